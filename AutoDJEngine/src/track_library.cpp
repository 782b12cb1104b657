#include "track_library.h"
#include "autodj_internal.h"
#include "logging.h"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace autodj {

Track::Track()
    : bpm(0.0)
    , duration(0.0)
    , true_end_time(-1.0)
{
}

double Track::naturalEnd() const {
    if (hasTrueEndTime()) {
        return duration > 0.0 ? std::min(true_end_time, duration) : true_end_time;
    }
    return duration;
}

namespace {

std::string displayNameFromPath(const std::string& path) {
    const size_t slash = path.find_last_of("/\\");
    std::string name = (slash == std::string::npos) ? path : path.substr(slash + 1);

    const size_t dot = name.find_last_of('.');
    if (dot != std::string::npos && dot > 0) {
        name = name.substr(0, dot);
    }
    return name;
}

} // namespace

TrackLibrary::TrackLibrary()
    : next_id_(1)
{
}

std::string TrackLibrary::generateId() {
    char buffer[32];
    do {
        snprintf(buffer, sizeof(buffer), "track-%d", next_id_++);
    } while (find(buffer) != nullptr);
    return buffer;
}

bool TrackLibrary::analyzeFile(const std::string& path, const ImportOptions& options,
                               Track* out) {
    if (!out) return false;

    AudioFile file;
    if (!file.load(path.c_str())) {
        AUTODJ_LOG_WARN("Import failed, could not decode %s", path.c_str());
        return false;
    }

    Track track;
    track.path = path;
    track.display_name = displayNameFromPath(path);
    track.duration = file.getDurationSeconds();

    if (options.analyze_bpm) {
        const double bpm = analyzeBPM(file.getData(), file.getTotalSamples(), file.getSampleRate());
        if (bpm > 0.0) {
            track.bpm = bpm;
        } else {
            AUTODJ_LOG_WARN("No tempo found in %s, track will play at original tempo", path.c_str());
        }
    }

    // Computed once here and cached on the track, never during playback
    track.true_end_time = detectTrueEndTime(file, options.true_end);

    *out = track;
    return true;
}

bool TrackLibrary::importFile(const std::string& path, const ImportOptions& options,
                              std::string* out_id) {
    Track track;
    if (!analyzeFile(path, options, &track)) {
        return false;
    }

    std::string id;
    if (!addTrack(track, &id)) {
        return false;
    }

    AUTODJ_LOG_INFO("Imported %s as %s: duration=%.2fs trueEnd=%.2fs bpm=%.1f",
                    path.c_str(), id.c_str(), track.duration,
                    track.true_end_time, track.bpm);

    if (out_id) *out_id = id;
    return true;
}

bool TrackLibrary::addTrack(const Track& track, std::string* out_id) {
    if (!track.id.empty() && find(track.id)) {
        AUTODJ_LOG_WARN("Track id %s is already in the library", track.id.c_str());
        return false;
    }

    Track stored = track;
    if (stored.id.empty()) {
        stored.id = generateId();
    }
    if (!std::isfinite(stored.duration) || stored.duration < 0.0) {
        stored.duration = 0.0;
    }
    if (stored.hasTrueEndTime()) {
        stored.true_end_time = std::max(0.0, std::min(stored.true_end_time, stored.duration));
    }
    if (!std::isfinite(stored.bpm)) {
        stored.bpm = 0.0;
    }

    tracks_.push_back(stored);
    if (out_id) *out_id = stored.id;
    return true;
}

bool TrackLibrary::remove(const std::string& id) {
    auto it = std::find_if(tracks_.begin(), tracks_.end(),
                           [&id](const Track& t) { return t.id == id; });
    if (it == tracks_.end()) return false;
    tracks_.erase(it);
    return true;
}

bool TrackLibrary::setBpm(const std::string& id, double bpm) {
    Track* track = findMutable(id);
    if (!track) return false;
    track->bpm = (std::isfinite(bpm) && bpm > 0.0) ? bpm : 0.0;
    return true;
}

bool TrackLibrary::setTrueEndTime(const std::string& id, double true_end_time) {
    Track* track = findMutable(id);
    if (!track) return false;

    if (!std::isfinite(true_end_time) || true_end_time < 0.0) {
        track->true_end_time = -1.0;
    } else {
        track->true_end_time = std::min(true_end_time, track->duration);
    }
    return true;
}

const Track* TrackLibrary::find(const std::string& id) const {
    for (const Track& track : tracks_) {
        if (track.id == id) return &track;
    }
    return nullptr;
}

Track* TrackLibrary::findMutable(const std::string& id) {
    for (Track& track : tracks_) {
        if (track.id == id) return &track;
    }
    return nullptr;
}

} // namespace autodj
