#ifndef AUTODJ_TRACK_LIBRARY_H
#define AUTODJ_TRACK_LIBRARY_H

#include "true_end_time.h"

#include <string>
#include <vector>

namespace autodj {

struct Track {
    std::string id;
    std::string path;
    std::string display_name;
    double bpm;            // <= 0 until analyzed
    double duration;       // container-reported, seconds
    double true_end_time;  // < 0 until detected; 0 <= value <= duration otherwise

    Track();

    bool hasBpm() const { return bpm > 0.0; }
    bool hasTrueEndTime() const { return true_end_time >= 0.0; }

    // Perceptual end of content: true end when known, else duration
    double naturalEnd() const;
};

struct ImportOptions {
    bool analyze_bpm;
    TrueEndTimeOptions true_end;

    ImportOptions() : analyze_bpm(true) {}
};

// Import collaborator: owns Track records, computes BPM and true end once
class TrackLibrary {
public:
    TrackLibrary();

    // Decode and analyze `path` without storing it; the returned track has no id
    static bool analyzeFile(const std::string& path, const ImportOptions& options, Track* out);

    // Decode `path`, analyze, and store. out_id receives the new track id.
    bool importFile(const std::string& path, const ImportOptions& options, std::string* out_id);

    // Store an already-described track. An empty id gets a generated one;
    // a duplicate id is rejected.
    bool addTrack(const Track& track, std::string* out_id = nullptr);
    bool remove(const std::string& id);

    bool setBpm(const std::string& id, double bpm);
    bool setTrueEndTime(const std::string& id, double true_end_time);

    const Track* find(const std::string& id) const;
    const std::vector<Track>& tracks() const { return tracks_; }
    size_t size() const { return tracks_.size(); }

private:
    Track* findMutable(const std::string& id);
    std::string generateId();

    std::vector<Track> tracks_;
    int next_id_;
};

} // namespace autodj

#endif // AUTODJ_TRACK_LIBRARY_H
