#include "mix_settings.h"
#include "logging.h"

#include <json/json.h>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <memory>
#include <sstream>

namespace autodj {

MixSettings::MixSettings()
    : next_song_start_offset(kDefaultNextSongStartOffset)
    , end_early_seconds(kDefaultEndEarlySeconds)
    , crossfade_seconds(kDefaultCrossfadeSeconds)
    , max_tempo_percent(kDefaultMaxTempoPercent)
    , tempo_mode(TempoMode::Auto)
    , tempo_preset(TempoPreset::Original)
    , tempo_control_enabled(true)
    , loop_playlist(true)
    , prepare_lead_seconds(kDefaultPrepareLeadSeconds)
{
}

namespace {

double clampField(const char* name, double value, double lo, double hi, double fallback) {
    if (!std::isfinite(value)) {
        AUTODJ_LOG_WARN("Setting %s is not a number, using %.2f", name, fallback);
        return fallback;
    }
    const double clamped = std::max(lo, std::min(value, hi));
    if (clamped != value) {
        AUTODJ_LOG_WARN("Setting %s=%.2f out of range, clamped to %.2f", name, value, clamped);
    }
    return clamped;
}

void readNumber(const Json::Value& root, const char* key, double* out) {
    if (root.isMember(key) && root[key].isNumeric()) {
        *out = root[key].asDouble();
    }
}

void readBool(const Json::Value& root, const char* key, bool* out) {
    if (root.isMember(key) && root[key].isBool()) {
        *out = root[key].asBool();
    }
}

} // namespace

MixSettings clampMixSettings(const MixSettings& settings) {
    MixSettings out = settings;

    out.next_song_start_offset = clampField("nextSongStartOffset", settings.next_song_start_offset,
                                            0.0, kMaxNextSongStartOffset, kDefaultNextSongStartOffset);
    out.end_early_seconds = clampField("endEarlySeconds", settings.end_early_seconds,
                                       0.0, kMaxEndEarlySeconds, kDefaultEndEarlySeconds);
    out.crossfade_seconds = clampField("crossfadeSeconds", settings.crossfade_seconds,
                                       kMinCrossfadeSeconds, kMaxCrossfadeSeconds,
                                       kDefaultCrossfadeSeconds);
    out.prepare_lead_seconds = clampField("prepareLeadSeconds", settings.prepare_lead_seconds,
                                          0.0, kMaxPrepareLeadSeconds, kDefaultPrepareLeadSeconds);

    // Percent units, accepting legacy ratio values
    out.max_tempo_percent = std::max(0.0, std::min(100.0,
        resolveMaxTempoPercent(settings.max_tempo_percent, kDefaultMaxTempoPercent)));

    return out;
}

void resetMixTiming(MixSettings* settings) {
    if (!settings) return;
    settings->next_song_start_offset = kDefaultNextSongStartOffset;
    settings->end_early_seconds = kDefaultEndEarlySeconds;
    settings->crossfade_seconds = kDefaultCrossfadeSeconds;
}

double maxStartOffsetFor(double next_duration_sec) {
    if (!std::isfinite(next_duration_sec) || next_duration_sec <= 0.0) return 0.0;
    // Leave at least one second of the incoming track
    return std::max(0.0, std::min(kMaxNextSongStartOffset, next_duration_sec - 1.0));
}

double clampStartOffset(double offset_sec, double next_duration_sec) {
    if (!std::isfinite(offset_sec)) return 0.0;
    return std::max(0.0, std::min(offset_sec, maxStartOffsetFor(next_duration_sec)));
}

bool parseMixSettingsJson(const std::string& text, MixSettings* settings) {
    if (!settings) return false;

    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;

    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
        AUTODJ_LOG_WARN("Could not parse mix settings: %s", errors.c_str());
        return false;
    }
    if (!root.isObject()) {
        AUTODJ_LOG_WARN("Mix settings must be a JSON object");
        return false;
    }

    MixSettings parsed = *settings;
    readNumber(root, "nextSongStartOffset", &parsed.next_song_start_offset);
    readNumber(root, "endEarlySeconds", &parsed.end_early_seconds);
    readNumber(root, "crossfadeSeconds", &parsed.crossfade_seconds);
    readNumber(root, "maxTempoPercent", &parsed.max_tempo_percent);
    readNumber(root, "prepareLeadSeconds", &parsed.prepare_lead_seconds);
    readBool(root, "tempoControlEnabled", &parsed.tempo_control_enabled);
    readBool(root, "loopPlaylist", &parsed.loop_playlist);

    if (root.isMember("tempoMode") && root["tempoMode"].isString()) {
        const std::string mode = root["tempoMode"].asString();
        if (!parseTempoMode(mode, &parsed.tempo_mode)) {
            AUTODJ_LOG_WARN("Unknown tempoMode '%s', keeping %s",
                            mode.c_str(), tempoModeName(parsed.tempo_mode));
        }
    }
    if (root.isMember("tempoPreset") && root["tempoPreset"].isString()) {
        parsed.tempo_preset = parseTempoPreset(root["tempoPreset"].asString(), parsed.tempo_preset);
    }

    *settings = clampMixSettings(parsed);
    return true;
}

std::string mixSettingsToJson(const MixSettings& settings) {
    Json::Value root(Json::objectValue);
    root["nextSongStartOffset"] = settings.next_song_start_offset;
    root["endEarlySeconds"] = settings.end_early_seconds;
    root["crossfadeSeconds"] = settings.crossfade_seconds;
    root["maxTempoPercent"] = settings.max_tempo_percent;
    root["tempoMode"] = tempoModeName(settings.tempo_mode);
    root["tempoPreset"] = tempoPresetKey(settings.tempo_preset);
    root["tempoControlEnabled"] = settings.tempo_control_enabled;
    root["loopPlaylist"] = settings.loop_playlist;
    root["prepareLeadSeconds"] = settings.prepare_lead_seconds;

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "    ";
    return Json::writeString(builder, root);
}

bool loadMixSettings(const std::string& filepath, MixSettings* settings) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        AUTODJ_LOG_WARN("Could not open settings file %s, using current settings", filepath.c_str());
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    if (!parseMixSettingsJson(buffer.str(), settings)) {
        return false;
    }
    AUTODJ_LOG_INFO("Mix settings loaded from %s", filepath.c_str());
    return true;
}

bool saveMixSettings(const std::string& filepath, const MixSettings& settings) {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        AUTODJ_LOG_ERROR("Could not write settings file %s", filepath.c_str());
        return false;
    }

    file << mixSettingsToJson(settings) << "\n";
    if (!file.good()) {
        AUTODJ_LOG_ERROR("Failed writing settings file %s", filepath.c_str());
        return false;
    }
    return true;
}

} // namespace autodj
