#ifndef AUTODJ_MIX_SETTINGS_H
#define AUTODJ_MIX_SETTINGS_H

#include "tempo_match.h"

#include <string>

namespace autodj {

// Literal defaults of the "reset timing" control
const double kDefaultNextSongStartOffset = 15.0;
const double kDefaultEndEarlySeconds = 5.0;
const double kDefaultCrossfadeSeconds = 8.0;

const double kMaxNextSongStartOffset = 60.0;
const double kMaxEndEarlySeconds = 60.0;
const double kMinCrossfadeSeconds = 1.0;
const double kMaxCrossfadeSeconds = 20.0;
const double kDefaultPrepareLeadSeconds = 10.0;
const double kMaxPrepareLeadSeconds = 120.0;

struct MixSettings {
    double next_song_start_offset;  // seconds into the incoming track
    double end_early_seconds;       // fade-out starts this long before the true end
    double crossfade_seconds;       // audible overlap
    double max_tempo_percent;       // auto-match safety cap, percent
    TempoMode tempo_mode;
    TempoPreset tempo_preset;       // target for TempoMode::Locked
    bool tempo_control_enabled;
    bool loop_playlist;
    double prepare_lead_seconds;    // idle deck is prepared this long before the fade

    MixSettings();
};

// Clamp every field to its legal range (never rejects)
MixSettings clampMixSettings(const MixSettings& settings);

// Restore the three timing fields, leave the rest untouched
void resetMixTiming(MixSettings* settings);

// Upper bound for next_song_start_offset given the incoming track
double maxStartOffsetFor(double next_duration_sec);
double clampStartOffset(double offset_sec, double next_duration_sec);

// JSON persistence. Missing or mistyped keys keep their current value.
bool loadMixSettings(const std::string& filepath, MixSettings* settings);
bool saveMixSettings(const std::string& filepath, const MixSettings& settings);
bool parseMixSettingsJson(const std::string& text, MixSettings* settings);
std::string mixSettingsToJson(const MixSettings& settings);

} // namespace autodj

#endif // AUTODJ_MIX_SETTINGS_H
