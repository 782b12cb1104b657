#include "tempo_match.h"

#include <algorithm>
#include <cmath>

namespace autodj {

// Multiplier of the track's own BPM. Slow to fast:
// fast ("Texas", slowed) 0.75, chill 0.88, original 1.00, upbeat 1.08, club 1.20
double tempoPresetRatio(TempoPreset preset) {
    switch (preset) {
        case TempoPreset::Fast: return 0.75;
        case TempoPreset::Chill: return 0.88;
        case TempoPreset::Original: return 1.0;
        case TempoPreset::Upbeat: return 1.08;
        case TempoPreset::Club: return 1.20;
    }
    return 1.0;
}

// Max stretch in percent, independent of MixSettings::max_tempo_percent
double tempoPresetMaxStretch(TempoPreset preset) {
    switch (preset) {
        case TempoPreset::Fast: return 25.0;
        case TempoPreset::Chill: return 15.0;
        case TempoPreset::Original: return 0.0;
        case TempoPreset::Upbeat: return 12.0;
        case TempoPreset::Club: return 25.0;
    }
    return 0.0;
}

PresetTempo computePresetTempo(double track_bpm, TempoPreset preset) {
    PresetTempo result;
    const bool bpm_known = std::isfinite(track_bpm) && track_bpm > 0.0;

    if (preset == TempoPreset::Original || !bpm_known) {
        result.target_bpm = bpm_known ? track_bpm : 0.0;
        result.ratio = 1.0;
        return result;
    }

    const double max_stretch = tempoPresetMaxStretch(preset);
    const double min_ratio = 1.0 - max_stretch / 100.0;
    const double max_ratio = 1.0 + max_stretch / 100.0;

    result.ratio = std::max(min_ratio, std::min(max_ratio, tempoPresetRatio(preset)));
    result.target_bpm = track_bpm * result.ratio;
    return result;
}

TempoPreset parseTempoPreset(const std::string& value, TempoPreset fallback) {
    if (value == "original") return TempoPreset::Original;
    if (value == "chill") return TempoPreset::Chill;
    if (value == "upbeat") return TempoPreset::Upbeat;
    if (value == "club") return TempoPreset::Club;
    if (value == "fast") return TempoPreset::Fast;
    return fallback;
}

const char* tempoPresetKey(TempoPreset preset) {
    switch (preset) {
        case TempoPreset::Original: return "original";
        case TempoPreset::Chill: return "chill";
        case TempoPreset::Upbeat: return "upbeat";
        case TempoPreset::Club: return "club";
        case TempoPreset::Fast: return "fast";
    }
    return "original";
}

const char* tempoPresetLabel(TempoPreset preset) {
    switch (preset) {
        case TempoPreset::Original: return "Original";
        case TempoPreset::Chill: return "Chill";
        case TempoPreset::Upbeat: return "Upbeat";
        case TempoPreset::Club: return "Club";
        case TempoPreset::Fast: return "Texas";
    }
    return "Original";
}

} // namespace autodj
