#ifndef AUTODJ_TEMPO_MATCH_H
#define AUTODJ_TEMPO_MATCH_H

#include <string>

namespace autodj {

// Percent values are treated as precise to 0.0001% when compared to the cap
const int kTempoCapRoundDecimals = 4;
const double kTempoCapEpsilonPct = 1e-6;

const double kDefaultMaxTempoPercent = 8.0;
const double kDefaultNearCapFraction = 0.8;

// Plausible range for half/double BPM candidates
const double kMinCandidateBpm = 40.0;
const double kMaxCandidateBpm = 400.0;

enum class TempoMode {
    Auto,
    Locked,
    Original
};

enum class TempoInterpretation {
    Normal,
    Half,
    Double
};

enum class TempoMatchZone {
    Green,
    Yellow,
    Orange,
    Red
};

enum class TempoCapVariant {
    Disabled,
    OverCap,
    NearCap,
    UnderCap
};

struct TempoShiftInfo {
    double required_shift_pct;   // +inf when no match is possible
    double ideal_ratio;
    TempoInterpretation interpretation;
    double interpreted_base_bpm;
};

struct TempoCapRequest {
    bool tempo_control_enabled;
    TempoMode tempo_mode;
    double required_shift_pct;
    double raw_max_tempo_percent;
    double near_cap_fraction;

    TempoCapRequest()
        : tempo_control_enabled(true)
        , tempo_mode(TempoMode::Auto)
        , required_shift_pct(0.0)
        , raw_max_tempo_percent(kDefaultMaxTempoPercent)
        , near_cap_fraction(kDefaultNearCapFraction)
    {
    }
};

struct TempoCapDecision {
    double cap_pct_used;
    bool over_cap;
    bool will_tempo_match;
    bool near_cap;
    TempoCapVariant variant;
};

// Tempo Match Evaluator. None of these throw; bad input means "no match".

double resolveMaxTempoPercent(double raw, double fallback_pct = kDefaultMaxTempoPercent);
double normalizeTempoPct(double value);
bool isOverTempoCap(double required_pct, double cap_pct);

TempoShiftInfo computeTempoShiftInfo(double source_bpm, double target_bpm);
TempoMatchZone computeTempoMatchZone(double shift_pct);
TempoCapDecision getTempoCapDecision(const TempoCapRequest& request);

// Tempo Preset Resolver

enum class TempoPreset {
    Original,
    Chill,
    Upbeat,
    Club,
    Fast
};

struct PresetTempo {
    double target_bpm;   // <= 0 when the track BPM is unknown
    double ratio;
};

double tempoPresetRatio(TempoPreset preset);
double tempoPresetMaxStretch(TempoPreset preset);
PresetTempo computePresetTempo(double track_bpm, TempoPreset preset);

TempoPreset parseTempoPreset(const std::string& value,
                             TempoPreset fallback = TempoPreset::Original);
const char* tempoPresetKey(TempoPreset preset);
const char* tempoPresetLabel(TempoPreset preset);

// String forms used in settings files and the C API
const char* tempoModeName(TempoMode mode);
bool parseTempoMode(const std::string& value, TempoMode* out);
const char* tempoInterpretationName(TempoInterpretation interpretation);
const char* tempoMatchZoneName(TempoMatchZone zone);
const char* tempoCapVariantName(TempoCapVariant variant);

} // namespace autodj

#endif // AUTODJ_TEMPO_MATCH_H
