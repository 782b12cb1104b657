#include "tempo_match.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace autodj {

double resolveMaxTempoPercent(double raw, double fallback_pct) {
    if (!std::isfinite(raw) || raw <= 0.0) return fallback_pct;

    // Older settings stored the cap as a ratio (0.08 meaning 8%)
    if (raw <= 1.0) return raw * 100.0;

    return raw;
}

double normalizeTempoPct(double value) {
    if (!std::isfinite(value)) return std::numeric_limits<double>::infinity();

    const double factor = std::pow(10.0, kTempoCapRoundDecimals);
    return std::round(value * factor) / factor;
}

bool isOverTempoCap(double required_pct, double cap_pct) {
    const double required = normalizeTempoPct(required_pct);
    const double cap = normalizeTempoPct(cap_pct);
    return (required - cap) > kTempoCapEpsilonPct;
}

TempoShiftInfo computeTempoShiftInfo(double source_bpm, double target_bpm) {
    const double base = (std::isfinite(source_bpm) && source_bpm > 0.0) ? source_bpm : 0.0;
    const double target = (std::isfinite(target_bpm) && target_bpm > 0.0) ? target_bpm : 0.0;

    TempoShiftInfo best;
    best.required_shift_pct = std::numeric_limits<double>::infinity();
    best.ideal_ratio = 1.0;
    best.interpretation = TempoInterpretation::Normal;
    best.interpreted_base_bpm = base;

    if (base <= 0.0 || target <= 0.0) {
        return best;
    }

    const double candidate_bpm[3] = { base, base * 0.5, base * 2.0 };
    const TempoInterpretation candidate_kind[3] = {
        TempoInterpretation::Normal,
        TempoInterpretation::Half,
        TempoInterpretation::Double
    };

    bool any_candidate = false;
    for (int i = 0; i < 3; i++) {
        const double bpm = candidate_bpm[i];
        if (!std::isfinite(bpm) || bpm < kMinCandidateBpm || bpm > kMaxCandidateBpm) {
            continue;
        }
        any_candidate = true;

        const double ratio = target / bpm;
        const double pct = std::abs(ratio - 1.0) * 100.0;
        if (pct < best.required_shift_pct) {
            best.required_shift_pct = pct;
            best.ideal_ratio = ratio;
            best.interpretation = candidate_kind[i];
            best.interpreted_base_bpm = bpm;
        }
    }

    if (!any_candidate) {
        // Source is outside the plausible range in every reading; compare as-is
        best.ideal_ratio = target / base;
        best.required_shift_pct = std::abs(best.ideal_ratio - 1.0) * 100.0;
    }

    return best;
}

TempoMatchZone computeTempoMatchZone(double shift_pct) {
    const double pct = std::isfinite(shift_pct)
        ? std::max(0.0, shift_pct)
        : std::numeric_limits<double>::infinity();

    if (pct <= 6.0) return TempoMatchZone::Green;
    if (pct <= 10.0) return TempoMatchZone::Yellow;
    if (pct <= 15.0) return TempoMatchZone::Orange;
    return TempoMatchZone::Red;
}

TempoCapDecision getTempoCapDecision(const TempoCapRequest& request) {
    TempoCapDecision decision;
    decision.cap_pct_used = std::max(0.0, std::min(100.0,
        resolveMaxTempoPercent(request.raw_max_tempo_percent, kDefaultMaxTempoPercent)));
    decision.over_cap = false;
    decision.near_cap = false;

    const double near_cap_fraction = std::isfinite(request.near_cap_fraction)
        ? request.near_cap_fraction
        : kDefaultNearCapFraction;

    if (!request.tempo_control_enabled) {
        decision.will_tempo_match = false;
        decision.variant = TempoCapVariant::Disabled;
        return decision;
    }

    // Only auto mode is subject to the safety cap
    if (request.tempo_mode != TempoMode::Auto) {
        decision.will_tempo_match = true;
        decision.variant = TempoCapVariant::UnderCap;
        return decision;
    }

    decision.over_cap = isOverTempoCap(request.required_shift_pct, decision.cap_pct_used);
    decision.will_tempo_match = !decision.over_cap;
    decision.near_cap = decision.will_tempo_match
        && decision.cap_pct_used > 0.0
        && request.required_shift_pct >= decision.cap_pct_used * near_cap_fraction;

    if (decision.over_cap) {
        decision.variant = TempoCapVariant::OverCap;
    } else if (decision.near_cap) {
        decision.variant = TempoCapVariant::NearCap;
    } else {
        decision.variant = TempoCapVariant::UnderCap;
    }
    return decision;
}

const char* tempoModeName(TempoMode mode) {
    switch (mode) {
        case TempoMode::Auto: return "auto";
        case TempoMode::Locked: return "locked";
        case TempoMode::Original: return "original";
    }
    return "auto";
}

bool parseTempoMode(const std::string& value, TempoMode* out) {
    if (!out) return false;

    if (value == "auto") {
        *out = TempoMode::Auto;
    } else if (value == "locked") {
        *out = TempoMode::Locked;
    } else if (value == "original") {
        *out = TempoMode::Original;
    } else {
        return false;
    }
    return true;
}

const char* tempoInterpretationName(TempoInterpretation interpretation) {
    switch (interpretation) {
        case TempoInterpretation::Normal: return "normal";
        case TempoInterpretation::Half: return "half";
        case TempoInterpretation::Double: return "double";
    }
    return "normal";
}

const char* tempoMatchZoneName(TempoMatchZone zone) {
    switch (zone) {
        case TempoMatchZone::Green: return "green";
        case TempoMatchZone::Yellow: return "yellow";
        case TempoMatchZone::Orange: return "orange";
        case TempoMatchZone::Red: return "red";
    }
    return "red";
}

const char* tempoCapVariantName(TempoCapVariant variant) {
    switch (variant) {
        case TempoCapVariant::Disabled: return "disabled";
        case TempoCapVariant::OverCap: return "over_cap";
        case TempoCapVariant::NearCap: return "near_cap";
        case TempoCapVariant::UnderCap: return "under_cap";
    }
    return "disabled";
}

} // namespace autodj
