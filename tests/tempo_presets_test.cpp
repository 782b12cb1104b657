#include "tempo_match.h"

#include <cmath>
#include <cstring>
#include <iostream>

namespace {

bool near(double a, double b, double tolerance = 1e-9) {
    return std::abs(a - b) <= tolerance;
}

bool test_presets_scale_the_track_bpm() {
    struct Case {
        autodj::TempoPreset preset;
        double ratio;
    };
    const Case cases[] = {
        { autodj::TempoPreset::Fast, 0.75 },
        { autodj::TempoPreset::Chill, 0.88 },
        { autodj::TempoPreset::Upbeat, 1.08 },
        { autodj::TempoPreset::Club, 1.20 },
    };
    for (const Case& c : cases) {
        const autodj::PresetTempo tempo = autodj::computePresetTempo(120.0, c.preset);
        if (!near(tempo.ratio, c.ratio) || !near(tempo.target_bpm, 120.0 * c.ratio)) {
            std::cerr << "Tempo presets test failed: " << autodj::tempoPresetKey(c.preset)
                      << " should scale 120 BPM by " << c.ratio << ".\n";
            return false;
        }
    }
    return true;
}

bool test_ratio_stays_within_max_stretch() {
    const autodj::TempoPreset presets[] = {
        autodj::TempoPreset::Original,
        autodj::TempoPreset::Chill,
        autodj::TempoPreset::Upbeat,
        autodj::TempoPreset::Club,
        autodj::TempoPreset::Fast,
    };
    for (autodj::TempoPreset preset : presets) {
        const double stretch = autodj::tempoPresetMaxStretch(preset) / 100.0;
        const autodj::PresetTempo tempo = autodj::computePresetTempo(97.0, preset);
        if (tempo.ratio < 1.0 - stretch - 1e-12 || tempo.ratio > 1.0 + stretch + 1e-12) {
            std::cerr << "Tempo presets test failed: " << autodj::tempoPresetKey(preset)
                      << " ratio escapes its max stretch.\n";
            return false;
        }
    }
    return true;
}

bool test_original_and_unknown_bpm_keep_ratio_one() {
    autodj::PresetTempo tempo = autodj::computePresetTempo(128.0, autodj::TempoPreset::Original);
    if (!near(tempo.ratio, 1.0) || !near(tempo.target_bpm, 128.0)) {
        std::cerr << "Tempo presets test failed: original preset must not change tempo.\n";
        return false;
    }

    tempo = autodj::computePresetTempo(0.0, autodj::TempoPreset::Club);
    if (!near(tempo.ratio, 1.0) || tempo.target_bpm > 0.0) {
        std::cerr << "Tempo presets test failed: unknown BPM must give ratio 1 and no target.\n";
        return false;
    }

    tempo = autodj::computePresetTempo(NAN, autodj::TempoPreset::Chill);
    if (!near(tempo.ratio, 1.0)) {
        std::cerr << "Tempo presets test failed: NaN BPM must give ratio 1.\n";
        return false;
    }
    return true;
}

bool test_preset_keys_and_labels() {
    if (autodj::parseTempoPreset("club") != autodj::TempoPreset::Club) {
        std::cerr << "Tempo presets test failed: 'club' should parse.\n";
        return false;
    }
    if (autodj::parseTempoPreset("warp", autodj::TempoPreset::Chill) != autodj::TempoPreset::Chill) {
        std::cerr << "Tempo presets test failed: unknown keys must return the fallback.\n";
        return false;
    }
    if (autodj::parseTempoPreset("") != autodj::TempoPreset::Original) {
        std::cerr << "Tempo presets test failed: default fallback is the original preset.\n";
        return false;
    }
    if (std::strcmp(autodj::tempoPresetLabel(autodj::TempoPreset::Fast), "Texas") != 0) {
        std::cerr << "Tempo presets test failed: the fast preset is labelled Texas.\n";
        return false;
    }
    return true;
}

} // namespace

int main() {
    if (!test_presets_scale_the_track_bpm()) {
        return 1;
    }
    if (!test_ratio_stays_within_max_stretch()) {
        return 1;
    }
    if (!test_original_and_unknown_bpm_keep_ratio_one()) {
        return 1;
    }
    if (!test_preset_keys_and_labels()) {
        return 1;
    }

    std::cout << "Tempo presets test passed.\n";
    return 0;
}
