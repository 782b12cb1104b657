#include "mix_settings.h"

#include <cmath>
#include <cstdio>
#include <iostream>
#include <string>

namespace {

bool near(double a, double b, double tolerance = 1e-9) {
    return std::abs(a - b) <= tolerance;
}

bool test_defaults() {
    const autodj::MixSettings settings;
    if (!near(settings.next_song_start_offset, 15.0) || !near(settings.end_early_seconds, 5.0)
        || !near(settings.crossfade_seconds, 8.0) || !near(settings.max_tempo_percent, 8.0)) {
        std::cerr << "Mix settings test failed: unexpected timing defaults.\n";
        return false;
    }
    if (settings.tempo_mode != autodj::TempoMode::Auto || !settings.loop_playlist
        || !settings.tempo_control_enabled) {
        std::cerr << "Mix settings test failed: unexpected mode defaults.\n";
        return false;
    }
    return true;
}

bool test_clamp_to_ranges() {
    autodj::MixSettings settings;
    settings.next_song_start_offset = 90.0;
    settings.end_early_seconds = -2.0;
    settings.crossfade_seconds = 0.2;
    settings.max_tempo_percent = 0.1;
    settings.prepare_lead_seconds = NAN;

    const autodj::MixSettings clamped = autodj::clampMixSettings(settings);
    if (!near(clamped.next_song_start_offset, 60.0) || !near(clamped.end_early_seconds, 0.0)
        || !near(clamped.crossfade_seconds, 1.0)) {
        std::cerr << "Mix settings test failed: timing fields were not clamped.\n";
        return false;
    }
    if (!near(clamped.max_tempo_percent, 10.0)) {
        std::cerr << "Mix settings test failed: a 0.1 cap should read as 10%.\n";
        return false;
    }
    if (!near(clamped.prepare_lead_seconds, autodj::kDefaultPrepareLeadSeconds)) {
        std::cerr << "Mix settings test failed: NaN prepare lead should fall back to the default.\n";
        return false;
    }

    settings = autodj::MixSettings();
    settings.crossfade_seconds = 45.0;
    if (!near(autodj::clampMixSettings(settings).crossfade_seconds, 20.0)) {
        std::cerr << "Mix settings test failed: crossfade should clamp to 20s.\n";
        return false;
    }
    return true;
}

bool test_reset_timing_keeps_other_fields() {
    autodj::MixSettings settings;
    settings.next_song_start_offset = 30.0;
    settings.end_early_seconds = 12.0;
    settings.crossfade_seconds = 3.0;
    settings.tempo_mode = autodj::TempoMode::Original;
    settings.loop_playlist = false;

    autodj::resetMixTiming(&settings);
    if (!near(settings.next_song_start_offset, 15.0) || !near(settings.end_early_seconds, 5.0)
        || !near(settings.crossfade_seconds, 8.0)) {
        std::cerr << "Mix settings test failed: reset should restore 15/5/8.\n";
        return false;
    }
    if (settings.tempo_mode != autodj::TempoMode::Original || settings.loop_playlist) {
        std::cerr << "Mix settings test failed: reset must not touch non-timing fields.\n";
        return false;
    }
    return true;
}

bool test_start_offset_limit_follows_next_track() {
    if (!near(autodj::maxStartOffsetFor(30.0), 29.0)) {
        std::cerr << "Mix settings test failed: a 30s track allows up to 29s.\n";
        return false;
    }
    if (!near(autodj::maxStartOffsetFor(300.0), 60.0)) {
        std::cerr << "Mix settings test failed: long tracks are limited to 60s.\n";
        return false;
    }
    if (!near(autodj::maxStartOffsetFor(0.5), 0.0) || !near(autodj::maxStartOffsetFor(-1.0), 0.0)) {
        std::cerr << "Mix settings test failed: very short or invalid tracks allow no offset.\n";
        return false;
    }
    if (!near(autodj::clampStartOffset(15.0, 10.0), 9.0)) {
        std::cerr << "Mix settings test failed: a 15s offset into a 10s track should clamp to 9s.\n";
        return false;
    }
    return true;
}

bool test_json_load_clamps_and_ignores_bad_types() {
    const std::string json =
        "{\n"
        "  \"crossfadeSeconds\": 45,\n"
        "  \"nextSongStartOffset\": -3,\n"
        "  \"endEarlySeconds\": \"soon\",\n"
        "  \"maxTempoPercent\": 0.12,\n"
        "  \"tempoMode\": \"locked\",\n"
        "  \"tempoPreset\": \"club\",\n"
        "  \"loopPlaylist\": false\n"
        "}\n";

    autodj::MixSettings settings;
    if (!autodj::parseMixSettingsJson(json, &settings)) {
        std::cerr << "Mix settings test failed: valid JSON was rejected.\n";
        return false;
    }
    if (!near(settings.crossfade_seconds, 20.0) || !near(settings.next_song_start_offset, 0.0)) {
        std::cerr << "Mix settings test failed: loaded values were not clamped.\n";
        return false;
    }
    if (!near(settings.end_early_seconds, 5.0)) {
        std::cerr << "Mix settings test failed: a mistyped key must keep its value.\n";
        return false;
    }
    if (!near(settings.max_tempo_percent, 12.0, 1e-9)) {
        std::cerr << "Mix settings test failed: legacy cap 0.12 should load as 12%.\n";
        return false;
    }
    if (settings.tempo_mode != autodj::TempoMode::Locked
        || settings.tempo_preset != autodj::TempoPreset::Club || settings.loop_playlist) {
        std::cerr << "Mix settings test failed: mode, preset or loop flag not loaded.\n";
        return false;
    }
    return true;
}

bool test_invalid_json_leaves_settings_untouched() {
    autodj::MixSettings settings;
    settings.crossfade_seconds = 4.0;

    if (autodj::parseMixSettingsJson("{ not json", &settings)) {
        std::cerr << "Mix settings test failed: broken JSON was accepted.\n";
        return false;
    }
    if (autodj::parseMixSettingsJson("[1, 2, 3]", &settings)) {
        std::cerr << "Mix settings test failed: a JSON array was accepted.\n";
        return false;
    }
    if (!near(settings.crossfade_seconds, 4.0)) {
        std::cerr << "Mix settings test failed: a failed load changed the settings.\n";
        return false;
    }
    return true;
}

bool test_save_then_load_file() {
    const std::string path = "autodj_mix_settings_test.json";

    autodj::MixSettings saved;
    saved.crossfade_seconds = 12.0;
    saved.tempo_mode = autodj::TempoMode::Original;
    saved.tempo_preset = autodj::TempoPreset::Fast;
    saved.prepare_lead_seconds = 20.0;

    if (!autodj::saveMixSettings(path, saved)) {
        std::cerr << "Mix settings test failed: could not write " << path << ".\n";
        return false;
    }

    autodj::MixSettings loaded;
    const bool ok = autodj::loadMixSettings(path, &loaded);
    std::remove(path.c_str());

    if (!ok) {
        std::cerr << "Mix settings test failed: could not read back " << path << ".\n";
        return false;
    }
    if (!near(loaded.crossfade_seconds, 12.0) || loaded.tempo_mode != autodj::TempoMode::Original
        || loaded.tempo_preset != autodj::TempoPreset::Fast
        || !near(loaded.prepare_lead_seconds, 20.0)) {
        std::cerr << "Mix settings test failed: saved file did not restore the settings.\n";
        return false;
    }

    autodj::MixSettings untouched;
    if (autodj::loadMixSettings("does/not/exist.json", &untouched)) {
        std::cerr << "Mix settings test failed: a missing file must report failure.\n";
        return false;
    }
    return true;
}

} // namespace

int main() {
    if (!test_defaults()) {
        return 1;
    }
    if (!test_clamp_to_ranges()) {
        return 1;
    }
    if (!test_reset_timing_keeps_other_fields()) {
        return 1;
    }
    if (!test_start_offset_limit_follows_next_track()) {
        return 1;
    }
    if (!test_json_load_clamps_and_ignores_bad_types()) {
        return 1;
    }
    if (!test_invalid_json_leaves_settings_untouched()) {
        return 1;
    }
    if (!test_save_then_load_file()) {
        return 1;
    }

    std::cout << "Mix settings test passed.\n";
    return 0;
}
