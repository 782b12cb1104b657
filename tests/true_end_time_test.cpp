#include "true_end_time.h"

#include <cmath>
#include <iostream>
#include <vector>

namespace {

bool near(double a, double b, double tolerance = 1e-9) {
    return std::abs(a - b) <= tolerance;
}

// 10 Hz keeps the buffers readable: one sample per 100 ms
const double kRate = 10.0;

std::vector<float> loudThenSilent(size_t total, size_t silent_tail) {
    std::vector<float> samples(total, 0.5f);
    for (size_t i = total - silent_tail; i < total; i++) {
        samples[i] = 0.0f;
    }
    return samples;
}

bool test_no_silence_returns_duration() {
    const std::vector<float> samples(100, 0.5f);
    const double end = autodj::detectTrueEndTimeFromChannelData(samples.data(), samples.size(),
                                                                kRate, 10.0);
    if (!near(end, 10.0)) {
        std::cerr << "True end time test failed: no silence should keep the duration.\n";
        return false;
    }
    return true;
}

bool test_trailing_silence_gives_onset() {
    const std::vector<float> samples = loudThenSilent(100, 20);
    const double end = autodj::detectTrueEndTimeFromChannelData(samples.data(), samples.size(),
                                                                kRate, 10.0);
    if (!near(end, 8.0)) {
        std::cerr << "True end time test failed: expected 8.0, got " << end << ".\n";
        return false;
    }
    return true;
}

bool test_short_silence_is_ignored() {
    // 500 ms of silence is under the 700 ms minimum
    const std::vector<float> samples = loudThenSilent(100, 5);
    const double end = autodj::detectTrueEndTimeFromChannelData(samples.data(), samples.size(),
                                                                kRate, 10.0);
    if (!near(end, 10.0)) {
        std::cerr << "True end time test failed: a short tail should keep the duration.\n";
        return false;
    }
    return true;
}

bool test_cut_keeps_distance_from_end() {
    // Silence from 9.0s, but nothing closer than 1.5s to the end may be cut
    const std::vector<float> samples = loudThenSilent(100, 10);
    const double end = autodj::detectTrueEndTimeFromChannelData(samples.data(), samples.size(),
                                                                kRate, 10.0);
    if (!near(end, 8.5)) {
        std::cerr << "True end time test failed: expected the 8.5s guard, got " << end << ".\n";
        return false;
    }
    return true;
}

bool test_quiet_noise_counts_as_silence() {
    // -60 dBFS is below the -55 dBFS threshold
    std::vector<float> samples = loudThenSilent(100, 20);
    for (size_t i = 80; i < 100; i++) {
        samples[i] = (i % 2 == 0) ? 0.001f : -0.001f;
    }
    const double end = autodj::detectTrueEndTimeFromChannelData(samples.data(), samples.size(),
                                                                kRate, 10.0);
    if (!near(end, 8.0)) {
        std::cerr << "True end time test failed: low level noise should read as silence.\n";
        return false;
    }
    return true;
}

bool test_custom_options() {
    autodj::TrueEndTimeOptions options;
    options.min_silence_ms = 300.0;
    options.min_cut_before_end_sec = 0.0;

    const std::vector<float> samples = loudThenSilent(100, 5);
    const double end = autodj::detectTrueEndTimeFromChannelData(samples.data(), samples.size(),
                                                                kRate, 10.0, options);
    if (!near(end, 9.5)) {
        std::cerr << "True end time test failed: expected 9.5 with relaxed options, got "
                  << end << ".\n";
        return false;
    }
    return true;
}

bool test_unusable_input_returns_duration() {
    const std::vector<float> samples = loudThenSilent(100, 20);
    if (!near(autodj::detectTrueEndTimeFromChannelData(nullptr, 100, kRate, 10.0), 10.0)) {
        std::cerr << "True end time test failed: null samples should keep the duration.\n";
        return false;
    }
    if (!near(autodj::detectTrueEndTimeFromChannelData(samples.data(), 0, kRate, 10.0), 10.0)) {
        std::cerr << "True end time test failed: empty input should keep the duration.\n";
        return false;
    }
    if (!near(autodj::detectTrueEndTimeFromChannelData(samples.data(), samples.size(), 0.0, 10.0), 10.0)) {
        std::cerr << "True end time test failed: zero sample rate should keep the duration.\n";
        return false;
    }
    return true;
}

bool test_all_silent_clamps_to_zero_guard() {
    // Silence everywhere: onset is 0, well before the guard
    const std::vector<float> samples(100, 0.0f);
    const double end = autodj::detectTrueEndTimeFromChannelData(samples.data(), samples.size(),
                                                                kRate, 10.0);
    if (!near(end, 0.0)) {
        std::cerr << "True end time test failed: an all-silent buffer should end at 0.\n";
        return false;
    }
    return true;
}

} // namespace

int main() {
    if (!test_no_silence_returns_duration()) {
        return 1;
    }
    if (!test_trailing_silence_gives_onset()) {
        return 1;
    }
    if (!test_short_silence_is_ignored()) {
        return 1;
    }
    if (!test_cut_keeps_distance_from_end()) {
        return 1;
    }
    if (!test_quiet_noise_counts_as_silence()) {
        return 1;
    }
    if (!test_custom_options()) {
        return 1;
    }
    if (!test_unusable_input_returns_duration()) {
        return 1;
    }
    if (!test_all_silent_clamps_to_zero_guard()) {
        return 1;
    }

    std::cout << "True end time test passed.\n";
    return 0;
}
