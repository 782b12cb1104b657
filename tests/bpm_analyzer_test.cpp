#include "autodj_internal.h"

#include <cmath>
#include <iostream>
#include <limits>
#include <vector>

namespace {

bool near(double a, double b, double tolerance = 1e-9) {
    return std::abs(a - b) <= tolerance;
}

bool test_fold_into_dj_range() {
    struct Case {
        double raw;
        double folded;
    };
    const Case cases[] = {
        { 120.0, 120.0 },
        { 35.0, 70.0 },
        { 60.0, 120.0 },
        { 175.0, 87.5 },
        { 320.0, 160.0 },
        { 70.0, 70.0 },
        { 160.0, 160.0 },
    };
    for (const Case& c : cases) {
        const double folded = autodj::foldBpmToDjRange(c.raw);
        if (!near(folded, c.folded)) {
            std::cerr << "BPM analyzer test failed: " << c.raw << " BPM folded to " << folded
                      << ", expected " << c.folded << ".\n";
            return false;
        }
    }
    return true;
}

bool test_non_finite_tempo_is_unknown() {
    const double bad[] = {
        std::numeric_limits<double>::infinity(),
        -std::numeric_limits<double>::infinity(),
        std::numeric_limits<double>::quiet_NaN(),
        0.0,
        -5.0,
    };
    for (double value : bad) {
        if (autodj::foldBpmToDjRange(value) != 0.0) {
            std::cerr << "BPM analyzer test failed: " << value << " should mean unknown BPM.\n";
            return false;
        }
    }
    return true;
}

bool test_empty_audio_has_no_bpm() {
    if (autodj::analyzeBPM(nullptr, 0, 44100) != 0.0) {
        std::cerr << "BPM analyzer test failed: no audio must give 0 BPM.\n";
        return false;
    }
    std::vector<float> samples(2 * 1024, 0.0f);
    if (autodj::analyzeBPM(samples.data(), 1024, 0) != 0.0) {
        std::cerr << "BPM analyzer test failed: a zero sample rate must give 0 BPM.\n";
        return false;
    }
    return true;
}

} // namespace

int main() {
    if (!test_fold_into_dj_range()) {
        return 1;
    }
    if (!test_non_finite_tempo_is_unknown()) {
        return 1;
    }
    if (!test_empty_audio_has_no_bpm()) {
        return 1;
    }

    std::cout << "BPM analyzer test passed.\n";
    return 0;
}
