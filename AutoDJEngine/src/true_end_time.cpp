#include "true_end_time.h"
#include "autodj_internal.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <vector>

namespace autodj {

namespace {

double dbToLinear(double db) {
    // dBFS is referenced to full scale (1.0)
    return std::pow(10.0, db / 20.0);
}

} // namespace

double detectTrueEndTimeFromChannelData(const float* samples, size_t count,
                                        double sample_rate, double duration_sec,
                                        const TrueEndTimeOptions& options) {
    if (!samples || count == 0 || !std::isfinite(sample_rate) || sample_rate <= 0.0) {
        return duration_sec;
    }

    const double threshold_db = std::isfinite(options.silence_threshold_db)
        ? options.silence_threshold_db : -55.0;
    const double min_silence_ms = std::isfinite(options.min_silence_ms)
        ? options.min_silence_ms : 700.0;
    const double min_cut_before_end = std::isfinite(options.min_cut_before_end_sec)
        ? options.min_cut_before_end_sec : 1.5;

    const double threshold = dbToLinear(threshold_db);
    const int64_t min_silence_samples = std::max<int64_t>(
        1, static_cast<int64_t>(std::floor(sample_rate * min_silence_ms / 1000.0)));

    int64_t silence_count = 0;
    int64_t silence_start = -1;

    for (int64_t i = static_cast<int64_t>(count) - 1; i >= 0; i--) {
        if (std::abs(samples[i]) < threshold) {
            silence_count++;
            if (silence_count >= min_silence_samples) {
                silence_start = i;
            }
        } else {
            silence_count = 0;
            // Signal after a qualifying silent run: transition point found
            if (silence_start >= 0) break;
        }
    }

    if (silence_start < 0) return duration_sec;

    const double silence_start_time = static_cast<double>(silence_start) / sample_rate;

    const double latest_allowed_cut = std::max(0.0, duration_sec - std::max(0.0, min_cut_before_end));
    const double true_end = std::min(silence_start_time, latest_allowed_cut);

    return std::max(0.0, std::min(duration_sec, true_end));
}

double detectTrueEndTime(const AudioFile& file, const TrueEndTimeOptions& options) {
    const double duration = file.getDurationSeconds();
    const int64_t frames = file.getTotalSamples();
    if (frames <= 0 || file.getSampleRate() <= 0 || duration <= 0.0) {
        return duration;
    }

    // Channel 0 is a good enough proxy for the whole mix
    const int channels = file.getChannels();
    const float* data = file.getData();
    std::vector<float> mono(static_cast<size_t>(frames));
    for (int64_t i = 0; i < frames; i++) {
        mono[static_cast<size_t>(i)] = data[i * channels];
    }

    return detectTrueEndTimeFromChannelData(mono.data(), mono.size(),
                                            file.getSampleRate(), duration, options);
}

} // namespace autodj
