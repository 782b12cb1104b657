#ifndef AUTODJ_TRUE_END_TIME_H
#define AUTODJ_TRUE_END_TIME_H

#include <cstddef>

namespace autodj {

class AudioFile;

struct TrueEndTimeOptions {
    double silence_threshold_db;    // dBFS, negative
    double min_silence_ms;          // run length that counts as trailing silence
    double min_cut_before_end_sec;  // never cut inside this tail window

    TrueEndTimeOptions()
        : silence_threshold_db(-55.0)
        , min_silence_ms(700.0)
        , min_cut_before_end_sec(1.5)
    {
    }
};

// Offline (import-time) scan for the last moment before sustained trailing
// silence. Returns durationSec unchanged when no qualifying silence exists
// or the input is unusable. O(count); never call from the playback path.
double detectTrueEndTimeFromChannelData(const float* samples, size_t count,
                                        double sample_rate, double duration_sec,
                                        const TrueEndTimeOptions& options = TrueEndTimeOptions());

// Same scan over channel 0 of a decoded file
double detectTrueEndTime(const AudioFile& file,
                         const TrueEndTimeOptions& options = TrueEndTimeOptions());

} // namespace autodj

#endif // AUTODJ_TRUE_END_TIME_H
