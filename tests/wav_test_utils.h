#ifndef AUTODJ_TESTS_WAV_TEST_UTILS_H
#define AUTODJ_TESTS_WAV_TEST_UTILS_H

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

namespace autodj {
namespace tests {

inline bool writePcm16Wav(const std::string& path, const std::vector<float>& samples, int sample_rate) {
    std::ofstream out(path.c_str(), std::ios::binary);
    if (!out) {
        return false;
    }

    const uint16_t channels = 1;
    const uint16_t bits_per_sample = 16;
    const uint32_t byte_rate = static_cast<uint32_t>(sample_rate) * channels * (bits_per_sample / 8);
    const uint16_t block_align = channels * (bits_per_sample / 8);
    const uint32_t data_size = static_cast<uint32_t>(samples.size() * sizeof(int16_t));
    const uint32_t riff_size = 36 + data_size;

    out.write("RIFF", 4);
    out.write(reinterpret_cast<const char*>(&riff_size), sizeof(riff_size));
    out.write("WAVE", 4);
    out.write("fmt ", 4);
    const uint32_t fmt_size = 16;
    out.write(reinterpret_cast<const char*>(&fmt_size), sizeof(fmt_size));
    const uint16_t audio_format = 1;
    out.write(reinterpret_cast<const char*>(&audio_format), sizeof(audio_format));
    out.write(reinterpret_cast<const char*>(&channels), sizeof(channels));
    const uint32_t sr_u32 = static_cast<uint32_t>(sample_rate);
    out.write(reinterpret_cast<const char*>(&sr_u32), sizeof(sr_u32));
    out.write(reinterpret_cast<const char*>(&byte_rate), sizeof(byte_rate));
    out.write(reinterpret_cast<const char*>(&block_align), sizeof(block_align));
    out.write(reinterpret_cast<const char*>(&bits_per_sample), sizeof(bits_per_sample));
    out.write("data", 4);
    out.write(reinterpret_cast<const char*>(&data_size), sizeof(data_size));

    for (float sample : samples) {
        const float clamped = std::max(-1.0f, std::min(1.0f, sample));
        const int16_t pcm = static_cast<int16_t>(std::lrint(clamped * 32767.0f));
        out.write(reinterpret_cast<const char*>(&pcm), sizeof(pcm));
    }
    return out.good();
}

// Sine tone followed by digital silence
inline std::vector<float> makeToneThenSilence(int sample_rate, double tone_seconds,
                                              double silence_seconds, double frequency = 440.0,
                                              float amplitude = 0.5f) {
    const size_t tone = static_cast<size_t>(tone_seconds * sample_rate);
    const size_t silence = static_cast<size_t>(silence_seconds * sample_rate);
    std::vector<float> samples(tone + silence, 0.0f);
    const double two_pi = 6.283185307179586;
    for (size_t i = 0; i < tone; i++) {
        samples[i] = amplitude * static_cast<float>(std::sin(two_pi * frequency * i / sample_rate));
    }
    return samples;
}

} // namespace tests
} // namespace autodj

#endif // AUTODJ_TESTS_WAV_TEST_UTILS_H
