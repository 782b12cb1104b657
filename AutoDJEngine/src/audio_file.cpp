#include "autodj_internal.h"
#include "logging.h"

// dr_libs for audio file loading
#define DR_MP3_IMPLEMENTATION
#define DR_WAV_IMPLEMENTATION
#define DR_FLAC_IMPLEMENTATION
#include <dr_mp3.h>
#include <dr_wav.h>
#include <dr_flac.h>

#include <cstring>
#include <cctype>
#include <algorithm>

namespace autodj {

namespace {

enum class FileKind { Unknown, Mp3, Wav, Flac };

FileKind kindFromExtension(const char* filepath) {
    const char* ext = strrchr(filepath, '.');
    if (!ext) return FileKind::Unknown;

    // Convert to lowercase for comparison
    char ext_lower[10] = {0};
    for (int i = 0; i < 9 && ext[i]; i++) {
        ext_lower[i] = static_cast<char>(tolower(static_cast<unsigned char>(ext[i])));
    }

    if (strcmp(ext_lower, ".mp3") == 0) return FileKind::Mp3;
    if (strcmp(ext_lower, ".wav") == 0) return FileKind::Wav;
    if (strcmp(ext_lower, ".flac") == 0) return FileKind::Flac;
    return FileKind::Unknown;
}

} // namespace

AudioFile::AudioFile()
    : total_samples_(0)
    , sample_rate_(0)
    , channels_(0)
{
}

AudioFile::~AudioFile() {
    unload();
}

bool AudioFile::load(const char* filepath) {
    unload();

    if (!filepath) return false;

    const FileKind kind = kindFromExtension(filepath);

    drwav_uint64 frames = 0;
    unsigned int channels = 0;
    unsigned int sample_rate = 0;
    float* data = nullptr;

    switch (kind) {
        case FileKind::Mp3: {
            drmp3_config config;
            drmp3_uint64 mp3_frames = 0;
            data = drmp3_open_file_and_read_pcm_frames_f32(filepath, &config, &mp3_frames, nullptr);
            frames = mp3_frames;
            channels = config.channels;
            sample_rate = config.sampleRate;
            break;
        }
        case FileKind::Wav:
            data = drwav_open_file_and_read_pcm_frames_f32(filepath, &channels, &sample_rate, &frames, nullptr);
            break;
        case FileKind::Flac: {
            drflac_uint64 flac_frames = 0;
            data = drflac_open_file_and_read_pcm_frames_f32(filepath, &channels, &sample_rate, &flac_frames, nullptr);
            frames = flac_frames;
            break;
        }
        case FileKind::Unknown:
            AUTODJ_LOG_WARN("Unsupported audio file type: %s", filepath);
            return false;
    }

    if (!data) {
        AUTODJ_LOG_WARN("Could not decode %s", filepath);
        return false;
    }

    if (frames == 0 || channels == 0 || sample_rate == 0) {
        AUTODJ_LOG_WARN("Empty or malformed audio in %s", filepath);
        drwav_free(data, nullptr);
        return false;
    }

    // Always keep interleaved stereo
    audio_data_.resize(static_cast<size_t>(frames) * 2);
    if (channels == 1) {
        for (drwav_uint64 i = 0; i < frames; i++) {
            audio_data_[i * 2] = data[i];      // Left
            audio_data_[i * 2 + 1] = data[i];  // Right
        }
    } else {
        // Stereo, or the front pair of a multichannel file
        for (drwav_uint64 i = 0; i < frames; i++) {
            audio_data_[i * 2] = data[i * channels];
            audio_data_[i * 2 + 1] = data[i * channels + 1];
        }
    }
    channels_ = 2;

    total_samples_ = static_cast<int64_t>(frames);
    sample_rate_ = static_cast<int>(sample_rate);

    // dr_libs all allocate with the default allocator
    drwav_free(data, nullptr);

    return true;
}

void AudioFile::unload() {
    audio_data_.clear();
    audio_data_.shrink_to_fit();
    total_samples_ = 0;
    sample_rate_ = 0;
    channels_ = 0;
}

double AudioFile::getDurationSeconds() const {
    if (sample_rate_ == 0) return 0.0;
    return static_cast<double>(total_samples_) / sample_rate_;
}

} // namespace autodj
