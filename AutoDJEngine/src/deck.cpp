#include "autodj_internal.h"
#include <SoundTouch.h>
#include <algorithm>
#include <cmath>
#include <cstring>

namespace autodj {

Deck::Deck(int sample_rate)
    : sample_rate_(sample_rate)
    , file_rate_(sample_rate)
    , audio_file_(std::make_unique<AudioFile>())
    , soundtouch_(std::make_unique<soundtouch::SoundTouch>())
    , is_playing_(false)
    , sample_position_(0)
    , buffered_samples_(0)
    , volume_(1.0f)
    , tempo_(1.0)
{
    soundtouch_->setSampleRate(sample_rate);
    soundtouch_->setChannels(2);
    soundtouch_->setTempo(1.0);
    soundtouch_->setRate(1.0);
}

Deck::~Deck() {
}

bool Deck::loadTrack(const char* filepath) {
    // Decode outside the lock so the audio callback never waits on a decoder
    std::unique_ptr<AudioFile> file = std::make_unique<AudioFile>();
    if (!file->load(filepath)) {
        return false;
    }

    std::lock_guard<std::mutex> lock(deck_mutex_);

    audio_file_ = std::move(file);
    file_rate_ = audio_file_->getSampleRate();

    // Reset playback state
    sample_position_ = 0;
    buffered_samples_ = 0;
    is_playing_ = false;

    // Resample from the file's rate to the output rate inside SoundTouch
    soundtouch_->clear();
    soundtouch_->setSampleRate(file_rate_);
    soundtouch_->setRate(static_cast<double>(file_rate_) / sample_rate_);

    return true;
}

void Deck::unloadTrack() {
    std::lock_guard<std::mutex> lock(deck_mutex_);
    is_playing_ = false;
    sample_position_ = 0;
    buffered_samples_ = 0;
    audio_file_->unload();
    soundtouch_->clear();
}

void Deck::play() {
    if (!isLoaded()) return;
    is_playing_ = true;
}

void Deck::pause() {
    is_playing_ = false;
}

void Deck::stop() {
    std::lock_guard<std::mutex> lock(deck_mutex_);
    is_playing_ = false;
    sample_position_ = 0;
    buffered_samples_ = 0;
    soundtouch_->clear();
}

void Deck::setPosition(double seconds) {
    std::lock_guard<std::mutex> lock(deck_mutex_);

    int64_t new_pos = static_cast<int64_t>(seconds * file_rate_);
    new_pos = std::max<int64_t>(0, std::min(new_pos, audio_file_->getTotalSamples()));
    sample_position_ = new_pos;

    // Clear SoundTouch buffer when seeking
    soundtouch_->clear();
    buffered_samples_ = 0;
}

double Deck::getPosition() const {
    const int rate = file_rate_;
    if (rate <= 0) return 0.0;
    const int64_t heard = std::max<int64_t>(0, sample_position_.load() - buffered_samples_.load());
    return static_cast<double>(heard) / rate;
}

double Deck::getDuration() const {
    std::lock_guard<std::mutex> lock(deck_mutex_);
    return audio_file_->getDurationSeconds();
}

void Deck::setVolume(float volume) {
    volume_ = std::max(0.0f, std::min(volume, 1.0f));
}

void Deck::setTempo(double tempo) {
    std::lock_guard<std::mutex> lock(deck_mutex_);
    tempo_ = std::max(0.5, std::min(tempo, 2.0));
    soundtouch_->setTempo(tempo_);
}

int Deck::readSamples(float* output, int frames) {
    // Always zero-initialize output to prevent noise from uninitialized data
    memset(output, 0, frames * 2 * sizeof(float));

    if (!is_playing_) {
        return frames;
    }

    std::lock_guard<std::mutex> lock(deck_mutex_);

    if (audio_file_->getTotalSamples() == 0) {
        return frames;
    }

    const float gain = volume_;

    // Bypass SoundTouch at unity tempo and matching rates - no processing latency
    if (std::abs(tempo_ - 1.0) < 0.001 && file_rate_ == sample_rate_) {
        int64_t remaining = audio_file_->getTotalSamples() - sample_position_;
        if (remaining <= 0) {
            is_playing_ = false;
            return frames;
        }

        int to_read = static_cast<int>(std::min<int64_t>(remaining, frames));
        const float* source = audio_file_->getData() + (sample_position_ * 2);

        memcpy(output, source, to_read * 2 * sizeof(float));
        sample_position_ += to_read;
        buffered_samples_ = 0;

        for (int i = 0; i < to_read * 2; ++i) {
            output[i] *= gain;
        }

        return frames;
    }

    // Feed SoundTouch with source samples
    const int CHUNK_SIZE = 4096;
    while (soundtouch_->numSamples() < static_cast<unsigned int>(frames)) {
        int64_t remaining = audio_file_->getTotalSamples() - sample_position_;
        if (remaining <= 0) {
            // End of track once SoundTouch has nothing left to give
            if (soundtouch_->numSamples() == 0) {
                is_playing_ = false;
            }
            break;
        }

        int to_read = static_cast<int>(std::min<int64_t>(CHUNK_SIZE, remaining));
        const float* source = audio_file_->getData() + (sample_position_ * 2);

        soundtouch_->putSamples(source, to_read);
        sample_position_ += to_read;
    }

    // Read processed samples from SoundTouch
    int received = soundtouch_->receiveSamples(output, frames);

    // Output samples still queued stand for tempo * file/output rate source samples each
    const double source_per_output = tempo_ * file_rate_ / sample_rate_;
    buffered_samples_ = static_cast<int64_t>(soundtouch_->numUnprocessedSamples())
        + static_cast<int64_t>(soundtouch_->numSamples() * source_per_output);

    for (int i = 0; i < received * 2; i++) {
        output[i] *= gain;
    }

    // Remainder is already zeroed from memset above

    return frames;
}

} // namespace autodj
