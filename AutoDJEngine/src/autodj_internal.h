#ifndef AUTODJ_INTERNAL_H
#define AUTODJ_INTERNAL_H

#include "deck_player.h"
#include "mix_settings.h"
#include "party_scheduler.h"
#include "track_library.h"

#include <cstdint>
#include <vector>
#include <mutex>
#include <atomic>
#include <memory>

// Forward declarations
namespace soundtouch {
    class SoundTouch;
}

namespace autodj {

// Audio file loader
class AudioFile {
public:
    AudioFile();
    ~AudioFile();

    bool load(const char* filepath);
    void unload();

    int64_t getTotalSamples() const { return total_samples_; }
    int getSampleRate() const { return sample_rate_; }
    int getChannels() const { return channels_; }
    double getDurationSeconds() const;

    const float* getData() const { return audio_data_.data(); }

private:
    std::vector<float> audio_data_;  // Interleaved stereo
    int64_t total_samples_;          // Total sample frames
    int sample_rate_;
    int channels_;
};

// Deck class
class Deck {
public:
    Deck(int sample_rate);
    ~Deck();

    bool loadTrack(const char* filepath);
    void unloadTrack();

    void play();
    void pause();
    void stop();
    bool isPlaying() const { return is_playing_; }

    void setPosition(double seconds);
    double getPosition() const;  // What has been heard, SoundTouch latency excluded
    double getDuration() const;

    void setVolume(float volume);
    float getVolume() const { return volume_; }
    void setTempo(double tempo);
    double getTempo() const { return tempo_; }

    // Audio processing
    int readSamples(float* output, int frames);

    bool isLoaded() const { return audio_file_ != nullptr && audio_file_->getTotalSamples() > 0; }

private:
    int sample_rate_;                // Output rate
    std::atomic<int> file_rate_;     // Source rate of the loaded track
    std::unique_ptr<AudioFile> audio_file_;
    std::unique_ptr<soundtouch::SoundTouch> soundtouch_;

    std::atomic<bool> is_playing_;
    std::atomic<int64_t> sample_position_;  // In source samples, fed to SoundTouch
    std::atomic<int64_t> buffered_samples_; // Fed to SoundTouch but not yet heard

    std::atomic<float> volume_;
    double tempo_;

    mutable std::mutex deck_mutex_;
};

// Mixer class
class Mixer {
public:
    Mixer();

    // Sums both decks; each deck applies its own volume
    void mix(Deck* deck_a, Deck* deck_b, float* output, int frames);

private:
    std::vector<float> buffer_a_;
    std::vector<float> buffer_b_;
};

// BPM of interleaved stereo PCM; 0.0 when no tempo could be found
double analyzeBPM(const float* samples, int64_t sampleCount, int sampleRate);

// Halves or doubles into 70-160 BPM; 0.0 for non-finite or non-positive input
double foldBpmToDjRange(double bpm);

// DeckPlayer over the engine's two decks
class EngineDeckPlayer : public DeckPlayer {
public:
    EngineDeckPlayer(Deck* deck_a, Deck* deck_b);

    bool load(DeckId deck, const Track& track) override;
    void unload(DeckId deck) override;
    void play(DeckId deck) override;
    void pause(DeckId deck) override;
    void stop(DeckId deck) override;
    void seek(DeckId deck, double seconds) override;
    void setRate(DeckId deck, double ratio) override;
    void setVolume(DeckId deck, float volume) override;
    double position(DeckId deck) const override;
    double duration(DeckId deck) const override;
    bool isPlaying(DeckId deck) const override;

private:
    Deck* decks_[2];
};

// Global engine state - shared across all source files
struct EngineState {
    std::unique_ptr<Deck> decks[2];
    std::unique_ptr<Mixer> mixer;
    std::unique_ptr<EngineDeckPlayer> player;
    std::unique_ptr<PartyScheduler> party;

    TrackLibrary library;

    void* stream;  // PaStream*, using void* to avoid PortAudio include in header
    int sample_rate;
    int buffer_size;

    std::atomic<int64_t> frames_rendered;  // Engine clock, advanced by the audio callback

    void* position_callback;  // Callbacks stored as void*
    void* track_skipped_callback;

    int callback_counter;

    // Serializes host commands (library, party, deck knobs) against party_tick
    std::mutex api_mutex;
};

extern EngineState* g_engine;

} // namespace autodj

#endif // AUTODJ_INTERNAL_H
