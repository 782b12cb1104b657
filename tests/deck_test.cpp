#include "autodj_internal.h"
#include "wav_test_utils.h"

#include <cmath>
#include <cstdio>
#include <iostream>
#include <string>
#include <vector>

namespace {

bool near(double a, double b, double tolerance) {
    return std::abs(a - b) <= tolerance;
}

const int kSampleRate = 44100;
const int kFrames = 512;
const std::string kPath = "autodj_deck_test.wav";

float peak(const std::vector<float>& buffer) {
    float value = 0.0f;
    for (float sample : buffer) {
        value = std::max(value, std::abs(sample));
    }
    return value;
}

bool test_unity_playback_advances_position() {
    autodj::Deck deck(kSampleRate);
    if (!deck.loadTrack(kPath.c_str()) || !deck.isLoaded()) {
        std::cerr << "Deck test failed: could not load " << kPath << ".\n";
        return false;
    }
    if (!near(deck.getDuration(), 2.0, 1e-6)) {
        std::cerr << "Deck test failed: expected a 2s track.\n";
        return false;
    }

    std::vector<float> buffer(kFrames * 2, 1.0f);
    deck.readSamples(buffer.data(), kFrames);
    if (peak(buffer) != 0.0f || !near(deck.getPosition(), 0.0, 1e-9)) {
        std::cerr << "Deck test failed: a stopped deck must output silence and hold position.\n";
        return false;
    }

    deck.play();
    deck.readSamples(buffer.data(), kFrames);
    if (!near(deck.getPosition(), static_cast<double>(kFrames) / kSampleRate, 1e-9)) {
        std::cerr << "Deck test failed: unity playback should advance one buffer.\n";
        return false;
    }
    if (peak(buffer) < 0.4f) {
        std::cerr << "Deck test failed: expected the tone in the output.\n";
        return false;
    }
    return true;
}

bool test_volume_scales_output() {
    autodj::Deck deck(kSampleRate);
    deck.loadTrack(kPath.c_str());
    deck.setVolume(0.0f);
    deck.play();

    std::vector<float> buffer(kFrames * 2);
    deck.readSamples(buffer.data(), kFrames);
    if (peak(buffer) != 0.0f) {
        std::cerr << "Deck test failed: zero volume must be silent.\n";
        return false;
    }

    deck.setVolume(3.0f);
    if (deck.getVolume() != 1.0f) {
        std::cerr << "Deck test failed: volume should clamp to 1.\n";
        return false;
    }
    return true;
}

bool test_seek_stop_and_end_of_track() {
    autodj::Deck deck(kSampleRate);
    deck.loadTrack(kPath.c_str());

    deck.setPosition(1.5);
    if (!near(deck.getPosition(), 1.5, 1e-6)) {
        std::cerr << "Deck test failed: seek to 1.5s did not stick.\n";
        return false;
    }
    deck.setPosition(99.0);
    if (!near(deck.getPosition(), 2.0, 1e-6)) {
        std::cerr << "Deck test failed: seeking past the end should clamp to the duration.\n";
        return false;
    }

    deck.setPosition(2.0 - static_cast<double>(kFrames) / kSampleRate / 2.0);
    deck.play();
    std::vector<float> buffer(kFrames * 2);
    deck.readSamples(buffer.data(), kFrames);
    deck.readSamples(buffer.data(), kFrames);
    if (deck.isPlaying()) {
        std::cerr << "Deck test failed: the deck should stop at the end of the track.\n";
        return false;
    }

    deck.play();
    deck.stop();
    if (deck.isPlaying() || !near(deck.getPosition(), 0.0, 1e-9)) {
        std::cerr << "Deck test failed: stop should rewind.\n";
        return false;
    }
    return true;
}

bool test_tempo_is_clamped() {
    autodj::Deck deck(kSampleRate);
    deck.setTempo(4.0);
    if (!near(deck.getTempo(), 2.0, 1e-9)) {
        std::cerr << "Deck test failed: tempo should clamp to 2.0.\n";
        return false;
    }
    deck.setTempo(0.1);
    if (!near(deck.getTempo(), 0.5, 1e-9)) {
        std::cerr << "Deck test failed: tempo should clamp to 0.5.\n";
        return false;
    }
    return true;
}

bool test_stretched_position_follows_output() {
    autodj::Deck deck(kSampleRate);
    deck.loadTrack(kPath.c_str());
    deck.setTempo(1.25);
    deck.play();

    // Audible position is output frames times tempo, whatever SoundTouch holds back
    std::vector<float> buffer(kFrames * 2);
    for (int block = 1; block <= 40; block++) {
        deck.readSamples(buffer.data(), kFrames);
        const double heard = block * kFrames * 1.25 / kSampleRate;
        if (!near(deck.getPosition(), heard, 0.05)) {
            std::cerr << "Deck test failed: stretched position " << deck.getPosition()
                      << "s after block " << block << ", expected about " << heard << "s.\n";
            return false;
        }
    }

    deck.setPosition(0.5);
    if (!near(deck.getPosition(), 0.5, 1e-6)) {
        std::cerr << "Deck test failed: a seek should drop the SoundTouch backlog.\n";
        return false;
    }
    return true;
}

bool test_mixer_sums_decks() {
    autodj::Deck deck_a(kSampleRate);
    autodj::Deck deck_b(kSampleRate);
    deck_a.loadTrack(kPath.c_str());
    deck_b.loadTrack(kPath.c_str());
    deck_a.setVolume(0.25f);
    deck_b.setVolume(0.25f);
    deck_a.play();
    deck_b.play();

    autodj::Mixer mixer;
    std::vector<float> output(kFrames * 2);
    mixer.mix(&deck_a, &deck_b, output.data(), kFrames);

    // Same tone on both decks at a quarter each: half the source level
    autodj::AudioFile file;
    file.load(kPath.c_str());
    const float* source = file.getData();
    for (int i = 0; i < kFrames * 2; i++) {
        if (!near(output[i], source[i] * 0.5f, 1e-5)) {
            std::cerr << "Deck test failed: mixer output should be the sum of both decks.\n";
            return false;
        }
    }
    return true;
}

} // namespace

int main() {
    if (!autodj::tests::writePcm16Wav(kPath, autodj::tests::makeToneThenSilence(kSampleRate, 2.0, 0.0),
                                      kSampleRate)) {
        std::cerr << "Deck test failed: could not write " << kPath << ".\n";
        return 1;
    }

    bool ok = test_unity_playback_advances_position()
        && test_volume_scales_output()
        && test_seek_stop_and_end_of_track()
        && test_tempo_is_clamped()
        && test_stretched_position_follows_output()
        && test_mixer_sums_decks();

    std::remove(kPath.c_str());
    if (!ok) {
        return 1;
    }

    std::cout << "Deck test passed.\n";
    return 0;
}
