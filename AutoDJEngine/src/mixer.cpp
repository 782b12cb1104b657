#include "autodj_internal.h"
#include <algorithm>
#include <cmath>

namespace autodj {

namespace {
const float kClipKnee = 0.8f;
const float kClipHeadroom = 1.0f - kClipKnee;
}

Mixer::Mixer() {
}

void Mixer::mix(Deck* deck_a, Deck* deck_b, float* output, int frames) {
    const size_t needed = static_cast<size_t>(frames) * 2;
    if (buffer_a_.size() < needed) {
        // Only grows when the host asks for a bigger buffer than before
        buffer_a_.resize(needed);
        buffer_b_.resize(needed);
    }

    deck_a->readSamples(buffer_a_.data(), frames);
    deck_b->readSamples(buffer_b_.data(), frames);

    for (size_t i = 0; i < needed; i++) {
        output[i] = buffer_a_[i] + buffer_b_[i];

        // Soft knee above the threshold, approaching full scale
        if (output[i] > kClipKnee) {
            output[i] = kClipKnee + kClipHeadroom * (1.0f - std::exp((kClipKnee - output[i]) / kClipHeadroom));
        }
        else if (output[i] < -kClipKnee) {
            output[i] = -kClipKnee - kClipHeadroom * (1.0f - std::exp((kClipKnee + output[i]) / kClipHeadroom));
        }
    }
}

} // namespace autodj
