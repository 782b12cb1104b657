// BPM Analyzer using QM DSP TempoTrackV2 (same library as Mixxx)
// Runs once per track on import; the result feeds tempo matching

#include "autodj_internal.h"
#include "logging.h"

// QM DSP includes
#include <dsp/tempotracking/TempoTrackV2.h>
#include <dsp/onsets/DetectionFunction.h>

#include <cmath>
#include <algorithm>
#include <exception>
#include <vector>

namespace autodj {

namespace {

const int kStepSize = 512;      // Hop size
const int kFrameLength = 1024;  // Frame size
const size_t kMinDetectionFrames = 100;

// Tempi outside this window are treated as tracker outliers
const double kMinPlausibleTempo = 60.0;
const double kMaxPlausibleTempo = 200.0;

// Reported BPM is folded into the usual DJ range
const double kFoldLowBpm = 70.0;
const double kFoldHighBpm = 160.0;

} // namespace

double foldBpmToDjRange(double bpm) {
    if (!std::isfinite(bpm) || bpm <= 0.0) {
        return 0.0;
    }
    while (bpm < kFoldLowBpm) bpm *= 2;
    while (bpm > kFoldHighBpm) bpm /= 2;
    return bpm;
}

// Analyze interleaved stereo audio for BPM using QM DSP TempoTrackV2
double analyzeBPM(const float* samples, int64_t sampleCount, int sampleRate) {
    if (!samples || sampleCount <= 0 || sampleRate <= 0) {
        AUTODJ_LOG_WARN("BPM analysis skipped: no audio");
        return 0.0;
    }

    AUTODJ_LOG_DEBUG("BPM analysis: %lld frames at %d Hz (%.1f seconds)",
                     static_cast<long long>(sampleCount), sampleRate,
                     static_cast<double>(sampleCount) / sampleRate);

    // sampleCount = number of stereo sample frames
    const int64_t numFrames = (sampleCount - kFrameLength) / kStepSize;
    if (numFrames <= 0) {
        AUTODJ_LOG_INFO("BPM analysis: track too short (%lld frames)",
                        static_cast<long long>(sampleCount));
        return 0.0;
    }

    try {
        // Complex spectral difference - best for beats
        DFConfig dfConfig;
        dfConfig.stepSize = kStepSize;
        dfConfig.frameLength = kFrameLength;
        dfConfig.DFType = DF_COMPLEXSD;
        dfConfig.dbRise = 3.0;
        dfConfig.adaptiveWhitening = false;
        dfConfig.whiteningRelaxCoeff = -1;
        dfConfig.whiteningFloor = -1;

        DetectionFunction df(dfConfig);

        std::vector<double> detectionFunction;
        detectionFunction.reserve(static_cast<size_t>(numFrames));
        std::vector<double> frame(kFrameLength);

        for (int64_t f = 0; f < numFrames; f++) {
            const int64_t startFrame = f * kStepSize;

            // Downmix to mono for this frame
            for (int i = 0; i < kFrameLength; i++) {
                const int64_t frameIdx = startFrame + i;
                if (frameIdx < sampleCount) {
                    const int64_t bufIdx = frameIdx * 2;
                    frame[i] = (samples[bufIdx] + samples[bufIdx + 1]) / 2.0;
                } else {
                    frame[i] = 0.0;
                }
            }

            detectionFunction.push_back(df.processTimeDomain(frame.data()));
        }

        if (detectionFunction.size() < kMinDetectionFrames) {
            AUTODJ_LOG_INFO("BPM analysis: not enough frames for tempo tracking (%zu)",
                            detectionFunction.size());
            return 0.0;
        }

        TempoTrackV2 tempoTracker(static_cast<float>(sampleRate), kStepSize);

        std::vector<double> beatPeriod;
        std::vector<double> tempi;
        tempoTracker.calculateBeatPeriod(detectionFunction, beatPeriod, tempi, 120.0, false);

        double detectedBPM = 0.0;
        if (!tempi.empty()) {
            // Median for stability
            std::vector<double> tempiSorted = tempi;
            std::sort(tempiSorted.begin(), tempiSorted.end());

            std::vector<double> filteredTempi;
            for (double t : tempiSorted) {
                if (t >= kMinPlausibleTempo && t <= kMaxPlausibleTempo) {
                    filteredTempi.push_back(t);
                }
            }

            if (!filteredTempi.empty()) {
                detectedBPM = filteredTempi[filteredTempi.size() / 2];
            } else {
                detectedBPM = tempiSorted[tempiSorted.size() / 2];
            }
        }

        detectedBPM = foldBpmToDjRange(detectedBPM);

        AUTODJ_LOG_DEBUG("BPM analysis result: %.1f BPM (raw tempi count: %zu)",
                         detectedBPM, tempi.size());
        return detectedBPM;

    } catch (const std::exception& e) {
        AUTODJ_LOG_ERROR("BPM analysis failed: %s", e.what());
        return 0.0;
    }
}

} // namespace autodj
