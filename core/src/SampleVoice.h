#pragma once

#include <atomic>
#include <memory>

#include "AudioFileLoader.h"

// Plays one decoded sample into the device output.
//
// Control methods are called from the engine thread and only touch
// atomics; renderAdd() runs on the audio thread and owns the play
// position. A voice that is not looping deactivates itself at the end
// of the sample and reports it through hasFinished().
class SampleVoice {
public:
    SampleVoice(std::shared_ptr<const DecodedSample> sample, bool looping, bool active);

    void setGain(float gain) noexcept { gain_.store(gain, std::memory_order_relaxed); }
    [[nodiscard]] float getGain() const noexcept { return gain_.load(std::memory_order_relaxed); }

    void setLooping(bool looping) noexcept { looping_.store(looping, std::memory_order_relaxed); }
    [[nodiscard]] bool isLooping() const noexcept { return looping_.load(std::memory_order_relaxed); }

    // Plays again from frame zero on the next audio block, cutting the
    // current pass short.
    void restart() noexcept;
    void halt() noexcept;

    [[nodiscard]] bool isActive() const noexcept;
    [[nodiscard]] bool hasFinished() const noexcept;

    [[nodiscard]] const DecodedSample& getSample() const { return *sample_; }

    // Audio thread. Mixes the next `numSamples` frames into `output`.
    void renderAdd(float* const* output, int numChannels, int numSamples,
                   double deviceSampleRate) noexcept;

private:
    std::shared_ptr<const DecodedSample> sample_;
    std::atomic<float> gain_{1.0F};
    std::atomic<bool> looping_;
    std::atomic<bool> active_;
    std::atomic<bool> restartPending_{false};
    std::atomic<bool> finished_{false};

    // Fractional read position in source frames. Audio thread only.
    double position_{0.0};
};
