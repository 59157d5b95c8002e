#include "SampleVoice.h"

#include <cmath>
#include <utility>

SampleVoice::SampleVoice(std::shared_ptr<const DecodedSample> sample,
                         const bool looping,
                         const bool active)
    : sample_(std::move(sample)), looping_(looping), active_(active)
{
}

void SampleVoice::restart() noexcept
{
    finished_.store(false, std::memory_order_relaxed);
    restartPending_.store(true, std::memory_order_release);
}

void SampleVoice::halt() noexcept
{
    restartPending_.store(false, std::memory_order_relaxed);
    active_.store(false, std::memory_order_release);
}

bool SampleVoice::isActive() const noexcept
{
    return active_.load(std::memory_order_acquire) ||
           restartPending_.load(std::memory_order_acquire);
}

bool SampleVoice::hasFinished() const noexcept
{
    return finished_.load(std::memory_order_acquire);
}

void SampleVoice::renderAdd(float* const* output,
                            const int numChannels,
                            const int numSamples,
                            const double deviceSampleRate) noexcept
{
    if (restartPending_.exchange(false, std::memory_order_acq_rel)) {
        position_ = 0.0;
        finished_.store(false, std::memory_order_relaxed);
        active_.store(true, std::memory_order_release);
    }

    if (!active_.load(std::memory_order_acquire)) {
        return;
    }

    const auto& buffer = sample_->buffer;
    const int numFrames = buffer.getNumSamples();
    const int sourceChannels = buffer.getNumChannels();
    if (numFrames <= 0 || sourceChannels <= 0 || deviceSampleRate <= 0.0) {
        return;
    }

    // Source frames advanced per device frame. Both rates are equal
    // in the common case and the read below is then exact.
    const double step = sample_->sampleRate / deviceSampleRate;
    const float gain = gain_.load(std::memory_order_relaxed);
    const bool looping = looping_.load(std::memory_order_relaxed);

    for (int i = 0; i < numSamples; ++i) {
        if (position_ >= static_cast<double>(numFrames)) {
            if (!looping) {
                active_.store(false, std::memory_order_release);
                finished_.store(true, std::memory_order_release);
                return;
            }
            position_ = std::fmod(position_, static_cast<double>(numFrames));
        }

        const int index = static_cast<int>(position_);
        const float frac = static_cast<float>(position_ - static_cast<double>(index));
        int next = index + 1;
        if (next >= numFrames) {
            next = looping ? 0 : index;
        }

        for (int channel = 0; channel < numChannels; ++channel) {
            float* dest = output[channel];
            if (dest == nullptr) {
                continue;
            }
            const float* src = buffer.getReadPointer(juce::jmin(channel, sourceChannels - 1));
            const float value = src[index] + (src[next] - src[index]) * frac;
            dest[i] += value * gain;
        }

        position_ += step;
    }

    if (!looping && position_ >= static_cast<double>(numFrames)) {
        active_.store(false, std::memory_order_release);
        finished_.store(true, std::memory_order_release);
    }
}
