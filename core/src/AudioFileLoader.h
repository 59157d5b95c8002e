#pragma once

#include <memory>

#include <juce_audio_basics/juce_audio_basics.h>
#include <juce_audio_formats/juce_audio_formats.h>

// Fully decoded audio file kept in memory for playback.
struct DecodedSample {
    juce::AudioBuffer<float> buffer;
    double sampleRate{0.0};

    [[nodiscard]] int getNumFrames() const { return buffer.getNumSamples(); }
    [[nodiscard]] double getDurationSeconds() const
    {
        return sampleRate > 0.0 ? static_cast<double>(buffer.getNumSamples()) / sampleRate
                                : 0.0;
    }
};

// Decodes and validates audio files. A file is valid when it exists,
// is not empty, can be decoded by one of the registered formats and
// holds at least one frame at a positive sample rate.
class AudioFileLoader {
public:
    AudioFileLoader();

    // Returns nullptr and fills `error` when the file is not valid.
    [[nodiscard]] std::shared_ptr<const DecodedSample> load(
        const juce::File& file, juce::String* error = nullptr);

private:
    juce::AudioFormatManager formatManager_;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(AudioFileLoader)
};
