#include "AudioFileLoader.h"

#include <algorithm>
#include <limits>

namespace {

std::shared_ptr<const DecodedSample> fail(juce::String* error, const juce::String& message)
{
    if (error != nullptr) {
        *error = message;
    }
    return nullptr;
}

}  // namespace

AudioFileLoader::AudioFileLoader()
{
    // WAV/AIFF/FLAC/Ogg depending on the JUCE configuration.
    formatManager_.registerBasicFormats();
}

std::shared_ptr<const DecodedSample> AudioFileLoader::load(const juce::File& file,
                                                           juce::String* error)
{
    if (!file.existsAsFile()) {
        return fail(error, "File not found: " + file.getFullPathName());
    }
    if (file.getSize() <= 0) {
        return fail(error, "Empty file: " + file.getFullPathName());
    }

    std::unique_ptr<juce::AudioFormatReader> reader(formatManager_.createReaderFor(file));
    if (reader == nullptr) {
        return fail(error, "Unsupported audio format: " + file.getFileName());
    }

    const juce::int64 numSamples64 = reader->lengthInSamples;
    if (numSamples64 <= 0) {
        return fail(error, "No audio frames in " + file.getFileName());
    }
    if (reader->sampleRate <= 0.0) {
        return fail(error, "Invalid sample rate in " + file.getFileName());
    }

    const int numFrames = static_cast<int>(
        std::min<juce::int64>(numSamples64, std::numeric_limits<int>::max()));
    const int channels = juce::jmax(1, static_cast<int>(reader->numChannels));

    auto sample = std::make_shared<DecodedSample>();
    sample->sampleRate = reader->sampleRate;
    sample->buffer.setSize(channels, numFrames);
    sample->buffer.clear();

    if (!reader->read(&sample->buffer, 0, numFrames, 0, true, true)) {
        return fail(error, "Failed to read audio data from " + file.getFileName());
    }

    if (error != nullptr) {
        error->clear();
    }
    return sample;
}
