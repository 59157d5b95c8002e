#include "Recorder.h"

#include <algorithm>

namespace {

constexpr int kSilenceFrames = 4096;

// FIFO length of the threaded writer, in seconds of audio. Large
// enough to ride out slow disks without dropping input.
constexpr double kWriterFifoSeconds = 10.0;

}  // namespace

Recorder::Recorder(juce::TimeSliceThread& writerThread)
    : writerThread_(writerThread)
{
    silence_.assign(static_cast<std::size_t>(kSilenceFrames), 0.0F);
}

Recorder::~Recorder()
{
    // An unfinished capture is flushed and closed here.
    auto writer = stop();
    writer.reset();
}

std::unique_ptr<juce::AudioFormatWriter> Recorder::openWavWriter(const juce::File& file,
                                                                 const double sampleRate,
                                                                 const int numChannels,
                                                                 const int bitsPerSample,
                                                                 juce::String* error)
{
    const auto setError = [error](const juce::String& message) {
        if (error != nullptr) {
            *error = message;
        }
    };

    if (sampleRate <= 0.0 || numChannels <= 0 || numChannels > kMaxChannels) {
        setError("Invalid recording format");
        return nullptr;
    }

    const auto parent = file.getParentDirectory();
    if (!parent.isDirectory()) {
        const auto created = parent.createDirectory();
        if (created.failed()) {
            setError("Cannot create " + parent.getFullPathName() + ": " +
                     created.getErrorMessage());
            return nullptr;
        }
    }

    auto stream = std::make_unique<juce::FileOutputStream>(file);
    if (!stream->openedOk()) {
        setError("Cannot open " + file.getFullPathName() + ": " +
                 stream->getStatus().getErrorMessage());
        stream.reset();
        file.deleteFile();
        return nullptr;
    }

    juce::WavAudioFormat wav;
    std::unique_ptr<juce::AudioFormatWriter> writer(
        wav.createWriterFor(stream.get(), sampleRate,
                            static_cast<unsigned int>(numChannels), bitsPerSample,
                            {}, 0));
    if (writer == nullptr) {
        setError("Cannot create a " + juce::String(bitsPerSample) +
                 "-bit WAV encoder for " + file.getFileName());
        stream.reset();
        file.deleteFile();
        return nullptr;
    }

    // The writer owns the stream from now on.
    stream.release();
    return writer;
}

void Recorder::start(std::unique_ptr<juce::AudioFormatWriter> writer,
                     const juce::int64 maxFrames)
{
    auto previous = stop();
    previous.reset();

    if (writer == nullptr) {
        return;
    }

    const int channels = static_cast<int>(writer->getNumChannels());
    const int fifoFrames = juce::jmax(
        32768, static_cast<int>(writer->getSampleRate() * kWriterFifoSeconds));

    framesWritten_.store(0);
    droppedFrames_.store(0);
    capReached_.store(false);
    maxFrames_.store(juce::jmax<juce::int64>(0, maxFrames));

    threadedWriter_ = std::make_unique<juce::AudioFormatWriter::ThreadedWriter>(
        writer.release(), writerThread_, fifoFrames);

    const juce::SpinLock::ScopedLockType lock(writerLock_);
    writerChannels_ = juce::jlimit(1, kMaxChannels, channels);
    activeWriter_ = threadedWriter_.get();
}

std::unique_ptr<juce::AudioFormatWriter::ThreadedWriter> Recorder::stop()
{
    {
        const juce::SpinLock::ScopedLockType lock(writerLock_);
        activeWriter_ = nullptr;
    }
    return std::move(threadedWriter_);
}

bool Recorder::isCapturing() const noexcept
{
    return threadedWriter_ != nullptr;
}

bool Recorder::hasReachedCap() const noexcept
{
    return capReached_.load(std::memory_order_acquire);
}

juce::int64 Recorder::getFramesWritten() const noexcept
{
    return framesWritten_.load(std::memory_order_acquire);
}

juce::int64 Recorder::getMaxFrames() const noexcept
{
    return maxFrames_.load(std::memory_order_acquire);
}

juce::int64 Recorder::getDroppedFrames() const noexcept
{
    return droppedFrames_.load(std::memory_order_acquire);
}

void Recorder::process(const float* const* input,
                       const int numInputChannels,
                       const int numSamples) noexcept
{
    const juce::SpinLock::ScopedTryLockType lock(writerLock_);
    if (!lock.isLocked() || activeWriter_ == nullptr || numSamples <= 0) {
        return;
    }

    int toWrite = numSamples;
    const juce::int64 maxFrames = maxFrames_.load(std::memory_order_relaxed);
    if (maxFrames > 0) {
        const juce::int64 remaining =
            maxFrames - framesWritten_.load(std::memory_order_relaxed);
        if (remaining <= 0) {
            return;
        }
        toWrite = static_cast<int>(std::min<juce::int64>(remaining, numSamples));
    }

    int offset = 0;
    while (offset < toWrite) {
        const int chunk = std::min(toWrite - offset, kSilenceFrames);
        writeBlock(input, numInputChannels, offset, chunk);
        offset += chunk;
    }

    if (maxFrames > 0 && framesWritten_.load(std::memory_order_relaxed) >= maxFrames) {
        capReached_.store(true, std::memory_order_release);
    }
}

void Recorder::writeBlock(const float* const* input,
                          const int numInputChannels,
                          const int offset,
                          const int numSamples) noexcept
{
    const float* channels[kMaxChannels] = {};

    for (int channel = 0; channel < writerChannels_; ++channel) {
        const float* source = nullptr;
        if (input != nullptr && numInputChannels > 0) {
            // Devices with fewer inputs than the file feed every extra
            // file channel from their last input.
            source = input[juce::jmin(channel, numInputChannels - 1)];
        }
        channels[channel] = source != nullptr ? source + offset : silence_.data();
    }

    if (activeWriter_->write(channels, numSamples)) {
        framesWritten_.fetch_add(numSamples, std::memory_order_relaxed);
    } else {
        droppedFrames_.fetch_add(numSamples, std::memory_order_relaxed);
    }
}
