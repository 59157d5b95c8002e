#pragma once

#include <atomic>
#include <memory>
#include <vector>

#include <juce_audio_formats/juce_audio_formats.h>

// Captures device input into an audio file.
//
// The writer is opened off the audio thread (openWavWriter) and handed
// to start(). Samples are pushed from the audio callback into a
// juce::AudioFormatWriter::ThreadedWriter whose FIFO is drained by a
// TimeSliceThread, so the audio thread never touches the disk. An
// optional frame cap makes the recorder write exactly that many frames
// and then ignore further input.
class Recorder {
public:
    static constexpr int kMaxChannels = 8;

    explicit Recorder(juce::TimeSliceThread& writerThread);
    ~Recorder();

    // Creates the WAV file and its encoder. Returns nullptr and fills
    // `error` on failure, leaving no file behind.
    [[nodiscard]] static std::unique_ptr<juce::AudioFormatWriter> openWavWriter(
        const juce::File& file, double sampleRate, int numChannels,
        int bitsPerSample, juce::String* error);

    // Arms capture. `maxFrames` <= 0 records without a cap.
    void start(std::unique_ptr<juce::AudioFormatWriter> writer, juce::int64 maxFrames);

    // Detaches the writer from the audio thread. Destroying the
    // returned writer flushes and closes the file, which may block.
    [[nodiscard]] std::unique_ptr<juce::AudioFormatWriter::ThreadedWriter> stop();

    [[nodiscard]] bool isCapturing() const noexcept;
    [[nodiscard]] bool hasReachedCap() const noexcept;
    [[nodiscard]] juce::int64 getFramesWritten() const noexcept;
    [[nodiscard]] juce::int64 getMaxFrames() const noexcept;
    [[nodiscard]] juce::int64 getDroppedFrames() const noexcept;

    // Audio thread.
    void process(const float* const* input, int numInputChannels, int numSamples) noexcept;

private:
    void writeBlock(const float* const* input, int numInputChannels, int offset,
                    int numSamples) noexcept;

    juce::TimeSliceThread& writerThread_;

    juce::SpinLock writerLock_;
    std::unique_ptr<juce::AudioFormatWriter::ThreadedWriter> threadedWriter_;
    juce::AudioFormatWriter::ThreadedWriter* activeWriter_{nullptr};  // Guarded by writerLock_.
    int writerChannels_{1};

    std::atomic<juce::int64> framesWritten_{0};
    std::atomic<juce::int64> maxFrames_{0};
    std::atomic<juce::int64> droppedFrames_{0};
    std::atomic<bool> capReached_{false};

    // Stands in for input channels the device leaves null.
    std::vector<float> silence_;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(Recorder)
};
