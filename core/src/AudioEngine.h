#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <juce_audio_devices/juce_audio_devices.h>
#include <juce_audio_basics/juce_audio_basics.h>
#include <juce_audio_formats/juce_audio_formats.h>
#include <juce_events/juce_events.h>

#include "AudioFileLoader.h"
#include "AutoStopTimer.h"
#include "AudioRouteManager.h"
#include "AudioSession.h"
#include "EngineConfig.h"
#include "ExternalFile.h"
#include "LoopMixer.h"
#include "Recorder.h"
#include "SoundboardEngine.h"
#include "core/EngineError.h"
#include "core/EngineSnapshot.h"
#include "core/PlaybackHandle.h"
#include "core/SessionManifest.h"

// Looper/soundboard engine.
//
// Responsibilities:
//   - Receive device audio through the AudioSession and feed the
//     recorder, the loop players and the soundboard pads.
//   - Run the recording state machine: the first loop sets the master
//     duration, later loops auto-stop at exactly that duration.
//   - Hand file work (writer open, flush, validation, decoding, import
//     copies, manifest writes) to a single background worker and apply
//     the results back on the engine thread.
//
// Every public method must be called on the engine thread, which is
// the thread `post` delivers to (the JUCE message thread in the
// application).
class AudioEngine : public juce::AudioIODeviceCallback,
                    private juce::AsyncUpdater {
public:
    using Task = std::function<void()>;
    using Poster = std::function<void(Task)>;

    class Listener {
    public:
        virtual ~Listener() = default;
        virtual void engineStateChanged() {}
        virtual void engineErrorOccurred(const looptune::EngineError& error)
        {
            juce::ignoreUnused(error);
        }
    };

    // Without a poster, work is delivered with MessageManager::callAsync.
    AudioEngine(AudioSession& session, EngineConfig config, Poster post = {});
    ~AudioEngine() override;

    // Detaches from the device, drains the worker and writes the
    // manifest. Called by the destructor; safe to call twice.
    void shutdown();

    // --- Recording -----------------------------------------------------
    void toggleRecording();
    void startRecording();
    // Stops any running recording, loop or pad.
    void stopRecording();

    // --- Loops ---------------------------------------------------------
    looptune::PlaybackHandle playLoop(const looptune::LoopId& id,
                                      bool indefinite = false,
                                      std::function<void()> onFinish = {});
    void stopLoop(const looptune::LoopId& id);
    void playAll();
    void stopAll();
    void setLoopVolume(const looptune::LoopId& id, float volume);
    void toggleMute(const looptune::LoopId& id);
    void toggleSolo(const looptune::LoopId& id);
    bool deleteLoop(const looptune::LoopId& id);

    // --- Ports ---------------------------------------------------------
    bool selectInput(const looptune::AudioPortDescriptor& port);
    bool selectOutput(const looptune::AudioPortDescriptor& port);

    // --- Soundboard ----------------------------------------------------
    void recordSlot(int index);
    void stopSlotRecording();
    void assignSlot(int index, std::shared_ptr<ExternalFileReference> source);
    void playSlot(int index);
    void removeSlot(int index);
    void toggleEditMode();
    void tapSlot(int index);

    // --- Session -------------------------------------------------------
    // Re-attaches the loops and pads listed in the manifest. Entries
    // whose file is gone are skipped. Pads become playable once their
    // decode on the worker is delivered.
    bool restoreSession();
    [[nodiscard]] juce::File getManifestFile() const;

    [[nodiscard]] looptune::EngineSnapshot snapshot() const;
    [[nodiscard]] const std::optional<looptune::EngineError>& getLastError() const
    {
        return lastError_;
    }
    [[nodiscard]] const EngineConfig& getConfig() const { return config_; }

    void addListener(Listener* listener) { listeners_.add(listener); }
    void removeListener(Listener* listener) { listeners_.remove(listener); }

    // Delivers finished-playback events. Triggered asynchronously from
    // the audio thread; exposed for hosts without a message loop.
    void dispatchPendingCompletions();

    [[nodiscard]] LoopMixer& getMixer() { return mixer_; }
    [[nodiscard]] SoundboardEngine& getSoundboard() { return soundboard_; }
    [[nodiscard]] AudioRouteManager& getRouteManager() { return routeManager_; }
    [[nodiscard]] const Recorder& getRecorder() const { return recorder_; }

    // juce::AudioIODeviceCallback
    void audioDeviceAboutToStart(juce::AudioIODevice* device) override;
    void audioDeviceStopped() override;
    void audioDeviceIOCallbackWithContext(
        const float* const* inputChannelData,
        int numInputChannels,
        float* const* outputChannelData,
        int numOutputChannels,
        int numSamples,
        const juce::AudioIODeviceCallbackContext& context) override;

private:
    enum class RecordingPhase { kIdle = 0, kStarting, kRecording, kFinalising };
    enum class RecordingTarget { kLoop = 0, kSlot };

    struct RecordingState {
        RecordingPhase phase{RecordingPhase::kIdle};
        RecordingTarget target{RecordingTarget::kLoop};
        int slot{-1};
        juce::uint64 generation{0};
        juce::File file;
        double sampleRate{0.0};
        // Millisecond counter after which auto-stop keeps what was captured.
        double autoStopDeadlineMs{0.0};
        // Loops started for sync when capture began.
        std::vector<looptune::LoopId> syncLoops;
    };

    void handleAsyncUpdate() override;

    bool activateSession();
    void beginRecording(RecordingTarget target, int slot);
    void finishRecording();
    void handleWriterOpened(juce::uint64 generation, const juce::File& file,
                            std::unique_ptr<juce::AudioFormatWriter> writer,
                            const juce::String& error);
    void handleRecordingFinalised(juce::uint64 generation, const juce::File& file,
                                  std::shared_ptr<const DecodedSample> sample,
                                  const juce::String& error);
    void armAutoStop(double seconds, juce::uint64 generation);
    void handleAutoStop(juce::uint64 generation);

    void handleSlotRestored(const looptune::ManifestSlot& entry, const juce::File& file,
                            std::shared_ptr<const DecodedSample> sample,
                            const juce::String& error);
    // Forgets a pad still loading from the manifest and deletes its file.
    void dropRestoringSlot(int index);
    void handleImportFinished(int index, const juce::File& file, const juce::String& title,
                              std::shared_ptr<const DecodedSample> sample,
                              const juce::String& error, bool copyFailed);

    [[nodiscard]] std::string buildManifestText() const;
    void persistManifest();
    void writeManifestNow();

    void reportError(looptune::EngineErrorKind kind, const std::string& message);
    void notifyStateChanged();

    AudioSession& session_;
    EngineConfig config_;
    Poster post_;

    juce::TimeSliceThread writerThread_;
    juce::ThreadPool worker_;
    AudioFileLoader workerLoader_;  // Worker thread only.

    Recorder recorder_;
    LoopMixer mixer_;
    SoundboardEngine soundboard_;
    AudioRouteManager routeManager_;
    AutoStopTimer autoStop_;

    RecordingState recording_;
    // Manifest pads whose decode has not arrived yet, by slot index.
    std::map<int, looptune::ManifestSlot> restoringSlots_;
    juce::uint64 nextGeneration_{0};
    bool recordDenied_{false};
    std::optional<looptune::EngineError> lastError_;

    std::atomic<double> deviceSampleRate_{44100.0};
    bool isShutdown_{false};

    juce::ListenerList<Listener> listeners_;

    JUCE_DECLARE_WEAK_REFERENCEABLE(AudioEngine)
    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(AudioEngine)
};
