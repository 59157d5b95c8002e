#include "AudioEngine.h"

#include <algorithm>
#include <cmath>
#include <utility>

#include "core/SessionManifest.h"
#include "core/StorageNaming.h"

namespace {

constexpr int kWorkerDrainTimeoutMs = 10000;
constexpr int kWriterThreadStopTimeoutMs = 2000;

// Shortest re-arm delay while waiting for the recorder to reach its cap.
constexpr double kMinAutoStopRetrySeconds = 0.005;

// How long auto-stop waits past the limit for frames the device has not
// delivered. A stalled device ends the take with what was captured.
constexpr double kAutoStopGraceSeconds = 1.0;

std::string newUuid()
{
    return juce::Uuid().toDashedString().toStdString();
}

}  // namespace

AudioEngine::AudioEngine(AudioSession& session, EngineConfig config, Poster post)
    : session_(session),
      config_(std::move(config)),
      post_(std::move(post)),
      writerThread_("looptune-writer"),
      worker_(1),
      recorder_(writerThread_),
      routeManager_(session),
      autoStop_([this](Task task) { post_(std::move(task)); })
{
    if (!post_) {
        post_ = [](Task task) { juce::MessageManager::callAsync(std::move(task)); };
    }

    const double sessionRate = session_.getSampleRate();
    if (sessionRate > 0.0) {
        deviceSampleRate_.store(sessionRate);
    }

    if (!config_.storageDirectory.isDirectory()) {
        const auto created = config_.storageDirectory.createDirectory();
        if (created.failed()) {
            juce::Logger::writeToLog("[looptune-core] Cannot create storage directory " +
                                     config_.storageDirectory.getFullPathName() + ": " +
                                     created.getErrorMessage());
        }
    }

    const auto forwardError = [this](const looptune::EngineError& error) {
        reportError(error.kind, error.message);
    };
    mixer_.onError = forwardError;
    routeManager_.onError = forwardError;
    routeManager_.onChanged = [this] { notifyStateChanged(); };

    writerThread_.startThread();
    session_.setAudioCallback(this);

    juce::Logger::writeToLog("[looptune-core] Audio engine initialised, storage: " +
                             config_.storageDirectory.getFullPathName());
}

AudioEngine::~AudioEngine()
{
    shutdown();
}

void AudioEngine::shutdown()
{
    if (isShutdown_) {
        return;
    }
    isShutdown_ = true;

    autoStop_.cancel();
    cancelPendingUpdate();

    // No further audio callbacks after this point.
    session_.setAudioCallback(nullptr);

    worker_.removeAllJobs(true, kWorkerDrainTimeoutMs);

    // A capture that never got validated is not kept.
    auto writer = recorder_.stop();
    writer.reset();
    if (recording_.phase != RecordingPhase::kIdle && recording_.file != juce::File()) {
        recording_.file.deleteFile();
    }
    recording_ = {};

    mixer_.stopAll();
    soundboard_.stopAll();
    writerThread_.stopThread(kWriterThreadStopTimeoutMs);

    writeManifestNow();
}

//==============================================================================
// Audio thread

void AudioEngine::audioDeviceAboutToStart(juce::AudioIODevice* device)
{
    const double sr = (device != nullptr) ? device->getCurrentSampleRate() : 0.0;
    if (sr > 0.0) {
        deviceSampleRate_.store(sr);
    }
}

void AudioEngine::audioDeviceStopped()
{
}

void AudioEngine::audioDeviceIOCallbackWithContext(
    const float* const* inputChannelData,
    const int numInputChannels,
    float* const* outputChannelData,
    const int numOutputChannels,
    const int numSamples,
    const juce::AudioIODeviceCallbackContext& context)
{
    juce::ignoreUnused(context);

    // Input first: some backends hand out the same memory for input
    // and output channels.
    recorder_.process(inputChannelData, numInputChannels, numSamples);

    for (int channel = 0; channel < numOutputChannels; ++channel) {
        if (auto* buffer = outputChannelData[channel]) {
            std::fill(buffer, buffer + numSamples, 0.0F);
        }
    }

    const double sampleRate = deviceSampleRate_.load(std::memory_order_relaxed);
    mixer_.render(outputChannelData, numOutputChannels, numSamples, sampleRate);
    soundboard_.render(outputChannelData, numOutputChannels, numSamples, sampleRate);

    if (mixer_.hasPendingCompletions()) {
        triggerAsyncUpdate();
    }
}

void AudioEngine::handleAsyncUpdate()
{
    dispatchPendingCompletions();
}

void AudioEngine::dispatchPendingCompletions()
{
    mixer_.dispatchPendingCompletions();
}

//==============================================================================
// Recording

bool AudioEngine::activateSession()
{
    const auto activated = session_.activate();
    if (activated.failed()) {
        reportError(looptune::EngineErrorKind::kSessionActivation,
                    activated.getErrorMessage().toStdString());
        return false;
    }
    return true;
}

void AudioEngine::toggleRecording()
{
    if (recording_.phase == RecordingPhase::kIdle) {
        startRecording();
    } else {
        stopRecording();
    }
}

void AudioEngine::startRecording()
{
    beginRecording(RecordingTarget::kLoop, -1);
}

void AudioEngine::recordSlot(const int index)
{
    if (!looptune::SoundboardSlots::IsValidIndex(index)) {
        juce::Logger::writeToLog("[looptune-core] recordSlot: invalid pad " +
                                 juce::String(index));
        return;
    }
    beginRecording(RecordingTarget::kSlot, index);
}

void AudioEngine::beginRecording(const RecordingTarget target, const int slot)
{
    if (recording_.phase != RecordingPhase::kIdle) {
        juce::Logger::writeToLog("[looptune-core] Recording already in progress, ignored");
        return;
    }

    if (!activateSession()) {
        notifyStateChanged();
        return;
    }

    if (session_.getNumInputChannels() <= 0) {
        recordDenied_ = true;
        juce::Logger::writeToLog("[looptune-core] No input channel available, recording denied");
        notifyStateChanged();
        return;
    }
    recordDenied_ = false;

    double sampleRate = session_.getSampleRate();
    if (sampleRate <= 0.0) {
        sampleRate = deviceSampleRate_.load();
    }

    const auto uuid = newUuid();
    const std::string fileName =
        target == RecordingTarget::kLoop
            ? looptune::MakeLoopFileName(uuid, juce::Time::currentTimeMillis(), "wav")
            : looptune::MakePadRecordingFileName(uuid, "wav");

    recording_ = {};
    recording_.phase = RecordingPhase::kStarting;
    recording_.target = target;
    recording_.slot = slot;
    recording_.generation = ++nextGeneration_;
    recording_.file = config_.storageDirectory.getChildFile(fileName);
    recording_.sampleRate = sampleRate;

    notifyStateChanged();

    const juce::WeakReference<AudioEngine> weak(this);
    const auto generation = recording_.generation;
    const auto file = recording_.file;
    const int channels = config_.recordingChannels;
    const int bits = config_.recordingBitsPerSample;
    auto post = post_;

    worker_.addJob([weak, post, generation, file, sampleRate, channels, bits] {
        juce::String error;
        auto writer = std::make_shared<std::unique_ptr<juce::AudioFormatWriter>>(
            Recorder::openWavWriter(file, sampleRate, channels, bits, &error));

        post([weak, generation, file, writer, error] {
            if (auto* self = weak.get()) {
                self->handleWriterOpened(generation, file, std::move(*writer), error);
            } else {
                writer->reset();
                file.deleteFile();
            }
        });
    });
}

void AudioEngine::handleWriterOpened(const juce::uint64 generation,
                                     const juce::File& file,
                                     std::unique_ptr<juce::AudioFormatWriter> writer,
                                     const juce::String& error)
{
    if (generation != recording_.generation || recording_.phase != RecordingPhase::kStarting) {
        // Stopped before the writer was ready.
        writer.reset();
        file.deleteFile();
        juce::Logger::writeToLog("[looptune-core] Recording cancelled before capture started");
        return;
    }

    if (writer == nullptr) {
        recording_ = {};
        file.deleteFile();
        reportError(looptune::EngineErrorKind::kRecordingIo, error.toStdString());
        notifyStateChanged();
        return;
    }

    double limitSeconds = 0.0;
    if (recording_.target == RecordingTarget::kLoop) {
        if (const auto master = mixer_.getMasterClock().current_duration()) {
            limitSeconds = *master;
        }
    } else {
        limitSeconds = config_.soundboardCeilingSeconds;
    }

    const juce::int64 maxFrames =
        limitSeconds > 0.0
            ? static_cast<juce::int64>(std::llround(limitSeconds * recording_.sampleRate))
            : 0;

    recorder_.start(std::move(writer), maxFrames);

    if (recording_.target == RecordingTarget::kLoop) {
        for (const auto& loop : mixer_.getLoops()) {
            const auto handle = mixer_.play(loop.id(), true);
            if (handle.TryGet() != looptune::PlaybackEvent::kFailed) {
                recording_.syncLoops.push_back(loop.id());
            }
        }
    }

    recording_.phase = RecordingPhase::kRecording;

    if (maxFrames > 0) {
        recording_.autoStopDeadlineMs = juce::Time::getMillisecondCounterHiRes() +
                                        (limitSeconds + kAutoStopGraceSeconds) * 1000.0;
        armAutoStop(limitSeconds, generation);
    }

    juce::Logger::writeToLog(
        "[looptune-core] Recording started: " + file.getFileName() +
        (maxFrames > 0 ? " (auto-stop after " + juce::String(maxFrames) + " frames)"
                       : juce::String(" (unbounded)")));
    notifyStateChanged();
}

void AudioEngine::armAutoStop(const double seconds, const juce::uint64 generation)
{
    const int delayMs = static_cast<int>(std::max(1L, std::lround(seconds * 1000.0)));
    autoStop_.arm(delayMs, [this, generation] { handleAutoStop(generation); });
}

void AudioEngine::handleAutoStop(const juce::uint64 generation)
{
    if (generation != recording_.generation || recording_.phase != RecordingPhase::kRecording) {
        return;
    }

    // The timer can run ahead of the device clock. Wait for the frames
    // still missing so the recording is exactly as long as the cap, but
    // no longer than the grace period.
    if (recorder_.hasReachedCap()) {
        juce::Logger::writeToLog("[looptune-core] Auto-stop: recording reached its length");
    } else {
        const double remainingMs =
            recording_.autoStopDeadlineMs - juce::Time::getMillisecondCounterHiRes();
        if (remainingMs > 0.0) {
            const auto missing = recorder_.getMaxFrames() - recorder_.getFramesWritten();
            const double seconds = std::max(kMinAutoStopRetrySeconds,
                                            static_cast<double>(missing) / recording_.sampleRate);
            armAutoStop(std::min(seconds, remainingMs / 1000.0), generation);
            return;
        }
        juce::Logger::writeToLog("[looptune-core] Auto-stop: device delivered " +
                                 juce::String(recorder_.getFramesWritten()) + " of " +
                                 juce::String(recorder_.getMaxFrames()) +
                                 " frames, keeping the partial take");
    }

    finishRecording();
}

void AudioEngine::stopRecording()
{
    autoStop_.cancel();

    if (recording_.phase == RecordingPhase::kIdle ||
        recording_.phase == RecordingPhase::kFinalising) {
        juce::Logger::writeToLog("[looptune-core] stopRecording ignored: not recording");
        return;
    }

    finishRecording();
}

void AudioEngine::stopSlotRecording()
{
    if (recording_.phase == RecordingPhase::kIdle ||
        recording_.target != RecordingTarget::kSlot) {
        juce::Logger::writeToLog("[looptune-core] stopSlotRecording ignored: no pad recording");
        return;
    }
    stopRecording();
}

void AudioEngine::finishRecording()
{
    autoStop_.cancel();

    if (recording_.phase == RecordingPhase::kStarting) {
        // The writer is discarded, and its file deleted, when it arrives.
        recording_ = {};
        juce::Logger::writeToLog("[looptune-core] Recording stopped before capture started");
        notifyStateChanged();
        return;
    }

    auto writer = std::make_shared<std::unique_ptr<juce::AudioFormatWriter::ThreadedWriter>>(
        recorder_.stop());

    for (const auto& id : recording_.syncLoops) {
        mixer_.stop(id);
    }
    recording_.syncLoops.clear();

    recording_.phase = RecordingPhase::kFinalising;
    notifyStateChanged();

    const juce::WeakReference<AudioEngine> weak(this);
    const auto generation = recording_.generation;
    const auto file = recording_.file;
    auto post = post_;

    worker_.addJob([this, weak, post, generation, file, writer] {
        // Flushes the FIFO and closes the file.
        writer->reset();

        juce::String error;
        auto sample = workerLoader_.load(file, &error);

        post([weak, generation, file, sample, error] {
            if (auto* self = weak.get()) {
                self->handleRecordingFinalised(generation, file, sample, error);
            }
        });
    });
}

void AudioEngine::handleRecordingFinalised(const juce::uint64 generation,
                                           const juce::File& file,
                                           std::shared_ptr<const DecodedSample> sample,
                                           const juce::String& error)
{
    if (generation != recording_.generation) {
        return;
    }

    const auto target = recording_.target;
    const int slot = recording_.slot;
    recording_ = {};

    if (sample == nullptr || !(sample->getDurationSeconds() > 0.0)) {
        file.deleteFile();
        reportError(looptune::EngineErrorKind::kValidation,
                    "Recording rejected: " + error.toStdString());
        notifyStateChanged();
        return;
    }

    if (target == RecordingTarget::kLoop) {
        mixer_.addLoop(newUuid(), file, std::move(sample));
    } else {
        dropRestoringSlot(slot);
        soundboard_.assign(slot, file, std::move(sample),
                           looptune::SoundboardSlots::RecordingTitle(slot));
    }

    persistManifest();
    notifyStateChanged();
}

//==============================================================================
// Loops

looptune::PlaybackHandle AudioEngine::playLoop(const looptune::LoopId& id,
                                               const bool indefinite,
                                               std::function<void()> onFinish)
{
    if (!activateSession()) {
        return looptune::PlaybackHandle::Failed();
    }

    auto handle = mixer_.play(id, indefinite, [this, onFinish = std::move(onFinish)] {
        if (onFinish) {
            onFinish();
        }
        notifyStateChanged();
    });
    notifyStateChanged();
    return handle;
}

void AudioEngine::stopLoop(const looptune::LoopId& id)
{
    mixer_.stop(id);
    notifyStateChanged();
}

void AudioEngine::playAll()
{
    if (!mixer_.getMasterClock().is_set()) {
        juce::Logger::writeToLog("[looptune-core] playAll ignored: no master loop duration");
        return;
    }
    if (!activateSession()) {
        return;
    }
    mixer_.playAll();
    notifyStateChanged();
}

void AudioEngine::stopAll()
{
    mixer_.stopAll();
    notifyStateChanged();
}

void AudioEngine::setLoopVolume(const looptune::LoopId& id, const float volume)
{
    mixer_.setVolume(id, volume);
    persistManifest();
    notifyStateChanged();
}

void AudioEngine::toggleMute(const looptune::LoopId& id)
{
    mixer_.toggleMute(id);
    notifyStateChanged();
}

void AudioEngine::toggleSolo(const looptune::LoopId& id)
{
    mixer_.toggleSolo(id);
    notifyStateChanged();
}

bool AudioEngine::deleteLoop(const looptune::LoopId& id)
{
    // A loop playing for sync is gone; stopping the recording must not
    // touch it anymore.
    auto& syncLoops = recording_.syncLoops;
    syncLoops.erase(std::remove(syncLoops.begin(), syncLoops.end(), id), syncLoops.end());

    if (!mixer_.deleteLoop(id)) {
        juce::Logger::writeToLog("[looptune-core] deleteLoop: unknown loop " + juce::String(id));
        return false;
    }
    persistManifest();
    notifyStateChanged();
    return true;
}

//==============================================================================
// Ports

bool AudioEngine::selectInput(const looptune::AudioPortDescriptor& port)
{
    return routeManager_.selectInput(port);
}

bool AudioEngine::selectOutput(const looptune::AudioPortDescriptor& port)
{
    return routeManager_.selectOutput(port);
}

//==============================================================================
// Soundboard

void AudioEngine::assignSlot(const int index, std::shared_ptr<ExternalFileReference> source)
{
    if (!looptune::SoundboardSlots::IsValidIndex(index) || source == nullptr) {
        juce::Logger::writeToLog("[looptune-core] assignSlot: invalid request");
        return;
    }

    const auto title = source->getDisplayName();
    const auto destination = config_.storageDirectory.getChildFile(
        looptune::MakeImportFileName(newUuid(), title.toStdString()));

    const juce::WeakReference<AudioEngine> weak(this);
    auto post = post_;

    worker_.addJob([this, weak, post, source, destination, index, title] {
        std::shared_ptr<const DecodedSample> sample;
        juce::String error;

        const auto copied = copyExternalFile(*source, destination);
        if (copied.wasOk()) {
            sample = workerLoader_.load(destination, &error);
            if (sample == nullptr) {
                destination.deleteFile();
            }
        } else {
            error = copied.getErrorMessage();
        }
        const bool copyFailed = copied.failed();

        post([weak, index, destination, title, sample, error, copyFailed] {
            if (auto* self = weak.get()) {
                self->handleImportFinished(index, destination, title, sample, error, copyFailed);
            }
        });
    });
}

void AudioEngine::handleImportFinished(const int index,
                                       const juce::File& file,
                                       const juce::String& title,
                                       std::shared_ptr<const DecodedSample> sample,
                                       const juce::String& error,
                                       const bool copyFailed)
{
    if (sample == nullptr) {
        reportError(copyFailed ? looptune::EngineErrorKind::kImportCopy
                               : looptune::EngineErrorKind::kPlayback,
                    error.toStdString());
        notifyStateChanged();
        return;
    }

    dropRestoringSlot(index);
    soundboard_.assign(index, file, std::move(sample), title);
    persistManifest();
    notifyStateChanged();
}

void AudioEngine::playSlot(const int index)
{
    const auto& slots = soundboard_.getSlots();
    if (slots.edit_mode() || !slots.slot(index).assigned()) {
        juce::Logger::writeToLog("[looptune-core] playSlot ignored for pad " +
                                 juce::String(index + 1));
        return;
    }
    if (!activateSession()) {
        return;
    }
    soundboard_.play(index);
}

void AudioEngine::removeSlot(const int index)
{
    const bool wasRestoring = restoringSlots_.count(index) > 0;
    dropRestoringSlot(index);
    if (soundboard_.remove(index) || wasRestoring) {
        persistManifest();
        notifyStateChanged();
    }
}

void AudioEngine::toggleEditMode()
{
    soundboard_.toggleEditMode();
    notifyStateChanged();
}

void AudioEngine::tapSlot(const int index)
{
    switch (soundboard_.getSlots().ActionForTap(index)) {
        case looptune::SlotTapAction::kPlay:
            playSlot(index);
            break;
        case looptune::SlotTapAction::kRemove:
            removeSlot(index);
            break;
        case looptune::SlotTapAction::kNone:
            break;
    }
}

//==============================================================================
// Session

juce::File AudioEngine::getManifestFile() const
{
    return config_.storageDirectory.getChildFile(looptune::kManifestFileName);
}

bool AudioEngine::restoreSession()
{
    if (!config_.persistManifest) {
        return false;
    }

    const auto manifestFile = getManifestFile();
    if (!manifestFile.existsAsFile()) {
        return false;
    }

    looptune::SessionManifest manifest;
    std::string error;
    if (!looptune::ParseManifest(manifestFile.loadFileAsString().toStdString(), manifest,
                                 &error)) {
        juce::Logger::writeToLog("[looptune-core] Ignoring session manifest: " +
                                 juce::String(error));
        return false;
    }

    int restoredLoops = 0;
    for (const auto& entry : manifest.loops) {
        const auto file = config_.storageDirectory.getChildFile(entry.file_name);
        if (!file.existsAsFile()) {
            juce::Logger::writeToLog("[looptune-core] Skipping missing loop file " +
                                     juce::String(entry.file_name));
            continue;
        }
        if (mixer_.findLoop(entry.id) != nullptr) {
            continue;
        }
        mixer_.restoreLoop(looptune::Loop(entry.id, file.getFullPathName().toStdString(),
                                          entry.duration_seconds, entry.volume));
        ++restoredLoops;
    }

    if (!mixer_.getLoops().empty()) {
        mixer_.restoreMasterDuration(manifest.master_duration_seconds.value_or(
            mixer_.getLoops().front().duration_seconds()));
    }

    // Pads decode on the worker. Until they arrive the manifest keeps
    // listing them.
    const juce::WeakReference<AudioEngine> weak(this);
    int pendingSlots = 0;
    for (const auto& entry : manifest.slots) {
        const auto file = config_.storageDirectory.getChildFile(entry.file_name);
        if (!file.existsAsFile()) {
            juce::Logger::writeToLog("[looptune-core] Skipping pad " +
                                     juce::String(entry.index + 1) + ": missing " +
                                     juce::String(entry.file_name));
            continue;
        }
        restoringSlots_[entry.index] = entry;
        ++pendingSlots;

        auto post = post_;
        worker_.addJob([this, weak, post, entry, file] {
            juce::String loadError;
            auto sample = workerLoader_.load(file, &loadError);

            post([weak, entry, file, sample, loadError] {
                if (auto* self = weak.get()) {
                    self->handleSlotRestored(entry, file, sample, loadError);
                }
            });
        });
    }

    juce::Logger::writeToLog("[looptune-core] Session restored: " + juce::String(restoredLoops) +
                             " loops, " + juce::String(pendingSlots) + " pads loading");
    notifyStateChanged();
    return true;
}

void AudioEngine::handleSlotRestored(const looptune::ManifestSlot& entry,
                                     const juce::File& file,
                                     std::shared_ptr<const DecodedSample> sample,
                                     const juce::String& error)
{
    const auto it = restoringSlots_.find(entry.index);
    if (it == restoringSlots_.end() || it->second.file_name != entry.file_name) {
        // Reassigned or removed while loading.
        return;
    }
    restoringSlots_.erase(it);

    if (sample == nullptr) {
        juce::Logger::writeToLog("[looptune-core] Skipping pad " + juce::String(entry.index + 1) +
                                 ": " + error);
        persistManifest();
        notifyStateChanged();
        return;
    }

    soundboard_.assign(entry.index, file, std::move(sample), juce::String(entry.title));
    notifyStateChanged();
}

void AudioEngine::dropRestoringSlot(const int index)
{
    const auto it = restoringSlots_.find(index);
    if (it == restoringSlots_.end()) {
        return;
    }

    const auto file = config_.storageDirectory.getChildFile(it->second.file_name);
    restoringSlots_.erase(it);
    if (file.existsAsFile() && !file.deleteFile()) {
        juce::Logger::writeToLog("[looptune-core] Could not delete " + file.getFullPathName());
    }
}

std::string AudioEngine::buildManifestText() const
{
    looptune::SessionManifest manifest;
    manifest.master_duration_seconds = mixer_.getMasterClock().current_duration();

    for (const auto& loop : mixer_.getLoops()) {
        looptune::ManifestLoop entry;
        entry.id = loop.id();
        entry.file_name = juce::File(loop.path()).getFileName().toStdString();
        entry.duration_seconds = loop.duration_seconds();
        entry.volume = loop.volume();
        manifest.loops.push_back(std::move(entry));
    }

    const auto& slots = soundboard_.getSlots().slots();
    for (int i = 0; i < looptune::SoundboardSlots::kNumSlots; ++i) {
        const auto& slot = slots[static_cast<std::size_t>(i)];
        if (!slot.assigned()) {
            const auto restoring = restoringSlots_.find(i);
            if (restoring != restoringSlots_.end()) {
                manifest.slots.push_back(restoring->second);
            }
            continue;
        }
        looptune::ManifestSlot entry;
        entry.index = i;
        entry.file_name = juce::File(*slot.sound_path).getFileName().toStdString();
        entry.title = slot.title;
        manifest.slots.push_back(std::move(entry));
    }

    return looptune::SerializeManifest(manifest);
}

void AudioEngine::persistManifest()
{
    if (!config_.persistManifest || isShutdown_) {
        return;
    }

    const auto file = getManifestFile();
    const juce::String text(buildManifestText());

    // The single worker thread keeps writes in submission order.
    worker_.addJob([file, text] {
        if (!file.replaceWithText(text, false, false, "\n")) {
            juce::Logger::writeToLog("[looptune-core] Could not write " + file.getFullPathName());
        }
    });
}

void AudioEngine::writeManifestNow()
{
    if (!config_.persistManifest) {
        return;
    }
    const auto file = getManifestFile();
    if (!file.replaceWithText(juce::String(buildManifestText()), false, false, "\n")) {
        juce::Logger::writeToLog("[looptune-core] Could not write " + file.getFullPathName());
    }
}

//==============================================================================
// State

looptune::EngineSnapshot AudioEngine::snapshot() const
{
    looptune::EngineSnapshot snapshot;

    snapshot.recording = recording_.phase != RecordingPhase::kIdle;
    snapshot.capturing = recording_.phase == RecordingPhase::kRecording;
    snapshot.finalising = recording_.phase == RecordingPhase::kFinalising;
    snapshot.record_denied = recordDenied_;
    snapshot.auto_stop_armed = autoStop_.isArmed();
    if (snapshot.recording && recording_.target == RecordingTarget::kSlot) {
        snapshot.recording_slot = recording_.slot;
    }

    snapshot.playing = mixer_.isPlaying();
    snapshot.master_duration_seconds = mixer_.getMasterClock().current_duration();

    const auto& mix = mixer_.getMixState();
    for (const auto& loop : mixer_.getLoops()) {
        looptune::LoopView view;
        view.id = loop.id();
        view.path = loop.path();
        view.duration_seconds = loop.duration_seconds();
        view.volume = loop.volume();
        view.effective_volume = mix.EffectiveVolume(loop.id(), loop.volume());
        view.playing = loop.playing();
        view.muted = mix.is_muted(loop.id());
        view.soloed = mix.is_soloed(loop.id());
        snapshot.loops.push_back(std::move(view));
    }

    const auto& slots = soundboard_.getSlots();
    for (int i = 0; i < looptune::SoundboardSlots::kNumSlots; ++i) {
        const auto& slot = slots.slot(i);
        looptune::SlotView view;
        view.index = i;
        view.title = slot.title;
        view.sound_path = slot.sound_path;
        view.assigned = slot.assigned();
        snapshot.slots.push_back(std::move(view));
    }
    snapshot.edit_mode = slots.edit_mode();

    snapshot.route = routeManager_.getRoute();
    snapshot.selected_input = routeManager_.getSelectedInput();
    snapshot.selected_output = routeManager_.getSelectedOutput();

    return snapshot;
}

void AudioEngine::reportError(const looptune::EngineErrorKind kind, const std::string& message)
{
    looptune::EngineError error{kind, message};
    juce::Logger::writeToLog("[looptune-core] " + juce::String(looptune::Describe(error)));
    lastError_ = error;
    listeners_.call([&error](Listener& l) { l.engineErrorOccurred(error); });
}

void AudioEngine::notifyStateChanged()
{
    listeners_.call([](Listener& l) { l.engineStateChanged(); });
}
