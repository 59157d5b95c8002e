#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <memory>
#include <string>

#include <juce_osc/juce_osc.h>

#include "AudioEngine.h"
#include "AutoStopTimer.h"
#include "ControlOscReceiver.h"
#include "EngineConfig.h"
#include "TestSupport.h"
#include "core/StorageNaming.h"

// Scenario tests for the looper/soundboard engine. The device callback
// is driven by hand at 8 kHz and the engine thread is the test thread,
// pumping a manual task queue. They run as a normal binary and are
// integrated with CTest.

using looptune::EngineErrorKind;
using looptune::PlaybackEvent;
using looptune::PortDirection;
using looptune::PortType;
using testing_support::CountingFileReference;
using testing_support::DeviceDriver;
using testing_support::FakeAudioSession;
using testing_support::ManualTaskQueue;
using testing_support::TemporaryDirectory;
using testing_support::makePort;
using testing_support::pumpFor;
using testing_support::pumpUntil;
using testing_support::waitForPending;

namespace {

constexpr int kRate = 8000;

EngineConfig makeConfig(const juce::File& storage)
{
    EngineConfig config;
    config.storageDirectory = storage;
    config.soundboardCeilingSeconds = 0.5;
    config.oscPort = 0;
    return config;
}

bool isCapturing(const AudioEngine& engine)
{
    return engine.snapshot().capturing;
}

bool isIdle(const AudioEngine& engine)
{
    return !engine.snapshot().recording;
}

// Records a loop that the test stops by hand after `frames` frames.
bool recordLoop(AudioEngine& engine, ManualTaskQueue& queue, DeviceDriver& driver, int frames)
{
    engine.startRecording();
    if (!pumpUntil(queue, [&engine] { return isCapturing(engine); })) {
        return false;
    }
    driver.run(frames);
    engine.stopRecording();
    return pumpUntil(queue, [&engine] { return isIdle(engine); });
}

std::shared_ptr<CountingFileReference> makeRampSource(const juce::File& directory,
                                                      const juce::String& name, int frames)
{
    const auto file = directory.getChildFile(name);
    const bool written = testing_support::writeWav(file, testing_support::makeRamp(frames), kRate);
    assert(written);
    juce::ignoreUnused(written);
    return std::make_shared<CountingFileReference>(file);
}

bool near(float actual, float expected, float tolerance = 1.0e-5F)
{
    return std::abs(actual - expected) <= tolerance;
}

juce::OSCMessage oscMessage(const char* address)
{
    return juce::OSCMessage(juce::OSCAddressPattern(address));
}

void testLoopRecordingFollowsMasterDuration()
{
    TemporaryDirectory storage("looptune_loops");
    ManualTaskQueue queue;
    FakeAudioSession session;
    AudioEngine engine(session, makeConfig(storage.get()), queue.poster());
    DeviceDriver driver(engine);

    // First recording: free length, establishes the master duration.
    engine.startRecording();
    auto snapshot = engine.snapshot();
    assert(snapshot.recording);
    assert(!snapshot.capturing);
    assert(session.isActive());

    bool ok = pumpUntil(queue, [&engine] { return isCapturing(engine); });
    assert(ok);
    assert(!engine.snapshot().auto_stop_armed);

    driver.run(2 * kRate);
    engine.stopRecording();
    assert(engine.snapshot().finalising);

    ok = pumpUntil(queue, [&engine] { return isIdle(engine); });
    assert(ok);

    snapshot = engine.snapshot();
    assert(snapshot.loops.size() == 1U);
    assert(snapshot.master_duration_seconds.value() == 2.0);
    assert(snapshot.loops[0].duration_seconds == 2.0);
    assert(snapshot.loops[0].volume == 1.0F);
    const juce::File firstFile(snapshot.loops[0].path);
    assert(firstFile.existsAsFile());
    assert(looptune::IsLoopFileName(firstFile.getFileName().toStdString()));
    assert(!engine.getLastError().has_value());
    const auto firstId = snapshot.loops[0].id;

    // Second recording stops by itself after exactly the master duration,
    // even when the timer runs ahead of the audio.
    engine.toggleRecording();
    ok = pumpUntil(queue, [&engine] { return isCapturing(engine); });
    assert(ok);
    snapshot = engine.snapshot();
    assert(snapshot.auto_stop_armed);
    // Existing loops play along while recording.
    assert(snapshot.loops[0].playing);
    assert(engine.getMixer().isActive(firstId));

    driver.run(kRate);
    pumpFor(queue, std::chrono::milliseconds(2200));
    assert(isCapturing(engine));

    // Only the frames up to the master duration are kept.
    driver.run(kRate + kRate / 2);
    assert(engine.getRecorder().hasReachedCap());
    ok = pumpUntil(queue, [&engine] { return isIdle(engine); });
    assert(ok);

    snapshot = engine.snapshot();
    assert(snapshot.loops.size() == 2U);
    assert(snapshot.loops[1].duration_seconds == 2.0);
    assert(snapshot.master_duration_seconds.value() == 2.0);
    assert(engine.getRecorder().getFramesWritten() == 2 * kRate);
    // Loops started for sync are stopped with the recording.
    assert(!snapshot.loops[0].playing);
    assert(!engine.getMixer().isActive(firstId));
    assert(snapshot.loops[0].id != snapshot.loops[1].id);

    // A manual stop before the master duration cancels the auto-stop and
    // keeps the shorter take.
    engine.startRecording();
    ok = pumpUntil(queue, [&engine] { return isCapturing(engine); });
    assert(ok);
    assert(engine.snapshot().auto_stop_armed);
    driver.run(kRate / 2);
    engine.stopRecording();
    assert(!engine.snapshot().auto_stop_armed);
    ok = pumpUntil(queue, [&engine] { return isIdle(engine); });
    assert(ok);
    pumpFor(queue, std::chrono::milliseconds(2500));

    snapshot = engine.snapshot();
    assert(!snapshot.recording);
    assert(snapshot.loops.size() == 3U);
    assert(snapshot.loops[2].duration_seconds == 0.5);
    assert(snapshot.master_duration_seconds.value() == 2.0);
    assert(!engine.getLastError().has_value());

    // Stopping while idle is ignored.
    engine.stopRecording();
    assert(!engine.snapshot().recording);
}

void testAutoStopTimer()
{
    // Fires once, through the poster.
    {
        ManualTaskQueue queue;
        int fired = 0;
        AutoStopTimer timer(queue.poster());
        timer.arm(20, [&fired] { ++fired; });
        assert(timer.isArmed());

        const bool ok = pumpUntil(queue, [&fired] { return fired == 1; });
        assert(ok);
        assert(!timer.isArmed());
        // Nothing left to prevent.
        assert(!timer.cancel());
        pumpFor(queue, std::chrono::milliseconds(50));
        assert(fired == 1);
    }

    // Cancelled before the delay elapses.
    {
        ManualTaskQueue queue;
        int fired = 0;
        AutoStopTimer timer(queue.poster());
        timer.arm(10000, [&fired] { ++fired; });
        assert(timer.cancel());
        assert(!timer.isArmed());
        pumpFor(queue, std::chrono::milliseconds(50));
        assert(fired == 0);
    }

    // Cancelled after the expiry was posted but before it ran.
    {
        ManualTaskQueue queue;
        int fired = 0;
        AutoStopTimer timer(queue.poster());
        timer.arm(1, [&fired] { ++fired; });
        const bool posted = waitForPending(queue, 1);
        assert(posted);
        assert(timer.isArmed());
        assert(timer.cancel());
        assert(queue.runPending() == 1);
        assert(fired == 0);
    }

    // Re-arming replaces the pending shot, posted or not.
    {
        ManualTaskQueue queue;
        int first = 0;
        int second = 0;
        AutoStopTimer timer(queue.poster());
        timer.arm(10000, [&first] { ++first; });
        timer.arm(1, [&second] { ++second; });
        bool ok = pumpUntil(queue, [&second] { return second == 1; });
        assert(ok);

        timer.arm(1, [&first] { ++first; });
        const bool posted = waitForPending(queue, 1);
        assert(posted);
        timer.arm(1, [&second] { ++second; });
        ok = pumpUntil(queue, [&second] { return second == 2; });
        assert(ok);
        pumpFor(queue, std::chrono::milliseconds(50));
        assert(first == 0);
        assert(second == 2);
    }
}

void testAutoStopWhenDeviceStalls()
{
    TemporaryDirectory storage("looptune_stall");
    ManualTaskQueue queue;
    FakeAudioSession session;
    AudioEngine engine(session, makeConfig(storage.get()), queue.poster());
    DeviceDriver driver(engine);

    bool ok = recordLoop(engine, queue, driver, kRate / 2);
    assert(ok);
    const auto firstId = engine.snapshot().loops.at(0).id;

    // The device delivers a few blocks and then nothing more, as after a
    // failed reactivation. The take still ends, with what was captured.
    engine.startRecording();
    ok = pumpUntil(queue, [&engine] { return isCapturing(engine); });
    assert(ok);
    assert(engine.snapshot().auto_stop_armed);
    driver.run(kRate / 8);

    const auto started = std::chrono::steady_clock::now();
    ok = pumpUntil(queue, [&engine] { return isIdle(engine); });
    assert(ok);
    // Not before the master duration.
    assert(std::chrono::steady_clock::now() - started >= std::chrono::milliseconds(400));

    const auto snapshot = engine.snapshot();
    assert(!snapshot.auto_stop_armed);
    assert(!engine.getRecorder().hasReachedCap());
    assert(engine.getRecorder().getFramesWritten() == kRate / 8);
    assert(snapshot.loops.size() == 2U);
    assert(snapshot.loops[1].duration_seconds == 0.125);
    assert(snapshot.master_duration_seconds.value() == 0.5);
    assert(!engine.getMixer().isActive(firstId));
    assert(!engine.getLastError().has_value());
}

void testPlayingFlagFollowsPlayers()
{
    TemporaryDirectory storage("looptune_playing");
    ManualTaskQueue queue;
    FakeAudioSession session;
    AudioEngine engine(session, makeConfig(storage.get()), queue.poster());
    DeviceDriver driver(engine);

    bool ok = recordLoop(engine, queue, driver, kRate);
    assert(ok);
    ok = recordLoop(engine, queue, driver, kRate);
    assert(ok);
    const auto a = engine.snapshot().loops.at(0).id;
    const auto b = engine.snapshot().loops.at(1).id;

    // Loops pulled into a take for sync stop with it, and so does the
    // mix-wide playing state.
    engine.playAll();
    assert(engine.snapshot().playing);
    ok = recordLoop(engine, queue, driver, kRate / 2);
    assert(ok);
    auto snapshot = engine.snapshot();
    assert(snapshot.loops.size() == 3U);
    assert(!snapshot.playing);
    assert(!snapshot.loops[0].playing);
    assert(!engine.getMixer().isActive(a));

    // Stopping the loops one by one ends it too.
    engine.playAll();
    assert(engine.snapshot().playing);
    engine.stopLoop(a);
    assert(engine.snapshot().playing);
    engine.stopLoop(b);
    assert(engine.snapshot().playing);
    engine.stopLoop(snapshot.loops[2].id);
    assert(!engine.snapshot().playing);
}

void testMixingAndDeletion()
{
    TemporaryDirectory storage("looptune_mix");
    ManualTaskQueue queue;
    FakeAudioSession session;
    AudioEngine engine(session, makeConfig(storage.get()), queue.poster());
    DeviceDriver driver(engine);

    // Without a master duration there is nothing to play.
    engine.playAll();
    assert(!engine.snapshot().playing);

    bool ok = recordLoop(engine, queue, driver, 2 * kRate);
    assert(ok);
    ok = recordLoop(engine, queue, driver, kRate);
    assert(ok);

    auto snapshot = engine.snapshot();
    assert(snapshot.loops.size() == 2U);
    const auto a = snapshot.loops[0].id;
    const auto b = snapshot.loops[1].id;
    auto& mixer = engine.getMixer();

    engine.playAll();
    assert(engine.snapshot().playing);
    assert(mixer.isActive(a));
    assert(mixer.isActive(b));

    // Volume changes reach the running players.
    engine.setLoopVolume(a, 0.5F);
    assert(mixer.getPlayerGain(a).value() == 0.5F);
    engine.setLoopVolume(b, 1.7F);
    assert(mixer.findLoop(b)->volume() == 1.0F);

    // Solo silences every other loop.
    engine.toggleSolo(b);
    assert(mixer.getPlayerGain(a).value() == 0.0F);
    assert(mixer.getPlayerGain(b).value() == 1.0F);
    snapshot = engine.snapshot();
    assert(snapshot.loops[1].soloed);
    assert(snapshot.loops[0].effective_volume == 0.0F);
    assert(snapshot.loops[0].volume == 0.5F);

    // Mute wins over solo.
    engine.toggleMute(b);
    assert(mixer.getPlayerGain(b).value() == 0.0F);
    assert(engine.snapshot().loops[1].muted);

    engine.toggleMute(b);
    engine.toggleSolo(b);
    assert(mixer.getPlayerGain(a).value() == 0.5F);
    assert(mixer.getPlayerGain(b).value() == 1.0F);

    // Gains show up in the rendered output: loop b is silent, loop a is
    // at half volume.
    engine.toggleMute(b);
    driver.process(64, 0.0F);
    assert(near(driver.outputSample(0, 10), 0.5F * 0.25F, 1.0e-3F));
    assert(near(driver.outputSample(1, 10), 0.5F * 0.25F, 1.0e-3F));
    engine.toggleMute(b);

    engine.stopAll();
    snapshot = engine.snapshot();
    assert(!snapshot.playing);
    assert(!snapshot.loops[0].playing);
    assert(!mixer.isActive(a));

    // Deleting one loop leaves the others and the master duration alone.
    const juce::File fileA(snapshot.loops[0].path);
    const juce::File fileB(snapshot.loops[1].path);
    engine.toggleMute(a);
    assert(engine.deleteLoop(a));
    assert(!fileA.exists());
    assert(fileB.existsAsFile());
    snapshot = engine.snapshot();
    assert(snapshot.loops.size() == 1U);
    assert(snapshot.loops[0].id == b);
    assert(snapshot.loops[0].volume == 1.0F);
    assert(snapshot.master_duration_seconds.value() == 2.0);
    assert(!mixer.getMixState().is_muted(a));

    assert(!engine.deleteLoop("no-such-loop"));

    // Deleting the last loop clears the master duration; the next take
    // establishes a new one.
    assert(engine.deleteLoop(b));
    assert(!fileB.exists());
    snapshot = engine.snapshot();
    assert(snapshot.loops.empty());
    assert(!snapshot.master_duration_seconds.has_value());

    ok = recordLoop(engine, queue, driver, kRate / 2);
    assert(ok);
    assert(engine.snapshot().master_duration_seconds.value() == 0.5);
}

void testPlaybackCompletion()
{
    TemporaryDirectory storage("looptune_completion");
    ManualTaskQueue queue;
    FakeAudioSession session;
    AudioEngine engine(session, makeConfig(storage.get()), queue.poster());
    DeviceDriver driver(engine);

    const bool recorded = recordLoop(engine, queue, driver, kRate);
    assert(recorded);
    const auto id = engine.snapshot().loops[0].id;

    int finished = 0;
    const auto handle = engine.playLoop(id, false, [&finished] { ++finished; });
    assert(handle.valid());
    assert(!handle.resolved());
    assert(engine.snapshot().loops[0].playing);

    // Playing again while running keeps the same instance.
    const auto again = engine.playLoop(id);
    assert(!again.resolved());

    driver.run(kRate + 256);
    assert(engine.getMixer().hasPendingCompletions());
    engine.dispatchPendingCompletions();

    assert(handle.TryGet().value() == PlaybackEvent::kFinished);
    assert(again.TryGet().value() == PlaybackEvent::kFinished);
    assert(finished == 1);
    assert(!engine.snapshot().loops[0].playing);

    engine.dispatchPendingCompletions();
    assert(finished == 1);

    // A stopped loop resolves as stopped and never calls its callback.
    const auto stopped = engine.playLoop(id, false, [&finished] { ++finished; });
    engine.stopLoop(id);
    assert(stopped.TryGet().value() == PlaybackEvent::kStopped);
    driver.run(kRate + 256);
    engine.dispatchPendingCompletions();
    assert(finished == 1);

    // Indefinite playback keeps looping.
    const auto looping = engine.playLoop(id, true);
    driver.run(3 * kRate);
    engine.dispatchPendingCompletions();
    assert(!looping.resolved());
    engine.stopAll();
    assert(looping.TryGet().value() == PlaybackEvent::kStopped);

    // Unknown loops fail right away.
    assert(engine.playLoop("missing").TryGet().value() == PlaybackEvent::kFailed);

    // A session that cannot be activated fails playback and recording.
    session.failActivation = true;
    assert(engine.playLoop(id).TryGet().value() == PlaybackEvent::kFailed);
    assert(engine.getLastError()->kind == EngineErrorKind::kSessionActivation);
    engine.startRecording();
    assert(!engine.snapshot().recording);
}

void testRecordingDeniedWithoutInput()
{
    TemporaryDirectory storage("looptune_denied");
    ManualTaskQueue queue;
    FakeAudioSession session;
    session.numInputChannels = 0;
    AudioEngine engine(session, makeConfig(storage.get()), queue.poster());

    engine.startRecording();
    auto snapshot = engine.snapshot();
    assert(snapshot.record_denied);
    assert(!snapshot.recording);

    // Stopping before the writer is ready leaves no file behind.
    session.numInputChannels = 1;
    const int before = queue.executed();
    engine.startRecording();
    snapshot = engine.snapshot();
    assert(!snapshot.record_denied);
    assert(snapshot.recording);
    engine.stopRecording();
    assert(!engine.snapshot().recording);

    const bool delivered = pumpUntil(queue, [&queue, before] { return queue.executed() > before; });
    assert(delivered);
    assert(storage.get().findChildFiles(juce::File::findFiles, false, "*.wav").isEmpty());
    assert(engine.snapshot().loops.empty());
}

void testSoundboard()
{
    TemporaryDirectory storage("looptune_pads");
    TemporaryDirectory sources("looptune_sources");
    ManualTaskQueue queue;
    FakeAudioSession session;
    AudioEngine engine(session, makeConfig(storage.get()), queue.poster());
    DeviceDriver driver(engine, 100);

    auto snapshot = engine.snapshot();
    assert(snapshot.slots.size() == 8U);
    assert(snapshot.slots[0].title == "Empty");

    const auto ramp = testing_support::makeRamp(400);
    auto source = makeRampSource(sources.get(), "ramp.wav", 400);

    engine.assignSlot(0, source);
    bool ok = pumpUntil(queue, [&engine] { return engine.snapshot().slots[0].assigned; });
    assert(ok);
    // Access is held for the copy only.
    assert(source->begins == 1);
    assert(source->ends == 1);

    snapshot = engine.snapshot();
    assert(snapshot.slots[0].title == "ramp.wav");
    const juce::File stored(snapshot.slots[0].sound_path.value());
    assert(stored.existsAsFile());
    assert(stored.getParentDirectory() == storage.get());
    assert(source->getFile().existsAsFile());

    // Playing a pad starts at frame zero, on every output channel.
    engine.playSlot(0);
    driver.process(100, 0.0F);
    assert(near(driver.outputSample(0, 0), ramp[0]));
    assert(near(driver.outputSample(0, 99), ramp[99]));
    assert(near(driver.outputSample(1, 50), ramp[50]));

    driver.process(100, 0.0F);
    assert(near(driver.outputSample(0, 0), ramp[100]));

    // Playing it again restarts it instead of layering a second copy.
    engine.playSlot(0);
    driver.process(100, 0.0F);
    assert(near(driver.outputSample(0, 0), ramp[0]));
    assert(near(driver.outputSample(0, 10), ramp[10]));

    driver.run(400, 0.0F);
    assert(!engine.getSoundboard().isVoiceActive(0));

    // Re-assigning replaces the stored copy.
    auto other = makeRampSource(sources.get(), "other.wav", 200);
    engine.assignSlot(0, other);
    ok = pumpUntil(queue, [&engine] { return engine.snapshot().slots[0].title == "other.wav"; });
    assert(ok);
    assert(!stored.exists());
    const juce::File replaced(engine.snapshot().slots[0].sound_path.value());
    assert(replaced.existsAsFile());

    // Edit mode: taps remove pads instead of playing them.
    engine.toggleEditMode();
    assert(engine.snapshot().edit_mode);
    engine.playSlot(0);
    assert(!engine.getSoundboard().isVoiceActive(0));

    engine.tapSlot(0);
    snapshot = engine.snapshot();
    assert(!snapshot.slots[0].assigned);
    assert(snapshot.slots[0].title == "Empty");
    assert(!replaced.exists());

    engine.toggleEditMode();
    assert(!engine.snapshot().edit_mode);

    // Taps on empty pads do nothing.
    engine.tapSlot(5);
    assert(!engine.snapshot().slots[5].assigned);

    // Pad recordings stop at the pad length limit.
    engine.recordSlot(1);
    ok = pumpUntil(queue, [&engine] { return isCapturing(engine); });
    assert(ok);
    snapshot = engine.snapshot();
    assert(snapshot.recording_slot.value() == 1);
    assert(snapshot.auto_stop_armed);

    driver.run(kRate);
    ok = pumpUntil(queue, [&engine] { return isIdle(engine); });
    assert(ok);

    snapshot = engine.snapshot();
    assert(snapshot.slots[1].assigned);
    assert(snapshot.slots[1].title == "Recording 2");
    const juce::File padFile(snapshot.slots[1].sound_path.value());
    assert(padFile.existsAsFile());
    assert(!looptune::IsLoopFileName(padFile.getFileName().toStdString()));
    assert(engine.getRecorder().getFramesWritten() == kRate / 2);
    // Pads do not touch the loop collection.
    assert(snapshot.loops.empty());
    assert(!snapshot.master_duration_seconds.has_value());

    // A pad recording can be stopped by hand.
    engine.recordSlot(2);
    ok = pumpUntil(queue, [&engine] { return isCapturing(engine); });
    assert(ok);
    driver.run(kRate / 8);
    engine.stopSlotRecording();
    ok = pumpUntil(queue, [&engine] { return isIdle(engine); });
    assert(ok);
    assert(engine.snapshot().slots[2].title == "Recording 3");

    // Refused access is an import error; nothing is copied.
    auto denied = std::make_shared<CountingFileReference>(source->getFile(), false);
    engine.assignSlot(3, denied);
    ok = pumpUntil(queue, [&engine] { return engine.getLastError().has_value(); });
    assert(ok);
    assert(engine.getLastError()->kind == EngineErrorKind::kImportCopy);
    assert(denied->begins == 1);
    assert(denied->ends == 0);
    assert(!engine.snapshot().slots[3].assigned);

    // A copy that does not decode is rejected and removed; access is
    // still released.
    const auto notAudio = sources.get().getChildFile("notes.wav");
    const bool written = notAudio.replaceWithText("not a wave file");
    assert(written);
    auto broken = std::make_shared<CountingFileReference>(notAudio);
    engine.assignSlot(4, broken);
    ok = pumpUntil(queue, [&engine] {
        return engine.getLastError()->kind == EngineErrorKind::kPlayback;
    });
    assert(ok);
    assert(broken->begins == 1);
    assert(broken->ends == 1);
    assert(!engine.snapshot().slots[4].assigned);
    assert(storage.get().findChildFiles(juce::File::findFiles, false, "*notes.wav").isEmpty());
}

void testRouteChanges()
{
    TemporaryDirectory storage("looptune_routes");
    ManualTaskQueue queue;
    FakeAudioSession session;

    const auto mic = makePort("Built-in Mic", PortDirection::kInput, PortType::kBuiltInMic);
    const auto usb = makePort("USB Interface", PortDirection::kInput, PortType::kUsb);
    const auto speaker = makePort("Speaker", PortDirection::kOutput, PortType::kBuiltInSpeaker);
    const auto headset =
        makePort("Bluetooth Headset", PortDirection::kOutput, PortType::kBluetoothA2dp);
    session.route.inputs = {mic, usb};
    session.route.outputs = {speaker, headset};

    AudioEngine engine(session, makeConfig(storage.get()), queue.poster());

    auto snapshot = engine.snapshot();
    assert(snapshot.route.inputs.size() == 2U);
    assert(snapshot.selected_input->name == "Built-in Mic");

    // Selection goes through deactivate, preference, reactivate.
    assert(engine.selectInput(usb));
    assert(session.deactivations == 1);
    assert(session.isActive());
    assert(engine.snapshot().selected_input->name == "USB Interface");

    assert(engine.selectOutput(headset));
    assert(session.lastRouting == looptune::OutputRouting::kAllowBluetoothA2dp);
    assert(engine.snapshot().selected_output->name == "Bluetooth Headset");

    // A new device does not move the selection.
    auto route = session.route;
    route.inputs.push_back(makePort("Line In", PortDirection::kInput, PortType::kLineIn));
    session.changeRoute(route);
    snapshot = engine.snapshot();
    assert(snapshot.route.inputs.size() == 3U);
    assert(snapshot.selected_input->name == "USB Interface");
    assert(!engine.getLastError().has_value());

    // Unplugging the selected input falls back to the route's input and
    // reports the inconsistency.
    route = session.route;
    route.inputs = {mic, makePort("Line In", PortDirection::kInput, PortType::kLineIn)};
    route.current_input = mic;
    session.changeRoute(route);
    snapshot = engine.snapshot();
    assert(snapshot.selected_input->name == "Built-in Mic");
    assert(snapshot.selected_output->name == "Bluetooth Headset");
    assert(engine.getLastError()->kind == EngineErrorKind::kRouteChangeInconsistency);

    // A port the session does not offer cannot be selected.
    assert(!engine.selectInput(makePort("Ghost", PortDirection::kInput)));
    assert(engine.getLastError()->kind == EngineErrorKind::kSessionActivation);
    assert(engine.snapshot().selected_input->name == "Built-in Mic");
}

void testSessionManifest()
{
    TemporaryDirectory storage("looptune_manifest");
    TemporaryDirectory sources("looptune_manifest_sources");

    looptune::LoopId keptId;
    juce::File droppedFile;
    {
        ManualTaskQueue queue;
        FakeAudioSession session;
        AudioEngine engine(session, makeConfig(storage.get()), queue.poster());
        DeviceDriver driver(engine);

        bool ok = recordLoop(engine, queue, driver, 2 * kRate);
        assert(ok);
        ok = recordLoop(engine, queue, driver, kRate);
        assert(ok);

        const auto snapshot = engine.snapshot();
        keptId = snapshot.loops[0].id;
        droppedFile = juce::File(snapshot.loops[1].path);
        engine.setLoopVolume(keptId, 0.4F);

        engine.assignSlot(6, makeRampSource(sources.get(), "clap.wav", 100));
        ok = pumpUntil(queue, [&engine] { return engine.snapshot().slots[6].assigned; });
        assert(ok);

        engine.shutdown();
        assert(engine.getManifestFile().existsAsFile());
    }

    // A loop whose file disappeared is skipped on restore.
    assert(droppedFile.deleteFile());

    {
        ManualTaskQueue queue;
        FakeAudioSession session;
        AudioEngine engine(session, makeConfig(storage.get()), queue.poster());
        DeviceDriver driver(engine);

        assert(engine.restoreSession());
        // Pads decode on the worker and arrive through the engine thread.
        assert(!engine.snapshot().slots[6].assigned);
        const bool padLoaded =
            pumpUntil(queue, [&engine] { return engine.snapshot().slots[6].assigned; });
        assert(padLoaded);

        const auto snapshot = engine.snapshot();
        assert(snapshot.loops.size() == 1U);
        assert(snapshot.loops[0].id == keptId);
        assert(snapshot.loops[0].volume == 0.4F);
        assert(snapshot.loops[0].duration_seconds == 2.0);
        assert(snapshot.master_duration_seconds.value() == 2.0);
        assert(snapshot.slots[6].assigned);
        assert(snapshot.slots[6].title == "clap.wav");

        // Restored loops decode on first playback.
        const auto handle = engine.playLoop(keptId);
        assert(!handle.resolved());
        engine.stopLoop(keptId);

        // The next take still follows the restored master duration. Stopped
        // before any audio arrived, it fails validation and is dropped.
        engine.startRecording();
        const bool capturing = pumpUntil(queue, [&engine] { return isCapturing(engine); });
        assert(capturing);
        assert(engine.snapshot().auto_stop_armed);
        engine.stopRecording();
        const bool idle = pumpUntil(queue, [&engine] { return isIdle(engine); });
        assert(idle);
        assert(engine.getLastError()->kind == EngineErrorKind::kValidation);
        assert(engine.snapshot().loops.size() == 1U);
        assert(storage.get().findChildFiles(juce::File::findFiles, false, "loop_*").size() == 1);
    }

    // Without persistence nothing is written or read.
    {
        TemporaryDirectory volatileStorage("looptune_volatile");
        ManualTaskQueue queue;
        FakeAudioSession session;
        auto config = makeConfig(volatileStorage.get());
        config.persistManifest = false;
        AudioEngine engine(session, config, queue.poster());
        DeviceDriver driver(engine);

        const bool ok = recordLoop(engine, queue, driver, kRate);
        assert(ok);
        assert(!engine.restoreSession());
        engine.shutdown();
        assert(!engine.getManifestFile().exists());
    }
}

void testOscControl()
{
    TemporaryDirectory storage("looptune_osc");
    ManualTaskQueue queue;
    FakeAudioSession session;
    AudioEngine engine(session, makeConfig(storage.get()), queue.poster());
    DeviceDriver driver(engine);
    ControlOscReceiver osc(engine, 0);
    assert(!osc.isConnected());

    assert(osc.handleMessage(oscMessage("/looptune/record/toggle")));
    bool ok = pumpUntil(queue, [&engine] { return isCapturing(engine); });
    assert(ok);
    driver.run(kRate);
    assert(osc.handleMessage(oscMessage("/looptune/record/toggle")));
    ok = pumpUntil(queue, [&engine] { return isIdle(engine); });
    assert(ok);

    const auto id = engine.snapshot().loops.at(0).id;
    const juce::OSCMessage volume(juce::OSCAddressPattern("/looptune/loop/volume"),
                                  juce::String(id), 0.3F);
    assert(osc.handleMessage(volume));
    assert(engine.getMixer().findLoop(id)->volume() == 0.3F);

    const juce::OSCMessage mute(juce::OSCAddressPattern("/looptune/loop/mute"), juce::String(id));
    assert(osc.handleMessage(mute));
    assert(engine.snapshot().loops[0].muted);

    assert(osc.handleMessage(oscMessage("/looptune/mix/play")));
    assert(engine.snapshot().playing);
    assert(osc.handleMessage(oscMessage("/looptune/mix/stop")));
    assert(!engine.snapshot().playing);

    assert(osc.handleMessage(oscMessage("/looptune/pad/edit")));
    assert(engine.snapshot().edit_mode);

    const juce::OSCMessage input(juce::OSCAddressPattern("/looptune/port/input"),
                                 juce::String("Built-in Mic"));
    assert(osc.handleMessage(input));

    // Malformed and unknown messages are rejected.
    assert(!osc.handleMessage(oscMessage("/looptune/loop/volume")));
    assert(!osc.handleMessage(oscMessage("/looptune/pad/play")));
    assert(!osc.handleMessage(oscMessage("/looptune/unknown/thing")));
    assert(!osc.handleMessage(oscMessage("/other/record/toggle")));
    const juce::OSCMessage ghost(juce::OSCAddressPattern("/looptune/port/output"),
                                 juce::String("Ghost"));
    assert(!osc.handleMessage(ghost));

    const juce::OSCMessage remove(juce::OSCAddressPattern("/looptune/loop/delete"),
                                  juce::String(id));
    assert(osc.handleMessage(remove));
    assert(engine.snapshot().loops.empty());
}

}  // namespace

int main()
{
    testAutoStopTimer();
    testLoopRecordingFollowsMasterDuration();
    testAutoStopWhenDeviceStalls();
    testPlayingFlagFollowsPlayers();
    testMixingAndDeletion();
    testPlaybackCompletion();
    testRecordingDeniedWithoutInput();
    testSoundboard();
    testRouteChanges();
    testSessionManifest();
    testOscControl();

    std::cout << "looptune engine tests: OK" << std::endl;
    return 0;
}
