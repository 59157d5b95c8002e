#include <algorithm>
#include <cassert>
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

#include "core/AudioPort.h"
#include "core/EngineError.h"
#include "core/Loop.h"
#include "core/MasterClock.h"
#include "core/MixState.h"
#include "core/PlaybackHandle.h"
#include "core/SessionManifest.h"
#include "core/SoundboardSlots.h"
#include "core/StorageNaming.h"

// Tests for the JUCE-free looper model: mixing law, master clock,
// pads, file naming, manifest and playback completion.
// They run as a normal binary and are integrated with CTest.

using looptune::AudioPortDescriptor;
using looptune::AudioRouteSnapshot;
using looptune::EngineError;
using looptune::EngineErrorKind;
using looptune::Loop;
using looptune::ManifestLoop;
using looptune::ManifestSlot;
using looptune::MasterClock;
using looptune::MixState;
using looptune::PlaybackCompletion;
using looptune::PlaybackEvent;
using looptune::PlaybackHandle;
using looptune::PortDirection;
using looptune::PortType;
using looptune::RouteChangeReason;
using looptune::SessionManifest;
using looptune::SlotTapAction;
using looptune::SoundboardSlots;

namespace {

AudioPortDescriptor makePort(const std::string& name, PortDirection direction,
                             PortType type = PortType::kOther)
{
    return AudioPortDescriptor{.name = name,
                               .uid = "alsa:" + name,
                               .type = type,
                               .direction = direction};
}

}  // namespace

int main()
{
    // Volumes are clamped into [0, 1].
    {
        assert(looptune::ClampVolume(1.5F) == 1.0F);
        assert(looptune::ClampVolume(-0.2F) == 0.0F);
        assert(looptune::ClampVolume(std::nanf("")) == 0.0F);

        Loop loop("a", "/tmp/loop_a.wav", 2.0, 3.0F);
        assert(loop.volume() == 1.0F);
        loop.set_volume(0.25F);
        assert(loop.volume() == 0.25F);
        assert(!loop.playing());
    }

    // Master clock is established once, by a positive duration only.
    {
        MasterClock clock;
        assert(!clock.is_set());
        assert(!clock.Establish(0.0));
        assert(clock.Establish(4.0));
        assert(!clock.Establish(2.0));
        assert(clock.current_duration().value() == 4.0);

        clock.Reset();
        assert(!clock.current_duration().has_value());
        assert(clock.Establish(3.0));
    }

    // Mixing law: mute dominates, a solo silences every other loop.
    {
        MixState mix;
        assert(mix.EffectiveVolume("a", 0.5F) == 0.5F);

        assert(mix.ToggleMute("a"));
        assert(mix.EffectiveVolume("a", 0.5F) == 0.0F);
        assert(!mix.ToggleMute("a"));
        assert(mix.EffectiveVolume("a", 0.5F) == 0.5F);

        assert(mix.ToggleSolo("b"));
        assert(mix.EffectiveVolume("a", 0.5F) == 0.0F);
        assert(mix.EffectiveVolume("b", 0.8F) == 0.8F);

        // Soloing another loop moves the solo.
        assert(mix.ToggleSolo("a"));
        assert(mix.solo_target().value() == "a");
        assert(mix.EffectiveVolume("b", 0.8F) == 0.0F);

        // Muted and soloed at once stays silent.
        mix.ToggleMute("a");
        assert(mix.EffectiveVolume("a", 1.0F) == 0.0F);

        // Toggling the solo target again clears it.
        assert(!mix.ToggleSolo("a"));
        assert(!mix.solo_target().has_value());
        assert(mix.EffectiveVolume("b", 0.8F) == 0.8F);

        // Forgetting a loop drops its mute and solo.
        mix.ToggleSolo("a");
        mix.Forget("a");
        assert(!mix.is_muted("a"));
        assert(!mix.solo_target().has_value());
    }

    // Soundboard pads.
    {
        SoundboardSlots slots;
        assert(slots.slots().size() == 8U);
        assert(slots.slot(0).title == "Empty");
        assert(!slots.slot(0).assigned());
        assert(!SoundboardSlots::IsValidIndex(8));
        assert(!slots.slot(-1).assigned());

        assert(slots.ActionForTap(0) == SlotTapAction::kNone);

        assert(!slots.Assign(0, "/s/a.wav", "Kick").has_value());
        assert(slots.slot(0).title == "Kick");
        assert(slots.ActionForTap(0) == SlotTapAction::kPlay);

        // Replacing returns the old file so that it can be deleted.
        const auto replaced = slots.Assign(0, "/s/b.wav", "Snare");
        assert(replaced.value() == "/s/a.wav");

        // Re-assigning the same file keeps it.
        assert(!slots.Assign(0, "/s/b.wav", "Snare 2").has_value());

        assert(slots.ToggleEditMode());
        assert(slots.ActionForTap(0) == SlotTapAction::kRemove);
        assert(slots.ActionForTap(1) == SlotTapAction::kNone);

        const auto cleared = slots.Clear(0);
        assert(cleared.value() == "/s/b.wav");
        assert(slots.slot(0).title == "Empty");
        assert(!slots.Clear(0).has_value());

        assert(SoundboardSlots::RecordingTitle(0) == "Recording 1");
        assert(SoundboardSlots::RecordingTitle(7) == "Recording 8");
    }

    // Storage naming.
    {
        const auto loopName = looptune::MakeLoopFileName("1234", 1700000000000LL, "wav");
        assert(loopName == "loop_1234_1700000000000.wav");
        assert(looptune::IsLoopFileName(loopName));
        assert(!looptune::IsLoopFileName("1234.wav"));

        assert(looptune::MakePadRecordingFileName("abcd", "wav") == "abcd.wav");
        assert(looptune::MakePadRecordingFileName("abcd", ".m4a") == "abcd.m4a");

        assert(looptune::MakeImportFileName("u", "drum.wav") == "u_drum.wav");
        assert(looptune::SanitiseFileName("../a/b:c") == ".._a_b_c");
        assert(looptune::SanitiseFileName("..") == "sound");
        assert(looptune::SanitiseFileName("") == "sound");
    }

    // Session manifest.
    {
        SessionManifest manifest;
        manifest.master_duration_seconds = 4.0;
        manifest.loops.push_back(ManifestLoop{.id = "first",
                                              .file_name = "loop_first_1.wav",
                                              .duration_seconds = 4.0,
                                              .volume = 0.5F});
        manifest.loops.push_back(ManifestLoop{.id = "second",
                                              .file_name = "loop_second_2.wav",
                                              .duration_seconds = 4.0,
                                              .volume = 1.0F});
        manifest.slots.push_back(
            ManifestSlot{.index = 3, .file_name = "pad.wav", .title = "Recording 4"});
        manifest.slots.push_back(ManifestSlot{.index = 5, .file_name = "x.wav", .title = ""});

        const std::string text = looptune::SerializeManifest(manifest);
        assert(text.rfind("looptune_session_v1\n", 0) == 0);

        SessionManifest parsed;
        std::string error;
        assert(looptune::ParseManifest(text, parsed, &error));
        assert(error.empty());
        assert(parsed.master_duration_seconds.value() == 4.0);
        assert(parsed.loops.size() == 2U);
        // Loop order is the order of the collection.
        assert(parsed.loops[0].id == "first");
        assert(parsed.loops[1].id == "second");
        assert(parsed.loops[0].volume == 0.5F);
        assert(parsed.slots.size() == 2U);
        assert(parsed.slots[0].index == 3);
        assert(parsed.slots[0].title == "Recording 4");
        assert(parsed.slots[1].title.empty());

        // Windows line endings are accepted.
        SessionManifest crlf;
        assert(looptune::ParseManifest(
            "looptune_session_v1\r\nmaster\t2.5\r\nloop\tid\t1\t2.5\tloop_id_1.wav\r\n", crlf));
        assert(crlf.master_duration_seconds.value() == 2.5);
        assert(crlf.loops.size() == 1U);

        SessionManifest untouched;
        untouched.master_duration_seconds = 1.0;
        assert(!looptune::ParseManifest("something else\n", untouched, &error));
        assert(!error.empty());
        assert(untouched.master_duration_seconds.value() == 1.0);

        assert(!looptune::ParseManifest("looptune_session_v1\nloop\tid\tloud\t2\tf.wav\n",
                                        untouched, &error));
        assert(error.find("line 2") != std::string::npos);
        assert(!looptune::ParseManifest("looptune_session_v1\nslot\t8\tf.wav\tT\n", untouched,
                                        &error));
        assert(!looptune::ParseManifest("looptune_session_v1\nmaster\t0\n", untouched, &error));
        assert(!looptune::ParseManifest("looptune_session_v1\nslot\t1\tf.wav\tbad\\q\n",
                                        untouched, &error));
    }

    // Imported names keep tabs, line breaks and backslashes.
    {
        SessionManifest manifest;
        manifest.master_duration_seconds = 2.0;
        manifest.loops.push_back(ManifestLoop{.id = "only",
                                              .file_name = "loop\\only.wav",
                                              .duration_seconds = 2.0,
                                              .volume = 1.0F});
        manifest.slots.push_back(
            ManifestSlot{.index = 0, .file_name = "u_my\tsong.wav", .title = "my\tsong.wav"});
        manifest.slots.push_back(
            ManifestSlot{.index = 1, .file_name = "u_two.wav", .title = "two\nlines\r"});

        const std::string text = looptune::SerializeManifest(manifest);
        // Header plus one record per line.
        assert(std::count(text.begin(), text.end(), '\n') == 5);

        SessionManifest parsed;
        std::string error;
        assert(looptune::ParseManifest(text, parsed, &error));
        assert(parsed.loops.size() == 1U);
        assert(parsed.loops[0].file_name == "loop\\only.wav");
        assert(parsed.slots.size() == 2U);
        assert(parsed.slots[0].file_name == "u_my\tsong.wav");
        assert(parsed.slots[0].title == "my\tsong.wav");
        assert(parsed.slots[1].title == "two\nlines\r");
    }

    // Route reconciliation and change reasons.
    {
        const auto mic = makePort("Built-in Mic", PortDirection::kInput, PortType::kBuiltInMic);
        const auto usb = makePort("USB Interface", PortDirection::kInput, PortType::kUsb);
        const auto speaker =
            makePort("Speaker", PortDirection::kOutput, PortType::kBuiltInSpeaker);
        const auto headset =
            makePort("Bluetooth Headset", PortDirection::kOutput, PortType::kBluetoothA2dp);

        assert(looptune::SamePort(usb, makePort("USB Interface", PortDirection::kInput)));
        assert(!looptune::SamePort(usb, makePort("USB Interface", PortDirection::kOutput)));

        bool kept = false;
        auto selection = looptune::ReconcileSelection(usb, {mic, usb}, mic, &kept);
        assert(kept);
        assert(selection->name == "USB Interface");

        selection = looptune::ReconcileSelection(usb, {mic}, mic, &kept);
        assert(!kept);
        assert(selection->name == "Built-in Mic");

        selection = looptune::ReconcileSelection(std::nullopt, {mic}, std::nullopt, &kept);
        assert(!selection.has_value());

        AudioRouteSnapshot before{.inputs = {mic, usb},
                                  .outputs = {speaker},
                                  .current_input = usb,
                                  .current_output = speaker};
        AudioRouteSnapshot after = before;
        after.inputs = {mic};
        after.current_input = mic;
        assert(looptune::InferRouteChangeReason(before, after) ==
               RouteChangeReason::kOldDeviceUnavailable);
        assert(looptune::InferRouteChangeReason(after, before) ==
               RouteChangeReason::kNewDeviceAvailable);

        AudioRouteSnapshot moved = before;
        moved.current_input = mic;
        assert(looptune::InferRouteChangeReason(before, moved) == RouteChangeReason::kOverride);
        assert(looptune::InferRouteChangeReason(before, before) ==
               RouteChangeReason::kConfigurationChange);

        assert(looptune::RoutingForPort(headset) == looptune::OutputRouting::kAllowBluetoothA2dp);
        assert(looptune::RoutingForPort(speaker) == looptune::OutputRouting::kDefaultToSpeaker);

        assert(looptune::GuessPortType("bluez_sink.a2dp", PortDirection::kOutput) ==
               PortType::kBluetoothA2dp);
        assert(looptune::GuessPortType("USB Audio CODEC", PortDirection::kInput) ==
               PortType::kUsb);
        assert(looptune::GuessPortType("Line Out", PortDirection::kOutput) ==
               PortType::kLineOut);
        assert(looptune::GuessPortType("Mystery", PortDirection::kOutput) == PortType::kOther);
    }

    // Errors.
    {
        const EngineError error{.kind = EngineErrorKind::kImportCopy, .message = "denied"};
        assert(looptune::Describe(error) == "ImportCopyError: denied");
        assert(looptune::Describe(EngineError{.kind = EngineErrorKind::kValidation}) ==
               "ValidationError");
    }

    // Playback completion resolves once; later events are ignored.
    {
        PlaybackCompletion completion;
        const PlaybackHandle handle = completion.handle();
        assert(handle.valid());
        assert(!handle.resolved());
        assert(!handle.TryGet().has_value());

        assert(completion.Resolve(PlaybackEvent::kFinished));
        assert(!completion.Resolve(PlaybackEvent::kStopped));
        assert(handle.Wait() == PlaybackEvent::kFinished);
        assert(completion.handle().TryGet().value() == PlaybackEvent::kFinished);

        assert(PlaybackHandle::Failed().TryGet().value() == PlaybackEvent::kFailed);
        assert(!PlaybackHandle().valid());
    }

    std::cout << "looptune core tests: OK" << std::endl;
    return 0;
}
