#pragma once

#include <juce_osc/juce_osc.h>

class AudioEngine;

// OSC control surface for the engine. Messages are dispatched on the
// message thread, which is the engine thread in the application.
//
//   /looptune/record/toggle
//   /looptune/loop/play    (string loopId)
//   /looptune/loop/stop    (string loopId)
//   /looptune/loop/volume  (string loopId, float volume)
//   /looptune/loop/mute    (string loopId)
//   /looptune/loop/solo    (string loopId)
//   /looptune/loop/delete  (string loopId)
//   /looptune/mix/play
//   /looptune/mix/stop
//   /looptune/port/input   (string portName)
//   /looptune/port/output  (string portName)
//   /looptune/pad/record   (int32 pad)
//   /looptune/pad/stop
//   /looptune/pad/assign   (int32 pad, string path)
//   /looptune/pad/play     (int32 pad)
//   /looptune/pad/remove   (int32 pad)
//   /looptune/pad/tap      (int32 pad)
//   /looptune/pad/edit
//
// Pads are numbered 0..7. Bundles are flattened and each contained
// message is handled as if it had been sent alone.
class ControlOscReceiver : private juce::OSCReceiver,
                           private juce::OSCReceiver::Listener<
                               juce::OSCReceiver::MessageLoopCallback> {
public:
    // A port <= 0 leaves the receiver unbound; messages can still be
    // injected with handleMessage().
    ControlOscReceiver(AudioEngine& engine, int port);
    ~ControlOscReceiver() override;

    [[nodiscard]] bool isConnected() const { return connected_; }

    // Returns false for unknown addresses and malformed arguments.
    bool handleMessage(const juce::OSCMessage& message);

private:
    void oscMessageReceived(const juce::OSCMessage& message) override;
    void oscBundleReceived(const juce::OSCBundle& bundle) override;

    bool handleLoopMessage(const juce::String& command, const juce::OSCMessage& message);
    bool handlePortMessage(const juce::String& command, const juce::OSCMessage& message);
    bool handlePadMessage(const juce::String& command, const juce::OSCMessage& message);

    void writeLog(const juce::OSCMessage& message, const juce::String& text);

    AudioEngine& engine_;
    bool connected_{false};

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(ControlOscReceiver)
};
