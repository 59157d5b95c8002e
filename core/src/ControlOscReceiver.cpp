#include "ControlOscReceiver.h"

#include <memory>

#include "AudioEngine.h"
#include "ExternalFile.h"

namespace {

constexpr const char* kPrefix = "/looptune/";

bool hasString(const juce::OSCMessage& message, const int index)
{
    return message.size() > index && message[index].isString();
}

bool hasInt(const juce::OSCMessage& message, const int index)
{
    return message.size() > index && message[index].isInt32();
}

// Volume may arrive as float or int depending on the sender.
bool readNumber(const juce::OSCMessage& message, const int index, float& out)
{
    if (message.size() <= index) {
        return false;
    }
    if (message[index].isFloat32()) {
        out = message[index].getFloat32();
        return true;
    }
    if (message[index].isInt32()) {
        out = static_cast<float>(message[index].getInt32());
        return true;
    }
    return false;
}

}  // namespace

ControlOscReceiver::ControlOscReceiver(AudioEngine& engine, const int port)
    : engine_(engine)
{
    addListener(this);

    if (port <= 0) {
        return;
    }

    connected_ = connect(port);
    if (!connected_) {
        juce::Logger::writeToLog("[looptune-core] Failed to bind OSC receiver on port " +
                                 juce::String(port));
    } else {
        juce::Logger::writeToLog("[looptune-core] OSC receiver listening on port " +
                                 juce::String(port));
    }
}

ControlOscReceiver::~ControlOscReceiver()
{
    removeListener(this);
    if (connected_) {
        disconnect();
    }
}

void ControlOscReceiver::oscMessageReceived(const juce::OSCMessage& message)
{
    if (!handleMessage(message)) {
        writeLog(message, "ignored");
    }
}

void ControlOscReceiver::oscBundleReceived(const juce::OSCBundle& bundle)
{
    for (const auto& element : bundle) {
        if (element.isMessage()) {
            oscMessageReceived(element.getMessage());
        } else if (element.isBundle()) {
            oscBundleReceived(element.getBundle());
        }
    }
}

bool ControlOscReceiver::handleMessage(const juce::OSCMessage& message)
{
    const auto address = message.getAddressPattern().toString();
    if (!address.startsWith(kPrefix)) {
        return false;
    }

    // "/looptune/<group>/<command>"
    const auto path = address.substring(juce::String(kPrefix).length());
    const auto group = path.upToFirstOccurrenceOf("/", false, false);
    const auto command = path.fromFirstOccurrenceOf("/", false, false);

    if (group == "record") {
        if (command == "toggle") {
            engine_.toggleRecording();
            return true;
        }
        return false;
    }
    if (group == "mix") {
        if (command == "play") {
            engine_.playAll();
            return true;
        }
        if (command == "stop") {
            engine_.stopAll();
            return true;
        }
        return false;
    }
    if (group == "loop") {
        return handleLoopMessage(command, message);
    }
    if (group == "port") {
        return handlePortMessage(command, message);
    }
    if (group == "pad") {
        return handlePadMessage(command, message);
    }
    return false;
}

bool ControlOscReceiver::handleLoopMessage(const juce::String& command,
                                           const juce::OSCMessage& message)
{
    if (!hasString(message, 0)) {
        writeLog(message, "expected a loop id");
        return false;
    }
    const auto id = message[0].getString().toStdString();

    if (command == "play") {
        const auto handle = engine_.playLoop(id);
        juce::ignoreUnused(handle);
    } else if (command == "stop") {
        engine_.stopLoop(id);
    } else if (command == "volume") {
        float volume = 0.0F;
        if (!readNumber(message, 1, volume)) {
            writeLog(message, "expected a volume");
            return false;
        }
        engine_.setLoopVolume(id, volume);
    } else if (command == "mute") {
        engine_.toggleMute(id);
    } else if (command == "solo") {
        engine_.toggleSolo(id);
    } else if (command == "delete") {
        engine_.deleteLoop(id);
    } else {
        return false;
    }
    return true;
}

bool ControlOscReceiver::handlePortMessage(const juce::String& command,
                                           const juce::OSCMessage& message)
{
    if (!hasString(message, 0)) {
        writeLog(message, "expected a port name");
        return false;
    }
    const auto name = message[0].getString().toStdString();
    const auto& route = engine_.getRouteManager().getRoute();

    const auto& ports = command == "input" ? route.inputs : route.outputs;
    if (command != "input" && command != "output") {
        return false;
    }

    for (const auto& port : ports) {
        if (port.name == name) {
            if (command == "input") {
                engine_.selectInput(port);
            } else {
                engine_.selectOutput(port);
            }
            return true;
        }
    }

    writeLog(message, "unknown port");
    return false;
}

bool ControlOscReceiver::handlePadMessage(const juce::String& command,
                                          const juce::OSCMessage& message)
{
    if (command == "stop") {
        engine_.stopSlotRecording();
        return true;
    }
    if (command == "edit") {
        engine_.toggleEditMode();
        return true;
    }

    if (!hasInt(message, 0)) {
        writeLog(message, "expected a pad index");
        return false;
    }
    const int pad = message[0].getInt32();

    if (command == "record") {
        engine_.recordSlot(pad);
    } else if (command == "play") {
        engine_.playSlot(pad);
    } else if (command == "remove") {
        engine_.removeSlot(pad);
    } else if (command == "tap") {
        engine_.tapSlot(pad);
    } else if (command == "assign") {
        if (!hasString(message, 1)) {
            writeLog(message, "expected a file path");
            return false;
        }
        // Relative paths are resolved against the working directory.
        const auto file =
            juce::File::getCurrentWorkingDirectory().getChildFile(message[1].getString());
        engine_.assignSlot(pad, std::make_shared<LocalFileReference>(file));
    } else {
        return false;
    }
    return true;
}

void ControlOscReceiver::writeLog(const juce::OSCMessage& message, const juce::String& text)
{
    juce::Logger::writeToLog("[looptune-core] " + message.getAddressPattern().toString() +
                             ": " + text);
}
