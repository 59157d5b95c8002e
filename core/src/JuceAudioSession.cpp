#include "JuceAudioSession.h"

namespace {

looptune::AudioPortDescriptor makePort(const juce::String& typeName,
                                       const juce::String& deviceName,
                                       const looptune::PortDirection direction)
{
    looptune::AudioPortDescriptor port;
    port.name = deviceName.toStdString();
    port.uid = (typeName + ":" + deviceName).toStdString();
    port.direction = direction;
    port.type = looptune::GuessPortType(port.name, direction);
    return port;
}

}  // namespace

JuceAudioSession::JuceAudioSession(const int numInputChannels,
                                   const int numOutputChannels)
{
    const juce::String audioError =
        deviceManager_.initialiseWithDefaultDevices(numInputChannels,
                                                    numOutputChannels);
    if (audioError.isNotEmpty()) {
        juce::Logger::writeToLog("[looptune-core] Failed to initialise audio: " +
                                 audioError);
    } else {
        juce::Logger::writeToLog("[looptune-core] Audio session initialised.");
    }

    lastRoute_ = getRoute();
    deviceManager_.addChangeListener(this);
}

JuceAudioSession::~JuceAudioSession()
{
    deviceManager_.removeChangeListener(this);
    setAudioCallback(nullptr);
}

juce::Result JuceAudioSession::activate()
{
    if (deviceManager_.getCurrentAudioDevice() == nullptr) {
        deviceManager_.restartLastAudioDevice();
    }

    if (deviceManager_.getCurrentAudioDevice() == nullptr) {
        return juce::Result::fail("No audio device could be opened");
    }
    return juce::Result::ok();
}

void JuceAudioSession::deactivate()
{
    deviceManager_.closeAudioDevice();
}

bool JuceAudioSession::isActive() const
{
    return deviceManager_.getCurrentAudioDevice() != nullptr;
}

int JuceAudioSession::getNumInputChannels() const
{
    auto* device = deviceManager_.getCurrentAudioDevice();
    if (device == nullptr) {
        return 0;
    }
    return device->getActiveInputChannels().countNumberOfSetBits();
}

double JuceAudioSession::getSampleRate() const
{
    auto* device = deviceManager_.getCurrentAudioDevice();
    if (device == nullptr) {
        return 0.0;
    }
    return device->getCurrentSampleRate();
}

looptune::AudioRouteSnapshot JuceAudioSession::getRoute() const
{
    looptune::AudioRouteSnapshot route;

    auto* type = deviceManager_.getCurrentDeviceTypeObject();
    if (type == nullptr) {
        return route;
    }

    const auto typeName = type->getTypeName();
    for (const auto& name : type->getDeviceNames(true)) {
        route.inputs.push_back(
            makePort(typeName, name, looptune::PortDirection::kInput));
    }
    for (const auto& name : type->getDeviceNames(false)) {
        route.outputs.push_back(
            makePort(typeName, name, looptune::PortDirection::kOutput));
    }

    // The current ports are those of the open device; a closed device
    // has no current route.
    if (deviceManager_.getCurrentAudioDevice() != nullptr) {
        const auto setup = deviceManager_.getAudioDeviceSetup();
        if (setup.inputDeviceName.isNotEmpty()) {
            route.current_input = makePort(typeName, setup.inputDeviceName,
                                           looptune::PortDirection::kInput);
        }
        if (setup.outputDeviceName.isNotEmpty()) {
            route.current_output = makePort(typeName, setup.outputDeviceName,
                                            looptune::PortDirection::kOutput);
        }
    }

    return route;
}

juce::Result JuceAudioSession::setPreferredInput(
    const looptune::AudioPortDescriptor& port)
{
    auto setup = deviceManager_.getAudioDeviceSetup();
    setup.inputDeviceName = port.name;
    setup.useDefaultInputChannels = true;
    return applySetup(setup);
}

juce::Result JuceAudioSession::setPreferredOutput(
    const looptune::AudioPortDescriptor& port,
    const looptune::OutputRouting routing)
{
    outputRouting_ = routing;
    juce::Logger::writeToLog(
        juce::String("[looptune-core] Output routing: ") +
        (routing == looptune::OutputRouting::kAllowBluetoothA2dp
             ? "allow bluetooth A2DP"
             : "default to speaker"));

    auto setup = deviceManager_.getAudioDeviceSetup();
    setup.outputDeviceName = port.name;
    setup.useDefaultOutputChannels = true;
    return applySetup(setup);
}

juce::Result JuceAudioSession::applySetup(
    const juce::AudioDeviceManager::AudioDeviceSetup& setup)
{
    const juce::String error = deviceManager_.setAudioDeviceSetup(setup, true);
    if (error.isNotEmpty()) {
        return juce::Result::fail(error);
    }
    return juce::Result::ok();
}

void JuceAudioSession::setAudioCallback(juce::AudioIODeviceCallback* callback)
{
    if (callback_ == callback) {
        return;
    }
    if (callback_ != nullptr) {
        deviceManager_.removeAudioCallback(callback_);
    }
    callback_ = callback;
    if (callback_ != nullptr) {
        deviceManager_.addAudioCallback(callback_);
    }
}

void JuceAudioSession::changeListenerCallback(juce::ChangeBroadcaster* source)
{
    juce::ignoreUnused(source);

    auto route = getRoute();
    const auto reason = looptune::InferRouteChangeReason(lastRoute_, route);
    lastRoute_ = route;

    juce::Logger::writeToLog(juce::String("[looptune-core] Route change: ") +
                             looptune::ToString(reason));
    notifyRouteChanged(reason, route);
}
