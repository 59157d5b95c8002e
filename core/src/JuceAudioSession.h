#pragma once

#include <juce_audio_devices/juce_audio_devices.h>

#include "AudioSession.h"

// AudioSession backed by a juce::AudioDeviceManager.
//
// Ports are the input and output device names offered by the current
// device type (ALSA, JACK...). Device list changes and device
// reconfiguration are broadcast by the manager and turned into route
// change notifications on the message thread.
class JuceAudioSession : public AudioSession,
                         private juce::ChangeListener {
public:
    JuceAudioSession(int numInputChannels, int numOutputChannels);
    ~JuceAudioSession() override;

    juce::Result activate() override;
    void deactivate() override;
    [[nodiscard]] bool isActive() const override;

    [[nodiscard]] int getNumInputChannels() const override;
    [[nodiscard]] double getSampleRate() const override;

    [[nodiscard]] looptune::AudioRouteSnapshot getRoute() const override;

    juce::Result setPreferredInput(
        const looptune::AudioPortDescriptor& port) override;
    juce::Result setPreferredOutput(
        const looptune::AudioPortDescriptor& port,
        looptune::OutputRouting routing) override;

    void setAudioCallback(juce::AudioIODeviceCallback* callback) override;

    juce::AudioDeviceManager& getDeviceManager() { return deviceManager_; }
    [[nodiscard]] looptune::OutputRouting getOutputRouting() const { return outputRouting_; }

private:
    void changeListenerCallback(juce::ChangeBroadcaster* source) override;

    juce::Result applySetup(const juce::AudioDeviceManager::AudioDeviceSetup& setup);

    juce::AudioDeviceManager deviceManager_;
    juce::AudioIODeviceCallback* callback_{nullptr};
    looptune::AudioRouteSnapshot lastRoute_;
    looptune::OutputRouting outputRouting_{looptune::OutputRouting::kDefaultToSpeaker};

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(JuceAudioSession)
};
