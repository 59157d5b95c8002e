#pragma once

#include <juce_audio_devices/juce_audio_devices.h>

#include "core/AudioPort.h"

// Hardware audio path used by the engine: device activation, the
// routes it can take and route-change notifications. The application
// uses JuceAudioSession; tests drive the engine through a fake.
class AudioSession {
public:
    class Listener {
    public:
        virtual ~Listener() = default;

        // Called on the engine thread after the set of ports or the
        // current route changed. `route` is the resulting route.
        virtual void audioRouteChanged(looptune::RouteChangeReason reason,
                                       const looptune::AudioRouteSnapshot& route) = 0;
    };

    virtual ~AudioSession() = default;

    // Enables the record/playback path. Idempotent.
    virtual juce::Result activate() = 0;
    virtual void deactivate() = 0;
    [[nodiscard]] virtual bool isActive() const = 0;

    [[nodiscard]] virtual int getNumInputChannels() const = 0;
    [[nodiscard]] virtual double getSampleRate() const = 0;

    [[nodiscard]] virtual looptune::AudioRouteSnapshot getRoute() const = 0;

    virtual juce::Result setPreferredInput(
        const looptune::AudioPortDescriptor& port) = 0;
    virtual juce::Result setPreferredOutput(
        const looptune::AudioPortDescriptor& port,
        looptune::OutputRouting routing) = 0;

    // Installs the callback that receives device audio. Passing
    // nullptr detaches the current one.
    virtual void setAudioCallback(juce::AudioIODeviceCallback* callback) = 0;

    void addListener(Listener* listener) { listeners_.add(listener); }
    void removeListener(Listener* listener) { listeners_.remove(listener); }

protected:
    void notifyRouteChanged(const looptune::RouteChangeReason reason,
                            const looptune::AudioRouteSnapshot& route)
    {
        listeners_.call([&](Listener& l) { l.audioRouteChanged(reason, route); });
    }

private:
    juce::ListenerList<Listener> listeners_;
};
