#pragma once

#include <functional>
#include <optional>

#include "AudioSession.h"
#include "core/AudioPort.h"
#include "core/EngineError.h"

// Tracks the ports offered by the audio session and the user's port
// selection in each direction.
//
// The route is re-read on construction and on every route change. A
// selected port survives a route change as long as a port with the
// same name is still offered; otherwise the selection falls back to
// the port the new route is using.
class AudioRouteManager : private AudioSession::Listener {
public:
    explicit AudioRouteManager(AudioSession& session);
    ~AudioRouteManager() override;

    [[nodiscard]] const looptune::AudioRouteSnapshot& getRoute() const { return route_; }
    [[nodiscard]] const std::optional<looptune::AudioPortDescriptor>& getSelectedInput() const
    {
        return selectedInput_;
    }
    [[nodiscard]] const std::optional<looptune::AudioPortDescriptor>& getSelectedOutput() const
    {
        return selectedOutput_;
    }

    // Both selections deactivate the session, apply the preference and
    // reactivate it. The selection is then whatever the session grants.
    bool selectInput(const looptune::AudioPortDescriptor& port);
    bool selectOutput(const looptune::AudioPortDescriptor& port);

    // Re-reads the route without treating it as a change.
    void refresh();

    std::function<void()> onChanged;
    std::function<void(const looptune::EngineError&)> onError;

private:
    void audioRouteChanged(looptune::RouteChangeReason reason,
                           const looptune::AudioRouteSnapshot& route) override;

    void reportInconsistency(const looptune::AudioPortDescriptor& vanished);
    void reportFailure(const juce::String& what, const juce::Result& result);

    AudioSession& session_;
    looptune::AudioRouteSnapshot route_;
    std::optional<looptune::AudioPortDescriptor> selectedInput_;
    std::optional<looptune::AudioPortDescriptor> selectedOutput_;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(AudioRouteManager)
};
