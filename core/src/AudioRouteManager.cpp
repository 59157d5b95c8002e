#include "AudioRouteManager.h"

AudioRouteManager::AudioRouteManager(AudioSession& session)
    : session_(session)
{
    refresh();
    session_.addListener(this);
}

AudioRouteManager::~AudioRouteManager()
{
    session_.removeListener(this);
}

void AudioRouteManager::refresh()
{
    route_ = session_.getRoute();
    selectedInput_ = route_.current_input;
    selectedOutput_ = route_.current_output;
}

bool AudioRouteManager::selectInput(const looptune::AudioPortDescriptor& port)
{
    session_.deactivate();
    const auto preferred = session_.setPreferredInput(port);
    if (preferred.failed()) {
        reportFailure("Cannot select input " + juce::String(port.name), preferred);
    }

    const auto activated = session_.activate();
    if (activated.failed()) {
        reportFailure("Cannot reactivate session", activated);
    }

    route_ = session_.getRoute();
    selectedInput_ = route_.current_input;

    juce::Logger::writeToLog(
        "[looptune-core] Input selected: " +
        juce::String(selectedInput_.has_value() ? selectedInput_->name : "<none>"));

    if (onChanged) {
        onChanged();
    }
    return preferred.wasOk() && activated.wasOk();
}

bool AudioRouteManager::selectOutput(const looptune::AudioPortDescriptor& port)
{
    session_.deactivate();
    const auto preferred =
        session_.setPreferredOutput(port, looptune::RoutingForPort(port));
    if (preferred.failed()) {
        reportFailure("Cannot select output " + juce::String(port.name), preferred);
    }

    const auto activated = session_.activate();
    if (activated.failed()) {
        reportFailure("Cannot reactivate session", activated);
    }

    route_ = session_.getRoute();
    selectedOutput_ = route_.current_output;

    juce::Logger::writeToLog(
        "[looptune-core] Output selected: " +
        juce::String(selectedOutput_.has_value() ? selectedOutput_->name : "<none>"));

    if (onChanged) {
        onChanged();
    }
    return preferred.wasOk() && activated.wasOk();
}

void AudioRouteManager::audioRouteChanged(const looptune::RouteChangeReason reason,
                                          const looptune::AudioRouteSnapshot& route)
{
    juce::Logger::writeToLog(juce::String("[looptune-core] Route changed (") +
                             looptune::ToString(reason) + ")");

    const auto previousInput = selectedInput_;
    const auto previousOutput = selectedOutput_;
    route_ = route;

    bool keptInput = false;
    selectedInput_ = looptune::ReconcileSelection(previousInput, route_.inputs,
                                                  route_.current_input, &keptInput);
    bool keptOutput = false;
    selectedOutput_ = looptune::ReconcileSelection(previousOutput, route_.outputs,
                                                   route_.current_output, &keptOutput);

    if (previousInput.has_value() && !keptInput) {
        reportInconsistency(*previousInput);
    }
    if (previousOutput.has_value() && !keptOutput) {
        reportInconsistency(*previousOutput);
    }

    if (onChanged) {
        onChanged();
    }
}

void AudioRouteManager::reportInconsistency(const looptune::AudioPortDescriptor& vanished)
{
    const looptune::EngineError error{
        looptune::EngineErrorKind::kRouteChangeInconsistency,
        "Selected port '" + vanished.name + "' is no longer available"};
    if (onError) {
        onError(error);
    } else {
        juce::Logger::writeToLog("[looptune-core] " + juce::String(looptune::Describe(error)));
    }
}

void AudioRouteManager::reportFailure(const juce::String& what, const juce::Result& result)
{
    const looptune::EngineError error{
        looptune::EngineErrorKind::kSessionActivation,
        (what + ": " + result.getErrorMessage()).toStdString()};
    if (onError) {
        onError(error);
    } else {
        juce::Logger::writeToLog("[looptune-core] " + juce::String(looptune::Describe(error)));
    }
}
