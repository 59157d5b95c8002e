#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <argparse/argparse.hpp>

#include <juce_events/juce_events.h>

#include "AudioEngine.h"
#include "ControlOscReceiver.h"
#include "EngineConfig.h"
#include "JuceAudioSession.h"

namespace {

struct CommandLine {
    EngineConfig config;
    juce::String logFile;
    bool exitRequested{false};
    int exitCode{0};
};

CommandLine parseCommandLine(const juce::StringArray& parameters)
{
    CommandLine result;

    argparse::ArgumentParser program("looptune", "0.1.0", argparse::default_arguments::all,
                                     false);
    program.add_description("looptune: headless looper and soundboard engine.");
    program.add_argument("-s", "--storage")
        .help("Directory for recordings, pad sounds and the session manifest.")
        .default_value(result.config.storageDirectory.getFullPathName().toStdString());
    program.add_argument("-p", "--osc-port")
        .help("UDP port of the OSC control surface (0 disables it).")
        .scan<'i', int>()
        .default_value(result.config.oscPort);
    program.add_argument("--inputs")
        .help("Number of device input channels to open.")
        .scan<'i', int>()
        .default_value(result.config.numInputChannels);
    program.add_argument("--outputs")
        .help("Number of device output channels to open.")
        .scan<'i', int>()
        .default_value(result.config.numOutputChannels);
    program.add_argument("-c", "--channels")
        .help("Channels written to recorded files.")
        .scan<'i', int>()
        .default_value(result.config.recordingChannels);
    program.add_argument("-b", "--bits")
        .help("Bit depth of recorded files.")
        .scan<'i', int>()
        .default_value(result.config.recordingBitsPerSample)
        .choices(16, 24, 32);
    program.add_argument("--pad-seconds")
        .help("Length limit of soundboard recordings, in seconds.")
        .scan<'g', double>()
        .default_value(result.config.soundboardCeilingSeconds);
    program.add_argument("--no-manifest")
        .help("Do not restore or write session.looptune; loops live only in memory.")
        .flag();
    program.add_argument("-l", "--log-file")
        .help("Also write the log to this file.")
        .default_value(std::string{});

    std::vector<std::string> arguments{"looptune"};
    for (const auto& parameter : parameters) {
        arguments.push_back(parameter.toStdString());
    }

    try {
        program.parse_args(arguments);
    } catch (const std::exception& err) {
        std::cerr << err.what() << std::endl;
        std::cerr << program;
        result.exitRequested = true;
        result.exitCode = 1;
        return result;
    }

    // --help and --version print from the parser itself.
    if (program.get<bool>("--help") || program.get<bool>("--version")) {
        result.exitRequested = true;
        return result;
    }

    const auto storage = program.get<std::string>("--storage");
    result.config.storageDirectory =
        juce::File::getCurrentWorkingDirectory().getChildFile(juce::String(storage));
    result.config.oscPort = program.get<int>("--osc-port");
    result.config.numInputChannels = program.get<int>("--inputs");
    result.config.numOutputChannels = program.get<int>("--outputs");
    result.config.recordingChannels = program.get<int>("--channels");
    result.config.recordingBitsPerSample = program.get<int>("--bits");
    result.config.soundboardCeilingSeconds = program.get<double>("--pad-seconds");
    result.config.persistManifest = !program.get<bool>("--no-manifest");
    result.logFile = juce::String(program.get<std::string>("--log-file"));

    if (result.config.recordingChannels < 1 || result.config.recordingChannels > Recorder::kMaxChannels ||
        result.config.soundboardCeilingSeconds <= 0.0) {
        std::cerr << "Invalid recording settings" << std::endl;
        result.exitRequested = true;
        result.exitCode = 1;
    }

    return result;
}

// Mirrors engine errors and recording transitions to the log.
class EngineLogListener : public AudioEngine::Listener {
public:
    explicit EngineLogListener(AudioEngine& engine) : engine_(engine) {}

    void engineStateChanged() override
    {
        const auto snapshot = engine_.snapshot();
        if (snapshot.capturing != wasCapturing_ ||
            snapshot.loops.size() != loopCount_) {
            wasCapturing_ = snapshot.capturing;
            loopCount_ = snapshot.loops.size();

            juce::String master = "unset";
            if (snapshot.master_duration_seconds.has_value()) {
                master = juce::String(*snapshot.master_duration_seconds, 3) + " s";
            }
            juce::Logger::writeToLog(
                "[looptune] " + juce::String(snapshot.capturing ? "recording" : "idle") +
                ", loops: " + juce::String(static_cast<int>(loopCount_)) +
                ", master: " + master);
        }
    }

    void engineErrorOccurred(const looptune::EngineError& error) override
    {
        juce::Logger::writeToLog("[looptune] error: " + juce::String(looptune::Describe(error)));
    }

private:
    AudioEngine& engine_;
    bool wasCapturing_{false};
    std::size_t loopCount_{0};
};

}  // namespace

class LooptuneApplication : public juce::JUCEApplicationBase {
public:
    LooptuneApplication() = default;

    const juce::String getApplicationName() override { return "LoopTune"; }
    const juce::String getApplicationVersion() override { return "0.1.0"; }
    bool moreThanOneInstanceAllowed() override { return true; }

    void initialise(const juce::String& commandLineParameters) override
    {
        juce::ignoreUnused(commandLineParameters);

        auto commandLine = parseCommandLine(getCommandLineParameterArray());
        if (commandLine.exitRequested) {
            setApplicationReturnValue(commandLine.exitCode);
            quit();
            return;
        }

        if (commandLine.logFile.isNotEmpty()) {
            const auto logFile =
                juce::File::getCurrentWorkingDirectory().getChildFile(commandLine.logFile);
            fileLogger_ = std::make_unique<juce::FileLogger>(logFile, "LoopTune log");
            juce::Logger::setCurrentLogger(fileLogger_.get());
        }

        const auto& config = commandLine.config;
        session_ = std::make_unique<JuceAudioSession>(config.numInputChannels,
                                                      config.numOutputChannels);
        engine_ = std::make_unique<AudioEngine>(*session_, config);

        logListener_ = std::make_unique<EngineLogListener>(*engine_);
        engine_->addListener(logListener_.get());

        if (config.persistManifest && !engine_->restoreSession()) {
            juce::Logger::writeToLog("[looptune] Starting with an empty session.");
        }

        if (config.oscPort > 0) {
            oscReceiver_ = std::make_unique<ControlOscReceiver>(*engine_, config.oscPort);
        }

        juce::Logger::writeToLog("[looptune] Ready.");
    }

    void shutdown() override
    {
        oscReceiver_.reset();
        if (engine_ != nullptr) {
            engine_->removeListener(logListener_.get());
            engine_->shutdown();
        }
        logListener_.reset();
        engine_.reset();
        session_.reset();

        juce::Logger::setCurrentLogger(nullptr);
        fileLogger_.reset();
    }

    void anotherInstanceStarted(const juce::String& commandLine) override
    {
        juce::ignoreUnused(commandLine);
    }

    void systemRequestedQuit() override { quit(); }
    void suspended() override {}
    void resumed() override {}

    void unhandledException(const std::exception* e,
                            const juce::String& sourceFilename,
                            int lineNumber) override
    {
        juce::Logger::writeToLog("[looptune] Unhandled exception" +
                                 (e != nullptr ? ": " + juce::String(e->what()) : juce::String()) +
                                 " at " + sourceFilename + ":" + juce::String(lineNumber));
    }

private:
    std::unique_ptr<juce::FileLogger> fileLogger_;
    std::unique_ptr<JuceAudioSession> session_;
    std::unique_ptr<AudioEngine> engine_;
    std::unique_ptr<EngineLogListener> logListener_;
    std::unique_ptr<ControlOscReceiver> oscReceiver_;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(LooptuneApplication)
};

START_JUCE_APPLICATION(LooptuneApplication)
