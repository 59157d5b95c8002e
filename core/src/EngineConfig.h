#pragma once

#include <juce_core/juce_core.h>

// Runtime settings of the engine, filled from the command line.
struct EngineConfig {
    // Directory holding loop recordings, pad sounds and the manifest.
    juce::File storageDirectory{
        juce::File::getSpecialLocation(juce::File::userApplicationDataDirectory)
            .getChildFile("looptune")};

    int numInputChannels{1};
    int numOutputChannels{2};

    int recordingChannels{1};
    int recordingBitsPerSample{16};

    // Fixed length limit of soundboard recordings.
    double soundboardCeilingSeconds{5.0};

    // Write session.looptune after every change and restore it at start.
    bool persistManifest{true};

    // UDP port of the OSC control surface; 0 disables it.
    int oscPort{9001};
};
