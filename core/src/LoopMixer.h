#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

#include <juce_audio_basics/juce_audio_basics.h>

#include "AudioFileLoader.h"
#include "SampleVoice.h"
#include "core/EngineError.h"
#include "core/Loop.h"
#include "core/MasterClock.h"
#include "core/MixState.h"
#include "core/PlaybackHandle.h"

// Owns the loop collection, the master clock and the active players.
//
// All methods except render() and hasPendingCompletions() run on the
// engine thread. The active player map is shared with the audio thread
// and guarded by a spin lock; the audio thread only try-locks it and
// renders silence for a contended block. Effective volumes of every
// active player are recomputed inside that critical section whenever a
// volume, mute or solo command changes them.
class LoopMixer {
public:
    LoopMixer();
    ~LoopMixer();

    [[nodiscard]] const std::vector<looptune::Loop>& getLoops() const { return loops_; }
    [[nodiscard]] const looptune::Loop* findLoop(const looptune::LoopId& id) const;
    [[nodiscard]] const looptune::MasterClock& getMasterClock() const { return masterClock_; }
    [[nodiscard]] const looptune::MixState& getMixState() const { return mixState_; }
    [[nodiscard]] bool isPlaying() const { return playing_; }

    [[nodiscard]] float getEffectiveVolume(const looptune::LoopId& id) const;

    // Gain currently applied by the active player of a loop, if any.
    [[nodiscard]] std::optional<float> getPlayerGain(const looptune::LoopId& id) const;
    [[nodiscard]] bool isActive(const looptune::LoopId& id) const;

    // Appends a validated recording. The first loop entering an empty
    // collection establishes the master duration.
    const looptune::Loop& addLoop(looptune::LoopId id, const juce::File& file,
                                  std::shared_ptr<const DecodedSample> sample,
                                  float volume = 1.0F);

    // Re-attaches a loop from the session manifest. The sample is
    // decoded on first playback.
    void restoreLoop(looptune::Loop loop);
    void restoreMasterDuration(double seconds);

    // Starts or resumes playback. Indefinite playback loops until
    // stopped and never calls `onFinish`; otherwise `onFinish` runs
    // once on the engine thread when the loop ends by itself.
    looptune::PlaybackHandle play(const looptune::LoopId& id, bool indefinite,
                                  std::function<void()> onFinish = {});
    void stop(const looptune::LoopId& id);
    void stopAll();
    bool playAll();

    void setVolume(const looptune::LoopId& id, float volume);
    bool toggleMute(const looptune::LoopId& id);
    bool toggleSolo(const looptune::LoopId& id);

    // Stops the loop, deletes its file and drops the entry. Returns
    // false for an unknown id.
    bool deleteLoop(const looptune::LoopId& id);

    // Resolves handles of players that reached their end and runs
    // their finish callbacks.
    void dispatchPendingCompletions();

    // Audio thread.
    void render(float* const* output, int numChannels, int numSamples,
                double deviceSampleRate) noexcept;
    [[nodiscard]] bool hasPendingCompletions() const noexcept;

    std::function<void(const looptune::EngineError&)> onError;

private:
    struct ActivePlayer {
        std::shared_ptr<SampleVoice> voice;
        std::shared_ptr<looptune::PlaybackCompletion> completion;
        std::function<void()> onFinish;
    };

    looptune::Loop* findMutableLoop(const looptune::LoopId& id);
    std::shared_ptr<const DecodedSample> sampleFor(const looptune::Loop& loop);

    // Removes the player from the map. Returns it so that the voice is
    // released outside the lock.
    std::optional<ActivePlayer> detachPlayer(const looptune::LoopId& id);
    void applyEffectiveVolumes();

    void reportError(looptune::EngineErrorKind kind, const std::string& message);

    std::vector<looptune::Loop> loops_;
    looptune::MasterClock masterClock_;
    looptune::MixState mixState_;
    bool playing_{false};

    AudioFileLoader loader_;
    std::unordered_map<looptune::LoopId, std::shared_ptr<const DecodedSample>> samples_;

    mutable juce::SpinLock playersLock_;
    std::map<looptune::LoopId, ActivePlayer> players_;  // Guarded by playersLock_.
    std::atomic<bool> completionsPending_{false};

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(LoopMixer)
};
