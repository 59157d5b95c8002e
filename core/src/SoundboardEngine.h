#pragma once

#include <array>
#include <functional>
#include <memory>

#include <juce_audio_basics/juce_audio_basics.h>

#include "AudioFileLoader.h"
#include "SampleVoice.h"
#include "core/EngineError.h"
#include "core/SoundboardSlots.h"

// Eight one-shot pads. Each assigned pad owns one voice; playing a pad
// restarts that voice from frame zero so a pad never overlaps itself.
//
// Engine thread only, except render().
class SoundboardEngine {
public:
    SoundboardEngine() = default;
    ~SoundboardEngine() = default;

    [[nodiscard]] const looptune::SoundboardSlots& getSlots() const { return slots_; }
    [[nodiscard]] bool isEditMode() const { return slots_.edit_mode(); }

    // Puts a decoded sound on a pad. The file that backed the pad
    // before is deleted unless it is the same file.
    bool assign(int index, const juce::File& file,
                std::shared_ptr<const DecodedSample> sample, const juce::String& title);

    // Ignored in edit mode and for empty pads.
    bool play(int index);
    void stop(int index);
    void stopAll();

    // Stops the pad, deletes its file and leaves it empty.
    bool remove(int index);

    bool toggleEditMode();
    void setEditMode(bool editMode) { slots_.set_edit_mode(editMode); }

    // Plays in normal mode, removes in edit mode.
    looptune::SlotTapAction tap(int index);

    [[nodiscard]] bool isVoiceActive(int index) const;

    // Audio thread.
    void render(float* const* output, int numChannels, int numSamples,
                double deviceSampleRate) noexcept;

private:
    static void deleteBackingFile(const std::string& path);

    looptune::SoundboardSlots slots_;

    mutable juce::SpinLock voicesLock_;
    std::array<std::shared_ptr<SampleVoice>, looptune::SoundboardSlots::kNumSlots> voices_{};  // Guarded by voicesLock_.

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(SoundboardEngine)
};
