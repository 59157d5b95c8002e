#include "SoundboardEngine.h"

#include <utility>

void SoundboardEngine::deleteBackingFile(const std::string& path)
{
    const juce::File file(path);
    if (file.existsAsFile() && !file.deleteFile()) {
        juce::Logger::writeToLog("[looptune-core] Could not delete " + file.getFullPathName());
    }
}

bool SoundboardEngine::assign(const int index,
                              const juce::File& file,
                              std::shared_ptr<const DecodedSample> sample,
                              const juce::String& title)
{
    if (!looptune::SoundboardSlots::IsValidIndex(index) || sample == nullptr) {
        return false;
    }

    auto voice = std::make_shared<SampleVoice>(std::move(sample), false, false);
    std::shared_ptr<SampleVoice> previousVoice;
    {
        const juce::SpinLock::ScopedLockType lock(voicesLock_);
        previousVoice = std::move(voices_[static_cast<std::size_t>(index)]);
        voices_[static_cast<std::size_t>(index)] = std::move(voice);
    }
    if (previousVoice != nullptr) {
        previousVoice->halt();
    }

    const auto replaced =
        slots_.Assign(index, file.getFullPathName().toStdString(), title.toStdString());
    if (replaced.has_value()) {
        deleteBackingFile(*replaced);
    }

    juce::Logger::writeToLog("[looptune-core] Pad " + juce::String(index + 1) +
                             " assigned: " + title);
    return true;
}

bool SoundboardEngine::play(const int index)
{
    if (slots_.edit_mode()) {
        juce::Logger::writeToLog("[looptune-core] Pad play ignored in edit mode");
        return false;
    }
    if (!slots_.slot(index).assigned()) {
        return false;
    }

    const juce::SpinLock::ScopedLockType lock(voicesLock_);
    auto& voice = voices_[static_cast<std::size_t>(index)];
    if (voice == nullptr) {
        return false;
    }
    voice->restart();
    return true;
}

void SoundboardEngine::stop(const int index)
{
    if (!looptune::SoundboardSlots::IsValidIndex(index)) {
        return;
    }
    const juce::SpinLock::ScopedLockType lock(voicesLock_);
    if (auto& voice = voices_[static_cast<std::size_t>(index)]) {
        voice->halt();
    }
}

void SoundboardEngine::stopAll()
{
    for (int i = 0; i < looptune::SoundboardSlots::kNumSlots; ++i) {
        stop(i);
    }
}

bool SoundboardEngine::remove(const int index)
{
    if (!looptune::SoundboardSlots::IsValidIndex(index)) {
        return false;
    }

    std::shared_ptr<SampleVoice> voice;
    {
        const juce::SpinLock::ScopedLockType lock(voicesLock_);
        voice = std::move(voices_[static_cast<std::size_t>(index)]);
    }
    if (voice != nullptr) {
        voice->halt();
    }

    const auto removed = slots_.Clear(index);
    if (!removed.has_value()) {
        return false;
    }
    deleteBackingFile(*removed);
    juce::Logger::writeToLog("[looptune-core] Pad " + juce::String(index + 1) + " cleared");
    return true;
}

bool SoundboardEngine::toggleEditMode()
{
    return slots_.ToggleEditMode();
}

looptune::SlotTapAction SoundboardEngine::tap(const int index)
{
    const auto action = slots_.ActionForTap(index);
    switch (action) {
        case looptune::SlotTapAction::kPlay:
            play(index);
            break;
        case looptune::SlotTapAction::kRemove:
            remove(index);
            break;
        case looptune::SlotTapAction::kNone:
            break;
    }
    return action;
}

bool SoundboardEngine::isVoiceActive(const int index) const
{
    if (!looptune::SoundboardSlots::IsValidIndex(index)) {
        return false;
    }
    const juce::SpinLock::ScopedLockType lock(voicesLock_);
    const auto& voice = voices_[static_cast<std::size_t>(index)];
    return voice != nullptr && voice->isActive();
}

void SoundboardEngine::render(float* const* output,
                              const int numChannels,
                              const int numSamples,
                              const double deviceSampleRate) noexcept
{
    const juce::SpinLock::ScopedTryLockType lock(voicesLock_);
    if (!lock.isLocked()) {
        return;
    }
    for (auto& voice : voices_) {
        if (voice != nullptr) {
            voice->renderAdd(output, numChannels, numSamples, deviceSampleRate);
        }
    }
}
