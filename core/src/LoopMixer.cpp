#include "LoopMixer.h"

#include <algorithm>
#include <utility>

LoopMixer::LoopMixer() = default;

LoopMixer::~LoopMixer()
{
    stopAll();
}

const looptune::Loop* LoopMixer::findLoop(const looptune::LoopId& id) const
{
    const auto it = std::find_if(loops_.begin(), loops_.end(),
                                 [&id](const looptune::Loop& loop) { return loop.id() == id; });
    return it != loops_.end() ? &*it : nullptr;
}

looptune::Loop* LoopMixer::findMutableLoop(const looptune::LoopId& id)
{
    const auto it = std::find_if(loops_.begin(), loops_.end(),
                                 [&id](const looptune::Loop& loop) { return loop.id() == id; });
    return it != loops_.end() ? &*it : nullptr;
}

float LoopMixer::getEffectiveVolume(const looptune::LoopId& id) const
{
    const auto* loop = findLoop(id);
    if (loop == nullptr) {
        return 0.0F;
    }
    return mixState_.EffectiveVolume(id, loop->volume());
}

std::optional<float> LoopMixer::getPlayerGain(const looptune::LoopId& id) const
{
    const juce::SpinLock::ScopedLockType lock(playersLock_);
    const auto it = players_.find(id);
    if (it == players_.end()) {
        return std::nullopt;
    }
    return it->second.voice->getGain();
}

bool LoopMixer::isActive(const looptune::LoopId& id) const
{
    const juce::SpinLock::ScopedLockType lock(playersLock_);
    return players_.find(id) != players_.end();
}

const looptune::Loop& LoopMixer::addLoop(looptune::LoopId id,
                                         const juce::File& file,
                                         std::shared_ptr<const DecodedSample> sample,
                                         const float volume)
{
    const double duration = sample != nullptr ? sample->getDurationSeconds() : 0.0;

    if (loops_.empty() && masterClock_.Establish(duration)) {
        juce::Logger::writeToLog("[looptune-core] Master loop duration set to " +
                                 juce::String(duration, 3) + " s");
    }

    if (sample != nullptr) {
        samples_[id] = std::move(sample);
    }

    loops_.emplace_back(std::move(id), file.getFullPathName().toStdString(), duration, volume);
    juce::Logger::writeToLog("[looptune-core] Loop added: " + juce::String(loops_.back().id()) +
                             " (" + juce::String(duration, 3) + " s)");
    return loops_.back();
}

void LoopMixer::restoreLoop(looptune::Loop loop)
{
    loop.set_playing(false);
    loops_.push_back(std::move(loop));
}

void LoopMixer::restoreMasterDuration(const double seconds)
{
    masterClock_.Reset();
    masterClock_.Establish(seconds);
}

std::shared_ptr<const DecodedSample> LoopMixer::sampleFor(const looptune::Loop& loop)
{
    const auto it = samples_.find(loop.id());
    if (it != samples_.end()) {
        return it->second;
    }

    juce::String error;
    auto sample = loader_.load(juce::File(loop.path()), &error);
    if (sample == nullptr) {
        reportError(looptune::EngineErrorKind::kPlayback,
                    "Cannot decode loop " + loop.id() + ": " + error.toStdString());
        return nullptr;
    }

    samples_[loop.id()] = sample;
    return sample;
}

looptune::PlaybackHandle LoopMixer::play(const looptune::LoopId& id,
                                         const bool indefinite,
                                         std::function<void()> onFinish)
{
    auto* loop = findMutableLoop(id);
    if (loop == nullptr) {
        juce::Logger::writeToLog("[looptune-core] play: unknown loop " + juce::String(id));
        return looptune::PlaybackHandle::Failed();
    }

    {
        const juce::SpinLock::ScopedLockType lock(playersLock_);
        const auto it = players_.find(id);
        if (it != players_.end() && !it->second.voice->hasFinished()) {
            // Resume the running instance; the handle stays the same.
            if (indefinite) {
                it->second.voice->setLooping(true);
                it->second.onFinish = nullptr;
            }
            loop->set_playing(true);
            return it->second.completion->handle();
        }
    }

    auto sample = sampleFor(*loop);
    if (sample == nullptr) {
        return looptune::PlaybackHandle::Failed();
    }

    ActivePlayer player;
    player.voice = std::make_shared<SampleVoice>(std::move(sample), indefinite, true);
    player.voice->setGain(mixState_.EffectiveVolume(id, loop->volume()));
    player.completion = std::make_shared<looptune::PlaybackCompletion>();
    if (!indefinite) {
        player.onFinish = std::move(onFinish);
    }
    auto handle = player.completion->handle();

    // A finished instance that was not dispatched yet is replaced.
    auto previous = detachPlayer(id);
    if (previous.has_value()) {
        previous->completion->Resolve(looptune::PlaybackEvent::kFinished);
    }

    {
        const juce::SpinLock::ScopedLockType lock(playersLock_);
        players_[id] = std::move(player);
    }

    loop->set_playing(true);
    return handle;
}

std::optional<LoopMixer::ActivePlayer> LoopMixer::detachPlayer(const looptune::LoopId& id)
{
    const juce::SpinLock::ScopedLockType lock(playersLock_);
    const auto it = players_.find(id);
    if (it == players_.end()) {
        return std::nullopt;
    }
    ActivePlayer player = std::move(it->second);
    players_.erase(it);
    player.voice->halt();
    return player;
}

void LoopMixer::stop(const looptune::LoopId& id)
{
    auto player = detachPlayer(id);
    if (player.has_value()) {
        player->completion->Resolve(looptune::PlaybackEvent::kStopped);
    }

    if (auto* loop = findMutableLoop(id)) {
        loop->set_playing(false);
    }

    const juce::SpinLock::ScopedLockType lock(playersLock_);
    if (players_.empty()) {
        playing_ = false;
    }
}

void LoopMixer::stopAll()
{
    std::map<looptune::LoopId, ActivePlayer> stopped;
    {
        const juce::SpinLock::ScopedLockType lock(playersLock_);
        stopped.swap(players_);
    }

    for (auto& [id, player] : stopped) {
        player.voice->halt();
        player.completion->Resolve(looptune::PlaybackEvent::kStopped);
    }

    for (auto& loop : loops_) {
        loop.set_playing(false);
    }
    playing_ = false;
}

bool LoopMixer::playAll()
{
    if (!masterClock_.is_set()) {
        juce::Logger::writeToLog("[looptune-core] playAll ignored: no master loop duration");
        return false;
    }

    for (const auto& loop : loops_) {
        // The handle is not needed: indefinite playback ends by stop only.
        const auto handle = play(loop.id(), true);
        juce::ignoreUnused(handle);
    }
    playing_ = true;
    return true;
}

void LoopMixer::setVolume(const looptune::LoopId& id, const float volume)
{
    auto* loop = findMutableLoop(id);
    if (loop == nullptr) {
        return;
    }
    loop->set_volume(volume);
    applyEffectiveVolumes();
}

bool LoopMixer::toggleMute(const looptune::LoopId& id)
{
    if (findLoop(id) == nullptr) {
        return false;
    }
    const bool muted = mixState_.ToggleMute(id);
    applyEffectiveVolumes();
    return muted;
}

bool LoopMixer::toggleSolo(const looptune::LoopId& id)
{
    if (findLoop(id) == nullptr) {
        return false;
    }
    const bool soloed = mixState_.ToggleSolo(id);
    applyEffectiveVolumes();
    return soloed;
}

void LoopMixer::applyEffectiveVolumes()
{
    const juce::SpinLock::ScopedLockType lock(playersLock_);
    for (auto& [id, player] : players_) {
        const auto* loop = findLoop(id);
        const float stored = loop != nullptr ? loop->volume() : 0.0F;
        player.voice->setGain(mixState_.EffectiveVolume(id, stored));
    }
}

bool LoopMixer::deleteLoop(const looptune::LoopId& id)
{
    const auto it = std::find_if(loops_.begin(), loops_.end(),
                                 [&id](const looptune::Loop& loop) { return loop.id() == id; });
    if (it == loops_.end()) {
        return false;
    }

    stop(id);

    const juce::File file(it->path());
    if (file.existsAsFile() && !file.deleteFile()) {
        juce::Logger::writeToLog("[looptune-core] Could not delete " + file.getFullPathName());
    }

    loops_.erase(it);
    samples_.erase(id);
    mixState_.Forget(id);
    applyEffectiveVolumes();

    if (loops_.empty()) {
        masterClock_.Reset();
        playing_ = false;
        juce::Logger::writeToLog("[looptune-core] Last loop deleted, master duration cleared");
    }
    return true;
}

void LoopMixer::dispatchPendingCompletions()
{
    completionsPending_.store(false, std::memory_order_release);

    std::vector<std::pair<looptune::LoopId, ActivePlayer>> finished;
    {
        const juce::SpinLock::ScopedLockType lock(playersLock_);
        for (auto it = players_.begin(); it != players_.end();) {
            if (it->second.voice->hasFinished()) {
                finished.emplace_back(it->first, std::move(it->second));
                it = players_.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (auto& [id, player] : finished) {
        if (auto* loop = findMutableLoop(id)) {
            loop->set_playing(false);
        }
        if (player.completion->Resolve(looptune::PlaybackEvent::kFinished) && player.onFinish) {
            player.onFinish();
        }
    }
}

void LoopMixer::render(float* const* output,
                       const int numChannels,
                       const int numSamples,
                       const double deviceSampleRate) noexcept
{
    const juce::SpinLock::ScopedTryLockType lock(playersLock_);
    if (!lock.isLocked()) {
        return;
    }

    bool anyFinished = false;
    for (auto& entry : players_) {
        auto& voice = *entry.second.voice;
        const bool wasFinished = voice.hasFinished();
        voice.renderAdd(output, numChannels, numSamples, deviceSampleRate);
        if (!wasFinished && voice.hasFinished()) {
            anyFinished = true;
        }
    }

    if (anyFinished) {
        completionsPending_.store(true, std::memory_order_release);
    }
}

bool LoopMixer::hasPendingCompletions() const noexcept
{
    return completionsPending_.load(std::memory_order_acquire);
}

void LoopMixer::reportError(const looptune::EngineErrorKind kind, const std::string& message)
{
    const looptune::EngineError error{kind, message};
    if (onError) {
        onError(error);
    } else {
        juce::Logger::writeToLog("[looptune-core] " + juce::String(looptune::Describe(error)));
    }
}
