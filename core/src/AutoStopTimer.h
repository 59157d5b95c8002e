#pragma once

#include <atomic>
#include <functional>
#include <memory>

#include <juce_core/juce_core.h>

// One-shot countdown behind the recording auto-stop.
//
// The delay runs on a juce::HighResolutionTimer thread. On expiry the
// callback is handed to the poster, which delivers it on the engine
// thread. It runs at most once, and never after cancel() or a newer
// arm() on the engine thread, even when it was already posted.
class AutoStopTimer : private juce::HighResolutionTimer {
public:
    using Task = std::function<void()>;
    using Poster = std::function<void(Task)>;

    explicit AutoStopTimer(Poster post);
    ~AutoStopTimer() override;

    // Starts a new countdown, replacing the pending one.
    void arm(int delayMs, Task onExpired);

    // Returns true when a callback was still due and now never runs.
    bool cancel();

    // True while a countdown is pending or its callback is posted but
    // not yet delivered.
    [[nodiscard]] bool isArmed() const noexcept;

private:
    void hiResTimerCallback() override;

    Poster post_;
    Task onExpired_;
    juce::uint64 lastShot_{0};
    // Shot allowed to deliver, 0 for none. Shared with posted closures.
    std::shared_ptr<std::atomic<juce::uint64>> pendingShot_;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(AutoStopTimer)
};
