#include "AutoStopTimer.h"

#include <utility>

AutoStopTimer::AutoStopTimer(Poster post)
    : post_(std::move(post)),
      pendingShot_(std::make_shared<std::atomic<juce::uint64>>(0))
{
}

AutoStopTimer::~AutoStopTimer()
{
    stopTimer();
    pendingShot_->store(0);
}

void AutoStopTimer::arm(const int delayMs, Task onExpired)
{
    // Blocks until a running callback has returned, so onExpired_ is
    // not read while it is replaced.
    stopTimer();

    onExpired_ = std::move(onExpired);
    pendingShot_->store(++lastShot_);
    startTimer(juce::jmax(1, delayMs));
}

bool AutoStopTimer::cancel()
{
    stopTimer();
    return pendingShot_->exchange(0) != 0;
}

bool AutoStopTimer::isArmed() const noexcept
{
    return pendingShot_->load() != 0;
}

void AutoStopTimer::hiResTimerCallback()
{
    stopTimer();

    const auto shot = pendingShot_->load();
    if (shot == 0) {
        return;
    }

    post_([pending = pendingShot_, shot, onExpired = onExpired_] {
        auto expected = shot;
        if (pending->compare_exchange_strong(expected, 0) && onExpired) {
            onExpired();
        }
    });
}
