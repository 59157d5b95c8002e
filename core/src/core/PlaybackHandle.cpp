#include "core/PlaybackHandle.h"

#include <chrono>
#include <utility>

namespace looptune {

const char* ToString(const PlaybackEvent event)
{
  switch (event) {
    case PlaybackEvent::kFinished:
      return "Finished";
    case PlaybackEvent::kStopped:
      return "Stopped";
    case PlaybackEvent::kFailed:
      return "Failed";
  }
  return "Unknown";
}

PlaybackHandle::PlaybackHandle(std::shared_future<PlaybackEvent> future)
    : future_(std::move(future))
{
}

PlaybackHandle PlaybackHandle::Failed()
{
  std::promise<PlaybackEvent> promise;
  promise.set_value(PlaybackEvent::kFailed);
  return PlaybackHandle(promise.get_future().share());
}

bool PlaybackHandle::resolved() const
{
  return future_.valid() && future_.wait_for(std::chrono::seconds(0)) ==
                                std::future_status::ready;
}

std::optional<PlaybackEvent> PlaybackHandle::TryGet() const
{
  if (!resolved()) {
    return std::nullopt;
  }
  return future_.get();
}

PlaybackEvent PlaybackHandle::Wait() const
{
  return future_.get();
}

PlaybackCompletion::PlaybackCompletion()
    : handle_(promise_.get_future().share())
{
}

bool PlaybackCompletion::resolved() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return resolved_;
}

bool PlaybackCompletion::Resolve(const PlaybackEvent event)
{
  std::lock_guard<std::mutex> lock(mutex_);
  if (resolved_) {
    return false;
  }
  resolved_ = true;
  promise_.set_value(event);
  return true;
}

}  // namespace looptune
