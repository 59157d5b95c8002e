#pragma once

#include <future>
#include <mutex>
#include <optional>

namespace looptune {

// Terminal event of one playback instance.
enum class PlaybackEvent {
  kFinished = 0,  // Reached the end naturally.
  kStopped,       // Stopped, deleted or cleared by stop-all.
  kFailed,        // The player could not be built.
};

[[nodiscard]] const char* ToString(PlaybackEvent event);

// Read side of a playback instance. Copies share the same state; the
// handle resolves exactly once.
class PlaybackHandle {
 public:
  PlaybackHandle() = default;
  explicit PlaybackHandle(std::shared_future<PlaybackEvent> future);

  // A handle that is already resolved with kFailed.
  [[nodiscard]] static PlaybackHandle Failed();

  [[nodiscard]] bool valid() const { return future_.valid(); }
  [[nodiscard]] bool resolved() const;

  // Terminal event when resolved, nothing otherwise. Never blocks.
  [[nodiscard]] std::optional<PlaybackEvent> TryGet() const;

  // Blocks until the instance ends. Must not be called on the thread
  // that delivers the events.
  [[nodiscard]] PlaybackEvent Wait() const;

 private:
  std::shared_future<PlaybackEvent> future_;
};

// Write side kept by the mixer. The first Resolve() wins, later calls
// are ignored so that a stop racing a natural end still produces a
// single terminal event.
class PlaybackCompletion {
 public:
  PlaybackCompletion();

  PlaybackCompletion(const PlaybackCompletion&) = delete;
  PlaybackCompletion& operator=(const PlaybackCompletion&) = delete;

  [[nodiscard]] PlaybackHandle handle() const { return handle_; }
  [[nodiscard]] bool resolved() const;

  // Returns true when this call resolved the handle.
  bool Resolve(PlaybackEvent event);

 private:
  mutable std::mutex mutex_;
  std::promise<PlaybackEvent> promise_;
  PlaybackHandle handle_;
  bool resolved_{false};
};

}  // namespace looptune
