#pragma once

#include <string>

namespace looptune {

using LoopId = std::string;

// A recorded clip managed by the loop mixer. The duration is the one
// measured on the decoded file when the loop was validated and never
// changes afterwards.
class Loop {
 public:
  Loop() = default;
  Loop(LoopId id, std::string path, double duration_seconds,
       float volume = 1.0F);

  [[nodiscard]] const LoopId& id() const { return id_; }
  [[nodiscard]] const std::string& path() const { return path_; }
  [[nodiscard]] double duration_seconds() const { return duration_seconds_; }
  [[nodiscard]] float volume() const { return volume_; }
  [[nodiscard]] bool playing() const { return playing_; }

  // Stored level in [0,1]; values outside the range are clamped.
  void set_volume(float volume);
  void set_playing(bool playing);

 private:
  LoopId id_;
  std::string path_;
  double duration_seconds_{0.0};
  float volume_{1.0F};
  bool playing_{false};
};

[[nodiscard]] float ClampVolume(float volume);

}  // namespace looptune
