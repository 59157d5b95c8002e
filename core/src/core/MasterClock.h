#pragma once

#include <optional>

namespace looptune {

// Holds the single authoritative loop duration. Set once by the first
// loop that enters an empty collection and kept immutable until the
// collection becomes empty again.
class MasterClock {
 public:
  MasterClock() = default;

  [[nodiscard]] std::optional<double> current_duration() const
  {
    return duration_seconds_;
  }

  [[nodiscard]] bool is_set() const { return duration_seconds_.has_value(); }

  // Sets the duration when none is set yet. Returns true when the
  // value changed; a non-positive duration is rejected.
  bool Establish(double duration_seconds);

  void Reset();

 private:
  std::optional<double> duration_seconds_;
};

}  // namespace looptune
