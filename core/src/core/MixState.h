#pragma once

#include <optional>
#include <unordered_set>

#include "core/Loop.h"

namespace looptune {

// Mute set and solo target of the loop mixer. Stored volumes live in
// the Loop entities; this class only answers what level a loop must
// actually be played at.
//
// Effective level law (mute dominates solo):
//   muted                      -> 0
//   another loop is soloed     -> 0
//   otherwise                  -> stored volume
class MixState {
 public:
  MixState() = default;

  [[nodiscard]] bool is_muted(const LoopId& id) const;
  [[nodiscard]] bool is_soloed(const LoopId& id) const;
  [[nodiscard]] const std::optional<LoopId>& solo_target() const
  {
    return solo_target_;
  }
  [[nodiscard]] const std::unordered_set<LoopId>& muted() const
  {
    return muted_;
  }

  // Toggles membership in the mute set. Returns the new muted state.
  bool ToggleMute(const LoopId& id);

  // Toggles the solo target: soloing the current target clears it,
  // soloing any other loop moves the target. Returns true when `id`
  // is the solo target afterwards.
  bool ToggleSolo(const LoopId& id);

  // Drops any mute/solo state held for a deleted loop.
  void Forget(const LoopId& id);

  [[nodiscard]] float EffectiveVolume(const LoopId& id,
                                      float stored_volume) const;

 private:
  std::unordered_set<LoopId> muted_;
  std::optional<LoopId> solo_target_;
};

}  // namespace looptune
