#include "core/MixState.h"

namespace looptune {

bool MixState::is_muted(const LoopId& id) const
{
  return muted_.find(id) != muted_.end();
}

bool MixState::is_soloed(const LoopId& id) const
{
  return solo_target_.has_value() && *solo_target_ == id;
}

bool MixState::ToggleMute(const LoopId& id)
{
  const auto it = muted_.find(id);
  if (it != muted_.end()) {
    muted_.erase(it);
    return false;
  }
  muted_.insert(id);
  return true;
}

bool MixState::ToggleSolo(const LoopId& id)
{
  if (is_soloed(id)) {
    solo_target_.reset();
    return false;
  }
  solo_target_ = id;
  return true;
}

void MixState::Forget(const LoopId& id)
{
  muted_.erase(id);
  if (is_soloed(id)) {
    solo_target_.reset();
  }
}

float MixState::EffectiveVolume(const LoopId& id,
                                const float stored_volume) const
{
  if (is_muted(id)) {
    return 0.0F;
  }
  if (solo_target_.has_value() && *solo_target_ != id) {
    return 0.0F;
  }
  return ClampVolume(stored_volume);
}

}  // namespace looptune
