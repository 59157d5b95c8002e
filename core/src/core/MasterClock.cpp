#include "core/MasterClock.h"

namespace looptune {

bool MasterClock::Establish(const double duration_seconds)
{
  if (duration_seconds_.has_value() || !(duration_seconds > 0.0)) {
    return false;
  }
  duration_seconds_ = duration_seconds;
  return true;
}

void MasterClock::Reset()
{
  duration_seconds_.reset();
}

}  // namespace looptune
