#include "core/Loop.h"

#include <algorithm>
#include <cmath>

namespace looptune {

float ClampVolume(const float volume)
{
  if (std::isnan(volume)) {
    return 0.0F;
  }
  return std::clamp(volume, 0.0F, 1.0F);
}

Loop::Loop(LoopId id, std::string path, const double duration_seconds,
           const float volume)
    : id_(std::move(id)),
      path_(std::move(path)),
      duration_seconds_(duration_seconds),
      volume_(ClampVolume(volume)) {}

void Loop::set_volume(const float volume)
{
  volume_ = ClampVolume(volume);
}

void Loop::set_playing(const bool playing)
{
  playing_ = playing;
}

}  // namespace looptune
