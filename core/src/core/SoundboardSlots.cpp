#include "core/SoundboardSlots.h"

namespace looptune {

namespace {

const SoundSlot kInvalidSlot{};

}  // namespace

const SoundSlot& SoundboardSlots::slot(const int index) const
{
  if (!IsValidIndex(index)) {
    return kInvalidSlot;
  }
  return slots_[static_cast<std::size_t>(index)];
}

bool SoundboardSlots::ToggleEditMode()
{
  edit_mode_ = !edit_mode_;
  return edit_mode_;
}

std::optional<std::string> SoundboardSlots::Assign(const int index,
                                                   std::string path,
                                                   std::string title)
{
  if (!IsValidIndex(index)) {
    return std::nullopt;
  }

  auto& target = slots_[static_cast<std::size_t>(index)];
  std::optional<std::string> previous = std::move(target.sound_path);
  target.sound_path = std::move(path);
  target.title = std::move(title);

  if (previous.has_value() && *previous == *target.sound_path) {
    return std::nullopt;
  }
  return previous;
}

std::optional<std::string> SoundboardSlots::Clear(const int index)
{
  if (!IsValidIndex(index)) {
    return std::nullopt;
  }

  auto& target = slots_[static_cast<std::size_t>(index)];
  std::optional<std::string> previous = std::move(target.sound_path);
  target = SoundSlot{};
  return previous;
}

SlotTapAction SoundboardSlots::ActionForTap(const int index) const
{
  if (!IsValidIndex(index) || !slot(index).assigned()) {
    return SlotTapAction::kNone;
  }
  return edit_mode_ ? SlotTapAction::kRemove : SlotTapAction::kPlay;
}

std::string SoundboardSlots::RecordingTitle(const int index)
{
  return "Recording " + std::to_string(index + 1);
}

}  // namespace looptune
