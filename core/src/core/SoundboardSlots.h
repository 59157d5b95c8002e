#pragma once

#include <array>
#include <optional>
#include <string>

namespace looptune {

// Model of one soundboard pad. The decoded audio lives in the engine;
// here a slot is either empty or points at a file in storage.
struct SoundSlot {
  std::optional<std::string> sound_path;
  std::string title{"Empty"};

  [[nodiscard]] bool assigned() const { return sound_path.has_value(); }
};

enum class SlotTapAction {
  kNone = 0,
  kPlay,
  kRemove,
};

// Fixed collection of eight pads plus the edit-mode toggle. The edit
// flag only changes what a tap on a pad does.
class SoundboardSlots {
 public:
  static constexpr int kNumSlots = 8;

  SoundboardSlots() = default;

  [[nodiscard]] static bool IsValidIndex(int index)
  {
    return index >= 0 && index < kNumSlots;
  }

  [[nodiscard]] const SoundSlot& slot(int index) const;
  [[nodiscard]] const std::array<SoundSlot, kNumSlots>& slots() const
  {
    return slots_;
  }

  [[nodiscard]] bool edit_mode() const { return edit_mode_; }
  bool ToggleEditMode();
  void set_edit_mode(bool edit_mode) { edit_mode_ = edit_mode; }

  // Assigns a file to a slot. Returns the path previously held by the
  // slot, if any, so the caller can delete the replaced file.
  std::optional<std::string> Assign(int index, std::string path,
                                    std::string title);

  // Resets a slot to empty and returns the path it held.
  std::optional<std::string> Clear(int index);

  // What a tap should do given the current edit mode and slot state.
  [[nodiscard]] SlotTapAction ActionForTap(int index) const;

  // Title given to pads filled from the microphone: "Recording N",
  // N being the 1-based pad number.
  [[nodiscard]] static std::string RecordingTitle(int index);

 private:
  std::array<SoundSlot, kNumSlots> slots_{};
  bool edit_mode_{false};
};

}  // namespace looptune
