#pragma once

#include <optional>
#include <string>
#include <vector>

#include "core/AudioPort.h"
#include "core/Loop.h"

namespace looptune {

// Read-only view of the engine handed to the presentation layer. A
// snapshot is a copy: it never changes after it has been taken.

struct LoopView {
  LoopId id;
  std::string path;
  double duration_seconds{0.0};
  float volume{1.0F};
  float effective_volume{1.0F};
  bool playing{false};
  bool muted{false};
  bool soloed{false};
};

struct SlotView {
  int index{0};
  std::string title;
  std::optional<std::string> sound_path;
  bool assigned{false};
};

struct EngineSnapshot {
  // True from startRecording() until the recorded file is finalised.
  bool recording{false};
  // The writer is armed and device input is being written.
  bool capturing{false};
  bool finalising{false};
  bool playing{false};
  // The device offered no input channel on the last record attempt.
  bool record_denied{false};
  bool auto_stop_armed{false};
  std::optional<int> recording_slot;

  std::optional<double> master_duration_seconds;
  std::vector<LoopView> loops;

  std::vector<SlotView> slots;
  bool edit_mode{false};

  AudioRouteSnapshot route;
  std::optional<AudioPortDescriptor> selected_input;
  std::optional<AudioPortDescriptor> selected_output;
};

}  // namespace looptune
