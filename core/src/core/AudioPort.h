#pragma once

#include <optional>
#include <string>
#include <vector>

namespace looptune {

enum class PortDirection {
  kInput = 0,
  kOutput,
};

enum class PortType {
  kBuiltInMic = 0,
  kBuiltInSpeaker,
  kHeadphones,
  kBluetoothA2dp,
  kBluetoothHfp,
  kUsb,
  kLineIn,
  kLineOut,
  kOther,
};

// Describes one hardware endpoint as reported by the audio backend.
// Ports are compared by name, which is the only identity that stays
// stable across device re-enumeration.
struct AudioPortDescriptor {
  std::string name;
  std::string uid;
  PortType type{PortType::kOther};
  PortDirection direction{PortDirection::kOutput};
};

[[nodiscard]] bool SamePort(const AudioPortDescriptor& a,
                            const AudioPortDescriptor& b);

// Live state of the audio route: every port currently offered and the
// port the backend is actually using in each direction.
struct AudioRouteSnapshot {
  std::vector<AudioPortDescriptor> inputs;
  std::vector<AudioPortDescriptor> outputs;
  std::optional<AudioPortDescriptor> current_input;
  std::optional<AudioPortDescriptor> current_output;
};

enum class RouteChangeReason {
  kUnknown = 0,
  kNewDeviceAvailable,
  kOldDeviceUnavailable,
  kCategoryChange,
  kOverride,
  kConfigurationChange,
};

[[nodiscard]] const char* ToString(RouteChangeReason reason);

// Derives the reason of a route change by comparing the port lists
// before and after the notification.
[[nodiscard]] RouteChangeReason InferRouteChangeReason(
    const AudioRouteSnapshot& before, const AudioRouteSnapshot& after);

// Output routing options applied when the user picks an output port:
// bluetooth A2DP ports need the category to allow A2DP, everything
// else is routed with the speaker as default.
enum class OutputRouting {
  kDefaultToSpeaker = 0,
  kAllowBluetoothA2dp,
};

[[nodiscard]] OutputRouting RoutingForPort(const AudioPortDescriptor& port);

[[nodiscard]] bool ContainsPort(const std::vector<AudioPortDescriptor>& ports,
                                const AudioPortDescriptor& port);

// Selection after a route change: the previous selection is kept when a
// port with the same name is still available, otherwise the new
// route's current port is used. `kept` reports which branch was taken.
[[nodiscard]] std::optional<AudioPortDescriptor> ReconcileSelection(
    const std::optional<AudioPortDescriptor>& previous,
    const std::vector<AudioPortDescriptor>& available,
    const std::optional<AudioPortDescriptor>& route_default,
    bool* kept = nullptr);

// Best-effort classification of a device name reported by a desktop
// backend (ALSA, JACK, PulseAudio...). Unknown names map to kOther.
[[nodiscard]] PortType GuessPortType(const std::string& device_name,
                                     PortDirection direction);

}  // namespace looptune
