#include "core/AudioPort.h"

#include <algorithm>
#include <cctype>
#include <initializer_list>

namespace looptune {

namespace {

std::string ToLower(std::string value)
{
  for (char& ch : value) {
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  }
  return value;
}

bool ContainsAny(const std::string& haystack,
                 std::initializer_list<const char*> needles)
{
  return std::any_of(needles.begin(), needles.end(),
                     [&haystack](const char* needle) {
                       return haystack.find(needle) != std::string::npos;
                     });
}

}  // namespace

bool SamePort(const AudioPortDescriptor& a, const AudioPortDescriptor& b)
{
  return a.direction == b.direction && a.name == b.name;
}

const char* ToString(const RouteChangeReason reason)
{
  switch (reason) {
    case RouteChangeReason::kUnknown:
      return "unknown";
    case RouteChangeReason::kNewDeviceAvailable:
      return "newDeviceAvailable";
    case RouteChangeReason::kOldDeviceUnavailable:
      return "oldDeviceUnavailable";
    case RouteChangeReason::kCategoryChange:
      return "categoryChange";
    case RouteChangeReason::kOverride:
      return "override";
    case RouteChangeReason::kConfigurationChange:
      return "routeConfigurationChange";
  }
  return "unknown";
}

bool ContainsPort(const std::vector<AudioPortDescriptor>& ports,
                  const AudioPortDescriptor& port)
{
  return std::any_of(ports.begin(), ports.end(),
                     [&port](const AudioPortDescriptor& candidate) {
                       return SamePort(candidate, port);
                     });
}

RouteChangeReason InferRouteChangeReason(const AudioRouteSnapshot& before,
                                         const AudioRouteSnapshot& after)
{
  const auto anyMissing = [](const std::vector<AudioPortDescriptor>& from,
                             const std::vector<AudioPortDescriptor>& to) {
    return std::any_of(from.begin(), from.end(),
                       [&to](const AudioPortDescriptor& port) {
                         return !ContainsPort(to, port);
                       });
  };

  if (anyMissing(before.inputs, after.inputs) ||
      anyMissing(before.outputs, after.outputs)) {
    return RouteChangeReason::kOldDeviceUnavailable;
  }
  if (anyMissing(after.inputs, before.inputs) ||
      anyMissing(after.outputs, before.outputs)) {
    return RouteChangeReason::kNewDeviceAvailable;
  }

  const auto sameCurrent =
      [](const std::optional<AudioPortDescriptor>& a,
         const std::optional<AudioPortDescriptor>& b) {
        if (a.has_value() != b.has_value()) {
          return false;
        }
        return !a.has_value() || SamePort(*a, *b);
      };

  if (!sameCurrent(before.current_input, after.current_input) ||
      !sameCurrent(before.current_output, after.current_output)) {
    return RouteChangeReason::kOverride;
  }
  return RouteChangeReason::kConfigurationChange;
}

OutputRouting RoutingForPort(const AudioPortDescriptor& port)
{
  return port.type == PortType::kBluetoothA2dp
             ? OutputRouting::kAllowBluetoothA2dp
             : OutputRouting::kDefaultToSpeaker;
}

std::optional<AudioPortDescriptor> ReconcileSelection(
    const std::optional<AudioPortDescriptor>& previous,
    const std::vector<AudioPortDescriptor>& available,
    const std::optional<AudioPortDescriptor>& route_default,
    bool* const kept)
{
  if (previous.has_value()) {
    const auto it = std::find_if(
        available.begin(), available.end(),
        [&previous](const AudioPortDescriptor& candidate) {
          return SamePort(candidate, *previous);
        });
    if (it != available.end()) {
      if (kept != nullptr) {
        *kept = true;
      }
      // Refresh uid/type from the new enumeration but keep the port.
      return *it;
    }
  }

  if (kept != nullptr) {
    *kept = false;
  }
  return route_default;
}

PortType GuessPortType(const std::string& device_name,
                       const PortDirection direction)
{
  const std::string name = ToLower(device_name);
  const bool input = direction == PortDirection::kInput;

  if (ContainsAny(name, {"bluez", "bluetooth", "a2dp", "airpods"})) {
    if (ContainsAny(name, {"hfp", "hsp", "headset_head_unit", "handsfree"})) {
      return PortType::kBluetoothHfp;
    }
    return input ? PortType::kBluetoothHfp : PortType::kBluetoothA2dp;
  }
  if (ContainsAny(name, {"usb"})) {
    return PortType::kUsb;
  }
  if (ContainsAny(name, {"headphone", "headset"})) {
    return input ? PortType::kBuiltInMic : PortType::kHeadphones;
  }
  if (ContainsAny(name, {"line"})) {
    return input ? PortType::kLineIn : PortType::kLineOut;
  }
  if (ContainsAny(name, {"mic", "capture"})) {
    return PortType::kBuiltInMic;
  }
  if (ContainsAny(name, {"speaker", "analog", "built-in", "internal",
                         "default"})) {
    return input ? PortType::kBuiltInMic : PortType::kBuiltInSpeaker;
  }
  return PortType::kOther;
}

}  // namespace looptune
