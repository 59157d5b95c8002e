#pragma once

#include <string>

namespace looptune {

// Failure categories reported by the engine. None of them is fatal:
// the engine logs the error, resets the affected state and lets the
// user retry.
enum class EngineErrorKind {
  kSessionActivation = 0,
  kRecordingIo,
  kValidation,
  kImportCopy,
  kPlayback,
  kRouteChangeInconsistency,
};

struct EngineError {
  EngineErrorKind kind{EngineErrorKind::kRecordingIo};
  std::string message;
};

[[nodiscard]] const char* ToString(EngineErrorKind kind);

// "<Kind>: <message>", used for log lines and listener payloads.
[[nodiscard]] std::string Describe(const EngineError& error);

}  // namespace looptune
