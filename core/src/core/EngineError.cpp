#include "core/EngineError.h"

namespace looptune {

const char* ToString(const EngineErrorKind kind)
{
  switch (kind) {
    case EngineErrorKind::kSessionActivation:
      return "SessionActivationError";
    case EngineErrorKind::kRecordingIo:
      return "RecordingIOError";
    case EngineErrorKind::kValidation:
      return "ValidationError";
    case EngineErrorKind::kImportCopy:
      return "ImportCopyError";
    case EngineErrorKind::kPlayback:
      return "PlaybackError";
    case EngineErrorKind::kRouteChangeInconsistency:
      return "RouteChangeInconsistency";
  }
  return "UnknownError";
}

std::string Describe(const EngineError& error)
{
  std::string text = ToString(error.kind);
  if (!error.message.empty()) {
    text += ": ";
    text += error.message;
  }
  return text;
}

}  // namespace looptune
