#pragma once

#include <cstdint>
#include <string>

namespace looptune {

// File naming for the shared storage directory. Every writer includes a
// freshly generated unique id so that loops, pad recordings and imports
// never collide, whatever else lives in the directory.
//
//   loop_<uuid>_<epochMillis>.<ext>   loop recordings
//   <uuid>.<ext>                      soundboard recordings
//   <uuid>_<original file name>       imported soundboard files

inline constexpr const char* kLoopFilePrefix = "loop_";
inline constexpr const char* kManifestFileName = "session.looptune";

[[nodiscard]] std::string MakeLoopFileName(const std::string& uuid,
                                           std::int64_t epoch_millis,
                                           const std::string& extension);

[[nodiscard]] std::string MakePadRecordingFileName(
    const std::string& uuid, const std::string& extension);

[[nodiscard]] std::string MakeImportFileName(const std::string& uuid,
                                             const std::string& original_name);

// Keeps the original name readable while removing path separators and
// control characters. An empty result becomes "sound".
[[nodiscard]] std::string SanitiseFileName(const std::string& name);

[[nodiscard]] bool IsLoopFileName(const std::string& file_name);

}  // namespace looptune
