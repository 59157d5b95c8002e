#include "core/StorageNaming.h"

namespace looptune {

namespace {

std::string WithExtension(std::string base, const std::string& extension)
{
  if (extension.empty()) {
    return base;
  }
  if (extension.front() != '.') {
    base += '.';
  }
  base += extension;
  return base;
}

}  // namespace

std::string MakeLoopFileName(const std::string& uuid,
                             const std::int64_t epoch_millis,
                             const std::string& extension)
{
  std::string base = kLoopFilePrefix;
  base += uuid;
  base += '_';
  base += std::to_string(epoch_millis);
  return WithExtension(std::move(base), extension);
}

std::string MakePadRecordingFileName(const std::string& uuid,
                                     const std::string& extension)
{
  return WithExtension(uuid, extension);
}

std::string MakeImportFileName(const std::string& uuid,
                               const std::string& original_name)
{
  return uuid + "_" + SanitiseFileName(original_name);
}

std::string SanitiseFileName(const std::string& name)
{
  std::string result;
  result.reserve(name.size());

  for (const char ch : name) {
    const auto uch = static_cast<unsigned char>(ch);
    if (ch == '/' || ch == '\\' || ch == ':' || uch < 0x20U || uch == 0x7FU) {
      result += '_';
    } else {
      result += ch;
    }
  }

  // A bare "." or ".." would resolve outside the file itself.
  if (result.empty() || result == "." || result == "..") {
    return "sound";
  }
  return result;
}

bool IsLoopFileName(const std::string& file_name)
{
  return file_name.rfind(kLoopFilePrefix, 0) == 0;
}

}  // namespace looptune
