#include "core/SessionManifest.h"

#include <exception>
#include <iomanip>
#include <limits>
#include <sstream>
#include <utility>

#include "core/Loop.h"
#include "core/SoundboardSlots.h"

namespace looptune {

namespace {

constexpr const char* kHeader = "looptune_session_v1";

std::vector<std::string> SplitFields(const std::string& line)
{
  std::vector<std::string> fields;
  std::string field;
  std::istringstream in(line);
  while (std::getline(in, field, '\t')) {
    fields.push_back(field);
  }
  return fields;
}

// Text fields may hold any character of a file name; tab, line breaks
// and the backslash itself are written as backslash escapes.
std::string EscapeField(const std::string& text)
{
  std::string escaped;
  escaped.reserve(text.size());
  for (const char c : text) {
    switch (c) {
      case '\\':
        escaped += "\\\\";
        break;
      case '\t':
        escaped += "\\t";
        break;
      case '\n':
        escaped += "\\n";
        break;
      case '\r':
        escaped += "\\r";
        break;
      default:
        escaped += c;
        break;
    }
  }
  return escaped;
}

bool UnescapeField(const std::string& text, std::string& out)
{
  std::string plain;
  plain.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (text[i] != '\\') {
      plain += text[i];
      continue;
    }
    if (++i == text.size()) {
      return false;
    }
    switch (text[i]) {
      case '\\':
        plain += '\\';
        break;
      case 't':
        plain += '\t';
        break;
      case 'n':
        plain += '\n';
        break;
      case 'r':
        plain += '\r';
        break;
      default:
        return false;
    }
  }
  out = std::move(plain);
  return true;
}

bool ParseDouble(const std::string& text, double& out)
{
  try {
    std::size_t consumed = 0;
    out = std::stod(text, &consumed);
    return consumed == text.size();
  } catch (const std::exception&) {
    return false;
  }
}

bool ParseInt(const std::string& text, int& out)
{
  try {
    std::size_t consumed = 0;
    out = std::stoi(text, &consumed);
    return consumed == text.size();
  } catch (const std::exception&) {
    return false;
  }
}

bool Fail(std::string* error, const std::string& message)
{
  if (error != nullptr) {
    *error = message;
  }
  return false;
}

}  // namespace

std::string SerializeManifest(const SessionManifest& manifest)
{
  std::ostringstream out;
  out << std::setprecision(std::numeric_limits<double>::max_digits10);

  out << kHeader << '\n';

  if (manifest.master_duration_seconds.has_value()) {
    out << "master\t" << *manifest.master_duration_seconds << '\n';
  }

  for (const auto& loop : manifest.loops) {
    out << "loop\t" << EscapeField(loop.id) << '\t' << loop.volume << '\t'
        << loop.duration_seconds << '\t' << EscapeField(loop.file_name)
        << '\n';
  }

  for (const auto& slot : manifest.slots) {
    out << "slot\t" << slot.index << '\t' << EscapeField(slot.file_name)
        << '\t' << EscapeField(slot.title) << '\n';
  }

  return out.str();
}

bool ParseManifest(const std::string& text, SessionManifest& out,
                   std::string* const error)
{
  SessionManifest parsed;
  std::istringstream in(text);
  std::string line;

  if (!std::getline(in, line)) {
    return Fail(error, "Missing looptune_session_v1 header");
  }
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
  if (line != kHeader) {
    return Fail(error, "Missing looptune_session_v1 header");
  }

  int lineNumber = 1;
  while (std::getline(in, line)) {
    ++lineNumber;
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty()) {
      continue;
    }

    const auto fields = SplitFields(line);
    const std::string& kind = fields.front();
    const std::string where = " at line " + std::to_string(lineNumber);

    if (kind == "master") {
      double seconds = 0.0;
      if (fields.size() != 2 || !ParseDouble(fields[1], seconds) ||
          !(seconds > 0.0)) {
        return Fail(error, "Malformed master record" + where);
      }
      parsed.master_duration_seconds = seconds;
    } else if (kind == "loop") {
      ManifestLoop loop;
      double volume = 0.0;
      if (fields.size() != 5 || fields[1].empty() || fields[4].empty() ||
          !ParseDouble(fields[2], volume) ||
          !ParseDouble(fields[3], loop.duration_seconds) ||
          !(loop.duration_seconds > 0.0) ||
          !UnescapeField(fields[1], loop.id) ||
          !UnescapeField(fields[4], loop.file_name)) {
        return Fail(error, "Malformed loop record" + where);
      }
      loop.volume = ClampVolume(static_cast<float>(volume));
      parsed.loops.push_back(std::move(loop));
    } else if (kind == "slot") {
      ManifestSlot slot;
      // A trailing empty title is dropped by the field splitter.
      if ((fields.size() != 3 && fields.size() != 4) ||
          !ParseInt(fields[1], slot.index) ||
          !SoundboardSlots::IsValidIndex(slot.index) || fields[2].empty() ||
          !UnescapeField(fields[2], slot.file_name) ||
          (fields.size() == 4 && !UnescapeField(fields[3], slot.title))) {
        return Fail(error, "Malformed slot record" + where);
      }
      parsed.slots.push_back(std::move(slot));
    }
  }

  out = std::move(parsed);
  if (error != nullptr) {
    error->clear();
  }
  return true;
}

}  // namespace looptune
