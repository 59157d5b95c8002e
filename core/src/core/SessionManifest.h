#pragma once

#include <optional>
#include <string>
#include <vector>

namespace looptune {

// Restart-durable index of the storage directory: which files are
// loops (in order), the master duration and which pads are assigned.
// Mute/solo state is deliberately volatile and not stored.
//
// Format (version 1), one record per line, fields separated by tabs so
// that imported file names may contain spaces:
//   looptune_session_v1
//   master  <seconds>
//   loop    <id> <volume> <seconds> <file_name>
//   slot    <index> <file_name> <title>
//
// File names are relative to the storage directory. Tabs, line breaks
// and backslashes inside ids, file names and titles are stored as \t,
// \n, \r and \\.
struct ManifestLoop {
  std::string id;
  std::string file_name;
  double duration_seconds{0.0};
  float volume{1.0F};
};

struct ManifestSlot {
  int index{0};
  std::string file_name;
  std::string title;
};

struct SessionManifest {
  std::optional<double> master_duration_seconds;
  std::vector<ManifestLoop> loops;
  std::vector<ManifestSlot> slots;
};

[[nodiscard]] std::string SerializeManifest(const SessionManifest& manifest);

// Parses a serialised manifest. Unknown record types are skipped so
// that newer writers stay readable; a missing header or a malformed
// record fails the whole parse and fills `error` when non-null.
bool ParseManifest(const std::string& text, SessionManifest& out,
                   std::string* error = nullptr);

}  // namespace looptune
