#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace herd::model {

// One live OS process as seen by a process source.
struct LiveProcess {
  int32_t pid{};
  std::string name;      // comm, e.g. "Telegram"
  std::string exe_path;  // /proc/<pid>/exe with " (deleted)" stripped; empty if unreadable
  std::string cwd;       // /proc/<pid>/cwd; empty if unreadable
};

struct ProcessList {
  std::vector<LiveProcess> processes; // enumeration order
  size_t total_seen{};                // numeric /proc entries before the name filter
  size_t vanished{};                  // entries that disappeared mid-read
};

} // namespace herd::model
