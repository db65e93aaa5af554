#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace herd::model {

struct Profile {
  std::string key;           // normalized absolute folder path, identity
  std::string display_name;  // directory name, e.g. "Telegram 3"
  std::string folder;        // absolute folder path as discovered
  std::string exe_path;      // resolved executable
  std::optional<int32_t> pid{};

  [[nodiscard]] bool running() const { return pid.has_value(); }
};

using ProfileList = std::vector<Profile>;

} // namespace herd::model
