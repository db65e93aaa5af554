#pragma once
#include <filesystem>
#include <string>
#include <vector>
#include "model/Profile.hpp"
#include "model/Result.hpp"

namespace herd::app {

// How a profile directory is resolved to its executable.
struct ExecutableRules {
  std::vector<std::string> candidates{"Telegram", "telegram-desktop", "Telegram.exe",
                                      "Telegram Desktop.exe", "TelegramPortable.exe"};
  std::string prefix{"telegram"};
  std::string suffix{};
};

struct DiscoveryResult {
  herd::model::ProfileList profiles;
  herd::model::ErrorCode status{herd::model::ErrorCode::None};
  std::string detail;
  size_t skipped{}; // subdirectories without an executable

  [[nodiscard]] bool ok() const { return status == herd::model::ErrorCode::None; }
};

// Scan base_dir for profile subdirectories. Never throws; an unusable
// base_dir yields status DiscoveryError and an empty list.
[[nodiscard]] DiscoveryResult discover(const std::filesystem::path& base_dir,
                                       const ExecutableRules& rules = {});

// Executable inside dir per rules, or empty.
[[nodiscard]] std::filesystem::path find_executable(const std::filesystem::path& dir,
                                                    const ExecutableRules& rules);

// Sort key: trailing decimal digits of name, if any.
struct ProfileOrder {
  bool has_number{false};
  unsigned long long number{};
  std::string name;
};
[[nodiscard]] ProfileOrder profile_order(const std::string& dir_name);
[[nodiscard]] bool profile_order_less(const ProfileOrder& a, const ProfileOrder& b);

} // namespace herd::app
