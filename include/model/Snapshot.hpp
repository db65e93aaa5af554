#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace herd::model {

// Result of one scan cycle: profile key -> observed pid (or none).
// Entries keep catalog order; lookups are linear since catalogs are small.
struct PidSnapshot {
  uint64_t seq{};          // scan cycle number, 0 for ad hoc matches
  bool degraded{false};    // process source unavailable, every pid unset
  std::vector<std::pair<std::string, std::optional<int32_t>>> entries;

  [[nodiscard]] const std::optional<int32_t>* find(const std::string& key) const {
    for (const auto& [k, v] : entries)
      if (k == key) return &v;
    return nullptr;
  }

  [[nodiscard]] std::optional<int32_t> pid_of(const std::string& key) const {
    const auto* v = find(key);
    return v ? *v : std::nullopt;
  }
};

// Per-profile change emitted by the state store when a pid differs.
struct PidChange {
  std::string key;
  std::string display_name;
  std::optional<int32_t> before;
  std::optional<int32_t> after;
};

} // namespace herd::model
