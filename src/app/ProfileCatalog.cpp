#include "app/ProfileCatalog.hpp"
#include "util/AsciiLower.hpp"
#include "util/Log.hpp"
#include "util/PathKey.hpp"

#include <algorithm>
#include <charconv>
#include <system_error>

namespace fs = std::filesystem;

namespace herd::app {

static bool is_regular(const fs::path& p) {
  std::error_code ec;
  return fs::is_regular_file(p, ec);
}

static bool has_exec_bit(const fs::path& p) {
  std::error_code ec;
  auto st = fs::status(p, ec);
  if (ec) return false;
  auto perms = st.permissions();
  return (perms & (fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec)) != fs::perms::none;
}

fs::path find_executable(const fs::path& dir, const ExecutableRules& rules) {
  for (const auto& name : rules.candidates) {
    auto p = dir / name;
    if (is_regular(p)) return p;
  }
  if (rules.prefix.empty() && rules.suffix.empty()) return {};
  // One level only: files directly inside dir
  std::vector<std::string> hits;
  std::error_code ec;
  fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
  if (ec) return {};
  for (fs::directory_iterator end; it != end; it.increment(ec)) {
    if (ec) break;
    const auto& entry = *it;
    std::error_code fec;
    if (!entry.is_regular_file(fec)) continue;
    auto fname = entry.path().filename().string();
    if (!herd::util::istarts_with(fname, rules.prefix)) continue;
    if (!herd::util::iends_with(fname, rules.suffix)) continue;
    if (rules.suffix.empty() && !has_exec_bit(entry.path())) continue;
    hits.push_back(std::move(fname));
  }
  if (hits.empty()) return {};
  std::sort(hits.begin(), hits.end());
  return dir / hits.front();
}

ProfileOrder profile_order(const std::string& dir_name) {
  ProfileOrder o;
  o.name = dir_name;
  size_t i = dir_name.size();
  while (i > 0 && dir_name[i - 1] >= '0' && dir_name[i - 1] <= '9') --i;
  if (i < dir_name.size()) {
    auto [ptr, ec] = std::from_chars(dir_name.data() + i, dir_name.data() + dir_name.size(), o.number);
    // Absurdly long digit runs overflow; treat them like unnumbered names
    o.has_number = (ec == std::errc{});
  }
  return o;
}

bool profile_order_less(const ProfileOrder& a, const ProfileOrder& b) {
  if (a.has_number != b.has_number) return a.has_number;
  if (a.has_number && a.number != b.number) return a.number < b.number;
  return a.name < b.name;
}

DiscoveryResult discover(const fs::path& base_dir, const ExecutableRules& rules) {
  DiscoveryResult r;
  std::error_code ec;
  if (base_dir.empty() || !fs::is_directory(base_dir, ec)) {
    r.status = herd::model::ErrorCode::DiscoveryError;
    r.detail = "not a directory: " + base_dir.string();
    return r;
  }
  fs::directory_iterator it(base_dir, ec);
  if (ec) {
    r.status = herd::model::ErrorCode::DiscoveryError;
    r.detail = base_dir.string() + ": " + ec.message();
    return r;
  }

  std::vector<std::pair<ProfileOrder, fs::path>> dirs;
  for (fs::directory_iterator end; it != end; it.increment(ec)) {
    if (ec) {
      r.status = herd::model::ErrorCode::DiscoveryError;
      r.detail = base_dir.string() + ": " + ec.message();
      r.profiles.clear();
      return r;
    }
    std::error_code dec;
    if (!it->is_directory(dec)) continue;
    dirs.emplace_back(profile_order(it->path().filename().string()), it->path());
  }
  std::sort(dirs.begin(), dirs.end(), [](const auto& a, const auto& b){ return profile_order_less(a.first, b.first); });

  for (const auto& [order, dir] : dirs) {
    auto exe = find_executable(dir, rules);
    if (exe.empty()) { ++r.skipped; continue; }
    herd::model::Profile p;
    p.folder = herd::util::normalize_path(dir.string());
    p.key = p.folder;
    p.display_name = order.name;
    p.exe_path = herd::util::normalize_path(exe.string());
    r.profiles.push_back(std::move(p));
  }
  herd::util::log_info("catalog", "%zu profile(s) under %s, %zu folder(s) without executable",
                       r.profiles.size(), base_dir.c_str(), r.skipped);
  return r;
}

} // namespace herd::app
