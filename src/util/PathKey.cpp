#include "util/PathKey.hpp"
#include "util/AsciiLower.hpp"

#include <filesystem>
#include <system_error>

namespace herd::util {

std::string normalize_path(std::string_view p) {
  if (p.empty()) return {};
  std::filesystem::path path{std::string(p)};
  std::error_code ec;
  if (!path.is_absolute()) {
    auto abs = std::filesystem::absolute(path, ec);
    if (!ec) path = abs;
  }
  std::string out = path.lexically_normal().string();
  while (out.size() > 1 && out.back() == '/') out.pop_back();
  return out;
}

std::string match_key(std::string_view p) {
  return ascii_lower_copy(normalize_path(p));
}

std::string strip_deleted_suffix(std::string_view path) {
  constexpr std::string_view marker = " (deleted)";
  if (path.ends_with(marker)) path.remove_suffix(marker.size());
  return std::string(path);
}

} // namespace herd::util
