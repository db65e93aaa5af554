#pragma once
#include <string>
#include <string_view>

namespace herd::util {

// Absolute, lexically normal path without a trailing separator.
// Used as the stable identity of a profile folder.
[[nodiscard]] std::string normalize_path(std::string_view p);

// normalize_path() folded to ASCII lower case, for matching.
[[nodiscard]] std::string match_key(std::string_view p);

// Strip the " (deleted)" marker the kernel appends to replaced executables.
[[nodiscard]] std::string strip_deleted_suffix(std::string_view path);

} // namespace herd::util
