#pragma once
#include <string>
#include <string_view>

namespace herd::util {

constexpr char ascii_lower(unsigned char c) {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : static_cast<char>(c);
}

inline std::string ascii_lower_copy(std::string_view s) {
  std::string out(s);
  for (auto& c : out) c = ascii_lower(static_cast<unsigned char>(c));
  return out;
}

inline bool istarts_with(std::string_view s, std::string_view prefix) {
  if (prefix.size() > s.size()) return false;
  for (size_t i = 0; i < prefix.size(); ++i)
    if (ascii_lower(static_cast<unsigned char>(s[i])) != ascii_lower(static_cast<unsigned char>(prefix[i]))) return false;
  return true;
}

inline bool iends_with(std::string_view s, std::string_view suffix) {
  if (suffix.size() > s.size()) return false;
  return istarts_with(s.substr(s.size() - suffix.size()), suffix);
}

inline bool icontains(std::string_view hay, std::string_view needle) {
  if (needle.empty()) return true;
  if (needle.size() > hay.size()) return false;
  for (size_t i = 0; i + needle.size() <= hay.size(); ++i)
    if (istarts_with(hay.substr(i), needle)) return true;
  return false;
}

} // namespace herd::util
