#pragma once

#include <cctype>
#include <charconv>
#include <fstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace herd::util {

// The TOML subset herd's config needs: [section] headers, key = value lines,
// basic "strings" with \" \\ \n \t escapes, integers, booleans and one-line
// arrays of strings. Anything else on a line is reported through warnings()
// and skipped; a malformed line never fails the whole load.
class TomlReader {
public:
  struct Warning {
    int line{};
    std::string text;
  };

  bool load(const std::string& path) {
    sections_.clear();
    warnings_.clear();
    std::ifstream in(path);
    if (!in.is_open()) return false;
    std::string current;
    std::string raw;
    int lineno = 0;
    while (std::getline(in, raw)) {
      ++lineno;
      auto sv = trim(strip_comment(raw));
      if (sv.empty()) continue;
      if (sv.front() == '[' && sv.back() == ']' && sv.find('=') == std::string_view::npos) {
        current = std::string(trim(sv.substr(1, sv.size() - 2)));
        ensure_section(current);
        continue;
      }
      auto eq = sv.find('=');
      if (eq == std::string_view::npos || trim(sv.substr(0, eq)).empty()) {
        warnings_.push_back({lineno, std::string(sv)});
        continue;
      }
      std::string key(trim(sv.substr(0, eq)));
      std::string val;
      if (!decode_value(trim(sv.substr(eq + 1)), val)) {
        warnings_.push_back({lineno, std::string(sv)});
        continue;
      }
      ensure_section(current).set(key, val);
    }
    return true;
  }

  bool save(const std::string& path) const {
    std::ofstream out(path);
    if (!out.is_open()) return false;
    bool first = true;
    for (const auto& [name, sec] : sections_) {
      if (!first) out << '\n';
      first = false;
      if (!name.empty()) out << '[' << name << "]\n";
      for (const auto& [k, v] : sec.entries) out << k << " = " << encode_value(v) << '\n';
    }
    return out.good();
  }

  [[nodiscard]] const std::vector<Warning>& warnings() const { return warnings_; }

  [[nodiscard]] std::string get_string(std::string_view section, std::string_view key,
                                        const std::string& def = "") const {
    const auto* v = find(section, key);
    return v ? *v : def;
  }

  [[nodiscard]] int get_int(std::string_view section, std::string_view key, int def = 0) const {
    const auto* v = find(section, key);
    if (!v || v->empty()) return def;
    int out = def;
    auto [ptr, ec] = std::from_chars(v->data(), v->data() + v->size(), out);
    if (ec != std::errc{} || ptr != v->data() + v->size()) return def;
    return out;
  }

  [[nodiscard]] bool get_bool(std::string_view section, std::string_view key, bool def = false) const {
    const auto* v = find(section, key);
    if (!v) return def;
    if (*v == "true" || *v == "True" || *v == "TRUE" || *v == "1") return true;
    if (*v == "false" || *v == "False" || *v == "FALSE" || *v == "0") return false;
    return def;
  }

  // Array value ["a", "b"] or a plain comma separated string. Items are
  // trimmed and unquoted; empty items are dropped.
  [[nodiscard]] std::vector<std::string> get_list(std::string_view section, std::string_view key) const {
    std::vector<std::string> out;
    const auto* v = find(section, key);
    if (!v) return out;
    std::string_view sv = trim(*v);
    if (sv.size() >= 2 && sv.front() == '[' && sv.back() == ']') sv = sv.substr(1, sv.size() - 2);
    std::string item;
    bool quoted = false;
    auto flush = [&]{
      auto t = trim(item);
      std::string s;
      if (t.size() >= 2 && t.front() == '"' && t.back() == '"') {
        if (!unescape(t.substr(1, t.size() - 2), s)) s.clear();
      } else {
        s = std::string(t);
      }
      if (!s.empty()) out.push_back(std::move(s));
      item.clear();
    };
    for (size_t i = 0; i < sv.size(); ++i) {
      char c = sv[i];
      if (c == '"' && (i == 0 || sv[i - 1] != '\\')) quoted = !quoted;
      if (c == ',' && !quoted) { flush(); continue; }
      item.push_back(c);
    }
    flush();
    return out;
  }

  void set(const std::string& section, const std::string& key, const std::string& value) {
    ensure_section(section).set(key, value);
  }
  void set(const std::string& section, const std::string& key, const char* value) {
    set(section, key, std::string(value));
  }
  void set(const std::string& section, const std::string& key, int value) {
    ensure_section(section).set(key, std::to_string(value));
  }
  void set(const std::string& section, const std::string& key, bool value) {
    ensure_section(section).set(key, value ? "true" : "false");
  }

  [[nodiscard]] bool has(std::string_view section, std::string_view key) const {
    return find(section, key) != nullptr;
  }

private:
  struct Section {
    std::vector<std::pair<std::string, std::string>> entries; // file order

    [[nodiscard]] const std::string* get(std::string_view key) const {
      for (const auto& [k, v] : entries)
        if (k == key) return &v;
      return nullptr;
    }

    void set(const std::string& key, const std::string& val) {
      for (auto& [k, v] : entries) {
        if (k == key) { v = val; return; }
      }
      entries.emplace_back(key, val);
    }
  };

  std::vector<std::pair<std::string, Section>> sections_;
  std::vector<Warning> warnings_;

  Section& ensure_section(const std::string& name) {
    for (auto& [n, s] : sections_)
      if (n == name) return s;
    sections_.emplace_back(name, Section{});
    return sections_.back().second;
  }

  [[nodiscard]] const std::string* find(std::string_view section, std::string_view key) const {
    for (const auto& [n, s] : sections_)
      if (n == section) return s.get(key);
    return nullptr;
  }

  static std::string_view trim(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);
    return sv;
  }

  // Cut a '#' comment that is not inside a quoted string.
  static std::string_view strip_comment(std::string_view sv) {
    bool quoted = false;
    for (size_t i = 0; i < sv.size(); ++i) {
      if (sv[i] == '"' && (i == 0 || sv[i - 1] != '\\')) quoted = !quoted;
      else if (sv[i] == '#' && !quoted) return sv.substr(0, i);
    }
    return sv;
  }

  static bool unescape(std::string_view in, std::string& out) {
    out.clear();
    for (size_t i = 0; i < in.size(); ++i) {
      if (in[i] != '\\') { out.push_back(in[i]); continue; }
      if (++i == in.size()) return false;
      switch (in[i]) {
        case '"': out.push_back('"'); break;
        case '\\': out.push_back('\\'); break;
        case 'n': out.push_back('\n'); break;
        case 't': out.push_back('\t'); break;
        default: return false;
      }
    }
    return true;
  }

  // Strings lose their quotes, arrays are kept verbatim for get_list,
  // bare words are kept as written.
  static bool decode_value(std::string_view v, std::string& out) {
    if (v.empty()) return false;
    if (v.front() == '"') {
      if (v.size() < 2 || v.back() != '"') return false;
      return unescape(v.substr(1, v.size() - 2), out);
    }
    if (v.front() == '[' && v.back() != ']') return false;
    out = std::string(v);
    return true;
  }

  static std::string encode_value(const std::string& v) {
    if (v == "true" || v == "false") return v;
    if (v.size() >= 2 && v.front() == '[' && v.back() == ']') return v;
    size_t start = (!v.empty() && v[0] == '-') ? 1 : 0;
    bool integer = start < v.size();
    for (size_t i = start; i < v.size() && integer; ++i)
      integer = std::isdigit(static_cast<unsigned char>(v[i])) != 0;
    if (integer) return v;
    std::string out = "\"";
    for (char c : v) {
      switch (c) {
        case '"': out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n"; break;
        case '\t': out += "\\t"; break;
        default: out.push_back(c);
      }
    }
    out.push_back('"');
    return out;
  }
};

} // namespace herd::util
