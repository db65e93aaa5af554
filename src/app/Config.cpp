#include "app/Config.hpp"
#include "util/Log.hpp"
#include "util/TomlReader.hpp"

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <string>

namespace herd::app {

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("HERD_", 0) == 0) {
    alt = std::string("herd_") + n.substr(5);
  } else if (n.rfind("herd_", 0) == 0) {
    alt = std::string("HERD_") + n.substr(5);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

int getenv_int(const char* name, int defv) {
  const char* v = getenv_compat(name);
  if (!v || !*v) return defv;
  std::string_view sv(v);
  int out = defv;
  auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), out);
  if (ec != std::errc{} || ptr != sv.data() + sv.size()) return defv;
  return out;
}

static bool env_flag(const char* name, bool defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  if (v[0]=='0'||v[0]=='f'||v[0]=='F'||v[0]=='n'||v[0]=='N') return false;
  return true;
}

std::string config_file_path() {
  if (const char* explicit_path = getenv_compat("HERD_CONFIG"); explicit_path)
    return std::string(explicit_path);
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/herd/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/herd/config.toml";
  return {};
}

// Resolve an int from TOML -> env -> compiled default
static int resolve_int(const herd::util::TomlReader& toml, bool have_toml,
                       const char* section, const char* key,
                       const char* env_name, int def) {
  if (have_toml && toml.has(section, key))
    return toml.get_int(section, key, def);
  if (env_name)
    return getenv_int(env_name, def);
  return def;
}

static bool resolve_bool(const herd::util::TomlReader& toml, bool have_toml,
                         const char* section, const char* key,
                         const char* env_name, bool def) {
  if (have_toml && toml.has(section, key))
    return toml.get_bool(section, key, def);
  if (env_name)
    return env_flag(env_name, def);
  return def;
}

static std::string resolve_string(const herd::util::TomlReader& toml, bool have_toml,
                                  const char* section, const char* key,
                                  const char* env_name, const std::string& def) {
  if (have_toml && toml.has(section, key))
    return toml.get_string(section, key, def);
  if (env_name) {
    const char* v = getenv_compat(env_name);
    if (v && *v) return std::string(v);
  }
  return def;
}

static std::vector<std::string> split_list(const std::string& s) {
  herd::util::TomlReader tmp;
  tmp.set("", "v", s);
  return tmp.get_list("", "v");
}

static std::vector<std::string> resolve_list(const herd::util::TomlReader& toml, bool have_toml,
                                             const char* section, const char* key,
                                             const char* env_name, const std::vector<std::string>& def) {
  if (have_toml && toml.has(section, key)) return toml.get_list(section, key);
  if (env_name) {
    const char* v = getenv_compat(env_name);
    if (v && *v) return split_list(v);
  }
  return def;
}

ScanSettings Config::scan_settings() const {
  ScanSettings s;
  s.enabled = supervisor.auto_refresh;
  s.interval = std::chrono::milliseconds(supervisor.interval_ms);
  s.max_parallel = supervisor.max_parallel;
  return s;
}

Config load_config(const std::string& path) {
  Config c{};
  herd::util::TomlReader toml;
  bool have_toml = !path.empty() && toml.load(path);
  if (have_toml) {
    c.source_path = path;
    for (const auto& w : toml.warnings())
      herd::util::log_error("config", "%s:%d: ignored '%s'", path.c_str(), w.line, w.text.c_str());
  }

  // --- [supervisor] ---
  c.supervisor.base_dir     = resolve_string(toml, have_toml, "supervisor", "base_dir",     "HERD_BASE_DIR", "");
  c.supervisor.interval_ms  = resolve_int   (toml, have_toml, "supervisor", "interval_ms",  "HERD_INTERVAL_MS", 2000);
  c.supervisor.auto_refresh = resolve_bool  (toml, have_toml, "supervisor", "auto_refresh", "HERD_AUTO_REFRESH", true);
  c.supervisor.max_parallel = resolve_int   (toml, have_toml, "supervisor", "max_parallel", "HERD_MAX_PARALLEL", 3);
  c.supervisor.interval_ms  = std::clamp(c.supervisor.interval_ms, kMinIntervalMs, kMaxIntervalMs);
  c.supervisor.max_parallel = std::clamp(c.supervisor.max_parallel, kMinParallel, kMaxParallel);

  // --- [match] ---
  const ExecutableRules defaults{};
  c.match.name_filter      = resolve_string(toml, have_toml, "match", "name_filter", "HERD_NAME_FILTER", "telegram");
  c.match.rules.candidates = resolve_list  (toml, have_toml, "match", "candidates",  "HERD_CANDIDATES", defaults.candidates);
  c.match.rules.prefix     = resolve_string(toml, have_toml, "match", "prefix",      "HERD_EXE_PREFIX", defaults.prefix);
  c.match.rules.suffix     = resolve_string(toml, have_toml, "match", "suffix",      "HERD_EXE_SUFFIX", defaults.suffix);

  return c;
}

bool save_base_dir(const std::string& path, const std::string& base_dir) {
  if (path.empty()) return false;
  herd::util::TomlReader toml;
  (void)toml.load(path); // start from the existing file when there is one
  toml.set("supervisor", "base_dir", base_dir);
  std::error_code ec;
  auto parent = std::filesystem::path(path).parent_path();
  if (!parent.empty()) std::filesystem::create_directories(parent, ec);
  if (ec) {
    herd::util::log_error("config", "failed to create %s: %s", parent.c_str(), ec.message().c_str());
    return false;
  }
  if (!toml.save(path)) {
    herd::util::log_error("config", "failed to write %s", path.c_str());
    return false;
  }
  return true;
}

} // namespace herd::app
