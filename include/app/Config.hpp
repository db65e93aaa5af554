#pragma once

#include <string>
#include "app/ProfileCatalog.hpp"
#include "app/Scanner.hpp"

namespace herd::app {

struct Config {
  struct {
    std::string base_dir;
    int interval_ms{2000};
    bool auto_refresh{true};
    int max_parallel{3};
  } supervisor;

  struct {
    std::string name_filter{"telegram"};
    ExecutableRules rules{};
  } match;

  std::string source_path; // file the values came from, empty if none

  [[nodiscard]] ScanSettings scan_settings() const;
};

// Bounds for user supplied values
inline constexpr int kMinIntervalMs = 200;
inline constexpr int kMaxIntervalMs = 10000;
inline constexpr int kMinParallel = 1;
inline constexpr int kMaxParallel = 20;

// $HERD_CONFIG, then $XDG_CONFIG_HOME/herd/config.toml, then ~/.config/herd/config.toml
[[nodiscard]] std::string config_file_path();

// Resolve TOML -> env -> compiled default. A missing file is not an error.
[[nodiscard]] Config load_config(const std::string& path);
[[nodiscard]] inline Config load_config() { return load_config(config_file_path()); }

// Persist supervisor.base_dir, keeping every other key of the file.
[[nodiscard]] bool save_base_dir(const std::string& path, const std::string& base_dir);

// Environment variable helpers (HERD_ and herd_ prefixes are equivalent)
const char* getenv_compat(const char* name);
int getenv_int(const char* name, int defv);

} // namespace herd::app
