#pragma once
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

namespace fixtures {

namespace fs = std::filesystem;

// Fresh per-process scratch directory.
inline fs::path scratch(const std::string& tag) {
  auto root = fs::temp_directory_path() / ("herd_test_" + tag + "_" + std::to_string(::getpid()));
  std::error_code ec;
  fs::remove_all(root, ec);
  fs::create_directories(root);
  return root;
}

inline void write_file(const fs::path& p, const std::string& content) {
  fs::create_directories(p.parent_path());
  std::ofstream(p) << content;
}

inline void make_exec(const fs::path& p, const std::string& content = "#!/bin/sh\nexit 0\n") {
  write_file(p, content);
  fs::permissions(p, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                     fs::perms::others_read | fs::perms::others_exec);
}

inline void cleanup(const fs::path& p) {
  std::error_code ec;
  fs::remove_all(p, ec);
}

} // namespace fixtures
