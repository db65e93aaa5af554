#include "util/Procfs.hpp"

#include <sys/types.h>
#include <dirent.h>
#include <unistd.h>

#include <charconv>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>

namespace herd::util {

static std::string proc_root() {
  const char* env = std::getenv("HERD_PROC_ROOT");
  if (env && *env) return std::string(env);
  return std::string();
}

static std::string pid_path(int32_t pid, const char* leaf) {
  return "/proc/" + std::to_string(pid) + "/" + leaf;
}

auto map_proc_path(const std::string& abs) -> std::string {
  if (abs.rfind("/proc", 0) != 0) return abs; // not under /proc
  auto root = proc_root();
  if (root.empty()) return abs;
  std::filesystem::path p(root);
  p /= std::filesystem::path(abs.substr(1)); // drop leading '/'
  return p.string();
}

auto read_file_string(const std::string& abs) -> std::optional<std::string> {
  std::ifstream in(map_proc_path(abs));
  if (!in) return std::nullopt;
  std::string s((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  // /proc files vanish when the process exits between open and read
  if (in.bad()) return std::nullopt;
  return s;
}

auto read_symlink(const std::string& abs) -> std::optional<std::string> {
  auto path = map_proc_path(abs);
  char buf[4096];
  ssize_t n = ::readlink(path.c_str(), buf, sizeof(buf) - 1);
  if (n < 0) return std::nullopt;
  return std::string(buf, static_cast<size_t>(n));
}

auto list_dir(const std::string& abs) -> std::vector<std::string> {
  std::vector<std::string> out;
  auto path = map_proc_path(abs);
  DIR* d = ::opendir(path.c_str());
  if (!d) return out;
  while (auto* ent = ::readdir(d)) {
    const char* name = ent->d_name;
    if (std::strcmp(name, ".") == 0 || std::strcmp(name, "..") == 0) continue;
    out.emplace_back(name);
  }
  ::closedir(d);
  return out;
}

auto list_pids() -> std::vector<int32_t> {
  std::vector<int32_t> out;
  for (const auto& name : list_dir("/proc")) {
    if (name.empty() || name[0] < '0' || name[0] > '9') continue;
    int32_t pid = 0;
    auto [ptr, ec] = std::from_chars(name.data(), name.data() + name.size(), pid);
    if (ec != std::errc{} || ptr != name.data() + name.size() || pid <= 0) continue;
    out.push_back(pid);
  }
  return out;
}

auto read_comm(int32_t pid) -> std::string {
  if (auto comm = read_file_string(pid_path(pid, "comm"))) {
    while (!comm->empty() && (comm->back() == '\n' || comm->back() == '\r')) comm->pop_back();
    if (!comm->empty()) return *comm;
  }
  auto stat = read_file_string(pid_path(pid, "stat"));
  if (!stat) return {};
  // comm may itself contain ')' so take the last one
  auto lp = stat->find('('); auto rp = stat->rfind(')');
  if (lp == std::string::npos || rp == std::string::npos || rp < lp) return {};
  return stat->substr(lp + 1, rp - lp - 1);
}

auto read_state(int32_t pid) -> std::optional<char> {
  auto stat = read_file_string(pid_path(pid, "stat"));
  if (!stat) return std::nullopt;
  auto rp = stat->rfind(')');
  if (rp == std::string::npos || rp + 2 >= stat->size()) return std::nullopt;
  return (*stat)[rp + 2];
}

bool proc_available() {
  auto path = map_proc_path("/proc");
  DIR* d = ::opendir(path.c_str());
  if (!d) return false;
  ::closedir(d);
  return true;
}

} // namespace herd::util
