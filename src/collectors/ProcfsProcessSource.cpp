#include "collectors/ProcfsProcessSource.hpp"
#include "util/AsciiLower.hpp"
#include "util/PathKey.hpp"
#include "util/Procfs.hpp"

#include <utility>

namespace herd::collectors {

ProcfsProcessSource::ProcfsProcessSource(std::string name_filter)
  : name_filter_(std::move(name_filter)) {}

bool ProcfsProcessSource::init() {
  // /proc/self must resolve or nothing else will
  return herd::util::proc_available() && herd::util::read_file_string("/proc/self/stat").has_value();
}

bool ProcfsProcessSource::sample(herd::model::ProcessList& out) {
  out.processes.clear(); out.total_seen = 0; out.vanished = 0;
  if (!herd::util::proc_available()) return false;
  for (int32_t pid : herd::util::list_pids()) {
    ++out.total_seen;
    std::string comm = herd::util::read_comm(pid);
    if (comm.empty()) { ++out.vanished; continue; }
    if (!name_filter_.empty() && !herd::util::icontains(comm, name_filter_)) continue;
    std::string dir = "/proc/" + std::to_string(pid);
    herd::model::LiveProcess lp;
    lp.pid = pid;
    lp.name = std::move(comm);
    // exe/cwd are unreadable for other users' processes; keep the row anyway
    if (auto exe = herd::util::read_symlink(dir + "/exe")) lp.exe_path = herd::util::strip_deleted_suffix(*exe);
    if (auto cwd = herd::util::read_symlink(dir + "/cwd")) lp.cwd = *cwd;
    out.processes.push_back(std::move(lp));
  }
  return true;
}

} // namespace herd::collectors
