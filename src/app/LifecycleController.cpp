#include "app/LifecycleController.hpp"
#include "util/Log.hpp"

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <mutex>
#include <thread>

namespace herd::app {

using herd::model::ErrorCode;
using herd::model::OpResult;

LifecycleController::LifecycleController(IProcessLauncher& launcher, IProcessTerminator& terminator,
                                         LifecycleTimings timings)
  : launcher_(launcher), terminator_(terminator), timings_(timings) {}

OpResult LifecycleController::open(const herd::model::Profile& profile) {
  std::error_code ec;
  if (profile.exe_path.empty() || !std::filesystem::is_regular_file(profile.exe_path, ec)) {
    return OpResult::failure(ErrorCode::ExecutableMissing, "executable not found: " + profile.exe_path);
  }
  auto out = launcher_.launch(profile.exe_path, profile.folder, true);
  if (out.result.ok) return OpResult::success("opened (pid " + std::to_string(out.pid) + ")");
  if (out.result.code == ErrorCode::None) out.result.code = ErrorCode::LaunchRejected;
  return out.result;
}

OpResult LifecycleController::terminate(int32_t pid, bool force) {
  if (pid <= 0) return OpResult::failure(ErrorCode::Other, "invalid pid " + std::to_string(pid));
  const auto spid = std::to_string(pid);

  auto kill_and_wait = [&](const char* verb) -> OpResult {
    auto sent = terminator_.send(pid, StopSignal::Force);
    if (sent.code == ErrorCode::NotFound) return OpResult{true, ErrorCode::NotFound, "pid " + spid + " already gone"};
    if (!sent.ok) return sent;
    switch (terminator_.wait_exit(pid, timings_.kill_wait)) {
      case WaitStatus::Exited: return OpResult::success(std::string(verb) + " " + spid);
      case WaitStatus::TimedOut:
        return OpResult::failure(ErrorCode::Timeout, "pid " + spid + " still alive after SIGKILL");
      case WaitStatus::Error: break;
    }
    return OpResult::failure(ErrorCode::Other, "could not wait for pid " + spid);
  };

  if (force) return kill_and_wait("killed");

  auto sent = terminator_.send(pid, StopSignal::Graceful);
  if (sent.code == ErrorCode::NotFound) return OpResult{true, ErrorCode::NotFound, "pid " + spid + " already gone"};
  if (!sent.ok) return sent;
  if (terminator_.wait_exit(pid, timings_.graceful_wait) == WaitStatus::Exited) {
    return OpResult::success("terminated " + spid);
  }
  herd::util::log_info("lifecycle", "pid %d ignored SIGTERM for %lldms, escalating",
                       pid, static_cast<long long>(timings_.graceful_wait.count()));
  return kill_and_wait("force killed");
}

OpResult LifecycleController::restart(const herd::model::Profile& profile) {
  std::string note;
  if (profile.pid) {
    auto t = terminate(*profile.pid, false);
    if (!t.ok) note = " (terminate failed: " + t.message + ")";
    // let the old instance release its profile lock before the new one starts
    std::this_thread::sleep_for(timings_.restart_settle);
  }
  auto r = open(profile);
  r.message += note;
  return r;
}

OpResult LifecycleController::toggle(const herd::model::Profile& profile) {
  if (profile.pid) return terminate(*profile.pid, false);
  return open(profile);
}

std::vector<ProfileOutcome> LifecycleController::open_all(const herd::model::ProfileList& profiles,
                                                          int max_parallel) {
  std::vector<ProfileOutcome> results;
  if (profiles.empty()) return results;
  results.reserve(profiles.size());
  const size_t workers = std::min<size_t>(static_cast<size_t>(std::max(1, max_parallel)), profiles.size());

  std::atomic<size_t> next{0};
  std::mutex results_mu;
  {
    std::vector<std::jthread> pool;
    pool.reserve(workers);
    for (size_t w = 0; w < workers; ++w) {
      pool.emplace_back([&]{
        for (;;) {
          size_t i = next.fetch_add(1, std::memory_order_relaxed);
          if (i >= profiles.size()) return;
          const auto& p = profiles[i];
          auto r = open(p);
          std::lock_guard<std::mutex> lk(results_mu);
          results.push_back(ProfileOutcome{p.key, p.display_name, std::move(r)});
        }
      });
    }
  } // jthreads join here
  return results;
}

std::vector<ProfileOutcome> LifecycleController::kill_all(const herd::model::ProfileList& profiles, bool force) {
  std::vector<ProfileOutcome> results;
  for (const auto& p : profiles) {
    if (!p.pid) continue;
    results.push_back(ProfileOutcome{p.key, p.display_name, terminate(*p.pid, force)});
  }
  return results;
}

} // namespace herd::app
