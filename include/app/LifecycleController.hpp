#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>
#include "app/ProcessOps.hpp"
#include "model/Profile.hpp"
#include "model/Result.hpp"

namespace herd::app {

struct LifecycleTimings {
  std::chrono::milliseconds graceful_wait{4000};
  std::chrono::milliseconds kill_wait{5000};
  std::chrono::milliseconds restart_settle{600};
};

struct ProfileOutcome {
  std::string key;
  std::string display_name;
  herd::model::OpResult result;
};

// Launch/terminate operations over injected OS capabilities. Never writes
// Profile::pid; the next scan reports the effect. Safe to call from several
// threads as long as the capabilities are.
class LifecycleController {
public:
  static constexpr int kDefaultMaxParallel = 3;

  LifecycleController(IProcessLauncher& launcher, IProcessTerminator& terminator,
                      LifecycleTimings timings = {});

  [[nodiscard]] herd::model::OpResult open(const herd::model::Profile& profile);
  [[nodiscard]] herd::model::OpResult terminate(int32_t pid, bool force = false);
  // Terminate the known pid (if any), settle, then always open.
  [[nodiscard]] herd::model::OpResult restart(const herd::model::Profile& profile);
  // Terminate when running, open otherwise.
  [[nodiscard]] herd::model::OpResult toggle(const herd::model::Profile& profile);

  // Launch every profile with at most max_parallel launches in flight.
  // Outcomes are in completion order.
  [[nodiscard]] std::vector<ProfileOutcome> open_all(const herd::model::ProfileList& profiles,
                                                     int max_parallel = kDefaultMaxParallel);
  // Terminate every profile with a known pid. Caller confirms beforehand.
  [[nodiscard]] std::vector<ProfileOutcome> kill_all(const herd::model::ProfileList& profiles,
                                                     bool force = false);

private:
  IProcessLauncher& launcher_;
  IProcessTerminator& terminator_;
  LifecycleTimings timings_;
};

} // namespace herd::app
