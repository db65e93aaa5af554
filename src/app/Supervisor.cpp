#include "app/Supervisor.hpp"
#include "collectors/ProcfsProcessSource.hpp"
#include "util/Log.hpp"

#include <iterator>
#include <utility>

namespace herd::app {

Supervisor::Supervisor(std::unique_ptr<herd::collectors::IProcessSource> source,
                       std::unique_ptr<IProcessLauncher> launcher,
                       std::unique_ptr<IProcessTerminator> terminator,
                       LifecycleTimings timings)
  : source_(source ? std::move(source) : std::make_unique<herd::collectors::NullProcessSource>()),
    launcher_(std::move(launcher)),
    terminator_(std::move(terminator)),
    lifecycle_(*launcher_, *terminator_, timings),
    scanner_(*source_, queue_) {}

Supervisor::~Supervisor() { scanner_.stop(); }

std::unique_ptr<herd::collectors::IProcessSource>
Supervisor::make_process_source(const std::string& name_filter) {
  auto procfs = std::make_unique<herd::collectors::ProcfsProcessSource>(name_filter);
  if (procfs->init()) return procfs;
  herd::util::log_error("supervisor", "/proc unavailable, running without process matching");
  return std::make_unique<herd::collectors::NullProcessSource>();
}

std::unique_ptr<Supervisor> Supervisor::make_default(const std::string& name_filter) {
  return std::make_unique<Supervisor>(make_process_source(name_filter),
                                      std::make_unique<PosixLauncher>(),
                                      std::make_unique<PosixTerminator>());
}

DiscoveryResult Supervisor::rescan(const std::filesystem::path& base_dir, const ExecutableRules& rules) {
  auto r = discover(base_dir, rules);
  if (!r.ok()) herd::util::log_error("supervisor", "discovery failed: %s", r.detail.c_str());
  state_.reset(r.profiles);
  scanner_.set_profiles(r.profiles);
  return r;
}

std::vector<herd::model::PidChange> Supervisor::refresh_now() {
  if (scanner_.running()) {
    scanner_.request_scan();
    return pump();
  }
  auto changes = pump();
  auto fresh = state_.apply(scanner_.scan_once());
  changes.insert(changes.end(), std::make_move_iterator(fresh.begin()), std::make_move_iterator(fresh.end()));
  return changes;
}

} // namespace herd::app
