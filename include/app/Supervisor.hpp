#pragma once
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include "app/LifecycleController.hpp"
#include "app/ProcessOps.hpp"
#include "app/ProfileCatalog.hpp"
#include "app/Scanner.hpp"
#include "app/SnapshotQueue.hpp"
#include "app/StateStore.hpp"
#include "collectors/IProcessSource.hpp"

namespace herd::app {

// Owns the scanner thread, the snapshot queue, the state store and the
// lifecycle controller. Every method except the scanner's own thread runs
// on the caller's (consumer) thread.
class Supervisor {
public:
  static constexpr std::chrono::milliseconds kDrainTick{150};

  Supervisor(std::unique_ptr<herd::collectors::IProcessSource> source,
             std::unique_ptr<IProcessLauncher> launcher,
             std::unique_ptr<IProcessTerminator> terminator,
             LifecycleTimings timings = {});
  ~Supervisor();
  Supervisor(const Supervisor&) = delete;
  Supervisor& operator=(const Supervisor&) = delete;

  // procfs when /proc is usable, the degraded null source otherwise.
  [[nodiscard]] static std::unique_ptr<herd::collectors::IProcessSource>
  make_process_source(const std::string& name_filter);

  // Production wiring: procfs source, fork/exec launcher, kill/pidfd terminator.
  [[nodiscard]] static std::unique_ptr<Supervisor> make_default(const std::string& name_filter);

  // Discover profiles and replace the whole catalog.
  DiscoveryResult rescan(const std::filesystem::path& base_dir, const ExecutableRules& rules);

  void set_settings(const ScanSettings& s) { scanner_.set_settings(s); }
  void start() { scanner_.start(); }
  void stop() { scanner_.stop(); }

  // Drain tick: apply every pending snapshot in arrival order.
  std::vector<herd::model::PidChange> pump() { return state_.drain(queue_); }

  // Stopped scanner: apply what is still queued, then a synchronous scan,
  // so nothing older can land on top of it. Running scanner: request an
  // immediate cycle and drain without waiting for it; the fresh snapshot
  // is applied by a later pump().
  std::vector<herd::model::PidChange> refresh_now();

  [[nodiscard]] StateStore& state() { return state_; }
  [[nodiscard]] const StateStore& state() const { return state_; }
  [[nodiscard]] LifecycleController& lifecycle() { return lifecycle_; }
  [[nodiscard]] Scanner& scanner() { return scanner_; }
  [[nodiscard]] SnapshotQueue& queue() { return queue_; }
  [[nodiscard]] const char* source_name() const { return source_->name(); }

private:
  std::unique_ptr<herd::collectors::IProcessSource> source_;
  std::unique_ptr<IProcessLauncher> launcher_;
  std::unique_ptr<IProcessTerminator> terminator_;
  SnapshotQueue queue_{};
  StateStore state_{};
  LifecycleController lifecycle_;
  Scanner scanner_; // declared last: its thread stops before the rest is torn down
};

} // namespace herd::app
