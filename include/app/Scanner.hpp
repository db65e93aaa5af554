#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <stop_token>
#include <thread>
#include "app/SnapshotQueue.hpp"
#include "collectors/IProcessSource.hpp"
#include "model/Profile.hpp"

namespace herd::app {

// Settings the scanner reads once per iteration. Writers publish a fresh
// immutable copy; a reader sees either the old or the new copy, never a mix.
// Updates are picked up on the next iteration (eventually consistent).
struct ScanSettings {
  bool enabled{true};
  std::chrono::milliseconds interval{2000};
  int max_parallel{3};
};

inline constexpr std::chrono::milliseconds kMinScanInterval{200};

[[nodiscard]] constexpr std::chrono::milliseconds clamp_interval(std::chrono::milliseconds requested) {
  return requested < kMinScanInterval ? kMinScanInterval : requested;
}

class Scanner {
public:
  Scanner(herd::collectors::IProcessSource& source, SnapshotQueue& queue);
  ~Scanner();
  Scanner(const Scanner&) = delete;
  Scanner& operator=(const Scanner&) = delete;

  void start();
  void stop();
  [[nodiscard]] bool running() const { return thread_.joinable(); }

  // Replace the profile set matched from the next cycle on (rescan).
  void set_profiles(herd::model::ProfileList profiles);
  void set_settings(const ScanSettings& s);
  [[nodiscard]] ScanSettings settings() const;

  // One synchronous match pass against the current profile set. Does not
  // touch the queue. Shares the source with the thread, so call it only
  // while the scanner is stopped or it waits for the in-flight cycle.
  [[nodiscard]] herd::model::PidSnapshot scan_once();

  // Ask the running thread for a cycle now instead of at the end of the
  // interval, even when auto refresh is disabled. Never blocks on a scan;
  // the snapshot arrives through the queue like any other.
  void request_scan();

  [[nodiscard]] uint64_t cycles() const { return cycles_.load(std::memory_order_relaxed); }
  // Interval actually slept in the last cycle (after clamping).
  [[nodiscard]] std::chrono::milliseconds last_sleep() const {
    return std::chrono::milliseconds(last_sleep_ms_.load(std::memory_order_relaxed));
  }

private:
  void run(std::stop_token st);
  herd::model::PidSnapshot cycle(const herd::model::ProfileList& profiles);

  herd::collectors::IProcessSource& source_;
  SnapshotQueue& queue_;
  std::atomic<std::shared_ptr<const herd::model::ProfileList>> profiles_;
  std::atomic<std::shared_ptr<const ScanSettings>> settings_;
  std::mutex source_mu_; // serializes scan_once() against the thread
  std::atomic<uint64_t> cycles_{0};
  std::atomic<int64_t> last_sleep_ms_{0};
  bool was_degraded_{false}; // guarded by source_mu_
  std::atomic<bool> scan_requested_{false};
  std::mutex wake_mu_;
  std::condition_variable_any wake_;
  std::jthread thread_{};
};

} // namespace herd::app
