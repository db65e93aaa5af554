#include "app/Scanner.hpp"
#include "app/IdentityMatcher.hpp"
#include "util/Log.hpp"

#include <utility>

namespace herd::app {

Scanner::Scanner(herd::collectors::IProcessSource& source, SnapshotQueue& queue)
  : source_(source), queue_(queue),
    profiles_(std::make_shared<const herd::model::ProfileList>()),
    settings_(std::make_shared<const ScanSettings>()) {}

Scanner::~Scanner() { stop(); }

void Scanner::start() {
  if (thread_.joinable()) return;
  thread_ = std::jthread([this](std::stop_token st){ run(st); });
}

void Scanner::stop() {
  if (!thread_.joinable()) return;
  thread_.request_stop();
  thread_.join();
}

void Scanner::set_profiles(herd::model::ProfileList profiles) {
  profiles_.store(std::make_shared<const herd::model::ProfileList>(std::move(profiles)));
}

void Scanner::set_settings(const ScanSettings& s) {
  settings_.store(std::make_shared<const ScanSettings>(s));
}

ScanSettings Scanner::settings() const {
  return *settings_.load();
}

herd::model::PidSnapshot Scanner::cycle(const herd::model::ProfileList& profiles) {
  herd::model::ProcessList live;
  bool ok = false;
  {
    std::lock_guard<std::mutex> lk(source_mu_);
    ok = source_.sample(live);
    // log transitions only
    if (ok == was_degraded_) {
      if (ok) herd::util::log_info("scanner", "process source '%s' available again", source_.name());
      else herd::util::log_error("scanner", "process source '%s' unavailable, every pid reported unknown", source_.name());
      was_degraded_ = !ok;
    }
  }
  return ok ? match(profiles, live.processes) : match_unavailable(profiles);
}

herd::model::PidSnapshot Scanner::scan_once() {
  auto profiles = profiles_.load();
  return cycle(*profiles);
}

void Scanner::request_scan() {
  {
    std::lock_guard<std::mutex> lk(wake_mu_);
    scan_requested_.store(true, std::memory_order_relaxed);
  }
  wake_.notify_all();
}

void Scanner::run(std::stop_token st) {
  while (!st.stop_requested()) {
    auto settings = settings_.load();
    bool forced = scan_requested_.exchange(false, std::memory_order_relaxed);
    if (settings->enabled || forced) {
      auto profiles = profiles_.load();
      auto snap = cycle(*profiles);
      snap.seq = cycles_.fetch_add(1, std::memory_order_relaxed) + 1;
      // A full queue means the consumer is behind; the next cycle supersedes this one
      (void)queue_.try_push(std::move(snap));
    }
    auto nap = clamp_interval(settings->interval);
    last_sleep_ms_.store(nap.count(), std::memory_order_relaxed);
    std::unique_lock<std::mutex> lk(wake_mu_);
    (void)wake_.wait_for(lk, st, nap, [this]{ return scan_requested_.load(std::memory_order_relaxed); });
  }
}

} // namespace herd::app
