#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "app/SnapshotQueue.hpp"
#include "model/Profile.hpp"
#include "model/Snapshot.hpp"

namespace herd::app {

// Owns the current profile set and is the only writer of Profile::pid.
// Not thread-safe: every call happens on the consumer (drain tick) thread.
class StateStore {
public:
  using Listener = std::function<void(const herd::model::PidChange&)>;

  StateStore() = default;
  explicit StateStore(herd::model::ProfileList profiles);

  // Replace the catalog after a rescan. Every pid starts unknown.
  void reset(herd::model::ProfileList profiles);

  void set_listener(Listener l) { listener_ = std::move(l); }

  // Apply one snapshot. Keys the store does not know are ignored.
  // Returns (and reports to the listener) only the profiles whose pid changed.
  std::vector<herd::model::PidChange> apply(const herd::model::PidSnapshot& snap);

  // Apply every pending snapshot in arrival order.
  std::vector<herd::model::PidChange> drain(SnapshotQueue& queue);

  [[nodiscard]] const herd::model::ProfileList& profiles() const { return profiles_; }
  [[nodiscard]] const herd::model::Profile* find(const std::string& key) const;
  [[nodiscard]] const herd::model::Profile* find_by_name(const std::string& display_name) const;
  [[nodiscard]] size_t running_count() const;
  [[nodiscard]] uint64_t last_applied_seq() const { return last_seq_; }
  [[nodiscard]] uint64_t applied_count() const { return applied_; }

private:
  herd::model::ProfileList profiles_;
  Listener listener_;
  uint64_t last_seq_{0};
  uint64_t applied_{0};
};

} // namespace herd::app
