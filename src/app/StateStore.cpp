#include "app/StateStore.hpp"

#include <algorithm>
#include <utility>

namespace herd::app {

StateStore::StateStore(herd::model::ProfileList profiles) { reset(std::move(profiles)); }

void StateStore::reset(herd::model::ProfileList profiles) {
  profiles_ = std::move(profiles);
  for (auto& p : profiles_) p.pid.reset();
}

std::vector<herd::model::PidChange> StateStore::apply(const herd::model::PidSnapshot& snap) {
  std::vector<herd::model::PidChange> changes;
  for (auto& p : profiles_) {
    const auto* observed = snap.find(p.key);
    if (!observed) continue; // snapshot predates this catalog
    if (p.pid == *observed) continue;
    changes.push_back(herd::model::PidChange{p.key, p.display_name, p.pid, *observed});
    p.pid = *observed;
  }
  if (snap.seq != 0) last_seq_ = snap.seq;
  ++applied_;
  if (listener_) {
    for (const auto& c : changes) listener_(c);
  }
  return changes;
}

std::vector<herd::model::PidChange> StateStore::drain(SnapshotQueue& queue) {
  std::vector<herd::model::PidChange> all;
  for (const auto& snap : queue.drain()) {
    auto changes = apply(snap);
    all.insert(all.end(), std::make_move_iterator(changes.begin()), std::make_move_iterator(changes.end()));
  }
  return all;
}

const herd::model::Profile* StateStore::find(const std::string& key) const {
  for (const auto& p : profiles_)
    if (p.key == key) return &p;
  return nullptr;
}

const herd::model::Profile* StateStore::find_by_name(const std::string& display_name) const {
  for (const auto& p : profiles_)
    if (p.display_name == display_name) return &p;
  return nullptr;
}

size_t StateStore::running_count() const {
  return static_cast<size_t>(std::count_if(profiles_.begin(), profiles_.end(),
                                           [](const auto& p){ return p.running(); }));
}

} // namespace herd::app
