#include "app/SnapshotQueue.hpp"

#include <utility>

namespace herd::app {

bool SnapshotQueue::try_push(herd::model::PidSnapshot snap) {
  auto tail = tail_.load(std::memory_order_relaxed);
  auto head = head_.load(std::memory_order_acquire);
  if (tail - head >= kCapacity) {
    dropped_.fetch_add(1, std::memory_order_relaxed);
    return false;
  }
  slots_[tail % kCapacity] = std::move(snap);
  // publish the slot
  tail_.store(tail + 1, std::memory_order_release);
  pushed_.fetch_add(1, std::memory_order_relaxed);
  return true;
}

std::vector<herd::model::PidSnapshot> SnapshotQueue::drain() {
  std::vector<herd::model::PidSnapshot> out;
  auto head = head_.load(std::memory_order_relaxed);
  auto tail = tail_.load(std::memory_order_acquire);
  out.reserve(tail - head);
  for (; head != tail; ++head) out.push_back(std::move(slots_[head % kCapacity]));
  // hand the slots back to the producer
  head_.store(head, std::memory_order_release);
  return out;
}

size_t SnapshotQueue::size() const {
  return tail_.load(std::memory_order_acquire) - head_.load(std::memory_order_acquire);
}

} // namespace herd::app
