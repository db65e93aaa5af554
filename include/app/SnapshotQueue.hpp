#pragma once
#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <vector>
#include "model/Snapshot.hpp"

namespace herd::app {

// Lock-free single-producer/single-consumer ring of snapshots.
// Producer: the scanner thread. Consumer: the state store drain tick.
// try_push never blocks and drops when full; drain never blocks and
// returns everything pending in arrival order.
class SnapshotQueue {
public:
  static constexpr size_t kCapacity = 64;

  SnapshotQueue() = default;
  // Non-copyable
  SnapshotQueue(const SnapshotQueue&) = delete;
  SnapshotQueue& operator=(const SnapshotQueue&) = delete;

  [[nodiscard]] bool try_push(herd::model::PidSnapshot snap);
  [[nodiscard]] std::vector<herd::model::PidSnapshot> drain();

  [[nodiscard]] size_t size() const;
  [[nodiscard]] uint64_t pushed() const { return pushed_.load(std::memory_order_relaxed); }
  [[nodiscard]] uint64_t dropped() const { return dropped_.load(std::memory_order_relaxed); }

private:
  std::array<herd::model::PidSnapshot, kCapacity> slots_{};
  alignas(64) std::atomic<size_t> head_{0}; // next slot to read
  alignas(64) std::atomic<size_t> tail_{0}; // next slot to write
  std::atomic<uint64_t> pushed_{0};
  std::atomic<uint64_t> dropped_{0};
};

} // namespace herd::app
