#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <utility>

/*
    LatestStore is the progress cache of the read loop.

    The read loop is the only writer. It refreshes the store from the source iterator at a
    bounded rate, while it holds the iterator lock, so every stored value describes a cursor
    state that actually existed.

    Readers are progress reporters running on other threads. They must never wait on a read
    that is blocked on I/O, so a read is one atomic load of a shared pointer: no lock is
    shared with the writer, and a reader gets either the previous or the new snapshot, never a
    torn one.

    The stored value may be stale by up to one refresh period plus one record's processing time.
    Before the first write read_latest() returns std::nullopt ("not started yet").
*/

namespace prw {

template <typename T>
class LatestStore {
public:
  LatestStore() = default;

  LatestStore(const LatestStore&) = delete;
  LatestStore& operator=(const LatestStore&) = delete;

  // Plain overwrite, last write wins
  void write(T value) {
    std::atomic_store_explicit(&latest_, std::make_shared<const T>(std::move(value)),
                               std::memory_order_release);
    version_.fetch_add(1, std::memory_order_acq_rel);
  }

  // Writing std::nullopt empties the store
  void write(std::optional<T> value) {
    if (value) {
      write(std::move(*value));
      return;
    }
    std::atomic_store_explicit(&latest_, std::shared_ptr<const T>(), std::memory_order_release);
    version_.fetch_add(1, std::memory_order_acq_rel);
  }

  std::optional<T> read_latest() const {
    const std::shared_ptr<const T> snapshot = std::atomic_load_explicit(&latest_, std::memory_order_acquire);
    if (!snapshot) return std::nullopt;
    return *snapshot;
  }

  // Number of writes so far
  std::uint64_t version() const {
    return version_.load(std::memory_order_acquire);
  }

  bool has_value() const {
    return static_cast<bool>(std::atomic_load_explicit(&latest_, std::memory_order_acquire));
  }

private:
  std::shared_ptr<const T> latest_;
  std::atomic<std::uint64_t> version_{0};
};

} // namespace prw
