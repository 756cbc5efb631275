#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

/*
  counters.hpp implements CounterSet, an object owned by the worker that stores every counter its
  operations register, and Counter, a named monotonic sum. Operations never create counters
  directly, they ask the CounterSet (the "mutator") so that two operations registering the same
  name share one counter.
*/

namespace prw {

// Counter is a named running total. Increments are atomic adds, so several threads (or several
// operations sharing a name) may add concurrently. Deltas must be >= 0, the value never decreases.
class Counter {
public:
  explicit Counter(std::string name) : name_(std::move(name)) {}

  Counter(const Counter&) = delete;
  Counter& operator=(const Counter&) = delete;

  // Throws std::invalid_argument on a negative delta
  void add(std::int64_t delta);

  std::int64_t value() const { return value_.load(std::memory_order_relaxed); }

  const std::string& name() const { return name_; }

private:
  const std::string name_;
  std::atomic<std::int64_t> value_{0};
};

class CounterSet {
public:
  CounterSet() = default;

  CounterSet(const CounterSet&) = delete;
  CounterSet& operator=(const CounterSet&) = delete;

  // Registers a counter, or returns the one already registered under 'name'.
  // The pointer stays valid for the lifetime of the set.
  Counter* add_counter(const std::string& name);

  // nullptr if no counter has that name
  Counter* find(const std::string& name) const;

  // (name, value) pairs in registration order
  std::vector<std::pair<std::string, std::int64_t>> snapshot() const;

  std::size_t size() const;

private:
  mutable std::mutex mu_;
  std::vector<std::unique_ptr<Counter>> counters_;
};

} // namespace prw
