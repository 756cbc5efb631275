#pragma once

#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "infra/counters.hpp"

/*
    StateSampler tracks which named execution state (e.g. "ReadOperation-read") the worker is in.

    Operations register their states once with state_for_name() and wrap each phase in a
    ScopedState. The scope restores the previous state when it is destroyed, so a phase is left
    exactly once on every exit path, exceptions included.

    Any thread can ask which state is active (current_state_name), and a sampling thread calls
    sample(elapsed) periodically to attribute the elapsed wall time to the active state's
    "<prefix><state>-msecs" counter.
*/

namespace prw {

class StateSampler {
public:
  using State = int;
  static constexpr State kDoNotSample = -1;

  StateSampler(std::string counter_prefix, CounterSet& counters);

  StateSampler(const StateSampler&) = delete;
  StateSampler& operator=(const StateSampler&) = delete;

  // Same name, same state
  State state_for_name(const std::string& name);

  class ScopedState {
  public:
    ScopedState(StateSampler& sampler, State state);
    ~ScopedState();

    ScopedState(const ScopedState&) = delete;
    ScopedState& operator=(const ScopedState&) = delete;

  private:
    StateSampler& sampler_;
    State previous_;
  };

  ScopedState scoped_state(State state) { return ScopedState(*this, state); }

  State current_state() const { return current_.load(std::memory_order_acquire); }

  // std::nullopt when no state is active
  std::optional<std::string> current_state_name() const;

  void sample(std::chrono::milliseconds elapsed);

private:
  State set_state(State state);

  const std::string counter_prefix_;
  CounterSet& counters_;

  mutable std::mutex mu_;
  std::vector<std::string> names_;       // indexed by State
  std::vector<Counter*> msecs_counters_; // indexed by State

  std::atomic<State> current_{kDoNotSample};
};

} // namespace prw
