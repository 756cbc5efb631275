#pragma once

#include <atomic>
#include <string>

#include "infra/counters.hpp"
#include "infra/state_sampler.hpp"
#include "infra/stop_token.hpp"

namespace prw {

// Base of every worker operation: a name, the counters and state sampler it reports into,
// and the Unstarted -> Started -> Finished lifecycle.
class Operation {
public:
  enum class InitializationState {
    Unstarted,
    Started,
    Finished
  };

  Operation(std::string name, std::string counter_prefix, CounterSet& counters, StateSampler& sampler);
  virtual ~Operation();

  Operation(const Operation&) = delete;
  Operation& operator=(const Operation&) = delete;

  // Throws std::logic_error unless Unstarted
  virtual void start(const StopToken& stop);
  // Throws std::logic_error unless Started
  virtual void finish();

  InitializationState initialization_state() const { return init_state_.load(std::memory_order_acquire); }

  const std::string& name() const { return name_; }
  const std::string& counter_prefix() const { return counter_prefix_; }

protected:
  CounterSet& counters_;
  StateSampler& sampler_;

  const StateSampler::State start_state_;
  const StateSampler::State process_state_;
  const StateSampler::State finish_state_;

private:
  std::string name_;
  std::string counter_prefix_;
  std::atomic<InitializationState> init_state_{InitializationState::Unstarted};
};

} // namespace prw
