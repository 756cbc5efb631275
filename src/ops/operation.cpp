#include "ops/operation.hpp"

#include <stdexcept>
#include <utility>

namespace prw {

Operation::Operation(std::string name, std::string counter_prefix, CounterSet& counters, StateSampler& sampler)
    : counters_(counters),
      sampler_(sampler),
      start_state_(sampler.state_for_name(name + "-start")),
      process_state_(sampler.state_for_name(name + "-process")),
      finish_state_(sampler.state_for_name(name + "-finish")),
      name_(std::move(name)),
      counter_prefix_(std::move(counter_prefix)) {}

Operation::~Operation() = default;

void Operation::start(const StopToken&) {
  InitializationState expected = InitializationState::Unstarted;
  if (!init_state_.compare_exchange_strong(expected, InitializationState::Started)) {
    throw std::logic_error("Operation '" + name_ + "' has already been started");
  }
}

void Operation::finish() {
  auto finish = sampler_.scoped_state(finish_state_);
  InitializationState expected = InitializationState::Started;
  if (!init_state_.compare_exchange_strong(expected, InitializationState::Finished)) {
    throw std::logic_error("Operation '" + name_ + "' cannot finish, it was never started or already finished");
  }
}

} // namespace prw
