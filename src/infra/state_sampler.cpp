#include "infra/state_sampler.hpp"

#include <stdexcept>
#include <utility>

namespace prw {

StateSampler::StateSampler(std::string counter_prefix, CounterSet& counters)
    : counter_prefix_(std::move(counter_prefix)), counters_(counters) {}

StateSampler::State StateSampler::state_for_name(const std::string& name) {
  std::lock_guard<std::mutex> lock(mu_);
  for (std::size_t i = 0; i < names_.size(); ++i) {
    if (names_[i] == name) return static_cast<State>(i);
  }
  names_.push_back(name);
  msecs_counters_.push_back(counters_.add_counter(counter_prefix_ + name + "-msecs"));
  return static_cast<State>(names_.size() - 1);
}

std::optional<std::string> StateSampler::current_state_name() const {
  const State s = current_state();
  if (s == kDoNotSample) return std::nullopt;

  std::lock_guard<std::mutex> lock(mu_);
  return names_.at(static_cast<std::size_t>(s));
}

void StateSampler::sample(std::chrono::milliseconds elapsed) {
  if (elapsed.count() < 0) {
    throw std::invalid_argument("StateSampler::sample: elapsed must be >= 0");
  }

  const State s = current_state();
  if (s == kDoNotSample) return;

  Counter* c = nullptr;
  {
    std::lock_guard<std::mutex> lock(mu_);
    c = msecs_counters_.at(static_cast<std::size_t>(s));
  }
  c->add(elapsed.count());
}

StateSampler::State StateSampler::set_state(State state) {
  return current_.exchange(state, std::memory_order_acq_rel);
}

StateSampler::ScopedState::ScopedState(StateSampler& sampler, State state)
    : sampler_(sampler), previous_(sampler.set_state(state)) {}

StateSampler::ScopedState::~ScopedState() {
  sampler_.set_state(previous_);
}

} // namespace prw
