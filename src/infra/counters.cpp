#include "infra/counters.hpp"

#include <stdexcept>

namespace prw {

void Counter::add(std::int64_t delta) {
  if (delta < 0) {
    throw std::invalid_argument("Counter '" + name_ + "' is monotonic, got delta " + std::to_string(delta));
  }
  value_.fetch_add(delta, std::memory_order_relaxed);
}

Counter* CounterSet::add_counter(const std::string& name) {
  std::lock_guard<std::mutex> lock(mu_);
  for (const auto& c : counters_) {
    if (c->name() == name) return c.get();
  }
  counters_.push_back(std::make_unique<Counter>(name));
  return counters_.back().get();
}

Counter* CounterSet::find(const std::string& name) const {
  std::lock_guard<std::mutex> lock(mu_);
  for (const auto& c : counters_) {
    if (c->name() == name) return c.get();
  }
  return nullptr;
}

std::vector<std::pair<std::string, std::int64_t>> CounterSet::snapshot() const {
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<std::pair<std::string, std::int64_t>> out;
  out.reserve(counters_.size());
  for (const auto& c : counters_) out.emplace_back(c->name(), c->value());
  return out;
}

std::size_t CounterSet::size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return counters_.size();
}

} // namespace prw
