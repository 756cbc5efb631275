#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

#include "core/progress.hpp"
#include "infra/counters.hpp"
#include "infra/state_sampler.hpp"

namespace prw {

// Prints one status line per call: active state, progress bar, bytes read and read rate since
// the previous call. print_counters() dumps every registered counter.
class ProgressConsole {
public:
  ProgressConsole(std::ostream& out, const Counter& bytes, const StateSampler& sampler);

  void print(const std::optional<Progress>& progress);

  void print_counters(const CounterSet& counters);

private:
  std::ostream& out_;
  const Counter& bytes_;
  const StateSampler& sampler_;

  std::chrono::steady_clock::time_point last_{std::chrono::steady_clock::now()};
  std::int64_t prev_bytes_{0};
};

} // namespace prw
