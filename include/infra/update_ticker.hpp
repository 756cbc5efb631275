#pragma once

#include <atomic>
#include <chrono>
#include <string>

#include "infra/thread_runner.hpp"

/*
    UpdateTicker raises a shared "update requested" flag once per period on its own thread.

    It does no other work: the consumer (the read loop) test-and-clears the flag on its next
    iteration and does the expensive refresh itself. This keeps the refresh rate bounded by the
    period without ever forcing a refresh from another thread.

    The first raise happens one full period after start; the owner decides whether an update is
    due before that. stop() wakes the ticker out of its wait and joins it, so it returns promptly
    whatever the period is.
*/

namespace prw {

class UpdateTicker {
public:
  // period must be > 0
  UpdateTicker(std::string name, std::chrono::milliseconds period, std::atomic_bool& flag);

  UpdateTicker(const UpdateTicker&) = delete;
  UpdateTicker& operator=(const UpdateTicker&) = delete;

  // Stops and joins if still running
  ~UpdateTicker();

  void start();
  // Idempotent
  void stop();

  bool running() const { return runner_.joinable(); }

  std::chrono::milliseconds period() const { return period_; }

private:
  const std::chrono::milliseconds period_;
  std::atomic_bool& flag_;
  ThreadRunner runner_;
};

} // namespace prw
