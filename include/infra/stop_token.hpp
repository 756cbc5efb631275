#pragma once
#include <atomic>

/*
    StopToken / StopSource is a small utility for cooperative cancellation.

    The StopSource is owned by whoever may cancel work (read_worker.cpp owns one for the
    whole process, tests own one per scenario).

    A StopToken is a read-only view into a StopSource. The read loop checks it at every
    record boundary, so a cancelled read fails with ReadCancelled after its normal cleanup.

    A default constructed StopToken is never stopped.
*/

namespace prw {

class StopToken {
public:
  StopToken() = default;
  explicit StopToken(const std::atomic_bool* flag) : flag_(flag) {}

  bool stop_requested() const {
    return flag_ && flag_->load(std::memory_order_acquire);
  }

private:
  const std::atomic_bool* flag_ = nullptr;
};

class StopSource {
public:
  StopSource() = default;

  StopSource(const StopSource&) = delete;
  StopSource& operator=(const StopSource&) = delete;

  StopToken token() const { return StopToken(&stop_); }

  // Same method names as ThreadRunner
  void request_stop() { stop_.store(true, std::memory_order_release); }

  bool stop_requested() const { return stop_.load(std::memory_order_acquire); }

private:
  std::atomic_bool stop_{false};
};

} // namespace prw
