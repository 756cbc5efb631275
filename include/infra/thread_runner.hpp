#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

#include "infra/stop_token.hpp"

/*
    ThreadRunner owns one worker thread. It provides:
        - Consistent start/stop behavior
        - A local stop flag for stopping the singular worker thread
        - Read-only access to a global stop token for whole-process shutdowns
        - An interruptible wait, so a thread sleeping between ticks wakes up as soon as
          request_stop() is called instead of finishing its sleep
        - Exception capture: whatever the worker function throws is rethrown by join()
*/

namespace prw {

class ThreadRunner {
public:
  // Any callable that takes a global stop token and a local stop flag, and returns nothing
  using Fn = std::function<void(const StopToken&, const std::atomic_bool&)>;

  ThreadRunner() = default;
  explicit ThreadRunner(std::string name);

  ThreadRunner(const ThreadRunner&) = delete;
  ThreadRunner& operator=(const ThreadRunner&) = delete;

  // Requests stop and joins. Never throws, a captured worker exception is dropped here
  ~ThreadRunner();

  // Throws std::runtime_error if the thread is already running
  void start(StopToken global_stop, Fn fn);

  // Request this specific thread to stop and wake it if it is inside wait_for(). Does NOT affect other threads
  void request_stop();
  // Returns true if either global or local stop flags are true
  bool stop_requested() const;

  // Sleeps up to 'timeout'. Returns true if a stop was requested (early wake-up or not)
  bool wait_for(std::chrono::milliseconds timeout);

  // Joins the thread and rethrows the exception the worker function exited with, if any
  void join();
  bool joinable() const;

  // True once the worker function has returned or thrown
  bool finished() const { return finished_.load(std::memory_order_acquire); }

  const std::string& name() const { return name_; }

private:
  std::thread thread_;
  std::atomic_bool local_stop_{false};
  std::atomic_bool finished_{false};
  StopToken global_stop_{};
  std::string name_{"thread"};

  std::mutex wait_mu_;
  std::condition_variable wait_cv_;

  std::exception_ptr error_;  // written by the worker, read after join
};

} // namespace prw
