#include "infra/thread_runner.hpp"

#include <stdexcept>
#include <utility>

namespace prw {

ThreadRunner::ThreadRunner(std::string name) : name_(std::move(name)) {}

ThreadRunner::~ThreadRunner() {
  request_stop();
  if (thread_.joinable()) thread_.join();
}

void ThreadRunner::start(StopToken global_stop, Fn fn) {
  if (thread_.joinable()) {
    throw std::runtime_error("ThreadRunner '" + name_ + "' already started");
  }

  local_stop_.store(false, std::memory_order_relaxed);
  finished_.store(false, std::memory_order_relaxed);
  error_ = nullptr;
  global_stop_ = global_stop;

  thread_ = std::thread([this, fn = std::move(fn)]() mutable {
    try {
      fn(global_stop_, local_stop_);
    } catch (...) {
      // Handed back to the owner through join()
      error_ = std::current_exception();
    }
    finished_.store(true, std::memory_order_release);
  });
}

void ThreadRunner::request_stop() {
  {
    std::lock_guard<std::mutex> lock(wait_mu_);
    local_stop_.store(true, std::memory_order_relaxed);
  }
  wait_cv_.notify_all();
}

bool ThreadRunner::stop_requested() const {
  return global_stop_.stop_requested() || local_stop_.load(std::memory_order_relaxed);
}

bool ThreadRunner::wait_for(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(wait_mu_);
  return wait_cv_.wait_for(lock, timeout, [this] { return stop_requested(); });
}

void ThreadRunner::join() {
  if (thread_.joinable()) thread_.join();

  if (error_) {
    std::exception_ptr e = std::move(error_);
    error_ = nullptr;
    std::rethrow_exception(e);
  }
}

bool ThreadRunner::joinable() const {
  return thread_.joinable();
}

} // namespace prw
