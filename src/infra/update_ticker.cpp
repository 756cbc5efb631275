#include "infra/update_ticker.hpp"

#include <stdexcept>
#include <utility>

namespace prw {

UpdateTicker::UpdateTicker(std::string name, std::chrono::milliseconds period, std::atomic_bool& flag)
    : period_(period), flag_(flag), runner_(std::move(name)) {
  if (period_.count() <= 0) {
    throw std::invalid_argument("UpdateTicker '" + runner_.name() + "': period must be > 0");
  }
}

UpdateTicker::~UpdateTicker() {
  runner_.request_stop();
  // ThreadRunner's destructor joins
}

void UpdateTicker::start() {
  runner_.start(StopToken{}, [this](const StopToken&, const std::atomic_bool&) {
    while (!runner_.wait_for(period_)) {
      flag_.store(true, std::memory_order_release);
    }
  });
}

void UpdateTicker::stop() {
  runner_.request_stop();
  runner_.join();
}

} // namespace prw
