#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "core/progress.hpp"
#include "core/receiver.hpp"
#include "core/source.hpp"
#include "infra/counters.hpp"
#include "infra/latest_store.hpp"
#include "infra/state_sampler.hpp"
#include "infra/stop_token.hpp"
#include "infra/update_ticker.hpp"
#include "ops/guarded_iterator.hpp"
#include "ops/operation.hpp"

/*
    ReadOperation drives a Source to completion and forwards every element to receiver 0.

    While it runs it keeps two pieces of side state:
      - a progress cache, refreshed from the iterator at most once per progress update period
        (and once before the first and after the last element), so get_progress() answers
        immediately even while next() is blocked on I/O;
      - the "<name>-ByteCount" counter, fed by the iterator's bytes-read callback.

    A rebalancing controller may shrink the remaining range at any time through
    propose_stop_position(). The proposal is served between two records.

    start() runs the loop on the calling thread. Whatever way it exits, the iterator is closed
    first and the progress ticker thread is stopped and joined second.
*/

namespace prw {

// Thrown by ReadOperation::start() when its stop token fires
class ReadCancelled : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

template <typename T>
class ReadOperation final : public Operation {
public:
  static constexpr std::chrono::milliseconds kDefaultProgressUpdatePeriod{1000};

  ReadOperation(std::string name, std::shared_ptr<const Source<T>> source, std::vector<Receiver<T>*> receivers,
                std::string counter_prefix, CounterSet& counters, StateSampler& sampler)
      : Operation(std::move(name), std::move(counter_prefix), counters, sampler),
        source_(std::move(source)),
        receivers_(std::move(receivers)),
        byte_count_(counters_.add_counter(BytesCounterName(this->name()))),
        read_state_(sampler_.state_for_name(this->name() + "-read")),
        iterator_(this->name()) {
    if (!source_) {
      throw std::invalid_argument("ReadOperation '" + this->name() + "': source must not be null");
    }
  }

  static std::string BytesCounterName(const std::string& operation_name) {
    return operation_name + "-ByteCount";
  }

  // 0 means "refresh progress after every record". Must be set before start()
  void set_progress_update_period(std::chrono::milliseconds period) {
    if (period.count() < 0) {
      throw std::invalid_argument("Progress update period must be non-negative");
    }
    if (initialization_state() != InitializationState::Unstarted) {
      throw std::logic_error("ReadOperation '" + name() + "': progress update period cannot change after start");
    }
    progress_update_period_ = period;
  }

  std::chrono::milliseconds progress_update_period() const { return progress_update_period_; }

  void start(const StopToken& stop) override {
    auto starting = sampler_.scoped_state(start_state_);
    Operation::start(stop);
    run_read_loop(stop);
  }

  // Possibly stale by one update period. std::nullopt until the loop has opened its iterator.
  // Never blocks.
  std::optional<Progress> get_progress() const {
    return progress_.read_latest();
  }

  // Relays the proposal to the iterator and returns its answer verbatim. std::nullopt when the
  // iterator does not exist (not started yet, no receiver, or already closed).
  std::optional<Position> propose_stop_position(const Progress& proposed) {
    return iterator_.update_stop_position(proposed);
  }

  const Source<T>& source() const { return *source_; }

  const Counter& byte_count() const { return *byte_count_; }

private:
  // Closes the iterator when the loop scope unwinds
  class IteratorCloser {
  public:
    explicit IteratorCloser(GuardedIterator<T>& it) : it_(it) {}
    ~IteratorCloser() { it_.close(); }

    IteratorCloser(const IteratorCloser&) = delete;
    IteratorCloser& operator=(const IteratorCloser&) = delete;

  private:
    GuardedIterator<T>& it_;
  };

  void run_read_loop(const StopToken& stop) {
    Receiver<T>* receiver = receivers_.empty() ? nullptr : receivers_.front();
    if (receiver == nullptr) {
      // Nobody consumes the output
      return;
    }

    auto processing = sampler_.scoped_state(process_state_);

    const bool refresh_every_record = progress_update_period_.count() == 0;

    // Declared before the closer so that it is destroyed (stopped and joined) after the iterator is closed
    std::optional<UpdateTicker> ticker;

    iterator_.open(source_->iterator([this](const SourceBase& origin, std::int64_t bytes) {
      on_bytes_read(origin, bytes);
    }));
    IteratorCloser closer(iterator_);

    if (!refresh_every_record) {
      ticker.emplace(name() + "-progress", progress_update_period_, progress_update_requested_);
      ticker->start();
    }

    iterator_.refresh_progress(progress_);

    auto should_refresh = [this, refresh_every_record] {
      return progress_update_requested_.exchange(false, std::memory_order_acq_rel) || refresh_every_record;
    };

    while (true) {
      if (stop.stop_requested()) {
        throw ReadCancelled("ReadOperation '" + name() + "' cancelled");
      }

      std::optional<T> value;
      {
        auto reading = sampler_.scoped_state(read_state_);
        value = iterator_.next(should_refresh, progress_);
      }
      if (!value) break;

      receiver->process(std::move(*value));
    }

    iterator_.refresh_progress(progress_);
  }

  void on_bytes_read(const SourceBase& origin, std::int64_t bytes) {
    if (&origin != static_cast<const SourceBase*>(source_.get())) {
      throw std::invalid_argument("ReadOperation '" + name() + "': bytes-read notification from an unexpected source");
    }
    if (bytes < 0) {
      throw std::invalid_argument("ReadOperation '" + name() + "': bytes-read notification with negative size " +
                                  std::to_string(bytes));
    }
    byte_count_->add(bytes);
  }

  const std::shared_ptr<const Source<T>> source_;
  const std::vector<Receiver<T>*> receivers_;
  Counter* const byte_count_;
  const StateSampler::State read_state_;

  GuardedIterator<T> iterator_;
  LatestStore<Progress> progress_;

  std::chrono::milliseconds progress_update_period_{kDefaultProgressUpdatePeriod};
  std::atomic_bool progress_update_requested_{true};
};

} // namespace prw
