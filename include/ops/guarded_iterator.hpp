#pragma once

#include <exception>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include "core/progress.hpp"
#include "core/source.hpp"
#include "infra/latest_store.hpp"

/*
    GuardedIterator is the only owner of a read loop's SourceIterator.

    Three parties reach the iterator: the read loop (advance, refresh, close), progress reporting
    (through the LatestStore it refreshes, never the iterator itself) and work rebalancing
    (update_stop_position). Every call goes through one mutex, taken per call and released before
    the element is handed downstream, so a split proposal waits at most for one has_next()/next()
    pair, never for a downstream process() call.

    The iterator itself is never handed out.
*/

namespace prw {

template <typename T>
class GuardedIterator {
public:
  // 'owner' only prefixes log lines
  explicit GuardedIterator(std::string owner) : owner_(std::move(owner)) {}

  GuardedIterator(const GuardedIterator&) = delete;
  GuardedIterator& operator=(const GuardedIterator&) = delete;

  void open(std::unique_ptr<SourceIterator<T>> it) {
    std::lock_guard<std::mutex> lock(mu_);
    it_ = std::move(it);
  }

  // has_next() and next() under one lock, then refreshes 'progress' if should_refresh() says so.
  // Returns std::nullopt at the end of input.
  template <typename ShouldRefresh>
  std::optional<T> next(ShouldRefresh&& should_refresh, LatestStore<Progress>& progress) {
    std::lock_guard<std::mutex> lock(mu_);
    if (!it_) throw IterationError(owner_ + ": source iterator is not open");
    if (!it_->has_next()) return std::nullopt;

    std::optional<T> value(it_->next());
    if (should_refresh()) progress.write(it_->get_progress());
    return value;
  }

  void refresh_progress(LatestStore<Progress>& progress) {
    std::lock_guard<std::mutex> lock(mu_);
    if (!it_) throw IterationError(owner_ + ": source iterator is not open");
    progress.write(it_->get_progress());
  }

  // std::nullopt (with a warning) when no iterator is open
  std::optional<Position> update_stop_position(const Progress& proposed) {
    std::lock_guard<std::mutex> lock(mu_);
    if (!it_) {
      std::cerr << "[read_operation] " << owner_
                << ": iterator has not been initialized, returning no stop position" << std::endl;
      return std::nullopt;
    }
    return it_->update_stop_position(proposed);
  }

  // Closes and drops the iterator. A failing close() is logged, never thrown, so it cannot hide
  // the outcome of the read it ends.
  void close() noexcept {
    std::unique_ptr<SourceIterator<T>> it;
    std::lock_guard<std::mutex> lock(mu_);
    it = std::move(it_);
    if (!it) return;

    try {
      it->close();
    } catch (const std::exception& e) {
      std::cerr << "[read_operation] " << owner_ << ": error closing source iterator: " << e.what() << std::endl;
    } catch (...) {
      std::cerr << "[read_operation] " << owner_ << ": unknown error closing source iterator" << std::endl;
    }
  }

private:
  const std::string owner_;
  mutable std::mutex mu_;
  std::unique_ptr<SourceIterator<T>> it_;
};

} // namespace prw
