#pragma once

#include <cmath>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "core/progress.hpp"
#include "core/source.hpp"

/*
    InMemorySource reads the records [start, stop) of a vector.

    Positions are record indices. Progress reports the index of the next record to be returned
    and the fraction of the current range consumed so far.

    A proposed stop index (given directly, or as a fraction of the current range) is accepted if
    it is past the start, not before the next unread record and strictly before the current stop.
    Everything else is refused: a stop at or before a record that was already returned would
    take back work that has been done.
*/

namespace prw {

template <typename T>
class InMemorySource final : public Source<T> {
public:
  // Size in bytes reported for each element
  using Sizer = std::function<std::int64_t(const T&)>;

  InMemorySource(std::vector<T> elements, Sizer sizer, std::int64_t start = 0,
                 std::optional<std::int64_t> stop = std::nullopt)
      : elements_(std::make_shared<const std::vector<T>>(std::move(elements))),
        sizer_(std::move(sizer)),
        start_(start),
        stop_(stop ? *stop : static_cast<std::int64_t>(elements_->size())) {
    if (!sizer_) throw std::invalid_argument("InMemorySource: sizer must be set");
    if (start_ < 0 || start_ > stop_ || stop_ > static_cast<std::int64_t>(elements_->size())) {
      throw std::invalid_argument("InMemorySource: invalid range [" + std::to_string(start_) + ", " +
                                  std::to_string(stop_) + ") for " + std::to_string(elements_->size()) +
                                  " elements");
    }
  }

  std::unique_ptr<SourceIterator<T>> iterator(BytesReadFn on_bytes_read) const override {
    return std::make_unique<Iterator>(*this, std::move(on_bytes_read));
  }

  std::int64_t start() const { return start_; }
  std::int64_t stop() const { return stop_; }

private:
  class Iterator final : public SourceIterator<T> {
  public:
    Iterator(const InMemorySource& source, BytesReadFn on_bytes_read)
        : origin_(source),
          elements_(source.elements_),
          sizer_(source.sizer_),
          on_bytes_read_(std::move(on_bytes_read)),
          start_(source.start_),
          next_(source.start_),
          stop_(source.stop_) {}

    bool has_next() override {
      return !closed_ && next_ < stop_;
    }

    T next() override {
      if (closed_) throw IterationError("InMemorySource: next() after close()");
      if (next_ >= stop_) throw IterationError("InMemorySource: no more elements");

      T value = (*elements_)[static_cast<std::size_t>(next_)];
      ++next_;
      if (on_bytes_read_) on_bytes_read_(origin_, sizer_(value));
      return value;
    }

    std::optional<Progress> get_progress() override {
      Progress p = ProgressAtRecord(next_);
      p.fraction_consumed = (stop_ == start_)
                                ? 1.0
                                : static_cast<double>(next_ - start_) / static_cast<double>(stop_ - start_);
      return p;
    }

    std::optional<Position> update_stop_position(const Progress& proposed) override {
      if (closed_) return std::nullopt;

      std::int64_t index = 0;
      if (proposed.position.record_index) {
        index = *proposed.position.record_index;
      } else if (proposed.fraction_consumed) {
        const double f = *proposed.fraction_consumed;
        if (!(f >= 0.0 && f <= 1.0)) return std::nullopt;
        index = start_ + static_cast<std::int64_t>(std::ceil(f * static_cast<double>(stop_ - start_)));
      } else {
        return std::nullopt;
      }

      if (index <= start_ || index < next_ || index >= stop_) return std::nullopt;

      stop_ = index;
      Position accepted;
      accepted.record_index = stop_;
      return accepted;
    }

    void close() override { closed_ = true; }

  private:
    const SourceBase& origin_;
    std::shared_ptr<const std::vector<T>> elements_;
    Sizer sizer_;
    BytesReadFn on_bytes_read_;

    const std::int64_t start_;
    std::int64_t next_;
    std::int64_t stop_;
    bool closed_{false};
  };

  std::shared_ptr<const std::vector<T>> elements_;
  Sizer sizer_;
  std::int64_t start_;
  std::int64_t stop_;
};

} // namespace prw
