#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>

#include "core/progress.hpp"

/*
    Source / SourceIterator contract.

    A Source is an immutable description of where data comes from. iterator() binds a fresh
    cursor over it and may throw (I/O, bad configuration) before producing anything.

    The iterator is driven by exactly one read loop, which serializes every call under its own
    lock, so implementations do not need to be thread safe. They must however keep
    get_progress() and update_stop_position() cheap: they are answered between two records and
    must not start new I/O.

    Byte accounting goes through the BytesReadFn handed to iterator(): next() calls it once per
    produced element with that element's size, passing the Source itself as origin.
*/

namespace prw {

// Thrown by next() past the end or after close()
class IterationError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class SourceBase {
public:
  virtual ~SourceBase() = default;
};

using BytesReadFn = std::function<void(const SourceBase& origin, std::int64_t bytes)>;

template <typename T>
class SourceIterator {
public:
  virtual ~SourceIterator() = default;

  // No side effects. false is the only normal end of input
  virtual bool has_next() = 0;

  // Advances by exactly one record
  virtual T next() = 0;

  // std::nullopt if the source cannot tell
  virtual std::optional<Progress> get_progress() { return std::nullopt; }

  // Returns the accepted (possibly adjusted) stop position, or std::nullopt if refused
  virtual std::optional<Position> update_stop_position(const Progress& proposed) {
    (void)proposed;
    return std::nullopt;
  }

  virtual void close() = 0;
};

template <typename T>
class Source : public SourceBase {
public:
  using value_type = T;

  virtual std::unique_ptr<SourceIterator<T>> iterator(BytesReadFn on_bytes_read) const = 0;
};

} // namespace prw
