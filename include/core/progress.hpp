#pragma once

#include <cstdint>
#include <optional>
#include <string>

/*
    Position and Progress describe how far a source iterator has read.

    The read loop treats both as opaque values: it stores them, compares them and hands them
    back to the source. Only sources interpret the fields, and each source fills in the ones
    that make sense for it (record index for in-memory sources, byte offset for files).
*/

namespace prw {

// A point in a source, usable as a stop boundary
struct Position {
  std::optional<std::int64_t> record_index;
  std::optional<std::int64_t> byte_offset;
};

bool operator==(const Position& a, const Position& b);
bool operator!=(const Position& a, const Position& b);

// A snapshot of "how far we are". A proposed stop position is also expressed as a Progress,
// either through an explicit position or through a fraction of the current range.
struct Progress {
  Position position;
  std::optional<double> fraction_consumed; // in [0, 1]
};

bool operator==(const Progress& a, const Progress& b);
bool operator!=(const Progress& a, const Progress& b);

Progress ProgressAtRecord(std::int64_t record_index);
Progress ProgressAtByteOffset(std::int64_t byte_offset);
// Throws std::invalid_argument outside [0, 1]
Progress ProgressAtFraction(double fraction);

std::string ToString(const Position& p);
std::string ToString(const Progress& p);
std::string ToString(const std::optional<Position>& p);
std::string ToString(const std::optional<Progress>& p);

} // namespace prw
