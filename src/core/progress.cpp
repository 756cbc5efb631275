#include "core/progress.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace prw {

bool operator==(const Position& a, const Position& b) {
  return a.record_index == b.record_index && a.byte_offset == b.byte_offset;
}

bool operator!=(const Position& a, const Position& b) { return !(a == b); }

bool operator==(const Progress& a, const Progress& b) {
  return a.position == b.position && a.fraction_consumed == b.fraction_consumed;
}

bool operator!=(const Progress& a, const Progress& b) { return !(a == b); }

Progress ProgressAtRecord(std::int64_t record_index) {
  Progress p;
  p.position.record_index = record_index;
  return p;
}

Progress ProgressAtByteOffset(std::int64_t byte_offset) {
  Progress p;
  p.position.byte_offset = byte_offset;
  return p;
}

Progress ProgressAtFraction(double fraction) {
  if (!(fraction >= 0.0 && fraction <= 1.0)) {
    throw std::invalid_argument("fraction must be in [0, 1]");
  }
  Progress p;
  p.fraction_consumed = fraction;
  return p;
}

std::string ToString(const Position& p) {
  std::ostringstream oss;
  oss << "{";
  bool first = true;
  if (p.record_index) {
    oss << "record=" << *p.record_index;
    first = false;
  }
  if (p.byte_offset) {
    if (!first) oss << ", ";
    oss << "offset=" << *p.byte_offset;
  }
  oss << "}";
  return oss.str();
}

std::string ToString(const Progress& p) {
  std::ostringstream oss;
  oss << "{position=" << ToString(p.position);
  if (p.fraction_consumed) {
    oss << ", fraction=" << std::fixed << std::setprecision(3) << *p.fraction_consumed;
  }
  oss << "}";
  return oss.str();
}

std::string ToString(const std::optional<Position>& p) {
  return p ? ToString(*p) : "none";
}

std::string ToString(const std::optional<Progress>& p) {
  return p ? ToString(*p) : "none";
}

} // namespace prw
