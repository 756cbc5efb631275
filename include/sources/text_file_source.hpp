#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "core/source.hpp"

/*
    TextFileSource reads the newline-delimited records of a file whose first byte lies in
    [start_offset, end_offset). A range that does not start at 0 skips the partial line it
    starts in, since that line belongs to the previous range.

    Elements are the lines without their terminator ("\n" or "\r\n"); the byte count reported
    for each line includes the terminator, so the byte counter ends at the number of bytes the
    range covers.

    Positions are byte offsets of record starts. A stop proposal (offset or fraction of the range)
    is accepted if it lies after the start of the last returned record and before the current end.
*/

namespace prw {

class TextFileSource final : public Source<std::string> {
public:
  // std::nullopt end_offset means "to the end of the file".
  // Throws std::invalid_argument on an empty path or an invalid range
  explicit TextFileSource(std::string path, std::int64_t start_offset = 0,
                          std::optional<std::int64_t> end_offset = std::nullopt);

  // Throws std::runtime_error if the file cannot be opened
  std::unique_ptr<SourceIterator<std::string>> iterator(BytesReadFn on_bytes_read) const override;

  const std::string& path() const { return path_; }
  std::int64_t start_offset() const { return start_offset_; }
  const std::optional<std::int64_t>& end_offset() const { return end_offset_; }

private:
  class Iterator;

  std::string path_;
  std::int64_t start_offset_;
  std::optional<std::int64_t> end_offset_;
};

} // namespace prw
