#include "sources/text_file_source.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <stdexcept>
#include <utility>

#include "core/progress.hpp"

namespace prw {

class TextFileSource::Iterator final : public SourceIterator<std::string> {
public:
  Iterator(const TextFileSource& source, BytesReadFn on_bytes_read)
      : origin_(source), on_bytes_read_(std::move(on_bytes_read)), start_(source.start_offset_) {
    in_.open(source.path_, std::ios::binary);
    if (!in_) throw std::runtime_error("Failed to open file: " + source.path_);

    in_.seekg(0, std::ios::end);
    const std::int64_t file_size = static_cast<std::int64_t>(in_.tellg());
    // An end past EOF would leave the fraction short of 1 and let splits land on no data
    end_ = source.end_offset_ ? std::min(*source.end_offset_, file_size) : file_size;

    // The line containing start_ - 1 started in the previous range
    offset_ = std::min(start_, file_size);
    if (start_ > 0 && start_ <= file_size) {
      in_.seekg(start_ - 1);
      std::string partial;
      std::getline(in_, partial);
      offset_ = start_ - 1 + static_cast<std::int64_t>(partial.size()) + (in_.eof() ? 0 : 1);
      if (in_.eof()) exhausted_ = true;
    } else if (start_ > file_size) {
      exhausted_ = true;
    } else {
      in_.seekg(0);
    }
  }

  bool has_next() override {
    if (closed_ || offset_ >= end_) return false;
    return peek();
  }

  std::string next() override {
    if (closed_) throw IterationError("TextFileSource: next() after close()");
    if (!has_next()) throw IterationError("TextFileSource: no more records");

    std::string line = std::move(*pending_);
    const std::int64_t consumed = pending_bytes_;
    pending_.reset();

    last_record_start_ = offset_;
    offset_ += consumed;

    if (!line.empty() && line.back() == '\r') line.pop_back();

    if (on_bytes_read_) on_bytes_read_(origin_, consumed);
    return line;
  }

  std::optional<Progress> get_progress() override {
    Progress p = ProgressAtByteOffset(offset_);
    if (end_ <= start_) {
      p.fraction_consumed = 1.0;
    } else {
      const double f = static_cast<double>(offset_ - start_) / static_cast<double>(end_ - start_);
      p.fraction_consumed = std::max(0.0, std::min(1.0, f));
    }
    return p;
  }

  std::optional<Position> update_stop_position(const Progress& proposed) override {
    if (closed_) return std::nullopt;

    std::int64_t offset = 0;
    if (proposed.position.byte_offset) {
      offset = *proposed.position.byte_offset;
    } else if (proposed.fraction_consumed) {
      const double f = *proposed.fraction_consumed;
      if (!(f >= 0.0 && f <= 1.0)) return std::nullopt;
      offset = start_ + static_cast<std::int64_t>(std::ceil(f * static_cast<double>(end_ - start_)));
    } else {
      return std::nullopt;
    }

    // Records starting before the new end stay in this range, so the last returned one must
    const std::int64_t lower = last_record_start_ ? *last_record_start_ : start_;
    if (offset <= lower || offset >= end_) return std::nullopt;

    end_ = offset;
    Position accepted;
    accepted.byte_offset = end_;
    return accepted;
  }

  void close() override {
    closed_ = true;
    pending_.reset();
    in_.close();
  }

private:
  // Reads the next line ahead, once
  bool peek() {
    if (pending_) return true;
    if (exhausted_) return false;

    std::string line;
    if (!std::getline(in_, line)) {
      exhausted_ = true;
      return false;
    }
    pending_bytes_ = static_cast<std::int64_t>(line.size()) + (in_.eof() ? 0 : 1);
    pending_ = std::move(line);
    if (in_.eof()) exhausted_ = true;
    return true;
  }

  const SourceBase& origin_;
  BytesReadFn on_bytes_read_;
  std::ifstream in_;

  const std::int64_t start_;
  std::int64_t end_{0};
  std::int64_t offset_{0}; // start of the next record
  std::optional<std::int64_t> last_record_start_;

  std::optional<std::string> pending_;
  std::int64_t pending_bytes_{0};
  bool exhausted_{false};
  bool closed_{false};
};

TextFileSource::TextFileSource(std::string path, std::int64_t start_offset, std::optional<std::int64_t> end_offset)
    : path_(std::move(path)), start_offset_(start_offset), end_offset_(end_offset) {
  if (path_.empty()) throw std::invalid_argument("TextFileSource: path must not be empty");
  if (start_offset_ < 0) throw std::invalid_argument("TextFileSource: start_offset must be >= 0");
  if (end_offset_ && *end_offset_ < start_offset_) {
    throw std::invalid_argument("TextFileSource: end_offset must be >= start_offset");
  }
}

std::unique_ptr<SourceIterator<std::string>> TextFileSource::iterator(BytesReadFn on_bytes_read) const {
  return std::make_unique<Iterator>(*this, std::move(on_bytes_read));
}

} // namespace prw
