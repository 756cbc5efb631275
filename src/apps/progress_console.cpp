#include "apps/progress_console.hpp"

#include <algorithm>
#include <iomanip>

namespace prw {

static constexpr const char* kReset = "\033[0m";
static constexpr const char* kGreen = "\033[32m";
static constexpr const char* kYellow= "\033[33m";

// Fill a simple bar based on the consumed fraction
static std::string Bar(double frac, std::size_t width) {
  frac = std::max(0.0, std::min(1.0, frac));
  const std::size_t filled = static_cast<std::size_t>(frac * static_cast<double>(width));
  std::string s;
  s.reserve(width);
  for (std::size_t i = 0; i < width; ++i) s.push_back(i < filled ? 'I' : '_');
  return s;
}

ProgressConsole::ProgressConsole(std::ostream& out, const Counter& bytes, const StateSampler& sampler)
    : out_(out), bytes_(bytes), sampler_(sampler) {}

void ProgressConsole::print(const std::optional<Progress>& progress) {
  using namespace std::chrono;

  const auto now = steady_clock::now();
  const double dt = duration_cast<duration<double>>(now - last_).count();
  last_ = now;

  const std::int64_t bytes = bytes_.value();
  const double kib_ps = (dt > 0) ? (static_cast<double>(bytes - prev_bytes_) / 1024.0 / dt) : 0.0;
  prev_bytes_ = bytes;

  const auto state = sampler_.current_state_name();

  out_ << std::left << std::setw(28) << state.value_or("idle");

  if (progress && progress->fraction_consumed) {
    const double f = *progress->fraction_consumed;
    const char* color = (f >= 1.0) ? kGreen : kYellow;
    out_ << color << "[" << Bar(f, 24) << "] " << std::right << std::setw(6) << std::fixed
         << std::setprecision(1) << (f * 100.0) << "%" << kReset;
  } else {
    out_ << "[" << std::string(24, '.') << "]    n/a";
  }

  out_ << "  pos=" << (progress ? ToString(progress->position) : std::string("none"))
       << "  bytes=" << bytes
       << "  KiB/s=" << std::fixed << std::setprecision(1) << kib_ps
       << std::endl;
}

void ProgressConsole::print_counters(const CounterSet& counters) {
  out_ << "COUNTERS\n";
  for (const auto& kv : counters.snapshot()) {
    out_ << "  " << std::left << std::setw(36) << kv.first << kv.second << "\n";
  }
  out_ << std::flush;
}

} // namespace prw
