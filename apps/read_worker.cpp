#include <iostream>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <thread>

// Utilities
#include "core/config_loader.hpp"
#include "core/progress.hpp"
#include "core/receiver.hpp"

#include "infra/counters.hpp"
#include "infra/state_sampler.hpp"
#include "infra/stop_token.hpp"
#include "infra/thread_runner.hpp"

#include "apps/progress_console.hpp"
#include "ops/read_operation.hpp"
#include "sources/text_file_source.hpp"

static std::atomic_bool g_sigint{false};

static void HandleSigint(int) {
  g_sigint.store(true, std::memory_order_relaxed);
}

namespace {

// Downstream of the read: optionally prints each record, optionally slow
class ConsoleSink final : public prw::Receiver<std::string> {
public:
  explicit ConsoleSink(prw::SinkConfig cfg) : cfg_(cfg) {}

  void process(std::string element) override {
    if (cfg_.per_record_delay_ms > 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(cfg_.per_record_delay_ms));
    }
    if (cfg_.print_records) std::cout << element << "\n";
    ++records_;
  }

  std::uint64_t records() const { return records_.load(std::memory_order_relaxed); }

private:
  prw::SinkConfig cfg_;
  std::atomic<std::uint64_t> records_{0};
};

}

// read_worker.cpp runs one ReadOperation over a text file range, the way a pipeline worker would:
// the read loop runs on its own thread while this thread reports progress, samples states and
// acts as the rebalancing controller.

int main(int argc, char** argv) {
  const std::string cfg_path = (argc > 1) ? argv[1] : "configs/dev.yaml";

  try {
    const prw::AppConfig cfg = prw::LoadConfigFromYamlFile(cfg_path);
    std::cout << "Loaded config OK: " << cfg_path << "\n";

    std::signal(SIGINT, HandleSigint);

    prw::StopSource global_stop;

    // Resources shared by the operation and this controller thread
    prw::CounterSet counters;
    prw::StateSampler sampler(cfg.operation.counter_prefix, counters);

    std::optional<std::int64_t> end_offset;
    if (cfg.source.end_offset >= 0) end_offset = cfg.source.end_offset;
    auto source = std::make_shared<const prw::TextFileSource>(cfg.source.path, cfg.source.start_offset, end_offset);

    ConsoleSink sink(cfg.sink);

    prw::ReadOperation<std::string> read(cfg.operation.name, source, {&sink}, cfg.operation.counter_prefix,
                                         counters, sampler);
    read.set_progress_update_period(std::chrono::milliseconds(cfg.operation.progress_update_period_ms));

    prw::ProgressConsole console(std::cout, read.byte_count(), sampler);

    prw::ThreadRunner read_runner(cfg.operation.name);
    read_runner.start(global_stop.token(), [&read](const prw::StopToken& global, const std::atomic_bool&) {
      read.start(global);
      read.finish();
    });
    std::cout << cfg.operation.name << " started on " << cfg.source.path << std::endl;

    const auto start = std::chrono::steady_clock::now();
    auto last_log = start;
    bool split_done = !cfg.rebalance.enabled;

    const auto sampling_period = std::chrono::milliseconds(cfg.metrics.sampling_period_ms);
    const auto log_interval = std::chrono::milliseconds(cfg.metrics.log_interval_ms);

    // Controller loop, exits when the read finishes or on SIGINT
    while (!read_runner.finished()) {
      std::this_thread::sleep_for(sampling_period);
      sampler.sample(sampling_period);

      if (g_sigint.load(std::memory_order_relaxed) && !global_stop.stop_requested()) {
        std::cout << "\nCancelling read..." << std::endl;
        global_stop.request_stop();
      }

      const auto now = std::chrono::steady_clock::now();

      if (!split_done && now - start >= std::chrono::milliseconds(cfg.rebalance.after_ms)) {
        split_done = true;
        const prw::Progress proposal = prw::ProgressAtFraction(cfg.rebalance.split_at_fraction);
        const std::optional<prw::Position> accepted = read.propose_stop_position(proposal);
        std::cout << "Proposed stop " << prw::ToString(proposal) << " -> "
                  << (accepted ? "accepted " + prw::ToString(*accepted) : std::string("refused")) << std::endl;
      }

      if (cfg.metrics.enable_console_log && now - last_log >= log_interval) {
        last_log = now;
        console.print(read.get_progress());
      }
    }

    // Rethrows a read failure
    read_runner.join();

    console.print(read.get_progress());
    std::cout << "Read finished: " << sink.records() << " records" << std::endl;
    console.print_counters(counters);

  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 1;
  }

  return 0;
}
