#pragma once
#include <cstdint>
#include <string>

namespace prw {

struct OperationConfig {
  std::string name = "ReadOperation";
  std::string counter_prefix = "";
  std::int64_t progress_update_period_ms = 1000; // 0 = refresh after every record
};

struct SourceConfig {
  std::string path = "";
  std::int64_t start_offset = 0;
  std::int64_t end_offset = -1; // -1 = end of file
};

struct SinkConfig {
  bool print_records = false;
  int per_record_delay_ms = 0; // simulates a slow downstream
};

struct RebalanceConfig {
  bool enabled = false;
  int after_ms = 100;
  double split_at_fraction = 0.5;
};

struct MetricsConfig {
  bool enable_console_log = true;
  int log_interval_ms = 1000;
  int sampling_period_ms = 100;
};

struct AppConfig {
  OperationConfig operation{};
  SourceConfig source{};
  SinkConfig sink{};
  RebalanceConfig rebalance{};
  MetricsConfig metrics{};
};

}
