#include "core/config_loader.hpp"

#include <yaml-cpp/yaml.h>

#include <sstream>
#include <stdexcept>

namespace prw {

static std::string PathJoin(const std::string& a, const std::string& b) {
  if (a.empty()) return b;
  return a + "." + b;
}

static std::runtime_error ConfigError(const std::string& key_path, const std::string& msg) {
  std::ostringstream oss;
  oss << "Config error at '" << key_path << "': " << msg;
  return std::runtime_error(oss.str());
}

static YAML::Node Child(const YAML::Node& parent, const char* key) {
  if (!parent || !parent.IsMap()) return YAML::Node();
  return parent[key];
}

template <typename T>
static T GetOrKey(const YAML::Node& parent, const char* key, const std::string& key_path, const T& fallback) {
  const YAML::Node n = Child(parent, key);
  if (!n) return fallback;
  try {
    return n.as<T>();
  } catch (const YAML::Exception& e) {
    throw ConfigError(key_path, e.what());
  }
}

static void LoadOperation(const YAML::Node& root, OperationConfig& cfg) {
  const YAML::Node op = root["operation"];
  if (!op) return;
  const std::string p = "operation";

  cfg.name = GetOrKey<std::string>(op, "name", PathJoin(p, "name"), cfg.name);
  cfg.counter_prefix = GetOrKey<std::string>(op, "counter_prefix", PathJoin(p, "counter_prefix"), cfg.counter_prefix);
  cfg.progress_update_period_ms = GetOrKey<std::int64_t>(op, "progress_update_period_ms", PathJoin(p, "progress_update_period_ms"), cfg.progress_update_period_ms);
}

static void LoadSource(const YAML::Node& root, SourceConfig& cfg) {
  const YAML::Node src = root["source"];
  if (!src) return;
  const std::string p = "source";

  cfg.path = GetOrKey<std::string>(src, "path", PathJoin(p, "path"), cfg.path);
  cfg.start_offset = GetOrKey<std::int64_t>(src, "start_offset", PathJoin(p, "start_offset"), cfg.start_offset);
  cfg.end_offset = GetOrKey<std::int64_t>(src, "end_offset", PathJoin(p, "end_offset"), cfg.end_offset);
}

static void LoadSink(const YAML::Node& root, SinkConfig& cfg) {
  const YAML::Node sink = root["sink"];
  if (!sink) return;
  const std::string p = "sink";

  cfg.print_records = GetOrKey<bool>(sink, "print_records", PathJoin(p, "print_records"), cfg.print_records);
  cfg.per_record_delay_ms = GetOrKey<int>(sink, "per_record_delay_ms", PathJoin(p, "per_record_delay_ms"), cfg.per_record_delay_ms);
}

static void LoadRebalance(const YAML::Node& root, RebalanceConfig& cfg) {
  const YAML::Node rb = root["rebalance"];
  if (!rb) return;
  const std::string p = "rebalance";

  cfg.enabled = GetOrKey<bool>(rb, "enabled", PathJoin(p, "enabled"), cfg.enabled);
  cfg.after_ms = GetOrKey<int>(rb, "after_ms", PathJoin(p, "after_ms"), cfg.after_ms);
  cfg.split_at_fraction = GetOrKey<double>(rb, "split_at_fraction", PathJoin(p, "split_at_fraction"), cfg.split_at_fraction);
}

static void LoadMetrics(const YAML::Node& root, MetricsConfig& cfg) {
  const YAML::Node m = root["metrics"];
  if (!m) return;
  const std::string p = "metrics";

  cfg.enable_console_log = GetOrKey<bool>(m, "enable_console_log", PathJoin(p, "enable_console_log"), cfg.enable_console_log);
  cfg.log_interval_ms = GetOrKey<int>(m, "log_interval_ms", PathJoin(p, "log_interval_ms"), cfg.log_interval_ms);
  cfg.sampling_period_ms = GetOrKey<int>(m, "sampling_period_ms", PathJoin(p, "sampling_period_ms"), cfg.sampling_period_ms);
}

void ValidateOrThrow(const AppConfig& cfg) {
  if (cfg.operation.name.empty()) throw ConfigError("operation.name", "must not be empty");
  if (cfg.operation.progress_update_period_ms < 0)
    throw ConfigError("operation.progress_update_period_ms", "must be >= 0 (0 = refresh after every record)");

  if (cfg.source.path.empty()) throw ConfigError("source.path", "required");
  if (cfg.source.start_offset < 0) throw ConfigError("source.start_offset", "must be >= 0");
  if (cfg.source.end_offset != -1 && cfg.source.end_offset <= cfg.source.start_offset)
    throw ConfigError("source.end_offset", "must be -1 (end of file) or > source.start_offset");

  if (cfg.sink.per_record_delay_ms < 0) throw ConfigError("sink.per_record_delay_ms", "must be >= 0");

  if (cfg.rebalance.enabled) {
    if (cfg.rebalance.after_ms < 0) throw ConfigError("rebalance.after_ms", "must be >= 0");
    if (!(cfg.rebalance.split_at_fraction > 0.0 && cfg.rebalance.split_at_fraction < 1.0))
      throw ConfigError("rebalance.split_at_fraction", "must be in (0, 1)");
  }

  if (cfg.metrics.log_interval_ms <= 0) throw ConfigError("metrics.log_interval_ms", "must be > 0");
  if (cfg.metrics.sampling_period_ms <= 0) throw ConfigError("metrics.sampling_period_ms", "must be > 0");
}

static AppConfig LoadFromRoot(const YAML::Node& root) {
  AppConfig cfg;

  LoadOperation(root, cfg.operation);
  LoadSource(root, cfg.source);
  LoadSink(root, cfg.sink);
  LoadRebalance(root, cfg.rebalance);
  LoadMetrics(root, cfg.metrics);

  ValidateOrThrow(cfg);
  return cfg;
}

AppConfig LoadConfigFromYamlFile(const std::string& path) {
  YAML::Node root;

  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(std::string("Failed to load YAML file '") + path + "': " + e.what());
  }

  return LoadFromRoot(root);
}

AppConfig LoadConfigFromYamlString(const std::string& yaml) {
  YAML::Node root;

  try {
    root = YAML::Load(yaml);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(std::string("Failed to parse YAML: ") + e.what());
  }

  return LoadFromRoot(root);
}

} // namespace prw
