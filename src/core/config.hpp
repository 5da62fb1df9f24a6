#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

enum class LogLevel;
enum class LogComponent;

namespace Config {

namespace Keys {

// Detector Settings
constexpr const char *DT_STRATEGY = "strategy";
constexpr const char *DT_WINDOW_SIZE = "window_size";
constexpr const char *DT_HALF_LIFE = "half_life";
constexpr const char *DT_RESYNC_INTERVAL = "resync_interval";
constexpr const char *DT_SENSITIVITY = "sensitivity";
constexpr const char *DT_SENSITIVITY_STEP = "sensitivity_step";
constexpr const char *DT_WARMUP_COUNT = "warmup_count";
constexpr const char *DT_STDDEV_FLOOR = "stddev_floor";
constexpr const char *DT_AUTO_START = "auto_start";

// Channel Settings
constexpr const char *CH_CAPACITY = "capacity";
constexpr const char *CH_FAN_OUT = "fan_out";

// Source Settings
constexpr const char *SRC_TYPE = "type";
constexpr const char *SRC_INPUT_PATH = "input_path";
constexpr const char *SRC_NUM_POINTS = "num_points";
constexpr const char *SRC_ANOMALY_RATIO = "anomaly_ratio";
constexpr const char *SRC_CORRUPT_RATIO = "corrupt_ratio";
constexpr const char *SRC_SAMPLE_INTERVAL_MS = "sample_interval_ms";
constexpr const char *SRC_SEED = "seed";

// Output Settings
constexpr const char *OUT_ANOMALIES_TO_STDOUT = "anomalies_to_stdout";
constexpr const char *OUT_ANOMALIES_TO_FILE = "anomalies_to_file";
constexpr const char *OUT_ANOMALY_OUTPUT_PATH = "anomaly_output_path";
constexpr const char *OUT_EMIT_ALL_SAMPLES = "emit_all_samples";

// Logging Settings
constexpr const char *LOGGING_DEFAULT_LEVEL = "default_level";

// Monitoring Settings
constexpr const char *MONITORING_WEB_SERVER_ENABLED = "web_server_enabled";
constexpr const char *MONITORING_WEB_SERVER_HOST = "web_server_host";
constexpr const char *MONITORING_WEB_SERVER_PORT = "web_server_port";
constexpr const char *MONITORING_RECENT_HISTORY_SIZE = "recent_history_size";
} // namespace Keys

struct LoggingConfig {
  std::map<LogComponent, LogLevel> log_levels;
};

struct DetectorConfig {
  // "sliding" keeps the last window_size values, "decay" weights by half_life
  std::string strategy = "sliding";
  size_t window_size = 100;
  double half_life = 50.0;
  // Evictions between full recomputations of the running sums, 0 = window_size
  size_t resync_interval = 0;
  double sensitivity = 3.0;
  double sensitivity_step = 0.25;
  size_t warmup_count = 30;
  double stddev_floor = 1e-9;
  bool auto_start = true;
};

struct ChannelConfig {
  size_t capacity = 1024;
  bool fan_out = true;
};

struct SourceConfig {
  std::string type = "simulated";
  std::string input_path = "data/stream.csv";
  uint64_t num_points = 1000; // 0 means endless
  double anomaly_ratio = 0.05;
  double corrupt_ratio = 0.01;
  uint64_t sample_interval_ms = 10;
  uint64_t seed = 0; // 0 means a nondeterministic seed
};

struct OutputConfig {
  bool anomalies_to_stdout = true;
  bool anomalies_to_file = false;
  std::string anomaly_output_path = "anomalies.jsonl";
  bool emit_all_samples = false;
};

struct MonitoringConfig {
  bool web_server_enabled = false;
  std::string web_server_host = "0.0.0.0";
  int web_server_port = 9090;
  size_t recent_history_size = 200;
};

struct AppConfig {
  DetectorConfig detector;
  ChannelConfig channel;
  SourceConfig source;
  OutputConfig output;
  LoggingConfig logging;
  MonitoringConfig monitoring;

  std::unordered_map<std::string, std::string> custom_settings;

  AppConfig();
};

// Validation functions for configuration parameters
bool validate_detector_config(const DetectorConfig &config,
                              std::vector<std::string> &errors);
bool validate_channel_config(const ChannelConfig &config,
                             std::vector<std::string> &errors);
bool validate_source_config(const SourceConfig &config,
                            std::vector<std::string> &errors);
bool validate_monitoring_config(const MonitoringConfig &config,
                                std::vector<std::string> &errors);
bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors);

LogLevel string_to_log_level(const std::string &level_str_raw);

class ConfigManager {
public:
  ConfigManager() = default;
  bool load_configuration(const std::string &filepath);
  std::shared_ptr<const AppConfig> get_config() const;

private:
  std::string config_filepath_;
  std::shared_ptr<const AppConfig> current_config_ =
      std::make_shared<AppConfig>();
  mutable std::mutex config_mutex_;
};

} // namespace Config

#endif // CONFIG_HPP
