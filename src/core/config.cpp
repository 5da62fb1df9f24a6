#include "config.hpp"
#include "logger.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace Config {

LogLevel string_to_log_level(const std::string &level_str_raw) {
  std::string level_str = Utils::trim_copy(level_str_raw);
  std::transform(level_str.begin(), level_str.end(), level_str.begin(),
                 ::toupper);
  if (level_str == "TRACE")
    return LogLevel::TRACE;
  if (level_str == "DEBUG")
    return LogLevel::DEBUG;
  if (level_str == "INFO")
    return LogLevel::INFO;
  if (level_str == "WARN")
    return LogLevel::WARN;
  if (level_str == "ERROR")
    return LogLevel::ERROR;
  if (level_str == "FATAL")
    return LogLevel::FATAL;
  return LogLevel::INFO; // A safe default
}

const std::map<std::string, LogComponent> key_to_component_map = {
    {"core", LogComponent::CORE},
    {"config", LogComponent::CONFIG},
    {"io.source", LogComponent::IO_SOURCE},
    {"io.dispatch", LogComponent::IO_DISPATCH},
    {"io.web", LogComponent::IO_WEB},
    {"detection.stats", LogComponent::DETECTION_STATS},
    {"detection.scorer", LogComponent::DETECTION_SCORER},
    {"detection.controller", LogComponent::DETECTION_CONTROLLER},
    {"channel", LogComponent::CHANNEL},
    {"metrics", LogComponent::METRICS}};

AppConfig::AppConfig() {
  // Everything at WARN, except CORE and the controller lifecycle at INFO
  for (const auto &pair : key_to_component_map)
    logging.log_levels[pair.second] = LogLevel::WARN;
  logging.log_levels[LogComponent::CORE] = LogLevel::INFO;
  logging.log_levels[LogComponent::DETECTION_CONTROLLER] = LogLevel::INFO;
}

// Convert string to boolean using common truthy values
bool string_to_bool(const std::string &val_str_raw) {
  std::string val_str = Utils::trim_copy(val_str_raw);
  std::transform(val_str.begin(), val_str.end(), val_str.begin(), ::tolower);
  return (val_str == "true" || val_str == "1" || val_str == "yes" ||
          val_str == "on");
}

bool validate_detector_config(const DetectorConfig &config,
                              std::vector<std::string> &errors) {
  bool valid = true;

  if (config.strategy != "sliding" && config.strategy != "decay") {
    errors.push_back("Detector strategy must be one of: sliding, decay");
    valid = false;
  }

  if (config.strategy == "sliding" &&
      (config.window_size < 2 || config.window_size > 10000000)) {
    errors.push_back("Detector window size must be between 2 and 10000000");
    valid = false;
  }

  if (config.strategy == "decay" &&
      (!std::isfinite(config.half_life) || config.half_life <= 0.0)) {
    errors.push_back("Detector half life must be a positive number of samples");
    valid = false;
  }

  if (!std::isfinite(config.sensitivity) || config.sensitivity < 0.0) {
    errors.push_back("Detector sensitivity must be a finite value >= 0");
    valid = false;
  }

  if (!std::isfinite(config.sensitivity_step) ||
      config.sensitivity_step <= 0.0) {
    errors.push_back("Detector sensitivity step must be greater than 0");
    valid = false;
  }

  if (config.warmup_count < 1) {
    errors.push_back("Detector warmup count must be at least 1");
    valid = false;
  }

  if (!std::isfinite(config.stddev_floor) || config.stddev_floor <= 0.0) {
    errors.push_back("Detector stddev floor must be greater than 0");
    valid = false;
  }

  return valid;
}

bool validate_channel_config(const ChannelConfig &config,
                             std::vector<std::string> &errors) {
  if (config.capacity < 1 || config.capacity > 10000000) {
    errors.push_back("Channel capacity must be between 1 and 10000000");
    return false;
  }
  return true;
}

bool validate_source_config(const SourceConfig &config,
                            std::vector<std::string> &errors) {
  bool valid = true;

  if (config.type != "simulated" && config.type != "file") {
    errors.push_back("Source type must be one of: simulated, file");
    valid = false;
  }

  if (config.type == "file" && config.input_path.empty()) {
    errors.push_back("Source input path is required for the file source");
    valid = false;
  }

  if (!(config.anomaly_ratio >= 0.0 && config.anomaly_ratio <= 1.0)) {
    errors.push_back("Source anomaly ratio must be between 0.0 and 1.0");
    valid = false;
  }

  if (!(config.corrupt_ratio >= 0.0 && config.corrupt_ratio <= 1.0)) {
    errors.push_back("Source corrupt ratio must be between 0.0 and 1.0");
    valid = false;
  }

  if (config.sample_interval_ms > 60000) {
    errors.push_back("Source sample interval must be at most 60000 ms");
    valid = false;
  }

  return valid;
}

bool validate_monitoring_config(const MonitoringConfig &config,
                                std::vector<std::string> &errors) {
  bool valid = true;

  if (config.web_server_port < 1 || config.web_server_port > 65535) {
    errors.push_back("Monitoring web server port must be between 1 and 65535");
    valid = false;
  }

  if (config.recent_history_size < 1 || config.recent_history_size > 100000) {
    errors.push_back(
        "Monitoring recent history size must be between 1 and 100000");
    valid = false;
  }

  return valid;
}

bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors) {
  bool valid = true;

  if (!validate_detector_config(config.detector, errors))
    valid = false;

  if (!validate_channel_config(config.channel, errors))
    valid = false;

  if (!validate_source_config(config.source, errors))
    valid = false;

  if (!validate_monitoring_config(config.monitoring, errors))
    valid = false;

  // Cross-component validation
  if (config.monitoring.web_server_enabled && !config.channel.fan_out) {
    errors.push_back("The web server live view needs its own channel "
                     "subscription; set [Channel] fan_out = true");
    valid = false;
  }

  if (config.output.anomalies_to_file &&
      config.output.anomaly_output_path.empty()) {
    errors.push_back("Output anomaly path is required when writing to file");
    valid = false;
  }

  return valid;
}

bool parse_config_into(const std::string &filepath, AppConfig &config) {
  std::cout << "Attempting to load configuration from " << filepath
            << std::endl;
  std::ifstream config_file(filepath);

  if (!config_file.is_open()) {
    std::cerr << "Warning: Could not open config file '" << filepath
              << "'. Using default configuration values." << std::endl;
    return false;
  }

  std::string line;
  std::string current_section;

  int line_num = 0;
  while (std::getline(config_file, line)) {
    line_num++;
    std::string trimmed_line = Utils::trim_copy(line);

    // Skip empty lines and comments
    if (trimmed_line.empty() || trimmed_line[0] == '#' ||
        trimmed_line[0] == ';')
      continue;

    // Section header [SectionName]
    if (trimmed_line[0] == '[' && trimmed_line.back() == ']') {
      current_section =
          Utils::trim_copy(trimmed_line.substr(1, trimmed_line.length() - 2));
      continue;
    }

    size_t delimiter_pos = trimmed_line.find('=');
    if (delimiter_pos == std::string::npos) {
      std::cerr << "Warning (Config Line " << line_num
                << "): Invalid format (missing '='): " << trimmed_line
                << std::endl;
      continue;
    }

    std::string key = Utils::trim_copy(trimmed_line.substr(0, delimiter_pos));
    std::string value =
        Utils::trim_copy(trimmed_line.substr(delimiter_pos + 1));

    if (key.empty()) {
      std::cerr << "Warning (Config Line " << line_num << "): Empty key found."
                << std::endl;
      continue;
    }

    try {
      if (current_section == "Detector") {
        if (key == Keys::DT_STRATEGY)
          config.detector.strategy = value;
        else if (key == Keys::DT_WINDOW_SIZE)
          config.detector.window_size =
              Utils::string_to_number<size_t>(value).value_or(
                  config.detector.window_size);
        else if (key == Keys::DT_HALF_LIFE)
          config.detector.half_life =
              Utils::string_to_number<double>(value).value_or(
                  config.detector.half_life);
        else if (key == Keys::DT_RESYNC_INTERVAL)
          config.detector.resync_interval =
              Utils::string_to_number<size_t>(value).value_or(
                  config.detector.resync_interval);
        else if (key == Keys::DT_SENSITIVITY)
          config.detector.sensitivity =
              Utils::string_to_number<double>(value).value_or(
                  config.detector.sensitivity);
        else if (key == Keys::DT_SENSITIVITY_STEP)
          config.detector.sensitivity_step =
              Utils::string_to_number<double>(value).value_or(
                  config.detector.sensitivity_step);
        else if (key == Keys::DT_WARMUP_COUNT)
          config.detector.warmup_count =
              Utils::string_to_number<size_t>(value).value_or(
                  config.detector.warmup_count);
        else if (key == Keys::DT_STDDEV_FLOOR)
          config.detector.stddev_floor =
              Utils::string_to_number<double>(value).value_or(
                  config.detector.stddev_floor);
        else if (key == Keys::DT_AUTO_START)
          config.detector.auto_start = string_to_bool(value);

      } else if (current_section == "Channel") {
        if (key == Keys::CH_CAPACITY)
          config.channel.capacity =
              Utils::string_to_number<size_t>(value).value_or(
                  config.channel.capacity);
        else if (key == Keys::CH_FAN_OUT)
          config.channel.fan_out = string_to_bool(value);

      } else if (current_section == "Source") {
        if (key == Keys::SRC_TYPE)
          config.source.type = value;
        else if (key == Keys::SRC_INPUT_PATH)
          config.source.input_path = value;
        else if (key == Keys::SRC_NUM_POINTS)
          config.source.num_points =
              Utils::string_to_number<uint64_t>(value).value_or(
                  config.source.num_points);
        else if (key == Keys::SRC_ANOMALY_RATIO)
          config.source.anomaly_ratio =
              Utils::string_to_number<double>(value).value_or(
                  config.source.anomaly_ratio);
        else if (key == Keys::SRC_CORRUPT_RATIO)
          config.source.corrupt_ratio =
              Utils::string_to_number<double>(value).value_or(
                  config.source.corrupt_ratio);
        else if (key == Keys::SRC_SAMPLE_INTERVAL_MS)
          config.source.sample_interval_ms =
              Utils::string_to_number<uint64_t>(value).value_or(
                  config.source.sample_interval_ms);
        else if (key == Keys::SRC_SEED)
          config.source.seed = Utils::string_to_number<uint64_t>(value).value_or(
              config.source.seed);

      } else if (current_section == "Output") {
        if (key == Keys::OUT_ANOMALIES_TO_STDOUT)
          config.output.anomalies_to_stdout = string_to_bool(value);
        else if (key == Keys::OUT_ANOMALIES_TO_FILE)
          config.output.anomalies_to_file = string_to_bool(value);
        else if (key == Keys::OUT_ANOMALY_OUTPUT_PATH)
          config.output.anomaly_output_path = value;
        else if (key == Keys::OUT_EMIT_ALL_SAMPLES)
          config.output.emit_all_samples = string_to_bool(value);

      } else if (current_section == "Logging") {
        if (key == Keys::LOGGING_DEFAULT_LEVEL) {
          LogLevel default_level = string_to_log_level(value);
          for (auto &pair : config.logging.log_levels)
            pair.second = default_level;
        } else {
          auto comp_it = key_to_component_map.find(key);
          if (comp_it != key_to_component_map.end())
            config.logging.log_levels[comp_it->second] =
                string_to_log_level(value);
          else if (key.length() > 2 && key.substr(key.length() - 2) == ".*") {
            // Wildcard match, e.g., "detection.* = DEBUG"
            std::string prefix = key.substr(0, key.length() - 1);
            for (const auto &pair : key_to_component_map)
              if (pair.first.rfind(prefix, 0) == 0)
                config.logging.log_levels[pair.second] =
                    string_to_log_level(value);
          } else
            std::cerr << "Warning (Config Line " << line_num
                      << "): Unknown logging component '" << key << "'"
                      << std::endl;
        }

      } else if (current_section == "Monitoring") {
        if (key == Keys::MONITORING_WEB_SERVER_ENABLED)
          config.monitoring.web_server_enabled = string_to_bool(value);
        else if (key == Keys::MONITORING_WEB_SERVER_HOST)
          config.monitoring.web_server_host = value;
        else if (key == Keys::MONITORING_WEB_SERVER_PORT)
          config.monitoring.web_server_port =
              Utils::string_to_number<int>(value).value_or(
                  config.monitoring.web_server_port);
        else if (key == Keys::MONITORING_RECENT_HISTORY_SIZE)
          config.monitoring.recent_history_size =
              Utils::string_to_number<size_t>(value).value_or(
                  config.monitoring.recent_history_size);

      } else {
        // Unknown sections and global keys are kept for extensions
        std::string full_key =
            current_section.empty() ? key : current_section + "." + key;
        config.custom_settings[full_key] = value;
      }
    } catch (const std::exception &e) {
      std::cerr << "Warning (Config Line " << line_num
                << "): Failed to parse value for key '" << key << "' - "
                << e.what() << std::endl;
    }
  }

  config_file.close();
  std::cout << "Configuration loaded successfully from " << filepath
            << std::endl;
  return true;
}

bool ConfigManager::load_configuration(const std::string &filepath) {
  config_filepath_ = filepath;
  auto new_config = std::make_shared<AppConfig>();

  if (!parse_config_into(filepath, *new_config)) {
    std::cerr << "Failed to parse configuration file: " << filepath
              << ". Keeping existing settings." << std::endl;
    return false;
  }

  std::vector<std::string> validation_errors;
  if (!validate_app_config(*new_config, validation_errors)) {
    std::cerr << "Configuration validation failed:" << std::endl;
    for (const auto &error : validation_errors) {
      std::cerr << "  - " << error << std::endl;
    }
    std::cerr << "Keeping existing settings." << std::endl;
    return false;
  }

  // Atomically swap the pointer
  std::lock_guard<std::mutex> lock(config_mutex_);
  current_config_ = new_config;
  std::cout << "Configuration loaded and validated successfully from "
            << config_filepath_ << std::endl;
  return true;
}

std::shared_ptr<const AppConfig> ConfigManager::get_config() const {
  std::lock_guard<std::mutex> lock(config_mutex_);
  return current_config_;
}

} // namespace Config
