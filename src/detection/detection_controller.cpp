#include "detection_controller.hpp"
#include "core/logger.hpp"
#include "core/metrics_manager.hpp"
#include "utils/scoped_timer.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

const Config::DetectorConfig &
validated(const Config::DetectorConfig &config) {
  std::vector<std::string> errors;
  if (!Config::validate_detector_config(config, errors)) {
    std::ostringstream oss;
    oss << "Invalid detector settings:";
    for (const auto &error : errors)
      oss << " " << error << ";";
    throw std::invalid_argument(oss.str());
  }
  return config;
}

LabeledCounter *samples_counter() {
  static LabeledCounter *counter =
      MetricsManager::instance().register_labeled_counter(
          "sad_samples_total",
          "Samples submitted to the controller, by outcome.");
  return counter;
}

} // namespace

DetectionController::DetectionController(const Config::DetectorConfig &config,
                                         std::shared_ptr<Channel> channel)
    : config_(validated(config)),
      scorer_(config.stddev_floor, config.warmup_count),
      channel_(std::move(channel)), sensitivity_(config.sensitivity) {
  if (!channel_) {
    throw std::invalid_argument("Detection controller requires a channel");
  }
  LOG(LogLevel::DEBUG, LogComponent::DETECTION_CONTROLLER,
      "Controller created: strategy=" << config_.strategy
                                      << " sensitivity=" << sensitivity_
                                      << " warmup=" << config_.warmup_count);
}

void DetectionController::start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ == RunState::RUNNING) {
    LOG(LogLevel::DEBUG, LogComponent::DETECTION_CONTROLLER,
        "start() ignored, already running");
    return;
  }

  if (state_ == RunState::STOPPED) {
    window_ = learning::make_window_statistics(config_);
    stats_.model_generation++;
  }

  LOG(LogLevel::INFO, LogComponent::DETECTION_CONTROLLER,
      "Detection " << (state_ == RunState::PAUSED ? "resumed by start()"
                                                  : "started")
                   << " (" << window_->strategy_name() << " window, model #"
                   << stats_.model_generation << ")");
  state_ = RunState::RUNNING;
}

void DetectionController::pause() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ != RunState::RUNNING) {
    LOG(LogLevel::DEBUG, LogComponent::DETECTION_CONTROLLER,
        "pause() ignored in state " << run_state_to_string(state_));
    return;
  }
  state_ = RunState::PAUSED;
  LOG(LogLevel::INFO, LogComponent::DETECTION_CONTROLLER,
      "Detection paused after " << stats_.samples_processed << " samples");
}

void DetectionController::resume() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ != RunState::PAUSED) {
    LOG(LogLevel::DEBUG, LogComponent::DETECTION_CONTROLLER,
        "resume() ignored in state " << run_state_to_string(state_));
    return;
  }
  state_ = RunState::RUNNING;
  LOG(LogLevel::INFO, LogComponent::DETECTION_CONTROLLER, "Detection resumed");
}

void DetectionController::stop() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ == RunState::STOPPED)
    return;
  window_.reset();
  state_ = RunState::STOPPED;
  LOG(LogLevel::INFO, LogComponent::DETECTION_CONTROLLER,
      "Detection stopped, window discarded");
}

void DetectionController::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!window_) {
    LOG(LogLevel::DEBUG, LogComponent::DETECTION_CONTROLLER,
        "reset() ignored, no model while stopped");
    return;
  }
  window_ = learning::make_window_statistics(config_);
  stats_.model_generation++;
  LOG(LogLevel::INFO, LogComponent::DETECTION_CONTROLLER,
      "Detection model reset (model #" << stats_.model_generation << ")");
}

bool DetectionController::is_valid_sensitivity(double value) {
  return std::isfinite(value) && value >= 0.0;
}

DetectionError DetectionController::set_sensitivity_locked(double value) {
  if (!is_valid_sensitivity(value)) {
    stats_.sensitivity_rejections++;
    LOG(LogLevel::WARN, LogComponent::DETECTION_CONTROLLER,
        "Rejected sensitivity " << value << ", keeping " << sensitivity_);
    return DetectionError::INVALID_PARAMETER;
  }

  LOG(LogLevel::INFO, LogComponent::DETECTION_CONTROLLER,
      "Sensitivity changed " << sensitivity_ << " -> " << value);
  sensitivity_ = value;
  return DetectionError::NONE;
}

DetectionError DetectionController::set_sensitivity(double value) {
  std::lock_guard<std::mutex> lock(mutex_);
  return set_sensitivity_locked(value);
}

DetectionError DetectionController::adjust_sensitivity(double delta) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!std::isfinite(delta)) {
    return set_sensitivity_locked(delta);
  }
  return set_sensitivity_locked(std::max(0.0, sensitivity_ + delta));
}

SubmitResult DetectionController::submit(const Sample &sample) {
  static Histogram *pipeline_timer =
      MetricsManager::instance().register_histogram(
          "sad_pipeline_duration_seconds",
          "Time spent classifying one sample, lock wait included.");
  ScopedTimer timer(*pipeline_timer);

  SubmitResult result;
  std::lock_guard<std::mutex> lock(mutex_);

  if (state_ != RunState::RUNNING) {
    stats_.dropped_not_running++;
    samples_counter()->increment({{"outcome", "dropped_not_running"}});
    return result;
  }

  if (!std::isfinite(sample.value)) {
    stats_.invalid_samples++;
    samples_counter()->increment({{"outcome", "invalid"}});
    LOG(LogLevel::WARN, LogComponent::DETECTION_CONTROLLER,
        "Rejected non-finite sample at t=" << sample.timestamp_ms);
    result.error = DetectionError::INVALID_SAMPLE;
    return result;
  }

  // Score against the history the value is about to join
  const learning::WindowSnapshot before = window_->snapshot();
  const ScoreResult score = scorer_.score(sample.value, before, sensitivity_);
  window_->update(sample.value);

  ClassifiedSample classified;
  classified.sample = sample;
  classified.deviation_score = score.deviation_score;
  classified.is_anomaly = score.is_anomaly;
  classified.window_mean = before.mean;
  classified.window_stddev = before.stddev;
  classified.sensitivity = sensitivity_;
  classified.sequence = next_sequence_++;

  stats_.samples_processed++;
  if (classified.is_anomaly) {
    stats_.anomalies_detected++;
    samples_counter()->increment({{"outcome", "anomaly"}});
    LOG(LogLevel::DEBUG, LogComponent::DETECTION_SCORER,
        "Anomaly at t=" << sample.timestamp_ms << " value=" << sample.value
                        << " score=" << classified.deviation_score
                        << " mean=" << before.mean
                        << " stddev=" << before.stddev);
  } else {
    samples_counter()->increment({{"outcome", "normal"}});
  }

  if (!channel_->publish(classified))
    LOG(LogLevel::DEBUG, LogComponent::CHANNEL,
        "Channel closed, classified sample #" << classified.sequence
                                              << " not delivered");

  result.classified = classified;
  return result;
}

RunState DetectionController::get_state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

double DetectionController::get_sensitivity() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sensitivity_;
}

learning::WindowSnapshot DetectionController::get_window_snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!window_)
    return learning::WindowSnapshot{};
  return window_->snapshot();
}

ControllerStatistics DetectionController::get_statistics() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}
