#ifndef DETECTION_TYPES_HPP
#define DETECTION_TYPES_HPP

#include "core/sample.hpp"

#include <cstdint>
#include <optional>
#include <string>

enum class RunState { STOPPED, RUNNING, PAUSED };

enum class DetectionError {
  NONE = 0,
  INVALID_PARAMETER = 1, // Sensitivity or setting outside its valid domain
  INVALID_SAMPLE = 2,    // Non-finite reading, dropped without state change
  // Reserved: every current transition is idempotent or defined from any state
  ILLEGAL_STATE_TRANSITION = 3
};

const char *run_state_to_string(RunState state);
const char *detection_error_to_string(DetectionError error);

struct SubmitResult {
  DetectionError error = DetectionError::NONE;
  // Empty when the sample was dropped (not running) or rejected
  std::optional<ClassifiedSample> classified;

  bool ok() const { return error == DetectionError::NONE; }
  bool was_classified() const { return classified.has_value(); }
};

struct ControllerStatistics {
  uint64_t samples_processed = 0;
  uint64_t anomalies_detected = 0;
  uint64_t invalid_samples = 0;
  uint64_t dropped_not_running = 0;
  uint64_t sensitivity_rejections = 0;
  uint64_t model_generation = 0; // Incremented every time the window is rebuilt
};

#endif // DETECTION_TYPES_HPP
