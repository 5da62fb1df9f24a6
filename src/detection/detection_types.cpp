#include "detection_types.hpp"

const char *run_state_to_string(RunState state) {
  switch (state) {
  case RunState::STOPPED:
    return "STOPPED";
  case RunState::RUNNING:
    return "RUNNING";
  case RunState::PAUSED:
    return "PAUSED";
  }
  return "UNKNOWN";
}

const char *detection_error_to_string(DetectionError error) {
  switch (error) {
  case DetectionError::NONE:
    return "NONE";
  case DetectionError::INVALID_PARAMETER:
    return "INVALID_PARAMETER";
  case DetectionError::INVALID_SAMPLE:
    return "INVALID_SAMPLE";
  case DetectionError::ILLEGAL_STATE_TRANSITION:
    return "ILLEGAL_STATE_TRANSITION";
  }
  return "UNKNOWN";
}
