#ifndef DETECTION_CONTROLLER_HPP
#define DETECTION_CONTROLLER_HPP

#include "anomaly_scorer.hpp"
#include "core/config.hpp"
#include "core/sample.hpp"
#include "detection_types.hpp"
#include "learning/window_statistics.hpp"
#include "utils/event_channel.hpp"

#include <memory>
#include <mutex>

/**
 * Owns the run state and the window model, and sequences the per-sample
 * pipeline: snapshot window -> score -> absorb value -> publish.
 *
 * Every public member is safe to call from any thread. A single mutex covers
 * the window, the sensitivity and the state, so a stop() racing a submit()
 * waits for the in-flight sample to be classified and published. Consumers
 * read the channel and never contend on this lock.
 */
class DetectionController {
public:
  using Channel = EventChannel<ClassifiedSample>;

  // Throws std::invalid_argument when the settings fail validation or the
  // channel is missing.
  DetectionController(const Config::DetectorConfig &config,
                      std::shared_ptr<Channel> channel);

  DetectionController(const DetectionController &) = delete;
  DetectionController &operator=(const DetectionController &) = delete;

  // STOPPED/PAUSED -> RUNNING. A fresh window is built only when leaving
  // STOPPED. Idempotent while RUNNING.
  void start();

  // RUNNING -> PAUSED. The window is left untouched; no-op in other states.
  void pause();

  // PAUSED -> RUNNING without recomputing anything; no-op in other states.
  void resume();

  // Any state -> STOPPED. Discards the window; the next start() begins a
  // fresh model.
  void stop();

  // Replaces the window with a fresh one without changing the run state.
  void reset();

  // Takes effect on the next processed sample. Negative or non-finite values
  // return INVALID_PARAMETER and keep the previous sensitivity.
  DetectionError set_sensitivity(double value);

  // Shifts the sensitivity by delta, bottoming out at zero.
  DetectionError adjust_sensitivity(double delta);

  // Ingestion entry point. Samples arriving while not RUNNING are dropped
  // without error; non-finite values return INVALID_SAMPLE and leave the
  // window unchanged.
  SubmitResult submit(const Sample &sample);

  RunState get_state() const;
  double get_sensitivity() const;
  // Empty snapshot while STOPPED
  learning::WindowSnapshot get_window_snapshot() const;
  ControllerStatistics get_statistics() const;
  const Config::DetectorConfig &get_config() const { return config_; }
  std::shared_ptr<Channel> get_channel() const { return channel_; }

  static bool is_valid_sensitivity(double value);

private:
  DetectionError set_sensitivity_locked(double value);

  const Config::DetectorConfig config_;
  const AnomalyScorer scorer_;
  std::shared_ptr<Channel> channel_;

  mutable std::mutex mutex_;
  RunState state_ = RunState::STOPPED;
  std::unique_ptr<learning::IWindowStatistics> window_;
  double sensitivity_;
  ControllerStatistics stats_;
  uint64_t next_sequence_ = 0;
};

#endif // DETECTION_CONTROLLER_HPP
