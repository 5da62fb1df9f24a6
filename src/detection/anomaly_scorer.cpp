#include "anomaly_scorer.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

AnomalyScorer::AnomalyScorer(double stddev_floor, size_t warmup_count)
    : stddev_floor_(stddev_floor), warmup_count_(warmup_count) {
  if (!std::isfinite(stddev_floor) || stddev_floor <= 0.0) {
    throw std::invalid_argument("Stddev floor must be a positive number");
  }
  if (warmup_count == 0) {
    throw std::invalid_argument("Warmup count must be at least 1");
  }
}

bool AnomalyScorer::is_warming_up(
    const learning::WindowSnapshot &snapshot) const {
  // Nothing to compare against before the first sample
  if (snapshot.total_count == 0)
    return true;
  return snapshot.total_count + 1 < warmup_count_;
}

ScoreResult AnomalyScorer::score(double value,
                                 const learning::WindowSnapshot &snapshot,
                                 double sensitivity) const {
  if (is_warming_up(snapshot))
    return ScoreResult{};

  return score_raw(value, snapshot.mean, snapshot.stddev, sensitivity,
                   stddev_floor_);
}

ScoreResult AnomalyScorer::score_raw(double value, double mean, double stddev,
                                     double sensitivity, double stddev_floor) {
  ScoreResult result;
  double denominator = std::max(stddev, stddev_floor);
  result.deviation_score = std::fabs(value - mean) / denominator;
  result.is_anomaly = result.deviation_score > sensitivity;
  return result;
}
