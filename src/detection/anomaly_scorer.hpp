#ifndef ANOMALY_SCORER_HPP
#define ANOMALY_SCORER_HPP

#include "learning/window_statistics.hpp"

#include <cstddef>

struct ScoreResult {
  double deviation_score = 0.0;
  bool is_anomaly = false;
};

// Turns a value and the window statistics it is compared against into a
// normalized deviation. Stateless: the same inputs always give the same
// result.
class AnomalyScorer {
public:
  static constexpr double DEFAULT_STDDEV_FLOOR = 1e-9;

  AnomalyScorer(double stddev_floor, size_t warmup_count);

  // Warm-up aware scoring against the statistics that precede the value.
  // The value is the (snapshot.total_count + 1)-th sample of the model; while
  // that ordinal is below warmup_count the result is {0, false}.
  ScoreResult score(double value, const learning::WindowSnapshot &snapshot,
                    double sensitivity) const;

  // |value - mean| / max(stddev, floor), flagged when above sensitivity
  static ScoreResult score_raw(double value, double mean, double stddev,
                               double sensitivity, double stddev_floor);

  bool is_warming_up(const learning::WindowSnapshot &snapshot) const;

  double get_stddev_floor() const { return stddev_floor_; }
  size_t get_warmup_count() const { return warmup_count_; }

private:
  double stddev_floor_;
  size_t warmup_count_;
};

#endif // ANOMALY_SCORER_HPP
