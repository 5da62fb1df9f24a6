#ifndef WINDOW_STATISTICS_HPP
#define WINDOW_STATISTICS_HPP

#include "core/config.hpp"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <vector>

namespace learning {

/**
 * Sufficient statistics of the active horizon at one point in time.
 * Before the first sample the mean is 0 and the stddev is +infinity.
 */
struct WindowSnapshot {
  size_t count = 0;         // Samples contributing to the active horizon
  uint64_t total_count = 0; // Samples absorbed since creation or reset
  double mean = 0.0;
  double variance = 0.0;
  double stddev = std::numeric_limits<double>::infinity();

  bool operator==(const WindowSnapshot &other) const {
    return count == other.count && total_count == other.total_count &&
           mean == other.mean && variance == other.variance &&
           stddev == other.stddev;
  }
  bool operator!=(const WindowSnapshot &other) const {
    return !(*this == other);
  }
};

/**
 * Online estimate of central tendency and dispersion over a bounded horizon.
 * Implementations are not internally synchronized; the owner serializes
 * calls.
 */
class IWindowStatistics {
public:
  virtual ~IWindowStatistics() = default;

  /**
   * Absorb a value and return the statistics including it. O(1) amortized.
   */
  virtual WindowSnapshot update(double value) = 0;

  virtual WindowSnapshot snapshot() const = 0;

  virtual void reset() = 0;

  virtual const char *strategy_name() const = 0;
};

/**
 * Fixed-size sliding window over the last N values.
 *
 * Keeps a ring buffer plus running sum and sum of squares which are adjusted
 * incrementally (add the new value, subtract the evicted one). Every
 * resync_interval evictions the sums are rebuilt from the buffer to bound
 * drift from repeated subtraction. Evicting a value that carries at least
 * half of the sum of squares rebuilds them immediately, since the smaller
 * values added while it was in the window were absorbed by rounding.
 */
class SlidingWindowStatistics : public IWindowStatistics {
public:
  /**
   * @param window_size Number of most recent values kept (> 0)
   * @param resync_interval Evictions between full recomputations, 0 means
   *        window_size (amortized O(1) per update)
   */
  explicit SlidingWindowStatistics(size_t window_size,
                                   size_t resync_interval = 0);

  WindowSnapshot update(double value) override;
  WindowSnapshot snapshot() const override;
  void reset() override;
  const char *strategy_name() const override { return "sliding"; }

  size_t get_window_size() const { return window_size_; }
  uint64_t get_resync_count() const { return resync_count_; }

private:
  void resynchronize();

  size_t window_size_;
  size_t resync_interval_;
  std::vector<double> buffer_;
  size_t head_ = 0; // Slot that receives the next value
  size_t count_ = 0;
  uint64_t total_count_ = 0;

  double sum_ = 0.0;
  double sum_of_squares_ = 0.0;

  size_t evictions_since_resync_ = 0;
  uint64_t resync_count_ = 0;
};

/**
 * Exponentially weighted window. O(1) memory, the weight of a sample halves
 * every half_life samples.
 */
class DecayWindowStatistics : public IWindowStatistics {
public:
  /**
   * @param half_life Samples after which a contribution weighs half (> 0)
   */
  explicit DecayWindowStatistics(double half_life);

  WindowSnapshot update(double value) override;
  WindowSnapshot snapshot() const override;
  void reset() override;
  const char *strategy_name() const override { return "decay"; }

  double get_alpha() const { return alpha_; }
  double get_half_life() const { return half_life_; }

  static double alpha_from_half_life(double half_life);

private:
  double half_life_;
  double alpha_;
  double ewma_mean_ = 0.0;
  double ewma_variance_ = 0.0;
  uint64_t total_count_ = 0;
};

// Builds the strategy named in the detector settings; throws
// std::invalid_argument for an unknown strategy or invalid horizon.
std::unique_ptr<IWindowStatistics>
make_window_statistics(const Config::DetectorConfig &config);

} // namespace learning

#endif // WINDOW_STATISTICS_HPP
