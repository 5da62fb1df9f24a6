#include "window_statistics.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace learning {

SlidingWindowStatistics::SlidingWindowStatistics(size_t window_size,
                                                 size_t resync_interval)
    : window_size_(window_size),
      resync_interval_(resync_interval == 0 ? window_size : resync_interval) {
  if (window_size == 0) {
    throw std::invalid_argument("Window size must be greater than 0");
  }
  buffer_.assign(window_size_, 0.0);
}

WindowSnapshot SlidingWindowStatistics::update(double value) {
  bool dominant_eviction = false;
  if (count_ == window_size_) {
    double evicted = buffer_[head_];
    dominant_eviction =
        evicted != 0.0 && evicted * evicted >= 0.5 * sum_of_squares_;
    sum_ -= evicted;
    sum_of_squares_ -= evicted * evicted;
    evictions_since_resync_++;
  } else {
    count_++;
  }

  buffer_[head_] = value;
  sum_ += value;
  sum_of_squares_ += value * value;
  head_ = (head_ + 1) % window_size_;
  total_count_++;

  if (dominant_eviction || evictions_since_resync_ >= resync_interval_)
    resynchronize();

  return snapshot();
}

WindowSnapshot SlidingWindowStatistics::snapshot() const {
  WindowSnapshot snap;
  snap.count = count_;
  snap.total_count = total_count_;
  if (count_ == 0)
    return snap;

  const double n = static_cast<double>(count_);
  snap.mean = sum_ / n;
  // Population variance; cancellation can push it slightly below zero
  snap.variance = std::max(0.0, sum_of_squares_ / n - snap.mean * snap.mean);
  snap.stddev = std::sqrt(snap.variance);
  return snap;
}

void SlidingWindowStatistics::reset() {
  std::fill(buffer_.begin(), buffer_.end(), 0.0);
  head_ = 0;
  count_ = 0;
  total_count_ = 0;
  sum_ = 0.0;
  sum_of_squares_ = 0.0;
  evictions_since_resync_ = 0;
}

void SlidingWindowStatistics::resynchronize() {
  double exact_sum = 0.0;
  double exact_sum_of_squares = 0.0;
  // Only the first count_ slots hold data until the buffer has wrapped
  for (size_t i = 0; i < count_; ++i) {
    exact_sum += buffer_[i];
    exact_sum_of_squares += buffer_[i] * buffer_[i];
  }

  LOG(LogLevel::TRACE, LogComponent::DETECTION_STATS,
      "Sliding window resync #" << resync_count_ + 1 << ": sum drift "
                                << (sum_ - exact_sum) << ", sumsq drift "
                                << (sum_of_squares_ - exact_sum_of_squares));

  sum_ = exact_sum;
  sum_of_squares_ = exact_sum_of_squares;
  evictions_since_resync_ = 0;
  resync_count_++;
}

DecayWindowStatistics::DecayWindowStatistics(double half_life)
    : half_life_(half_life), alpha_(alpha_from_half_life(half_life)) {}

double DecayWindowStatistics::alpha_from_half_life(double half_life) {
  if (!std::isfinite(half_life) || half_life <= 0.0) {
    throw std::invalid_argument("Half life must be a positive, finite number");
  }
  return 1.0 - std::pow(0.5, 1.0 / half_life);
}

WindowSnapshot DecayWindowStatistics::update(double value) {
  if (total_count_ == 0) {
    // Initialize with first value
    ewma_mean_ = value;
    ewma_variance_ = 0.0;
  } else {
    double delta = value - ewma_mean_;
    ewma_mean_ += alpha_ * delta;
    ewma_variance_ += alpha_ * (delta * delta * (1.0 - alpha_) - ewma_variance_);
    if (ewma_variance_ < 0.0)
      ewma_variance_ = 0.0;
  }

  total_count_++;
  return snapshot();
}

WindowSnapshot DecayWindowStatistics::snapshot() const {
  WindowSnapshot snap;
  snap.count = static_cast<size_t>(total_count_);
  snap.total_count = total_count_;
  if (total_count_ == 0)
    return snap;

  snap.mean = ewma_mean_;
  snap.variance = ewma_variance_;
  snap.stddev = std::sqrt(ewma_variance_);
  return snap;
}

void DecayWindowStatistics::reset() {
  ewma_mean_ = 0.0;
  ewma_variance_ = 0.0;
  total_count_ = 0;
}

std::unique_ptr<IWindowStatistics>
make_window_statistics(const Config::DetectorConfig &config) {
  if (config.strategy == "sliding") {
    LOG(LogLevel::DEBUG, LogComponent::DETECTION_STATS,
        "Creating sliding window statistics, size " << config.window_size);
    return std::make_unique<SlidingWindowStatistics>(config.window_size,
                                                     config.resync_interval);
  }
  if (config.strategy == "decay") {
    LOG(LogLevel::DEBUG, LogComponent::DETECTION_STATS,
        "Creating decay window statistics, half life " << config.half_life);
    return std::make_unique<DecayWindowStatistics>(config.half_life);
  }
  throw std::invalid_argument("Unknown window statistics strategy: " +
                              config.strategy);
}

} // namespace learning
