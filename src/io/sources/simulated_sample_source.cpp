#include "simulated_sample_source.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>

namespace {
uint64_t resolve_seed(uint64_t configured) {
  if (configured != 0)
    return configured;
  std::random_device rd;
  return (static_cast<uint64_t>(rd()) << 32) | rd();
}
} // namespace

SimulatedSampleSource::SimulatedSampleSource(
    const Config::SourceConfig &config, uint64_t base_timestamp_ms)
    : num_points_(config.num_points), anomaly_ratio_(config.anomaly_ratio),
      corrupt_ratio_(config.corrupt_ratio),
      base_timestamp_ms_(base_timestamp_ms),
      step_ms_(std::max<uint64_t>(1, config.sample_interval_ms)),
      rng_(resolve_seed(config.seed)),
      noise_dist_(-NOISE_AMPLITUDE, NOISE_AMPLITUDE),
      spike_dist_(SPIKE_MIN, SPIKE_MAX), unit_dist_(0.0, 1.0) {
  if (!(anomaly_ratio_ >= 0.0 && anomaly_ratio_ <= 1.0) ||
      !(corrupt_ratio_ >= 0.0 && corrupt_ratio_ <= 1.0)) {
    throw std::invalid_argument(
        "Simulated source ratios must lie within [0, 1]");
  }
  LOG(LogLevel::INFO, LogComponent::IO_SOURCE,
      "Simulated source ready: points="
          << (num_points_ == 0 ? std::string("endless")
                               : std::to_string(num_points_))
          << " anomaly_ratio=" << anomaly_ratio_
          << " corrupt_ratio=" << corrupt_ratio_);
}

Sample SimulatedSampleSource::generate_one() {
  const uint64_t i = index_++;
  double value = BASE_LEVEL + noise_dist_(rng_) +
                 static_cast<double>(i % TREND_PERIOD);

  if (unit_dist_(rng_) < anomaly_ratio_) {
    value += spike_dist_(rng_);
    injected_anomalies_++;
  }
  if (unit_dist_(rng_) < corrupt_ratio_) {
    value = std::numeric_limits<double>::quiet_NaN();
    injected_corruptions_++;
  }

  return Sample(base_timestamp_ms_ + i * step_ms_, value);
}

std::vector<Sample> SimulatedSampleSource::get_next_batch(size_t max_samples) {
  std::vector<Sample> batch;
  if (max_samples == 0)
    return batch;

  batch.reserve(max_samples);
  while (batch.size() < max_samples && !is_exhausted())
    batch.push_back(generate_one());

  LOG(LogLevel::TRACE, LogComponent::IO_SOURCE,
      "Generated " << batch.size() << " samples, total " << index_);
  return batch;
}

bool SimulatedSampleSource::is_exhausted() const {
  return num_points_ != 0 && index_ >= num_points_;
}
