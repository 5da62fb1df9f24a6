#ifndef SIMULATED_SAMPLE_SOURCE_HPP
#define SIMULATED_SAMPLE_SOURCE_HPP

#include "base_sample_source.hpp"
#include "core/config.hpp"

#include <cstdint>
#include <random>

// Synthetic stream: 100 + U(-10, 10) + (i mod 100), with injected spikes of
// U(50, 100) and occasional corrupt (NaN) readings.
class SimulatedSampleSource : public ISampleSource {
public:
  static constexpr double BASE_LEVEL = 100.0;
  static constexpr double NOISE_AMPLITUDE = 10.0;
  static constexpr uint64_t TREND_PERIOD = 100;
  static constexpr double SPIKE_MIN = 50.0;
  static constexpr double SPIKE_MAX = 100.0;

  // Timestamps start at base_timestamp_ms and advance by sample_interval_ms
  // (at least 1 ms) per reading. A seed of 0 draws one from random_device.
  SimulatedSampleSource(const Config::SourceConfig &config,
                        uint64_t base_timestamp_ms);

  std::vector<Sample> get_next_batch(size_t max_samples) override;
  bool is_exhausted() const override;
  const char *get_name() const override { return "SimulatedSampleSource"; }

  uint64_t get_generated_count() const { return index_; }
  uint64_t get_injected_anomalies() const { return injected_anomalies_; }
  uint64_t get_injected_corruptions() const { return injected_corruptions_; }

private:
  Sample generate_one();

  uint64_t num_points_; // 0 means endless
  double anomaly_ratio_;
  double corrupt_ratio_;
  uint64_t base_timestamp_ms_;
  uint64_t step_ms_;

  std::mt19937_64 rng_;
  std::uniform_real_distribution<double> noise_dist_;
  std::uniform_real_distribution<double> spike_dist_;
  std::uniform_real_distribution<double> unit_dist_;

  uint64_t index_ = 0;
  uint64_t injected_anomalies_ = 0;
  uint64_t injected_corruptions_ = 0;
};

#endif // SIMULATED_SAMPLE_SOURCE_HPP
