#ifndef METRICS_MANAGER_HPP
#define METRICS_MANAGER_HPP

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

class MetricsManager;

using MetricLabels = std::map<std::string, std::string>;
using SteadyTimePoint = std::chrono::steady_clock::time_point;

// Monotonic counter split into one series per label set
struct LabeledCounter {
  friend class MetricsManager;
  void increment(const MetricLabels &labels, uint64_t value = 1);
  uint64_t get_value(const MetricLabels &labels) const;
  uint64_t get_total() const;

private:
  LabeledCounter(std::string name, std::string help)
      : name(std::move(name)), help(std::move(help)) {}

  std::string name;
  std::string help;
  std::map<MetricLabels, std::unique_ptr<std::atomic<uint64_t>>> series_;
  mutable std::mutex series_mutex_;
};

struct Gauge {
  friend class MetricsManager;
  void set(double value) { val.store(value, std::memory_order_relaxed); }
  double get_value() const { return val.load(std::memory_order_relaxed); }

private:
  Gauge(std::string name, std::string help)
      : name(std::move(name)), help(std::move(help)), val(0.0) {}
  std::string name;
  std::string help;
  std::atomic<double> val;
};

// Fixed-bucket histogram. Bucket counts are per bucket, not cumulative;
// the exposition formats accumulate them. A short tail of raw observations
// is retained for charting on the JSON endpoint.
struct Histogram {
  friend class MetricsManager;
  void observe(double value);

  std::vector<std::pair<SteadyTimePoint, double>>
  get_recent_observations() const;

  double get_cumulative_sum() const;
  uint64_t get_cumulative_count() const;

  const std::vector<double> &get_upper_bounds() const { return upper_bounds_; }
  // Observations at or below each upper bound, plus the +Inf bucket last
  std::vector<uint64_t> get_cumulative_bucket_counts() const;

private:
  Histogram(std::string name, std::string help,
            std::vector<double> upper_bounds);

  std::string name;
  std::string help;
  const std::vector<double> upper_bounds_;

  mutable std::mutex mtx;
  std::vector<uint64_t> bucket_counts_; // size upper_bounds_ + 1
  std::deque<std::pair<SteadyTimePoint, double>> recent_;
  double sum_ = 0.0;
  uint64_t count_ = 0;

  static constexpr size_t MAX_RECENT_OBSERVATIONS = 200;
};

class MetricsManager {
public:
  static MetricsManager &instance();

  MetricsManager(const MetricsManager &) = delete;
  void operator=(const MetricsManager &) = delete;

  // Bucket bounds suited to per-sample latencies, in seconds
  static std::vector<double> default_latency_buckets();

  // Registering a name twice throws std::runtime_error
  LabeledCounter *register_labeled_counter(const std::string &name,
                                           const std::string &help_text);
  Gauge *register_gauge(const std::string &name, const std::string &help_text);
  // Bounds must be strictly increasing, otherwise std::invalid_argument
  Histogram *register_histogram(
      const std::string &name, const std::string &help_text,
      std::vector<double> upper_bounds = default_latency_buckets());

  Gauge *get_or_register_gauge(const std::string &name,
                               const std::string &help_text);

  std::string expose_as_prometheus_text();
  std::string expose_as_json();

private:
  MetricsManager() : start_time_(std::chrono::steady_clock::now()) {}
  ~MetricsManager() = default;

  void ensure_unregistered(const std::string &name) const;

  std::map<std::string, std::unique_ptr<LabeledCounter>> labeled_counters_;
  std::map<std::string, std::unique_ptr<Gauge>> gauges_;
  std::map<std::string, std::unique_ptr<Histogram>> histograms_;
  mutable std::mutex registry_mutex_;

  const SteadyTimePoint start_time_;
};

#endif // METRICS_MANAGER_HPP
