#include "metrics_manager.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace {

std::string escape_label_value(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  for (char c : raw) {
    if (c == '\\' || c == '"')
      out += '\\';
    if (c == '\n') {
      out += "\\n";
      continue;
    }
    out += c;
  }
  return out;
}

// Renders {k="v",...} for the text format, empty when there are no labels
std::string prometheus_labels(const MetricLabels &labels) {
  if (labels.empty())
    return "";
  std::string out = "{";
  for (auto it = labels.begin(); it != labels.end(); ++it) {
    if (it != labels.begin())
      out += ',';
    out += it->first + "=\"" + escape_label_value(it->second) + "\"";
  }
  return out + "}";
}

// Renders k=v,... as a flat JSON key
std::string json_series_key(const MetricLabels &labels) {
  std::string out;
  for (const auto &[key, val] : labels) {
    if (!out.empty())
      out += ',';
    out += key + "=" + val;
  }
  return out;
}

std::string prometheus_number(double value) {
  if (std::isnan(value))
    return "NaN";
  if (std::isinf(value))
    return value > 0 ? "+Inf" : "-Inf";
  std::ostringstream oss;
  oss << value;
  return oss.str();
}

void write_header(std::ostringstream &out, const std::string &name,
                  const std::string &help, const char *type) {
  out << "# HELP " << name << " " << help << "\n";
  out << "# TYPE " << name << " " << type << "\n";
}

} // namespace

// --- Histogram ---

Histogram::Histogram(std::string name, std::string help,
                     std::vector<double> upper_bounds)
    : name(std::move(name)), help(std::move(help)),
      upper_bounds_(std::move(upper_bounds)),
      bucket_counts_(upper_bounds_.size() + 1, 0) {}

void Histogram::observe(double value) {
  // First bound >= value; values above every bound land in +Inf
  auto bucket = std::lower_bound(upper_bounds_.begin(), upper_bounds_.end(),
                                 value) -
                upper_bounds_.begin();

  std::lock_guard<std::mutex> lock(mtx);
  bucket_counts_[static_cast<size_t>(bucket)]++;
  sum_ += value;
  count_++;
  recent_.emplace_back(std::chrono::steady_clock::now(), value);
  if (recent_.size() > MAX_RECENT_OBSERVATIONS)
    recent_.pop_front();
}

std::vector<std::pair<SteadyTimePoint, double>>
Histogram::get_recent_observations() const {
  std::lock_guard<std::mutex> lock(mtx);
  return {recent_.begin(), recent_.end()};
}

double Histogram::get_cumulative_sum() const {
  std::lock_guard<std::mutex> lock(mtx);
  return sum_;
}

uint64_t Histogram::get_cumulative_count() const {
  std::lock_guard<std::mutex> lock(mtx);
  return count_;
}

std::vector<uint64_t> Histogram::get_cumulative_bucket_counts() const {
  std::lock_guard<std::mutex> lock(mtx);
  std::vector<uint64_t> cumulative(bucket_counts_.size());
  uint64_t running = 0;
  for (size_t i = 0; i < bucket_counts_.size(); ++i) {
    running += bucket_counts_[i];
    cumulative[i] = running;
  }
  return cumulative;
}

// --- LabeledCounter ---

void LabeledCounter::increment(const MetricLabels &labels, uint64_t value) {
  std::lock_guard<std::mutex> lock(series_mutex_);
  auto &series = series_[labels];
  if (!series)
    series = std::make_unique<std::atomic<uint64_t>>(0);
  series->fetch_add(value, std::memory_order_relaxed);
}

uint64_t LabeledCounter::get_value(const MetricLabels &labels) const {
  std::lock_guard<std::mutex> lock(series_mutex_);
  auto it = series_.find(labels);
  return it == series_.end() ? 0 : it->second->load(std::memory_order_relaxed);
}

uint64_t LabeledCounter::get_total() const {
  std::lock_guard<std::mutex> lock(series_mutex_);
  uint64_t total = 0;
  for (const auto &entry : series_)
    total += entry.second->load(std::memory_order_relaxed);
  return total;
}

// --- MetricsManager ---

MetricsManager &MetricsManager::instance() {
  static MetricsManager instance;
  return instance;
}

std::vector<double> MetricsManager::default_latency_buckets() {
  return {1e-6, 5e-6, 1e-5, 5e-5, 1e-4, 5e-4, 1e-3, 5e-3, 1e-2, 5e-2, 0.1};
}

void MetricsManager::ensure_unregistered(const std::string &name) const {
  if (labeled_counters_.count(name) || gauges_.count(name) ||
      histograms_.count(name))
    throw std::runtime_error("Metric already registered: " + name);
}

LabeledCounter *
MetricsManager::register_labeled_counter(const std::string &name,
                                         const std::string &help_text) {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  ensure_unregistered(name);
  auto &slot = labeled_counters_[name];
  slot.reset(new LabeledCounter(name, help_text));
  return slot.get();
}

Gauge *MetricsManager::register_gauge(const std::string &name,
                                      const std::string &help_text) {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  ensure_unregistered(name);
  auto &slot = gauges_[name];
  slot.reset(new Gauge(name, help_text));
  return slot.get();
}

Gauge *MetricsManager::get_or_register_gauge(const std::string &name,
                                             const std::string &help_text) {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  auto it = gauges_.find(name);
  if (it != gauges_.end())
    return it->second.get();
  ensure_unregistered(name);
  auto &slot = gauges_[name];
  slot.reset(new Gauge(name, help_text));
  return slot.get();
}

Histogram *MetricsManager::register_histogram(const std::string &name,
                                              const std::string &help_text,
                                              std::vector<double> upper_bounds) {
  for (size_t i = 0; i < upper_bounds.size(); ++i) {
    if (!std::isfinite(upper_bounds[i]) ||
        (i > 0 && upper_bounds[i] <= upper_bounds[i - 1]))
      throw std::invalid_argument("Histogram " + name +
                                  " needs strictly increasing finite bounds");
  }

  std::lock_guard<std::mutex> lock(registry_mutex_);
  ensure_unregistered(name);
  auto &slot = histograms_[name];
  slot.reset(new Histogram(name, help_text, std::move(upper_bounds)));
  return slot.get();
}

std::string MetricsManager::expose_as_prometheus_text() {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  std::ostringstream out;

  for (const auto &[name, counter] : labeled_counters_) {
    write_header(out, name, counter->help, "counter");
    std::lock_guard<std::mutex> series_lock(counter->series_mutex_);
    for (const auto &[labels, value] : counter->series_)
      out << name << prometheus_labels(labels) << " "
          << value->load(std::memory_order_relaxed) << "\n";
  }

  for (const auto &[name, gauge] : gauges_) {
    write_header(out, name, gauge->help, "gauge");
    out << name << " " << prometheus_number(gauge->get_value()) << "\n";
  }

  for (const auto &[name, histogram] : histograms_) {
    write_header(out, name, histogram->help, "histogram");
    const auto &bounds = histogram->get_upper_bounds();
    const auto cumulative = histogram->get_cumulative_bucket_counts();
    for (size_t i = 0; i < bounds.size(); ++i)
      out << name << "_bucket{le=\"" << prometheus_number(bounds[i]) << "\"} "
          << cumulative[i] << "\n";
    out << name << "_bucket{le=\"+Inf\"} " << cumulative.back() << "\n";
    out << name << "_sum " << prometheus_number(histogram->get_cumulative_sum())
        << "\n";
    out << name << "_count " << histogram->get_cumulative_count() << "\n";
  }

  return out.str();
}

std::string MetricsManager::expose_as_json() {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  const auto now = std::chrono::steady_clock::now();

  json j;
  j["server_timestamp_ms"] =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count();
  j["app_runtime_seconds"] =
      std::chrono::duration_cast<std::chrono::seconds>(now - start_time_)
          .count();

  json counters = json::object();
  for (const auto &[name, counter] : labeled_counters_) {
    json series = json::object();
    uint64_t total = 0;
    std::lock_guard<std::mutex> series_lock(counter->series_mutex_);
    for (const auto &[labels, value] : counter->series_) {
      const uint64_t v = value->load(std::memory_order_relaxed);
      total += v;
      if (!labels.empty())
        series[json_series_key(labels)] = v;
    }
    series["total"] = total;
    counters[name] = std::move(series);
  }
  j["counters"] = std::move(counters);

  json gauges = json::object();
  for (const auto &[name, gauge] : gauges_) {
    const double v = gauge->get_value();
    gauges[name] = std::isfinite(v) ? json(v) : json(nullptr);
  }
  j["gauges"] = std::move(gauges);

  json histograms = json::object();
  for (const auto &[name, histogram] : histograms_) {
    json buckets = json::array();
    const auto &bounds = histogram->get_upper_bounds();
    const auto cumulative = histogram->get_cumulative_bucket_counts();
    for (size_t i = 0; i < bounds.size(); ++i)
      buckets.push_back({{"le", bounds[i]}, {"count", cumulative[i]}});

    // Seconds before now, for charting
    json recent = json::array();
    for (const auto &[when, value] : histogram->get_recent_observations())
      recent.push_back(
          {std::chrono::duration<double>(now - when).count(), value});

    histograms[name] = {{"count", histogram->get_cumulative_count()},
                        {"sum", histogram->get_cumulative_sum()},
                        {"buckets", std::move(buckets)},
                        {"recent_observations", std::move(recent)}};
  }
  j["histograms"] = std::move(histograms);

  return j.dump();
}
