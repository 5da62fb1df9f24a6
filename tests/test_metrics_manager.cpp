#include "core/metrics_manager.hpp"
#include "utils/scoped_timer.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

// The registry is process-wide, so every test registers its own names

TEST(MetricsManagerTest, LabeledCounterTracksSeries) {
  auto *counter = MetricsManager::instance().register_labeled_counter(
      "test_labeled_counter_total", "Counter under test.");
  counter->increment({{"outcome", "anomaly"}});
  counter->increment({{"outcome", "anomaly"}}, 2);
  counter->increment({{"outcome", "normal"}});

  EXPECT_EQ(counter->get_value({{"outcome", "anomaly"}}), 3u);
  EXPECT_EQ(counter->get_value({{"outcome", "normal"}}), 1u);
  EXPECT_EQ(counter->get_value({{"outcome", "invalid"}}), 0u);
  EXPECT_EQ(counter->get_total(), 4u);
}

TEST(MetricsManagerTest, DuplicateRegistrationThrows) {
  MetricsManager::instance().register_gauge("test_duplicate_gauge", "x");
  EXPECT_THROW(
      MetricsManager::instance().register_gauge("test_duplicate_gauge", "x"),
      std::runtime_error);

  auto *a = MetricsManager::instance().get_or_register_gauge(
      "test_shared_gauge", "Shared.");
  auto *b = MetricsManager::instance().get_or_register_gauge(
      "test_shared_gauge", "Shared.");
  EXPECT_EQ(a, b);
}

TEST(MetricsManagerTest, PrometheusTextExposition) {
  auto *counter = MetricsManager::instance().register_labeled_counter(
      "test_prom_counter_total", "Prometheus counter.");
  counter->increment({{"kind", "a"}}, 5);
  auto *gauge = MetricsManager::instance().register_gauge("test_prom_gauge",
                                                          "Prometheus gauge.");
  gauge->set(2.5);

  std::string text = MetricsManager::instance().expose_as_prometheus_text();
  EXPECT_NE(text.find("# TYPE test_prom_counter_total counter"),
            std::string::npos);
  EXPECT_NE(text.find("test_prom_counter_total{kind=\"a\"} 5"),
            std::string::npos);
  EXPECT_NE(text.find("# TYPE test_prom_gauge gauge"), std::string::npos);
  EXPECT_NE(text.find("test_prom_gauge 2.5"), std::string::npos);
}

TEST(MetricsManagerTest, JsonExposition) {
  auto *histogram = MetricsManager::instance().register_histogram(
      "test_json_histogram_seconds", "Histogram under test.");
  histogram->observe(0.25);
  histogram->observe(0.75);

  auto j = nlohmann::json::parse(MetricsManager::instance().expose_as_json());
  ASSERT_TRUE(j.contains("histograms"));
  const auto &h = j["histograms"]["test_json_histogram_seconds"];
  EXPECT_EQ(h["count"].get<uint64_t>(), 2u);
  EXPECT_DOUBLE_EQ(h["sum"].get<double>(), 1.0);
  EXPECT_EQ(h["recent_observations"].size(), 2u);
  EXPECT_EQ(h["buckets"].size(),
            MetricsManager::default_latency_buckets().size());
  EXPECT_TRUE(j.contains("app_runtime_seconds"));
}

TEST(MetricsManagerTest, HistogramBucketsAreCumulative) {
  auto *histogram = MetricsManager::instance().register_histogram(
      "test_bucketed_seconds", "Bucketed histogram.", {0.1, 1.0, 10.0});
  histogram->observe(0.05);
  histogram->observe(0.1);
  histogram->observe(5.0);
  histogram->observe(50.0);

  auto cumulative = histogram->get_cumulative_bucket_counts();
  ASSERT_EQ(cumulative.size(), 4u);
  EXPECT_EQ(cumulative[0], 2u); // le 0.1 is inclusive
  EXPECT_EQ(cumulative[1], 2u);
  EXPECT_EQ(cumulative[2], 3u);
  EXPECT_EQ(cumulative[3], 4u);

  std::string text = MetricsManager::instance().expose_as_prometheus_text();
  EXPECT_NE(text.find("test_bucketed_seconds_bucket{le=\"10\"} 3"),
            std::string::npos);
  EXPECT_NE(text.find("test_bucketed_seconds_bucket{le=\"+Inf\"} 4"),
            std::string::npos);
  EXPECT_NE(text.find("test_bucketed_seconds_count 4"), std::string::npos);
}

TEST(MetricsManagerTest, RejectsUnorderedBucketBounds) {
  const std::vector<double> bounds = {1.0, 0.5};
  EXPECT_THROW(MetricsManager::instance().register_histogram(
                   "test_unordered_seconds", "Bad bounds.", bounds),
               std::invalid_argument);
}

TEST(MetricsManagerTest, NamesAreUniqueAcrossMetricKinds) {
  MetricsManager::instance().register_gauge("test_kind_clash", "Gauge.");
  EXPECT_THROW(MetricsManager::instance().register_labeled_counter(
                   "test_kind_clash", "Counter."),
               std::runtime_error);
}

TEST(MetricsManagerTest, LabelValuesAreEscaped) {
  auto *counter = MetricsManager::instance().register_labeled_counter(
      "test_escaped_total", "Escaping.");
  counter->increment({{"path", "a\"b"}});
  std::string text = MetricsManager::instance().expose_as_prometheus_text();
  EXPECT_NE(text.find("test_escaped_total{path=\"a\\\"b\"} 1"),
            std::string::npos);
}

TEST(MetricsManagerTest, ScopedTimerObservesOnce) {
  auto *histogram = MetricsManager::instance().register_histogram(
      "test_scoped_timer_seconds", "Timer under test.");
  {
    ScopedTimer timer(*histogram);
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  EXPECT_EQ(histogram->get_cumulative_count(), 1u);
  EXPECT_GE(histogram->get_cumulative_sum(), 0.004);
}

TEST(MetricsManagerTest, ConcurrentIncrements) {
  auto *counter = MetricsManager::instance().register_labeled_counter(
      "test_concurrent_counter_total", "Concurrent counter.");
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t)
    threads.emplace_back([counter] {
      for (int i = 0; i < 1000; ++i)
        counter->increment({{"thread", "any"}});
    });
  for (auto &t : threads)
    t.join();
  EXPECT_EQ(counter->get_total(), 4000u);
}
