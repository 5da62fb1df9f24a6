#include "json_formatter.hpp"

#include <cmath>

nlohmann::json JsonFormatter::finite_or_null(double value) {
  if (std::isfinite(value))
    return value;
  return nullptr;
}

nlohmann::json JsonFormatter::classified_sample_to_json_object(
    const ClassifiedSample &classified) {
  nlohmann::json j;
  j["sequence"] = classified.sequence;
  j["timestamp_ms"] = classified.sample.timestamp_ms;
  j["value"] = finite_or_null(classified.sample.value);
  j["deviation_score"] = finite_or_null(classified.deviation_score);
  j["is_anomaly"] = classified.is_anomaly;
  j["sensitivity"] = classified.sensitivity;

  // === Window the sample was scored against ===
  nlohmann::json j_window;
  j_window["mean"] = finite_or_null(classified.window_mean);
  j_window["stddev"] = finite_or_null(classified.window_stddev);
  j["window"] = j_window;

  return j;
}

std::string JsonFormatter::format_classified_sample_to_json(
    const ClassifiedSample &classified) {
  return classified_sample_to_json_object(classified).dump();
}

nlohmann::json JsonFormatter::window_snapshot_to_json_object(
    const learning::WindowSnapshot &snapshot) {
  nlohmann::json j;
  j["count"] = snapshot.count;
  j["total_count"] = snapshot.total_count;
  j["mean"] = finite_or_null(snapshot.mean);
  j["variance"] = finite_or_null(snapshot.variance);
  j["stddev"] = finite_or_null(snapshot.stddev);
  return j;
}

nlohmann::json JsonFormatter::controller_statistics_to_json_object(
    const ControllerStatistics &stats) {
  return {{"samples_processed", stats.samples_processed},
          {"anomalies_detected", stats.anomalies_detected},
          {"invalid_samples", stats.invalid_samples},
          {"dropped_not_running", stats.dropped_not_running},
          {"sensitivity_rejections", stats.sensitivity_rejections},
          {"model_generation", stats.model_generation}};
}
