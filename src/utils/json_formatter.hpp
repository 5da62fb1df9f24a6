#ifndef JSON_FORMATTER_HPP
#define JSON_FORMATTER_HPP

#include "core/sample.hpp"
#include "detection/detection_types.hpp"
#include "learning/window_statistics.hpp"
#include "nlohmann/json.hpp"

#include <string>

namespace JsonFormatter {

// Non-finite doubles (the stddev of an empty window) are written as null
nlohmann::json finite_or_null(double value);

nlohmann::json
classified_sample_to_json_object(const ClassifiedSample &classified);
std::string format_classified_sample_to_json(const ClassifiedSample &classified);

nlohmann::json
window_snapshot_to_json_object(const learning::WindowSnapshot &snapshot);
nlohmann::json
controller_statistics_to_json_object(const ControllerStatistics &stats);

} // namespace JsonFormatter

#endif // JSON_FORMATTER_HPP
