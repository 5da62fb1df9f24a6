#include "file_sample_source.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

FileSampleSource::FileSampleSource(const std::string &filepath)
    : filepath_(filepath) {
  sample_file_stream_.open(filepath);
  if (!sample_file_stream_.is_open()) {
    LOG(LogLevel::FATAL, LogComponent::IO_SOURCE,
        "Failed to open sample source file: " << filepath);
    throw std::runtime_error("Failed to open sample source file: " + filepath);
  }
  LOG(LogLevel::INFO, LogComponent::IO_SOURCE,
      "Successfully opened sample file: " << filepath);
}

FileSampleSource::~FileSampleSource() {
  if (sample_file_stream_.is_open())
    sample_file_stream_.close();
  LOG(LogLevel::INFO, LogComponent::IO_SOURCE,
      "FileSampleSource closed. Lines read: " << line_number_
                                              << ", malformed: "
                                              << malformed_lines_);
}

namespace {
// Unlike string_to_number, "" and "-" are not readings
std::optional<double> parse_reading(const std::string &field) {
  if (field.empty() || field == "-")
    return std::nullopt;
  return Utils::string_to_number<double>(field);
}
} // namespace

std::optional<Sample>
FileSampleSource::parse_line(std::string_view line,
                             uint64_t fallback_timestamp_ms) {
  auto fields = Utils::split_string_view(line, ',');
  if (fields.size() == 1) {
    auto value = parse_reading(Utils::trim_copy(fields[0]));
    if (!value)
      return std::nullopt;
    return Sample(fallback_timestamp_ms, *value);
  }

  if (fields.size() == 2) {
    const std::string ts_field = Utils::trim_copy(fields[0]);
    const std::string value_field = Utils::trim_copy(fields[1]);
    if (ts_field.empty() || ts_field == "-")
      return std::nullopt;
    auto ts = Utils::string_to_number<uint64_t>(ts_field);
    auto value = parse_reading(value_field);
    if (!ts || !value)
      return std::nullopt;
    return Sample(*ts, *value);
  }

  return std::nullopt;
}

std::vector<Sample> FileSampleSource::get_next_batch(size_t max_samples) {
  std::vector<Sample> batch;
  if (exhausted_ || max_samples == 0)
    return batch;

  batch.reserve(max_samples);
  std::string line;
  while (batch.size() < max_samples) {
    if (!std::getline(sample_file_stream_, line)) {
      exhausted_ = true;
      break;
    }
    line_number_++;

    Utils::trim_inplace(line);
    if (line.empty() || line.front() == '#')
      continue;

    if (auto sample = parse_line(line, Utils::get_current_time_ms())) {
      batch.push_back(*sample);
    } else {
      malformed_lines_++;
      LOG(LogLevel::WARN, LogComponent::IO_SOURCE,
          "Malformed sample at " << filepath_ << ":" << line_number_ << ": '"
                                 << line << "'");
      batch.emplace_back(Utils::get_current_time_ms(),
                         std::numeric_limits<double>::quiet_NaN());
    }
  }

  LOG(LogLevel::DEBUG, LogComponent::IO_SOURCE,
      "Read " << batch.size() << " samples from file at line number "
              << line_number_);
  return batch;
}
