#ifndef FILE_SAMPLE_SOURCE_HPP
#define FILE_SAMPLE_SOURCE_HPP

#include "base_sample_source.hpp"

#include <cstdint>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>

// Reads one reading per line, either "value" or "timestamp_ms,value".
// Blank lines and lines starting with '#' are skipped. Lines that do not
// parse become NaN readings so the controller counts them as invalid.
class FileSampleSource : public ISampleSource {
public:
  // Throws std::runtime_error when the file cannot be opened
  explicit FileSampleSource(const std::string &filepath);
  ~FileSampleSource() override;

  std::vector<Sample> get_next_batch(size_t max_samples) override;
  bool is_exhausted() const override { return exhausted_; }
  const char *get_name() const override { return "FileSampleSource"; }

  uint64_t get_line_number() const { return line_number_; }
  uint64_t get_malformed_count() const { return malformed_lines_; }

  // Parses one non-comment line; nullopt when it is not a valid record.
  // Lines without a timestamp get fallback_timestamp_ms.
  static std::optional<Sample> parse_line(std::string_view line,
                                          uint64_t fallback_timestamp_ms);

private:
  std::string filepath_;
  std::ifstream sample_file_stream_;
  uint64_t line_number_ = 0;
  uint64_t malformed_lines_ = 0;
  bool exhausted_ = false;
};

#endif // FILE_SAMPLE_SOURCE_HPP
