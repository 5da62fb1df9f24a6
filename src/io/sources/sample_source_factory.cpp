#include "sample_source_factory.hpp"
#include "file_sample_source.hpp"
#include "simulated_sample_source.hpp"
#include "utils/utils.hpp"

#include <stdexcept>

std::unique_ptr<ISampleSource>
make_sample_source(const Config::SourceConfig &config) {
  if (config.type == "simulated")
    return std::make_unique<SimulatedSampleSource>(
        config, Utils::get_current_time_ms());
  if (config.type == "file")
    return std::make_unique<FileSampleSource>(config.input_path);
  throw std::invalid_argument("Unknown sample source type: " + config.type);
}
