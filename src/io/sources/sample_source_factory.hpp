#ifndef SAMPLE_SOURCE_FACTORY_HPP
#define SAMPLE_SOURCE_FACTORY_HPP

#include "base_sample_source.hpp"
#include "core/config.hpp"

#include <memory>

// Builds the source named by [Source] type. Throws std::invalid_argument for
// an unknown type and std::runtime_error when a file source cannot be opened.
std::unique_ptr<ISampleSource>
make_sample_source(const Config::SourceConfig &config);

#endif // SAMPLE_SOURCE_FACTORY_HPP
