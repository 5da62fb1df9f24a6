#ifndef BASE_SAMPLE_SOURCE_HPP
#define BASE_SAMPLE_SOURCE_HPP

#include "core/sample.hpp"

#include <cstddef>
#include <vector>

class ISampleSource {
public:
  virtual ~ISampleSource() = default;

  // Fetches up to max_samples readings in stream order
  // Returns an empty vector if no new readings are available
  virtual std::vector<Sample> get_next_batch(size_t max_samples) = 0;

  // True once the source will never produce another reading
  virtual bool is_exhausted() const = 0;

  virtual const char *get_name() const = 0;
};

#endif // BASE_SAMPLE_SOURCE_HPP
