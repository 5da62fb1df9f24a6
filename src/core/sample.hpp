#ifndef SAMPLE_HPP
#define SAMPLE_HPP

#include <cstdint>

// One timestamped scalar reading from the monitored stream
struct Sample {
  uint64_t timestamp_ms = 0;
  double value = 0.0;

  Sample() = default;
  Sample(uint64_t ts_ms, double v) : timestamp_ms(ts_ms), value(v) {}
};

// The outcome of running one Sample through the detection pipeline.
// mean/stddev are the window statistics the sample was scored against.
struct ClassifiedSample {
  Sample sample;
  double deviation_score = 0.0;
  bool is_anomaly = false;

  double window_mean = 0.0;
  double window_stddev = 0.0;
  double sensitivity = 0.0;

  // Position in the classified stream since the controller was created
  uint64_t sequence = 0;
};

#endif // SAMPLE_HPP
