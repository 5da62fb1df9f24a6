#ifndef STDOUT_DISPATCHER_HPP
#define STDOUT_DISPATCHER_HPP

#include "base_dispatcher.hpp"

#include <iostream>
#include <string>

// Writes one JSON document per line to a stream, stdout by default. Lines are
// serialized with log output so the two never interleave.
class StdoutDispatcher : public IEventDispatcher {
public:
  explicit StdoutDispatcher(std::ostream &out = std::cout) : out_(out) {}

  bool dispatch(const ClassifiedSample &classified) override;
  const char *get_name() const override { return "StdoutDispatcher"; }
  std::string get_dispatcher_type() const override { return "stdout"; }

private:
  std::ostream &out_;
};

#endif // STDOUT_DISPATCHER_HPP
