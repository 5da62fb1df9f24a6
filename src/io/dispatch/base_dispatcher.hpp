#ifndef BASE_DISPATCHER_HPP
#define BASE_DISPATCHER_HPP

#include "core/sample.hpp"
#include <string>

class IEventDispatcher {
public:
  virtual ~IEventDispatcher() = default;
  virtual bool dispatch(const ClassifiedSample &classified) = 0;
  virtual const char *get_name() const = 0;
  virtual std::string get_dispatcher_type() const = 0;
};

#endif // BASE_DISPATCHER_HPP
