#include "stdout_dispatcher.hpp"
#include "core/logger.hpp"
#include "utils/json_formatter.hpp"

#include <mutex>

bool StdoutDispatcher::dispatch(const ClassifiedSample &classified) {
  try {
    const std::string json_output =
        JsonFormatter::format_classified_sample_to_json(classified);
    std::lock_guard<std::mutex> lock(LogManager::instance().output_mutex());
    out_ << json_output << std::endl;
    return out_.good();
  } catch (const std::exception &e) {
    LOG(LogLevel::ERROR, LogComponent::IO_DISPATCH,
        "Exception while dispatching sample to stdout: " << e.what());
    return false;
  }
}
