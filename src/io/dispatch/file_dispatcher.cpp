#include "file_dispatcher.hpp"
#include "core/logger.hpp"
#include "utils/json_formatter.hpp"
#include "utils/utils.hpp"

#include <string>

FileDispatcher::FileDispatcher(const std::string &file_path)
    : output_path_(file_path) {
  if (output_path_.empty())
    return;

  if (!Utils::create_directory_for_file(output_path_))
    LOG(LogLevel::WARN, LogComponent::IO_DISPATCH,
        "Could not create directory for " << output_path_);

  output_stream_.open(output_path_, std::ios::app);
  if (!output_stream_.is_open())
    LOG(LogLevel::ERROR, LogComponent::IO_DISPATCH,
        "FileDispatcher could not open output file: " << output_path_);
}

FileDispatcher::~FileDispatcher() {
  if (output_stream_.is_open()) {
    output_stream_.flush();
    output_stream_.close();
    LOG(LogLevel::TRACE, LogComponent::IO_DISPATCH,
        "FileDispatcher closed output file: " << output_path_);
  }
}

bool FileDispatcher::dispatch(const ClassifiedSample &classified) {
  if (!output_stream_.is_open())
    return false;

  try {
    const std::string json_output =
        JsonFormatter::format_classified_sample_to_json(classified);
    output_stream_ << json_output << '\n';
    output_stream_.flush();

    if (!output_stream_.good()) {
      LOG(LogLevel::ERROR, LogComponent::IO_DISPATCH,
          "Failed to write sample #" << classified.sequence << " to "
                                     << output_path_);
      return false;
    }
    LOG(LogLevel::TRACE, LogComponent::IO_DISPATCH,
        "Sample dispatched to file: " << json_output);
    return true;
  } catch (const std::exception &e) {
    LOG(LogLevel::ERROR, LogComponent::IO_DISPATCH,
        "Exception while dispatching sample to file: " << e.what());
    return false;
  }
}
