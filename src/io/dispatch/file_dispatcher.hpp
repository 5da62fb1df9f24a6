#ifndef FILE_DISPATCHER_HPP
#define FILE_DISPATCHER_HPP

#include "base_dispatcher.hpp"

#include <fstream>
#include <string>

// Appends one JSON document per classified sample to a file
class FileDispatcher : public IEventDispatcher {
public:
  explicit FileDispatcher(const std::string &file_path);
  ~FileDispatcher() override;

  bool dispatch(const ClassifiedSample &classified) override;
  const char *get_name() const override { return "FileDispatcher"; }
  std::string get_dispatcher_type() const override { return "file"; }

  bool is_open() const { return output_stream_.is_open(); }

private:
  std::string output_path_;
  std::ofstream output_stream_;
};

#endif // FILE_DISPATCHER_HPP
