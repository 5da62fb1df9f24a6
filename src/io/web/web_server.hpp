#ifndef WEB_SERVER_HPP
#define WEB_SERVER_HPP

#include "core/sample.hpp"
#include "detection/detection_controller.hpp"
#include "httplib.h"
#include "nlohmann/json.hpp"

#include <atomic>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

// HTTP surface for operators: Prometheus scrape, JSON metrics, controller
// state and the most recent classified samples for a live chart.
class WebServer {
public:
  WebServer(const std::string &host, int port,
            DetectionController &controller, size_t recent_history_size);
  ~WebServer();

  // Binds synchronously, then serves on a background thread. In fan-out mode
  // the server also subscribes to the controller's channel for its history.
  // Returns false when the address cannot be bound.
  bool start();
  void stop();

  // Appends to the recent history, evicting the oldest entry when full
  void record_sample(const ClassifiedSample &classified);

  nlohmann::json build_state_json() const;
  // Oldest first; limit 0 returns the whole history
  nlohmann::json build_recent_json(size_t limit) const;

  size_t get_history_size() const;

private:
  void run();
  void collect_recent();
  void register_routes();

  std::unique_ptr<httplib::Server> server_;
  std::thread server_thread_;
  std::thread collector_thread_;
  std::atomic<bool> shutdown_flag_{false};
  std::string host_;
  int port_;
  DetectionController &controller_;

  std::shared_ptr<DetectionController::Channel::Subscriber> subscription_;

  mutable std::mutex history_mutex_;
  std::deque<ClassifiedSample> recent_history_;
  const size_t max_history_;
};

#endif // WEB_SERVER_HPP
