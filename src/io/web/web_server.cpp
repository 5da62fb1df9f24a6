#include "web_server.hpp"
#include "core/logger.hpp"
#include "core/metrics_manager.hpp"
#include "utils/json_formatter.hpp"
#include "utils/utils.hpp"

#include <chrono>
#include <stdexcept>

WebServer::WebServer(const std::string &host, int port,
                     DetectionController &controller,
                     size_t recent_history_size)
    : host_(host), port_(port), controller_(controller),
      max_history_(recent_history_size) {
  if (max_history_ == 0)
    throw std::invalid_argument("Recent history size must be greater than 0");

  server_ = std::make_unique<httplib::Server>();
  register_routes();

  LOG(LogLevel::INFO, LogComponent::IO_WEB,
      "Web server initialized for " << host_ << ":" << port_);
}

WebServer::~WebServer() {
  if (server_thread_.joinable() || collector_thread_.joinable())
    stop();
}

void WebServer::register_routes() {
  server_->Get("/metrics", [](const httplib::Request &req,
                              httplib::Response &res) {
    LOG(LogLevel::DEBUG, LogComponent::IO_WEB,
        "Received request for /metrics from " << req.remote_addr);
    res.set_content(MetricsManager::instance().expose_as_prometheus_text(),
                    "text/plain; version=0.0.4");
  });

  server_->Get("/api/v1/metrics",
               [](const httplib::Request &, httplib::Response &res) {
                 res.set_content(MetricsManager::instance().expose_as_json(),
                                 "application/json");
               });

  server_->Get("/api/v1/controller/state",
               [this](const httplib::Request &, httplib::Response &res) {
                 res.set_content(build_state_json().dump(2),
                                 "application/json");
               });

  server_->Get("/api/v1/stream/recent", [this](const httplib::Request &req,
                                               httplib::Response &res) {
    size_t limit = 0;
    if (req.has_param("limit")) {
      auto parsed =
          Utils::string_to_number<size_t>(req.get_param_value("limit"));
      if (!parsed) {
        res.status = 400;
        res.set_content(R"({"error":"limit must be a non-negative integer"})",
                        "application/json");
        return;
      }
      limit = *parsed;
    }
    res.set_content(build_recent_json(limit).dump(), "application/json");
  });
}

bool WebServer::start() {
  if (server_thread_.joinable())
    return true; // Already running

  shutdown_flag_ = false;
  if (!server_->bind_to_port(host_, port_)) {
    LOG(LogLevel::ERROR, LogComponent::IO_WEB,
        "Web server failed to bind " << host_ << ":" << port_);
    return false;
  }

  auto channel = controller_.get_channel();
  if (channel->mode() == ChannelMode::FAN_OUT) {
    subscription_ = channel->subscribe();
    collector_thread_ = std::thread(&WebServer::collect_recent, this);
  } else {
    LOG(LogLevel::WARN, LogComponent::IO_WEB,
        "Channel is single-consumer; the recent stream feed stays empty");
  }

  server_thread_ = std::thread(&WebServer::run, this);
  return true;
}

void WebServer::stop() {
  shutdown_flag_ = true;
  if (server_)
    server_->stop();

  if (server_thread_.joinable())
    server_thread_.join();
  if (collector_thread_.joinable())
    collector_thread_.join();

  if (subscription_) {
    controller_.get_channel()->unsubscribe(subscription_);
    subscription_.reset();
  }
  LOG(LogLevel::INFO, LogComponent::IO_WEB, "Web server stopped");
}

void WebServer::run() {
  LOG(LogLevel::INFO, LogComponent::IO_WEB,
      "Web server listening on " << host_ << ":" << port_);
  if (!server_->listen_after_bind() && !shutdown_flag_)
    LOG(LogLevel::ERROR, LogComponent::IO_WEB,
        "Web server stopped listening on " << host_ << ":" << port_);
}

void WebServer::collect_recent() {
  ClassifiedSample classified;
  while (!shutdown_flag_) {
    if (subscription_->wait_for_pop(classified,
                                    std::chrono::milliseconds(100)))
      record_sample(classified);
    else if (subscription_->is_closed())
      break;
  }
}

void WebServer::record_sample(const ClassifiedSample &classified) {
  std::lock_guard<std::mutex> lock(history_mutex_);
  recent_history_.push_back(classified);
  while (recent_history_.size() > max_history_)
    recent_history_.pop_front();
}

size_t WebServer::get_history_size() const {
  std::lock_guard<std::mutex> lock(history_mutex_);
  return recent_history_.size();
}

nlohmann::json WebServer::build_state_json() const {
  nlohmann::json j;
  const auto &config = controller_.get_config();
  auto channel = controller_.get_channel();

  j["state"] = run_state_to_string(controller_.get_state());
  j["sensitivity"] = controller_.get_sensitivity();
  j["strategy"] = config.strategy;
  j["warmup_count"] = config.warmup_count;
  j["window"] =
      JsonFormatter::window_snapshot_to_json_object(
          controller_.get_window_snapshot());
  j["statistics"] = JsonFormatter::controller_statistics_to_json_object(
      controller_.get_statistics());
  j["channel"] = {{"mode", channel_mode_to_string(channel->mode())},
                  {"capacity", channel->capacity()},
                  {"subscribers", channel->subscriber_count()},
                  {"published", channel->published_count()},
                  {"dropped", channel->dropped_count()}};
  return j;
}

nlohmann::json WebServer::build_recent_json(size_t limit) const {
  std::lock_guard<std::mutex> lock(history_mutex_);
  size_t skip = 0;
  if (limit != 0 && limit < recent_history_.size())
    skip = recent_history_.size() - limit;

  nlohmann::json samples = nlohmann::json::array();
  for (size_t i = skip; i < recent_history_.size(); ++i)
    samples.push_back(
        JsonFormatter::classified_sample_to_json_object(recent_history_[i]));
  return samples;
}
