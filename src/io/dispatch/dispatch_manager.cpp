#include "dispatch_manager.hpp"
#include "core/logger.hpp"
#include "core/metrics_manager.hpp"
#include "file_dispatcher.hpp"
#include "stdout_dispatcher.hpp"

#include <cmath>
#include <string>
#include <utility>

namespace {
LabeledCounter *dispatch_counter() {
  static LabeledCounter *counter =
      MetricsManager::instance().register_labeled_counter(
          "sad_dispatch_total",
          "Classified samples handed to dispatchers, by type and result.");
  return counter;
}
} // namespace

DispatchManager::DispatchManager()
    : mean_gauge_(MetricsManager::instance().get_or_register_gauge(
          "sad_window_mean", "Window mean the latest sample was scored "
                             "against.")),
      stddev_gauge_(MetricsManager::instance().get_or_register_gauge(
          "sad_window_stddev", "Window standard deviation the latest sample "
                               "was scored against (-1 while undefined).")),
      last_score_gauge_(MetricsManager::instance().get_or_register_gauge(
          "sad_last_deviation_score", "Deviation score of the latest "
                                      "classified sample.")) {}

DispatchManager::~DispatchManager() {
  if (subscription_ && !subscription_->is_closed())
    LOG(LogLevel::WARN, LogComponent::IO_DISPATCH,
        "DispatchManager destroyed before its channel was closed");
  if (dispatcher_thread_.joinable())
    dispatcher_thread_.join();
}

void DispatchManager::initialize(const Config::AppConfig &app_config,
                                 std::shared_ptr<Subscription> subscription) {
  reconfigure(app_config);
  subscription_ = std::move(subscription);
  if (subscription_)
    dispatcher_thread_ = std::thread(&DispatchManager::dispatcher_loop, this);
}

void DispatchManager::reconfigure(const Config::AppConfig &new_config) {
  std::vector<std::unique_ptr<IEventDispatcher>> dispatchers;
  const auto &output = new_config.output;

  if (output.anomalies_to_stdout)
    dispatchers.push_back(std::make_unique<StdoutDispatcher>());
  if (output.anomalies_to_file && !output.anomaly_output_path.empty())
    dispatchers.push_back(
        std::make_unique<FileDispatcher>(output.anomaly_output_path));

  set_dispatchers(std::move(dispatchers), output.emit_all_samples);
}

void DispatchManager::set_dispatchers(
    std::vector<std::unique_ptr<IEventDispatcher>> dispatchers,
    bool emit_all_samples) {
  std::lock_guard<std::mutex> lock(dispatchers_mutex_);
  dispatchers_ = std::move(dispatchers);
  emit_all_samples_ = emit_all_samples;
  LOG(LogLevel::INFO, LogComponent::IO_DISPATCH,
      "DispatchManager configured. Active dispatchers: "
          << dispatchers_.size() << ", emitting "
          << (emit_all_samples_ ? "all samples" : "anomalies only"));
}

size_t DispatchManager::get_dispatcher_count() const {
  std::lock_guard<std::mutex> lock(dispatchers_mutex_);
  return dispatchers_.size();
}

void DispatchManager::handle(const ClassifiedSample &classified) {
  consumed_++;
  mean_gauge_->set(classified.window_mean);
  stddev_gauge_->set(std::isfinite(classified.window_stddev)
                         ? classified.window_stddev
                         : -1.0);
  last_score_gauge_->set(classified.deviation_score);

  std::lock_guard<std::mutex> lock(dispatchers_mutex_);
  if (!classified.is_anomaly && !emit_all_samples_)
    return;

  for (const auto &dispatcher : dispatchers_) {
    const std::string type = dispatcher->get_dispatcher_type();
    if (dispatcher->dispatch(classified)) {
      dispatched_++;
      dispatch_counter()->increment(
          {{"dispatcher_type", type}, {"result", "success"}});
    } else {
      failed_++;
      dispatch_counter()->increment(
          {{"dispatcher_type", type}, {"result", "failure"}});
      LOG(LogLevel::WARN, LogComponent::IO_DISPATCH,
          dispatcher->get_name() << " failed on sample #"
                                 << classified.sequence);
    }
  }
}

void DispatchManager::dispatcher_loop() {
  LOG(LogLevel::INFO, LogComponent::IO_DISPATCH, "Dispatcher thread started");
  ClassifiedSample classified;
  while (subscription_->wait_and_pop(classified)) {
    try {
      handle(classified);
    } catch (const std::exception &e) {
      LOG(LogLevel::ERROR, LogComponent::IO_DISPATCH,
          "Exception while handling sample #" << classified.sequence << ": "
                                              << e.what());
    }
  }
  LOG(LogLevel::INFO, LogComponent::IO_DISPATCH,
      "Dispatcher thread finished after " << consumed_.load() << " samples ("
                                          << subscription_->dropped_count()
                                          << " evicted unread)");
}

void DispatchManager::shutdown() {
  if (dispatcher_thread_.joinable())
    dispatcher_thread_.join();
}
