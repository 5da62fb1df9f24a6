#ifndef DISPATCH_MANAGER_HPP
#define DISPATCH_MANAGER_HPP

#include "base_dispatcher.hpp"
#include "core/config.hpp"
#include "core/sample.hpp"
#include "utils/event_channel.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

struct Gauge;

// Consumer side of the pipeline: drains a channel subscription on its own
// thread, mirrors the latest window statistics into gauges and hands the
// selected samples to every configured dispatcher.
class DispatchManager {
public:
  using Subscription = EventChannel<ClassifiedSample>::Subscriber;

  DispatchManager();
  ~DispatchManager();

  DispatchManager(const DispatchManager &) = delete;
  DispatchManager &operator=(const DispatchManager &) = delete;

  // Builds the dispatchers and starts consuming. The thread exits once the
  // subscription is closed and drained.
  void initialize(const Config::AppConfig &app_config,
                  std::shared_ptr<Subscription> subscription);
  void reconfigure(const Config::AppConfig &new_config);

  // Replaces the configured dispatchers; used by tests and embedders
  void set_dispatchers(std::vector<std::unique_ptr<IEventDispatcher>> dispatchers,
                       bool emit_all_samples);

  // Processes one classified sample synchronously on the calling thread
  void handle(const ClassifiedSample &classified);

  // Joins the consumer thread; the channel must be closed first
  void shutdown();

  uint64_t get_consumed_count() const { return consumed_.load(); }
  uint64_t get_dispatched_count() const { return dispatched_.load(); }
  uint64_t get_failed_count() const { return failed_.load(); }
  size_t get_dispatcher_count() const;

private:
  void dispatcher_loop();

  mutable std::mutex dispatchers_mutex_;
  std::vector<std::unique_ptr<IEventDispatcher>> dispatchers_;
  bool emit_all_samples_ = false;

  std::shared_ptr<Subscription> subscription_;
  std::thread dispatcher_thread_;

  std::atomic<uint64_t> consumed_{0};
  std::atomic<uint64_t> dispatched_{0};
  std::atomic<uint64_t> failed_{0};

  Gauge *mean_gauge_;
  Gauge *stddev_gauge_;
  Gauge *last_score_gauge_;
};

#endif // DISPATCH_MANAGER_HPP
