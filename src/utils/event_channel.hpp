#ifndef EVENT_CHANNEL_HPP
#define EVENT_CHANNEL_HPP

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <vector>

enum class ChannelMode { SINGLE_CONSUMER, FAN_OUT };

inline const char *channel_mode_to_string(ChannelMode mode) {
  return mode == ChannelMode::FAN_OUT ? "FAN_OUT" : "SINGLE_CONSUMER";
}

// Bounded handoff from one producer to its consumers. publish() never blocks:
// when a consumer's queue is full its oldest unconsumed item is evicted.
//
// SINGLE_CONSUMER keeps one queue from construction on, so items published
// before the consumer attaches are retained (up to capacity). FAN_OUT gives
// every subscriber its own queue that sees each item published after it
// subscribed.
template <typename T> class EventChannel {
public:
  class Subscriber {
  public:
    explicit Subscriber(size_t capacity) : capacity_(capacity) {}

    // A non-blocking try_pop
    std::optional<T> try_pop() {
      std::lock_guard<std::mutex> lock(mutex_);
      if (queue_.empty())
        return std::nullopt;
      T value = std::move(queue_.front());
      queue_.pop_front();
      return value;
    }

    // A blocking wait_and_pop that returns false once closed and drained
    bool wait_and_pop(T &value) {
      std::unique_lock<std::mutex> lock(mutex_);
      cond_.wait(lock, [this] { return !queue_.empty() || closed_; });
      if (queue_.empty())
        return false;

      value = std::move(queue_.front());
      queue_.pop_front();
      return true;
    }

    // Like wait_and_pop, but gives up after timeout
    bool wait_for_pop(T &value, std::chrono::milliseconds timeout) {
      std::unique_lock<std::mutex> lock(mutex_);
      cond_.wait_for(lock, timeout,
                     [this] { return !queue_.empty() || closed_; });
      if (queue_.empty())
        return false;

      value = std::move(queue_.front());
      queue_.pop_front();
      return true;
    }

    std::vector<T> drain() {
      std::lock_guard<std::mutex> lock(mutex_);
      std::vector<T> items(std::make_move_iterator(queue_.begin()),
                           std::make_move_iterator(queue_.end()));
      queue_.clear();
      return items;
    }

    size_t size() const {
      std::lock_guard<std::mutex> lock(mutex_);
      return queue_.size();
    }

    bool empty() const {
      std::lock_guard<std::mutex> lock(mutex_);
      return queue_.empty();
    }

    uint64_t dropped_count() const {
      std::lock_guard<std::mutex> lock(mutex_);
      return dropped_;
    }

    bool is_closed() const {
      std::lock_guard<std::mutex> lock(mutex_);
      return closed_;
    }

    size_t capacity() const { return capacity_; }

  private:
    friend class EventChannel<T>;

    // Returns true when the oldest item had to be evicted
    bool push(const T &value) {
      bool evicted = false;
      {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_)
          return false;
        if (queue_.size() >= capacity_) {
          queue_.pop_front();
          dropped_++;
          evicted = true;
        }
        queue_.push_back(value);
      }
      cond_.notify_one();
      return evicted;
    }

    void close() {
      {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
      }
      cond_.notify_all();
    }

    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cond_;
    std::deque<T> queue_;
    uint64_t dropped_ = 0;
    bool closed_ = false;
  };

  explicit EventChannel(size_t capacity,
                        ChannelMode mode = ChannelMode::SINGLE_CONSUMER)
      : capacity_(capacity), mode_(mode) {
    if (capacity == 0) {
      throw std::invalid_argument("Channel capacity must be greater than 0");
    }
    if (mode_ == ChannelMode::SINGLE_CONSUMER) {
      primary_ = std::make_shared<Subscriber>(capacity_);
      subscribers_.push_back(primary_);
    }
  }

  EventChannel(const EventChannel &) = delete;
  EventChannel &operator=(const EventChannel &) = delete;

  std::shared_ptr<Subscriber> subscribe() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (mode_ == ChannelMode::SINGLE_CONSUMER) {
      if (primary_claimed_)
        throw std::logic_error(
            "Single-consumer channel already has a subscriber");
      primary_claimed_ = true;
      return primary_;
    }

    auto subscriber = std::make_shared<Subscriber>(capacity_);
    if (closed_)
      subscriber->close();
    else
      subscribers_.push_back(subscriber);
    return subscriber;
  }

  void unsubscribe(const std::shared_ptr<Subscriber> &subscriber) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (mode_ == ChannelMode::SINGLE_CONSUMER) {
      // The queue stays attached so a later consumer resumes from it
      if (subscriber == primary_)
        primary_claimed_ = false;
      return;
    }
    subscribers_.erase(
        std::remove(subscribers_.begin(), subscribers_.end(), subscriber),
        subscribers_.end());
  }

  // Returns false once the channel is closed
  bool publish(const T &value) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_)
      return false;
    for (auto &subscriber : subscribers_)
      if (subscriber->push(value))
        dropped_.fetch_add(1, std::memory_order_relaxed);
    published_.fetch_add(1, std::memory_order_relaxed);
    return true;
  }

  // Notify all waiting consumers to wake up for shutdown
  void close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    for (auto &subscriber : subscribers_)
      subscriber->close();
  }

  bool is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }

  size_t subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (mode_ == ChannelMode::SINGLE_CONSUMER)
      return primary_claimed_ ? 1 : 0;
    return subscribers_.size();
  }

  uint64_t published_count() const {
    return published_.load(std::memory_order_relaxed);
  }

  // Evictions summed over every subscriber queue
  uint64_t dropped_count() const {
    return dropped_.load(std::memory_order_relaxed);
  }

  size_t capacity() const { return capacity_; }
  ChannelMode mode() const { return mode_; }

private:
  const size_t capacity_;
  const ChannelMode mode_;

  mutable std::mutex mutex_;
  std::vector<std::shared_ptr<Subscriber>> subscribers_;
  std::shared_ptr<Subscriber> primary_;
  bool primary_claimed_ = false;
  bool closed_ = false;

  std::atomic<uint64_t> published_{0};
  std::atomic<uint64_t> dropped_{0};
};

#endif // EVENT_CHANNEL_HPP
