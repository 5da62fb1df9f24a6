#include "utils/event_channel.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

TEST(EventChannelTest, DropsOldestWhenFull) {
  EventChannel<int> channel(2);
  for (int i = 1; i <= 5; ++i)
    EXPECT_TRUE(channel.publish(i));

  auto consumer = channel.subscribe();
  auto items = consumer->drain();
  ASSERT_EQ(items.size(), 2u);
  EXPECT_EQ(items[0], 4);
  EXPECT_EQ(items[1], 5);
  EXPECT_EQ(channel.dropped_count(), 3u);
  EXPECT_EQ(consumer->dropped_count(), 3u);
  EXPECT_EQ(channel.published_count(), 5u);
}

TEST(EventChannelTest, PreservesOrder) {
  EventChannel<int> channel(100);
  auto consumer = channel.subscribe();
  for (int i = 0; i < 50; ++i)
    channel.publish(i);

  for (int i = 0; i < 50; ++i) {
    auto item = consumer->try_pop();
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(*item, i);
  }
  EXPECT_FALSE(consumer->try_pop().has_value());
}

TEST(EventChannelTest, SingleConsumerRejectsSecondSubscriber) {
  EventChannel<int> channel(4, ChannelMode::SINGLE_CONSUMER);
  auto first = channel.subscribe();
  EXPECT_THROW(channel.subscribe(), std::logic_error);
  EXPECT_EQ(channel.subscriber_count(), 1u);

  channel.unsubscribe(first);
  EXPECT_EQ(channel.subscriber_count(), 0u);
  EXPECT_NO_THROW(channel.subscribe());
}

TEST(EventChannelTest, FanOutDeliversEveryItemToEverySubscriber) {
  EventChannel<int> channel(10, ChannelMode::FAN_OUT);
  auto a = channel.subscribe();
  auto b = channel.subscribe();
  for (int i = 0; i < 3; ++i)
    channel.publish(i);

  auto a_items = a->drain();
  auto b_items = b->drain();
  EXPECT_EQ(a_items, (std::vector<int>{0, 1, 2}));
  EXPECT_EQ(b_items, (std::vector<int>{0, 1, 2}));
}

TEST(EventChannelTest, FanOutSubscribersHaveIndependentBackpressure) {
  EventChannel<int> channel(2, ChannelMode::FAN_OUT);
  auto fast = channel.subscribe();
  auto slow = channel.subscribe();

  for (int i = 0; i < 4; ++i) {
    channel.publish(i);
    fast->try_pop();
  }
  EXPECT_EQ(fast->dropped_count(), 0u);
  EXPECT_EQ(slow->dropped_count(), 2u);
  EXPECT_EQ(slow->drain(), (std::vector<int>{2, 3}));
}

TEST(EventChannelTest, LateFanOutSubscriberOnlySeesNewItems) {
  EventChannel<int> channel(8, ChannelMode::FAN_OUT);
  channel.publish(1);
  auto late = channel.subscribe();
  channel.publish(2);
  EXPECT_EQ(late->drain(), (std::vector<int>{2}));
}

TEST(EventChannelTest, CloseWakesBlockedConsumer) {
  EventChannel<int> channel(4);
  auto consumer = channel.subscribe();
  std::atomic<bool> returned{false};
  bool got_item = true;

  std::thread waiter([&] {
    int value = 0;
    got_item = consumer->wait_and_pop(value);
    returned = true;
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_FALSE(returned);
  channel.close();
  waiter.join();

  EXPECT_TRUE(returned);
  EXPECT_FALSE(got_item);
  EXPECT_FALSE(channel.publish(1));
  EXPECT_TRUE(channel.is_closed());
}

TEST(EventChannelTest, ClosedChannelStillDrains) {
  EventChannel<int> channel(4);
  auto consumer = channel.subscribe();
  channel.publish(7);
  channel.close();

  int value = 0;
  EXPECT_TRUE(consumer->wait_and_pop(value));
  EXPECT_EQ(value, 7);
  EXPECT_FALSE(consumer->wait_and_pop(value));
}

TEST(EventChannelTest, WaitForPopTimesOut) {
  EventChannel<int> channel(4);
  auto consumer = channel.subscribe();
  int value = 0;
  auto start = std::chrono::steady_clock::now();
  EXPECT_FALSE(consumer->wait_for_pop(value, std::chrono::milliseconds(20)));
  EXPECT_GE(std::chrono::steady_clock::now() - start,
            std::chrono::milliseconds(15));
}

TEST(EventChannelTest, ProducerNeverBlocksOnSlowConsumer) {
  EventChannel<int> channel(16);
  auto consumer = channel.subscribe();
  std::atomic<bool> done{false};

  std::thread producer([&] {
    for (int i = 0; i < 100000; ++i)
      channel.publish(i);
    done = true;
  });
  producer.join();

  EXPECT_TRUE(done);
  EXPECT_EQ(consumer->size(), 16u);
  auto items = consumer->drain();
  EXPECT_EQ(items.back(), 99999);
}

TEST(EventChannelTest, RejectsZeroCapacity) {
  EXPECT_THROW(EventChannel<int>(0), std::invalid_argument);
}
