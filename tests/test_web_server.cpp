#include "io/web/web_server.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

class WebServerTest : public ::testing::Test {
protected:
  void SetUp() override {
    config_.window_size = 10;
    config_.warmup_count = 2;
    channel_ = std::make_shared<DetectionController::Channel>(
        32, ChannelMode::FAN_OUT);
    controller_ = std::make_unique<DetectionController>(config_, channel_);
  }

  ClassifiedSample make_classified(uint64_t sequence) {
    ClassifiedSample classified;
    classified.sample = Sample(sequence * 10, static_cast<double>(sequence));
    classified.sequence = sequence;
    return classified;
  }

  Config::DetectorConfig config_;
  std::shared_ptr<DetectionController::Channel> channel_;
  std::unique_ptr<DetectionController> controller_;
};

TEST_F(WebServerTest, StateReflectsController) {
  WebServer server("127.0.0.1", 0, *controller_, 10);

  auto stopped = server.build_state_json();
  EXPECT_EQ(stopped["state"].get<std::string>(), "STOPPED");
  EXPECT_TRUE(stopped["window"]["stddev"].is_null());
  EXPECT_EQ(stopped["channel"]["mode"].get<std::string>(), "FAN_OUT");

  controller_->start();
  controller_->submit(Sample(1, 4.0));
  controller_->submit(Sample(2, 6.0));
  controller_->set_sensitivity(2.0);

  auto running = server.build_state_json();
  EXPECT_EQ(running["state"].get<std::string>(), "RUNNING");
  EXPECT_DOUBLE_EQ(running["sensitivity"].get<double>(), 2.0);
  EXPECT_EQ(running["window"]["count"].get<size_t>(), 2u);
  EXPECT_DOUBLE_EQ(running["window"]["mean"].get<double>(), 5.0);
  EXPECT_EQ(running["statistics"]["samples_processed"].get<uint64_t>(), 2u);
  EXPECT_EQ(running["channel"]["published"].get<uint64_t>(), 2u);
  EXPECT_EQ(running["strategy"].get<std::string>(), "sliding");
}

TEST_F(WebServerTest, RecentHistoryIsBounded) {
  WebServer server("127.0.0.1", 0, *controller_, 3);
  for (uint64_t i = 0; i < 5; ++i)
    server.record_sample(make_classified(i));

  EXPECT_EQ(server.get_history_size(), 3u);
  auto all = server.build_recent_json(0);
  ASSERT_EQ(all.size(), 3u);
  EXPECT_EQ(all[0]["sequence"].get<uint64_t>(), 2u);
  EXPECT_EQ(all[2]["sequence"].get<uint64_t>(), 4u);

  auto last_two = server.build_recent_json(2);
  ASSERT_EQ(last_two.size(), 2u);
  EXPECT_EQ(last_two[0]["sequence"].get<uint64_t>(), 3u);

  EXPECT_EQ(server.build_recent_json(50).size(), 3u);
}

TEST_F(WebServerTest, EmptyHistoryIsEmptyArray) {
  WebServer server("127.0.0.1", 0, *controller_, 5);
  auto recent = server.build_recent_json(0);
  EXPECT_TRUE(recent.is_array());
  EXPECT_TRUE(recent.empty());
}

TEST_F(WebServerTest, RejectsZeroHistory) {
  EXPECT_THROW(WebServer("127.0.0.1", 0, *controller_, 0),
               std::invalid_argument);
}

TEST_F(WebServerTest, ServesLiveEndpoints) {
  constexpr int port = 18531;
  WebServer server("127.0.0.1", port, *controller_, 50);
  if (!server.start())
    GTEST_SKIP() << "port " << port << " unavailable";

  controller_->start();
  for (int i = 0; i < 6; ++i)
    controller_->submit(Sample(static_cast<uint64_t>(i), 10.0 + i));

  // The collector drains the subscription on its own thread
  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (server.get_history_size() < 6 &&
         std::chrono::steady_clock::now() < deadline)
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  ASSERT_EQ(server.get_history_size(), 6u);

  httplib::Client client("127.0.0.1", port);
  client.set_connection_timeout(2);

  auto recent = client.Get("/api/v1/stream/recent?limit=2");
  ASSERT_TRUE(recent);
  EXPECT_EQ(recent->status, 200);
  auto body = nlohmann::json::parse(recent->body);
  ASSERT_EQ(body.size(), 2u);
  EXPECT_EQ(body[1]["sequence"].get<uint64_t>(), 5u);

  auto bad_limit = client.Get("/api/v1/stream/recent?limit=abc");
  ASSERT_TRUE(bad_limit);
  EXPECT_EQ(bad_limit->status, 400);

  auto state = client.Get("/api/v1/controller/state");
  ASSERT_TRUE(state);
  EXPECT_EQ(nlohmann::json::parse(state->body)["state"].get<std::string>(),
            "RUNNING");

  auto metrics = client.Get("/metrics");
  ASSERT_TRUE(metrics);
  EXPECT_NE(metrics->body.find("sad_samples_total"), std::string::npos);

  server.stop();
  EXPECT_EQ(channel_->subscriber_count(), 0u);
}
