#include "detection/detection_controller.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <cmath>
#include <limits>
#include <memory>
#include <random>
#include <stdexcept>
#include <thread>
#include <vector>

class DetectionControllerTest : public ::testing::Test {
protected:
  void SetUp() override {
    config_.strategy = "sliding";
    config_.window_size = 5;
    config_.sensitivity = 3.0;
    config_.warmup_count = 3;
    channel_ = std::make_shared<DetectionController::Channel>(64);
  }

  std::unique_ptr<DetectionController> make_controller() {
    return std::make_unique<DetectionController>(config_, channel_);
  }

  Sample sample(double value) { return Sample(next_ts_++, value); }

  Config::DetectorConfig config_;
  std::shared_ptr<DetectionController::Channel> channel_;
  uint64_t next_ts_ = 1000;
};

TEST_F(DetectionControllerTest, StartsStopped) {
  auto controller = make_controller();
  EXPECT_EQ(controller->get_state(), RunState::STOPPED);
  EXPECT_EQ(controller->get_window_snapshot(), learning::WindowSnapshot{});
  EXPECT_DOUBLE_EQ(controller->get_sensitivity(), 3.0);
}

TEST_F(DetectionControllerTest, EndToEndSpikeIsFlagged) {
  auto controller = make_controller();
  controller->start();

  for (int i = 0; i < 5; ++i) {
    SubmitResult result = controller->submit(sample(10.0));
    ASSERT_TRUE(result.ok());
    ASSERT_TRUE(result.was_classified());
    EXPECT_FALSE(result.classified->is_anomaly);
  }

  auto snap = controller->get_window_snapshot();
  EXPECT_NEAR(snap.mean, 10.0, 1e-9);
  EXPECT_NEAR(snap.stddev, 0.0, 1e-9);

  SubmitResult spike = controller->submit(sample(100.0));
  ASSERT_TRUE(spike.was_classified());
  EXPECT_TRUE(spike.classified->is_anomaly);
  EXPECT_GT(spike.classified->deviation_score, 3.0);
  EXPECT_TRUE(std::isfinite(spike.classified->deviation_score));
  EXPECT_NEAR(spike.classified->window_mean, 10.0, 1e-9);

  auto consumer = channel_->subscribe();
  auto items = consumer->drain();
  ASSERT_EQ(items.size(), 6u);
  EXPECT_TRUE(items.back().is_anomaly);
  EXPECT_EQ(items.back().sample.value, 100.0);
}

TEST_F(DetectionControllerTest, BackpressureKeepsMostRecent) {
  channel_ = std::make_shared<DetectionController::Channel>(2);
  auto controller = make_controller();
  controller->start();
  for (int i = 1; i <= 5; ++i)
    controller->submit(sample(i));

  auto consumer = channel_->subscribe();
  auto items = consumer->drain();
  ASSERT_EQ(items.size(), 2u);
  EXPECT_EQ(items[0].sample.value, 4.0);
  EXPECT_EQ(items[1].sample.value, 5.0);
  EXPECT_EQ(items[0].sequence + 1, items[1].sequence);
}

TEST_F(DetectionControllerTest, WarmupNeverFlags) {
  config_.warmup_count = 10;
  config_.window_size = 50;
  auto controller = make_controller();
  controller->start();

  std::mt19937 gen(3);
  std::uniform_real_distribution<> wild(-1e9, 1e9);
  for (int i = 0; i < 9; ++i) {
    auto result = controller->submit(sample(wild(gen)));
    ASSERT_TRUE(result.was_classified());
    EXPECT_FALSE(result.classified->is_anomaly) << "sample " << i + 1;
    EXPECT_DOUBLE_EQ(result.classified->deviation_score, 0.0);
  }
}

TEST_F(DetectionControllerTest, WarmupLongerThanWindow) {
  config_.window_size = 3;
  config_.warmup_count = 8;
  auto controller = make_controller();
  controller->start();

  for (int i = 0; i < 7; ++i)
    EXPECT_FALSE(controller->submit(sample(i % 2 ? 1e6 : 0.0))
                     .classified->is_anomaly);
  for (int i = 0; i < 3; ++i)
    controller->submit(sample(5.0));
  EXPECT_TRUE(controller->submit(sample(5000.0)).classified->is_anomaly);
}

TEST_F(DetectionControllerTest, DropOnPause) {
  auto controller = make_controller();
  controller->start();
  controller->submit(sample(1.0));
  controller->submit(sample(2.0));
  controller->pause();

  auto before = controller->get_window_snapshot();
  auto published_before = channel_->published_count();

  for (int i = 0; i < 10; ++i) {
    SubmitResult result = controller->submit(sample(1000.0 + i));
    EXPECT_TRUE(result.ok());
    EXPECT_FALSE(result.was_classified());
  }

  EXPECT_EQ(controller->get_window_snapshot(), before);
  EXPECT_EQ(channel_->published_count(), published_before);
  EXPECT_EQ(controller->get_statistics().dropped_not_running, 10u);
}

TEST_F(DetectionControllerTest, SubmitWhileStoppedIsDropped) {
  auto controller = make_controller();
  SubmitResult result = controller->submit(sample(1.0));
  EXPECT_TRUE(result.ok());
  EXPECT_FALSE(result.was_classified());
  EXPECT_EQ(channel_->published_count(), 0u);
}

TEST_F(DetectionControllerTest, PauseResumeLeavesWindowUntouched) {
  auto controller = make_controller();
  controller->start();
  for (double v : {3.0, 7.0, 11.0, 2.0})
    controller->submit(sample(v));

  auto before = controller->get_window_snapshot();
  controller->pause();
  EXPECT_EQ(controller->get_state(), RunState::PAUSED);
  controller->resume();
  EXPECT_EQ(controller->get_state(), RunState::RUNNING);
  EXPECT_EQ(controller->get_window_snapshot(), before);
}

TEST_F(DetectionControllerTest, TransitionsAreIdempotent) {
  auto controller = make_controller();
  controller->pause(); // STOPPED: no-op
  EXPECT_EQ(controller->get_state(), RunState::STOPPED);
  controller->resume(); // STOPPED: no-op
  EXPECT_EQ(controller->get_state(), RunState::STOPPED);

  controller->start();
  controller->submit(sample(4.0));
  auto snap = controller->get_window_snapshot();
  controller->start(); // already RUNNING
  EXPECT_EQ(controller->get_window_snapshot(), snap);

  controller->pause();
  controller->pause();
  EXPECT_EQ(controller->get_state(), RunState::PAUSED);
  controller->start(); // resumes without rebuilding
  EXPECT_EQ(controller->get_state(), RunState::RUNNING);
  EXPECT_EQ(controller->get_window_snapshot(), snap);

  controller->stop();
  controller->stop();
  EXPECT_EQ(controller->get_state(), RunState::STOPPED);
}

TEST_F(DetectionControllerTest, StopDiscardsWindow) {
  auto controller = make_controller();
  controller->start();
  for (int i = 0; i < 4; ++i)
    controller->submit(sample(20.0));
  controller->stop();
  EXPECT_EQ(controller->get_window_snapshot(), learning::WindowSnapshot{});

  controller->start();
  auto snap = controller->get_window_snapshot();
  EXPECT_EQ(snap.total_count, 0u);
  EXPECT_EQ(controller->get_statistics().model_generation, 2u);

  // Warm-up restarts with the fresh model
  EXPECT_FALSE(controller->submit(sample(1e9)).classified->is_anomaly);
}

TEST_F(DetectionControllerTest, ResetKeepsRunState) {
  auto controller = make_controller();
  controller->start();
  for (int i = 0; i < 4; ++i)
    controller->submit(sample(20.0));
  controller->pause();
  controller->reset();

  EXPECT_EQ(controller->get_state(), RunState::PAUSED);
  EXPECT_EQ(controller->get_window_snapshot().total_count, 0u);
}

TEST_F(DetectionControllerTest, InvalidSampleLeavesStateUnchanged) {
  auto controller = make_controller();
  controller->start();
  controller->submit(sample(5.0));
  auto before = controller->get_window_snapshot();

  for (double bad : {std::numeric_limits<double>::quiet_NaN(),
                     std::numeric_limits<double>::infinity(),
                     -std::numeric_limits<double>::infinity()}) {
    SubmitResult result = controller->submit(sample(bad));
    EXPECT_EQ(result.error, DetectionError::INVALID_SAMPLE);
    EXPECT_FALSE(result.was_classified());
  }

  EXPECT_EQ(controller->get_window_snapshot(), before);
  EXPECT_EQ(controller->get_statistics().invalid_samples, 3u);
  EXPECT_EQ(channel_->published_count(), 1u);
}

TEST_F(DetectionControllerTest, SensitivityValidation) {
  auto controller = make_controller();
  EXPECT_EQ(controller->set_sensitivity(-0.1),
            DetectionError::INVALID_PARAMETER);
  EXPECT_EQ(controller->set_sensitivity(
                std::numeric_limits<double>::quiet_NaN()),
            DetectionError::INVALID_PARAMETER);
  EXPECT_EQ(controller->set_sensitivity(
                std::numeric_limits<double>::infinity()),
            DetectionError::INVALID_PARAMETER);
  EXPECT_DOUBLE_EQ(controller->get_sensitivity(), 3.0);
  EXPECT_EQ(controller->get_statistics().sensitivity_rejections, 3u);

  EXPECT_EQ(controller->set_sensitivity(0.0), DetectionError::NONE);
  EXPECT_DOUBLE_EQ(controller->get_sensitivity(), 0.0);
}

TEST_F(DetectionControllerTest, AdjustSensitivityClampsAtZero) {
  auto controller = make_controller();
  EXPECT_EQ(controller->adjust_sensitivity(0.5), DetectionError::NONE);
  EXPECT_DOUBLE_EQ(controller->get_sensitivity(), 3.5);
  EXPECT_EQ(controller->adjust_sensitivity(-10.0), DetectionError::NONE);
  EXPECT_DOUBLE_EQ(controller->get_sensitivity(), 0.0);
  EXPECT_EQ(controller->adjust_sensitivity(
                std::numeric_limits<double>::quiet_NaN()),
            DetectionError::INVALID_PARAMETER);
  EXPECT_DOUBLE_EQ(controller->get_sensitivity(), 0.0);
}

TEST_F(DetectionControllerTest, SensitivityChangeAppliesToNextSample) {
  auto controller = make_controller();
  controller->start();
  for (double v : {10.0, 12.0, 8.0, 10.0})
    controller->submit(sample(v));

  controller->set_sensitivity(100.0);
  auto relaxed = controller->submit(sample(30.0));
  EXPECT_FALSE(relaxed.classified->is_anomaly);
  EXPECT_DOUBLE_EQ(relaxed.classified->sensitivity, 100.0);
}

TEST_F(DetectionControllerTest, SensitivityMonotonicityOverSameHistory) {
  std::mt19937 gen(11);
  std::normal_distribution<> dist(50.0, 5.0);
  std::vector<double> history;
  for (int i = 0; i < 200; ++i)
    history.push_back(i % 37 == 0 ? 120.0 : dist(gen));

  auto run = [&](double sensitivity) {
    auto channel = std::make_shared<DetectionController::Channel>(1);
    Config::DetectorConfig config = config_;
    config.window_size = 20;
    config.sensitivity = sensitivity;
    DetectionController controller(config, channel);
    controller.start();
    std::vector<ClassifiedSample> out;
    uint64_t ts = 0;
    for (double v : history)
      out.push_back(*controller.submit(Sample(ts++, v)).classified);
    return out;
  };

  auto strict = run(1.5);
  auto lenient = run(4.0);
  ASSERT_EQ(strict.size(), lenient.size());
  for (size_t i = 0; i < strict.size(); ++i) {
    EXPECT_DOUBLE_EQ(strict[i].deviation_score, lenient[i].deviation_score);
    if (lenient[i].is_anomaly)
      EXPECT_TRUE(strict[i].is_anomaly) << "index " << i;
  }
}

TEST_F(DetectionControllerTest, DecayStrategyDetectsSpike) {
  config_.strategy = "decay";
  config_.half_life = 10.0;
  config_.warmup_count = 15;
  auto controller = make_controller();
  controller->start();
  for (int i = 0; i < 30; ++i)
    EXPECT_FALSE(controller->submit(sample(i % 2 ? 11.0 : 9.0))
                     .classified->is_anomaly);
  EXPECT_TRUE(controller->submit(sample(60.0)).classified->is_anomaly);
}

TEST_F(DetectionControllerTest, SequencesAreContiguous) {
  auto controller = make_controller();
  controller->start();
  uint64_t expected = 0;
  for (int i = 0; i < 10; ++i) {
    auto result = controller->submit(sample(i));
    EXPECT_EQ(result.classified->sequence, expected++);
  }
}

TEST_F(DetectionControllerTest, RejectsInvalidConfiguration) {
  config_.sensitivity = -1.0;
  EXPECT_THROW(make_controller(), std::invalid_argument);

  config_.sensitivity = 3.0;
  config_.strategy = "unknown";
  EXPECT_THROW(make_controller(), std::invalid_argument);

  config_.strategy = "sliding";
  EXPECT_THROW(DetectionController(config_, nullptr), std::invalid_argument);
}

TEST_F(DetectionControllerTest, ConcurrentControlAndSubmitAreSafe) {
  config_.window_size = 32;
  channel_ = std::make_shared<DetectionController::Channel>(
      128, ChannelMode::FAN_OUT);
  auto controller = make_controller();
  auto consumer = channel_->subscribe();
  controller->start();

  std::atomic<bool> stop_flag{false};
  std::thread producer([&] {
    uint64_t ts = 0;
    while (!stop_flag) {
      const double value = static_cast<double>(ts % 17);
      controller->submit(Sample(ts++, value));
    }
  });
  std::thread operator_thread([&] {
    for (int i = 0; i < 200; ++i) {
      controller->pause();
      controller->set_sensitivity(1.0 + (i % 5));
      controller->resume();
      if (i % 50 == 0)
        controller->reset();
    }
  });

  uint64_t consumed = 0;
  uint64_t last_sequence = 0;
  bool ordered = true;
  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(1);
  while (std::chrono::steady_clock::now() < deadline) {
    ClassifiedSample item;
    if (consumer->wait_for_pop(item, std::chrono::milliseconds(10))) {
      if (consumed > 0 && item.sequence <= last_sequence)
        ordered = false;
      last_sequence = item.sequence;
      consumed++;
    }
  }

  operator_thread.join();
  stop_flag = true;
  producer.join();

  EXPECT_TRUE(ordered);
  EXPECT_GT(consumed, 0u);
  auto snap = controller->get_window_snapshot();
  EXPECT_LE(snap.count, 32u);
  EXPECT_GE(snap.mean, 0.0);
  EXPECT_LE(snap.mean, 16.0);
}
