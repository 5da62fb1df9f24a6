#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/metrics_manager.hpp"
#include "detection/detection_controller.hpp"
#include "io/dispatch/dispatch_manager.hpp"
#include "io/sources/base_sample_source.hpp"
#include "io/sources/sample_source_factory.hpp"
#include "io/web/web_server.hpp"
#include "utils/event_channel.hpp"
#include "utils/utils.hpp"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#if defined(__unix__) || (defined(__APPLE__) && defined(__MACH__))
#include <termios.h>
#include <unistd.h>
#endif

// Global atomic flags for signal handling
std::atomic<bool> g_shutdown_requested = false;
std::atomic<bool> g_reload_config_requested = false;
std::atomic<bool> g_reset_state_requested = false;
std::atomic<bool> g_pause_requested = false;
std::atomic<bool> g_resume_requested = false;
std::atomic<bool> g_start_requested = false;
std::atomic<bool> g_stop_requested = false;
std::atomic<int> g_sensitivity_steps = 0;
std::atomic<bool> g_source_exhausted = false;

// A simple, safe signal handler function
void signal_handler(int signum) {
  if (signum == SIGINT || signum == SIGTERM) {
    g_shutdown_requested = true;
  } else if (signum == SIGHUP) {
    g_reload_config_requested = true;
  } else if (signum == SIGUSR1) {
    g_reset_state_requested = true;
  } else if (signum == SIGUSR2) {
    g_pause_requested = true;
  } else if (signum == SIGCONT) {
    g_resume_requested = true;
  }
}

// --- RAII helper for raw terminal mode (POSIX only) ---
#if defined(__unix__) || (defined(__APPLE__) && defined(__MACH__))
struct TerminalManager {
  termios original_termios;
  bool is_valid = false;

  TerminalManager() {
    if (tcgetattr(STDIN_FILENO, &original_termios) == 0) {
      termios raw = original_termios;
      // No line buffering or echo; IXON off so Ctrl+S and Ctrl+Q reach us
      raw.c_lflag &= ~(ICANON | ECHO);
      raw.c_iflag &= ~IXON;
      tcsetattr(STDIN_FILENO, TCSANOW, &raw);
      is_valid = true;
    }
  }

  ~TerminalManager() {
    if (is_valid)
      tcsetattr(STDIN_FILENO, TCSANOW, &original_termios);
  }
};
#endif

// --- Keyboard listener thread function ---
void keyboard_listener_thread() {
#if defined(__unix__) || (defined(__APPLE__) && defined(__MACH__))
  TerminalManager tm;
  if (!tm.is_valid)
    return;

  char c;
  while (!g_shutdown_requested) {
    // Bounded wait so a shutdown raised elsewhere is noticed without a key
    int ready = Utils::wait_for_readable(STDIN_FILENO, 100);
    if (ready == 0)
      continue;
    if (ready < 0)
      break;

    ssize_t bytes_read = read(STDIN_FILENO, &c, 1);
    if (bytes_read > 0)
      switch (c) {
      case 3: // Ctrl+C
      case 4: // Ctrl+D
        g_shutdown_requested = true;
        break;
      case 19: // Ctrl+S (Start)
        g_start_requested = true;
        break;
      case 16: // Ctrl+P (Pause)
        g_pause_requested = true;
        break;
      case 17: // Ctrl+Q (Resume - 'Q' is next to 'P')
        g_resume_requested = true;
        break;
      case 24: // Ctrl+X (Stop)
        g_stop_requested = true;
        break;
      case 5: // Ctrl+E (rEset)
        g_reset_state_requested = true;
        break;
      case 18: // Ctrl+R (Reload)
        g_reload_config_requested = true;
        break;
      case '+':
      case '=':
        g_sensitivity_steps++;
        break;
      case '-':
      case '_':
        g_sensitivity_steps--;
        break;
      }
    else if (bytes_read == 0)
      break; // stdin closed, keep running on signals alone
    else if (errno == EINTR)
      continue;
    else
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
#else
  std::cout
      << "Interactive keyboard shortcuts are not supported on this platform."
      << std::endl;
#endif
}

// --- Producer thread function ---
void sample_producer_thread(ISampleSource &source,
                            DetectionController &controller,
                            uint64_t sample_interval_ms,
                            const std::atomic<bool> &shutdown_flag) {
  LOG(LogLevel::INFO, LogComponent::IO_SOURCE,
      "Producer thread started on " << source.get_name());

  // Unpaced sources are drained in batches
  const size_t batch_size = sample_interval_ms == 0 ? 256 : 1;
  uint64_t submitted = 0;

  while (!shutdown_flag) {
    if (source.is_exhausted()) {
      g_source_exhausted = true;
      break;
    }

    std::vector<Sample> batch;
    try {
      batch = source.get_next_batch(batch_size);
    } catch (const std::exception &e) {
      LOG(LogLevel::ERROR, LogComponent::IO_SOURCE,
          "Source failed, stopping producer: " << e.what());
      g_source_exhausted = true;
      break;
    }

    for (const auto &sample : batch) {
      SubmitResult result = controller.submit(sample);
      if (result.error == DetectionError::INVALID_SAMPLE)
        LOG(LogLevel::DEBUG, LogComponent::IO_SOURCE,
            "Corrupt reading at t=" << sample.timestamp_ms << " rejected");
      submitted++;
    }

    if (sample_interval_ms > 0)
      std::this_thread::sleep_for(
          std::chrono::milliseconds(sample_interval_ms));
    else if (batch.empty())
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  LOG(LogLevel::INFO, LogComponent::IO_SOURCE,
      "Producer thread finished after " << submitted << " samples"
                                        << (g_source_exhausted
                                                ? " (source exhausted)"
                                                : ""));
}

double run_state_gauge_value(RunState state) {
  switch (state) {
  case RunState::STOPPED:
    return 0.0;
  case RunState::RUNNING:
    return 1.0;
  case RunState::PAUSED:
    return 2.0;
  }
  return -1.0;
}

int main(int argc, char *argv[]) {
  std::ios_base::sync_with_stdio(false);
  std::cin.tie(nullptr);

  // Register all signal handlers
  struct sigaction action;
  action.sa_handler = signal_handler;
  sigemptyset(&action.sa_mask);
  action.sa_flags = 0;
  sigaction(SIGINT, &action, NULL);
  sigaction(SIGTERM, &action, NULL);
  sigaction(SIGHUP, &action, NULL);
  sigaction(SIGUSR1, &action, NULL);
  sigaction(SIGUSR2, &action, NULL); // Pause
  sigaction(SIGCONT, &action, NULL); // Resume

  // --- Load Configuration ---
  Config::ConfigManager config_manager;
  std::string config_file_to_load = "config.ini";
  if (argc > 1)
    config_file_to_load = argv[1];

  if (!config_manager.load_configuration(config_file_to_load))
    std::cerr << "Configuration " << config_file_to_load
              << " could not be applied, using defaults." << std::endl;
  auto current_config = config_manager.get_config();

  // --- Initialize Logging ---
  LogManager::instance().configure(current_config->logging);
  LOG(LogLevel::INFO, LogComponent::CORE,
      "Stream anomaly detector starting up...");
#if defined(__unix__) || (defined(__APPLE__) && defined(__MACH__))
  LOG(LogLevel::DEBUG, LogComponent::CORE, "PID: " << getpid());
#endif

  // --- Detection Pipeline ---
  auto channel = std::make_shared<DetectionController::Channel>(
      current_config->channel.capacity, current_config->channel.fan_out
                                            ? ChannelMode::FAN_OUT
                                            : ChannelMode::SINGLE_CONSUMER);

  std::unique_ptr<DetectionController> controller;
  std::unique_ptr<ISampleSource> source;
  try {
    controller = std::make_unique<DetectionController>(
        current_config->detector, channel);
    source = make_sample_source(current_config->source);
  } catch (const std::exception &e) {
    LOG(LogLevel::FATAL, LogComponent::CORE,
        "Failed to build the detection pipeline: " << e.what());
    return 1;
  }

  DispatchManager dispatch_manager;
  dispatch_manager.initialize(*current_config, channel->subscribe());

  // --- Metrics Registration ---
  auto *sensitivity_gauge = MetricsManager::instance().register_gauge(
      "sad_sensitivity", "Current anomaly threshold in standard deviations.");
  auto *run_state_gauge = MetricsManager::instance().register_gauge(
      "sad_run_state", "Controller state: 0 stopped, 1 running, 2 paused.");
  auto *channel_dropped_gauge = MetricsManager::instance().register_gauge(
      "sad_channel_dropped", "Classified samples evicted before a consumer "
                             "read them.");
  auto *channel_published_gauge = MetricsManager::instance().register_gauge(
      "sad_channel_published", "Classified samples published to the channel.");

  // --- Web Server Initialization ---
  std::unique_ptr<WebServer> web_server;
  if (current_config->monitoring.web_server_enabled) {
    web_server = std::make_unique<WebServer>(
        current_config->monitoring.web_server_host,
        current_config->monitoring.web_server_port, *controller,
        current_config->monitoring.recent_history_size);
    if (!web_server->start()) {
      LOG(LogLevel::ERROR, LogComponent::CORE,
          "Continuing without the web server");
      web_server.reset();
    }
  }

  if (current_config->detector.auto_start)
    controller->start();

  std::thread keyboard_thread(keyboard_listener_thread);
  std::cout << "\nInteractive Controls:\n"
            << "  Ctrl+C / Ctrl+D: Shutdown Gracefully\n"
            << "  Ctrl+S:          Start Detection\n"
            << "  Ctrl+P:          Pause Detection\n"
            << "  Ctrl+Q:          Resume Detection\n"
            << "  Ctrl+X:          Stop Detection\n"
            << "  Ctrl+E:          Reset Window Model\n"
            << "  Ctrl+R:          Reload Configuration\n"
            << "  + / -:           Raise / Lower Sensitivity\n\n"
            << std::flush;

  std::thread producer_thread(sample_producer_thread, std::ref(*source),
                              std::ref(*controller),
                              current_config->source.sample_interval_ms,
                              std::ref(g_shutdown_requested));

  auto time_start = std::chrono::steady_clock::now();
  bool exhaustion_reported = false;

  while (!g_shutdown_requested) {
    // --- Signal Polling and State Transition Block ---
    if (g_reset_state_requested.exchange(false)) {
      LOG(LogLevel::WARN, LogComponent::CORE,
          "SIGUSR1 or Ctrl+E detected. Resetting the window model...");
      controller->reset();
    }

    if (g_reload_config_requested.exchange(false)) {
      LOG(LogLevel::INFO, LogComponent::CORE,
          "SIGHUP or Ctrl+R detected. Reloading configuration from "
              << config_file_to_load << "...");
      if (config_manager.load_configuration(config_file_to_load)) {
        auto previous_config = current_config;
        current_config = config_manager.get_config();
        LogManager::instance().configure(current_config->logging);
        DetectionError err =
            controller->set_sensitivity(current_config->detector.sensitivity);
        if (err != DetectionError::NONE)
          LOG(LogLevel::ERROR, LogComponent::CONFIG,
              "Reloaded sensitivity not applied: "
                  << detection_error_to_string(err));
        dispatch_manager.reconfigure(*current_config);
        LOG(LogLevel::INFO, LogComponent::CONFIG,
            "Sensitivity, logging and output reconfigured.");

        const auto &old_dt = previous_config->detector;
        const auto &new_dt = current_config->detector;
        if (old_dt.strategy != new_dt.strategy ||
            old_dt.window_size != new_dt.window_size ||
            old_dt.half_life != new_dt.half_life ||
            old_dt.resync_interval != new_dt.resync_interval ||
            old_dt.warmup_count != new_dt.warmup_count ||
            old_dt.stddev_floor != new_dt.stddev_floor ||
            previous_config->channel.capacity !=
                current_config->channel.capacity ||
            previous_config->channel.fan_out !=
                current_config->channel.fan_out)
          LOG(LogLevel::WARN, LogComponent::CONFIG,
              "Window and channel settings changed; they apply on the next "
              "restart.");
      } else
        LOG(LogLevel::ERROR, LogComponent::CONFIG,
            "Failed to reload configuration. Keeping old settings.");
    }

    if (g_start_requested.exchange(false))
      controller->start();
    if (g_pause_requested.exchange(false))
      controller->pause();
    if (g_resume_requested.exchange(false))
      controller->resume();
    if (g_stop_requested.exchange(false))
      controller->stop();

    const int steps = g_sensitivity_steps.exchange(0);
    if (steps != 0) {
      DetectionError err = controller->adjust_sensitivity(
          steps * current_config->detector.sensitivity_step);
      if (err != DetectionError::NONE)
        LOG(LogLevel::WARN, LogComponent::CORE,
            "Sensitivity adjustment rejected: "
                << detection_error_to_string(err));
    }

    // --- Periodic Gauges ---
    sensitivity_gauge->set(controller->get_sensitivity());
    run_state_gauge->set(run_state_gauge_value(controller->get_state()));
    channel_dropped_gauge->set(static_cast<double>(channel->dropped_count()));
    channel_published_gauge->set(
        static_cast<double>(channel->published_count()));

    if (g_source_exhausted && !exhaustion_reported) {
      exhaustion_reported = true;
      if (!web_server) {
        LOG(LogLevel::INFO, LogComponent::CORE,
            "Sample source exhausted. Shutting down.");
        break;
      }
      LOG(LogLevel::INFO, LogComponent::CORE,
          "Sample source exhausted. Web view stays up until shutdown.");
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  }

  // --- Shutdown ---
  g_shutdown_requested = true;
  LOG(LogLevel::INFO, LogComponent::CORE,
      "Control loop finished. Stopping producer...");
  if (producer_thread.joinable())
    producer_thread.join();

  const ControllerStatistics stats = controller->get_statistics();
  controller->stop();
  channel->close();
  dispatch_manager.shutdown();

  if (web_server)
    web_server->stop();

  if (keyboard_thread.joinable())
    keyboard_thread.join();

  auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                         std::chrono::steady_clock::now() - time_start)
                         .count();

  LOG(LogLevel::INFO, LogComponent::CORE, "---Processing Summary---");
  LOG(LogLevel::INFO, LogComponent::CORE,
      "Samples classified: " << stats.samples_processed
                             << ", anomalies: " << stats.anomalies_detected);
  LOG(LogLevel::INFO, LogComponent::CORE,
      "Invalid samples: " << stats.invalid_samples << ", dropped while not "
                          << "running: " << stats.dropped_not_running);
  LOG(LogLevel::INFO, LogComponent::CORE,
      "Dispatched: " << dispatch_manager.get_dispatched_count()
                     << ", channel evictions: " << channel->dropped_count());
  LOG(LogLevel::INFO, LogComponent::CORE,
      "Total processing time: " << duration_ms << " ms");

  return 0;
}
