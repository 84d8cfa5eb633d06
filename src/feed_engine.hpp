#pragma once

#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>

#include "log.hpp"

class BroadcastHub;
class DirWatcher;
class SettingsManager;
class WatchLostError;

class FeedEngine {
public:
  struct Options {
    // Tests run several engines in one process and leave signals alone.
    bool install_signal_handlers = true;
  };

  // Values read from the settings at start().
  struct Config {
    std::string host = "0.0.0.0";
    uint16_t port = 8080;
    bool debug = false;
    std::filesystem::path watch_dir;
    std::chrono::milliseconds debounce{200};
    std::size_t queue_capacity = 256;
    std::chrono::milliseconds heartbeat_interval{15000};
    int watch_retry_attempts = 5;
    std::chrono::milliseconds watch_retry_base{100};
    std::chrono::milliseconds shutdown_grace{2000};
  };

  explicit FeedEngine(std::shared_ptr<SettingsManager> settings, Options options = Options());
  ~FeedEngine();

  FeedEngine(const FeedEngine&) = delete;
  FeedEngine& operator=(const FeedEngine&) = delete;

  // Throws ConfigError or WatchInitError, or asio's system_error when the
  // endpoint cannot be bound.
  void start();
  // Blocks until shutdown completes. Returns the process exit status.
  int run();
  void start_background();
  // Thread-safe. Begins the closing sequence on the io thread.
  void request_shutdown();
  // Shuts down (if still running) and joins the background thread.
  void stop();

  static Config read_config(const SettingsManager& settings);

  struct Stats {
    std::size_t subscribers = 0;
    uint64_t last_sequence = 0;
    uint64_t sessions_opened = 0;
    bool watching = false;
  };

  Stats stats() const;
  int exit_code() const { return exit_code_.load(); }
  bool shutting_down() const { return shutting_down_.load(); }

  uint16_t listen_port() const { return listen_port_.load(); }
  const Config& config() const { return config_; }
  std::shared_ptr<SettingsManager> settings() const { return settings_; }
  std::shared_ptr<Logger> logger() const { return logger_; }
  std::shared_ptr<BroadcastHub> hub() const { return hub_; }

  LogListenerHandle add_log_listener(Logger::Listener listener, void* user_data = nullptr);
  void remove_log_listener(LogListenerHandle handle);
  void clear_log_listeners();

private:
  using tcp = asio::ip::tcp;

  void start_accept();
  void begin_shutdown(const std::string& reason, int exit_code);
  void poll_drain(std::chrono::steady_clock::time_point deadline);
  void on_watch_lost(const std::string& what);

  Options options_;
  Config config_;
  std::shared_ptr<SettingsManager> settings_;
  std::shared_ptr<Logger> logger_;
  asio::io_context io_;
  std::thread io_thread_;
  std::unique_ptr<tcp::acceptor> acceptor_;
  std::unique_ptr<asio::signal_set> signals_;
  std::unique_ptr<asio::steady_timer> drain_timer_;
  std::shared_ptr<BroadcastHub> hub_;
  std::unique_ptr<DirWatcher> watcher_;
  std::atomic<bool> started_{false};
  std::atomic<bool> shutting_down_{false};
  std::atomic<int> exit_code_{0};
  std::atomic<uint16_t> listen_port_{0};
  std::atomic<uint64_t> sessions_opened_{0};
};
