#include "feed_engine.hpp"

#include <csignal>
#include <stdexcept>

#include "broadcast_hub.hpp"
#include "dir_watcher.hpp"
#include "errors.hpp"
#include "http_request.hpp"
#include "log.hpp"
#include "protocol.hpp"
#include "settings_manager.hpp"
#include "stream_session.hpp"

namespace {

constexpr std::chrono::milliseconds kDrainPollInterval{25};

} // namespace

FeedEngine::FeedEngine(std::shared_ptr<SettingsManager> settings, Options options)
  : options_(options),
    settings_(settings ? std::move(settings) : std::make_shared<SettingsManager>()),
    logger_(std::make_shared<Logger>("dirfeed")) {
}

FeedEngine::~FeedEngine() {
  stop();
}

FeedEngine::Config FeedEngine::read_config(const SettingsManager& settings) {
  Config cfg;
  cfg.host = settings.get<std::string>("host");
  if(cfg.host.empty()) {
    throw ConfigError("host must not be empty");
  }

  int port = settings.get<int>("port");
  if(port < 0 || port > 65535) {
    throw ConfigError("Invalid port '" + std::to_string(port) + "'");
  }
  cfg.port = static_cast<uint16_t>(port);
  cfg.debug = settings.get<bool>("debug");
  cfg.watch_dir = settings.get<std::string>("watch_dir");

  int debounce = settings.get<int>("debounce_ms");
  if(debounce <= 0) {
    throw ConfigError("debounce_ms must be positive");
  }
  cfg.debounce = std::chrono::milliseconds(debounce);

  int capacity = settings.get<int>("queue_capacity");
  if(capacity < 2) {
    throw ConfigError("queue_capacity must be at least 2");
  }
  cfg.queue_capacity = static_cast<std::size_t>(capacity);

  int heartbeat = settings.get<int>("heartbeat_interval_ms");
  if(heartbeat <= 0) {
    throw ConfigError("heartbeat_interval_ms must be positive");
  }
  cfg.heartbeat_interval = std::chrono::milliseconds(heartbeat);

  cfg.watch_retry_attempts = settings.get<int>("watch_retry_attempts");
  if(cfg.watch_retry_attempts < 1) {
    throw ConfigError("watch_retry_attempts must be at least 1");
  }
  int retry_base = settings.get<int>("watch_retry_base_ms");
  if(retry_base <= 0) {
    throw ConfigError("watch_retry_base_ms must be positive");
  }
  cfg.watch_retry_base = std::chrono::milliseconds(retry_base);

  int grace = settings.get<int>("shutdown_grace_ms");
  if(grace < 0) {
    throw ConfigError("shutdown_grace_ms must not be negative");
  }
  cfg.shutdown_grace = std::chrono::milliseconds(grace);
  return cfg;
}

void FeedEngine::start() {
  if(started_) return;

  config_ = read_config(*settings_);
  init(config_.debug);

  hub_ = std::make_shared<BroadcastHub>(config_.queue_capacity, logger_);

  if(!config_.watch_dir.empty()) {
    DirWatcher::Options watch_options;
    watch_options.root = config_.watch_dir;
    watch_options.debounce_window = config_.debounce;
    watch_options.retry_attempts = config_.watch_retry_attempts;
    watch_options.retry_base = config_.watch_retry_base;

    auto hub = hub_;
    watcher_ = std::make_unique<DirWatcher>(
      watch_options,
      [hub](const FileChange& change){ hub->publish(change); },
      [this](const WatchLostError& lost){
        std::string what = lost.what();
        asio::post(io_, [this, what](){ on_watch_lost(what); });
      },
      logger_);
    watcher_->start();
  } else {
    logger_->warn("No watch directory configured; clients will only receive heartbeats");
  }

  try {
    asio::ip::address listen_address = asio::ip::make_address(config_.host);
    acceptor_ = std::make_unique<tcp::acceptor>(io_);
    tcp::endpoint endpoint(listen_address, config_.port);
    acceptor_->open(endpoint.protocol());
    acceptor_->set_option(tcp::acceptor::reuse_address(true));
    acceptor_->bind(endpoint);
    acceptor_->listen();
    listen_port_ = acceptor_->local_endpoint().port();
  } catch(const std::exception& e) {
    logger_->error("Unable to listen on {}:{}: {}", config_.host, config_.port, e.what());
    if(watcher_) watcher_->stop();
    throw;
  }

  if(options_.install_signal_handlers) {
    signals_ = std::make_unique<asio::signal_set>(io_, SIGINT, SIGTERM);
    signals_->async_wait([this](const std::error_code& ec, int signal_number){
      if(ec) return;
      logger_->info("Received signal {}", signal_number);
      begin_shutdown(kClosingServer, 0);
    });
  }

  started_ = true;
  shutting_down_ = false;
  start_accept();
  logger_->info("Streaming on http://{}:{}{}", config_.host, listen_port(), kStreamPath);
}

void FeedEngine::start_accept() {
  if(!acceptor_) return;
  acceptor_->async_accept(
    [this](std::error_code ec, tcp::socket socket){
      if(ec) {
        if(ec == asio::error::operation_aborted || shutting_down_) return;
        logger_->error("Accept error: {}", ec.message());
      } else if(shutting_down_) {
        std::error_code ignored;
        socket.close(ignored);
        return;
      } else {
        ++sessions_opened_;
        logger_->debug("Accepted connection from {}", socket.remote_endpoint(ec).address().to_string());
        StreamSession::Options session_options;
        session_options.heartbeat_interval = config_.heartbeat_interval;
        StreamSession::create_incoming(io_, std::move(socket), hub_, session_options, logger_);
      }
      if(started_ && !shutting_down_) {
        start_accept();
      }
    });
}

void FeedEngine::begin_shutdown(const std::string& reason, int exit_code) {
  if(exit_code > exit_code_) exit_code_ = exit_code;
  if(shutting_down_.exchange(true)) return;

  logger_->info("Shutting down ({})", reason);

  // the producer goes first so nothing is published behind the notice
  if(watcher_) watcher_->stop();

  std::error_code ec;
  if(acceptor_) acceptor_->close(ec);
  if(signals_) signals_->cancel(ec);

  hub_->broadcast_closing(reason);

  drain_timer_ = std::make_unique<asio::steady_timer>(io_);
  poll_drain(std::chrono::steady_clock::now() + config_.shutdown_grace);
}

void FeedEngine::poll_drain(std::chrono::steady_clock::time_point deadline) {
  auto remaining = hub_->subscriber_count();
  if(remaining == 0 || std::chrono::steady_clock::now() >= deadline) {
    if(remaining > 0) {
      logger_->warn("{} session(s) did not drain before the grace period ended", remaining);
    }
    io_.stop();
    return;
  }
  drain_timer_->expires_after(kDrainPollInterval);
  drain_timer_->async_wait([this, deadline](const std::error_code& ec){
    if(ec) return;
    poll_drain(deadline);
  });
}

void FeedEngine::on_watch_lost(const std::string& what) {
  logger_->error("Watch lost: {}", what);
  begin_shutdown(kClosingWatchLost, 1);
}

void FeedEngine::request_shutdown() {
  asio::post(io_, [this](){ begin_shutdown(kClosingServer, 0); });
}

int FeedEngine::run() {
  if(!started_) start();
  io_.run();
  return exit_code_;
}

void FeedEngine::start_background() {
  if(!started_) start();
  if(io_thread_.joinable()) return;
  io_thread_ = std::thread([this](){
    io_.run();
  });
}

void FeedEngine::stop() {
  if(!started_) return;

  if(io_thread_.joinable()) {
    if(!io_.stopped()) request_shutdown();
    io_thread_.join();
  }

  if(watcher_) watcher_->stop();
  std::error_code ec;
  if(acceptor_) acceptor_->close(ec);
  started_ = false;
}

FeedEngine::Stats FeedEngine::stats() const {
  Stats s;
  if(hub_) {
    auto hub_stats = hub_->stats();
    s.subscribers = hub_stats.subscribers;
    s.last_sequence = hub_stats.last_sequence;
  }
  s.sessions_opened = sessions_opened_;
  s.watching = watcher_ && watcher_->running();
  return s;
}

LogListenerHandle FeedEngine::add_log_listener(Logger::Listener listener, void* user_data) {
  if(!logger_) return 0;
  return logger_->add_listener(std::move(listener), user_data);
}

void FeedEngine::remove_log_listener(LogListenerHandle handle) {
  if(logger_ && handle != 0) {
    logger_->remove_listener(handle);
  }
}

void FeedEngine::clear_log_listeners() {
  if(logger_) {
    logger_->clear_listeners();
  }
}
