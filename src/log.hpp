#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

// Creates the process sinks on first use. Later calls only change the level.
void init(bool verbose = false);

// When disabled, messages no listener claimed are dropped instead of printed.
void set_log_passthrough(bool enabled);
bool log_passthrough();

enum class LogChannel { Info, Warn, Error, Debug, Print, PrintErr };

struct LogChannelTraits {
  const char* label;
  spdlog::level::level_enum level;
};

LogChannelTraits channel_traits(LogChannel channel);

// Writes to the stamped/plain sinks, bypassing listeners. `source` is shown
// in brackets when not empty.
void write_to_sinks(LogChannel channel, const std::string& source, const std::string& message);

using LogListenerHandle = std::size_t;

// Named message source shared by the engine's components. Every message is
// offered to the listeners first; when none of them returns true it goes to
// the process sinks.
class Logger {
public:
  using Listener = std::function<bool(void* user_data,
                                      const std::string& channel,
                                      spdlog::level::level_enum level,
                                      const std::string& message)>;

  Logger() = default;
  explicit Logger(std::string name) : name_(std::move(name)) {}

  const std::string& name() const { return name_; }

  LogListenerHandle add_listener(Listener listener, void* user_data = nullptr);
  void remove_listener(LogListenerHandle handle);
  void clear_listeners();

  void publish(LogChannel channel, const std::string& message);

  template<typename... Args>
  void emit(LogChannel channel, spdlog::format_string_t<Args...> fmt, Args&&... args) {
    publish(channel, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    emit(LogChannel::Info, fmt, std::forward<Args>(args)...);
  }
  template<typename... Args>
  void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    emit(LogChannel::Warn, fmt, std::forward<Args>(args)...);
  }
  template<typename... Args>
  void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    emit(LogChannel::Error, fmt, std::forward<Args>(args)...);
  }
  template<typename... Args>
  void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    emit(LogChannel::Debug, fmt, std::forward<Args>(args)...);
  }
  template<typename... Args>
  void print(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    emit(LogChannel::Print, fmt, std::forward<Args>(args)...);
  }
  template<typename... Args>
  void print_err(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    emit(LogChannel::PrintErr, fmt, std::forward<Args>(args)...);
  }

private:
  struct Binding {
    void* user_data = nullptr;
    Listener callback;
  };

  std::string name_;
  std::mutex listener_mutex_;
  std::unordered_map<LogListenerHandle, Binding> listeners_;
  LogListenerHandle next_listener_id_ = 1;
};

// For components that may run without a logger: a null logger writes to the
// process sinks directly.
template<typename... Args>
inline void log_to(Logger* logger, LogChannel channel,
                   spdlog::format_string_t<Args...> fmt, Args&&... args) {
  auto message = fmt::format(fmt, std::forward<Args>(args)...);
  if(logger) {
    logger->publish(channel, message);
  } else {
    write_to_sinks(channel, std::string(), message);
  }
}

template<typename... Args>
inline void log_info(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(logger, LogChannel::Info, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_warn(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(logger, LogChannel::Warn, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_error(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(logger, LogChannel::Error, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_debug(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(logger, LogChannel::Debug, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void print_out(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(logger, LogChannel::Print, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void print_err(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(logger, LogChannel::PrintErr, fmt, std::forward<Args>(args)...);
}
