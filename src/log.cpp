#include "log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <atomic>
#include <exception>
#include <memory>
#include <vector>

namespace {

constexpr const char* kStampedPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
constexpr const char* kPlainPattern = "%v";

struct ProcessSinks {
  std::shared_ptr<spdlog::logger> stamped_out;  // info, warn, debug
  std::shared_ptr<spdlog::logger> stamped_err;  // errors
  std::shared_ptr<spdlog::logger> plain_out;    // usage text
  std::shared_ptr<spdlog::logger> plain_err;
};

ProcessSinks g_sinks;
std::once_flag g_sinks_once;
std::atomic<bool> g_passthrough{true};

template<typename Sink>
std::shared_ptr<spdlog::logger> make_sink_logger(const char* name,
                                                 const char* pattern,
                                                 spdlog::level::level_enum flush_level) {
  auto sink = std::make_shared<Sink>();
  sink->set_pattern(pattern);
  auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
  logger->flush_on(flush_level);
  spdlog::register_logger(logger);
  return logger;
}

const ProcessSinks& process_sinks() {
  std::call_once(g_sinks_once, [](){
    using spdlog::sinks::stderr_color_sink_mt;
    using spdlog::sinks::stdout_color_sink_mt;
    g_sinks.stamped_out = make_sink_logger<stdout_color_sink_mt>("dirfeed", kStampedPattern, spdlog::level::warn);
    g_sinks.stamped_err = make_sink_logger<stderr_color_sink_mt>("dirfeed.err", kStampedPattern, spdlog::level::err);
    g_sinks.plain_out = make_sink_logger<stdout_color_sink_mt>("dirfeed.print", kPlainPattern, spdlog::level::info);
    g_sinks.plain_err = make_sink_logger<stderr_color_sink_mt>("dirfeed.print_err", kPlainPattern, spdlog::level::err);
  });
  return g_sinks;
}

spdlog::logger& sink_for(LogChannel channel) {
  const auto& sinks = process_sinks();
  switch(channel) {
    case LogChannel::Print:    return *sinks.plain_out;
    case LogChannel::PrintErr: return *sinks.plain_err;
    case LogChannel::Error:    return *sinks.stamped_err;
    default:                   return *sinks.stamped_out;
  }
}

} // namespace

LogChannelTraits channel_traits(LogChannel channel) {
  switch(channel) {
    case LogChannel::Info:     return {"info", spdlog::level::info};
    case LogChannel::Warn:     return {"warn", spdlog::level::warn};
    case LogChannel::Error:    return {"error", spdlog::level::err};
    case LogChannel::Debug:    return {"debug", spdlog::level::debug};
    case LogChannel::Print:    return {"print", spdlog::level::info};
    case LogChannel::PrintErr: return {"print_err", spdlog::level::err};
  }
  return {"info", spdlog::level::info};
}

void init(bool verbose) {
  const auto& sinks = process_sinks();
  sinks.stamped_out->set_level(verbose ? spdlog::level::debug : spdlog::level::info);
  sinks.stamped_err->set_level(spdlog::level::info);
  sinks.plain_out->set_level(spdlog::level::info);
  sinks.plain_err->set_level(spdlog::level::info);
  spdlog::set_default_logger(sinks.stamped_out);
}

void set_log_passthrough(bool enabled) {
  g_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_passthrough.load(std::memory_order_acquire);
}

void write_to_sinks(LogChannel channel, const std::string& source, const std::string& message) {
  if(!log_passthrough()) return;
  auto& sink = sink_for(channel);
  auto level = channel_traits(channel).level;
  if(source.empty()) {
    sink.log(level, message);
  } else {
    sink.log(level, fmt::format("[{}] {}", source, message));
  }
}

LogListenerHandle Logger::add_listener(Listener listener, void* user_data) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(listener_mutex_);
  const auto id = next_listener_id_++;
  listeners_.emplace(id, Binding{user_data, std::move(listener)});
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.erase(handle);
}

void Logger::clear_listeners() {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.clear();
}

void Logger::publish(LogChannel channel, const std::string& message) {
  const auto traits = channel_traits(channel);
  const std::string source = name_.empty() ? std::string(traits.label) : name_ + ":" + traits.label;

  std::vector<Binding> snapshot;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    snapshot.reserve(listeners_.size());
    for(const auto& entry : listeners_) {
      snapshot.push_back(entry.second);
    }
  }

  bool handled = false;
  for(auto& binding : snapshot) {
    try {
      if(binding.callback(binding.user_data, source, traits.level, message)) {
        handled = true;
      }
    } catch(const std::exception& e) {
      write_to_sinks(LogChannel::Error, source, fmt::format("log listener threw: {}", e.what()));
    }
  }
  if(!handled) {
    write_to_sinks(channel, name_.empty() ? std::string() : source, message);
  }
}
