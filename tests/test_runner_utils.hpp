#pragma once

#include "log.hpp"
#include "feed_engine.hpp"

#include <asio.hpp>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <array>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

namespace dirfeed::test {

inline void write_config_before_start(const std::filesystem::path& workspace,
                                      const std::string& filename,
                                      const nlohmann::json& content) {
  auto config_dir = workspace / ".config";
  std::error_code ec;
  std::filesystem::create_directories(config_dir, ec);
  std::ofstream out(config_dir / filename, std::ios::trunc);
  if(out) {
    out << content.dump(2);
  }
}

inline void write_file(const std::filesystem::path& path, const std::string& content) {
  std::ofstream out(path, std::ios::trunc | std::ios::binary);
  if(!out) {
    throw std::runtime_error("Unable to write " + path.string());
  }
  out << content;
}

// A scratch directory under the system temp dir, removed on destruction.
class TempWorkspace {
public:
  explicit TempWorkspace(const std::string& name)
    : root_(std::filesystem::temp_directory_path() /
            (name + "_" + std::to_string(::getpid()))) {
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
    std::filesystem::create_directories(root_);
  }

  ~TempWorkspace() {
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
  }

  TempWorkspace(const TempWorkspace&) = delete;
  TempWorkspace& operator=(const TempWorkspace&) = delete;

  const std::filesystem::path& root() const { return root_; }
  std::filesystem::path operator/(const std::string& child) const { return root_ / child; }

private:
  std::filesystem::path root_;
};

class LogCapture {
public:
  LogCapture() = default;

  ~LogCapture() {
    detach_all();
  }

  void attach(const std::shared_ptr<Logger>& logger,
              const std::string& label = std::string()) {
    if(!logger) return;
    auto handle = logger->add_listener(make_listener(label), nullptr);
    std::lock_guard<std::mutex> lock(attachments_mutex_);
    attachments_.push_back({logger, nullptr, handle});
  }

  void attach(FeedEngine& engine, const std::string& label = std::string()) {
    auto handle = engine.add_log_listener(make_listener(label), nullptr);
    std::lock_guard<std::mutex> lock(attachments_mutex_);
    attachments_.push_back({nullptr, &engine, handle});
  }

  void detach_all() {
    std::vector<Attachment> pending;
    {
      std::lock_guard<std::mutex> lock(attachments_mutex_);
      pending.swap(attachments_);
    }
    for(auto& attachment : pending) {
      if(attachment.logger && attachment.handle != 0) {
        attachment.logger->remove_listener(attachment.handle);
      }
      if(attachment.engine && attachment.handle != 0) {
        attachment.engine->remove_log_listener(attachment.handle);
      }
    }
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.clear();
  }

  std::vector<std::string> snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_;
  }

  bool contains(const std::string& needle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(lines_.begin(), lines_.end(),
      [&](const std::string& line){ return line.find(needle) != std::string::npos; });
  }

  bool wait_for_substring(const std::string& needle,
                          std::chrono::milliseconds timeout) {
    auto predicate = [&]{
      return std::any_of(lines_.begin(), lines_.end(),
        [&](const std::string& line){ return line.find(needle) != std::string::npos; });
    };
    std::unique_lock<std::mutex> lock(mutex_);
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while(!predicate()) {
      if(cv_.wait_until(lock, deadline) == std::cv_status::timeout) break;
    }
    return predicate();
  }

private:
  struct Attachment {
    std::shared_ptr<Logger> logger;
    FeedEngine* engine = nullptr;
    LogListenerHandle handle = 0;
  };

  Logger::Listener make_listener(const std::string& label) {
    return [this, label](void*,
                         const std::string& channel,
                         spdlog::level::level_enum,
                         const std::string& message) {
      std::lock_guard<std::mutex> lock(mutex_);
      if(!label.empty()) {
        lines_.emplace_back(label + ": " + message);
      } else {
        lines_.emplace_back(channel + ": " + message);
      }
      cv_.notify_all();
      return false;
    };
  }

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<std::string> lines_;
  std::mutex attachments_mutex_;
  std::vector<Attachment> attachments_;
};

inline bool wait_for_condition(std::function<bool()> predicate,
                               std::chrono::milliseconds timeout,
                               std::chrono::milliseconds interval = std::chrono::milliseconds(50)) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while(std::chrono::steady_clock::now() < deadline) {
    if(predicate()) return true;
    std::this_thread::sleep_for(interval);
  }
  return predicate();
}

struct SseEvent {
  std::string event;
  std::string id;
  std::string data;
  std::optional<int> retry;
  std::vector<std::string> comments;

  nlohmann::json json() const { return nlohmann::json::parse(data); }
};

// Blocking client for the streaming endpoint. Reads are bounded by a
// deadline so a silent server fails the test instead of hanging it.
class SseClient {
public:
  SseClient() : socket_(io_) {}

  void connect(uint16_t port) {
    asio::ip::tcp::endpoint endpoint(asio::ip::make_address("127.0.0.1"), port);
    socket_.connect(endpoint);
  }

  void send_raw(const std::string& bytes) {
    asio::write(socket_, asio::buffer(bytes));
  }

  void send_get(const std::string& target,
                const std::vector<std::string>& extra_headers = {}) {
    std::string request = "GET " + target + " HTTP/1.1\r\nHost: 127.0.0.1\r\nAccept: text/event-stream\r\n";
    for(const auto& header : extra_headers) {
      request += header + "\r\n";
    }
    request += "\r\n";
    send_raw(request);
  }

  // Reads until `done` holds, the peer closes, or the timeout passes.
  bool read_until(const std::function<bool()>& done, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while(!done()) {
      if(eof_ || std::chrono::steady_clock::now() >= deadline) return done();
      bool finished = false;
      std::error_code result;
      socket_.async_read_some(asio::buffer(chunk_),
        [&](std::error_code ec, std::size_t n){
          finished = true;
          result = ec;
          if(!ec) received_.append(chunk_.data(), n);
        });
      io_.restart();
      io_.run_until(deadline);
      if(!finished) {
        std::error_code ignored;
        socket_.cancel(ignored);
        io_.restart();
        io_.run();
        return done();
      }
      if(result) eof_ = true;
    }
    return true;
  }

  bool read_until_contains(const std::string& needle, std::chrono::milliseconds timeout) {
    return read_until([&]{ return received_.find(needle) != std::string::npos; }, timeout);
  }

  bool read_events(std::size_t count, const std::string& event_name, std::chrono::milliseconds timeout) {
    return read_until([&]{ return events_named(event_name).size() >= count; }, timeout);
  }

  bool read_until_closed(std::chrono::milliseconds timeout) {
    read_until([]{ return false; }, timeout);
    return eof_;
  }

  void close() {
    std::error_code ec;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    socket_.close(ec);
  }

  const std::string& received() const { return received_; }
  bool peer_closed() const { return eof_; }

  int status_code() const {
    std::istringstream in(received_);
    std::string version;
    int status = 0;
    in >> version >> status;
    return status;
  }

  std::string head() const {
    auto end = received_.find("\r\n\r\n");
    return end == std::string::npos ? received_ : received_.substr(0, end + 4);
  }

  // Complete frames received after the response head.
  std::vector<SseEvent> events() const {
    std::vector<SseEvent> out;
    auto start = received_.find("\r\n\r\n");
    if(start == std::string::npos) return out;
    std::string body = received_.substr(start + 4);

    std::size_t pos = 0;
    while(true) {
      auto end = body.find("\n\n", pos);
      if(end == std::string::npos) break;
      std::istringstream block(body.substr(pos, end - pos));
      pos = end + 2;

      SseEvent ev;
      bool any_data = false;
      std::string line;
      while(std::getline(block, line)) {
        if(line.empty()) continue;
        if(line[0] == ':') {
          ev.comments.push_back(line.size() > 1 && line[1] == ' ' ? line.substr(2) : line.substr(1));
          continue;
        }
        auto colon = line.find(':');
        std::string field = line.substr(0, colon);
        std::string value = colon == std::string::npos ? std::string() : line.substr(colon + 1);
        if(!value.empty() && value[0] == ' ') value.erase(0, 1);
        if(field == "event") ev.event = value;
        else if(field == "id") ev.id = value;
        else if(field == "retry") ev.retry = std::stoi(value);
        else if(field == "data") {
          if(any_data) ev.data += "\n";
          ev.data += value;
          any_data = true;
        }
      }
      out.push_back(std::move(ev));
    }
    return out;
  }

  std::vector<SseEvent> events_named(const std::string& name) const {
    std::vector<SseEvent> out;
    for(auto& ev : events()) {
      if(ev.event == name) out.push_back(std::move(ev));
    }
    return out;
  }

  // Change events only, in arrival order.
  std::vector<SseEvent> change_events() const {
    std::vector<SseEvent> out;
    for(auto& ev : events()) {
      if(ev.event == "created" || ev.event == "modified" ||
         ev.event == "deleted" || ev.event == "renamed") {
        out.push_back(std::move(ev));
      }
    }
    return out;
  }

private:
  asio::io_context io_;
  asio::ip::tcp::socket socket_;
  std::array<char, 4096> chunk_{};
  std::string received_;
  bool eof_ = false;
};

struct TestContext {
  LogCapture& logs;
  bool verbose = false;
};

struct TestCase {
  const char* name;
  std::function<bool(TestContext&)> fn;
};

// Runs `tests` with the dot/F progress line. Log output is captured and only
// shown for failing tests unless DIRFEED_TEST_LOGS or -v is given.
inline int run_test_cases(const std::string& suite,
                          const std::vector<TestCase>& tests,
                          int argc,
                          char** argv) {
  bool verbose = (std::getenv("DIRFEED_TEST_VERBOSE") != nullptr);
  for(int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if(arg == "-v" || arg == "--verbose") {
      verbose = true;
    }
  }

  bool show_logs = (std::getenv("DIRFEED_TEST_LOGS") != nullptr) || verbose;
  const bool suppress_logs = !show_logs;
  if(suppress_logs) {
    set_log_passthrough(false);
  }
  LogCapture logs;
  TestContext ctx{logs, verbose};

  std::size_t failures = 0;
  std::cout << "Running " << tests.size() << " " << suite << " tests: " << std::flush;

  for(std::size_t idx = 0; idx < tests.size(); ++idx) {
    const auto& test = tests[idx];
    logs.clear();
    bool passed = false;
    try {
      passed = test.fn(ctx);
    } catch(const std::exception& e) {
      passed = false;
      std::cerr << "Exception in test " << test.name << ": " << e.what() << "\n";
    }
    logs.detach_all();
    if(passed) {
      std::cout << '.' << std::flush;
    } else {
      std::cout << 'F' << " (" << test.name << ")\n";
      failures++;
      for(const auto& line : logs.snapshot()) {
        std::cout << "    " << line << "\n";
      }
      if(idx + 1 < tests.size()) {
        std::cout << "Running " << tests.size() << " " << suite << " tests: " << std::flush;
      }
    }
  }
  std::cout << "\n";
  if(suppress_logs) {
    set_log_passthrough(true);
  }
  if(failures == 0) {
    std::cout << "PASS (" << tests.size() << " tests)\n";
    return 0;
  }
  std::cout << "FAIL (" << failures << "/" << tests.size() << " failed)\n";
  return 1;
}

} // namespace dirfeed::test
