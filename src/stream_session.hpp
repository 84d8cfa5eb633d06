#pragma once
#include <asio.hpp>
#include <array>
#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>

#include "broadcast_hub.hpp"
#include "http_request.hpp"
#include "log.hpp"

// One client connection on the streaming endpoint.
//
// Reads the request head, registers with the hub, writes the response head
// and an acknowledgment, then drains its subscriber queue onto the socket one
// frame at a time. A heartbeat goes out whenever the connection has been idle
// for a full interval. Any read or write failure ends the session, which is
// the only place a subscriber is unregistered.
//
// All handlers run on the io_context thread.
class StreamSession : public std::enable_shared_from_this<StreamSession> {
public:
    struct Options {
        std::chrono::milliseconds heartbeat_interval{15000};
        std::size_t max_request_bytes = kMaxRequestHeadBytes;
    };

    static std::shared_ptr<StreamSession> create_incoming(asio::io_context& io,
                                                          asio::ip::tcp::socket sock,
                                                          std::shared_ptr<BroadcastHub> hub,
                                                          Options options,
                                                          std::shared_ptr<Logger> logger = nullptr);

    ~StreamSession();

    void start();

    uint64_t subscriber_id() const { return subscriber_ ? subscriber_->id() : 0; }
    const std::string& remote() const { return remote_; }

private:
    StreamSession(asio::io_context& io,
                  asio::ip::tcp::socket sock,
                  std::shared_ptr<BroadcastHub> hub,
                  Options options,
                  std::shared_ptr<Logger> logger);

    void do_read_request();
    void handle_request(const std::string& head);
    void reject(int status, const std::string& reason, const std::string& extra_headers = "");
    void open_stream(std::optional<uint64_t> last_event_id);

    void watch_peer();
    void schedule_heartbeat();
    void pump();
    void send_frame(std::string frame, std::optional<uint64_t> delivered = std::nullopt);
    void do_write();
    void close(const std::string& why);

    struct Frame {
        std::string bytes;
        std::optional<uint64_t> delivered;
    };

    asio::io_context& io_;
    asio::ip::tcp::socket socket_;
    std::shared_ptr<BroadcastHub> hub_;
    Options options_;
    std::shared_ptr<Logger> logger_;
    asio::streambuf read_buf_;
    std::array<char, 512> peer_buf_{};
    asio::steady_timer heartbeat_timer_;
    std::shared_ptr<Subscriber> subscriber_;
    std::deque<Frame> write_queue_;
    std::string remote_;
    bool writing_ = false;
    bool streaming_ = false;
    bool close_after_write_ = false;
    bool closed_ = false;
};
