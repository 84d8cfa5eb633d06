#include "stream_session.hpp"
#include "protocol.hpp"

#include <system_error>

std::shared_ptr<StreamSession> StreamSession::create_incoming(asio::io_context& io,
                                                              asio::ip::tcp::socket sock,
                                                              std::shared_ptr<BroadcastHub> hub,
                                                              Options options,
                                                              std::shared_ptr<Logger> logger)
{
    auto s = std::shared_ptr<StreamSession>(new StreamSession(io, std::move(sock), std::move(hub),
                                                              options, std::move(logger)));
    s->start();
    return s;
}

StreamSession::StreamSession(asio::io_context& io,
                             asio::ip::tcp::socket sock,
                             std::shared_ptr<BroadcastHub> hub,
                             Options options,
                             std::shared_ptr<Logger> logger)
: io_(io),
  socket_(std::move(sock)),
  hub_(std::move(hub)),
  options_(options),
  logger_(std::move(logger)),
  read_buf_(options.max_request_bytes),
  heartbeat_timer_(io)
{
    std::error_code ec;
    auto ep = socket_.remote_endpoint(ec);
    remote_ = ec ? std::string("unknown") : ep.address().to_string() + ":" + std::to_string(ep.port());
}

StreamSession::~StreamSession(){
    close("session released");
}

void StreamSession::start(){
    do_read_request();
}

void StreamSession::do_read_request(){
    auto self = shared_from_this();
    asio::async_read_until(socket_, read_buf_, "\r\n\r\n",
        [this, self](std::error_code ec, std::size_t bytes){
            if(ec == asio::error::not_found){
                reject(400, "Bad Request");
                return;
            }
            if(ec){
                close("request read: " + ec.message());
                return;
            }
            auto data = read_buf_.data();
            std::string head(asio::buffers_begin(data), asio::buffers_begin(data) + bytes);
            read_buf_.consume(bytes);
            handle_request(head);
        });
}

void StreamSession::handle_request(const std::string& head){
    auto req = parse_http_request(head);
    if(!req){
        reject(400, "Bad Request");
        return;
    }
    if(req->path != kStreamPath){
        reject(404, "Not Found");
        return;
    }
    if(req->method != "GET"){
        reject(405, "Method Not Allowed", "Allow: GET\r\n");
        return;
    }

    std::optional<uint64_t> last_event_id;
    if(auto header = req->header("last-event-id")){
        last_event_id = parse_last_event_id(*header);
        if(!last_event_id){
            log_debug(logger_.get(), "Session: ignoring malformed Last-Event-ID '{}' from {}", *header, remote_);
        }
    }
    open_stream(last_event_id);
}

void StreamSession::reject(int status, const std::string& reason, const std::string& extra_headers){
    log_info(logger_.get(), "Session: {} {} for {}", status, reason, remote_);
    close_after_write_ = true;
    send_frame(make_error_response(status, reason, extra_headers));
}

void StreamSession::open_stream(std::optional<uint64_t> last_event_id){
    streaming_ = true;
    subscriber_ = hub_->register_subscriber(last_event_id);

    std::weak_ptr<StreamSession> weak = shared_from_this();
    asio::io_context* io = &io_;
    subscriber_->set_notify([weak, io](){
        asio::post(*io, [weak](){
            if(auto s = weak.lock()) s->pump();
        });
    });

    if(last_event_id){
        log_info(logger_.get(), "Session #{}: stream opened for {} (Last-Event-ID {})",
                 subscriber_->id(), remote_, *last_event_id);
    } else {
        log_info(logger_.get(), "Session #{}: stream opened for {}", subscriber_->id(), remote_);
    }

    send_frame(make_stream_response_head() + format_open_ack());
    watch_peer();
    schedule_heartbeat();
}

void StreamSession::watch_peer(){
    auto self = shared_from_this();
    socket_.async_read_some(asio::buffer(peer_buf_),
        [this, self](std::error_code ec, std::size_t){
            if(ec){
                close(ec == asio::error::eof ? std::string("peer disconnected") : "read: " + ec.message());
                return;
            }
            // clients have nothing to say once streaming; keep listening for EOF
            watch_peer();
        });
}

void StreamSession::schedule_heartbeat(){
    if(closed_ || !streaming_) return;
    heartbeat_timer_.expires_after(options_.heartbeat_interval);
    auto self = shared_from_this();
    heartbeat_timer_.async_wait([this, self](const std::error_code& ec){
        if(ec || closed_) return;
        // a frame in flight rearms the timer when it completes
        if(writing_ || !write_queue_.empty() || close_after_write_) return;
        send_frame(format_heartbeat());
    });
}

void StreamSession::pump(){
    if(closed_ || !streaming_ || writing_ || close_after_write_) return;
    if(!write_queue_.empty() || !subscriber_) return;

    auto item = subscriber_->try_pop();
    if(!item) return;
    if(item->type == StreamItem::Type::Gap){
        log_debug(logger_.get(), "Session #{}: gap {}..{}", subscriber_->id(), item->gap_from, item->gap_to);
    } else if(item->type == StreamItem::Type::Closing){
        close_after_write_ = true;
    }
    send_frame(format_sse_event(*item), item->resume_token());
}

void StreamSession::send_frame(std::string frame, std::optional<uint64_t> delivered){
    if(closed_) return;
    write_queue_.push_back(Frame{std::move(frame), delivered});
    if(!writing_){
        do_write();
    }
}

void StreamSession::do_write(){
    if(write_queue_.empty()) return;
    writing_ = true;
    auto self = shared_from_this();
    asio::async_write(socket_, asio::buffer(write_queue_.front().bytes),
        [this, self](std::error_code ec, std::size_t){
            writing_ = false;
            if(closed_) return;
            if(ec){
                close("write: " + ec.message());
                return;
            }
            auto delivered = write_queue_.front().delivered;
            write_queue_.pop_front();
            if(delivered && subscriber_) subscriber_->mark_delivered(*delivered);

            if(!write_queue_.empty()){
                do_write();
                return;
            }
            if(close_after_write_){
                close(streaming_ ? "server closing" : "response sent");
                return;
            }
            schedule_heartbeat();
            pump();
        });
}

void StreamSession::close(const std::string& why){
    if(closed_) return;
    closed_ = true;

    try {
        heartbeat_timer_.cancel();
    } catch(const std::system_error& e){
        log_debug(logger_.get(), "Session: heartbeat cancel failed: {}", e.what());
    }
    std::error_code ec;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    socket_.close(ec);
    write_queue_.clear();

    if(subscriber_){
        hub_->unregister_subscriber(subscriber_->id());
        log_info(logger_.get(), "Session #{}: closed for {} ({}, last delivered #{})",
                 subscriber_->id(), remote_, why, subscriber_->last_delivered_sequence());
    } else {
        log_debug(logger_.get(), "Session: connection from {} closed ({})", remote_, why);
    }
}
