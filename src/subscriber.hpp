#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

#include "change_record.hpp"

// Bounded delivery queue for one streaming client.
//
// Holds at most `capacity` change records. When a record arrives on a full
// queue the oldest unread record is evicted and folded into a single pending
// gap marker, which is always handed out before the remaining records. After
// close() or a closing notice the queue accepts nothing further.
class Subscriber {
public:
    using Clock = std::chrono::steady_clock;
    using NotifyFn = std::function<void()>;

    Subscriber(uint64_t id, std::size_t capacity);

    uint64_t id() const { return id_; }
    std::size_t capacity() const { return capacity_; }
    std::chrono::system_clock::time_point connected_since() const { return connected_since_; }

    // Producer side. Return false when the queue is closed.
    bool enqueue(const ChangeRecordPtr& record);
    bool enqueue_gap(uint64_t from, uint64_t to);
    bool enqueue_closing(const std::string& reason, uint64_t last_sequence);

    // Consumer side.
    std::optional<StreamItem> try_pop();
    std::optional<StreamItem> wait_pop(std::chrono::milliseconds timeout);

    void set_notify(NotifyFn fn);
    void notify();

    // Discards everything queued and rejects further items.
    void close();
    bool closed() const;

    void mark_delivered(uint64_t sequence);
    uint64_t last_delivered_sequence() const;

    std::size_t size() const;
    bool empty() const;
    uint64_t dropped_count() const;

private:
    struct Gap {
        uint64_t from = 0;
        uint64_t to = 0;
    };
    struct Closing {
        std::string reason;
        uint64_t last_sequence = 0;
    };

    void absorb_into_gap(uint64_t from, uint64_t to);
    std::optional<StreamItem> pop_locked();

    const uint64_t id_;
    const std::size_t capacity_;
    const std::chrono::system_clock::time_point connected_since_;

    mutable std::mutex m_;
    std::condition_variable cv_;
    std::deque<ChangeRecordPtr> records_;
    std::optional<Gap> gap_;
    std::optional<Closing> closing_;
    bool closed_ = false;
    uint64_t last_delivered_ = 0;
    uint64_t dropped_ = 0;
    NotifyFn notify_;
};
