#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "change_record.hpp"
#include "log.hpp"
#include "subscriber.hpp"

inline constexpr std::size_t kDefaultQueueCapacity = 256;

// Process-wide fan-out point between the watcher and the stream sessions.
//
// The hub only keeps weak references to subscribers; each session owns its
// Subscriber. All state is guarded by one mutex and changes only through
// register_subscriber, unregister_subscriber, publish and broadcast_closing.
class BroadcastHub {
public:
    struct Stats {
        std::size_t subscribers = 0;
        uint64_t last_sequence = 0;
        uint64_t registrations = 0;
        bool closing = false;
    };

    explicit BroadcastHub(std::size_t queue_capacity = kDefaultQueueCapacity,
                          std::shared_ptr<Logger> logger = nullptr);

    // Creates a subscriber with an empty queue. When `resume_after` is older
    // than the current sequence, a gap covering (resume_after, current] is
    // queued first since no history is kept.
    std::shared_ptr<Subscriber> register_subscriber(std::optional<uint64_t> resume_after = std::nullopt);

    // Idempotent. The queue is discarded before the registration goes away.
    void unregister_subscriber(uint64_t id);

    // Assigns the next sequence and queues the record for every registered
    // subscriber. Never blocks on a consumer. Returns the sequence, or 0 once
    // the hub is closing.
    uint64_t publish(const FileChange& change);

    // Queues a terminal notice for every subscriber; later publishes are
    // ignored and later registrations receive the notice immediately.
    void broadcast_closing(const std::string& reason);

    uint64_t current_sequence() const;
    std::size_t subscriber_count() const;
    std::size_t queue_capacity() const { return queue_capacity_; }
    bool closing() const;
    Stats stats() const;

private:
    const std::size_t queue_capacity_;
    std::shared_ptr<Logger> logger_;

    mutable std::mutex m_;
    std::map<uint64_t, std::weak_ptr<Subscriber>> subscribers_;
    uint64_t next_sequence_ = 1;
    uint64_t next_subscriber_id_ = 1;
    uint64_t registrations_ = 0;
    std::optional<std::string> closing_reason_;
};
