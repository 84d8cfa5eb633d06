#include "broadcast_hub.hpp"

#include <vector>

BroadcastHub::BroadcastHub(std::size_t queue_capacity, std::shared_ptr<Logger> logger)
: queue_capacity_(queue_capacity == 0 ? kDefaultQueueCapacity : queue_capacity),
  logger_(std::move(logger))
{
}

std::shared_ptr<Subscriber> BroadcastHub::register_subscriber(std::optional<uint64_t> resume_after){
    std::shared_ptr<Subscriber> sub;
    uint64_t current = 0;
    {
        std::lock_guard lg(m_);
        sub = std::make_shared<Subscriber>(next_subscriber_id_++, queue_capacity_);
        current = next_sequence_ - 1;
        if(resume_after && *resume_after < current){
            sub->enqueue_gap(*resume_after + 1, current);
        }
        if(closing_reason_){
            sub->enqueue_closing(*closing_reason_, current);
        } else {
            subscribers_.emplace(sub->id(), sub);
        }
        ++registrations_;
    }
    if(resume_after){
        if(*resume_after < current){
            log_debug(logger_.get(), "Hub: subscriber #{} resumes after {}, gap {}..{}",
                      sub->id(), *resume_after, *resume_after + 1, current);
        } else if(*resume_after > current){
            log_debug(logger_.get(), "Hub: subscriber #{} presented unknown id {} (current {}), streaming live",
                      sub->id(), *resume_after, current);
        }
    }
    log_debug(logger_.get(), "Hub: registered subscriber #{}", sub->id());
    return sub;
}

void BroadcastHub::unregister_subscriber(uint64_t id){
    std::shared_ptr<Subscriber> sub;
    {
        std::lock_guard lg(m_);
        auto it = subscribers_.find(id);
        if(it == subscribers_.end()) return;
        sub = it->second.lock();
        // drained before the registration disappears, under the same lock a
        // publish holds, so no record can land after this point
        if(sub) sub->close();
        subscribers_.erase(it);
    }
    log_debug(logger_.get(), "Hub: unregistered subscriber #{}", id);
}

uint64_t BroadcastHub::publish(const FileChange& change){
    std::vector<std::shared_ptr<Subscriber>> targets;
    uint64_t sequence = 0;
    std::size_t overflowed = 0;
    {
        std::lock_guard lg(m_);
        if(closing_reason_) return 0;
        sequence = next_sequence_++;
        auto record = std::make_shared<const ChangeRecord>(ChangeRecord{
            sequence, change.kind, change.path, change.old_path,
            std::chrono::system_clock::now()});
        targets.reserve(subscribers_.size());
        for(auto it = subscribers_.begin(); it != subscribers_.end();){
            auto sub = it->second.lock();
            if(!sub){
                it = subscribers_.erase(it);
                continue;
            }
            auto dropped_before = sub->dropped_count();
            if(sub->enqueue(record)){
                if(sub->dropped_count() != dropped_before) ++overflowed;
                targets.push_back(std::move(sub));
            }
            ++it;
        }
    }
    for(auto& sub : targets) sub->notify();
    log_debug(logger_.get(), "Hub: #{} {} {} -> {} subscriber(s)",
              sequence, to_string(change.kind), change.path, targets.size());
    if(overflowed > 0){
        log_debug(logger_.get(), "Hub: #{} overflowed {} slow subscriber queue(s)", sequence, overflowed);
    }
    return sequence;
}

void BroadcastHub::broadcast_closing(const std::string& reason){
    std::vector<std::shared_ptr<Subscriber>> targets;
    uint64_t last = 0;
    {
        std::lock_guard lg(m_);
        if(closing_reason_) return;
        closing_reason_ = reason;
        last = next_sequence_ - 1;
        for(auto& entry : subscribers_){
            if(auto sub = entry.second.lock()){
                sub->enqueue_closing(reason, last);
                targets.push_back(std::move(sub));
            }
        }
    }
    for(auto& sub : targets) sub->notify();
    log_info(logger_.get(), "Hub: closing ({}) sent to {} subscriber(s) at #{}", reason, targets.size(), last);
}

uint64_t BroadcastHub::current_sequence() const {
    std::lock_guard lg(m_);
    return next_sequence_ - 1;
}

std::size_t BroadcastHub::subscriber_count() const {
    std::lock_guard lg(m_);
    return subscribers_.size();
}

bool BroadcastHub::closing() const {
    std::lock_guard lg(m_);
    return closing_reason_.has_value();
}

BroadcastHub::Stats BroadcastHub::stats() const {
    std::lock_guard lg(m_);
    Stats s;
    s.subscribers = subscribers_.size();
    s.last_sequence = next_sequence_ - 1;
    s.registrations = registrations_;
    s.closing = closing_reason_.has_value();
    return s;
}
