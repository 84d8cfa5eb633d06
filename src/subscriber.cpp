#include "subscriber.hpp"

#include <algorithm>
#include <utility>

Subscriber::Subscriber(uint64_t id, std::size_t capacity)
: id_(id),
  capacity_(std::max<std::size_t>(capacity, 1)),
  connected_since_(std::chrono::system_clock::now())
{
}

void Subscriber::absorb_into_gap(uint64_t from, uint64_t to){
    if(gap_){
        gap_->from = std::min(gap_->from, from);
        gap_->to = std::max(gap_->to, to);
    } else {
        gap_ = Gap{from, to};
    }
}

bool Subscriber::enqueue(const ChangeRecordPtr& record){
    if(!record) return false;
    {
        std::lock_guard lg(m_);
        if(closed_ || closing_) return false;
        if(records_.size() >= capacity_){
            // drop oldest, never the incoming record
            auto evicted = records_.front()->sequence;
            records_.pop_front();
            absorb_into_gap(evicted, evicted);
            ++dropped_;
        }
        records_.push_back(record);
    }
    cv_.notify_one();
    return true;
}

bool Subscriber::enqueue_gap(uint64_t from, uint64_t to){
    if(from > to) return false;
    {
        std::lock_guard lg(m_);
        if(closed_ || closing_) return false;
        absorb_into_gap(from, to);
    }
    cv_.notify_one();
    return true;
}

bool Subscriber::enqueue_closing(const std::string& reason, uint64_t last_sequence){
    {
        std::lock_guard lg(m_);
        if(closed_ || closing_) return false;
        closing_ = Closing{reason, last_sequence};
    }
    cv_.notify_one();
    return true;
}

std::optional<StreamItem> Subscriber::pop_locked(){
    if(closed_) return std::nullopt;
    if(gap_){
        auto item = StreamItem::make_gap(gap_->from, gap_->to);
        gap_.reset();
        return item;
    }
    if(!records_.empty()){
        auto item = StreamItem::make_change(std::move(records_.front()));
        records_.pop_front();
        return item;
    }
    if(closing_){
        auto item = StreamItem::make_closing(closing_->reason, closing_->last_sequence);
        // handed out once, the queue is sealed afterwards
        closed_ = true;
        return item;
    }
    return std::nullopt;
}

std::optional<StreamItem> Subscriber::try_pop(){
    std::lock_guard lg(m_);
    return pop_locked();
}

std::optional<StreamItem> Subscriber::wait_pop(std::chrono::milliseconds timeout){
    std::unique_lock lock(m_);
    cv_.wait_for(lock, timeout, [this]{
        return closed_ || gap_.has_value() || !records_.empty() || closing_.has_value();
    });
    return pop_locked();
}

void Subscriber::set_notify(NotifyFn fn){
    std::lock_guard lg(m_);
    notify_ = std::move(fn);
}

void Subscriber::notify(){
    NotifyFn fn;
    {
        std::lock_guard lg(m_);
        if(closed_) return;
        fn = notify_;
    }
    if(fn) fn();
}

void Subscriber::close(){
    {
        std::lock_guard lg(m_);
        closed_ = true;
        records_.clear();
        gap_.reset();
        notify_ = nullptr;
    }
    cv_.notify_all();
}

bool Subscriber::closed() const {
    std::lock_guard lg(m_);
    return closed_;
}

void Subscriber::mark_delivered(uint64_t sequence){
    std::lock_guard lg(m_);
    last_delivered_ = std::max(last_delivered_, sequence);
}

uint64_t Subscriber::last_delivered_sequence() const {
    std::lock_guard lg(m_);
    return last_delivered_;
}

std::size_t Subscriber::size() const {
    std::lock_guard lg(m_);
    return records_.size() + (gap_ ? 1 : 0);
}

bool Subscriber::empty() const {
    return size() == 0;
}

uint64_t Subscriber::dropped_count() const {
    std::lock_guard lg(m_);
    return dropped_;
}
