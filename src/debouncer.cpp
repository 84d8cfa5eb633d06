#include "debouncer.hpp"

#include <algorithm>

Debouncer::Debouncer(std::chrono::milliseconds window)
: window_(window.count() > 0 ? window : kDefaultDebounceWindow)
{
}

FileChange Debouncer::merge(const FileChange& earlier, const FileChange& later){
    // A path that is new to subscribers stays new while it is being written.
    if(later.kind == ChangeKind::Modified &&
       (earlier.kind == ChangeKind::Created || earlier.kind == ChangeKind::Renamed)){
        return earlier;
    }
    return later;
}

void Debouncer::add(const FileChange& change, Clock::time_point now){
    FileChange incoming = change;

    if(incoming.kind == ChangeKind::Renamed && !incoming.old_path.empty()){
        auto source = pending_.find(incoming.old_path);
        if(source != pending_.end() && source->second.change.kind == ChangeKind::Created){
            // write-temp-then-rename: the temporary never reaches subscribers
            pending_.erase(source);
            auto target = pending_.find(incoming.path);
            bool target_known = target != pending_.end() &&
                                target->second.change.kind != ChangeKind::Deleted;
            incoming.kind = target_known ? ChangeKind::Modified : ChangeKind::Created;
            incoming.old_path.clear();
        }
    }

    auto deadline = now + window_;
    auto it = pending_.find(incoming.path);
    if(it == pending_.end()){
        pending_.emplace(incoming.path, Pending{incoming, deadline, next_order_++});
        return;
    }
    // element references survive a rehash; iterators do not
    Pending& entry = it->second;
    const FileChange& earlier = entry.change;
    if(earlier.kind == ChangeKind::Renamed && incoming.kind != ChangeKind::Modified &&
       !earlier.old_path.empty() && earlier.old_path != incoming.path){
        // The rename is about to be replaced; subscribers still need to
        // learn that its source is gone.
        retire_source(earlier.old_path, deadline);
    }
    entry.change = merge(entry.change, incoming);
    entry.deadline = deadline;
    entry.order = next_order_++;
}

void Debouncer::retire_source(const std::string& old_path, Clock::time_point deadline){
    // a pending change on the source path already describes its later state
    if(pending_.count(old_path)) return;
    FileChange gone;
    gone.kind = ChangeKind::Deleted;
    gone.path = old_path;
    pending_.emplace(old_path, Pending{std::move(gone), deadline, next_order_++});
}

std::vector<FileChange> Debouncer::release(std::vector<Pending> due){
    std::sort(due.begin(), due.end(), [](const Pending& a, const Pending& b){
        if(a.deadline != b.deadline) return a.deadline < b.deadline;
        return a.order < b.order;
    });
    std::vector<FileChange> out;
    out.reserve(due.size());
    for(auto& p : due) out.push_back(std::move(p.change));
    return out;
}

std::vector<FileChange> Debouncer::take_due(Clock::time_point now){
    std::vector<Pending> due;
    for(auto it = pending_.begin(); it != pending_.end();){
        if(it->second.deadline <= now){
            due.push_back(std::move(it->second));
            it = pending_.erase(it);
        } else {
            ++it;
        }
    }
    return release(std::move(due));
}

std::vector<FileChange> Debouncer::take_all(){
    std::vector<Pending> due;
    due.reserve(pending_.size());
    for(auto& entry : pending_) due.push_back(std::move(entry.second));
    pending_.clear();
    return release(std::move(due));
}

std::optional<Debouncer::Clock::time_point> Debouncer::next_deadline() const {
    std::optional<Clock::time_point> earliest;
    for(const auto& entry : pending_){
        if(!earliest || entry.second.deadline < *earliest) earliest = entry.second.deadline;
    }
    return earliest;
}
