#include "dir_watcher.hpp"

#include <sys/eventfd.h>
#include <sys/inotify.h>
#include <poll.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstring>

namespace fs = std::filesystem;

namespace {

constexpr uint32_t kWatchMask = IN_CREATE | IN_MODIFY | IN_DELETE |
                                IN_MOVED_FROM | IN_MOVED_TO |
                                IN_DELETE_SELF | IN_MOVE_SELF;

constexpr std::size_t kEventBufferSize = 64 * (sizeof(struct inotify_event) + NAME_MAX + 1);

// Upper bound on one poll() so a missed wake-up cannot stall the loop.
constexpr int kMaxPollMs = 1000;

bool is_under(const fs::path& candidate, const fs::path& dir){
    auto c = candidate.generic_string();
    auto d = dir.generic_string();
    if(c.size() < d.size() || c.compare(0, d.size(), d) != 0) return false;
    return c.size() == d.size() || c[d.size()] == '/';
}

} // namespace

DirWatcher::DirWatcher(Options options,
                       ChangeCallback on_change,
                       LostCallback on_lost,
                       std::shared_ptr<Logger> logger)
: options_(std::move(options)),
  on_change_(std::move(on_change)),
  on_lost_(std::move(on_lost)),
  logger_(std::move(logger)),
  debouncer_(options_.debounce_window)
{
    if(options_.retry_attempts < 1) options_.retry_attempts = 1;
    if(options_.retry_base.count() <= 0) options_.retry_base = std::chrono::milliseconds(100);
}

DirWatcher::~DirWatcher(){
    stop();
    close_inotify();
    if(wake_fd_ >= 0) ::close(wake_fd_);
}

void DirWatcher::start(){
    if(running_) return;

    std::error_code ec;
    if(!fs::exists(options_.root, ec)){
        throw WatchInitError("watch path does not exist: " + options_.root.string());
    }
    if(!fs::is_directory(options_.root, ec)){
        throw WatchInitError("watch path is not a directory: " + options_.root.string());
    }
    root_ = fs::canonical(options_.root, ec);
    if(ec){
        throw WatchInitError("cannot resolve watch path " + options_.root.string() + ": " + ec.message());
    }

    open_inotify();
    std::string error;
    if(!add_watch(root_, error)){
        close_inotify();
        throw WatchInitError("cannot watch " + root_.string() + ": " + error);
    }
    add_watch_recursive(root_);

    if(wake_fd_ < 0){
        wake_fd_ = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if(wake_fd_ < 0){
            close_inotify();
            throw WatchInitError(std::string("eventfd failed: ") + std::strerror(errno));
        }
    } else {
        // clear a wake-up left over from a previous stop()
        uint64_t stale = 0;
        while(::read(wake_fd_, &stale, sizeof(stale)) > 0) {}
    }

    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
        stop_requested_ = false;
    }
    running_ = true;
    log_info(logger_.get(), "Watcher: watching {} ({} director{})",
             root_.string(), watch_count(), watch_count() == 1 ? "y" : "ies");
    thread_ = std::thread([this](){ watch_loop(); });
}

void DirWatcher::stop(){
    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
        stop_requested_ = true;
    }
    stop_cv_.notify_all();
    if(wake_fd_ >= 0){
        uint64_t one = 1;
        if(::write(wake_fd_, &one, sizeof(one)) < 0 && errno != EAGAIN){
            log_warn(logger_.get(), "Watcher: wake-up write failed: {}", std::strerror(errno));
        }
    }
    if(thread_.joinable()) thread_.join();
    running_ = false;
}

std::size_t DirWatcher::watch_count() const {
    std::lock_guard<std::mutex> lock(watches_mutex_);
    return wd_to_path_.size();
}

void DirWatcher::open_inotify(){
    inotify_fd_ = ::inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if(inotify_fd_ < 0){
        throw WatchInitError(std::string("inotify_init1 failed: ") + std::strerror(errno));
    }
}

void DirWatcher::close_inotify(){
    if(inotify_fd_ >= 0){
        ::close(inotify_fd_);
        inotify_fd_ = -1;
    }
    std::lock_guard<std::mutex> lock(watches_mutex_);
    wd_to_path_.clear();
    path_to_wd_.clear();
    root_wd_ = -1;
}

bool DirWatcher::add_watch(const fs::path& dir, std::string& error){
    int wd = ::inotify_add_watch(inotify_fd_, dir.c_str(), kWatchMask);
    if(wd < 0){
        error = std::strerror(errno);
        return false;
    }
    std::lock_guard<std::mutex> lock(watches_mutex_);
    wd_to_path_[wd] = dir;
    path_to_wd_[dir.generic_string()] = wd;
    if(dir == root_) root_wd_ = wd;
    return true;
}

void DirWatcher::add_watch_recursive(const fs::path& dir, bool report_contents){
    bool watched = false;
    {
        std::lock_guard<std::mutex> lock(watches_mutex_);
        watched = path_to_wd_.count(dir.generic_string()) > 0;
    }
    if(!watched){
        std::string error;
        if(!add_watch(dir, error)){
            log_warn(logger_.get(), "Watcher: cannot watch {}: {}", dir.string(), error);
            return;
        }
    }

    std::error_code ec;
    fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    fs::recursive_directory_iterator end;
    for(; !ec && it != end; it.increment(ec)){
        if(report_contents) note(ChangeKind::Created, it->path());
        std::error_code type_ec;
        if(it->is_symlink(type_ec) || !it->is_directory(type_ec)) continue;
        bool known = false;
        {
            std::lock_guard<std::mutex> lock(watches_mutex_);
            known = path_to_wd_.count(it->path().generic_string()) > 0;
        }
        if(known) continue;
        std::string error;
        if(!add_watch(it->path(), error)){
            log_warn(logger_.get(), "Watcher: cannot watch {}: {}", it->path().string(), error);
        }
    }
    if(ec){
        log_debug(logger_.get(), "Watcher: scan of {} stopped early: {}", dir.string(), ec.message());
    }
}

void DirWatcher::drop_watches_under(const fs::path& dir){
    std::lock_guard<std::mutex> lock(watches_mutex_);
    for(auto it = wd_to_path_.begin(); it != wd_to_path_.end();){
        if(is_under(it->second, dir)){
            ::inotify_rm_watch(inotify_fd_, it->first);
            path_to_wd_.erase(it->second.generic_string());
            it = wd_to_path_.erase(it);
        } else {
            ++it;
        }
    }
}

void DirWatcher::rebase_watches(const fs::path& from, const fs::path& to){
    std::lock_guard<std::mutex> lock(watches_mutex_);
    const auto prefix_len = from.generic_string().size();
    for(auto& entry : wd_to_path_){
        if(!is_under(entry.second, from)) continue;
        path_to_wd_.erase(entry.second.generic_string());
        auto suffix = entry.second.generic_string().substr(prefix_len);
        entry.second = fs::path(to.generic_string() + suffix);
        path_to_wd_[entry.second.generic_string()] = entry.first;
    }
}

std::string DirWatcher::relative_of(const fs::path& path) const {
    return path.lexically_relative(root_).generic_string();
}

void DirWatcher::note(ChangeKind kind, const fs::path& path, const fs::path& old_path){
    FileChange change;
    change.kind = kind;
    change.path = relative_of(path);
    if(!old_path.empty()) change.old_path = relative_of(old_path);
    log_debug(logger_.get(), "Watcher: raw {} {}", to_string(kind), path.string());
    debouncer_.add(change, Clock::now());
}

void DirWatcher::flush(bool everything){
    auto ready = everything ? debouncer_.take_all() : debouncer_.take_due(Clock::now());
    for(const auto& change : ready){
        if(!on_change_) continue;
        try {
            on_change_(change);
        } catch(const std::exception& e){
            log_error(logger_.get(), "Watcher: change handler failed for {}: {}", change.path, e.what());
        }
    }
}

void DirWatcher::watch_loop(){
    while(true){
        {
            std::lock_guard<std::mutex> lock(stop_mutex_);
            if(stop_requested_) break;
        }

        int timeout_ms = kMaxPollMs;
        if(auto deadline = debouncer_.next_deadline()){
            auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - Clock::now()).count() + 1;
            timeout_ms = static_cast<int>(std::clamp<long long>(wait, 0, kMaxPollMs));
        }

        pollfd fds[2];
        fds[0].fd = inotify_fd_;
        fds[0].events = POLLIN;
        fds[0].revents = 0;
        fds[1].fd = wake_fd_;
        fds[1].events = POLLIN;
        fds[1].revents = 0;

        int rc = ::poll(fds, 2, timeout_ms);
        ReadResult result = ReadResult::Ok;
        std::string cause;
        if(rc < 0){
            if(errno != EINTR){
                cause = std::string("poll failed: ") + std::strerror(errno);
                result = ReadResult::Reestablish;
            }
        } else if(rc > 0){
            if(fds[1].revents & POLLIN) break;
            if(fds[0].revents & (POLLERR | POLLHUP | POLLNVAL)){
                cause = "inotify descriptor error";
                result = ReadResult::Reestablish;
            } else if(fds[0].revents & POLLIN){
                result = read_events();
                if(result == ReadResult::Reestablish) cause = "watch tree disrupted";
            }
        }

        if(result == ReadResult::Reestablish){
            flush(true);
            auto recovery = reestablish(cause);
            if(recovery == Recovery::Stopped) break;
            if(recovery == Recovery::Lost){
                running_ = false;
                WatchLostError lost("lost watch on " + root_.string() + " (" + cause + ")");
                log_error(logger_.get(), "Watcher: {}", lost.what());
                if(on_lost_) on_lost_(lost);
                return;
            }
            continue;
        }

        flush(false);
    }

    flush(true);
    running_ = false;
    log_debug(logger_.get(), "Watcher: stopped");
}

DirWatcher::ReadResult DirWatcher::read_events(){
    alignas(struct inotify_event) char buffer[kEventBufferSize];
    std::vector<PendingMove> moves;
    ReadResult result = ReadResult::Ok;

    while(true){
        ssize_t length = ::read(inotify_fd_, buffer, sizeof(buffer));
        if(length < 0){
            if(errno == EAGAIN || errno == EWOULDBLOCK) break;
            if(errno == EINTR) continue;
            log_warn(logger_.get(), "Watcher: read failed: {}", std::strerror(errno));
            result = ReadResult::Reestablish;
            break;
        }
        if(length == 0) break;

        for(char* ptr = buffer; ptr < buffer + length;){
            const auto* event = reinterpret_cast<const struct inotify_event*>(ptr);
            if(handle_event(event, moves) == ReadResult::Reestablish){
                result = ReadResult::Reestablish;
            }
            ptr += sizeof(struct inotify_event) + event->len;
        }
    }

    settle_moves(moves);
    return result;
}

DirWatcher::ReadResult DirWatcher::handle_event(const inotify_event* event,
                                                std::vector<PendingMove>& moves){
    if(event->mask & IN_Q_OVERFLOW){
        log_warn(logger_.get(), "Watcher: kernel event queue overflowed");
        return ReadResult::Reestablish;
    }

    fs::path dir;
    {
        std::lock_guard<std::mutex> lock(watches_mutex_);
        auto it = wd_to_path_.find(event->wd);
        if(it == wd_to_path_.end()) return ReadResult::Ok;
        dir = it->second;
    }

    if(event->mask & IN_IGNORED){
        if(event->wd == root_wd_) return ReadResult::Reestablish;
        std::lock_guard<std::mutex> lock(watches_mutex_);
        path_to_wd_.erase(dir.generic_string());
        wd_to_path_.erase(event->wd);
        return ReadResult::Ok;
    }
    if(event->mask & (IN_DELETE_SELF | IN_MOVE_SELF)){
        // subdirectories are reported through their parent's events
        return event->wd == root_wd_ ? ReadResult::Reestablish : ReadResult::Ok;
    }
    if(event->len == 0) return ReadResult::Ok;

    const fs::path full = dir / event->name;
    const bool is_dir = (event->mask & IN_ISDIR) != 0;

    if(event->mask & IN_CREATE){
        note(ChangeKind::Created, full);
        if(is_dir) add_watch_recursive(full, true);
    } else if(event->mask & IN_MODIFY){
        note(ChangeKind::Modified, full);
    } else if(event->mask & IN_DELETE){
        note(ChangeKind::Deleted, full);
    } else if(event->mask & IN_MOVED_FROM){
        moves.push_back(PendingMove{event->cookie, full, is_dir});
    } else if(event->mask & IN_MOVED_TO){
        auto match = std::find_if(moves.begin(), moves.end(),
            [&](const PendingMove& m){ return m.cookie == event->cookie; });
        if(match != moves.end()){
            if(is_dir) rebase_watches(match->path, full);
            note(ChangeKind::Renamed, full, match->path);
            moves.erase(match);
        } else {
            note(ChangeKind::Created, full);
            if(is_dir) add_watch_recursive(full, true);
        }
    }
    return ReadResult::Ok;
}

void DirWatcher::settle_moves(std::vector<PendingMove>& moves){
    // moved out of the tree
    for(const auto& move : moves){
        if(move.is_dir) drop_watches_under(move.path);
        note(ChangeKind::Deleted, move.path);
    }
    moves.clear();
}

bool DirWatcher::wait_or_stop(std::chrono::milliseconds delay){
    std::unique_lock<std::mutex> lock(stop_mutex_);
    return !stop_cv_.wait_for(lock, delay, [this]{ return stop_requested_; });
}

DirWatcher::Recovery DirWatcher::reestablish(const std::string& cause){
    log_warn(logger_.get(), "Watcher: re-establishing watch on {}: {}", root_.string(), cause);
    close_inotify();

    auto delay = options_.retry_base;
    for(int attempt = 1; attempt <= options_.retry_attempts; ++attempt){
        if(!wait_or_stop(delay)) return Recovery::Stopped;
        delay *= 2;

        std::error_code ec;
        if(!fs::is_directory(root_, ec)){
            log_warn(logger_.get(), "Watcher: attempt {}/{}: {} is gone",
                     attempt, options_.retry_attempts, root_.string());
            continue;
        }
        try {
            open_inotify();
        } catch(const WatchInitError& e){
            log_warn(logger_.get(), "Watcher: attempt {}/{}: {}", attempt, options_.retry_attempts, e.what());
            continue;
        }
        std::string error;
        if(!add_watch(root_, error)){
            log_warn(logger_.get(), "Watcher: attempt {}/{}: {}", attempt, options_.retry_attempts, error);
            close_inotify();
            continue;
        }
        add_watch_recursive(root_);
        log_info(logger_.get(), "Watcher: watch on {} re-established after {} attempt(s)",
                 root_.string(), attempt);
        return Recovery::Recovered;
    }
    return Recovery::Lost;
}
