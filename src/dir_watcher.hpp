#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "change_record.hpp"
#include "debouncer.hpp"
#include "errors.hpp"
#include "log.hpp"

struct inotify_event;

// Recursive inotify watch over one directory tree.
//
// Runs on its own thread. Raw kernel events are paired (renames), normalized
// to paths relative to the root and debounced before being handed to the
// change callback. The callbacks run on the watcher thread and must not block.
class DirWatcher {
public:
    struct Options {
        std::filesystem::path root;
        std::chrono::milliseconds debounce_window{kDefaultDebounceWindow};
        int retry_attempts = 5;
        std::chrono::milliseconds retry_base{100};
    };

    using ChangeCallback = std::function<void(const FileChange&)>;
    using LostCallback = std::function<void(const WatchLostError&)>;

    DirWatcher(Options options,
               ChangeCallback on_change,
               LostCallback on_lost,
               std::shared_ptr<Logger> logger = nullptr);
    ~DirWatcher();

    DirWatcher(const DirWatcher&) = delete;
    DirWatcher& operator=(const DirWatcher&) = delete;

    // Throws WatchInitError when the root is missing, not a directory or
    // cannot be watched.
    void start();
    // Flushes pending debounced changes and joins the thread.
    void stop();

    bool running() const { return running_.load(); }
    std::size_t watch_count() const;
    const std::filesystem::path& root() const { return root_; }

private:
    using Clock = std::chrono::steady_clock;

    enum class ReadResult { Ok, Reestablish };
    enum class Recovery { Recovered, Stopped, Lost };

    struct PendingMove {
        uint32_t cookie = 0;
        std::filesystem::path path;
        bool is_dir = false;
    };

    void open_inotify();
    void close_inotify();
    bool add_watch(const std::filesystem::path& dir, std::string& error);
    // With `report_contents`, every entry already inside `dir` is noted as
    // created; entries made before the new watches took hold are otherwise lost.
    void add_watch_recursive(const std::filesystem::path& dir, bool report_contents = false);
    void drop_watches_under(const std::filesystem::path& dir);
    void rebase_watches(const std::filesystem::path& from, const std::filesystem::path& to);

    void watch_loop();
    ReadResult read_events();
    ReadResult handle_event(const inotify_event* event, std::vector<PendingMove>& moves);
    void settle_moves(std::vector<PendingMove>& moves);
    Recovery reestablish(const std::string& cause);
    bool wait_or_stop(std::chrono::milliseconds delay);

    void note(ChangeKind kind, const std::filesystem::path& path,
              const std::filesystem::path& old_path = {});
    void flush(bool everything);
    std::string relative_of(const std::filesystem::path& path) const;

    Options options_;
    std::filesystem::path root_;
    ChangeCallback on_change_;
    LostCallback on_lost_;
    std::shared_ptr<Logger> logger_;

    Debouncer debouncer_;
    int inotify_fd_ = -1;
    int wake_fd_ = -1;
    int root_wd_ = -1;
    mutable std::mutex watches_mutex_;
    std::unordered_map<int, std::filesystem::path> wd_to_path_;
    std::unordered_map<std::string, int> path_to_wd_;

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::mutex stop_mutex_;
    std::condition_variable stop_cv_;
    bool stop_requested_ = false;
};
