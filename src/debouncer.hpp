#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "change_record.hpp"

inline constexpr std::chrono::milliseconds kDefaultDebounceWindow{200};

// Coalesces bursts of changes on the same path. Each new change on a path
// pushes that path's deadline out by one window; a path is released once its
// window passes without further changes.
//
// Time is passed in explicitly so the policy can be driven without a clock.
class Debouncer {
public:
    using Clock = std::chrono::steady_clock;

    explicit Debouncer(std::chrono::milliseconds window = kDefaultDebounceWindow);

    void add(const FileChange& change, Clock::time_point now);

    // Changes whose window has expired, oldest deadline first.
    std::vector<FileChange> take_due(Clock::time_point now);
    std::vector<FileChange> take_all();

    std::optional<Clock::time_point> next_deadline() const;
    std::size_t pending() const { return pending_.size(); }
    std::chrono::milliseconds window() const { return window_; }

private:
    struct Pending {
        FileChange change;
        Clock::time_point deadline;
        uint64_t order = 0;
    };

    static FileChange merge(const FileChange& earlier, const FileChange& later);
    std::vector<FileChange> release(std::vector<Pending> due);
    void retire_source(const std::string& old_path, Clock::time_point deadline);

    std::chrono::milliseconds window_;
    std::unordered_map<std::string, Pending> pending_;
    uint64_t next_order_ = 0;
};
