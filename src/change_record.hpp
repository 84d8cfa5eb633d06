#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

enum class ChangeKind { Created, Modified, Deleted, Renamed };

const char* to_string(ChangeKind kind);
std::optional<ChangeKind> change_kind_from_string(const std::string& value);

// A normalized filesystem change as the watcher reports it. The hub turns it
// into a ChangeRecord by assigning a sequence number.
struct FileChange {
    ChangeKind kind = ChangeKind::Modified;
    std::string path;      // relative to the watch root, '/' separated
    std::string old_path;  // Renamed only
};

struct ChangeRecord {
    uint64_t sequence = 0;
    ChangeKind kind = ChangeKind::Modified;
    std::string path;
    std::string old_path;
    std::chrono::system_clock::time_point timestamp;
};

using ChangeRecordPtr = std::shared_ptr<const ChangeRecord>;

// One unit of delivery on a subscriber queue.
struct StreamItem {
    enum class Type { Change, Gap, Closing };

    Type type = Type::Change;
    ChangeRecordPtr change;    // Type::Change
    uint64_t gap_from = 0;     // Type::Gap, inclusive
    uint64_t gap_to = 0;       // Type::Gap, inclusive
    std::string reason;        // Type::Closing
    uint64_t last_sequence = 0;// Type::Closing

    static StreamItem make_change(ChangeRecordPtr record);
    static StreamItem make_gap(uint64_t from, uint64_t to);
    static StreamItem make_closing(std::string reason, uint64_t last_sequence);

    // Sequence a client should present to resume after this item, if any.
    std::optional<uint64_t> resume_token() const;
};
