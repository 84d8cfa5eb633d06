#include "change_record.hpp"

const char* to_string(ChangeKind kind) {
    switch(kind) {
        case ChangeKind::Created:  return "created";
        case ChangeKind::Modified: return "modified";
        case ChangeKind::Deleted:  return "deleted";
        case ChangeKind::Renamed:  return "renamed";
    }
    return "modified";
}

std::optional<ChangeKind> change_kind_from_string(const std::string& value) {
    if(value == "created") return ChangeKind::Created;
    if(value == "modified") return ChangeKind::Modified;
    if(value == "deleted") return ChangeKind::Deleted;
    if(value == "renamed") return ChangeKind::Renamed;
    return std::nullopt;
}

StreamItem StreamItem::make_change(ChangeRecordPtr record) {
    StreamItem item;
    item.type = Type::Change;
    item.change = std::move(record);
    return item;
}

StreamItem StreamItem::make_gap(uint64_t from, uint64_t to) {
    StreamItem item;
    item.type = Type::Gap;
    item.gap_from = from;
    item.gap_to = to;
    return item;
}

StreamItem StreamItem::make_closing(std::string reason, uint64_t last_sequence) {
    StreamItem item;
    item.type = Type::Closing;
    item.reason = std::move(reason);
    item.last_sequence = last_sequence;
    return item;
}

std::optional<uint64_t> StreamItem::resume_token() const {
    switch(type) {
        case Type::Change:  return change ? std::optional<uint64_t>(change->sequence) : std::nullopt;
        case Type::Gap:     return gap_to;
        case Type::Closing: return std::nullopt;
    }
    return std::nullopt;
}
