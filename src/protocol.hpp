#pragma once
#include <nlohmann/json.hpp>
#include <string>

#include "change_record.hpp"

// protocol.hpp: text/event-stream framing
inline constexpr int kClientRetryMs = 3000;
inline constexpr const char* kClosingServer = "server-closing";
inline constexpr const char* kClosingWatchLost = "watch-lost";

nlohmann::json change_to_json(const ChangeRecord& record);
nlohmann::json gap_to_json(uint64_t from, uint64_t to);
nlohmann::json closing_to_json(const std::string& reason, uint64_t last_sequence);

// Compact JSON for a data line. Bytes that are not valid UTF-8 (filenames
// are arbitrary bytes) are replaced with U+FFFD instead of throwing.
std::string to_wire_json(const nlohmann::json& payload);

// One complete frame (terminated by a blank line) for a queued item.
std::string format_sse_event(const StreamItem& item);
std::string format_sse_frame(const std::string& event,
                             const std::string& data,
                             const std::string& id = "");
std::string format_heartbeat();

// Sent right after the response head so probes see bytes without waiting
// for a filesystem change.
std::string format_open_ack(int retry_ms = kClientRetryMs);
