#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

inline constexpr std::size_t kMaxRequestHeadBytes = 16 * 1024;
inline constexpr const char* kStreamPath = "/sse";

struct HttpRequest {
    std::string method;
    std::string target;   // as sent, including any query string
    std::string path;     // target without the query string
    std::string version;
    std::map<std::string, std::string> headers; // lower-cased names

    std::optional<std::string> header(const std::string& name) const;
};

// Parses a request head (request line and header lines, CRLF or LF
// terminated). Returns nullopt for anything malformed.
std::optional<HttpRequest> parse_http_request(const std::string& head);

// Decimal Last-Event-ID value; nullopt when absent or not a number.
std::optional<uint64_t> parse_last_event_id(const std::string& value);

std::string make_stream_response_head();
std::string make_error_response(int status,
                                const std::string& reason,
                                const std::string& extra_headers = "");
