#include "http_request.hpp"

#include <charconv>
#include <sstream>

#include "settings_manager.hpp"

namespace {

std::string rstrip_cr(std::string line){
    if(!line.empty() && line.back() == '\r') line.pop_back();
    return line;
}

} // namespace

std::optional<std::string> HttpRequest::header(const std::string& name) const {
    auto it = headers.find(SettingsManager::to_lower(name));
    if(it == headers.end()) return std::nullopt;
    return it->second;
}

std::optional<HttpRequest> parse_http_request(const std::string& head){
    std::istringstream in(head);
    std::string line;
    if(!std::getline(in, line)) return std::nullopt;
    line = rstrip_cr(line);

    HttpRequest req;
    std::istringstream request_line(line);
    if(!(request_line >> req.method >> req.target >> req.version)) return std::nullopt;
    std::string trailing;
    if(request_line >> trailing) return std::nullopt;
    if(req.version.rfind("HTTP/", 0) != 0) return std::nullopt;
    if(req.target.empty() || req.target[0] != '/') return std::nullopt;
    req.path = req.target.substr(0, req.target.find('?'));

    while(std::getline(in, line)){
        line = rstrip_cr(line);
        if(line.empty()) break;
        auto colon = line.find(':');
        if(colon == std::string::npos || colon == 0) return std::nullopt;
        auto name = SettingsManager::to_lower(SettingsManager::trim_copy(line.substr(0, colon)));
        auto value = SettingsManager::trim_copy(line.substr(colon + 1));
        req.headers[name] = value;
    }
    return req;
}

std::optional<uint64_t> parse_last_event_id(const std::string& value){
    auto clean = SettingsManager::trim_copy(value);
    if(clean.empty()) return std::nullopt;
    uint64_t out = 0;
    const char* first = clean.data();
    const char* last = clean.data() + clean.size();
    auto result = std::from_chars(first, last, out);
    if(result.ec != std::errc() || result.ptr != last) return std::nullopt;
    return out;
}

std::string make_stream_response_head(){
    return "HTTP/1.1 200 OK\r\n"
           "Content-Type: text/event-stream\r\n"
           "Cache-Control: no-cache\r\n"
           "Connection: keep-alive\r\n"
           "X-Accel-Buffering: no\r\n"
           "\r\n";
}

std::string make_error_response(int status,
                                const std::string& reason,
                                const std::string& extra_headers){
    std::string body = std::to_string(status) + " " + reason + "\n";
    std::ostringstream out;
    out << "HTTP/1.1 " << status << " " << reason << "\r\n"
        << "Content-Type: text/plain\r\n"
        << "Content-Length: " << body.size() << "\r\n"
        << "Connection: close\r\n"
        << extra_headers
        << "\r\n"
        << body;
    return out.str();
}
