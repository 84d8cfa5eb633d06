#include "protocol.hpp"

#include <sstream>

using json = nlohmann::json;

json change_to_json(const ChangeRecord& record){
    json j;
    j["seq"] = record.sequence;
    j["kind"] = to_string(record.kind);
    j["path"] = record.path;
    if(record.kind == ChangeKind::Renamed){
        j["old_path"] = record.old_path;
    }
    j["timestamp"] = std::chrono::duration_cast<std::chrono::milliseconds>(
        record.timestamp.time_since_epoch()).count();
    return j;
}

json gap_to_json(uint64_t from, uint64_t to){
    json j;
    j["from"] = from;
    j["to"] = to;
    return j;
}

json closing_to_json(const std::string& reason, uint64_t last_sequence){
    json j;
    j["reason"] = reason;
    j["last_seq"] = last_sequence;
    return j;
}

std::string to_wire_json(const json& payload){
    return payload.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string format_sse_frame(const std::string& event,
                             const std::string& data,
                             const std::string& id){
    std::ostringstream out;
    if(!id.empty()) out << "id: " << id << "\n";
    out << "event: " << event << "\n";
    // a data line may not contain a newline; split if the payload has any
    std::istringstream lines(data);
    std::string line;
    bool any = false;
    while(std::getline(lines, line)){
        out << "data: " << line << "\n";
        any = true;
    }
    if(!any) out << "data: \n";
    out << "\n";
    return out.str();
}

std::string format_sse_event(const StreamItem& item){
    switch(item.type){
        case StreamItem::Type::Change:
            return format_sse_frame(to_string(item.change->kind),
                                    to_wire_json(change_to_json(*item.change)),
                                    std::to_string(item.change->sequence));
        case StreamItem::Type::Gap:
            return format_sse_frame("gap",
                                    to_wire_json(gap_to_json(item.gap_from, item.gap_to)),
                                    std::to_string(item.gap_to));
        case StreamItem::Type::Closing:
            return format_sse_frame("closing",
                                    to_wire_json(closing_to_json(item.reason, item.last_sequence)));
    }
    return {};
}

std::string format_heartbeat(){
    return format_sse_frame("heartbeat", "{}");
}

std::string format_open_ack(int retry_ms){
    return "retry: " + std::to_string(retry_ms) + "\n: connected\n\n";
}
