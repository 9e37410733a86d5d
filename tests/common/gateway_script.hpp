#pragma once

#include <cstdint>
#include <string>
#include <string_view>

// Server-side gateway payloads used to script a MockTransport.
namespace gateway_script {

inline std::string hello(std::uint64_t interval_ms) {
    return "{\"op\":10,\"d\":{\"heartbeat_interval\":" + std::to_string(interval_ms) + "},\"s\":null,\"t\":null}";
}

inline std::string heartbeat_ack() {
    return "{\"op\":11,\"d\":null}";
}

inline std::string heartbeat_request() {
    return "{\"op\":1,\"d\":null}";
}

inline std::string reconnect() {
    return "{\"op\":7,\"d\":null}";
}

inline std::string invalid_session(bool resumable) {
    return std::string("{\"op\":9,\"d\":") + (resumable ? "true" : "false") + "}";
}

inline std::string dispatch(std::uint64_t seq, std::string_view name, std::string_view data) {
    std::string out = "{\"op\":0,\"s\":" + std::to_string(seq) + ",\"t\":\"";
    out += name;
    out += "\",\"d\":";
    out += data;
    out += '}';
    return out;
}

inline std::string ready(std::uint64_t seq, std::string_view session_id, std::string_view resume_url = "wss://resume.example.test") {
    std::string d = "{\"v\":10,\"session_id\":\"";
    d += session_id;
    d += "\",\"resume_gateway_url\":\"";
    d += resume_url;
    d += "\",\"guilds\":[]}";
    return dispatch(seq, "READY", d);
}

inline std::string resumed(std::uint64_t seq) {
    return dispatch(seq, "RESUMED", "{}");
}

} // namespace gateway_script
