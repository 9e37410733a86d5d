#pragma once

#include <string>
#include <string_view>
#include <cstdint>


namespace lcr {
namespace json {

// Appends s to out as the body of a JSON string literal (quotes not included)
inline void append_escaped(std::string& out, std::string_view s) {
    static constexpr char hex[] = "0123456789abcdef";
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            case '\b': out += "\\b";  break;
            case '\f': out += "\\f";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += "\\u00";
                    out += hex[(c >> 4) & 0x0F];
                    out += hex[c & 0x0F];
                } else {
                    out += c;
                }
        }
    }
}

[[nodiscard]]
inline std::string escape(std::string_view s) {
    std::string out;
    out.reserve(s.size() + 2);
    append_escaped(out, s);
    return out;
}

// "key":"value"
inline void append_string_field(std::string& out, std::string_view key, std::string_view value) {
    out += '"';
    out += key;
    out += "\":\"";
    append_escaped(out, value);
    out += '"';
}

// Fast integer -> string formatter
inline void append(std::string& out, std::uint64_t value) {
    char buf[32];
    char* p = buf + sizeof(buf);
    do {
        *(--p) = static_cast<char>('0' + (value % 10));
        value /= 10;
    } while (value > 0);
    out.append(p, buf + sizeof(buf) - p);
}

} // namespace json
} // namespace lcr
