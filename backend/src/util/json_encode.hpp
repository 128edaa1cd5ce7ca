#pragma once
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

// Basic JSON string escaper
inline std::string json_escape(std::string_view s) {
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"':  out += "\\\""; break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:   out += c;      break;
        }
    }
    return out;
}

inline void json_string(std::ostringstream& os, std::string_view s) {
    os << "\"" << json_escape(s) << "\"";
}

inline void json_number(std::ostringstream& os, double v) {
    os << std::setprecision(15) << v;
}

// Encode rows as an array of objects, one per row, using `encode_row(os, row)`.
// [ {...}, {...} ]
template <typename Row, typename Fn>
inline void json_object_array(std::ostringstream& os, const std::vector<Row>& rows, Fn encode_row) {
    os << "[";
    bool first = true;
    for (const auto& row : rows) {
        if (!first) os << ",";
        first = false;
        encode_row(os, row);
    }
    os << "]";
}

// Writes `null` for an empty optional.
template <typename T, typename Fn>
inline void json_optional(std::ostringstream& os, const std::optional<T>& v, Fn encode) {
    if (!v) {
        os << "null";
        return;
    }
    encode(os, *v);
}
