#include "value.hpp"

#include <charconv>
#include <cmath>
#include <cstdio>
#include <ostream>

namespace qre {

const char* value_type_name(ValueType type) {
    switch (type) {
    case ValueType::Null:     return "null";
    case ValueType::String:   return "string";
    case ValueType::Int:      return "int";
    case ValueType::Float:    return "float";
    case ValueType::Decimal:  return "decimal";
    case ValueType::DateTime: return "datetime";
    }
    return "unknown";
}

// shortest text that reads back to the same double, always with a
// fraction or exponent so it stays recognizable as a float
std::string format_double(double d) {
    if (std::isnan(d)) return "nan";
    if (std::isinf(d)) return d < 0 ? "-inf" : "inf";

    char buf[32];
    std::to_chars_result r = std::to_chars(buf, buf + sizeof(buf), d);
    std::string result(buf, r.ptr);
    if (result.find_first_of(".e") == std::string::npos) result += ".0";
    return result;
}

std::string json_quote(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 2);
    out += '"';
    for (unsigned char c : s) {
        switch (c) {
        case '"':  out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\b': out += "\\b"; break;
        case '\f': out += "\\f"; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        default:
            if (c < 0x20) {
                char buf[8];
                snprintf(buf, sizeof(buf), "\\u%04x", c);
                out += buf;
            } else {
                out += (char)c;
            }
        }
    }
    out += '"';
    return out;
}

std::string Value::to_string() const {
    switch (type()) {
    case ValueType::Null:     return "null";
    case ValueType::String:   return as_string();
    case ValueType::Int:      return std::to_string(as_int());
    case ValueType::Float:    return format_double(as_float());
    case ValueType::Decimal:  return as_decimal().to_string();
    case ValueType::DateTime: return as_datetime().to_iso8601();
    }
    return "";
}

std::string Value::to_json() const {
    switch (type()) {
    case ValueType::Null:
        return "null";
    case ValueType::Int:
        return to_string();
    case ValueType::Float: {
        double d = as_float();
        return std::isfinite(d) ? format_double(d) : "null";
    }
    case ValueType::Decimal:
        return as_decimal().is_nan() ? "null" : to_string();
    case ValueType::String:
    case ValueType::DateTime:
        return json_quote(to_string());
    }
    return "null";
}

bool Value::operator==(const Value& other) const {
    if (type() != other.type()) return false;
    switch (type()) {
    case ValueType::Null:     return true;
    case ValueType::String:   return as_string() == other.as_string();
    case ValueType::Int:      return as_int() == other.as_int();
    case ValueType::Float:    return as_float() == other.as_float();
    case ValueType::Decimal:  return as_decimal() == other.as_decimal();
    case ValueType::DateTime: return as_datetime() == other.as_datetime();
    }
    return false;
}

std::ostream& operator<<(std::ostream& os, const Value& value) {
    if (value.is_string()) return os << json_quote(value.as_string());
    return os << value.to_string();
}

} // namespace qre
