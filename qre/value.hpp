#pragma once

#include "qre-decimal.hpp"
#include "datetime.hpp"

#include <cstdint>
#include <iosfwd>
#include <string>
#include <utility>
#include <variant>

namespace qre {

enum class ValueType {
    Null,
    String,
    Int,
    Float,
    Decimal,
    DateTime
};

const char* value_type_name(ValueType type);

// Converted value of a capture group
class Value {
public:
    Value() = default;
    Value(const char* s) : data_(std::string(s)) {}
    Value(std::string s) : data_(std::move(s)) {}
    Value(int i) : data_(static_cast<int64_t>(i)) {}
    Value(int64_t i) : data_(i) {}
    Value(double d) : data_(d) {}
    Value(Decimal d) : data_(std::move(d)) {}
    Value(DateTime dt) : data_(dt) {}

    ValueType type() const { return static_cast<ValueType>(data_.index()); }
    bool is_null() const { return type() == ValueType::Null; }
    bool is_string() const { return type() == ValueType::String; }
    bool is_int() const { return type() == ValueType::Int; }
    bool is_float() const { return type() == ValueType::Float; }
    bool is_decimal() const { return type() == ValueType::Decimal; }
    bool is_datetime() const { return type() == ValueType::DateTime; }

    // Accessors throw std::bad_variant_access on a type mismatch
    const std::string& as_string() const { return std::get<std::string>(data_); }
    int64_t as_int() const { return std::get<int64_t>(data_); }
    double as_float() const { return std::get<double>(data_); }
    const Decimal& as_decimal() const { return std::get<Decimal>(data_); }
    const DateTime& as_datetime() const { return std::get<DateTime>(data_); }

    // Plain text form, the same text the built-in converters accept
    std::string to_string() const;
    std::string to_json() const;

    bool operator==(const Value& other) const;
    bool operator!=(const Value& other) const { return !(*this == other); }

private:
    // alternative order must follow ValueType
    std::variant<std::monostate, std::string, int64_t, double, Decimal, DateTime> data_;
};

std::string format_double(double d);
std::string json_quote(const std::string& s);

std::ostream& operator<<(std::ostream& os, const Value& value);

} // namespace qre
