#include "type_registry.hpp"
#include "qre_error.hpp"
#include "re2_wrapper.hpp"
#include "../lib/log.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cerrno>
#include <cstdlib>
#include <stdexcept>

namespace qre {

Value identity_converter(const std::string& raw) {
    return Value(raw);
}

bool is_identifier(const std::string& name) {
    if (name.empty()) return false;
    for (unsigned char c : name) {
        if (!std::isalnum(c) && c != '_') return false;
    }
    return true;
}

TypeRegistry& TypeRegistry::global() {
    static TypeRegistry registry = with_builtins();
    return registry;
}

TypeRegistry TypeRegistry::with_builtins() {
    TypeRegistry registry;
    register_builtin_types(registry);
    return registry;
}

void TypeRegistry::register_type(const std::string& name, const std::string& regex_fragment,
                                 Converter converter) {
    if (!is_identifier(name)) {
        log_error("register_type: invalid type name '%s'", name.c_str());
        throw InvalidTypeError(name, "type name must contain only letters, digits and '_'");
    }
    std::string fragment = make_groups_non_capturing(regex_fragment);
    std::string reason;
    if (!validate_regex_fragment(fragment, &reason)) {
        log_error("register_type: '%s' has an invalid fragment: %s", name.c_str(), reason.c_str());
        throw InvalidTypeError(name, reason);
    }

    auto spec = std::make_shared<TypeSpec>();
    spec->name = name;
    spec->regex_fragment = std::move(fragment);
    spec->converter = converter ? std::move(converter) : Converter(identity_converter);
    log_debug("register_type: %s -> %s", name.c_str(), spec->regex_fragment.c_str());
    types_[name] = std::move(spec);
}

std::shared_ptr<const TypeSpec> TypeRegistry::resolve(const std::string& name) const {
    auto it = types_.find(name);
    if (it == types_.end()) {
        log_debug("resolve: unknown type '%s' (%zu types registered)", name.c_str(), types_.size());
        throw UnknownTypeError(name);
    }
    return it->second;
}

std::vector<std::string> TypeRegistry::names() const {
    std::vector<std::string> result;
    result.reserve(types_.size());
    for (const auto& entry : types_) result.push_back(entry.first);
    std::sort(result.begin(), result.end());
    return result;
}

// ============================================================================
// Built-in converters
// ============================================================================

// integers beyond int64 become exact decimal values
Value convert_int(const std::string& raw) {
    const char* begin = raw.c_str();
    char* end = nullptr;
    errno = 0;
    long long v = std::strtoll(begin, &end, 10);
    if (end == begin || *end != '\0') throw std::invalid_argument("not an integer");
    if (errno == ERANGE) {
        log_debug("convert_int: '%s' exceeds int64, using decimal", raw.c_str());
        return Value(Decimal::parse(raw));
    }
    return Value(static_cast<int64_t>(v));
}

// parsed with from_chars, independent of the C locale
Value convert_float(const std::string& raw) {
    const char* begin = raw.data();
    const char* last = begin + raw.size();
    if (begin != last && *begin == '+') begin++;
    double v = 0;
    std::from_chars_result r = std::from_chars(begin, last, v);
    if (r.ec == std::errc::invalid_argument || r.ptr != last) throw std::invalid_argument("not a float");
    if (r.ec == std::errc::result_out_of_range) throw std::out_of_range("float out of range");
    return Value(v);
}

Value convert_decimal(const std::string& raw) {
    return Value(Decimal::parse(raw));
}

Value convert_date(const std::string& raw) {
    return Value(datetime_parse_date(raw));
}

Value convert_datetime(const std::string& raw) {
    return Value(datetime_parse_iso8601(raw));
}

// canonical 8-4-4-4-12 lower case form, with or without hyphens on input
Value convert_uuid(const std::string& raw) {
    std::string hex;
    for (unsigned char c : raw) {
        if (c == '-') continue;
        if (!std::isxdigit(c)) throw std::invalid_argument("not a uuid");
        hex += (char)std::tolower(c);
    }
    if (hex.size() != 32) throw std::invalid_argument("uuid must have 32 hex digits");
    return Value(hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
                 hex.substr(16, 4) + "-" + hex.substr(20));
}

// ============================================================================
// Built-in types
// ============================================================================

static const char* const IPV4_OCTET = "(?:25[0-5]|2[0-4][0-9]|[01]?[0-9][0-9]?)";

void register_builtin_types(TypeRegistry& registry) {
    registry.register_type("int", R"([+-]?[0-9]+)", convert_int);
    registry.register_type("float", R"([+-]?(?:[0-9]*[.])?[0-9]+)", convert_float);
    registry.register_type("decimal", R"([+-]?(?:[0-9]*[.])?[0-9]+)", convert_decimal);
    registry.register_type("uuid",
        R"([a-fA-F0-9]{8}-?[a-fA-F0-9]{4}-?[a-fA-F0-9]{4}-?[a-fA-F0-9]{4}-?[a-fA-F0-9]{12})",
        convert_uuid);
    registry.register_type("date", R"(\d{4}-\d{1,2}-\d{1,2})", convert_date);
    registry.register_type("datetime",
        R"(\d{4}-\d{1,2}-\d{1,2})"
        R"([T ]\d{1,2}:\d{1,2})"
        R"((?::\d{1,2}(?:[.,]\d{1,6}\d{0,6})?)?)"
        R"((?:Z|[+-]\d{2}(?::?\d{2})?)?)",
        convert_datetime);

    // basic shapes
    registry.register_type("letters", R"(\pL+)");
    registry.register_type("identifier", R"([\pL\pN_]+)");
    registry.register_type("open", R"(\[\[|\[|\(|\{)");
    registry.register_type("close", R"(\]\]|\]|\)|\})");

    // and some not so basic ones
    registry.register_type("email", R"([\pL\pN_.+-]+@[a-zA-Z0-9-]+\.[a-zA-Z0-9.-]+)");
    registry.register_type("url",
        R"(https?://(?:www\.)?[-\w@:%.+~#=]{1,256}\.[\w()]{1,6}\b[-\w()!@:%+.~#?&/=]*)");
    // Visa, MasterCard, American Express, Diners Club, Discover, JCB
    registry.register_type("creditcard",
        R"(4[0-9]{12}(?:[0-9]{3})?)"
        R"(|(?:5[1-5][0-9]{2}|222[1-9]|22[3-9][0-9]|2[3-6][0-9]{2}|27[01][0-9]|2720)[0-9]{12})"
        R"(|3[47][0-9]{13})"
        R"(|3(?:0[0-5]|[68][0-9])[0-9]{11})"
        R"(|6(?:011|5[0-9]{2})[0-9]{12})"
        R"(|(?:2131|1800|35[0-9]{3})[0-9]{11})");
    registry.register_type("ipv4", std::string(IPV4_OCTET) + R"((?:\.)" + IPV4_OCTET + "){3}");
    registry.register_type("ipv6",
        R"((?:[0-9a-fA-F]{1,4}:){7}[0-9a-fA-F]{1,4})"
        R"(|(?:[0-9a-fA-F]{1,4}:){1,7}:)"
        R"(|(?:[0-9a-fA-F]{1,4}:){1,6}:[0-9a-fA-F]{1,4})"
        R"(|(?:[0-9a-fA-F]{1,4}:){1,5}(?::[0-9a-fA-F]{1,4}){1,2})"
        R"(|(?:[0-9a-fA-F]{1,4}:){1,4}(?::[0-9a-fA-F]{1,4}){1,3})"
        R"(|(?:[0-9a-fA-F]{1,4}:){1,3}(?::[0-9a-fA-F]{1,4}){1,4})"
        R"(|(?:[0-9a-fA-F]{1,4}:){1,2}(?::[0-9a-fA-F]{1,4}){1,5})"
        R"(|[0-9a-fA-F]{1,4}:(?::[0-9a-fA-F]{1,4}){1,6})"
        R"(|:(?:(?::[0-9a-fA-F]{1,4}){1,7}|:))"
        R"(|fe80:(?::[0-9a-fA-F]{0,4}){0,4}%[0-9a-zA-Z]+)"
        R"(|::(?:ffff(?::0{1,4})?:)?(?:(?:25[0-5]|(?:2[0-4]|1?[0-9])?[0-9])\.){3}(?:25[0-5]|(?:2[0-4]|1?[0-9])?[0-9]))"
        R"(|(?:[0-9a-fA-F]{1,4}:){1,4}:(?:(?:25[0-5]|(?:2[0-4]|1?[0-9])?[0-9])\.){3}(?:25[0-5]|(?:2[0-4]|1?[0-9])?[0-9]))");
}

} // namespace qre
