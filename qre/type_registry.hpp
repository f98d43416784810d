#pragma once

#include "value.hpp"

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace qre {

// Turns the raw text of a capture into a typed value. A converter reports
// failure by throwing; the matcher wraps it into a ConversionError.
using Converter = std::function<Value(const std::string&)>;

// Default converter, returns the capture unchanged as a string
Value identity_converter(const std::string& raw);

struct TypeSpec {
    std::string name;
    std::string regex_fragment;   // never contains capturing groups
    Converter converter;
};

// Table of type name -> TypeSpec used by typed groups such as [age:int].
//
// TypeRegistry::global() is the process-wide instance used when no registry is
// passed explicitly; it is seeded with the built-in types. It is NOT thread-safe:
// registration must not race pattern compilation without external locking.
// Compilation only reads the registry while resolving type names, and keeps
// shared ownership of what it resolved, so re-registering a name never affects
// existing matchers.
class TypeRegistry {
public:
    TypeRegistry() = default;

    static TypeRegistry& global();
    static TypeRegistry with_builtins();

    // Insert or overwrite. Throws InvalidTypeError for a name that is not an
    // identifier or a fragment that is empty or rejected by RE2. Capturing
    // groups in the fragment are made non-capturing.
    void register_type(const std::string& name, const std::string& regex_fragment,
                       Converter converter = identity_converter);

    // Throws UnknownTypeError if the name is not registered
    std::shared_ptr<const TypeSpec> resolve(const std::string& name) const;

    bool contains(const std::string& name) const { return types_.count(name) != 0; }
    size_t size() const { return types_.size(); }
    std::vector<std::string> names() const;

private:
    std::unordered_map<std::string, std::shared_ptr<const TypeSpec>> types_;
};

// Seeds int, float, decimal, date, datetime, uuid, letters, identifier, email,
// url, ipv4, ipv6, creditcard, open and close
void register_builtin_types(TypeRegistry& registry);

// Built-in converters
Value convert_int(const std::string& raw);
Value convert_float(const std::string& raw);
Value convert_decimal(const std::string& raw);
Value convert_date(const std::string& raw);
Value convert_datetime(const std::string& raw);
Value convert_uuid(const std::string& raw);

bool is_identifier(const std::string& name);

} // namespace qre
