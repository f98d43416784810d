/**
 * @file qre_error.cpp
 * @brief qre error code lookup and exception construction
 */

#include "qre_error.hpp"

namespace qre {

// ============================================================================
// Error Code Name Lookup
// ============================================================================

const char* err_code_name(QreErrorCode code) {
    switch (code) {
    case ERR_OK:                    return "OK";
    case ERR_PATTERN_SYNTAX:        return "PATTERN_SYNTAX";
    case ERR_UNTERMINATED_GROUP:    return "UNTERMINATED_GROUP";
    case ERR_DUPLICATE_ALTERNATION: return "DUPLICATE_ALTERNATION";
    case ERR_INVALID_GROUP_NAME:    return "INVALID_GROUP_NAME";
    case ERR_INVALID_REGEX:         return "INVALID_REGEX";
    case ERR_SEMANTIC_ERROR:        return "SEMANTIC_ERROR";
    case ERR_UNKNOWN_TYPE:          return "UNKNOWN_TYPE";
    case ERR_DUPLICATE_GROUP_NAME:  return "DUPLICATE_GROUP_NAME";
    case ERR_INVALID_TYPE:          return "INVALID_TYPE";
    case ERR_RUNTIME_ERROR:         return "RUNTIME_ERROR";
    case ERR_CONVERSION_FAILED:     return "CONVERSION_FAILED";
    case ERR_INVALID_REPLACEMENT:   return "INVALID_REPLACEMENT";
    }
    return "UNKNOWN";
}

const char* err_code_message(QreErrorCode code) {
    switch (code) {
    case ERR_OK:                    return "no error";
    case ERR_PATTERN_SYNTAX:        return "pattern syntax error";
    case ERR_UNTERMINATED_GROUP:    return "unterminated group";
    case ERR_DUPLICATE_ALTERNATION: return "only one top-level '|' is allowed";
    case ERR_INVALID_GROUP_NAME:    return "group name must contain only letters, digits and '_'";
    case ERR_INVALID_REGEX:         return "generated regular expression is invalid";
    case ERR_SEMANTIC_ERROR:        return "semantic error";
    case ERR_UNKNOWN_TYPE:          return "unknown type";
    case ERR_DUPLICATE_GROUP_NAME:  return "duplicate group name";
    case ERR_INVALID_TYPE:          return "invalid type registration";
    case ERR_RUNTIME_ERROR:         return "runtime error";
    case ERR_CONVERSION_FAILED:     return "value conversion failed";
    case ERR_INVALID_REPLACEMENT:   return "invalid replacement";
    }
    return "unknown error";
}

const char* err_category_name(QreErrorCode code) {
    if (code == ERR_OK) return "ok";
    if (QRE_ERR_IS_SYNTAX(code)) return "syntax";
    if (QRE_ERR_IS_SEMANTIC(code)) return "semantic";
    if (QRE_ERR_IS_RUNTIME(code)) return "runtime";
    return "unknown";
}

// ============================================================================
// Exceptions
// ============================================================================

PatternError::PatternError(QreErrorCode code, const std::string& message,
                           const std::string& fragment, size_t position)
    : Error(code, message + " at offset " + std::to_string(position) + ": '" + fragment + "'"),
      fragment_(fragment), position_(position) {}

UnknownTypeError::UnknownTypeError(const std::string& type_name, size_t position)
    : PatternError(ERR_UNKNOWN_TYPE, "unknown type '" + type_name + "'", type_name, position),
      type_name_(type_name) {}

DuplicateGroupNameError::DuplicateGroupNameError(const std::string& group_name)
    : Error(ERR_DUPLICATE_GROUP_NAME, "group name '" + group_name + "' is used more than once"),
      group_name_(group_name) {}

InvalidTypeError::InvalidTypeError(const std::string& type_name, const std::string& reason)
    : Error(ERR_INVALID_TYPE, "cannot register type '" + type_name + "': " + reason),
      type_name_(type_name) {}

ConversionError::ConversionError(const std::string& group, const std::string& raw,
                                 const std::string& reason)
    : Error(ERR_CONVERSION_FAILED,
            "cannot convert group '" + group + "' value '" + raw + "': " + reason),
      group_(group), raw_(raw) {}

} // namespace qre
