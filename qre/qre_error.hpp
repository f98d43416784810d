/**
 * @file qre_error.hpp
 * @brief qre error codes and exception types
 *
 * Every failure raised by the library is a qre::Error carrying a numeric
 * error code. Codes are grouped in ranges the same way for all modules.
 */

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace qre {

// ============================================================================
// Error Code Ranges
// ============================================================================

#define QRE_ERR_SYNTAX_BASE    100
#define QRE_ERR_SEMANTIC_BASE  200
#define QRE_ERR_RUNTIME_BASE   300

#define QRE_ERR_IS_SYNTAX(code)    ((code) >= 100 && (code) < 200)
#define QRE_ERR_IS_SEMANTIC(code)  ((code) >= 200 && (code) < 300)
#define QRE_ERR_IS_RUNTIME(code)   ((code) >= 300 && (code) < 400)

// ============================================================================
// Error Codes
// ============================================================================

enum QreErrorCode {
    ERR_OK = 0,

    // 1xx - pattern syntax
    ERR_PATTERN_SYNTAX = 100,         // generic pattern syntax error
    ERR_UNTERMINATED_GROUP = 101,     // `[` without a closing `]`
    ERR_DUPLICATE_ALTERNATION = 102,  // more than one top-level `|`
    ERR_INVALID_GROUP_NAME = 103,     // group name is not an identifier
    ERR_INVALID_REGEX = 104,          // generated regex rejected by RE2

    // 2xx - semantic / compilation
    ERR_SEMANTIC_ERROR = 200,         // generic semantic error
    ERR_UNKNOWN_TYPE = 201,           // type name not in the registry
    ERR_DUPLICATE_GROUP_NAME = 202,   // explicit group name used twice
    ERR_INVALID_TYPE = 203,           // bad type registration arguments

    // 3xx - runtime
    ERR_RUNTIME_ERROR = 300,          // generic runtime error
    ERR_CONVERSION_FAILED = 301,      // converter failed on a capture
    ERR_INVALID_REPLACEMENT = 302,    // replace() misuse
};

const char* err_code_name(QreErrorCode code);
const char* err_code_message(QreErrorCode code);
const char* err_category_name(QreErrorCode code);

// ============================================================================
// Exceptions
// ============================================================================

class Error : public std::runtime_error {
public:
    Error(QreErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    QreErrorCode code() const { return code_; }

private:
    QreErrorCode code_;
};

// Malformed pattern text. position is the byte offset of the offending
// substring in the pattern.
class PatternError : public Error {
public:
    PatternError(QreErrorCode code, const std::string& message,
                 const std::string& fragment, size_t position);

    const std::string& fragment() const { return fragment_; }
    size_t position() const { return position_; }

private:
    std::string fragment_;
    size_t position_;
};

class UnknownTypeError : public PatternError {
public:
    UnknownTypeError(const std::string& type_name, size_t position = 0);

    const std::string& type_name() const { return type_name_; }

private:
    std::string type_name_;
};

class DuplicateGroupNameError : public Error {
public:
    explicit DuplicateGroupNameError(const std::string& group_name);

    const std::string& group_name() const { return group_name_; }

private:
    std::string group_name_;
};

class InvalidTypeError : public Error {
public:
    InvalidTypeError(const std::string& type_name, const std::string& reason);

    const std::string& type_name() const { return type_name_; }

private:
    std::string type_name_;
};

class ConversionError : public Error {
public:
    ConversionError(const std::string& group, const std::string& raw, const std::string& reason);

    const std::string& group() const { return group_; }
    const std::string& raw() const { return raw_; }

private:
    std::string group_;
    std::string raw_;
};

class ReplaceError : public Error {
public:
    explicit ReplaceError(const std::string& message)
        : Error(ERR_INVALID_REPLACEMENT, message) {}
};

} // namespace qre
