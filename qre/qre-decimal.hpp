// ============================================================================
// qre/qre-decimal.hpp - Arbitrary precision decimal values for qre
// ============================================================================
// Decimal captures are parsed exactly (no rounding) with mpdecimal's maximum
// context. mpdecimal.h is only included in qre-decimal.cpp.
#pragma once

// Forward declarations for mpdecimal types
typedef struct mpd_t mpd_t;
typedef struct mpd_context_t mpd_context_t;

#include <string>

namespace qre {

// Shared read-only context used for parsing and comparison
const mpd_context_t* decimal_context();

class Decimal {
public:
    Decimal();
    ~Decimal();

    Decimal(const Decimal& other);
    Decimal& operator=(const Decimal& other);
    Decimal(Decimal&& other) noexcept;
    Decimal& operator=(Decimal&& other) noexcept;

    // Parse "123.45", "-.1", "+000123.4", "1E+3".
    // Throws std::invalid_argument on malformed text.
    static Decimal parse(const std::string& text);

    // Scientific string form, e.g. "-123.0", "1E+3"
    std::string to_string() const;
    double to_double() const;

    // <0, 0, >0. NaN compares unequal to everything.
    int compare(const Decimal& other) const;
    bool is_nan() const;

    bool operator==(const Decimal& other) const { return compare(other) == 0; }
    bool operator!=(const Decimal& other) const { return !(*this == other); }

private:
    mpd_t* value_;
};

} // namespace qre
