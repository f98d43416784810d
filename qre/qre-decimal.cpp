// ============================================================================
// qre/qre-decimal.cpp - mpdecimal backed Decimal value
// ============================================================================

#include "qre-decimal.hpp"
#include "../lib/log.h"

#include <mpdecimal.h>

#include <charconv>
#include <climits>
#include <cmath>
#include <limits>
#include <new>
#include <stdexcept>
#include <utility>

namespace qre {

const mpd_context_t* decimal_context() {
    // maximum context: string conversion is exact, never rounded
    static const mpd_context_t ctx = [] {
        mpd_context_t c;
        mpd_maxcontext(&c);
        return c;
    }();
    return &ctx;
}

static mpd_t* decimal_new_or_throw() {
    mpd_t* value = mpd_qnew();
    if (!value) throw std::bad_alloc();
    return value;
}

Decimal::Decimal() : value_(decimal_new_or_throw()) {
    uint32_t status = 0;
    mpd_qset_string(value_, "0", decimal_context(), &status);
}

Decimal::~Decimal() {
    if (value_) mpd_del(value_);
}

// a moved-from source copies as NaN, the state it already reports
Decimal::Decimal(const Decimal& other) : value_(decimal_new_or_throw()) {
    uint32_t status = 0;
    if (!other.value_) {
        mpd_qset_string(value_, "NaN", decimal_context(), &status);
    } else if (!mpd_qcopy(value_, other.value_, &status)) {
        mpd_del(value_);
        throw std::bad_alloc();
    }
}

Decimal& Decimal::operator=(const Decimal& other) {
    if (this != &other) {
        Decimal copy(other);
        std::swap(value_, copy.value_);
    }
    return *this;
}

Decimal::Decimal(Decimal&& other) noexcept : value_(other.value_) {
    other.value_ = nullptr;
}

Decimal& Decimal::operator=(Decimal&& other) noexcept {
    std::swap(value_, other.value_);
    return *this;
}

Decimal Decimal::parse(const std::string& text) {
    Decimal result;
    uint32_t status = 0;
    mpd_qset_string(result.value_, text.c_str(), decimal_context(), &status);
    if (status & MPD_Conversion_syntax) {
        log_debug("decimal_parse: invalid decimal literal '%s'", text.c_str());
        throw std::invalid_argument("invalid decimal literal '" + text + "'");
    }
    if (status & MPD_Malloc_error) throw std::bad_alloc();
    return result;
}

std::string Decimal::to_string() const {
    if (!value_) return "NaN";
    char* s = mpd_to_sci(value_, 1);
    if (!s) throw std::bad_alloc();
    std::string result(s);
    mpd_free(s);
    return result;
}

double Decimal::to_double() const {
    if (is_nan()) return std::numeric_limits<double>::quiet_NaN();
    std::string text = to_string();
    double v = 0;
    std::from_chars_result r = std::from_chars(text.data(), text.data() + text.size(), v);
    if (r.ec == std::errc::result_out_of_range) {
        // magnitude beyond double: saturate like strtod
        if (mpd_isnegative(value_)) return mpd_adjexp(value_) > 0 ? -HUGE_VAL : -0.0;
        return mpd_adjexp(value_) > 0 ? HUGE_VAL : 0.0;
    }
    return v;
}

bool Decimal::is_nan() const {
    return !value_ || mpd_isnan(value_);
}

int Decimal::compare(const Decimal& other) const {
    if (is_nan() || other.is_nan()) return INT_MAX;
    uint32_t status = 0;
    return mpd_qcmp(value_, other.value_, &status);
}

} // namespace qre
