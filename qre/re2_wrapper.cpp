/**
 * @file re2_wrapper.cpp
 * @brief RE2 regex wrapper implementation for qre pattern matching
 * @license MIT
 */

#include "re2_wrapper.hpp"
#include "qre_error.hpp"
#include "../lib/log.h"

namespace qre {

// patterns with large width groups or the url/ipv6 types need more than the
// RE2 default program budget
static const int64_t QRE_RE2_MAX_MEM = 32 << 20;

static re2::RE2::Options regex_options(bool case_sensitive) {
    re2::RE2::Options options;
    options.set_log_errors(false);
    options.set_case_sensitive(case_sensitive);
    options.set_max_mem(QRE_RE2_MAX_MEM);
    // UTF8 is the default encoding
    return options;
}

std::shared_ptr<const re2::RE2> compile_regex(const std::string& source, bool case_sensitive) {
    auto re = std::make_shared<const re2::RE2>(source, regex_options(case_sensitive));
    if (!re->ok()) {
        log_error("compile_regex: RE2 rejected '%s': %s", source.c_str(), re->error().c_str());
        throw PatternError(ERR_INVALID_REGEX, "invalid regular expression (" + re->error() + ")",
                           re->error_arg(), 0);
    }
    log_debug("Compiled pattern regex: %s%s", source.c_str(), case_sensitive ? "" : " (ignore case)");
    return re;
}

bool regex_match_at(const re2::RE2& re, const std::string& text, size_t startpos,
                    re2::RE2::Anchor anchor, std::vector<re2::StringPiece>& submatch) {
    submatch.assign(1 + re.NumberOfCapturingGroups(), re2::StringPiece());
    if (startpos > text.size()) return false;
    re2::StringPiece input(text);
    return re.Match(input, startpos, text.size(), anchor, submatch.data(), (int)submatch.size());
}

// Escape regex metacharacters in a literal string
void escape_regex_literal(std::string& regex, const std::string& text, bool flexible_spaces) {
    for (char c : text) {
        // RE2 metacharacters that need escaping
        switch (c) {
        case '\\': case '.': case '+': case '*': case '?':
        case '(': case ')': case '[': case ']': case '{': case '}':
        case '|': case '^': case '$':
            regex += '\\';
            break;
        case ' ':
            if (flexible_spaces) {
                regex += " +";
                continue;
            }
            break;
        default:
            break;
        }
        regex += c;
    }
}

std::string make_groups_non_capturing(const std::string& fragment) {
    std::string out;
    out.reserve(fragment.size() + 8);
    size_t i = 0, len = fragment.size();
    while (i < len) {
        char c = fragment[i];
        if (c == '\\' && i + 1 < len) {
            out.append(fragment, i, 2);
            i += 2;
        } else if (c == '[') {
            // copy the whole character class; a leading ']' (after optional '^') is literal
            size_t j = i + 1;
            if (j < len && fragment[j] == '^') j++;
            if (j < len && fragment[j] == ']') j++;
            while (j < len && fragment[j] != ']') {
                j += (fragment[j] == '\\' && j + 1 < len) ? 2 : 1;
            }
            if (j < len) j++;
            out.append(fragment, i, j - i);
            i = j;
        } else if (c == '(' && (i + 1 >= len || fragment[i + 1] != '?')) {
            out += "(?:";
            i++;
        } else {
            out += c;
            i++;
        }
    }
    return out;
}

bool validate_regex_fragment(const std::string& fragment, std::string* error) {
    if (fragment.empty()) {
        if (error) *error = "empty regex fragment";
        return false;
    }
    // compile inside a group so a dangling '|' or ')' is caught in context
    re2::RE2 probe("(?:" + fragment + ")", regex_options(true));
    if (!probe.ok()) {
        if (error) *error = probe.error();
        return false;
    }
    if (probe.NumberOfCapturingGroups() > 0) {
        if (error) *error = "named capture groups are not allowed in a type fragment";
        return false;
    }
    return true;
}

} // namespace qre
