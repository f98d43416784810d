/**
 * @file qre.hpp
 * @brief qre - readable patterns compiled to regular expressions
 *
 * Pattern syntax summary
 *
 * Wildcards:
 *   *   any character, 0+ times
 *   +   any character, exactly once
 *   ?   any character, 0-1 times
 *
 * Alternation:
 *   |   splits the whole pattern into two alternatives (one per pattern)
 *
 * Groups:
 *   [name]                 named group, returned in MatchResult::named()
 *   []                     unnamed group, returned in MatchResult::unnamed()
 *   [name:4], [:4]         group exactly 4 characters wide
 *   [name:int], [:int]     group matching a registered type, converted to its value
 *
 * Escaping:
 *   [*], [+], [?], [|]     literal symbol, not a wildcard
 *   [[, ]]                 literal brackets, not groups
 */

#pragma once

#include "matcher.hpp"
#include "match_result.hpp"
#include "multi_matcher.hpp"
#include "qre_error.hpp"
#include "type_registry.hpp"
#include "value.hpp"

#include <string>

namespace qre {

// One-shot helpers; each builds a temporary Matcher on the global registry.
MatchResult match(const std::string& pattern, const std::string& text, bool case_sensitive = true);
MatchResult match_start(const std::string& pattern, const std::string& text, bool case_sensitive = true);
MatchResult match_end(const std::string& pattern, const std::string& text, bool case_sensitive = true);
MatchResult search(const std::string& pattern, const std::string& text, bool case_sensitive = true);
MatchResultList search_all(const std::string& pattern, const std::string& text, bool case_sensitive = true);

// Regex source the pattern compiles to
std::string to_regex(const std::string& pattern);

// Register a type on the process-wide registry. Not thread-safe: do it before
// compiling patterns that use the type, or guard it with your own lock.
void register_type(const std::string& name, const std::string& regex_fragment,
                   Converter converter = identity_converter);

} // namespace qre
