/**
 * @file re2_wrapper.hpp
 * @brief RE2 regex wrapper for qre pattern matching
 * @license MIT
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include <re2/re2.h>

namespace qre {

/**
 * Compile a regex source to a RE2 program.
 *
 * @param source Regex text produced by the pattern compiler
 * @param case_sensitive Whether matching respects letter case
 * @return Shared immutable program, safe for concurrent matching
 * @throws PatternError (ERR_INVALID_REGEX) if RE2 rejects the source
 */
std::shared_ptr<const re2::RE2> compile_regex(const std::string& source, bool case_sensitive);

/**
 * Run a compiled program over text starting at a byte offset.
 *
 * @param re Compiled program
 * @param text Input text
 * @param startpos Byte offset where matching starts
 * @param anchor RE2 anchoring mode
 * @param submatch Output, resized to 1 + number of capture groups.
 *        Entry 0 is the whole match; a group that did not participate has
 *        a null data() pointer.
 * @return true if the program matched
 */
bool regex_match_at(const re2::RE2& re, const std::string& text, size_t startpos,
                    re2::RE2::Anchor anchor, std::vector<re2::StringPiece>& submatch);

/**
 * Escape regex metacharacters in a literal string.
 *
 * @param regex Output regex text
 * @param text Literal to escape
 * @param flexible_spaces Emit " +" for each space so it matches a run of spaces
 */
void escape_regex_literal(std::string& regex, const std::string& text, bool flexible_spaces = false);

/**
 * Rewrite every capturing group "(" in a regex fragment to "(?:", leaving
 * escaped parens, parens inside character classes and "(?" constructs alone.
 */
std::string make_groups_non_capturing(const std::string& fragment);

/**
 * Check that a fragment compiles on its own and adds no capture groups.
 *
 * @param fragment Regex fragment, already passed through make_groups_non_capturing
 * @param error Output reason when the fragment is rejected
 * @return true if the fragment is usable inside a capture group
 */
bool validate_regex_fragment(const std::string& fragment, std::string* error);

} // namespace qre
