#pragma once

#include "match_result.hpp"
#include "pattern_compiler.hpp"
#include "re2_wrapper.hpp"
#include "type_registry.hpp"

#include <memory>
#include <string>
#include <vector>

namespace qre {

// Compiled pattern ready for repeated matching.
//
// A Matcher is immutable after construction. Copies share the compiled pattern
// and RE2 programs, and any number of threads may call the match functions
// on the same Matcher concurrently.
class Matcher {
public:
    // Throws PatternError, UnknownTypeError or DuplicateGroupNameError
    explicit Matcher(const std::string& pattern, const MatcherOptions& options = MatcherOptions(),
                     const TypeRegistry& registry = TypeRegistry::global());
    explicit Matcher(std::shared_ptr<const CompiledPattern> compiled);

    // whole input
    MatchResult match(const std::string& text) const;
    // prefix of the input
    MatchResult match_start(const std::string& text) const;
    // suffix of the input
    MatchResult match_end(const std::string& text) const;
    // first occurrence anywhere
    MatchResult search(const std::string& text) const;
    // every non-overlapping occurrence, left to right
    MatchResultList search_all(const std::string& text) const;

    const std::string& pattern() const { return pattern_; }
    const std::string& regex() const { return compiled_->regex_source; }
    const GroupTable& groups() const { return compiled_->groups; }
    bool case_sensitive() const { return compiled_->case_sensitive; }
    const CompiledPattern& compiled() const { return *compiled_; }

private:
    void buildPrograms();
    MatchResult run(const re2::RE2& re, const std::string& text, re2::RE2::Anchor anchor) const;

    std::string pattern_;
    std::shared_ptr<const CompiledPattern> compiled_;
    std::shared_ptr<const re2::RE2> regex_;        // pattern as compiled
    std::shared_ptr<const re2::RE2> end_regex_;    // (?:pattern)$ for match_end
    std::vector<int> capture_index_;               // RE2 submatch index per group entry
};

} // namespace qre
