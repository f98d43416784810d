#pragma once

#include "matcher.hpp"

#include <string>
#include <vector>

namespace qre {

// Several patterns matched against the same text, results collected into one.
// Named values of later patterns overwrite earlier ones, unnamed values append.
// With strict set, every pattern must match or the failing result is returned.
class MultiMatcher {
public:
    explicit MultiMatcher(const std::vector<std::string>& patterns,
                          const MatcherOptions& options = MatcherOptions(), bool strict = false,
                          const TypeRegistry& registry = TypeRegistry::global());

    MatchResult match(const std::string& text) const;
    MatchResult match_start(const std::string& text) const;
    MatchResult match_end(const std::string& text) const;
    MatchResult search(const std::string& text) const;
    MatchResultList search_all(const std::string& text) const;

    const std::vector<Matcher>& matchers() const { return matchers_; }
    bool strict() const { return strict_; }

private:
    using MatchFn = MatchResult (Matcher::*)(const std::string&) const;
    MatchResult collect(MatchFn fn, const std::string& text) const;

    std::vector<Matcher> matchers_;
    bool strict_;
};

} // namespace qre
