#include "multi_matcher.hpp"
#include "qre_error.hpp"

namespace qre {

MultiMatcher::MultiMatcher(const std::vector<std::string>& patterns, const MatcherOptions& options,
                           bool strict, const TypeRegistry& registry)
    : strict_(strict) {
    if (patterns.empty()) throw Error(ERR_PATTERN_SYNTAX, "at least one pattern is required");
    matchers_.reserve(patterns.size());
    for (const std::string& pattern : patterns) {
        matchers_.emplace_back(pattern, options, registry);
    }
}

MatchResult MultiMatcher::collect(MatchFn fn, const std::string& text) const {
    MatchResult result = (matchers_[0].*fn)(text);
    if (!result && strict_) return result;
    for (size_t i = 1; i < matchers_.size(); i++) {
        MatchResult sub = (matchers_[i].*fn)(text);
        if (sub) {
            result.merge(sub);
        } else if (strict_) {
            return sub;
        }
    }
    return result;
}

MatchResult MultiMatcher::match(const std::string& text) const {
    return collect(&Matcher::match, text);
}

MatchResult MultiMatcher::match_start(const std::string& text) const {
    return collect(&Matcher::match_start, text);
}

MatchResult MultiMatcher::match_end(const std::string& text) const {
    return collect(&Matcher::match_end, text);
}

MatchResult MultiMatcher::search(const std::string& text) const {
    return collect(&Matcher::search, text);
}

MatchResultList MultiMatcher::search_all(const std::string& text) const {
    MatchResultList results;
    for (const Matcher& matcher : matchers_) {
        MatchResultList sub = matcher.search_all(text);
        if (sub.empty() && strict_) return MatchResultList();
        results.append(sub);
    }
    return results;
}

} // namespace qre
