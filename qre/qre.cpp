#include "qre.hpp"

#include <utility>

namespace qre {

static MatcherOptions facade_options(bool case_sensitive) {
    MatcherOptions options;
    options.case_sensitive = case_sensitive;
    return options;
}

MatchResult match(const std::string& pattern, const std::string& text, bool case_sensitive) {
    return Matcher(pattern, facade_options(case_sensitive)).match(text);
}

MatchResult match_start(const std::string& pattern, const std::string& text, bool case_sensitive) {
    return Matcher(pattern, facade_options(case_sensitive)).match_start(text);
}

MatchResult match_end(const std::string& pattern, const std::string& text, bool case_sensitive) {
    return Matcher(pattern, facade_options(case_sensitive)).match_end(text);
}

MatchResult search(const std::string& pattern, const std::string& text, bool case_sensitive) {
    return Matcher(pattern, facade_options(case_sensitive)).search(text);
}

MatchResultList search_all(const std::string& pattern, const std::string& text, bool case_sensitive) {
    return Matcher(pattern, facade_options(case_sensitive)).search_all(text);
}

std::string to_regex(const std::string& pattern) {
    return compile_pattern(pattern, MatcherOptions(), TypeRegistry::global())->regex_source;
}

void register_type(const std::string& name, const std::string& regex_fragment, Converter converter) {
    TypeRegistry::global().register_type(name, regex_fragment, std::move(converter));
}

} // namespace qre
