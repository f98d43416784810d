#include "matcher.hpp"
#include "qre_error.hpp"
#include "../lib/log.h"

#include <memory>
#include <utility>

namespace qre {

// byte length of the UTF-8 sequence starting with lead
static size_t utf8_char_len(unsigned char lead) {
    if (lead < 0x80) return 1;
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 1;  // stray continuation byte
}

Matcher::Matcher(const std::string& pattern, const MatcherOptions& options, const TypeRegistry& registry)
    : pattern_(pattern), compiled_(compile_pattern(pattern, options, registry)) {
    buildPrograms();
}

Matcher::Matcher(std::shared_ptr<const CompiledPattern> compiled)
    : compiled_(std::move(compiled)) {
    if (!compiled_) throw Error(ERR_INVALID_REGEX, "Matcher requires a compiled pattern");
    buildPrograms();
}

void Matcher::buildPrograms() {
    const std::string& source = compiled_->regex_source;
    regex_ = compile_regex(source, compiled_->case_sensitive);
    end_regex_ = compile_regex("(?:" + source + ")$", compiled_->case_sensitive);

    const std::map<std::string, int>& names = regex_->NamedCapturingGroups();
    capture_index_.clear();
    for (const GroupTableEntry& entry : compiled_->groups) {
        auto it = names.find(entry.internal_id);
        if (it == names.end()) {
            log_error("Matcher: capture '%s' missing from regex %s", entry.internal_id.c_str(), source.c_str());
            throw PatternError(ERR_INVALID_REGEX, "capture group missing from compiled regex",
                               entry.internal_id, 0);
        }
        capture_index_.push_back(it->second);
    }
}

MatchResult Matcher::run(const re2::RE2& re, const std::string& text, re2::RE2::Anchor anchor) const {
    std::vector<re2::StringPiece> submatch;
    if (!regex_match_at(re, text, 0, anchor, submatch)) return MatchResult::no_match();

    std::vector<CaptureSpan> captures(capture_index_.size());
    for (size_t i = 0; i < capture_index_.size(); i++) {
        const re2::StringPiece& sp = submatch[capture_index_[i]];
        if (sp.data() == nullptr) continue;
        captures[i].participated = true;
        captures[i].offset = (size_t)(sp.data() - text.data());
        captures[i].length = sp.size();
    }
    return assemble_match_result(compiled_->groups, captures, std::make_shared<const std::string>(text));
}

MatchResult Matcher::match(const std::string& text) const {
    return run(*regex_, text, re2::RE2::ANCHOR_BOTH);
}

MatchResult Matcher::match_start(const std::string& text) const {
    return run(*regex_, text, re2::RE2::ANCHOR_START);
}

MatchResult Matcher::match_end(const std::string& text) const {
    return run(*end_regex_, text, re2::RE2::UNANCHORED);
}

MatchResult Matcher::search(const std::string& text) const {
    return run(*regex_, text, re2::RE2::UNANCHORED);
}

MatchResultList Matcher::search_all(const std::string& text) const {
    MatchResultList results;
    std::shared_ptr<const std::string> source;  // created on the first hit, shared by all results
    std::vector<re2::StringPiece> submatch;
    std::vector<CaptureSpan> captures(capture_index_.size());
    size_t pos = 0;
    while (pos <= text.size()) {
        if (!regex_match_at(*regex_, text, pos, re2::RE2::UNANCHORED, submatch)) break;

        for (size_t i = 0; i < capture_index_.size(); i++) {
            const re2::StringPiece& sp = submatch[capture_index_[i]];
            captures[i] = CaptureSpan();
            if (sp.data() == nullptr) continue;
            captures[i].participated = true;
            captures[i].offset = (size_t)(sp.data() - text.data());
            captures[i].length = sp.size();
        }
        if (!source) source = std::make_shared<const std::string>(text);
        results.push_back(assemble_match_result(compiled_->groups, captures, source));

        size_t start = (size_t)(submatch[0].data() - text.data());
        size_t end = start + submatch[0].size();
        if (end > start) {
            pos = end;
        } else {
            // empty match: step over one character so the scan always advances
            if (end >= text.size()) break;
            pos = end + utf8_char_len((unsigned char)text[end]);
        }
    }
    log_debug("search_all: %zu matches of %s", results.size(), compiled_->regex_source.c_str());
    return results;
}

} // namespace qre
