#include "match_result.hpp"
#include "qre_error.hpp"
#include "../lib/log.h"

#include <algorithm>
#include <exception>
#include <numeric>
#include <utility>

namespace qre {

namespace {

struct Replacement {
    size_t offset;
    size_t length;
    const std::string* text;
};

// spans are applied on the original text; a span overlapping an earlier one is skipped
std::string apply_replacements(const std::string& source, std::vector<Replacement> replacements) {
    std::stable_sort(replacements.begin(), replacements.end(),
        [](const Replacement& a, const Replacement& b) { return a.offset < b.offset; });

    std::string out;
    size_t previous_end = 0;
    for (const Replacement& r : replacements) {
        if (r.offset < previous_end) continue;
        out.append(source, previous_end, r.offset - previous_end);
        out += *r.text;
        previous_end = r.offset + r.length;
    }
    out.append(source, previous_end, std::string::npos);
    return out;
}

} // namespace

MatchResult assemble_match_result(const GroupTable& groups,
                                  const std::vector<CaptureSpan>& captures,
                                  std::shared_ptr<const std::string> source) {
    MatchResult result;
    result.matched_ = true;
    result.source_ = std::move(source);
    const std::string& text = *result.source_;

    std::vector<size_t> indices(groups.size());
    std::iota(indices.begin(), indices.end(), 0);
    std::stable_sort(indices.begin(), indices.end(),
        [&groups](size_t a, size_t b) { return groups[a].order < groups[b].order; });

    for (size_t i : indices) {
        const GroupTableEntry& entry = groups[i];
        const CaptureSpan& capture = captures.at(i);
        if (!capture.participated) {
            // named groups of the other branch are left out, unnamed ones keep their slot
            if (!entry.display_name) result.unnamed_.emplace_back();
            continue;
        }

        std::string raw = text.substr(capture.offset, capture.length);
        Value value;
        try {
            value = entry.converter(raw);
        } catch (const std::exception& e) {
            const std::string& group = entry.display_name ? *entry.display_name : entry.internal_id;
            log_error("assemble_match_result: converter for group '%s' failed on '%s': %s",
                      group.c_str(), raw.c_str(), e.what());
            throw ConversionError(group, raw, e.what());
        } catch (...) {
            const std::string& group = entry.display_name ? *entry.display_name : entry.internal_id;
            log_error("assemble_match_result: converter for group '%s' failed on '%s' with a non-standard exception",
                      group.c_str(), raw.c_str());
            throw ConversionError(group, raw, "unknown exception");
        }

        if (entry.display_name) {
            result.named_order_.push_back(*entry.display_name);
            result.named_[*entry.display_name] = std::move(value);
        } else {
            result.unnamed_.push_back(std::move(value));
        }
        result.spans_.push_back(GroupSpan{entry.display_name, capture.offset, capture.length});
    }
    return result;
}

const std::string& MatchResult::source() const {
    static const std::string empty;
    return source_ ? *source_ : empty;
}

std::vector<Value> MatchResult::all_values() const {
    std::vector<Value> values(unnamed_);
    for (const std::string& name : named_order_) values.push_back(named_.at(name));
    return values;
}

std::vector<MatchItem> MatchResult::all_items() const {
    std::vector<MatchItem> items;
    items.reserve(unnamed_.size() + named_order_.size());
    for (const Value& value : unnamed_) items.emplace_back(std::nullopt, value);
    for (const std::string& name : named_order_) items.emplace_back(name, named_.at(name));
    return items;
}

std::string MatchResult::replace(const std::vector<std::string>& values) const {
    if (values.empty()) throw ReplaceError("provide one or more replacement values");
    if (!matched_) throw ReplaceError("replace() can only be used on a successful match");

    std::vector<Replacement> replacements;
    for (size_t i = 0; i < spans_.size() && i < values.size(); i++) {
        replacements.push_back(Replacement{spans_[i].offset, spans_[i].length, &values[i]});
    }
    return apply_replacements(source(), std::move(replacements));
}

std::string MatchResult::replace(const std::map<std::string, std::string>& values) const {
    if (values.empty()) throw ReplaceError("provide one or more replacement values");
    if (!matched_) throw ReplaceError("replace() can only be used on a successful match");

    std::vector<Replacement> replacements;
    for (const GroupSpan& span : spans_) {
        if (!span.name) continue;
        auto it = values.find(*span.name);
        if (it != values.end()) replacements.push_back(Replacement{span.offset, span.length, &it->second});
    }
    return apply_replacements(source(), std::move(replacements));
}

void MatchResult::merge(const MatchResult& other) {
    if (!other.matched_) return;
    if (!matched_) source_ = other.source_;
    matched_ = true;
    for (const std::string& name : other.named_order_) {
        if (!named_.count(name)) named_order_.push_back(name);
        named_[name] = other.named_.at(name);
    }
    unnamed_.insert(unnamed_.end(), other.unnamed_.begin(), other.unnamed_.end());
    spans_.insert(spans_.end(), other.spans_.begin(), other.spans_.end());
}

// ============================================================================
// MatchResultList
// ============================================================================

void MatchResultList::append(const MatchResultList& other) {
    results_.insert(results_.end(), other.results_.begin(), other.results_.end());
}

std::vector<Value> MatchResultList::all_values() const {
    std::vector<Value> values;
    for (const MatchResult& result : results_) {
        std::vector<Value> part = result.all_values();
        values.insert(values.end(), part.begin(), part.end());
    }
    return values;
}

std::vector<MatchItem> MatchResultList::all_items() const {
    std::vector<MatchItem> items;
    for (const MatchResult& result : results_) {
        std::vector<MatchItem> part = result.all_items();
        items.insert(items.end(), part.begin(), part.end());
    }
    return items;
}

std::string MatchResultList::replace(const std::vector<std::string>& values) const {
    if (results_.empty()) throw ReplaceError("replace() can only be used on a successful match");
    if (values.empty()) throw ReplaceError("provide one or more replacement values");

    // every result of one search_all() call shares the same source text
    std::vector<Replacement> replacements;
    size_t next = 0;
    for (const MatchResult& result : results_) {
        for (const GroupSpan& span : result.spans()) {
            if (next >= values.size()) break;
            replacements.push_back(Replacement{span.offset, span.length, &values[next++]});
        }
    }
    return apply_replacements(results_.front().source(), std::move(replacements));
}

} // namespace qre
