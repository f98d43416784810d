#pragma once

#include "pattern_compiler.hpp"
#include "value.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace qre {

// Raw engine capture for one group table entry
struct CaptureSpan {
    size_t offset = 0;
    size_t length = 0;
    bool participated = false;  // false when the group sat in the other alternation branch
};

// Location of a participating group in the matched text, kept for replace()
struct GroupSpan {
    std::optional<std::string> name;
    size_t offset = 0;
    size_t length = 0;
};

using MatchItem = std::pair<std::optional<std::string>, Value>;

// Outcome of one match attempt. Both collections are always present; a failed
// match has matched() == false and empty collections.
class MatchResult {
public:
    using const_iterator = std::map<std::string, Value>::const_iterator;

    MatchResult() = default;
    static MatchResult no_match() { return MatchResult(); }

    bool matched() const { return matched_; }
    explicit operator bool() const { return matched_; }

    // named groups, by display name
    const std::map<std::string, Value>& named() const { return named_; }
    // unnamed groups, left to right; null for a group that did not participate
    const std::vector<Value>& unnamed() const { return unnamed_; }

    bool contains(const std::string& name) const { return named_.count(name) != 0; }
    // throws std::out_of_range for a missing name
    const Value& operator[](const std::string& name) const { return named_.at(name); }
    size_t size() const { return named_.size(); }
    bool empty() const { return named_.empty(); }
    const_iterator begin() const { return named_.begin(); }
    const_iterator end() const { return named_.end(); }

    // unnamed values first, then named values in pattern order
    std::vector<Value> all_values() const;
    // same order as all_values(); unnamed items have no key
    std::vector<MatchItem> all_items() const;

    // Replace matched groups, in order, with the given strings. Named and
    // unnamed groups are treated alike; extra groups keep their text.
    std::string replace(const std::vector<std::string>& values) const;
    // Replace named groups by name
    std::string replace(const std::map<std::string, std::string>& values) const;

    // matched text; every result of one search_all() call shares one copy
    const std::string& source() const;
    const std::shared_ptr<const std::string>& shared_source() const { return source_; }
    const std::vector<GroupSpan>& spans() const { return spans_; }

    // Fold another result over the same text into this one: named entries
    // overwrite, unnamed entries and spans append.
    void merge(const MatchResult& other);

    bool operator==(const MatchResult& other) const {
        return matched_ == other.matched_ && named_ == other.named_ && unnamed_ == other.unnamed_;
    }
    bool operator!=(const MatchResult& other) const { return !(*this == other); }

private:
    friend MatchResult assemble_match_result(const GroupTable& groups,
                                             const std::vector<CaptureSpan>& captures,
                                             std::shared_ptr<const std::string> source);

    bool matched_ = false;
    std::map<std::string, Value> named_;
    std::vector<std::string> named_order_;
    std::vector<Value> unnamed_;
    std::shared_ptr<const std::string> source_;
    std::vector<GroupSpan> spans_;
};

// Build a result from engine captures. captures[i] belongs to groups[i].
// A throwing converter is reported as ConversionError naming the group.
MatchResult assemble_match_result(const GroupTable& groups,
                                  const std::vector<CaptureSpan>& captures,
                                  std::shared_ptr<const std::string> source);

// All results of search_all(), left to right
class MatchResultList {
public:
    using const_iterator = std::vector<MatchResult>::const_iterator;

    MatchResultList() = default;
    explicit MatchResultList(std::vector<MatchResult> results) : results_(std::move(results)) {}

    void push_back(MatchResult result) { results_.push_back(std::move(result)); }
    void append(const MatchResultList& other);

    size_t size() const { return results_.size(); }
    bool empty() const { return results_.empty(); }
    explicit operator bool() const { return !results_.empty(); }
    const MatchResult& operator[](size_t i) const { return results_[i]; }
    const_iterator begin() const { return results_.begin(); }
    const_iterator end() const { return results_.end(); }

    std::vector<Value> all_values() const;
    std::vector<MatchItem> all_items() const;

    // Replacement values are consumed across results in match order
    std::string replace(const std::vector<std::string>& values) const;

private:
    std::vector<MatchResult> results_;
};

} // namespace qre
