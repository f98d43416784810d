#pragma once

#include "type_registry.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace qre {

enum class SegmentKind {
    Literal,            // text matched verbatim
    WildcardAny,        // *  any character, 0+ times
    WildcardOne,        // +  any character, exactly once
    WildcardMaybe,      // ?  any character, 0-1 times
    Group,              // [name:constraint]
    AlternationSplit    // top-level |
};

enum class ConstraintKind {
    None,
    Width,
    Type
};

struct GroupConstraint {
    ConstraintKind kind = ConstraintKind::None;
    size_t width = 0;
    std::shared_ptr<const TypeSpec> type;
};

struct Segment {
    SegmentKind kind = SegmentKind::Literal;
    std::string text;               // literal text; raw constraint text for groups
    std::string name;               // group name, empty for unnamed groups
    GroupConstraint constraint;     // filled by resolve_segments()
    size_t position = 0;            // byte offset in the pattern

    bool is_named_group() const { return kind == SegmentKind::Group && !name.empty(); }
};

const char* segment_kind_name(SegmentKind kind);

// Tokenizing pass. Escapes are folded into literal runs, groups keep their
// constraint text unresolved. Throws PatternError on malformed syntax.
std::vector<Segment> tokenize_pattern(const std::string& pattern);

// Resolution pass. Digits become a Width constraint, anything else is looked
// up in the registry. Throws UnknownTypeError.
void resolve_segments(std::vector<Segment>& segments, const TypeRegistry& registry);

// tokenize_pattern + resolve_segments
std::vector<Segment> parse_pattern(const std::string& pattern, const TypeRegistry& registry);

// One branch, or two if the pattern has a top-level alternation
std::vector<std::vector<Segment>> split_branches(const std::vector<Segment>& segments);

} // namespace qre
