#pragma once

#include "pattern_parser.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace qre {

struct MatcherOptions {
    bool case_sensitive = true;
    bool flexible_spaces = false;   // a literal space matches one or more spaces
};

struct GroupTableEntry {
    std::string internal_id;                    // RE2 capture name
    std::optional<std::string> display_name;    // absent for unnamed groups
    Converter converter;
    int order = 0;                              // left-to-right position in the pattern
};

using GroupTable = std::vector<GroupTableEntry>;

// Immutable result of compiling a pattern
struct CompiledPattern {
    std::string regex_source;
    GroupTable groups;
    bool case_sensitive = true;
};

// Translate segments (one or two branches) into a regex and its group table.
// Throws DuplicateGroupNameError when an explicit name appears twice.
std::shared_ptr<const CompiledPattern> compile_segments(const std::vector<Segment>& segments,
                                                        const MatcherOptions& options);

// parse_pattern + compile_segments
std::shared_ptr<const CompiledPattern> compile_pattern(const std::string& pattern,
                                                       const MatcherOptions& options,
                                                       const TypeRegistry& registry);

} // namespace qre
