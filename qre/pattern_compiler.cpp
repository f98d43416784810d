#include "pattern_compiler.hpp"
#include "qre_error.hpp"
#include "re2_wrapper.hpp"
#include "../lib/log.h"

#include <unordered_set>

namespace qre {

namespace {

class PatternCompiler {
public:
    PatternCompiler(const std::vector<Segment>& segments, const MatcherOptions& options)
        : segments_(segments), options_(options) {}

    std::shared_ptr<const CompiledPattern> run();

private:
    void collectNames();
    std::string nextUnnamedId();
    void compileBranch(std::string& regex, const std::vector<Segment>& branch);
    void compileGroup(std::string& regex, const Segment& seg);

    const std::vector<Segment>& segments_;
    const MatcherOptions& options_;
    std::unordered_set<std::string> used_ids_;
    int unnamed_counter_ = 0;
    GroupTable groups_;
};

void PatternCompiler::collectNames() {
    for (const Segment& seg : segments_) {
        if (!seg.is_named_group()) continue;
        if (!used_ids_.insert(seg.name).second) {
            log_error("compile_segments: duplicate group name '%s'", seg.name.c_str());
            throw DuplicateGroupNameError(seg.name);
        }
    }
}

// synthesized ids skip anything a user name already took
std::string PatternCompiler::nextUnnamedId() {
    std::string id;
    do {
        id = "_" + std::to_string(unnamed_counter_++);
    } while (used_ids_.count(id));
    used_ids_.insert(id);
    return id;
}

void PatternCompiler::compileGroup(std::string& regex, const Segment& seg) {
    GroupTableEntry entry;
    if (seg.name.empty()) {
        entry.internal_id = nextUnnamedId();
    } else {
        entry.internal_id = seg.name;
        entry.display_name = seg.name;
    }
    entry.converter = identity_converter;
    entry.order = (int)groups_.size();

    regex += "(?P<";
    regex += entry.internal_id;
    regex += '>';
    switch (seg.constraint.kind) {
    case ConstraintKind::None:
        regex += ".*";
        break;
    case ConstraintKind::Width:
        regex += ".{";
        regex += std::to_string(seg.constraint.width);
        regex += '}';
        break;
    case ConstraintKind::Type:
        regex += seg.constraint.type->regex_fragment;
        entry.converter = seg.constraint.type->converter;
        break;
    }
    regex += ')';
    groups_.push_back(std::move(entry));
}

void PatternCompiler::compileBranch(std::string& regex, const std::vector<Segment>& branch) {
    for (const Segment& seg : branch) {
        switch (seg.kind) {
        case SegmentKind::Literal:
            escape_regex_literal(regex, seg.text, options_.flexible_spaces);
            break;
        case SegmentKind::WildcardAny:
            regex += ".*";
            break;
        case SegmentKind::WildcardOne:
            regex += '.';
            break;
        case SegmentKind::WildcardMaybe:
            regex += ".?";
            break;
        case SegmentKind::Group:
            compileGroup(regex, seg);
            break;
        case SegmentKind::AlternationSplit:
            // removed by split_branches
            break;
        }
    }
}

std::shared_ptr<const CompiledPattern> PatternCompiler::run() {
    collectNames();

    std::vector<std::vector<Segment>> branches = split_branches(segments_);
    std::string regex;
    if (branches.size() == 1) {
        compileBranch(regex, branches[0]);
    } else {
        // the split always covers the whole pattern: (?:left)|(?:right)
        for (size_t i = 0; i < branches.size(); i++) {
            if (i) regex += '|';
            regex += "(?:";
            compileBranch(regex, branches[i]);
            regex += ')';
        }
    }

    auto compiled = std::make_shared<CompiledPattern>();
    compiled->regex_source = std::move(regex);
    compiled->groups = std::move(groups_);
    compiled->case_sensitive = options_.case_sensitive;
    log_debug("compile_segments: %zu segments, %zu groups -> %s", segments_.size(),
              compiled->groups.size(), compiled->regex_source.c_str());
    return compiled;
}

} // namespace

std::shared_ptr<const CompiledPattern> compile_segments(const std::vector<Segment>& segments,
                                                        const MatcherOptions& options) {
    return PatternCompiler(segments, options).run();
}

std::shared_ptr<const CompiledPattern> compile_pattern(const std::string& pattern,
                                                       const MatcherOptions& options,
                                                       const TypeRegistry& registry) {
    return compile_segments(parse_pattern(pattern, registry), options);
}

} // namespace qre
