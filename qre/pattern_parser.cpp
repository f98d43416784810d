#include "pattern_parser.hpp"
#include "qre_error.hpp"
#include "../lib/log.h"

#include <cstring>

namespace qre {

// widths longer than this many digits cannot be a sensible repeat count
#define QRE_MAX_WIDTH_DIGITS 9

const char* segment_kind_name(SegmentKind kind) {
    switch (kind) {
    case SegmentKind::Literal:          return "literal";
    case SegmentKind::WildcardAny:      return "wildcard_any";
    case SegmentKind::WildcardOne:      return "wildcard_one";
    case SegmentKind::WildcardMaybe:    return "wildcard_maybe";
    case SegmentKind::Group:            return "group";
    case SegmentKind::AlternationSplit: return "alternation";
    }
    return "unknown";
}

namespace {

class PatternTokenizer {
public:
    explicit PatternTokenizer(const std::string& pattern) : pattern_(pattern) {}

    std::vector<Segment> run();

private:
    void appendLiteral(const char* text, size_t len, size_t position);
    void flushLiteral();
    void addSegment(SegmentKind kind, size_t position);
    void scanGroup();

    const std::string& pattern_;
    size_t pos_ = 0;
    std::vector<Segment> segments_;
    std::string literal_;
    size_t literal_pos_ = 0;
    bool seen_split_ = false;
};

void PatternTokenizer::appendLiteral(const char* text, size_t len, size_t position) {
    if (literal_.empty()) literal_pos_ = position;
    literal_.append(text, len);
}

void PatternTokenizer::flushLiteral() {
    if (literal_.empty()) return;
    Segment seg;
    seg.kind = SegmentKind::Literal;
    seg.text = std::move(literal_);
    seg.position = literal_pos_;
    segments_.push_back(std::move(seg));
    literal_.clear();
}

void PatternTokenizer::addSegment(SegmentKind kind, size_t position) {
    flushLiteral();
    Segment seg;
    seg.kind = kind;
    seg.position = position;
    segments_.push_back(std::move(seg));
}

// [name], [], [name:4], [:int]; spaces inside the brackets are ignored
void PatternTokenizer::scanGroup() {
    size_t open = pos_;
    size_t close = open + 1;
    while (close < pattern_.size() && pattern_[close] != ']' && pattern_[close] != '[') {
        close++;
    }
    if (close >= pattern_.size() || pattern_[close] == '[') {
        log_debug("tokenize_pattern: unterminated group at %zu in '%s'", open, pattern_.c_str());
        throw PatternError(ERR_UNTERMINATED_GROUP, "unterminated group",
                           pattern_.substr(open, close - open), open);
    }

    std::string content;
    for (size_t i = open + 1; i < close; i++) {
        if (pattern_[i] != ' ') content += pattern_[i];
    }

    Segment seg;
    seg.kind = SegmentKind::Group;
    seg.position = open;
    size_t colon = content.find(':');
    if (colon == std::string::npos) {
        seg.name = content;
    } else {
        seg.name = content.substr(0, colon);
        seg.text = content.substr(colon + 1);
        if (seg.text.empty()) {
            throw PatternError(ERR_PATTERN_SYNTAX, "missing constraint after ':'",
                               pattern_.substr(open, close - open + 1), open);
        }
    }
    if (!seg.name.empty() && !is_identifier(seg.name)) {
        throw PatternError(ERR_INVALID_GROUP_NAME, err_code_message(ERR_INVALID_GROUP_NAME),
                           pattern_.substr(open, close - open + 1), open);
    }

    flushLiteral();
    segments_.push_back(std::move(seg));
    pos_ = close + 1;
}

std::vector<Segment> PatternTokenizer::run() {
    const size_t len = pattern_.size();
    while (pos_ < len) {
        char c = pattern_[pos_];
        switch (c) {
        case '[':
            if (pos_ + 1 < len && pattern_[pos_ + 1] == '[') {
                // [[ -> literal [
                appendLiteral("[", 1, pos_);
                pos_ += 2;
            } else if (pos_ + 2 < len && pattern_[pos_ + 2] == ']' && pattern_[pos_ + 1] != '\0' &&
                       strchr("*+?|", pattern_[pos_ + 1])) {
                // [*] [+] [?] [|] -> literal symbol
                appendLiteral(&pattern_[pos_ + 1], 1, pos_);
                pos_ += 3;
            } else {
                scanGroup();
            }
            break;
        case ']':
            // ]] -> literal ], a lone ] is literal too
            appendLiteral("]", 1, pos_);
            pos_ += (pos_ + 1 < len && pattern_[pos_ + 1] == ']') ? 2 : 1;
            break;
        case '*':
            addSegment(SegmentKind::WildcardAny, pos_++);
            break;
        case '+':
            addSegment(SegmentKind::WildcardOne, pos_++);
            break;
        case '?':
            addSegment(SegmentKind::WildcardMaybe, pos_++);
            break;
        case '|':
            if (seen_split_) {
                throw PatternError(ERR_DUPLICATE_ALTERNATION, err_code_message(ERR_DUPLICATE_ALTERNATION),
                                   "|", pos_);
            }
            seen_split_ = true;
            addSegment(SegmentKind::AlternationSplit, pos_++);
            break;
        default:
            appendLiteral(&pattern_[pos_], 1, pos_);
            pos_++;
            break;
        }
    }
    flushLiteral();
    return std::move(segments_);
}

bool all_digits(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
    }
    return true;
}

} // namespace

std::vector<Segment> tokenize_pattern(const std::string& pattern) {
    return PatternTokenizer(pattern).run();
}

void resolve_segments(std::vector<Segment>& segments, const TypeRegistry& registry) {
    for (Segment& seg : segments) {
        if (seg.kind != SegmentKind::Group) continue;
        GroupConstraint& constraint = seg.constraint;
        if (seg.text.empty()) {
            constraint.kind = ConstraintKind::None;
        } else if (all_digits(seg.text)) {
            if (seg.text.size() > QRE_MAX_WIDTH_DIGITS) {
                throw PatternError(ERR_PATTERN_SYNTAX, "group width too large", seg.text, seg.position);
            }
            constraint.kind = ConstraintKind::Width;
            constraint.width = std::stoul(seg.text);
        } else {
            try {
                constraint.type = registry.resolve(seg.text);
            } catch (const UnknownTypeError&) {
                throw UnknownTypeError(seg.text, seg.position);
            }
            constraint.kind = ConstraintKind::Type;
        }
    }
}

std::vector<Segment> parse_pattern(const std::string& pattern, const TypeRegistry& registry) {
    std::vector<Segment> segments = tokenize_pattern(pattern);
    resolve_segments(segments, registry);
    return segments;
}

std::vector<std::vector<Segment>> split_branches(const std::vector<Segment>& segments) {
    std::vector<std::vector<Segment>> branches(1);
    for (const Segment& seg : segments) {
        if (seg.kind == SegmentKind::AlternationSplit) {
            branches.emplace_back();
        } else {
            branches.back().push_back(seg);
        }
    }
    return branches;
}

} // namespace qre
