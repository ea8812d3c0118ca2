#pragma once

#include <cstddef>
#include <optional>
#include <regex>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include "secret_kind.hpp"
#include "placeholder_codec.hpp"

namespace confshield {

// Declarative form of a detection rule, as written in code or config files.
// The reported value is the first non-empty capture group, or the whole
// match when the pattern has no groups.
struct PatternRule {
    std::string name;
    SecretKind kind;
    std::string pattern;
    bool case_insensitive = false;
};

struct SecretMatch {
    size_t offset;
    size_t length;
    SecretKind kind;
    std::string value;
    size_t rule_index;

    size_t end() const { return offset + length; }
};

class MatchCursor;

// Ordered, immutable set of compiled detection rules. Construction fails fast
// with PatternConfigError; scanning is stateless and may run concurrently.
class PatternCatalog {
public:
    struct CompiledRule {
        std::string name;
        SecretKind kind;
        std::regex regex;
    };

    explicit PatternCatalog(std::vector<PatternRule> rules,
                            std::vector<std::string> extra_skip_values = {});

    // Built-in rules covering every SecretKind.
    static std::vector<PatternRule> default_rules();

    // Default rules followed by the given custom rules.
    static PatternCatalog with_defaults(const std::vector<PatternRule>& custom_rules = {},
                                        std::vector<std::string> extra_skip_values = {});

    // Lazy scan. The cursor borrows both the catalog and the text.
    MatchCursor scan(const std::string& text) const;

    // Convenience wrapper that drains a cursor.
    std::vector<SecretMatch> detect(const std::string& text) const;

    // Values that look like secrets but are references, examples or
    // well-known addresses.
    bool should_skip(const std::string& value) const;

    const std::vector<CompiledRule>& rules() const { return rules_; }

private:
    std::vector<CompiledRule> rules_;
    std::unordered_set<std::string> skip_exact_;

    static void validate_kind_table();
};

// Yields non-overlapping matches in order of earliest start; ties go to the
// longer match, then to the earlier rule. Placeholder tokens are atomic:
// no match may start inside or straddle one.
class MatchCursor {
public:
    MatchCursor(const PatternCatalog& catalog, const std::string& text);

    // Throws DetectionError if a rule fails on this text.
    std::optional<SecretMatch> next();

    // Rewinds to the beginning of the text.
    void reset();

private:
    struct Head {
        bool valid = false;
        bool exhausted = false;
        size_t origin = 0;
        size_t whole_start = 0;
        std::optional<SecretMatch> match;
        // Whole-match spans [begin, end) rejected by the skip policy on the way to `match`.
        std::vector<std::pair<size_t, size_t>> skipped;
    };

    struct Attempt {
        std::optional<SecretMatch> match;
        size_t whole_start = 0;
        size_t whole_end = 0;
        bool skipped = false;
    };

    const PatternCatalog& catalog_;
    const std::string& text_;
    std::vector<TokenSpan> atomic_;
    std::vector<Head> heads_;
    size_t pos_ = 0;

    bool segment_at(size_t pos, size_t& seg_end, bool& bounded, size_t& next_pos) const;
    Attempt run_regex(size_t rule_index, size_t from, size_t seg_end,
                      bool bounded, bool fresh, bool anchored) const;
    Head search_rule(size_t rule_index, size_t from) const;
    void refresh_head(size_t rule_index);
};

}
