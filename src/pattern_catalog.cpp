#include "pattern_catalog.hpp"
#include "errors.hpp"
#include "security_logger.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_set>

namespace confshield {

namespace {

// "key: value", "key=value" and JSON "key": "value". The value is quoted
// (groups 1 and 2) or a bare run up to whitespace or a structural character
// (group 3). Separators never span a newline.
const std::string kKeySep = R"(["']?[ \t]*[:=][ \t]*)";
const std::string kValue = R"re((?:"([^"\n]+)"|'([^'\n]+)'|([^\s"',}\]]+)))re";

std::string keyed(const std::string& keys) {
    return "(?:" + keys + ")" + kKeySep + kValue;
}

const char* kSkipSubstrings[] = {"example", "placeholder", "your_", "xxx", "***"};

const char* kSkipExact[] = {
    "none", "null", "true", "false",
    "0.0.0.0", "127.0.0.1", "255.255.255.255", "::1", "localhost"
};

std::string to_lower(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

bool is_prefix_char(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
}

}

PatternCatalog::PatternCatalog(std::vector<PatternRule> rules,
                               std::vector<std::string> extra_skip_values) {
    validate_kind_table();

    if (rules.empty()) {
        throw PatternConfigError("pattern catalog has no rules");
    }

    std::unordered_set<std::string> names;
    rules_.reserve(rules.size());
    for (auto& rule : rules) {
        if (rule.name.empty()) {
            throw PatternConfigError("pattern rule without a name (kind " + kind_name(rule.kind) + ")");
        }
        if (!names.insert(rule.name).second) {
            throw PatternConfigError("duplicate pattern rule name: " + rule.name);
        }
        if (rule.pattern.empty()) {
            throw PatternConfigError("pattern rule '" + rule.name + "' has an empty pattern");
        }

        auto flags = std::regex::ECMAScript | std::regex::optimize;
        if (rule.case_insensitive) flags |= std::regex::icase;

        std::regex compiled;
        try {
            compiled = std::regex(rule.pattern, flags);
        } catch (const std::regex_error& e) {
            throw PatternConfigError("pattern rule '" + rule.name + "' does not compile: " + e.what());
        }

        if (std::regex_match(std::string(), compiled)) {
            throw PatternConfigError("pattern rule '" + rule.name + "' matches empty text");
        }

        rules_.push_back({std::move(rule.name), rule.kind, std::move(compiled)});
    }

    for (const char* v : kSkipExact) skip_exact_.insert(v);
    for (const auto& v : extra_skip_values) {
        if (!v.empty()) skip_exact_.insert(to_lower(v));
    }

    SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::PATTERN_CONFIG,
                        "internal", "pattern catalog ready with " + std::to_string(rules_.size()) + " rules");
}

// Prefixes must be unique, non-empty, upper-case and must not end in '_' so
// the codec can split "<PREFIX>_<INDEX>" at the last underscore.
void PatternCatalog::validate_kind_table() {
    std::unordered_set<std::string> seen;
    for (size_t i = 0; i < kKindTable.size(); ++i) {
        const auto& info = kKindTable[i];
        std::string prefix = info.prefix ? info.prefix : "";

        if (static_cast<size_t>(info.kind) != i) {
            throw PatternConfigError("kind table out of order at prefix '" + prefix + "'");
        }
        if (prefix.empty() || !(prefix[0] >= 'A' && prefix[0] <= 'Z') || prefix.back() == '_') {
            throw PatternConfigError("malformed placeholder prefix '" + prefix + "'");
        }
        if (!std::all_of(prefix.begin(), prefix.end(), is_prefix_char)) {
            throw PatternConfigError("malformed placeholder prefix '" + prefix + "'");
        }
        if (!seen.insert(prefix).second) {
            throw PatternConfigError("duplicate placeholder prefix '" + prefix + "'");
        }
    }
}

std::vector<PatternRule> PatternCatalog::default_rules() {
    // Order is the final tie-break for equal spans: the structural token
    // formats come before the generic key-driven rules.
    return {
        {"private_key_block", SecretKind::PRIVATE_KEY,
         R"(-----BEGIN (?:[A-Z0-9]+ )*PRIVATE KEY-----[\s\S]*?-----END (?:[A-Z0-9]+ )*PRIVATE KEY-----)"},
        {"jwt_long_lived_token", SecretKind::LONG_LIVED_TOKEN,
         R"(\beyJ[A-Za-z0-9_-]{8,}\.[A-Za-z0-9_-]{8,}\.[A-Za-z0-9_-]{8,})"},
        {"known_token_formats", SecretKind::API_TOKEN,
         R"(\b(?:ghp_[A-Za-z0-9]{36}|hf_[A-Za-z0-9]{30,}|AKIA[0-9A-Z]{16}))"},
        {"webhook_url", SecretKind::WEBHOOK_URL,
         R"(webhook(?:_url)?["']?[ \t]*[:=][ \t]*["']?(https?://[^\s"'},]+))", true},
        {"password_value", SecretKind::PASSWORD,
         keyed("password|passwd|pass|pwd"), true},
        {"api_token_value", SecretKind::API_TOKEN,
         keyed(R"(api[_-]?key|access[_-]?token|auth[_-]?token|token|bearer)"), true},
        {"client_secret_value", SecretKind::CLIENT_SECRET,
         keyed(R"((?:client[_-]?)?secret)"), true},
        {"username_value", SecretKind::USERNAME,
         keyed("username|user|login"), true},
        {"ssid_value", SecretKind::SSID,
         keyed("ssid"), true},
        {"latitude_value", SecretKind::LATITUDE,
         R"((?:latitude|lat)["']?[ \t]*[:=][ \t]*["']?(-?\d+\.\d+))", true},
        {"longitude_value", SecretKind::LONGITUDE,
         R"((?:longitude|lon|lng)["']?[ \t]*[:=][ \t]*["']?(-?\d+\.\d+))", true},
        {"hostname_value", SecretKind::HOSTNAME,
         R"((?:hostname|host|broker|server)["']?[ \t]*[:=][ \t]*["']?)"
         R"(((?=[A-Za-z0-9.-]*[A-Za-z])[A-Za-z0-9](?:[A-Za-z0-9-]*[A-Za-z0-9])?(?:\.[A-Za-z0-9](?:[A-Za-z0-9-]*[A-Za-z0-9])?)+))",
         true},
        {"private_dns_name", SecretKind::HOSTNAME,
         R"(\b[A-Za-z0-9-]+(?:\.[A-Za-z0-9-]+)*\.(?:duckdns\.org|nabu\.casa|local|lan|home\.arpa)\b)", true},
        {"email_address", SecretKind::EMAIL,
         R"(\b[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,})"},
        {"ipv6_address", SecretKind::IPV6,
         R"(\b(?:(?:[0-9A-Fa-f]{1,4}:){7}[0-9A-Fa-f]{1,4}|(?:[0-9A-Fa-f]{1,4}:){1,6}:[0-9A-Fa-f]{1,4}(?::[0-9A-Fa-f]{1,4}){0,5})\b)"},
        {"mac_address", SecretKind::MAC_ADDRESS,
         R"(\b(?:[0-9A-Fa-f]{2}[:-]){5}[0-9A-Fa-f]{2}\b)"},
        {"ipv4_address", SecretKind::IPV4,
         R"(\b(?:(?:25[0-5]|2[0-4][0-9]|[01]?[0-9][0-9]?)\.){3}(?:25[0-5]|2[0-4][0-9]|[01]?[0-9][0-9]?)\b)"},
    };
}

PatternCatalog PatternCatalog::with_defaults(const std::vector<PatternRule>& custom_rules,
                                             std::vector<std::string> extra_skip_values) {
    auto rules = default_rules();
    rules.insert(rules.end(), custom_rules.begin(), custom_rules.end());
    return PatternCatalog(std::move(rules), std::move(extra_skip_values));
}

MatchCursor PatternCatalog::scan(const std::string& text) const {
    return MatchCursor(*this, text);
}

std::vector<SecretMatch> PatternCatalog::detect(const std::string& text) const {
    std::vector<SecretMatch> matches;
    auto cursor = scan(text);
    while (auto m = cursor.next()) {
        matches.push_back(std::move(*m));
    }
    return matches;
}

bool PatternCatalog::should_skip(const std::string& value) const {
    if (value.size() < 3) return true;
    // YAML tags such as "!secret wifi_password" reference a value kept elsewhere.
    if (value[0] == '!') return true;

    std::string lower = to_lower(value);
    if (skip_exact_.count(lower)) return true;
    for (const char* s : kSkipSubstrings) {
        if (lower.find(s) != std::string::npos) return true;
    }
    return false;
}

// ---------------------------------------------------------------------------
// MatchCursor
// ---------------------------------------------------------------------------
//
// Every rule keeps a head: its first acceptable match at or after the
// position it was computed from. A search "from p" treats p as the start of
// input, so a sanitized text (where p follows a placeholder) scans exactly
// like the original text did after the replaced span. This is what makes a
// second pass a no-op.

MatchCursor::MatchCursor(const PatternCatalog& catalog, const std::string& text)
    : catalog_(catalog), text_(text), atomic_(PlaceholderCodec::find_tokens(text)) {
    heads_.resize(catalog_.rules().size());
}

void MatchCursor::reset() {
    pos_ = 0;
    heads_.assign(catalog_.rules().size(), Head{});
}

// Locates the segment containing pos. Segments are the gaps between
// placeholder tokens. Returns false when pos sits inside a token; next_pos
// is then set to the token end.
bool MatchCursor::segment_at(size_t pos, size_t& seg_end, bool& bounded, size_t& next_pos) const {
    auto it = std::upper_bound(atomic_.begin(), atomic_.end(), pos,
        [](size_t p, const TokenSpan& t) { return p < t.offset + t.length; });

    if (it != atomic_.end() && it->offset <= pos) {
        next_pos = it->offset + it->length;
        return false;
    }
    if (it != atomic_.end()) {
        seg_end = it->offset;
        bounded = true;
        next_pos = it->offset + it->length;
    } else {
        seg_end = text_.size();
        bounded = false;
        next_pos = text_.size();
    }
    return true;
}

MatchCursor::Attempt MatchCursor::run_regex(size_t rule_index, size_t from, size_t seg_end,
                                            bool bounded, bool fresh, bool anchored) const {
    const auto& rule = catalog_.rules()[rule_index];
    auto flags = std::regex_constants::match_default;
    if (!fresh) flags |= std::regex_constants::match_prev_avail;
    if (bounded) flags |= std::regex_constants::match_not_eow;
    if (anchored) flags |= std::regex_constants::match_continuous;

    Attempt attempt;
    std::smatch m;
    bool found = false;
    try {
        found = std::regex_search(text_.cbegin() + from, text_.cbegin() + seg_end, m, rule.regex, flags);
    } catch (const std::regex_error& e) {
        throw DetectionError("rule '" + rule.name + "' (" + kind_name(rule.kind) +
                             ") failed at offset " + std::to_string(from) + ": " + e.what());
    }
    if (!found || m.length(0) == 0) return attempt;

    attempt.whole_start = from + static_cast<size_t>(m.position(0));
    attempt.whole_end = attempt.whole_start + static_cast<size_t>(m.length(0));

    size_t group = 0;
    for (size_t g = 1; g < m.size(); ++g) {
        if (m[g].matched && m[g].length() > 0) {
            group = g;
            break;
        }
    }

    SecretMatch match;
    match.offset = from + static_cast<size_t>(m.position(group));
    match.length = static_cast<size_t>(m.length(group));
    match.kind = rule.kind;
    match.value = m.str(group);
    match.rule_index = rule_index;

    attempt.skipped = catalog_.should_skip(match.value);
    attempt.match = std::move(match);
    return attempt;
}

MatchCursor::Head MatchCursor::search_rule(size_t rule_index, size_t from) const {
    Head head;
    head.valid = true;
    head.origin = from;

    size_t pos = from;
    bool fresh = true;
    while (pos < text_.size()) {
        size_t seg_end = 0;
        size_t next_pos = 0;
        bool bounded = false;
        if (!segment_at(pos, seg_end, bounded, next_pos)) {
            pos = next_pos;
            fresh = true;
            continue;
        }

        Attempt attempt = run_regex(rule_index, pos, seg_end, bounded, fresh, false);
        if (!attempt.match) {
            if (!bounded) break;
            pos = next_pos;
            fresh = true;
            continue;
        }
        if (attempt.skipped) {
            head.skipped.push_back({attempt.whole_start, attempt.whole_end});
            pos = attempt.whole_end;
            fresh = false;
            continue;
        }

        head.match = std::move(attempt.match);
        head.whole_start = attempt.whole_start;
        return head;
    }

    head.exhausted = true;
    return head;
}

// Brings a head up to date for pos_. A cached head stays valid when its match
// starts after pos_ and no skipped match spans pos_: the only position whose
// outcome can change is pos_ itself, which is probed with an anchored search.
void MatchCursor::refresh_head(size_t rule_index) {
    Head& head = heads_[rule_index];
    if (head.valid && head.origin == pos_) return;

    bool reusable = head.valid && (head.exhausted || head.whole_start > pos_);
    if (reusable) {
        for (const auto& region : head.skipped) {
            if (region.first <= pos_ && pos_ < region.second) {
                reusable = false;
                break;
            }
        }
    }
    if (!reusable) {
        head = search_rule(rule_index, pos_);
        return;
    }

    size_t seg_end = 0;
    size_t next_pos = 0;
    bool bounded = false;
    if (pos_ < text_.size() && segment_at(pos_, seg_end, bounded, next_pos) && pos_ < seg_end) {
        Attempt attempt = run_regex(rule_index, pos_, seg_end, bounded, true, true);
        if (attempt.match) {
            if (attempt.skipped) {
                head = search_rule(rule_index, pos_);
                return;
            }
            Head fresh_head;
            fresh_head.valid = true;
            fresh_head.origin = pos_;
            fresh_head.match = std::move(attempt.match);
            fresh_head.whole_start = attempt.whole_start;
            head = std::move(fresh_head);
            return;
        }
    }

    head.origin = pos_;
    head.skipped.erase(std::remove_if(head.skipped.begin(), head.skipped.end(),
        [this](const std::pair<size_t, size_t>& r) { return r.second <= pos_; }),
        head.skipped.end());
}

std::optional<SecretMatch> MatchCursor::next() {
    const SecretMatch* best = nullptr;
    for (size_t i = 0; i < heads_.size(); ++i) {
        refresh_head(i);
        const auto& head = heads_[i];
        if (head.exhausted || !head.match) continue;
        const SecretMatch& candidate = *head.match;
        if (candidate.offset < pos_) continue;

        if (!best ||
            candidate.offset < best->offset ||
            (candidate.offset == best->offset && candidate.length > best->length)) {
            best = &candidate;
        }
    }

    if (!best) return std::nullopt;

    SecretMatch result = *best;
    pos_ = result.end();
    return result;
}

}
