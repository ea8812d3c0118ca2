#include "placeholder_codec.hpp"

#include <cstring>
#include <stdexcept>

namespace confshield {

namespace {

bool is_body_char(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
}

}

std::string PlaceholderCodec::encode(SecretKind kind, uint32_t index) {
    if (index < FIRST_INDEX) {
        throw std::out_of_range("placeholder index must be >= 1");
    }

    std::string digits = std::to_string(index);
    if (digits.size() < INDEX_WIDTH) {
        digits.insert(0, INDEX_WIDTH - digits.size(), '0');
    }

    std::string token = OPEN;
    token += kind_prefix(kind);
    token += '_';
    token += digits;
    token += CLOSE;
    return token;
}

size_t PlaceholderCodec::token_length_at(const std::string& text, size_t pos) {
    const size_t open_len = std::strlen(OPEN);
    if (text.compare(pos, open_len, OPEN) != 0) return 0;

    size_t i = pos + open_len;
    size_t body_start = i;
    while (i < text.size() && is_body_char(text[i])) ++i;
    if (i == body_start) return 0;
    if (text.compare(i, 2, CLOSE) != 0) return 0;
    return i + 2 - pos;
}

std::vector<TokenSpan> PlaceholderCodec::find_tokens(const std::string& text) {
    std::vector<TokenSpan> spans;
    size_t pos = 0;
    while ((pos = text.find(OPEN, pos)) != std::string::npos) {
        size_t len = token_length_at(text, pos);
        if (len > 0) {
            spans.push_back({pos, len});
            pos += len;
        } else {
            ++pos;
        }
    }
    return spans;
}

std::optional<PlaceholderId> PlaceholderCodec::decode(const std::string& token) {
    if (token_length_at(token, 0) != token.size()) return std::nullopt;

    const size_t open_len = std::strlen(OPEN);
    std::string body = token.substr(open_len, token.size() - open_len - 2);

    size_t sep = body.rfind('_');
    if (sep == std::string::npos || sep == 0 || sep + 1 == body.size()) return std::nullopt;

    std::string prefix = body.substr(0, sep);
    std::string digits = body.substr(sep + 1);

    auto kind = kind_from_prefix(prefix);
    if (!kind) return std::nullopt;

    // Bounded so the value below cannot overflow uint32_t.
    if (digits.size() > 10) return std::nullopt;
    uint64_t value = 0;
    for (char c : digits) {
        if (c < '0' || c > '9') return std::nullopt;
        value = value * 10 + static_cast<uint64_t>(c - '0');
    }
    if (value < FIRST_INDEX || value > UINT32_MAX) return std::nullopt;

    auto index = static_cast<uint32_t>(value);
    if (encode(*kind, index) != token) return std::nullopt;

    return PlaceholderId{*kind, index};
}

}
