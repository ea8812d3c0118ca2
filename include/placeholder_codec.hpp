#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "secret_kind.hpp"

namespace confshield {

struct PlaceholderId {
    SecretKind kind;
    uint32_t index;

    bool operator==(const PlaceholderId& other) const {
        return kind == other.kind && index == other.index;
    }
};

// A substring that matches the placeholder grammar. It may still fail to
// decode (unknown kind, non-canonical index).
struct TokenSpan {
    size_t offset;
    size_t length;
};

// Encodes (kind, index) pairs as "<<SECRET_<PREFIX>_<NNNN>>>" tokens.
//
// Grammar:   "<<SECRET_" [A-Z0-9_]+ ">>"
// Canonical: the body splits at its last '_' into a known kind prefix and a
//            decimal index >= 1, zero-padded to at least INDEX_WIDTH digits
//            with no extra leading zeros. Only canonical tokens decode, so
//            encode(decode(t)) == t for every decodable t.
class PlaceholderCodec {
public:
    static constexpr const char* OPEN = "<<SECRET_";
    static constexpr const char* CLOSE = ">>";
    static constexpr size_t INDEX_WIDTH = 4;
    static constexpr uint32_t FIRST_INDEX = 1;

    // Throws std::out_of_range for index 0.
    static std::string encode(SecretKind kind, uint32_t index);

    // Never throws; returns nullopt for anything that is not a canonical placeholder.
    static std::optional<PlaceholderId> decode(const std::string& token);

    // Returns every grammar-matching token in text, left to right, non-overlapping.
    static std::vector<TokenSpan> find_tokens(const std::string& text);

    // Matches a grammar token starting exactly at pos; returns its length or 0.
    static size_t token_length_at(const std::string& text, size_t pos);
};

}
