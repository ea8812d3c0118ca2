#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>

namespace confshield {

// Closed set of sensitive-data categories. Each kind owns exactly one
// placeholder prefix; the detection rules that produce it live in the
// PatternCatalog.
enum class SecretKind {
    PASSWORD,
    API_TOKEN,
    LONG_LIVED_TOKEN,
    PRIVATE_KEY,
    CLIENT_SECRET,
    USERNAME,
    WEBHOOK_URL,
    IPV4,
    IPV6,
    MAC_ADDRESS,
    HOSTNAME,
    EMAIL,
    SSID,
    LATITUDE,
    LONGITUDE
};

struct KindInfo {
    SecretKind kind;
    const char* prefix;
};

// Order matches the enumeration.
inline constexpr std::array<KindInfo, 15> kKindTable = {{
    {SecretKind::PASSWORD, "PASSWORD"},
    {SecretKind::API_TOKEN, "API_TOKEN"},
    {SecretKind::LONG_LIVED_TOKEN, "LONG_LIVED_TOKEN"},
    {SecretKind::PRIVATE_KEY, "PRIVATE_KEY"},
    {SecretKind::CLIENT_SECRET, "CLIENT_SECRET"},
    {SecretKind::USERNAME, "USERNAME"},
    {SecretKind::WEBHOOK_URL, "WEBHOOK_URL"},
    {SecretKind::IPV4, "IPV4"},
    {SecretKind::IPV6, "IPV6"},
    {SecretKind::MAC_ADDRESS, "MAC_ADDRESS"},
    {SecretKind::HOSTNAME, "HOSTNAME"},
    {SecretKind::EMAIL, "EMAIL"},
    {SecretKind::SSID, "SSID"},
    {SecretKind::LATITUDE, "LATITUDE"},
    {SecretKind::LONGITUDE, "LONGITUDE"},
}};

inline const char* kind_prefix(SecretKind kind) {
    return kKindTable[static_cast<size_t>(kind)].prefix;
}

inline std::string kind_name(SecretKind kind) {
    return kind_prefix(kind);
}

// Reverse lookup used by the codec, the store loader and config parsing.
inline std::optional<SecretKind> kind_from_prefix(const std::string& prefix) {
    for (const auto& info : kKindTable) {
        if (prefix == info.prefix) return info.kind;
    }
    return std::nullopt;
}

}
