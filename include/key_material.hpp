#pragma once

#include <array>
#include <cstddef>
#include <filesystem>
#include <string>

namespace confshield {

// Symmetric key for the mapping store, derived from a locally held secret.
// The engine only reads key files; generate_key_file exists for the CLI's
// keygen command. Key bytes are wiped on destruction and never logged.
class KeyMaterial {
public:
    static constexpr size_t KEY_SIZE = 32;
    static constexpr size_t FINGERPRINT_SIZE = 8;
    static constexpr size_t MIN_SECRET_SIZE = 32;

    /**
     * Loads a key file. A file holding exactly 64 hex characters is decoded
     * to 32 raw bytes; any other content of at least MIN_SECRET_SIZE bytes is
     * used as-is. Trailing whitespace is ignored.
     * @throws ConfigurationError if the file is missing, unreadable or too short.
     */
    static KeyMaterial from_file(const std::filesystem::path& path);

    // Derives key material from an in-memory secret (same rules as a key file body).
    static KeyMaterial from_secret(const std::string& secret);

    /**
     * Writes a new random key (64 hex chars) with mode 0600.
     * @throws ConfigurationError if the file already exists.
     */
    static void generate_key_file(const std::filesystem::path& path);

    // Hex encoding of `bytes` CSPRNG bytes.
    static std::string generate_hex(size_t bytes = KEY_SIZE);

    KeyMaterial(KeyMaterial&& other) noexcept;
    KeyMaterial& operator=(KeyMaterial&& other) noexcept;
    KeyMaterial(const KeyMaterial&) = delete;
    KeyMaterial& operator=(const KeyMaterial&) = delete;
    ~KeyMaterial();

    const std::array<unsigned char, KEY_SIZE>& key() const { return key_; }

    // Public identifier of the key, stored in the store header so a wrong key
    // is reported as such instead of as generic corruption.
    const std::array<unsigned char, FINGERPRINT_SIZE>& fingerprint() const { return fingerprint_; }

private:
    KeyMaterial() = default;

    std::array<unsigned char, KEY_SIZE> key_{};
    std::array<unsigned char, FINGERPRINT_SIZE> fingerprint_{};

    void wipe() noexcept;
};

}
