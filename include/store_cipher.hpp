#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "key_material.hpp"

namespace confshield {

// AES-256-GCM envelope for the mapping store file:
//
//   version(1) | key fingerprint(8) | nonce(12) | ciphertext | tag(16)
//
// The first nine bytes are authenticated as associated data, so any change
// anywhere in the file fails to open.
class StoreCipher {
public:
    static constexpr uint8_t FORMAT_VERSION = 1;
    static constexpr size_t HEADER_SIZE = 1 + KeyMaterial::FINGERPRINT_SIZE;
    static constexpr size_t NONCE_SIZE = 12;
    static constexpr size_t TAG_SIZE = 16;

    // Encrypts with a fresh random nonce.
    static std::vector<unsigned char> seal(const KeyMaterial& key, const std::string& plaintext);

    /**
     * Authenticates and decrypts an envelope.
     * @param location Store path, used only in error messages.
     * @throws StoreKeyMismatchError if the header names a different key.
     * @throws StoreIntegrityError on truncation, unknown version or tag failure.
     */
    static std::string open(const KeyMaterial& key, const std::vector<unsigned char>& envelope,
                            const std::string& location);
};

}
