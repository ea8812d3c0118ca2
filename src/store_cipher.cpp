#include "store_cipher.hpp"
#include "errors.hpp"

#include <stdexcept>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

namespace confshield {

namespace {

// Unique owner for EVP_CIPHER_CTX.
struct CipherCtx {
    EVP_CIPHER_CTX* p{nullptr};
    CipherCtx() : p(EVP_CIPHER_CTX_new()) {
        if (!p) throw std::runtime_error("EVP_CIPHER_CTX_new failed");
    }
    ~CipherCtx() { if (p) EVP_CIPHER_CTX_free(p); }
    CipherCtx(const CipherCtx&) = delete;
    CipherCtx& operator=(const CipherCtx&) = delete;
};

void openssl_check(int rc, const char* what) {
    if (rc != 1) throw std::runtime_error(std::string("OpenSSL: ") + what);
}

}

std::vector<unsigned char> StoreCipher::seal(const KeyMaterial& key, const std::string& plaintext) {
    std::vector<unsigned char> out;
    out.reserve(HEADER_SIZE + NONCE_SIZE + plaintext.size() + TAG_SIZE);

    out.push_back(FORMAT_VERSION);
    out.insert(out.end(), key.fingerprint().begin(), key.fingerprint().end());

    unsigned char nonce[NONCE_SIZE];
    openssl_check(RAND_bytes(nonce, sizeof(nonce)), "RAND_bytes(nonce) failed");
    out.insert(out.end(), nonce, nonce + NONCE_SIZE);

    CipherCtx ctx;
    openssl_check(EVP_EncryptInit_ex(ctx.p, EVP_aes_256_gcm(), nullptr, nullptr, nullptr),
                  "EncryptInit(cipher) failed");
    openssl_check(EVP_CIPHER_CTX_ctrl(ctx.p, EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(NONCE_SIZE), nullptr),
                  "SET_IVLEN failed");
    openssl_check(EVP_EncryptInit_ex(ctx.p, nullptr, nullptr, key.key().data(), nonce),
                  "EncryptInit(key/iv) failed");

    int len = 0;
    openssl_check(EVP_EncryptUpdate(ctx.p, nullptr, &len, out.data(), static_cast<int>(HEADER_SIZE)),
                  "EncryptUpdate(AAD) failed");

    size_t ct_offset = out.size();
    out.resize(ct_offset + plaintext.size() + TAG_SIZE);
    int outlen = 0;
    openssl_check(EVP_EncryptUpdate(ctx.p, out.data() + ct_offset, &outlen,
                                    reinterpret_cast<const unsigned char*>(plaintext.data()),
                                    static_cast<int>(plaintext.size())),
                  "EncryptUpdate(PT) failed");
    int fin = 0;
    openssl_check(EVP_EncryptFinal_ex(ctx.p, out.data() + ct_offset + outlen, &fin),
                  "EncryptFinal failed");

    size_t tag_offset = ct_offset + static_cast<size_t>(outlen + fin);
    openssl_check(EVP_CIPHER_CTX_ctrl(ctx.p, EVP_CTRL_GCM_GET_TAG, static_cast<int>(TAG_SIZE),
                                      out.data() + tag_offset),
                  "GET_TAG failed");
    out.resize(tag_offset + TAG_SIZE);
    return out;
}

std::string StoreCipher::open(const KeyMaterial& key, const std::vector<unsigned char>& envelope,
                              const std::string& location) {
    if (envelope.size() < HEADER_SIZE + NONCE_SIZE + TAG_SIZE) {
        throw StoreIntegrityError("mapping store is truncated: " + location);
    }
    if (envelope[0] != FORMAT_VERSION) {
        throw StoreIntegrityError("mapping store has unsupported format version " +
                                  std::to_string(envelope[0]) + ": " + location);
    }
    if (CRYPTO_memcmp(envelope.data() + 1, key.fingerprint().data(), KeyMaterial::FINGERPRINT_SIZE) != 0) {
        throw StoreKeyMismatchError("mapping store was written with a different key: " + location);
    }

    const unsigned char* nonce = envelope.data() + HEADER_SIZE;
    const unsigned char* ct = nonce + NONCE_SIZE;
    size_t ct_len = envelope.size() - HEADER_SIZE - NONCE_SIZE - TAG_SIZE;
    const unsigned char* tag = ct + ct_len;

    CipherCtx ctx;
    openssl_check(EVP_DecryptInit_ex(ctx.p, EVP_aes_256_gcm(), nullptr, nullptr, nullptr),
                  "DecryptInit(cipher) failed");
    openssl_check(EVP_CIPHER_CTX_ctrl(ctx.p, EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(NONCE_SIZE), nullptr),
                  "SET_IVLEN failed");
    openssl_check(EVP_DecryptInit_ex(ctx.p, nullptr, nullptr, key.key().data(), nonce),
                  "DecryptInit(key/iv) failed");

    int len = 0;
    openssl_check(EVP_DecryptUpdate(ctx.p, nullptr, &len, envelope.data(), static_cast<int>(HEADER_SIZE)),
                  "DecryptUpdate(AAD) failed");

    std::string plain(ct_len, '\0');
    int outlen = 0;
    if (ct_len > 0) {
        openssl_check(EVP_DecryptUpdate(ctx.p, reinterpret_cast<unsigned char*>(&plain[0]), &outlen,
                                        ct, static_cast<int>(ct_len)),
                      "DecryptUpdate(CT) failed");
    }

    openssl_check(EVP_CIPHER_CTX_ctrl(ctx.p, EVP_CTRL_GCM_SET_TAG, static_cast<int>(TAG_SIZE),
                                      const_cast<unsigned char*>(tag)),
                  "SET_TAG failed");

    unsigned char final_block[16];
    int fin = 0;
    if (EVP_DecryptFinal_ex(ctx.p, final_block, &fin) != 1) {
        OPENSSL_cleanse(&plain[0], plain.size());
        throw StoreIntegrityError("mapping store failed authentication (tampered or corrupted): " + location);
    }

    plain.resize(static_cast<size_t>(outlen));
    return plain;
}

}
