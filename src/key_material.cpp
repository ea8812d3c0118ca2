#include "key_material.hpp"
#include "errors.hpp"
#include "input_validator.hpp"
#include "security_logger.hpp"
#include "store_file.hpp"

#include <cctype>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <system_error>
#include <vector>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/rand.h>

namespace confshield {

namespace {

const char kHkdfSalt[] = "confshield mapping store";
const char kKeyInfo[] = "confshield store key v1";
const char kFingerprintInfo[] = "confshield key id v1";

void hkdf_sha256(const std::vector<unsigned char>& ikm, const char* info,
                 unsigned char* out, size_t out_len) {
    EVP_PKEY_CTX* pctx = EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr);
    if (!pctx) throw std::runtime_error("HKDF context allocation failed");

    bool ok = EVP_PKEY_derive_init(pctx) == 1 &&
              EVP_PKEY_CTX_set_hkdf_md(pctx, EVP_sha256()) == 1 &&
              EVP_PKEY_CTX_set1_hkdf_salt(pctx, reinterpret_cast<const unsigned char*>(kHkdfSalt),
                                          static_cast<int>(sizeof(kHkdfSalt) - 1)) == 1 &&
              EVP_PKEY_CTX_set1_hkdf_key(pctx, ikm.data(), static_cast<int>(ikm.size())) == 1 &&
              EVP_PKEY_CTX_add1_hkdf_info(pctx, reinterpret_cast<const unsigned char*>(info),
                                          static_cast<int>(std::char_traits<char>::length(info))) == 1;

    size_t len = out_len;
    ok = ok && EVP_PKEY_derive(pctx, out, &len) == 1 && len == out_len;

    EVP_PKEY_CTX_free(pctx);
    if (!ok) throw std::runtime_error("HKDF derivation failed");
}

unsigned char hex_nibble(char c) {
    if (c >= '0' && c <= '9') return static_cast<unsigned char>(c - '0');
    if (c >= 'a' && c <= 'f') return static_cast<unsigned char>(c - 'a' + 10);
    return static_cast<unsigned char>(c - 'A' + 10);
}

}

KeyMaterial KeyMaterial::from_file(const std::filesystem::path& path) {
    std::error_code ec;
    auto status = std::filesystem::status(path, ec);
    if (ec || !std::filesystem::is_regular_file(status)) {
        throw ConfigurationError("key file not found: " + path.string());
    }

    using perms = std::filesystem::perms;
    if ((status.permissions() & (perms::group_all | perms::others_all)) != perms::none) {
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::KEY_MATERIAL,
                            path.string(), "key file is readable by group or others; restrict it to 0600");
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw ConfigurationError("key file is not readable: " + path.string());
    }
    std::string secret((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    try {
        KeyMaterial material = from_secret(secret);
        OPENSSL_cleanse(&secret[0], secret.size());
        return material;
    } catch (const ConfigurationError& e) {
        OPENSSL_cleanse(&secret[0], secret.size());
        throw ConfigurationError(std::string(e.what()) + " (" + path.string() + ")");
    }
}

KeyMaterial KeyMaterial::from_secret(const std::string& secret) {
    size_t end = secret.size();
    while (end > 0 && std::isspace(static_cast<unsigned char>(secret[end - 1]))) --end;

    std::vector<unsigned char> ikm;
    std::string body = secret.substr(0, end);
    if (InputValidator::is_valid_hex(body, KEY_SIZE * 2)) {
        ikm.reserve(KEY_SIZE);
        for (size_t i = 0; i < body.size(); i += 2) {
            ikm.push_back(static_cast<unsigned char>((hex_nibble(body[i]) << 4) | hex_nibble(body[i + 1])));
        }
    } else {
        ikm.assign(body.begin(), body.end());
    }
    if (!body.empty()) OPENSSL_cleanse(&body[0], body.size());

    if (ikm.size() < MIN_SECRET_SIZE) {
        if (!ikm.empty()) OPENSSL_cleanse(ikm.data(), ikm.size());
        throw ConfigurationError("key material too short: need at least " +
                                 std::to_string(MIN_SECRET_SIZE) + " bytes");
    }

    KeyMaterial material;
    try {
        hkdf_sha256(ikm, kKeyInfo, material.key_.data(), material.key_.size());
        hkdf_sha256(ikm, kFingerprintInfo, material.fingerprint_.data(), material.fingerprint_.size());
    } catch (...) {
        OPENSSL_cleanse(ikm.data(), ikm.size());
        throw;
    }
    OPENSSL_cleanse(ikm.data(), ikm.size());
    return material;
}

std::string KeyMaterial::generate_hex(size_t bytes) {
    std::vector<unsigned char> buffer(bytes);
    if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
        throw std::runtime_error("CSPRNG Failure - Entropy Exhausted");
    }

    std::stringstream ss;
    for (unsigned char b : buffer) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);
    }
    OPENSSL_cleanse(buffer.data(), buffer.size());
    return ss.str();
}

void KeyMaterial::generate_key_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        throw ConfigurationError("refusing to overwrite existing key file: " + path.string());
    }

    std::string hex = generate_hex(KEY_SIZE);
    hex += '\n';
    try {
        write_file_exclusive(path, hex);
    } catch (const std::system_error& e) {
        OPENSSL_cleanse(&hex[0], hex.size());
        throw ConfigurationError("cannot create key file " + path.string() + ": " + e.what());
    }
    OPENSSL_cleanse(&hex[0], hex.size());

    SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::KEY_MATERIAL,
                        path.string(), "new store key generated");
}

KeyMaterial::KeyMaterial(KeyMaterial&& other) noexcept
    : key_(other.key_), fingerprint_(other.fingerprint_) {
    other.wipe();
}

KeyMaterial& KeyMaterial::operator=(KeyMaterial&& other) noexcept {
    if (this != &other) {
        key_ = other.key_;
        fingerprint_ = other.fingerprint_;
        other.wipe();
    }
    return *this;
}

KeyMaterial::~KeyMaterial() {
    wipe();
}

void KeyMaterial::wipe() noexcept {
    OPENSSL_cleanse(key_.data(), key_.size());
    OPENSSL_cleanse(fingerprint_.data(), fingerprint_.size());
}

}
