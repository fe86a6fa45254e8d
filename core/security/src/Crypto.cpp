#include "Crypto.h"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/hmac.h>
#include <openssl/kdf.h>
#include <openssl/crypto.h>
#include <stdexcept>
#include <memory>

namespace SkipKP {

namespace {

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

struct PkeyCtxDeleter {
    void operator()(EVP_PKEY_CTX* ctx) const { EVP_PKEY_CTX_free(ctx); }
};
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter>;

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::vector<uint8_t> Crypto::hmacSHA256(const skp::SecureBuffer& key, const std::string& message) {
    std::vector<uint8_t> digest(HMAC_SIZE);
    unsigned int digestLen = 0;

    // HMAC() treats a null key pointer as an error even for zero length.
    static const uint8_t emptyKey = 0;
    const uint8_t* keyPtr = key.empty() ? &emptyKey : key.data();

    if (!HMAC(EVP_sha256(), keyPtr, static_cast<int>(key.size()),
              reinterpret_cast<const unsigned char*>(message.data()), message.size(),
              digest.data(), &digestLen)) {
        throw std::runtime_error("HMAC-SHA256 computation failed");
    }
    digest.resize(digestLen);
    return digest;
}

std::string Crypto::hmacSHA256Hex(const skp::SecureBuffer& key, const std::string& message) {
    return toHex(hmacSHA256(key, message));
}

bool Crypto::constantTimeEquals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    if (a.empty()) {
        return true;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

skp::SecureBuffer Crypto::hkdfSHA256(const skp::SecureBuffer& ikm, const std::string& salt,
                                const std::string& info, size_t length) {
    PkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr));
    if (!ctx) {
        throw std::runtime_error("Failed to create HKDF context");
    }

    if (EVP_PKEY_derive_init(ctx.get()) <= 0 ||
        EVP_PKEY_CTX_set_hkdf_md(ctx.get(), EVP_sha256()) <= 0 ||
        EVP_PKEY_CTX_set1_hkdf_salt(ctx.get(), reinterpret_cast<const unsigned char*>(salt.data()),
                                    static_cast<int>(salt.size())) <= 0 ||
        EVP_PKEY_CTX_set1_hkdf_key(ctx.get(), ikm.data(), static_cast<int>(ikm.size())) <= 0 ||
        EVP_PKEY_CTX_add1_hkdf_info(ctx.get(), reinterpret_cast<const unsigned char*>(info.data()),
                                    static_cast<int>(info.size())) <= 0) {
        throw std::runtime_error("Failed to configure HKDF");
    }

    skp::SecureBuffer out(length);
    size_t outLen = length;
    if (EVP_PKEY_derive(ctx.get(), out.data(), &outLen) <= 0 || outLen != length) {
        throw std::runtime_error("HKDF derivation failed");
    }
    return out;
}

std::vector<uint8_t> Crypto::sealAesGcm(const skp::SecureBuffer& key, const skp::SecureBuffer& plaintext,
                                        const std::string& aad) {
    if (key.size() != KEY_SIZE) {
        throw std::runtime_error("Invalid AES-256 key length");
    }

    std::vector<uint8_t> sealed(GCM_IV_SIZE + plaintext.size() + GCM_TAG_SIZE);
    uint8_t* iv = sealed.data();
    uint8_t* ciphertext = sealed.data() + GCM_IV_SIZE;

    if (RAND_bytes(iv, static_cast<int>(GCM_IV_SIZE)) != 1) {
        throw std::runtime_error("Failed to generate GCM IV");
    }

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw std::runtime_error("Failed to create cipher context");
    }

    int len = 0;
    int total = 0;

    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1)
        throw std::runtime_error("EVP_EncryptInit_ex failed");

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(GCM_IV_SIZE), nullptr) != 1)
        throw std::runtime_error("Failed to set IV length");

    if (EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), iv) != 1)
        throw std::runtime_error("Failed to initialize key and IV");

    if (!aad.empty() &&
        EVP_EncryptUpdate(ctx.get(), nullptr, &len, reinterpret_cast<const unsigned char*>(aad.data()),
                          static_cast<int>(aad.size())) != 1)
        throw std::runtime_error("Failed to add AAD");

    if (!plaintext.empty()) {
        if (EVP_EncryptUpdate(ctx.get(), ciphertext, &len, plaintext.data(),
                              static_cast<int>(plaintext.size())) != 1)
            throw std::runtime_error("Encryption failed");
        total = len;
    }

    if (EVP_EncryptFinal_ex(ctx.get(), ciphertext + total, &len) != 1)
        throw std::runtime_error("EVP_EncryptFinal_ex failed");
    total += len;

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(GCM_TAG_SIZE),
                            ciphertext + total) != 1)
        throw std::runtime_error("Failed to get authentication tag");

    sealed.resize(GCM_IV_SIZE + static_cast<size_t>(total) + GCM_TAG_SIZE);
    return sealed;
}

skp::SecureBuffer Crypto::openAesGcm(const skp::SecureBuffer& key, const std::vector<uint8_t>& sealed,
                                const std::string& aad) {
    if (key.size() != KEY_SIZE) {
        throw std::runtime_error("Invalid AES-256 key length");
    }
    if (sealed.size() < GCM_IV_SIZE + GCM_TAG_SIZE) {
        throw std::runtime_error("Sealed payload too short");
    }

    const uint8_t* iv = sealed.data();
    const uint8_t* ciphertext = sealed.data() + GCM_IV_SIZE;
    const size_t cipherLen = sealed.size() - GCM_IV_SIZE - GCM_TAG_SIZE;
    const uint8_t* tag = ciphertext + cipherLen;

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw std::runtime_error("Failed to create cipher context");
    }

    skp::SecureBuffer plaintext(cipherLen);
    int len = 0;
    int total = 0;

    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1)
        throw std::runtime_error("EVP_DecryptInit_ex failed");

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(GCM_IV_SIZE), nullptr) != 1)
        throw std::runtime_error("Failed to set IV length");

    if (EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), iv) != 1)
        throw std::runtime_error("Failed to initialize key and IV");

    if (!aad.empty() &&
        EVP_DecryptUpdate(ctx.get(), nullptr, &len, reinterpret_cast<const unsigned char*>(aad.data()),
                          static_cast<int>(aad.size())) != 1)
        throw std::runtime_error("Failed to add AAD");

    if (cipherLen > 0) {
        if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &len, ciphertext, static_cast<int>(cipherLen)) != 1)
            throw std::runtime_error("Decryption failed");
        total = len;
    }

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(GCM_TAG_SIZE),
                            const_cast<uint8_t*>(tag)) != 1)
        throw std::runtime_error("Failed to set authentication tag");

    // plaintext is wiped by its destructor when this throws.
    if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + total, &len) != 1)
        throw std::runtime_error("Tag verification failed");

    return plaintext;
}

void Crypto::appendHex(std::string& out, const uint8_t* data, size_t len, bool upperCase) {
    const char* digits = upperCase ? "0123456789ABCDEF" : "0123456789abcdef";
    for (size_t i = 0; i < len; ++i) {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0F]);
    }
}

std::string Crypto::toHex(const uint8_t* data, size_t len, bool upperCase) {
    std::string out;
    out.reserve(len * 2);
    appendHex(out, data, len, upperCase);
    return out;
}

std::string Crypto::toHex(const std::vector<uint8_t>& data, bool upperCase) {
    return toHex(data.data(), data.size(), upperCase);
}

bool Crypto::fromHex(const std::string& hex, std::vector<uint8_t>& out) {
    if (hex.size() % 2 != 0) {
        return false;
    }
    std::vector<uint8_t> bytes;
    bytes.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = hexValue(hex[i]);
        int lo = hexValue(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            return false;
        }
        bytes.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    out = std::move(bytes);
    return true;
}

bool Crypto::isHex(const std::string& value) {
    for (char c : value) {
        if (hexValue(c) < 0) {
            return false;
        }
    }
    return true;
}

std::string Crypto::base64Encode(const std::vector<uint8_t>& data) {
    std::string out(4 * ((data.size() + 2) / 3), '\0');
    if (out.empty()) {
        return out;
    }
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), data.data(),
                                  static_cast<int>(data.size()));
    out.resize(static_cast<size_t>(written));
    return out;
}

bool Crypto::base64Decode(const std::string& text, std::vector<uint8_t>& out) {
    if (text.size() % 4 != 0) {
        return false;
    }
    if (text.empty()) {
        out.clear();
        return true;
    }

    size_t padding = 0;
    if (text[text.size() - 1] == '=') ++padding;
    if (text[text.size() - 2] == '=') ++padding;

    std::vector<uint8_t> decoded(text.size() / 4 * 3);
    int written = EVP_DecodeBlock(decoded.data(), reinterpret_cast<const unsigned char*>(text.data()),
                                  static_cast<int>(text.size()));
    if (written < 0 || static_cast<size_t>(written) < padding) {
        return false;
    }
    decoded.resize(static_cast<size_t>(written) - padding);
    out = std::move(decoded);
    return true;
}

} // namespace SkipKP
