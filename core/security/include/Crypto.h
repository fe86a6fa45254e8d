#pragma once

#include "SecureBuffer.h"

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

namespace SkipKP {

/**
 * @brief Cryptographic primitives used by the sync protocol
 *
 * HMAC-SHA256 message signing, HKDF-SHA256 key derivation and AES-256-GCM
 * payload sealing, all backed by OpenSSL. Operations that can only fail on
 * an OpenSSL malfunction or malformed input throw std::runtime_error;
 * callers translate that into a Result.
 */
class Crypto {
public:
    static constexpr size_t KEY_SIZE = 32;      // AES-256
    static constexpr size_t GCM_IV_SIZE = 12;
    static constexpr size_t GCM_TAG_SIZE = 16;
    static constexpr size_t HMAC_SIZE = 32;

    /**
     * @brief Compute HMAC-SHA256
     * @param key HMAC key
     * @param message Data to authenticate
     * @return 32-byte digest
     * @throws std::runtime_error if OpenSSL fails
     */
    static std::vector<uint8_t> hmacSHA256(const skp::SecureBuffer& key, const std::string& message);

    /// HMAC-SHA256 rendered as lowercase hex
    static std::string hmacSHA256Hex(const skp::SecureBuffer& key, const std::string& message);

    /**
     * @brief Compare two strings without early exit on the first mismatch
     *
     * Length is not secret; strings of different length compare unequal.
     */
    static bool constantTimeEquals(const std::string& a, const std::string& b);

    /**
     * @brief Derive key material with HKDF-SHA256 (RFC 5869)
     * @throws std::runtime_error if OpenSSL fails
     */
    static skp::SecureBuffer hkdfSHA256(const skp::SecureBuffer& ikm, const std::string& salt,
                                   const std::string& info, size_t length);

    /**
     * @brief Encrypt with AES-256-GCM under a fresh random IV
     * @param key 32-byte key
     * @param plaintext Data to encrypt
     * @param aad Additional authenticated data
     * @return iv || ciphertext || tag
     * @throws std::runtime_error on bad key size or OpenSSL failure
     */
    static std::vector<uint8_t> sealAesGcm(const skp::SecureBuffer& key, const skp::SecureBuffer& plaintext,
                                           const std::string& aad);

    /**
     * @brief Decrypt and authenticate the output of sealAesGcm()
     * @throws std::runtime_error when the input is truncated or the tag
     *         does not verify
     */
    static skp::SecureBuffer openAesGcm(const skp::SecureBuffer& key, const std::vector<uint8_t>& sealed,
                                   const std::string& aad);

    static std::string toHex(const uint8_t* data, size_t len, bool upperCase = false);
    static std::string toHex(const std::vector<uint8_t>& data, bool upperCase = false);

    /// Append hex digits to @p out without an intermediate string
    static void appendHex(std::string& out, const uint8_t* data, size_t len, bool upperCase = false);

    /// @return false on odd length or a non-hex character
    static bool fromHex(const std::string& hex, std::vector<uint8_t>& out);

    static bool isHex(const std::string& value);

    static std::string base64Encode(const std::vector<uint8_t>& data);

    /// @return false if @p text is not canonical padded base64
    static bool base64Decode(const std::string& text, std::vector<uint8_t>& out);
};

} // namespace SkipKP

