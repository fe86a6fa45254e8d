#pragma once

/**
 * @file EntropyProvider.h
 * @brief CSPRNG access for key material, key IDs and /entropy responses
 */

#include "Result.h"
#include "SecureBuffer.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace SkipKP {

/**
 * @brief Source of cryptographically secure random bytes
 */
class IRandomSource {
public:
    virtual ~IRandomSource() = default;

    /// Fill @p out with @p len random bytes; false if the source failed
    virtual bool fill(uint8_t* out, std::size_t len) = 0;
};

/**
 * @brief RAND_bytes from the OpenSSL default DRBG
 */
class OpenSSLRandomSource : public IRandomSource {
public:
    bool fill(uint8_t* out, std::size_t len) override;
};

class EntropyProvider {
public:
    explicit EntropyProvider(std::shared_ptr<IRandomSource> source = std::make_shared<OpenSSLRandomSource>());

    /**
     * @brief Random string carrying at least @p minEntropyBits of entropy
     * @return ceil(bits/8) random bytes as uppercase hex, RngUnavailable if
     *         the source failed, ValidationError for a non-positive request
     */
    skp::Result<std::string> generate(int minEntropyBits);

    skp::Result<skp::SecureBuffer> randomBytes(std::size_t len);

    /// Random identifier rendered as lowercase hex (2 * @p bytes chars)
    skp::Result<std::string> randomId(std::size_t bytes);

private:
    std::shared_ptr<IRandomSource> source_;
};

} // namespace SkipKP
