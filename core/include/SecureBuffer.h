#pragma once

/**
 * @file SecureBuffer.h
 * @brief Move-only byte buffer that wipes its contents on destruction
 *
 * Holds key material and shared secrets. Copies must be made explicitly
 * with clone() so every copy of a secret is visible at the call site.
 */

#include <openssl/crypto.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace skp {

class SecureBuffer {
public:
    SecureBuffer() = default;

    explicit SecureBuffer(std::size_t size) : data_(size, 0) {}

    /// Adopts @p bytes; the source vector is left empty
    explicit SecureBuffer(std::vector<uint8_t>&& bytes) : data_(std::move(bytes)) {}

    SecureBuffer(const uint8_t* bytes, std::size_t len) : data_(bytes, bytes + len) {}

    static SecureBuffer fromString(const std::string& s) {
        return SecureBuffer(reinterpret_cast<const uint8_t*>(s.data()), s.size());
    }

    SecureBuffer(const SecureBuffer&) = delete;
    SecureBuffer& operator=(const SecureBuffer&) = delete;

    SecureBuffer(SecureBuffer&& other) noexcept : data_(std::move(other.data_)) {
        other.data_.clear();
    }

    SecureBuffer& operator=(SecureBuffer&& other) noexcept {
        if (this != &other) {
            wipe();
            data_ = std::move(other.data_);
            other.data_.clear();
        }
        return *this;
    }

    ~SecureBuffer() {
        wipe();
    }

    SecureBuffer clone() const {
        return SecureBuffer(data_.data(), data_.size());
    }

    /// Zero the contents and release them
    void wipe() noexcept {
        if (!data_.empty()) {
            OPENSSL_cleanse(data_.data(), data_.size());
        }
        data_.clear();
    }

    uint8_t* data() noexcept { return data_.data(); }
    const uint8_t* data() const noexcept { return data_.data(); }
    std::size_t size() const noexcept { return data_.size(); }
    bool empty() const noexcept { return data_.empty(); }

    const std::vector<uint8_t>& bytes() const noexcept { return data_; }

    bool operator==(const SecureBuffer& other) const {
        return data_.size() == other.data_.size() &&
               (data_.empty() || CRYPTO_memcmp(data_.data(), other.data_.data(), data_.size()) == 0);
    }
    bool operator!=(const SecureBuffer& other) const { return !(*this == other); }

private:
    std::vector<uint8_t> data_;
};

/// Wipe a std::string that held secret text
inline void cleanseString(std::string& s) noexcept {
    if (!s.empty()) {
        OPENSSL_cleanse(&s[0], s.size());
    }
    s.clear();
}

} // namespace skp
