#include "EntropyProvider.h"
#include "Crypto.h"
#include "Logger.h"
#include "MetricsCollector.h"

#include <openssl/rand.h>
#include <climits>

namespace SkipKP {

bool OpenSSLRandomSource::fill(uint8_t* out, std::size_t len) {
    if (len == 0) {
        return true;
    }
    if (len > static_cast<std::size_t>(INT_MAX)) {
        return false;
    }
    return RAND_bytes(out, static_cast<int>(len)) == 1;
}

EntropyProvider::EntropyProvider(std::shared_ptr<IRandomSource> source)
    : source_(std::move(source)) {}

skp::Result<skp::SecureBuffer> EntropyProvider::randomBytes(std::size_t len) {
    skp::SecureBuffer buffer(len);
    if (!source_ || !source_->fill(buffer.data(), buffer.size())) {
        Logger::instance().log(LogLevel::ERROR, "Random source failed to produce " + std::to_string(len) + " bytes", "EntropyProvider");
        MetricsCollector::instance().incrementRngFailures();
        return skp::Err<skp::SecureBuffer>(skp::ErrorCode::RngUnavailable);
    }
    return std::move(buffer);
}

skp::Result<std::string> EntropyProvider::generate(int minEntropyBits) {
    if (minEntropyBits <= 0) {
        return skp::Err<std::string>(skp::ErrorCode::ValidationError, "minentropy must be positive");
    }

    auto bytes = randomBytes((static_cast<std::size_t>(minEntropyBits) + 7) / 8);
    if (!bytes) {
        return bytes.error();
    }
    MetricsCollector::instance().incrementEntropyRequests();
    return Crypto::toHex(bytes->data(), bytes->size(), true);
}

skp::Result<std::string> EntropyProvider::randomId(std::size_t bytes) {
    auto raw = randomBytes(bytes);
    if (!raw) {
        return raw.error();
    }
    return Crypto::toHex(raw->data(), raw->size());
}

} // namespace SkipKP
