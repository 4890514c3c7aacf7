#include "entropy_source.hpp"
#include "cryptorand/error.hpp"
#include "utils/logger.hpp"
#include <sodium.h>

namespace cryptorand::crypto {

SodiumEntropySource::SodiumEntropySource() {
    // sodium_init() is idempotent and thread-safe; 1 means already initialized
    if (sodium_init() < 0) {
        CRYPTORAND_LOG_CRITICAL("libsodium initialization failed, no entropy source available");
        throw CryptoException(ErrorCode::CryptoInitFailed, "failed to initialize libsodium");
    }
}

void SodiumEntropySource::fill(byte* buffer, size_t size) {
    if (size == 0) {
        return;
    }
    randombytes_buf(buffer, size);
}

} // namespace cryptorand::crypto
