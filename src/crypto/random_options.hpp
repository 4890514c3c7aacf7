#pragma once

#include "cryptorand/common.hpp"
#include "cryptorand/error.hpp"

namespace cryptorand::utils {
class Config;
}

namespace cryptorand::crypto {

/**
 * Tuning for CryptoRandom's per-processor byte caches
 */
struct RandomOptions {
    size_t cache_size = constants::BYTE_CACHE_SIZE;
    size_t request_cache_limit = constants::REQUEST_CACHE_LIMIT;  // larger requests bypass the cache
    size_t slot_count = 0;                                        // 0: one slot per logical processor
    bool use_cache = true;                                        // false: every request goes to the source

    /**
     * Checks cache_size > 0 and request_cache_limit < cache_size
     */
    Result<void> validate() const;

    /**
     * Read options from the keys cache_size, request_cache_limit,
     * slot_count and use_cache; missing keys keep their defaults.
     * Values of the wrong type or out of range are reported as errors.
     */
    static Result<RandomOptions> from_config(const utils::Config& config);
};

} // namespace cryptorand::crypto
