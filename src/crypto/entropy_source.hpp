#pragma once

#include "cryptorand/common.hpp"

namespace cryptorand::crypto {

/**
 * Supplier of cryptographically secure random bytes
 *
 * Implementations must be safe to call concurrently and must either fill
 * the whole buffer or throw CryptoException. Output is never substituted
 * with weaker or predictable bytes.
 */
class EntropySource {
public:
    virtual ~EntropySource() = default;

    /**
     * Fill buffer with secure random bytes
     * @param buffer Destination, may be null only when size is 0
     * @param size Number of bytes to write
     */
    virtual void fill(byte* buffer, size_t size) = 0;
};

/**
 * Operating system CSPRNG via libsodium's randombytes
 */
class SodiumEntropySource : public EntropySource {
public:
    /**
     * Initializes libsodium
     * @throws CryptoException if sodium_init() fails
     */
    SodiumEntropySource();

    void fill(byte* buffer, size_t size) override;
};

} // namespace cryptorand::crypto
