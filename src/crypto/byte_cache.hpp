#pragma once

#include "cryptorand/common.hpp"
#include "entropy_source.hpp"
#include <mutex>

namespace cryptorand::crypto {

/**
 * Fixed-size buffer of random bytes handed out front to back
 *
 * Every byte is served at most once: the position is advanced before bytes
 * are copied out, and the served bytes are wiped in the backing buffer right
 * after the copy. All access goes through the internal mutex.
 */
class ByteCache {
public:
    /**
     * Creates an exhausted cache; the first take() refills it
     * @param capacity Size of the backing buffer in bytes, > 0
     */
    explicit ByteCache(size_t capacity);
    ~ByteCache();

    CRYPTORAND_DISALLOW_COPY_AND_MOVE(ByteCache);

    /**
     * Copy the next `size` unserved bytes into `buffer`
     *
     * Refills the whole backing buffer from `source` when fewer than `size`
     * bytes remain. If the refill throws, the cache is left exhausted and
     * nothing is copied.
     *
     * @throws ArgumentException if size > capacity()
     * @throws whatever `source.fill` throws
     */
    void take(EntropySource& source, byte* buffer, size_t size);

    size_t capacity() const { return capacity_; }

    /**
     * Offset of the next unserved byte, in [0, capacity()]
     */
    size_t position() const;

    /**
     * True if every backing byte in [offset, offset + length) is zero
     */
    bool region_is_zero(size_t offset, size_t length) const;

private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    bytes bytes_;
    size_t position_;
};

} // namespace cryptorand::crypto
