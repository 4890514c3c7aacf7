#pragma once

#include "cryptorand/common.hpp"
#include "entropy_source.hpp"
#include "random_options.hpp"
#include <atomic>
#include <limits>
#include <memory>

namespace cryptorand::crypto {

class ByteCache;

/**
 * Cryptographically secure random number generator
 *
 * Small requests are served from per-processor byte caches that amortize
 * calls into the entropy source; requests above
 * RandomOptions::request_cache_limit go to the source directly. No byte is
 * ever handed out twice, across threads or calls. All members are safe to
 * call concurrently.
 *
 * Also usable as a UniformRandomBitGenerator with <random> and <algorithm>.
 */
class CryptoRandom {
public:
    using result_type = uint64_t;

    /**
     * Generator over libsodium's randombytes with default options
     */
    CryptoRandom();

    /**
     * @param source Entropy source, must not be null
     * @param options Cache tuning
     * @throws ArgumentException if source is null
     * @throws ConfigException if options fail validation
     */
    explicit CryptoRandom(std::shared_ptr<EntropySource> source,
                          RandomOptions options = RandomOptions());
    ~CryptoRandom();

    CRYPTORAND_DISALLOW_COPY_AND_MOVE(CryptoRandom);

    /**
     * Random int32 in [0, INT32_MAX)
     */
    int32_t next_non_negative_int();

    /**
     * Random int32 in [0, max_value), or 0 when max_value is 0
     * @throws ArgumentException (OutOfRange) if max_value < 0
     */
    int32_t next_int(int32_t max_value);

    /**
     * Random int32 in [min_value, max_value), or min_value when equal
     * @throws ArgumentException (OutOfRange) if min_value > max_value
     */
    int32_t next_int(int32_t min_value, int32_t max_value);

    /**
     * Random int64 in [0, INT64_MAX)
     */
    int64_t next_int64();

    /**
     * Random int64 in [0, max_value)
     * @throws ArgumentException (OutOfRange) if max_value < 0
     */
    int64_t next_int64(int64_t max_value);

    /**
     * Random int64 in [min_value, max_value)
     * @throws ArgumentException (OutOfRange) if min_value > max_value
     */
    int64_t next_int64(int64_t min_value, int64_t max_value);

    /**
     * Fill buffer with random bytes
     * @throws ArgumentException (InvalidArgument) if buffer is null and size > 0
     */
    void next_bytes(byte* buffer, size_t size);

    void next_bytes(bytes& buffer) {
        next_bytes(buffer.data(), buffer.size());
    }

    template<size_t N>
    void next_bytes(fixed_bytes<N>& buffer) {
        next_bytes(buffer.data(), buffer.size());
    }

    /**
     * Random double in [0, 1) with 53 bits of precision
     */
    double next_double();

    /**
     * Random float in [0, 1) with 24 bits of precision
     */
    float next_single();

    double sample() { return next_double(); }

    // UniformRandomBitGenerator
    static constexpr result_type min() { return std::numeric_limits<result_type>::min(); }
    static constexpr result_type max() { return std::numeric_limits<result_type>::max(); }
    result_type operator()();

    size_t slot_count() const { return slot_count_; }
    const RandomOptions& options() const { return options_; }

    /**
     * Cursor of a slot's byte cache, or nullopt if the slot has not been used yet
     */
    std::optional<size_t> cache_position(size_t slot) const;

private:
    void fill(byte* buffer, size_t size);
    ByteCache& cache_for_slot(size_t slot);

    std::shared_ptr<EntropySource> source_;
    RandomOptions options_;
    size_t slot_count_;
    std::unique_ptr<std::atomic<ByteCache*>[]> caches_;
};

} // namespace cryptorand::crypto
