#pragma once

#include "cryptorand/common.hpp"
#include "cryptorand/error.hpp"
#include <limits>

/**
 * Conversion of raw random bytes into unbiased integers and floats
 *
 * Every sampler takes a `fill` callable with signature
 * `void(byte* buffer, size_t size)` that writes fresh random bytes. Multi-byte
 * values are always decoded little-endian, whatever the host byte order.
 */
namespace cryptorand::crypto::distribution {

inline uint32_t load_le32(const byte* p) {
    return static_cast<uint32_t>(p[0])
         | (static_cast<uint32_t>(p[1]) << 8)
         | (static_cast<uint32_t>(p[2]) << 16)
         | (static_cast<uint32_t>(p[3]) << 24);
}

inline uint64_t load_le64(const byte* p) {
    return static_cast<uint64_t>(load_le32(p))
         | (static_cast<uint64_t>(load_le32(p + 4)) << 32);
}

/**
 * Smallest 2^n - 1 that is >= range
 */
constexpr uint32_t range_mask(uint32_t range) {
    uint32_t mask = range;
    mask |= mask >> 1;
    mask |= mask >> 2;
    mask |= mask >> 4;
    mask |= mask >> 8;
    mask |= mask >> 16;
    return mask;
}

constexpr uint64_t range_mask(uint64_t range) {
    uint64_t mask = range;
    mask |= mask >> 1;
    mask |= mask >> 2;
    mask |= mask >> 4;
    mask |= mask >> 8;
    mask |= mask >> 16;
    mask |= mask >> 32;
    return mask;
}

// Top 53 bits scaled by 2^-53, so 1.0 is unreachable
constexpr double to_double(uint64_t bits) {
    return static_cast<double>(bits >> (64 - constants::DOUBLE_MANTISSA_BITS))
         * (1.0 / static_cast<double>(uint64_t(1) << constants::DOUBLE_MANTISSA_BITS));
}

// Top 24 bits scaled by 2^-24
constexpr float to_single(uint32_t bits) {
    return static_cast<float>(bits >> (32 - constants::SINGLE_MANTISSA_BITS))
         * (1.0f / static_cast<float>(uint32_t(1) << constants::SINGLE_MANTISSA_BITS));
}

template<typename Fill>
uint32_t draw_uint32(Fill& fill) {
    fixed_bytes<4> buf;
    fill(buf.data(), buf.size());
    return load_le32(buf.data());
}

template<typename Fill>
uint64_t draw_uint64(Fill& fill) {
    fixed_bytes<8> buf;
    fill(buf.data(), buf.size());
    return load_le64(buf.data());
}

/**
 * Uniform int32 in [0, INT32_MAX)
 */
template<typename Fill>
int32_t non_negative_int32(Fill&& fill) {
    constexpr uint32_t max = static_cast<uint32_t>(std::numeric_limits<int32_t>::max());
    uint32_t result;
    do {
        result = draw_uint32(fill) & max;  // drop the sign bit
    } while (result == max);
    return static_cast<int32_t>(result);
}

/**
 * Uniform int64 in [0, INT64_MAX)
 */
template<typename Fill>
int64_t non_negative_int64(Fill&& fill) {
    constexpr uint64_t max = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
    uint64_t result;
    do {
        result = draw_uint64(fill) & max;
    } while (result == max);
    return static_cast<int64_t>(result);
}

/**
 * Uniform int32 in [min_value, max_value), or min_value when they are equal
 *
 * Masked rejection sampling: draws are masked to the smallest power of two
 * covering the range and redrawn while they fall outside it. At least half
 * of all draws are accepted.
 *
 * @throws ArgumentException (OutOfRange) if min_value > max_value, before any
 *         byte is drawn
 */
template<typename Fill>
int32_t int32_in_range(Fill&& fill, int32_t min_value, int32_t max_value) {
    if (min_value == max_value) {
        return min_value;
    }
    if (min_value > max_value) {
        throw ArgumentException(ErrorCode::OutOfRange, "min_value is greater than max_value");
    }

    // Number of possible results minus one; wraps correctly for the full int32 span
    uint32_t range = static_cast<uint32_t>(max_value) - static_cast<uint32_t>(min_value) - 1u;
    if (range == 0) {
        return min_value;
    }

    const uint32_t mask = range_mask(range);
    uint32_t result;
    do {
        result = draw_uint32(fill) & mask;
    } while (result > range);

    return static_cast<int32_t>(static_cast<int64_t>(min_value) + result);
}

/**
 * Uniform int64 in [min_value, max_value), or min_value when they are equal
 *
 * @throws ArgumentException (OutOfRange) if min_value > max_value
 */
template<typename Fill>
int64_t int64_in_range(Fill&& fill, int64_t min_value, int64_t max_value) {
    if (min_value == max_value) {
        return min_value;
    }
    if (min_value > max_value) {
        throw ArgumentException(ErrorCode::OutOfRange, "min_value is greater than max_value");
    }

    uint64_t range = static_cast<uint64_t>(max_value) - static_cast<uint64_t>(min_value) - 1u;
    if (range == 0) {
        return min_value;
    }

    const uint64_t mask = range_mask(range);
    uint64_t result;
    do {
        result = draw_uint64(fill) & mask;
    } while (result > range);

    // min_value + result lies in [min_value, max_value); add in unsigned to avoid signed overflow
    uint64_t sum = static_cast<uint64_t>(min_value) + result;
    if (sum > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        return -static_cast<int64_t>(~sum) - 1;
    }
    return static_cast<int64_t>(sum);
}

template<typename Fill>
double unit_double(Fill&& fill) {
    return to_double(draw_uint64(fill));
}

template<typename Fill>
float unit_single(Fill&& fill) {
    return to_single(draw_uint32(fill));
}

} // namespace cryptorand::crypto::distribution
