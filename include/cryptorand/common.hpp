#pragma once

#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <string>
#include <memory>
#include <optional>

// cryptorand Version
#define CRYPTORAND_VERSION_MAJOR 0
#define CRYPTORAND_VERSION_MINOR 1
#define CRYPTORAND_VERSION_PATCH 0
#define CRYPTORAND_VERSION_STRING "0.1.0"

// Platform detection
#if defined(_WIN32) || defined(_WIN64)
    #ifndef CRYPTORAND_PLATFORM_WINDOWS
        #define CRYPTORAND_PLATFORM_WINDOWS
    #endif
#elif defined(__linux__)
    #ifndef CRYPTORAND_PLATFORM_LINUX
        #define CRYPTORAND_PLATFORM_LINUX
    #endif
#elif defined(__APPLE__)
    #ifndef CRYPTORAND_PLATFORM_MACOS
        #define CRYPTORAND_PLATFORM_MACOS
    #endif
#endif

// Utility macros
#define CRYPTORAND_DISALLOW_COPY(TypeName) \
    TypeName(const TypeName&) = delete; \
    TypeName& operator=(const TypeName&) = delete

#define CRYPTORAND_DISALLOW_MOVE(TypeName) \
    TypeName(TypeName&&) = delete; \
    TypeName& operator=(TypeName&&) = delete

#define CRYPTORAND_DISALLOW_COPY_AND_MOVE(TypeName) \
    CRYPTORAND_DISALLOW_COPY(TypeName); \
    CRYPTORAND_DISALLOW_MOVE(TypeName)

// Constants
namespace cryptorand {
namespace constants {

// Byte cache constants
constexpr size_t BYTE_CACHE_SIZE = 4096;                     // per-processor cache, empirically tuned
constexpr size_t REQUEST_CACHE_LIMIT = BYTE_CACHE_SIZE / 4;  // larger requests bypass the cache

// Floating point conversion
constexpr int DOUBLE_MANTISSA_BITS = 53;
constexpr int SINGLE_MANTISSA_BITS = 24;

} // namespace constants
} // namespace cryptorand

// Core types
namespace cryptorand {

// Basic types
using byte = uint8_t;
using bytes = std::vector<byte>;

template<size_t N>
using fixed_bytes = std::array<byte, N>;

} // namespace cryptorand
