#include "byte_cache.hpp"
#include "cryptorand/error.hpp"
#include <sodium.h>
#include <algorithm>
#include <cstring>

namespace cryptorand::crypto {

ByteCache::ByteCache(size_t capacity)
    : capacity_(capacity), bytes_(capacity), position_(capacity) {
    if (capacity_ == 0) {
        throw ArgumentException(ErrorCode::InvalidArgument, "byte cache capacity must be positive");
    }
}

ByteCache::~ByteCache() {
    sodium_memzero(bytes_.data(), bytes_.size());
}

void ByteCache::take(EntropySource& source, byte* buffer, size_t size) {
    if (size > capacity_) {
        throw ArgumentException(ErrorCode::OutOfRange, "request exceeds byte cache capacity");
    }
    if (size == 0) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    size_t start = position_;
    if (start + size > capacity_) {
        // Stays exhausted if the refill throws part way through
        position_ = capacity_;
        source.fill(bytes_.data(), capacity_);
        start = 0;
    }

    position_ = start + size;

    byte* served = bytes_.data() + start;
    std::memcpy(buffer, served, size);
    sodium_memzero(served, size);
}

size_t ByteCache::position() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return position_;
}

bool ByteCache::region_is_zero(size_t offset, size_t length) const {
    if (offset > capacity_ || length > capacity_ - offset) {
        throw ArgumentException(ErrorCode::OutOfRange, "region outside byte cache");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto begin = bytes_.begin() + static_cast<std::ptrdiff_t>(offset);
    return std::all_of(begin, begin + static_cast<std::ptrdiff_t>(length),
                       [](byte b) { return b == 0; });
}

} // namespace cryptorand::crypto
