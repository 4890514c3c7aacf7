#include "crypto_random.hpp"
#include "byte_cache.hpp"
#include "distribution.hpp"
#include "processor_id.hpp"
#include "cryptorand/error.hpp"
#include "utils/logger.hpp"

namespace cryptorand::crypto {

namespace {
    RandomOptions checked(RandomOptions options) {
        auto valid = options.validate();
        if (valid.is_err()) {
            CRYPTORAND_LOG_ERROR("Rejected random options: {}", valid.error().to_string());
            throw ConfigException(valid.error().code(), valid.error().message());
        }
        return options;
    }
}

CryptoRandom::CryptoRandom()
    : CryptoRandom(std::make_shared<SodiumEntropySource>()) {}

CryptoRandom::CryptoRandom(std::shared_ptr<EntropySource> source, RandomOptions options)
    : source_(std::move(source)),
      options_(checked(options)),
      slot_count_(options_.slot_count == 0 ? processor_id::logical_processor_count()
                                            : options_.slot_count),
      caches_(new std::atomic<ByteCache*>[slot_count_]) {
    if (!source_) {
        throw ArgumentException(ErrorCode::InvalidArgument, "entropy source must not be null");
    }
    for (size_t i = 0; i < slot_count_; ++i) {
        caches_[i].store(nullptr, std::memory_order_relaxed);
    }

    CRYPTORAND_LOG_INFO("CryptoRandom ready: {} cache slots of {} bytes, bypass above {} bytes{}",
                        slot_count_, options_.cache_size, options_.request_cache_limit,
                        options_.use_cache ? "" : " (cache disabled)");
}

CryptoRandom::~CryptoRandom() {
    for (size_t i = 0; i < slot_count_; ++i) {
        delete caches_[i].load(std::memory_order_acquire);
    }
}

ByteCache& CryptoRandom::cache_for_slot(size_t slot) {
    std::atomic<ByteCache*>& cell = caches_[slot];
    ByteCache* cache = cell.load(std::memory_order_acquire);
    if (cache) {
        return *cache;
    }

    // First use of this slot: install once, losers adopt the winner's cache
    auto candidate = std::make_unique<ByteCache>(options_.cache_size);
    ByteCache* expected = nullptr;
    if (cell.compare_exchange_strong(expected, candidate.get(),
                                     std::memory_order_acq_rel, std::memory_order_acquire)) {
        CRYPTORAND_LOG_DEBUG("Installed byte cache for slot {}", slot);
        return *candidate.release();
    }
    return *expected;
}

void CryptoRandom::fill(byte* buffer, size_t size) {
    if (size == 0) {
        return;
    }
    if (!options_.use_cache || size > options_.request_cache_limit) {
        source_->fill(buffer, size);
        return;
    }

    size_t slot = processor_id::current_slot(slot_count_);
    cache_for_slot(slot).take(*source_, buffer, size);
}

void CryptoRandom::next_bytes(byte* buffer, size_t size) {
    if (buffer == nullptr && size > 0) {
        throw ArgumentException(ErrorCode::InvalidArgument, "buffer must not be null");
    }
    fill(buffer, size);
}

int32_t CryptoRandom::next_non_negative_int() {
    return distribution::non_negative_int32([this](byte* b, size_t n) { fill(b, n); });
}

int32_t CryptoRandom::next_int(int32_t max_value) {
    if (max_value < 0) {
        throw ArgumentException(ErrorCode::OutOfRange, "max_value must not be negative");
    }
    return next_int(0, max_value);
}

int32_t CryptoRandom::next_int(int32_t min_value, int32_t max_value) {
    return distribution::int32_in_range([this](byte* b, size_t n) { fill(b, n); },
                                        min_value, max_value);
}

int64_t CryptoRandom::next_int64() {
    return distribution::non_negative_int64([this](byte* b, size_t n) { fill(b, n); });
}

int64_t CryptoRandom::next_int64(int64_t max_value) {
    if (max_value < 0) {
        throw ArgumentException(ErrorCode::OutOfRange, "max_value must not be negative");
    }
    return next_int64(0, max_value);
}

int64_t CryptoRandom::next_int64(int64_t min_value, int64_t max_value) {
    return distribution::int64_in_range([this](byte* b, size_t n) { fill(b, n); },
                                        min_value, max_value);
}

double CryptoRandom::next_double() {
    return distribution::unit_double([this](byte* b, size_t n) { fill(b, n); });
}

float CryptoRandom::next_single() {
    return distribution::unit_single([this](byte* b, size_t n) { fill(b, n); });
}

CryptoRandom::result_type CryptoRandom::operator()() {
    fixed_bytes<8> buf;
    fill(buf.data(), buf.size());
    return distribution::load_le64(buf.data());
}

std::optional<size_t> CryptoRandom::cache_position(size_t slot) const {
    if (slot >= slot_count_) {
        throw ArgumentException(ErrorCode::OutOfRange, "slot index out of range");
    }
    const ByteCache* cache = caches_[slot].load(std::memory_order_acquire);
    if (!cache) {
        return std::nullopt;
    }
    return cache->position();
}

} // namespace cryptorand::crypto
