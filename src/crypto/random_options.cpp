#include "random_options.hpp"
#include "utils/config.hpp"
#include "utils/logger.hpp"
#include <string>

namespace cryptorand::crypto {

namespace {
    // Reads a non-negative integer key into out; absent keys leave out unchanged
    Result<void> read_size(const utils::Config& config, const std::string& key, size_t& out) {
        if (!config.has(key)) {
            return Result<void>::Ok();
        }
        const auto& value = config.data().at(key);
        if (!value.is_number_integer()) {
            return Result<void>::Err(Error(ErrorCode::ConfigInvalidValue,
                                           key + " must be an integer", value.dump()));
        }
        if (value.is_number_unsigned()) {
            out = value.get<size_t>();
            return Result<void>::Ok();
        }
        auto signed_value = value.get<int64_t>();
        if (signed_value < 0) {
            return Result<void>::Err(Error(ErrorCode::ConfigInvalidValue,
                                           key + " must not be negative", value.dump()));
        }
        out = static_cast<size_t>(signed_value);
        return Result<void>::Ok();
    }
}

Result<void> RandomOptions::validate() const {
    if (cache_size == 0) {
        return Result<void>::Err(ErrorCode::ConfigInvalidValue, "cache_size must be positive");
    }
    if (request_cache_limit >= cache_size) {
        return Result<void>::Err(Error(ErrorCode::ConfigInvalidValue,
                                       "request_cache_limit must be less than cache_size",
                                       std::to_string(request_cache_limit) + " >= " +
                                       std::to_string(cache_size)));
    }
    return Result<void>::Ok();
}

Result<RandomOptions> RandomOptions::from_config(const utils::Config& config) {
    RandomOptions options;

    for (auto read : {read_size(config, "cache_size", options.cache_size),
                      read_size(config, "request_cache_limit", options.request_cache_limit),
                      read_size(config, "slot_count", options.slot_count)}) {
        if (read.is_err()) {
            CRYPTORAND_LOG_ERROR("Invalid random options: {}", read.error().to_string());
            return Result<RandomOptions>::Err(read.error());
        }
    }

    if (config.has("use_cache")) {
        auto use_cache = config.get<bool>("use_cache");
        if (!use_cache) {
            CRYPTORAND_LOG_ERROR("Invalid random options: use_cache must be a boolean");
            return Result<RandomOptions>::Err(ErrorCode::ConfigInvalidValue, "use_cache must be a boolean");
        }
        options.use_cache = *use_cache;
    }

    auto valid = options.validate();
    if (valid.is_err()) {
        CRYPTORAND_LOG_ERROR("Invalid random options: {}", valid.error().to_string());
        return Result<RandomOptions>::Err(valid.error());
    }
    return Result<RandomOptions>::Ok(options);
}

} // namespace cryptorand::crypto
