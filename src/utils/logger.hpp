#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace cryptorand::utils {

/**
 * Logging system wrapper around spdlog
 */
class Logger {
public:
    /**
     * Initialize the logging system
     * @param level Log level (trace, debug, info, warn, error, critical, off)
     * @param log_to_file Whether to log to file in addition to console
     */
    static void init(const std::string& level = "info", bool log_to_file = false);

    /**
     * Get the logger instance, initializing it with defaults on first use
     */
    static std::shared_ptr<spdlog::logger> get();

private:
    static std::shared_ptr<spdlog::logger> logger_;
    static std::mutex mutex_;
};

} // namespace cryptorand::utils

// Convenience macros
#define CRYPTORAND_LOG_TRACE(...)    cryptorand::utils::Logger::get()->trace(__VA_ARGS__)
#define CRYPTORAND_LOG_DEBUG(...)    cryptorand::utils::Logger::get()->debug(__VA_ARGS__)
#define CRYPTORAND_LOG_INFO(...)     cryptorand::utils::Logger::get()->info(__VA_ARGS__)
#define CRYPTORAND_LOG_WARN(...)     cryptorand::utils::Logger::get()->warn(__VA_ARGS__)
#define CRYPTORAND_LOG_ERROR(...)    cryptorand::utils::Logger::get()->error(__VA_ARGS__)
#define CRYPTORAND_LOG_CRITICAL(...) cryptorand::utils::Logger::get()->critical(__VA_ARGS__)
