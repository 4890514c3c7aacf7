#include "logger.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <vector>

namespace cryptorand::utils {

std::shared_ptr<spdlog::logger> Logger::logger_;
std::mutex Logger::mutex_;

void Logger::init(const std::string& level, bool log_to_file) {
    std::vector<spdlog::sink_ptr> sinks;

    // Console sink
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
    sinks.push_back(console_sink);

    // File sink (optional)
    if (log_to_file) {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            "cryptorand.log",
            1024 * 1024 * 10,  // 10MB
            3                   // 3 rotating files
        );
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
        sinks.push_back(file_sink);
    }

    auto logger = std::make_shared<spdlog::logger>("cryptorand", sinks.begin(), sinks.end());

    // Unknown names fall back to info
    auto parsed = spdlog::level::from_str(level);
    if (parsed == spdlog::level::off && level != "off") {
        parsed = spdlog::level::info;
    }
    logger->set_level(parsed);

    // Flush on error or higher
    logger->flush_on(spdlog::level::err);

    std::lock_guard<std::mutex> lock(mutex_);
    logger_ = logger;

    // Register as default logger
    spdlog::set_default_logger(logger_);
}

std::shared_ptr<spdlog::logger> Logger::get() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (logger_) {
            return logger_;
        }
    }
    init();
    std::lock_guard<std::mutex> lock(mutex_);
    return logger_;
}

} // namespace cryptorand::utils
