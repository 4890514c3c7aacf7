#include "cryptorand/error.hpp"
#include <sstream>

namespace cryptorand {

const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::Unknown: return "Unknown error";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::OutOfRange: return "Out of range";

        case ErrorCode::CryptoInitFailed: return "Crypto initialization failed";
        case ErrorCode::EntropySourceFailed: return "Entropy source failed";

        case ErrorCode::ConfigParseFailed: return "Config parse failed";
        case ErrorCode::ConfigInvalidValue: return "Invalid config value";
        case ErrorCode::ConfigIoFailed: return "Config I/O failed";

        default: return "Unknown error code";
    }
}

std::string Error::to_string() const {
    std::ostringstream oss;
    oss << "[" << error_code_to_string(code_) << "] " << message_;
    if (!details_.empty()) {
        oss << " (" << details_ << ")";
    }
    return oss.str();
}

} // namespace cryptorand
