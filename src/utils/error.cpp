#include "murmur/error.hpp"
#include <sstream>

namespace murmur {

const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::Unknown: return "Unknown error";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        
        case ErrorCode::NetworkConnectionFailed: return "Connection failed";
        case ErrorCode::NetworkTimeout: return "Network timeout";
        case ErrorCode::NetworkDisconnected: return "Disconnected";
        case ErrorCode::NetworkTorFailed: return "Tor control failed";
        
        case ErrorCode::MalformedAdvertisement: return "Malformed advertisement";
        case ErrorCode::StaleAdvertisement: return "Stale advertisement";
        
        case ErrorCode::NotInitialized: return "Not initialized";
        case ErrorCode::InitializationFailed: return "Initialization failed";
        
        case ErrorCode::ConfigInvalidValue: return "Invalid configuration value";
        case ErrorCode::ConfigParseFailed: return "Configuration parse failed";
        
        case ErrorCode::InvalidFormat: return "Invalid format";
        
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

} // namespace murmur
