#pragma once

#include "murmur/common.hpp"
#include <stdexcept>
#include <string>
#include <variant>

namespace murmur {

// Error codes for structured error handling
enum class ErrorCode {
    // Generic errors
    Success = 0,
    Unknown,
    InvalidArgument,
    
    // Network errors
    NetworkConnectionFailed,
    NetworkTimeout,
    NetworkDisconnected,
    NetworkTorFailed,
    
    // Advertisement errors
    MalformedAdvertisement,
    StaleAdvertisement,
    
    // Lifecycle errors
    NotInitialized,
    InitializationFailed,
    
    // Configuration errors
    ConfigInvalidValue,
    ConfigParseFailed,
    
    // Serialization errors
    InvalidFormat
};

// Convert error code to string
const char* error_code_to_string(ErrorCode code);

// Error class with structured information
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}
    
    Error(ErrorCode code, std::string message, std::string details)
        : code_(code), message_(std::move(message)), details_(std::move(details)) {}
    
    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }
    const std::string& details() const { return details_; }
    
    std::string to_string() const;
    
private:
    ErrorCode code_;
    std::string message_;
    std::string details_;
};

// Result type for error handling
template<typename T>
class Result {
public:
    static Result Ok(T value) {
        return Result(std::move(value));
    }
    
    static Result Err(Error error) {
        return Result(std::move(error));
    }
    
    static Result Err(ErrorCode code, const std::string& message) {
        return Result(Error(code, message));
    }
    
    bool is_ok() const { return std::holds_alternative<T>(value_); }
    bool is_err() const { return std::holds_alternative<Error>(value_); }
    
    // Get the value (throws if error)
    T& value() {
        if (is_err()) {
            throw std::runtime_error("Called value() on error Result: " + error().to_string());
        }
        return std::get<T>(value_);
    }
    
    const T& value() const {
        if (is_err()) {
            throw std::runtime_error("Called value() on error Result: " + error().to_string());
        }
        return std::get<T>(value_);
    }
    
    // Get the error (throws if ok)
    const Error& error() const {
        if (is_ok()) {
            throw std::runtime_error("Called error() on ok Result");
        }
        return std::get<Error>(value_);
    }
    
private:
    explicit Result(T value) : value_(std::move(value)) {}
    explicit Result(Error error) : value_(std::move(error)) {}
    
    std::variant<T, Error> value_;
};

// Custom exception classes
class MurmurException : public std::runtime_error {
public:
    MurmurException(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}
    
    ErrorCode code() const { return code_; }
    
private:
    ErrorCode code_;
};

class NetworkException : public MurmurException {
public:
    NetworkException(ErrorCode code, const std::string& message)
        : MurmurException(code, "Network error: " + message) {}
};

class ProtocolException : public MurmurException {
public:
    ProtocolException(ErrorCode code, const std::string& message)
        : MurmurException(code, "Protocol error: " + message) {}
};

class ConfigException : public MurmurException {
public:
    ConfigException(ErrorCode code, const std::string& message)
        : MurmurException(code, "Config error: " + message) {}
};

class StateException : public MurmurException {
public:
    StateException(ErrorCode code, const std::string& message)
        : MurmurException(code, "State error: " + message) {}
};

} // namespace murmur
