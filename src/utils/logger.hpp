#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace murmur::utils {

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
     * Get the logger instance
     */
    static std::shared_ptr<spdlog::logger> get();
    
private:
    static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace murmur::utils

// Convenience macros
#define MURMUR_LOG_TRACE(...)    murmur::utils::Logger::get()->trace(__VA_ARGS__)
#define MURMUR_LOG_DEBUG(...)    murmur::utils::Logger::get()->debug(__VA_ARGS__)
#define MURMUR_LOG_INFO(...)     murmur::utils::Logger::get()->info(__VA_ARGS__)
#define MURMUR_LOG_WARN(...)     murmur::utils::Logger::get()->warn(__VA_ARGS__)
#define MURMUR_LOG_ERROR(...)    murmur::utils::Logger::get()->error(__VA_ARGS__)
#define MURMUR_LOG_CRITICAL(...) murmur::utils::Logger::get()->critical(__VA_ARGS__)
