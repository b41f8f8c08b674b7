#include "logger.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <mutex>
#include <vector>

namespace murmur::utils {

std::shared_ptr<spdlog::logger> Logger::logger_;

namespace {

std::mutex logger_mutex;

std::shared_ptr<spdlog::logger> make_logger(const std::string& level, bool log_to_file) {
    std::vector<spdlog::sink_ptr> sinks;
    
    // Console sink
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
    sinks.push_back(console_sink);
    
    // File sink (optional)
    if (log_to_file) {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            "murmur.log",
            1024 * 1024 * 10,  // 10MB
            3                   // 3 rotating files
        );
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
        sinks.push_back(file_sink);
    }
    
    auto logger = std::make_shared<spdlog::logger>("murmur", sinks.begin(), sinks.end());
    
    if (level == "trace") {
        logger->set_level(spdlog::level::trace);
    } else if (level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (level == "info") {
        logger->set_level(spdlog::level::info);
    } else if (level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (level == "error") {
        logger->set_level(spdlog::level::err);
    } else if (level == "critical") {
        logger->set_level(spdlog::level::critical);
    } else if (level == "off") {
        logger->set_level(spdlog::level::off);
    } else {
        logger->set_level(spdlog::level::info);
    }
    
    // Flush on error or higher
    logger->flush_on(spdlog::level::err);
    return logger;
}

} // namespace

void Logger::init(const std::string& level, bool log_to_file) {
    auto logger = make_logger(level, log_to_file);
    
    std::lock_guard<std::mutex> lock(logger_mutex);
    logger_ = logger;
    spdlog::set_default_logger(logger_);
}

std::shared_ptr<spdlog::logger> Logger::get() {
    std::lock_guard<std::mutex> lock(logger_mutex);
    if (!logger_) {
        logger_ = make_logger("info", false);
        spdlog::set_default_logger(logger_);
    }
    return logger_;
}

} // namespace murmur::utils
