#include "config.hpp"
#include "murmur/error.hpp"
#include <fstream>

namespace murmur::utils {

Config Config::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigException(ErrorCode::ConfigParseFailed, "Failed to open config file: " + path);
    }
    
    Config config;
    try {
        file >> config.data_;
    } catch (const json::parse_error& e) {
        throw ConfigException(ErrorCode::ConfigParseFailed,
                              "Failed to parse config file: " + std::string(e.what()));
    }
    
    if (!config.data_.is_object()) {
        throw ConfigException(ErrorCode::ConfigParseFailed, "Config root must be an object: " + path);
    }
    
    return config;
}

Config Config::load_from_json(const std::string& json_str) {
    Config config;
    try {
        config.data_ = json::parse(json_str);
    } catch (const json::parse_error& e) {
        throw ConfigException(ErrorCode::ConfigParseFailed,
                              "Failed to parse JSON: " + std::string(e.what()));
    }
    
    if (!config.data_.is_object()) {
        throw ConfigException(ErrorCode::ConfigParseFailed, "Config root must be an object");
    }
    
    return config;
}

} // namespace murmur::utils
