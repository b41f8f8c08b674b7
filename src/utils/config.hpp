#pragma once

#include <string>
#include <optional>
#include <nlohmann/json.hpp>

namespace murmur::utils {

using json = nlohmann::json;

/**
 * Configuration management system
 * Backed by a JSON document
 */
class Config {
public:
    Config() = default;
    
    /**
     * Load configuration from JSON file
     */
    static Config load_from_file(const std::string& path);
    
    /**
     * Load configuration from JSON string
     */
    static Config load_from_json(const std::string& json_str);
    
    /**
     * Get a value from config, nullopt if absent or of another type
     */
    template<typename T>
    std::optional<T> get(const std::string& key) const {
        if (!data_.is_object() || !data_.contains(key)) {
            return std::nullopt;
        }
        try {
            return data_.at(key).get<T>();
        } catch (const json::exception&) {
            return std::nullopt;
        }
    }
    
    /**
     * Get a value with default
     */
    template<typename T>
    T get_or(const std::string& key, const T& default_value) const {
        auto value = get<T>(key);
        return value.value_or(default_value);
    }
    
    template<typename T>
    void set(const std::string& key, const T& value) {
        data_[key] = value;
    }
    
    bool has(const std::string& key) const {
        return data_.is_object() && data_.contains(key);
    }
    
    /**
     * Get underlying JSON object
     */
    const json& data() const { return data_; }
    
private:
    json data_ = json::object();
};

} // namespace murmur::utils
