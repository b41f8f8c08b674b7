#include "network/p2p_config.hpp"
#include "murmur/error.hpp"
#include <limits>

namespace murmur::network {

namespace {

using json = nlohmann::json;

const json* find_key(const utils::Config& config, const char* key) {
    const auto& data = config.data();
    auto it = data.find(key);
    if (it == data.end() || it->is_null()) {
        return nullptr;
    }
    return &*it;
}

std::optional<bool> read_bool(const utils::Config& config, const char* key) {
    const json* value = find_key(config, key);
    if (!value) {
        return std::nullopt;
    }
    if (!value->is_boolean()) {
        throw ConfigException(ErrorCode::ConfigInvalidValue, std::string(key) + " must be a boolean");
    }
    return value->get<bool>();
}

std::optional<uint64_t> read_unsigned(const utils::Config& config, const char* key, uint64_t max) {
    const json* value = find_key(config, key);
    if (!value) {
        return std::nullopt;
    }
    if (!value->is_number_integer() || (!value->is_number_unsigned() && value->get<int64_t>() < 0)) {
        throw ConfigException(ErrorCode::ConfigInvalidValue, std::string(key) + " must be a non-negative integer");
    }
    auto result = value->get<uint64_t>();
    if (result > max) {
        throw ConfigException(ErrorCode::ConfigInvalidValue,
                              std::string(key) + " exceeds " + std::to_string(max));
    }
    return result;
}

std::optional<std::chrono::milliseconds> read_interval(const utils::Config& config, const char* key) {
    auto value = read_unsigned(config, key, static_cast<uint64_t>(std::numeric_limits<int64_t>::max()));
    if (!value) {
        return std::nullopt;
    }
    return std::chrono::milliseconds(static_cast<int64_t>(*value));
}

std::optional<uint16_t> read_port(const utils::Config& config, const char* key) {
    auto value = read_unsigned(config, key, 65535);
    if (!value) {
        return std::nullopt;
    }
    return static_cast<uint16_t>(*value);
}

} // namespace

P2PConfigPatch P2PConfigPatch::from_config(const utils::Config& config) {
    P2PConfigPatch patch;
    patch.enable_auto_discovery = read_bool(config, "enableAutoDiscovery");
    patch.enable_tor = read_bool(config, "enableTor");
    if (auto max_peers = read_unsigned(config, "maxPeers", std::numeric_limits<uint32_t>::max())) {
        patch.max_peers = static_cast<size_t>(*max_peers);
    }
    patch.sync_interval = read_interval(config, "syncInterval");
    patch.heartbeat_interval = read_interval(config, "heartbeatInterval");
    patch.connection_timeout = read_interval(config, "connectionTimeout");
    patch.discovery_interval = read_interval(config, "discoveryInterval");
    patch.listen_port = read_port(config, "listenPort");
    patch.tor_socks_port = read_port(config, "torSocksPort");
    return patch;
}

P2PConfig P2PConfig::merged(const P2PConfigPatch& patch) const {
    P2PConfig result = *this;
    if (patch.enable_auto_discovery) result.enable_auto_discovery = *patch.enable_auto_discovery;
    if (patch.enable_tor) result.enable_tor = *patch.enable_tor;
    if (patch.max_peers) result.max_peers = *patch.max_peers;
    if (patch.sync_interval) result.sync_interval = *patch.sync_interval;
    if (patch.heartbeat_interval) result.heartbeat_interval = *patch.heartbeat_interval;
    if (patch.connection_timeout) result.connection_timeout = *patch.connection_timeout;
    if (patch.discovery_interval) result.discovery_interval = *patch.discovery_interval;
    if (patch.listen_port) result.listen_port = *patch.listen_port;
    if (patch.tor_socks_port) result.tor_socks_port = *patch.tor_socks_port;
    return result;
}

void P2PConfig::validate() const {
    if (max_peers == 0) {
        throw ConfigException(ErrorCode::ConfigInvalidValue, "maxPeers must be positive");
    }
    if (sync_interval.count() <= 0 || heartbeat_interval.count() <= 0 ||
        discovery_interval.count() <= 0) {
        throw ConfigException(ErrorCode::ConfigInvalidValue, "task intervals must be positive");
    }
    if (connection_timeout.count() <= 0) {
        throw ConfigException(ErrorCode::ConfigInvalidValue, "connectionTimeout must be positive");
    }
    if (listen_port == 0 || tor_socks_port == 0) {
        throw ConfigException(ErrorCode::ConfigInvalidValue, "ports must be non-zero");
    }
}

void to_json(nlohmann::json& j, const P2PConfig& config) {
    j = nlohmann::json{
        {"enableAutoDiscovery", config.enable_auto_discovery},
        {"enableTor", config.enable_tor},
        {"maxPeers", config.max_peers},
        {"syncInterval", config.sync_interval.count()},
        {"heartbeatInterval", config.heartbeat_interval.count()},
        {"connectionTimeout", config.connection_timeout.count()},
        {"discoveryInterval", config.discovery_interval.count()},
        {"listenPort", config.listen_port},
        {"torSocksPort", config.tor_socks_port}
    };
}

} // namespace murmur::network
