#pragma once

#include "murmur/common.hpp"
#include "utils/config.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <optional>

namespace murmur::network {

/**
 * P2PConfigPatch - Partial configuration; unset fields keep their current value
 */
struct P2PConfigPatch {
    std::optional<bool> enable_auto_discovery;
    std::optional<bool> enable_tor;
    std::optional<size_t> max_peers;
    std::optional<std::chrono::milliseconds> sync_interval;
    std::optional<std::chrono::milliseconds> heartbeat_interval;
    std::optional<std::chrono::milliseconds> connection_timeout;
    std::optional<std::chrono::milliseconds> discovery_interval;
    std::optional<uint16_t> listen_port;
    std::optional<uint16_t> tor_socks_port;
    
    /**
     * Read camelCase keys from a config document (intervals in milliseconds).
     * @throws ConfigException if a present key has the wrong type or range
     */
    static P2PConfigPatch from_config(const utils::Config& config);
};

/**
 * P2PConfig - Settings of one coordinator session
 */
struct P2PConfig {
    bool enable_auto_discovery = true;
    bool enable_tor = false;
    size_t max_peers = constants::DEFAULT_MAX_PEERS;
    std::chrono::milliseconds sync_interval{constants::DEFAULT_SYNC_INTERVAL_MS};
    std::chrono::milliseconds heartbeat_interval{constants::DEFAULT_HEARTBEAT_INTERVAL_MS};
    std::chrono::milliseconds connection_timeout{constants::DEFAULT_CONNECTION_TIMEOUT_MS};
    std::chrono::milliseconds discovery_interval{constants::DEFAULT_DISCOVERY_INTERVAL_MS};
    uint16_t listen_port = constants::DEFAULT_PORT;
    uint16_t tor_socks_port = constants::DEFAULT_TOR_SOCKS_PORT;
    
    P2PConfig merged(const P2PConfigPatch& patch) const;
    
    /**
     * @throws ConfigException on zero intervals, zero max_peers or port 0
     */
    void validate() const;
};

void to_json(nlohmann::json& j, const P2PConfig& config);

} // namespace murmur::network
