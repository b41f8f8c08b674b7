#pragma once

#include "murmur/common.hpp"
#include "network/peer.hpp"
#include <nlohmann/json.hpp>
#include <vector>

namespace murmur::network {

enum class SyncStatus {
    Idle,
    Syncing,
    Error
};

/**
 * TorStatus - State of the Tor circuit as last known to this node
 */
enum class TorStatus {
    Disconnected,
    Connecting,
    Connected,
    Error
};

const char* sync_status_to_string(SyncStatus status);
const char* tor_status_to_string(TorStatus status);

/**
 * NetworkStatus - Aggregate health snapshot, always derived, never edited
 */
struct NetworkStatus {
    bool is_connected = false;
    size_t active_peers = 0;
    size_t total_peers = 0;
    SyncStatus sync_status = SyncStatus::Idle;
    Timestamp last_sync_time = 0;
    double network_latency = 0.0;  // Estimated, milliseconds
    bool tor_enabled = false;
    TorStatus tor_status = TorStatus::Disconnected;
};

void to_json(nlohmann::json& j, const NetworkStatus& status);

/**
 * TaskState - Inputs to the status snapshot that do not come from the registry
 */
struct TaskState {
    SyncStatus sync_status = SyncStatus::Idle;
    Timestamp last_sync_time = 0;
    bool tor_enabled = false;
    TorStatus tor_status = TorStatus::Disconnected;
    double network_latency = 0.0;  // Last estimate, kept when no peer is active
};

/**
 * StatusAggregator - Pure computation of NetworkStatus
 */
class StatusAggregator {
public:
    static NetworkStatus compute(const std::vector<PeerInfo>& peers, const TaskState& state);
    
    /**
     * Mean latency estimate over the active peers, nullopt if none is active
     */
    static std::optional<double> estimate_latency(const std::vector<PeerInfo>& peers);
};

} // namespace murmur::network
