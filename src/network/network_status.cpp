#include "network/network_status.hpp"

namespace murmur::network {

const char* sync_status_to_string(SyncStatus status) {
    switch (status) {
        case SyncStatus::Idle: return "idle";
        case SyncStatus::Syncing: return "syncing";
        case SyncStatus::Error: return "error";
    }
    return "idle";
}

const char* tor_status_to_string(TorStatus status) {
    switch (status) {
        case TorStatus::Disconnected: return "disconnected";
        case TorStatus::Connecting: return "connecting";
        case TorStatus::Connected: return "connected";
        case TorStatus::Error: return "error";
    }
    return "disconnected";
}

void to_json(nlohmann::json& j, const NetworkStatus& status) {
    j = nlohmann::json{
        {"isConnected", status.is_connected},
        {"activePeers", status.active_peers},
        {"totalPeers", status.total_peers},
        {"syncStatus", sync_status_to_string(status.sync_status)},
        {"lastSyncTime", status.last_sync_time},
        {"networkLatency", status.network_latency},
        {"torEnabled", status.tor_enabled},
        {"torStatus", tor_status_to_string(status.tor_status)}
    };
}

std::optional<double> StatusAggregator::estimate_latency(const std::vector<PeerInfo>& peers) {
    uint64_t total = 0;
    size_t active = 0;
    
    for (const auto& peer : peers) {
        if (peer.is_active) {
            total += latency_estimate_ms(peer.connection_quality);
            ++active;
        }
    }
    
    if (active == 0) {
        return std::nullopt;
    }
    return static_cast<double>(total) / static_cast<double>(active);
}

NetworkStatus StatusAggregator::compute(const std::vector<PeerInfo>& peers, const TaskState& state) {
    NetworkStatus status;
    
    status.total_peers = peers.size();
    for (const auto& peer : peers) {
        if (peer.is_active) {
            ++status.active_peers;
        }
    }
    status.is_connected = status.active_peers > 0;
    status.network_latency = estimate_latency(peers).value_or(state.network_latency);
    
    status.sync_status = state.sync_status;
    status.last_sync_time = state.last_sync_time;
    status.tor_enabled = state.tor_enabled;
    status.tor_status = state.tor_status;
    
    return status;
}

} // namespace murmur::network
