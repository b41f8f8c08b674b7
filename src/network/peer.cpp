#include "network/peer.hpp"
#include "utils/logger.hpp"

namespace murmur::network {

const char* connection_quality_to_string(ConnectionQuality quality) {
    switch (quality) {
        case ConnectionQuality::Excellent: return "excellent";
        case ConnectionQuality::Good: return "good";
        case ConnectionQuality::Fair: return "fair";
        case ConnectionQuality::Poor: return "poor";
    }
    return "good";
}

ConnectionQuality quality_from_latency(std::optional<uint32_t> latency_ms) {
    if (!latency_ms) {
        return ConnectionQuality::Good;
    }
    
    if (*latency_ms < 100) return ConnectionQuality::Excellent;
    if (*latency_ms < 200) return ConnectionQuality::Good;
    if (*latency_ms < 500) return ConnectionQuality::Fair;
    return ConnectionQuality::Poor;
}

uint32_t latency_estimate_ms(ConnectionQuality quality) {
    switch (quality) {
        case ConnectionQuality::Excellent: return 50;
        case ConnectionQuality::Good: return 100;
        case ConnectionQuality::Fair: return 200;
        case ConnectionQuality::Poor: return 500;
    }
    return 100;
}

// PeerInfo methods

std::string PeerInfo::endpoint() const {
    return address + ":" + std::to_string(port);
}

void to_json(nlohmann::json& j, const PeerInfo& peer) {
    j = nlohmann::json{
        {"nodeId", peer.node_id},
        {"address", peer.address},
        {"port", peer.port},
        {"publicKey", peer.public_key},
        {"capabilities", peer.capabilities},
        {"connectionQuality", connection_quality_to_string(peer.connection_quality)},
        {"lastSeen", peer.last_seen},
        {"isActive", peer.is_active}
    };
}

// PeerRegistry methods

PeerRegistry::PeerRegistry(size_t capacity)
    : capacity_(capacity)
{
}

void PeerRegistry::set_capacity(size_t capacity) {
    std::lock_guard<std::mutex> lock(mutex_);
    capacity_ = capacity;
}

size_t PeerRegistry::capacity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return capacity_;
}

bool PeerRegistry::admit(const PeerDescriptor& descriptor, Timestamp now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    if (peers_.find(descriptor.node_id) != peers_.end()) {
        return false;
    }
    
    if (peers_.size() >= capacity_) {
        MURMUR_LOG_WARN("Peer table full ({} peers), not admitting {}", peers_.size(), descriptor.node_id);
        return false;
    }
    
    PeerInfo info;
    info.node_id = descriptor.node_id;
    info.address = descriptor.address;
    info.port = descriptor.port;
    info.public_key = descriptor.public_key;
    info.capabilities.insert(descriptor.capabilities.begin(), descriptor.capabilities.end());
    info.connection_quality = quality_from_latency(descriptor.latency_ms);
    info.last_seen = now_ms;
    info.is_active = true;
    
    peers_.emplace(descriptor.node_id, std::move(info));
    MURMUR_LOG_DEBUG("Admitted peer {} at {}:{}", descriptor.node_id, descriptor.address, descriptor.port);
    return true;
}

bool PeerRegistry::mark_inactive(const std::string& node_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    auto it = peers_.find(node_id);
    if (it == peers_.end()) {
        return false;
    }
    
    it->second.is_active = false;
    return true;
}

bool PeerRegistry::mark_active(const std::string& node_id, Timestamp now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    auto it = peers_.find(node_id);
    if (it == peers_.end()) {
        return false;
    }
    
    it->second.is_active = true;
    it->second.last_seen = now_ms;
    return true;
}

size_t PeerRegistry::mark_active_by_endpoint(const std::string& address, uint16_t port, Timestamp now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    size_t matched = 0;
    for (auto& [node_id, info] : peers_) {
        if (info.address == address && info.port == port) {
            info.is_active = true;
            info.last_seen = now_ms;
            ++matched;
        }
    }
    return matched;
}

std::optional<PeerInfo> PeerRegistry::get(const std::string& node_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    
    auto it = peers_.find(node_id);
    if (it == peers_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool PeerRegistry::contains(const std::string& node_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peers_.find(node_id) != peers_.end();
}

std::vector<PeerInfo> PeerRegistry::snapshot_active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    
    std::vector<PeerInfo> result;
    for (const auto& [node_id, info] : peers_) {
        if (info.is_active) {
            result.push_back(info);
        }
    }
    return result;
}

std::vector<PeerInfo> PeerRegistry::snapshot_all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    
    std::vector<PeerInfo> result;
    result.reserve(peers_.size());
    for (const auto& [node_id, info] : peers_) {
        result.push_back(info);
    }
    return result;
}

size_t PeerRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peers_.size();
}

size_t PeerRegistry::active_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    
    size_t count = 0;
    for (const auto& [node_id, info] : peers_) {
        if (info.is_active) {
            ++count;
        }
    }
    return count;
}

void PeerRegistry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    peers_.clear();
}

} // namespace murmur::network
