#pragma once

#include "murmur/common.hpp"
#include <nlohmann/json.hpp>
#include <limits>
#include <map>
#include <set>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace murmur::network {

/**
 * ConnectionQuality - Coarse latency classification of a peer link
 */
enum class ConnectionQuality {
    Excellent,  // < 100 ms
    Good,       // < 200 ms
    Fair,       // < 500 ms
    Poor
};

const char* connection_quality_to_string(ConnectionQuality quality);

/**
 * Classify a latency measurement. A missing measurement counts as Good.
 */
ConnectionQuality quality_from_latency(std::optional<uint32_t> latency_ms);

/**
 * Representative latency of a quality bucket, used for network latency estimates
 */
uint32_t latency_estimate_ms(ConnectionQuality quality);

/**
 * PeerDescriptor - A peer as reported by discovery or an advertisement
 */
struct PeerDescriptor {
    std::string node_id;
    std::string address;
    uint16_t port = 0;
    std::string public_key;
    std::vector<std::string> capabilities;
    std::optional<uint32_t> latency_ms;
};

/**
 * PeerInfo - Registry entry for a known peer
 */
struct PeerInfo {
    std::string node_id;
    std::string address;
    uint16_t port = 0;
    std::string public_key;
    std::set<std::string> capabilities;
    ConnectionQuality connection_quality = ConnectionQuality::Good;
    Timestamp last_seen = 0;
    bool is_active = false;
    
    std::string endpoint() const;
};

void to_json(nlohmann::json& j, const PeerInfo& peer);

/**
 * PeerRegistry - Authoritative in-memory table of known peers
 * 
 * Entries are keyed by node id and are never removed individually; liveness
 * is tracked through the is_active flag. All operations are synchronous and
 * safe to call from the periodic task workers concurrently.
 */
class PeerRegistry {
public:
    explicit PeerRegistry(size_t capacity = std::numeric_limits<size_t>::max());
    ~PeerRegistry() = default;
    
    // Upper bound on entries; admit() refuses new peers once reached
    void set_capacity(size_t capacity);
    size_t capacity() const;
    
    /**
     * Insert a peer if its node id is unknown and the table is not full.
     * @return true if the peer was newly added, false if already present or full
     */
    bool admit(const PeerDescriptor& descriptor, Timestamp now_ms);
    
    // Liveness. Return false if the node id is unknown.
    bool mark_inactive(const std::string& node_id);
    bool mark_active(const std::string& node_id, Timestamp now_ms);
    
    // Flip every entry at address:port back to active, returns how many matched
    size_t mark_active_by_endpoint(const std::string& address, uint16_t port, Timestamp now_ms);
    
    std::optional<PeerInfo> get(const std::string& node_id) const;
    bool contains(const std::string& node_id) const;
    
    std::vector<PeerInfo> snapshot_active() const;
    std::vector<PeerInfo> snapshot_all() const;
    
    size_t size() const;
    size_t active_count() const;
    
    void clear();
    
private:
    mutable std::mutex mutex_;
    size_t capacity_;
    std::map<std::string, PeerInfo> peers_;
};

} // namespace murmur::network
