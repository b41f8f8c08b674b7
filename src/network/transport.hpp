#pragma once

#include "murmur/common.hpp"
#include "network/peer.hpp"
#include "network/network_status.hpp"
#include "storage/post_store.hpp"
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace murmur::network {

/**
 * RemotePost - A post as returned by a peer during sync
 */
struct RemotePost {
    std::string id;
    std::string content;
    std::string pseudonym;
    Timestamp timestamp = 0;
    std::optional<std::string> node_id;
};

struct SyncResponse {
    std::vector<RemotePost> posts;
};

// Reports the transport pushes on its own channel
struct TransportTorReport {
    TorStatus status;
};

struct TransportPeerDiscovered {
    PeerDescriptor peer;
};

struct TransportPeerDisconnected {
    std::string node_id;
};

struct TransportPostReceived {
    RemotePost post;
};

using TransportEvent = std::variant<
    TransportTorReport,
    TransportPeerDiscovered,
    TransportPeerDisconnected,
    TransportPostReceived
>;

/**
 * Transport - The native networking layer this core delegates to
 * 
 * Owns sockets, cryptographic identity and Tor circuits. Every call may block
 * until it settles; a failed call throws a MurmurException subtype (usually
 * NetworkException). Timeouts are the transport's own business.
 */
class Transport {
public:
    using EventHandler = std::function<void(const TransportEvent&)>;
    
    virtual ~Transport() = default;
    
    // Lifecycle
    virtual void init(uint16_t port, uint16_t tor_socks_port) = 0;
    virtual void start() = 0;
    // Undo start(); the next init() and start() bring the transport up again
    virtual void stop() = 0;
    
    // Peers
    virtual std::vector<PeerDescriptor> discover_peers() = 0;
    virtual bool connect_to_peer(const std::string& endpoint) = 0;
    virtual void disconnect_from_peer(const std::string& node_id) = 0;
    virtual void send_heartbeat(const std::string& node_id) = 0;
    
    // Posts
    virtual SyncResponse sync_with_peer(const std::string& node_id) = 0;
    virtual void broadcast_post(const std::string& node_id, const storage::Post& post) = 0;
    
    // Tor
    virtual void enable_tor() = 0;
    virtual void disable_tor() = 0;
    
    // Identity
    virtual std::string get_node_id() = 0;
    
    /**
     * Register the receiver of unsolicited reports. Passing an empty handler
     * detaches the previous one.
     */
    virtual void set_event_handler(EventHandler handler) = 0;
};

} // namespace murmur::network
