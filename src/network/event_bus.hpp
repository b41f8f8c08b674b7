#pragma once

#include "murmur/common.hpp"
#include "network/network_status.hpp"
#include "network/p2p_config.hpp"
#include "network/peer.hpp"
#include "storage/post_store.hpp"
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <variant>

namespace murmur::network {

/**
 * EventType - Domain events published to subscribers
 */
enum class EventType {
    Initialized,
    Error,
    PeerDiscovered,
    PeerConnected,
    PeerDisconnected,
    PostReceived,
    PostCreated,
    SyncStarted,
    SyncCompleted,
    SyncError,
    NetworkStatusChanged,
    TorStatusChanged,
    Disconnected
};

// Wire names: "peer_discovered", "sync_completed", ...
const char* event_type_to_string(EventType type);
std::optional<EventType> event_type_from_string(const std::string& name);

struct PeerEndpoint {
    std::string address;
    uint16_t port = 0;
    std::optional<std::string> node_id;
};

struct ErrorReport {
    std::string type;     // e.g. "initialization_failed", "connection_failed", "sync_failed"
    std::string message;
};

struct SyncReport {
    Timestamp timestamp = 0;
    size_t posts_received = 0;
    size_t peers_synced = 0;
    size_t peers_failed = 0;
};

struct TorStatusReport {
    bool enabled = false;
    TorStatus status = TorStatus::Disconnected;
};

using EventPayload = std::variant<
    std::monostate,
    P2PConfig,
    ErrorReport,
    PeerInfo,
    PeerEndpoint,
    storage::Post,
    SyncReport,
    NetworkStatus,
    TorStatusReport
>;

struct Event {
    EventType type;
    Timestamp timestamp = 0;
    EventPayload payload;
};

/**
 * EventBus - Fan-out of domain events to subscribers
 * 
 * Handlers run synchronously on the publishing thread, outside the bus lock,
 * so they may subscribe or unsubscribe from within a callback. An exception
 * thrown by one handler is logged and does not stop delivery to the others.
 */
class EventBus {
public:
    using Handler = std::function<void(const Event&)>;
    using SubscriptionId = uint64_t;
    
    EventBus() = default;
    ~EventBus() = default;
    
    MURMUR_DISALLOW_COPY(EventBus);
    
    SubscriptionId subscribe(EventType type, Handler handler);
    SubscriptionId subscribe_all(Handler handler);
    
    bool unsubscribe(SubscriptionId id);
    void unsubscribe_all();
    
    void publish(EventType type, EventPayload payload = std::monostate{});
    
    size_t subscriber_count() const;
    
private:
    struct Subscription {
        std::optional<EventType> type;  // nullopt = every event
        Handler handler;
    };
    
    mutable std::mutex mutex_;
    std::map<SubscriptionId, Subscription> subscriptions_;
    SubscriptionId next_id_ = 1;
};

} // namespace murmur::network
