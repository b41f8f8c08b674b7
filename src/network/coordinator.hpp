#pragma once

#include "murmur/common.hpp"
#include "murmur/error.hpp"
#include "network/advertisement.hpp"
#include "network/event_bus.hpp"
#include "network/network_status.hpp"
#include "network/p2p_config.hpp"
#include "network/peer.hpp"
#include "network/task_scheduler.hpp"
#include "network/transport.hpp"
#include "storage/post_store.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

namespace murmur::network {

/**
 * NetworkCoordinator - Client-side coordination core of the feed network
 *
 * Owns the peer registry, post store, scan history and the periodic
 * discovery / heartbeat / sync tasks, and delegates all real networking to
 * an injected Transport. Domain events go out through an EventBus.
 *
 * Concurrency:
 * - Each periodic task runs on its own scheduler worker; public operations
 *   run on the caller's thread. Registry and store are internally locked.
 * - Only one sync pass runs at a time. A pass requested while another is in
 *   flight is dropped (logged), never queued.
 * - disconnect() stops scheduling without waiting for calls in flight. Each
 *   initialize() opens a new session and results that arrive for an older
 *   session are discarded. Results are applied under a shared session lock
 *   that initialize() and disconnect() take exclusively.
 * - Events are never published while a coordinator lock is held, so handlers
 *   may call back into the coordinator.
 */
class NetworkCoordinator {
public:
    class Builder {
    public:
        Builder& with_transport(std::shared_ptr<Transport> transport);
        Builder& with_event_bus(std::shared_ptr<EventBus> bus);
        Builder& with_base_config(const P2PConfig& config);

        /**
         * @throws StateException if no transport was supplied
         */
        std::unique_ptr<NetworkCoordinator> build();

    private:
        std::shared_ptr<Transport> transport_;
        std::shared_ptr<EventBus> bus_;
        P2PConfig base_config_;
    };

    NetworkCoordinator(std::shared_ptr<Transport> transport,
                       std::shared_ptr<EventBus> bus,
                       P2PConfig base_config = P2PConfig{});
    ~NetworkCoordinator();

    MURMUR_DISALLOW_COPY_AND_MOVE(NetworkCoordinator);

    // Lifecycle

    /**
     * Merge the patch over the base config, bring up the transport and start
     * the periodic tasks. A second call while initialized is a no-op.
     * @throws on any failure; the coordinator is then left uninitialized with
     *         its previous config, the transport is stopped again and an
     *         "error" event of type initialization_failed is published
     */
    void initialize(const P2PConfigPatch& patch = P2PConfigPatch{});

    /**
     * Stop the periodic tasks, drop every peer connection and clear all
     * local state. Publishes "disconnected".
     */
    void disconnect();

    bool is_initialized() const { return initialized_; }
    P2PConfig config() const;

    // Peers

    /**
     * One discovery pass. Returns the peers that were not known before.
     * @throws StateException if not initialized, or the transport's exception
     */
    std::vector<PeerInfo> discover_peers();

    /**
     * Ask the transport to connect to address:port. Transport failures are
     * logged, published as an "error" event and reported as false.
     * @throws StateException if not initialized
     */
    bool connect_to_peer(const std::string& address, uint16_t port);

    /**
     * Parse an advertisement, record it in the scan history, connect and
     * admit the advertised peer.
     */
    Result<PeerAdvertisement> connect_to_advertisement(const std::string& text);

    // One heartbeat pass over the active peers
    void run_heartbeat();

    std::vector<PeerInfo> get_peers() const;
    std::vector<PeerInfo> get_active_peers() const;
    std::vector<PeerAdvertisement> get_scan_history() const;

    // Posts

    /**
     * Store a new local post, then offer it to every active peer. Broadcast
     * failures never undo the local insertion.
     * @throws StateException if not initialized
     */
    storage::Post create_post(const std::string& content, const std::string& pseudonym);

    // One sync pass; no-op if another pass is in flight
    void synchronize_posts();

    // Newest first
    std::vector<storage::Post> get_posts() const;

    // Status
    NetworkStatus get_network_status() const;

    // Tor

    /**
     * @throws the transport's exception; Tor state is then left unchanged
     */
    void set_tor_enabled(bool enabled);
    TorStatusReport get_tor_status() const;

    // Events
    EventBus::SubscriptionId subscribe(EventType type, EventBus::Handler handler);
    EventBus::SubscriptionId subscribe_all(EventBus::Handler handler);
    bool unsubscribe(EventBus::SubscriptionId id);
    void unsubscribe_all();

private:
    std::shared_ptr<Transport> transport_;
    std::shared_ptr<EventBus> bus_;
    const P2PConfig base_config_;

    PeerRegistry registry_;
    storage::PostStore posts_;
    ScanHistory scan_history_;
    TaskScheduler scheduler_;

    // config_ and task_state_
    mutable std::mutex state_mutex_;
    P2PConfig config_;
    TaskState task_state_;

    // Serializes initialize() and disconnect()
    std::mutex lifecycle_mutex_;

    // Shared while a result is applied, exclusive while the session changes
    mutable std::shared_mutex session_mutex_;

    std::atomic<bool> initialized_{false};
    std::atomic<uint64_t> session_{0};
    std::atomic<bool> sync_in_progress_{false};

    void require_initialized(const char* operation) const;
    bool is_current(uint64_t session) const;
    // Owns the lock only if the session is still current
    std::shared_lock<std::shared_mutex> lock_session(uint64_t session) const;

    void start_background_tasks(const P2PConfig& config);
    void discovery_tick();

    bool open_connection(const std::string& address, uint16_t port);
    bool merge_remote_post(const RemotePost& remote, uint64_t session);
    void broadcast_post(const storage::Post& post, uint64_t session);
    std::string local_node_id();

    void on_transport_event(const TransportEvent& event);

    void set_sync_status(SyncStatus status, std::optional<Timestamp> completed_at = std::nullopt);
    void refresh_status();
    void stop_transport();

    TorStatusReport apply_tor(bool enabled);

    static std::string generate_post_id(Timestamp now_ms);
};

} // namespace murmur::network
