#include "network/coordinator.hpp"
#include "crypto/random.hpp"
#include "murmur/time_utils.hpp"
#include "utils/logger.hpp"
#include <exception>

namespace murmur::network {

namespace {

constexpr const char* POST_ID_ALPHABET = "0123456789abcdefghijklmnopqrstuvwxyz";
constexpr size_t POST_ID_SUFFIX_LENGTH = 9;

} // namespace

// Builder

NetworkCoordinator::Builder& NetworkCoordinator::Builder::with_transport(std::shared_ptr<Transport> transport) {
    transport_ = std::move(transport);
    return *this;
}

NetworkCoordinator::Builder& NetworkCoordinator::Builder::with_event_bus(std::shared_ptr<EventBus> bus) {
    bus_ = std::move(bus);
    return *this;
}

NetworkCoordinator::Builder& NetworkCoordinator::Builder::with_base_config(const P2PConfig& config) {
    base_config_ = config;
    return *this;
}

std::unique_ptr<NetworkCoordinator> NetworkCoordinator::Builder::build() {
    if (!transport_) {
        throw StateException(ErrorCode::InvalidArgument, "NetworkCoordinator requires a transport");
    }
    if (!bus_) {
        bus_ = std::make_shared<EventBus>();
    }
    return std::make_unique<NetworkCoordinator>(transport_, bus_, base_config_);
}

// NetworkCoordinator

NetworkCoordinator::NetworkCoordinator(std::shared_ptr<Transport> transport,
                                       std::shared_ptr<EventBus> bus,
                                       P2PConfig base_config)
    : transport_(std::move(transport)),
      bus_(std::move(bus)),
      base_config_(std::move(base_config)),
      config_(base_config_)
{
    if (!transport_) {
        throw StateException(ErrorCode::InvalidArgument, "NetworkCoordinator requires a transport");
    }
    if (!bus_) {
        bus_ = std::make_shared<EventBus>();
    }
}

NetworkCoordinator::~NetworkCoordinator() {
    {
        std::unique_lock<std::shared_mutex> session_lock(session_mutex_);
        initialized_ = false;
        session_++;
    }
    transport_->set_event_handler(nullptr);
    scheduler_.cancel_all();
    scheduler_.join_all();
}

void NetworkCoordinator::initialize(const P2PConfigPatch& patch) {
    P2PConfig merged;
    uint64_t session = 0;
    std::optional<TorStatusReport> tor_report;
    std::exception_ptr failure;
    std::string failure_message;
    {
        std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);

        if (initialized_) {
            MURMUR_LOG_INFO("P2P network already initialized");
            return;
        }

        P2PConfig previous_config;
        TaskState previous_state;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            previous_config = config_;
            previous_state = task_state_;
        }
        bool started = false;

        try {
            merged = base_config_.merged(patch);
            merged.validate();

            MURMUR_LOG_INFO("Initializing P2P network (port {}, tor socks {}, max peers {})",
                            merged.listen_port, merged.tor_socks_port, merged.max_peers);

            transport_->init(merged.listen_port, merged.tor_socks_port);
            transport_->start();
            started = true;

            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                config_ = merged;
                task_state_ = TaskState{};
            }
            registry_.set_capacity(merged.max_peers);

            if (merged.enable_tor) {
                tor_report = apply_tor(true);
            }

            transport_->set_event_handler([this](const TransportEvent& event) {
                on_transport_event(event);
            });

            {
                std::unique_lock<std::shared_mutex> session_lock(session_mutex_);
                registry_.clear();
                posts_.clear();
                scan_history_.clear();
                session = ++session_;
                initialized_ = true;
            }
            start_background_tasks(merged);
        } catch (const std::exception& e) {
            {
                std::unique_lock<std::shared_mutex> session_lock(session_mutex_);
                initialized_ = false;
                session_++;
            }
            scheduler_.cancel_all();
            transport_->set_event_handler(nullptr);
            if (started) {
                stop_transport();
            }

            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                config_ = previous_config;
                task_state_ = previous_state;
            }
            registry_.set_capacity(previous_config.max_peers);

            MURMUR_LOG_ERROR("Failed to initialize P2P network: {}", e.what());
            failure = std::current_exception();
            failure_message = e.what();
        }
    }

    if (failure) {
        bus_->publish(EventType::Error, ErrorReport{"initialization_failed", failure_message});
        std::rethrow_exception(failure);
    }

    if (tor_report) {
        bus_->publish(EventType::TorStatusChanged, *tor_report);
        if (!is_current(session)) {
            return;
        }
        refresh_status();
    }

    if (!is_current(session)) {
        return;
    }
    MURMUR_LOG_INFO("P2P network initialized");
    bus_->publish(EventType::Initialized, merged);
}

void NetworkCoordinator::start_background_tasks(const P2PConfig& config) {
    if (config.enable_auto_discovery) {
        scheduler_.schedule_every("discovery", config.discovery_interval, [this]() { discovery_tick(); });
    }
    scheduler_.schedule_every("heartbeat", config.heartbeat_interval, [this]() { run_heartbeat(); });
    scheduler_.schedule_every("sync", config.sync_interval, [this]() { synchronize_posts(); });
}

void NetworkCoordinator::discovery_tick() {
    if (!initialized_) {
        return;
    }

    try {
        discover_peers();
    } catch (const std::exception& e) {
        MURMUR_LOG_ERROR("Peer discovery failed: {}", e.what());
    }
}

void NetworkCoordinator::disconnect() {
    {
        std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);

        if (!initialized_) {
            MURMUR_LOG_DEBUG("Disconnect requested while not initialized");
            return;
        }

        MURMUR_LOG_INFO("Disconnecting from P2P network...");

        // Anything still in flight belongs to the old session from here on
        std::vector<PeerInfo> active;
        {
            std::unique_lock<std::shared_mutex> session_lock(session_mutex_);
            initialized_ = false;
            session_++;

            active = registry_.snapshot_active();
            registry_.clear();
            posts_.clear();
            scan_history_.clear();

            std::lock_guard<std::mutex> lock(state_mutex_);
            task_state_ = TaskState{};
        }

        scheduler_.cancel_all();
        transport_->set_event_handler(nullptr);

        for (const auto& peer : active) {
            try {
                transport_->disconnect_from_peer(peer.node_id);
            } catch (const MurmurException& e) {
                MURMUR_LOG_WARN("Failed to disconnect from peer {}: {}", peer.node_id, e.what());
            }
        }
        stop_transport();
    }

    MURMUR_LOG_INFO("Disconnected from P2P network");
    bus_->publish(EventType::Disconnected);
}

void NetworkCoordinator::stop_transport() {
    try {
        transport_->stop();
    } catch (const MurmurException& e) {
        MURMUR_LOG_WARN("Failed to stop transport: {}", e.what());
    }
}

P2PConfig NetworkCoordinator::config() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return config_;
}

void NetworkCoordinator::require_initialized(const char* operation) const {
    if (!initialized_) {
        throw StateException(ErrorCode::NotInitialized,
                             std::string(operation) + " requires an initialized network");
    }
}

bool NetworkCoordinator::is_current(uint64_t session) const {
    return initialized_ && session_ == session;
}

std::shared_lock<std::shared_mutex> NetworkCoordinator::lock_session(uint64_t session) const {
    std::shared_lock<std::shared_mutex> lock(session_mutex_);
    if (!is_current(session)) {
        lock.unlock();
    }
    return lock;
}

// Peers

std::vector<PeerInfo> NetworkCoordinator::discover_peers() {
    require_initialized("discover_peers");
    uint64_t session = session_;

    MURMUR_LOG_DEBUG("Discovering peers...");
    auto discovered = transport_->discover_peers();

    std::vector<PeerInfo> new_peers;
    Timestamp now = time::timestamp_milliseconds();

    for (const auto& descriptor : discovered) {
        if (descriptor.node_id.empty()) {
            MURMUR_LOG_WARN("Skipping discovered peer without node id at {}:{}",
                            descriptor.address, descriptor.port);
            continue;
        }

        std::optional<PeerInfo> info;
        {
            auto guard = lock_session(session);
            if (!guard) {
                MURMUR_LOG_DEBUG("Ignoring discovery results from a closed session");
                return new_peers;
            }
            if (!registry_.admit(descriptor, now)) {
                continue;
            }
            info = registry_.get(descriptor.node_id);
        }

        if (info) {
            new_peers.push_back(*info);
            bus_->publish(EventType::PeerDiscovered, *info);
        }
    }

    MURMUR_LOG_INFO("Discovered {} new peers", new_peers.size());

    if (!new_peers.empty() && is_current(session)) {
        refresh_status();
    }
    return new_peers;
}

bool NetworkCoordinator::open_connection(const std::string& address, uint16_t port) {
    std::string endpoint = address + ":" + std::to_string(port);
    MURMUR_LOG_INFO("Connecting to peer {}", endpoint);

    try {
        if (!transport_->connect_to_peer(endpoint)) {
            MURMUR_LOG_INFO("Failed to connect to peer {}", endpoint);
            return false;
        }
    } catch (const MurmurException& e) {
        MURMUR_LOG_ERROR("Connection to peer {} failed: {}", endpoint, e.what());
        bus_->publish(EventType::Error, ErrorReport{"connection_failed", e.what()});
        return false;
    }

    MURMUR_LOG_INFO("Connected to peer {}", endpoint);
    return true;
}

bool NetworkCoordinator::connect_to_peer(const std::string& address, uint16_t port) {
    require_initialized("connect_to_peer");
    uint64_t session = session_;

    if (address.empty() || port == 0) {
        MURMUR_LOG_WARN("Refusing to connect to invalid endpoint '{}:{}'", address, port);
        return false;
    }

    if (!open_connection(address, port)) {
        return false;
    }

    size_t revived = 0;
    {
        auto guard = lock_session(session);
        if (!guard) {
            return false;
        }
        revived = registry_.mark_active_by_endpoint(address, port, time::timestamp_milliseconds());
    }
    bus_->publish(EventType::PeerConnected, PeerEndpoint{address, port, std::nullopt});

    if (revived > 0 && is_current(session)) {
        refresh_status();
    }
    return true;
}

Result<PeerAdvertisement> NetworkCoordinator::connect_to_advertisement(const std::string& text) {
    require_initialized("connect_to_advertisement");
    uint64_t session = session_;

    auto parsed = parse_advertisement(text, time::timestamp_milliseconds());
    if (parsed.is_err()) {
        MURMUR_LOG_WARN("Advertisement rejected: {}", parsed.error().to_string());
        return parsed;
    }

    const auto& adv = parsed.value();
    auto closed = [&]() {
        return Result<PeerAdvertisement>::Err(ErrorCode::NetworkDisconnected,
                                              "network was disconnected while connecting");
    };

    {
        auto guard = lock_session(session);
        if (!guard) {
            return closed();
        }
        scan_history_.record(adv);
    }

    if (!open_connection(adv.address, adv.port)) {
        return Result<PeerAdvertisement>::Err(
            ErrorCode::NetworkConnectionFailed,
            "could not connect to " + adv.address + ":" + std::to_string(adv.port));
    }

    {
        auto guard = lock_session(session);
        if (!guard) {
            return closed();
        }
        Timestamp now = time::timestamp_milliseconds();
        if (!registry_.admit(adv.to_descriptor(), now)) {
            registry_.mark_active(adv.node_id, now);
        }
    }

    bus_->publish(EventType::PeerConnected, PeerEndpoint{adv.address, adv.port, adv.node_id});
    if (is_current(session)) {
        refresh_status();
    }
    return parsed;
}

void NetworkCoordinator::run_heartbeat() {
    if (!initialized_) {
        return;
    }
    uint64_t session = session_;

    // Ping a snapshot; the live table may change while we wait on the transport
    auto peers = registry_.snapshot_active();
    size_t failures = 0;

    for (const auto& peer : peers) {
        bool alive = true;
        try {
            transport_->send_heartbeat(peer.node_id);
        } catch (const std::exception& e) {
            MURMUR_LOG_WARN("Heartbeat to peer {} failed: {}", peer.node_id, e.what());
            alive = false;
        }

        std::optional<PeerInfo> lost;
        {
            auto guard = lock_session(session);
            if (!guard) {
                MURMUR_LOG_DEBUG("Ignoring heartbeat results from a closed session");
                return;
            }
            if (alive) {
                registry_.mark_active(peer.node_id, time::timestamp_milliseconds());
                continue;
            }
            ++failures;
            if (registry_.mark_inactive(peer.node_id)) {
                lost = registry_.get(peer.node_id).value_or(peer);
            }
        }

        if (lost) {
            bus_->publish(EventType::PeerDisconnected, *lost);
        }
    }

    MURMUR_LOG_DEBUG("Heartbeat pass: {} peer(s) pinged, {} unresponsive", peers.size(), failures);
    if (is_current(session)) {
        refresh_status();
    }
}

std::vector<PeerInfo> NetworkCoordinator::get_peers() const {
    return registry_.snapshot_all();
}

std::vector<PeerInfo> NetworkCoordinator::get_active_peers() const {
    return registry_.snapshot_active();
}

std::vector<PeerAdvertisement> NetworkCoordinator::get_scan_history() const {
    return scan_history_.entries();
}

// Posts

std::string NetworkCoordinator::generate_post_id(Timestamp now_ms) {
    return "post_" + std::to_string(now_ms) + "_" +
           crypto::Random::token(POST_ID_SUFFIX_LENGTH, POST_ID_ALPHABET);
}

std::string NetworkCoordinator::local_node_id() {
    try {
        auto node_id = transport_->get_node_id();
        if (!node_id.empty()) {
            return node_id;
        }
        MURMUR_LOG_WARN("Transport reported an empty node id");
    } catch (const MurmurException& e) {
        MURMUR_LOG_ERROR("Failed to get node id: {}", e.what());
    }
    return constants::UNKNOWN_NODE_ID;
}

storage::Post NetworkCoordinator::create_post(const std::string& content, const std::string& pseudonym) {
    require_initialized("create_post");
    uint64_t session = session_;

    storage::Post post;
    post.content = content;
    post.pseudonym = pseudonym;
    post.timestamp = time::timestamp_milliseconds();
    post.node_id = local_node_id();

    {
        auto guard = lock_session(session);
        if (!guard) {
            throw StateException(ErrorCode::NotInitialized, "network was disconnected while creating a post");
        }
        do {
            post.id = generate_post_id(post.timestamp);
        } while (!posts_.insert(post));
    }

    MURMUR_LOG_INFO("Created post {}", post.id);
    bus_->publish(EventType::PostCreated, post);

    broadcast_post(post, session);
    return post;
}

void NetworkCoordinator::broadcast_post(const storage::Post& post, uint64_t session) {
    auto peers = registry_.snapshot_active();
    size_t delivered = 0;

    for (const auto& peer : peers) {
        if (!is_current(session)) {
            return;
        }

        try {
            transport_->broadcast_post(peer.node_id, post);
            ++delivered;
        } catch (const MurmurException& e) {
            MURMUR_LOG_WARN("Failed to broadcast post {} to peer {}: {}", post.id, peer.node_id, e.what());
        }
    }

    MURMUR_LOG_DEBUG("Broadcast post {} to {}/{} peer(s)", post.id, delivered, peers.size());
}

bool NetworkCoordinator::merge_remote_post(const RemotePost& remote, uint64_t session) {
    if (remote.id.empty()) {
        MURMUR_LOG_WARN("Dropping remote post without id");
        return false;
    }

    storage::Post post;
    post.id = remote.id;
    post.content = remote.content;
    post.pseudonym = remote.pseudonym;
    post.timestamp = remote.timestamp;
    post.node_id = remote.node_id;

    {
        auto guard = lock_session(session);
        if (!guard || !posts_.insert(post)) {
            return false;
        }
    }

    bus_->publish(EventType::PostReceived, post);
    return true;
}

void NetworkCoordinator::synchronize_posts() {
    if (!initialized_) {
        MURMUR_LOG_DEBUG("Skipping synchronization: network not initialized");
        return;
    }

    bool expected = false;
    if (!sync_in_progress_.compare_exchange_strong(expected, true)) {
        MURMUR_LOG_DEBUG("Synchronization already in progress");
        return;
    }

    struct SyncFlagReset {
        std::atomic<bool>& flag;
        ~SyncFlagReset() { flag = false; }
    } reset{sync_in_progress_};

    uint64_t session = session_;

    {
        auto guard = lock_session(session);
        if (!guard) {
            return;
        }
        set_sync_status(SyncStatus::Syncing);
    }

    MURMUR_LOG_INFO("Starting post synchronization...");
    bus_->publish(EventType::SyncStarted);

    try {
        SyncReport report;
        auto peers = registry_.snapshot_active();

        for (const auto& peer : peers) {
            SyncResponse response;
            try {
                response = transport_->sync_with_peer(peer.node_id);
            } catch (const MurmurException& e) {
                MURMUR_LOG_WARN("Sync with peer {} failed: {}", peer.node_id, e.what());
                ++report.peers_failed;
                continue;
            }

            for (const auto& remote : response.posts) {
                if (!is_current(session)) {
                    MURMUR_LOG_DEBUG("Discarding sync results from a closed session");
                    return;
                }
                if (merge_remote_post(remote, session)) {
                    ++report.posts_received;
                }
            }

            if (!is_current(session)) {
                MURMUR_LOG_DEBUG("Discarding sync results from a closed session");
                return;
            }
            ++report.peers_synced;
        }

        report.timestamp = time::timestamp_milliseconds();
        {
            auto guard = lock_session(session);
            if (!guard) {
                return;
            }
            set_sync_status(SyncStatus::Idle, report.timestamp);
        }

        MURMUR_LOG_INFO("Synchronization complete: {} new post(s) from {} peer(s), {} failed",
                        report.posts_received, report.peers_synced, report.peers_failed);
        bus_->publish(EventType::SyncCompleted, report);
    } catch (const std::exception& e) {
        {
            auto guard = lock_session(session);
            if (!guard) {
                return;
            }
            set_sync_status(SyncStatus::Error);
        }

        MURMUR_LOG_ERROR("Post synchronization failed: {}", e.what());
        bus_->publish(EventType::SyncError, ErrorReport{"sync_failed", e.what()});
    }
}

std::vector<storage::Post> NetworkCoordinator::get_posts() const {
    return posts_.newest_first();
}

// Status

void NetworkCoordinator::set_sync_status(SyncStatus status, std::optional<Timestamp> completed_at) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    task_state_.sync_status = status;
    if (completed_at) {
        task_state_.last_sync_time = *completed_at;
    }
}

NetworkStatus NetworkCoordinator::get_network_status() const {
    auto peers = registry_.snapshot_all();

    std::lock_guard<std::mutex> lock(state_mutex_);
    return StatusAggregator::compute(peers, task_state_);
}

void NetworkCoordinator::refresh_status() {
    auto peers = registry_.snapshot_all();

    NetworkStatus status;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        status = StatusAggregator::compute(peers, task_state_);
        task_state_.network_latency = status.network_latency;
    }

    bus_->publish(EventType::NetworkStatusChanged, status);
}

// Tor

TorStatusReport NetworkCoordinator::apply_tor(bool enabled) {
    try {
        if (enabled) {
            transport_->enable_tor();
        } else {
            transport_->disable_tor();
        }
    } catch (const std::exception& e) {
        MURMUR_LOG_ERROR("Failed to {} Tor: {}", enabled ? "enable" : "disable", e.what());
        throw;
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    task_state_.tor_enabled = enabled;
    // Connected/Error arrive later on the transport's event channel
    task_state_.tor_status = enabled ? TorStatus::Connecting : TorStatus::Disconnected;

    MURMUR_LOG_INFO("Tor {}", enabled ? "enabled, connecting" : "disabled");
    return TorStatusReport{task_state_.tor_enabled, task_state_.tor_status};
}

void NetworkCoordinator::set_tor_enabled(bool enabled) {
    auto report = apply_tor(enabled);
    bus_->publish(EventType::TorStatusChanged, report);
    refresh_status();
}

TorStatusReport NetworkCoordinator::get_tor_status() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return TorStatusReport{task_state_.tor_enabled, task_state_.tor_status};
}

// Transport reports

void NetworkCoordinator::on_transport_event(const TransportEvent& event) {
    uint64_t session = session_;
    if (!is_current(session)) {
        MURMUR_LOG_TRACE("Ignoring transport event while not initialized");
        return;
    }

    if (const auto* tor = std::get_if<TransportTorReport>(&event)) {
        TorStatusReport report;
        {
            auto guard = lock_session(session);
            if (!guard) {
                return;
            }
            std::lock_guard<std::mutex> lock(state_mutex_);
            task_state_.tor_status = tor->status;
            report = TorStatusReport{task_state_.tor_enabled, task_state_.tor_status};
        }
        MURMUR_LOG_INFO("Tor status is now {}", tor_status_to_string(tor->status));
        bus_->publish(EventType::TorStatusChanged, report);
        if (is_current(session)) {
            refresh_status();
        }
    } else if (const auto* discovered = std::get_if<TransportPeerDiscovered>(&event)) {
        if (discovered->peer.node_id.empty()) {
            MURMUR_LOG_WARN("Transport reported a peer without node id");
            return;
        }
        std::optional<PeerInfo> info;
        {
            auto guard = lock_session(session);
            if (!guard || !registry_.admit(discovered->peer, time::timestamp_milliseconds())) {
                return;
            }
            info = registry_.get(discovered->peer.node_id);
        }
        if (info) {
            bus_->publish(EventType::PeerDiscovered, *info);
        }
        if (is_current(session)) {
            refresh_status();
        }
    } else if (const auto* lost = std::get_if<TransportPeerDisconnected>(&event)) {
        std::optional<PeerInfo> info;
        {
            auto guard = lock_session(session);
            if (!guard || !registry_.mark_inactive(lost->node_id)) {
                return;
            }
            info = registry_.get(lost->node_id);
        }
        if (info) {
            bus_->publish(EventType::PeerDisconnected, *info);
        }
        if (is_current(session)) {
            refresh_status();
        }
    } else if (const auto* received = std::get_if<TransportPostReceived>(&event)) {
        merge_remote_post(received->post, session);
    }
}

// Events

EventBus::SubscriptionId NetworkCoordinator::subscribe(EventType type, EventBus::Handler handler) {
    return bus_->subscribe(type, std::move(handler));
}

EventBus::SubscriptionId NetworkCoordinator::subscribe_all(EventBus::Handler handler) {
    return bus_->subscribe_all(std::move(handler));
}

bool NetworkCoordinator::unsubscribe(EventBus::SubscriptionId id) {
    return bus_->unsubscribe(id);
}

void NetworkCoordinator::unsubscribe_all() {
    bus_->unsubscribe_all();
}

} // namespace murmur::network
