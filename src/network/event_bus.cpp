#include "network/event_bus.hpp"
#include "murmur/time_utils.hpp"
#include "utils/logger.hpp"
#include <vector>

namespace murmur::network {

namespace {

struct EventName {
    EventType type;
    const char* name;
};

constexpr EventName EVENT_NAMES[] = {
    {EventType::Initialized, "initialized"},
    {EventType::Error, "error"},
    {EventType::PeerDiscovered, "peer_discovered"},
    {EventType::PeerConnected, "peer_connected"},
    {EventType::PeerDisconnected, "peer_disconnected"},
    {EventType::PostReceived, "post_received"},
    {EventType::PostCreated, "post_created"},
    {EventType::SyncStarted, "sync_started"},
    {EventType::SyncCompleted, "sync_completed"},
    {EventType::SyncError, "sync_error"},
    {EventType::NetworkStatusChanged, "network_status_changed"},
    {EventType::TorStatusChanged, "tor_status_changed"},
    {EventType::Disconnected, "disconnected"},
};

} // namespace

const char* event_type_to_string(EventType type) {
    for (const auto& entry : EVENT_NAMES) {
        if (entry.type == type) {
            return entry.name;
        }
    }
    return "unknown";
}

std::optional<EventType> event_type_from_string(const std::string& name) {
    for (const auto& entry : EVENT_NAMES) {
        if (name == entry.name) {
            return entry.type;
        }
    }
    return std::nullopt;
}

EventBus::SubscriptionId EventBus::subscribe(EventType type, Handler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    SubscriptionId id = next_id_++;
    subscriptions_.emplace(id, Subscription{type, std::move(handler)});
    return id;
}

EventBus::SubscriptionId EventBus::subscribe_all(Handler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    SubscriptionId id = next_id_++;
    subscriptions_.emplace(id, Subscription{std::nullopt, std::move(handler)});
    return id;
}

bool EventBus::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscriptions_.erase(id) > 0;
}

void EventBus::unsubscribe_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    subscriptions_.clear();
}

void EventBus::publish(EventType type, EventPayload payload) {
    Event event{type, time::timestamp_milliseconds(), std::move(payload)};
    
    // Snapshot matching handlers so callbacks run without the lock held
    std::vector<Handler> handlers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, subscription] : subscriptions_) {
            if (!subscription.type || *subscription.type == type) {
                handlers.push_back(subscription.handler);
            }
        }
    }
    
    MURMUR_LOG_TRACE("Publishing {} to {} handler(s)", event_type_to_string(type), handlers.size());
    
    for (const auto& handler : handlers) {
        try {
            handler(event);
        } catch (const std::exception& e) {
            MURMUR_LOG_ERROR("Event handler for {} threw: {}", event_type_to_string(type), e.what());
        }
    }
}

size_t EventBus::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscriptions_.size();
}

} // namespace murmur::network
