/**
 * @file event_bus.hpp
 * @brief Typed event bus used by the engines to publish per-item outcomes
 *
 * Engines emit events (file copied, chunk rewritten, path deleted, ...)
 * without knowing who listens. The logger and metrics components, and
 * tests that need to observe exactly what an engine did, subscribe here.
 *
 * EXAMPLE:
 * EventBus bus;
 * bus.subscribe<ChunkRewrittenEvent>([](const ChunkRewrittenEvent& e) { ... });
 * publish(&bus, ChunkRewrittenEvent{...});
 */

#pragma once

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace psync::events {

/**
 * @brief One handler list per event type
 *
 * THREAD SAFETY:
 * - Every engine worker may emit concurrently; emitters only take a shared lock
 * - Subscribing and unsubscribing take the exclusive lock
 * - Handlers run synchronously on the emitting worker and must be thread-safe
 */
class EventBus {
public:
    using SubscriptionId = std::size_t;

    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * @brief Register `handler` for every future EventType
     *
     * RETURNS: Id accepted by unsubscribe<EventType>()
     */
    template<typename EventType>
    SubscriptionId subscribe(std::function<void(const EventType&)> handler) {
        std::unique_lock lock(mutex_);
        const SubscriptionId id = next_id_++;
        channel_for<EventType>().handlers.emplace_back(id, std::move(handler));
        return id;
    }

    template<typename EventType>
    void unsubscribe(SubscriptionId id) {
        std::unique_lock lock(mutex_);
        auto* channel = find_channel<EventType>();
        if (channel == nullptr) {
            return;
        }
        auto& handlers = channel->handlers;
        handlers.erase(std::remove_if(handlers.begin(), handlers.end(),
                                      [id](const auto& entry) { return entry.first == id; }),
                       handlers.end());
    }

    /**
     * @brief Deliver `event` to every handler of its type
     *
     * Handlers are snapshotted first, so a handler may subscribe or
     * unsubscribe without deadlocking. A handler that throws is logged and
     * the remaining handlers still run.
     */
    template<typename EventType>
    void emit(const EventType& event) {
        std::vector<std::function<void(const EventType&)>> snapshot;
        {
            std::shared_lock lock(mutex_);
            const auto* channel = find_channel<EventType>();
            if (channel == nullptr || channel->handlers.empty()) {
                return;
            }
            snapshot.reserve(channel->handlers.size());
            for (const auto& entry : channel->handlers) {
                snapshot.push_back(entry.second);
            }
        }

        for (const auto& handler : snapshot) {
            try {
                handler(event);
            } catch (const std::exception& e) {
                spdlog::error("Event handler threw: {}", e.what());
            }
        }
    }

    template<typename EventType>
    std::size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        const auto* channel = find_channel<EventType>();
        return channel != nullptr ? channel->handlers.size() : 0;
    }

    void clear() {
        std::unique_lock lock(mutex_);
        channels_.clear();
    }

private:
    struct ChannelBase {
        virtual ~ChannelBase() = default;
    };

    template<typename EventType>
    struct Channel final : ChannelBase {
        std::vector<std::pair<SubscriptionId, std::function<void(const EventType&)>>> handlers;
    };

    // Caller holds the exclusive lock
    template<typename EventType>
    Channel<EventType>& channel_for() {
        auto& slot = channels_[std::type_index(typeid(EventType))];
        if (!slot) {
            slot = std::make_unique<Channel<EventType>>();
        }
        return static_cast<Channel<EventType>&>(*slot);
    }

    // Caller holds either lock; only Channel<EventType> is stored under EventType's key
    template<typename EventType>
    Channel<EventType>* find_channel() const {
        const auto it = channels_.find(std::type_index(typeid(EventType)));
        return it == channels_.end() ? nullptr : static_cast<Channel<EventType>*>(it->second.get());
    }

    std::unordered_map<std::type_index, std::unique_ptr<ChannelBase>> channels_;
    mutable std::shared_mutex mutex_;
    SubscriptionId next_id_ = 0;
};

/**
 * @brief Emit through an optional bus (engines receive nullptr when nobody listens)
 */
template<typename EventType>
void publish(EventBus* bus, const EventType& event) {
    if (bus != nullptr) {
        bus->emit(event);
    }
}

} // namespace psync::events
