/**
 * @file event_bus.hpp
 * @brief Type-safe in-process event channel
 *
 * Publishers emit events without knowing who handles them. The upload core
 * publishes job, chunk and progress events here; observers (logging,
 * metrics, tests) subscribe per event type.
 *
 * EXAMPLE:
 * EventBus bus;
 * auto id = bus.subscribe<ChunkCommittedEvent>([](const ChunkCommittedEvent& e) { ... });
 * bus.emit(ChunkCommittedEvent{"job", 0, 3, 1024});
 * bus.unsubscribe<ChunkCommittedEvent>(id);
 */

#pragma once

#include <spdlog/spdlog.h>

#include <algorithm>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <vector>

namespace scingest::events {

/**
 * @brief Subscribers keyed by event type, delivered synchronously
 *
 * THREAD SAFETY:
 * - Any thread may emit, subscribe or unsubscribe concurrently
 * - Handlers run synchronously on the emitting thread, without the bus lock
 *   held, so a handler may itself subscribe or emit
 */
class EventBus {
public:
    using SubscriptionId = std::size_t;

    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /// Returns the id to pass to unsubscribe().
    template<typename EventType>
    SubscriptionId subscribe(std::function<void(const EventType&)> handler) {
        auto erased = std::make_shared<const Callback>(
            [fn = std::move(handler)](const void* event) { fn(*static_cast<const EventType*>(event)); });

        std::unique_lock lock(mutex_);
        const SubscriptionId id = next_id_++;
        subscriptions_[key<EventType>()].push_back(Subscription{id, std::move(erased)});
        return id;
    }

    template<typename EventType>
    void unsubscribe(SubscriptionId id) {
        std::unique_lock lock(mutex_);
        auto it = subscriptions_.find(key<EventType>());
        if (it == subscriptions_.end()) {
            return;
        }
        auto& list = it->second;
        list.erase(std::remove_if(list.begin(), list.end(),
                                  [id](const Subscription& s) { return s.id == id; }),
                   list.end());
        if (list.empty()) {
            subscriptions_.erase(it);
        }
    }

    /**
     * @brief Deliver an event to every current subscriber
     *
     * A handler that throws std::exception is logged and skipped; the
     * remaining handlers still run.
     */
    template<typename EventType>
    void emit(const EventType& event) {
        std::vector<std::shared_ptr<const Callback>> targets;
        {
            std::shared_lock lock(mutex_);
            auto it = subscriptions_.find(key<EventType>());
            if (it == subscriptions_.end()) {
                return;
            }
            targets.reserve(it->second.size());
            for (const auto& s : it->second) {
                targets.push_back(s.callback);
            }
        }

        for (const auto& callback : targets) {
            try {
                (*callback)(&event);
            } catch (const std::exception& e) {
                spdlog::error("[events] {} handler failed: {}", typeid(EventType).name(), e.what());
            }
        }
    }

    template<typename EventType>
    std::size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        auto it = subscriptions_.find(key<EventType>());
        return it == subscriptions_.end() ? 0 : it->second.size();
    }

    void clear() {
        std::unique_lock lock(mutex_);
        subscriptions_.clear();
    }

private:
    using Callback = std::function<void(const void*)>;

    struct Subscription {
        SubscriptionId id;
        std::shared_ptr<const Callback> callback;
    };

    template<typename EventType>
    static std::type_index key() {
        return std::type_index(typeid(EventType));
    }

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::type_index, std::vector<Subscription>> subscriptions_;
    SubscriptionId next_id_ = 0;
};

} // namespace scingest::events
