/**
 * @file event_bus.hpp
 * @brief Typed publish/subscribe for advisory notifications
 *
 * Transfer and session code report progress and lifecycle changes without
 * knowing who listens (a progress display, a test, nothing at all).
 *
 * EXAMPLE:
 * EventBus bus;
 * auto id = bus.subscribe<TransferProgressEvent>([](const TransferProgressEvent& e) { ... });
 * bus.emit(TransferProgressEvent{...});
 * bus.unsubscribe<TransferProgressEvent>(id);
 */

#pragma once

#include <spdlog/spdlog.h>

#include <algorithm>
#include <functional>
#include <mutex>
#include <shared_mutex>
#include <typeindex>
#include <vector>

namespace syncmd::events {

/**
 * @brief Synchronous event dispatch keyed by event type
 *
 * THREAD SAFETY:
 * - subscribe/unsubscribe/emit may be called from any thread
 * - Handlers run on the emitting thread, outside the lock, so a handler may
 *   itself subscribe or emit
 */
class EventBus {
public:
    using SubscriptionId = std::size_t;

    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    template<typename EventType>
    SubscriptionId subscribe(std::function<void(const EventType&)> handler) {
        Slot slot{0, std::type_index(typeid(EventType)),
                  [handler = std::move(handler)](const void* event) {
                      handler(*static_cast<const EventType*>(event));
                  }};

        std::unique_lock lock(mutex_);
        slot.id = next_id_++;
        slots_.push_back(std::move(slot));
        return slots_.back().id;
    }

    template<typename EventType>
    void unsubscribe(SubscriptionId id) {
        const std::type_index type(typeid(EventType));
        std::unique_lock lock(mutex_);
        slots_.erase(std::remove_if(slots_.begin(), slots_.end(),
                                    [&](const Slot& slot) { return slot.id == id && slot.type == type; }),
                     slots_.end());
    }

    /**
     * @brief Deliver @p event to every handler subscribed to its type
     *
     * A handler throwing std::exception is logged and the remaining handlers
     * still run.
     */
    template<typename EventType>
    void emit(const EventType& event) {
        const std::type_index type(typeid(EventType));
        std::vector<std::function<void(const void*)>> targets;
        {
            std::shared_lock lock(mutex_);
            for (const auto& slot : slots_) {
                if (slot.type == type) {
                    targets.push_back(slot.invoke);
                }
            }
        }

        for (const auto& target : targets) {
            try {
                target(&event);
            } catch (const std::exception& e) {
                spdlog::error("Handler for {} threw: {}", type.name(), e.what());
            }
        }
    }

    template<typename EventType>
    std::size_t subscriber_count() const {
        const std::type_index type(typeid(EventType));
        std::shared_lock lock(mutex_);
        return static_cast<std::size_t>(
            std::count_if(slots_.begin(), slots_.end(), [&](const Slot& slot) { return slot.type == type; }));
    }

    void clear() {
        std::unique_lock lock(mutex_);
        slots_.clear();
    }

private:
    struct Slot {
        SubscriptionId id;
        std::type_index type;
        std::function<void(const void*)> invoke;
    };

    mutable std::shared_mutex mutex_;
    std::vector<Slot> slots_;
    SubscriptionId next_id_ = 0;
};

} // namespace syncmd::events
