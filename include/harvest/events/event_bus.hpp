/**
 * @file event_bus.hpp
 * @brief Type-safe publish/subscribe channel for run telemetry
 *
 * WHY THIS FILE EXISTS:
 * The transfer engine reports what it is doing (per-item outcomes, archive
 * batches, session episodes, rate/ETA) without knowing who listens. The CLI
 * attaches a logger and a metrics collector; tests attach recorders that assert
 * on, or react to, individual events.
 *
 * WHAT IT DOES:
 * - Subscription keyed by event type (std::type_index)
 * - Synchronous delivery on the emitting thread
 * - Thread-safe registration and emission
 *
 * EXAMPLE:
 * EventBus bus;
 * bus.subscribe<ItemProcessedEvent>([](const ItemProcessedEvent& e) { ... });
 * bus.emit(ItemProcessedEvent{...});
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

namespace harvest::events {

/**
 * @brief Type-safe event bus
 *
 * THREAD SAFETY:
 * - subscribe/unsubscribe take an exclusive lock
 * - emit copies the handler list under a shared lock and calls the handlers
 *   without holding it, so a handler may subscribe or emit in turn
 *
 * HANDLER FAILURES:
 * A handler that throws a std::exception is logged and the remaining
 * handlers still run; telemetry must never abort a transfer.
 */
class EventBus {
public:
    using HandlerId = std::size_t;

    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * @brief Register @p handler for events of type EventType
     * @return Handler id for unsubscribe()
     */
    template<typename EventType>
    HandlerId subscribe(std::function<void(const EventType&)> handler) {
        std::unique_lock lock(mutex_);
        const HandlerId id = next_handler_id_++;
        handlers_[key_of<EventType>()].push_back(
            Registration{id, std::make_shared<HandlerImpl<EventType>>(std::move(handler))});
        return id;
    }

    template<typename EventType>
    void unsubscribe(HandlerId id) {
        std::unique_lock lock(mutex_);
        auto it = handlers_.find(key_of<EventType>());
        if (it == handlers_.end()) {
            return;
        }
        auto& registrations = it->second;
        registrations.erase(
            std::remove_if(registrations.begin(), registrations.end(),
                [id](const Registration& r) { return r.id == id; }),
            registrations.end());
    }

    /**
     * @brief Deliver @p event to every subscriber of its type, in subscription order
     */
    template<typename EventType>
    void emit(const EventType& event) {
        std::vector<Registration> snapshot;
        {
            std::shared_lock lock(mutex_);
            auto it = handlers_.find(key_of<EventType>());
            if (it == handlers_.end()) {
                return;
            }
            snapshot = it->second;
        }

        for (const auto& registration : snapshot) {
            try {
                registration.handler->call(&event);
            } catch (const std::exception& e) {
                spdlog::error("Event handler #{} for {} threw: {}",
                              registration.id, typeid(EventType).name(), e.what());
            }
        }
    }

    template<typename EventType>
    std::size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        auto it = handlers_.find(key_of<EventType>());
        return it != handlers_.end() ? it->second.size() : 0;
    }

    void clear() {
        std::unique_lock lock(mutex_);
        handlers_.clear();
    }

private:
    struct HandlerBase {
        virtual ~HandlerBase() = default;
        virtual void call(const void* event) = 0;
    };

    template<typename EventType>
    struct HandlerImpl : HandlerBase {
        std::function<void(const EventType&)> func;

        explicit HandlerImpl(std::function<void(const EventType&)> f) : func(std::move(f)) {}

        void call(const void* event) override {
            // Only ever registered under typeid(EventType)
            func(*static_cast<const EventType*>(event));
        }
    };

    struct Registration {
        HandlerId id;
        std::shared_ptr<HandlerBase> handler;
    };

    template<typename EventType>
    static std::type_index key_of() {
        return std::type_index(typeid(EventType));
    }

    std::unordered_map<std::type_index, std::vector<Registration>> handlers_;
    mutable std::shared_mutex mutex_;
    HandlerId next_handler_id_ = 0;
};

} // namespace harvest::events
