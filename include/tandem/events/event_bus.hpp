/**
 * @file event_bus.hpp
 * @brief Type-safe event bus for decoupled component communication
 *
 * The SessionManager and the Gateway publish domain events here; logging
 * and metrics subscribe. Publishers never depend on who is listening.
 *
 * EXAMPLE:
 * EventBus bus;
 * bus.subscribe<SessionCreatedEvent>([](const SessionCreatedEvent& e) { ... });
 * bus.emit(SessionCreatedEvent{...});
 */

#pragma once

#include <functional>
#include <memory>
#include <typeindex>
#include <unordered_map>
#include <vector>
#include <mutex>
#include <shared_mutex>
#include <algorithm>

#include <spdlog/spdlog.h>

namespace tandem::events {

/**
 * @brief Type-indexed publish/subscribe hub
 *
 * THREAD SAFETY:
 * - emit() and subscribe() may be called concurrently from any thread
 * - Handlers run synchronously on the emitting thread, outside the lock
 * - Emitters must not hold a session lock while emitting
 */
class EventBus {
public:
    EventBus() = default;
    ~EventBus() = default;

    // Non-copyable (would duplicate handlers)
    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * @brief Subscribe to events of a specific type
     *
     * @return Subscription id for unsubscribe()
     */
    template<typename EventType>
    size_t subscribe(std::function<void(const EventType&)> handler) {
        std::unique_lock lock(mutex_);

        auto type_id = std::type_index(typeid(EventType));
        auto wrapper = std::make_shared<HandlerImpl<EventType>>(std::move(handler));
        size_t handler_id = next_handler_id_++;
        handlers_[type_id].push_back({handler_id, wrapper});

        return handler_id;
    }

    /**
     * @brief Remove a handler previously returned by subscribe()
     */
    template<typename EventType>
    void unsubscribe(size_t handler_id) {
        std::unique_lock lock(mutex_);

        auto type_id = std::type_index(typeid(EventType));
        auto it = handlers_.find(type_id);

        if (it != handlers_.end()) {
            auto& handler_list = it->second;
            handler_list.erase(
                std::remove_if(handler_list.begin(), handler_list.end(),
                    [handler_id](const auto& pair) {
                        return pair.first == handler_id;
                    }),
                handler_list.end()
            );
        }
    }

    /**
     * @brief Deliver an event to every subscriber of its type
     *
     * A handler that throws is logged; the remaining handlers still run.
     */
    template<typename EventType>
    void emit(const EventType& event) {
        // Copy so a handler may subscribe without deadlocking
        std::vector<std::shared_ptr<HandlerBase>> handlers_copy;
        {
            std::shared_lock lock(mutex_);
            auto type_id = std::type_index(typeid(EventType));
            auto it = handlers_.find(type_id);

            if (it == handlers_.end()) {
                return;
            }
            for (const auto& [id, handler] : it->second) {
                handlers_copy.push_back(handler);
            }
        }

        for (auto& handler : handlers_copy) {
            try {
                handler->call(&event);
            } catch (const std::exception& e) {
                spdlog::error("Event handler for {} threw: {}", typeid(EventType).name(), e.what());
            }
        }
    }

    /**
     * @brief Get number of subscribers for an event type
     */
    template<typename EventType>
    size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        auto type_id = std::type_index(typeid(EventType));
        auto it = handlers_.find(type_id);
        return it != handlers_.end() ? it->second.size() : 0;
    }

    /**
     * @brief Remove all subscribers
     */
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

        explicit HandlerImpl(std::function<void(const EventType&)> f)
            : func(std::move(f)) {}

        void call(const void* event) override {
            const EventType* typed_event = static_cast<const EventType*>(event);
            func(*typed_event);
        }
    };

    std::unordered_map<
        std::type_index,
        std::vector<std::pair<size_t, std::shared_ptr<HandlerBase>>>
    > handlers_;

    mutable std::shared_mutex mutex_;
    size_t next_handler_id_ = 0;
};

} // namespace tandem::events
