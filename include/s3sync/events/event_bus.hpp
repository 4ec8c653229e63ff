/**
 * @file event_bus.hpp
 * @brief Type-safe event bus for decoupled component communication
 *
 * WHY THIS FILE EXISTS:
 * The upload pipeline reports progress (pieces created, parts uploaded,
 * units skipped or failed) without knowing who listens. Logging and metrics
 * subscribe without the pipeline knowing about them.
 *
 * EXAMPLE:
 * EventBus bus;
 * bus.subscribe<UnitUploadedEvent>([](const UnitUploadedEvent& e) { ... });
 * bus.emit(UnitUploadedEvent{...});
 */

#pragma once

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace s3sync::events {

/**
 * @brief Type-safe event bus
 *
 * THREAD SAFETY:
 * - Multiple threads can emit events concurrently
 * - Multiple threads can subscribe concurrently
 * - Handlers are called synchronously in emitting thread
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
     * RETURNS:
     * Subscription ID for unsubscribing later
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
     * @brief Emit an event to all subscribers
     *
     * EXCEPTION SAFETY:
     * A handler that throws is logged and skipped; remaining handlers still
     * run and the emitter never sees the exception.
     */
    template<typename EventType>
    void emit(const EventType& event) {
        // Copy handler pointers so a handler may subscribe without deadlocking
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
            } catch (...) {
                spdlog::error("Event handler for {} threw an unknown exception", typeid(EventType).name());
            }
        }
    }

    template<typename EventType>
    size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        auto type_id = std::type_index(typeid(EventType));
        auto it = handlers_.find(type_id);
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

        explicit HandlerImpl(std::function<void(const EventType&)> f)
            : func(std::move(f)) {}

        void call(const void* event) override {
            // Only EventType handlers are stored under typeid(EventType)
            const EventType* typed_event = static_cast<const EventType*>(event);
            func(*typed_event);
        }
    };

    // event type -> list of (handler_id, handler)
    std::unordered_map<
        std::type_index,
        std::vector<std::pair<size_t, std::shared_ptr<HandlerBase>>>
    > handlers_;

    mutable std::shared_mutex mutex_;
    size_t next_handler_id_ = 0;
};

} // namespace s3sync::events
