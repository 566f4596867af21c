/**
 * @file event_bus.hpp
 * @brief Type-safe broadcast channel for engine notifications
 *
 * WHY THIS FILE EXISTS:
 * The connection manager and the sync engine report state changes, log
 * entries and received payloads to whoever is listening (a UI, a CLI, a
 * test) without knowing who that is. Any number of subscribers can attach
 * and each one gets an explicit handle to detach again.
 *
 * EXAMPLE:
 * EventBus bus;
 * auto sub = bus.subscribe<LogEntryEvent>([](const LogEntryEvent& e) { ... });
 * bus.emit(LogEntryEvent{...});
 * sub.unsubscribe();
 */

#pragma once

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace lexsync::events {

namespace detail {

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
        func(*static_cast<const EventType*>(event));
    }
};

/**
 * @brief Handler table shared between the bus and its subscriptions
 *
 * Held through a shared_ptr so a Subscription that outlives its bus
 * degrades to a no-op instead of dangling.
 */
struct Registry {
    std::unordered_map<
        std::type_index,
        std::vector<std::pair<std::size_t, std::shared_ptr<HandlerBase>>>
    > handlers;
    mutable std::shared_mutex mutex;
    std::size_t next_id = 0;

    void remove(std::type_index type, std::size_t id) {
        std::unique_lock lock(mutex);
        auto it = handlers.find(type);
        if (it == handlers.end()) {
            return;
        }
        auto& list = it->second;
        list.erase(std::remove_if(list.begin(), list.end(),
                                  [id](const auto& entry) { return entry.first == id; }),
                   list.end());
    }
};

} // namespace detail

/**
 * @brief Handle returned by EventBus::subscribe()
 *
 * Move-only. Dropping the handle does NOT unsubscribe; call unsubscribe()
 * when the handler's captures are about to go away.
 */
class Subscription {
public:
    Subscription() = default;

    Subscription(std::weak_ptr<detail::Registry> registry, std::type_index type, std::size_t id)
        : registry_(std::move(registry)), type_(type), id_(id), active_(true) {}

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    Subscription(Subscription&& other) noexcept
        : registry_(std::move(other.registry_)), type_(other.type_), id_(other.id_), active_(other.active_) {
        other.active_ = false;
    }

    Subscription& operator=(Subscription&& other) noexcept {
        if (this != &other) {
            registry_ = std::move(other.registry_);
            type_ = other.type_;
            id_ = other.id_;
            active_ = other.active_;
            other.active_ = false;
        }
        return *this;
    }

    void unsubscribe() {
        if (!active_) {
            return;
        }
        active_ = false;
        if (auto registry = registry_.lock()) {
            registry->remove(type_, id_);
        }
    }

    [[nodiscard]] bool active() const noexcept { return active_; }

private:
    std::weak_ptr<detail::Registry> registry_;
    std::type_index type_{typeid(void)};
    std::size_t id_ = 0;
    bool active_ = false;
};

/**
 * @brief Type-safe event bus
 *
 * THREAD SAFETY:
 * - subscribe/unsubscribe/emit may be called from any thread
 * - Handlers run synchronously on the emitting thread
 * - The handler list is copied before dispatch, so a handler may
 *   subscribe or unsubscribe without deadlocking
 */
class EventBus {
public:
    EventBus() : registry_(std::make_shared<detail::Registry>()) {}

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * @brief Subscribe to events of a specific type
     *
     * RETURNS:
     * Subscription handle; call unsubscribe() on it to detach
     */
    template<typename EventType>
    Subscription subscribe(std::function<void(const EventType&)> handler) {
        std::unique_lock lock(registry_->mutex);

        const auto type_id = std::type_index(typeid(EventType));
        auto wrapper = std::make_shared<detail::HandlerImpl<EventType>>(std::move(handler));
        const std::size_t handler_id = registry_->next_id++;
        registry_->handlers[type_id].push_back({handler_id, wrapper});

        return Subscription(registry_, type_id, handler_id);
    }

    /**
     * @brief Emit an event to all subscribers
     *
     * EXCEPTION SAFETY:
     * A handler that throws is logged; the remaining handlers still run.
     */
    template<typename EventType>
    void emit(const EventType& event) const {
        std::vector<std::shared_ptr<detail::HandlerBase>> handlers_copy;
        {
            std::shared_lock lock(registry_->mutex);
            auto it = registry_->handlers.find(std::type_index(typeid(EventType)));
            if (it == registry_->handlers.end()) {
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
                spdlog::error("Event handler threw: {}", e.what());
            }
        }
    }

    template<typename EventType>
    std::size_t subscriber_count() const {
        std::shared_lock lock(registry_->mutex);
        auto it = registry_->handlers.find(std::type_index(typeid(EventType)));
        return it != registry_->handlers.end() ? it->second.size() : 0;
    }

    void clear() {
        std::unique_lock lock(registry_->mutex);
        registry_->handlers.clear();
    }

private:
    std::shared_ptr<detail::Registry> registry_;
};

} // namespace lexsync::events
