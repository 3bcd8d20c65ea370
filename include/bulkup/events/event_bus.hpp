/**
 * @file event_bus.hpp
 * @brief Type-safe publish/subscribe between the transfer core and observers
 *
 * Workers emit progress events from their own threads; subscribers (logging,
 * metrics, progress displays) run synchronously in the emitting thread and
 * must therefore be thread-safe themselves.
 *
 * EXAMPLE:
 * EventBus bus;
 * auto sub = bus.subscribe_scoped<FileSkippedEvent>([](const FileSkippedEvent& e) { ... });
 * bus.emit(FileSkippedEvent{...});
 */

#pragma once

#include <spdlog/spdlog.h>

#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace bulkup::events {

class EventBus;

/**
 * @brief Unsubscribes its handler when destroyed
 */
class Subscription {
public:
    Subscription() = default;
    explicit Subscription(std::function<void()> cancel) : cancel_(std::move(cancel)) {}
    ~Subscription() { reset(); }

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    Subscription(Subscription&& other) noexcept : cancel_(std::move(other.cancel_)) {
        other.cancel_ = nullptr;
    }

    Subscription& operator=(Subscription&& other) noexcept {
        if (this != &other) {
            reset();
            cancel_ = std::move(other.cancel_);
            other.cancel_ = nullptr;
        }
        return *this;
    }

    void reset() {
        if (cancel_) {
            auto cancel = std::move(cancel_);
            cancel_ = nullptr;
            cancel();
        }
    }

    [[nodiscard]] bool active() const noexcept { return static_cast<bool>(cancel_); }

private:
    std::function<void()> cancel_;
};

/**
 * @brief Type-safe event bus
 *
 * THREAD SAFETY:
 * - emit() may be called from any number of threads concurrently
 * - subscribe/unsubscribe take an exclusive lock; emit copies the handler
 *   list under a shared lock and calls handlers without holding it
 */
class EventBus {
public:
    EventBus() = default;
    ~EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * @brief Subscribe to events of a specific type
     *
     * RETURNS: Subscription id for unsubscribe<EventType>()
     */
    template<typename EventType>
    std::size_t subscribe(std::function<void(const EventType&)> handler) {
        auto erased = std::make_shared<ErasedHandler>(
            [fn = std::move(handler)](const void* event) { fn(*static_cast<const EventType*>(event)); });

        std::unique_lock lock(mutex_);
        const std::size_t handler_id = ++last_handler_id_;
        channels_[std::type_index(typeid(EventType))].emplace(handler_id, std::move(erased));
        return handler_id;
    }

    /**
     * @brief Subscribe for the lifetime of the returned object
     *
     * The bus must outlive the Subscription.
     */
    template<typename EventType>
    Subscription subscribe_scoped(std::function<void(const EventType&)> handler) {
        const std::size_t id = subscribe<EventType>(std::move(handler));
        return Subscription([this, id]() { unsubscribe<EventType>(id); });
    }

    template<typename EventType>
    void unsubscribe(std::size_t handler_id) {
        std::unique_lock lock(mutex_);
        auto channel = channels_.find(std::type_index(typeid(EventType)));
        if (channel == channels_.end()) {
            return;
        }
        channel->second.erase(handler_id);
        if (channel->second.empty()) {
            channels_.erase(channel);
        }
    }

    /**
     * @brief Deliver event to every subscriber of its type
     *
     * A handler that throws is logged and does not prevent the remaining
     * handlers from running, nor does the exception reach the emitter.
     */
    template<typename EventType>
    void emit(const EventType& event) {
        std::vector<std::shared_ptr<ErasedHandler>> snapshot;
        {
            std::shared_lock lock(mutex_);
            auto channel = channels_.find(std::type_index(typeid(EventType)));
            if (channel == channels_.end()) {
                return;
            }
            snapshot.reserve(channel->second.size());
            for (const auto& entry : channel->second) {
                snapshot.push_back(entry.second);
            }
        }

        for (const auto& handler : snapshot) {
            try {
                (*handler)(&event);
            } catch (const std::exception& e) {
                spdlog::error("Event handler for {} threw: {}", typeid(EventType).name(), e.what());
            }
        }
    }

    template<typename EventType>
    std::size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        auto channel = channels_.find(std::type_index(typeid(EventType)));
        return channel == channels_.end() ? 0 : channel->second.size();
    }

    void clear() {
        std::unique_lock lock(mutex_);
        channels_.clear();
    }

private:
    using ErasedHandler = std::function<void(const void*)>;
    // Ordered by id so handlers run in subscription order
    using Channel = std::map<std::size_t, std::shared_ptr<ErasedHandler>>;

    std::unordered_map<std::type_index, Channel> channels_;
    mutable std::shared_mutex mutex_;
    std::size_t last_handler_id_ = 0;
};

} // namespace bulkup::events
