/**
 * @file event_bus.hpp
 * @brief Synchronous publish/subscribe hub for session progress
 *
 * WHY THIS FILE EXISTS:
 * The orchestrator and the encryption gateway report what they do as
 * events; whether anybody logs them, counts them or (in tests) records
 * them is decided by whoever wires the bus up in main().
 *
 * EXAMPLE:
 * EventBus bus;
 * bus.subscribe<ArtifactEncryptedEvent>([](const ArtifactEncryptedEvent& e) { ... });
 * bus.emit(ArtifactEncryptedEvent{"notes/todo.txt", 120, false});
 */

#pragma once

#include <spdlog/spdlog.h>

#include <cstddef>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <typeindex>
#include <vector>

namespace mist::events {

using SubscriptionId = std::size_t;

/**
 * @brief Routes each event value to the handlers registered for its type
 *
 * THREAD SAFETY:
 * Subscribing and emitting may happen from different threads. Handlers
 * run synchronously on the emitting thread, outside the internal lock, so
 * a handler may itself subscribe or emit.
 */
class EventBus {
public:
    EventBus() = default;
    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    template<typename Event>
    SubscriptionId subscribe(std::function<void(const Event&)> handler) {
        auto slot = std::make_shared<Slot<Event>>(std::move(handler));

        std::unique_lock lock(mutex_);
        const SubscriptionId id = ++last_id_;
        slots_[std::type_index(typeid(Event))].push_back(Entry{id, std::move(slot)});
        return id;
    }

    /// Unknown ids are ignored.
    template<typename Event>
    void unsubscribe(SubscriptionId id) {
        std::unique_lock lock(mutex_);
        auto found = slots_.find(std::type_index(typeid(Event)));
        if (found == slots_.end()) {
            return;
        }
        auto& entries = found->second;
        for (auto it = entries.begin(); it != entries.end(); ++it) {
            if (it->id == id) {
                entries.erase(it);
                break;
            }
        }
    }

    /**
     * @brief Deliver `event` to every current subscriber of its type
     *
     * A handler that throws is logged and skipped; the remaining handlers
     * still run and the emitter never sees the exception.
     */
    template<typename Event>
    void emit(const Event& event) const {
        for (const auto& slot : snapshot(std::type_index(typeid(Event)))) {
            try {
                slot->deliver(&event);
            } catch (const std::exception& e) {
                spdlog::error("Handler for {} threw: {}", typeid(Event).name(), e.what());
            }
        }
    }

    template<typename Event>
    std::size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        auto found = slots_.find(std::type_index(typeid(Event)));
        return found == slots_.end() ? 0 : found->second.size();
    }

    void clear() {
        std::unique_lock lock(mutex_);
        slots_.clear();
    }

private:
    struct SlotBase {
        virtual ~SlotBase() = default;
        virtual void deliver(const void* event) const = 0;
    };

    template<typename Event>
    struct Slot final : SlotBase {
        explicit Slot(std::function<void(const Event&)> fn) : handler(std::move(fn)) {}

        void deliver(const void* event) const override { handler(*static_cast<const Event*>(event)); }

        std::function<void(const Event&)> handler;
    };

    struct Entry {
        SubscriptionId id;
        std::shared_ptr<const SlotBase> slot;
    };

    std::vector<std::shared_ptr<const SlotBase>> snapshot(std::type_index type) const {
        std::vector<std::shared_ptr<const SlotBase>> result;
        std::shared_lock lock(mutex_);
        auto found = slots_.find(type);
        if (found != slots_.end()) {
            result.reserve(found->second.size());
            for (const auto& entry : found->second) {
                result.push_back(entry.slot);
            }
        }
        return result;
    }

    mutable std::shared_mutex mutex_;
    std::map<std::type_index, std::vector<Entry>> slots_;
    SubscriptionId last_id_ = 0;
};

} // namespace mist::events
