/**
 * @file event_bus.hpp
 * @brief Thread-safe publish/subscribe bus for pipeline progress events.
 */

#ifndef VETSCAN_EVENT_BUS_HPP
#define VETSCAN_EVENT_BUS_HPP

#include <functional>
#include <mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace vetscan {

/**
 * @brief Type-safe publish/subscribe event bus.
 *
 * @details The pipeline publishes from worker threads (chunk retries,
 * skipped images) as well as from the calling thread. Handlers are invoked
 * outside the bus lock, so a handler may publish or subscribe itself; they
 * must be thread-safe.
 */
class EventBus {
public:
    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * @brief Subscribe a handler to an event type.
     * @tparam Event The event struct (e.g. PipelineStateEvent).
     */
    template <typename Event>
    void subscribe(std::function<void(const Event&)> handler) {
        std::lock_guard lock(mtx_);
        subscribers_[std::type_index(typeid(Event))].push_back(
            [handler = std::move(handler)](const void* e) {
                handler(*static_cast<const Event*>(e));
            });
    }

    /**
     * @brief Deliver an event to every subscriber of its type.
     */
    template <typename Event>
    void publish(const Event& event) const {
        std::vector<Callback> targets;
        {
            std::lock_guard lock(mtx_);
            const auto it = subscribers_.find(std::type_index(typeid(Event)));
            if (it == subscribers_.end()) return;
            targets = it->second;
        }
        for (const auto& fn : targets) {
            fn(&event);
        }
    }

private:
    using Callback = std::function<void(const void*)>;
    std::unordered_map<std::type_index, std::vector<Callback>> subscribers_;
    mutable std::mutex mtx_;
};

} // namespace vetscan

#endif // VETSCAN_EVENT_BUS_HPP
