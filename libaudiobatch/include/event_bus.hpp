/**
 * @file event_bus.hpp
 * @brief Thread-safe publish/subscribe bus used to report run activity.
 */

#ifndef AUDIOBATCH_EVENT_BUS_HPP
#define AUDIOBATCH_EVENT_BUS_HPP

#include <functional>
#include <mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace audiobatch {

    /**
     * @brief Type-keyed publish/subscribe bus.
     *
     * @details The orchestrator and the session publish events from worker
     * threads; the CLI (progress bar, report collection) and tests subscribe.
     * Publication holds the bus mutex for the whole dispatch, so handlers are
     * never run concurrently with each other and must not publish themselves.
     */
    class EventBus {
    public:
        EventBus() = default;

        EventBus(const EventBus&) = delete;
        EventBus& operator=(const EventBus&) = delete;

        /**
         * @brief Subscribe a handler to a specific event type.
         * @tparam Event The event struct type (e.g., RunProgressEvent).
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
         * @brief Publish an event to all subscribers of its type.
         */
        template <typename Event>
        void publish(const Event& event) {
            std::lock_guard lock(mtx_);
            const auto it = subscribers_.find(std::type_index(typeid(Event)));
            if (it == subscribers_.end()) {
                return;
            }
            for (const auto& fn : it->second) {
                fn(&event);
            }
        }

    private:
        using Callback = std::function<void(const void*)>;
        std::unordered_map<std::type_index, std::vector<Callback>> subscribers_;
        std::mutex mtx_;
    };

} // namespace audiobatch

#endif // AUDIOBATCH_EVENT_BUS_HPP
