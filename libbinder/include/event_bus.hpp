/**
 * @file event_bus.hpp
 * @brief Thread-safe publish/subscribe bus used for progress reporting.
 */

#ifndef BINDER_EVENT_BUS_HPP
#define BINDER_EVENT_BUS_HPP

#include <functional>
#include <mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace binder {

    /**
     * @brief Type-keyed publish/subscribe bus.
     *
     * @details The pipeline publishes plain event structs (see events.hpp)
     * without knowing who listens. Front ends subscribe to the event types
     * they render. Handlers run synchronously on the publishing thread,
     * which for a merge job is the job's worker thread.
     */
    class EventBus {
    public:
        EventBus() = default;
        EventBus(const EventBus&) = delete;
        EventBus& operator=(const EventBus&) = delete;

        /**
         * @brief Subscribe a handler to one event type.
         * @tparam Event The event struct type (e.g. StageEnteredEvent).
         * @param handler Invoked with a const reference for every published event.
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
        void publish(const Event& event) {
            std::vector<Callback> targets;
            {
                std::lock_guard lock(mtx_);
                const auto it = subscribers_.find(std::type_index(typeid(Event)));
                if (it == subscribers_.end()) {
                    return;
                }
                targets = it->second;
            }
            // handlers run unlocked so they may subscribe or publish themselves
            for (const auto& fn : targets) {
                fn(&event);
            }
        }

        /// Drop every subscription.
        void clear() {
            std::lock_guard lock(mtx_);
            subscribers_.clear();
        }

    private:
        using Callback = std::function<void(const void*)>;
        std::unordered_map<std::type_index, std::vector<Callback>> subscribers_;
        std::mutex mtx_;
    };

} // namespace binder

#endif // BINDER_EVENT_BUS_HPP
