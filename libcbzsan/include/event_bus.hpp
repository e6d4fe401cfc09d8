/**
 * @file event_bus.hpp
 * @brief Type-keyed publish/subscribe channel between the pipeline and its observers.
 */

#ifndef CBZSAN_EVENT_BUS_HPP
#define CBZSAN_EVENT_BUS_HPP

#include <cstddef>
#include <functional>
#include <mutex>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <utility>
#include <vector>

namespace cbzsan {

    /**
     * @brief Publish/subscribe bus keyed by event struct type.
     *
     * @details The PipelineOrchestrator publishes archive events without
     * knowing who listens; the CLI subscribes its console output and the
     * report collector. Handlers run synchronously on the publishing
     * thread, outside the internal lock, so a handler may itself publish
     * or subscribe.
     */
    class EventBus {
    public:
        EventBus() = default;

        EventBus(const EventBus&) = delete;
        EventBus& operator=(const EventBus&) = delete;

        /**
         * @brief Register a handler for one event type.
         * @tparam Event Event struct (e.g. ArchiveCompleteEvent).
         */
        template <typename Event>
        void subscribe(std::function<void(const Event&)> handler) {
            std::lock_guard lock(mtx_);
            handlers_[std::type_index(typeid(Event))].emplace_back(
                [h = std::move(handler)](const void* e) { h(*static_cast<const Event*>(e)); });
        }

        /**
         * @brief Deliver an event to every handler of its type, in subscription order.
         */
        template <typename Event>
        void publish(const Event& event) const {
            std::vector<Handler> targets;
            {
                std::lock_guard lock(mtx_);
                const auto it = handlers_.find(std::type_index(typeid(Event)));
                if (it == handlers_.end()) return;
                targets = it->second;
            }
            for (const auto& fn : targets) {
                fn(&event);
            }
        }

        /// @return Number of handlers registered for Event.
        template <typename Event>
        [[nodiscard]] std::size_t subscriber_count() const {
            std::lock_guard lock(mtx_);
            const auto it = handlers_.find(std::type_index(typeid(Event)));
            return it == handlers_.end() ? 0 : it->second.size();
        }

    private:
        using Handler = std::function<void(const void*)>;
        std::unordered_map<std::type_index, std::vector<Handler>> handlers_;
        mutable std::mutex mtx_;
    };

} // namespace cbzsan

#endif // CBZSAN_EVENT_BUS_HPP
