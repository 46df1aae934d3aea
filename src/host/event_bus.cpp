#include "host/event_bus.hpp"
#include <spdlog/spdlog.h>

namespace warden::host {

void EventBus::publish(const agents::Event& event) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto kind = event.kind();
    for (const auto& [subscriber, kinds] : subscriptions_) {
        if (kinds.count(kind) == 0) {
            continue;
        }
        auto& queue = queues_[subscriber];
        if (queue.size() >= MAX_QUEUE_DEPTH) {
            queue.pop_front();
            spdlog::warn("Event queue for {} is full; dropped oldest event", subscriber);
        }
        queue.push_back(event);
        spdlog::debug("Event {} #{} queued for {}", agents::event_kind_to_string(kind),
                      event.sequence, subscriber);
    }
}

void EventBus::subscribe(const std::string& subscriber, const std::vector<agents::EventKind>& kinds) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& subs = subscriptions_[subscriber];
    for (auto kind : kinds) {
        subs.insert(kind);
    }
}

void EventBus::unsubscribe(const std::string& subscriber, const std::vector<agents::EventKind>& kinds,
                           bool unsubscribe_all) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (unsubscribe_all) {
        subscriptions_.erase(subscriber);
        queues_.erase(subscriber);
        return;
    }

    auto it = subscriptions_.find(subscriber);
    if (it == subscriptions_.end()) {
        return;
    }

    for (auto kind : kinds) {
        it->second.erase(kind);
    }
}

std::vector<agents::Event> EventBus::poll(const std::string& subscriber, size_t max_events) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<agents::Event> events;
    auto it = queues_.find(subscriber);
    if (it == queues_.end()) {
        return events;
    }

    auto& queue = it->second;
    while (!queue.empty() && events.size() < max_events) {
        events.push_back(std::move(queue.front()));
        queue.pop_front();
    }
    return events;
}

nlohmann::json EventBus::poll_json(const std::string& subscriber, size_t max_events) {
    nlohmann::json events_array = nlohmann::json::array();
    for (const auto& event : poll(subscriber, max_events)) {
        events_array.push_back(event.to_json());
    }
    return events_array;
}

size_t EventBus::pending(const std::string& subscriber) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = queues_.find(subscriber);
    return it == queues_.end() ? 0 : it->second.size();
}

} // namespace warden::host
