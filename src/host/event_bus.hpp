#pragma once
#include <cstddef>
#include <deque>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "agents/event_protocol.hpp"

namespace warden::host {

// Fan-out of protocol events to named subscribers (UI panes, loggers).
// Each subscriber has its own bounded queue; the oldest event is dropped on overflow.
class EventBus {
public:
    static constexpr size_t MAX_QUEUE_DEPTH = 1024;

    void publish(const agents::Event& event);
    void subscribe(const std::string& subscriber, const std::vector<agents::EventKind>& kinds);
    void unsubscribe(const std::string& subscriber, const std::vector<agents::EventKind>& kinds,
                     bool unsubscribe_all);

    std::vector<agents::Event> poll(const std::string& subscriber, size_t max_events);

    // Same as poll, serialized as a JSON array of envelopes
    nlohmann::json poll_json(const std::string& subscriber, size_t max_events);

    size_t pending(const std::string& subscriber) const;

private:
    std::unordered_map<std::string, std::set<agents::EventKind>> subscriptions_;
    std::unordered_map<std::string, std::deque<agents::Event>> queues_;
    mutable std::mutex mutex_;
};

} // namespace warden::host
