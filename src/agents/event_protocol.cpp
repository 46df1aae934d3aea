#include "agents/event_protocol.hpp"
#include "core/crypto.hpp"
#include <stdexcept>

using json = nlohmann::json;

namespace warden::agents {

namespace {

int64_t to_millis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point from_millis(int64_t ms) {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

template <typename T>
void put_optional(json& j, const char* key, const std::optional<T>& value) {
    if (value) {
        j[key] = *value;
    } else {
        j[key] = nullptr;
    }
}

template <typename T>
std::optional<T> get_optional(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) {
        return std::nullopt;
    }
    return j[key].get<T>();
}

struct PayloadWriter {
    json operator()(const InputEvent& e) const {
        return {{"prompt", e.prompt}, {"context_refs", e.context_refs}};
    }
    json operator()(const OutputEvent& e) const {
        return {{"chunk_id", e.chunk_id}, {"content_type", e.content_type},
                {"data", core::crypto::base64_encode(e.data)}, {"complete", e.complete}};
    }
    json operator()(const ArtifactEvent& e) const {
        json j = {{"id", e.id}, {"kind", e.kind}, {"path", e.path}};
        put_optional(j, "preview_hint", e.preview_hint);
        return j;
    }
    json operator()(const ConsentRequestEvent& e) const {
        json j = {{"capability", e.capability}, {"reason", e.reason}};
        put_optional(j, "duration_s", e.duration_s);
        return j;
    }
    json operator()(const ConsentGrantEvent& e) const {
        json j = {{"capability", e.capability}};
        if (e.expires_at) {
            j["expires_at"] = to_millis(*e.expires_at);
        } else {
            j["expires_at"] = nullptr;
        }
        return j;
    }
    json operator()(const ConsentRevokeEvent& e) const {
        return {{"capability", e.capability}};
    }
    json operator()(const ErrorEvent& e) const {
        json j = {{"code", e.code}, {"message", e.message}};
        put_optional(j, "hint", e.hint);
        return j;
    }
    json operator()(const StateUpdateEvent& e) const {
        return {{"key", e.key}, {"value", e.value}, {"scope", e.scope}};
    }
};

EventPayload read_payload(EventKind kind, const json& data) {
    switch (kind) {
        case EventKind::INPUT: {
            InputEvent e;
            e.prompt = data.at("prompt").get<std::string>();
            e.context_refs = data.value("context_refs", std::vector<std::string>{});
            return e;
        }
        case EventKind::OUTPUT: {
            OutputEvent e;
            e.chunk_id = data.at("chunk_id").get<uint64_t>();
            e.content_type = data.at("content_type").get<std::string>();
            auto decoded = core::crypto::base64_decode(data.at("data").get<std::string>());
            if (!decoded) {
                throw std::invalid_argument("output data is not valid base64");
            }
            e.data = std::move(*decoded);
            e.complete = data.at("complete").get<bool>();
            return e;
        }
        case EventKind::ARTIFACT: {
            ArtifactEvent e;
            e.id = data.at("id").get<std::string>();
            e.kind = data.at("kind").get<std::string>();
            e.path = data.at("path").get<std::string>();
            e.preview_hint = get_optional<std::string>(data, "preview_hint");
            return e;
        }
        case EventKind::CONSENT_REQUEST: {
            ConsentRequestEvent e;
            e.capability = data.at("capability").get<std::string>();
            e.reason = data.at("reason").get<std::string>();
            e.duration_s = get_optional<uint64_t>(data, "duration_s");
            return e;
        }
        case EventKind::CONSENT_GRANT: {
            ConsentGrantEvent e;
            e.capability = data.at("capability").get<std::string>();
            auto ms = get_optional<int64_t>(data, "expires_at");
            if (ms) {
                e.expires_at = from_millis(*ms);
            }
            return e;
        }
        case EventKind::CONSENT_REVOKE: {
            ConsentRevokeEvent e;
            e.capability = data.at("capability").get<std::string>();
            return e;
        }
        case EventKind::ERROR: {
            ErrorEvent e;
            e.code = data.at("code").get<std::string>();
            e.message = data.at("message").get<std::string>();
            e.hint = get_optional<std::string>(data, "hint");
            return e;
        }
        case EventKind::STATE_UPDATE:
        default: {
            StateUpdateEvent e;
            e.key = data.at("key").get<std::string>();
            e.value = data.value("value", json());
            e.scope = data.value("scope", "agent");
            return e;
        }
    }
}

} // namespace

const char* event_kind_to_string(EventKind kind) {
    switch (kind) {
        case EventKind::INPUT:           return "Input";
        case EventKind::OUTPUT:          return "Output";
        case EventKind::ARTIFACT:        return "Artifact";
        case EventKind::CONSENT_REQUEST: return "ConsentRequest";
        case EventKind::CONSENT_GRANT:   return "ConsentGrant";
        case EventKind::CONSENT_REVOKE:  return "ConsentRevoke";
        case EventKind::ERROR:           return "Error";
        case EventKind::STATE_UPDATE:    return "StateUpdate";
        default: return "Unknown";
    }
}

std::optional<EventKind> event_kind_from_string(const std::string& name) {
    if (name == "Input")          return EventKind::INPUT;
    if (name == "Output")         return EventKind::OUTPUT;
    if (name == "Artifact")       return EventKind::ARTIFACT;
    if (name == "ConsentRequest") return EventKind::CONSENT_REQUEST;
    if (name == "ConsentGrant")   return EventKind::CONSENT_GRANT;
    if (name == "ConsentRevoke")  return EventKind::CONSENT_REVOKE;
    if (name == "Error")          return EventKind::ERROR;
    if (name == "StateUpdate")    return EventKind::STATE_UPDATE;
    return std::nullopt;
}

Event Event::make(EventPayload payload, const std::string& agent_id, uint64_t sequence) {
    Event event;
    event.payload = std::move(payload);
    event.agent_id = agent_id;
    event.timestamp = std::chrono::system_clock::now();
    event.sequence = sequence;
    return event;
}

Event Event::input(const std::string& agent_id, const std::string& prompt, uint64_t sequence) {
    return make(InputEvent{prompt, {}}, agent_id, sequence);
}

Event Event::output(const std::string& agent_id, uint64_t chunk_id,
                    const std::string& content_type, std::vector<uint8_t> data,
                    bool complete, uint64_t sequence) {
    OutputEvent e;
    e.chunk_id = chunk_id;
    e.content_type = content_type;
    e.data = std::move(data);
    e.complete = complete;
    return make(std::move(e), agent_id, sequence);
}

Event Event::error(const std::string& agent_id, const std::string& code,
                   const std::string& message, uint64_t sequence,
                   std::optional<std::string> hint) {
    return make(ErrorEvent{code, message, std::move(hint)}, agent_id, sequence);
}

json Event::to_json() const {
    json j;
    j["version"] = PROTOCOL_VERSION;
    j["event_type"]["type"] = event_kind_to_string(kind());
    j["event_type"]["data"] = std::visit(PayloadWriter{}, payload);
    j["agent_id"] = agent_id;
    j["timestamp"] = to_millis(timestamp);
    j["sequence"] = sequence;
    return j;
}

EventParseResult event_from_json(const json& j) {
    EventParseResult result;
    try {
        std::string version = j.value("version", PROTOCOL_VERSION);
        if (version != PROTOCOL_VERSION) {
            result.error = "unsupported event protocol version: " + version;
            return result;
        }

        const auto& type = j.at("event_type");
        std::string type_name = type.at("type").get<std::string>();
        auto kind = event_kind_from_string(type_name);
        if (!kind) {
            result.error = "unknown event type: " + type_name;
            return result;
        }

        result.event.payload = read_payload(*kind, type.at("data"));
        result.event.agent_id = j.at("agent_id").get<std::string>();
        result.event.timestamp = from_millis(j.at("timestamp").get<int64_t>());
        result.event.sequence = j.at("sequence").get<uint64_t>();
        result.success = true;
    } catch (const std::exception& e) {
        result.error = std::string("malformed event: ") + e.what();
    }
    return result;
}

EventParseResult event_from_string(const std::string& text) {
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        EventParseResult result;
        result.error = "malformed event: invalid JSON";
        return result;
    }
    return event_from_json(j);
}

uint64_t EventSequencer::next(const std::string& agent_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return ++counters_[agent_id];
}

uint64_t EventSequencer::current(const std::string& agent_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counters_.find(agent_id);
    return it == counters_.end() ? 0 : it->second;
}

} // namespace warden::agents
