#pragma once
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace warden::agents {

// Event protocol version carried in every serialized envelope
inline constexpr const char* PROTOCOL_VERSION = "0.1";

// User or system input to an agent
struct InputEvent {
    std::string prompt;
    std::vector<std::string> context_refs;
};

// Agent response chunk
struct OutputEvent {
    uint64_t chunk_id = 0;
    std::string content_type;   // "text/plain", "text/markdown", "application/json"
    std::vector<uint8_t> data;
    bool complete = false;
};

// Generated artifact
struct ArtifactEvent {
    std::string id;
    std::string kind;           // "diff", "log", "preview", "code"
    std::string path;
    std::optional<std::string> preview_hint;
};

// Agent asks the host for a capability
struct ConsentRequestEvent {
    std::string capability;
    std::string reason;
    std::optional<uint64_t> duration_s;
};

// Host granted a capability
struct ConsentGrantEvent {
    std::string capability;
    std::optional<std::chrono::system_clock::time_point> expires_at;
};

// Capability withdrawn
struct ConsentRevokeEvent {
    std::string capability;
};

struct ErrorEvent {
    std::string code;
    std::string message;
    std::optional<std::string> hint;
};

struct StateUpdateEvent {
    std::string key;
    nlohmann::json value;
    std::string scope;          // "agent", "session", "global"
};

using EventPayload = std::variant<InputEvent, OutputEvent, ArtifactEvent,
                                  ConsentRequestEvent, ConsentGrantEvent, ConsentRevokeEvent,
                                  ErrorEvent, StateUpdateEvent>;

// Discriminator, in the same order as EventPayload alternatives
enum class EventKind {
    INPUT,
    OUTPUT,
    ARTIFACT,
    CONSENT_REQUEST,
    CONSENT_GRANT,
    CONSENT_REVOKE,
    ERROR,
    STATE_UPDATE
};

const char* event_kind_to_string(EventKind kind);
std::optional<EventKind> event_kind_from_string(const std::string& name);

// Stable error codes carried by runtime Error events
namespace error_codes {
inline constexpr const char* CAPABILITY_FORMAT = "E_CAPABILITY_FORMAT";
inline constexpr const char* CAPABILITY_DENIED = "E_CAPABILITY_DENIED";
inline constexpr const char* CAPABILITY_REVOKED = "E_CAPABILITY_REVOKED";
inline constexpr const char* BACKEND = "E_BACKEND";
inline constexpr const char* AGENT_EXIT = "E_AGENT_EXIT";
inline constexpr const char* AGENT_DISABLED = "E_AGENT_DISABLED";
} // namespace error_codes

// Protocol envelope
struct Event {
    EventPayload payload;
    std::string agent_id;
    std::chrono::system_clock::time_point timestamp;
    uint64_t sequence = 0;

    EventKind kind() const { return static_cast<EventKind>(payload.index()); }

    template <typename T>
    const T* as() const { return std::get_if<T>(&payload); }

    static Event make(EventPayload payload, const std::string& agent_id, uint64_t sequence);

    static Event input(const std::string& agent_id, const std::string& prompt, uint64_t sequence);
    static Event output(const std::string& agent_id, uint64_t chunk_id,
                        const std::string& content_type, std::vector<uint8_t> data,
                        bool complete, uint64_t sequence);
    static Event error(const std::string& agent_id, const std::string& code,
                       const std::string& message, uint64_t sequence,
                       std::optional<std::string> hint = std::nullopt);

    nlohmann::json to_json() const;
};

struct EventParseResult {
    bool success = false;
    std::string error;
    Event event;
};

EventParseResult event_from_json(const nlohmann::json& j);
EventParseResult event_from_string(const std::string& text);

// Hands out monotonically increasing sequence numbers per agent
class EventSequencer {
public:
    uint64_t next(const std::string& agent_id);
    uint64_t current(const std::string& agent_id) const;

private:
    std::unordered_map<std::string, uint64_t> counters_;
    mutable std::mutex mutex_;
};

} // namespace warden::agents
