#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/error.hpp"

namespace warden::state {
class SqliteStore;
}

namespace warden::oauth {

struct GrantAction {
    std::string capability;
    std::optional<uint64_t> duration_s;
};

struct RevokeAction {
    std::string capability;
};

struct DenyAction {
    std::string capability;
    std::string reason;
};

using ConsentAction = std::variant<GrantAction, RevokeAction, DenyAction>;

const char* consent_action_name(const ConsentAction& action);
const std::string& consent_action_capability(const ConsentAction& action);

// Ledger entry. Entries carry capability identifiers, durations and reasons only.
struct ConsentEntry {
    std::chrono::system_clock::time_point timestamp;
    std::string agent_id;
    ConsentAction action;
    std::optional<std::string> user_id;

    nlohmann::json to_json() const;
    static std::optional<ConsentEntry> from_json(const nlohmann::json& j);
};

// Event log type used when entries are mirrored to the state database
inline constexpr const char* CONSENT_EVENT_TYPE = "consent";

// Append-only audit trail of grant/revoke/deny decisions
class ConsentLedger {
public:
    core::Status log_grant(const std::string& agent_id, const std::string& capability,
                           std::optional<uint64_t> duration_s,
                           std::optional<std::string> user_id = std::nullopt);
    core::Status log_revoke(const std::string& agent_id, const std::string& capability,
                            std::optional<std::string> user_id = std::nullopt);
    core::Status log_deny(const std::string& agent_id, const std::string& capability,
                          const std::string& reason,
                          std::optional<std::string> user_id = std::nullopt);

    std::vector<ConsentEntry> get_all() const;
    std::vector<ConsentEntry> get_for_agent(const std::string& agent_id) const;
    size_t size() const;

    // Pretty-printed JSON array of every entry, in append order
    std::string export_json() const;

    // Mirror subsequent entries into the durable event log
    void attach_store(std::shared_ptr<state::SqliteStore> store);

    // Load the entries the store held when it was attached, ahead of any
    // in-memory ones. Returns the number of entries restored; a second call
    // restores nothing.
    size_t restore();

private:
    core::Status append(const std::string& agent_id, ConsentAction action,
                        std::optional<std::string> user_id);

    std::vector<ConsentEntry> entries_;
    std::shared_ptr<state::SqliteStore> store_;
    size_t pending_restore_ = 0;   // consent rows present in the store at attach time
    mutable std::shared_mutex mutex_;
};

} // namespace warden::oauth
