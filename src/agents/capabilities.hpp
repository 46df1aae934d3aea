#pragma once
#include <chrono>
#include <cstddef>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "core/error.hpp"

namespace warden::agents {

using Clock = std::chrono::system_clock;

// Capability identifier, e.g. "files.read" -> scope "files", action "read"
struct Capability {
    std::string scope;
    std::string action;

    Capability() = default;
    Capability(std::string scope, std::string action)
        : scope(std::move(scope)), action(std::move(action)) {}

    std::string to_string() const { return scope + "." + action; }

    bool operator==(const Capability& other) const {
        return scope == other.scope && action == other.action;
    }
    bool operator!=(const Capability& other) const { return !(*this == other); }
};

struct CapabilityParseResult {
    bool success = false;
    core::ErrorCode code = core::ErrorCode::NONE;
    std::string error;
    Capability capability;
};

// Parse "scope.action". Fails with FORMAT unless exactly two non-empty parts.
CapabilityParseResult parse_capability(const std::string& text);

// Capability grant with optional time bound
struct CapabilityGrant {
    Capability capability;
    Clock::time_point granted_at;
    std::optional<Clock::time_point> expires_at;
    bool revoked = false;

    bool is_valid_at(Clock::time_point now) const {
        if (revoked) return false;
        return !expires_at || now <= *expires_at;
    }
    bool is_valid() const { return is_valid_at(Clock::now()); }
};

// Single-use proof that a capability check passed for an agent.
// Redeemed by the runtime immediately before handing work to a backend.
struct ExecutionTicket {
    std::string id;
    std::string agent_id;
    Capability capability;
    Clock::time_point issued_at;
    Clock::time_point expires_at;
};

struct TicketResult {
    bool success = false;
    core::ErrorCode code = core::ErrorCode::NONE;
    std::string error;
    ExecutionTicket ticket;
};

// Default-deny capability store
class CapabilityManager {
public:
    static constexpr std::chrono::seconds DEFAULT_TICKET_TTL{30};

    CapabilityGrant grant(const Capability& capability,
                          std::optional<std::chrono::milliseconds> duration = std::nullopt);

    // True iff a non-revoked, non-expired grant for the capability exists
    bool check(const Capability& capability) const;

    // Revoke every live grant of the capability; NOT_FOUND when there is none
    core::Status revoke(const Capability& capability);

    std::vector<CapabilityGrant> active_grants() const;

    // Drop grants that are no longer valid (revoked or expired) and stale tickets.
    // Returns the number of grants removed.
    size_t cleanup_expired();

    TicketResult issue_ticket(const std::string& agent_id, const Capability& capability,
                              std::chrono::milliseconds ttl = DEFAULT_TICKET_TTL);

    // Consume a ticket; fails if it was already used, has expired, or its grant
    // is no longer valid. The check and the consumption happen under one lock.
    core::Status redeem(const ExecutionTicket& ticket);

    // Drop an issued ticket that will never be redeemed
    void discard(const ExecutionTicket& ticket);

    size_t outstanding_tickets() const;

private:
    std::vector<CapabilityGrant> grants_;
    std::unordered_map<std::string, ExecutionTicket> tickets_;
    mutable std::shared_mutex mutex_;

    bool has_valid_grant_locked(const Capability& capability, Clock::time_point now) const;
    void prune_tickets_locked(Clock::time_point now);
};

} // namespace warden::agents
