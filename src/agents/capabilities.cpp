#include "agents/capabilities.hpp"
#include "core/crypto.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <mutex>

namespace warden::agents {

CapabilityParseResult parse_capability(const std::string& text) {
    CapabilityParseResult result;

    size_t dot = text.find('.');
    if (dot == std::string::npos || text.find('.', dot + 1) != std::string::npos) {
        result.code = core::ErrorCode::FORMAT;
        result.error = "invalid capability format: '" + text + "' (expected scope.action)";
        return result;
    }

    std::string scope = text.substr(0, dot);
    std::string action = text.substr(dot + 1);
    if (scope.empty() || action.empty()) {
        result.code = core::ErrorCode::FORMAT;
        result.error = "invalid capability format: '" + text + "' (empty scope or action)";
        return result;
    }

    result.success = true;
    result.capability = Capability(std::move(scope), std::move(action));
    return result;
}

CapabilityGrant CapabilityManager::grant(const Capability& capability,
                                         std::optional<std::chrono::milliseconds> duration) {
    CapabilityGrant grant;
    grant.capability = capability;
    grant.granted_at = Clock::now();
    if (duration) {
        grant.expires_at = grant.granted_at + *duration;
    }

    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        grants_.push_back(grant);
    }

    if (duration) {
        spdlog::info("Granted capability: {} ({}ms)", capability.to_string(), duration->count());
    } else {
        spdlog::info("Granted capability: {}", capability.to_string());
    }
    return grant;
}

bool CapabilityManager::check(const Capability& capability) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return has_valid_grant_locked(capability, Clock::now());
}

core::Status CapabilityManager::revoke(const Capability& capability) {
    bool revoked = false;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        for (auto& grant : grants_) {
            if (grant.capability == capability && !grant.revoked) {
                grant.revoked = true;
                revoked = true;
            }
        }
    }

    if (!revoked) {
        return core::Status::fail(core::ErrorCode::NOT_FOUND,
            "capability not found or already revoked: " + capability.to_string());
    }

    spdlog::info("Revoked capability: {}", capability.to_string());
    return core::Status::ok();
}

std::vector<CapabilityGrant> CapabilityManager::active_grants() const {
    auto now = Clock::now();
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<CapabilityGrant> active;
    for (const auto& grant : grants_) {
        if (grant.is_valid_at(now)) {
            active.push_back(grant);
        }
    }
    return active;
}

size_t CapabilityManager::cleanup_expired() {
    auto now = Clock::now();
    std::unique_lock<std::shared_mutex> lock(mutex_);

    size_t before = grants_.size();
    grants_.erase(std::remove_if(grants_.begin(), grants_.end(),
        [now](const CapabilityGrant& g) { return !g.is_valid_at(now); }),
        grants_.end());
    size_t removed = before - grants_.size();

    prune_tickets_locked(now);

    if (removed > 0) {
        spdlog::debug("Removed {} stale capability grants", removed);
    }
    return removed;
}

TicketResult CapabilityManager::issue_ticket(const std::string& agent_id,
                                             const Capability& capability,
                                             std::chrono::milliseconds ttl) {
    TicketResult result;
    auto now = Clock::now();

    std::unique_lock<std::shared_mutex> lock(mutex_);
    prune_tickets_locked(now);
    if (!has_valid_grant_locked(capability, now)) {
        result.code = core::ErrorCode::NOT_FOUND;
        result.error = "no valid grant for capability: " + capability.to_string();
        return result;
    }

    ExecutionTicket ticket;
    ticket.id = core::crypto::random_uuid();
    if (ticket.id.empty()) {
        result.code = core::ErrorCode::BACKEND;
        result.error = "failed to generate ticket id";
        return result;
    }
    ticket.agent_id = agent_id;
    ticket.capability = capability;
    ticket.issued_at = now;
    ticket.expires_at = now + ttl;
    tickets_[ticket.id] = ticket;

    result.success = true;
    result.ticket = std::move(ticket);
    return result;
}

core::Status CapabilityManager::redeem(const ExecutionTicket& ticket) {
    auto now = Clock::now();
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = tickets_.find(ticket.id);
    if (it == tickets_.end()) {
        return core::Status::fail(core::ErrorCode::NOT_FOUND,
            "unknown or already redeemed ticket for " + ticket.capability.to_string());
    }

    ExecutionTicket stored = it->second;
    tickets_.erase(it);

    if (stored.agent_id != ticket.agent_id || stored.capability != ticket.capability) {
        return core::Status::fail(core::ErrorCode::VALIDATION,
            "ticket does not match the presented capability");
    }
    if (now > stored.expires_at) {
        return core::Status::fail(core::ErrorCode::NOT_FOUND,
            "ticket expired for " + stored.capability.to_string());
    }
    if (!has_valid_grant_locked(stored.capability, now)) {
        return core::Status::fail(core::ErrorCode::NOT_FOUND,
            "capability no longer granted: " + stored.capability.to_string());
    }
    return core::Status::ok();
}

void CapabilityManager::discard(const ExecutionTicket& ticket) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    tickets_.erase(ticket.id);
}

size_t CapabilityManager::outstanding_tickets() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return tickets_.size();
}

void CapabilityManager::prune_tickets_locked(Clock::time_point now) {
    for (auto it = tickets_.begin(); it != tickets_.end(); ) {
        if (now > it->second.expires_at) {
            it = tickets_.erase(it);
        } else {
            ++it;
        }
    }
}

bool CapabilityManager::has_valid_grant_locked(const Capability& capability,
                                               Clock::time_point now) const {
    return std::any_of(grants_.begin(), grants_.end(), [&](const CapabilityGrant& g) {
        return g.capability == capability && g.is_valid_at(now);
    });
}

} // namespace warden::agents
