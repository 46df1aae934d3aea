#include "oauth/consent.hpp"
#include "state/sqlite_store.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <mutex>

using json = nlohmann::json;

namespace warden::oauth {

namespace {

int64_t to_millis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

} // namespace

const char* consent_action_name(const ConsentAction& action) {
    if (std::holds_alternative<GrantAction>(action)) return "Grant";
    if (std::holds_alternative<RevokeAction>(action)) return "Revoke";
    return "Deny";
}

const std::string& consent_action_capability(const ConsentAction& action) {
    return std::visit([](const auto& a) -> const std::string& { return a.capability; }, action);
}

json ConsentEntry::to_json() const {
    json j;
    j["timestamp"] = to_millis(timestamp);
    j["agent_id"] = agent_id;
    j["action"]["action"] = consent_action_name(action);
    j["action"]["capability"] = consent_action_capability(action);
    if (const auto* grant = std::get_if<GrantAction>(&action)) {
        if (grant->duration_s) {
            j["action"]["duration_s"] = *grant->duration_s;
        } else {
            j["action"]["duration_s"] = nullptr;
        }
    } else if (const auto* deny = std::get_if<DenyAction>(&action)) {
        j["action"]["reason"] = deny->reason;
    }
    if (user_id) {
        j["user_id"] = *user_id;
    } else {
        j["user_id"] = nullptr;
    }
    return j;
}

std::optional<ConsentEntry> ConsentEntry::from_json(const json& j) {
    try {
        ConsentEntry entry;
        entry.timestamp = std::chrono::system_clock::time_point(
            std::chrono::milliseconds(j.at("timestamp").get<int64_t>()));
        entry.agent_id = j.at("agent_id").get<std::string>();

        const auto& a = j.at("action");
        std::string name = a.at("action").get<std::string>();
        std::string capability = a.at("capability").get<std::string>();
        if (name == "Grant") {
            GrantAction grant{capability, std::nullopt};
            if (a.contains("duration_s") && !a["duration_s"].is_null()) {
                grant.duration_s = a["duration_s"].get<uint64_t>();
            }
            entry.action = grant;
        } else if (name == "Revoke") {
            entry.action = RevokeAction{capability};
        } else if (name == "Deny") {
            entry.action = DenyAction{capability, a.value("reason", "")};
        } else {
            return std::nullopt;
        }

        if (j.contains("user_id") && !j["user_id"].is_null()) {
            entry.user_id = j["user_id"].get<std::string>();
        }
        return entry;
    } catch (const json::exception& e) {
        spdlog::warn("Skipping malformed consent entry: {}", e.what());
        return std::nullopt;
    }
}

core::Status ConsentLedger::append(const std::string& agent_id, ConsentAction action,
                                   std::optional<std::string> user_id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    ConsentEntry entry;
    entry.timestamp = std::chrono::system_clock::now();
    if (!entries_.empty() && entry.timestamp < entries_.back().timestamp) {
        // Keep timestamps non-decreasing in append order even if the wall clock steps back
        entry.timestamp = entries_.back().timestamp;
    }
    entry.agent_id = agent_id;
    entry.action = std::move(action);
    entry.user_id = std::move(user_id);

    std::string serialized;
    try {
        serialized = entry.to_json().dump();
    } catch (const json::exception& e) {
        return core::Status::fail(core::ErrorCode::BACKEND,
            std::string("failed to serialize consent entry: ") + e.what());
    }

    entries_.push_back(entry);

    if (store_) {
        auto status = store_->append_event(to_millis(entry.timestamp), CONSENT_EVENT_TYPE,
                                           agent_id, serialized);
        if (!status.success) {
            spdlog::error("Consent entry kept in memory only: {}", status.error);
        }
    }
    return core::Status::ok();
}

core::Status ConsentLedger::log_grant(const std::string& agent_id, const std::string& capability,
                                      std::optional<uint64_t> duration_s,
                                      std::optional<std::string> user_id) {
    auto status = append(agent_id, GrantAction{capability, duration_s}, std::move(user_id));
    if (status.success) {
        spdlog::info("Consent granted: {} -> {}", agent_id, capability);
    }
    return status;
}

core::Status ConsentLedger::log_revoke(const std::string& agent_id, const std::string& capability,
                                       std::optional<std::string> user_id) {
    auto status = append(agent_id, RevokeAction{capability}, std::move(user_id));
    if (status.success) {
        spdlog::info("Consent revoked: {} -> {}", agent_id, capability);
    }
    return status;
}

core::Status ConsentLedger::log_deny(const std::string& agent_id, const std::string& capability,
                                     const std::string& reason,
                                     std::optional<std::string> user_id) {
    auto status = append(agent_id, DenyAction{capability, reason}, std::move(user_id));
    if (status.success) {
        spdlog::info("Consent denied: {} -> {} ({})", agent_id, capability, reason);
    }
    return status;
}

std::vector<ConsentEntry> ConsentLedger::get_all() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_;
}

std::vector<ConsentEntry> ConsentLedger::get_for_agent(const std::string& agent_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<ConsentEntry> result;
    for (const auto& entry : entries_) {
        if (entry.agent_id == agent_id) {
            result.push_back(entry);
        }
    }
    return result;
}

size_t ConsentLedger::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.size();
}

std::string ConsentLedger::export_json() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    json entries = json::array();
    for (const auto& entry : entries_) {
        entries.push_back(entry.to_json());
    }
    return entries.dump(2);
}

void ConsentLedger::attach_store(std::shared_ptr<state::SqliteStore> store) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    store_ = std::move(store);
    pending_restore_ = store_ ? store_->events_by_type(CONSENT_EVENT_TYPE).size() : 0;
}

size_t ConsentLedger::restore() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (!store_) {
        return 0;
    }

    auto rows = store_->events_by_type(CONSENT_EVENT_TYPE);
    rows.resize(std::min(rows.size(), pending_restore_));
    pending_restore_ = 0;

    std::vector<ConsentEntry> restored;
    for (const auto& row : rows) {
        json j = json::parse(row.data, nullptr, false);
        if (j.is_discarded()) {
            spdlog::warn("Skipping unreadable consent row {}", row.id);
            continue;
        }
        auto entry = ConsentEntry::from_json(j);
        if (entry) {
            restored.push_back(std::move(*entry));
        }
    }

    size_t count = restored.size();
    restored.insert(restored.end(), entries_.begin(), entries_.end());
    entries_ = std::move(restored);
    spdlog::info("Restored {} consent entries", count);
    return count;
}

} // namespace warden::oauth
