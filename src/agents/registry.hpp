#pragma once
#include <filesystem>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "agents/manifest.hpp"
#include "core/error.hpp"

namespace warden::agents {

// A registered agent
struct AgentInfo {
    Manifest manifest;
    std::filesystem::path base_dir;
    bool enabled = true;
};

// Agent registry keyed by manifest name (last registration wins)
class AgentRegistry {
public:
    // Register the agent in dir; requires dir/manifest.json
    core::Status register_agent(const std::filesystem::path& agent_dir);

    // Register every subdirectory that carries a manifest. Failures of single
    // agents are logged and skipped; returns the number registered.
    size_t discover(const std::filesystem::path& agents_dir);

    std::optional<AgentInfo> get(const std::string& name) const;
    std::vector<AgentInfo> list() const;
    std::vector<AgentInfo> get_by_sandbox(SandboxMode mode) const;

    // NOT_FOUND for an unknown agent
    core::Status set_enabled(const std::string& name, bool enabled);

    // Idempotent; returns whether an entry was removed
    bool unregister(const std::string& name);

    size_t size() const;

private:
    std::unordered_map<std::string, AgentInfo> agents_;
    mutable std::shared_mutex mutex_;
};

} // namespace warden::agents
