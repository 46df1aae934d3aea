#include "agents/registry.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <mutex>

namespace warden::agents {

core::Status AgentRegistry::register_agent(const std::filesystem::path& agent_dir) {
    auto manifest_path = agent_dir / MANIFEST_FILENAME;

    std::error_code ec;
    if (!std::filesystem::exists(manifest_path, ec)) {
        return core::Status::fail(core::ErrorCode::NOT_FOUND,
            std::string("no ") + MANIFEST_FILENAME + " found in " + agent_dir.string());
    }

    auto loaded = Manifest::load(manifest_path);
    if (!loaded.success) {
        return core::Status::fail(loaded.code,
            "failed to load agent manifest from " + agent_dir.string() + ": " + loaded.error);
    }

    AgentInfo info;
    info.manifest = std::move(loaded.manifest);
    info.base_dir = agent_dir;
    info.enabled = true;

    std::string name = info.manifest.name;
    std::string version = info.manifest.version;
    bool replaced = false;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        replaced = agents_.count(name) > 0;
        agents_[name] = std::move(info);
    }

    if (replaced) {
        spdlog::info("Re-registered agent: {} v{} (previous entry replaced)", name, version);
    } else {
        spdlog::info("Registered agent: {} v{}", name, version);
    }
    return core::Status::ok();
}

size_t AgentRegistry::discover(const std::filesystem::path& agents_dir) {
    std::error_code ec;
    if (!std::filesystem::is_directory(agents_dir, ec)) {
        spdlog::warn("Agents directory does not exist: {}", agents_dir.string());
        return 0;
    }

    // Sorted for a stable registration order when names collide
    std::vector<std::filesystem::path> candidates;
    for (std::filesystem::directory_iterator it(agents_dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code entry_ec;
        if (it->is_directory(entry_ec) &&
            std::filesystem::exists(it->path() / MANIFEST_FILENAME, entry_ec)) {
            candidates.push_back(it->path());
        }
    }
    if (ec) {
        spdlog::warn("Failed to read agents directory {}: {}", agents_dir.string(), ec.message());
    }
    std::sort(candidates.begin(), candidates.end());

    size_t registered = 0;
    for (const auto& dir : candidates) {
        auto status = register_agent(dir);
        if (!status.success) {
            spdlog::warn("Failed to register agent in {}: {}", dir.string(), status.error);
            continue;
        }
        registered++;
    }

    spdlog::info("Discovered {} agent(s) in {}", registered, agents_dir.string());
    return registered;
}

std::optional<AgentInfo> AgentRegistry::get(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = agents_.find(name);
    if (it == agents_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<AgentInfo> AgentRegistry::list() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<AgentInfo> result;
    result.reserve(agents_.size());
    for (const auto& [_, info] : agents_) {
        result.push_back(info);
    }
    return result;
}

std::vector<AgentInfo> AgentRegistry::get_by_sandbox(SandboxMode mode) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<AgentInfo> result;
    for (const auto& [_, info] : agents_) {
        if (info.enabled && info.manifest.sandbox == mode) {
            result.push_back(info);
        }
    }
    return result;
}

core::Status AgentRegistry::set_enabled(const std::string& name, bool enabled) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = agents_.find(name);
    if (it == agents_.end()) {
        return core::Status::fail(core::ErrorCode::NOT_FOUND, "agent not found: " + name);
    }
    it->second.enabled = enabled;
    return core::Status::ok();
}

bool AgentRegistry::unregister(const std::string& name) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return agents_.erase(name) > 0;
}

size_t AgentRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return agents_.size();
}

} // namespace warden::agents
