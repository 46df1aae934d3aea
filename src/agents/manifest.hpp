#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/error.hpp"

namespace warden::agents {

inline constexpr const char* MANIFEST_FILENAME = "manifest.json";
inline constexpr const char* MANIFEST_SCHEMA_VERSION = "0.1";

// Execution isolation strategy for an agent
enum class SandboxMode {
    WASM,
    NATIVE
};

inline std::optional<SandboxMode> sandbox_mode_from_string(const std::string& str) {
    if (str == "wasm") return SandboxMode::WASM;
    if (str == "native") return SandboxMode::NATIVE;
    return std::nullopt;
}

inline const char* sandbox_mode_to_string(SandboxMode mode) {
    switch (mode) {
        case SandboxMode::NATIVE: return "native";
        default: return "wasm";
    }
}

struct ResourceLimits {
    std::string cpu;   // e.g. "500m"
    std::string mem;   // e.g. "512Mi"
};

struct ManifestResult;

// Agent manifest (schema 0.1). Immutable once loaded and validated.
struct Manifest {
    std::string schema_version;
    std::string name;
    std::string version;
    std::string entry;
    SandboxMode sandbox = SandboxMode::WASM;
    std::vector<std::string> capabilities;
    std::vector<std::string> oauth_scopes;
    ResourceLimits resources;
    std::vector<std::string> ui_hints;   // e.g. "streaming", "diff", "preview"

    // Schema version must be 0.1 and the entry point non-empty.
    // Capability strings that do not look like scope.action only warn.
    core::Status validate() const;

    std::filesystem::path entry_path(const std::filesystem::path& base_dir) const {
        return base_dir / entry;
    }

    bool requires_native() const { return sandbox == SandboxMode::NATIVE; }

    nlohmann::json to_json() const;

    // Parse without validating
    static ManifestResult from_json(const nlohmann::json& j);

    // Read, parse and validate a manifest file
    static ManifestResult load(const std::filesystem::path& path);
};

struct ManifestResult {
    bool success = false;
    core::ErrorCode code = core::ErrorCode::NONE;
    std::string error;
    Manifest manifest;
};

} // namespace warden::agents
