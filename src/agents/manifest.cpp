#include "agents/manifest.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace warden::agents {

core::Status Manifest::validate() const {
    if (schema_version != MANIFEST_SCHEMA_VERSION) {
        return core::Status::fail(core::ErrorCode::VALIDATION,
            "unsupported manifest schema version: " + schema_version +
            " (expected " + MANIFEST_SCHEMA_VERSION + ")");
    }

    if (entry.empty()) {
        return core::Status::fail(core::ErrorCode::VALIDATION,
            "manifest entry point cannot be empty");
    }

    // The entry point must stay inside the agent directory
    std::filesystem::path entry_rel(entry);
    if (entry_rel.is_absolute() || entry_rel.has_root_name()) {
        return core::Status::fail(core::ErrorCode::VALIDATION,
            "manifest entry point must be relative to the agent directory: " + entry);
    }
    auto normalized = entry_rel.lexically_normal();
    if (normalized.empty() || normalized == "." || *normalized.begin() == "..") {
        return core::Status::fail(core::ErrorCode::VALIDATION,
            "manifest entry point escapes the agent directory: " + entry);
    }

    for (const auto& cap : capabilities) {
        if (cap.find('.') == std::string::npos && cap.find(':') == std::string::npos) {
            spdlog::warn("Capability '{}' in manifest '{}' may not follow standard format", cap, name);
        }
    }

    return core::Status::ok();
}

json Manifest::to_json() const {
    json j;
    j["schema_version"] = schema_version;
    j["name"] = name;
    j["version"] = version;
    j["entry"] = entry;
    j["sandbox"] = sandbox_mode_to_string(sandbox);
    j["capabilities"] = capabilities;
    j["oauth_scopes"] = oauth_scopes;
    j["resources"]["cpu"] = resources.cpu;
    j["resources"]["mem"] = resources.mem;
    j["ui"]["hints"] = ui_hints;
    return j;
}

ManifestResult Manifest::from_json(const json& j) {
    ManifestResult result;
    try {
        Manifest m;
        m.schema_version = j.at("schema_version").get<std::string>();
        m.name = j.at("name").get<std::string>();
        m.version = j.at("version").get<std::string>();
        m.entry = j.value("entry", "");

        std::string sandbox = j.at("sandbox").get<std::string>();
        auto mode = sandbox_mode_from_string(sandbox);
        if (!mode) {
            result.code = core::ErrorCode::VALIDATION;
            result.error = "unknown sandbox mode: " + sandbox + " (expected wasm or native)";
            return result;
        }
        m.sandbox = *mode;

        m.capabilities = j.value("capabilities", std::vector<std::string>{});
        m.oauth_scopes = j.value("oauth_scopes", std::vector<std::string>{});
        if (j.contains("resources")) {
            const auto& res = j["resources"];
            m.resources.cpu = res.value("cpu", "");
            m.resources.mem = res.value("mem", "");
        }
        if (j.contains("ui")) {
            m.ui_hints = j["ui"].value("hints", std::vector<std::string>{});
        }

        if (m.name.empty()) {
            result.code = core::ErrorCode::VALIDATION;
            result.error = "manifest name cannot be empty";
            return result;
        }

        result.success = true;
        result.manifest = std::move(m);
    } catch (const json::exception& e) {
        result.code = core::ErrorCode::VALIDATION;
        result.error = std::string("invalid manifest: ") + e.what();
    }
    return result;
}

ManifestResult Manifest::load(const std::filesystem::path& path) {
    ManifestResult result;

    std::ifstream file(path);
    if (!file.is_open()) {
        result.code = core::ErrorCode::NOT_FOUND;
        result.error = "failed to read manifest: " + path.string();
        return result;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    json j = json::parse(buffer.str(), nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        result.code = core::ErrorCode::VALIDATION;
        result.error = "failed to parse manifest: " + path.string();
        return result;
    }

    result = from_json(j);
    if (!result.success) {
        result.error = "failed to parse manifest " + path.string() + ": " + result.error;
        return result;
    }

    auto status = result.manifest.validate();
    if (!status.success) {
        result.success = false;
        result.code = status.code;
        result.error = "invalid manifest " + path.string() + ": " + status.error;
        return result;
    }

    return result;
}

} // namespace warden::agents
