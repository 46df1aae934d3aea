#pragma once
#include <filesystem>
#include <string>
#include "oauth/vault.hpp"

namespace warden::host {

// Control plane configuration, normally read from the environment / .env
struct ControlPlaneConfig {
    std::filesystem::path agents_dir;
    oauth::VaultBackend vault_backend = oauth::InMemory{};
    std::filesystem::path state_db;      // empty = no durable state
    std::string log_level = "info";
    std::string github_client_id;        // provider registered when set
    std::string google_client_id;
};

// WARDEN_AGENTS_DIR, WARDEN_VAULT_BACKEND (memory|keychain|sqlite), WARDEN_VAULT_PATH,
// WARDEN_VAULT_PASSPHRASE, WARDEN_STATE_DB ("none" disables), WARDEN_LOG_LEVEL,
// GITHUB_CLIENT_ID, GOOGLE_CLIENT_ID
ControlPlaneConfig load_config_from_env();

} // namespace warden::host
