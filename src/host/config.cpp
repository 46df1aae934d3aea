#include "host/config.hpp"
#include "core/config.hpp"
#include "core/paths.hpp"
#include <spdlog/spdlog.h>

namespace warden::host {

namespace cfg = core::config;

ControlPlaneConfig load_config_from_env() {
    cfg::load_dotenv();

    ControlPlaneConfig config;

    std::string agents_dir = cfg::get_env("WARDEN_AGENTS_DIR");
    config.agents_dir = agents_dir.empty() ? core::paths::default_agents_dir()
                                           : std::filesystem::path(agents_dir);

    std::string backend = cfg::get_env_or("WARDEN_VAULT_BACKEND", "sqlite");
    if (backend == "memory") {
        config.vault_backend = oauth::InMemory{};
    } else if (backend == "keychain") {
        config.vault_backend = oauth::OsKeychain{};
    } else {
        if (backend != "sqlite") {
            spdlog::warn("Unknown WARDEN_VAULT_BACKEND '{}', using sqlite", backend);
        }
        oauth::EncryptedSqlite sqlite;
        std::string path = cfg::get_env("WARDEN_VAULT_PATH");
        sqlite.path = path.empty() ? core::paths::data_dir() / "vault.db" : std::filesystem::path(path);
        std::string passphrase = cfg::get_env("WARDEN_VAULT_PASSPHRASE");
        if (!passphrase.empty()) {
            sqlite.passphrase = passphrase;
        }
        config.vault_backend = sqlite;
    }

    std::string state_db = cfg::get_env("WARDEN_STATE_DB");
    if (state_db == "none") {
        config.state_db.clear();
    } else {
        config.state_db = state_db.empty() ? core::paths::data_dir() / "state.db"
                                           : std::filesystem::path(state_db);
    }

    config.log_level = cfg::get_env_or("WARDEN_LOG_LEVEL", "info");
    config.github_client_id = cfg::get_env("GITHUB_CLIENT_ID");
    config.google_client_id = cfg::get_env("GOOGLE_CLIENT_ID");
    return config;
}

} // namespace warden::host
