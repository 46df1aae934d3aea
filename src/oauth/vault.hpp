#pragma once
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <variant>
#include <vector>
#include "core/error.hpp"
#include "oauth/encrypted_store.hpp"
#include "oauth/keychain.hpp"
#include "oauth/types.hpp"

namespace warden::oauth {

// Vault storage strategies, fixed for a vault's lifetime
struct OsKeychain {
    std::string service = "warden";
};

struct EncryptedSqlite {
    std::filesystem::path path;
    std::optional<std::string> passphrase;  // master key file beside the vault when unset
};

struct InMemory {};

using VaultBackend = std::variant<OsKeychain, EncryptedSqlite, InMemory>;

const char* vault_backend_name(const VaultBackend& backend);

// Secret store gated by an explicit lock. Every data operation fails with
// LOCKED while locked; locking keeps stored data resident.
class TokenVault {
public:
    // nullptr + error when the backend cannot be opened
    static std::shared_ptr<TokenVault> create(const VaultBackend& backend, std::string& error);

    core::Status store(const std::string& label, const std::string& secret);
    SecretResult fetch(const std::string& label);

    // Idempotent: absent labels are not an error
    core::Status erase(const std::string& label);

    // Re-key the encrypted backend. No-op with a warning for the others.
    core::Status rotate_keys();

    // Labels held by the vault. The keychain backend cannot enumerate and returns none.
    std::vector<std::string> labels();

    void lock();
    void unlock();
    bool is_locked() const;

    const VaultBackend& backend() const { return backend_; }

private:
    using MemoryStore = std::map<std::string, std::string>;
    using Storage = std::variant<KeychainClient, std::unique_ptr<EncryptedStore>, MemoryStore>;

    TokenVault(VaultBackend backend, Storage storage);

    core::Status locked_error(const std::string& operation) const;

    VaultBackend backend_;
    Storage storage_;
    bool locked_ = false;
    mutable std::shared_mutex mutex_;
};

} // namespace warden::oauth
