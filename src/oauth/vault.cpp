#include "oauth/vault.hpp"
#include "core/crypto.hpp"
#include <spdlog/spdlog.h>
#include <mutex>
#include <type_traits>

namespace warden::oauth {

const char* vault_backend_name(const VaultBackend& backend) {
    if (std::holds_alternative<OsKeychain>(backend)) return "keychain";
    if (std::holds_alternative<EncryptedSqlite>(backend)) return "sqlite";
    return "memory";
}

TokenVault::TokenVault(VaultBackend backend, Storage storage)
    : backend_(std::move(backend)), storage_(std::move(storage)) {}

std::shared_ptr<TokenVault> TokenVault::create(const VaultBackend& backend, std::string& error) {
    Storage storage;
    if (const auto* keychain = std::get_if<OsKeychain>(&backend)) {
        storage = KeychainClient(keychain->service);
    } else if (const auto* sqlite = std::get_if<EncryptedSqlite>(&backend)) {
        auto store = EncryptedStore::open(sqlite->path, sqlite->passphrase, error);
        if (!store) {
            return nullptr;
        }
        storage = std::move(store);
    } else {
        storage = MemoryStore{};
    }

    spdlog::info("Token vault ready ({} backend)", vault_backend_name(backend));
    return std::shared_ptr<TokenVault>(new TokenVault(backend, std::move(storage)));
}

core::Status TokenVault::locked_error(const std::string& operation) const {
    return core::Status::fail(core::ErrorCode::LOCKED, "vault is locked: cannot " + operation);
}

core::Status TokenVault::store(const std::string& label, const std::string& secret) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (locked_) {
        return locked_error("store '" + label + "'");
    }

    return std::visit([&](auto& s) -> core::Status {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, KeychainClient>) {
            return s.store(label, secret);
        } else if constexpr (std::is_same_v<T, MemoryStore>) {
            auto it = s.find(label);
            if (it != s.end()) {
                core::crypto::secure_clear(it->second);
            }
            s[label] = secret;
            return core::Status::ok();
        } else {
            return s->put(label, secret);
        }
    }, storage_);
}

SecretResult TokenVault::fetch(const std::string& label) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (locked_) {
        auto status = locked_error("fetch '" + label + "'");
        return SecretResult::fail(status.code, status.error);
    }

    return std::visit([&](auto& s) -> SecretResult {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, KeychainClient>) {
            return s.lookup(label);
        } else if constexpr (std::is_same_v<T, MemoryStore>) {
            auto it = s.find(label);
            if (it == s.end()) {
                return SecretResult::fail(core::ErrorCode::NOT_FOUND, "no secret stored for '" + label + "'");
            }
            return SecretResult::found(it->second);
        } else {
            return s->get(label);
        }
    }, storage_);
}

core::Status TokenVault::erase(const std::string& label) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (locked_) {
        return locked_error("delete '" + label + "'");
    }

    return std::visit([&](auto& s) -> core::Status {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, KeychainClient>) {
            return s.clear(label);
        } else if constexpr (std::is_same_v<T, MemoryStore>) {
            auto it = s.find(label);
            if (it != s.end()) {
                core::crypto::secure_clear(it->second);
                s.erase(it);
            }
            return core::Status::ok();
        } else {
            return s->remove(label);
        }
    }, storage_);
}

core::Status TokenVault::rotate_keys() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (locked_) {
        return locked_error("rotate keys");
    }

    auto* encrypted = std::get_if<std::unique_ptr<EncryptedStore>>(&storage_);
    if (!encrypted) {
        spdlog::warn("Key rotation is not supported by the {} vault backend; nothing to do",
                     vault_backend_name(backend_));
        return core::Status::ok();
    }
    return (*encrypted)->rotate_keys();
}

std::vector<std::string> TokenVault::labels() {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (locked_) {
        return {};
    }

    std::vector<std::string> result;
    if (const auto* memory = std::get_if<MemoryStore>(&storage_)) {
        for (const auto& [label, secret] : *memory) {
            result.push_back(label);
        }
    } else if (auto* encrypted = std::get_if<std::unique_ptr<EncryptedStore>>(&storage_)) {
        result = (*encrypted)->labels();
    }
    return result;
}

void TokenVault::lock() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    locked_ = true;
    spdlog::info("Vault locked");
}

void TokenVault::unlock() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    locked_ = false;
    spdlog::info("Vault unlocked");
}

bool TokenVault::is_locked() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return locked_;
}

} // namespace warden::oauth
