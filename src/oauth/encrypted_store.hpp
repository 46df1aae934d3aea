#pragma once
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "core/error.hpp"
#include "oauth/types.hpp"

struct sqlite3;

namespace warden::oauth {

// Secrets encrypted at rest in a SQLite file.
//
// vault_meta     KDF salt and iteration count, active data key id
// vault_keys     data keys wrapped with the key-encryption key
// vault_secrets  AES-256-GCM ciphertext per label (label is the AAD)
//
// The key-encryption key comes from PBKDF2 over the passphrase, or over the
// contents of a random master key file "<path>.key" created with mode 0600
// when no passphrase is given.
class EncryptedStore {
public:
    static constexpr int KDF_ITERATIONS = 100000;

    ~EncryptedStore();

    EncryptedStore(const EncryptedStore&) = delete;
    EncryptedStore& operator=(const EncryptedStore&) = delete;

    // Open or create the vault file and unwrap the active data key.
    // nullptr + error on failure, including a wrong passphrase.
    static std::unique_ptr<EncryptedStore> open(const std::filesystem::path& path,
                                                const std::optional<std::string>& passphrase,
                                                std::string& error);

    core::Status put(const std::string& label, const std::string& secret);
    SecretResult get(const std::string& label);
    core::Status remove(const std::string& label);
    std::vector<std::string> labels();

    // Generate a fresh data key and re-encrypt every secret with it in one transaction
    core::Status rotate_keys();

    int64_t active_key_id();

private:
    EncryptedStore(sqlite3* db, std::vector<uint8_t> kek);

    bool initialize(std::string& error);
    bool create_data_key(std::vector<uint8_t>& key, int64_t& key_id, std::string& error);
    bool load_data_key(int64_t key_id, std::vector<uint8_t>& key, std::string& error);

    sqlite3* db_;
    std::vector<uint8_t> kek_;
    std::vector<uint8_t> data_key_;
    int64_t key_id_ = 0;
    std::mutex mutex_;
};

} // namespace warden::oauth
