#include "oauth/encrypted_store.hpp"
#include "core/crypto.hpp"
#include "state/sqlite_statement.hpp"
#include <spdlog/spdlog.h>
#include <sqlite3.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace warden::oauth {

namespace crypto = core::crypto;
using state::Statement;
using state::exec_sql;

namespace {

constexpr const char* KEY_WRAP_AAD = "warden-data-key";

const char* const SCHEMA =
    "CREATE TABLE IF NOT EXISTS vault_meta ("
    "  key TEXT PRIMARY KEY,"
    "  value NOT NULL);"
    "CREATE TABLE IF NOT EXISTS vault_keys ("
    "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "  iv BLOB NOT NULL,"
    "  wrapped_key BLOB NOT NULL,"
    "  created_at INTEGER NOT NULL);"
    "CREATE TABLE IF NOT EXISTS vault_secrets ("
    "  label TEXT PRIMARY KEY,"
    "  key_id INTEGER NOT NULL,"
    "  iv BLOB NOT NULL,"
    "  ciphertext BLOB NOT NULL,"
    "  updated_at INTEGER NOT NULL);";

int64_t now_seconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string sqlite_error(sqlite3* db) {
    return sqlite3_errmsg(db);
}

// Read the master key file next to the vault, creating it on first use
bool load_master_key(const std::filesystem::path& key_path, std::string& secret, std::string& error) {
    std::ifstream in(key_path);
    if (in) {
        std::stringstream buffer;
        buffer << in.rdbuf();
        secret = buffer.str();
        while (!secret.empty() && (secret.back() == '\n' || secret.back() == '\r')) {
            secret.pop_back();
        }
        if (secret.empty()) {
            error = "master key file is empty: " + key_path.string();
            return false;
        }
        return true;
    }

    auto bytes = crypto::random_bytes(crypto::AES_KEY_SIZE);
    if (bytes.empty()) {
        error = "failed to generate master key";
        return false;
    }
    secret = crypto::base64_encode(bytes);
    crypto::secure_clear(bytes);

    int fd = ::open(key_path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
    if (fd < 0) {
        error = "failed to create master key file " + key_path.string() + ": " + std::strerror(errno);
        crypto::secure_clear(secret);
        return false;
    }
    std::string contents = secret + "\n";
    ssize_t written = ::write(fd, contents.data(), contents.size());
    crypto::secure_clear(contents);
    ::close(fd);
    if (written < 0 || static_cast<size_t>(written) != secret.size() + 1) {
        error = "failed to write master key file " + key_path.string();
        crypto::secure_clear(secret);
        return false;
    }
    spdlog::info("Created vault master key file {}", key_path.string());
    return true;
}

// Fetch the KDF salt, writing a fresh one for a new vault
bool load_salt(sqlite3* db, std::vector<uint8_t>& salt, std::string& error) {
    {
        Statement select(db, "SELECT value FROM vault_meta WHERE key = 'kdf_salt';");
        if (!select.ok()) {
            error = select.error();
            return false;
        }
        if (select.step() == SQLITE_ROW) {
            salt = select.column_blob(0);
            return !salt.empty();
        }
    }

    salt = crypto::random_bytes(16);
    if (salt.empty()) {
        error = "failed to generate KDF salt";
        return false;
    }
    Statement insert(db, "INSERT INTO vault_meta (key, value) VALUES ('kdf_salt', ?1);");
    insert.bind_blob(1, salt);
    if (!insert.run()) {
        error = "failed to store KDF salt: " + insert.error();
        return false;
    }
    return true;
}

} // namespace

EncryptedStore::EncryptedStore(sqlite3* db, std::vector<uint8_t> kek)
    : db_(db), kek_(std::move(kek)) {}

EncryptedStore::~EncryptedStore() {
    crypto::secure_clear(kek_);
    crypto::secure_clear(data_key_);
    if (db_) {
        sqlite3_close(db_);
    }
}

std::unique_ptr<EncryptedStore> EncryptedStore::open(const std::filesystem::path& path,
                                                     const std::optional<std::string>& passphrase,
                                                     std::string& error) {
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            error = "failed to create " + path.parent_path().string() + ": " + ec.message();
            return nullptr;
        }
    }

    std::string secret;
    if (passphrase && !passphrase->empty()) {
        secret = *passphrase;
    } else {
        std::filesystem::path key_path = path;
        key_path += ".key";
        if (!load_master_key(key_path, secret, error)) {
            return nullptr;
        }
    }

    sqlite3* db = nullptr;
    if (sqlite3_open_v2(path.c_str(), &db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr) != SQLITE_OK) {
        error = "failed to open vault " + path.string() + ": " + (db ? sqlite_error(db) : "out of memory");
        if (db) sqlite3_close(db);
        crypto::secure_clear(secret);
        return nullptr;
    }

    std::vector<uint8_t> salt;
    if (!exec_sql(db, SCHEMA, error) || !load_salt(db, salt, error)) {
        sqlite3_close(db);
        crypto::secure_clear(secret);
        return nullptr;
    }

    auto kek = crypto::pbkdf2_sha256(secret, salt, KDF_ITERATIONS);
    crypto::secure_clear(secret);
    if (kek.empty()) {
        sqlite3_close(db);
        error = "key derivation failed";
        return nullptr;
    }

    std::unique_ptr<EncryptedStore> store(new EncryptedStore(db, std::move(kek)));
    if (!store->initialize(error)) {
        return nullptr;
    }
    spdlog::debug("Encrypted vault opened: {} (data key {})", path.string(), store->key_id_);
    return store;
}

bool EncryptedStore::initialize(std::string& error) {
    Statement select(db_, "SELECT value FROM vault_meta WHERE key = 'active_key_id';");
    if (!select.ok()) {
        error = select.error();
        return false;
    }
    if (select.step() == SQLITE_ROW) {
        key_id_ = select.column_int64(0);
        if (!load_data_key(key_id_, data_key_, error)) {
            error = "failed to unlock vault: " + error;
            return false;
        }
        return true;
    }

    if (!exec_sql(db_, "BEGIN IMMEDIATE;", error)) {
        return false;
    }
    if (!create_data_key(data_key_, key_id_, error)) {
        std::string ignored;
        exec_sql(db_, "ROLLBACK;", ignored);
        return false;
    }
    Statement active(db_, "INSERT INTO vault_meta (key, value) VALUES ('active_key_id', ?1);");
    active.bind(1, key_id_);
    if (!active.run()) {
        error = "failed to record active key: " + active.error();
        std::string ignored;
        exec_sql(db_, "ROLLBACK;", ignored);
        return false;
    }
    return exec_sql(db_, "COMMIT;", error);
}

bool EncryptedStore::create_data_key(std::vector<uint8_t>& key, int64_t& key_id, std::string& error) {
    key = crypto::random_bytes(crypto::AES_KEY_SIZE);
    auto iv = crypto::random_bytes(crypto::GCM_IV_SIZE);
    std::vector<uint8_t> wrapped;
    if (key.empty() || iv.empty() || !crypto::aes_gcm_encrypt(kek_, iv, key, KEY_WRAP_AAD, wrapped)) {
        crypto::secure_clear(key);
        error = "failed to generate data key";
        return false;
    }

    Statement insert(db_, "INSERT INTO vault_keys (iv, wrapped_key, created_at) VALUES (?1, ?2, ?3);");
    insert.bind_blob(1, iv).bind_blob(2, wrapped).bind(3, now_seconds());
    if (!insert.run()) {
        crypto::secure_clear(key);
        error = "failed to store data key: " + insert.error();
        return false;
    }
    key_id = sqlite3_last_insert_rowid(db_);
    return true;
}

bool EncryptedStore::load_data_key(int64_t key_id, std::vector<uint8_t>& key, std::string& error) {
    Statement select(db_, "SELECT iv, wrapped_key FROM vault_keys WHERE id = ?1;");
    select.bind(1, key_id);
    if (select.step() != SQLITE_ROW) {
        error = "data key " + std::to_string(key_id) + " missing";
        return false;
    }
    if (!crypto::aes_gcm_decrypt(kek_, select.column_blob(0), select.column_blob(1), KEY_WRAP_AAD, key)) {
        error = "wrong passphrase or corrupted key";
        return false;
    }
    return true;
}

core::Status EncryptedStore::put(const std::string& label, const std::string& secret) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto iv = crypto::random_bytes(crypto::GCM_IV_SIZE);
    std::vector<uint8_t> plaintext(secret.begin(), secret.end());
    std::vector<uint8_t> ciphertext;
    bool encrypted = !iv.empty() && crypto::aes_gcm_encrypt(data_key_, iv, plaintext, label, ciphertext);
    crypto::secure_clear(plaintext);
    if (!encrypted) {
        return core::Status::fail(core::ErrorCode::BACKEND, "failed to encrypt secret '" + label + "'");
    }

    Statement upsert(db_,
        "INSERT INTO vault_secrets (label, key_id, iv, ciphertext, updated_at) "
        "VALUES (?1, ?2, ?3, ?4, ?5) "
        "ON CONFLICT(label) DO UPDATE SET key_id = excluded.key_id, iv = excluded.iv, "
        "ciphertext = excluded.ciphertext, updated_at = excluded.updated_at;");
    upsert.bind(1, label).bind(2, key_id_).bind_blob(3, iv).bind_blob(4, ciphertext).bind(5, now_seconds());
    if (!upsert.run()) {
        return core::Status::fail(core::ErrorCode::BACKEND, "failed to store secret: " + upsert.error());
    }
    return core::Status::ok();
}

SecretResult EncryptedStore::get(const std::string& label) {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement select(db_, "SELECT key_id, iv, ciphertext FROM vault_secrets WHERE label = ?1;");
    select.bind(1, label);
    int rc = select.step();
    if (rc == SQLITE_DONE) {
        return SecretResult::fail(core::ErrorCode::NOT_FOUND, "no secret stored for '" + label + "'");
    }
    if (rc != SQLITE_ROW) {
        return SecretResult::fail(core::ErrorCode::BACKEND, "failed to read secret: " + select.error());
    }

    int64_t key_id = select.column_int64(0);
    if (key_id != key_id_) {
        return SecretResult::fail(core::ErrorCode::BACKEND,
            "secret '" + label + "' is encrypted with retired key " + std::to_string(key_id));
    }

    std::vector<uint8_t> plaintext;
    if (!crypto::aes_gcm_decrypt(data_key_, select.column_blob(1), select.column_blob(2), label, plaintext)) {
        return SecretResult::fail(core::ErrorCode::BACKEND, "failed to decrypt secret '" + label + "'");
    }
    std::string value(plaintext.begin(), plaintext.end());
    crypto::secure_clear(plaintext);
    return SecretResult::found(std::move(value));
}

core::Status EncryptedStore::remove(const std::string& label) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement del(db_, "DELETE FROM vault_secrets WHERE label = ?1;");
    del.bind(1, label);
    if (!del.run()) {
        return core::Status::fail(core::ErrorCode::BACKEND, "failed to delete secret: " + del.error());
    }
    return core::Status::ok();
}

std::vector<std::string> EncryptedStore::labels() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    Statement select(db_, "SELECT label FROM vault_secrets ORDER BY label;");
    while (select.step() == SQLITE_ROW) {
        result.push_back(select.column_text(0));
    }
    return result;
}

core::Status EncryptedStore::rotate_keys() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string error;
    if (!exec_sql(db_, "BEGIN IMMEDIATE;", error)) {
        return core::Status::fail(core::ErrorCode::BACKEND, "failed to start key rotation: " + error);
    }

    auto rollback = [this](const std::string& message) {
        std::string ignored;
        exec_sql(db_, "ROLLBACK;", ignored);
        spdlog::error("Vault key rotation aborted: {}", message);
        return core::Status::fail(core::ErrorCode::BACKEND, "key rotation failed: " + message);
    };

    std::vector<uint8_t> new_key;
    int64_t new_key_id = 0;
    if (!create_data_key(new_key, new_key_id, error)) {
        return rollback(error);
    }

    struct Row {
        std::string label;
        std::vector<uint8_t> iv;
        std::vector<uint8_t> ciphertext;
    };
    std::vector<Row> rows;
    {
        Statement select(db_, "SELECT label, iv, ciphertext FROM vault_secrets;");
        int rc;
        while ((rc = select.step()) == SQLITE_ROW) {
            rows.push_back({select.column_text(0), select.column_blob(1), select.column_blob(2)});
        }
        // Old keys are deleted below; every row must have been re-encrypted first
        if (rc != SQLITE_DONE) {
            crypto::secure_clear(new_key);
            return rollback("failed to read secrets: " + select.error());
        }
    }

    for (const auto& row : rows) {
        std::vector<uint8_t> plaintext;
        if (!crypto::aes_gcm_decrypt(data_key_, row.iv, row.ciphertext, row.label, plaintext)) {
            crypto::secure_clear(new_key);
            return rollback("failed to decrypt '" + row.label + "'");
        }
        auto iv = crypto::random_bytes(crypto::GCM_IV_SIZE);
        std::vector<uint8_t> ciphertext;
        bool encrypted = !iv.empty() && crypto::aes_gcm_encrypt(new_key, iv, plaintext, row.label, ciphertext);
        crypto::secure_clear(plaintext);
        if (!encrypted) {
            crypto::secure_clear(new_key);
            return rollback("failed to re-encrypt '" + row.label + "'");
        }

        Statement update(db_, "UPDATE vault_secrets SET key_id = ?1, iv = ?2, ciphertext = ?3 WHERE label = ?4;");
        update.bind(1, new_key_id).bind_blob(2, iv).bind_blob(3, ciphertext).bind(4, row.label);
        if (!update.run()) {
            crypto::secure_clear(new_key);
            return rollback(update.error());
        }
    }

    Statement active(db_, "UPDATE vault_meta SET value = ?1 WHERE key = 'active_key_id';");
    active.bind(1, new_key_id);
    Statement retire(db_, "DELETE FROM vault_keys WHERE id != ?1;");
    retire.bind(1, new_key_id);
    if (!active.run() || !retire.run()) {
        crypto::secure_clear(new_key);
        return rollback("failed to activate new data key");
    }

    if (!exec_sql(db_, "COMMIT;", error)) {
        crypto::secure_clear(new_key);
        return rollback(error);
    }

    crypto::secure_clear(data_key_);
    data_key_ = std::move(new_key);
    key_id_ = new_key_id;
    spdlog::info("Vault data key rotated ({} secrets re-encrypted)", rows.size());
    return core::Status::ok();
}

int64_t EncryptedStore::active_key_id() {
    std::lock_guard<std::mutex> lock(mutex_);
    return key_id_;
}

} // namespace warden::oauth
