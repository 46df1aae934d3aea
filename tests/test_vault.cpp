#include <gtest/gtest.h>
#include <sqlite3.h>
#include <sys/stat.h>
#include "core/crypto.hpp"
#include "oauth/encrypted_store.hpp"
#include "oauth/vault.hpp"
#include "test_helpers.hpp"

using namespace warden::oauth;
using warden::core::ErrorCode;
using warden::testing::TempDir;

namespace {

std::shared_ptr<TokenVault> make_vault(const VaultBackend& backend) {
    std::string error;
    auto vault = TokenVault::create(backend, error);
    EXPECT_TRUE(vault) << error;
    return vault;
}

} // namespace

class TokenVaultBackends : public ::testing::TestWithParam<std::string> {
protected:
    std::shared_ptr<TokenVault> open() {
        if (GetParam() == "sqlite") {
            return make_vault(EncryptedSqlite{dir_ / "vault.db", std::string("correct horse")});
        }
        return make_vault(InMemory{});
    }

    TempDir dir_;
};

TEST_P(TokenVaultBackends, StoreFetchErase) {
    auto vault = open();
    ASSERT_TRUE(vault);

    ASSERT_TRUE(vault->store("k", "v").success);
    auto fetched = vault->fetch("k");
    ASSERT_TRUE(fetched.success) << fetched.error;
    EXPECT_EQ(fetched.value, "v");

    ASSERT_TRUE(vault->erase("k").success);
    auto missing = vault->fetch("k");
    EXPECT_FALSE(missing.success);
    EXPECT_EQ(missing.code, ErrorCode::NOT_FOUND);
}

TEST_P(TokenVaultBackends, StoreIsUpsert) {
    auto vault = open();
    ASSERT_TRUE(vault);
    ASSERT_TRUE(vault->store("k", "one").success);
    ASSERT_TRUE(vault->store("k", "two").success);
    EXPECT_EQ(vault->fetch("k").value, "two");
    EXPECT_EQ(vault->labels(), std::vector<std::string>{"k"});
}

TEST_P(TokenVaultBackends, EraseMissingSucceeds) {
    auto vault = open();
    ASSERT_TRUE(vault);
    EXPECT_TRUE(vault->erase("never-stored").success);
}

TEST_P(TokenVaultBackends, LockGatesEveryDataOperation) {
    auto vault = open();
    ASSERT_TRUE(vault);
    ASSERT_TRUE(vault->store("k", "v").success);

    vault->lock();
    EXPECT_TRUE(vault->is_locked());
    EXPECT_EQ(vault->store("k", "other").code, ErrorCode::LOCKED);
    EXPECT_EQ(vault->fetch("k").code, ErrorCode::LOCKED);
    EXPECT_EQ(vault->erase("k").code, ErrorCode::LOCKED);
    EXPECT_EQ(vault->rotate_keys().code, ErrorCode::LOCKED);
    EXPECT_TRUE(vault->labels().empty());

    vault->unlock();
    EXPECT_FALSE(vault->is_locked());
    auto fetched = vault->fetch("k");
    ASSERT_TRUE(fetched.success);
    EXPECT_EQ(fetched.value, "v");
}

TEST_P(TokenVaultBackends, RotateKeysKeepsSecretsReadable) {
    auto vault = open();
    ASSERT_TRUE(vault);
    ASSERT_TRUE(vault->store("a", "alpha").success);
    ASSERT_TRUE(vault->store("b", "beta").success);

    ASSERT_TRUE(vault->rotate_keys().success);
    EXPECT_EQ(vault->fetch("a").value, "alpha");
    EXPECT_EQ(vault->fetch("b").value, "beta");
}

INSTANTIATE_TEST_SUITE_P(Backends, TokenVaultBackends, ::testing::Values("memory", "sqlite"));

TEST(EncryptedStore, SecretsSurviveReopen) {
    TempDir dir;
    std::string error;
    {
        auto store = EncryptedStore::open(dir / "vault.db", std::string("pass"), error);
        ASSERT_TRUE(store) << error;
        ASSERT_TRUE(store->put("gh", "token-123").success);
    }
    auto store = EncryptedStore::open(dir / "vault.db", std::string("pass"), error);
    ASSERT_TRUE(store) << error;
    auto fetched = store->get("gh");
    ASSERT_TRUE(fetched.success) << fetched.error;
    EXPECT_EQ(fetched.value, "token-123");
}

TEST(EncryptedStore, WrongPassphraseIsRejected) {
    TempDir dir;
    std::string error;
    {
        auto store = EncryptedStore::open(dir / "vault.db", std::string("right"), error);
        ASSERT_TRUE(store) << error;
    }
    auto store = EncryptedStore::open(dir / "vault.db", std::string("wrong"), error);
    EXPECT_FALSE(store);
    EXPECT_NE(error.find("failed to unlock vault"), std::string::npos);
}

TEST(EncryptedStore, CiphertextDoesNotContainPlaintext) {
    TempDir dir;
    std::string error;
    const std::string secret = "super-secret-access-token-value";
    {
        auto store = EncryptedStore::open(dir / "vault.db", std::string("pass"), error);
        ASSERT_TRUE(store) << error;
        ASSERT_TRUE(store->put("label", secret).success);
    }
    std::string raw = warden::testing::read_file(dir / "vault.db");
    ASSERT_FALSE(raw.empty());
    EXPECT_EQ(raw.find(secret), std::string::npos);
}

TEST(EncryptedStore, MasterKeyFileCreatedPrivate) {
    TempDir dir;
    std::string error;
    {
        auto store = EncryptedStore::open(dir / "vault.db", std::nullopt, error);
        ASSERT_TRUE(store) << error;
        ASSERT_TRUE(store->put("k", "v").success);
    }
    auto key_path = dir / "vault.db.key";
    struct stat st {};
    ASSERT_EQ(::stat(key_path.c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0600u);

    auto store = EncryptedStore::open(dir / "vault.db", std::nullopt, error);
    ASSERT_TRUE(store) << error;
    EXPECT_EQ(store->get("k").value, "v");
}

TEST(EncryptedStore, RotationReplacesDataKey) {
    TempDir dir;
    std::string error;
    auto store = EncryptedStore::open(dir / "vault.db", std::string("pass"), error);
    ASSERT_TRUE(store) << error;
    ASSERT_TRUE(store->put("k", "v").success);

    int64_t before = store->active_key_id();
    ASSERT_TRUE(store->rotate_keys().success);
    EXPECT_NE(store->active_key_id(), before);
    EXPECT_EQ(store->get("k").value, "v");
    EXPECT_EQ(store->labels(), std::vector<std::string>{"k"});

    store.reset();
    auto reopened = EncryptedStore::open(dir / "vault.db", std::string("pass"), error);
    ASSERT_TRUE(reopened) << error;
    EXPECT_EQ(reopened->get("k").value, "v");
}

namespace {

bool exec_raw(const std::filesystem::path& path, const char* sql) {
    sqlite3* db = nullptr;
    bool ok = sqlite3_open(path.c_str(), &db) == SQLITE_OK &&
              sqlite3_exec(db, sql, nullptr, nullptr, nullptr) == SQLITE_OK;
    sqlite3_close(db);
    return ok;
}

} // namespace

TEST(EncryptedStore, FailedRotationKeepsOldKey) {
    TempDir dir;
    std::string error;
    auto store = EncryptedStore::open(dir / "vault.db", std::string("pass"), error);
    ASSERT_TRUE(store) << error;
    ASSERT_TRUE(store->put("k", "v").success);
    int64_t before = store->active_key_id();

    // Unreadable secrets table: rotation must not retire the key protecting it
    ASSERT_TRUE(exec_raw(dir / "vault.db", "ALTER TABLE vault_secrets RENAME TO vault_secrets_moved;"));
    auto rotated = store->rotate_keys();
    EXPECT_FALSE(rotated.success);
    EXPECT_EQ(rotated.code, ErrorCode::BACKEND);
    EXPECT_EQ(store->active_key_id(), before);

    ASSERT_TRUE(exec_raw(dir / "vault.db", "ALTER TABLE vault_secrets_moved RENAME TO vault_secrets;"));
    EXPECT_EQ(store->get("k").value, "v");

    store.reset();
    auto reopened = EncryptedStore::open(dir / "vault.db", std::string("pass"), error);
    ASSERT_TRUE(reopened) << error;
    EXPECT_EQ(reopened->get("k").value, "v");
}

TEST(Crypto, AesGcmDetectsTampering) {
    namespace crypto = warden::core::crypto;
    auto key = crypto::random_bytes(crypto::AES_KEY_SIZE);
    auto iv = crypto::random_bytes(crypto::GCM_IV_SIZE);
    std::vector<uint8_t> plaintext = {'h', 'e', 'l', 'l', 'o'};

    std::vector<uint8_t> ciphertext;
    ASSERT_TRUE(crypto::aes_gcm_encrypt(key, iv, plaintext, "label", ciphertext));
    EXPECT_EQ(ciphertext.size(), plaintext.size() + crypto::GCM_TAG_SIZE);

    std::vector<uint8_t> decrypted;
    ASSERT_TRUE(crypto::aes_gcm_decrypt(key, iv, ciphertext, "label", decrypted));
    EXPECT_EQ(decrypted, plaintext);

    EXPECT_FALSE(crypto::aes_gcm_decrypt(key, iv, ciphertext, "other-label", decrypted));
    ciphertext[0] ^= 0x01;
    EXPECT_FALSE(crypto::aes_gcm_decrypt(key, iv, ciphertext, "label", decrypted));
}

TEST(Crypto, Pkce256ChallengeMatchesRfcExample) {
    namespace crypto = warden::core::crypto;
    // RFC 7636 appendix B
    std::string verifier = "dBjftJeZ4CVP-mJ92K5k8_X0JXhyLlfRSgQzrMcn4Ec";
    EXPECT_EQ(crypto::base64url_encode(crypto::sha256(verifier)),
              "E9Melhoa2OwvFrEMTJguCHaoeK1t8URWbuGJSstw-cM");
}

TEST(VaultBackend, ReportsName) {
    EXPECT_STREQ(vault_backend_name(OsKeychain{}), "keychain");
    EXPECT_STREQ(vault_backend_name(EncryptedSqlite{}), "sqlite");
    EXPECT_STREQ(vault_backend_name(InMemory{}), "memory");
}

// Stand-in for secret-tool that keeps entries as files beside the script
TEST(KeychainClient, TalksToSecretTool) {
    TempDir dir;
    auto tool = dir / "fake-secret-tool";
    warden::testing::write_file(tool,
        "#!/bin/sh\n"
        "dir=\"$(dirname \"$0\")/entries\"\n"
        "mkdir -p \"$dir\"\n"
        "cmd=$1; shift\n"
        "case \"$cmd\" in\n"
        "  store) shift; cat > \"$dir/$2.$4\" ;;\n"
        "  lookup) [ -f \"$dir/$2.$4\" ] || exit 1; cat \"$dir/$2.$4\" ;;\n"
        "  clear) rm -f \"$dir/$2.$4\" ;;\n"
        "  *) echo \"bad command\" >&2; exit 2 ;;\n"
        "esac\n");
    warden::testing::make_executable(tool);

    KeychainClient keychain("warden-test", tool.string());
    EXPECT_EQ(keychain.lookup("gh").code, ErrorCode::NOT_FOUND);

    ASSERT_TRUE(keychain.store("gh", "token-xyz").success);
    auto found = keychain.lookup("gh");
    ASSERT_TRUE(found.success) << found.error;
    EXPECT_EQ(found.value, "token-xyz");
    EXPECT_EQ(warden::testing::read_file(dir / "entries" / "warden-test.gh"), "token-xyz");

    ASSERT_TRUE(keychain.clear("gh").success);
    EXPECT_TRUE(keychain.clear("gh").success);
    EXPECT_EQ(keychain.lookup("gh").code, ErrorCode::NOT_FOUND);
}

TEST(KeychainClient, MissingToolIsBackendError) {
    KeychainClient keychain("warden-test", "/nonexistent/secret-tool");
    auto status = keychain.store("gh", "x");
    EXPECT_FALSE(status.success);
    EXPECT_EQ(status.code, ErrorCode::BACKEND);
}
