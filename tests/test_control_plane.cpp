#include <gtest/gtest.h>
#include "host/control_plane.hpp"
#include "test_helpers.hpp"

using namespace warden;
using namespace warden::agents;
using warden::testing::TempDir;

namespace {

class EchoWasmHost : public WasmHost {
public:
    bool available() const override { return true; }

    WasmResult invoke(const std::filesystem::path&, const std::string& input) override {
        WasmResult result;
        result.success = true;
        result.output = input;
        return result;
    }
};

// Transport that must never be reached in these tests
class OfflineTransport : public oauth::HttpTransport {
public:
    oauth::HttpResponse send(const oauth::HttpRequest&) override {
        oauth::HttpResponse response;
        response.error = "offline";
        return response;
    }
};

} // namespace

class ControlPlaneTest : public ::testing::Test {
protected:
    void SetUp() override {
        warden::testing::write_agent(dir_ / "agents", "reader",
            warden::testing::manifest_json("reader", "wasm", {"fs.read"}));
        warden::testing::write_agent(dir_ / "agents", "plain",
            warden::testing::manifest_json("plain", "wasm", {}));
    }

    host::ControlPlaneConfig make_config() {
        host::ControlPlaneConfig config;
        config.agents_dir = dir_ / "agents";
        config.vault_backend = oauth::InMemory{};
        config.state_db = dir_ / "state.db";
        return config;
    }

    std::unique_ptr<host::ControlPlane> start(host::ControlPlaneConfig config) {
        auto plane = std::make_unique<host::ControlPlane>(std::move(config),
            std::make_shared<OfflineTransport>(), std::make_shared<EchoWasmHost>());
        auto status = plane->init();
        EXPECT_TRUE(status.success) << status.error;
        return plane;
    }

    TempDir dir_;
};

TEST_F(ControlPlaneTest, InitDiscoversAgents) {
    auto plane = start(make_config());
    EXPECT_EQ(plane->registry()->size(), 2u);
    ASSERT_TRUE(plane->state());
    ASSERT_TRUE(plane->vault());
    ASSERT_TRUE(plane->broker());
    EXPECT_TRUE(plane->broker()->provider_names().empty());
}

TEST_F(ControlPlaneTest, RegistersConfiguredProviders) {
    auto config = make_config();
    config.github_client_id = "gh";
    config.google_client_id = "gg";
    auto plane = start(config);
    EXPECT_EQ(plane->broker()->provider_names(), (std::vector<std::string>{"github", "google"}));
    auto google = plane->broker()->get_provider("google");
    ASSERT_TRUE(google);
    EXPECT_EQ(google->client_id, "gg");
}

TEST_F(ControlPlaneTest, UnknownAgentIsNotFound) {
    auto plane = start(make_config());
    auto result = plane->run_agent("nobody", "x");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.code, core::ErrorCode::NOT_FOUND);
    EXPECT_TRUE(result.events.empty());
}

TEST_F(ControlPlaneTest, EventsReachBusAndStateLog) {
    auto plane = start(make_config());
    plane->events()->subscribe("ui", {EventKind::OUTPUT});

    auto result = plane->run_agent("plain", "hello");
    ASSERT_TRUE(result.success);
    ASSERT_EQ(result.events.size(), 2u);

    auto outputs = plane->events()->poll("ui", 10);
    ASSERT_EQ(outputs.size(), 1u);
    EXPECT_EQ(outputs[0].sequence, 2u);

    auto stored = plane->state()->events_for_agent("plain");
    ASSERT_EQ(stored.size(), 2u);
    EXPECT_EQ(stored[0].event_type, "Input");
    EXPECT_EQ(stored[1].event_type, "Output");
    auto parsed = event_from_string(stored[1].data);
    ASSERT_TRUE(parsed.success) << parsed.error;
    EXPECT_EQ(parsed.event.agent_id, "plain");
}

TEST_F(ControlPlaneTest, GrantsSurviveRestart) {
    int asked = 0;
    {
        auto plane = start(make_config());
        plane->set_consent_resolver([&](const std::string&, const ConsentRequestEvent&) {
            ++asked;
            return ConsentDecision::grant();
        });
        auto result = plane->run_agent("reader", "x");
        ASSERT_TRUE(result.success);
        EXPECT_EQ(result.events.back().kind(), EventKind::OUTPUT);
    }
    ASSERT_EQ(asked, 1);

    auto plane = start(make_config());
    EXPECT_TRUE(plane->capabilities()->check({"fs", "read"}));
    EXPECT_EQ(plane->ledger()->size(), 1u);

    auto result = plane->run_agent("reader", "x");
    EXPECT_EQ(result.events.back().kind(), EventKind::OUTPUT);
    EXPECT_EQ(asked, 1);
}

TEST_F(ControlPlaneTest, RevocationSurvivesRestart) {
    {
        auto plane = start(make_config());
        ASSERT_TRUE(plane->ledger()->log_grant("reader", "fs.read", std::nullopt).success);
        ASSERT_TRUE(plane->ledger()->log_revoke("reader", "fs.read").success);
    }

    auto plane = start(make_config());
    EXPECT_EQ(plane->ledger()->size(), 2u);
    EXPECT_FALSE(plane->capabilities()->check({"fs", "read"}));
}

TEST_F(ControlPlaneTest, RevokedCapabilityStaysRevokedAfterRestart) {
    {
        auto plane = start(make_config());
        plane->set_consent_resolver([](const std::string&, const ConsentRequestEvent&) {
            return ConsentDecision::grant();
        });
        ASSERT_EQ(plane->run_agent("reader", "x").events.back().kind(), EventKind::OUTPUT);

        plane->events()->subscribe("ui", {EventKind::CONSENT_REVOKE});
        auto status = plane->revoke_capability("reader", "fs.read", std::string("alice"));
        ASSERT_TRUE(status.success) << status.error;
        EXPECT_FALSE(plane->capabilities()->check({"fs", "read"}));

        auto events = plane->events()->poll("ui", 10);
        ASSERT_EQ(events.size(), 1u);
        EXPECT_EQ(events[0].as<ConsentRevokeEvent>()->capability, "fs.read");
        EXPECT_EQ(events[0].agent_id, "reader");
    }

    auto plane = start(make_config());
    EXPECT_EQ(plane->ledger()->size(), 2u);
    EXPECT_FALSE(plane->capabilities()->check({"fs", "read"}));

    // The next run has to ask again
    int asked = 0;
    plane->set_consent_resolver([&](const std::string&, const ConsentRequestEvent&) {
        ++asked;
        return ConsentDecision::deny("no");
    });
    EXPECT_EQ(plane->run_agent("reader", "x").events.back().kind(), EventKind::ERROR);
    EXPECT_EQ(asked, 1);
}

TEST_F(ControlPlaneTest, RevokingUngrantedCapabilityIsNotFound) {
    auto plane = start(make_config());
    auto status = plane->revoke_capability("reader", "fs.read");
    EXPECT_EQ(status.code, core::ErrorCode::NOT_FOUND);
    EXPECT_EQ(plane->ledger()->size(), 0u);
}

TEST_F(ControlPlaneTest, TokenRevokeIsPublished) {
    auto plane = start(make_config());
    plane->events()->subscribe("ui", {EventKind::CONSENT_REVOKE});

    oauth::TokenHandle handle;
    handle.id = "handle-1";
    handle.provider = "github";
    auto status = plane->broker()->revoke(handle, "mailer");
    ASSERT_TRUE(status.success) << status.error;

    auto events = plane->events()->poll("ui", 10);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].agent_id, "mailer");
    EXPECT_EQ(events[0].as<ConsentRevokeEvent>()->capability, "oauth.github");
    EXPECT_EQ(plane->ledger()->size(), 1u);
}

TEST_F(ControlPlaneTest, LapsedGrantIsNotReplayed) {
    {
        std::string error;
        auto store = state::SqliteStore::open(dir_ / "state.db", error);
        ASSERT_TRUE(store) << error;
        nlohmann::json entry = {
            {"timestamp", 1000},
            {"agent_id", "reader"},
            {"action", {{"action", "Grant"}, {"capability", "fs.read"}, {"duration_s", 60}}},
        };
        ASSERT_TRUE(store->append_event(1000, oauth::CONSENT_EVENT_TYPE, "reader", entry.dump()).success);
    }

    auto plane = start(make_config());
    EXPECT_EQ(plane->ledger()->size(), 1u);
    EXPECT_FALSE(plane->capabilities()->check({"fs", "read"}));
}

TEST_F(ControlPlaneTest, RunsWithoutStateDatabase) {
    auto config = make_config();
    config.state_db.clear();
    auto plane = start(config);
    EXPECT_FALSE(plane->state());
    EXPECT_TRUE(plane->run_agent("plain", "x").success);
}

TEST_F(ControlPlaneTest, VaultFailureFailsInit) {
    {
        std::string error;
        auto vault = oauth::TokenVault::create(
            oauth::EncryptedSqlite{dir_ / "vault.db", std::string("right")}, error);
        ASSERT_TRUE(vault) << error;
    }

    auto config = make_config();
    config.vault_backend = oauth::EncryptedSqlite{dir_ / "vault.db", std::string("wrong")};
    host::ControlPlane plane(config, std::make_shared<OfflineTransport>(), std::make_shared<EchoWasmHost>());
    auto status = plane.init();
    EXPECT_FALSE(status.success);
    EXPECT_EQ(status.code, core::ErrorCode::BACKEND);
}
