#include <gtest/gtest.h>
#include <thread>
#include <vector>
#include "oauth/consent.hpp"
#include "state/sqlite_store.hpp"

using namespace warden::oauth;
using json = nlohmann::json;

TEST(ConsentLedger, KeepsAppendOrder) {
    ConsentLedger ledger;
    ASSERT_TRUE(ledger.log_grant("agent-a", "files.read", 3600).success);
    ASSERT_TRUE(ledger.log_deny("agent-b", "net.fetch", "not now").success);
    ASSERT_TRUE(ledger.log_revoke("agent-a", "files.read").success);

    auto all = ledger.get_all();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_TRUE(std::holds_alternative<GrantAction>(all[0].action));
    EXPECT_TRUE(std::holds_alternative<DenyAction>(all[1].action));
    EXPECT_TRUE(std::holds_alternative<RevokeAction>(all[2].action));
    for (size_t i = 1; i < all.size(); i++) {
        EXPECT_LE(all[i - 1].timestamp, all[i].timestamp);
    }

    auto a = ledger.get_for_agent("agent-a");
    ASSERT_EQ(a.size(), 2u);
    EXPECT_EQ(consent_action_name(a[0].action), std::string("Grant"));
    EXPECT_EQ(consent_action_name(a[1].action), std::string("Revoke"));
    EXPECT_TRUE(ledger.get_for_agent("nobody").empty());
}

TEST(ConsentLedger, RecordsDurationReasonAndUser) {
    ConsentLedger ledger;
    ASSERT_TRUE(ledger.log_grant("agent-a", "files.read", std::nullopt, std::string("alice")).success);
    ASSERT_TRUE(ledger.log_deny("agent-a", "net.fetch", "suspicious").success);

    auto all = ledger.get_all();
    const auto& grant = std::get<GrantAction>(all[0].action);
    EXPECT_FALSE(grant.duration_s.has_value());
    EXPECT_EQ(all[0].user_id, std::optional<std::string>("alice"));
    EXPECT_EQ(std::get<DenyAction>(all[1].action).reason, "suspicious");
    EXPECT_FALSE(all[1].user_id.has_value());
}

TEST(ConsentLedger, ExportIsPrettyJsonArray) {
    ConsentLedger ledger;
    ASSERT_TRUE(ledger.log_grant("agent-a", "files.read", 60).success);
    ASSERT_TRUE(ledger.log_deny("agent-a", "net.fetch", "no").success);

    std::string exported = ledger.export_json();
    EXPECT_NE(exported.find('\n'), std::string::npos);

    json j = json::parse(exported);
    ASSERT_TRUE(j.is_array());
    ASSERT_EQ(j.size(), 2u);
    EXPECT_EQ(j[0]["agent_id"], "agent-a");
    EXPECT_EQ(j[0]["action"]["action"], "Grant");
    EXPECT_EQ(j[0]["action"]["capability"], "files.read");
    EXPECT_EQ(j[0]["action"]["duration_s"], 60);
    EXPECT_EQ(j[1]["action"]["reason"], "no");
}

TEST(ConsentLedger, EmptyExport) {
    ConsentLedger ledger;
    EXPECT_EQ(json::parse(ledger.export_json()), json::array());
}

TEST(ConsentLedger, EntryJsonRoundTrip) {
    ConsentLedger ledger;
    ASSERT_TRUE(ledger.log_grant("agent-a", "files.read", 30, std::string("bob")).success);
    auto entry = ledger.get_all()[0];

    auto parsed = ConsentEntry::from_json(entry.to_json());
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->to_json(), entry.to_json());
    EXPECT_FALSE(ConsentEntry::from_json(json{{"agent_id", "x"}}).has_value());
}

TEST(ConsentLedger, ConcurrentAppendsAreAllKept) {
    ConsentLedger ledger;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; t++) {
        threads.emplace_back([&ledger, t]() {
            for (int i = 0; i < 50; i++) {
                EXPECT_TRUE(ledger.log_grant("agent-" + std::to_string(t), "files.read", std::nullopt).success);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(ledger.size(), 200u);
    EXPECT_EQ(ledger.get_for_agent("agent-2").size(), 50u);
}

TEST(ConsentLedger, MirrorsToStoreAndRestores) {
    std::string error;
    std::shared_ptr<warden::state::SqliteStore> store = warden::state::SqliteStore::open_in_memory(error);
    ASSERT_TRUE(store) << error;

    {
        ConsentLedger ledger;
        ledger.attach_store(store);
        ASSERT_TRUE(ledger.log_grant("agent-a", "files.read", 10).success);
        ASSERT_TRUE(ledger.log_revoke("agent-a", "files.read").success);
    }
    EXPECT_EQ(store->events_by_type(CONSENT_EVENT_TYPE).size(), 2u);

    ConsentLedger restored;
    restored.attach_store(store);
    ASSERT_TRUE(restored.log_deny("agent-b", "net.fetch", "later").success);
    EXPECT_EQ(restored.restore(), 2u);

    auto all = restored.get_all();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].agent_id, "agent-a");
    EXPECT_TRUE(std::holds_alternative<RevokeAction>(all[1].action));
    EXPECT_EQ(all[2].agent_id, "agent-b");
}

TEST(ConsentLedger, RestoreWithoutStoreIsNoop) {
    ConsentLedger ledger;
    EXPECT_EQ(ledger.restore(), 0u);
}
