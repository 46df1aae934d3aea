#include <gtest/gtest.h>
#include "state/sqlite_store.hpp"
#include "test_helpers.hpp"

using namespace warden::state;
using warden::testing::TempDir;

namespace {

std::unique_ptr<SqliteStore> memory_store() {
    std::string error;
    auto store = SqliteStore::open_in_memory(error);
    EXPECT_TRUE(store) << error;
    return store;
}

} // namespace

TEST(SqliteStore, MigratesToCurrentVersion) {
    auto store = memory_store();
    ASSERT_TRUE(store);
    EXPECT_EQ(store->schema_version(), SqliteStore::CURRENT_SCHEMA_VERSION);
}

TEST(SqliteStore, KeyValueUpsertAndErase) {
    auto store = memory_store();
    ASSERT_TRUE(store);

    EXPECT_FALSE(store->kv_get("theme").has_value());
    ASSERT_TRUE(store->kv_set("theme", "dark").success);
    ASSERT_TRUE(store->kv_set("theme", "light").success);
    ASSERT_TRUE(store->kv_set("font", "mono").success);
    EXPECT_EQ(store->kv_get("theme"), std::optional<std::string>("light"));
    EXPECT_EQ(store->kv_keys(), (std::vector<std::string>{"font", "theme"}));

    ASSERT_TRUE(store->kv_erase("theme").success);
    ASSERT_TRUE(store->kv_erase("theme").success);
    EXPECT_FALSE(store->kv_get("theme").has_value());
}

TEST(SqliteStore, EventLogQueries) {
    auto store = memory_store();
    ASSERT_TRUE(store);

    ASSERT_TRUE(store->append_event(1000, "Input", "agent-a", "{\"n\":1}").success);
    ASSERT_TRUE(store->append_event(1001, "Output", "agent-b", "{\"n\":2}").success);
    ASSERT_TRUE(store->append_event(1002, "Output", "agent-a", "{\"n\":3}").success);

    auto a = store->events_for_agent("agent-a");
    ASSERT_EQ(a.size(), 2u);
    EXPECT_EQ(a[0].event_type, "Input");
    EXPECT_EQ(a[1].data, "{\"n\":3}");
    EXPECT_LT(a[0].id, a[1].id);

    EXPECT_EQ(store->events_by_type("Output").size(), 2u);

    auto recent = store->recent_events(2);
    ASSERT_EQ(recent.size(), 2u);
    EXPECT_EQ(recent[0].timestamp_ms, 1002);
    EXPECT_EQ(recent[1].timestamp_ms, 1001);
}

TEST(SqliteStore, ArtifactIndex) {
    auto store = memory_store();
    ASSERT_TRUE(store);

    ArtifactRecord record{"art-1", "diff", "/tmp/a.diff", "agent-a", 10};
    ASSERT_TRUE(store->index_artifact(record).success);
    record.path = "/tmp/b.diff";
    ASSERT_TRUE(store->index_artifact(record).success);
    ASSERT_TRUE(store->index_artifact({"art-2", "log", "/tmp/run.log", "agent-a", 0}).success);

    auto artifacts = store->artifacts_for_agent("agent-a");
    ASSERT_EQ(artifacts.size(), 2u);
    EXPECT_EQ(artifacts[0].id, "art-1");
    EXPECT_EQ(artifacts[0].path, "/tmp/b.diff");
    EXPECT_GT(artifacts[1].created_at, 0);
    EXPECT_TRUE(store->artifacts_for_agent("agent-b").empty());
}

TEST(SqliteStore, PersistsAcrossReopen) {
    TempDir dir;
    auto path = dir / "nested" / "state.db";
    std::string error;
    {
        auto store = SqliteStore::open(path, error);
        ASSERT_TRUE(store) << error;
        ASSERT_TRUE(store->kv_set("k", "v").success);
        ASSERT_TRUE(store->append_event(5, "consent", "agent-a", "{}").success);
    }

    auto reopened = SqliteStore::open(path, error);
    ASSERT_TRUE(reopened) << error;
    EXPECT_EQ(reopened->schema_version(), SqliteStore::CURRENT_SCHEMA_VERSION);
    EXPECT_EQ(reopened->kv_get("k"), std::optional<std::string>("v"));
    EXPECT_EQ(reopened->events_by_type("consent").size(), 1u);
}
