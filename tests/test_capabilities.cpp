#include <gtest/gtest.h>
#include <thread>
#include <vector>
#include "agents/capabilities.hpp"

using namespace warden::agents;
using warden::core::ErrorCode;

namespace {

Capability cap(const std::string& text) {
    auto parsed = parse_capability(text);
    EXPECT_TRUE(parsed.success) << parsed.error;
    return parsed.capability;
}

} // namespace

TEST(CapabilityParse, SplitsScopeAndAction) {
    auto parsed = parse_capability("files.read");
    ASSERT_TRUE(parsed.success);
    EXPECT_EQ(parsed.capability.scope, "files");
    EXPECT_EQ(parsed.capability.action, "read");
    EXPECT_EQ(parsed.capability.to_string(), "files.read");
}

TEST(CapabilityParse, RejectsMalformedStrings) {
    for (const char* text : {"invalid", "a.b.c", ".read", "files.", "", "."}) {
        auto parsed = parse_capability(text);
        EXPECT_FALSE(parsed.success) << text;
        EXPECT_EQ(parsed.code, ErrorCode::FORMAT) << text;
    }
}

TEST(CapabilityManager, DeniesByDefault) {
    CapabilityManager manager;
    EXPECT_FALSE(manager.check(cap("files.read")));
    EXPECT_TRUE(manager.active_grants().empty());
}

TEST(CapabilityManager, GrantThenRevoke) {
    CapabilityManager manager;
    auto files_read = cap("files.read");

    manager.grant(files_read);
    EXPECT_TRUE(manager.check(files_read));
    EXPECT_FALSE(manager.check(cap("files.write")));

    ASSERT_TRUE(manager.revoke(files_read).success);
    EXPECT_FALSE(manager.check(files_read));
}

TEST(CapabilityManager, RevokeWithoutGrantIsNotFound) {
    CapabilityManager manager;
    auto status = manager.revoke(cap("net.fetch"));
    EXPECT_FALSE(status.success);
    EXPECT_EQ(status.code, ErrorCode::NOT_FOUND);

    manager.grant(cap("net.fetch"));
    ASSERT_TRUE(manager.revoke(cap("net.fetch")).success);
    EXPECT_EQ(manager.revoke(cap("net.fetch")).code, ErrorCode::NOT_FOUND);
}

TEST(CapabilityManager, RegrantAfterRevokeAddsFreshGrant) {
    CapabilityManager manager;
    auto c = cap("files.read");
    manager.grant(c);
    ASSERT_TRUE(manager.revoke(c).success);
    EXPECT_FALSE(manager.check(c));

    manager.grant(c);
    EXPECT_TRUE(manager.check(c));
    EXPECT_EQ(manager.active_grants().size(), 1u);

    // The revoked grant is still held until cleanup
    EXPECT_EQ(manager.cleanup_expired(), 1u);
    EXPECT_TRUE(manager.check(c));
}

TEST(CapabilityManager, TimedGrantExpires) {
    CapabilityManager manager;
    auto c = cap("clipboard.read");
    auto grant = manager.grant(c, std::chrono::milliseconds(50));
    ASSERT_TRUE(grant.expires_at.has_value());
    EXPECT_TRUE(manager.check(c));

    std::this_thread::sleep_for(std::chrono::milliseconds(120));
    EXPECT_FALSE(manager.check(c));
    EXPECT_TRUE(manager.active_grants().empty());
}

TEST(CapabilityManager, GrantValidityIsInclusiveAtExpiry) {
    CapabilityGrant grant;
    grant.granted_at = Clock::now();
    grant.expires_at = grant.granted_at + std::chrono::seconds(10);
    EXPECT_TRUE(grant.is_valid_at(*grant.expires_at));
    EXPECT_FALSE(grant.is_valid_at(*grant.expires_at + std::chrono::milliseconds(1)));
}

TEST(CapabilityManager, CleanupRemovesRevokedAndExpiredGrants) {
    CapabilityManager manager;
    manager.grant(cap("a.expired"), std::chrono::milliseconds(10));
    manager.grant(cap("b.revoked"));
    manager.grant(cap("c.live"));
    ASSERT_TRUE(manager.revoke(cap("b.revoked")).success);

    std::this_thread::sleep_for(std::chrono::milliseconds(40));
    EXPECT_EQ(manager.cleanup_expired(), 2u);
    EXPECT_EQ(manager.cleanup_expired(), 0u);

    auto active = manager.active_grants();
    ASSERT_EQ(active.size(), 1u);
    EXPECT_EQ(active[0].capability.to_string(), "c.live");
}

TEST(CapabilityManager, TicketRedeemsOnce) {
    CapabilityManager manager;
    auto c = cap("files.read");
    manager.grant(c);

    auto issued = manager.issue_ticket("agent-a", c);
    ASSERT_TRUE(issued.success) << issued.error;
    EXPECT_TRUE(manager.redeem(issued.ticket).success);

    auto again = manager.redeem(issued.ticket);
    EXPECT_FALSE(again.success);
    EXPECT_EQ(again.code, ErrorCode::NOT_FOUND);
}

TEST(CapabilityManager, TicketRequiresGrant) {
    CapabilityManager manager;
    auto issued = manager.issue_ticket("agent-a", cap("files.read"));
    EXPECT_FALSE(issued.success);
    EXPECT_EQ(issued.code, ErrorCode::NOT_FOUND);
}

TEST(CapabilityManager, TicketFailsAfterRevoke) {
    CapabilityManager manager;
    auto c = cap("files.write");
    manager.grant(c);
    auto issued = manager.issue_ticket("agent-a", c);
    ASSERT_TRUE(issued.success);

    ASSERT_TRUE(manager.revoke(c).success);
    auto redeemed = manager.redeem(issued.ticket);
    EXPECT_FALSE(redeemed.success);
    EXPECT_EQ(redeemed.code, ErrorCode::NOT_FOUND);
}

TEST(CapabilityManager, TicketExpires) {
    CapabilityManager manager;
    auto c = cap("files.read");
    manager.grant(c);
    auto issued = manager.issue_ticket("agent-a", c, std::chrono::milliseconds(10));
    ASSERT_TRUE(issued.success);

    std::this_thread::sleep_for(std::chrono::milliseconds(40));
    EXPECT_FALSE(manager.redeem(issued.ticket).success);
}

TEST(CapabilityManager, IssuingPrunesExpiredTickets) {
    CapabilityManager manager;
    auto c = cap("files.read");
    manager.grant(c);
    for (int i = 0; i < 5; i++) {
        ASSERT_TRUE(manager.issue_ticket("agent-a", c, std::chrono::milliseconds(10)).success);
    }
    EXPECT_EQ(manager.outstanding_tickets(), 5u);

    std::this_thread::sleep_for(std::chrono::milliseconds(40));
    auto fresh = manager.issue_ticket("agent-a", c);
    ASSERT_TRUE(fresh.success);
    EXPECT_EQ(manager.outstanding_tickets(), 1u);
}

TEST(CapabilityManager, DiscardedTicketCannotBeRedeemed) {
    CapabilityManager manager;
    auto c = cap("files.read");
    manager.grant(c);
    auto issued = manager.issue_ticket("agent-a", c);
    ASSERT_TRUE(issued.success);

    manager.discard(issued.ticket);
    EXPECT_EQ(manager.outstanding_tickets(), 0u);
    EXPECT_EQ(manager.redeem(issued.ticket).code, ErrorCode::NOT_FOUND);

    // Discarding twice is harmless
    manager.discard(issued.ticket);
    EXPECT_EQ(manager.outstanding_tickets(), 0u);
}

TEST(CapabilityManager, ConcurrentGrantsAndChecks) {
    CapabilityManager manager;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; t++) {
        threads.emplace_back([&manager, t]() {
            for (int i = 0; i < 100; i++) {
                Capability c("scope" + std::to_string(t), "action" + std::to_string(i));
                manager.grant(c);
                EXPECT_TRUE(manager.check(c));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(manager.active_grants().size(), 400u);
}
