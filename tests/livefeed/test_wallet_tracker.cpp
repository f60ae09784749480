/*
Tidewatch — WalletActivityTracker Tests
Role: Verify per-wallet profiles, duplicate handling and both eviction paths
*/
#include <gtest/gtest.h>
#include "analytics/WalletActivityTracker.hpp"
#include "fixtures/feed_messages.hpp"

using Clock = WalletActivityTracker::Clock;

TEST(WalletActivityTracker, RecordBuildsProfile) {
    WalletActivityTracker tracker;
    const auto now = Clock::now();
    tracker.record(fixtures::makeTrade("a", 0.5, 100, TradeSide::Buy, "0xW1", 2000), now);
    const WalletProfile* p = tracker.record(
        fixtures::makeTrade("b", 0.5, 300, TradeSide::Sell, "0xw1", 1000, "other"), now);

    ASSERT_NE(p, nullptr);
    EXPECT_EQ(p->wallet, "0xw1");
    EXPECT_EQ(p->tradeCount, 2);
    EXPECT_DOUBLE_EQ(p->totalVolume, 200.0);
    EXPECT_DOUBLE_EQ(p->avgTradeSize(), 100.0);
    EXPECT_EQ(p->firstSeen, 1000);
    EXPECT_EQ(p->marketEntries.at("will-it-rain-tomorrow"), 1);
    EXPECT_EQ(p->marketEntries.at("other"), 1);
    EXPECT_EQ(tracker.size(), 1);
}

TEST(WalletActivityTracker, LookupIsCaseInsensitive) {
    WalletActivityTracker tracker;
    tracker.record(fixtures::makeTrade("a", 0.5, 100, TradeSide::Buy, "0xABCDEF"));
    EXPECT_NE(tracker.find("0xabcdef"), nullptr);
    EXPECT_NE(tracker.find("0xAbCdEf"), nullptr);
    EXPECT_EQ(tracker.find("0x123"), nullptr);
}

TEST(WalletActivityTracker, TradeWithoutWalletIsSkipped) {
    WalletActivityTracker tracker;
    EXPECT_EQ(tracker.record(fixtures::makeTrade("a", 0.5, 100, TradeSide::Buy, "")), nullptr);
    EXPECT_EQ(tracker.size(), 0);
}

TEST(WalletActivityTracker, ResentTradeIsNotCountedTwice) {
    WalletActivityTracker tracker;
    auto t = fixtures::makeTrade("a", 0.5, 100);
    tracker.record(t);
    const WalletProfile* p = tracker.record(t);
    ASSERT_NE(p, nullptr);
    EXPECT_EQ(p->tradeCount, 1);
    EXPECT_EQ(p->history.size(), 1);
}

TEST(WalletActivityTracker, HistoryIsBoundedButTotalsAreCumulative) {
    WalletActivityTracker::Limits limits;
    limits.historyLimit = 3;
    WalletActivityTracker tracker(limits);
    for (int i = 0; i < 5; ++i) {
        tracker.record(fixtures::makeTrade("t" + std::to_string(i), 1.0, 10));
    }
    const WalletProfile* p = tracker.find("0xwallet1");
    ASSERT_NE(p, nullptr);
    EXPECT_EQ(p->history.size(), 3);
    EXPECT_EQ(p->history.front().identity, "t2");
    EXPECT_EQ(p->tradeCount, 5);
    EXPECT_DOUBLE_EQ(p->totalVolume, 50.0);
}

TEST(WalletActivityTracker, ExpiredProfilesAreEvicted) {
    WalletActivityTracker::Limits limits;
    limits.ttl = std::chrono::hours(6);
    WalletActivityTracker tracker(limits);

    const auto t0 = Clock::now();
    tracker.record(fixtures::makeTrade("a", 0.5, 1, TradeSide::Buy, "0xold"), t0);
    tracker.record(fixtures::makeTrade("b", 0.5, 1, TradeSide::Buy, "0xnew"), t0 + std::chrono::hours(5));

    EXPECT_EQ(tracker.evictExpired(t0 + std::chrono::hours(6)), 0);
    EXPECT_EQ(tracker.evictExpired(t0 + std::chrono::hours(6) + std::chrono::seconds(1)), 1);
    EXPECT_EQ(tracker.find("0xold"), nullptr);
    EXPECT_NE(tracker.find("0xnew"), nullptr);
}

TEST(WalletActivityTracker, CapacityEvictsLeastRecentlyUpdated) {
    WalletActivityTracker::Limits limits;
    limits.maxProfiles = 2;
    WalletActivityTracker tracker(limits);

    const auto t0 = Clock::now();
    tracker.record(fixtures::makeTrade("a", 0.5, 1, TradeSide::Buy, "0xa"), t0);
    tracker.record(fixtures::makeTrade("b", 0.5, 1, TradeSide::Buy, "0xb"), t0);
    tracker.record(fixtures::makeTrade("a2", 0.5, 1, TradeSide::Buy, "0xa"), t0);   // 0xa is fresh again
    tracker.record(fixtures::makeTrade("c", 0.5, 1, TradeSide::Buy, "0xc"), t0);

    EXPECT_EQ(tracker.size(), 2);
    EXPECT_NE(tracker.find("0xa"), nullptr);
    EXPECT_EQ(tracker.find("0xb"), nullptr);
    EXPECT_NE(tracker.find("0xc"), nullptr);
}
