/*
Tidewatch — AggregationEngine Tests
Role: Verify rolling stats, rankings and the per-output throttles
Testing Strategy: Explicit time points instead of sleeps
*/
#include <gtest/gtest.h>
#include "analytics/AggregationEngine.hpp"
#include "fixtures/feed_messages.hpp"

using namespace std::chrono_literals;
using Clock = AggregationEngine::Clock;

TEST(AggregationEngine, EmptyLogHasNeutralStats) {
    auto s = AggregationEngine::computeStats({});
    EXPECT_EQ(s.tradeCount, 0);
    EXPECT_DOUBLE_EQ(s.totalVolume, 0.0);
    EXPECT_DOUBLE_EQ(s.avgTradeSize, 0.0);
    EXPECT_DOUBLE_EQ(s.buyPressure, 50.0);
    EXPECT_DOUBLE_EQ(s.imbalance, 0.0);
}

TEST(AggregationEngine, StatsOverMixedFlow) {
    std::vector<Trade> log{
        fixtures::makeTrade("a", 0.5, 600, TradeSide::Buy),      // 300
        fixtures::makeTrade("b", 0.5, 200, TradeSide::Sell),     // 100
        fixtures::makeTrade("c", 1.0, 1200, TradeSide::Buy),     // 1200, whale
    };
    auto s = AggregationEngine::computeStats(log);

    EXPECT_EQ(s.tradeCount, 3);
    EXPECT_DOUBLE_EQ(s.totalVolume, 1600.0);
    EXPECT_DOUBLE_EQ(s.buyVolume, 1500.0);
    EXPECT_DOUBLE_EQ(s.sellVolume, 100.0);
    EXPECT_DOUBLE_EQ(s.largestTrade, 1200.0);
    EXPECT_EQ(s.whaleCount, 1);
    EXPECT_NEAR(s.avgTradeSize, 533.333, 0.001);
    EXPECT_NEAR(s.buyPressure, 93.75, 1e-9);
    EXPECT_NEAR(s.imbalance, 87.5, 1e-9);
}

TEST(AggregationEngine, TopTradersSortedByVolumeAndLimited) {
    std::vector<Trade> log{
        fixtures::makeTrade("a", 1.0, 100, TradeSide::Buy, "0xAAA", 1, "m1"),
        fixtures::makeTrade("b", 1.0, 50, TradeSide::Sell, "0xaaa", 1, "m2"),
        fixtures::makeTrade("c", 1.0, 500, TradeSide::Buy, "0xbbb", 1, "m1"),
        fixtures::makeTrade("d", 1.0, 10, TradeSide::Buy, "0xccc", 1, "m1"),
    };
    auto top = AggregationEngine::computeTopTraders(log, 2);

    ASSERT_EQ(top.size(), 2);
    EXPECT_EQ(top[0].wallet, "0xbbb");
    EXPECT_DOUBLE_EQ(top[0].volume, 500.0);
    EXPECT_EQ(top[1].wallet, "0xaaa");
    EXPECT_DOUBLE_EQ(top[1].volume, 150.0);
    EXPECT_EQ(top[1].trades, 2);
    EXPECT_EQ(top[1].markets, 2);
    EXPECT_DOUBLE_EQ(top[1].buyPercent, 50.0);
}

TEST(AggregationEngine, MarketVolumesKeepFirstImage) {
    auto a = fixtures::makeTrade("a", 1.0, 100, TradeSide::Buy, "0xw", 1, "m1", "Market one");
    auto b = fixtures::makeTrade("b", 1.0, 100, TradeSide::Buy, "0xw", 1, "m1", "Market one");
    b.image = "m1.png";
    auto c = fixtures::makeTrade("c", 1.0, 50, TradeSide::Buy, "0xw", 1, "m2", "Market two");

    auto vols = AggregationEngine::computeMarketVolumes({a, b, c}, 10);
    ASSERT_EQ(vols.size(), 2);
    EXPECT_EQ(vols[0].slug, "m1");
    EXPECT_EQ(vols[0].title, "Market one");
    EXPECT_DOUBLE_EQ(vols[0].volume, 200.0);
    EXPECT_EQ(vols[0].trades, 2);
    ASSERT_TRUE(vols[0].image.has_value());
    EXPECT_EQ(*vols[0].image, "m1.png");
    EXPECT_FALSE(vols[1].image.has_value());
}

TEST(AggregationEngine, TickThrottlesStatsAndRankingsSeparately) {
    AggregationEngine engine(500ms, 1000ms, 10);
    std::vector<Trade> log{fixtures::makeTrade("a", 1.0, 100)};
    const auto t0 = Clock::now();

    auto r0 = engine.tick(log, t0);
    EXPECT_TRUE(r0.statsUpdated);
    EXPECT_TRUE(r0.rankingsUpdated);

    auto r1 = engine.tick(log, t0 + 300ms);
    EXPECT_FALSE(r1.statsUpdated);
    EXPECT_FALSE(r1.rankingsUpdated);

    auto r2 = engine.tick(log, t0 + 500ms);
    EXPECT_TRUE(r2.statsUpdated);
    EXPECT_FALSE(r2.rankingsUpdated);

    auto r3 = engine.tick(log, t0 + 1000ms);
    EXPECT_TRUE(r3.statsUpdated);
    EXPECT_TRUE(r3.rankingsUpdated);
}

TEST(AggregationEngine, TickReplacesResultsWholesale) {
    AggregationEngine engine(500ms, 1000ms, 10);
    const auto t0 = Clock::now();
    engine.tick({fixtures::makeTrade("a", 1.0, 100)}, t0);
    EXPECT_EQ(engine.stats().tradeCount, 1);

    engine.tick({}, t0 + 2s);
    EXPECT_EQ(engine.stats().tradeCount, 0);
    EXPECT_TRUE(engine.topTraders().empty());
    EXPECT_TRUE(engine.marketVolumes().empty());
}

TEST(AggregationEngine, ResetForcesRecompute) {
    AggregationEngine engine(500ms, 1000ms, 10);
    const auto t0 = Clock::now();
    engine.tick({}, t0);
    engine.reset();
    auto r = engine.tick({}, t0 + 1ms);
    EXPECT_TRUE(r.statsUpdated);
    EXPECT_TRUE(r.rankingsUpdated);
}
