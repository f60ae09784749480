/*
Tidewatch — MetadataEnricher Tests
Role: Verify batching, debounce, caching and that no key is requested twice
Testing Strategy: Real io_context + strand with a short debounce; fake metadata source completes on demand
*/
#include <gtest/gtest.h>
#include "MetadataEnricher.hpp"
#include "fixtures/fake_providers.hpp"
#include "fixtures/feed_messages.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/strand.hpp>

using namespace std::chrono_literals;
namespace net = boost::asio;

namespace {

MarketMetadata market(const std::string& slug, const std::string& cond, std::optional<std::string> image) {
    MarketMetadata m;
    m.slug = slug;
    m.conditionId = cond;
    m.image = std::move(image);
    return m;
}

class MetadataEnricherTest : public ::testing::Test {
protected:
    void SetUp() override {
        source = std::make_shared<FakeMetadataSource>();
        enricher = std::make_shared<MetadataEnricher>(strand, source, 20, 20ms);
        enricher->onBatchComplete([this] { ++batches; });
    }

    void drain() {
        ioc.restart();
        ioc.run();
    }

    net::io_context ioc;
    net::strand<net::io_context::executor_type> strand{ioc.get_executor()};
    std::shared_ptr<FakeMetadataSource> source;
    std::shared_ptr<MetadataEnricher> enricher;
    int batches = 0;
};

} // namespace

TEST_F(MetadataEnricherTest, UnknownKeysWaitForDebounce) {
    auto t = fixtures::makeTrade("a", 0.5, 1, TradeSide::Buy, "0xw", 1, "rain");
    EXPECT_FALSE(enricher->resolve(t).has_value());
    EXPECT_EQ(enricher->pendingCount(), 2);   // slug and condition id
    EXPECT_EQ(source->requestCount(), 0);

    drain();
    ASSERT_EQ(source->requestCount(), 1);
    EXPECT_EQ(enricher->inFlightCount(), 2);
    EXPECT_EQ(source->requests()[0].eventSlugs, (std::vector<std::string>{"rain"}));
    EXPECT_EQ(source->requests()[0].conditionIds, (std::vector<std::string>{"0xcond-rain"}));
}

TEST_F(MetadataEnricherTest, SameKeyIsRequestedOnce) {
    auto t = fixtures::makeTrade("a", 0.5, 1, TradeSide::Buy, "0xw", 1, "rain");
    enricher->resolve(t);
    enricher->resolve(fixtures::makeTrade("b", 0.5, 1, TradeSide::Buy, "0xw", 2, "rain"));
    EXPECT_EQ(enricher->pendingCount(), 2);

    drain();
    enricher->resolve(t);   // in flight: nothing new queued
    EXPECT_EQ(enricher->pendingCount(), 0);
    drain();
    EXPECT_EQ(source->requestCount(), 1);
}

TEST_F(MetadataEnricherTest, FullBatchFlushesImmediately) {
    auto small = std::make_shared<MetadataEnricher>(strand, source, 2, 10s);
    small->resolve(fixtures::makeTrade("a", 0.5, 1, TradeSide::Buy, "0xw", 1, "rain"));
    EXPECT_EQ(source->requestCount(), 1);
    EXPECT_EQ(small->pendingCount(), 0);
    small->stop();
}

TEST_F(MetadataEnricherTest, AnsweredKeysAreCachedAndServed) {
    auto t = fixtures::makeTrade("a", 0.5, 1, TradeSide::Buy, "0xw", 1, "rain");
    enricher->resolve(t);
    drain();

    MetadataResponse resp;
    resp.ok = true;
    resp.markets.push_back(market("rain", "0xcond-rain", std::string("rain.png")));
    source->complete(resp);
    drain();

    EXPECT_EQ(batches, 1);
    EXPECT_EQ(enricher->state(MetadataEnricher::slugKey("rain")), MetadataEnricher::KeyState::Present);
    auto img = enricher->resolve(t);
    ASSERT_TRUE(img.has_value());
    EXPECT_EQ(*img, "rain.png");
    EXPECT_EQ(source->requestCount(), 1);
}

TEST_F(MetadataEnricherTest, UnansweredKeysBecomeNegative) {
    auto t = fixtures::makeTrade("a", 0.5, 1, TradeSide::Buy, "0xw", 1, "rain");
    enricher->resolve(t);
    drain();

    MetadataResponse resp;
    resp.ok = true;   // answered, but nothing about "rain"
    source->complete(resp);
    drain();

    EXPECT_EQ(enricher->state(MetadataEnricher::slugKey("rain")), MetadataEnricher::KeyState::Negative);
    EXPECT_EQ(enricher->state(MetadataEnricher::conditionKey("0xcond-rain")), MetadataEnricher::KeyState::Negative);
    EXPECT_FALSE(enricher->resolve(t).has_value());
    drain();
    EXPECT_EQ(source->requestCount(), 1);
}

TEST_F(MetadataEnricherTest, FailedLookupIsNeverRetried) {
    auto t = fixtures::makeTrade("a", 0.5, 1, TradeSide::Buy, "0xw", 1, "rain");
    enricher->resolve(t);
    drain();

    MetadataResponse resp;
    resp.ok = false;
    resp.error = "HTTP 503";
    source->complete(resp);
    drain();

    EXPECT_EQ(batches, 1);
    enricher->resolve(t);
    drain();
    EXPECT_EQ(source->requestCount(), 1);
    EXPECT_EQ(enricher->cacheSize(), 2);
}

TEST_F(MetadataEnricherTest, ExtraAnsweredKeysAreCachedToo) {
    enricher->resolve(fixtures::makeTrade("a", 0.5, 1, TradeSide::Buy, "0xw", 1, "rain"));
    drain();

    MetadataResponse resp;
    resp.ok = true;
    auto m = market("rain", "0xcond-rain", std::string("rain.png"));
    m.eventSlug = "weather";
    resp.markets.push_back(m);
    source->complete(resp);
    drain();

    EXPECT_EQ(enricher->state(MetadataEnricher::slugKey("weather")), MetadataEnricher::KeyState::Present);
    auto other = fixtures::makeTrade("b", 0.5, 1, TradeSide::Buy, "0xw", 1, "weather");
    ASSERT_TRUE(enricher->resolve(other).has_value());
}

TEST_F(MetadataEnricherTest, StopDropsPendingWork) {
    enricher->resolve(fixtures::makeTrade("a", 0.5, 1, TradeSide::Buy, "0xw", 1, "rain"));
    enricher->stop();
    drain();
    EXPECT_EQ(source->requestCount(), 0);
}

TEST_F(MetadataEnricherTest, ConditionIdAloneFindsTheImage) {
    enricher->resolve("rain", "0xcond-rain");
    drain();

    MetadataResponse resp;
    resp.ok = true;
    resp.markets.push_back(market("", "0xcond-rain", std::string("cond.png")));
    source->complete(resp);
    drain();

    auto img = enricher->resolve("renamed-slug", "0xcond-rain");
    ASSERT_TRUE(img.has_value());
    EXPECT_EQ(*img, "cond.png");
    EXPECT_EQ(enricher->pendingCount(), 0);
}

TEST_F(MetadataEnricherTest, StartAfterStopResolvesAgain) {
    auto t = fixtures::makeTrade("a", 0.5, 1, TradeSide::Buy, "0xw", 1, "rain");
    enricher->resolve(t);
    drain();
    ASSERT_EQ(source->requestCount(), 1);

    enricher->stop();
    EXPECT_EQ(enricher->inFlightCount(), 0);
    EXPECT_EQ(enricher->state(MetadataEnricher::slugKey("rain")), MetadataEnricher::KeyState::Unknown);

    enricher->start();
    enricher->resolve(t);
    EXPECT_EQ(enricher->pendingCount(), 2);
    drain();
    ASSERT_EQ(source->requestCount(), 2);

    MetadataResponse resp;
    resp.ok = true;
    resp.markets.push_back(market("rain", "0xcond-rain", std::string("rain.png")));
    source->complete(resp);   // the batch sent before stop()
    source->complete(resp);
    drain();
    EXPECT_EQ(batches, 2);
    EXPECT_EQ(enricher->resolve(t).value_or(""), "rain.png");
}
