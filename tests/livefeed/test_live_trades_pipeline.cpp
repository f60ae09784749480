/*
Tidewatch — LiveTradesPipeline Tests
Role: End-to-end behaviour of the facade with scripted network edges
Testing Strategy: Real I/O thread and strand; FakeTransport driven from the test thread; Qt signals
                  delivered by pumping the QCoreApplication event loop
Coverage: Startup wiring, flush to the canonical list, whale buffer, pause and resume, image
          patching, tracked wallets, signals, CSV export, clean stop and restart
*/
#include <gtest/gtest.h>
#include "LiveTradesPipeline.hpp"
#include "fixtures/fake_providers.hpp"
#include "fixtures/fake_transport.hpp"
#include "fixtures/feed_messages.hpp"
#include <QCoreApplication>
#include <chrono>
#include <functional>
#include <sstream>
#include <stdexcept>
#include <thread>

using namespace std::chrono_literals;

namespace {

constexpr const char* kWhaleWallet = "0xAbC0000000000000000000000000000000000001";
constexpr const char* kSmallWallet = "0xdef0000000000000000000000000000000000002";

class LiveTradesPipelineTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        if (!QCoreApplication::instance()) {
            static int argc = 1;
            static char name[] = "tidewatch_tests";
            static char* argv[] = {name, nullptr};
            static QCoreApplication app(argc, argv);
        }
    }

    void SetUp() override {
        PipelineConfig config;
        config.flushInterval = 10ms;
        config.statsInterval = 20ms;
        config.rankingsInterval = 20ms;
        config.watchdogInterval = 50ms;
        config.metadataDebounce = 20ms;

        LiveTradesPipeline::Collaborators collab;
        collab.urlProvider = std::make_shared<FakeUrlProvider>("wss://feed.example.com/stream?token=abc");
        collab.transportFactory = transports.factory();
        collab.metadataSource = metadata;
        pipeline = std::make_unique<LiveTradesPipeline>(config, std::move(collab));

        QObject::connect(pipeline.get(), &LiveTradesPipeline::tradesFlushed,
                         [this](const std::vector<Trade>& batch) {
                             flushedSignals += static_cast<int>(batch.size());
                             for (const auto& t : batch) flushedIds.push_back(t.order_hash);
                         });
        QObject::connect(pipeline.get(), &LiveTradesPipeline::whaleAlert,
                         [this](const Trade&) { ++whaleAlerts; });
        QObject::connect(pipeline.get(), &LiveTradesPipeline::connectionStateChanged,
                         [this](FeedState s) { states.push_back(s); });
    }

    void TearDown() override {
        // Outstanding completions hold the pipeline's strand; release them with the pipeline.
        metadata.reset();
        pipeline.reset();
    }

    // Pumps Qt events until the predicate holds or two seconds pass.
    bool waitFor(const std::function<bool()>& pred) {
        const auto deadline = std::chrono::steady_clock::now() + 2s;
        while (std::chrono::steady_clock::now() < deadline) {
            QCoreApplication::processEvents();
            if (pred()) return true;
            std::this_thread::sleep_for(5ms);
        }
        QCoreApplication::processEvents();
        return pred();
    }

    void startAndOpen() {
        pipeline->start();
        ASSERT_TRUE(waitFor([this] {
            return transports.count() >= 1 && transports.last().connectCalls() == 1;
        }));
        transports.last().open();
        ASSERT_TRUE(waitFor([this] { return pipeline->connectionState() == FeedState::Open; }));
    }

    void deliver(const std::string& frame) {
        transports.last().receive(frame);
    }

    MetadataResponse imageFor(const std::string& slug, const std::string& image) {
        MetadataResponse resp;
        resp.ok = true;
        MarketMetadata m;
        m.slug = slug;
        m.image = image;
        resp.markets.push_back(m);
        return resp;
    }

    FakeTransportFactory transports;
    std::shared_ptr<FakeMetadataSource> metadata = std::make_shared<FakeMetadataSource>();
    std::unique_ptr<LiveTradesPipeline> pipeline;
    int flushedSignals = 0;
    std::vector<std::string> flushedIds;
    int whaleAlerts = 0;
    std::vector<FeedState> states;
};

} // namespace

TEST(LiveTradesPipelineConfig, ThrowsWithoutAnyStreamSource) {
    PipelineConfig config;
    EXPECT_THROW(LiveTradesPipeline pipeline(config), std::runtime_error);
}

TEST_F(LiveTradesPipelineTest, FlushesDecodedTradesNewestFirst) {
    startAndOpen();
    EXPECT_EQ(transports.last().host(), "feed.example.com");
    ASSERT_FALSE(transports.last().sent().empty());   // subscription frame

    deliver(fixtures::orderFrame("0xa", 0.50, 10.0, "BUY", kSmallWallet, 1760000000));
    deliver(fixtures::orderFrame("0xb", 0.40, 20.0, "SELL", kSmallWallet, 1760000010));

    ASSERT_TRUE(waitFor([this] { return pipeline->recentTrades().size() == 2; }));
    const auto recent = pipeline->recentTrades();
    EXPECT_EQ(recent[0].order_hash, "0xb");
    EXPECT_EQ(recent[1].order_hash, "0xa");
    EXPECT_TRUE(waitFor([this] { return flushedSignals == 2; }));
    EXPECT_TRUE(pipeline->whaleTrades().empty());
    EXPECT_TRUE(waitFor([this] { return !states.empty() && states.back() == FeedState::Open; }));
}

TEST_F(LiveTradesPipelineTest, WhaleTradesReachTheWhaleBufferAndAlert) {
    startAndOpen();
    deliver(fixtures::orderFrame("0xwhale", 0.80, 5000.0, "BUY", kWhaleWallet));
    deliver(fixtures::orderFrame("0xsmall", 0.50, 10.0, "BUY", kSmallWallet));

    ASSERT_TRUE(waitFor([this] { return pipeline->recentTrades().size() == 2; }));
    const auto whales = pipeline->whaleTrades();
    ASSERT_EQ(whales.size(), 1u);
    EXPECT_EQ(whales[0].order_hash, "0xwhale");
    EXPECT_TRUE(waitFor([this] { return whaleAlerts == 1; }));

    FilterState filter;
    filter.whalesOnly = true;
    const auto view = pipeline->materialize(filter);
    ASSERT_EQ(view.size(), 1u);
    EXPECT_EQ(view[0].order_hash, "0xwhale");
}

TEST_F(LiveTradesPipelineTest, StatsSnapshotFollowsTheCanonicalList) {
    startAndOpen();
    deliver(fixtures::orderFrame("0xa", 0.50, 100.0, "BUY", kSmallWallet));
    deliver(fixtures::orderFrame("0xb", 0.50, 100.0, "SELL", kWhaleWallet));

    ASSERT_TRUE(waitFor([this] { return pipeline->stats().tradeCount == 2; }));
    const auto s = pipeline->stats();
    EXPECT_DOUBLE_EQ(s.totalVolume, 100.0);
    EXPECT_DOUBLE_EQ(s.buyPressure, 50.0);
    EXPECT_TRUE(waitFor([this] { return pipeline->topTraders().size() == 2; }));
    EXPECT_TRUE(waitFor([this] { return pipeline->marketVolumes().size() == 1; }));
}

TEST_F(LiveTradesPipelineTest, PausedTradesQueueUntilResume) {
    startAndOpen();
    deliver(fixtures::orderFrame("0xa", 0.50, 10.0, "BUY", kSmallWallet));
    ASSERT_TRUE(waitFor([this] { return pipeline->recentTrades().size() == 1; }));

    pipeline->pause();
    EXPECT_TRUE(pipeline->isPaused());
    ASSERT_TRUE(waitFor([this] { return flushedSignals == 1; }));
    // Give the pause a chance to land on the strand before the next frames.
    std::this_thread::sleep_for(30ms);

    deliver(fixtures::orderFrame("0xb", 0.50, 10.0, "BUY", kSmallWallet));
    deliver(fixtures::orderFrame("0xc", 0.50, 10.0, "BUY", kSmallWallet));
    ASSERT_TRUE(waitFor([this] { return pipeline->queuedCount() == 2; }));
    std::this_thread::sleep_for(30ms);
    EXPECT_EQ(pipeline->recentTrades().size(), 1u);

    pipeline->resume();
    EXPECT_FALSE(pipeline->isPaused());
    ASSERT_TRUE(waitFor([this] { return pipeline->recentTrades().size() == 3; }));
    EXPECT_EQ(pipeline->queuedCount(), 0u);
    EXPECT_EQ(pipeline->recentTrades().front().order_hash, "0xc");
    EXPECT_TRUE(waitFor([this] { return flushedSignals == 3; }));
}

TEST_F(LiveTradesPipelineTest, TrackedOnlyViewAndWalletProfile) {
    startAndOpen();
    deliver(fixtures::orderFrame("0xa", 0.50, 10.0, "BUY", kSmallWallet));
    deliver(fixtures::orderFrame("0xb", 0.50, 20.0, "SELL", kWhaleWallet));
    ASSERT_TRUE(waitFor([this] { return pipeline->recentTrades().size() == 2; }));

    pipeline->trackWallet(kWhaleWallet, "big fish");
    FilterState filter;
    filter.trackedOnly = true;
    const auto view = pipeline->materialize(filter);
    ASSERT_EQ(view.size(), 1u);
    EXPECT_EQ(view[0].order_hash, "0xb");

    EXPECT_TRUE(pipeline->untrackWallet(kWhaleWallet));
    EXPECT_TRUE(pipeline->materialize(filter).empty());

    const auto profile = pipeline->walletProfile(kSmallWallet);
    ASSERT_TRUE(profile.has_value());
    EXPECT_EQ(profile->tradeCount, 1u);
    EXPECT_FALSE(pipeline->walletProfile("0xnobody").has_value());
}

TEST_F(LiveTradesPipelineTest, FreshWalletSignalOnLargeFirstTrade) {
    startAndOpen();
    const auto now = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    deliver(fixtures::orderFrame("0xwhale", 0.80, 5000.0, "BUY", kWhaleWallet, now));
    ASSERT_TRUE(waitFor([this] { return pipeline->recentTrades().size() == 1; }));

    const auto signals = pipeline->signalsFor(pipeline->recentTrades().front());
    bool fresh = false;
    for (const auto& s : signals) fresh = fresh || s.type == SignalType::FreshWallet;
    EXPECT_TRUE(fresh);
}

TEST_F(LiveTradesPipelineTest, ExportCsvWritesOneRowPerVisibleTrade) {
    startAndOpen();
    deliver(fixtures::orderFrame("0xa", 0.50, 10.0, "BUY", kSmallWallet));
    deliver(fixtures::orderFrame("0xb", 0.50, 20.0, "SELL", kSmallWallet));
    ASSERT_TRUE(waitFor([this] { return pipeline->recentTrades().size() == 2; }));

    std::ostringstream out;
    EXPECT_EQ(pipeline->exportCsv(FilterState{}, out), 2u);

    std::size_t lines = 0;
    std::istringstream in(out.str());
    for (std::string line; std::getline(in, line);) ++lines;
    EXPECT_EQ(lines, 3u);   // header + 2
}

TEST_F(LiveTradesPipelineTest, StopClosesTheFeedNormally) {
    startAndOpen();
    pipeline->stop();
    EXPECT_FALSE(pipeline->isRunning());
    EXPECT_EQ(pipeline->connectionState(), FeedState::Closed);

    const auto& codes = transports.last().closeCodes();
    ASSERT_FALSE(codes.empty());
    EXPECT_EQ(codes.back(), WsTransport::kCloseNormal);

    pipeline->stop();   // idempotent
    EXPECT_FALSE(pipeline->isRunning());
}

TEST_F(LiveTradesPipelineTest, ResolvedImagesPatchIngestedTrades) {
    startAndOpen();
    deliver(fixtures::orderFrame("0xwhale", 0.80, 5000.0, "BUY", kWhaleWallet));
    ASSERT_TRUE(waitFor([this] {
        return pipeline->recentTrades().size() == 1 && metadata->requestCount() == 1;
    }));
    EXPECT_FALSE(pipeline->recentTrades().front().image.has_value());
    EXPECT_EQ(metadata->requests()[0].eventSlugs, (std::vector<std::string>{"will-it-rain-tomorrow"}));

    metadata->complete(imageFor("will-it-rain-tomorrow", "rain.png"));
    ASSERT_TRUE(waitFor([this] {
        const auto recent = pipeline->recentTrades();
        return !recent.empty() && recent.front().image == std::optional<std::string>("rain.png");
    }));
    const auto whales = pipeline->whaleTrades();
    ASSERT_EQ(whales.size(), 1u);
    EXPECT_EQ(whales[0].image.value_or(""), "rain.png");

    // Later trades from the same market arrive with the cached image.
    deliver(fixtures::orderFrame("0xnext", 0.50, 10.0, "SELL", kSmallWallet));
    ASSERT_TRUE(waitFor([this] { return pipeline->recentTrades().size() == 2; }));
    EXPECT_EQ(pipeline->recentTrades().front().image.value_or(""), "rain.png");
    EXPECT_EQ(metadata->requestCount(), 1u);
}

TEST_F(LiveTradesPipelineTest, TradesQueuedWhilePausedGetTheirImageOnResume) {
    startAndOpen();
    pipeline->pause();
    std::this_thread::sleep_for(30ms);

    deliver(fixtures::orderFrame("0xa", 0.50, 10.0, "BUY", kSmallWallet));
    ASSERT_TRUE(waitFor([this] {
        return pipeline->queuedCount() == 1 && metadata->requestCount() == 1;
    }));

    // The completion is posted to the strand ahead of the resume below.
    metadata->complete(imageFor("will-it-rain-tomorrow", "rain.png"));
    pipeline->resume();

    ASSERT_TRUE(waitFor([this] { return pipeline->recentTrades().size() == 1; }));
    EXPECT_EQ(pipeline->recentTrades().front().image.value_or(""), "rain.png");
}

TEST_F(LiveTradesPipelineTest, RestartAfterStopStillResolvesImages) {
    startAndOpen();
    pipeline->stop();

    pipeline->start();
    ASSERT_TRUE(waitFor([this] {
        return transports.count() >= 2 && transports.last().connectCalls() == 1;
    }));
    transports.last().open();
    ASSERT_TRUE(waitFor([this] { return pipeline->connectionState() == FeedState::Open; }));

    deliver(fixtures::orderFrame("0xa", 0.50, 10.0, "BUY", kSmallWallet));
    ASSERT_TRUE(waitFor([this] { return metadata->requestCount() == 1; }));
    metadata->complete(imageFor("will-it-rain-tomorrow", "rain.png"));
    ASSERT_TRUE(waitFor([this] {
        const auto recent = pipeline->recentTrades();
        return !recent.empty() && recent.front().image == std::optional<std::string>("rain.png");
    }));
}

TEST_F(LiveTradesPipelineTest, FlushSignalCarriesItsOwnBatch) {
    startAndOpen();
    deliver(fixtures::orderFrame("0xa", 0.50, 10.0, "BUY", kSmallWallet));
    ASSERT_TRUE(waitFor([this] { return pipeline->recentTrades().size() == 1; }));
    deliver(fixtures::orderFrame("0xb", 0.50, 10.0, "BUY", kSmallWallet));
    ASSERT_TRUE(waitFor([this] { return pipeline->recentTrades().size() == 2; }));

    // Both signals may be delivered only now, after the log already holds both trades.
    ASSERT_TRUE(waitFor([this] { return flushedIds.size() == 2; }));
    EXPECT_EQ(flushedIds, (std::vector<std::string>{"0xa", "0xb"}));
}
