/*
Tidewatch — LiveTradesPipeline
Role: Wiring and tick scheduling of the live-trades pipeline; see LiveTradesPipeline.hpp.
Threading: Component callbacks and timers run on m_strand. Qt signals are queued to the
           object's thread through QMetaObject::invokeMethod.
*/
#include "LiveTradesPipeline.hpp"
#include "Cpp20Utils.hpp"
#include "TidewatchLogging.hpp"
#include "analytics/ViewMaterializer.hpp"
#include "export/CsvExporter.hpp"
#include "provider/HttpMetadataSource.hpp"
#include "provider/HttpUrlProvider.hpp"
#include "ws/BeastWsTransport.hpp"
#include <boost/asio/post.hpp>
#include <QPointer>
#include <chrono>
#include <future>
#include <mutex>
#include <stdexcept>

namespace net = boost::asio;

namespace {

WalletActivityTracker::Limits trackerLimits(const PipelineConfig& c) {
    WalletActivityTracker::Limits l;
    l.historyLimit = c.walletHistoryLimit;
    l.maxProfiles = c.maxWalletProfiles;
    l.ttl = c.walletProfileTtl;
    return l;
}

SignalDetector::Thresholds detectorThresholds(const PipelineConfig& c) {
    SignalDetector::Thresholds t;
    t.freshWalletMaxAgeSeconds = c.freshWalletMaxAgeSeconds;
    t.freshWalletMinNotional = c.freshWalletMinNotional;
    t.unusualSizingMultiple = c.unusualSizingMultiple;
    t.repeatedEntriesThreshold = c.repeatedEntriesThreshold;
    t.rapidClusterCount = c.rapidClusterCount;
    t.rapidClusterWindowSeconds = c.rapidClusterWindowSeconds;
    return t;
}

constexpr auto kStopWait = std::chrono::seconds(2);

} // namespace

LiveTradesPipeline::LiveTradesPipeline(PipelineConfig config, QObject* parent)
    : LiveTradesPipeline(std::move(config), Collaborators{}, parent)
{}

LiveTradesPipeline::LiveTradesPipeline(PipelineConfig config, Collaborators collaborators, QObject* parent)
    : QObject(parent)
    , m_config(std::move(config))
    , m_queue(m_config.canonicalCapacity)
    , m_canonical(m_config.canonicalCapacity)
    , m_whales(m_config.whaleCapacity)
    , m_detector(detectorThresholds(m_config))
    , m_aggregation(m_config.statsInterval, m_config.rankingsInterval, m_config.rankingLimit)
    , m_wallets(trackerLimits(m_config))
{
    qRegisterMetaType<Trade>("Trade");
    qRegisterMetaType<std::vector<Trade>>("std::vector<Trade>");
    qRegisterMetaType<FeedState>("FeedState");
    qRegisterMetaType<HealthStatus>("HealthStatus");

    m_sslCtx.set_default_verify_paths();
    m_sslCtx.set_verify_mode(net::ssl::verify_peer);

    auto urlProvider = std::move(collaborators.urlProvider);
    if (!urlProvider) {
        if (!m_config.wsUrl.empty()) {
            urlProvider = std::make_shared<StaticUrlProvider>(m_config.wsUrl);
        } else if (!m_config.urlProviderEndpoint.empty()) {
            urlProvider = std::make_shared<HttpUrlProvider>(m_ioc.get_executor(), m_sslCtx,
                                                            m_config.urlProviderEndpoint,
                                                            m_config.apiToken, m_config.httpTimeout);
        } else {
            throw std::runtime_error("Tidewatch: neither ws_url nor url_provider_endpoint is configured");
        }
    }

    auto metadataSource = std::move(collaborators.metadataSource);
    if (!metadataSource && !m_config.metadataEndpoint.empty()) {
        metadataSource = std::make_shared<HttpMetadataSource>(m_ioc.get_executor(), m_sslCtx,
                                                              m_config.metadataEndpoint,
                                                              m_config.apiToken, m_config.httpTimeout);
    }
    if (!metadataSource) {
        tLog_App("No metadata endpoint configured, market images disabled");
    }

    auto transportFactory = std::move(collaborators.transportFactory);
    if (!transportFactory) {
        transportFactory = [this]() -> std::shared_ptr<WsTransport> {
            return std::make_shared<BeastWsTransport>(m_strand, m_sslCtx);
        };
    }

    FeedConnection::Options connOpts;
    connOpts.connectTimeout = m_config.connectTimeout;
    connOpts.reconnectBackoff = m_config.reconnectBackoff;
    connOpts.platform = m_config.platform;
    connOpts.version = m_config.protocolVersion;
    m_connection = std::make_shared<FeedConnection>(m_strand, std::move(urlProvider),
                                                    std::move(transportFactory), connOpts);

    HealthMonitor::Options healthOpts;
    healthOpts.watchdogInterval = m_config.watchdogInterval;
    healthOpts.staleThreshold = m_config.staleThreshold;
    healthOpts.hardReconnectInterval = m_config.hardReconnectInterval;
    std::weak_ptr<FeedConnection> weakConn = m_connection;
    m_health = std::make_shared<HealthMonitor>(
        m_strand, m_connection->session(),
        [weakConn](int code, std::string reason) {
            if (auto conn = weakConn.lock()) conn->forceClose(code, std::move(reason));
        },
        healthOpts);

    m_enricher = std::make_shared<MetadataEnricher>(m_strand, std::move(metadataSource),
                                                    m_config.metadataBatchSize, m_config.metadataDebounce);

    wireComponents();
    tLog_App("Live trades pipeline created");
}

LiveTradesPipeline::~LiveTradesPipeline() {
    stop();
}

void LiveTradesPipeline::wireComponents() {
    m_connection->onTrade([this](Trade trade) { handleTrade(std::move(trade)); });
    m_connection->onStateChanged([this](FeedState s) { handleStateChange(s); });
    m_connection->onConnectError([this](ConnectError e, std::string message) {
        emitError(QString("Connect failed (%1): %2")
                      .arg(QString::fromUtf8(toString(e)))
                      .arg(QString::fromStdString(message)));
    });
    m_connection->onProviderError([this](std::string message) {
        emitError(QString("Provider error: %1").arg(QString::fromStdString(message)));
    });

    m_health->onHealthChanged([this](HealthStatus status) {
        QPointer<LiveTradesPipeline> self(this);
        QMetaObject::invokeMethod(this, [self, status] {
            if (!self) return;
            emit self->healthChanged(status);
        }, Qt::QueuedConnection);
    });

    m_enricher->onBatchComplete([this]() {
        auto lookup = [this](const Trade& t) { return m_enricher->cachedImage(t); };
        const std::size_t patched = m_canonical.attachImages(lookup) + m_whales.attachImages(lookup);
        if (patched > 0) {
            tLog_Data("Attached images to" << static_cast<qulonglong>(patched) << "trades");
        }
    });
}

void LiveTradesPipeline::start() {
    if (m_running.exchange(true)) return;

    m_workGuard.emplace(m_ioc.get_executor());
    m_ioc.restart();
    m_ioThread = std::thread(&LiveTradesPipeline::run, this);

    net::post(m_strand, [this]() {
        m_ticking = true;
        m_enricher->start();
        m_health->start();
        scheduleFlush();
        scheduleStats();
        scheduleSweep();
    });
    m_connection->connect();
    tLog_App("Live trades pipeline started");
}

void LiveTradesPipeline::stop() {
    if (!m_running.exchange(false)) return;

    // Cancel on the strand and give the close frame a moment before stopping the loop.
    auto done = std::make_shared<std::promise<void>>();
    auto stopped = done->get_future();
    net::post(m_strand, [this, done]() {
        stopOnStrand();
        done->set_value();
    });
    if (stopped.wait_for(kStopWait) != std::future_status::ready) {
        tLog_Warning("Pipeline stop timed out waiting for the strand");
    }

    m_workGuard.reset();
    m_ioc.stop();
    if (m_ioThread.joinable()) {
        m_ioThread.join();
    }
    tLog_App("Live trades pipeline stopped");
}

void LiveTradesPipeline::run() {
    tLog_App("I/O thread running");
    for (;;) {
        try {
            m_ioc.run();
            break;
        } catch (const std::exception& e) {
            tLog_Error("Unhandled exception on I/O thread:" << e.what());
            emitError(QString("I/O thread error: %1").arg(QString::fromUtf8(e.what())));
        }
    }
}

void LiveTradesPipeline::stopOnStrand() {
    m_ticking = false;
    m_flushTimer.cancel();
    m_statsTimer.cancel();
    m_sweepTimer.cancel();
    m_health->stop();
    m_enricher->stop();
    m_connection->disconnect();
}

void LiveTradesPipeline::reconnectNow() {
    m_connection->reconnectNow();
}

void LiveTradesPipeline::pause() {
    m_paused.store(true);
    net::post(m_strand, [this]() {
        m_queue.pause();
        tLog_App("Feed paused");
    });
}

void LiveTradesPipeline::resume() {
    m_paused.store(false);
    net::post(m_strand, [this]() {
        // Anything still pending predates the pause and goes in first.
        auto pending = m_queue.flush();
        if (!pending.empty()) {
            attachCachedImages(pending);
            m_canonical.prepend(pending);
            emitFlushed(std::move(pending));
        }

        auto backlog = m_queue.resume();
        m_queuedCount.store(0);
        tLog_App("Feed resumed," << static_cast<qulonglong>(backlog.size()) << "queued trades merged");
        if (backlog.empty()) return;
        attachCachedImages(backlog);
        m_canonical.prepend(backlog);
        emitFlushed(std::move(backlog));
    });
}

void LiveTradesPipeline::trackWallet(const std::string& wallet, const std::string& nickname) {
    std::unique_lock lock(m_trackedMx);
    m_tracked.track(wallet, nickname);
}

bool LiveTradesPipeline::untrackWallet(const std::string& wallet) {
    std::unique_lock lock(m_trackedMx);
    return m_tracked.untrack(wallet);
}

TrackedWallets LiveTradesPipeline::trackedWallets() const {
    std::shared_lock lock(m_trackedMx);
    return m_tracked;
}

std::vector<Trade> LiveTradesPipeline::materialize(const FilterState& filter) const {
    const auto canonical = m_canonical.snapshot();
    const auto whales = filter.whalesOnly ? m_whales.snapshot() : std::vector<Trade>{};
    const TrackedWallets tracked = trackedWallets();

    std::shared_lock lock(m_profilesMx);
    auto lookup = [this](const Trade& t) {
        return m_detector.detect(t, m_wallets.find(t.user));
    };
    return ViewMaterializer::materialize(canonical, whales, filter, tracked, lookup);
}

std::vector<AnomalySignal> LiveTradesPipeline::signalsFor(const Trade& trade) const {
    std::shared_lock lock(m_profilesMx);
    return m_detector.detect(trade, m_wallets.find(trade.user));
}

std::size_t LiveTradesPipeline::exportCsv(const FilterState& filter, std::ostream& out) const {
    const auto rows = materialize(filter);
    CsvExporter::write(out, rows);
    tLog_App("Exported" << static_cast<qulonglong>(rows.size()) << "trades to CSV");
    return rows.size();
}

AggregateStats LiveTradesPipeline::stats() const {
    std::shared_lock lock(m_snapshotMx);
    return m_statsSnapshot;
}

std::vector<TraderStats> LiveTradesPipeline::topTraders() const {
    std::shared_lock lock(m_snapshotMx);
    return m_topTradersSnapshot;
}

std::vector<MarketVolume> LiveTradesPipeline::marketVolumes() const {
    std::shared_lock lock(m_snapshotMx);
    return m_marketVolumesSnapshot;
}

std::optional<WalletProfile> LiveTradesPipeline::walletProfile(const std::string& wallet) const {
    std::shared_lock lock(m_profilesMx);
    if (const WalletProfile* p = m_wallets.find(wallet)) return *p;
    return std::nullopt;
}

HealthStatus LiveTradesPipeline::health() const {
    return m_health->evaluate();
}

FeedState LiveTradesPipeline::connectionState() const {
    return m_connection->session().state();
}

double LiveTradesPipeline::eventsPerMinute() const {
    return m_health->eventsPerMinute();
}

void LiveTradesPipeline::handleTrade(Trade trade) {
    {
        std::unique_lock lock(m_profilesMx);
        m_wallets.record(trade);
    }

    if (!trade.image) trade.image = m_enricher->cachedImage(trade);

    if (trade.isWhale()) {
        m_whales.prepend(trade);
        tLog_AppN(1, "Whale trade:" << QString::fromStdString(Cpp20Utils::formatTradeLog(trade, m_whales.size())));
        QPointer<LiveTradesPipeline> self(this);
        QMetaObject::invokeMethod(this, [self, trade] {
            if (!self) return;
            emit self->whaleAlert(trade);
        }, Qt::QueuedConnection);
    }

    m_enricher->resolve(trade);
    m_queue.enqueue(std::move(trade));
    m_queuedCount.store(m_queue.queuedCount());
}

void LiveTradesPipeline::handleStateChange(FeedState state) {
    if (state == FeedState::Open) m_health->resetThroughput();
    m_health->refresh();

    QPointer<LiveTradesPipeline> self(this);
    QMetaObject::invokeMethod(this, [self, state] {
        if (!self) return;
        emit self->connectionStateChanged(state);
    }, Qt::QueuedConnection);
}

void LiveTradesPipeline::flushTick() {
    auto batch = m_queue.flush();
    if (batch.empty()) return;

    attachCachedImages(batch);
    m_canonical.prepend(batch);
    tLog_Data(QString::fromStdString(Cpp20Utils::formatTradeLog(batch.back(), m_canonical.size())));
    emitFlushed(std::move(batch));
}

// Trades that sat in the queue may have missed the batch that resolved their market.
void LiveTradesPipeline::attachCachedImages(std::vector<Trade>& trades) const {
    for (auto& t : trades) {
        if (!t.image) t.image = m_enricher->cachedImage(t);
    }
}

void LiveTradesPipeline::emitFlushed(std::vector<Trade> batch) {
    QPointer<LiveTradesPipeline> self(this);
    QMetaObject::invokeMethod(this, [self, batch = std::move(batch)] {
        if (!self) return;
        emit self->tradesFlushed(batch);
    }, Qt::QueuedConnection);
}

void LiveTradesPipeline::statsTick() {
    const auto result = m_aggregation.tick(m_canonical.snapshot());
    if (!result.statsUpdated && !result.rankingsUpdated) return;

    {
        std::unique_lock lock(m_snapshotMx);
        if (result.statsUpdated) m_statsSnapshot = m_aggregation.stats();
        if (result.rankingsUpdated) {
            m_topTradersSnapshot = m_aggregation.topTraders();
            m_marketVolumesSnapshot = m_aggregation.marketVolumes();
        }
    }

    QPointer<LiveTradesPipeline> self(this);
    QMetaObject::invokeMethod(this, [self] {
        if (!self) return;
        emit self->statsUpdated();
    }, Qt::QueuedConnection);
}

void LiveTradesPipeline::sweepTick() {
    std::size_t evicted = 0;
    std::size_t remaining = 0;
    {
        std::unique_lock lock(m_profilesMx);
        evicted = m_wallets.evictExpired();
        remaining = m_wallets.size();
    }
    if (evicted > 0) {
        tLog_DataN(1, "Evicted" << static_cast<qulonglong>(evicted) << "wallet profiles,"
                   << static_cast<qulonglong>(remaining) << "remain");
    }
}

void LiveTradesPipeline::scheduleFlush() {
    m_flushTimer.expires_after(m_config.flushInterval);
    m_flushTimer.async_wait([this](const boost::system::error_code& ec) {
        if (ec || !m_ticking) return;
        flushTick();
        scheduleFlush();
    });
}

void LiveTradesPipeline::scheduleStats() {
    m_statsTimer.expires_after(m_config.statsInterval);
    m_statsTimer.async_wait([this](const boost::system::error_code& ec) {
        if (ec || !m_ticking) return;
        statsTick();
        scheduleStats();
    });
}

void LiveTradesPipeline::scheduleSweep() {
    m_sweepTimer.expires_after(m_config.walletSweepInterval);
    m_sweepTimer.async_wait([this](const boost::system::error_code& ec) {
        if (ec || !m_ticking) return;
        sweepTick();
        scheduleSweep();
    });
}

void LiveTradesPipeline::emitError(QString msg) {
    QPointer<LiveTradesPipeline> self(this);
    QMetaObject::invokeMethod(this, [self, m = std::move(msg)] {
        if (!self) return;
        emit self->errorOccurred(m);
    }, Qt::QueuedConnection);
}
