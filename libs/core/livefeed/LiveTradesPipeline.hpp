#pragma once
/*
Tidewatch — LiveTradesPipeline
Role: Facade that owns the I/O thread, the pipeline strand and every live-trades component.
Inputs/Outputs: Decoded trades from FeedConnection in; snapshots, views, CSV and Qt signals out.
Threading: One io_context on a worker thread; all mutation runs on one strand. Public getters
           read published snapshots and may be called from any thread.
Performance: Per-trade work is O(1) amortized; list-sized work happens on the 50 ms flush tick.
Integration: Instantiated by the stream CLI (or a GUI) with a PipelineConfig.
Observability: Lifecycle on tidewatch.app, flushes and sweeps on tidewatch.data; errors via errorOccurred.
Related: LiveTradesPipeline.cpp, FeedConnection.hpp, HealthMonitor.hpp, analytics/*, cache/TradeLog.hpp.
Assumptions: The config has been validated (PipelineConfig::loadFromFile); injected collaborators are shared, not owned.
*/
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <QMetaType>
#include <QObject>
#include <QString>
#include <atomic>
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <shared_mutex>
#include <string>
#include <thread>
#include <vector>
#include "FeedConnection.hpp"
#include "HealthMonitor.hpp"
#include "IngestQueue.hpp"
#include "MetadataEnricher.hpp"
#include "analytics/AggregationEngine.hpp"
#include "analytics/SignalDetector.hpp"
#include "analytics/TrackedWallets.hpp"
#include "analytics/WalletActivityTracker.hpp"
#include "cache/TradeLog.hpp"
#include "config/PipelineConfig.hpp"
#include "model/PipelineTypes.h"
#include "model/TradeData.h"
#include "provider/IMetadataSource.hpp"
#include "provider/IUrlProvider.hpp"
#include "ws/WsTransport.hpp"

class LiveTradesPipeline : public QObject {
    Q_OBJECT

public:
    using Strand = boost::asio::strand<boost::asio::io_context::executor_type>;

    // Overrides for the network edges; anything left empty is built from the config.
    struct Collaborators {
        std::shared_ptr<IUrlProvider>    urlProvider;
        std::shared_ptr<IMetadataSource> metadataSource;
        WsTransportFactory               transportFactory;
    };

    explicit LiveTradesPipeline(PipelineConfig config, QObject* parent = nullptr);
    LiveTradesPipeline(PipelineConfig config, Collaborators collaborators, QObject* parent = nullptr);
    ~LiveTradesPipeline() override;

    void start();
    // Cancels every periodic task as a group, closes the feed with 1000 and joins the I/O thread.
    void stop();
    [[nodiscard]] bool isRunning() const noexcept { return m_running.load(); }

    void reconnectNow();

    void pause();
    void resume();
    [[nodiscard]] bool isPaused() const noexcept { return m_paused.load(); }
    [[nodiscard]] std::size_t queuedCount() const noexcept { return m_queuedCount.load(); }

    void trackWallet(const std::string& wallet, const std::string& nickname = {});
    bool untrackWallet(const std::string& wallet);
    [[nodiscard]] TrackedWallets trackedWallets() const;

    [[nodiscard]] std::vector<Trade> materialize(const FilterState& filter) const;
    [[nodiscard]] std::vector<AnomalySignal> signalsFor(const Trade& trade) const;
    // Writes the materialized view for the filter as CSV; returns the number of rows.
    std::size_t exportCsv(const FilterState& filter, std::ostream& out) const;

    [[nodiscard]] std::vector<Trade> recentTrades() const { return m_canonical.snapshot(); }
    [[nodiscard]] std::vector<Trade> whaleTrades() const { return m_whales.snapshot(); }
    [[nodiscard]] AggregateStats stats() const;
    [[nodiscard]] std::vector<TraderStats> topTraders() const;
    [[nodiscard]] std::vector<MarketVolume> marketVolumes() const;
    [[nodiscard]] std::map<std::string, std::string> availableMarkets() const { return m_canonical.availableMarkets(); }
    [[nodiscard]] std::optional<WalletProfile> walletProfile(const std::string& wallet) const;

    [[nodiscard]] HealthStatus health() const;
    [[nodiscard]] FeedState connectionState() const;
    [[nodiscard]] double eventsPerMinute() const;
    [[nodiscard]] const FeedSession& session() const noexcept { return m_connection->session(); }

    [[nodiscard]] const PipelineConfig& config() const noexcept { return m_config; }

    // Non-copyable, non-movable (manages thread)
    LiveTradesPipeline(const LiveTradesPipeline&) = delete;
    LiveTradesPipeline& operator=(const LiveTradesPipeline&) = delete;
    LiveTradesPipeline(LiveTradesPipeline&&) = delete;
    LiveTradesPipeline& operator=(LiveTradesPipeline&&) = delete;

signals:
    // The trades just merged into the canonical log, in the order they were merged.
    void tradesFlushed(const std::vector<Trade>& batch);
    void whaleAlert(const Trade& trade);
    void connectionStateChanged(FeedState state);
    void healthChanged(HealthStatus status);
    void statsUpdated();
    void errorOccurred(const QString& error);

private:
    void run();
    void wireComponents();

    // Strand-only
    void handleTrade(Trade trade);
    void handleStateChange(FeedState state);
    void flushTick();
    void statsTick();
    void sweepTick();
    void scheduleFlush();
    void scheduleStats();
    void scheduleSweep();
    void stopOnStrand();
    void attachCachedImages(std::vector<Trade>& trades) const;
    void emitFlushed(std::vector<Trade> batch);

    void emitError(QString msg);

    PipelineConfig                  m_config;

    boost::asio::io_context         m_ioc;
    boost::asio::ssl::context       m_sslCtx{boost::asio::ssl::context::tlsv12_client};
    Strand                          m_strand{m_ioc.get_executor()};
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> m_workGuard;
    std::thread                     m_ioThread;
    std::atomic<bool>               m_running{false};

    boost::asio::steady_timer       m_flushTimer{m_strand};
    boost::asio::steady_timer       m_statsTimer{m_strand};
    boost::asio::steady_timer       m_sweepTimer{m_strand};
    bool                            m_ticking = false;

    std::shared_ptr<FeedConnection>   m_connection;
    std::shared_ptr<HealthMonitor>    m_health;
    std::shared_ptr<MetadataEnricher> m_enricher;

    IngestQueue                     m_queue;
    TradeLog                        m_canonical;
    TradeLog                        m_whales;
    SignalDetector                  m_detector;
    AggregationEngine               m_aggregation;

    // Profiles are written on the strand and read under a shared lock elsewhere.
    mutable std::shared_mutex       m_profilesMx;
    WalletActivityTracker           m_wallets;

    mutable std::shared_mutex       m_trackedMx;
    TrackedWallets                  m_tracked;

    mutable std::shared_mutex       m_snapshotMx;
    AggregateStats                  m_statsSnapshot;
    std::vector<TraderStats>        m_topTradersSnapshot;
    std::vector<MarketVolume>       m_marketVolumesSnapshot;

    std::atomic<bool>               m_paused{false};
    std::atomic<std::size_t>        m_queuedCount{0};
};

Q_DECLARE_METATYPE(Trade)
Q_DECLARE_METATYPE(std::vector<Trade>)
Q_DECLARE_METATYPE(FeedState)
Q_DECLARE_METATYPE(HealthStatus)
