/*
Tidewatch — HealthMonitor
Role: Staleness watchdog, periodic hard reconnect and throughput meter for the order stream.
Inputs/Outputs: Reads the shared FeedSession; forces closes (4000 stale, 4001 rotation) through a callback.
Threading: Timers run on the pipeline strand; evaluate() and eventsPerMinute() only read atomics
           and may be called from any thread.
Integration: Created by LiveTradesPipeline next to FeedConnection; reset on every (re)open.
Observability: Health transitions are reported through onHealthChanged and logged on tidewatch.app.
Related: HealthMonitor.cpp, FeedSession.hpp, FeedConnection.hpp.
*/
#pragma once
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include "FeedSession.hpp"

enum class HealthStatus {
    Healthy,
    Stale,     // open, but silent for longer than one watchdog tick
    Offline    // not open
};

inline const char* toString(HealthStatus h) {
    switch (h) {
        case HealthStatus::Healthy: return "healthy";
        case HealthStatus::Stale:   return "stale";
        case HealthStatus::Offline: return "offline";
    }
    return "unknown";
}

class HealthMonitor : public std::enable_shared_from_this<HealthMonitor> {
public:
    using Strand = boost::asio::strand<boost::asio::io_context::executor_type>;
    using Clock = std::chrono::steady_clock;
    using ForceCloseFn = std::function<void(int code, std::string reason)>;
    using HealthCb = std::function<void(HealthStatus)>;

    static constexpr int kCloseStale    = 4000;
    static constexpr int kCloseRotation = 4001;

    struct Options {
        std::chrono::milliseconds watchdogInterval{5000};
        std::chrono::milliseconds staleThreshold{15000};
        std::chrono::milliseconds hardReconnectInterval{5 * 60 * 1000};
    };

    HealthMonitor(Strand strand, const FeedSession& session, ForceCloseFn forceClose, Options options);

    void start();
    // Cancels every timer as a group.
    void stop();

    [[nodiscard]] HealthStatus evaluate(Clock::time_point now = Clock::now()) const;

    // One watchdog step: force-closes with 4000 when the open feed has been silent past
    // the threshold. Returns true when it did.
    bool checkStale(Clock::time_point now = Clock::now());

    // Re-evaluates health and reports a transition, if any.
    void refresh(Clock::time_point now = Clock::now());

    // Starts a new throughput window; called on every (re)open.
    void resetThroughput(Clock::time_point now = Clock::now());
    [[nodiscard]] double eventsPerMinute(Clock::time_point now = Clock::now()) const;

    void onHealthChanged(HealthCb cb) { m_onHealthChanged = std::move(cb); }
    [[nodiscard]] HealthStatus lastReported() const noexcept { return m_lastStatus; }

private:
    void scheduleWatchdog();
    void scheduleHardReconnect();

    Strand m_strand;
    const FeedSession& m_session;
    ForceCloseFn m_forceClose;
    Options m_options;

    boost::asio::steady_timer m_watchdogTimer;
    boost::asio::steady_timer m_hardReconnectTimer;
    bool m_running = false;

    std::atomic<Clock::rep> m_windowStartTicks{0};
    std::atomic<uint64_t> m_framesAtWindowStart{0};

    HealthStatus m_lastStatus = HealthStatus::Offline;
    HealthCb m_onHealthChanged;
};
