#include "HealthMonitor.hpp"
#include "Cpp20Utils.hpp"
#include "TidewatchLogging.hpp"
#include <algorithm>

HealthMonitor::HealthMonitor(Strand strand, const FeedSession& session, ForceCloseFn forceClose, Options options)
    : m_strand(std::move(strand))
    , m_session(session)
    , m_forceClose(std::move(forceClose))
    , m_options(options)
    , m_watchdogTimer(m_strand)
    , m_hardReconnectTimer(m_strand)
{}

void HealthMonitor::start() {
    if (m_running) return;
    m_running = true;
    resetThroughput();
    scheduleWatchdog();
    scheduleHardReconnect();
    tLog_App("Health monitor started");
}

void HealthMonitor::stop() {
    if (!m_running) return;
    m_running = false;
    m_watchdogTimer.cancel();
    m_hardReconnectTimer.cancel();
    tLog_App("Health monitor stopped");
}

HealthStatus HealthMonitor::evaluate(Clock::time_point now) const {
    if (!m_session.isOpen()) return HealthStatus::Offline;
    const auto last = m_session.lastMessageAt();
    if (!last) return HealthStatus::Healthy;
    if (now - *last > m_options.watchdogInterval) return HealthStatus::Stale;
    return HealthStatus::Healthy;
}

bool HealthMonitor::checkStale(Clock::time_point now) {
    if (!m_session.isOpen()) return false;
    const auto last = m_session.lastMessageAt();
    if (!last || now - *last <= m_options.staleThreshold) return false;

    const auto silentMs = std::chrono::duration_cast<std::chrono::milliseconds>(now - *last).count();
    tLog_Warning("Feed stale for" << static_cast<qlonglong>(silentMs) << "ms, forcing reconnect");
    if (m_forceClose) m_forceClose(kCloseStale, "stale feed");
    return true;
}

void HealthMonitor::refresh(Clock::time_point now) {
    const HealthStatus status = evaluate(now);
    if (status == m_lastStatus) return;
    m_lastStatus = status;
    tLog_App("Feed health ->" << toString(status));
    if (m_onHealthChanged) m_onHealthChanged(status);
}

void HealthMonitor::resetThroughput(Clock::time_point now) {
    m_windowStartTicks.store(now.time_since_epoch().count());
    m_framesAtWindowStart.store(m_session.frames());
}

double HealthMonitor::eventsPerMinute(Clock::time_point now) const {
    const uint64_t total = m_session.frames();
    const uint64_t base = m_framesAtWindowStart.load();
    const uint64_t events = total >= base ? total - base : 0;
    const Clock::time_point windowStart{Clock::duration(m_windowStartTicks.load())};
    const double seconds = std::chrono::duration<double>(now - windowStart).count();
    // Under one second the rate is extrapolated from a one-second window.
    return static_cast<double>(events) * 60.0 / std::max(seconds, 1.0);
}

void HealthMonitor::scheduleWatchdog() {
    m_watchdogTimer.expires_after(m_options.watchdogInterval);
    m_watchdogTimer.async_wait([weak = weak_from_this()](const boost::system::error_code& ec) {
        if (ec) return;
        auto self = weak.lock();
        if (!self || !self->m_running) return;
        const auto now = Clock::now();
        self->checkStale(now);
        self->refresh(now);
        if (self->m_session.isOpen()) {
            tLog_Data(QString::fromStdString(Cpp20Utils::formatThroughput("feed", self->eventsPerMinute(now))));
        }
        self->scheduleWatchdog();
    });
}

void HealthMonitor::scheduleHardReconnect() {
    m_hardReconnectTimer.expires_after(m_options.hardReconnectInterval);
    m_hardReconnectTimer.async_wait([weak = weak_from_this()](const boost::system::error_code& ec) {
        if (ec) return;
        auto self = weak.lock();
        if (!self || !self->m_running) return;
        if (self->m_session.isOpen() && self->m_forceClose) {
            tLog_App("Rotating feed connection");
            self->m_forceClose(kCloseRotation, "scheduled rotation");
        }
        self->scheduleHardReconnect();
    });
}
