/*
Tidewatch — FeedSession
Role: Explicit lifecycle record of the order-stream connection: state, cached URL, liveness and counters.
Inputs/Outputs: Written by FeedConnection; read by HealthMonitor and, through atomics, by any thread.
Threading: State, timestamps and counters are atomics; the URL and error text are strand-only.
Integration: Owned by FeedConnection and handed by reference to HealthMonitor.
Related: FeedConnection.hpp, HealthMonitor.hpp.
*/
#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <utility>

enum class FeedState {
    Idle,
    Connecting,
    Open,
    Reconnecting,
    Closed,
    TimedOut,
    Failed
};

enum class ConnectError {
    None,
    UrlUnavailable,
    TimedOut,
    HandshakeFailed
};

inline const char* toString(FeedState s) {
    switch (s) {
        case FeedState::Idle:         return "idle";
        case FeedState::Connecting:   return "connecting";
        case FeedState::Open:         return "open";
        case FeedState::Reconnecting: return "reconnecting";
        case FeedState::Closed:       return "closed";
        case FeedState::TimedOut:     return "timed_out";
        case FeedState::Failed:       return "failed";
    }
    return "unknown";
}

inline const char* toString(ConnectError e) {
    switch (e) {
        case ConnectError::None:            return "none";
        case ConnectError::UrlUnavailable:  return "url_unavailable";
        case ConnectError::TimedOut:        return "timed_out";
        case ConnectError::HandshakeFailed: return "handshake_failed";
    }
    return "unknown";
}

class FeedSession {
public:
    using Clock = std::chrono::steady_clock;

    [[nodiscard]] FeedState state() const noexcept { return m_state.load(); }
    void setState(FeedState s) noexcept { m_state.store(s); }
    [[nodiscard]] bool isOpen() const noexcept { return state() == FeedState::Open; }

    // Subscription URL, cached for the process lifetime once fetched
    [[nodiscard]] const std::string& cachedUrl() const noexcept { return m_cachedUrl; }
    void setCachedUrl(std::string url) { m_cachedUrl = std::move(url); }
    void clearCachedUrl() { m_cachedUrl.clear(); }

    void markMessage(Clock::time_point now) noexcept { m_lastMessageTicks.store(now.time_since_epoch().count()); }
    [[nodiscard]] std::optional<Clock::time_point> lastMessageAt() const noexcept {
        const auto ticks = m_lastMessageTicks.load();
        if (ticks == kNever) return std::nullopt;
        return Clock::time_point(Clock::duration(ticks));
    }

    void markOpened(Clock::time_point now) noexcept {
        m_openedTicks.store(now.time_since_epoch().count());
        markMessage(now);
    }
    [[nodiscard]] std::optional<Clock::time_point> openedAt() const noexcept {
        const auto ticks = m_openedTicks.load();
        if (ticks == kNever) return std::nullopt;
        return Clock::time_point(Clock::duration(ticks));
    }

    void countFrame() noexcept { ++m_frames; }
    void countTrade() noexcept { ++m_trades; }
    void countDecodeFailure() noexcept { ++m_decodeFailures; }
    void countReconnect() noexcept { ++m_reconnects; }

    [[nodiscard]] uint64_t frames() const noexcept { return m_frames.load(); }
    [[nodiscard]] uint64_t trades() const noexcept { return m_trades.load(); }
    [[nodiscard]] uint64_t decodeFailures() const noexcept { return m_decodeFailures.load(); }
    [[nodiscard]] uint64_t reconnects() const noexcept { return m_reconnects.load(); }

    void setLastError(ConnectError e, std::string message) {
        m_lastConnectError = e;
        m_lastError = std::move(message);
    }
    [[nodiscard]] ConnectError lastConnectError() const noexcept { return m_lastConnectError; }
    [[nodiscard]] const std::string& lastError() const noexcept { return m_lastError; }

private:
    static constexpr Clock::rep kNever = std::numeric_limits<Clock::rep>::min();

    std::atomic<FeedState> m_state{FeedState::Idle};
    std::string            m_cachedUrl;
    std::atomic<Clock::rep> m_lastMessageTicks{kNever};
    std::atomic<Clock::rep> m_openedTicks{kNever};

    std::atomic<uint64_t> m_frames{0};
    std::atomic<uint64_t> m_trades{0};
    std::atomic<uint64_t> m_decodeFailures{0};
    std::atomic<uint64_t> m_reconnects{0};

    ConnectError m_lastConnectError = ConnectError::None;
    std::string  m_lastError;
};
