#pragma once

#include <QLoggingCategory>
#include <QDebug>
#include <atomic>
#include <cstdint>
#include <cstdlib>

// =============================================================================
// TIDEWATCH LOGGING CATEGORIES
// =============================================================================
// Three categories, each with per-call-site atomic throttling for hot paths.

Q_DECLARE_LOGGING_CATEGORY(logApp)      // Application: init, lifecycle, config
Q_DECLARE_LOGGING_CATEGORY(logData)     // Data: feed socket, frames, batches, metadata lookups
Q_DECLARE_LOGGING_CATEGORY(logDebug)    // Debug: detailed diagnostics (disabled by default)

namespace tidewatch::log_throttle {
    // Compile-time defaults (overridden by env vars)
    inline constexpr int kApp   = 1;    // Log every app event (low frequency)
    inline constexpr int kData  = 20;   // Log every 20th data operation
    inline constexpr int kDebug = 10;   // Log every 10th debug message
}

// Atomic throttling macro with runtime env var override
#define TLOG_THROTTLED(cat, defaultInterval, ...)                                   \
    do {                                                                             \
        static std::atomic<uint32_t> _counter{0};                                    \
        static int _interval = []() {                                                \
            const char* env = std::getenv("TIDEWATCH_LOG_" #cat "_INTERVAL");       \
            const int parsed = env ? std::atoi(env) : (defaultInterval);             \
            return parsed > 0 ? parsed : 1;                                          \
        }();                                                                         \
        if ((_counter++ % static_cast<uint32_t>(_interval)) == 0) {                  \
            qCDebug(log##cat) << __VA_ARGS__;                                        \
        }                                                                            \
    } while(false)

// Primary logging macros (automatically throttled for hot paths)
#define tLog_App(...)     TLOG_THROTTLED(App, tidewatch::log_throttle::kApp, __VA_ARGS__)
#define tLog_Data(...)    TLOG_THROTTLED(Data, tidewatch::log_throttle::kData, __VA_ARGS__)
#define tLog_Debug(...)   TLOG_THROTTLED(Debug, tidewatch::log_throttle::kDebug, __VA_ARGS__)

// Override macros for specific throttle intervals
#define tLog_AppN(n, ...)    TLOG_THROTTLED(App, n, __VA_ARGS__)
#define tLog_DataN(n, ...)   TLOG_THROTTLED(Data, n, __VA_ARGS__)
#define tLog_DebugN(n, ...)  TLOG_THROTTLED(Debug, n, __VA_ARGS__)

// Always-on macros (no throttling for critical messages)
#define tLog_Warning(...)  qCWarning(logApp) << __VA_ARGS__
#define tLog_Error(...)    qCCritical(logApp) << __VA_ARGS__

/*
USAGE:
tLog_App("Pipeline started");                              // lifecycle, every call
tLog_Data("Flushed batch:" << count << "trades");          // every 20th call
tLog_DataN(1, "Subscription confirmed:" << id);            // every call
tLog_Warning("Feed stale for" << seconds << "s");          // never throttled

RUNTIME CONTROL:
export TIDEWATCH_LOG_Data_INTERVAL=1       # See every data operation
export QT_LOGGING_RULES="tidewatch.debug=true"
*/
