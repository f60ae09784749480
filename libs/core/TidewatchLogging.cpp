#include "TidewatchLogging.hpp"

// =============================================================================
// TIDEWATCH LOGGING CATEGORY DEFINITIONS
// =============================================================================

Q_LOGGING_CATEGORY(logApp, "tidewatch.app")         // Application: init, lifecycle, config
Q_LOGGING_CATEGORY(logData, "tidewatch.data")       // Data: feed socket, frames, batches, metadata
Q_LOGGING_CATEGORY(logDebug, "tidewatch.debug", QtWarningMsg) // Debug: off unless enabled by rules
