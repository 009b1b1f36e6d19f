#pragma once

#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(rallyTransportLog)
Q_DECLARE_LOGGING_CATEGORY(rallySignalingLog)
Q_DECLARE_LOGGING_CATEGORY(rallyOrchestratorLog)
Q_DECLARE_LOGGING_CATEGORY(rallySyncLog)
Q_DECLARE_LOGGING_CATEGORY(rallyOfflineLog)
Q_DECLARE_LOGGING_CATEGORY(rallyFacadeLog)
Q_DECLARE_LOGGING_CATEGORY(rallyRelayLog)

namespace rally {

// Installs a Qt message handler that appends to `path` (or the default log
// file when empty) and echoes to stderr.
void install_file_logging(const QString& path = QString{});

// Returns the default log file path (may be empty if unavailable).
QString default_log_file_path();

// Verbose "SYNC:" protocol tracing. On when RALLY_DEBUG_SYNC is set or
// when enabled through configuration.
[[nodiscard]] bool sync_trace_enabled();
void set_sync_trace_enabled(bool enabled);

} // namespace rally
