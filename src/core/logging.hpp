#pragma once

#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(lcDiscovery)
Q_DECLARE_LOGGING_CATEGORY(lcConnection)
Q_DECLARE_LOGGING_CATEGORY(lcProtocol)
Q_DECLARE_LOGGING_CATEGORY(lcConfig)

namespace voxlink {

// Turns on debug output for the categories selected by VOXLINK_DEBUG_DISCOVERY
// and VOXLINK_DEBUG_CONNECTION, or for all of them when `all` is set.
void apply_debug_filter_rules(bool all = false);

// Installs a Qt message handler that stamps time/level/category, writes to
// stderr and appends to the log file (if one could be opened).
void install_file_logging(const QString& path = QString());

// Returns the default log file path (may be empty if unavailable).
QString default_log_file_path();

} // namespace voxlink
