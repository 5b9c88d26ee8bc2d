#pragma once

#include <QString>

namespace daybook::app {

// Installs a Qt message handler that appends every message to the log file
// as "<ISO ts> <level> <category> <message>". Messages are still passed on
// to the previously installed handler.
void install_file_logging();

// Same, writing to `path` instead of the default location.
void install_file_logging(const QString& path);

// Restores the handler that was active before install_file_logging().
void uninstall_file_logging();

// <AppLocalDataLocation>/logs/daybook.log (may be empty if unavailable).
QString default_log_file_path();

} // namespace daybook::app
