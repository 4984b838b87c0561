#pragma once

#include <QDateTime>
#include <QString>
#include <QtGlobal>

namespace qrlink::ui {

/**
 * LogOptions - Where log lines go and what reaches the terminal.
 *
 * Environment overrides (applied by fromEnvironment()):
 *   QRLINK_LOG_FILE         log file path, "-" disables the file
 *   QRLINK_LOG_ECHO         lowest level echoed to stderr: debug|info|warning|critical
 *   QRLINK_DEBUG_SIGNALING  any value turns on qrlink.* debug output
 */
struct LogOptions {
    QString file_path = defaultLogFilePath();
    QtMsgType echo_level = QtWarningMsg;
    bool signaling_debug = false;

    // <AppLocalDataLocation>/logs/qrlink.log, empty if there is no such location.
    [[nodiscard]] static QString defaultLogFilePath();

    [[nodiscard]] static LogOptions fromEnvironment();
};

// Parses a QRLINK_LOG_ECHO level name. Case insensitive.
[[nodiscard]] bool parse_log_level(const QString& name, QtMsgType* out);

// "2024-01-01T00:00:00.000Z W signaling  state Connecting -> Failed"
// The "qrlink." prefix is dropped from the category so handshake lines stay narrow.
[[nodiscard]] QString format_log_line(const QDateTime& when,
                                      QtMsgType type,
                                      const char* category,
                                      const QString& message);

// Installs the qrlink message handler. Returns the file actually written to,
// or an empty string when logging goes to stderr only.
QString install_logging(const LogOptions& options);

// Restores Qt's default handler and closes the log file.
void uninstall_logging();

// Turns on debug output for the qrlink.* logging categories.
void enable_signaling_debug();

} // namespace qrlink::ui
