#include "ui/logging.hpp"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QMutex>
#include <QStandardPaths>

#include <cstdio>

namespace qrlink::ui {
namespace {

// Ordered by severity, which QtMsgType itself is not (QtInfoMsg sorts last).
int severity(QtMsgType type) {
    switch (type) {
        case QtDebugMsg: return 0;
        case QtInfoMsg: return 1;
        case QtWarningMsg: return 2;
        case QtCriticalMsg: return 3;
        case QtFatalMsg: return 4;
    }
    return 4;
}

QChar level_letter(QtMsgType type) {
    switch (type) {
        case QtDebugMsg: return QLatin1Char('D');
        case QtInfoMsg: return QLatin1Char('I');
        case QtWarningMsg: return QLatin1Char('W');
        case QtCriticalMsg: return QLatin1Char('C');
        case QtFatalMsg: return QLatin1Char('F');
    }
    return QLatin1Char('?');
}

struct Sink {
    QMutex mu;
    QFile file;
    QtMsgType echo_level = QtWarningMsg;
};

Sink& sink() {
    static Sink s;
    return s;
}

void handle_message(QtMsgType type, const QMessageLogContext& ctx, const QString& msg) {
    const auto line = format_log_line(QDateTime::currentDateTimeUtc(), type, ctx.category, msg);

    auto& s = sink();
    QMutexLocker lock(&s.mu);
    if (s.file.isOpen()) {
        s.file.write(line.toUtf8());
        s.file.flush();
    }
    if (!s.file.isOpen() || severity(type) >= severity(s.echo_level)) {
        std::fputs(line.toLocal8Bit().constData(), stderr);
    }
}

} // namespace

QString LogOptions::defaultLogFilePath() {
    const auto base = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    if (base.isEmpty()) {
        return QString{};
    }
    return QDir(base).filePath(QStringLiteral("logs/qrlink.log"));
}

LogOptions LogOptions::fromEnvironment() {
    LogOptions options;

    if (qEnvironmentVariableIsSet("QRLINK_LOG_FILE")) {
        const auto path = qEnvironmentVariable("QRLINK_LOG_FILE");
        options.file_path = path == QStringLiteral("-") ? QString{} : path;
    }

    if (qEnvironmentVariableIsSet("QRLINK_LOG_ECHO")) {
        QtMsgType level = QtWarningMsg;
        if (parse_log_level(qEnvironmentVariable("QRLINK_LOG_ECHO"), &level)) {
            options.echo_level = level;
        } else {
            qWarning() << "Ignoring invalid QRLINK_LOG_ECHO =" << qgetenv("QRLINK_LOG_ECHO");
        }
    }

    options.signaling_debug = qEnvironmentVariableIsSet("QRLINK_DEBUG_SIGNALING");
    return options;
}

bool parse_log_level(const QString& name, QtMsgType* out) {
    const auto key = name.trimmed().toLower();
    if (key == QStringLiteral("debug")) {
        *out = QtDebugMsg;
    } else if (key == QStringLiteral("info")) {
        *out = QtInfoMsg;
    } else if (key == QStringLiteral("warning")) {
        *out = QtWarningMsg;
    } else if (key == QStringLiteral("critical")) {
        *out = QtCriticalMsg;
    } else {
        return false;
    }
    return true;
}

QString format_log_line(const QDateTime& when,
                        QtMsgType type,
                        const char* category,
                        const QString& message) {
    auto area = category ? QString::fromLatin1(category) : QString{};
    if (area == QStringLiteral("default")) {
        area = QStringLiteral("app");
    } else if (area.startsWith(QStringLiteral("qrlink."))) {
        area = area.mid(7);
    }

    return QStringLiteral("%1 %2 %3 %4\n")
        .arg(when.toUTC().toString(Qt::ISODateWithMs))
        .arg(level_letter(type))
        .arg(area, -10)
        .arg(message);
}

QString install_logging(const LogOptions& options) {
    if (options.signaling_debug) {
        enable_signaling_debug();
    }

    auto& s = sink();
    {
        QMutexLocker lock(&s.mu);
        s.echo_level = options.echo_level;
        if (s.file.isOpen()) {
            s.file.close();
        }
        if (!options.file_path.isEmpty()) {
            QDir().mkpath(QFileInfo(options.file_path).absolutePath());
            s.file.setFileName(options.file_path);
            if (!s.file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
                std::fprintf(stderr, "qrlink: cannot open log file %s: %s\n",
                             qPrintable(options.file_path), qPrintable(s.file.errorString()));
            }
        }
    }

    qInstallMessageHandler(handle_message);
    return s.file.isOpen() ? s.file.fileName() : QString{};
}

void uninstall_logging() {
    qInstallMessageHandler(nullptr);
    auto& s = sink();
    QMutexLocker lock(&s.mu);
    if (s.file.isOpen()) {
        s.file.close();
    }
}

void enable_signaling_debug() {
    QLoggingCategory::setFilterRules(QStringLiteral("qrlink.*.debug=true\n"));
}

} // namespace qrlink::ui
