#include "core/logging.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QStandardPaths>
#include <QStringList>
#include <QtGlobal>

#include <cstdio>

Q_LOGGING_CATEGORY(lcDiscovery, "voxlink.discovery", QtInfoMsg)
Q_LOGGING_CATEGORY(lcConnection, "voxlink.connection", QtInfoMsg)
Q_LOGGING_CATEGORY(lcProtocol, "voxlink.protocol", QtInfoMsg)
Q_LOGGING_CATEGORY(lcConfig, "voxlink.config", QtInfoMsg)

namespace voxlink {
namespace {

QString compute_log_file_path() {
    const auto base = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    if (base.isEmpty()) {
        return QString{};
    }
    return QDir(base).filePath(QStringLiteral("logs/voxlink.log"));
}

const char* level_tag(QtMsgType type) {
    switch (type) {
        case QtDebugMsg: return "D";
        case QtInfoMsg: return "I";
        case QtWarningMsg: return "W";
        case QtCriticalMsg: return "C";
        case QtFatalMsg: return "F";
    }
    return "?";
}

struct LoggerState {
    QMutex mu;
    QFile file;
    QString path;
    bool initialized = false;
};

LoggerState& state() {
    static LoggerState s{};
    return s;
}

void ensure_open(LoggerState& s) {
    if (s.initialized) return;
    s.initialized = true;

    if (s.path.isEmpty()) {
        return;
    }

    QDir dir(QFileInfo(s.path).absolutePath());
    dir.mkpath(QStringLiteral("."));

    s.file.setFileName(s.path);
    if (!s.file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        std::fprintf(stderr, "voxlink: cannot open log file %s\n", qPrintable(s.path));
    }
}

void message_handler(QtMsgType type,
                     const QMessageLogContext& ctx,
                     const QString& msg) {
    auto& s = state();
    QMutexLocker lock(&s.mu);
    ensure_open(s);

    const auto ts = QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs);
    const auto cat = ctx.category ? QString::fromLatin1(ctx.category) : QStringLiteral("");

    const auto line = QStringLiteral("%1 %2 %3 %4\n")
                          .arg(ts, QString::fromLatin1(level_tag(type)), cat, msg);
    const auto bytes = line.toUtf8();

    std::fputs(bytes.constData(), stderr);

    if (s.file.isOpen()) {
        s.file.write(bytes);
        s.file.flush();
    }
}

} // namespace

void apply_debug_filter_rules(bool all) {
    QStringList rules;
    if (all || qEnvironmentVariableIsSet("VOXLINK_DEBUG_DISCOVERY")) {
        rules << QStringLiteral("voxlink.discovery.debug=true");
    }
    if (all || qEnvironmentVariableIsSet("VOXLINK_DEBUG_CONNECTION")) {
        rules << QStringLiteral("voxlink.connection.debug=true")
              << QStringLiteral("voxlink.protocol.debug=true");
    }
    if (all) {
        rules << QStringLiteral("voxlink.config.debug=true");
    }
    if (!rules.isEmpty()) {
        QLoggingCategory::setFilterRules(rules.join(QLatin1Char('\n')));
    }
}

void install_file_logging(const QString& path) {
    {
        auto& s = state();
        QMutexLocker lock(&s.mu);
        s.path = path.isEmpty() ? compute_log_file_path() : path;
    }
    qInstallMessageHandler(message_handler);
}

QString default_log_file_path() {
    return compute_log_file_path();
}

} // namespace voxlink
