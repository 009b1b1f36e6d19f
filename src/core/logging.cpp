#include "core/logging.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QStandardPaths>
#include <QtGlobal>
#include <atomic>
#include <cstdio>

Q_LOGGING_CATEGORY(rallyTransportLog, "rally.transport")
Q_LOGGING_CATEGORY(rallySignalingLog, "rally.signaling")
Q_LOGGING_CATEGORY(rallyOrchestratorLog, "rally.orchestrator")
Q_LOGGING_CATEGORY(rallySyncLog, "rally.sync")
Q_LOGGING_CATEGORY(rallyOfflineLog, "rally.offline")
Q_LOGGING_CATEGORY(rallyFacadeLog, "rally.facade")
Q_LOGGING_CATEGORY(rallyRelayLog, "rally.relay")

namespace rally {
namespace {

std::atomic<bool> g_trace_override{false};

QString compute_log_file_path() {
    const auto base = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    if (base.isEmpty()) {
        return QString{};
    }
    return QDir(base).filePath(QStringLiteral("logs/rally.log"));
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
    bool opened = false;
};

LoggerState& state() {
    static LoggerState s{};
    return s;
}

void ensure_open(LoggerState& s) {
    if (s.opened) return;
    s.opened = true;

    if (s.path.isEmpty()) {
        return;
    }

    QDir dir(QFileInfo(s.path).absolutePath());
    dir.mkpath(QStringLiteral("."));

    s.file.setFileName(s.path);
    if (!s.file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        std::fprintf(stderr, "rally: cannot open log file %s\n", qPrintable(s.path));
    }
}

void message_handler(QtMsgType type,
                     const QMessageLogContext& ctx,
                     const QString& msg) {
    auto& s = state();
    QMutexLocker lock(&s.mu);
    ensure_open(s);

    const auto ts = QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs);
    const auto cat = ctx.category ? QString::fromLatin1(ctx.category) : QString{};
    const auto line = QStringLiteral("%1 %2 %3 %4\n")
                          .arg(ts, QString::fromLatin1(level_tag(type)), cat, msg);
    const auto bytes = line.toUtf8();

    if (s.file.isOpen()) {
        s.file.write(bytes);
        s.file.flush();
    }
    std::fwrite(bytes.constData(), 1, static_cast<size_t>(bytes.size()), stderr);
}

} // namespace

void install_file_logging(const QString& path) {
    {
        auto& s = state();
        QMutexLocker lock(&s.mu);
        s.path = path.isEmpty() ? compute_log_file_path() : path;
        s.opened = false;
        if (s.file.isOpen()) s.file.close();
    }
    qInstallMessageHandler(message_handler);
}

QString default_log_file_path() {
    return compute_log_file_path();
}

bool sync_trace_enabled() {
    return g_trace_override.load() || qEnvironmentVariableIsSet("RALLY_DEBUG_SYNC");
}

void set_sync_trace_enabled(bool enabled) {
    g_trace_override.store(enabled);
}

} // namespace rally
