#include "common/logging.hpp"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QThread>

#include <unistd.h>

#include <cstdio>
#include <mutex>

namespace timeledger::logging {

namespace {

constexpr qint64 kMaxLogSizeBytes = 5 * 1024 * 1024;
constexpr int kKeptGenerations = 3;

struct LoggerState {
    QString processName;
    bool traceEnabled = false;
    LogLevel threshold = LogLevel::Info;
};

std::mutex g_logMutex;
LoggerState g_state;

thread_local QString t_corrId;

int severity(LogLevel level)
{
    return static_cast<int>(level);
}

// <file>.1 is the newest rotated generation, <file>.N the oldest kept.
void rotate(const QString &path)
{
    const QFileInfo info(path);
    if (!info.exists() || info.size() < kMaxLogSizeBytes) {
        return;
    }

    QFile::remove(QStringLiteral("%1.%2").arg(path).arg(kKeptGenerations));
    for (int generation = kKeptGenerations - 1; generation >= 1; --generation) {
        QFile::rename(QStringLiteral("%1.%2").arg(path).arg(generation),
                      QStringLiteral("%1.%2").arg(path).arg(generation + 1));
    }
    QFile::rename(path, path + QStringLiteral(".1"));
}

void appendLine(const QString &path, const QByteArray &line)
{
    rotate(path);

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append)) {
        // Never lose an error just because the log directory is unwritable.
        std::fprintf(stderr, "%s\n", line.constData());
        return;
    }
    file.write(line + '\n');
}

QString threadTag()
{
    return QStringLiteral("0x%1")
        .arg(reinterpret_cast<quintptr>(QThread::currentThreadId()), 0, 16);
}

} // namespace

void initLogging(const QString &processName, bool traceEnabled)
{
    LogLevel threshold = LogLevel::Info;
    const QString requested = qEnvironmentVariable("TIMELEDGER_LOG_LEVEL");
    if (!requested.isEmpty()) {
        const auto parsed = parseLogLevel(requested);
        if (parsed.has_value()) {
            threshold = *parsed;
        } else {
            std::fprintf(stderr, "Ignoring unknown TIMELEDGER_LOG_LEVEL '%s'\n",
                         requested.toLocal8Bit().constData());
        }
    }
    if (traceEnabled) {
        threshold = LogLevel::Debug;
    }

    std::lock_guard<std::mutex> lock(g_logMutex);
    g_state.processName = processName;
    g_state.traceEnabled = traceEnabled;
    g_state.threshold = threshold;
}

bool isTraceEnabled()
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    return g_state.traceEnabled;
}

LogLevel minimumLevel()
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    return g_state.threshold;
}

std::optional<LogLevel> parseLogLevel(const QString &value)
{
    const QString name = value.trimmed().toLower();
    if (name == QStringLiteral("debug")) {
        return LogLevel::Debug;
    }
    if (name == QStringLiteral("info")) {
        return LogLevel::Info;
    }
    if (name == QStringLiteral("warn") || name == QStringLiteral("warning")) {
        return LogLevel::Warn;
    }
    if (name == QStringLiteral("error")) {
        return LogLevel::Error;
    }
    return std::nullopt;
}

QString logLevelName(LogLevel level)
{
    switch (level) {
    case LogLevel::Debug:
        return QStringLiteral("DEBUG");
    case LogLevel::Info:
        return QStringLiteral("INFO");
    case LogLevel::Warn:
        return QStringLiteral("WARN");
    case LogLevel::Error:
        return QStringLiteral("ERROR");
    }
    return QStringLiteral("INFO");
}

void setCorrelationId(const QString &corrId)
{
    t_corrId = corrId;
}

QString currentCorrelationId()
{
    return t_corrId;
}

CorrelationScope::CorrelationScope(const QString &corrId)
    : m_prev(t_corrId)
{
    t_corrId = corrId;
}

CorrelationScope::~CorrelationScope()
{
    t_corrId = m_prev;
}

QString logsDirPath()
{
    const QString overridden = qEnvironmentVariable("TIMELEDGER_LOG_DIR");
    if (!overridden.isEmpty()) {
        return overridden;
    }
    const QString home = qEnvironmentVariable("HOME");
    return (home.isEmpty() ? QStringLiteral(".") : home)
        + QStringLiteral("/.local/share/timeledger/logs");
}

QString defaultProcessName()
{
    {
        std::lock_guard<std::mutex> lock(g_logMutex);
        if (!g_state.processName.isEmpty()) {
            return g_state.processName;
        }
    }
    if (QCoreApplication::instance() && !QCoreApplication::applicationName().isEmpty()) {
        return QCoreApplication::applicationName();
    }
    return QStringLiteral("timeledger");
}

QString defaultWho()
{
    char hostname[256] = {};
    if (gethostname(hostname, sizeof(hostname)) != 0) {
        hostname[0] = '\0';
    }
    return QStringLiteral("host:%1,uid:%2")
        .arg(QString::fromUtf8(hostname))
        .arg(static_cast<int>(getuid()));
}

void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context)
{
    const QString process = processName.isEmpty() ? defaultProcessName() : processName;

    std::lock_guard<std::mutex> lock(g_logMutex);
    const bool toMain = severity(level) >= severity(g_state.threshold);
    if (!toMain && !g_state.traceEnabled) {
        return;
    }

    const nlohmann::json payload = {
        {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString()},
        {"level", logLevelName(level).toStdString()},
        {"process", process.toStdString()},
        {"thread", threadTag().toStdString()},
        {"component", component.toStdString()},
        {"where", where.toStdString()},
        {"what", what.toStdString()},
        {"why", why.toStdString()},
        {"how", how.toStdString()},
        {"who", who.toStdString()},
        {"corr", (correlationId.isEmpty() ? t_corrId : correlationId).toStdString()},
        {"context", context}
    };
    // Context may carry raw bytes from a damaged data file; a log call must
    // never throw, so invalid UTF-8 is replaced instead of rejected.
    const QByteArray line = QByteArray::fromStdString(
        payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));

    const QString dir = logsDirPath();
    QDir().mkpath(dir);
    if (toMain) {
        appendLine(dir + QLatin1Char('/') + process + QStringLiteral(".log"), line);
    }
    if (g_state.traceEnabled) {
        appendLine(dir + QLatin1Char('/') + process + QStringLiteral("-trace.log"), line);
    }
}

} // namespace timeledger::logging
