#pragma once

#include <optional>

#include <QString>

#include <nlohmann/json.hpp>

namespace timeledger::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Call once from main() before the first event. Reads TIMELEDGER_LOG_LEVEL
// (debug|info|warn|error) and TIMELEDGER_LOG_DIR from the environment.
// Tracing forces the threshold down to Debug and mirrors every event into
// <process>-trace.log.
void initLogging(const QString &processName, bool traceEnabled);

bool isTraceEnabled();
LogLevel minimumLevel();

std::optional<LogLevel> parseLogLevel(const QString &value);
QString logLevelName(LogLevel level);

// Thread-local correlation id; one per CLI invocation.
void setCorrelationId(const QString &corrId);
QString currentCorrelationId();

class CorrelationScope {
public:
    explicit CorrelationScope(const QString &corrId);
    ~CorrelationScope();

    CorrelationScope(const CorrelationScope &) = delete;
    CorrelationScope &operator=(const CorrelationScope &) = delete;

private:
    QString m_prev;
};

// One JSON object per line. All fields are required; pass empty strings
// where unknown. An empty correlationId picks up the current scope.
void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context = nlohmann::json::object());

// $TIMELEDGER_LOG_DIR, else $HOME/.local/share/timeledger/logs.
QString logsDirPath();
QString defaultProcessName();
QString defaultWho();

} // namespace timeledger::logging

#define TLOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    ::timeledger::logging::logEvent(::timeledger::logging::LogLevel::Debug, \
                                    ::timeledger::logging::defaultProcessName(), \
                                    (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define TLOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    ::timeledger::logging::logEvent(::timeledger::logging::LogLevel::Info, \
                                    ::timeledger::logging::defaultProcessName(), \
                                    (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define TLOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    ::timeledger::logging::logEvent(::timeledger::logging::LogLevel::Warn, \
                                    ::timeledger::logging::defaultProcessName(), \
                                    (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define TLOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    ::timeledger::logging::logEvent(::timeledger::logging::LogLevel::Error, \
                                    ::timeledger::logging::defaultProcessName(), \
                                    (component), (where), (what), (why), (how), (who), (corr), (ctxJson))
