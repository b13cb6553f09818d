#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace killwatch::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Initialize logging for the current process. Call early in main().
// With trace enabled, debug events are written and mirrored to a -trace.log file.
void initLogging(const QString &processName, bool traceEnabled);

bool isTraceEnabled();

// Thread-local correlation support for linking the log events of one request.
void setCorrelationId(const QString &corrId);
QString currentCorrelationId();

class CorrelationScope {
public:
    explicit CorrelationScope(const QString &corrId);
    ~CorrelationScope();

private:
    QString m_prev;
};

// Structured log event. All fields are required; use empty strings where unknown.
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

QString defaultProcessName();
QString defaultWho();
QString logsDirPath();

} // namespace killwatch::logging

#define KWLOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    ::killwatch::logging::logEvent(::killwatch::logging::LogLevel::Debug, \
                                   ::killwatch::logging::defaultProcessName(), \
                                   (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define KWLOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    ::killwatch::logging::logEvent(::killwatch::logging::LogLevel::Info, \
                                   ::killwatch::logging::defaultProcessName(), \
                                   (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define KWLOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    ::killwatch::logging::logEvent(::killwatch::logging::LogLevel::Warn, \
                                   ::killwatch::logging::defaultProcessName(), \
                                   (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define KWLOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    ::killwatch::logging::logEvent(::killwatch::logging::LogLevel::Error, \
                                   ::killwatch::logging::defaultProcessName(), \
                                   (component), (where), (what), (why), (how), (who), (corr), (ctxJson))
