#pragma once

#include <QElapsedTimer>
#include <QString>

#include <string>

#include <nlohmann/json.hpp>

namespace clausedrift::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Initialize logging for the current process. Call early in main().
void initLogging(const QString &processName, bool traceEnabled);

bool isTraceEnabled();

// Thread-local correlation support for linking the log events of one comparison run.
void setCorrelationId(const QString &corrId);
QString currentCorrelationId();

class CorrelationScope {
public:
    explicit CorrelationScope(const QString &corrId);
    ~CorrelationScope();

private:
    QString m_prev;
};

// One version-pair comparison in the log. Sets the correlation id to
// "<old>..<new>" and logs comparison_start; complete() logs
// comparison_complete with the elapsed time. A scope destroyed before
// complete() logs comparison_aborted instead.
class ComparisonLogScope {
public:
    ComparisonLogScope(const std::string &oldVersionId,
                       const std::string &newVersionId,
                       const nlohmann::json &startContext = nlohmann::json::object());
    ~ComparisonLogScope();

    ComparisonLogScope(const ComparisonLogScope &) = delete;
    ComparisonLogScope &operator=(const ComparisonLogScope &) = delete;

    void complete(nlohmann::json summary);
    const QString &correlationId() const { return m_corrId; }

private:
    QString m_corrId;
    CorrelationScope m_correlation;
    QElapsedTimer m_timer;
    bool m_completed = false;
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

QString logsDirPath();
QString defaultProcessName();
QString defaultWho();

} // namespace clausedrift::logging

#define CDLOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    ::clausedrift::logging::logEvent(::clausedrift::logging::LogLevel::Debug, \
                                     ::clausedrift::logging::defaultProcessName(), \
                                     (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define CDLOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    ::clausedrift::logging::logEvent(::clausedrift::logging::LogLevel::Info, \
                                     ::clausedrift::logging::defaultProcessName(), \
                                     (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define CDLOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    ::clausedrift::logging::logEvent(::clausedrift::logging::LogLevel::Warn, \
                                     ::clausedrift::logging::defaultProcessName(), \
                                     (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define CDLOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    ::clausedrift::logging::logEvent(::clausedrift::logging::LogLevel::Error, \
                                     ::clausedrift::logging::defaultProcessName(), \
                                     (component), (where), (what), (why), (how), (who), (corr), (ctxJson))
