#pragma once

#include <QString>

#include <nlohmann/json.hpp>

#include <string>
#include <utility>

namespace krishi::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Initialize logging for the current process. Call early in main().
void initLogging(const QString &processName, bool traceEnabled);

bool isTraceEnabled();

// What the current thread is working on. Every event logged on the thread
// carries these fields.
struct LogContext {
    QString correlationId;
    QString locationId;
    QString alertId;
};

LogContext currentContext();
QString currentCorrelationId();
QString newCorrelationId();

// Narrows the thread's log context until the scope ends. Empty arguments
// keep the value of the enclosing scope.
class CorrelationScope {
public:
    explicit CorrelationScope(const QString &corrId,
                              const std::string &locationId = std::string(),
                              const std::string &alertId = std::string());
    // Installs a context captured on another thread as is.
    explicit CorrelationScope(const LogContext &context);
    ~CorrelationScope();

    CorrelationScope(const CorrelationScope &) = delete;
    CorrelationScope &operator=(const CorrelationScope &) = delete;

private:
    LogContext m_prev;
};

// Wraps fn so that it runs under the log context of the thread that wrapped
// it. Used for work handed to a thread pool.
template <typename Fn>
auto withCurrentContext(Fn fn)
{
    return [context = currentContext(), fn = std::move(fn)]() {
        CorrelationScope scope(context);
        return fn();
    };
}

// Structured log event. Use empty strings where a field is unknown.
void logEvent(LogLevel level,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const nlohmann::json &context = nlohmann::json::object());

QString processName();
QString logsDirPath();

} // namespace krishi::logging

#define KRLOG_DEBUG(component, where, what, why, how, ctxJson) \
    ::krishi::logging::logEvent(::krishi::logging::LogLevel::Debug, \
                                (component), (where), (what), (why), (how), (ctxJson))

#define KRLOG_INFO(component, where, what, why, how, ctxJson) \
    ::krishi::logging::logEvent(::krishi::logging::LogLevel::Info, \
                                (component), (where), (what), (why), (how), (ctxJson))

#define KRLOG_WARN(component, where, what, why, how, ctxJson) \
    ::krishi::logging::logEvent(::krishi::logging::LogLevel::Warn, \
                                (component), (where), (what), (why), (how), (ctxJson))

#define KRLOG_ERROR(component, where, what, why, how, ctxJson) \
    ::krishi::logging::logEvent(::krishi::logging::LogLevel::Error, \
                                (component), (where), (what), (why), (how), (ctxJson))
