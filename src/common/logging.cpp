#include "common/logging.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QThread>
#include <QUuid>

#include <cstdio>
#include <mutex>

namespace krishi::logging {

namespace {

constexpr qint64 kMaxLogSizeBytes = 5 * 1024 * 1024;

std::mutex g_logMutex;
bool g_traceEnabled = false;
QString g_processName = QStringLiteral("krishi");

thread_local LogContext t_context;

const char *levelName(LogLevel level)
{
    switch (level) {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    }
    return "INFO";
}

// One file per process; events logged while tracing also go to a -trace file.
QString logFilePath(const QString &process, const QString &suffix)
{
    return logsDirPath() + QDir::separator() + process + suffix;
}

void rotateIfNeeded(const QString &path)
{
    QFileInfo info(path);
    if (!info.exists() || info.size() < kMaxLogSizeBytes) {
        return;
    }

    const QString rotated = path + QStringLiteral(".1");
    QFile::remove(rotated);
    QFile::rename(path, rotated);
}

// Called with g_logMutex held.
void appendLine(const QString &path, const QByteArray &line)
{
    QDir().mkpath(logsDirPath());
    rotateIfNeeded(path);

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        std::fprintf(stderr, "%s\n", line.constData());
        return;
    }

    file.write(line);
    file.write("\n");
}

QString pickNonEmpty(const QString &value, const QString &fallback)
{
    return value.isEmpty() ? fallback : value;
}

} // namespace

QString logsDirPath()
{
    const QString home = qEnvironmentVariable("HOME");
    if (home.isEmpty()) {
        return QStringLiteral(".local/share/krishi/logs");
    }
    return home + QStringLiteral("/.local/share/krishi/logs");
}

void initLogging(const QString &processName, bool traceEnabled)
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    if (!processName.isEmpty()) {
        g_processName = processName;
    }
    g_traceEnabled = traceEnabled;
}

bool isTraceEnabled()
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    return g_traceEnabled;
}

QString processName()
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    return g_processName;
}

LogContext currentContext()
{
    return t_context;
}

QString currentCorrelationId()
{
    return t_context.correlationId;
}

QString newCorrelationId()
{
    return QUuid::createUuid().toString(QUuid::WithoutBraces);
}

CorrelationScope::CorrelationScope(const QString &corrId,
                                   const std::string &locationId,
                                   const std::string &alertId)
    : m_prev(t_context)
{
    t_context.correlationId = pickNonEmpty(corrId, m_prev.correlationId);
    t_context.locationId =
        pickNonEmpty(QString::fromStdString(locationId), m_prev.locationId);
    t_context.alertId = pickNonEmpty(QString::fromStdString(alertId), m_prev.alertId);
}

CorrelationScope::CorrelationScope(const LogContext &context)
    : m_prev(t_context)
{
    t_context = context;
}

CorrelationScope::~CorrelationScope()
{
    t_context = m_prev;
}

void logEvent(LogLevel level,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const nlohmann::json &context)
{
    const LogContext &request = t_context;
    nlohmann::json payload = {
        {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString()},
        {"level", levelName(level)},
        {"thread", QStringLiteral("0x%1")
                       .arg(reinterpret_cast<quintptr>(QThread::currentThreadId()), 0, 16)
                       .toStdString()},
        {"component", component.toStdString()},
        {"where", where.toStdString()},
        {"what", what.toStdString()},
        {"why", why.toStdString()},
        {"how", how.toStdString()},
        {"corr", request.correlationId.toStdString()},
        {"context", context}
    };
    if (!request.locationId.isEmpty()) {
        payload["location"] = request.locationId.toStdString();
    }
    if (!request.alertId.isEmpty()) {
        payload["alert"] = request.alertId.toStdString();
    }

    std::lock_guard<std::mutex> lock(g_logMutex);
    payload["process"] = g_processName.toStdString();
    const QByteArray line = QByteArray::fromStdString(payload.dump());

    if (level != LogLevel::Debug || g_traceEnabled) {
        appendLine(logFilePath(g_processName, QStringLiteral(".log")), line);
    }
    if (g_traceEnabled) {
        appendLine(logFilePath(g_processName, QStringLiteral("-trace.log")), line);
    }
}

} // namespace krishi::logging
