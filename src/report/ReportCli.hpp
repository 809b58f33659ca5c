#pragma once

#include <chrono>
#include <optional>

#include <QString>
#include <QStringList>

namespace krishi {

class WeatherAnalytics;

class ReportCli
{
public:
    // CLI dispatcher for weather reports, alert actions, and data import.
    // returns exit code
    int run(int argc, char *argv[]);

private:
    // Each subcommand queries the engine and renders output in the chosen format.
    int runCurrentReport(const QStringList &args, WeatherAnalytics &engine);
    int runHistoryReport(const QStringList &args, WeatherAnalytics &engine);
    int runForecastReport(const QStringList &args, WeatherAnalytics &engine);
    int runMetricsReport(const QStringList &args, WeatherAnalytics &engine);
    int runAlertsReport(const QStringList &args, WeatherAnalytics &engine);
    int runResolve(const QStringList &args, WeatherAnalytics &engine);
    int runNearbyReport(const QStringList &args, WeatherAnalytics &engine);
    int runStatisticsReport(const QStringList &args, WeatherAnalytics &engine);
    int runOutlookReport(const QStringList &args, WeatherAnalytics &engine);
    int runImport(const QStringList &args, WeatherAnalytics &engine);

    std::optional<std::chrono::system_clock::time_point> parseIso8601(
        const QString &value) const;
};

} // namespace krishi
