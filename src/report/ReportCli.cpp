#include "report/ReportCli.hpp"

#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>

#include <QFile>

#include "common/config.hpp"
#include "common/krishi_version.hpp"
#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/models.hpp"
#include "engine/advisory_text.hpp"
#include "engine/crop_profiles.hpp"
#include "engine/metrics_engine.hpp"
#include "engine/weather_analytics.hpp"
#include "store/krishi_store.hpp"

namespace krishi {

namespace {

constexpr int kExitUsage = 1;

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  krishi-report current --location ID [--format markdown|json]\n"
        "  krishi-report history --location ID --from ISO --to ISO [--format markdown|json]\n"
        "  krishi-report forecast --location ID [--days N] [--format markdown|json]\n"
        "  krishi-report metrics --location ID [--crop ID] [--gdd-days N] [--format markdown|json]\n"
        "  krishi-report alerts --location ID [--evaluate] [--crop ID] [--format markdown|json]\n"
        "  krishi-report resolve --alert ID [--notes TEXT] [--format markdown|json]\n"
        "  krishi-report nearby --lat DEG --lon DEG [--radius KM] [--format markdown|json]\n"
        "  krishi-report statistics --location ID [--days N] [--language hi|hr|en] [--format markdown|json]\n"
        "  krishi-report outlook --location ID [--language hi|hr|en] [--format markdown|json]\n"
        "  krishi-report import --input PATH\n"
        "  krishi-report version\n"
        "Options: --db PATH, --config PATH, --trace\n");
}

// Distinct exit status per error kind so scripts can branch on it.
int exitCodeFor(ErrorCode code)
{
    switch (code) {
    case ErrorCode::InvalidArgument:
    case ErrorCode::InvalidCoordinates:
        return 2;
    case ErrorCode::NotFound:
    case ErrorCode::InsufficientData:
        return 3;
    case ErrorCode::BackendUnavailable:
        return 4;
    case ErrorCode::Timeout:
        return 5;
    case ErrorCode::InvalidConfiguration:
        return 6;
    }
    return kExitUsage;
}

std::string formatNumber(const std::optional<double> &value, const char *unit)
{
    if (!value) {
        return "n/a";
    }
    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << *value << unit;
    return out.str();
}

QString getArgValue(const QStringList &args, const QString &key)
{
    const int idx = args.indexOf(key);
    if (idx < 0 || idx + 1 >= args.size()) {
        return {};
    }
    return args.at(idx + 1);
}

QString getFormat(const QStringList &args)
{
    const QString value = getArgValue(args, QStringLiteral("--format"));
    if (value.isEmpty()) {
        return QStringLiteral("markdown");
    }
    return value.toLower();
}

bool validFormat(const QString &format)
{
    return format == QStringLiteral("markdown") || format == QStringLiteral("json");
}

std::optional<int> getIntArg(const QStringList &args, const QString &key, int fallback)
{
    const QString value = getArgValue(args, key);
    if (value.isEmpty()) {
        return fallback;
    }
    bool ok = false;
    const int parsed = value.toInt(&ok);
    if (!ok) {
        return std::nullopt;
    }
    return parsed;
}

std::optional<double> getDoubleArg(const QStringList &args, const QString &key)
{
    const QString value = getArgValue(args, key);
    if (value.isEmpty()) {
        return std::nullopt;
    }
    bool ok = false;
    const double parsed = value.toDouble(&ok);
    if (!ok) {
        return std::nullopt;
    }
    return parsed;
}

nlohmann::json readJsonFile(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return nlohmann::json();
    }
    const QByteArray data = file.readAll();
    try {
        return nlohmann::json::parse(data.toStdString());
    } catch (const nlohmann::json::parse_error &) {
        return nlohmann::json();
    }
}

void renderMeasurementsMarkdown(const Measurements &m)
{
    std::cout << "- Temperature: " << formatNumber(m.temperature, " C") << "\n";
    std::cout << "- Humidity: " << formatNumber(m.humidity, "%") << "\n";
    std::cout << "- Rainfall: " << formatNumber(m.rainfall, " mm") << "\n";
    std::cout << "- Wind: " << formatNumber(m.windSpeed, " km/h") << " from "
              << formatNumber(m.windDirection, " deg") << "\n";
    std::cout << "- Soil temperature: " << formatNumber(m.soilTemperature, " C") << "\n";
    std::cout << "- Soil moisture: " << formatNumber(m.soilMoisture, "%") << "\n";
    std::cout << "- Solar radiation: " << formatNumber(m.solarRadiation, " W/m2") << "\n";
}

void renderAlertMarkdown(const Alert &alert)
{
    std::cout << "- [" << toAlertSeverityString(alert.severity) << "] "
              << toAlertCategoryString(alert.category) << " (" << alert.id << ")\n";
    std::cout << "  - condition: " << alert.condition << "\n";
    std::cout << "  - action: " << alert.recommendedAction << "\n";
    std::cout << "  - state: " << toAlertStateString(alert.state) << ", since "
              << toIso8601Utc(alert.createdAt) << "\n";
    if (alert.resolvedAt) {
        std::cout << "  - resolved: " << toIso8601Utc(*alert.resolvedAt);
        if (!alert.resolutionNotes.empty()) {
            std::cout << " (" << alert.resolutionNotes << ")";
        }
        std::cout << "\n";
    }
}

void renderStaleNotice(bool stale)
{
    if (stale) {
        std::cout << "\n> Storage is unavailable; showing the last cached data.\n";
    }
}

std::vector<double> collect(const std::vector<DailySummary> &summaries,
                            std::optional<double> DailySummary::*field)
{
    std::vector<double> values;
    for (const auto &summary : summaries) {
        if (summary.*field) {
            values.push_back(*(summary.*field));
        }
    }
    return values;
}

} // namespace

int ReportCli::run(int argc, char *argv[])
{
    // CLI entry: parse the subcommand, open the store and delegate to the handler.
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }

    if (args.size() < 2) {
        std::cerr << usageText().toStdString();
        return kExitUsage;
    }

    const QString command = args.at(1);
    // One correlation id per invocation; the engine narrows it further.
    logging::CorrelationScope logScope(logging::newCorrelationId(),
                                       getArgValue(args, QStringLiteral("--location")).toStdString(),
                                       getArgValue(args, QStringLiteral("--alert")).toStdString());
    KRLOG_INFO(QStringLiteral("ReportCli"),
               QStringLiteral("run"),
               QStringLiteral("report_cli_command"),
               QStringLiteral("user_invocation"),
               QStringLiteral("cli"),
               nlohmann::json{{"command", command.toStdString()}});

    if (command == QStringLiteral("version") || command == QStringLiteral("--version")) {
        std::cout << "krishi-report " << KRISHI_VERSION << std::endl;
        return 0;
    }

    using Handler = int (ReportCli::*)(const QStringList &, WeatherAnalytics &);
    Handler handler = nullptr;
    if (command == QStringLiteral("current")) {
        handler = &ReportCli::runCurrentReport;
    } else if (command == QStringLiteral("history")) {
        handler = &ReportCli::runHistoryReport;
    } else if (command == QStringLiteral("forecast")) {
        handler = &ReportCli::runForecastReport;
    } else if (command == QStringLiteral("metrics")) {
        handler = &ReportCli::runMetricsReport;
    } else if (command == QStringLiteral("alerts")) {
        handler = &ReportCli::runAlertsReport;
    } else if (command == QStringLiteral("resolve")) {
        handler = &ReportCli::runResolve;
    } else if (command == QStringLiteral("nearby")) {
        handler = &ReportCli::runNearbyReport;
    } else if (command == QStringLiteral("statistics")) {
        handler = &ReportCli::runStatisticsReport;
    } else if (command == QStringLiteral("outlook")) {
        handler = &ReportCli::runOutlookReport;
    } else if (command == QStringLiteral("import")) {
        handler = &ReportCli::runImport;
    }
    if (!handler) {
        std::cerr << usageText().toStdString();
        return kExitUsage;
    }

    if (!validFormat(getFormat(args))) {
        std::cerr << "Invalid format. Use markdown or json." << std::endl;
        return kExitUsage;
    }

    try {
        const EngineConfig config = loadEngineConfig(getArgValue(args, QStringLiteral("--config")));
        const QString dbPath = getArgValue(args, QStringLiteral("--db"));
        std::unique_ptr<KrishiStore> store = dbPath.isEmpty()
            ? std::make_unique<KrishiStore>()
            : std::make_unique<KrishiStore>(dbPath.toStdString());
        StaticCropProfiles crops;
        WeatherAnalytics engine(*store, crops, config);
        engine.initialize();

        return (this->*handler)(args, engine);
    } catch (const KrishiError &e) {
        KRLOG_WARN(QStringLiteral("ReportCli"),
                   QStringLiteral("run"),
                   QStringLiteral("report_cli_failed"),
                   QString::fromUtf8(toErrorCodeString(e.code())),
                   QStringLiteral("cli"),
                   nlohmann::json{{"command", command.toStdString()},
                                  {"error", e.what()}});
        std::cerr << "Error (" << toErrorCodeString(e.code()) << "): " << e.what() << std::endl;
        return exitCodeFor(e.code());
    }
}

int ReportCli::runCurrentReport(const QStringList &args, WeatherAnalytics &engine)
{
    const QString locationId = getArgValue(args, QStringLiteral("--location"));
    if (locationId.isEmpty()) {
        std::cerr << usageText().toStdString();
        return kExitUsage;
    }

    const Location location = engine.repository().getLocation(locationId.toStdString()).value;
    const auto current = engine.currentConditions(location.id);

    if (getFormat(args) == QStringLiteral("json")) {
        nlohmann::json payload;
        payload["location"] = location;
        payload["reading"] = current.value;
        payload["stale"] = current.stale;
        std::cout << payload.dump(2) << std::endl;
        return 0;
    }

    std::cout << "# Current Conditions: " << location.name << "\n\n";
    std::cout << location.district << ", " << location.region << " ("
              << location.latitude << ", " << location.longitude << ")\n";
    std::cout << "Observed: " << toIso8601Utc(current.value.timestamp);
    if (!current.value.dataSource.empty()) {
        std::cout << " via " << current.value.dataSource;
    }
    std::cout << "\n\n";
    renderMeasurementsMarkdown(current.value.measurements);
    renderStaleNotice(current.stale);
    return 0;
}

int ReportCli::runHistoryReport(const QStringList &args, WeatherAnalytics &engine)
{
    // History reports summarize readings per UTC day and classify trends.
    const QString locationId = getArgValue(args, QStringLiteral("--location"));
    const QString fromValue = getArgValue(args, QStringLiteral("--from"));
    const QString toValue = getArgValue(args, QStringLiteral("--to"));
    if (locationId.isEmpty() || fromValue.isEmpty() || toValue.isEmpty()) {
        std::cerr << usageText().toStdString();
        return kExitUsage;
    }

    const auto from = parseIso8601(fromValue);
    const auto to = parseIso8601(toValue);
    if (!from.has_value() || !to.has_value()) {
        std::cerr << "Invalid ISO8601 timestamp." << std::endl;
        return kExitUsage;
    }

    const auto summaries = engine.dailySummaries(locationId.toStdString(), *from, *to);
    const Trend temperatureTrend =
        MetricsEngine::classifyTrend(collect(summaries, &DailySummary::meanTemperature));
    const Trend rainfallTrend =
        MetricsEngine::classifyTrend(collect(summaries, &DailySummary::totalRainfall));
    const Trend moistureTrend =
        MetricsEngine::classifyTrend(collect(summaries, &DailySummary::meanSoilMoisture));

    if (getFormat(args) == QStringLiteral("json")) {
        nlohmann::json payload;
        payload["locationId"] = locationId.toStdString();
        payload["from"] = toIso8601Utc(*from);
        payload["to"] = toIso8601Utc(*to);
        payload["days"] = summaries;
        payload["trends"] = {{"temperature", toTrendString(temperatureTrend)},
                             {"rainfall", toTrendString(rainfallTrend)},
                             {"soilMoisture", toTrendString(moistureTrend)}};
        std::cout << payload.dump(2) << std::endl;
        return 0;
    }

    std::cout << "# Weather History: " << locationId.toStdString() << "\n\n";
    std::cout << "Period: " << toIso8601Utc(*from) << " -> " << toIso8601Utc(*to) << "\n";
    std::cout << "Days with readings: " << summaries.size() << "\n\n";
    std::cout << "## Trends\n\n";
    std::cout << "- Temperature: " << toTrendString(temperatureTrend) << "\n";
    std::cout << "- Rainfall: " << toTrendString(rainfallTrend) << "\n";
    std::cout << "- Soil moisture: " << toTrendString(moistureTrend) << "\n\n";
    std::cout << "## Days\n\n";
    for (const auto &summary : summaries) {
        std::cout << "- " << toIsoDate(summary.day) << ": "
                  << formatNumber(summary.minTemperature, " C") << " .. "
                  << formatNumber(summary.maxTemperature, " C") << ", rain "
                  << formatNumber(summary.totalRainfall, " mm") << ", soil moisture "
                  << formatNumber(summary.lastSoilMoisture, "%") << " ("
                  << summary.readingCount << " readings)\n";
    }
    return 0;
}

int ReportCli::runForecastReport(const QStringList &args, WeatherAnalytics &engine)
{
    const QString locationId = getArgValue(args, QStringLiteral("--location"));
    const auto days = getIntArg(args, QStringLiteral("--days"),
                                engine.config().maxForecastHorizonDays);
    if (locationId.isEmpty() || !days) {
        std::cerr << usageText().toStdString();
        return kExitUsage;
    }

    const auto points = engine.forecast(locationId.toStdString(), *days);

    if (getFormat(args) == QStringLiteral("json")) {
        nlohmann::json payload;
        payload["locationId"] = locationId.toStdString();
        payload["horizonDays"] = *days;
        payload["days"] = points;
        std::cout << payload.dump(2) << std::endl;
        return 0;
    }

    std::cout << "# Forecast: " << locationId.toStdString() << "\n\n";
    if (points.empty()) {
        std::cout << "No forecast available.\n";
        return 0;
    }
    for (const auto &point : points) {
        std::cout << "## " << toIsoDate(point.forecastDate) << " (confidence "
                  << formatNumber(point.confidence * 100.0, "%") << ")\n\n";
        renderMeasurementsMarkdown(point.measurements);
        std::cout << "\n";
    }
    return 0;
}

int ReportCli::runMetricsReport(const QStringList &args, WeatherAnalytics &engine)
{
    const QString locationId = getArgValue(args, QStringLiteral("--location"));
    const QString cropId = getArgValue(args, QStringLiteral("--crop"));
    const auto gddDays = getIntArg(args, QStringLiteral("--gdd-days"), 7);
    if (locationId.isEmpty() || !gddDays) {
        std::cerr << usageText().toStdString();
        return kExitUsage;
    }

    const MetricsReport report =
        engine.metrics(locationId.toStdString(), cropId.toStdString(), *gddDays);

    if (getFormat(args) == QStringLiteral("json")) {
        nlohmann::json payload;
        payload["locationId"] = report.locationId;
        payload["cropId"] = report.cropId;
        payload["metrics"] = report.metrics;
        payload["stale"] = report.stale;
        std::cout << payload.dump(2) << std::endl;
        return 0;
    }

    std::cout << "# Agricultural Metrics: " << report.locationId << "\n\n";
    std::cout << "Crop profile: " << report.cropId << "\n\n";
    for (const auto &metric : report.metrics) {
        std::cout << "- " << toMetricKindString(metric.kind) << ": ";
        if (!metric.available()) {
            std::cout << "unavailable (missing input)\n";
            continue;
        }
        std::cout << formatNumber(metric.value, "");
        if (!metric.category.empty()) {
            std::cout << " (" << metric.category << ")";
        }
        std::cout << "\n";
    }
    renderStaleNotice(report.stale);
    return 0;
}

int ReportCli::runAlertsReport(const QStringList &args, WeatherAnalytics &engine)
{
    const QString locationId = getArgValue(args, QStringLiteral("--location"));
    if (locationId.isEmpty()) {
        std::cerr << usageText().toStdString();
        return kExitUsage;
    }
    const bool evaluate = args.contains(QStringLiteral("--evaluate"));

    std::optional<EvaluationReport> evaluation;
    if (evaluate) {
        evaluation = engine.evaluateAlerts(locationId.toStdString(),
                                           getArgValue(args, QStringLiteral("--crop")).toStdString());
    }
    const auto active = engine.activeAlerts(locationId.toStdString());

    if (getFormat(args) == QStringLiteral("json")) {
        nlohmann::json payload;
        payload["locationId"] = locationId.toStdString();
        payload["active"] = active.value;
        payload["stale"] = active.stale;
        if (evaluation) {
            nlohmann::json unknown = nlohmann::json::array();
            for (AlertCategory category : evaluation->unknown) {
                unknown.push_back(toAlertCategoryString(category));
            }
            payload["evaluation"] = {{"created", evaluation->created},
                                     {"updated", evaluation->updated},
                                     {"resolved", evaluation->resolved},
                                     {"suppressed", evaluation->suppressed},
                                     {"unknown", unknown}};
        }
        std::cout << payload.dump(2) << std::endl;
        return 0;
    }

    std::cout << "# Alerts: " << locationId.toStdString() << "\n\n";
    if (evaluation) {
        std::cout << "Evaluation: " << evaluation->created.size() << " created, "
                  << evaluation->updated.size() << " updated, "
                  << evaluation->resolved.size() << " resolved, "
                  << evaluation->suppressed << " unchanged\n\n";
        if (!evaluation->resolved.empty()) {
            std::cout << "## Resolved\n\n";
            for (const auto &alert : evaluation->resolved) {
                renderAlertMarkdown(alert);
            }
            std::cout << "\n";
        }
    }
    std::cout << "## Active\n\n";
    if (active.value.empty()) {
        std::cout << "No active alerts.\n";
    }
    for (const auto &alert : active.value) {
        renderAlertMarkdown(alert);
    }
    renderStaleNotice(active.stale);
    return 0;
}

int ReportCli::runResolve(const QStringList &args, WeatherAnalytics &engine)
{
    const QString alertId = getArgValue(args, QStringLiteral("--alert"));
    if (alertId.isEmpty()) {
        std::cerr << usageText().toStdString();
        return kExitUsage;
    }

    const Alert alert = engine.resolveAlert(alertId.toStdString(),
                                            getArgValue(args, QStringLiteral("--notes")).toStdString());
    const auto transitions = engine.alertHistory(alert.id);

    if (getFormat(args) == QStringLiteral("json")) {
        nlohmann::json payload;
        payload["alert"] = alert;
        payload["transitions"] = transitions;
        std::cout << payload.dump(2) << std::endl;
        return 0;
    }

    std::cout << "# Alert Resolved\n\n";
    renderAlertMarkdown(alert);
    if (!transitions.empty()) {
        std::cout << "\n## History\n\n";
        for (const auto &transition : transitions) {
            std::cout << "- " << toIso8601Utc(transition.timestamp) << ": "
                      << transition.fromState << " -> " << transition.toState << " ("
                      << transition.reason << ")\n";
        }
    }
    return 0;
}

int ReportCli::runNearbyReport(const QStringList &args, WeatherAnalytics &engine)
{
    const auto latitude = getDoubleArg(args, QStringLiteral("--lat"));
    const auto longitude = getDoubleArg(args, QStringLiteral("--lon"));
    if (!latitude || !longitude) {
        std::cerr << usageText().toStdString();
        return kExitUsage;
    }
    const double radius = getDoubleArg(args, QStringLiteral("--radius"))
                              .value_or(engine.config().defaultRadiusKm);

    const auto results = engine.nearby(*latitude, *longitude, radius);

    if (getFormat(args) == QStringLiteral("json")) {
        nlohmann::json payload;
        payload["latitude"] = *latitude;
        payload["longitude"] = *longitude;
        payload["radiusKm"] = radius;
        payload["locations"] = results;
        std::cout << payload.dump(2) << std::endl;
        return 0;
    }

    std::cout << "# Locations within " << formatNumber(radius, " km") << "\n\n";
    if (results.empty()) {
        std::cout << "No registered locations in range.\n";
    }
    for (const auto &result : results) {
        std::cout << "- " << result.location.name << " (" << result.location.id << "): "
                  << formatNumber(result.distanceKm, " km") << "\n";
    }
    return 0;
}

int ReportCli::runStatisticsReport(const QStringList &args, WeatherAnalytics &engine)
{
    const QString locationId = getArgValue(args, QStringLiteral("--location"));
    const auto days = getIntArg(args, QStringLiteral("--days"),
                                PlanningReports::kDefaultStatisticsDays);
    if (locationId.isEmpty() || !days) {
        std::cerr << usageText().toStdString();
        return kExitUsage;
    }

    const AlertStatistics stats = engine.alertStatistics(locationId.toStdString(), *days);

    if (getFormat(args) == QStringLiteral("json")) {
        std::cout << nlohmann::json(stats).dump(2) << std::endl;
        return 0;
    }

    const AdvisoryTranslator translator(
        parseLanguageCode(getArgValue(args, QStringLiteral("--language")).toStdString()));
    std::cout << "# Alert statistics: " << stats.locationId << " (last " << stats.days
              << " days)\n\n";
    std::cout << "- Total alerts: " << stats.totalAlerts << "\n";
    std::cout << "- Resolved: " << stats.resolvedAlerts << "\n";
    std::cout << "- Average time to resolve: "
              << formatNumber(stats.averageResolutionHours, " h") << "\n\n";
    std::cout << "## By severity\n\n";
    for (const auto &item : stats.bySeverity) {
        std::cout << "- " << toAlertSeverityString(item.first) << ": " << item.second << "\n";
    }
    std::cout << "\n## By category\n\n";
    for (const auto &item : stats.byCategory) {
        std::cout << "- " << translator.alertCategory(item.first) << " ("
                  << toAlertCategoryString(item.first) << "): " << item.second << "\n";
    }
    return 0;
}

int ReportCli::runOutlookReport(const QStringList &args, WeatherAnalytics &engine)
{
    const QString locationId = getArgValue(args, QStringLiteral("--location"));
    if (locationId.isEmpty()) {
        std::cerr << usageText().toStdString();
        return kExitUsage;
    }

    const MonthlyOutlook outlook = engine.monthlyOutlook(locationId.toStdString());

    if (getFormat(args) == QStringLiteral("json")) {
        std::cout << nlohmann::json(outlook).dump(2) << std::endl;
        return 0;
    }

    const AdvisoryTranslator translator(
        parseLanguageCode(getArgValue(args, QStringLiteral("--language")).toStdString()));
    std::cout << "# Monthly outlook: " << outlook.locationId << " from "
              << toIsoDate(outlook.firstDay) << "\n\n";
    if (outlook.weeks.empty()) {
        std::cout << "No forecast available.\n";
        return 0;
    }
    for (const auto &week : outlook.weeks) {
        std::cout << "## Week of " << toIsoDate(week.weekStart) << " (" << week.forecastDays
                  << " forecast days)\n\n";
        std::cout << "- Average temperature: " << formatNumber(week.averageTemperature, " C");
        if (week.averageTemperature) {
            std::cout << " (" << translator.temperatureDescription(*week.averageTemperature)
                      << ")";
        }
        std::cout << "\n";
        std::cout << "- Expected rainfall: " << formatNumber(week.totalRainfall, " mm") << "\n";
        std::cout << "- " << translator.outlookLabel(OutlookLabel::FrostDays) << ": "
                  << week.frostDays << "\n";
        std::cout << "- " << translator.outlookLabel(OutlookLabel::HeatStressDays) << ": "
                  << week.heatStressDays << "\n";
        std::cout << "- " << translator.outlookLabel(OutlookLabel::FavourableDays) << ": "
                  << week.favourableDays << "\n\n";
    }
    std::cout << "## Summary\n\n";
    std::cout << "- Expected rainfall: " << formatNumber(outlook.totalRainfall, " mm") << "\n";
    std::cout << "- " << translator.outlookLabel(OutlookLabel::FavourableDays) << " per week: "
              << formatNumber(outlook.averageFavourableDaysPerWeek, "") << "\n";
    std::cout << "- " << translator.weatherRisk(outlook.extremeWeatherRisk) << "\n";
    return 0;
}

int ReportCli::runImport(const QStringList &args, WeatherAnalytics &engine)
{
    // Imports a JSON document with optional "locations", "readings" and
    // "forecasts" arrays. Invalid records are reported and skipped.
    const QString inputPath = getArgValue(args, QStringLiteral("--input"));
    if (inputPath.isEmpty()) {
        std::cerr << usageText().toStdString();
        return kExitUsage;
    }

    const nlohmann::json document = readJsonFile(inputPath);
    if (!document.is_object()) {
        std::cerr << "Failed to read import file." << std::endl;
        return kExitUsage;
    }

    int locations = 0;
    int readings = 0;
    int forecasts = 0;
    int rejected = 0;
    auto reject = [&rejected](const char *kind, const std::exception &e) {
        ++rejected;
        std::cerr << "Rejected " << kind << ": " << e.what() << std::endl;
    };

    for (const auto &item : document.value("locations", nlohmann::json::array())) {
        try {
            engine.registerLocation(item.get<Location>());
            ++locations;
        } catch (const KrishiError &e) {
            reject("location", e);
        } catch (const nlohmann::json::exception &e) {
            reject("location", e);
        }
    }
    for (const auto &item : document.value("readings", nlohmann::json::array())) {
        try {
            engine.recordReading(item.get<Reading>());
            ++readings;
        } catch (const KrishiError &e) {
            reject("reading", e);
        } catch (const nlohmann::json::exception &e) {
            reject("reading", e);
        }
    }

    const auto importedAt = std::chrono::system_clock::now();
    for (const auto &item : document.value("forecasts", nlohmann::json::array())) {
        try {
            ForecastPoint point = item.get<ForecastPoint>();
            if (point.issuedAt == std::chrono::system_clock::time_point{}) {
                point.issuedAt = importedAt;
            }
            engine.upsertForecast({point});
            ++forecasts;
        } catch (const KrishiError &e) {
            reject("forecast point", e);
        } catch (const nlohmann::json::exception &e) {
            reject("forecast point", e);
        }
    }

    KRLOG_INFO(QStringLiteral("ReportCli"),
               QStringLiteral("runImport"),
               QStringLiteral("report_import"),
               QStringLiteral("user_invocation"),
               QStringLiteral("json_file"),
               nlohmann::json{{"locations", locations},
                              {"readings", readings},
                              {"forecasts", forecasts},
                              {"rejected", rejected}});

    std::cout << "Imported " << locations << " locations, " << readings << " readings, "
              << forecasts << " forecast points";
    if (rejected > 0) {
        std::cout << "; rejected " << rejected;
    }
    std::cout << "." << std::endl;
    return rejected == 0 ? 0 : exitCodeFor(ErrorCode::InvalidArgument);
}

std::optional<std::chrono::system_clock::time_point> ReportCli::parseIso8601(
    const QString &value) const
{
    const std::string text = value.toStdString();
    const auto parsed = text.size() == 10 ? fromIsoDate(text) : fromIso8601Utc(text);
    if (parsed == std::chrono::system_clock::time_point{}) {
        return std::nullopt;
    }
    return parsed;
}

} // namespace krishi
