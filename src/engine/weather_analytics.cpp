#include "engine/weather_analytics.hpp"

#include "common/errors.hpp"
#include "common/logging.hpp"
#include "common/time_utils.hpp"

namespace krishi {

WeatherAnalytics::WeatherAnalytics(WeatherBackend &backend,
                                   const CropProfileProvider &crops,
                                   const EngineConfig &config)
    : m_backend(backend)
    , m_crops(crops)
    , m_config(config)
    , m_repository(backend, m_config)
    , m_forecasts(m_repository, m_config)
    , m_alerts(m_repository, m_forecasts, crops, m_config)
{
}

std::size_t WeatherAnalytics::initialize()
{
    try {
        return m_geoIndex.rebuild(m_backend);
    } catch (const KrishiError &) {
        throw;
    } catch (const std::exception &e) {
        throw BackendUnavailableError(std::string("location enumeration failed: ") + e.what());
    }
}

void WeatherAnalytics::registerLocation(const Location &location)
{
    CachedRepository::validateLocation(location);
    m_repository.saveLocation(location);
    m_geoIndex.registerLocation(location);
}

std::vector<NearbyLocation> WeatherAnalytics::nearby(double latitude, double longitude) const
{
    return m_geoIndex.nearby(latitude, longitude, m_config.defaultRadiusKm);
}

std::vector<NearbyLocation> WeatherAnalytics::nearby(double latitude, double longitude,
                                                     double radiusKm) const
{
    return m_geoIndex.nearby(latitude, longitude, radiusKm);
}

CachedResult<Reading> WeatherAnalytics::currentConditions(const std::string &locationId)
{
    return m_repository.getCurrent(locationId);
}

CachedResult<std::vector<Reading>> WeatherAnalytics::history(
    const std::string &locationId,
    std::chrono::system_clock::time_point from,
    std::chrono::system_clock::time_point to)
{
    return m_repository.getHistory(locationId, from, to);
}

std::vector<DailySummary> WeatherAnalytics::dailySummaries(
    const std::string &locationId,
    std::chrono::system_clock::time_point from,
    std::chrono::system_clock::time_point to)
{
    return MetricsEngine::dailySummaries(m_repository.getHistory(locationId, from, to).value);
}

MetricsReport WeatherAnalytics::metrics(const std::string &locationId,
                                        const std::string &cropId,
                                        int gddDays)
{
    return metrics(locationId, cropId, gddDays, std::chrono::system_clock::now());
}

MetricsReport WeatherAnalytics::metrics(const std::string &locationId,
                                        const std::string &cropId,
                                        int gddDays,
                                        std::chrono::system_clock::time_point asOf)
{
    if (gddDays < 1) {
        throw InvalidArgumentError("growing degree day window must be at least one day");
    }
    const CropThresholds thresholds = resolveThresholds(m_crops, cropId);
    MetricsEngine::validateMoistureThresholds(thresholds);

    const Deadline deadline = m_repository.defaultDeadline();
    // Whole UTC days, so repeated calls within a day share one history entry.
    const auto from = addDays(startOfUtcDay(asOf), -(gddDays - 1));
    const auto to = addDays(startOfUtcDay(asOf), 1) - std::chrono::seconds(1);
    const std::string window = thresholds.cropId + "|" + toIsoDate(from) + "|"
        + std::to_string(gddDays);

    MetricsReport report;
    report.locationId = locationId;
    report.cropId = thresholds.cropId;

    auto result = m_repository.getMetrics(
        locationId, window, deadline,
        [this, locationId, thresholds, from, to, asOf, deadline]() {
            const Reading current = m_repository.getCurrent(locationId, deadline).value;
            std::vector<Reading> history;
            try {
                history = m_repository.getHistory(locationId, from, to, deadline).value;
            } catch (const NotFoundError &) {
                history.clear();
            }
            return MetricsEngine::computeAll(current, history, from, to, thresholds, asOf);
        });
    report.metrics = result.value;
    report.stale = result.stale;
    return report;
}

std::vector<ForecastPoint> WeatherAnalytics::forecast(const std::string &locationId,
                                                      int horizonDays)
{
    return m_forecasts.aggregate(locationId, horizonDays);
}

CachedResult<std::vector<Alert>> WeatherAnalytics::activeAlerts(const std::string &locationId)
{
    m_repository.getLocation(locationId);
    return m_repository.listActiveAlerts(locationId);
}

EvaluationReport WeatherAnalytics::evaluateAlerts(const std::string &locationId,
                                                  const std::string &cropId)
{
    return m_alerts.evaluate(locationId, cropId);
}

Alert WeatherAnalytics::resolveAlert(const std::string &alertId, const std::string &notes)
{
    return m_alerts.resolve(alertId, notes);
}

std::vector<AlertTransition> WeatherAnalytics::alertHistory(const std::string &alertId)
{
    m_repository.getAlert(alertId);
    return m_repository.alertTransitions(alertId);
}

AlertStatistics WeatherAnalytics::alertStatistics(const std::string &locationId, int days)
{
    return alertStatistics(locationId, days, std::chrono::system_clock::now());
}

AlertStatistics WeatherAnalytics::alertStatistics(const std::string &locationId,
                                                  int days,
                                                  std::chrono::system_clock::time_point now)
{
    PlanningReports::validateStatisticsDays(days);
    m_repository.getLocation(locationId);
    return PlanningReports::alertStatistics(locationId, m_repository.listAlerts(locationId),
                                            days, now);
}

MonthlyOutlook WeatherAnalytics::monthlyOutlook(const std::string &locationId)
{
    m_repository.getLocation(locationId);
    const auto now = std::chrono::system_clock::now();
    std::vector<ForecastPoint> points;
    try {
        points = m_repository.getForecast(locationId).value;
    } catch (const NotFoundError &) {
        // No forecast yet: an outlook without weeks.
    }
    const auto daily = ForecastAggregator::combine(locationId, points, now,
                                                   PlanningReports::kOutlookWeeks * 7,
                                                   m_config.forecastDecayPerDay);
    return PlanningReports::monthlyOutlook(locationId, daily, now, m_config.alertThresholds);
}

void WeatherAnalytics::recordReading(const Reading &reading)
{
    m_repository.recordReading(reading);
}

void WeatherAnalytics::upsertForecast(const std::vector<ForecastPoint> &points)
{
    m_repository.upsertForecast(points);
}

std::size_t WeatherAnalytics::refreshForecast(const std::string &locationId,
                                              const std::vector<ForecastSource *> &sources,
                                              int horizonDays)
{
    const Location location = m_repository.getLocation(locationId).value;
    return m_forecasts.refresh(location, sources, horizonDays);
}

const EngineConfig &WeatherAnalytics::config() const
{
    return m_config;
}

CachedRepository &WeatherAnalytics::repository()
{
    return m_repository;
}

const GeoIndex &WeatherAnalytics::geoIndex() const
{
    return m_geoIndex;
}

} // namespace krishi
