#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "common/config.hpp"
#include "common/models.hpp"
#include "engine/alert_evaluator.hpp"
#include "engine/cached_repository.hpp"
#include "engine/crop_profiles.hpp"
#include "engine/forecast_aggregator.hpp"
#include "engine/geo_index.hpp"
#include "engine/metrics_engine.hpp"
#include "engine/planning_reports.hpp"
#include "engine/weather_backend.hpp"

namespace krishi {

struct MetricsReport {
    std::string locationId;
    std::string cropId;
    std::vector<AgriculturalMetric> metrics;
    bool stale = false;
};

/**
 * Composition root of the engine. Owns the index, the repository and the
 * evaluators; the backend and crop profiles are borrowed and must outlive it.
 * Call initialize() once before serving requests.
 */
class WeatherAnalytics
{
public:
    WeatherAnalytics(WeatherBackend &backend,
                     const CropProfileProvider &crops,
                     const EngineConfig &config);

    WeatherAnalytics(const WeatherAnalytics &) = delete;
    WeatherAnalytics &operator=(const WeatherAnalytics &) = delete;

    // Rebuilds the geo index from the backend. Returns the number indexed.
    std::size_t initialize();

    void registerLocation(const Location &location);
    std::vector<NearbyLocation> nearby(double latitude, double longitude) const;
    std::vector<NearbyLocation> nearby(double latitude, double longitude, double radiusKm) const;

    CachedResult<Reading> currentConditions(const std::string &locationId);
    CachedResult<std::vector<Reading>> history(const std::string &locationId,
                                               std::chrono::system_clock::time_point from,
                                               std::chrono::system_clock::time_point to);
    std::vector<DailySummary> dailySummaries(const std::string &locationId,
                                             std::chrono::system_clock::time_point from,
                                             std::chrono::system_clock::time_point to);

    // Heat stress, soil moisture, soil temperature from the current reading and
    // growing degree days over the last `gddDays` UTC days.
    MetricsReport metrics(const std::string &locationId,
                          const std::string &cropId = {},
                          int gddDays = 7);
    MetricsReport metrics(const std::string &locationId,
                          const std::string &cropId,
                          int gddDays,
                          std::chrono::system_clock::time_point asOf);

    std::vector<ForecastPoint> forecast(const std::string &locationId, int horizonDays);
    CachedResult<std::vector<Alert>> activeAlerts(const std::string &locationId);
    EvaluationReport evaluateAlerts(const std::string &locationId, const std::string &cropId = {});
    Alert resolveAlert(const std::string &alertId, const std::string &notes = {});
    std::vector<AlertTransition> alertHistory(const std::string &alertId);

    // Alerts raised over the last `days` days, counted by severity and category.
    AlertStatistics alertStatistics(const std::string &locationId,
                                    int days = PlanningReports::kDefaultStatisticsDays);
    AlertStatistics alertStatistics(const std::string &locationId,
                                    int days,
                                    std::chrono::system_clock::time_point now);
    // Four weekly aggregates of the combined forecast starting today.
    MonthlyOutlook monthlyOutlook(const std::string &locationId);

    void recordReading(const Reading &reading);
    void upsertForecast(const std::vector<ForecastPoint> &points);
    std::size_t refreshForecast(const std::string &locationId,
                                const std::vector<ForecastSource *> &sources,
                                int horizonDays);

    const EngineConfig &config() const;
    CachedRepository &repository();
    const GeoIndex &geoIndex() const;

private:
    WeatherBackend &m_backend;
    const CropProfileProvider &m_crops;
    EngineConfig m_config;
    GeoIndex m_geoIndex;
    CachedRepository m_repository;
    ForecastAggregator m_forecasts;
    AlertEvaluator m_alerts;
};

} // namespace krishi
