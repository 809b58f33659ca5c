#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "common/config.hpp"
#include "common/models.hpp"
#include "engine/single_flight_cache.hpp"
#include "engine/weather_backend.hpp"

namespace krishi {

/**
 * CachedRepository mediates every read and write of locations, readings,
 * forecast points, alerts and derived metrics against the WeatherBackend.
 *
 * - Each read path has its own TTL cache keyed by (operation, location,
 *   window) with single-flight loading.
 * - Write paths validate input, write through to the backend and then drop
 *   every cache entry of the affected locations before returning, so a read
 *   issued after the write returns observes it.
 * - Backend failures surface as BackendUnavailableError unless degraded
 *   availability is enabled and a stale entry exists.
 *
 * Every call takes a deadline; the overloads without one use the configured
 * request timeout.
 */
class CachedRepository {
public:
    CachedRepository(WeatherBackend &backend, const EngineConfig &config);
    ~CachedRepository();

    CachedRepository(const CachedRepository &) = delete;
    CachedRepository &operator=(const CachedRepository &) = delete;

    Deadline defaultDeadline() const;

    CachedResult<Location> getLocation(const std::string &locationId);
    CachedResult<Location> getLocation(const std::string &locationId, Deadline deadline);

    CachedResult<Reading> getCurrent(const std::string &locationId);
    CachedResult<Reading> getCurrent(const std::string &locationId, Deadline deadline);

    CachedResult<std::vector<Reading>> getHistory(
        const std::string &locationId,
        std::chrono::system_clock::time_point from,
        std::chrono::system_clock::time_point to);
    CachedResult<std::vector<Reading>> getHistory(
        const std::string &locationId,
        std::chrono::system_clock::time_point from,
        std::chrono::system_clock::time_point to,
        Deadline deadline);

    // Raw source points for dates from today (UTC) on, ascending by date.
    CachedResult<std::vector<ForecastPoint>> getForecast(const std::string &locationId);
    CachedResult<std::vector<ForecastPoint>> getForecast(const std::string &locationId,
                                                         Deadline deadline);

    CachedResult<std::vector<Alert>> listActiveAlerts(const std::string &locationId);
    CachedResult<std::vector<Alert>> listActiveAlerts(const std::string &locationId,
                                                      Deadline deadline);

    // Uncached: used for state transitions, which must see the stored row.
    Alert getAlert(const std::string &alertId);
    std::vector<Alert> listAlerts(const std::string &locationId);
    std::vector<AlertTransition> alertTransitions(const std::string &alertId);

    // Derived metrics share the single-flight and invalidation machinery; the
    // window string distinguishes crops and time windows.
    CachedResult<std::vector<AgriculturalMetric>> getMetrics(
        const std::string &locationId,
        const std::string &window,
        Deadline deadline,
        std::function<std::vector<AgriculturalMetric>()> compute);

    void saveLocation(const Location &location);
    void saveLocation(const Location &location, Deadline deadline);
    void recordReading(const Reading &reading);
    void recordReading(const Reading &reading, Deadline deadline);
    void upsertForecast(const std::vector<ForecastPoint> &points);
    void upsertForecast(const std::vector<ForecastPoint> &points, Deadline deadline);
    void saveAlert(const Alert &alert);
    void saveAlert(const Alert &alert, Deadline deadline);
    void recordAlertTransition(const AlertTransition &transition);

    void invalidateLocation(const std::string &locationId);
    CacheStats cacheStats() const;

    static void validateReading(const Reading &reading);
    static void validateForecastPoint(const ForecastPoint &point);
    static void validateLocation(const Location &location);

private:
    void requireDeadline(Deadline deadline, const char *operation) const;

    WeatherBackend &m_backend;
    EngineConfig m_config;

    SingleFlightCache<Location> m_locationCache;
    SingleFlightCache<Reading> m_currentCache;
    SingleFlightCache<std::vector<Reading>> m_historyCache;
    SingleFlightCache<std::vector<ForecastPoint>> m_forecastCache;
    SingleFlightCache<std::vector<Alert>> m_alertCache;
    SingleFlightCache<std::vector<AgriculturalMetric>> m_metricsCache;
};

} // namespace krishi
