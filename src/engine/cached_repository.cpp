#include "engine/cached_repository.hpp"

#include <cmath>
#include <set>
#include <utility>

#include "common/errors.hpp"
#include "common/logging.hpp"
#include "common/time_utils.hpp"

namespace krishi {

namespace {

constexpr double kMinAirTemperature = -60.0;
constexpr double kMaxAirTemperature = 60.0;

// Translates anything the backend throws that is not already one of ours into
// BackendUnavailableError, so callers see one failure kind for storage.
template <typename Fn>
auto callBackend(const char *operation, const std::string &subject, Fn &&fn) -> decltype(fn())
{
    try {
        return fn();
    } catch (const BackendUnavailableError &e) {
        KRLOG_WARN(QStringLiteral("CachedRepository"),
                   QString::fromUtf8(operation),
                   QStringLiteral("backend_unavailable"),
                   QStringLiteral("persistence_error"),
                   QStringLiteral("backend_call"),
                   nlohmann::json{{"subject", subject}, {"error", e.what()}});
        throw;
    } catch (const KrishiError &) {
        throw;
    } catch (const std::exception &e) {
        KRLOG_WARN(QStringLiteral("CachedRepository"),
                   QString::fromUtf8(operation),
                   QStringLiteral("backend_unavailable"),
                   QStringLiteral("persistence_error"),
                   QStringLiteral("backend_call"),
                   nlohmann::json{{"subject", subject}, {"error", e.what()}});
        throw BackendUnavailableError(std::string(operation) + " failed: " + e.what());
    }
}

void requireLocationId(const std::string &locationId)
{
    if (locationId.empty()) {
        throw InvalidArgumentError("location id must not be empty");
    }
}

void checkRange(const std::optional<double> &value, double min, double max, const char *field)
{
    if (!value) {
        return;
    }
    if (!std::isfinite(*value) || *value < min || *value > max) {
        throw InvalidArgumentError(std::string(field) + " out of range: " + std::to_string(*value));
    }
}

void validateMeasurements(const Measurements &m)
{
    checkRange(m.temperature, kMinAirTemperature, kMaxAirTemperature, "temperature");
    checkRange(m.humidity, 0.0, 100.0, "humidity");
    checkRange(m.rainfall, 0.0, 2000.0, "rainfall");
    checkRange(m.windSpeed, 0.0, 500.0, "windSpeed");
    checkRange(m.windDirection, 0.0, 360.0, "windDirection");
    checkRange(m.soilTemperature, kMinAirTemperature, kMaxAirTemperature, "soilTemperature");
    checkRange(m.soilMoisture, 0.0, 100.0, "soilMoisture");
    checkRange(m.solarRadiation, 0.0, 2000.0, "solarRadiation");
}

} // namespace

CachedRepository::CachedRepository(WeatherBackend &backend, const EngineConfig &config)
    : m_backend(backend)
    , m_config(config)
    , m_locationCache(config.locationTtl, config.degradedAvailabilityOnBackendFailure,
                      config.loaderThreads)
    , m_currentCache(config.currentTtl, config.degradedAvailabilityOnBackendFailure,
                     config.loaderThreads)
    , m_historyCache(config.historyTtl, config.degradedAvailabilityOnBackendFailure,
                     config.loaderThreads)
    , m_forecastCache(config.forecastTtl, config.degradedAvailabilityOnBackendFailure,
                      config.loaderThreads)
    , m_alertCache(config.currentTtl, config.degradedAvailabilityOnBackendFailure,
                   config.loaderThreads)
    , m_metricsCache(config.metricsTtl, config.degradedAvailabilityOnBackendFailure,
                     config.loaderThreads)
{
    validateConfig(m_config);
}

CachedRepository::~CachedRepository() = default;

Deadline CachedRepository::defaultDeadline() const
{
    return std::chrono::steady_clock::now() + m_config.requestTimeout;
}

void CachedRepository::requireDeadline(Deadline deadline, const char *operation) const
{
    if (std::chrono::steady_clock::now() >= deadline) {
        throw TimeoutError(std::string(operation) + " deadline already expired");
    }
}

void CachedRepository::validateLocation(const Location &location)
{
    requireLocationId(location.id);
    if (!GeoIndex::validCoordinates(location.latitude, location.longitude)) {
        throw InvalidCoordinatesError("location " + location.id + " has invalid coordinates");
    }
    if (location.elevationMeters
        && (!std::isfinite(*location.elevationMeters) || *location.elevationMeters < 0.0)) {
        throw InvalidArgumentError("elevation cannot be negative");
    }
}

void CachedRepository::validateReading(const Reading &reading)
{
    requireLocationId(reading.locationId);
    if (reading.timestamp == std::chrono::system_clock::time_point{}) {
        throw InvalidArgumentError("reading timestamp is missing");
    }
    validateMeasurements(reading.measurements);
}

void CachedRepository::validateForecastPoint(const ForecastPoint &point)
{
    requireLocationId(point.locationId);
    if (point.source.empty()) {
        throw InvalidArgumentError("forecast point source must not be empty");
    }
    if (!std::isfinite(point.confidence) || point.confidence < 0.0 || point.confidence > 1.0) {
        throw InvalidArgumentError("forecast confidence must be within [0, 1]");
    }
    if (startOfUtcDay(point.forecastDate) != point.forecastDate) {
        throw InvalidArgumentError("forecast date must be a UTC midnight");
    }
    validateMeasurements(point.measurements);
}

CachedResult<Location> CachedRepository::getLocation(const std::string &locationId)
{
    return getLocation(locationId, defaultDeadline());
}

CachedResult<Location> CachedRepository::getLocation(const std::string &locationId,
                                                     Deadline deadline)
{
    requireLocationId(locationId);
    return m_locationCache.get(
        {CacheOperation::Location, locationId, {}}, deadline,
        logging::withCurrentContext([this, locationId]() {
            auto location = callBackend("getLocation", locationId, [&]() {
                return m_backend.getLocation(locationId);
            });
            if (!location) {
                throw NotFoundError("unknown location " + locationId);
            }
            return *location;
        }));
}

CachedResult<Reading> CachedRepository::getCurrent(const std::string &locationId)
{
    return getCurrent(locationId, defaultDeadline());
}

CachedResult<Reading> CachedRepository::getCurrent(const std::string &locationId,
                                                   Deadline deadline)
{
    requireLocationId(locationId);
    return m_currentCache.get(
        {CacheOperation::Current, locationId, {}}, deadline,
        logging::withCurrentContext([this, locationId]() {
            auto reading = callBackend("getCurrent", locationId, [&]() {
                return m_backend.latestReading(locationId);
            });
            if (!reading) {
                throw NotFoundError("no readings recorded for location " + locationId);
            }
            return *reading;
        }));
}

CachedResult<std::vector<Reading>> CachedRepository::getHistory(
    const std::string &locationId,
    std::chrono::system_clock::time_point from,
    std::chrono::system_clock::time_point to)
{
    return getHistory(locationId, from, to, defaultDeadline());
}

CachedResult<std::vector<Reading>> CachedRepository::getHistory(
    const std::string &locationId,
    std::chrono::system_clock::time_point from,
    std::chrono::system_clock::time_point to,
    Deadline deadline)
{
    requireLocationId(locationId);
    if (from > to) {
        throw InvalidArgumentError("history window starts after it ends");
    }

    const std::string window = std::to_string(toEpochSeconds(from)) + "-"
        + std::to_string(toEpochSeconds(to));
    return m_historyCache.get(
        {CacheOperation::History, locationId, window}, deadline,
        logging::withCurrentContext([this, locationId, from, to]() {
            auto readings = callBackend("getHistory", locationId, [&]() {
                return m_backend.readingsBetween(locationId, from, to);
            });
            if (readings.empty()) {
                throw NotFoundError("no readings for location " + locationId
                                    + " between " + toIso8601Utc(from) + " and "
                                    + toIso8601Utc(to));
            }
            return readings;
        }));
}

CachedResult<std::vector<ForecastPoint>> CachedRepository::getForecast(
    const std::string &locationId)
{
    return getForecast(locationId, defaultDeadline());
}

CachedResult<std::vector<ForecastPoint>> CachedRepository::getForecast(
    const std::string &locationId, Deadline deadline)
{
    requireLocationId(locationId);
    // Keyed by the current UTC day so that points for passed dates drop out of
    // the view at midnight even if the entry is still fresh.
    const auto today = startOfUtcDay(std::chrono::system_clock::now());
    return m_forecastCache.get(
        {CacheOperation::Forecast, locationId, toIsoDate(today)}, deadline,
        logging::withCurrentContext([this, locationId, today]() {
            auto points = callBackend("getForecast", locationId, [&]() {
                return m_backend.forecastPointsFrom(locationId, today);
            });
            if (points.empty()) {
                throw NotFoundError("no current forecast for location " + locationId);
            }
            return points;
        }));
}

CachedResult<std::vector<Alert>> CachedRepository::listActiveAlerts(
    const std::string &locationId)
{
    return listActiveAlerts(locationId, defaultDeadline());
}

CachedResult<std::vector<Alert>> CachedRepository::listActiveAlerts(
    const std::string &locationId, Deadline deadline)
{
    requireLocationId(locationId);
    return m_alertCache.get(
        {CacheOperation::ActiveAlerts, locationId, {}}, deadline,
        logging::withCurrentContext([this, locationId]() {
            return callBackend("listActiveAlerts", locationId, [&]() {
                return m_backend.listAlerts(locationId, AlertState::Active);
            });
        }));
}

Alert CachedRepository::getAlert(const std::string &alertId)
{
    if (alertId.empty()) {
        throw InvalidArgumentError("alert id must not be empty");
    }
    auto alert = callBackend("getAlert", alertId, [&]() {
        return m_backend.getAlert(alertId);
    });
    if (!alert) {
        throw NotFoundError("unknown alert " + alertId);
    }
    return *alert;
}

std::vector<Alert> CachedRepository::listAlerts(const std::string &locationId)
{
    requireLocationId(locationId);
    return callBackend("listAlerts", locationId, [&]() {
        return m_backend.listAlerts(locationId, std::nullopt);
    });
}

std::vector<AlertTransition> CachedRepository::alertTransitions(const std::string &alertId)
{
    return callBackend("alertTransitions", alertId, [&]() {
        return m_backend.alertTransitions(alertId);
    });
}

CachedResult<std::vector<AgriculturalMetric>> CachedRepository::getMetrics(
    const std::string &locationId,
    const std::string &window,
    Deadline deadline,
    std::function<std::vector<AgriculturalMetric>()> compute)
{
    requireLocationId(locationId);
    return m_metricsCache.get({CacheOperation::Metrics, locationId, window}, deadline,
                              logging::withCurrentContext(std::move(compute)));
}

void CachedRepository::saveLocation(const Location &location)
{
    saveLocation(location, defaultDeadline());
}

void CachedRepository::saveLocation(const Location &location, Deadline deadline)
{
    validateLocation(location);
    requireDeadline(deadline, "saveLocation");
    callBackend("saveLocation", location.id, [&]() {
        m_backend.upsertLocation(location);
    });
    invalidateLocation(location.id);
}

void CachedRepository::recordReading(const Reading &reading)
{
    recordReading(reading, defaultDeadline());
}

void CachedRepository::recordReading(const Reading &reading, Deadline deadline)
{
    validateReading(reading);
    requireDeadline(deadline, "recordReading");
    callBackend("recordReading", reading.locationId, [&]() {
        m_backend.addReading(reading);
    });
    invalidateLocation(reading.locationId);
}

void CachedRepository::upsertForecast(const std::vector<ForecastPoint> &points)
{
    upsertForecast(points, defaultDeadline());
}

void CachedRepository::upsertForecast(const std::vector<ForecastPoint> &points,
                                      Deadline deadline)
{
    if (points.empty()) {
        return;
    }

    std::set<std::string> locations;
    for (const auto &point : points) {
        validateForecastPoint(point);
        locations.insert(point.locationId);
    }
    requireDeadline(deadline, "upsertForecast");

    callBackend("upsertForecast", *locations.begin(), [&]() {
        m_backend.upsertForecastPoints(points);
    });
    for (const auto &locationId : locations) {
        invalidateLocation(locationId);
    }
}

void CachedRepository::saveAlert(const Alert &alert)
{
    saveAlert(alert, defaultDeadline());
}

void CachedRepository::saveAlert(const Alert &alert, Deadline deadline)
{
    if (alert.id.empty()) {
        throw InvalidArgumentError("alert id must not be empty");
    }
    requireLocationId(alert.locationId);
    if (alert.state == AlertState::Resolved && !alert.resolvedAt) {
        throw InvalidArgumentError("resolved alert " + alert.id + " has no resolved-at time");
    }
    requireDeadline(deadline, "saveAlert");

    callBackend("saveAlert", alert.locationId, [&]() {
        m_backend.saveAlert(alert);
    });
    invalidateLocation(alert.locationId);
}

void CachedRepository::recordAlertTransition(const AlertTransition &transition)
{
    callBackend("recordAlertTransition", transition.locationId, [&]() {
        m_backend.addAlertTransition(transition);
    });
}

void CachedRepository::invalidateLocation(const std::string &locationId)
{
    std::size_t removed = 0;
    removed += m_locationCache.invalidateLocation(locationId);
    removed += m_currentCache.invalidateLocation(locationId);
    removed += m_historyCache.invalidateLocation(locationId);
    removed += m_forecastCache.invalidateLocation(locationId);
    removed += m_alertCache.invalidateLocation(locationId);
    removed += m_metricsCache.invalidateLocation(locationId);

    KRLOG_DEBUG(QStringLiteral("CachedRepository"),
                QStringLiteral("invalidateLocation"),
                QStringLiteral("cache_invalidated"),
                QStringLiteral("write_path"),
                QStringLiteral("per_location_shard"),
                nlohmann::json{{"locationId", locationId}, {"entriesRemoved", removed}});
}

CacheStats CachedRepository::cacheStats() const
{
    CacheStats total;
    auto add = [&total](const CacheStats &s) {
        total.hits += s.hits;
        total.misses += s.misses;
        total.loads += s.loads;
        total.joinedFlights += s.joinedFlights;
        total.staleServed += s.staleServed;
        total.timeouts += s.timeouts;
        total.invalidations += s.invalidations;
        total.evictions += s.evictions;
    };
    add(m_locationCache.stats());
    add(m_currentCache.stats());
    add(m_historyCache.stats());
    add(m_forecastCache.stats());
    add(m_alertCache.stats());
    add(m_metricsCache.stats());
    return total;
}

} // namespace krishi
