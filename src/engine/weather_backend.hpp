#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"
#include "engine/geo_index.hpp"

namespace krishi {

/**
 * Persistence collaborator consumed by the engine.
 *
 * "Not found" is reported as an empty optional or an empty list. Every other
 * failure is reported by throwing BackendUnavailableError. Range queries
 * return rows ordered by timestamp (or forecast date) ascending, and a read
 * issued after a completed write must observe that write.
 */
class WeatherBackend : public LocationSource {
public:
    ~WeatherBackend() override = default;

    virtual std::optional<Location> getLocation(const std::string &locationId) = 0;
    virtual void upsertLocation(const Location &location) = 0;

    virtual std::optional<Reading> latestReading(const std::string &locationId) = 0;
    virtual std::vector<Reading> readingsBetween(
        const std::string &locationId,
        std::chrono::system_clock::time_point from,
        std::chrono::system_clock::time_point to) = 0;
    virtual void addReading(const Reading &reading) = 0;

    // Points whose forecast date is on or after `fromDate`, every source and
    // every issue included.
    virtual std::vector<ForecastPoint> forecastPointsFrom(
        const std::string &locationId,
        std::chrono::system_clock::time_point fromDate) = 0;
    // Replaces any point with the same (location, source, date, issuedAt).
    virtual void upsertForecastPoints(const std::vector<ForecastPoint> &points) = 0;

    virtual std::vector<Alert> listAlerts(const std::string &locationId,
                                          std::optional<AlertState> state) = 0;
    virtual std::optional<Alert> getAlert(const std::string &alertId) = 0;
    virtual void saveAlert(const Alert &alert) = 0;

    virtual void addAlertTransition(const AlertTransition &transition) = 0;
    virtual std::vector<AlertTransition> alertTransitions(const std::string &alertId) = 0;
};

} // namespace krishi
