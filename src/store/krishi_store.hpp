#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"
#include "engine/weather_backend.hpp"

namespace krishi {

// KrishiStore is the SQLite access layer for all persistent data: locations,
// readings, forecast points, alerts, alert transitions, and meta.
// One connection is shared by every caller and guarded by a mutex. SQLite
// failures are reported as BackendUnavailableError.
class KrishiStore : public WeatherBackend {
public:
    // Opens $HOME/.local/share/krishi/krishi.db, creating it if needed.
    KrishiStore();
    explicit KrishiStore(const std::string &databasePath);
    ~KrishiStore() override;

    KrishiStore(const KrishiStore &) = delete;
    KrishiStore &operator=(const KrishiStore &) = delete;

    static std::string defaultDatabasePath();

    std::vector<Location> listLocations() override;
    std::optional<Location> getLocation(const std::string &locationId) override;
    void upsertLocation(const Location &location) override;

    std::optional<Reading> latestReading(const std::string &locationId) override;
    std::vector<Reading> readingsBetween(
        const std::string &locationId,
        std::chrono::system_clock::time_point from,
        std::chrono::system_clock::time_point to) override;
    void addReading(const Reading &reading) override;

    std::vector<ForecastPoint> forecastPointsFrom(
        const std::string &locationId,
        std::chrono::system_clock::time_point fromDate) override;
    void upsertForecastPoints(const std::vector<ForecastPoint> &points) override;

    std::vector<Alert> listAlerts(const std::string &locationId,
                                  std::optional<AlertState> state) override;
    std::optional<Alert> getAlert(const std::string &alertId) override;
    void saveAlert(const Alert &alert) override;

    void addAlertTransition(const AlertTransition &transition) override;
    std::vector<AlertTransition> alertTransitions(const std::string &alertId) override;

    std::optional<std::string> getMeta(const std::string &key) const;
    void setMeta(const std::string &key, const std::string &value);

private:
    void open(const std::string &databasePath);

    struct Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace krishi
