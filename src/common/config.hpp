#pragma once

#include <chrono>
#include <string>

#include <QString>

#include <nlohmann/json.hpp>

namespace krishi {

struct AlertThresholds {
    // 24h rainfall above which a flood-risk alert triggers; twice this is extreme.
    double floodRainfallMm = 50.0;
    double frostWarningCelsius = 4.0;
    double lowTemperatureCelsius = 2.0;
    double highHumidityPercent = 80.0;
    double diseaseMinTemperatureCelsius = 20.0;
    int dryConsecutiveDays = 5;
};

struct EngineConfig {
    std::chrono::seconds currentTtl{300};
    std::chrono::seconds forecastTtl{3 * 3600};
    std::chrono::seconds historyTtl{1800};
    std::chrono::seconds locationTtl{3600};
    std::chrono::seconds metricsTtl{120};
    int maxForecastHorizonDays = 7;
    bool degradedAvailabilityOnBackendFailure = false;
    std::chrono::milliseconds requestTimeout{5000};
    int loaderThreads = 4;
    double defaultRadiusKm = 10.0;
    double forecastDecayPerDay = 0.9;
    bool alertHistoryEnabled = true;
    AlertThresholds alertThresholds;
};

// Throws InvalidConfigurationError on the first out-of-range value.
void validateConfig(const EngineConfig &config);

// Applies the keys present in `j` on top of `config`; unknown keys are ignored.
EngineConfig configFromJson(const nlohmann::json &j, EngineConfig config = EngineConfig{});
nlohmann::json configToJson(const EngineConfig &config);

// Loads defaults, then the JSON file at `path` (if not empty), then KRISHI_*
// environment overrides, and validates the result.
EngineConfig loadEngineConfig(const QString &path = QString());

} // namespace krishi
