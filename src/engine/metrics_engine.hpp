#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"
#include "engine/crop_profiles.hpp"

namespace krishi {

/**
 * Derived agricultural metrics. Every function is pure: all time inputs are
 * explicit and a missing input yields an unavailable result rather than a
 * substituted default.
 */
class MetricsEngine
{
public:
    // NWS heat index (Rothfusz regression with the low/high humidity
    // adjustments, Steadman's simple form below 80 F). Celsius in and out.
    static double heatIndexCelsius(double temperatureCelsius, double humidityPercent);
    static std::optional<double> heatIndexCelsius(const Measurements &measurements);

    // none < 27 C <= moderate < 32 C <= severe < 41 C <= extreme
    static HeatStressLevel classifyHeatStress(double heatIndexCelsius);
    static std::optional<HeatStressLevel> heatStress(const Measurements &measurements);

    // Throws InvalidConfigurationError for bands outside 0..100 or dry >= saturated.
    static void validateMoistureThresholds(const CropThresholds &thresholds);
    static SoilMoistureCategory classifySoilMoisture(double moisturePercent,
                                                     const CropThresholds &thresholds);

    static SoilTemperatureStatus classifySoilTemperature(double soilTemperatureCelsius);

    // Sum over each UTC day in [from, to] of max(0, (min + max) / 2 - base).
    // Empty when any day in the window has no temperature.
    static std::optional<double> growingDegreeDays(const std::vector<Reading> &readings,
                                                   std::chrono::system_clock::time_point from,
                                                   std::chrono::system_clock::time_point to,
                                                   double baseCelsius);
    // One temperature per forecast day; empty when a day lacks one.
    static std::optional<double> growingDegreeDays(const std::vector<ForecastPoint> &points,
                                                   double baseCelsius);

    // Per UTC day, ascending.
    static std::vector<DailySummary> dailySummaries(const std::vector<Reading> &readings);

    // Compares the mean of the second half of the series against the first.
    static Trend classifyTrend(const std::vector<double> &values);

    static AgriculturalMetric heatStressMetric(const Reading &reading,
                                               std::chrono::system_clock::time_point asOf);
    static AgriculturalMetric soilMoistureMetric(const Reading &reading,
                                                 const CropThresholds &thresholds,
                                                 std::chrono::system_clock::time_point asOf);
    static AgriculturalMetric soilTemperatureMetric(const Reading &reading,
                                                    std::chrono::system_clock::time_point asOf);
    static AgriculturalMetric growingDegreeDaysMetric(const std::string &locationId,
                                                      const std::vector<Reading> &readings,
                                                      std::chrono::system_clock::time_point from,
                                                      std::chrono::system_clock::time_point to,
                                                      const CropThresholds &thresholds,
                                                      std::chrono::system_clock::time_point asOf);

    // All metric kinds for a location from its current reading and a history window.
    static std::vector<AgriculturalMetric> computeAll(const Reading &current,
                                                      const std::vector<Reading> &history,
                                                      std::chrono::system_clock::time_point from,
                                                      std::chrono::system_clock::time_point to,
                                                      const CropThresholds &thresholds,
                                                      std::chrono::system_clock::time_point asOf);
};

} // namespace krishi
