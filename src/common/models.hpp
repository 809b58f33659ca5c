#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "common/enums.hpp"

namespace krishi {

struct Location {
    std::string id;
    std::string name;
    std::string district;
    std::string region = "Haryana";
    double latitude = 0.0;
    double longitude = 0.0;
    std::optional<double> elevationMeters;
};

// Sensor gaps are expected, so every measurement is optional.
struct Measurements {
    std::optional<double> temperature;       // Celsius
    std::optional<double> humidity;          // percent
    std::optional<double> rainfall;          // mm
    std::optional<double> windSpeed;         // km/h
    std::optional<double> windDirection;     // degrees
    std::optional<double> soilTemperature;   // Celsius
    std::optional<double> soilMoisture;      // percent
    std::optional<double> solarRadiation;    // W/m2
};

struct Reading {
    std::string locationId;
    std::chrono::system_clock::time_point timestamp;
    Measurements measurements;
    std::string dataSource;
};

struct ForecastPoint {
    std::string locationId;
    // UTC midnight of the day the forecast targets.
    std::chrono::system_clock::time_point forecastDate;
    std::chrono::system_clock::time_point issuedAt;
    std::string source;
    Measurements measurements;
    double confidence = 0.0;
};

struct AgriculturalMetric {
    std::string locationId;
    MetricKind kind = MetricKind::HeatStressIndex;
    // Empty when an input was missing. Never defaulted to zero.
    std::optional<double> value;
    std::string category;
    std::chrono::system_clock::time_point windowStart;
    std::chrono::system_clock::time_point windowEnd;
    std::chrono::system_clock::time_point computedAt;

    bool available() const
    {
        return value.has_value() || !category.empty();
    }
};

struct DailySummary {
    std::chrono::system_clock::time_point day;
    int readingCount = 0;
    std::optional<double> meanTemperature;
    std::optional<double> minTemperature;
    std::optional<double> maxTemperature;
    std::optional<double> totalRainfall;
    std::optional<double> meanHumidity;
    std::optional<double> meanSoilMoisture;
    std::optional<double> lastSoilMoisture;
    std::optional<double> meanSoilTemperature;
};

struct Alert {
    std::string id;
    std::string locationId;
    AlertCategory category = AlertCategory::FloodRisk;
    AlertSeverity severity = AlertSeverity::Low;
    std::string condition;
    std::string recommendedAction;
    AlertState state = AlertState::Active;
    std::chrono::system_clock::time_point createdAt;
    std::chrono::system_clock::time_point updatedAt;
    std::optional<std::chrono::system_clock::time_point> resolvedAt;
    std::string resolutionNotes;
};

// Audit record of one alert state change. Only written when alert history
// retention is enabled.
struct AlertTransition {
    std::string id;
    std::string alertId;
    std::string locationId;
    AlertCategory category = AlertCategory::FloodRisk;
    std::string fromState;
    std::string toState;
    AlertSeverity severity = AlertSeverity::Low;
    std::string reason;
    std::chrono::system_clock::time_point timestamp;
};

struct NearbyLocation {
    Location location;
    double distanceKm = 0.0;
};

// Alerts of one location raised since `since`, whatever their current state.
struct AlertStatistics {
    std::string locationId;
    int days = 30;
    std::chrono::system_clock::time_point since;
    int totalAlerts = 0;
    std::map<AlertSeverity, int> bySeverity;
    std::map<AlertCategory, int> byCategory;
    int resolvedAlerts = 0;
    // Mean of resolvedAt - createdAt over the resolved ones.
    std::optional<double> averageResolutionHours;
};

struct WeeklyOutlook {
    std::chrono::system_clock::time_point weekStart;
    int forecastDays = 0;
    std::optional<double> averageTemperature;
    double totalRainfall = 0.0;
    int frostDays = 0;
    int heatStressDays = 0;
    int favourableDays = 0;
};

struct MonthlyOutlook {
    std::string locationId;
    std::chrono::system_clock::time_point firstDay;
    // Weeks without any forecast day are left out.
    std::vector<WeeklyOutlook> weeks;
    double totalRainfall = 0.0;
    std::optional<double> averageFavourableDaysPerWeek;
    bool extremeWeatherRisk = false;
};

} // namespace krishi
