#pragma once

#include <chrono>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"
#include "common/time_utils.hpp"

namespace krishi {

inline std::string toMetricKindString(MetricKind kind)
{
    switch (kind) {
    case MetricKind::HeatStressIndex:
        return "heat_stress_index";
    case MetricKind::SoilMoistureCategory:
        return "soil_moisture_category";
    case MetricKind::GrowingDegreeDays:
        return "growing_degree_days";
    case MetricKind::SoilTemperatureStatus:
        return "soil_temperature_status";
    }
    return "heat_stress_index";
}

inline std::string toHeatStressString(HeatStressLevel level)
{
    switch (level) {
    case HeatStressLevel::None:
        return "none";
    case HeatStressLevel::Moderate:
        return "moderate";
    case HeatStressLevel::Severe:
        return "severe";
    case HeatStressLevel::Extreme:
        return "extreme";
    }
    return "none";
}

inline std::string toSoilMoistureString(SoilMoistureCategory category)
{
    switch (category) {
    case SoilMoistureCategory::Dry:
        return "dry";
    case SoilMoistureCategory::Optimal:
        return "optimal";
    case SoilMoistureCategory::Saturated:
        return "saturated";
    }
    return "optimal";
}

inline std::string toSoilTemperatureString(SoilTemperatureStatus status)
{
    switch (status) {
    case SoilTemperatureStatus::Cold:
        return "cold";
    case SoilTemperatureStatus::Optimal:
        return "optimal";
    case SoilTemperatureStatus::Hot:
        return "hot";
    }
    return "optimal";
}

inline std::string toTrendString(Trend trend)
{
    switch (trend) {
    case Trend::Stable:
        return "stable";
    case Trend::Increasing:
        return "increasing";
    case Trend::Decreasing:
        return "decreasing";
    }
    return "stable";
}

inline std::string toAlertCategoryString(AlertCategory category)
{
    switch (category) {
    case AlertCategory::FloodRisk:
        return "flood_risk";
    case AlertCategory::HeatAdvisory:
        return "heat_advisory";
    case AlertCategory::FrostWarning:
        return "frost_warning";
    case AlertCategory::IrrigationAdvisory:
        return "irrigation_advisory";
    case AlertCategory::DiseaseRisk:
        return "disease_risk";
    }
    return "flood_risk";
}

inline AlertCategory parseAlertCategoryString(const std::string &value)
{
    if (value == "heat_advisory") {
        return AlertCategory::HeatAdvisory;
    }
    if (value == "frost_warning") {
        return AlertCategory::FrostWarning;
    }
    if (value == "irrigation_advisory") {
        return AlertCategory::IrrigationAdvisory;
    }
    if (value == "disease_risk") {
        return AlertCategory::DiseaseRisk;
    }
    return AlertCategory::FloodRisk;
}

inline std::string toAlertSeverityString(AlertSeverity severity)
{
    switch (severity) {
    case AlertSeverity::Low:
        return "low";
    case AlertSeverity::Medium:
        return "medium";
    case AlertSeverity::High:
        return "high";
    case AlertSeverity::Extreme:
        return "extreme";
    }
    return "low";
}

inline AlertSeverity parseAlertSeverityString(const std::string &value)
{
    if (value == "medium") {
        return AlertSeverity::Medium;
    }
    if (value == "high") {
        return AlertSeverity::High;
    }
    if (value == "extreme") {
        return AlertSeverity::Extreme;
    }
    return AlertSeverity::Low;
}

inline std::string toAlertStateString(AlertState state)
{
    return state == AlertState::Resolved ? "resolved" : "active";
}

inline AlertState parseAlertStateString(const std::string &value)
{
    return value == "resolved" ? AlertState::Resolved : AlertState::Active;
}

inline nlohmann::json optionalToJson(const std::optional<double> &value)
{
    return value ? nlohmann::json(*value) : nlohmann::json();
}

inline std::optional<double> optionalFromJson(const nlohmann::json &j, const char *key)
{
    if (!j.contains(key) || !j.at(key).is_number()) {
        return std::nullopt;
    }
    return j.at(key).get<double>();
}

inline void to_json(nlohmann::json &j, const Location &location)
{
    j = nlohmann::json{
        {"id", location.id},
        {"name", location.name},
        {"district", location.district},
        {"region", location.region},
        {"latitude", location.latitude},
        {"longitude", location.longitude},
        {"elevation", optionalToJson(location.elevationMeters)}
    };
}

inline void from_json(const nlohmann::json &j, Location &location)
{
    location.id = j.value("id", "");
    location.name = j.value("name", "");
    location.district = j.value("district", "");
    location.region = j.value("region", "Haryana");
    location.latitude = j.value("latitude", 0.0);
    location.longitude = j.value("longitude", 0.0);
    location.elevationMeters = optionalFromJson(j, "elevation");
}

inline void to_json(nlohmann::json &j, const Measurements &m)
{
    j = nlohmann::json{
        {"temperature", optionalToJson(m.temperature)},
        {"humidity", optionalToJson(m.humidity)},
        {"rainfall", optionalToJson(m.rainfall)},
        {"windSpeed", optionalToJson(m.windSpeed)},
        {"windDirection", optionalToJson(m.windDirection)},
        {"soilTemperature", optionalToJson(m.soilTemperature)},
        {"soilMoisture", optionalToJson(m.soilMoisture)},
        {"solarRadiation", optionalToJson(m.solarRadiation)}
    };
}

inline void from_json(const nlohmann::json &j, Measurements &m)
{
    m.temperature = optionalFromJson(j, "temperature");
    m.humidity = optionalFromJson(j, "humidity");
    m.rainfall = optionalFromJson(j, "rainfall");
    m.windSpeed = optionalFromJson(j, "windSpeed");
    m.windDirection = optionalFromJson(j, "windDirection");
    m.soilTemperature = optionalFromJson(j, "soilTemperature");
    m.soilMoisture = optionalFromJson(j, "soilMoisture");
    m.solarRadiation = optionalFromJson(j, "solarRadiation");
}

inline void to_json(nlohmann::json &j, const Reading &reading)
{
    j = nlohmann::json{
        {"locationId", reading.locationId},
        {"timestamp", toIso8601Utc(reading.timestamp)},
        {"measurements", reading.measurements},
        {"dataSource", reading.dataSource}
    };
}

inline void from_json(const nlohmann::json &j, Reading &reading)
{
    reading.locationId = j.value("locationId", "");
    reading.timestamp = fromIso8601Utc(j.value("timestamp", ""));
    if (j.contains("measurements") && j.at("measurements").is_object()) {
        reading.measurements = j.at("measurements").get<Measurements>();
    } else {
        reading.measurements = Measurements{};
    }
    reading.dataSource = j.value("dataSource", "");
}

inline void to_json(nlohmann::json &j, const ForecastPoint &point)
{
    j = nlohmann::json{
        {"locationId", point.locationId},
        {"forecastDate", toIsoDate(point.forecastDate)},
        {"issuedAt", toIso8601Utc(point.issuedAt)},
        {"source", point.source},
        {"measurements", point.measurements},
        {"confidence", point.confidence}
    };
}

inline void from_json(const nlohmann::json &j, ForecastPoint &point)
{
    point.locationId = j.value("locationId", "");
    point.forecastDate = fromIsoDate(j.value("forecastDate", ""));
    point.issuedAt = fromIso8601Utc(j.value("issuedAt", ""));
    point.source = j.value("source", "");
    if (j.contains("measurements") && j.at("measurements").is_object()) {
        point.measurements = j.at("measurements").get<Measurements>();
    } else {
        point.measurements = Measurements{};
    }
    point.confidence = j.value("confidence", 0.0);
}

inline void to_json(nlohmann::json &j, const AgriculturalMetric &metric)
{
    j = nlohmann::json{
        {"locationId", metric.locationId},
        {"kind", toMetricKindString(metric.kind)},
        {"available", metric.available()},
        {"value", optionalToJson(metric.value)},
        {"category", metric.category},
        {"windowStart", toIso8601Utc(metric.windowStart)},
        {"windowEnd", toIso8601Utc(metric.windowEnd)},
        {"computedAt", toIso8601Utc(metric.computedAt)}
    };
}

inline void to_json(nlohmann::json &j, const DailySummary &summary)
{
    j = nlohmann::json{
        {"day", toIsoDate(summary.day)},
        {"readingCount", summary.readingCount},
        {"meanTemperature", optionalToJson(summary.meanTemperature)},
        {"minTemperature", optionalToJson(summary.minTemperature)},
        {"maxTemperature", optionalToJson(summary.maxTemperature)},
        {"totalRainfall", optionalToJson(summary.totalRainfall)},
        {"meanHumidity", optionalToJson(summary.meanHumidity)},
        {"meanSoilMoisture", optionalToJson(summary.meanSoilMoisture)},
        {"lastSoilMoisture", optionalToJson(summary.lastSoilMoisture)},
        {"meanSoilTemperature", optionalToJson(summary.meanSoilTemperature)}
    };
}

inline void to_json(nlohmann::json &j, const Alert &alert)
{
    j = nlohmann::json{
        {"id", alert.id},
        {"locationId", alert.locationId},
        {"category", toAlertCategoryString(alert.category)},
        {"severity", toAlertSeverityString(alert.severity)},
        {"condition", alert.condition},
        {"recommendedAction", alert.recommendedAction},
        {"state", toAlertStateString(alert.state)},
        {"createdAt", toIso8601Utc(alert.createdAt)},
        {"updatedAt", toIso8601Utc(alert.updatedAt)},
        {"resolvedAt", alert.resolvedAt ? nlohmann::json(toIso8601Utc(*alert.resolvedAt))
                                        : nlohmann::json()},
        {"resolutionNotes", alert.resolutionNotes}
    };
}

inline void from_json(const nlohmann::json &j, Alert &alert)
{
    alert.id = j.value("id", "");
    alert.locationId = j.value("locationId", "");
    alert.category = parseAlertCategoryString(j.value("category", ""));
    alert.severity = parseAlertSeverityString(j.value("severity", ""));
    alert.condition = j.value("condition", "");
    alert.recommendedAction = j.value("recommendedAction", "");
    alert.state = parseAlertStateString(j.value("state", ""));
    alert.createdAt = fromIso8601Utc(j.value("createdAt", ""));
    alert.updatedAt = fromIso8601Utc(j.value("updatedAt", ""));
    if (j.contains("resolvedAt") && j.at("resolvedAt").is_string()) {
        alert.resolvedAt = fromIso8601Utc(j.at("resolvedAt").get<std::string>());
    } else {
        alert.resolvedAt.reset();
    }
    alert.resolutionNotes = j.value("resolutionNotes", "");
}

inline void to_json(nlohmann::json &j, const AlertTransition &transition)
{
    j = nlohmann::json{
        {"id", transition.id},
        {"alertId", transition.alertId},
        {"locationId", transition.locationId},
        {"category", toAlertCategoryString(transition.category)},
        {"fromState", transition.fromState},
        {"toState", transition.toState},
        {"severity", toAlertSeverityString(transition.severity)},
        {"reason", transition.reason},
        {"timestamp", toIso8601Utc(transition.timestamp)}
    };
}

inline void to_json(nlohmann::json &j, const NearbyLocation &nearby)
{
    j = nlohmann::json{
        {"location", nearby.location},
        {"distanceKm", nearby.distanceKm}
    };
}

inline void to_json(nlohmann::json &j, const AlertStatistics &stats)
{
    nlohmann::json bySeverity = nlohmann::json::object();
    for (const auto &item : stats.bySeverity) {
        bySeverity[toAlertSeverityString(item.first)] = item.second;
    }
    nlohmann::json byCategory = nlohmann::json::object();
    for (const auto &item : stats.byCategory) {
        byCategory[toAlertCategoryString(item.first)] = item.second;
    }
    j = nlohmann::json{
        {"locationId", stats.locationId},
        {"days", stats.days},
        {"since", toIso8601Utc(stats.since)},
        {"totalAlerts", stats.totalAlerts},
        {"bySeverity", bySeverity},
        {"byCategory", byCategory},
        {"resolvedAlerts", stats.resolvedAlerts},
        {"averageResolutionHours", optionalToJson(stats.averageResolutionHours)}
    };
}

inline void to_json(nlohmann::json &j, const WeeklyOutlook &week)
{
    j = nlohmann::json{
        {"weekStart", toIsoDate(week.weekStart)},
        {"forecastDays", week.forecastDays},
        {"averageTemperature", optionalToJson(week.averageTemperature)},
        {"totalRainfall", week.totalRainfall},
        {"frostDays", week.frostDays},
        {"heatStressDays", week.heatStressDays},
        {"favourableDays", week.favourableDays}
    };
}

inline void to_json(nlohmann::json &j, const MonthlyOutlook &outlook)
{
    j = nlohmann::json{
        {"locationId", outlook.locationId},
        {"firstDay", toIsoDate(outlook.firstDay)},
        {"weeks", outlook.weeks},
        {"totalRainfall", outlook.totalRainfall},
        {"averageFavourableDaysPerWeek", optionalToJson(outlook.averageFavourableDaysPerWeek)},
        {"extremeWeatherRisk", outlook.extremeWeatherRisk}
    };
}

} // namespace krishi
