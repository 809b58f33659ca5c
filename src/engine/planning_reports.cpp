#include "engine/planning_reports.hpp"

#include "common/errors.hpp"
#include "common/time_utils.hpp"

namespace krishi {

namespace {

constexpr double kHeatStressCelsius = 35.0;
constexpr double kFavourableMinCelsius = 15.0;
constexpr double kFavourableMaxCelsius = 30.0;
// More risky days than this in any week marks the month as extreme.
constexpr int kExtremeDaysPerWeek = 2;

const AlertSeverity kSeverities[] = {
    AlertSeverity::Low, AlertSeverity::Medium, AlertSeverity::High, AlertSeverity::Extreme};

const AlertCategory kCategories[] = {
    AlertCategory::FloodRisk, AlertCategory::HeatAdvisory, AlertCategory::FrostWarning,
    AlertCategory::IrrigationAdvisory, AlertCategory::DiseaseRisk};

} // namespace

void PlanningReports::validateStatisticsDays(int days)
{
    if (days < 1 || days > kMaxStatisticsDays) {
        throw InvalidArgumentError("statistics window must be between 1 and "
                                   + std::to_string(kMaxStatisticsDays) + " days");
    }
}

AlertStatistics PlanningReports::alertStatistics(const std::string &locationId,
                                                 const std::vector<Alert> &alerts,
                                                 int days,
                                                 std::chrono::system_clock::time_point now)
{
    validateStatisticsDays(days);

    AlertStatistics stats;
    stats.locationId = locationId;
    stats.days = days;
    stats.since = now - std::chrono::hours(24) * days;
    for (AlertSeverity severity : kSeverities) {
        stats.bySeverity[severity] = 0;
    }
    for (AlertCategory category : kCategories) {
        stats.byCategory[category] = 0;
    }

    double resolvedHours = 0.0;
    for (const Alert &alert : alerts) {
        if (alert.locationId != locationId || alert.createdAt < stats.since) {
            continue;
        }
        ++stats.totalAlerts;
        ++stats.bySeverity[alert.severity];
        ++stats.byCategory[alert.category];
        if (alert.state == AlertState::Resolved && alert.resolvedAt) {
            const auto open = *alert.resolvedAt - alert.createdAt;
            resolvedHours += std::chrono::duration<double, std::ratio<3600>>(open).count();
            ++stats.resolvedAlerts;
        }
    }
    if (stats.resolvedAlerts > 0) {
        stats.averageResolutionHours = resolvedHours / stats.resolvedAlerts;
    }
    return stats;
}

MonthlyOutlook PlanningReports::monthlyOutlook(const std::string &locationId,
                                               const std::vector<ForecastPoint> &daily,
                                               std::chrono::system_clock::time_point today,
                                               const AlertThresholds &thresholds)
{
    MonthlyOutlook outlook;
    outlook.locationId = locationId;
    outlook.firstDay = startOfUtcDay(today);

    int favourableTotal = 0;
    for (int week = 0; week < kOutlookWeeks; ++week) {
        WeeklyOutlook summary;
        summary.weekStart = addDays(outlook.firstDay, week * 7);
        const auto weekEnd = addDays(summary.weekStart, 7);

        double temperatureSum = 0.0;
        int temperatureCount = 0;
        for (const ForecastPoint &point : daily) {
            if (point.forecastDate < summary.weekStart || point.forecastDate >= weekEnd) {
                continue;
            }
            ++summary.forecastDays;
            summary.totalRainfall += point.measurements.rainfall.value_or(0.0);
            if (!point.measurements.temperature) {
                continue;
            }
            const double temperature = *point.measurements.temperature;
            temperatureSum += temperature;
            ++temperatureCount;
            if (temperature <= thresholds.lowTemperatureCelsius) {
                ++summary.frostDays;
            }
            if (temperature >= kHeatStressCelsius) {
                ++summary.heatStressDays;
            }
            if (temperature >= kFavourableMinCelsius && temperature <= kFavourableMaxCelsius) {
                ++summary.favourableDays;
            }
        }
        if (summary.forecastDays == 0) {
            continue;
        }
        if (temperatureCount > 0) {
            summary.averageTemperature = temperatureSum / temperatureCount;
        }

        outlook.totalRainfall += summary.totalRainfall;
        favourableTotal += summary.favourableDays;
        if (summary.frostDays > kExtremeDaysPerWeek
            || summary.heatStressDays > kExtremeDaysPerWeek) {
            outlook.extremeWeatherRisk = true;
        }
        outlook.weeks.push_back(summary);
    }

    if (!outlook.weeks.empty()) {
        outlook.averageFavourableDaysPerWeek =
            static_cast<double>(favourableTotal) / outlook.weeks.size();
    }
    return outlook;
}

} // namespace krishi
