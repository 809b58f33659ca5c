#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "common/config.hpp"
#include "common/models.hpp"

namespace krishi {

/**
 * Planning views derived from stored alerts and forecasts.
 *
 * Both are pure functions of their inputs; WeatherAnalytics fetches the data
 * through the cached repository and passes it in.
 */
class PlanningReports
{
public:
    static constexpr int kDefaultStatisticsDays = 30;
    static constexpr int kMaxStatisticsDays = 366;
    static constexpr int kOutlookWeeks = 4;

    // Counts the alerts created within the last `days` days before `now`.
    static AlertStatistics alertStatistics(const std::string &locationId,
                                           const std::vector<Alert> &alerts,
                                           int days,
                                           std::chrono::system_clock::time_point now);

    // `daily` holds at most one point per UTC day, as produced by
    // ForecastAggregator::combine. Frost days are at or below
    // lowTemperatureCelsius.
    static MonthlyOutlook monthlyOutlook(const std::string &locationId,
                                         const std::vector<ForecastPoint> &daily,
                                         std::chrono::system_clock::time_point today,
                                         const AlertThresholds &thresholds);

    static void validateStatisticsDays(int days);
};

} // namespace krishi
