#include "engine/metrics_engine.hpp"

#include <algorithm>
#include <cmath>
#include <map>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/time_utils.hpp"

namespace krishi {

namespace {

constexpr double kModerateHeatIndex = 27.0;
constexpr double kSevereHeatIndex = 32.0;
constexpr double kExtremeHeatIndex = 41.0;

constexpr double kColdSoilCelsius = 10.0;
constexpr double kHotSoilCelsius = 35.0;

constexpr double kTrendThreshold = 0.1;

double toFahrenheit(double celsius)
{
    return celsius * 9.0 / 5.0 + 32.0;
}

double toCelsius(double fahrenheit)
{
    return (fahrenheit - 32.0) * 5.0 / 9.0;
}

struct DayAccumulator {
    int readingCount = 0;
    int temperatureCount = 0;
    double temperatureSum = 0.0;
    double temperatureMin = 0.0;
    double temperatureMax = 0.0;
    bool hasRainfall = false;
    double rainfallSum = 0.0;
    int humidityCount = 0;
    double humiditySum = 0.0;
    int soilMoistureCount = 0;
    double soilMoistureSum = 0.0;
    std::optional<double> lastSoilMoisture;
    std::chrono::system_clock::time_point lastSoilMoistureAt;
    int soilTemperatureCount = 0;
    double soilTemperatureSum = 0.0;

    void add(const Reading &reading)
    {
        const Measurements &m = reading.measurements;
        ++readingCount;
        if (m.temperature) {
            if (temperatureCount == 0) {
                temperatureMin = *m.temperature;
                temperatureMax = *m.temperature;
            } else {
                temperatureMin = std::min(temperatureMin, *m.temperature);
                temperatureMax = std::max(temperatureMax, *m.temperature);
            }
            temperatureSum += *m.temperature;
            ++temperatureCount;
        }
        if (m.rainfall) {
            hasRainfall = true;
            rainfallSum += *m.rainfall;
        }
        if (m.humidity) {
            humiditySum += *m.humidity;
            ++humidityCount;
        }
        if (m.soilMoisture) {
            soilMoistureSum += *m.soilMoisture;
            ++soilMoistureCount;
            if (!lastSoilMoisture || reading.timestamp >= lastSoilMoistureAt) {
                lastSoilMoisture = m.soilMoisture;
                lastSoilMoistureAt = reading.timestamp;
            }
        }
        if (m.soilTemperature) {
            soilTemperatureSum += *m.soilTemperature;
            ++soilTemperatureCount;
        }
    }
};

std::optional<double> meanOf(double sum, int count)
{
    if (count == 0) {
        return std::nullopt;
    }
    return sum / count;
}

AgriculturalMetric pointMetric(const Reading &reading, MetricKind kind,
                               std::chrono::system_clock::time_point asOf)
{
    AgriculturalMetric metric;
    metric.locationId = reading.locationId;
    metric.kind = kind;
    metric.windowStart = reading.timestamp;
    metric.windowEnd = reading.timestamp;
    metric.computedAt = asOf;
    return metric;
}

} // namespace

double MetricsEngine::heatIndexCelsius(double temperatureCelsius, double humidityPercent)
{
    const double t = toFahrenheit(temperatureCelsius);
    const double rh = humidityPercent;

    const double simple = 0.5 * (t + 61.0 + (t - 68.0) * 1.2 + rh * 0.094);
    if ((simple + t) / 2.0 < 80.0) {
        return toCelsius(simple);
    }

    double hi = -42.379 + 2.04901523 * t + 10.14333127 * rh
        - 0.22475541 * t * rh - 0.00683783 * t * t
        - 0.05481717 * rh * rh + 0.00122874 * t * t * rh
        + 0.00085282 * t * rh * rh - 0.00000199 * t * t * rh * rh;

    if (rh < 13.0 && t >= 80.0 && t <= 112.0) {
        hi -= ((13.0 - rh) / 4.0) * std::sqrt((17.0 - std::fabs(t - 95.0)) / 17.0);
    } else if (rh > 85.0 && t >= 80.0 && t <= 87.0) {
        hi += ((rh - 85.0) / 10.0) * ((87.0 - t) / 5.0);
    }
    return toCelsius(hi);
}

std::optional<double> MetricsEngine::heatIndexCelsius(const Measurements &measurements)
{
    if (!measurements.temperature || !measurements.humidity) {
        return std::nullopt;
    }
    return heatIndexCelsius(*measurements.temperature, *measurements.humidity);
}

HeatStressLevel MetricsEngine::classifyHeatStress(double heatIndex)
{
    if (heatIndex >= kExtremeHeatIndex) {
        return HeatStressLevel::Extreme;
    }
    if (heatIndex >= kSevereHeatIndex) {
        return HeatStressLevel::Severe;
    }
    if (heatIndex >= kModerateHeatIndex) {
        return HeatStressLevel::Moderate;
    }
    return HeatStressLevel::None;
}

std::optional<HeatStressLevel> MetricsEngine::heatStress(const Measurements &measurements)
{
    const auto heatIndex = heatIndexCelsius(measurements);
    if (!heatIndex) {
        return std::nullopt;
    }
    return classifyHeatStress(*heatIndex);
}

void MetricsEngine::validateMoistureThresholds(const CropThresholds &thresholds)
{
    const double dry = thresholds.dryBelowPercent;
    const double saturated = thresholds.saturatedAbovePercent;
    if (!std::isfinite(dry) || !std::isfinite(saturated)
        || dry < 0.0 || saturated > 100.0 || dry >= saturated) {
        throw InvalidConfigurationError("malformed soil moisture bands for crop "
                                        + thresholds.cropId + ": dry below "
                                        + std::to_string(dry) + ", saturated above "
                                        + std::to_string(saturated));
    }
}

SoilMoistureCategory MetricsEngine::classifySoilMoisture(double moisturePercent,
                                                         const CropThresholds &thresholds)
{
    validateMoistureThresholds(thresholds);
    if (moisturePercent < thresholds.dryBelowPercent) {
        return SoilMoistureCategory::Dry;
    }
    if (moisturePercent > thresholds.saturatedAbovePercent) {
        return SoilMoistureCategory::Saturated;
    }
    return SoilMoistureCategory::Optimal;
}

SoilTemperatureStatus MetricsEngine::classifySoilTemperature(double soilTemperatureCelsius)
{
    if (soilTemperatureCelsius < kColdSoilCelsius) {
        return SoilTemperatureStatus::Cold;
    }
    if (soilTemperatureCelsius > kHotSoilCelsius) {
        return SoilTemperatureStatus::Hot;
    }
    return SoilTemperatureStatus::Optimal;
}

std::optional<double> MetricsEngine::growingDegreeDays(
    const std::vector<Reading> &readings,
    std::chrono::system_clock::time_point from,
    std::chrono::system_clock::time_point to,
    double baseCelsius)
{
    if (from > to) {
        throw InvalidArgumentError("growing degree day window starts after it ends");
    }

    const auto firstDay = startOfUtcDay(from);
    const auto lastDay = startOfUtcDay(to);

    std::map<long long, DayAccumulator> days;
    for (const auto &reading : readings) {
        const auto day = startOfUtcDay(reading.timestamp);
        if (day < firstDay || day > lastDay) {
            continue;
        }
        days[toEpochSeconds(day)].add(reading);
    }

    double total = 0.0;
    for (auto day = firstDay; day <= lastDay; day = addDays(day, 1)) {
        auto it = days.find(toEpochSeconds(day));
        if (it == days.end() || it->second.temperatureCount == 0) {
            return std::nullopt;
        }
        const double mean = (it->second.temperatureMin + it->second.temperatureMax) / 2.0;
        total += std::max(0.0, mean - baseCelsius);
    }
    return total;
}

std::optional<double> MetricsEngine::growingDegreeDays(const std::vector<ForecastPoint> &points,
                                                       double baseCelsius)
{
    if (points.empty()) {
        return std::nullopt;
    }
    double total = 0.0;
    for (const auto &point : points) {
        if (!point.measurements.temperature) {
            return std::nullopt;
        }
        total += std::max(0.0, *point.measurements.temperature - baseCelsius);
    }
    return total;
}

std::vector<DailySummary> MetricsEngine::dailySummaries(const std::vector<Reading> &readings)
{
    std::map<long long, DayAccumulator> days;
    for (const auto &reading : readings) {
        days[toEpochSeconds(startOfUtcDay(reading.timestamp))].add(reading);
    }

    std::vector<DailySummary> summaries;
    summaries.reserve(days.size());
    for (const auto &item : days) {
        const DayAccumulator &acc = item.second;
        DailySummary summary;
        summary.day = fromEpochSeconds(item.first);
        summary.readingCount = acc.readingCount;
        summary.meanTemperature = meanOf(acc.temperatureSum, acc.temperatureCount);
        if (acc.temperatureCount > 0) {
            summary.minTemperature = acc.temperatureMin;
            summary.maxTemperature = acc.temperatureMax;
        }
        if (acc.hasRainfall) {
            summary.totalRainfall = acc.rainfallSum;
        }
        summary.meanHumidity = meanOf(acc.humiditySum, acc.humidityCount);
        summary.meanSoilMoisture = meanOf(acc.soilMoistureSum, acc.soilMoistureCount);
        summary.lastSoilMoisture = acc.lastSoilMoisture;
        summary.meanSoilTemperature = meanOf(acc.soilTemperatureSum, acc.soilTemperatureCount);
        summaries.push_back(summary);
    }
    return summaries;
}

Trend MetricsEngine::classifyTrend(const std::vector<double> &values)
{
    if (values.size() < 2) {
        return Trend::Stable;
    }

    const std::size_t half = values.size() / 2;
    double firstSum = 0.0;
    double secondSum = 0.0;
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i < half) {
            firstSum += values[i];
        } else {
            secondSum += values[i];
        }
    }
    const double diff = secondSum / static_cast<double>(values.size() - half)
        - firstSum / static_cast<double>(half);
    if (std::fabs(diff) < kTrendThreshold) {
        return Trend::Stable;
    }
    return diff > 0 ? Trend::Increasing : Trend::Decreasing;
}

AgriculturalMetric MetricsEngine::heatStressMetric(const Reading &reading,
                                                   std::chrono::system_clock::time_point asOf)
{
    AgriculturalMetric metric = pointMetric(reading, MetricKind::HeatStressIndex, asOf);
    metric.value = heatIndexCelsius(reading.measurements);
    if (metric.value) {
        metric.category = toHeatStressString(classifyHeatStress(*metric.value));
    }
    return metric;
}

AgriculturalMetric MetricsEngine::soilMoistureMetric(const Reading &reading,
                                                     const CropThresholds &thresholds,
                                                     std::chrono::system_clock::time_point asOf)
{
    validateMoistureThresholds(thresholds);
    AgriculturalMetric metric = pointMetric(reading, MetricKind::SoilMoistureCategory, asOf);
    metric.value = reading.measurements.soilMoisture;
    if (metric.value) {
        metric.category = toSoilMoistureString(classifySoilMoisture(*metric.value, thresholds));
    }
    return metric;
}

AgriculturalMetric MetricsEngine::soilTemperatureMetric(const Reading &reading,
                                                        std::chrono::system_clock::time_point asOf)
{
    AgriculturalMetric metric = pointMetric(reading, MetricKind::SoilTemperatureStatus, asOf);
    metric.value = reading.measurements.soilTemperature;
    if (metric.value) {
        metric.category = toSoilTemperatureString(classifySoilTemperature(*metric.value));
    }
    return metric;
}

AgriculturalMetric MetricsEngine::growingDegreeDaysMetric(
    const std::string &locationId,
    const std::vector<Reading> &readings,
    std::chrono::system_clock::time_point from,
    std::chrono::system_clock::time_point to,
    const CropThresholds &thresholds,
    std::chrono::system_clock::time_point asOf)
{
    AgriculturalMetric metric;
    metric.locationId = locationId;
    metric.kind = MetricKind::GrowingDegreeDays;
    metric.windowStart = from;
    metric.windowEnd = to;
    metric.computedAt = asOf;
    metric.value = growingDegreeDays(readings, from, to, thresholds.gddBaseCelsius);
    return metric;
}

std::vector<AgriculturalMetric> MetricsEngine::computeAll(
    const Reading &current,
    const std::vector<Reading> &history,
    std::chrono::system_clock::time_point from,
    std::chrono::system_clock::time_point to,
    const CropThresholds &thresholds,
    std::chrono::system_clock::time_point asOf)
{
    validateMoistureThresholds(thresholds);

    std::vector<AgriculturalMetric> metrics;
    metrics.push_back(heatStressMetric(current, asOf));
    metrics.push_back(soilMoistureMetric(current, thresholds, asOf));
    metrics.push_back(growingDegreeDaysMetric(current.locationId, history, from, to,
                                              thresholds, asOf));
    metrics.push_back(soilTemperatureMetric(current, asOf));
    return metrics;
}

} // namespace krishi
