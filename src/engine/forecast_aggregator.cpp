#include "engine/forecast_aggregator.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <utility>

#include "common/errors.hpp"
#include "common/logging.hpp"
#include "common/time_utils.hpp"

namespace krishi {

namespace {

using MeasurementField = std::optional<double> Measurements::*;

const MeasurementField kMeasurementFields[] = {
    &Measurements::temperature,
    &Measurements::humidity,
    &Measurements::rainfall,
    &Measurements::windSpeed,
    &Measurements::windDirection,
    &Measurements::soilTemperature,
    &Measurements::soilMoisture,
    &Measurements::solarRadiation,
};

std::optional<double> weightedMean(const std::vector<const ForecastPoint *> &points,
                                   MeasurementField field)
{
    double weightedSum = 0.0;
    double weightTotal = 0.0;
    double plainSum = 0.0;
    int count = 0;
    for (const ForecastPoint *point : points) {
        const std::optional<double> &value = point->measurements.*field;
        if (!value) {
            continue;
        }
        weightedSum += point->confidence * *value;
        weightTotal += point->confidence;
        plainSum += *value;
        ++count;
    }
    if (count == 0) {
        return std::nullopt;
    }
    if (weightTotal <= 0.0) {
        return plainSum / count;
    }
    return weightedSum / weightTotal;
}

} // namespace

ForecastAggregator::ForecastAggregator(CachedRepository &repository, const EngineConfig &config)
    : m_repository(repository)
    , m_config(config)
{
}

int ForecastAggregator::clampHorizon(int horizonDays) const
{
    if (horizonDays < 1) {
        throw InvalidArgumentError("forecast horizon must be at least one day");
    }
    return std::min(horizonDays, m_config.maxForecastHorizonDays);
}

std::vector<ForecastPoint> ForecastAggregator::combine(
    const std::string &locationId,
    const std::vector<ForecastPoint> &points,
    std::chrono::system_clock::time_point today,
    int horizonDays,
    double decayPerDay)
{
    const auto firstDay = startOfUtcDay(today);

    // Latest issue per (source, day).
    std::map<std::pair<std::string, long long>, const ForecastPoint *> latest;
    for (const auto &point : points) {
        if (point.locationId != locationId) {
            continue;
        }
        const auto key = std::make_pair(point.source, toEpochSeconds(startOfUtcDay(point.forecastDate)));
        auto it = latest.find(key);
        if (it == latest.end() || it->second->issuedAt < point.issuedAt) {
            latest[key] = &point;
        }
    }

    std::map<long long, std::vector<const ForecastPoint *>> byDay;
    for (const auto &item : latest) {
        byDay[item.first.second].push_back(item.second);
    }

    std::vector<ForecastPoint> combined;
    double previousConfidence = 1.0;
    for (int daysAhead = 0; daysAhead < horizonDays; ++daysAhead) {
        const auto day = addDays(firstDay, daysAhead);
        auto it = byDay.find(toEpochSeconds(day));
        if (it == byDay.end()) {
            continue;
        }
        const std::vector<const ForecastPoint *> &sources = it->second;

        ForecastPoint merged;
        merged.locationId = locationId;
        merged.forecastDate = day;
        merged.source = kAggregateSource;
        merged.issuedAt = sources.front()->issuedAt;

        double confidenceSum = 0.0;
        double confidenceSquares = 0.0;
        for (const ForecastPoint *source : sources) {
            confidenceSum += source->confidence;
            confidenceSquares += source->confidence * source->confidence;
            merged.issuedAt = std::max(merged.issuedAt, source->issuedAt);
        }
        for (MeasurementField field : kMeasurementFields) {
            merged.measurements.*field = weightedMean(sources, field);
        }

        const double base = confidenceSum > 0.0 ? confidenceSquares / confidenceSum : 0.0;
        const double decayed = base * std::pow(decayPerDay, daysAhead);
        merged.confidence = std::min(decayed, previousConfidence);
        previousConfidence = merged.confidence;
        combined.push_back(merged);
    }
    return combined;
}

std::vector<ForecastPoint> ForecastAggregator::aggregate(const std::string &locationId,
                                                         int horizonDays)
{
    return aggregate(locationId, horizonDays, std::chrono::system_clock::now(),
                     m_repository.defaultDeadline());
}

std::vector<ForecastPoint> ForecastAggregator::aggregate(const std::string &locationId,
                                                         int horizonDays,
                                                         std::chrono::system_clock::time_point asOf,
                                                         Deadline deadline)
{
    const int horizon = clampHorizon(horizonDays);
    m_repository.getLocation(locationId, deadline);

    std::vector<ForecastPoint> points;
    try {
        points = m_repository.getForecast(locationId, deadline).value;
    } catch (const NotFoundError &) {
        return {};
    }

    std::vector<ForecastPoint> combined =
        combine(locationId, points, asOf, horizon, m_config.forecastDecayPerDay);
    if (static_cast<int>(combined.size()) < horizon) {
        KRLOG_DEBUG(QStringLiteral("ForecastAggregator"),
                    QStringLiteral("aggregate"),
                    QStringLiteral("forecast_days_omitted"),
                    QStringLiteral("insufficient_data"),
                    QStringLiteral("confidence_weighted_merge"),
                    nlohmann::json{{"locationId", locationId},
                                   {"horizonDays", horizon},
                                   {"daysReturned", combined.size()}});
    }
    return combined;
}

std::size_t ForecastAggregator::refresh(const Location &location,
                                        const std::vector<ForecastSource *> &sources,
                                        int horizonDays)
{
    const int horizon = clampHorizon(horizonDays);

    std::vector<ForecastPoint> accepted;
    for (ForecastSource *source : sources) {
        if (!source) {
            continue;
        }
        std::vector<ForecastPoint> fetched;
        try {
            fetched = source->fetch(location, horizon);
        } catch (const std::exception &e) {
            KRLOG_WARN(QStringLiteral("ForecastAggregator"),
                       QStringLiteral("refresh"),
                       QStringLiteral("forecast_source_failed"),
                       QStringLiteral("source_error"),
                       QStringLiteral("skip_source"),
                       nlohmann::json{{"locationId", location.id},
                                      {"source", source->name()},
                                      {"error", e.what()}});
            continue;
        }

        for (auto &point : fetched) {
            if (point.locationId.empty()) {
                point.locationId = location.id;
            }
            if (point.source.empty()) {
                point.source = source->name();
            }
            point.forecastDate = startOfUtcDay(point.forecastDate);
            try {
                CachedRepository::validateForecastPoint(point);
            } catch (const InvalidArgumentError &e) {
                KRLOG_WARN(QStringLiteral("ForecastAggregator"),
                           QStringLiteral("refresh"),
                           QStringLiteral("forecast_point_rejected"),
                           QStringLiteral("validation_failed"),
                           QStringLiteral("skip_point"),
                           nlohmann::json{{"locationId", location.id},
                                          {"source", source->name()},
                                          {"error", e.what()}});
                continue;
            }
            if (point.locationId == location.id) {
                accepted.push_back(std::move(point));
            }
        }
    }

    m_repository.upsertForecast(accepted);

    KRLOG_INFO(QStringLiteral("ForecastAggregator"),
               QStringLiteral("refresh"),
               QStringLiteral("forecast_refreshed"),
               QStringLiteral("source_pull"),
               QStringLiteral("upsert_forecast"),
               nlohmann::json{{"locationId", location.id},
                              {"sources", sources.size()},
                              {"points", accepted.size()}});
    return accepted.size();
}

} // namespace krishi
