#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "common/config.hpp"
#include "common/models.hpp"
#include "engine/cached_repository.hpp"

namespace krishi {

// A provider of raw forecast points. Each point carries its own confidence.
class ForecastSource
{
public:
    virtual ~ForecastSource() = default;

    virtual std::string name() const = 0;
    virtual std::vector<ForecastPoint> fetch(const Location &location, int horizonDays) = 0;
};

/**
 * Merges the forecast points of every source into one point per day.
 *
 * Only the latest issue of each (source, day) counts. Measurements are
 * confidence-weighted means over the sources that carry them. The combined
 * confidence is the confidence-weighted mean of the source confidences
 * discounted by decayPerDay^daysAhead, and never exceeds the previous day's.
 * Days without any source point are left out.
 */
class ForecastAggregator
{
public:
    ForecastAggregator(CachedRepository &repository, const EngineConfig &config);

    std::vector<ForecastPoint> aggregate(const std::string &locationId, int horizonDays);
    std::vector<ForecastPoint> aggregate(const std::string &locationId,
                                         int horizonDays,
                                         std::chrono::system_clock::time_point asOf,
                                         Deadline deadline);

    // Pulls every source and stores the points. Returns how many were stored.
    std::size_t refresh(const Location &location,
                        const std::vector<ForecastSource *> &sources,
                        int horizonDays);

    int clampHorizon(int horizonDays) const;

    static std::vector<ForecastPoint> combine(const std::string &locationId,
                                              const std::vector<ForecastPoint> &points,
                                              std::chrono::system_clock::time_point today,
                                              int horizonDays,
                                              double decayPerDay);

    static constexpr const char *kAggregateSource = "aggregate";

private:
    CachedRepository &m_repository;
    EngineConfig m_config;
};

} // namespace krishi
