#pragma once

#include <array>
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "common/config.hpp"
#include "common/models.hpp"
#include "engine/cached_repository.hpp"
#include "engine/crop_profiles.hpp"
#include "engine/forecast_aggregator.hpp"

namespace krishi {

enum class RuleOutcome {
    Triggered,
    Clear,
    // Inputs missing: the alert state is left untouched.
    Unknown
};

struct RuleResult {
    AlertCategory category = AlertCategory::FloodRisk;
    RuleOutcome outcome = RuleOutcome::Unknown;
    AlertSeverity severity = AlertSeverity::Medium;
    std::string condition;
    std::string recommendedAction;
};

struct EvaluationInputs {
    std::optional<Reading> current;
    // Readings covering the dry-streak window, ascending.
    std::vector<Reading> history;
    // Aggregated forecast from today on.
    std::vector<ForecastPoint> forecast;
    std::chrono::system_clock::time_point today;
};

struct EvaluationReport {
    std::string locationId;
    std::vector<Alert> created;
    std::vector<Alert> updated;
    std::vector<Alert> resolved;
    std::vector<AlertCategory> unknown;
    int suppressed = 0;
};

/**
 * Applies the alert rules to a location and moves each (location, category)
 * alert through None -> Active -> Resolved.
 *
 * Rules run in AlertCategory declaration order. A triggered rule creates the
 * Active alert or refreshes it in place, keeping its created-at; a cleared
 * rule resolves it. Transitions of one (location, category) are serialized
 * through a striped lock, so at most one Active alert exists per pair.
 */
class AlertEvaluator
{
public:
    AlertEvaluator(CachedRepository &repository,
                   ForecastAggregator &forecasts,
                   const CropProfileProvider &crops,
                   const EngineConfig &config);

    EvaluationReport evaluate(const std::string &locationId, const std::string &cropId = {});
    EvaluationReport evaluate(const std::string &locationId,
                              const std::string &cropId,
                              std::chrono::system_clock::time_point now,
                              Deadline deadline);

    // Idempotent: resolving a Resolved alert returns it unchanged.
    Alert resolve(const std::string &alertId, const std::string &notes = {});
    Alert resolve(const std::string &alertId,
                  const std::string &notes,
                  std::chrono::system_clock::time_point now,
                  Deadline deadline);

    static std::vector<RuleResult> applyRules(const EvaluationInputs &inputs,
                                              const AlertThresholds &thresholds,
                                              const CropThresholds &crop);

    static std::string recommendedActionFor(AlertCategory category);

private:
    static constexpr std::size_t kLockStripes = 64;

    std::mutex &lockFor(const std::string &locationId, AlertCategory category);
    void applyOutcome(const std::string &locationId,
                      const RuleResult &result,
                      std::chrono::system_clock::time_point now,
                      Deadline deadline,
                      EvaluationReport &report);
    void recordTransition(const Alert &alert,
                          const std::string &fromState,
                          const std::string &reason,
                          std::chrono::system_clock::time_point now);

    CachedRepository &m_repository;
    ForecastAggregator &m_forecasts;
    const CropProfileProvider &m_crops;
    EngineConfig m_config;
    std::array<std::mutex, kLockStripes> m_locks;
};

} // namespace krishi
