#include "engine/alert_evaluator.hpp"

#include <QUuid>

#include <algorithm>
#include <functional>
#include <iomanip>
#include <map>
#include <sstream>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/time_utils.hpp"
#include "engine/metrics_engine.hpp"

namespace krishi {

namespace {

std::string formatValue(double value)
{
    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << value;
    return out.str();
}

std::string newId()
{
    return QUuid::createUuid().toString(QUuid::WithoutBraces).toStdString();
}

RuleResult makeResult(AlertCategory category)
{
    RuleResult result;
    result.category = category;
    result.recommendedAction = AlertEvaluator::recommendedActionFor(category);
    return result;
}

std::optional<double> observedRainfall24h(const EvaluationInputs &inputs)
{
    if (!inputs.current) {
        return std::nullopt;
    }
    if (inputs.history.empty()) {
        return inputs.current->measurements.rainfall;
    }

    const auto end = inputs.current->timestamp;
    const auto start = end - std::chrono::hours(24);
    std::optional<double> total;
    for (const auto &reading : inputs.history) {
        if (reading.timestamp <= start || reading.timestamp > end
            || !reading.measurements.rainfall) {
            continue;
        }
        total = total.value_or(0.0) + *reading.measurements.rainfall;
    }
    return total;
}

RuleResult floodRule(const EvaluationInputs &inputs, const AlertThresholds &thresholds)
{
    RuleResult result = makeResult(AlertCategory::FloodRisk);

    std::optional<double> expected;
    for (const auto &point : inputs.forecast) {
        const long long ahead = daysBetween(inputs.today, point.forecastDate);
        if (ahead < 0 || ahead > 1 || !point.measurements.rainfall) {
            continue;
        }
        expected = std::max(expected.value_or(0.0), *point.measurements.rainfall);
    }
    const std::optional<double> observed = observedRainfall24h(inputs);

    if (!expected && !observed) {
        return result;
    }

    const double worst = std::max(expected.value_or(0.0), observed.value_or(0.0));
    if (worst <= thresholds.floodRainfallMm) {
        result.outcome = RuleOutcome::Clear;
        return result;
    }

    result.outcome = RuleOutcome::Triggered;
    result.severity = worst >= 2.0 * thresholds.floodRainfallMm ? AlertSeverity::Extreme
                                                                : AlertSeverity::High;
    const bool fromForecast = expected && *expected >= observed.value_or(0.0);
    result.condition = "Rainfall of " + formatValue(worst) + " mm "
        + (fromForecast ? "forecast" : "observed") + " within 24h (threshold "
        + formatValue(thresholds.floodRainfallMm) + " mm)";
    return result;
}

RuleResult heatRule(const EvaluationInputs &inputs)
{
    RuleResult result = makeResult(AlertCategory::HeatAdvisory);
    if (!inputs.current) {
        return result;
    }
    const auto heatIndex = MetricsEngine::heatIndexCelsius(inputs.current->measurements);
    if (!heatIndex) {
        return result;
    }
    if (MetricsEngine::classifyHeatStress(*heatIndex) != HeatStressLevel::Extreme) {
        result.outcome = RuleOutcome::Clear;
        return result;
    }
    result.outcome = RuleOutcome::Triggered;
    result.severity = AlertSeverity::Extreme;
    result.condition = "Extreme heat stress, heat index " + formatValue(*heatIndex) + " C";
    return result;
}

RuleResult frostRule(const EvaluationInputs &inputs, const AlertThresholds &thresholds)
{
    RuleResult result = makeResult(AlertCategory::FrostWarning);
    if (!inputs.current || !inputs.current->measurements.temperature) {
        return result;
    }
    const double temperature = *inputs.current->measurements.temperature;
    if (temperature > thresholds.frostWarningCelsius) {
        result.outcome = RuleOutcome::Clear;
        return result;
    }
    result.outcome = RuleOutcome::Triggered;
    result.severity = temperature <= thresholds.lowTemperatureCelsius ? AlertSeverity::High
                                                                      : AlertSeverity::Medium;
    result.condition = "Temperature " + formatValue(temperature) + " C at or below "
        + formatValue(thresholds.frostWarningCelsius) + " C";
    return result;
}

RuleResult irrigationRule(const EvaluationInputs &inputs,
                          const AlertThresholds &thresholds,
                          const CropThresholds &crop)
{
    RuleResult result = makeResult(AlertCategory::IrrigationAdvisory);
    if (!inputs.current) {
        return result;
    }

    std::vector<Reading> readings = inputs.history;
    readings.push_back(*inputs.current);
    std::map<long long, std::optional<double>> lastMoistureByDay;
    for (const auto &summary : MetricsEngine::dailySummaries(readings)) {
        lastMoistureByDay[toEpochSeconds(summary.day)] = summary.lastSoilMoisture;
    }

    const auto lastDay = startOfUtcDay(inputs.current->timestamp);
    bool missing = false;
    std::optional<double> latest;
    for (int back = 0; back < thresholds.dryConsecutiveDays; ++back) {
        auto it = lastMoistureByDay.find(toEpochSeconds(addDays(lastDay, -back)));
        if (it == lastMoistureByDay.end() || !it->second) {
            missing = true;
            continue;
        }
        if (back == 0) {
            latest = it->second;
        }
        if (MetricsEngine::classifySoilMoisture(*it->second, crop) != SoilMoistureCategory::Dry) {
            // One known non-dry day breaks the streak whatever else is missing.
            result.outcome = RuleOutcome::Clear;
            return result;
        }
    }
    if (missing) {
        return result;
    }

    result.outcome = RuleOutcome::Triggered;
    result.severity = *latest < crop.dryBelowPercent / 2.0 ? AlertSeverity::High
                                                           : AlertSeverity::Medium;
    result.condition = "Soil moisture below " + formatValue(crop.dryBelowPercent) + "% for "
        + std::to_string(thresholds.dryConsecutiveDays) + " consecutive days (latest "
        + formatValue(*latest) + "%)";
    return result;
}

RuleResult diseaseRule(const EvaluationInputs &inputs, const AlertThresholds &thresholds)
{
    RuleResult result = makeResult(AlertCategory::DiseaseRisk);
    if (!inputs.current || !inputs.current->measurements.humidity
        || !inputs.current->measurements.temperature) {
        return result;
    }
    const double humidity = *inputs.current->measurements.humidity;
    const double temperature = *inputs.current->measurements.temperature;
    if (humidity < thresholds.highHumidityPercent
        || temperature < thresholds.diseaseMinTemperatureCelsius) {
        result.outcome = RuleOutcome::Clear;
        return result;
    }
    result.outcome = RuleOutcome::Triggered;
    result.severity = AlertSeverity::Medium;
    result.condition = "Humidity " + formatValue(humidity) + "% with temperature "
        + formatValue(temperature) + " C favours fungal disease";
    return result;
}

} // namespace

AlertEvaluator::AlertEvaluator(CachedRepository &repository,
                               ForecastAggregator &forecasts,
                               const CropProfileProvider &crops,
                               const EngineConfig &config)
    : m_repository(repository)
    , m_forecasts(forecasts)
    , m_crops(crops)
    , m_config(config)
{
}

std::string AlertEvaluator::recommendedActionFor(AlertCategory category)
{
    switch (category) {
    case AlertCategory::FloodRisk:
        return "Clear field drainage channels and postpone fertilizer application.";
    case AlertCategory::HeatAdvisory:
        return "Irrigate in the early morning or evening and provide shade for nurseries and livestock.";
    case AlertCategory::FrostWarning:
        return "Apply light irrigation in the evening and cover sensitive seedlings overnight.";
    case AlertCategory::IrrigationAdvisory:
        return "Schedule irrigation; soil moisture has stayed below the crop's dry threshold.";
    case AlertCategory::DiseaseRisk:
        return "Inspect crops for fungal infection and consider a preventive fungicide spray.";
    }
    return {};
}

std::vector<RuleResult> AlertEvaluator::applyRules(const EvaluationInputs &inputs,
                                                   const AlertThresholds &thresholds,
                                                   const CropThresholds &crop)
{
    MetricsEngine::validateMoistureThresholds(crop);
    return {
        floodRule(inputs, thresholds),
        heatRule(inputs),
        frostRule(inputs, thresholds),
        irrigationRule(inputs, thresholds, crop),
        diseaseRule(inputs, thresholds),
    };
}

std::mutex &AlertEvaluator::lockFor(const std::string &locationId, AlertCategory category)
{
    const std::size_t hash = std::hash<std::string>{}(locationId)
        ^ (std::hash<int>{}(static_cast<int>(category)) << 1);
    return m_locks[hash % kLockStripes];
}

EvaluationReport AlertEvaluator::evaluate(const std::string &locationId, const std::string &cropId)
{
    return evaluate(locationId, cropId, std::chrono::system_clock::now(),
                    m_repository.defaultDeadline());
}

EvaluationReport AlertEvaluator::evaluate(const std::string &locationId,
                                          const std::string &cropId,
                                          std::chrono::system_clock::time_point now,
                                          Deadline deadline)
{
    logging::CorrelationScope logScope(QString(), locationId);
    const CropThresholds crop = resolveThresholds(m_crops, cropId);
    MetricsEngine::validateMoistureThresholds(crop);
    m_repository.getLocation(locationId, deadline);

    EvaluationInputs inputs;
    inputs.today = startOfUtcDay(now);
    try {
        inputs.current = m_repository.getCurrent(locationId, deadline).value;
    } catch (const NotFoundError &) {
        inputs.current.reset();
    }

    if (inputs.current) {
        // Covers both the dry streak and the 24 hours of observed rainfall.
        const auto streakStart = addDays(startOfUtcDay(inputs.current->timestamp),
                                         -(m_config.alertThresholds.dryConsecutiveDays - 1));
        const auto from = std::min(streakStart,
                                   inputs.current->timestamp - std::chrono::hours(24));
        try {
            inputs.history =
                m_repository.getHistory(locationId, from, inputs.current->timestamp, deadline).value;
        } catch (const NotFoundError &) {
            inputs.history.clear();
        }
    }

    inputs.forecast = m_forecasts.aggregate(locationId, 2, now, deadline);

    EvaluationReport report;
    report.locationId = locationId;
    for (const RuleResult &result : applyRules(inputs, m_config.alertThresholds, crop)) {
        applyOutcome(locationId, result, now, deadline, report);
    }

    KRLOG_INFO(QStringLiteral("AlertEvaluator"),
               QStringLiteral("evaluate"),
               QStringLiteral("alerts_evaluated"),
               QStringLiteral("rule_pass"),
               QStringLiteral("ordered_threshold_rules"),
               nlohmann::json{{"cropId", crop.cropId},
                              {"created", report.created.size()},
                              {"updated", report.updated.size()},
                              {"resolved", report.resolved.size()},
                              {"suppressed", report.suppressed},
                              {"unknown", report.unknown.size()}});
    return report;
}

void AlertEvaluator::applyOutcome(const std::string &locationId,
                                  const RuleResult &result,
                                  std::chrono::system_clock::time_point now,
                                  Deadline deadline,
                                  EvaluationReport &report)
{
    if (result.outcome == RuleOutcome::Unknown) {
        report.unknown.push_back(result.category);
        return;
    }

    std::lock_guard<std::mutex> lock(lockFor(locationId, result.category));

    const auto active = m_repository.listActiveAlerts(locationId, deadline);
    if (active.stale) {
        throw BackendUnavailableError("alert state for " + locationId + " is unavailable");
    }
    auto existing = std::find_if(active.value.begin(), active.value.end(),
                                 [&result](const Alert &alert) {
                                     return alert.category == result.category;
                                 });

    if (result.outcome == RuleOutcome::Clear) {
        if (existing == active.value.end()) {
            return;
        }
        Alert alert = *existing;
        alert.state = AlertState::Resolved;
        alert.resolvedAt = now;
        alert.updatedAt = now;
        alert.resolutionNotes = "Condition cleared";
        m_repository.saveAlert(alert, deadline);
        recordTransition(alert, toAlertStateString(AlertState::Active),
                         "condition cleared", now);
        report.resolved.push_back(alert);
        return;
    }

    if (existing == active.value.end()) {
        Alert alert;
        alert.id = newId();
        alert.locationId = locationId;
        alert.category = result.category;
        alert.severity = result.severity;
        alert.condition = result.condition;
        alert.recommendedAction = result.recommendedAction;
        alert.state = AlertState::Active;
        alert.createdAt = now;
        alert.updatedAt = now;
        m_repository.saveAlert(alert, deadline);
        recordTransition(alert, "none", result.condition, now);
        report.created.push_back(alert);
        return;
    }

    Alert alert = *existing;
    if (alert.severity == result.severity && alert.condition == result.condition
        && alert.recommendedAction == result.recommendedAction) {
        ++report.suppressed;
        return;
    }
    alert.severity = result.severity;
    alert.condition = result.condition;
    alert.recommendedAction = result.recommendedAction;
    alert.updatedAt = now;
    m_repository.saveAlert(alert, deadline);
    recordTransition(alert, toAlertStateString(AlertState::Active), result.condition, now);
    report.updated.push_back(alert);
}

Alert AlertEvaluator::resolve(const std::string &alertId, const std::string &notes)
{
    return resolve(alertId, notes, std::chrono::system_clock::now(),
                   m_repository.defaultDeadline());
}

Alert AlertEvaluator::resolve(const std::string &alertId,
                              const std::string &notes,
                              std::chrono::system_clock::time_point now,
                              Deadline deadline)
{
    logging::CorrelationScope logScope(QString(), std::string(), alertId);
    const Alert found = m_repository.getAlert(alertId);
    logging::CorrelationScope locationScope(QString(), found.locationId);

    std::lock_guard<std::mutex> lock(lockFor(found.locationId, found.category));
    // Re-read under the lock; an evaluation may have resolved it meanwhile.
    Alert alert = m_repository.getAlert(alertId);
    if (alert.state == AlertState::Resolved) {
        return alert;
    }

    alert.state = AlertState::Resolved;
    alert.resolvedAt = now;
    alert.updatedAt = now;
    alert.resolutionNotes = notes.empty() ? std::string("Resolved manually") : notes;
    m_repository.saveAlert(alert, deadline);
    recordTransition(alert, toAlertStateString(AlertState::Active), "manual resolution", now);

    KRLOG_INFO(QStringLiteral("AlertEvaluator"),
               QStringLiteral("resolve"),
               QStringLiteral("alert_resolved"),
               QStringLiteral("manual_request"),
               QStringLiteral("state_transition"),
               nlohmann::json{{"category", toAlertCategoryString(alert.category)}});
    return alert;
}

void AlertEvaluator::recordTransition(const Alert &alert,
                                      const std::string &fromState,
                                      const std::string &reason,
                                      std::chrono::system_clock::time_point now)
{
    logging::CorrelationScope logScope(QString(), alert.locationId, alert.id);
    KRLOG_DEBUG(QStringLiteral("AlertEvaluator"),
                QStringLiteral("recordTransition"),
                QStringLiteral("alert_transition"),
                QString::fromStdString(reason),
                QStringLiteral("state_transition"),
                nlohmann::json{{"from", fromState},
                               {"to", toAlertStateString(alert.state)},
                               {"severity", toAlertSeverityString(alert.severity)}});
    if (!m_config.alertHistoryEnabled) {
        return;
    }
    AlertTransition transition;
    transition.id = newId();
    transition.alertId = alert.id;
    transition.locationId = alert.locationId;
    transition.category = alert.category;
    transition.fromState = fromState;
    transition.toState = toAlertStateString(alert.state);
    transition.severity = alert.severity;
    transition.reason = reason;
    transition.timestamp = now;
    m_repository.recordAlertTransition(transition);
}

} // namespace krishi
