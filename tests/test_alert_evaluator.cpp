#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <algorithm>
#include <chrono>
#include <thread>
#include <vector>

#include "common/config.hpp"
#include "common/errors.hpp"
#include "common/time_utils.hpp"
#include "engine/alert_evaluator.hpp"
#include "engine/cached_repository.hpp"
#include "engine/crop_profiles.hpp"
#include "engine/forecast_aggregator.hpp"
#include "fake_backend.hpp"

using namespace std::chrono_literals;
using krishi::AlertCategory;
using krishi::AlertSeverity;
using krishi::RuleOutcome;
using krishi::testing::errorCodeOf;
using krishi::testing::FakeBackend;
using krishi::testing::makeLocation;
using krishi::testing::makeReading;

namespace {

krishi::StaticCropProfiles wheatProfiles()
{
    krishi::CropThresholds wheat;
    wheat.cropId = "WHEAT";
    wheat.gddBaseCelsius = 5.0;
    wheat.dryBelowPercent = 15.0;
    wheat.saturatedAbovePercent = 70.0;

    krishi::CropThresholds defaults;
    defaults.cropId = "DEFAULT";
    return krishi::StaticCropProfiles({{"WHEAT", wheat}}, defaults);
}

struct Harness {
    explicit Harness(const krishi::EngineConfig &engineConfig = krishi::EngineConfig{})
        : config(engineConfig)
        , crops(wheatProfiles())
        , repository(backend, config)
        , forecasts(repository, config)
        , evaluator(repository, forecasts, crops, config)
    {
        repository.saveLocation(makeLocation("PANIPAT", 29.39, 76.97));
    }

    void record(const std::string &isoTimestamp, double soilMoisture,
                double temperature = 25.0, double humidity = 50.0)
    {
        auto reading = makeReading("PANIPAT", krishi::fromIso8601Utc(isoTimestamp));
        reading.measurements.soilMoisture = soilMoisture;
        reading.measurements.temperature = temperature;
        reading.measurements.humidity = humidity;
        repository.recordReading(reading);
    }

    krishi::EvaluationReport evaluateAt(const std::string &isoTimestamp,
                                        const std::string &cropId = "WHEAT")
    {
        return evaluator.evaluate("PANIPAT", cropId, krishi::fromIso8601Utc(isoTimestamp),
                                  repository.defaultDeadline());
    }

    FakeBackend backend;
    krishi::EngineConfig config;
    krishi::StaticCropProfiles crops;
    krishi::CachedRepository repository;
    krishi::ForecastAggregator forecasts;
    krishi::AlertEvaluator evaluator;
};

const krishi::RuleResult &resultFor(const std::vector<krishi::RuleResult> &results,
                                    AlertCategory category)
{
    return *std::find_if(results.begin(), results.end(),
                         [category](const krishi::RuleResult &r) {
                             return r.category == category;
                         });
}

krishi::CropThresholds wheatThresholds()
{
    return *wheatProfiles().thresholdsFor("WHEAT");
}

} // namespace

class AlertEvaluatorTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void testDryStreakRaisesAndClearsIrrigationAlert();
    void testRepeatedEvaluationDoesNotDuplicate();
    void testSeverityChangeUpdatesInPlace();
    void testConcurrentEvaluationsKeepOneActiveAlert();
    void testManualResolveIsIdempotent();
    void testManualResolveHonoursDeadline();
    void testUnknownIdsAndCrops();
    void testTransitionsRecordedWhenEnabled();
    void testTransitionsSkippedWhenDisabled();
    void testMissingInputsAreUnknown();
    void testIrrigationStreakNeedsEveryDay();
    void testFrostSeverity();
    void testFloodSeverity();
    void testFloodCountsPreviousEveningRain();
    void testHeatAndDiseaseRules();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
};

void AlertEvaluatorTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void AlertEvaluatorTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void AlertEvaluatorTests::testDryStreakRaisesAndClearsIrrigationAlert()
{
    Harness h;
    h.record("2026-06-01T06:00:00Z", 12.0);
    h.record("2026-06-02T06:00:00Z", 12.0);
    h.record("2026-06-03T06:00:00Z", 12.0);
    h.record("2026-06-04T06:00:00Z", 12.0);
    h.record("2026-06-05T06:00:00Z", 12.0);

    const auto first = h.evaluateAt("2026-06-05T12:00:00Z");
    QCOMPARE(first.created.size(), static_cast<std::size_t>(1));
    const krishi::Alert raised = first.created.front();
    QCOMPARE(raised.category, AlertCategory::IrrigationAdvisory);
    QCOMPARE(raised.severity, AlertSeverity::Medium);
    QCOMPARE(raised.state, krishi::AlertState::Active);
    QVERIFY(!raised.resolvedAt.has_value());
    QCOMPARE(h.backend.activeAlertCount("PANIPAT", AlertCategory::IrrigationAdvisory), 1);

    // No rainfall was ever reported, so flood risk cannot be judged.
    QVERIFY(std::find(first.unknown.begin(), first.unknown.end(), AlertCategory::FloodRisk)
            != first.unknown.end());

    h.record("2026-06-06T06:00:00Z", 20.0);
    const auto second = h.evaluateAt("2026-06-06T12:00:00Z");
    QCOMPARE(second.created.size(), static_cast<std::size_t>(0));
    QCOMPARE(second.resolved.size(), static_cast<std::size_t>(1));

    const krishi::Alert stored = h.repository.getAlert(raised.id);
    QCOMPARE(stored.state, krishi::AlertState::Resolved);
    QVERIFY(stored.resolvedAt.has_value());
    QVERIFY(*stored.resolvedAt == krishi::fromIso8601Utc("2026-06-06T12:00:00Z"));
    QVERIFY(stored.createdAt == raised.createdAt);
    QCOMPARE(h.backend.activeAlertCount("PANIPAT", AlertCategory::IrrigationAdvisory), 0);
    QVERIFY(h.repository.listActiveAlerts("PANIPAT").value.empty());
}

void AlertEvaluatorTests::testRepeatedEvaluationDoesNotDuplicate()
{
    Harness h;
    for (int day = 1; day <= 5; ++day) {
        h.record("2026-06-0" + std::to_string(day) + "T06:00:00Z", 12.0);
    }

    QCOMPARE(h.evaluateAt("2026-06-05T12:00:00Z").created.size(), static_cast<std::size_t>(1));
    const auto again = h.evaluateAt("2026-06-05T13:00:00Z");
    QCOMPARE(again.created.size(), static_cast<std::size_t>(0));
    QCOMPARE(again.updated.size(), static_cast<std::size_t>(0));
    QCOMPARE(again.suppressed, 1);
    QCOMPARE(h.backend.activeAlertCount("PANIPAT", AlertCategory::IrrigationAdvisory), 1);
}

void AlertEvaluatorTests::testSeverityChangeUpdatesInPlace()
{
    Harness h;
    for (int day = 1; day <= 5; ++day) {
        h.record("2026-06-0" + std::to_string(day) + "T06:00:00Z", 12.0);
    }
    const auto created = h.evaluateAt("2026-06-05T12:00:00Z").created.front();

    h.record("2026-06-05T14:00:00Z", 5.0);
    const auto report = h.evaluateAt("2026-06-05T15:00:00Z");
    QCOMPARE(report.updated.size(), static_cast<std::size_t>(1));
    const auto &updated = report.updated.front();
    QCOMPARE(QString::fromStdString(updated.id), QString::fromStdString(created.id));
    QCOMPARE(updated.severity, AlertSeverity::High);
    QVERIFY(updated.createdAt == created.createdAt);
    QVERIFY(updated.updatedAt == krishi::fromIso8601Utc("2026-06-05T15:00:00Z"));
    QCOMPARE(h.backend.activeAlertCount("PANIPAT", AlertCategory::IrrigationAdvisory), 1);
}

void AlertEvaluatorTests::testConcurrentEvaluationsKeepOneActiveAlert()
{
    Harness h;
    for (int day = 1; day <= 5; ++day) {
        h.record("2026-06-0" + std::to_string(day) + "T06:00:00Z", 12.0);
    }
    h.backend.latencyMs = 5;

    std::atomic<int> created{0};
    std::atomic<int> failures{0};
    std::vector<std::thread> workers;
    for (int i = 0; i < 8; ++i) {
        workers.emplace_back([&]() {
            try {
                created += static_cast<int>(h.evaluateAt("2026-06-05T12:00:00Z").created.size());
            } catch (const krishi::KrishiError &) {
                ++failures;
            }
        });
    }
    for (auto &worker : workers) {
        worker.join();
    }

    QCOMPARE(failures.load(), 0);
    QCOMPARE(created.load(), 1);
    QCOMPARE(h.backend.activeAlertCount("PANIPAT", AlertCategory::IrrigationAdvisory), 1);
    QCOMPARE(h.backend.duplicateActiveWrites.load(), 0);
}

void AlertEvaluatorTests::testManualResolveIsIdempotent()
{
    Harness h;
    h.record("2026-06-05T06:00:00Z", 40.0, 1.0);
    const auto report = h.evaluateAt("2026-06-05T07:00:00Z");
    QCOMPARE(report.created.size(), static_cast<std::size_t>(1));
    const auto frost = report.created.front();

    const auto resolvedAt = krishi::fromIso8601Utc("2026-06-05T09:00:00Z");
    const auto resolved =
        h.evaluator.resolve(frost.id, {}, resolvedAt, h.repository.defaultDeadline());
    QCOMPARE(resolved.state, krishi::AlertState::Resolved);
    QVERIFY(*resolved.resolvedAt == resolvedAt);
    QCOMPARE(QString::fromStdString(resolved.resolutionNotes), QStringLiteral("Resolved manually"));

    const auto again = h.evaluator.resolve(frost.id, "second attempt",
                                           krishi::fromIso8601Utc("2026-06-05T10:00:00Z"),
                                           h.repository.defaultDeadline());
    QCOMPARE(again.state, krishi::AlertState::Resolved);
    QVERIFY(*again.resolvedAt == resolvedAt);
    QCOMPARE(QString::fromStdString(again.resolutionNotes), QStringLiteral("Resolved manually"));
    QCOMPARE(h.repository.alertTransitions(frost.id).size(), static_cast<std::size_t>(2));

    // The condition persists, so the next evaluation opens a new alert.
    const auto reopened = h.evaluateAt("2026-06-05T11:00:00Z");
    QCOMPARE(reopened.created.size(), static_cast<std::size_t>(1));
    QVERIFY(reopened.created.front().id != frost.id);
}

void AlertEvaluatorTests::testManualResolveHonoursDeadline()
{
    Harness h;
    h.record("2026-06-05T06:00:00Z", 40.0, 1.0);
    const auto frost = h.evaluateAt("2026-06-05T07:00:00Z").created.front();

    const auto expired = std::chrono::steady_clock::now() - std::chrono::seconds(1);
    const auto code = errorCodeOf([&]() {
        h.evaluator.resolve(frost.id, {}, krishi::fromIso8601Utc("2026-06-05T09:00:00Z"),
                            expired);
    });
    QVERIFY(code.has_value());
    QCOMPARE(*code, krishi::ErrorCode::Timeout);
    QCOMPARE(h.repository.getAlert(frost.id).state, krishi::AlertState::Active);
    QCOMPARE(h.repository.alertTransitions(frost.id).size(), static_cast<std::size_t>(1));
}

void AlertEvaluatorTests::testUnknownIdsAndCrops()
{
    Harness h;
    auto code = errorCodeOf([&]() { h.evaluator.resolve("no-such-alert"); });
    QVERIFY(code.has_value());
    QCOMPARE(*code, krishi::ErrorCode::NotFound);

    code = errorCodeOf([&]() { h.evaluateAt("2026-06-05T12:00:00Z", "RICE"); });
    QVERIFY(code.has_value());
    QCOMPARE(*code, krishi::ErrorCode::NotFound);

    code = errorCodeOf([&]() { h.evaluator.evaluate("NOWHERE"); });
    QVERIFY(code.has_value());
    QCOMPARE(*code, krishi::ErrorCode::NotFound);

    // Crop ids are matched case-insensitively.
    code = errorCodeOf([&]() { h.evaluateAt("2026-06-05T12:00:00Z", "wheat"); });
    QVERIFY(!code.has_value());
}

void AlertEvaluatorTests::testTransitionsRecordedWhenEnabled()
{
    Harness h;
    h.record("2026-06-05T06:00:00Z", 40.0, 3.0);
    const auto frost = h.evaluateAt("2026-06-05T07:00:00Z").created.front();
    QCOMPARE(frost.severity, AlertSeverity::Medium);

    h.record("2026-06-05T08:00:00Z", 40.0, 10.0);
    h.evaluateAt("2026-06-05T09:00:00Z");

    const auto transitions = h.repository.alertTransitions(frost.id);
    QCOMPARE(transitions.size(), static_cast<std::size_t>(2));
    QCOMPARE(QString::fromStdString(transitions[0].fromState), QStringLiteral("none"));
    QCOMPARE(QString::fromStdString(transitions[0].toState), QStringLiteral("active"));
    QCOMPARE(QString::fromStdString(transitions[1].fromState), QStringLiteral("active"));
    QCOMPARE(QString::fromStdString(transitions[1].toState), QStringLiteral("resolved"));
}

void AlertEvaluatorTests::testTransitionsSkippedWhenDisabled()
{
    krishi::EngineConfig config;
    config.alertHistoryEnabled = false;
    Harness h(config);
    h.record("2026-06-05T06:00:00Z", 40.0, 3.0);
    const auto frost = h.evaluateAt("2026-06-05T07:00:00Z").created.front();
    h.evaluator.resolve(frost.id);
    QVERIFY(h.repository.alertTransitions(frost.id).empty());
}

void AlertEvaluatorTests::testMissingInputsAreUnknown()
{
    krishi::EvaluationInputs inputs;
    inputs.today = krishi::fromIso8601Utc("2026-06-05T00:00:00Z");
    const auto results =
        krishi::AlertEvaluator::applyRules(inputs, krishi::AlertThresholds{}, wheatThresholds());
    QCOMPARE(results.size(), static_cast<std::size_t>(5));
    for (const auto &result : results) {
        QCOMPARE(result.outcome, RuleOutcome::Unknown);
    }

    // Evaluating a location with no data changes nothing.
    Harness h;
    const auto report = h.evaluateAt("2026-06-05T12:00:00Z");
    QVERIFY(report.created.empty());
    QVERIFY(report.resolved.empty());
    QCOMPARE(report.unknown.size(), static_cast<std::size_t>(5));
}

void AlertEvaluatorTests::testIrrigationStreakNeedsEveryDay()
{
    krishi::EvaluationInputs inputs;
    inputs.today = krishi::fromIso8601Utc("2026-06-05T00:00:00Z");
    for (int day = 3; day <= 4; ++day) {
        auto reading = makeReading("PANIPAT", krishi::fromIso8601Utc(
                                                  "2026-06-0" + std::to_string(day) + "T06:00:00Z"));
        reading.measurements.soilMoisture = 10.0;
        inputs.history.push_back(reading);
    }
    auto current = makeReading("PANIPAT", krishi::fromIso8601Utc("2026-06-05T06:00:00Z"));
    current.measurements.soilMoisture = 10.0;
    inputs.current = current;

    auto results =
        krishi::AlertEvaluator::applyRules(inputs, krishi::AlertThresholds{}, wheatThresholds());
    QCOMPARE(resultFor(results, AlertCategory::IrrigationAdvisory).outcome, RuleOutcome::Unknown);

    // A known wet day inside the window clears the rule even with gaps.
    inputs.history[0].measurements.soilMoisture = 40.0;
    results = krishi::AlertEvaluator::applyRules(inputs, krishi::AlertThresholds{},
                                                 wheatThresholds());
    QCOMPARE(resultFor(results, AlertCategory::IrrigationAdvisory).outcome, RuleOutcome::Clear);

    // Only the last reading of a day counts.
    inputs.history[0].measurements.soilMoisture = 10.0;
    auto lateWet = makeReading("PANIPAT", krishi::fromIso8601Utc("2026-06-05T05:00:00Z"));
    lateWet.measurements.soilMoisture = 50.0;
    inputs.history.push_back(lateWet);
    krishi::AlertThresholds shortStreak;
    shortStreak.dryConsecutiveDays = 3;
    results = krishi::AlertEvaluator::applyRules(inputs, shortStreak, wheatThresholds());
    const auto &irrigation = resultFor(results, AlertCategory::IrrigationAdvisory);
    QCOMPARE(irrigation.outcome, RuleOutcome::Triggered);
    QCOMPARE(irrigation.severity, AlertSeverity::Medium);
}

void AlertEvaluatorTests::testFrostSeverity()
{
    krishi::EvaluationInputs inputs;
    inputs.today = krishi::fromIso8601Utc("2026-01-10T00:00:00Z");
    auto current = makeReading("PANIPAT", krishi::fromIso8601Utc("2026-01-10T05:00:00Z"));
    current.measurements.temperature = 3.5;
    inputs.current = current;

    auto results =
        krishi::AlertEvaluator::applyRules(inputs, krishi::AlertThresholds{}, wheatThresholds());
    QCOMPARE(resultFor(results, AlertCategory::FrostWarning).outcome, RuleOutcome::Triggered);
    QCOMPARE(resultFor(results, AlertCategory::FrostWarning).severity, AlertSeverity::Medium);

    inputs.current->measurements.temperature = 2.0;
    results = krishi::AlertEvaluator::applyRules(inputs, krishi::AlertThresholds{},
                                                 wheatThresholds());
    QCOMPARE(resultFor(results, AlertCategory::FrostWarning).severity, AlertSeverity::High);

    inputs.current->measurements.temperature = 4.1;
    results = krishi::AlertEvaluator::applyRules(inputs, krishi::AlertThresholds{},
                                                 wheatThresholds());
    QCOMPARE(resultFor(results, AlertCategory::FrostWarning).outcome, RuleOutcome::Clear);
}

void AlertEvaluatorTests::testFloodSeverity()
{
    krishi::EvaluationInputs inputs;
    inputs.today = krishi::fromIso8601Utc("2026-07-15T00:00:00Z");
    auto early = makeReading("PANIPAT", krishi::fromIso8601Utc("2026-07-15T06:00:00Z"));
    early.measurements.rainfall = 30.0;
    auto current = makeReading("PANIPAT", krishi::fromIso8601Utc("2026-07-15T12:00:00Z"));
    current.measurements.rainfall = 35.0;
    // Older than 24h before the current reading.
    auto stale = makeReading("PANIPAT", krishi::fromIso8601Utc("2026-07-14T11:00:00Z"));
    stale.measurements.rainfall = 100.0;
    inputs.history = {stale, early, current};
    inputs.current = current;

    auto results =
        krishi::AlertEvaluator::applyRules(inputs, krishi::AlertThresholds{}, wheatThresholds());
    const auto &observed = resultFor(results, AlertCategory::FloodRisk);
    QCOMPARE(observed.outcome, RuleOutcome::Triggered);
    QCOMPARE(observed.severity, AlertSeverity::High);

    krishi::ForecastPoint tomorrow;
    tomorrow.locationId = "PANIPAT";
    tomorrow.forecastDate = krishi::addDays(inputs.today, 1);
    tomorrow.measurements.rainfall = 110.0;
    inputs.forecast = {tomorrow};
    results = krishi::AlertEvaluator::applyRules(inputs, krishi::AlertThresholds{},
                                                 wheatThresholds());
    QCOMPARE(resultFor(results, AlertCategory::FloodRisk).severity, AlertSeverity::Extreme);

    // Rain beyond tomorrow is ignored.
    tomorrow.forecastDate = krishi::addDays(inputs.today, 2);
    inputs.forecast = {tomorrow};
    inputs.history = {current};
    results = krishi::AlertEvaluator::applyRules(inputs, krishi::AlertThresholds{},
                                                 wheatThresholds());
    QCOMPARE(resultFor(results, AlertCategory::FloodRisk).outcome, RuleOutcome::Clear);

    // The threshold itself is not above the threshold.
    tomorrow.forecastDate = krishi::addDays(inputs.today, 1);
    tomorrow.measurements.rainfall = 50.0;
    inputs.forecast = {tomorrow};
    results = krishi::AlertEvaluator::applyRules(inputs, krishi::AlertThresholds{},
                                                 wheatThresholds());
    QCOMPARE(resultFor(results, AlertCategory::FloodRisk).outcome, RuleOutcome::Clear);

    tomorrow.measurements.rainfall = 50.5;
    inputs.forecast = {tomorrow};
    results = krishi::AlertEvaluator::applyRules(inputs, krishi::AlertThresholds{},
                                                 wheatThresholds());
    QCOMPARE(resultFor(results, AlertCategory::FloodRisk).outcome, RuleOutcome::Triggered);
    QCOMPARE(resultFor(results, AlertCategory::FloodRisk).severity, AlertSeverity::High);
}

void AlertEvaluatorTests::testFloodCountsPreviousEveningRain()
{
    krishi::EngineConfig config;
    config.alertThresholds.dryConsecutiveDays = 1;
    Harness h(config);

    auto evening = makeReading("PANIPAT", krishi::fromIso8601Utc("2026-07-14T22:00:00Z"));
    evening.measurements.rainfall = 40.0;
    h.repository.recordReading(evening);
    auto morning = makeReading("PANIPAT", krishi::fromIso8601Utc("2026-07-15T08:00:00Z"));
    morning.measurements.rainfall = 15.0;
    morning.measurements.temperature = 25.0;
    h.repository.recordReading(morning);

    const auto report = h.evaluateAt("2026-07-15T09:00:00Z");
    const auto flood = std::find_if(report.created.begin(), report.created.end(),
                                    [](const krishi::Alert &alert) {
                                        return alert.category == AlertCategory::FloodRisk;
                                    });
    QVERIFY(flood != report.created.end());
    QCOMPARE(flood->severity, AlertSeverity::High);
    QVERIFY(flood->condition.find("55.0 mm observed") != std::string::npos);
}

void AlertEvaluatorTests::testHeatAndDiseaseRules()
{
    krishi::EvaluationInputs inputs;
    inputs.today = krishi::fromIso8601Utc("2026-05-20T00:00:00Z");
    auto current = makeReading("PANIPAT", krishi::fromIso8601Utc("2026-05-20T13:00:00Z"));
    current.measurements.temperature = 42.0;
    current.measurements.humidity = 30.0;
    inputs.current = current;

    auto results =
        krishi::AlertEvaluator::applyRules(inputs, krishi::AlertThresholds{}, wheatThresholds());
    QCOMPARE(resultFor(results, AlertCategory::HeatAdvisory).outcome, RuleOutcome::Triggered);
    QCOMPARE(resultFor(results, AlertCategory::HeatAdvisory).severity, AlertSeverity::Extreme);
    QCOMPARE(resultFor(results, AlertCategory::DiseaseRisk).outcome, RuleOutcome::Clear);
    QVERIFY(!resultFor(results, AlertCategory::HeatAdvisory).recommendedAction.empty());

    inputs.current->measurements.temperature = 24.0;
    inputs.current->measurements.humidity = 85.0;
    results = krishi::AlertEvaluator::applyRules(inputs, krishi::AlertThresholds{},
                                                 wheatThresholds());
    QCOMPARE(resultFor(results, AlertCategory::HeatAdvisory).outcome, RuleOutcome::Clear);
    QCOMPARE(resultFor(results, AlertCategory::DiseaseRisk).outcome, RuleOutcome::Triggered);
    QCOMPARE(resultFor(results, AlertCategory::DiseaseRisk).severity, AlertSeverity::Medium);

    // Results come back in priority order.
    QCOMPARE(results.front().category, AlertCategory::FloodRisk);
    QCOMPARE(results.back().category, AlertCategory::DiseaseRisk);
}

QTEST_MAIN(AlertEvaluatorTests)
#include "test_alert_evaluator.moc"
