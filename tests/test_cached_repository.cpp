#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include "common/config.hpp"
#include "common/errors.hpp"
#include "common/time_utils.hpp"
#include "engine/cached_repository.hpp"
#include "fake_backend.hpp"

using namespace std::chrono_literals;
using krishi::testing::errorCodeOf;
using krishi::testing::FakeBackend;
using krishi::testing::makeLocation;
using krishi::testing::makeReading;

namespace {

krishi::EngineConfig testConfig()
{
    krishi::EngineConfig config;
    config.requestTimeout = 3000ms;
    return config;
}

krishi::ForecastPoint makePoint(const std::string &locationId, int dayOffset,
                                const std::string &source)
{
    krishi::ForecastPoint point;
    point.locationId = locationId;
    point.forecastDate =
        krishi::addDays(krishi::startOfUtcDay(std::chrono::system_clock::now()), dayOffset);
    point.issuedAt = std::chrono::system_clock::now();
    point.source = source;
    point.confidence = 0.8;
    point.measurements.temperature = 30.0;
    return point;
}

} // namespace

class CachedRepositoryTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void testReadAfterWriteObservesWrite();
    void testConcurrentReadsFetchOnce();
    void testConcurrentReadYourWrites();
    void testCallerDeadlineTimesOut();
    void testExpiredDeadlineRejectsWrite();
    void testDegradedModeServesStale();
    void testBackendFailureWithoutDegradedMode();
    void testUntypedBackendFailureIsUnavailable();
    void testHistoryWindow();
    void testNotFoundCases();
    void testWriteValidation();
    void testForecastUpsertInvalidates();
    void testExplicitInvalidation();
    void testInvalidConfigurationRejected();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
};

void CachedRepositoryTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void CachedRepositoryTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void CachedRepositoryTests::testReadAfterWriteObservesWrite()
{
    FakeBackend backend;
    krishi::CachedRepository repository(backend, testConfig());
    repository.saveLocation(makeLocation("PANIPAT", 29.3909, 76.9635));

    const auto now = std::chrono::system_clock::now();
    auto first = makeReading("PANIPAT", now - 1h);
    first.measurements.temperature = 30.0;
    repository.recordReading(first);

    QCOMPARE(*repository.getCurrent("PANIPAT").value.measurements.temperature, 30.0);
    QCOMPARE(*repository.getCurrent("PANIPAT").value.measurements.temperature, 30.0);
    QCOMPARE(backend.latestCalls.load(), 1);

    auto second = makeReading("PANIPAT", now);
    second.measurements.temperature = 32.5;
    repository.recordReading(second);

    // The write dropped the cached entry before returning.
    QCOMPARE(*repository.getCurrent("PANIPAT").value.measurements.temperature, 32.5);
    QCOMPARE(backend.latestCalls.load(), 2);

    auto moved = makeLocation("PANIPAT", 29.40, 76.97);
    repository.saveLocation(moved);
    QCOMPARE(repository.getLocation("PANIPAT").value.latitude, 29.40);
}

void CachedRepositoryTests::testConcurrentReadsFetchOnce()
{
    FakeBackend backend;
    backend.upsertLocation(makeLocation("KARNAL", 29.6857, 76.9905));
    backend.addReading(makeReading("KARNAL", std::chrono::system_clock::now()));
    backend.latencyMs = 150;

    krishi::CachedRepository repository(backend, testConfig());

    std::vector<std::thread> callers;
    std::atomic<int> served{0};
    for (int i = 0; i < 12; ++i) {
        callers.emplace_back([&]() {
            try {
                const auto result = repository.getCurrent("KARNAL");
                if (result.value.locationId == "KARNAL") {
                    ++served;
                }
            } catch (const krishi::KrishiError &) {
            }
        });
    }
    for (auto &caller : callers) {
        caller.join();
    }

    QCOMPARE(served.load(), 12);
    QCOMPARE(backend.latestCalls.load(), 1);
}

void CachedRepositoryTests::testConcurrentReadYourWrites()
{
    FakeBackend backend;
    const std::vector<std::string> others = {"KARNAL", "HISAR", "ROHTAK"};
    const auto now = std::chrono::system_clock::now();
    backend.upsertLocation(makeLocation("PANIPAT", 29.3909, 76.9635));
    for (const auto &id : others) {
        backend.upsertLocation(makeLocation(id, 29.5, 76.5));
        backend.addReading(makeReading(id, now - 3h));
    }
    auto initial = makeReading("PANIPAT", now - 3h);
    initial.measurements.temperature = 20.0;
    backend.addReading(initial);

    backend.latencyMs = 60;
    backend.latencyAfterLatestRead = true;
    krishi::CachedRepository repository(backend, testConfig());

    // A load that has already read the old reading when the write lands.
    std::atomic<double> earlyTemperature{0.0};
    std::thread early([&]() {
        earlyTemperature = *repository.getCurrent("PANIPAT").value.measurements.temperature;
    });
    QTRY_VERIFY_WITH_TIMEOUT(backend.latestSnapshots.load() >= 1, 2000);

    auto written = makeReading("PANIPAT", now - 2h);
    written.measurements.temperature = 31.0;
    repository.recordReading(written);
    QCOMPARE(*repository.getCurrent("PANIPAT").value.measurements.temperature, 31.0);
    early.join();
    QCOMPARE(earlyTemperature.load(), 20.0);
    QCOMPARE(*repository.getCurrent("PANIPAT").value.measurements.temperature, 31.0);

    backend.latencyMs = 5;
    std::atomic<bool> done{false};
    std::atomic<int> staleReads{0};
    std::atomic<int> failures{0};

    std::vector<std::thread> background;
    for (std::size_t i = 0; i < others.size(); ++i) {
        background.emplace_back([&, i]() {
            for (int n = 0; n < 20; ++n) {
                try {
                    repository.recordReading(
                        makeReading(others[i], now - 2h + std::chrono::seconds(n)));
                } catch (const krishi::KrishiError &) {
                    ++failures;
                }
            }
        });
    }
    for (int r = 0; r < 4; ++r) {
        background.emplace_back([&, r]() {
            while (!done) {
                try {
                    repository.getCurrent(r == 0 ? std::string("PANIPAT")
                                                 : others[r % others.size()]);
                } catch (const krishi::KrishiError &) {
                    ++failures;
                }
            }
        });
    }

    for (int n = 0; n < 25; ++n) {
        auto reading = makeReading("PANIPAT", now - 1h + std::chrono::seconds(n));
        reading.measurements.temperature = 10.0 + n;
        try {
            repository.recordReading(reading);
            const auto current = repository.getCurrent("PANIPAT");
            if (current.value.timestamp != reading.timestamp) {
                ++staleReads;
            }
        } catch (const krishi::KrishiError &) {
            ++failures;
        }
    }
    done = true;
    for (auto &thread : background) {
        thread.join();
    }

    QCOMPARE(staleReads.load(), 0);
    QCOMPARE(failures.load(), 0);
}

void CachedRepositoryTests::testCallerDeadlineTimesOut()
{
    FakeBackend backend;
    backend.addReading(makeReading("HISAR", std::chrono::system_clock::now()));
    backend.latencyMs = 400;

    krishi::CachedRepository repository(backend, testConfig());

    const auto code = errorCodeOf([&]() {
        repository.getCurrent("HISAR", std::chrono::steady_clock::now() + 30ms);
    });
    QVERIFY(code.has_value());
    QCOMPARE(*code, krishi::ErrorCode::Timeout);

    // The abandoned flight keeps running and serves the next caller.
    const auto result = repository.getCurrent("HISAR");
    QCOMPARE(QString::fromStdString(result.value.locationId), QStringLiteral("HISAR"));
    QCOMPARE(backend.latestCalls.load(), 1);
    QVERIFY(repository.cacheStats().timeouts >= 1);
}

void CachedRepositoryTests::testExpiredDeadlineRejectsWrite()
{
    FakeBackend backend;
    krishi::CachedRepository repository(backend, testConfig());

    const auto code = errorCodeOf([&]() {
        repository.recordReading(makeReading("HISAR", std::chrono::system_clock::now()),
                                 std::chrono::steady_clock::now() - 1ms);
    });
    QVERIFY(code.has_value());
    QCOMPARE(*code, krishi::ErrorCode::Timeout);
    QVERIFY(!backend.latestReading("HISAR").has_value());
}

void CachedRepositoryTests::testDegradedModeServesStale()
{
    FakeBackend backend;
    backend.addReading(makeReading("PANIPAT", std::chrono::system_clock::now()));

    auto config = testConfig();
    config.currentTtl = 0s;
    config.degradedAvailabilityOnBackendFailure = true;
    krishi::CachedRepository repository(backend, config);

    const auto fresh = repository.getCurrent("PANIPAT");
    QVERIFY(!fresh.stale);

    backend.failing = true;
    const auto stale = repository.getCurrent("PANIPAT");
    QVERIFY(stale.stale);
    QCOMPARE(QString::fromStdString(stale.value.locationId), QStringLiteral("PANIPAT"));

    // Nothing cached for this location, so the failure surfaces.
    const auto code = errorCodeOf([&]() { repository.getCurrent("KARNAL"); });
    QVERIFY(code.has_value());
    QCOMPARE(*code, krishi::ErrorCode::BackendUnavailable);

    backend.failing = false;
    QVERIFY(!repository.getCurrent("PANIPAT").stale);
}

void CachedRepositoryTests::testBackendFailureWithoutDegradedMode()
{
    FakeBackend backend;
    backend.addReading(makeReading("PANIPAT", std::chrono::system_clock::now()));

    auto config = testConfig();
    config.currentTtl = 0s;
    krishi::CachedRepository repository(backend, config);
    repository.getCurrent("PANIPAT");

    backend.failing = true;
    const auto code = errorCodeOf([&]() { repository.getCurrent("PANIPAT"); });
    QVERIFY(code.has_value());
    QCOMPARE(*code, krishi::ErrorCode::BackendUnavailable);

    // Writes fail the same way and leave nothing behind.
    const auto writeCode = errorCodeOf([&]() {
        repository.recordReading(makeReading("PANIPAT", std::chrono::system_clock::now()));
    });
    QVERIFY(writeCode.has_value());
    QCOMPARE(*writeCode, krishi::ErrorCode::BackendUnavailable);
}

void CachedRepositoryTests::testUntypedBackendFailureIsUnavailable()
{
    FakeBackend backend;
    backend.failingUntyped = true;
    krishi::CachedRepository repository(backend, testConfig());

    const auto code = errorCodeOf([&]() { repository.getLocation("PANIPAT"); });
    QVERIFY(code.has_value());
    QCOMPARE(*code, krishi::ErrorCode::BackendUnavailable);
}

void CachedRepositoryTests::testHistoryWindow()
{
    FakeBackend backend;
    const auto base = krishi::fromIso8601Utc("2026-06-01T00:00:00Z");
    for (int hour = 0; hour < 48; hour += 6) {
        auto reading = makeReading("PANIPAT", base + std::chrono::hours(hour));
        reading.measurements.temperature = 20.0 + hour / 6;
        backend.addReading(reading);
    }

    krishi::CachedRepository repository(backend, testConfig());

    const auto readings = repository.getHistory("PANIPAT", base, base + 24h).value;
    QCOMPARE(readings.size(), static_cast<std::size_t>(5));
    for (std::size_t i = 1; i < readings.size(); ++i) {
        QVERIFY(readings[i - 1].timestamp <= readings[i].timestamp);
    }

    auto code = errorCodeOf([&]() { repository.getHistory("PANIPAT", base + 24h, base); });
    QVERIFY(code.has_value());
    QCOMPARE(*code, krishi::ErrorCode::InvalidArgument);

    code = errorCodeOf([&]() { repository.getHistory("PANIPAT", base - 72h, base - 48h); });
    QVERIFY(code.has_value());
    QCOMPARE(*code, krishi::ErrorCode::NotFound);

    // A reading inside a cached window invalidates it.
    auto late = makeReading("PANIPAT", base + 23h);
    repository.recordReading(late);
    QCOMPARE(repository.getHistory("PANIPAT", base, base + 24h).value.size(),
             static_cast<std::size_t>(6));
}

void CachedRepositoryTests::testNotFoundCases()
{
    FakeBackend backend;
    krishi::CachedRepository repository(backend, testConfig());

    auto code = errorCodeOf([&]() { repository.getLocation("NOWHERE"); });
    QVERIFY(code.has_value());
    QCOMPARE(*code, krishi::ErrorCode::NotFound);

    code = errorCodeOf([&]() { repository.getCurrent("NOWHERE"); });
    QVERIFY(code.has_value());
    QCOMPARE(*code, krishi::ErrorCode::NotFound);

    code = errorCodeOf([&]() { repository.getForecast("NOWHERE"); });
    QVERIFY(code.has_value());
    QCOMPARE(*code, krishi::ErrorCode::NotFound);

    code = errorCodeOf([&]() { repository.getAlert("missing-alert"); });
    QVERIFY(code.has_value());
    QCOMPARE(*code, krishi::ErrorCode::NotFound);

    // No active alerts is an answer, not an error.
    QVERIFY(repository.listActiveAlerts("NOWHERE").value.empty());

    code = errorCodeOf([&]() { repository.getCurrent(""); });
    QVERIFY(code.has_value());
    QCOMPARE(*code, krishi::ErrorCode::InvalidArgument);
}

void CachedRepositoryTests::testWriteValidation()
{
    FakeBackend backend;
    krishi::CachedRepository repository(backend, testConfig());
    const auto now = std::chrono::system_clock::now();

    auto humid = makeReading("PANIPAT", now);
    humid.measurements.humidity = 120.0;
    auto code = errorCodeOf([&]() { repository.recordReading(humid); });
    QVERIFY(code.has_value());
    QCOMPARE(*code, krishi::ErrorCode::InvalidArgument);

    auto undated = makeReading("PANIPAT", {});
    code = errorCodeOf([&]() { repository.recordReading(undated); });
    QVERIFY(code.has_value());
    QCOMPARE(*code, krishi::ErrorCode::InvalidArgument);
    QVERIFY(!backend.latestReading("PANIPAT").has_value());

    code = errorCodeOf([&]() { repository.saveLocation(makeLocation("BAD", 95.0, 76.0)); });
    QVERIFY(code.has_value());
    QCOMPARE(*code, krishi::ErrorCode::InvalidCoordinates);

    auto point = makePoint("PANIPAT", 1, "imd");
    point.confidence = 1.5;
    code = errorCodeOf([&]() { repository.upsertForecast({point}); });
    QVERIFY(code.has_value());
    QCOMPARE(*code, krishi::ErrorCode::InvalidArgument);

    point = makePoint("PANIPAT", 1, "imd");
    point.forecastDate += 3h;
    code = errorCodeOf([&]() { repository.upsertForecast({point}); });
    QVERIFY(code.has_value());
    QCOMPARE(*code, krishi::ErrorCode::InvalidArgument);

    krishi::Alert alert;
    alert.id = "alert-1";
    alert.locationId = "PANIPAT";
    alert.state = krishi::AlertState::Resolved;
    code = errorCodeOf([&]() { repository.saveAlert(alert); });
    QVERIFY(code.has_value());
    QCOMPARE(*code, krishi::ErrorCode::InvalidArgument);
}

void CachedRepositoryTests::testForecastUpsertInvalidates()
{
    FakeBackend backend;
    krishi::CachedRepository repository(backend, testConfig());

    repository.upsertForecast({makePoint("PANIPAT", 0, "imd"), makePoint("PANIPAT", 1, "imd")});
    QCOMPARE(repository.getForecast("PANIPAT").value.size(), static_cast<std::size_t>(2));
    QCOMPARE(repository.getForecast("PANIPAT").value.size(), static_cast<std::size_t>(2));
    QCOMPARE(backend.forecastCalls.load(), 1);

    repository.upsertForecast({makePoint("PANIPAT", 2, "ecmwf")});
    QCOMPARE(repository.getForecast("PANIPAT").value.size(), static_cast<std::size_t>(3));
    QCOMPARE(backend.forecastCalls.load(), 2);

    // Points for past days are not part of the view.
    repository.upsertForecast({makePoint("PANIPAT", -2, "imd")});
    QCOMPARE(repository.getForecast("PANIPAT").value.size(), static_cast<std::size_t>(3));

    // An empty batch is a no-op.
    repository.upsertForecast({});
    QCOMPARE(backend.forecastCalls.load(), 3);
}

void CachedRepositoryTests::testExplicitInvalidation()
{
    FakeBackend backend;
    krishi::CachedRepository repository(backend, testConfig());
    repository.saveLocation(makeLocation("PANIPAT", 29.3909, 76.9635));
    repository.recordReading(makeReading("PANIPAT", std::chrono::system_clock::now() - 1h));

    repository.getCurrent("PANIPAT");
    // Written behind the repository's back, so only an invalidation reveals it.
    auto external = makeReading("PANIPAT", std::chrono::system_clock::now());
    external.measurements.temperature = 18.0;
    backend.addReading(external);
    QVERIFY(!repository.getCurrent("PANIPAT").value.measurements.temperature.has_value());
    QCOMPARE(backend.latestCalls.load(), 1);

    const auto before = repository.cacheStats().invalidations;
    repository.invalidateLocation("PANIPAT");
    QVERIFY(repository.cacheStats().invalidations > before);
    QCOMPARE(*repository.getCurrent("PANIPAT").value.measurements.temperature, 18.0);
    QCOMPARE(backend.latestCalls.load(), 2);
}

void CachedRepositoryTests::testInvalidConfigurationRejected()
{
    FakeBackend backend;
    auto config = testConfig();
    config.loaderThreads = 0;
    bool rejected = false;
    try {
        krishi::CachedRepository repository(backend, config);
    } catch (const krishi::InvalidConfigurationError &) {
        rejected = true;
    }
    QVERIFY(rejected);
}

QTEST_MAIN(CachedRepositoryTests)
#include "test_cached_repository.moc"
