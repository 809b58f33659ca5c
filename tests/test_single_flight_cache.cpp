#include <QtTest/QtTest>

#include <atomic>
#include <chrono>
#include <future>
#include <string>
#include <thread>
#include <vector>

#include "common/errors.hpp"
#include "engine/single_flight_cache.hpp"

using namespace std::chrono_literals;
using krishi::CacheKey;
using krishi::CacheOperation;
using krishi::SingleFlightCache;

namespace {

krishi::Deadline in(std::chrono::milliseconds duration)
{
    return std::chrono::steady_clock::now() + duration;
}

CacheKey currentKey(const std::string &locationId)
{
    return CacheKey{CacheOperation::Current, locationId, ""};
}

} // namespace

class SingleFlightCacheTests : public QObject
{
    Q_OBJECT
private slots:
    void testFreshEntryIsServedFromCache();
    void testConcurrentMissesShareOneLoad();
    void testTimedOutCallerLeavesFlightRunning();
    void testInvalidationDropsInFlightResult();
    void testInvalidationIsPerLocation();
    void testStaleServedOnBackendFailure();
    void testStaleNotServedWhenDisabled();
    void testOtherErrorsPropagate();
    void testExpiredEntriesAreSwept();
};

void SingleFlightCacheTests::testFreshEntryIsServedFromCache()
{
    SingleFlightCache<std::string> cache(1h);
    std::atomic<int> loads{0};
    auto loader = [&loads]() {
        ++loads;
        return std::string("31.5");
    };

    QCOMPARE(QString::fromStdString(cache.get(currentKey("PANIPAT"), in(2s), loader).value),
             QStringLiteral("31.5"));
    const auto second = cache.get(currentKey("PANIPAT"), in(2s), loader);
    QCOMPARE(QString::fromStdString(second.value), QStringLiteral("31.5"));
    QVERIFY(!second.stale);
    QCOMPARE(loads.load(), 1);

    const auto stats = cache.stats();
    QCOMPARE(stats.loads, static_cast<std::uint64_t>(1));
    QCOMPARE(stats.hits, static_cast<std::uint64_t>(1));
    QCOMPARE(cache.size(), static_cast<std::size_t>(1));

    // Different window, different entry.
    cache.get(CacheKey{CacheOperation::History, "PANIPAT", "0-86400"}, in(2s), loader);
    QCOMPARE(loads.load(), 2);
}

void SingleFlightCacheTests::testConcurrentMissesShareOneLoad()
{
    SingleFlightCache<std::string> cache(1h, false, 4);
    std::atomic<int> loads{0};
    auto loader = [&loads]() {
        ++loads;
        std::this_thread::sleep_for(150ms);
        return std::string("loaded");
    };

    constexpr int kCallers = 16;
    std::vector<std::thread> callers;
    std::vector<std::string> results(kCallers);
    std::atomic<int> failures{0};
    for (int i = 0; i < kCallers; ++i) {
        callers.emplace_back([&, i]() {
            try {
                results[i] = cache.get(currentKey("KARNAL"), in(5s), loader).value;
            } catch (const krishi::KrishiError &) {
                ++failures;
            }
        });
    }
    for (auto &caller : callers) {
        caller.join();
    }

    QCOMPARE(failures.load(), 0);
    QCOMPARE(loads.load(), 1);
    for (const auto &result : results) {
        QCOMPARE(QString::fromStdString(result), QStringLiteral("loaded"));
    }
    QCOMPARE(cache.stats().loads, static_cast<std::uint64_t>(1));
}

void SingleFlightCacheTests::testTimedOutCallerLeavesFlightRunning()
{
    SingleFlightCache<std::string> cache(1h);
    std::atomic<int> loads{0};
    auto loader = [&loads]() {
        ++loads;
        std::this_thread::sleep_for(300ms);
        return std::string("slow");
    };

    bool timedOut = false;
    try {
        cache.get(currentKey("HISAR"), in(20ms), loader);
    } catch (const krishi::TimeoutError &) {
        timedOut = true;
    }
    QVERIFY(timedOut);
    QCOMPARE(cache.stats().timeouts, static_cast<std::uint64_t>(1));

    // The second caller joins or hits the same flight instead of starting one.
    const auto result = cache.get(currentKey("HISAR"), in(5s), loader);
    QCOMPARE(QString::fromStdString(result.value), QStringLiteral("slow"));
    QCOMPARE(loads.load(), 1);

    // The timed-out flight populated the cache.
    cache.get(currentKey("HISAR"), in(5s), loader);
    QCOMPARE(loads.load(), 1);
}

void SingleFlightCacheTests::testInvalidationDropsInFlightResult()
{
    SingleFlightCache<std::string> cache(1h);
    std::promise<void> started;
    std::promise<void> release;
    std::shared_future<void> releaseFuture = release.get_future().share();
    std::atomic<int> loads{0};

    auto blockingLoader = [&]() {
        ++loads;
        started.set_value();
        releaseFuture.wait();
        return std::string("before-write");
    };

    std::string firstResult;
    std::thread reader([&]() {
        firstResult = cache.get(currentKey("PANIPAT"), in(5s), blockingLoader).value;
    });

    started.get_future().wait();
    QCOMPARE(cache.invalidateLocation("PANIPAT"), static_cast<std::size_t>(1));
    release.set_value();
    reader.join();

    // The waiter that started the flight still gets its answer...
    QCOMPARE(QString::fromStdString(firstResult), QStringLiteral("before-write"));

    // ...but it was not written back, so the next read loads again.
    auto freshLoader = [&loads]() {
        ++loads;
        return std::string("after-write");
    };
    const auto next = cache.get(currentKey("PANIPAT"), in(5s), freshLoader);
    QCOMPARE(QString::fromStdString(next.value), QStringLiteral("after-write"));
    QCOMPARE(loads.load(), 2);
}

void SingleFlightCacheTests::testInvalidationIsPerLocation()
{
    SingleFlightCache<std::string> cache(1h);
    std::atomic<int> loads{0};
    auto loader = [&loads]() {
        ++loads;
        return std::string("value");
    };

    cache.get(currentKey("PANIPAT"), in(2s), loader);
    cache.get(CacheKey{CacheOperation::History, "PANIPAT", "w"}, in(2s), loader);
    cache.get(currentKey("KARNAL"), in(2s), loader);
    QCOMPARE(loads.load(), 3);

    QCOMPARE(cache.invalidateLocation("PANIPAT"), static_cast<std::size_t>(2));
    cache.get(currentKey("KARNAL"), in(2s), loader);
    QCOMPARE(loads.load(), 3);
    cache.get(currentKey("PANIPAT"), in(2s), loader);
    QCOMPARE(loads.load(), 4);
}

void SingleFlightCacheTests::testStaleServedOnBackendFailure()
{
    // A zero TTL makes every entry expire immediately.
    SingleFlightCache<std::string> cache(0ms, true);
    cache.get(currentKey("PANIPAT"), in(2s), []() { return std::string("last-known"); });

    const auto result = cache.get(currentKey("PANIPAT"), in(2s), []() -> std::string {
        throw krishi::BackendUnavailableError("store offline");
    });
    QVERIFY(result.stale);
    QCOMPARE(QString::fromStdString(result.value), QStringLiteral("last-known"));
    QCOMPARE(cache.stats().staleServed, static_cast<std::uint64_t>(1));

    // Without any previous value the failure surfaces.
    bool unavailable = false;
    try {
        cache.get(currentKey("KARNAL"), in(2s), []() -> std::string {
            throw krishi::BackendUnavailableError("store offline");
        });
    } catch (const krishi::BackendUnavailableError &) {
        unavailable = true;
    }
    QVERIFY(unavailable);
}

void SingleFlightCacheTests::testStaleNotServedWhenDisabled()
{
    SingleFlightCache<std::string> cache(0ms, false);
    cache.get(currentKey("PANIPAT"), in(2s), []() { return std::string("last-known"); });

    bool unavailable = false;
    try {
        cache.get(currentKey("PANIPAT"), in(2s), []() -> std::string {
            throw krishi::BackendUnavailableError("store offline");
        });
    } catch (const krishi::BackendUnavailableError &) {
        unavailable = true;
    }
    QVERIFY(unavailable);
}

void SingleFlightCacheTests::testOtherErrorsPropagate()
{
    SingleFlightCache<std::string> cache(0ms, true);
    cache.get(currentKey("PANIPAT"), in(2s), []() { return std::string("last-known"); });

    bool notFound = false;
    try {
        cache.get(currentKey("PANIPAT"), in(2s), []() -> std::string {
            throw krishi::NotFoundError("no readings");
        });
    } catch (const krishi::NotFoundError &) {
        notFound = true;
    }
    QVERIFY(notFound);

    // A failed flight is cleared, so the next call retries.
    const auto retried =
        cache.get(currentKey("PANIPAT"), in(2s), []() { return std::string("recovered"); });
    QCOMPARE(QString::fromStdString(retried.value), QStringLiteral("recovered"));
    QVERIFY(!retried.stale);
}

void SingleFlightCacheTests::testExpiredEntriesAreSwept()
{
    SingleFlightCache<std::string> cache(0ms);
    auto loader = []() {
        return std::string("readings");
    };

    for (int second = 1; second <= 50; ++second) {
        const CacheKey key{CacheOperation::History, "PANIPAT", "0-" + std::to_string(second)};
        cache.get(key, in(2s), loader);
        QVERIFY(cache.size() <= static_cast<std::size_t>(1));
    }
    QCOMPARE(cache.stats().evictions, static_cast<std::uint64_t>(49));

    // Expired values stay around as a fallback when stale serving is on.
    SingleFlightCache<std::string> degraded(0ms, true);
    for (int second = 1; second <= 5; ++second) {
        const CacheKey key{CacheOperation::History, "PANIPAT", "0-" + std::to_string(second)};
        degraded.get(key, in(2s), loader);
    }
    QCOMPARE(degraded.size(), static_cast<std::size_t>(5));
    QCOMPARE(degraded.stats().evictions, static_cast<std::uint64_t>(0));
}

QTEST_MAIN(SingleFlightCacheTests)
#include "test_single_flight_cache.moc"
