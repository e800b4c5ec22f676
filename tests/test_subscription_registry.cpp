#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "realtime/subscription_registry.hpp"
#include "rules/filter_matcher.hpp"

using rulecast::SubscriptionRegistry;
using rulecast::SubscriptionValidationError;

class SubscriptionRegistryTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();

    void testSubscribeAndList();
    void testMalformedFilterIsRejected();
    void testRequiredFields();
    void testUnsubscribe();
    void testClientCascade();
    void testCleanupRemovesOnlyStaleInactive();
    void testConcurrentMutationAndReads();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
};

void SubscriptionRegistryTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void SubscriptionRegistryTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void SubscriptionRegistryTests::testSubscribeAndList()
{
    SubscriptionRegistry registry;
    const auto a = registry.subscribe("c1", "posts", std::nullopt,
                                      std::string("status = 'published'"),
                                      nlohmann::json{{"id", "u1"}});
    const auto b = registry.subscribe("c1", "comments", std::string("r9"), std::nullopt, std::nullopt);
    const auto c = registry.subscribe("c2", "posts", std::nullopt, std::nullopt, std::nullopt);

    QVERIFY(a && b && c);
    QVERIFY(a->id != b->id && b->id != c->id);
    QVERIFY(a->filter);
    QVERIFY(a->filter->usesFastPath());
    QVERIFY(!c->filter);
    QVERIFY(b->recordId.has_value());

    QCOMPARE(registry.subscriptionCount(), static_cast<std::size_t>(3));
    QCOMPARE(registry.clientCount(), static_cast<std::size_t>(2));
    QCOMPARE(registry.listByClient("c1").size(), static_cast<std::size_t>(2));
    QCOMPARE(registry.listByCollection("posts").size(), static_cast<std::size_t>(2));
    QVERIFY(registry.listByCollection("users").empty());
    QVERIFY(registry.isActive(a->id));
}

void SubscriptionRegistryTests::testMalformedFilterIsRejected()
{
    SubscriptionRegistry registry;
    bool thrown = false;
    try {
        registry.subscribe("c1", "posts", std::nullopt, std::string("foo ==="), std::nullopt);
    } catch (const SubscriptionValidationError &ex) {
        thrown = true;
        QVERIFY(std::string(ex.what()).find("invalid filter") != std::string::npos);
    }
    QVERIFY(thrown);
    QCOMPARE(registry.subscriptionCount(), static_cast<std::size_t>(0));
    QVERIFY(registry.listByClient("c1").empty());

    // An empty filter is the same as no filter.
    const auto open = registry.subscribe("c1", "posts", std::nullopt, std::string(), std::nullopt);
    QVERIFY(!open->filter);
    QVERIFY(!open->filterExpr.has_value());
}

void SubscriptionRegistryTests::testRequiredFields()
{
    SubscriptionRegistry registry;
    QVERIFY_EXCEPTION_THROWN(
        registry.subscribe("", "posts", std::nullopt, std::nullopt, std::nullopt),
        SubscriptionValidationError);
    QVERIFY_EXCEPTION_THROWN(
        registry.subscribe("c1", "", std::nullopt, std::nullopt, std::nullopt),
        SubscriptionValidationError);
}

void SubscriptionRegistryTests::testUnsubscribe()
{
    SubscriptionRegistry registry;
    const auto a = registry.subscribe("c1", "posts", std::nullopt, std::nullopt, std::nullopt);
    const auto b = registry.subscribe("c1", "posts", std::nullopt, std::nullopt, std::nullopt);

    const auto snapshot = registry.listByCollection("posts");
    QVERIFY(registry.unsubscribe(a->id));
    QVERIFY(!registry.unsubscribe(a->id));
    QVERIFY(!registry.isActive(a->id));
    QVERIFY(registry.isActive(b->id));

    // Snapshots taken before the removal stay intact.
    QCOMPARE(snapshot.size(), static_cast<std::size_t>(2));
    QCOMPARE(QString::fromStdString(snapshot.front()->collection), QStringLiteral("posts"));

    QVERIFY(registry.unsubscribe(b->id));
    QCOMPARE(registry.clientCount(), static_cast<std::size_t>(0));
}

void SubscriptionRegistryTests::testClientCascade()
{
    SubscriptionRegistry registry;
    registry.subscribe("c1", "posts", std::nullopt, std::nullopt, std::nullopt);
    registry.subscribe("c1", "comments", std::nullopt, std::nullopt, std::nullopt);
    const auto other = registry.subscribe("c2", "posts", std::nullopt, std::nullopt, std::nullopt);

    QCOMPARE(registry.unsubscribeClient("c1"), static_cast<std::size_t>(2));
    QCOMPARE(registry.unsubscribeClient("c1"), static_cast<std::size_t>(0));
    QVERIFY(registry.listByClient("c1").empty());
    QVERIFY(registry.listByCollection("comments").empty());
    QCOMPARE(registry.listByCollection("posts").size(), static_cast<std::size_t>(1));
    QVERIFY(registry.isActive(other->id));
}

void SubscriptionRegistryTests::testCleanupRemovesOnlyStaleInactive()
{
    using namespace std::chrono;
    auto now = system_clock::time_point(hours(1000));
    SubscriptionRegistry registry([&now] { return now; });

    const auto idle = registry.subscribe("idle", "posts", std::nullopt, std::nullopt, std::nullopt);
    const auto busy = registry.subscribe("busy", "posts", std::nullopt, std::nullopt, std::nullopt);

    now += minutes(30);
    const auto fresh = registry.subscribe("fresh", "posts", std::nullopt, std::nullopt, std::nullopt);

    now += minutes(45);
    registry.markActive("busy");

    now += minutes(1);
    QCOMPARE(registry.cleanup(hours(1)), static_cast<std::size_t>(1));
    QVERIFY(!registry.isActive(idle->id));
    QVERIFY(registry.isActive(busy->id));
    QVERIFY(registry.isActive(fresh->id));

    QCOMPARE(registry.cleanup(hours(1)), static_cast<std::size_t>(0));
}

void SubscriptionRegistryTests::testConcurrentMutationAndReads()
{
    SubscriptionRegistry registry;
    std::atomic<bool> inconsistent{false};
    constexpr int kWriters = 4;
    constexpr int kPerWriter = 200;

    std::vector<std::thread> threads;
    for (int w = 0; w < kWriters; ++w) {
        threads.emplace_back([&registry, w] {
            const std::string client = "client-" + std::to_string(w);
            for (int i = 0; i < kPerWriter; ++i) {
                const auto sub = registry.subscribe(client, "posts", std::nullopt, std::nullopt, std::nullopt);
                if (i % 2 == 0) {
                    registry.unsubscribe(sub->id);
                }
            }
        });
    }
    threads.emplace_back([&registry, &inconsistent] {
        for (int i = 0; i < 500; ++i) {
            for (const auto &sub : registry.listByCollection("posts")) {
                if (!sub || sub->collection != "posts" || sub->id.empty()) {
                    inconsistent = true;
                }
            }
        }
    });
    for (auto &thread : threads) {
        thread.join();
    }

    QVERIFY(!inconsistent.load());
    QCOMPARE(registry.subscriptionCount(), static_cast<std::size_t>(kWriters * kPerWriter / 2));
    QCOMPARE(registry.unsubscribeClient("client-0"), static_cast<std::size_t>(kPerWriter / 2));
}

QTEST_MAIN(SubscriptionRegistryTests)
#include "test_subscription_registry.moc"
