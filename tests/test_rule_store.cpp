#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <filesystem>
#include <optional>

#include "common/models.hpp"
#include "rules/rule_store.hpp"
#include "rules/rules_engine.hpp"

using rulecast::AccessRule;
using rulecast::CollectionRules;

class RuleStoreTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void testRulesSurviveReopen();
    void testNullAndEmptyRulesAreDistinct();
    void testUpsertReplaces();
    void testDelete();
    void testReloadIntoEngine();
    void testIntegrityCheck();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;

    void resetDb();
    std::filesystem::path dbPath() const;
    static CollectionRules postsRules();
};

void RuleStoreTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void RuleStoreTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

std::filesystem::path RuleStoreTests::dbPath() const
{
    return std::filesystem::path(m_tempDir.path().toStdString())
        / ".local/share/rulecast/rulecast.db";
}

void RuleStoreTests::resetDb()
{
    std::error_code error;
    std::filesystem::remove(dbPath(), error);
    std::filesystem::remove(dbPath().string() + "-wal", error);
    std::filesystem::remove(dbPath().string() + "-shm", error);
}

CollectionRules RuleStoreTests::postsRules()
{
    CollectionRules rules;
    rules.name = "posts";
    rules.listRule = AccessRule::fromExpression("auth.id = record.userId");
    rules.viewRule = AccessRule::fromExpression("auth.id = record.userId || record.public = true");
    rules.createRule = AccessRule::fromExpression("auth.id != \"\"");
    rules.updateRule = AccessRule::denyAll();
    rules.deleteRule = AccessRule::allowAll();
    return rules;
}

void RuleStoreTests::testRulesSurviveReopen()
{
    resetDb();

    {
        rulecast::RuleStore store;
        store.upsertCollectionRules(postsRules());
    }

    QVERIFY(std::filesystem::exists(dbPath()));

    {
        rulecast::RuleStore store;
        const auto rules = store.getCollectionRules("posts");
        QVERIFY(rules.has_value());
        QCOMPARE(QString::fromStdString(rules->viewRule.expression),
                 QStringLiteral("auth.id = record.userId || record.public = true"));
        QCOMPARE(rules->listRule.kind, AccessRule::Kind::Expression);
    }
}

void RuleStoreTests::testNullAndEmptyRulesAreDistinct()
{
    resetDb();
    rulecast::RuleStore store;
    store.upsertCollectionRules(postsRules());

    const auto rules = store.getCollectionRules("posts");
    QVERIFY(rules.has_value());
    QCOMPARE(rules->updateRule.kind, AccessRule::Kind::DenyAll);
    QCOMPARE(rules->deleteRule.kind, AccessRule::Kind::AllowAll);
    QVERIFY(!store.getCollectionRules("missing").has_value());
}

void RuleStoreTests::testUpsertReplaces()
{
    resetDb();
    rulecast::RuleStore store;
    store.upsertCollectionRules(postsRules());

    CollectionRules changed = postsRules();
    changed.updateRule = AccessRule::fromExpression("auth.id = record.userId");
    changed.deleteRule = AccessRule::denyAll();
    store.upsertCollectionRules(changed);

    const auto all = store.listCollectionRules();
    QCOMPARE(all.size(), static_cast<size_t>(1));
    QCOMPARE(all.front().updateRule.kind, AccessRule::Kind::Expression);
    QCOMPARE(all.front().deleteRule.kind, AccessRule::Kind::DenyAll);
}

void RuleStoreTests::testDelete()
{
    resetDb();
    rulecast::RuleStore store;
    store.upsertCollectionRules(postsRules());

    QVERIFY(store.deleteCollectionRules("posts"));
    QVERIFY(!store.deleteCollectionRules("posts"));
    QVERIFY(store.listCollectionRules().empty());
}

void RuleStoreTests::testReloadIntoEngine()
{
    resetDb();

    {
        rulecast::RuleStore store;
        store.upsertCollectionRules(postsRules());
        CollectionRules comments;
        comments.name = "comments";
        comments.viewRule = AccessRule::allowAll();
        store.upsertCollectionRules(comments);
    }

    rulecast::RuleStore store;
    rulecast::RulesEngine engine;
    for (const auto &rules : store.listCollectionRules()) {
        QVERIFY(engine.setCollectionRules(rules));
    }

    QVERIFY(engine.hasCollection("posts"));
    QVERIFY(engine.hasCollection("comments"));

    rulecast::RuleContext context;
    context.auth = nlohmann::json{{"id", "u1"}};
    context.record = nlohmann::json{{"id", "p1"}, {"userId", "u1"}};
    QVERIFY(engine.checkRule("posts", rulecast::RuleType::View, context));
    QVERIFY(!engine.checkRule("posts", rulecast::RuleType::Update, context));
    QVERIFY(engine.checkRule("comments", rulecast::RuleType::View, rulecast::RuleContext{}));
}

void RuleStoreTests::testIntegrityCheck()
{
    resetDb();
    rulecast::RuleStore store;
    std::string message;
    QVERIFY(store.integrityCheck(&message));
    QCOMPARE(QString::fromStdString(message), QStringLiteral("ok"));
}

QTEST_MAIN(RuleStoreTests)
#include "test_rule_store.moc"
