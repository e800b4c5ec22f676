#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"
#include "rules/rules_engine.hpp"

using rulecast::AccessRule;
using rulecast::CollectionRules;
using rulecast::RuleContext;
using rulecast::RulesEngine;
using rulecast::RuleType;

class RulesEngineTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();

    void testDenyAllAllowAllAndAdmin();
    void testUnknownCollectionDenies();
    void testExpressionRules();
    void testEvaluationFailureDenies();
    void testRejectsUnparseableRules();
    void testRuleManagement();
    void testGenerateFilterOwnership();
    void testGenerateFilterLiteralsAndFolding();
    void testGenerateFilterUnrecognizedShape();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;

    static CollectionRules postsRules();
    static RuleContext authAs(const std::string &id, const nlohmann::json &record = nullptr);
};

void RulesEngineTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void RulesEngineTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

CollectionRules RulesEngineTests::postsRules()
{
    CollectionRules rules;
    rules.name = "posts";
    rules.listRule = AccessRule::fromExpression("auth.id = record.userId");
    rules.viewRule = AccessRule::fromExpression("auth.id = record.userId || record.public = true");
    rules.createRule = AccessRule::fromExpression("auth.id != \"\" && data.userId = auth.id");
    rules.updateRule = AccessRule::denyAll();
    rules.deleteRule = AccessRule::allowAll();
    return rules;
}

RuleContext RulesEngineTests::authAs(const std::string &id, const nlohmann::json &record)
{
    RuleContext context;
    context.auth = nlohmann::json{{"id", id}, {"role", "member"}};
    if (!record.is_null()) {
        context.record = record;
    }
    return context;
}

void RulesEngineTests::testDenyAllAllowAllAndAdmin()
{
    RulesEngine engine;
    QVERIFY(engine.setCollectionRules(postsRules()));

    QVERIFY(!engine.checkRule("posts", RuleType::Update, authAs("u1")));
    QVERIFY(!engine.checkRule("posts", RuleType::Update, RuleContext{}));
    QVERIFY(engine.checkRule("posts", RuleType::Delete, RuleContext{}));

    RuleContext admin;
    admin.admin = true;
    QVERIFY(engine.checkRule("posts", RuleType::Update, admin));
    QVERIFY(engine.checkRule("anything", RuleType::List, admin));
}

void RulesEngineTests::testUnknownCollectionDenies()
{
    RulesEngine engine;
    QVERIFY(!engine.checkRule("missing", RuleType::View, authAs("u1")));
    QVERIFY(!engine.hasCollection("missing"));
}

void RulesEngineTests::testExpressionRules()
{
    RulesEngine engine;
    QVERIFY(engine.setCollectionRules(postsRules()));

    const nlohmann::json owned{{"id", "p1"}, {"userId", "u1"}, {"public", false}};
    const nlohmann::json shared{{"id", "p2"}, {"userId", "u9"}, {"public", true}};

    QVERIFY(engine.checkRule("posts", RuleType::View, authAs("u1", owned)));
    QVERIFY(!engine.checkRule("posts", RuleType::View, authAs("u2", owned)));
    QVERIFY(engine.checkRule("posts", RuleType::View, authAs("u2", shared)));

    RuleContext anonymous;
    anonymous.record = owned;
    QVERIFY(!engine.checkRule("posts", RuleType::View, anonymous));

    RuleContext create = authAs("u1");
    create.data = nlohmann::json{{"userId", "u1"}};
    QVERIFY(engine.checkRule("posts", RuleType::Create, create));
    create.data = nlohmann::json{{"userId", "u2"}};
    QVERIFY(!engine.checkRule("posts", RuleType::Create, create));

    RuleContext anonymousCreate;
    anonymousCreate.data = nlohmann::json{{"userId", ""}};
    QVERIFY(!engine.checkRule("posts", RuleType::Create, anonymousCreate));
}

void RulesEngineTests::testEvaluationFailureDenies()
{
    RulesEngine engine;
    CollectionRules rules;
    rules.name = "notes";
    rules.viewRule = AccessRule::fromExpression("$size(record.flag) > 0 || true");
    QVERIFY(engine.setCollectionRules(rules));

    RuleContext context;
    context.record = nlohmann::json{{"flag", true}};
    QVERIFY(!engine.checkRule("notes", RuleType::View, context));

    context.record = nlohmann::json{{"flag", "set"}};
    QVERIFY(engine.checkRule("notes", RuleType::View, context));
}

void RulesEngineTests::testRejectsUnparseableRules()
{
    RulesEngine engine;
    CollectionRules rules = postsRules();
    rules.viewRule = AccessRule::fromExpression("auth.id ===");

    std::string error;
    QVERIFY(!engine.setCollectionRules(rules, &error));
    QVERIFY(error.find("view") != std::string::npos);
    QVERIFY(!engine.hasCollection("posts"));

    CollectionRules unnamed = postsRules();
    unnamed.name.clear();
    QVERIFY(!engine.setCollectionRules(unnamed, &error));
}

void RulesEngineTests::testRuleManagement()
{
    RulesEngine engine;
    QVERIFY(engine.setCollectionRules(postsRules()));
    CollectionRules comments;
    comments.name = "comments";
    comments.viewRule = AccessRule::allowAll();
    QVERIFY(engine.setCollectionRules(comments));

    const auto listed = engine.listCollections();
    QCOMPARE(listed.size(), static_cast<std::size_t>(2));
    QCOMPARE(QString::fromStdString(listed.front().name), QStringLiteral("comments"));

    const auto stored = engine.collectionRules("posts");
    QVERIFY(stored.has_value());
    QVERIFY(stored->updateRule.kind == AccessRule::Kind::DenyAll);
    QCOMPARE(QString::fromStdString(stored->listRule.expression),
             QStringLiteral("auth.id = record.userId"));

    QVERIFY(engine.removeCollection("posts"));
    QVERIFY(!engine.removeCollection("posts"));
    QVERIFY(!engine.checkRule("posts", RuleType::Delete, RuleContext{}));
}

void RulesEngineTests::testGenerateFilterOwnership()
{
    RulesEngine engine;
    QVERIFY(engine.setCollectionRules(postsRules()));

    const auto owned = engine.generateFilter("posts", authAs("u1"));
    QVERIFY(owned.has_value());
    QCOMPARE(QString::fromStdString(owned->clause), QStringLiteral("\"userId\" = ?"));
    QCOMPARE(owned->params.size(), static_cast<std::size_t>(1));
    QVERIFY(owned->params.front() == nlohmann::json("u1"));

    const auto anonymous = engine.generateFilter("posts", RuleContext{});
    QVERIFY(anonymous.has_value());
    QVERIFY(anonymous->isAlwaysFalse());

    RuleContext admin;
    admin.admin = true;
    const auto adminFilter = engine.generateFilter("posts", admin);
    QVERIFY(adminFilter.has_value());
    QVERIFY(adminFilter->isAlwaysTrue());

    const auto unknown = engine.generateFilter("missing", authAs("u1"));
    QVERIFY(unknown.has_value());
    QVERIFY(unknown->isAlwaysFalse());
}

void RulesEngineTests::testGenerateFilterLiteralsAndFolding()
{
    RulesEngine engine;
    CollectionRules rules;
    rules.name = "articles";
    rules.listRule = AccessRule::fromExpression(
        "auth.role = 'editor' && record.status = 'published' && 10 < record.views");
    QVERIFY(engine.setCollectionRules(rules));

    RuleContext editor;
    editor.auth = nlohmann::json{{"id", "e1"}, {"role", "editor"}};
    const auto fragment = engine.generateFilter("articles", editor);
    QVERIFY(fragment.has_value());
    QCOMPARE(QString::fromStdString(fragment->clause),
             QStringLiteral("(\"status\" = ?) AND (\"views\" > ?)"));
    QCOMPARE(fragment->params.size(), static_cast<std::size_t>(2));
    QVERIFY(fragment->params[0] == nlohmann::json("published"));
    QVERIFY(fragment->params[1] == nlohmann::json(10));

    RuleContext member;
    member.auth = nlohmann::json{{"id", "m1"}, {"role", "member"}};
    const auto denied = engine.generateFilter("articles", member);
    QVERIFY(denied.has_value());
    QVERIFY(denied->isAlwaysFalse());

    CollectionRules open;
    open.name = "open";
    open.listRule = AccessRule::allowAll();
    QVERIFY(engine.setCollectionRules(open));
    const auto all = engine.generateFilter("open", RuleContext{});
    QVERIFY(all.has_value());
    QVERIFY(all->isAlwaysTrue());

    CollectionRules closed;
    closed.name = "closed";
    QVERIFY(engine.setCollectionRules(closed));
    const auto none = engine.generateFilter("closed", editor);
    QVERIFY(none.has_value());
    QVERIFY(none->isAlwaysFalse());
}

void RulesEngineTests::testGenerateFilterUnrecognizedShape()
{
    RulesEngine engine;
    CollectionRules rules;
    rules.name = "docs";
    rules.listRule = AccessRule::fromExpression("$contains(record.editors, auth.id)");
    QVERIFY(engine.setCollectionRules(rules));

    QVERIFY(!engine.generateFilter("docs", authAs("u1")).has_value());
}

QTEST_MAIN(RulesEngineTests)
#include "test_rules_engine.moc"
