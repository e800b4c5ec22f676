#include <QtTest/QtTest>

#include <string>

#include <nlohmann/json.hpp>

#include "rules/filter_matcher.hpp"

using rulecast::FilterMatcher;

class FilterMatcherTests : public QObject
{
    Q_OBJECT
private slots:
    void testPublishedAndPopular();
    void testFastPathShapes();
    void testGeneralFallback();
    void testTypedCoercionOnFastPath();
    void testRejectsMalformedFilter();
    void testRejectsClockDependentFilter();
};

void FilterMatcherTests::testPublishedAndPopular()
{
    const auto matcher = FilterMatcher::compile("status='published' && views>10");
    QVERIFY(matcher);
    QVERIFY(matcher->usesFastPath());

    QVERIFY(matcher->matches({{"id", "1"}, {"status", "published"}, {"views", 11}}));
    QVERIFY(!matcher->matches({{"id", "2"}, {"status", "published"}, {"views", 10}}));
    QVERIFY(!matcher->matches({{"id", "3"}, {"status", "draft"}, {"views", 500}}));
    QVERIFY(!matcher->matches({{"id", "4"}}));
}

void FilterMatcherTests::testFastPathShapes()
{
    const auto prefixed = FilterMatcher::compile("record.author.name = 'ann' && 3 < record.rank");
    QVERIFY(prefixed);
    QVERIFY(prefixed->usesFastPath());
    QVERIFY(prefixed->matches({{"author", {{"name", "ann"}}}, {"rank", 4}}));
    QVERIFY(!prefixed->matches({{"author", {{"name", "ann"}}}, {"rank", 3}}));
    QCOMPARE(QString::fromStdString(prefixed->source()),
             QStringLiteral("record.author.name = 'ann' && 3 < record.rank"));
}

void FilterMatcherTests::testGeneralFallback()
{
    const auto either = FilterMatcher::compile("status = 'draft' || $contains(tags, 'pinned')");
    QVERIFY(either);
    QVERIFY(!either->usesFastPath());
    QVERIFY(either->matches({{"status", "draft"}}));
    QVERIFY(either->matches({{"status", "published"}, {"tags", {"pinned"}}}));
    QVERIFY(!either->matches({{"status", "published"}, {"tags", {"old"}}}));

    const auto failing = FilterMatcher::compile("$size(flag) > 0");
    QVERIFY(failing);
    QVERIFY(!failing->matches({{"flag", true}}));
}

void FilterMatcherTests::testTypedCoercionOnFastPath()
{
    const auto matcher = FilterMatcher::compile("views = '42' && featured = 'true'");
    QVERIFY(matcher);
    QVERIFY(matcher->usesFastPath());
    QVERIFY(matcher->matches({{"views", 42}, {"featured", true}}));
    QVERIFY(!matcher->matches({{"views", 42}, {"featured", false}}));
}

void FilterMatcherTests::testRejectsMalformedFilter()
{
    std::string error;
    QVERIFY(!FilterMatcher::compile("foo ===", &error));
    QVERIFY(!error.empty());
    QVERIFY(error.find("position") != std::string::npos);

    QVERIFY(!FilterMatcher::compile("$unknown(status)"));
}

void FilterMatcherTests::testRejectsClockDependentFilter()
{
    std::string error;
    QVERIFY(!FilterMatcher::compile("publishAt < $now()", &error));
    QVERIFY(error.find("$now()") != std::string::npos);

    // Access rules may still compare against the clock.
    QVERIFY(rulecast::expr::parseExpression("record.publishAt < $now()").ok());
}

QTEST_MAIN(FilterMatcherTests)
#include "test_filter_matcher.moc"
