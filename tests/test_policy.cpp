#include <QtTest/QtTest>

#include <stdexcept>
#include <string>
#include <vector>

#include "retention/policy.hpp"

using keepsake::Period;
using keepsake::Policy;
using keepsake::PolicyParseError;
using keepsake::Unit;

class PolicyTests : public QObject
{
    Q_OBJECT
private slots:
    void testSetAndGet();
    void testMustSet();
    void testForEachFollowsPeriodOrder();
    void testCloneIsIndependent();
    void testParseDefaultsAndForms();
    void testParseErrors();
    void testParseStopsAtFirstBadRule();
    void testTextIsCanonical();
    void testFromTextSplitsWhitespace();
    void testToString();

private:
    static void expectParseError(const std::vector<std::string> &rules,
                                 PolicyParseError::Kind kind,
                                 const std::string &rule,
                                 const std::string &field);
};

void PolicyTests::expectParseError(const std::vector<std::string> &rules,
                                   PolicyParseError::Kind kind,
                                   const std::string &rule,
                                   const std::string &field)
{
    try {
        keepsake::parsePolicy(rules);
        QFAIL(qPrintable(QStringLiteral("no error for rule %1")
                             .arg(QString::fromStdString(rule))));
    } catch (const PolicyParseError &error) {
        QCOMPARE(error.kind(), kind);
        QCOMPARE(QString::fromStdString(error.rule()), QString::fromStdString(rule));
        QCOMPARE(QString::fromStdString(error.field()), QString::fromStdString(field));
        QVERIFY(QString::fromUtf8(error.what())
                    .startsWith(QStringLiteral("rule \"%1\": ")
                                    .arg(QString::fromStdString(rule))));
    }
}

void PolicyTests::testSetAndGet()
{
    Policy policy;
    QVERIFY(policy.isEmpty());

    QVERIFY(policy.set(Period{Unit::Daily, 1}, 7));
    QCOMPARE(policy.get(Period{Unit::Daily, 1}), 7);

    QVERIFY(policy.set(Period{Unit::Yearly, 1}, -20));
    QCOMPARE(policy.get(Period{Unit::Yearly, 1}), Policy::kInfinite);

    // Last is normalized to interval 1.
    QVERIFY(policy.set(Period{Unit::Last, 4}, 3));
    QCOMPARE(policy.get(Period{Unit::Last, 1}), 3);
    QCOMPARE(policy.size(), static_cast<std::size_t>(3));

    QVERIFY(policy.set(Period{Unit::Daily, 1}, 0));
    QCOMPARE(policy.get(Period{Unit::Daily, 1}), 0);
    QCOMPARE(policy.size(), static_cast<std::size_t>(2));

    QVERIFY(!policy.set(Period{Unit::Monthly, 0}, 5));
    QVERIFY(!policy.set(Period{static_cast<Unit>(12), 1}, 5));
    QCOMPARE(policy.size(), static_cast<std::size_t>(2));
    QCOMPARE(policy.get(Period{Unit::Monthly, -1}), 0);
    QCOMPARE(policy.get(Period{Unit::Secondly, 60}), 0);
}

void PolicyTests::testMustSet()
{
    Policy policy;
    policy.mustSet(Unit::Daily, 1, 7);
    policy.mustSet(Unit::Daily, 2, 3);
    QCOMPARE(policy.size(), static_cast<std::size_t>(2));

    bool threw = false;
    try {
        policy.mustSet(Unit::Daily, 1, 9);
    } catch (const std::logic_error &) {
        threw = true;
    }
    QVERIFY(threw);
    QCOMPARE(policy.get(Period{Unit::Daily, 1}), 7);

    threw = false;
    try {
        policy.mustSet(Unit::Monthly, 0, 1);
    } catch (const std::logic_error &) {
        threw = true;
    }
    QVERIFY(threw);
}

void PolicyTests::testForEachFollowsPeriodOrder()
{
    Policy policy;
    policy.set(Period{Unit::Yearly, 2}, 1);
    policy.set(Period{Unit::Secondly, 60}, 2);
    policy.set(Period{Unit::Daily, 1}, 3);
    policy.set(Period{Unit::Last, 1}, 4);
    policy.set(Period{Unit::Secondly, 30}, 5);

    std::vector<Period> visited;
    std::vector<int> counts;
    policy.forEach([&](const Period &period, int count) {
        visited.push_back(period);
        counts.push_back(count);
    });

    const std::vector<Period> expected = {
        {Unit::Last, 1},
        {Unit::Secondly, 30},
        {Unit::Secondly, 60},
        {Unit::Daily, 1},
        {Unit::Yearly, 2},
    };
    QVERIFY(visited == expected);
    QVERIFY((counts == std::vector<int>{4, 5, 2, 3, 1}));
}

void PolicyTests::testCloneIsIndependent()
{
    Policy policy;
    policy.set(Period{Unit::Daily, 1}, 7);

    Policy copy = policy.clone();
    QVERIFY(copy == policy);

    copy.set(Period{Unit::Daily, 1}, 2);
    copy.set(Period{Unit::Monthly, 1}, 1);
    QCOMPARE(policy.get(Period{Unit::Daily, 1}), 7);
    QCOMPARE(policy.size(), static_cast<std::size_t>(1));
    QVERIFY(copy != policy);
}

void PolicyTests::testParseDefaultsAndForms()
{
    const Policy policy = keepsake::parsePolicy(
        {"daily", "7@daily:2", "MONTHLY", "+3@yearly", "-5@yearly:10",
         "secondly:1h30m", "2@secondly:90", "secondly:1.9s", "1@Last:1"});

    QCOMPARE(policy.get(Period{Unit::Daily, 1}), Policy::kInfinite);
    QCOMPARE(policy.get(Period{Unit::Daily, 2}), 7);
    QCOMPARE(policy.get(Period{Unit::Monthly, 1}), Policy::kInfinite);
    QCOMPARE(policy.get(Period{Unit::Yearly, 1}), 3);
    QCOMPARE(policy.get(Period{Unit::Yearly, 10}), Policy::kInfinite);
    QCOMPARE(policy.get(Period{Unit::Secondly, 5400}), Policy::kInfinite);
    QCOMPARE(policy.get(Period{Unit::Secondly, 90}), 2);
    QCOMPARE(policy.get(Period{Unit::Secondly, 1}), Policy::kInfinite);
    QCOMPARE(policy.get(Period{Unit::Last, 1}), 1);
    QCOMPARE(policy.size(), static_cast<std::size_t>(9));

    QVERIFY(keepsake::parsePolicy({}).isEmpty());
}

void PolicyTests::testParseErrors()
{
    using Kind = PolicyParseError::Kind;

    expectParseError({"weekly"}, Kind::UnknownUnit, "weekly", "unit");
    expectParseError({"3@"}, Kind::UnknownUnit, "3@", "unit");
    expectParseError({"x@daily"}, Kind::BadInteger, "x@daily", "count");
    expectParseError({"@daily"}, Kind::BadInteger, "@daily", "count");
    expectParseError({"99999999999@daily"}, Kind::BadInteger, "99999999999@daily", "count");
    expectParseError({"0@last:1"}, Kind::InvalidPeriod, "0@last:1", "count");
    expectParseError({"daily:x"}, Kind::BadInteger, "daily:x", "interval");
    expectParseError({"monthly:1h"}, Kind::BadInteger, "monthly:1h", "interval");
    expectParseError({"daily:0"}, Kind::InvalidPeriod, "daily:0", "interval");
    expectParseError({"yearly:-2"}, Kind::InvalidPeriod, "yearly:-2", "interval");
    expectParseError({"secondly:500ms"}, Kind::InvalidPeriod, "secondly:500ms", "interval");
    expectParseError({"last:2"}, Kind::InvalidPeriod, "last:2", "interval");
    expectParseError({"daily", "5@daily"}, Kind::DuplicatePeriod, "5@daily", "period");
    expectParseError({"secondly:60", "secondly:1m"}, Kind::DuplicatePeriod, "secondly:1m",
                     "period");

    try {
        keepsake::parsePolicy({"daily", "7@DAILY:1"});
        QFAIL("duplicate accepted");
    } catch (const PolicyParseError &error) {
        QCOMPARE(QString::fromUtf8(error.what()),
                 QStringLiteral("rule \"7@DAILY:1\": duplicate daily:1"));
    }

    try {
        keepsake::parsePolicy({"0@daily"});
        QFAIL("zero count accepted");
    } catch (const PolicyParseError &error) {
        QCOMPARE(QString::fromUtf8(error.what()),
                 QStringLiteral("rule \"0@daily\": count must not be zero"));
    }
}

void PolicyTests::testParseStopsAtFirstBadRule()
{
    try {
        keepsake::parsePolicy({"1@last", "bogus", "daily:0"});
        QFAIL("bad rule accepted");
    } catch (const PolicyParseError &error) {
        QCOMPARE(QString::fromStdString(error.rule()), QStringLiteral("bogus"));
        QCOMPARE(error.kind(), PolicyParseError::Kind::UnknownUnit);
    }
}

void PolicyTests::testTextIsCanonical()
{
    const Policy policy = keepsake::parsePolicy(
        {"yearly:5", "7@daily", "secondly:5400", "1@last", "2@monthly:3", "secondly:30"});

    const std::string text = policy.toText();
    QCOMPARE(QString::fromStdString(text),
             QStringLiteral("1@last secondly:30 secondly:1h30m 7@daily 2@monthly:3 yearly:5"));

    const Policy reparsed = Policy::fromText(text);
    QVERIFY(reparsed == policy);
    QCOMPARE(QString::fromStdString(reparsed.toText()), QString::fromStdString(text));

    const Policy reordered = keepsake::parsePolicy(
        {"secondly:30", "2@monthly:3", "1@last", "secondly:1h30m", "yearly:5", "7@daily:1"});
    QCOMPARE(QString::fromStdString(reordered.toText()), QString::fromStdString(text));

    QCOMPARE(QString::fromStdString(Policy().toText()), QString());
}

void PolicyTests::testFromTextSplitsWhitespace()
{
    const Policy policy = Policy::fromText("  1@last\t7@daily\n yearly ");
    QCOMPARE(policy.size(), static_cast<std::size_t>(3));
    QCOMPARE(policy.get(Period{Unit::Last, 1}), 1);
    QCOMPARE(policy.get(Period{Unit::Daily, 1}), 7);
    QCOMPARE(policy.get(Period{Unit::Yearly, 1}), Policy::kInfinite);

    QVERIFY(Policy::fromText("   ").isEmpty());
}

void PolicyTests::testToString()
{
    const Policy policy =
        keepsake::parsePolicy({"yearly:5", "7@daily", "3@last", "6@secondly:1h"});
    QCOMPARE(QString::fromStdString(policy.toString()),
             QStringLiteral("last (3), every 1h (6), every day (7), every 5 years (inf)"));
    QCOMPARE(QString::fromStdString(Policy().toString()), QString());
}

QTEST_MAIN(PolicyTests)
#include "test_policy.moc"
