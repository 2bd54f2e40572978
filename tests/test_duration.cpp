#include <QtTest/QtTest>

#include <chrono>
#include <string>

#include "retention/duration.hpp"

using namespace std::chrono_literals;

class DurationTests : public QObject
{
    Q_OBJECT
private slots:
    void testParseUnits();
    void testParseFractionsAndSigns();
    void testParseRejects();
    void testFormat();
    void testFormatParsesBack();
};

void DurationTests::testParseUnits()
{
    QVERIFY(keepsake::parseDuration("90s") == std::chrono::nanoseconds(90s));
    QVERIFY(keepsake::parseDuration("1h30m") == std::chrono::nanoseconds(5400s));
    QVERIFY(keepsake::parseDuration("1h0m5s") == std::chrono::nanoseconds(3605s));
    QVERIFY(keepsake::parseDuration("500ms") == std::chrono::nanoseconds(500ms));
    QVERIFY(keepsake::parseDuration("2us") == std::chrono::nanoseconds(2us));
    QVERIFY(keepsake::parseDuration("3\xC2\xB5s") == std::chrono::nanoseconds(3us));
    QVERIFY(keepsake::parseDuration("3\xCE\xBCs") == std::chrono::nanoseconds(3us));
    QVERIFY(keepsake::parseDuration("7ns") == std::chrono::nanoseconds(7));
    QVERIFY(keepsake::parseDuration("0") == std::chrono::nanoseconds(0));
}

void DurationTests::testParseFractionsAndSigns()
{
    QVERIFY(keepsake::parseDuration("1.5h") == std::chrono::nanoseconds(5400s));
    QVERIFY(keepsake::parseDuration(".5s") == std::chrono::nanoseconds(500ms));
    QVERIFY(keepsake::parseDuration("1.9s") == std::chrono::nanoseconds(1900ms));
    QVERIFY(keepsake::parseDuration("-2m") == std::chrono::nanoseconds(-120s));
    QVERIFY(keepsake::parseDuration("+2m") == std::chrono::nanoseconds(120s));
}

void DurationTests::testParseRejects()
{
    QVERIFY(!keepsake::parseDuration("").has_value());
    QVERIFY(!keepsake::parseDuration("-").has_value());
    QVERIFY(!keepsake::parseDuration("h").has_value());
    QVERIFY(!keepsake::parseDuration("1").has_value());
    QVERIFY(!keepsake::parseDuration("1x").has_value());
    QVERIFY(!keepsake::parseDuration(".s").has_value());
    QVERIFY(!keepsake::parseDuration("--1s").has_value());
    QVERIFY(!keepsake::parseDuration("1d").has_value());
    QVERIFY(!keepsake::parseDuration("9999999999h").has_value());
}

void DurationTests::testFormat()
{
    QCOMPARE(QString::fromStdString(keepsake::formatDuration(0)), QStringLiteral("0s"));
    QCOMPARE(QString::fromStdString(keepsake::formatDuration(45)), QStringLiteral("45s"));
    QCOMPARE(QString::fromStdString(keepsake::formatDuration(60)), QStringLiteral("1m"));
    QCOMPARE(QString::fromStdString(keepsake::formatDuration(90)), QStringLiteral("1m30s"));
    QCOMPARE(QString::fromStdString(keepsake::formatDuration(3600)), QStringLiteral("1h"));
    QCOMPARE(QString::fromStdString(keepsake::formatDuration(5400)), QStringLiteral("1h30m"));
    QCOMPARE(QString::fromStdString(keepsake::formatDuration(3605)), QStringLiteral("1h0m5s"));
    QCOMPARE(QString::fromStdString(keepsake::formatDuration(86400)), QStringLiteral("24h"));
}

void DurationTests::testFormatParsesBack()
{
    for (const long long seconds : {1LL, 59LL, 61LL, 3599LL, 7200LL, 90061LL}) {
        const auto parsed = keepsake::parseDuration(keepsake::formatDuration(seconds));
        QVERIFY(parsed.has_value());
        QCOMPARE(static_cast<long long>(
                     std::chrono::duration_cast<std::chrono::seconds>(*parsed).count()),
                 seconds);
    }
}

QTEST_MAIN(DurationTests)
#include "test_duration.moc"
