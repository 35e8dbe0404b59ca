#include <QtTest>

#include "utils/formatting.h"

class TestFormatting : public QObject
{
    Q_OBJECT

private slots:
    void testFormatFileSize_data()
    {
        QTest::addColumn<qint64>("bytes");
        QTest::addColumn<QString>("expected");

        QTest::newRow("zero") << qint64(0) << "0 B";
        QTest::newRow("negative") << qint64(-5) << "0 B";
        QTest::newRow("bytes") << qint64(512) << "512 B";
        QTest::newRow("just below KB") << qint64(1023) << "1023 B";
        QTest::newRow("one KB") << qint64(1024) << "1.0 KB";
        QTest::newRow("fractional KB") << qint64(1536) << "1.5 KB";
        QTest::newRow("MB") << qint64(5 * 1024 * 1024) << "5.0 MB";
        QTest::newRow("GB") << qint64(3) * 1024 * 1024 * 1024 / 2 << "1.5 GB";
    }

    void testFormatFileSize()
    {
        QFETCH(qint64, bytes);
        QFETCH(QString, expected);
        QCOMPARE(Formatting::formatFileSize(bytes), expected);
    }

    void testEstimateTransferTime()
    {
        QCOMPARE(Formatting::estimateTransferTime(1200, 100.0), QString("12s"));
        QCOMPARE(Formatting::estimateTransferTime(184, 1.0), QString("3m 4s"));
        QCOMPARE(Formatting::estimateTransferTime(3720, 1.0), QString("1h 2m"));
        QCOMPARE(Formatting::estimateTransferTime(0, 10.0), QString("0s"));
    }

    void testEstimateWithoutThroughput()
    {
        QCOMPARE(Formatting::estimateTransferTime(1000, 0.0), QString("Unknown"));
        QCOMPARE(Formatting::estimateTransferTime(1000, -1.0), QString("Unknown"));
    }

    void testSanitizeReplacesInvalidCharacters()
    {
        QCOMPARE(Formatting::sanitizeFileName("Q1: plan/draft?.doc"), QString("Q1_ plan_draft_.doc"));
        QCOMPARE(Formatting::sanitizeFileName(QString("tab\there")), QString("tab_here"));
        QCOMPARE(Formatting::sanitizeFileName("report.pdf"), QString("report.pdf"));
    }

    void testSanitizeTrimsDotsAndSpaces()
    {
        QCOMPARE(Formatting::sanitizeFileName("  .hidden. "), QString("hidden"));
        QCOMPARE(Formatting::sanitizeFileName("..."), QString("untitled"));
        QCOMPARE(Formatting::sanitizeFileName(""), QString("untitled"));
    }

    void testSanitizeKeepsExtensionWhenTruncating()
    {
        const QString longName = QString(300, QLatin1Char('n')) + ".txt";
        const QString result = Formatting::sanitizeFileName(longName);

        QCOMPARE(result.size(), 255);
        QVERIFY(result.endsWith(".txt"));
        QVERIFY(result.startsWith("nnnn"));
    }
};

QTEST_MAIN(TestFormatting)
#include "test_formatting.moc"
