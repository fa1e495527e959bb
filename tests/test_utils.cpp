#include <QtTest>
#include "../src/utils.h"

class TestUtils : public QObject {
    Q_OBJECT
private slots:
    void testFormatSize();
    void testFormatDuration();
};

void TestUtils::testFormatSize()
{
    QCOMPARE(Utils::formatSize(0), QString("0 B"));
    QCOMPARE(Utils::formatSize(1023), QString("1023 B"));
    QCOMPARE(Utils::formatSize(1536), QString("1.50 KB"));
    QCOMPARE(Utils::formatSize(5LL * 1024 * 1024), QString("5.00 MB"));
    QCOMPARE(Utils::formatSize(3LL * 1024 * 1024 * 1024 / 2), QString("1.50 GB"));
}

void TestUtils::testFormatDuration()
{
    QCOMPARE(Utils::formatDuration(850), QString("850 ms"));
    QCOMPARE(Utils::formatDuration(1500), QString("1.5 s"));
    QCOMPARE(Utils::formatDuration(90000), QString("1.5 min"));
}

QTEST_APPLESS_MAIN(TestUtils)
#include "test_utils.moc"
