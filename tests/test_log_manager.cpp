#include <QtTest>
#include <QTemporaryDir>
#include <QFile>
#include <QRegularExpression>
#include "../src/log_manager.h"

class TestLogManager : public QObject {
    Q_OBJECT
private slots:
    void init();
    void cleanupTestCase();
    void testLineFormat();
    void testRingIsBounded();
    void testWriteThrough();
    void testRollOver();
    void testMessageHandlerAndTags();
    void testEchoThreshold();
};

static QByteArray readFile(const QString& path)
{
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) return QByteArray();
    return f.readAll();
}

void TestLogManager::init()
{
    LogManager::instance().closeLogFile();
    LogManager::instance().clear();
}

void TestLogManager::cleanupTestCase()
{
    LogManager::instance().closeLogFile();
}

void TestLogManager::testLineFormat()
{
    const QDateTime when(QDate(2024, 3, 1), QTime(9, 5, 7, 42));
    QCOMPARE(LogManager::formatLine(when, LogLevel::Warn, "[Journal] slow"),
             QString("[09:05:07.042] [WARN] [Journal] slow"));
    QCOMPARE(logLevelName(LogLevel::Error), QString("ERROR"));
    QCOMPARE(logLevelName(LogLevel::Debug), QString("DEBUG"));
}

void TestLogManager::testRingIsBounded()
{
    LogManager& logs = LogManager::instance();
    for (int i = 0; i < LogManager::MAX_LOGS + 5; ++i) logs.addLog(QString("line %1").arg(i));
    const QStringList lines = logs.logs();
    QCOMPARE(lines.size(), LogManager::MAX_LOGS);
    QVERIFY(lines.first().endsWith("line 5"));
    QVERIFY(lines.last().endsWith(QString("line %1").arg(LogManager::MAX_LOGS + 4)));
    QVERIFY(QRegularExpression(R"(^\[\d\d:\d\d:\d\d\.\d{3}\] \[INFO\] line 5$)").match(lines.first()).hasMatch());
}

void TestLogManager::testWriteThrough()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());
    const QString path = tmp.filePath("state/foldertidy.log");
    LogManager& logs = LogManager::instance();
    QVERIFY(logs.openLogFile(path));
    QCOMPARE(logs.logFilePath(), path);

    logs.addLog("[Organizer] Done", LogLevel::Info);
    logs.addLog("[MoveEngine] Skipped a.pdf", LogLevel::Warn);
    logs.flush();

    const QByteArray text = readFile(path);
    QVERIFY(text.contains("--- foldertidy "));
    QVERIFY(text.contains("[INFO] [Organizer] Done"));
    QVERIFY(text.contains("[WARN] [MoveEngine] Skipped a.pdf"));

    logs.closeLogFile();
    QVERIFY(logs.logFilePath().isEmpty());
    logs.addLog("only in memory");
    QVERIFY(!readFile(path).contains("only in memory"));
    QVERIFY(logs.logs().last().endsWith("only in memory"));
}

void TestLogManager::testRollOver()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());
    const QString path = tmp.filePath("foldertidy.log");
    {
        QFile f(path);
        QVERIFY(f.open(QIODevice::WriteOnly));
        f.write(QByteArray(200, 'o'));
    }

    LogManager& logs = LogManager::instance();
    QVERIFY(logs.openLogFile(path, 100));
    logs.addLog("fresh", LogLevel::Error);
    logs.closeLogFile();

    QCOMPARE(readFile(path + ".1"), QByteArray(200, 'o'));
    const QByteArray current = readFile(path);
    QVERIFY(current.contains("[ERROR] fresh"));
    QVERIFY(!current.contains("ooo"));

    // Below the limit the file is appended to.
    QVERIFY(logs.openLogFile(path, 1024 * 1024));
    logs.addLog("appended", LogLevel::Error);
    logs.closeLogFile();
    const QByteArray appended = readFile(path);
    QVERIFY(appended.contains("[ERROR] fresh"));
    QVERIFY(appended.contains("[ERROR] appended"));
}

void TestLogManager::testMessageHandlerAndTags()
{
    LogManager& logs = LogManager::instance();
    logs.setEchoThreshold(LogLevel::Fatal);
    const QtMessageHandler previous = qInstallMessageHandler(customMessageHandler);
    qInfo() << "[Scanner] Pruned" << 2 << "directories";
    qWarning() << "[Lock] busy";
    qDebug() << "[Scanner] Queued";
    qInstallMessageHandler(previous);
    logs.setEchoThreshold(LogLevel::Warn);

    const QStringList scanner = logs.logsTagged("Scanner");
    QCOMPARE(scanner.size(), 2);
    QVERIFY(scanner[0].contains("[INFO] [Scanner] Pruned 2 directories"));
    QVERIFY(scanner[1].contains("[DEBUG] [Scanner] Queued"));
    QCOMPARE(logs.logsTagged("Lock").size(), 1);
    QVERIFY(logs.logsTagged("Journal").isEmpty());
}

void TestLogManager::testEchoThreshold()
{
    LogManager& logs = LogManager::instance();
    logs.setVerbose(false);
    QVERIFY(!logs.shouldEcho(LogLevel::Info));
    QVERIFY(logs.shouldEcho(LogLevel::Warn));
    QVERIFY(logs.shouldEcho(LogLevel::Error));
    logs.setVerbose(true);
    QVERIFY(logs.shouldEcho(LogLevel::Debug));
    logs.setVerbose(false);
    QCOMPARE(logs.echoThreshold(), LogLevel::Warn);
}

QTEST_APPLESS_MAIN(TestLogManager)
#include "test_log_manager.moc"
