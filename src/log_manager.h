#ifndef LOG_MANAGER_H
#define LOG_MANAGER_H

#include <QObject>
#include <QStringList>
#include <QMutex>
#include <QFile>
#include <QTextStream>
#include <QTimer>

enum class LogLevel { Debug, Info, Warn, Error, Fatal };

QString logLevelName(LogLevel level);

/**
 * @brief Process-wide log sink behind qDebug/qInfo/qWarning/qCritical.
 *
 * Keeps the last MAX_LOGS formatted lines in memory and writes through to the
 * log file in the state directory. Writes are flushed in batches by a timer;
 * warnings and worse are flushed at once so they survive a crash. Lines at or
 * above the echo threshold are also printed to stderr.
 */
class LogManager : public QObject {
    Q_OBJECT

public:
    static LogManager& instance() {
        static LogManager inst;
        return inst;
    }

    ~LogManager() override;

    // Opens (appending) the persistent log. A file larger than maxBytes is
    // first rolled over to "<path>.1", replacing the previous backup.
    bool openLogFile(const QString& path, qint64 maxBytes = DEFAULT_MAX_LOG_BYTES);
    void closeLogFile();
    QString logFilePath() const;

    void setEchoThreshold(LogLevel level) { m_echoThreshold = level; }
    LogLevel echoThreshold() const { return m_echoThreshold; }
    // --verbose: echo everything down to debug output.
    void setVerbose(bool verbose) { m_echoThreshold = verbose ? LogLevel::Debug : LogLevel::Warn; }
    bool shouldEcho(LogLevel level) const { return level >= m_echoThreshold; }

    QStringList logs() const;
    // Buffered lines whose message starts with "[tag]".
    QStringList logsTagged(const QString& tag) const;

    void addLog(const QString& message, LogLevel level = LogLevel::Info);
    void clear();
    void flush() { flushPending(); }

    static QString formatLine(const QDateTime& when, LogLevel level, const QString& message);

    static constexpr int MAX_LOGS = 1000;
    static constexpr qint64 DEFAULT_MAX_LOG_BYTES = 5 * 1024 * 1024;

private:
    explicit LogManager(QObject* parent = nullptr);
    void flushPending();
    void scheduleFlush(LogLevel level);

    QStringList m_logs;
    mutable QMutex m_mutex;
    QFile m_file;
    QTextStream m_ts;
    QTimer m_flushTimer;
    bool m_pendingFlush = false;
    LogLevel m_echoThreshold = LogLevel::Warn;
    static constexpr int FLUSH_INTERVAL_MS = 250;
};

// Routes Qt messages into LogManager. Installed once by main().
void customMessageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg);

#endif // LOG_MANAGER_H
