#include "log_manager.h"
#include <QDebug>
#include <QMutexLocker>
#include <QCoreApplication>
#include <QDateTime>
#include <QThread>
#include <QFileInfo>
#include <QDir>
#include <cstdio>
#include <cstdlib>

namespace {

LogLevel levelFor(QtMsgType type)
{
    switch (type) {
        case QtDebugMsg: return LogLevel::Debug;
        case QtInfoMsg: return LogLevel::Info;
        case QtWarningMsg: return LogLevel::Warn;
        case QtCriticalMsg: return LogLevel::Error;
        case QtFatalMsg: return LogLevel::Fatal;
    }
    return LogLevel::Info;
}

// Keeps a single backup next to the live file.
void rollOver(const QString& path, qint64 maxBytes)
{
    const QFileInfo fi(path);
    if (maxBytes <= 0 || !fi.exists() || fi.size() <= maxBytes) return;
    const QString backup = path + ".1";
    QFile::remove(backup);
    if (!QFile::rename(path, backup)) {
        fprintf(stderr, "Cannot roll over log file %s\n", QFile::encodeName(path).constData());
    }
}

} // namespace

QString logLevelName(LogLevel level)
{
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
    }
    return "INFO";
}

LogManager::LogManager(QObject* parent) : QObject(parent) {
    m_flushTimer.setSingleShot(true);
    m_flushTimer.setInterval(FLUSH_INTERVAL_MS);
    connect(&m_flushTimer, &QTimer::timeout, this, &LogManager::flushPending);
}

LogManager::~LogManager() {
    closeLogFile();
}

QString LogManager::formatLine(const QDateTime& when, LogLevel level, const QString& message) {
    return QString("[%1] [%2] %3").arg(when.toString("hh:mm:ss.zzz"), logLevelName(level), message);
}

bool LogManager::openLogFile(const QString& path, qint64 maxBytes) {
    closeLogFile();
    QMutexLocker locker(&m_mutex);
    QDir().mkpath(QFileInfo(path).absolutePath());
    rollOver(path, maxBytes);
    m_file.setFileName(path);
    if (!m_file.open(QIODevice::Append | QIODevice::Text)) {
        return false;
    }
    m_ts.setDevice(&m_file);
    m_ts << "\n--- foldertidy " << QCoreApplication::applicationPid() << " started "
         << QDateTime::currentDateTime().toString(Qt::ISODate) << " ---\n";
    m_ts.flush();
    return true;
}

void LogManager::closeLogFile() {
    m_flushTimer.stop();
    QMutexLocker locker(&m_mutex);
    m_pendingFlush = false;
    if (!m_file.isOpen()) return;
    m_ts.flush();
    m_ts.setDevice(nullptr);
    m_file.close();
}

QString LogManager::logFilePath() const {
    QMutexLocker locker(&m_mutex);
    return m_file.isOpen() ? m_file.fileName() : QString();
}

QStringList LogManager::logs() const {
    QMutexLocker locker(&m_mutex);
    return m_logs;
}

QStringList LogManager::logsTagged(const QString& tag) const {
    const QString marker = QString("[%1]").arg(tag);
    QStringList out;
    QMutexLocker locker(&m_mutex);
    for (const QString& line : m_logs) {
        // "[time] [LEVEL] message"
        if (line.section("] ", 2).startsWith(marker)) out.append(line);
    }
    return out;
}

void LogManager::addLog(const QString& message, LogLevel level) {
    const QString line = formatLine(QDateTime::currentDateTime(), level, message);
    bool toDisk = false;
    {
        QMutexLocker locker(&m_mutex);
        m_logs.append(line);
        if (m_logs.size() > MAX_LOGS) {
            m_logs.removeFirst();
        }
        if (m_ts.device()) {
            m_ts << line << '\n';
            m_pendingFlush = true;
            toDisk = true;
        }
    }
    if (toDisk) {
        scheduleFlush(level);
    }
}

void LogManager::flushPending() {
    {
        QMutexLocker locker(&m_mutex);
        if (m_pendingFlush && m_ts.device()) {
            m_ts.flush();
        }
        m_pendingFlush = false;
    }
    if (m_flushTimer.isActive() && QThread::currentThread() == thread()) {
        m_flushTimer.stop();
    }
}

void LogManager::scheduleFlush(LogLevel level) {
    // Without an event loop (or off the owner thread) the timer cannot fire.
    if (level >= LogLevel::Warn || QThread::currentThread() != thread()
        || !QCoreApplication::instance()) {
        flushPending();
        return;
    }
    if (!m_flushTimer.isActive()) {
        m_flushTimer.start(FLUSH_INTERVAL_MS);
    }
}

void LogManager::clear() {
    QMutexLocker locker(&m_mutex);
    m_logs.clear();
}

void customMessageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg) {
    Q_UNUSED(context);
    const LogLevel level = levelFor(type);

    LogManager& logs = LogManager::instance();
    if (QThread::currentThread() == logs.thread()) {
        logs.addLog(msg, level);
    } else {
        QMetaObject::invokeMethod(&logs, [level, msg]() {
            LogManager::instance().addLog(msg, level);
        }, Qt::QueuedConnection);
    }

    if (logs.shouldEcho(level)) {
        const QString line = LogManager::formatLine(QDateTime::currentDateTime(), level, msg);
        fprintf(stderr, "%s\n", line.toLocal8Bit().constData());
        fflush(stderr);
    }

    if (type == QtFatalMsg) {
        logs.flush();
        abort();
    }
}
