#include "folder_watcher.h"
#include "scanner.h"
#include "session_recorder.h"
#include "file_utils.h"
#include <QDebug>
#include <QDir>
#include <QFileInfo>

FolderWatcher::FolderWatcher(const OrganizeContext& ctx, QObject* parent)
    : QObject(parent)
    , m_ctx(ctx)
    , m_root(FileUtils::cleanAbsolutePath(ctx.targetRoot))
    , m_guard(ctx.config.protectedPaths)
    , m_classifier(ctx.config.categories)
    , m_engine(ctx.config.dryRun)
    , m_watcher(new QFileSystemWatcher(this))
    , m_debounceTimer(new QTimer(this))
    , m_cancelTimer(new QTimer(this))
{
    if (ctx.renameFunction) m_engine.setRenameFunction(ctx.renameFunction);

    connect(m_watcher, &QFileSystemWatcher::directoryChanged,
            this, &FolderWatcher::onDirectoryChanged);

    m_debounceTimer->setSingleShot(true);
    m_debounceTimer->setInterval(kDebounceMs);
    connect(m_debounceTimer, &QTimer::timeout,
            this, &FolderWatcher::onDebounceTimeout);

    m_cancelTimer->setInterval(kCancelPollMs);
    connect(m_cancelTimer, &QTimer::timeout,
            this, &FolderWatcher::onCancelPoll);
}

FolderWatcher::~FolderWatcher()
{
    if (m_state == State::Watching || m_state == State::Draining) finishStop();
}

bool FolderWatcher::isIgnoredFile(const QString& fileName)
{
    if (Scanner::isIgnoredName(fileName)) return true;
    static const QStringList partial = {".part", ".crdownload", ".download", ".tmp"};
    for (const QString& suffix : partial) {
        if (fileName.endsWith(suffix, Qt::CaseInsensitive)) return true;
    }
    return false;
}

void FolderWatcher::setState(State state)
{
    if (m_state == state) return;
    m_state = state;
    qDebug() << "[Watcher] State" << int(state) << m_root;
    emit stateChanged(state);
}

QStringList FolderWatcher::listFiles() const
{
    QStringList out;
    const QFileInfoList files = QDir(m_root).entryInfoList(QDir::Files, QDir::Name);
    for (const QFileInfo& fi : files) {
        if (isIgnoredFile(fi.fileName())) continue;
        out.append(FileUtils::cleanAbsolutePath(fi.absoluteFilePath()));
    }
    return out;
}

bool FolderWatcher::start(QString* errorOut)
{
    if (m_state != State::Idle) {
        if (errorOut) *errorOut = "Watcher was already started";
        return false;
    }

    QString message;
    m_startError = Organizer::preflight(m_root, m_guard, &message);
    if (m_startError == PreflightError::None && !m_ctx.config.dryRun) {
        LockManager::Result acquired = LockManager(m_ctx.stateDir).acquire(m_root);
        if (acquired.status == LockManager::Status::Busy) {
            m_startError = PreflightError::Busy;
            m_busyHolder = acquired.holder;
            message = QString("%1 is already being organized by %2").arg(m_root, acquired.holder.describe());
        } else if (acquired.status == LockManager::Status::Failed) {
            m_startError = PreflightError::LockFailed;
            message = acquired.error;
        } else {
            m_lock = std::move(acquired.lock);
            m_journal = std::make_unique<JournalStore>(QDir(m_ctx.stateDir).filePath("journal.sqlite"));
            QString err;
            if (!m_journal->open(&err)) {
                m_startError = PreflightError::JournalUnavailable;
                message = QString("Cannot open the journal: %1").arg(err);
                m_journal.reset();
                m_lock.reset();
            }
        }
    }
    if (m_startError != PreflightError::None) {
        qWarning() << "[Watcher]" << message;
        if (errorOut) *errorOut = message;
        return false;
    }

    if (!m_watcher->addPath(m_root)) {
        message = QString("Cannot watch %1").arg(m_root);
        qWarning() << "[Watcher]" << message;
        if (errorOut) *errorOut = message;
        m_journal.reset();
        m_lock.reset();
        return false;
    }

    const QStringList existing = listFiles();
    m_known = QSet<QString>(existing.begin(), existing.end());
    if (m_ctx.cancel) m_cancelTimer->start();
    qInfo() << "[Watcher] Watching" << m_root << "existing files:" << m_known.size();
    setState(State::Watching);
    return true;
}

void FolderWatcher::stop()
{
    if (m_state != State::Watching) return;
    setState(State::Draining);
    m_debounceTimer->stop();
    // An event in flight finishes first; processQueue() completes the stop.
    if (!m_processing) finishStop();
}

void FolderWatcher::finishStop()
{
    m_cancelTimer->stop();
    m_debounceTimer->stop();
    if (!m_watcher->directories().isEmpty()) {
        m_watcher->removePaths(m_watcher->directories());
    }
    if (!m_queue.isEmpty()) {
        qInfo() << "[Watcher] Dropping" << m_queue.size() << "queued files";
    }
    m_queue.clear();
    m_queuedSize.clear();
    m_journal.reset();
    m_lock.reset();
    qInfo() << "[Watcher] Stopped" << m_root << "processed:" << m_processed << "sessions:" << m_committed;
    setState(State::Stopped);
}

void FolderWatcher::onCancelPoll()
{
    if (m_ctx.cancel && m_ctx.cancel->load()) {
        qInfo() << "[Watcher] Cancellation requested";
        stop();
    }
}

void FolderWatcher::onDirectoryChanged(const QString& path)
{
    if (m_state != State::Watching) return;
    qDebug() << "[Watcher] Directory changed" << path;

    const QStringList current = listFiles();
    for (const QString& file : current) {
        if (m_known.contains(file)) continue;
        if (!m_queue.contains(file)) {
            m_queue.append(file);
            m_queuedSize.insert(file, QFileInfo(file).size());
            qDebug() << "[Watcher] Queued" << file;
        }
    }
    m_known = QSet<QString>(current.begin(), current.end());

    // Restart the debounce window on every change.
    if (!m_queue.isEmpty()) m_debounceTimer->start();
}

void FolderWatcher::onDebounceTimeout()
{
    processQueue();
}

void FolderWatcher::processQueue()
{
    if (m_processing) return;
    m_processing = true;

    QStringList stillGrowing;
    while (!m_queue.isEmpty() && m_state == State::Watching) {
        if (m_ctx.cancel && m_ctx.cancel->load()) {
            stop();
            break;
        }
        const QString path = m_queue.takeFirst();
        const qint64 queuedSize = m_queuedSize.take(path);
        const QFileInfo fi(path);
        if (!fi.exists()) {
            qDebug() << "[Watcher] Gone before processing:" << path;
            continue;
        }
        if (fi.size() != queuedSize) {
            // Still being written: give it another debounce window.
            stillGrowing.append(path);
            m_queuedSize.insert(path, fi.size());
            continue;
        }
        processFile(path);
    }

    m_processing = false;
    if (m_state == State::Draining) {
        finishStop();
        return;
    }
    if (!stillGrowing.isEmpty()) {
        m_queue = stillGrowing + m_queue;
        m_debounceTimer->start();
    }
}

void FolderWatcher::processFile(const QString& path)
{
    const FileEntry entry = Scanner::entryFor(QFileInfo(path));
    if (entry.extension.isEmpty()) {
        qDebug() << "[Watcher] No extension, leaving" << path;
        return;
    }

    SessionRecorder recorder(m_root);
    MoveOperation op;
    // A marker can appear after start (git init in the watched folder).
    const PathGuard::Result verdict = m_guard.check(m_root);
    if (!verdict.allowed()) {
        op = MoveOperation::skipped(entry.path, SkipReason::ProtectedPath, verdict.reason);
        qWarning() << "[Watcher] Skipped" << entry.path << "-" << verdict.reason;
        recorder.record(op);
    } else {
        op = Organizer::processEntry(entry, m_root, m_ctx.config, m_classifier, m_engine, recorder);
    }
    m_processed++;
    m_skipped += recorder.skipped();

    Session session = recorder.finish();
    if (!recorder.hasMoves() && !m_engine.isDryRun()) {
        FileUtils::removeEmptyDirectories(session.createdDirectories, m_root);
    }
    if (m_journal && recorder.hasMoves()) {
        QString err;
        if (m_journal->commit(session, &err)) {
            m_committed++;
            emit sessionCommitted(session.id);
        } else {
            qCritical() << "[Watcher] Could not journal the move of" << path << err;
        }
    }
    emit fileProcessed(op);
}
