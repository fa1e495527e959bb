#pragma once

#include <QObject>
#include <QFileSystemWatcher>
#include <QHash>
#include <QSet>
#include <QString>
#include <QStringList>
#include <QTimer>
#include <memory>
#include "organizer.h"
#include "classifier.h"
#include "path_guard.h"
#include "journal_store.h"

/**
 * @brief Organizes files as they appear in a target directory.
 *
 * Idle -> Watching -> Draining -> Stopped. start() runs the batch pre-flight and
 * holds the target's lock until the watcher stops. New top-level files are
 * queued, debounced and then pushed one at a time through the same
 * classify/rename/move pipeline as a batch run; each event that moved something
 * is committed as its own session. stop(), or the cancel flag of the context,
 * lets the event in flight finish before the lock is released.
 */
class FolderWatcher : public QObject
{
    Q_OBJECT

public:
    enum class State { Idle, Watching, Draining, Stopped };
    Q_ENUM(State)

    explicit FolderWatcher(const OrganizeContext& ctx, QObject* parent = nullptr);
    ~FolderWatcher();

    bool start(QString* errorOut = nullptr);
    void stop();

    State state() const { return m_state; }
    PreflightError startError() const { return m_startError; }
    LockHolder busyHolder() const { return m_busyHolder; }

    int processedFiles() const { return m_processed; }
    int committedSessions() const { return m_committed; }
    const QVector<MoveOperation>& skipped() const { return m_skipped; }

    // Hidden files and in-progress downloads are never picked up.
    static bool isIgnoredFile(const QString& fileName);

    static constexpr int kDebounceMs = 500;
    static constexpr int kCancelPollMs = 200;

signals:
    void stateChanged(FolderWatcher::State state);
    void fileProcessed(const MoveOperation& op);
    void sessionCommitted(qint64 sessionId);

private slots:
    void onDirectoryChanged(const QString& path);
    void onDebounceTimeout();
    void onCancelPoll();

private:
    QStringList listFiles() const;
    void processQueue();
    void processFile(const QString& path);
    void finishStop();
    void setState(State state);

    OrganizeContext m_ctx;
    QString m_root;
    PathGuard m_guard;
    Classifier m_classifier;
    MoveEngine m_engine;
    std::unique_ptr<FolderLock> m_lock;
    std::unique_ptr<JournalStore> m_journal;

    QFileSystemWatcher* m_watcher;
    QTimer* m_debounceTimer;
    QTimer* m_cancelTimer;

    QSet<QString> m_known;              // top-level files seen so far
    QStringList m_queue;                // waiting for the debounce, in arrival order
    QHash<QString, qint64> m_queuedSize;
    bool m_processing = false;

    State m_state = State::Idle;
    PreflightError m_startError = PreflightError::None;
    LockHolder m_busyHolder;
    int m_processed = 0;
    int m_committed = 0;
    QVector<MoveOperation> m_skipped;
};
