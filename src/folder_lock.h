#pragma once
#include <QString>
#include <QDateTime>
#include <QLockFile>
#include <memory>

// Identity recorded in a lock marker.
struct LockHolder {
    qint64 pid = 0;
    QString hostname;
    QString appname;
    QDateTime acquiredAt;

    QString describe() const;
};

// Held lock on one target directory. Released on destruction.
class FolderLock {
public:
    ~FolderLock();

    QString target() const { return m_target; }
    QString markerPath() const { return m_markerPath; }
    bool isHeld() const { return m_lock && m_lock->isLocked(); }
    void release();

private:
    friend class LockManager;
    FolderLock(const QString& target, const QString& markerPath, std::unique_ptr<QLockFile> lock);
    Q_DISABLE_COPY(FolderLock)

    QString m_target;
    QString m_markerPath;
    std::unique_ptr<QLockFile> m_lock;
};

/**
 * @brief Exclusive, cross-process lock per target directory.
 *
 * Markers live in <stateDir>/locks/, named after a hash of the target's
 * canonical path. A marker left by a process that is no longer running is
 * reclaimed silently. Markers never expire by age, so a long watch session
 * keeps its lock.
 */
class LockManager {
public:
    enum class Status { Acquired, Busy, Failed };

    struct Result {
        Status status = Status::Failed;
        std::unique_ptr<FolderLock> lock;   // set when Acquired
        LockHolder holder;                  // set when Busy
        QString error;                      // set when Failed
    };

    explicit LockManager(const QString& stateDir);

    Result acquire(const QString& targetDir) const;
    void release(std::unique_ptr<FolderLock>& lock) const;

    // Reads the marker of targetDir without acquiring anything.
    bool holderInfo(const QString& targetDir, LockHolder& out) const;
    QString markerPathFor(const QString& targetDir) const;

private:
    QString m_lockDir;
};
