#include "folder_lock.h"
#include "file_utils.h"
#include <QCryptographicHash>
#include <QFileInfo>
#include <QDir>
#include <QDebug>

QString LockHolder::describe() const
{
    QString text = QString("process %1").arg(pid);
    if (!appname.isEmpty()) text += QString(" (%1)").arg(appname);
    if (!hostname.isEmpty()) text += QString(" on %1").arg(hostname);
    if (acquiredAt.isValid()) text += QString(" since %1").arg(acquiredAt.toLocalTime().toString("yyyy-MM-dd hh:mm:ss"));
    return text;
}

FolderLock::FolderLock(const QString& target, const QString& markerPath, std::unique_ptr<QLockFile> lock)
    : m_target(target)
    , m_markerPath(markerPath)
    , m_lock(std::move(lock))
{
}

FolderLock::~FolderLock()
{
    release();
}

void FolderLock::release()
{
    if (!isHeld()) return;
    m_lock->unlock();
    qDebug() << "[Lock] Released" << m_target;
}

LockManager::LockManager(const QString& stateDir)
    : m_lockDir(QDir(stateDir).filePath("locks"))
{
}

QString LockManager::markerPathFor(const QString& targetDir) const
{
    QString key = FileUtils::canonicalOrClean(targetDir);
    if (FileUtils::pathCaseSensitivity() == Qt::CaseInsensitive) key = key.toLower();
    const QByteArray digest = QCryptographicHash::hash(key.toUtf8(), QCryptographicHash::Sha1).toHex();
    return QDir(m_lockDir).filePath(QString::fromLatin1(digest) + ".lock");
}

bool LockManager::holderInfo(const QString& targetDir, LockHolder& out) const
{
    const QString marker = markerPathFor(targetDir);
    QLockFile probe(marker);
    qint64 pid = 0;
    QString host, app;
    if (!probe.getLockInfo(&pid, &host, &app)) return false;
    out.pid = pid;
    out.hostname = host;
    out.appname = app;
    out.acquiredAt = QFileInfo(marker).lastModified();
    return true;
}

LockManager::Result LockManager::acquire(const QString& targetDir) const
{
    Result result;
    if (!QDir().mkpath(m_lockDir)) {
        result.error = QString("Cannot create lock directory %1").arg(m_lockDir);
        qWarning() << "[Lock]" << result.error;
        return result;
    }

    const QString target = FileUtils::cleanAbsolutePath(targetDir);
    const QString marker = markerPathFor(target);
    auto lockFile = std::make_unique<QLockFile>(marker);
    // Age never makes a marker stale; only a dead holder does.
    lockFile->setStaleLockTime(0);

    if (lockFile->tryLock(0)) {
        qDebug() << "[Lock] Acquired" << target << "marker" << marker;
        result.status = Status::Acquired;
        result.lock.reset(new FolderLock(target, marker, std::move(lockFile)));
        return result;
    }

    switch (lockFile->error()) {
        case QLockFile::LockFailedError:
            result.status = Status::Busy;
            if (!holderInfo(target, result.holder))
                qWarning() << "[Lock] Busy but holder of" << target << "is unreadable";
            qInfo() << "[Lock]" << target << "is busy, held by" << result.holder.describe();
            return result;
        case QLockFile::PermissionError:
            result.error = QString("Permission denied creating lock %1").arg(marker);
            break;
        default:
            result.error = QString("Cannot create lock %1").arg(marker);
            break;
    }
    qWarning() << "[Lock]" << result.error;
    return result;
}

void LockManager::release(std::unique_ptr<FolderLock>& lock) const
{
    if (!lock) return;
    lock->release();
    lock.reset();
}
