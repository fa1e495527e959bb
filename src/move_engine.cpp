#include "move_engine.h"
#include "session_recorder.h"
#include "renamer.h"
#include "file_utils.h"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QDirIterator>
#include <QDebug>

#ifdef _WIN32
#include <windows.h>
#else
#include <cstdio>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#if defined(__linux__)
#include <sys/syscall.h>
#include <linux/fs.h>
#endif
#endif

namespace {

void markSkipped(MoveOperation& op, SkipReason reason, const QString& detail)
{
    op.outcome = MoveOperation::Outcome::Skipped;
    op.reason = reason;
    op.detail = detail;
}

qint64 directorySize(const QString& dir)
{
    qint64 total = 0;
    QDirIterator it(dir, QDir::Files | QDir::Hidden | QDir::System, QDirIterator::Subdirectories);
    while (it.hasNext()) {
        it.next();
        total += it.fileInfo().size();
    }
    return total;
}

#ifdef _WIN32
QString windowsErrorText(DWORD code)
{
    wchar_t* buf = nullptr;
    DWORD len = FormatMessageW(FORMAT_MESSAGE_ALLOCATE_BUFFER | FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS,
                               nullptr, code, MAKELANGID(LANG_NEUTRAL, SUBLANG_DEFAULT), (LPWSTR)&buf, 0, nullptr);
    QString msg = len && buf ? QString::fromWCharArray(buf).trimmed() : QString("error %1").arg(code);
    if (buf) LocalFree(buf);
    return msg;
}
#else
MoveEngine::RenameResult renameError(int err, QString* errorOut)
{
    if (errorOut) *errorOut = QString::fromLocal8Bit(std::strerror(err));
    switch (err) {
        case EXDEV: return MoveEngine::RenameResult::CrossDevice;
        case EACCES:
        case EPERM:
        case EROFS: return MoveEngine::RenameResult::PermissionDenied;
        case ENOENT: return MoveEngine::RenameResult::NotFound;
        case EEXIST:
        case ENOTEMPTY: return MoveEngine::RenameResult::DestinationExists;
        default: return MoveEngine::RenameResult::Failed;
    }
}
#endif

} // namespace

MoveEngine::MoveEngine(bool dryRun)
    : m_dryRun(dryRun)
    , m_rename(&MoveEngine::platformRename)
{
}

void MoveEngine::setRenameFunction(RenameFunction fn)
{
    m_rename = fn ? std::move(fn) : RenameFunction(&MoveEngine::platformRename);
}

MoveEngine::RenameResult MoveEngine::platformRename(const QString& from, const QString& to, QString* errorOut)
{
#ifdef _WIN32
    const QString nativeFrom = QDir::toNativeSeparators(from);
    const QString nativeTo = QDir::toNativeSeparators(to);
    // No MOVEFILE_COPY_ALLOWED: a volume change must surface as an error so the
    // verified copy path takes over. No MOVEFILE_REPLACE_EXISTING either.
    if (MoveFileExW((LPCWSTR)nativeFrom.utf16(), (LPCWSTR)nativeTo.utf16(), MOVEFILE_WRITE_THROUGH))
        return RenameResult::Ok;
    const DWORD code = GetLastError();
    if (errorOut) *errorOut = windowsErrorText(code);
    switch (code) {
        case ERROR_NOT_SAME_DEVICE: return RenameResult::CrossDevice;
        case ERROR_ACCESS_DENIED:
        case ERROR_SHARING_VIOLATION:
        case ERROR_WRITE_PROTECT: return RenameResult::PermissionDenied;
        case ERROR_FILE_NOT_FOUND:
        case ERROR_PATH_NOT_FOUND: return RenameResult::NotFound;
        case ERROR_FILE_EXISTS:
        case ERROR_ALREADY_EXISTS: return RenameResult::DestinationExists;
        default: return RenameResult::Failed;
    }
#else
    const QByteArray src = QFile::encodeName(from);
    const QByteArray dst = QFile::encodeName(to);
#if defined(__linux__) && defined(SYS_renameat2) && defined(RENAME_NOREPLACE)
    if (::syscall(SYS_renameat2, AT_FDCWD, src.constData(), AT_FDCWD, dst.constData(), RENAME_NOREPLACE) == 0)
        return RenameResult::Ok;
    const int noReplaceErr = errno;
    // EINVAL, ENOSYS: the kernel or the filesystem has no RENAME_NOREPLACE.
    if (noReplaceErr != EINVAL && noReplaceErr != ENOSYS) return renameError(noReplaceErr, errorOut);
#endif
    struct stat st;
    if (::lstat(src.constData(), &st) == 0 && S_ISREG(st.st_mode)) {
        // link() fails with EEXIST instead of replacing, so the name is claimed atomically.
        if (::link(src.constData(), dst.constData()) == 0) {
            if (::unlink(src.constData()) == 0) return RenameResult::Ok;
            const int err = errno;
            ::unlink(dst.constData());
            return renameError(err, errorOut);
        }
        const int err = errno;
        // EPERM, ENOTSUP, EMLINK: no hard links here, fall back to check then rename.
        if (err == EEXIST || err == EXDEV || err == ENOENT || err == EACCES || err == EROFS)
            return renameError(err, errorOut);
    }
    if (::lstat(dst.constData(), &st) == 0) return renameError(EEXIST, errorOut);
    if (::rename(src.constData(), dst.constData()) == 0) return RenameResult::Ok;
    return renameError(errno, errorOut);
#endif
}

bool MoveEngine::copyVerified(const QString& src, const QString& dst, QString* errorOut)
{
    QFile in(src);
    QFile out(dst);
    if (!in.open(QIODevice::ReadOnly)) {
        if (errorOut) *errorOut = QString("Failed to open %1: %2").arg(src, in.errorString());
        return false;
    }
    // NewOnly: whatever appeared at dst since conflict resolution is not ours to touch.
    if (!out.open(QIODevice::WriteOnly | QIODevice::NewOnly)) {
        if (errorOut) *errorOut = QString("Failed to create %1: %2").arg(dst, out.errorString());
        return false;
    }

    auto discard = [&](const QString& why) {
        if (errorOut) *errorOut = why;
        out.close();
        out.remove();
        return false;
    };

    QByteArray buf;
    buf.resize(4 * 1024 * 1024);
    while (!in.atEnd()) {
        const qint64 r = in.read(buf.data(), buf.size());
        if (r < 0) return discard(QString("Read error %1: %2").arg(src, in.errorString()));
        if (r == 0) break;
        const qint64 w = out.write(buf.constData(), r);
        if (w != r) return discard(QString("Write error %1: %2").arg(dst, out.errorString()));
    }
    if (!out.flush()) return discard(QString("Write error %1: %2").arg(dst, out.errorString()));

    const QDateTime mtime = QFileInfo(src).lastModified();
    if (mtime.isValid() && !out.setFileTime(mtime, QFileDevice::FileModificationTime))
        qWarning() << "[MoveEngine] Could not preserve modification time on" << dst;
    out.close();
    in.close();

    const qint64 expected = QFileInfo(src).size();
    const qint64 actual = QFileInfo(dst).size();
    if (expected != actual) {
        if (errorOut) *errorOut = QString("Size mismatch after copy (%1 of %2 bytes)").arg(actual).arg(expected);
        QFile::remove(dst);
        return false;
    }
    return true;
}

bool MoveEngine::isTaken(const QString& path) const
{
    return FileUtils::pathOccupied(path) || m_reserved.contains(path);
}

QString MoveEngine::resolveConflict(const QString& dir, const QString& name) const
{
    const QDir d(dir);
    QString candidate = d.filePath(name);
    if (!isTaken(candidate)) return candidate;

    QString stem, ext;
    Renamer::splitName(name, stem, ext);
    for (int i = 1;; ++i) {
        const QString numbered = ext.isEmpty() ? QString("%1-%2").arg(stem).arg(i)
                                               : QString("%1-%2.%3").arg(stem).arg(i).arg(ext);
        candidate = d.filePath(numbered);
        if (!isTaken(candidate)) return candidate;
    }
}

bool MoveEngine::ensureDirectory(const QString& dir, SessionRecorder* recorder, QString* errorOut)
{
    QStringList missing;
    QString cursor = dir;
    while (!FileUtils::dirExists(cursor)) {
        if (FileUtils::pathOccupied(cursor)) {
            if (errorOut) *errorOut = QString("%1 exists and is not a directory").arg(cursor);
            return false;
        }
        missing.prepend(cursor);
        const QString parent = QFileInfo(cursor).absolutePath();
        if (parent == cursor) break;
        cursor = parent;
    }
    if (missing.isEmpty() || m_dryRun) return true;

    for (const QString& d : missing) {
        if (QDir().mkdir(d)) {
            qDebug() << "[MoveEngine] Created directory" << d;
            if (recorder) recorder->recordCreatedDirectory(d);
            continue;
        }
        if (FileUtils::dirExists(d)) continue; // created concurrently
        if (errorOut) *errorOut = QString("Cannot create directory %1").arg(d);
        return false;
    }
    return true;
}

MoveOperation MoveEngine::transfer(MoveOperation op, bool* destinationTaken)
{
    QString err;
    switch (m_rename(op.source, op.destination, &err)) {
        case RenameResult::Ok:
            op.outcome = MoveOperation::Outcome::Success;
            return op;
        case RenameResult::PermissionDenied:
            markSkipped(op, SkipReason::PermissionDenied, err);
            return op;
        case RenameResult::NotFound:
            markSkipped(op, SkipReason::SourceNotFound, err);
            return op;
        case RenameResult::DestinationExists:
            if (destinationTaken) *destinationTaken = true;
            markSkipped(op, SkipReason::OtherIOError,
                        err.isEmpty() ? QString("%1 already exists").arg(op.destination) : err);
            return op;
        case RenameResult::Failed:
            markSkipped(op, SkipReason::OtherIOError, err);
            return op;
        case RenameResult::CrossDevice:
            break;
    }

    if (op.kind == MoveOperation::Kind::Directory) {
        markSkipped(op, SkipReason::CrossDeviceCopyFailed, "Directories are not copied across filesystems");
        return op;
    }

    qInfo() << "[MoveEngine] Cross-device move, copying" << op.source << "->" << op.destination;
    if (!copyVerified(op.source, op.destination, &err)) {
        qWarning() << "[MoveEngine] Copy failed, source kept:" << err;
        markSkipped(op, SkipReason::CrossDeviceCopyFailed, err);
        return op;
    }

    QFile source(op.source);
    if (!source.remove()) {
        // Keep exactly one copy: the original.
        const QString why = QString("Copied but could not remove the source: %1").arg(source.errorString());
        QFile::remove(op.destination);
        qWarning() << "[MoveEngine]" << why;
        markSkipped(op, SkipReason::CrossDeviceCopyFailed, why);
        return op;
    }
    op.outcome = MoveOperation::Outcome::Success;
    return op;
}

MoveOperation MoveEngine::transferToFreeName(MoveOperation op, const QString& dir, const QString& name)
{
    for (int attempt = 1;; ++attempt) {
        bool taken = false;
        const MoveOperation result = transfer(op, &taken);
        if (!taken || attempt >= kMaxNameAttempts) return result;
        qWarning() << "[MoveEngine]" << op.destination << "appeared during the move, trying another name";
        op.destination = resolveConflict(dir, name);
        op.renamed = QFileInfo(op.destination).fileName() != QFileInfo(op.source).fileName();
    }
}

MoveOperation MoveEngine::execute(const FileEntry& entry, const QString& destinationDir,
                                  const QString& candidateName, SessionRecorder* recorder)
{
    MoveOperation op;
    op.source = FileUtils::cleanAbsolutePath(entry.path);
    op.size = entry.size;
    op.kind = MoveOperation::Kind::File;

    auto finish = [&](const MoveOperation& result) {
        if (result.succeeded()) {
            qDebug() << "[MoveEngine]" << (m_dryRun ? "Would move" : "Moved") << result.source << "->" << result.destination;
        } else {
            qWarning() << "[MoveEngine] Skipped" << result.source << "-" << describeSkip(result);
        }
        if (recorder) recorder->record(result);
        return result;
    };

    const QString dir = FileUtils::cleanAbsolutePath(destinationDir);
    QString err;
    if (!ensureDirectory(dir, recorder, &err)) {
        markSkipped(op, SkipReason::DirectoryCreateFailed, err);
        return finish(op);
    }

    if (FileUtils::samePath(QDir(dir).filePath(candidateName), op.source)) {
        qDebug() << "[MoveEngine] Already in place:" << op.source;
        op.destination = op.source;
        return op;
    }

    op.destination = resolveConflict(dir, candidateName);
    op.renamed = QFileInfo(op.destination).fileName() != QFileInfo(op.source).fileName();

    const QFileInfo current(op.source);
    if (!current.exists()) {
        markSkipped(op, SkipReason::SourceNotFound, QString());
        return finish(op);
    }
    if (current.size() != entry.size || (entry.modified.isValid() && current.lastModified() != entry.modified)) {
        qWarning() << "[MoveEngine] File changed since scan:" << op.source;
        op.size = current.size();
    }

    if (m_dryRun) {
        m_reserved.insert(op.destination);
        return finish(op);
    }
    return finish(transferToFreeName(op, dir, candidateName));
}

MoveOperation MoveEngine::moveDirectory(const QString& sourceDir, const QString& destinationParent,
                                        SessionRecorder* recorder)
{
    MoveOperation op;
    op.kind = MoveOperation::Kind::Directory;
    op.source = FileUtils::cleanAbsolutePath(sourceDir);

    auto finish = [&](const MoveOperation& result) {
        if (result.succeeded()) {
            qInfo() << "[MoveEngine]" << (m_dryRun ? "Would relocate" : "Relocated") << result.source << "->" << result.destination;
        } else {
            qWarning() << "[MoveEngine] Skipped folder" << result.source << "-" << describeSkip(result);
        }
        if (recorder) recorder->record(result);
        return result;
    };

    if (!FileUtils::dirExists(op.source)) {
        markSkipped(op, SkipReason::SourceNotFound, QString());
        return finish(op);
    }

    const QString parent = FileUtils::cleanAbsolutePath(destinationParent);
    if (FileUtils::isSameOrInside(op.source, parent)) {
        markSkipped(op, SkipReason::OtherIOError, "Cannot move a folder into itself");
        return finish(op);
    }

    QString err;
    if (!ensureDirectory(parent, recorder, &err)) {
        markSkipped(op, SkipReason::DirectoryCreateFailed, err);
        return finish(op);
    }

    op.destination = resolveConflict(parent, QFileInfo(op.source).fileName());
    op.renamed = QFileInfo(op.destination).fileName() != QFileInfo(op.source).fileName();
    op.size = directorySize(op.source);

    if (m_dryRun) {
        m_reserved.insert(op.destination);
        return finish(op);
    }
    return finish(transferToFreeName(op, parent, QFileInfo(op.source).fileName()));
}

MoveOperation MoveEngine::restore(const QString& from, const QString& to, MoveOperation::Kind kind)
{
    MoveOperation op;
    op.kind = kind;
    op.source = FileUtils::cleanAbsolutePath(from);
    op.destination = FileUtils::cleanAbsolutePath(to);

    const QFileInfo current(op.source);
    const bool present = kind == MoveOperation::Kind::Directory ? current.isDir() : current.exists();
    if (!present) {
        markSkipped(op, SkipReason::SourceNotFound, "No longer at its organized location");
        return op;
    }
    if (FileUtils::pathOccupied(op.destination)) {
        markSkipped(op, SkipReason::OtherIOError, "Original location is occupied");
        return op;
    }
    op.size = kind == MoveOperation::Kind::Directory ? directorySize(op.source) : current.size();

    QString err;
    if (!ensureDirectory(QFileInfo(op.destination).absolutePath(), nullptr, &err)) {
        markSkipped(op, SkipReason::DirectoryCreateFailed, err);
        return op;
    }
    if (m_dryRun) return op;
    return transfer(op);
}

bool MoveEngine::remove(const QString& path, QString* errorOut)
{
    if (m_dryRun) {
        qInfo() << "[MoveEngine] Dry run, would delete" << path;
        return true;
    }
    QFile f(path);
    if (!f.remove()) {
        if (errorOut) *errorOut = f.errorString();
        qWarning() << "[MoveEngine] Failed to delete" << path << f.errorString();
        return false;
    }
    qInfo() << "[MoveEngine] Deleted" << path;
    return true;
}
