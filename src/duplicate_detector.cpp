#include "duplicate_detector.h"
#include "move_engine.h"
#include <QFile>
#include <QFileInfo>
#include <QCryptographicHash>
#include <QMap>
#include <QHash>
#include <QSet>
#include <QDebug>
#include <algorithm>

namespace {

// Deleting a real file that another member links to would leave that member
// dangling, and lose the data outright when the link is the kept one.
bool isLinkedFromGroup(const DuplicateGroup& group, int index)
{
    const QFileInfo fi(group.paths[index]);
    if (fi.isSymLink()) return false;
    const QString target = fi.canonicalFilePath();
    if (target.isEmpty()) return false;
    for (int j = 0; j < group.paths.size(); ++j) {
        if (j == index) continue;
        const QFileInfo other(group.paths[j]);
        if (other.isSymLink() && other.canonicalFilePath() == target) return true;
    }
    return false;
}

} // namespace

qint64 DuplicateScanResult::reclaimableBytes() const
{
    qint64 total = 0;
    for (const DuplicateGroup& g : groups) total += g.size * (g.paths.size() - 1);
    return total;
}

QByteArray DuplicateDetector::hashFile(const QString& path, QString* errorOut)
{
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) {
        if (errorOut) *errorOut = f.errorString();
        return QByteArray();
    }
    QCryptographicHash hasher(QCryptographicHash::Sha256);
    QByteArray buf;
    buf.resize(1 << 20); // 1MB
    while (true) {
        const qint64 n = f.read(buf.data(), buf.size());
        if (n < 0) {
            if (errorOut) *errorOut = f.errorString();
            return QByteArray();
        }
        if (n == 0) break;
        hasher.addData(buf.constData(), int(n));
    }
    return hasher.result().toHex();
}

DuplicateScanResult DuplicateDetector::findDuplicates(const QVector<FileEntry>& entries)
{
    DuplicateScanResult result;

    // A symlink and its target are one file, not two copies. Keep a single entry
    // per canonical path, preferring the real path over a link to it.
    QVector<const FileEntry*> unique;
    QHash<QString, int> byCanonical;
    QSet<QString> linkTargets;
    for (const FileEntry& e : entries) {
        const QFileInfo fi(e.path);
        const QString canonical = fi.canonicalFilePath();
        if (canonical.isEmpty()) {
            unique.append(&e);
            continue;
        }
        const auto found = byCanonical.constFind(canonical);
        if (found == byCanonical.constEnd()) {
            byCanonical.insert(canonical, unique.size());
            unique.append(&e);
            continue;
        }
        qDebug() << "[Duplicates]" << e.path << "and" << unique[found.value()]->path << "are the same file";
        if (QFileInfo(unique[found.value()]->path).isSymLink() && !fi.isSymLink()) {
            unique[found.value()] = &e;
        }
        linkTargets.insert(canonical);
    }

    // QMap keeps the output ordered by size, which keeps reports stable.
    QMap<qint64, QVector<const FileEntry*>> bySize;
    for (const FileEntry* e : unique) bySize[e->size].append(e);

    for (auto it = bySize.cbegin(); it != bySize.cend(); ++it) {
        if (it.value().size() < 2) continue;

        QVector<QByteArray> order;
        QHash<QByteArray, QStringList> byHash;
        for (const FileEntry* e : it.value()) {
            QString err;
            const QByteArray hash = hashFile(e->path, &err);
            if (hash.isEmpty()) {
                qWarning() << "[Duplicates] Cannot hash" << e->path << err;
                const SkipReason reason = QFileInfo::exists(e->path) ? SkipReason::PermissionDenied
                                                                     : SkipReason::SourceNotFound;
                result.skipped.append(MoveOperation::skipped(e->path, reason, err));
                continue;
            }
            result.hashedFiles++;
            if (!byHash.contains(hash)) order.append(hash);
            byHash[hash].append(e->path);
        }

        for (const QByteArray& hash : order) {
            const QStringList& paths = byHash[hash];
            if (paths.size() < 2) continue;
            DuplicateGroup g;
            g.hash = hash;
            g.size = it.key();
            g.paths = paths;
            // A file something else links to is the one to keep.
            std::stable_partition(g.paths.begin(), g.paths.end(), [&linkTargets](const QString& p) {
                return linkTargets.contains(QFileInfo(p).canonicalFilePath());
            });
            result.groups.append(g);
        }
    }

    qInfo() << "[Duplicates] Hashed" << result.hashedFiles << "files, found" << result.groups.size()
            << "groups, skipped" << result.skipped.size();
    return result;
}

DuplicateRemovalReport DuplicateDetector::removeDuplicates(const QVector<DuplicateGroup>& groups, MoveEngine& engine)
{
    DuplicateRemovalReport report;
    for (const DuplicateGroup& g : groups) {
        for (int i = 1; i < g.paths.size(); ++i) {
            if (isLinkedFromGroup(g, i)) {
                qWarning() << "[Duplicates] Keeping" << g.paths[i] << "another member links to it";
                report.failures.append(MoveOperation::skipped(g.paths[i], SkipReason::OtherIOError,
                                                              "Another member of the group is a link to this file"));
                continue;
            }
            QString err;
            if (engine.remove(g.paths[i], &err)) {
                report.removed++;
                report.freedBytes += g.size;
            } else {
                const SkipReason reason = QFileInfo::exists(g.paths[i]) ? SkipReason::PermissionDenied
                                                                        : SkipReason::SourceNotFound;
                report.failures.append(MoveOperation::skipped(g.paths[i], reason, err));
            }
        }
    }
    qInfo() << "[Duplicates] Removed" << report.removed << "files, failures:" << report.failures.size();
    return report;
}
