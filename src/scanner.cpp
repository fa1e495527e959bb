#include "scanner.h"
#include "classifier.h"
#include "file_utils.h"
#include <QDir>
#include <QHash>
#include <QDebug>

Scanner::Scanner(const QString& root, bool recursive, const PathGuard& guard, const Classifier* classifier)
    : m_root(FileUtils::cleanAbsolutePath(root))
    , m_canonicalRoot(FileUtils::canonicalOrClean(root))
    , m_recursive(recursive)
    , m_guard(guard)
    , m_classifier(classifier)
{
    m_pendingDirs.append(m_root);
    m_visited.insert(m_canonicalRoot);
    qDebug() << "[Scanner] Scanning" << m_root << (m_recursive ? "recursively" : "top level only");
}

Scanner::~Scanner() = default;

bool Scanner::isIgnoredName(const QString& name)
{
    return name.isEmpty() || name.startsWith('.')
        || name.endsWith(".DS_Store") || name.endsWith(".localized");
}

FileEntry Scanner::entryFor(const QFileInfo& fi)
{
    // QFileInfo follows symlinks for size and timestamps, so a file symlink
    // yields its target's metadata under its own path.
    FileEntry e;
    e.path = FileUtils::cleanAbsolutePath(fi.absoluteFilePath());
    e.size = fi.size();
    e.modified = fi.lastModified();
    e.extension = fi.suffix().toLower();
    return e;
}

bool Scanner::acceptFile(const QFileInfo& fi) const
{
    if (isIgnoredName(fi.fileName())) return false;
    // Files without an extension cannot be classified and are left alone.
    return !fi.suffix().isEmpty();
}

bool Scanner::acceptDirectory(const QFileInfo& fi, bool topLevel)
{
    const QString name = fi.fileName();
    if (isIgnoredName(name)) return false;
    if (topLevel && m_classifier && m_classifier->isOutputFolderName(name)) return false;

    const QString canonical = FileUtils::canonicalOrClean(fi.absoluteFilePath());
    if (fi.isSymLink() && !FileUtils::isStrictlyInside(m_canonicalRoot, canonical)) {
        qDebug() << "[Scanner] Not following symlink outside the root:" << fi.absoluteFilePath();
        return false;
    }
    if (m_visited.contains(canonical)) {
        qDebug() << "[Scanner] Already visited" << canonical;
        return false;
    }

    const PathGuard::Result verdict = m_guard.checkDescendant(fi.absoluteFilePath());
    if (!verdict.allowed()) {
        qDebug() << "[Scanner] Pruned:" << verdict.reason;
        ++m_pruned;
        return false;
    }

    m_visited.insert(canonical);
    return true;
}

bool Scanner::openNextDirectory()
{
    m_it.reset();
    if (m_pendingDirs.isEmpty()) return false;
    m_currentDir = m_pendingDirs.takeFirst();
    m_it = std::make_unique<QDirIterator>(m_currentDir, QDir::Files | QDir::Dirs | QDir::NoDotAndDotDot);
    return true;
}

bool Scanner::hasNext()
{
    if (m_closed) return false;
    if (m_hasLookahead) return true;

    while (true) {
        if (!m_it || !m_it->hasNext()) {
            if (!openNextDirectory()) {
                close();
                return false;
            }
            continue;
        }

        m_it->next();
        const QFileInfo fi = m_it->fileInfo();

        if (fi.isDir()) {
            if (m_recursive && acceptDirectory(fi, m_currentDir == m_root))
                m_pendingDirs.append(FileUtils::cleanAbsolutePath(fi.absoluteFilePath()));
            continue;
        }
        if (!fi.isFile() || !acceptFile(fi)) continue;

        m_lookahead = entryFor(fi);
        m_hasLookahead = true;
        return true;
    }
}

FileEntry Scanner::next()
{
    if (!hasNext()) return FileEntry();
    m_hasLookahead = false;
    return m_lookahead;
}

void Scanner::close()
{
    if (m_closed) return;
    m_closed = true;
    m_hasLookahead = false;
    m_it.reset();
    m_pendingDirs.clear();
    qDebug() << "[Scanner] Closed" << m_root << "pruned directories:" << m_pruned;
}

QVector<FileEntry> Scanner::collectAll()
{
    QVector<FileEntry> out;
    while (hasNext()) out.append(next());
    return out;
}

QVector<FolderRelocation> Scanner::dominantCategoryFolders(const Classifier& classifier,
                                                           double threshold, int minimumFiles) const
{
    QVector<FolderRelocation> out;
    const QFileInfoList subdirs = QDir(m_root).entryInfoList(QDir::Dirs | QDir::NoDotAndDotDot, QDir::Name);
    for (const QFileInfo& dirInfo : subdirs) {
        const QString name = dirInfo.fileName();
        if (isIgnoredName(name) || classifier.isOutputFolderName(name)) continue;
        if (dirInfo.isSymLink()) continue;
        if (!m_guard.checkDescendant(dirInfo.absoluteFilePath()).allowed()) continue;

        QHash<QString, int> counts;
        int total = 0;
        const QFileInfoList files = QDir(dirInfo.absoluteFilePath()).entryInfoList(QDir::Files);
        for (const QFileInfo& fi : files) {
            if (!acceptFile(fi)) continue;
            ++total;
            counts[classifier.categoryFor(fi.suffix())]++;
        }
        if (total < minimumFiles) continue;

        QString best;
        int bestCount = 0;
        for (auto it = counts.cbegin(); it != counts.cend(); ++it) {
            if (it.value() > bestCount) {
                best = it.key();
                bestCount = it.value();
            }
        }
        if (best == Classifier::fallbackCategory()) continue;
        if (bestCount < minimumFiles || double(bestCount) / total < threshold) continue;

        FolderRelocation r;
        r.sourceDir = FileUtils::cleanAbsolutePath(dirInfo.absoluteFilePath());
        r.category = best;
        r.matchingFiles = bestCount;
        r.totalFiles = total;
        qDebug() << "[Scanner] Folder" << name << "is dominated by" << best << bestCount << "/" << total;
        out.append(r);
    }
    return out;
}
