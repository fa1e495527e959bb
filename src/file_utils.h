#pragma once

#include <QString>
#include <QFileInfo>
#include <QDir>
#include <QStringList>
#include <algorithm>

/**
 * FileUtils - path helpers shared by the scanner, the guard and the move engine.
 *
 * Every path that is compared against another path goes through cleanAbsolutePath()
 * (or canonicalOrClean() when symlinks must be resolved) so comparisons stay
 * consistent across components.
 */
namespace FileUtils {

inline Qt::CaseSensitivity pathCaseSensitivity()
{
#ifdef Q_OS_WIN
    return Qt::CaseInsensitive;
#else
    return Qt::CaseSensitive;
#endif
}

/**
 * Absolute path with "." and ".." segments removed and separators normalized.
 * Does not touch the filesystem beyond resolving the current directory.
 */
inline QString cleanAbsolutePath(const QString& path)
{
    return QDir::cleanPath(QFileInfo(path).absoluteFilePath());
}

/**
 * Canonical path (symlinks resolved) when the path exists, otherwise the clean
 * absolute path.
 */
inline QString canonicalOrClean(const QString& path)
{
    const QString canonical = QFileInfo(path).canonicalFilePath();
    return canonical.isEmpty() ? cleanAbsolutePath(path) : canonical;
}

inline bool samePath(const QString& a, const QString& b)
{
    return cleanAbsolutePath(a).compare(cleanAbsolutePath(b), pathCaseSensitivity()) == 0;
}

/**
 * True when child lies strictly below parent. Both paths must already be clean.
 */
inline bool isStrictlyInside(const QString& parent, const QString& child)
{
    if (parent.isEmpty() || child.size() <= parent.size()) return false;
    QString prefix = parent;
    if (!prefix.endsWith('/')) prefix += '/';
    return child.startsWith(prefix, pathCaseSensitivity());
}

inline bool isSameOrInside(const QString& parent, const QString& child)
{
    return parent.compare(child, pathCaseSensitivity()) == 0 || isStrictlyInside(parent, child);
}

inline int pathDepth(const QString& cleanPath)
{
    return cleanPath.count('/');
}

inline bool dirExists(const QString& dirPath)
{
    QFileInfo fi(dirPath);
    return fi.exists() && fi.isDir();
}

/**
 * Existence check that also reports dangling symlinks, which QFileInfo::exists()
 * hides. Used where "something occupies this name" matters more than validity.
 */
inline bool pathOccupied(const QString& path)
{
    QFileInfo fi(path);
    return fi.exists() || fi.isSymLink();
}

/**
 * Directory has no entries at all, hidden and system entries included.
 */
inline bool isDirectoryEmpty(const QString& dirPath)
{
    QDir dir(dirPath);
    return dir.exists() && dir.isEmpty(QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden | QDir::System);
}

/**
 * Removes the given directories deepest first when they are empty. The root itself
 * and anything outside it is left alone; non-empty or undeletable ones go to `kept`.
 */
inline void removeEmptyDirectories(QStringList dirs, const QString& root,
                                   QStringList* removed = nullptr, QStringList* kept = nullptr)
{
    std::sort(dirs.begin(), dirs.end(), [](const QString& a, const QString& b) {
        return pathDepth(a) > pathDepth(b);
    });
    const QString cleanRoot = cleanAbsolutePath(root);
    for (const QString& d : dirs) {
        if (!isStrictlyInside(cleanRoot, cleanAbsolutePath(d))) continue;
        if (!dirExists(d)) continue;
        if (!isDirectoryEmpty(d) || !QDir().rmdir(d)) {
            if (kept) kept->append(d);
            continue;
        }
        if (removed) removed->append(d);
    }
}

} // namespace FileUtils
