#pragma once
#include <QString>
#include <QStringList>
#include <QVector>
#include <QSet>
#include <QFileInfo>
#include <QDirIterator>
#include <memory>
#include "organizer_types.h"
#include "path_guard.h"

class Classifier;

// A root-level subdirectory whose direct files are dominated by one category.
struct FolderRelocation {
    QString sourceDir;     // absolute
    QString category;
    int matchingFiles = 0;
    int totalFiles = 0;
};

/**
 * @brief Lazy walk of a target directory producing FileEntry snapshots.
 *
 * Usage:
 *   Scanner scanner(root, recursive, guard, &classifier);
 *   while (scanner.hasNext()) process(scanner.next());
 *
 * Non-recursive scans yield root-level files only; subdirectories are reported
 * through dominantCategoryFolders() instead. Recursive scans apply
 * PathGuard::checkDescendant at every directory boundary and prune rejected
 * subtrees without reporting them. Directory symlinks are followed only when
 * they resolve inside the root, and every directory is visited at most once by
 * canonical path.
 *
 * Once close() is called, or the walk is exhausted, the scanner stays closed.
 */
class Scanner {
public:
    Scanner(const QString& root, bool recursive, const PathGuard& guard,
            const Classifier* classifier = nullptr);
    ~Scanner();

    bool hasNext();
    FileEntry next();
    void close();
    bool isClosed() const { return m_closed; }

    // Drains the remaining entries.
    QVector<FileEntry> collectAll();

    QString root() const { return m_root; }
    int prunedDirectories() const { return m_pruned; }

    // Root-level subdirectories where at least `threshold` of the direct files
    // (and no fewer than `minimumFiles`) fall into one configured category.
    QVector<FolderRelocation> dominantCategoryFolders(const Classifier& classifier,
                                                      double threshold = kDominantThreshold,
                                                      int minimumFiles = kDominantMinimumFiles) const;

    static FileEntry entryFor(const QFileInfo& fi);
    // Hidden entries and desktop metadata files.
    static bool isIgnoredName(const QString& name);

    static constexpr double kDominantThreshold = 0.75;
    static constexpr int kDominantMinimumFiles = 3;

private:
    bool openNextDirectory();
    bool acceptDirectory(const QFileInfo& fi, bool topLevel);
    bool acceptFile(const QFileInfo& fi) const;

    QString m_root;            // clean absolute
    QString m_canonicalRoot;
    bool m_recursive;
    const PathGuard& m_guard;
    const Classifier* m_classifier;

    QStringList m_pendingDirs;
    QString m_currentDir;
    std::unique_ptr<QDirIterator> m_it;
    QSet<QString> m_visited;   // canonical paths
    FileEntry m_lookahead;
    bool m_hasLookahead = false;
    bool m_closed = false;
    int m_pruned = 0;
};
