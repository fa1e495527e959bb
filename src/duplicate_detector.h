#pragma once
#include <QString>
#include <QStringList>
#include <QVector>
#include <QByteArray>
#include "organizer_types.h"

class MoveEngine;

struct DuplicateScanResult {
    QVector<DuplicateGroup> groups;
    QVector<MoveOperation> skipped;   // files that could not be hashed
    int hashedFiles = 0;

    qint64 reclaimableBytes() const;  // everything but the first member of each group
};

struct DuplicateRemovalReport {
    int removed = 0;
    qint64 freedBytes = 0;
    QVector<MoveOperation> failures;
};

/**
 * @brief Groups files with identical content.
 *
 * Entries are bucketed by size first; only buckets with two or more members are
 * hashed (SHA-256). Groups keep the order in which their members were given, so
 * the first path of a group is the one a keep-first policy retains.
 *
 * A symlink and the file it resolves to count as one file. A file that a link
 * points to is moved to the front of its group so the link keeps working.
 */
class DuplicateDetector {
public:
    static DuplicateScanResult findDuplicates(const QVector<FileEntry>& entries);

    // Keep-first retention: deletes every member of each group but the first.
    // A real file that another member links to is never deleted.
    static DuplicateRemovalReport removeDuplicates(const QVector<DuplicateGroup>& groups, MoveEngine& engine);

    // Hex encoded SHA-256 of the file contents, empty when the file cannot be read.
    static QByteArray hashFile(const QString& path, QString* errorOut = nullptr);
};
