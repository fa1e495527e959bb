#pragma once
#include <QString>
#include <QStringList>
#include <QDateTime>
#include <QByteArray>
#include <QVector>
#include <QMetaType>

// Snapshot of one file taken at scan time. Becomes stale if the file changes
// before it is moved; MoveEngine detects that but does not prevent it.
struct FileEntry {
    QString path;          // absolute path
    qint64 size = 0;
    QDateTime modified;
    QString extension;     // lowercased, without the dot

    QString fileName() const;
    bool isValid() const { return !path.isEmpty(); }
};

struct Category {
    QString name;
    QStringList extensions; // lowercased, without the dot
};

enum class OrganizationMode { Category, Date, Hybrid };
enum class RenameMode { Clean, DatePrefix, Skip };

enum class SkipReason {
    None,
    PermissionDenied,
    SourceNotFound,
    ProtectedPath,
    CrossDeviceCopyFailed,
    DirectoryCreateFailed,
    OtherIOError
};

struct MoveOperation {
    enum class Outcome { Success, Skipped };
    enum class Kind { File, Directory };

    QString source;
    QString destination;   // resolved, post conflict resolution
    qint64 size = 0;
    Kind kind = Kind::File;
    Outcome outcome = Outcome::Success;
    SkipReason reason = SkipReason::None;
    QString detail;        // OS error text for OtherIOError and friends
    bool renamed = false;  // file name differs from the source name

    bool succeeded() const { return outcome == Outcome::Success; }

    static MoveOperation skipped(const QString& source, SkipReason reason, const QString& detail = QString());
};

// One batch or watch-triggered run. Immutable once committed to the journal.
struct Session {
    qint64 id = 0;         // assigned by JournalStore::commit
    QString targetRoot;
    QDateTime startedAt;
    QVector<MoveOperation> moves;    // successful moves, in execution order
    QStringList createdDirectories;  // directories this session created
    int filesMoved = 0;
    int filesRenamed = 0;
    qint64 bytesMoved = 0;
    qint64 durationMs = 0;
    int skippedCount = 0;
    bool undone = false;

    bool isEmpty() const { return moves.isEmpty(); }
};

struct DuplicateGroup {
    QByteArray hash;       // SHA-256, hex encoded
    qint64 size = 0;
    QStringList paths;     // always >= 2 members
};

QString organizationModeName(OrganizationMode mode);
QString renameModeName(RenameMode mode);
QString skipReasonName(SkipReason reason);
// Human readable reason including the OS detail when there is one.
QString describeSkip(const MoveOperation& op);

Q_DECLARE_METATYPE(MoveOperation)
