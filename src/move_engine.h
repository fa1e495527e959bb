#pragma once
#include <QString>
#include <QSet>
#include <functional>
#include "organizer_types.h"

class SessionRecorder;

/**
 * @brief Performs the physical moves of a run, one file at a time.
 *
 * execute() creates the destination directory, picks a free name ("name-1.ext",
 * "name-2.ext", ...) against the directory as it is at move time, re-checks the
 * source and renames it. The rename never replaces a file; if the name was taken
 * in the meantime the next free one is used. When the rename fails because source
 * and destination are on different filesystems, the file is copied, the copy is
 * verified by size and only then is the source removed.
 *
 * Every call returns a MoveOperation. Failures are captured as a SkipReason, the
 * source is left untouched and the batch continues.
 *
 * In dry-run mode nothing on disk changes; names that would have been taken are
 * reserved so later candidates in the same run still get distinct suffixes.
 */
class MoveEngine {
public:
    // DestinationExists: the rename refused to replace something at `to`.
    enum class RenameResult { Ok, CrossDevice, PermissionDenied, NotFound, DestinationExists, Failed };
    using RenameFunction = std::function<RenameResult(const QString& from, const QString& to, QString* errorOut)>;

    explicit MoveEngine(bool dryRun = false);

    bool isDryRun() const { return m_dryRun; }

    // Replaces the atomic rename primitive. Tests use it to simulate
    // cross-device and permission failures.
    void setRenameFunction(RenameFunction fn);

    MoveOperation execute(const FileEntry& entry, const QString& destinationDir,
                          const QString& candidateName, SessionRecorder* recorder = nullptr);

    // Moves a whole directory below destinationParent, keeping its name unless taken.
    MoveOperation moveDirectory(const QString& sourceDir, const QString& destinationParent,
                                SessionRecorder* recorder = nullptr);

    // Undo path: moves `from` back to `to` under its exact name. Never overwrites
    // and never renames; a missing `from` is reported as SourceNotFound.
    MoveOperation restore(const QString& from, const QString& to, MoveOperation::Kind kind);

    // Permanent delete used by duplicate removal. Not journaled.
    bool remove(const QString& path, QString* errorOut = nullptr);

    // Free name for `name` inside `dir`, taking dry-run reservations into account.
    QString resolveConflict(const QString& dir, const QString& name) const;

    // Atomic rename that never replaces an existing destination.
    static RenameResult platformRename(const QString& from, const QString& to, QString* errorOut);

    // Copies src to a new file dst (never overwrites), preserves the modification
    // time and verifies the size. A failed copy leaves no file at dst.
    static bool copyVerified(const QString& src, const QString& dst, QString* errorOut);

private:
    bool ensureDirectory(const QString& dir, SessionRecorder* recorder, QString* errorOut);
    bool isTaken(const QString& path) const;
    MoveOperation transfer(MoveOperation op, bool* destinationTaken = nullptr);
    // transfer(), picking the next free name when the chosen one is taken meanwhile.
    MoveOperation transferToFreeName(MoveOperation op, const QString& dir, const QString& name);

    bool m_dryRun;
    RenameFunction m_rename;
    QSet<QString> m_reserved;  // dry-run only

    static constexpr int kMaxNameAttempts = 5;
};
