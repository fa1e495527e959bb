#pragma once
#include <QString>
#include <QVector>
#include <QMap>
#include <atomic>
#include "organizer_types.h"
#include "organizer_config.h"
#include "move_engine.h"
#include "folder_lock.h"

class Classifier;
class SessionRecorder;
class PathGuard;

enum class PreflightError {
    None,
    MissingTarget,
    NotADirectory,
    ProtectedTarget,
    Busy,
    LockFailed,
    JournalUnavailable
};

QString preflightErrorName(PreflightError error);

// Everything one run needs. Nothing is shared between contexts, so several
// targets can be processed in one process.
struct OrganizeContext {
    QString targetRoot;
    OrganizerConfig config;
    QString stateDir;                           // journal and lock markers
    const std::atomic_bool* cancel = nullptr;   // checked between files
    MoveEngine::RenameFunction renameFunction;  // empty: platform rename
};

struct RunReport {
    PreflightError preflight = PreflightError::None;
    QString message;                 // explanation of a fatal error
    LockHolder holder;               // who holds the target when Busy
    Session session;                 // successful moves and summary counts
    QVector<MoveOperation> skipped;  // full list
    QMap<QString, int> categoryCounts;
    int relocatedFolders = 0;
    bool dryRun = false;
    bool cancelled = false;
    bool committed = false;
    QString journalError;            // moves happened but could not be journaled

    bool isFatal() const { return preflight != PreflightError::None; }
    QVector<MoveOperation> skippedPreview(int cap = kSkippedPreviewCap) const;
    // 0 clean, 1 fatal, 2 completed with skips.
    int exitCode() const;

    static constexpr int kSkippedPreviewCap = 10;
};

/**
 * @brief Batch driver: pre-flight, lock, scan, classify, rename, move, journal.
 *
 * Fatal conditions are detected before anything on disk changes and are
 * returned in RunReport::preflight. Per-file failures end up in
 * RunReport::skipped and never stop the batch. Dry runs take no lock and
 * write no journal.
 */
class Organizer {
public:
    static RunReport run(const OrganizeContext& ctx);

    static PreflightError preflight(const QString& root, const PathGuard& guard, QString* messageOut = nullptr);

    // Classify, rename and move one entry. Shared by batch runs and the watcher.
    static MoveOperation processEntry(const FileEntry& entry, const QString& root, const OrganizerConfig& config,
                                      const Classifier& classifier, MoveEngine& engine, SessionRecorder& recorder);
};
