#include "organizer.h"
#include "classifier.h"
#include "renamer.h"
#include "scanner.h"
#include "path_guard.h"
#include "session_recorder.h"
#include "journal_store.h"
#include "file_utils.h"
#include "utils.h"
#include <QDir>
#include <QFileInfo>
#include <QDebug>

namespace {

bool isCancelled(const OrganizeContext& ctx)
{
    return ctx.cancel && ctx.cancel->load();
}

} // namespace

QString preflightErrorName(PreflightError error)
{
    switch (error) {
        case PreflightError::None: return "None";
        case PreflightError::MissingTarget: return "Target does not exist";
        case PreflightError::NotADirectory: return "Target is not a directory";
        case PreflightError::ProtectedTarget: return "Target is protected";
        case PreflightError::Busy: return "Target is busy";
        case PreflightError::LockFailed: return "Lock failed";
        case PreflightError::JournalUnavailable: return "Journal unavailable";
    }
    return "";
}

QVector<MoveOperation> RunReport::skippedPreview(int cap) const
{
    if (cap < 0 || skipped.size() <= cap) return skipped;
    return skipped.mid(0, cap);
}

int RunReport::exitCode() const
{
    if (isFatal() || !journalError.isEmpty()) return 1;
    return skipped.isEmpty() ? 0 : 2;
}

PreflightError Organizer::preflight(const QString& root, const PathGuard& guard, QString* messageOut)
{
    const QFileInfo fi(root);
    if (!fi.exists()) {
        if (messageOut) *messageOut = QString("%1 does not exist").arg(root);
        return PreflightError::MissingTarget;
    }
    if (!fi.isDir()) {
        if (messageOut) *messageOut = QString("%1 is not a directory").arg(root);
        return PreflightError::NotADirectory;
    }
    const PathGuard::Result verdict = guard.check(root);
    if (!verdict.allowed()) {
        if (messageOut) *messageOut = QString("Refusing to organize: %1").arg(verdict.reason);
        return PreflightError::ProtectedTarget;
    }
    return PreflightError::None;
}

MoveOperation Organizer::processEntry(const FileEntry& entry, const QString& root, const OrganizerConfig& config,
                                      const Classifier& classifier, MoveEngine& engine, SessionRecorder& recorder)
{
    const QString relativeDir = classifier.classify(entry, config.organizationMode);
    const QString name = Renamer::rename(entry, config.renameMode);
    return engine.execute(entry, QDir(root).filePath(relativeDir), name, &recorder);
}

RunReport Organizer::run(const OrganizeContext& ctx)
{
    RunReport report;
    report.dryRun = ctx.config.dryRun;
    const QString root = FileUtils::cleanAbsolutePath(ctx.targetRoot);
    const PathGuard guard(ctx.config.protectedPaths);

    report.preflight = preflight(root, guard, &report.message);
    if (report.isFatal()) {
        qWarning() << "[Organizer]" << report.message;
        return report;
    }

    std::unique_ptr<FolderLock> lock;
    const LockManager locks(ctx.stateDir);
    if (!report.dryRun) {
        LockManager::Result acquired = locks.acquire(root);
        if (acquired.status == LockManager::Status::Busy) {
            report.preflight = PreflightError::Busy;
            report.holder = acquired.holder;
            report.message = QString("%1 is already being organized by %2").arg(root, acquired.holder.describe());
            qWarning() << "[Organizer]" << report.message;
            return report;
        }
        if (acquired.status == LockManager::Status::Failed) {
            report.preflight = PreflightError::LockFailed;
            report.message = acquired.error;
            return report;
        }
        lock = std::move(acquired.lock);
    }

    JournalStore journal(QDir(ctx.stateDir).filePath("journal.sqlite"));
    if (!report.dryRun) {
        QString err;
        if (!journal.open(&err)) {
            report.preflight = PreflightError::JournalUnavailable;
            report.message = QString("Cannot open the journal: %1").arg(err);
            qWarning() << "[Organizer]" << report.message;
            return report;
        }
    }

    qInfo() << "[Organizer]" << (report.dryRun ? "Dry run on" : "Organizing") << root
            << "mode:" << organizationModeName(ctx.config.organizationMode)
            << "rename:" << renameModeName(ctx.config.renameMode)
            << "recursive:" << ctx.config.recursive;

    const Classifier classifier(ctx.config.categories);
    MoveEngine engine(report.dryRun);
    if (ctx.renameFunction) engine.setRenameFunction(ctx.renameFunction);
    SessionRecorder recorder(root);

    Scanner scanner(root, ctx.config.recursive, guard, &classifier);

    if (!ctx.config.recursive) {
        const QVector<FolderRelocation> relocations = scanner.dominantCategoryFolders(classifier);
        for (const FolderRelocation& r : relocations) {
            if (isCancelled(ctx)) break;
            const MoveOperation op = engine.moveDirectory(r.sourceDir, QDir(root).filePath(r.category), &recorder);
            if (op.succeeded()) report.relocatedFolders++;
        }
    }

    while (scanner.hasNext()) {
        if (isCancelled(ctx)) {
            qInfo() << "[Organizer] Cancelled, stopping before the next file";
            report.cancelled = true;
            scanner.close();
            break;
        }
        processEntry(scanner.next(), root, ctx.config, classifier, engine, recorder);
    }

    report.session = recorder.finish();
    report.skipped = recorder.skipped();
    report.categoryCounts = recorder.categoryCounts();

    if (!report.dryRun && !recorder.hasMoves()) {
        // Nothing is journaled, so nothing could undo the folders made for failed moves.
        FileUtils::removeEmptyDirectories(report.session.createdDirectories, root);
    }
    if (!report.dryRun && recorder.hasMoves()) {
        QString err;
        if (journal.commit(report.session, &err)) {
            report.committed = true;
        } else {
            report.journalError = err;
            qCritical() << "[Organizer] Moves were made but could not be journaled:" << err;
        }
    }

    qInfo() << "[Organizer] Done:" << report.session.filesMoved << "files,"
            << Utils::formatSize(report.session.bytesMoved) << "in"
            << Utils::formatDuration(report.session.durationMs)
            << "skipped:" << report.skipped.size();
    return report;
}
