#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDebug>
#include <QDir>
#include <QTextStream>
#include <QTimer>
#include <atomic>
#include <csignal>
#include <cstdio>
#include <memory>
#include "log_manager.h"
#include "organizer.h"
#include "organizer_config.h"
#include "folder_watcher.h"
#include "journal_store.h"
#include "duplicate_detector.h"
#include "scanner.h"
#include "path_guard.h"
#include "file_utils.h"
#include "utils.h"

namespace {

std::atomic_bool g_stopRequested{false};

void onStopSignal(int)
{
    g_stopRequested.store(true);
}

QTextStream& out()
{
    static QTextStream ts(stdout);
    return ts;
}

void printSkipped(const QVector<MoveOperation>& skipped, int total)
{
    if (skipped.isEmpty()) return;
    out() << "\nSkipped files:\n";
    for (const MoveOperation& op : skipped) {
        out() << "  " << op.source << "\n      " << describeSkip(op) << "\n";
    }
    if (total > skipped.size()) {
        out() << "  ... and " << (total - skipped.size()) << " more (use --all-skipped)\n";
    }
}

void printReport(const RunReport& report, bool allSkipped)
{
    const Session& s = report.session;
    out() << (report.dryRun ? "Dry run, nothing was changed.\n" : "")
          << "Files moved:    " << s.filesMoved << "\n"
          << "Files renamed:  " << s.filesRenamed << "\n"
          << "Folders moved:  " << report.relocatedFolders << "\n"
          << "Data moved:     " << Utils::formatSize(s.bytesMoved) << "\n"
          << "Duration:       " << Utils::formatDuration(s.durationMs) << "\n"
          << "Skipped:        " << report.skipped.size() << "\n";
    if (!report.categoryCounts.isEmpty()) {
        out() << "\nBy folder:\n";
        for (auto it = report.categoryCounts.cbegin(); it != report.categoryCounts.cend(); ++it) {
            out() << "  " << it.key() << ": " << it.value() << "\n";
        }
    }
    if (report.dryRun && !s.moves.isEmpty()) {
        out() << "\nPlanned moves:\n";
        for (const MoveOperation& op : s.moves) out() << "  " << op.source << "\n   -> " << op.destination << "\n";
    }
    printSkipped(allSkipped ? report.skipped : report.skippedPreview(), report.skipped.size());
    if (report.cancelled) out() << "\nInterrupted, remaining files were left in place.\n";
    if (!report.journalError.isEmpty()) out() << "\nWARNING: this run could not be journaled and cannot be undone.\n";
    out().flush();
}

int runHistory(const QString& stateDir, const QString& folder, int limit)
{
    JournalStore journal(QDir(stateDir).filePath("journal.sqlite"));
    QString err;
    if (!journal.open(&err)) {
        qCritical() << "Cannot open the journal:" << err;
        return 1;
    }
    const QVector<Session> sessions = journal.history(limit, folder);
    if (sessions.isEmpty()) {
        out() << "No sessions recorded.\n";
        return 0;
    }
    for (const Session& s : sessions) {
        out() << "#" << s.id << "  " << s.startedAt.toLocalTime().toString("yyyy-MM-dd hh:mm:ss")
              << "  " << s.targetRoot << "\n"
              << "      " << s.filesMoved << " files, " << Utils::formatSize(s.bytesMoved)
              << ", " << s.skippedCount << " skipped, " << Utils::formatDuration(s.durationMs)
              << (s.undone ? "  [undone]" : "") << "\n";
    }
    out().flush();
    return 0;
}

int runUndo(const QString& stateDir, const QString& folder)
{
    JournalStore journal(QDir(stateDir).filePath("journal.sqlite"));
    QString err;
    if (!journal.open(&err)) {
        qCritical() << "Cannot open the journal:" << err;
        return 1;
    }
    Session last;
    if (!journal.last(last, folder)) {
        out() << "Nothing to undo.\n";
        return 0;
    }

    LockManager locks(stateDir);
    LockManager::Result acquired = locks.acquire(last.targetRoot);
    if (acquired.status != LockManager::Status::Acquired) {
        qCritical() << "Cannot undo:" << last.targetRoot
                    << (acquired.status == LockManager::Status::Busy ? "is busy, held by " + acquired.holder.describe()
                                                                     : acquired.error);
        return 1;
    }

    MoveEngine engine;
    const UndoReport report = journal.undo(engine, folder);
    out() << report.message << "\n";
    if (!report.performed) return 0;
    if (!report.removedDirectories.isEmpty())
        out() << "Removed " << report.removedDirectories.size() << " empty folders\n";
    for (const QString& kept : report.keptDirectories) out() << "Kept non-empty folder " << kept << "\n";
    printSkipped(report.skipped, report.skipped.size());
    out().flush();
    return report.skipped.isEmpty() ? 0 : 2;
}

int runDuplicates(const QString& stateDir, const QString& folder, const OrganizerConfig& config, bool remove)
{
    const PathGuard guard(config.protectedPaths);
    QString message;
    if (Organizer::preflight(FileUtils::cleanAbsolutePath(folder), guard, &message) != PreflightError::None) {
        qCritical() << message;
        return 1;
    }

    Scanner scanner(folder, config.recursive, guard);
    const DuplicateScanResult result = DuplicateDetector::findDuplicates(scanner.collectAll());
    for (const DuplicateGroup& g : result.groups) {
        out() << Utils::formatSize(g.size) << "  " << g.hash.left(12) << "\n";
        for (int i = 0; i < g.paths.size(); ++i) out() << (i == 0 ? "  keep   " : "  dup    ") << g.paths[i] << "\n";
    }
    out() << result.groups.size() << " duplicate groups, " << Utils::formatSize(result.reclaimableBytes())
          << " reclaimable\n";
    printSkipped(result.skipped, result.skipped.size());

    if (!remove || result.groups.isEmpty()) {
        out().flush();
        return result.skipped.isEmpty() ? 0 : 2;
    }

    std::unique_ptr<FolderLock> lock;
    if (!config.dryRun) {
        LockManager::Result acquired = LockManager(stateDir).acquire(folder);
        if (acquired.status != LockManager::Status::Acquired) {
            qCritical() << "Cannot delete duplicates:" << folder << "is locked";
            return 1;
        }
        lock = std::move(acquired.lock);
    }
    MoveEngine engine(config.dryRun);
    const DuplicateRemovalReport removal = DuplicateDetector::removeDuplicates(result.groups, engine);
    out() << (config.dryRun ? "Would delete " : "Deleted ") << removal.removed << " files, freed "
          << Utils::formatSize(removal.freedBytes) << "\n";
    printSkipped(removal.failures, removal.failures.size());
    out().flush();
    return result.skipped.isEmpty() && removal.failures.isEmpty() ? 0 : 2;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName("FolderTidy");
    QCoreApplication::setApplicationName("foldertidy");
    QCoreApplication::setApplicationVersion("1.0.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Sorts the files of a folder into category or date folders, renames them, "
                                     "finds duplicates and can undo its last run.");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("folder", "Folder to organize.", "[FOLDER]");
    QCommandLineOption modeOpt({"m", "mode"}, "Organization mode: category, date or hybrid.", "mode");
    QCommandLineOption renameOpt({"r", "rename"}, "Rename mode: clean, date-prefix or skip.", "rename");
    QCommandLineOption recursiveOpt({"R", "recursive"}, "Also organize files in subfolders.");
    QCommandLineOption dryRunOpt({"n", "dry-run"}, "Show what would happen without changing anything.");
    QCommandLineOption watchOpt({"w", "watch"}, "Keep running and organize new files as they appear.");
    QCommandLineOption undoOpt("undo", "Undo the most recent run (of FOLDER when given).");
    QCommandLineOption historyOpt("history", "List the N most recent runs.", "N");
    QCommandLineOption dupOpt("duplicates", "Report files with identical content.");
    QCommandLineOption dupDeleteOpt("delete-duplicates", "Delete duplicates, keeping the first of each group.");
    QCommandLineOption allSkippedOpt("all-skipped", "List every skipped file instead of a preview.");
    QCommandLineOption configOpt("config", "Configuration file (INI).", "file");
    QCommandLineOption verboseOpt({"v", "verbose"}, "Print debug output.");
    parser.addOptions({modeOpt, renameOpt, recursiveOpt, dryRunOpt, watchOpt, undoOpt, historyOpt,
                       dupOpt, dupDeleteOpt, allSkippedOpt, configOpt, verboseOpt});
    parser.process(app);

    const QString stateDir = ConfigStore::stateDirectory();
    LogManager& logManager = LogManager::instance();
    logManager.setVerbose(parser.isSet(verboseOpt));
    if (!logManager.openLogFile(QDir(stateDir).filePath("foldertidy.log"))) {
        fprintf(stderr, "Cannot open log file in %s\n", stateDir.toLocal8Bit().constData());
    }
    qInstallMessageHandler(customMessageHandler);
    qInfo() << "[MAIN] foldertidy" << QCoreApplication::applicationVersion() << "state dir:" << stateDir;

    std::signal(SIGINT, onStopSignal);
    std::signal(SIGTERM, onStopSignal);

    const QString configPath = parser.isSet(configOpt) ? parser.value(configOpt) : ConfigStore::defaultConfigPath();
    OrganizerConfig config;
    QString err;
    if (!ConfigStore(configPath).load(config, &err)) {
        qCritical() << err;
        return 1;
    }
    if (parser.isSet(modeOpt) && !parseOrganizationMode(parser.value(modeOpt), config.organizationMode)) {
        qCritical() << "Unknown organization mode:" << parser.value(modeOpt);
        return 1;
    }
    if (parser.isSet(renameOpt) && !parseRenameMode(parser.value(renameOpt), config.renameMode)) {
        qCritical() << "Unknown rename mode:" << parser.value(renameOpt);
        return 1;
    }
    if (parser.isSet(recursiveOpt)) config.recursive = true;
    if (parser.isSet(dryRunOpt)) config.dryRun = true;

    const QStringList args = parser.positionalArguments();
    const QString folder = args.isEmpty() ? QString() : FileUtils::cleanAbsolutePath(args.first());

    if (parser.isSet(historyOpt)) {
        bool ok = false;
        const int limit = parser.value(historyOpt).toInt(&ok);
        if (!ok || limit <= 0) {
            qCritical() << "--history expects a positive number";
            return 1;
        }
        return runHistory(stateDir, folder, limit);
    }
    if (parser.isSet(undoOpt)) return runUndo(stateDir, folder);

    if (folder.isEmpty()) {
        parser.showHelp(1);
    }

    if (parser.isSet(dupOpt) || parser.isSet(dupDeleteOpt))
        return runDuplicates(stateDir, folder, config, parser.isSet(dupDeleteOpt));

    OrganizeContext ctx;
    ctx.targetRoot = folder;
    ctx.config = config;
    ctx.stateDir = stateDir;
    ctx.cancel = &g_stopRequested;

    if (parser.isSet(watchOpt)) {
        FolderWatcher watcher(ctx);
        if (!watcher.start(&err)) {
            qCritical() << err;
            return 1;
        }
        QObject::connect(&watcher, &FolderWatcher::fileProcessed, [](const MoveOperation& op) {
            if (op.succeeded()) out() << op.source << "\n   -> " << op.destination << "\n";
            else out() << op.source << "\n   skipped: " << describeSkip(op) << "\n";
            out().flush();
        });
        QObject::connect(&watcher, &FolderWatcher::stateChanged, &app, [&app](FolderWatcher::State state) {
            if (state == FolderWatcher::State::Stopped) app.quit();
        });
        out() << "Watching " << folder << " (Ctrl+C to stop)\n";
        out().flush();
        app.exec();
        out() << "Processed " << watcher.processedFiles() << " files, skipped " << watcher.skipped().size() << "\n";
        out().flush();
        return watcher.skipped().isEmpty() ? 0 : 2;
    }

    const RunReport report = Organizer::run(ctx);
    if (report.isFatal()) {
        qCritical() << preflightErrorName(report.preflight) + ":" << report.message;
        return report.exitCode();
    }
    printReport(report, parser.isSet(allSkippedOpt));
    return report.exitCode();
}
