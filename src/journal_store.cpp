#include "journal_store.h"
#include "move_engine.h"
#include "organizer_config.h"
#include "file_utils.h"
#include <QSqlQuery>
#include <QSqlError>
#include <QVariant>
#include <QDir>
#include <QFileInfo>
#include <QDebug>
#include <atomic>

namespace {

std::atomic_int g_connectionCounter{0};

const char* const kSessionColumns =
    "id, target_root, started_at, files_moved, files_renamed, bytes_moved, duration_ms, skipped_count, undone";

Session sessionFromRow(const QSqlQuery& q)
{
    Session s;
    s.id = q.value(0).toLongLong();
    s.targetRoot = q.value(1).toString();
    s.startedAt = QDateTime::fromMSecsSinceEpoch(q.value(2).toLongLong(), Qt::UTC);
    s.filesMoved = q.value(3).toInt();
    s.filesRenamed = q.value(4).toInt();
    s.bytesMoved = q.value(5).toLongLong();
    s.durationMs = q.value(6).toLongLong();
    s.skippedCount = q.value(7).toInt();
    s.undone = q.value(8).toBool();
    return s;
}

} // namespace

JournalStore::JournalStore(const QString& dbFilePath)
    : m_path(dbFilePath)
    , m_connectionName(QString("foldertidy_journal_%1").arg(++g_connectionCounter))
{
}

JournalStore::~JournalStore()
{
    close();
}

QString JournalStore::defaultPath()
{
    return QDir(ConfigStore::stateDirectory()).filePath("journal.sqlite");
}

bool JournalStore::open(QString* errorOut)
{
    if (isOpen()) return true;
    const QString dir = QFileInfo(m_path).absolutePath();
    if (!QDir().mkpath(dir)) {
        if (errorOut) *errorOut = QString("Cannot create journal directory %1").arg(dir);
        return false;
    }

    m_db = QSqlDatabase::addDatabase("QSQLITE", m_connectionName);
    m_db.setDatabaseName(m_path);
    if (!m_db.open()) {
        if (errorOut) *errorOut = m_db.lastError().text();
        qWarning() << "[Journal] Open failed:" << m_path << m_db.lastError();
        close();
        return false;
    }
    if (!migrate()) {
        if (errorOut) *errorOut = QString("Cannot create journal schema in %1").arg(m_path);
        close();
        return false;
    }
    qDebug() << "[Journal] Opened" << m_path;
    return true;
}

void JournalStore::close()
{
    if (!m_db.isValid()) return;
    m_db.close();
    m_db = QSqlDatabase();
    QSqlDatabase::removeDatabase(m_connectionName);
}

bool JournalStore::exec(const QString& sql)
{
    QSqlQuery q(m_db);
    if (!q.exec(sql)) {
        qWarning() << "[Journal] SQL failed:" << sql << q.lastError();
        return false;
    }
    return true;
}

bool JournalStore::migrate()
{
    const char* ddl[] = {
        "PRAGMA foreign_keys=ON;",
        "CREATE TABLE IF NOT EXISTS sessions (\n"
        "  id INTEGER PRIMARY KEY AUTOINCREMENT,\n"
        "  target_root TEXT NOT NULL,\n"
        "  started_at INTEGER NOT NULL,\n"
        "  files_moved INTEGER NOT NULL DEFAULT 0,\n"
        "  files_renamed INTEGER NOT NULL DEFAULT 0,\n"
        "  bytes_moved INTEGER NOT NULL DEFAULT 0,\n"
        "  duration_ms INTEGER NOT NULL DEFAULT 0,\n"
        "  skipped_count INTEGER NOT NULL DEFAULT 0,\n"
        "  undone INTEGER NOT NULL DEFAULT 0\n"
        ");",
        "CREATE INDEX IF NOT EXISTS idx_sessions_target ON sessions(target_root);",
        "CREATE TABLE IF NOT EXISTS moves (\n"
        "  id INTEGER PRIMARY KEY AUTOINCREMENT,\n"
        "  session_id INTEGER NOT NULL REFERENCES sessions(id) ON DELETE CASCADE,\n"
        "  seq INTEGER NOT NULL,\n"
        "  source TEXT NOT NULL,\n"
        "  destination TEXT NOT NULL,\n"
        "  size INTEGER NOT NULL DEFAULT 0,\n"
        "  kind INTEGER NOT NULL DEFAULT 0,\n"
        "  renamed INTEGER NOT NULL DEFAULT 0\n"
        ");",
        "CREATE INDEX IF NOT EXISTS idx_moves_session ON moves(session_id);",
        "CREATE TABLE IF NOT EXISTS created_dirs (\n"
        "  session_id INTEGER NOT NULL REFERENCES sessions(id) ON DELETE CASCADE,\n"
        "  seq INTEGER NOT NULL,\n"
        "  path TEXT NOT NULL\n"
        ");",
        "CREATE INDEX IF NOT EXISTS idx_created_dirs_session ON created_dirs(session_id);"
    };
    for (const char* sql : ddl) if (!exec(QString::fromLatin1(sql))) return false;
    return true;
}

bool JournalStore::commit(Session& session, QString* errorOut)
{
    if (!isOpen()) {
        if (errorOut) *errorOut = "Journal is not open";
        return false;
    }
    if (!m_db.transaction()) {
        if (errorOut) *errorOut = m_db.lastError().text();
        return false;
    }

    auto fail = [&](const QSqlQuery& q) {
        if (errorOut) *errorOut = q.lastError().text();
        qWarning() << "[Journal] Commit failed:" << q.lastError();
        m_db.rollback();
        return false;
    };

    QSqlQuery ins(m_db);
    ins.prepare("INSERT INTO sessions(target_root, started_at, files_moved, files_renamed, bytes_moved, "
                "duration_ms, skipped_count, undone) VALUES(?,?,?,?,?,?,?,0)");
    ins.addBindValue(session.targetRoot);
    ins.addBindValue(session.startedAt.toMSecsSinceEpoch());
    ins.addBindValue(session.filesMoved);
    ins.addBindValue(session.filesRenamed);
    ins.addBindValue(session.bytesMoved);
    ins.addBindValue(session.durationMs);
    ins.addBindValue(session.skippedCount);
    if (!ins.exec()) return fail(ins);
    const qint64 id = ins.lastInsertId().toLongLong();

    QSqlQuery mv(m_db);
    mv.prepare("INSERT INTO moves(session_id, seq, source, destination, size, kind, renamed) VALUES(?,?,?,?,?,?,?)");
    for (int i = 0; i < session.moves.size(); ++i) {
        const MoveOperation& op = session.moves[i];
        mv.addBindValue(id);
        mv.addBindValue(i);
        mv.addBindValue(op.source);
        mv.addBindValue(op.destination);
        mv.addBindValue(op.size);
        mv.addBindValue(op.kind == MoveOperation::Kind::Directory ? 1 : 0);
        mv.addBindValue(op.renamed ? 1 : 0);
        if (!mv.exec()) return fail(mv);
    }

    QSqlQuery dir(m_db);
    dir.prepare("INSERT INTO created_dirs(session_id, seq, path) VALUES(?,?,?)");
    for (int i = 0; i < session.createdDirectories.size(); ++i) {
        dir.addBindValue(id);
        dir.addBindValue(i);
        dir.addBindValue(session.createdDirectories[i]);
        if (!dir.exec()) return fail(dir);
    }

    if (!m_db.commit()) {
        if (errorOut) *errorOut = m_db.lastError().text();
        m_db.rollback();
        return false;
    }
    session.id = id;
    qInfo() << "[Journal] Committed session" << id << "for" << session.targetRoot
            << "moves:" << session.moves.size();
    prune();
    return true;
}

bool JournalStore::prune()
{
    QSqlQuery q(m_db);
    q.prepare("DELETE FROM sessions WHERE id NOT IN (SELECT id FROM sessions ORDER BY id DESC LIMIT ?)");
    q.addBindValue(kRetainedSessions);
    if (!q.exec()) {
        qWarning() << "[Journal] Prune failed:" << q.lastError();
        return false;
    }
    if (q.numRowsAffected() > 0) qDebug() << "[Journal] Pruned" << q.numRowsAffected() << "old sessions";
    return true;
}

bool JournalStore::loadDetails(Session& s) const
{
    QSqlQuery mv(m_db);
    mv.prepare("SELECT source, destination, size, kind, renamed FROM moves WHERE session_id=? ORDER BY seq");
    mv.addBindValue(s.id);
    if (!mv.exec()) {
        qWarning() << "[Journal] Loading moves failed:" << mv.lastError();
        return false;
    }
    s.moves.clear();
    while (mv.next()) {
        MoveOperation op;
        op.source = mv.value(0).toString();
        op.destination = mv.value(1).toString();
        op.size = mv.value(2).toLongLong();
        op.kind = mv.value(3).toInt() == 1 ? MoveOperation::Kind::Directory : MoveOperation::Kind::File;
        op.renamed = mv.value(4).toBool();
        s.moves.append(op);
    }

    QSqlQuery dir(m_db);
    dir.prepare("SELECT path FROM created_dirs WHERE session_id=? ORDER BY seq");
    dir.addBindValue(s.id);
    if (!dir.exec()) {
        qWarning() << "[Journal] Loading directories failed:" << dir.lastError();
        return false;
    }
    s.createdDirectories.clear();
    while (dir.next()) s.createdDirectories.append(dir.value(0).toString());
    return true;
}

bool JournalStore::load(qint64 sessionId, Session& out) const
{
    if (!isOpen()) return false;
    QSqlQuery q(m_db);
    q.prepare(QString("SELECT %1 FROM sessions WHERE id=?").arg(kSessionColumns));
    q.addBindValue(sessionId);
    if (!q.exec() || !q.next()) return false;
    out = sessionFromRow(q);
    return loadDetails(out);
}

bool JournalStore::last(Session& out, const QString& targetRoot) const
{
    if (!isOpen()) return false;
    QSqlQuery q(m_db);
    if (targetRoot.isEmpty()) {
        q.prepare(QString("SELECT %1 FROM sessions ORDER BY id DESC LIMIT 1").arg(kSessionColumns));
    } else {
        q.prepare(QString("SELECT %1 FROM sessions WHERE target_root=? ORDER BY id DESC LIMIT 1").arg(kSessionColumns));
        q.addBindValue(FileUtils::cleanAbsolutePath(targetRoot));
    }
    if (!q.exec()) {
        qWarning() << "[Journal] Query failed:" << q.lastError();
        return false;
    }
    if (!q.next()) return false;
    out = sessionFromRow(q);
    return loadDetails(out);
}

QVector<Session> JournalStore::history(int limit, const QString& targetRoot) const
{
    QVector<Session> out;
    if (!isOpen() || limit <= 0) return out;
    QSqlQuery q(m_db);
    if (targetRoot.isEmpty()) {
        q.prepare(QString("SELECT %1 FROM sessions ORDER BY id DESC LIMIT ?").arg(kSessionColumns));
    } else {
        q.prepare(QString("SELECT %1 FROM sessions WHERE target_root=? ORDER BY id DESC LIMIT ?").arg(kSessionColumns));
        q.addBindValue(FileUtils::cleanAbsolutePath(targetRoot));
    }
    q.addBindValue(limit);
    if (!q.exec()) {
        qWarning() << "[Journal] History query failed:" << q.lastError();
        return out;
    }
    while (q.next()) out.append(sessionFromRow(q));
    return out;
}

int JournalStore::sessionCount() const
{
    if (!isOpen()) return 0;
    QSqlQuery q(m_db);
    if (!q.exec("SELECT COUNT(*) FROM sessions") || !q.next()) return 0;
    return q.value(0).toInt();
}

bool JournalStore::markUndone(qint64 sessionId)
{
    QSqlQuery q(m_db);
    q.prepare("UPDATE sessions SET undone=1 WHERE id=?");
    q.addBindValue(sessionId);
    if (!q.exec()) {
        qWarning() << "[Journal] Cannot mark session" << sessionId << "undone:" << q.lastError();
        return false;
    }
    return true;
}

UndoReport JournalStore::undo(MoveEngine& engine, const QString& targetRoot)
{
    UndoReport report;
    Session s;
    if (!last(s, targetRoot)) {
        report.message = "No session to undo";
        return report;
    }
    if (s.undone) {
        report.message = QString("Session %1 was already undone").arg(s.id);
        return report;
    }

    report.performed = true;
    report.sessionId = s.id;
    qInfo() << "[Journal] Undoing session" << s.id << "for" << s.targetRoot << "moves:" << s.moves.size();

    for (int i = s.moves.size() - 1; i >= 0; --i) {
        const MoveOperation& m = s.moves[i];
        const MoveOperation r = engine.restore(m.destination, m.source, m.kind);
        if (r.succeeded()) {
            report.restored++;
        } else {
            qWarning() << "[Journal] Cannot restore" << m.source << "-" << describeSkip(r);
            report.skipped.append(r);
        }
    }

    FileUtils::removeEmptyDirectories(s.createdDirectories, s.targetRoot,
                                      &report.removedDirectories, &report.keptDirectories);

    markUndone(s.id);
    report.message = QString("Restored %1 of %2 items").arg(report.restored).arg(s.moves.size());
    qInfo() << "[Journal]" << report.message << "removed directories:" << report.removedDirectories.size();
    return report;
}
