#pragma once
#include <QString>
#include <QStringList>
#include <QVector>
#include <QSqlDatabase>
#include "organizer_types.h"

class MoveEngine;

struct UndoReport {
    bool performed = false;           // false when there was nothing to undo
    qint64 sessionId = 0;
    int restored = 0;
    QVector<MoveOperation> skipped;   // reversals that could not be applied
    QStringList removedDirectories;
    QStringList keptDirectories;      // created by the session but not empty any more
    QString message;
};

/**
 * @brief SQLite journal of committed sessions, used by undo and history.
 *
 * One database is shared by every target; each session row carries its target
 * root. The most recent kRetainedSessions sessions are kept. Each instance owns
 * its own named connection so several stores can be open in one process.
 */
class JournalStore {
public:
    explicit JournalStore(const QString& dbFilePath);
    ~JournalStore();

    // Creates the parent directory and the schema if needed.
    bool open(QString* errorOut = nullptr);
    void close();
    bool isOpen() const { return m_db.isValid() && m_db.isOpen(); }
    QString path() const { return m_path; }

    // Assigns session.id. Returns false and leaves the journal unchanged on error.
    bool commit(Session& session, QString* errorOut = nullptr);

    // Most recent session, for one target when targetRoot is given.
    bool last(Session& out, const QString& targetRoot = QString()) const;

    // Summaries without moves, most recent first.
    QVector<Session> history(int limit, const QString& targetRoot = QString()) const;

    bool load(qint64 sessionId, Session& out) const;

    // Reverses the most recent session. A session that was already undone is
    // not replayed and an earlier one is not reached for either.
    UndoReport undo(MoveEngine& engine, const QString& targetRoot = QString());

    int sessionCount() const;

    static constexpr int kRetainedSessions = 50;

    // <state directory>/journal.sqlite
    static QString defaultPath();

private:
    bool migrate();
    bool exec(const QString& sql);
    bool prune();
    bool markUndone(qint64 sessionId);
    bool loadDetails(Session& s) const;

    QString m_path;
    QString m_connectionName;
    QSqlDatabase m_db;
};
