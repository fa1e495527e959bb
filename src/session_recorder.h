#pragma once
#include <QString>
#include <QStringList>
#include <QVector>
#include <QMap>
#include <QElapsedTimer>
#include "organizer_types.h"

// Accumulates the outcome of one run. Successful operations become the
// Session's moves; skipped ones are kept apart for the summary.
class SessionRecorder {
public:
    explicit SessionRecorder(const QString& targetRoot);

    void record(const MoveOperation& op);
    void recordCreatedDirectory(const QString& dir);

    // Stamps the elapsed time and returns a copy of the session.
    Session finish();

    const Session& session() const { return m_session; }
    const QVector<MoveOperation>& skipped() const { return m_skipped; }
    // Successful moves per first path segment below the target root.
    const QMap<QString, int>& categoryCounts() const { return m_categoryCounts; }
    bool hasMoves() const { return !m_session.moves.isEmpty(); }

private:
    Session m_session;
    QVector<MoveOperation> m_skipped;
    QMap<QString, int> m_categoryCounts;
    QElapsedTimer m_timer;
};
