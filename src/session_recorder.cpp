#include "session_recorder.h"
#include "file_utils.h"
#include <QDir>

SessionRecorder::SessionRecorder(const QString& targetRoot)
{
    m_session.targetRoot = FileUtils::cleanAbsolutePath(targetRoot);
    m_session.startedAt = QDateTime::currentDateTimeUtc();
    m_timer.start();
}

void SessionRecorder::record(const MoveOperation& op)
{
    if (!op.succeeded()) {
        m_skipped.append(op);
        m_session.skippedCount = m_skipped.size();
        return;
    }

    m_session.moves.append(op);
    if (op.kind == MoveOperation::Kind::File) {
        m_session.filesMoved++;
        if (op.renamed) m_session.filesRenamed++;
    }
    m_session.bytesMoved += op.size;

    const QString rel = QDir(m_session.targetRoot).relativeFilePath(op.destination);
    if (!rel.startsWith("..")) {
        const QString head = rel.section('/', 0, 0);
        if (!head.isEmpty()) m_categoryCounts[head]++;
    }
}

void SessionRecorder::recordCreatedDirectory(const QString& dir)
{
    const QString clean = FileUtils::cleanAbsolutePath(dir);
    if (!m_session.createdDirectories.contains(clean, FileUtils::pathCaseSensitivity()))
        m_session.createdDirectories.append(clean);
}

Session SessionRecorder::finish()
{
    m_session.durationMs = m_timer.elapsed();
    return m_session;
}
