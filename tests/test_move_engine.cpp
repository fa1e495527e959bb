#include <QtTest>
#include <QTemporaryDir>
#include <QDir>
#include <QFile>
#include <QRandomGenerator>
#include "../src/move_engine.h"
#include "../src/session_recorder.h"
#include "../src/scanner.h"

class TestMoveEngine : public QObject {
    Q_OBJECT
private slots:
    void testConflictResolutionNeverOverwrites();
    void testCreatesMissingDirectories();
    void testDirectoryCreateFailed();
    void testSourceNotFound();
    void testCrossDeviceFallbackCopies();
    void testCrossDeviceCopyFailureKeepsSource();
    void testPermissionDeniedLeavesSource();
    void testDryRunChangesNothing();
    void testMoveDirectory();
    void testRestoreNeverOverwrites();
    void testPlatformRenameRefusesToReplace();
    void testNameTakenDuringMovePicksNextName();
};

static void writeFile(const QString& path, const QByteArray& data)
{
    QDir().mkpath(QFileInfo(path).absolutePath());
    QFile f(path);
    QVERIFY(f.open(QIODevice::WriteOnly));
    f.write(data);
}

static QByteArray readFile(const QString& path)
{
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) return QByteArray();
    return f.readAll();
}

static FileEntry entryFor(const QString& path)
{
    return Scanner::entryFor(QFileInfo(path));
}

void TestMoveEngine::testConflictResolutionNeverOverwrites()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());
    const QString root = tmp.path();
    writeFile(root + "/one/rapport.pdf", "first");
    writeFile(root + "/two/rapport.pdf", "second");

    MoveEngine engine;
    SessionRecorder recorder(root);
    const MoveOperation a = engine.execute(entryFor(root + "/one/rapport.pdf"), root + "/Documents", "rapport.pdf", &recorder);
    const MoveOperation b = engine.execute(entryFor(root + "/two/rapport.pdf"), root + "/Documents", "rapport.pdf", &recorder);

    QVERIFY(a.succeeded());
    QVERIFY(b.succeeded());
    QCOMPARE(QFileInfo(a.destination).fileName(), QString("rapport.pdf"));
    QCOMPARE(QFileInfo(b.destination).fileName(), QString("rapport-1.pdf"));
    QCOMPARE(readFile(root + "/Documents/rapport.pdf"), QByteArray("first"));
    QCOMPARE(readFile(root + "/Documents/rapport-1.pdf"), QByteArray("second"));
    QVERIFY(!QFileInfo::exists(root + "/one/rapport.pdf"));
    QVERIFY(!QFileInfo::exists(root + "/two/rapport.pdf"));

    QCOMPARE(recorder.session().moves.size(), 2);
    QCOMPARE(recorder.session().filesMoved, 2);
    QCOMPARE(recorder.session().filesRenamed, 1);
    QCOMPARE(recorder.session().bytesMoved, qint64(11));
    QCOMPARE(recorder.categoryCounts().value("Documents"), 2);

    // A third file lands on the next free suffix.
    writeFile(root + "/three/rapport.pdf", "third");
    const MoveOperation c = engine.execute(entryFor(root + "/three/rapport.pdf"), root + "/Documents", "rapport.pdf");
    QCOMPARE(QFileInfo(c.destination).fileName(), QString("rapport-2.pdf"));
}

void TestMoveEngine::testCreatesMissingDirectories()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());
    const QString root = tmp.path();
    writeFile(root + "/photo.jpg", "img");

    MoveEngine engine;
    SessionRecorder recorder(root);
    const MoveOperation op = engine.execute(entryFor(root + "/photo.jpg"), root + "/2024/01-january", "photo.jpg", &recorder);
    QVERIFY(op.succeeded());
    QVERIFY(QFileInfo::exists(root + "/2024/01-january/photo.jpg"));
    QCOMPARE(recorder.session().createdDirectories,
             QStringList({QDir::cleanPath(root + "/2024"), QDir::cleanPath(root + "/2024/01-january")}));
}

void TestMoveEngine::testDirectoryCreateFailed()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());
    const QString root = tmp.path();
    writeFile(root + "/Documents", "I am a file, not a folder");
    writeFile(root + "/a.pdf", "pdf");

    MoveEngine engine;
    SessionRecorder recorder(root);
    const MoveOperation op = engine.execute(entryFor(root + "/a.pdf"), root + "/Documents", "a.pdf", &recorder);
    QVERIFY(!op.succeeded());
    QCOMPARE(op.reason, SkipReason::DirectoryCreateFailed);
    QVERIFY(QFileInfo::exists(root + "/a.pdf"));
    QCOMPARE(recorder.skipped().size(), 1);
    QCOMPARE(recorder.session().skippedCount, 1);
    QVERIFY(!recorder.hasMoves());
}

void TestMoveEngine::testSourceNotFound()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());
    const QString root = tmp.path();
    writeFile(root + "/gone.txt", "x");
    const FileEntry e = entryFor(root + "/gone.txt");
    QVERIFY(QFile::remove(root + "/gone.txt"));

    MoveEngine engine;
    const MoveOperation op = engine.execute(e, root + "/Documents", "gone.txt");
    QVERIFY(!op.succeeded());
    QCOMPARE(op.reason, SkipReason::SourceNotFound);
}

void TestMoveEngine::testCrossDeviceFallbackCopies()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());
    const QString root = tmp.path();

    // Larger than the copy buffer so the loop runs more than once.
    QByteArray payload(5 * 1024 * 1024 + 123, Qt::Uninitialized);
    for (int i = 0; i < payload.size(); ++i) payload[i] = char(QRandomGenerator::global()->bounded(256));
    writeFile(root + "/big.bin", payload);
    const QDateTime mtime = QFileInfo(root + "/big.bin").lastModified();

    MoveEngine engine;
    int renameCalls = 0;
    engine.setRenameFunction([&renameCalls](const QString&, const QString&, QString* err) {
        ++renameCalls;
        if (err) *err = "Invalid cross-device link";
        return MoveEngine::RenameResult::CrossDevice;
    });

    const MoveOperation op = engine.execute(entryFor(root + "/big.bin"), root + "/Others", "big.bin");
    QVERIFY2(op.succeeded(), qPrintable(describeSkip(op)));
    QCOMPARE(renameCalls, 1);
    QVERIFY(!QFileInfo::exists(root + "/big.bin"));
    QCOMPARE(readFile(root + "/Others/big.bin"), payload);
    QCOMPARE(QFileInfo(root + "/Others/big.bin").lastModified().toSecsSinceEpoch(), mtime.toSecsSinceEpoch());
}

void TestMoveEngine::testCrossDeviceCopyFailureKeepsSource()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());
    const QString root = tmp.path();
    writeFile(root + "/doc.pdf", "precious");

    MoveEngine engine;
    // Something claims the destination name between resolution and copy.
    engine.setRenameFunction([](const QString&, const QString& to, QString*) {
        QDir().mkpath(to);
        return MoveEngine::RenameResult::CrossDevice;
    });

    const MoveOperation op = engine.execute(entryFor(root + "/doc.pdf"), root + "/Documents", "doc.pdf");
    QVERIFY(!op.succeeded());
    QCOMPARE(op.reason, SkipReason::CrossDeviceCopyFailed);
    QCOMPARE(readFile(root + "/doc.pdf"), QByteArray("precious"));
    QVERIFY(QFileInfo(root + "/Documents/doc.pdf").isDir());
}

void TestMoveEngine::testPermissionDeniedLeavesSource()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());
    const QString root = tmp.path();
    writeFile(root + "/locked.txt", "keep me");

    MoveEngine engine;
    engine.setRenameFunction([](const QString&, const QString&, QString* err) {
        if (err) *err = "Permission denied";
        return MoveEngine::RenameResult::PermissionDenied;
    });
    SessionRecorder recorder(root);
    const MoveOperation op = engine.execute(entryFor(root + "/locked.txt"), root + "/Documents", "locked.txt", &recorder);
    QCOMPARE(op.reason, SkipReason::PermissionDenied);
    QCOMPARE(op.detail, QString("Permission denied"));
    QCOMPARE(readFile(root + "/locked.txt"), QByteArray("keep me"));
    QCOMPARE(recorder.skipped().size(), 1);
}

void TestMoveEngine::testDryRunChangesNothing()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());
    const QString root = tmp.path();
    writeFile(root + "/a/rapport.pdf", "a");
    writeFile(root + "/b/rapport.pdf", "b");

    MoveEngine engine(true);
    SessionRecorder recorder(root);
    const MoveOperation a = engine.execute(entryFor(root + "/a/rapport.pdf"), root + "/Documents", "rapport.pdf", &recorder);
    const MoveOperation b = engine.execute(entryFor(root + "/b/rapport.pdf"), root + "/Documents", "rapport.pdf", &recorder);

    QVERIFY(a.succeeded() && b.succeeded());
    QCOMPARE(a.destination, QDir::cleanPath(root + "/Documents/rapport.pdf"));
    QCOMPARE(b.destination, QDir::cleanPath(root + "/Documents/rapport-1.pdf"));
    QVERIFY(!QFileInfo::exists(root + "/Documents"));
    QVERIFY(QFileInfo::exists(root + "/a/rapport.pdf"));
    QVERIFY(QFileInfo::exists(root + "/b/rapport.pdf"));
    QVERIFY(recorder.session().createdDirectories.isEmpty());
}

void TestMoveEngine::testMoveDirectory()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());
    const QString root = tmp.path();
    writeFile(root + "/Holiday/1.jpg", "12");
    writeFile(root + "/Holiday/2.jpg", "345");

    MoveEngine engine;
    SessionRecorder recorder(root);
    const MoveOperation op = engine.moveDirectory(root + "/Holiday", root + "/Images", &recorder);
    QVERIFY(op.succeeded());
    QCOMPARE(op.kind, MoveOperation::Kind::Directory);
    QCOMPARE(op.size, qint64(5));
    QVERIFY(QFileInfo::exists(root + "/Images/Holiday/1.jpg"));
    QVERIFY(!QFileInfo::exists(root + "/Holiday"));
    QCOMPARE(recorder.session().filesMoved, 0);

    const MoveOperation into = engine.moveDirectory(root + "/Images", root + "/Images/Holiday");
    QCOMPARE(into.reason, SkipReason::OtherIOError);
}

void TestMoveEngine::testRestoreNeverOverwrites()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());
    const QString root = tmp.path();
    writeFile(root + "/Documents/a.pdf", "moved");
    writeFile(root + "/a.pdf", "newcomer");

    MoveEngine engine;
    const MoveOperation blocked = engine.restore(root + "/Documents/a.pdf", root + "/a.pdf", MoveOperation::Kind::File);
    QVERIFY(!blocked.succeeded());
    QCOMPARE(readFile(root + "/a.pdf"), QByteArray("newcomer"));
    QCOMPARE(readFile(root + "/Documents/a.pdf"), QByteArray("moved"));

    const MoveOperation missing = engine.restore(root + "/Documents/none.pdf", root + "/none.pdf", MoveOperation::Kind::File);
    QCOMPARE(missing.reason, SkipReason::SourceNotFound);

    QVERIFY(QFile::remove(root + "/a.pdf"));
    QVERIFY(engine.restore(root + "/Documents/a.pdf", root + "/a.pdf", MoveOperation::Kind::File).succeeded());
    QCOMPARE(readFile(root + "/a.pdf"), QByteArray("moved"));
}

void TestMoveEngine::testPlatformRenameRefusesToReplace()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());
    const QString root = tmp.path();
    writeFile(root + "/incoming.pdf", "incoming");
    writeFile(root + "/Documents/incoming.pdf", "already there");

    QString err;
    const MoveEngine::RenameResult r = MoveEngine::platformRename(root + "/incoming.pdf",
                                                                  root + "/Documents/incoming.pdf", &err);
    QCOMPARE(r, MoveEngine::RenameResult::DestinationExists);
    QVERIFY(!err.isEmpty());
    QCOMPARE(readFile(root + "/incoming.pdf"), QByteArray("incoming"));
    QCOMPARE(readFile(root + "/Documents/incoming.pdf"), QByteArray("already there"));

    // Directories are refused too.
    QVERIFY(QDir().mkpath(root + "/Holiday"));
    QVERIFY(QDir().mkpath(root + "/Images/Holiday"));
    writeFile(root + "/Images/Holiday/kept.jpg", "kept");
    QVERIFY(MoveEngine::platformRename(root + "/Holiday", root + "/Images/Holiday", nullptr)
            != MoveEngine::RenameResult::Ok);
    QCOMPARE(readFile(root + "/Images/Holiday/kept.jpg"), QByteArray("kept"));

    QVERIFY(MoveEngine::platformRename(root + "/incoming.pdf", root + "/Documents/fresh.pdf", nullptr)
            == MoveEngine::RenameResult::Ok);
    QCOMPARE(readFile(root + "/Documents/fresh.pdf"), QByteArray("incoming"));
    QVERIFY(!QFileInfo::exists(root + "/incoming.pdf"));
}

void TestMoveEngine::testNameTakenDuringMovePicksNextName()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());
    const QString root = tmp.path();
    writeFile(root + "/rapport.pdf", "ours");

    // Another program creates the chosen name between conflict resolution and the rename.
    MoveEngine engine;
    int calls = 0;
    engine.setRenameFunction([&calls](const QString& from, const QString& to, QString* err) {
        if (calls++ == 0) {
            QFile intruder(to);
            if (intruder.open(QIODevice::WriteOnly)) intruder.write("theirs");
        }
        return MoveEngine::platformRename(from, to, err);
    });
    SessionRecorder recorder(root);
    const MoveOperation op = engine.execute(entryFor(root + "/rapport.pdf"), root + "/Documents", "rapport.pdf", &recorder);

    QVERIFY(op.succeeded());
    QCOMPARE(calls, 2);
    QCOMPARE(QFileInfo(op.destination).fileName(), QString("rapport-1.pdf"));
    QVERIFY(op.renamed);
    QCOMPARE(readFile(root + "/Documents/rapport.pdf"), QByteArray("theirs"));
    QCOMPARE(readFile(root + "/Documents/rapport-1.pdf"), QByteArray("ours"));
    QCOMPARE(recorder.session().moves.size(), 1);
    QVERIFY(recorder.skipped().isEmpty());
}

QTEST_APPLESS_MAIN(TestMoveEngine)
#include "test_move_engine.moc"
