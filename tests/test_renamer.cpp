#include <QtTest>
#include "../src/renamer.h"

class TestRenamer : public QObject {
    Q_OBJECT
private slots:
    void testCleanAccents();
    void testCleanSeparatorsAndMarkers();
    void testCleanKeepsNumbersInNames();
    void testCleanIsIdempotent();
    void testCleanKeepsExtensionCase();
    void testCleanWithoutLatinLetters();
    void testDatePrefix();
    void testSkipIsIdentity();
};

static FileEntry entryNamed(const QString& name, const QDateTime& modified = QDateTime())
{
    FileEntry e;
    e.path = "/tmp/in/" + name;
    e.modified = modified;
    return e;
}

void TestRenamer::testCleanAccents()
{
    QCOMPARE(Renamer::cleanName(QString::fromUtf8("élève café.pdf")), QString("eleve-cafe.pdf"));
    QCOMPARE(Renamer::cleanName(QString::fromUtf8("Straße Œuvre.doc")), QString("strasse-oeuvre.doc"));
    QCOMPARE(Renamer::cleanName(QString::fromUtf8("Ångström Ølberg.txt")), QString("angstrom-olberg.txt"));
}

void TestRenamer::testCleanSeparatorsAndMarkers()
{
    QCOMPARE(Renamer::cleanName("Report (1).pdf"), QString("report.pdf"));
    QCOMPARE(Renamer::cleanName("Report (copy).pdf"), QString("report.pdf"));
    QCOMPARE(Renamer::cleanName("Report copie 2.pdf"), QString("report.pdf"));
    QCOMPARE(Renamer::cleanName("My  File__name--v2 (copy).txt"), QString("my-file-name-v2.txt"));
    QCOMPARE(Renamer::cleanName("--weird!!name--.md"), QString("weirdname.md"));
    QCOMPARE(Renamer::cleanName("archive.tar.gz"), QString("archive-tar.gz"));
    QCOMPARE(Renamer::cleanName("track-01.mp3"), QString("track-01.mp3"));
    QCOMPARE(Renamer::cleanName("Report - Copy.pdf"), QString("report.pdf"));
    QCOMPARE(Renamer::cleanName("Report - Copy (2).pdf"), QString("report.pdf"));
    QCOMPARE(Renamer::cleanName("Report_(copy 3).pdf"), QString("report.pdf"));
    QCOMPARE(Renamer::cleanName("Report COPY!.pdf"), QString("report.pdf"));
}

void TestRenamer::testCleanKeepsNumbersInNames()
{
    QCOMPARE(Renamer::cleanName("Chapter 1.pdf"), QString("chapter-1.pdf"));
    QCOMPARE(Renamer::cleanName("Chapter 2.pdf"), QString("chapter-2.pdf"));
    QCOMPARE(Renamer::cleanName("Chapter 2 (1).pdf"), QString("chapter-2.pdf"));
    QCOMPARE(Renamer::cleanName("invoice-2024-7.pdf"), QString("invoice-2024-7.pdf"));
    QCOMPARE(Renamer::cleanName("Copy.txt"), QString("copy.txt"));
    QCOMPARE(Renamer::cleanName("copy-machine manual.pdf"), QString("copy-machine-manual.pdf"));
    QCOMPARE(Renamer::stripDuplicateMarkers("Season 2 (copy)"), QString("Season 2"));
    QCOMPARE(Renamer::stripDuplicateMarkers("season-2"), QString("season-2"));
}

void TestRenamer::testCleanIsIdempotent()
{
    const QStringList inputs = {
        QString::fromUtf8("élève café.pdf"),
        "Report (1) (2).pdf",
        "Holiday - Beach_2024 copy.JPG",
        "a-1-2-copy.txt",
        "Chapter 1.pdf",
        "Report COPY!.pdf",
        "Notes - Copy (2) copy.txt",
        QString::fromUtf8("日本語.txt"),
        "README",
        "x.y.z.tar.gz"
    };
    for (const QString& in : inputs) {
        const QString once = Renamer::cleanName(in);
        QCOMPARE(Renamer::cleanName(once), once);
    }
}

void TestRenamer::testCleanKeepsExtensionCase()
{
    QCOMPARE(Renamer::cleanName("Photo Final.JPG"), QString("photo-final.JPG"));
    QCOMPARE(Renamer::rename(entryNamed("Photo Final.JPG"), RenameMode::Clean), QString("photo-final.JPG"));
}

void TestRenamer::testCleanWithoutLatinLetters()
{
    // Nothing of the stem survives: the name is kept.
    QCOMPARE(Renamer::cleanName(QString::fromUtf8("日本語.txt")), QString::fromUtf8("日本語.txt"));
    QCOMPARE(Renamer::cleanName("(1).txt"), QString("1.txt"));
}

void TestRenamer::testDatePrefix()
{
    const QDateTime when(QDate(2024, 3, 7), QTime(10, 30));
    QCOMPARE(Renamer::datePrefixName("Scan Result.pdf", when), QString("2024-03-07-Scan Result.pdf"));
    QCOMPARE(Renamer::datePrefixName("2024-03-07-Scan Result.pdf", when),
             QString("2024-03-07-2024-03-07-Scan Result.pdf"));
    QCOMPARE(Renamer::datePrefixName("Report (1).pdf", when), QString("2024-03-07-Report (1).pdf"));
    QCOMPARE(Renamer::rename(entryNamed("scan.pdf", when), RenameMode::DatePrefix), QString("2024-03-07-scan.pdf"));
}

void TestRenamer::testSkipIsIdentity()
{
    QCOMPARE(Renamer::rename(entryNamed(QString::fromUtf8("Élève (1).PDF")), RenameMode::Skip),
             QString::fromUtf8("Élève (1).PDF"));
}

QTEST_APPLESS_MAIN(TestRenamer)
#include "test_renamer.moc"
