#pragma once
#include <QString>
#include <QDateTime>
#include <QRegularExpression>
#include "organizer_types.h"

// Produces the candidate file name for an entry. Never touches the filesystem;
// conflicts with existing names are resolved by MoveEngine.
class Renamer {
public:
    // Trailing "(1)", "(copy)", " - Copy", " copie 2", ... added by file managers
    // and browsers. A bare "-1" or " 1" is part of the name, not a marker.
    static const QRegularExpression& duplicateMarkerPattern();

    static QString rename(const FileEntry& entry, RenameMode mode);

    // "Élève Café (1).PDF" -> "eleve-cafe.PDF". Idempotent. Returns the input
    // unchanged when nothing of the stem survives.
    static QString cleanName(const QString& fileName);

    // "scan.pdf" + 2024-03-07 -> "2024-03-07-scan.pdf". The name itself is not
    // touched, even when it already starts with a date.
    static QString datePrefixName(const QString& fileName, const QDateTime& modified);

    // Lowercase ASCII slug of arbitrary text, dash separated.
    static QString slugify(const QString& text);

    // Repeatedly removes trailing duplicate markers. Works on raw stems and on
    // slugs; a marker that is the whole text is kept.
    static QString stripDuplicateMarkers(const QString& text);

    // Splits "name.ext" at the last dot. Leading dots and trailing dots do not count.
    static void splitName(const QString& fileName, QString& stem, QString& extension);
};
