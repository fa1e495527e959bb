#include "renamer.h"

namespace {

bool isCombiningMark(QChar c)
{
    const QChar::Category cat = c.category();
    return cat == QChar::Mark_NonSpacing || cat == QChar::Mark_SpacingCombining || cat == QChar::Mark_Enclosing;
}

// Separators turn into a single dash; anything else that is not alphanumeric is dropped.
bool isSeparator(QChar c)
{
    static const QString separators = QStringLiteral("_-.,;:()[]{}+&/\\|~");
    return c.isSpace() || separators.contains(c);
}

// Latin letters that have no canonical decomposition.
QString transliterate(QChar lower)
{
    switch (lower.unicode()) {
        case 0x00DF: return QStringLiteral("ss"); // sharp s
        case 0x00E6: return QStringLiteral("ae");
        case 0x0153: return QStringLiteral("oe");
        case 0x00F8: return QStringLiteral("o");
        case 0x0111: return QStringLiteral("d");
        case 0x0142: return QStringLiteral("l");
        case 0x00FE: return QStringLiteral("th");
        case 0x00F0: return QStringLiteral("d");
        default: return QString();
    }
}

} // namespace

const QRegularExpression& Renamer::duplicateMarkerPattern()
{
    static const QRegularExpression re(
        R"((?:[\s_-]*\((?:\d+|copy|copie|kopie|copia)(?:\s+\d+)?\)|[\s_-]+(?:copy|copie|kopie|copia)(?:[\s_-]+\d+)?)$)",
        QRegularExpression::CaseInsensitiveOption);
    return re;
}

void Renamer::splitName(const QString& fileName, QString& stem, QString& extension)
{
    const int dot = fileName.lastIndexOf('.');
    if (dot <= 0 || dot == fileName.size() - 1) {
        stem = fileName;
        extension.clear();
        return;
    }
    stem = fileName.left(dot);
    extension = fileName.mid(dot + 1);
}

QString Renamer::slugify(const QString& text)
{
    const QString decomposed = text.normalized(QString::NormalizationForm_KD);
    QString out;
    out.reserve(decomposed.size());
    bool pendingDash = false;

    for (const QChar raw : decomposed) {
        if (isCombiningMark(raw)) continue;
        const QChar c = raw.toLower();

        QString piece;
        if (c.unicode() < 128 && c.isLetterOrNumber()) piece = c;
        else piece = transliterate(c);

        if (!piece.isEmpty()) {
            if (pendingDash && !out.isEmpty()) out += '-';
            pendingDash = false;
            out += piece;
        } else if (isSeparator(c)) {
            pendingDash = true;
        }
    }
    return out;
}

QString Renamer::stripDuplicateMarkers(const QString& text)
{
    QString result = text;
    while (true) {
        const QRegularExpressionMatch m = duplicateMarkerPattern().match(result);
        if (!m.hasMatch() || m.capturedStart() == 0) break;
        result.truncate(m.capturedStart());
    }
    return result;
}

QString Renamer::cleanName(const QString& fileName)
{
    QString stem, ext;
    splitName(fileName, stem, ext);
    // Markers are recognised on the stem as written, "(1)" before it becomes "-1".
    // The slug is checked again for markers that only line up after slugging.
    const QString slug = stripDuplicateMarkers(slugify(stripDuplicateMarkers(stem)));
    if (slug.isEmpty()) return fileName;
    return ext.isEmpty() ? slug : slug + '.' + ext;
}

QString Renamer::datePrefixName(const QString& fileName, const QDateTime& modified)
{
    const QDateTime when = modified.isValid() ? modified.toLocalTime() : QDateTime::currentDateTime();
    return when.toString("yyyy-MM-dd") + '-' + fileName;
}

QString Renamer::rename(const FileEntry& entry, RenameMode mode)
{
    const QString name = entry.fileName();
    switch (mode) {
        case RenameMode::Clean: return cleanName(name);
        case RenameMode::DatePrefix: return datePrefixName(name, entry.modified);
        case RenameMode::Skip: return name;
    }
    return name;
}
