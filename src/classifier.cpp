#include "classifier.h"
#include <QRegularExpression>

namespace {

const char* const kMonths[] = {
    "january", "february", "march", "april", "may", "june",
    "july", "august", "september", "october", "november", "december"
};

QDateTime effectiveTime(const FileEntry& entry)
{
    return entry.modified.isValid() ? entry.modified.toLocalTime() : QDateTime::currentDateTime();
}

} // namespace

Classifier::Classifier(const QVector<Category>& categories)
    : m_categories(categories)
{
    // First category listing an extension owns it.
    for (const Category& c : m_categories) {
        for (const QString& ext : c.extensions) {
            const QString key = ext.toLower();
            if (!m_extensionToCategory.contains(key)) m_extensionToCategory.insert(key, c.name);
        }
    }
}

QString Classifier::fallbackCategory()
{
    return QStringLiteral("Others");
}

QString Classifier::monthFolderName(int month)
{
    if (month < 1 || month > 12) return QString();
    return QString("%1-%2").arg(month, 2, 10, QLatin1Char('0')).arg(QLatin1String(kMonths[month - 1]));
}

QString Classifier::dateFolder(const QDateTime& modified)
{
    const QDate d = modified.date();
    return QString("%1/%2").arg(d.year(), 4, 10, QLatin1Char('0')).arg(monthFolderName(d.month()));
}

QString Classifier::categoryFor(const QString& extension) const
{
    return m_extensionToCategory.value(extension.toLower(), fallbackCategory());
}

QString Classifier::classify(const FileEntry& entry, OrganizationMode mode) const
{
    switch (mode) {
        case OrganizationMode::Category:
            return categoryFor(entry.extension);
        case OrganizationMode::Date:
            return dateFolder(effectiveTime(entry));
        case OrganizationMode::Hybrid:
            return QString("%1/%2").arg(categoryFor(entry.extension))
                                   .arg(effectiveTime(entry).date().year(), 4, 10, QLatin1Char('0'));
    }
    return fallbackCategory();
}

bool Classifier::isOutputFolderName(const QString& name) const
{
    if (name.compare(fallbackCategory(), Qt::CaseInsensitive) == 0) return true;
    for (const Category& c : m_categories) {
        if (name.compare(c.name, Qt::CaseInsensitive) == 0) return true;
    }
    static const QRegularExpression yearPattern(R"(^\d{4}$)");
    return yearPattern.match(name).hasMatch();
}
