#pragma once
#include <QString>
#include <QStringList>
#include <QVector>
#include <QHash>
#include <QDateTime>
#include "organizer_types.h"

// Maps a file entry to its destination directory, relative to the target root.
// Pure function of the entry and the category table.
class Classifier {
public:
    explicit Classifier(const QVector<Category>& categories);

    // Category: "Images"       Date: "2024/01-january"       Hybrid: "Images/2024"
    QString classify(const FileEntry& entry, OrganizationMode mode) const;

    // Case-insensitive extension lookup, fallbackCategory() on a miss.
    QString categoryFor(const QString& extension) const;

    // Directory names this classifier produces at the top of the target root.
    // Used by the scanner so an organized tree is not organized again.
    bool isOutputFolderName(const QString& name) const;

    static QString fallbackCategory();
    static QString dateFolder(const QDateTime& modified);
    // 1 -> "01-january". Fixed English table, independent of the locale.
    static QString monthFolderName(int month);

private:
    QVector<Category> m_categories;
    QHash<QString, QString> m_extensionToCategory;
};
