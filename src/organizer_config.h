#pragma once
#include <QString>
#include <QStringList>
#include <QVector>
#include "organizer_types.h"

struct OrganizerConfig {
    QVector<Category> categories;   // ordered, first match wins
    OrganizationMode organizationMode = OrganizationMode::Category;
    RenameMode renameMode = RenameMode::Clean;
    bool recursive = false;
    bool dryRun = false;
    QStringList protectedPaths;     // in addition to the built-in list

    static OrganizerConfig defaults();
    static QVector<Category> defaultCategories();
};

// Accepts full names and short aliases, case-insensitive. Returns false and
// leaves `out` untouched for anything else.
bool parseOrganizationMode(const QString& text, OrganizationMode& out);
bool parseRenameMode(const QString& text, RenameMode& out);

/**
 * @brief Loads and saves OrganizerConfig as an INI file through QSettings.
 *
 * Layout:
 *   [Preferences] OrganizationMode, RenameMode, Recursive
 *   [Categories]  QSettings array of (Name, Extensions) entries, order preserved
 *   [Protected]   Paths
 *
 * A missing file yields OrganizerConfig::defaults(). An unparseable mode value
 * keeps the default and logs a warning.
 */
class ConfigStore {
public:
    explicit ConfigStore(const QString& iniPath);

    QString path() const { return m_path; }

    bool load(OrganizerConfig& out, QString* errorOut = nullptr) const;
    bool save(const OrganizerConfig& config, QString* errorOut = nullptr) const;

    // <state directory>/foldertidy.ini
    static QString defaultConfigPath();

    // Directory for the journal database, lock markers and the log file.
    // FOLDERTIDY_STATE_DIR overrides the platform location.
    static QString stateDirectory();

private:
    QString m_path;
};
