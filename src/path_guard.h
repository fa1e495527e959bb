#pragma once
#include <QString>
#include <QStringList>

/**
 * @brief Decides whether a directory may be organized or descended into.
 *
 * check() is the target-level rule: a path is rejected when it equals one of the
 * protected paths, when it is an ancestor of one (the filesystem root, the home
 * directory that holds ~/.ssh, ...), or when it contains a project marker file.
 *
 * checkDescendant() is the rule applied at every directory boundary of a
 * recursive scan. On top of check() it rejects well-known dependency and build
 * directories (node_modules, target, venv, ...). Rejected descendants are pruned
 * silently by the scanner.
 */
class PathGuard {
public:
    enum class Verdict { Allowed, ProtectedPath, ProjectFolder, DependencyFolder };

    struct Result {
        Verdict verdict = Verdict::Allowed;
        QString reason;    // user-facing, names the rule that matched
        QString matched;   // protected path, marker or directory name that matched

        bool allowed() const { return verdict == Verdict::Allowed; }
    };

    PathGuard();
    explicit PathGuard(const QStringList& extraProtectedPaths);

    Result check(const QString& path) const;
    Result checkDescendant(const QString& dirPath) const;

    QStringList protectedPaths() const { return m_protected; }

    static bool isProjectFolder(const QString& dirPath, QString* markerOut = nullptr);
    static const QStringList& projectMarkers();
    static const QStringList& dependencyFolderNames();
    static QStringList defaultProtectedPaths();

private:
    void addProtected(const QString& path);

    QStringList m_protected; // clean absolute paths
};
