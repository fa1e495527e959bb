#include "path_guard.h"
#include "file_utils.h"
#include <QDir>
#include <QFileInfo>
#include <QDebug>

namespace {

QString describeVerdict(PathGuard::Verdict v, const QString& path, const QString& matched)
{
    switch (v) {
        case PathGuard::Verdict::Allowed:
            return QString();
        case PathGuard::Verdict::ProtectedPath:
            if (FileUtils::samePath(path, matched))
                return QString("%1 is a protected system or security location").arg(path);
            return QString("%1 contains the protected location %2").arg(path, matched);
        case PathGuard::Verdict::ProjectFolder:
            return QString("%1 is a software project folder (contains %2)").arg(path, matched);
        case PathGuard::Verdict::DependencyFolder:
            return QString("%1 is a dependency or build folder (%2)").arg(path, matched);
    }
    return QString();
}

} // namespace

PathGuard::PathGuard()
{
    for (const QString& p : defaultProtectedPaths()) addProtected(p);
}

PathGuard::PathGuard(const QStringList& extraProtectedPaths)
    : PathGuard()
{
    for (const QString& p : extraProtectedPaths) addProtected(p);
}

void PathGuard::addProtected(const QString& path)
{
    if (path.trimmed().isEmpty()) return;
    QString expanded = path.trimmed();
    if (expanded.startsWith('~')) expanded.replace(0, 1, QDir::homePath());
    const QString clean = FileUtils::cleanAbsolutePath(expanded);
    if (!m_protected.contains(clean, FileUtils::pathCaseSensitivity())) m_protected.append(clean);
}

QStringList PathGuard::defaultProtectedPaths()
{
    QStringList paths;
    paths << QDir::rootPath();
#ifdef Q_OS_WIN
    paths << "C:/Windows" << "C:/Program Files" << "C:/Program Files (x86)" << "C:/ProgramData";
#else
    paths << "/bin" << "/boot" << "/dev" << "/etc" << "/lib" << "/lib32" << "/lib64"
          << "/opt" << "/proc" << "/root" << "/run" << "/sbin" << "/srv" << "/sys"
          << "/usr" << "/var" << "/snap";
#endif
#ifdef Q_OS_MACOS
    paths << "/System" << "/Library" << "/Applications" << "/private" << "/Volumes";
#endif
    const QString home = QDir::homePath();
    paths << home + "/.ssh" << home + "/.gnupg" << home + "/.password-store"
          << home + "/.aws" << home + "/.kube" << home + "/.config"
          << home + "/.local";
#ifdef Q_OS_MACOS
    paths << home + "/Library";
#endif
#ifdef Q_OS_WIN
    paths << home + "/AppData";
#endif
    return paths;
}

const QStringList& PathGuard::projectMarkers()
{
    static const QStringList markers = {
        ".git", ".svn", ".hg",
        "package.json", "yarn.lock", "pnpm-lock.yaml",
        "Cargo.toml", "Cargo.lock",
        "pyproject.toml", "setup.py", "requirements.txt", "Pipfile",
        "Gemfile", "go.mod", "pom.xml", "build.gradle", "composer.json",
        "Dockerfile", "CMakeLists.txt"
    };
    return markers;
}

const QStringList& PathGuard::dependencyFolderNames()
{
    static const QStringList names = {
        "node_modules", "target", "build", "dist", "venv", "__pycache__",
        ".cargo", ".next", ".nuxt", "vendor", "bin", "obj"
    };
    return names;
}

bool PathGuard::isProjectFolder(const QString& dirPath, QString* markerOut)
{
    const QDir dir(dirPath);
    for (const QString& marker : projectMarkers()) {
        if (FileUtils::pathOccupied(dir.filePath(marker))) {
            if (markerOut) *markerOut = marker;
            return true;
        }
    }
    return false;
}

PathGuard::Result PathGuard::check(const QString& path) const
{
    Result r;
    const QString clean = FileUtils::cleanAbsolutePath(path);
    // Compare both the literal and the resolved form so a symlink cannot
    // smuggle a protected directory past the guard.
    QStringList forms{clean};
    const QString canonical = FileUtils::canonicalOrClean(path);
    if (canonical.compare(clean, FileUtils::pathCaseSensitivity()) != 0) forms << canonical;

    for (const QString& form : forms) {
        for (const QString& prot : m_protected) {
            // Exact match or the candidate is an ancestor of a protected path.
            if (FileUtils::isSameOrInside(form, prot)) {
                r.verdict = Verdict::ProtectedPath;
                r.matched = prot;
                r.reason = describeVerdict(r.verdict, clean, prot);
                return r;
            }
        }
    }

    QString marker;
    if (isProjectFolder(clean, &marker)) {
        r.verdict = Verdict::ProjectFolder;
        r.matched = marker;
        r.reason = describeVerdict(r.verdict, clean, marker);
    }
    return r;
}

PathGuard::Result PathGuard::checkDescendant(const QString& dirPath) const
{
    const QString name = QFileInfo(dirPath).fileName();
    for (const QString& dep : dependencyFolderNames()) {
        if (name.compare(dep, Qt::CaseInsensitive) == 0) {
            Result r;
            r.verdict = Verdict::DependencyFolder;
            r.matched = dep;
            r.reason = describeVerdict(r.verdict, FileUtils::cleanAbsolutePath(dirPath), dep);
            return r;
        }
    }
    return check(dirPath);
}
