#include "organizer_config.h"
#include <QSettings>
#include <QStandardPaths>
#include <QFileInfo>
#include <QDir>
#include <QDebug>

namespace {

Category makeCategory(const QString& name, const QStringList& exts)
{
    Category c;
    c.name = name;
    c.extensions = exts;
    return c;
}

QStringList normalizeExtensions(const QStringList& raw)
{
    QStringList out;
    for (QString e : raw) {
        e = e.trimmed().toLower();
        while (e.startsWith('.')) e.remove(0, 1);
        if (!e.isEmpty() && !out.contains(e)) out.append(e);
    }
    return out;
}

QString renameModeKey(RenameMode mode)
{
    switch (mode) {
        case RenameMode::Clean: return "clean";
        case RenameMode::DatePrefix: return "date-prefix";
        case RenameMode::Skip: return "skip";
    }
    return "clean";
}

} // namespace

QVector<Category> OrganizerConfig::defaultCategories()
{
    return {
        makeCategory("Images", {"jpg","jpeg","png","gif","bmp","tif","tiff","webp","heic","heif",
                                "svg","ico","avif","psd","raw","cr2","cr3","nef","arw","dng"}),
        makeCategory("Videos", {"mp4","mov","avi","mkv","wmv","m4v","mpg","mpeg","webm","flv","3gp"}),
        makeCategory("Audio", {"mp3","wav","aac","flac","ogg","m4a","wma","opus","aiff"}),
        makeCategory("Documents", {"pdf","doc","docx","odt","rtf","txt","md","tex","pages"}),
        makeCategory("Spreadsheets", {"xls","xlsx","ods","csv","numbers"}),
        makeCategory("Presentations", {"ppt","pptx","odp","key"}),
        makeCategory("Archives", {"zip","rar","7z","tar","gz","bz2","xz","tgz","zst"}),
        makeCategory("Code", {"py","js","ts","html","css","json","xml","yaml","yml","sh",
                              "c","cpp","h","hpp","java","rs","go","rb","php","sql"}),
        makeCategory("Installers", {"exe","msi","dmg","pkg","deb","rpm","appimage","apk"}),
        makeCategory("Fonts", {"ttf","otf","woff","woff2"}),
        makeCategory("eBooks", {"epub","mobi","azw3"}),
    };
}

OrganizerConfig OrganizerConfig::defaults()
{
    OrganizerConfig config;
    config.categories = defaultCategories();
    return config;
}

bool parseOrganizationMode(const QString& text, OrganizationMode& out)
{
    const QString s = text.trimmed().toLower();
    if (s == "category" || s == "cat" || s == "c") { out = OrganizationMode::Category; return true; }
    if (s == "date" || s == "d") { out = OrganizationMode::Date; return true; }
    if (s == "hybrid" || s == "h") { out = OrganizationMode::Hybrid; return true; }
    return false;
}

bool parseRenameMode(const QString& text, RenameMode& out)
{
    const QString s = text.trimmed().toLower();
    if (s == "clean" || s == "c") { out = RenameMode::Clean; return true; }
    if (s == "date-prefix" || s == "date" || s == "d") { out = RenameMode::DatePrefix; return true; }
    if (s == "skip" || s == "none" || s == "s") { out = RenameMode::Skip; return true; }
    return false;
}

ConfigStore::ConfigStore(const QString& iniPath)
    : m_path(iniPath)
{
}

bool ConfigStore::load(OrganizerConfig& out, QString* errorOut) const
{
    out = OrganizerConfig::defaults();
    if (!QFileInfo::exists(m_path)) {
        qDebug() << "[Config] No config file at" << m_path << "- using defaults";
        return true;
    }

    QSettings s(m_path, QSettings::IniFormat);
    if (s.status() != QSettings::NoError) {
        if (errorOut) *errorOut = QString("Cannot parse config file %1").arg(m_path);
        qWarning() << "[Config] Failed to read" << m_path << "status" << s.status();
        return false;
    }

    s.beginGroup("Preferences");
    const QString org = s.value("OrganizationMode").toString();
    if (!org.isEmpty() && !parseOrganizationMode(org, out.organizationMode)) {
        qWarning() << "[Config] Unknown OrganizationMode" << org << "- keeping" << organizationModeName(out.organizationMode);
    }
    const QString ren = s.value("RenameMode").toString();
    if (!ren.isEmpty() && !parseRenameMode(ren, out.renameMode)) {
        qWarning() << "[Config] Unknown RenameMode" << ren << "- keeping" << renameModeName(out.renameMode);
    }
    out.recursive = s.value("Recursive", false).toBool();
    s.endGroup();

    const int count = s.beginReadArray("Categories");
    if (count > 0) {
        QVector<Category> categories;
        for (int i = 0; i < count; ++i) {
            s.setArrayIndex(i);
            Category c;
            c.name = s.value("Name").toString().trimmed();
            c.extensions = normalizeExtensions(s.value("Extensions").toStringList());
            if (c.name.isEmpty()) {
                qWarning() << "[Config] Ignoring unnamed category at index" << i;
                continue;
            }
            categories.append(c);
        }
        out.categories = categories;
    }
    s.endArray();

    out.protectedPaths = s.value("Protected/Paths").toStringList();

    qInfo() << "[Config] Loaded" << m_path << "categories:" << out.categories.size()
            << "mode:" << organizationModeName(out.organizationMode)
            << "rename:" << renameModeName(out.renameMode);
    return true;
}

bool ConfigStore::save(const OrganizerConfig& config, QString* errorOut) const
{
    const QString dir = QFileInfo(m_path).absolutePath();
    if (!QDir().mkpath(dir)) {
        if (errorOut) *errorOut = QString("Cannot create config directory %1").arg(dir);
        return false;
    }

    QSettings s(m_path, QSettings::IniFormat);
    s.clear();

    s.beginGroup("Preferences");
    s.setValue("OrganizationMode", organizationModeName(config.organizationMode).toLower());
    s.setValue("RenameMode", renameModeKey(config.renameMode));
    s.setValue("Recursive", config.recursive);
    s.endGroup();

    s.beginWriteArray("Categories", config.categories.size());
    for (int i = 0; i < config.categories.size(); ++i) {
        s.setArrayIndex(i);
        s.setValue("Name", config.categories[i].name);
        s.setValue("Extensions", config.categories[i].extensions);
    }
    s.endArray();

    s.setValue("Protected/Paths", config.protectedPaths);
    s.sync();

    if (s.status() != QSettings::NoError) {
        if (errorOut) *errorOut = QString("Failed to write config file %1").arg(m_path);
        qWarning() << "[Config] Failed to write" << m_path;
        return false;
    }
    return true;
}

QString ConfigStore::defaultConfigPath()
{
    return QDir(stateDirectory()).filePath("foldertidy.ini");
}

QString ConfigStore::stateDirectory()
{
    const QString overridden = qEnvironmentVariable("FOLDERTIDY_STATE_DIR");
    if (!overridden.isEmpty()) return QDir::cleanPath(overridden);
    return QDir(QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation)).filePath("foldertidy");
}
