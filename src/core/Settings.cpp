#include "Settings.h"

#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QStandardPaths>

// ── Settings file path ──────────────────────────────────────────────
QString Settings::settingsPath()
{
    QDir dir(QStandardPaths::writableLocation(QStandardPaths::AppDataLocation));
    if (!dir.exists()) dir.mkpath(QStringLiteral("."));
    return dir.filePath(QStringLiteral("settings.ini"));
}

Settings* Settings::instance()
{
    static Settings s;
    return &s;
}

// ── Constructors ────────────────────────────────────────────────────
Settings::Settings()
    : QObject(nullptr)
    , m_settings(settingsPath(), QSettings::IniFormat)
{
    qDebug() << "[Settings] INI path:" << m_settings.fileName();
}

Settings::Settings(const QString& iniPath, QObject* parent)
    : QObject(parent)
    , m_settings(iniPath, QSettings::IniFormat)
{
    qDebug() << "[Settings] INI path:" << m_settings.fileName();
}

QString Settings::dataDirectory() const
{
    return QFileInfo(m_settings.fileName()).absolutePath();
}

// ── Templates ───────────────────────────────────────────────────────
QString Settings::builtinTemplate(const QString& name)
{
    if (name == QStringLiteral("default"))
        return QStringLiteral("{Genero}/{Año}/{Artista}/{Álbum}/{TrackNo - Título}.{ext}");
    if (name == QStringLiteral("artist-album"))
        return QStringLiteral("{Artista}/{Álbum}/{TrackNo - Título}.{ext}");
    if (name == QStringLiteral("release"))
        return QStringLiteral("{AlbumArtist}/{Álbum} [{ReleaseID}]/{TrackNo - Título}.{ext}");
    return QString();
}

QString Settings::tagFallbackTemplate()
{
    return builtinTemplate(QStringLiteral("artist-album"));
}

QString Settings::templatePattern(const QString& name) const
{
    const QString key = QStringLiteral("templates/") + name;
    QString pattern = m_settings.value(key).toString();
    if (!pattern.isEmpty())
        return pattern;
    pattern = builtinTemplate(name);
    if (!pattern.isEmpty())
        return pattern;
    // Not a known name: treat it as an ad-hoc pattern
    if (!name.contains(QLatin1Char('{')))
        qWarning() << "[Settings] No template named" << name << "and it has no placeholders";
    return name;
}

bool Settings::hasTemplate(const QString& name) const
{
    return m_settings.contains(QStringLiteral("templates/") + name)
        || !builtinTemplate(name).isEmpty();
}

void Settings::setTemplatePattern(const QString& name, const QString& pattern)
{
    m_settings.setValue(QStringLiteral("templates/") + name, pattern);
    emit templatesChanged();
}

QStringList Settings::templateNames() const
{
    QStringList names = {QStringLiteral("default"), QStringLiteral("artist-album"),
                         QStringLiteral("release")};
    const QString prefix = QStringLiteral("templates/");
    for (const auto& key : m_settings.allKeys()) {
        if (!key.startsWith(prefix))
            continue;
        const QString n = key.mid(prefix.size());
        if (!names.contains(n))
            names.append(n);
    }
    return names;
}

// ── Organizer ───────────────────────────────────────────────────────
QString Settings::activeTemplate() const
{
    return m_settings.value(QStringLiteral("organizer/activeTemplate"),
                            QStringLiteral("default")).toString();
}

void Settings::setActiveTemplate(const QString& name)
{
    m_settings.setValue(QStringLiteral("organizer/activeTemplate"), name);
    emit templatesChanged();
}

QString Settings::destinationRoot() const
{
    return m_settings.value(QStringLiteral("organizer/destinationRoot")).toString();
}

void Settings::setDestinationRoot(const QString& path)
{
    m_settings.setValue(QStringLiteral("organizer/destinationRoot"), path);
    emit destinationRootChanged(path);
}

QString Settings::organizeMode() const
{
    return m_settings.value(QStringLiteral("organizer/mode"), QStringLiteral("simulate")).toString();
}

void Settings::setOrganizeMode(const QString& mode)
{
    m_settings.setValue(QStringLiteral("organizer/mode"), mode);
}

bool Settings::requireYear() const
{
    return m_settings.value(QStringLiteral("organizer/requireYear"), false).toBool();
}

void Settings::setRequireYear(bool enabled)
{
    m_settings.setValue(QStringLiteral("organizer/requireYear"), enabled);
}

QString Settings::albumMode() const
{
    return m_settings.value(QStringLiteral("organizer/albumMode"), QStringLiteral("tags")).toString();
}

void Settings::setAlbumMode(const QString& mode)
{
    m_settings.setValue(QStringLiteral("organizer/albumMode"), mode);
}

bool Settings::fallbackToTags() const
{
    return m_settings.value(QStringLiteral("organizer/fallbackToTags"), true).toBool();
}

void Settings::setFallbackToTags(bool enabled)
{
    m_settings.setValue(QStringLiteral("organizer/fallbackToTags"), enabled);
}

int Settings::maxDisambiguation() const
{
    int n = m_settings.value(QStringLiteral("organizer/maxDisambiguation"), 99).toInt();
    return qBound(2, n, 9999);
}

void Settings::setMaxDisambiguation(int n)
{
    m_settings.setValue(QStringLiteral("organizer/maxDisambiguation"), n);
}

// ── Sanitization rules ──────────────────────────────────────────────
bool Settings::stripNames() const
{
    return m_settings.value(QStringLiteral("rules/stripNames"), true).toBool();
}

void Settings::setStripNames(bool enabled)
{
    m_settings.setValue(QStringLiteral("rules/stripNames"), enabled);
}

bool Settings::stripPromoParens() const
{
    return m_settings.value(QStringLiteral("rules/stripPromoParens"), false).toBool();
}

void Settings::setStripPromoParens(bool enabled)
{
    m_settings.setValue(QStringLiteral("rules/stripPromoParens"), enabled);
}

bool Settings::sanitizeForbidden() const
{
    return m_settings.value(QStringLiteral("rules/sanitizeForbidden"), true).toBool();
}

void Settings::setSanitizeForbidden(bool enabled)
{
    m_settings.setValue(QStringLiteral("rules/sanitizeForbidden"), enabled);
}

bool Settings::fallbackToAlbumArtist() const
{
    return m_settings.value(QStringLiteral("rules/fallbackToAlbumArtist"), true).toBool();
}

void Settings::setFallbackToAlbumArtist(bool enabled)
{
    m_settings.setValue(QStringLiteral("rules/fallbackToAlbumArtist"), enabled);
}

bool Settings::compilationDetection() const
{
    return m_settings.value(QStringLiteral("rules/compilationDetection"), true).toBool();
}

void Settings::setCompilationDetection(bool enabled)
{
    m_settings.setValue(QStringLiteral("rules/compilationDetection"), enabled);
}

QString Settings::compilationPattern() const
{
    return m_settings.value(QStringLiteral("rules/compilationPattern")).toString();
}

void Settings::setCompilationPattern(const QString& pattern)
{
    m_settings.setValue(QStringLiteral("rules/compilationPattern"), pattern);
}

QString Settings::substitute() const
{
    return m_settings.value(QStringLiteral("rules/substitute"), QStringLiteral("_")).toString();
}

void Settings::setSubstitute(const QString& s)
{
    m_settings.setValue(QStringLiteral("rules/substitute"), s);
}

int Settings::maxSegmentLength() const
{
    int len = m_settings.value(QStringLiteral("rules/maxSegmentLength"), 200).toInt();
    return qBound(16, len, 255);
}

void Settings::setMaxSegmentLength(int length)
{
    m_settings.setValue(QStringLiteral("rules/maxSegmentLength"), length);
}

// ── Duplicates ──────────────────────────────────────────────────────
bool Settings::useContentHash() const
{
    return m_settings.value(QStringLiteral("duplicates/useContentHash"), false).toBool();
}

void Settings::setUseContentHash(bool enabled)
{
    m_settings.setValue(QStringLiteral("duplicates/useContentHash"), enabled);
}

qint64 Settings::hashSampleSize() const
{
    qint64 size = m_settings.value(QStringLiteral("duplicates/sampleSize"), 64 * 1024).toLongLong();
    return size > 0 ? size : 64 * 1024;
}

void Settings::setHashSampleSize(qint64 bytes)
{
    m_settings.setValue(QStringLiteral("duplicates/sampleSize"), bytes);
}

double Settings::durationTolerance() const
{
    double tol = m_settings.value(QStringLiteral("duplicates/durationTolerance"), 1.0).toDouble();
    return tol >= 0.0 ? tol : 1.0;
}

void Settings::setDurationTolerance(double seconds)
{
    m_settings.setValue(QStringLiteral("duplicates/durationTolerance"), seconds);
}

QString Settings::duplicatePolicy() const
{
    return m_settings.value(QStringLiteral("duplicates/policy"), QStringLiteral("skip")).toString();
}

void Settings::setDuplicatePolicy(const QString& policy)
{
    m_settings.setValue(QStringLiteral("duplicates/policy"), policy);
}

QString Settings::quarantineDir() const
{
    return m_settings.value(QStringLiteral("duplicates/quarantineDir"),
                            dataDirectory() + QStringLiteral("/quarantine")).toString();
}

void Settings::setQuarantineDir(const QString& path)
{
    m_settings.setValue(QStringLiteral("duplicates/quarantineDir"), path);
}

QString Settings::trashDir() const
{
    return m_settings.value(QStringLiteral("duplicates/trashDir"),
                            dataDirectory() + QStringLiteral("/trash")).toString();
}

void Settings::setTrashDir(const QString& path)
{
    m_settings.setValue(QStringLiteral("duplicates/trashDir"), path);
}

// ── Undo / IO ───────────────────────────────────────────────────────
QString Settings::undoLogPath() const
{
    return m_settings.value(QStringLiteral("undo/logPath"),
                            dataDirectory() + QStringLiteral("/undo.jsonl")).toString();
}

void Settings::setUndoLogPath(const QString& path)
{
    m_settings.setValue(QStringLiteral("undo/logPath"), path);
}

int Settings::maxRetries() const
{
    return qBound(0, m_settings.value(QStringLiteral("io/maxRetries"), 3).toInt(), 10);
}

void Settings::setMaxRetries(int n)
{
    m_settings.setValue(QStringLiteral("io/maxRetries"), n);
}

int Settings::retryDelayMs() const
{
    return qBound(0, m_settings.value(QStringLiteral("io/retryDelayMs"), 50).toInt(), 5000);
}

void Settings::setRetryDelayMs(int ms)
{
    m_settings.setValue(QStringLiteral("io/retryDelayMs"), ms);
}
