#pragma once

#include <QObject>
#include <QSettings>
#include <QStringList>

class Settings : public QObject {
    Q_OBJECT

public:
    static Settings* instance();
    // Standalone settings file (tests, --config)
    explicit Settings(const QString& iniPath, QObject* parent = nullptr);

    // ── Templates ───────────────────────────────────────────────────
    // Built-ins: "default", "artist-album", "release". A name that is not
    // configured is returned as the pattern itself.
    QString templatePattern(const QString& name) const;
    bool hasTemplate(const QString& name) const;   // configured or built-in
    void setTemplatePattern(const QString& name, const QString& pattern);
    QStringList templateNames() const;

    static QString builtinTemplate(const QString& name);
    static QString tagFallbackTemplate();

    // ── Organizer ───────────────────────────────────────────────────
    QString activeTemplate() const;
    void setActiveTemplate(const QString& name);

    QString destinationRoot() const;
    void setDestinationRoot(const QString& path);

    // "simulate" (default), "move", "copy" or "link"
    QString organizeMode() const;
    void setOrganizeMode(const QString& mode);

    bool requireYear() const;
    void setRequireYear(bool enabled);

    // "tags" (default) or "release"
    QString albumMode() const;
    void setAlbumMode(const QString& mode);

    bool fallbackToTags() const;
    void setFallbackToTags(bool enabled);

    int maxDisambiguation() const;
    void setMaxDisambiguation(int n);

    // ── Sanitization rules ──────────────────────────────────────────
    bool stripNames() const;
    void setStripNames(bool enabled);

    bool stripPromoParens() const;
    void setStripPromoParens(bool enabled);

    bool sanitizeForbidden() const;
    void setSanitizeForbidden(bool enabled);

    bool fallbackToAlbumArtist() const;
    void setFallbackToAlbumArtist(bool enabled);

    bool compilationDetection() const;
    void setCompilationDetection(bool enabled);

    QString compilationPattern() const;
    void setCompilationPattern(const QString& pattern);

    QString substitute() const;
    void setSubstitute(const QString& s);

    int maxSegmentLength() const;
    void setMaxSegmentLength(int length);

    // ── Duplicates ──────────────────────────────────────────────────
    bool useContentHash() const;
    void setUseContentHash(bool enabled);

    qint64 hashSampleSize() const;
    void setHashSampleSize(qint64 bytes);

    double durationTolerance() const;
    void setDurationTolerance(double seconds);

    // "skip" (default), "quarantine" or "delete"
    QString duplicatePolicy() const;
    void setDuplicatePolicy(const QString& policy);

    QString quarantineDir() const;
    void setQuarantineDir(const QString& path);

    QString trashDir() const;
    void setTrashDir(const QString& path);

    // ── Undo / IO ───────────────────────────────────────────────────
    QString undoLogPath() const;
    void setUndoLogPath(const QString& path);

    int maxRetries() const;
    void setMaxRetries(int n);

    int retryDelayMs() const;
    void setRetryDelayMs(int ms);

    QString dataDirectory() const;
    QString fileName() const { return m_settings.fileName(); }
    void sync() { m_settings.sync(); }

    static QString settingsPath();

signals:
    void templatesChanged();
    void destinationRootChanged(const QString& path);

private:
    Settings();
    QSettings m_settings;
};
