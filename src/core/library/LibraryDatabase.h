#pragma once

#include <QObject>
#include <QSqlDatabase>
#include <QString>
#include <QVector>
#include <QMutex>
#include <optional>

#include "../MusicData.h"
#include "DatabaseContext.h"
#include "ITrackStore.h"
#include "TrackRepository.h"

// SQLite catalog (QSQLITE, WAL) with separate read and write connections.
// The reorganization engine sees it only through ITrackStore.
class LibraryDatabase : public QObject, public ITrackStore {
    Q_OBJECT

public:
    explicit LibraryDatabase(const QString& dbPath, QObject* parent = nullptr);
    ~LibraryDatabase() override;

    bool open();
    void close();
    bool isOpen() const;
    QString path() const { return m_dbPath; }

    static QString defaultPath();

    // ── ITrackStore ──────────────────────────────────────────────────
    QVector<Track> load(const TrackFilter& filter = TrackFilter()) const override;
    bool updatePath(const QString& trackId, const QString& newPath) override;
    bool markDeleted(const QString& trackId) override;
    bool restoreDeleted(const QString& trackId) override;
    bool updateContentHash(const QString& trackId, const QByteArray& hash) override;

    // ── Tracks (scanner side) ────────────────────────────────────────
    bool trackExists(const QString& filePath) const;
    bool insertTrack(const Track& track, QString* assignedId = nullptr);
    bool removeTrack(const QString& id);
    std::optional<Track> trackById(const QString& id) const;
    std::optional<Track> trackByPath(const QString& filePath) const;
    int trackCount(bool includeDeleted = false) const;
    void clearAllData();

    // ── Transaction helpers ──────────────────────────────────────────
    bool beginTransaction();
    bool commitTransaction();

signals:
    void databaseChanged();

private:
    void init();
    void createTables();
    void createIndexes();
    void migrateColumns();

    QSqlDatabase m_db;        // write connection (engine write-back, inserts)
    QSqlDatabase m_readDb;    // read connection (load, lookups)
    QString m_dbPath;
    QString m_writeName;
    QString m_readName;
    mutable QRecursiveMutex m_writeMutex;  // protects m_db (writes)
    mutable QRecursiveMutex m_readMutex;   // protects m_readDb (reads)

    // Repository delegation
    DatabaseContext m_ctx;
    TrackRepository* m_trackRepo = nullptr;
};
