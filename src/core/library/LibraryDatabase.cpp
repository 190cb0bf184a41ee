#include "LibraryDatabase.h"

#include <QSqlQuery>
#include <QSqlRecord>
#include <QSqlError>
#include <QStandardPaths>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QDebug>
#include <QUuid>
#include <QDateTime>
#include <QStringList>

QString LibraryDatabase::defaultPath()
{
    QString dataDir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    return dataDir + QStringLiteral("/library.db");
}

LibraryDatabase::LibraryDatabase(const QString& dbPath, QObject* parent)
    : QObject(parent)
    , m_dbPath(dbPath)
{
    init();
}

void LibraryDatabase::init()
{
    // Connection names are per instance so tests can hold several catalogs
    const QString tag = QUuid::createUuid().toString(QUuid::Id128);
    m_writeName = QStringLiteral("library_write_") + tag;
    m_readName = QStringLiteral("library_read_") + tag;

    // Initialize DatabaseContext: points to our owned DB connections & mutexes
    m_ctx.writeDb = &m_db;
    m_ctx.readDb = &m_readDb;
    m_ctx.writeMutex = &m_writeMutex;
    m_ctx.readMutex = &m_readMutex;

    m_trackRepo = new TrackRepository(&m_ctx);
}

LibraryDatabase::~LibraryDatabase()
{
    close();
    delete m_trackRepo;
}

// ── open / close ────────────────────────────────────────────────────
bool LibraryDatabase::open()
{
    QMutexLocker lock(&m_writeMutex);
    if (m_db.isOpen()) return true;

    QDir().mkpath(QFileInfo(m_dbPath).absolutePath());

    // Write connection
    m_db = QSqlDatabase::addDatabase(QStringLiteral("QSQLITE"), m_writeName);
    m_db.setDatabaseName(m_dbPath);

    if (!m_db.open()) {
        qWarning() << "[LibraryDB] Failed to open write connection:" << m_db.lastError().text();
        return false;
    }

    QSqlQuery pragma(m_db);
    if (pragma.exec(QStringLiteral("PRAGMA journal_mode=WAL")) && pragma.next()) {
        QString mode = pragma.value(0).toString().toLower();
        if (mode != QStringLiteral("wal"))
            qWarning() << "[LibraryDB] WAL mode not activated, got:" << mode;
    }
    pragma.exec(QStringLiteral("PRAGMA synchronous=NORMAL"));
    pragma.exec(QStringLiteral("PRAGMA temp_store=MEMORY"));

    // Integrity check: detect corruption early
    {
        QSqlQuery check(m_db);
        if (check.exec(QStringLiteral("PRAGMA quick_check")) && check.next()) {
            QString result = check.value(0).toString();
            if (result != QStringLiteral("ok")) {
                // Unlike a scan cache, the catalog holds the only record of
                // where files were moved, so refuse to continue
                qCritical() << "[LibraryDB] Integrity check FAILED:" << result;
                m_db.close();
                return false;
            }
        }
    }

    createTables();
    migrateColumns();
    createIndexes();

    // Read connection: separate from writer for WAL concurrency
    {
        QMutexLocker readLock(&m_readMutex);
        m_readDb = QSqlDatabase::addDatabase(QStringLiteral("QSQLITE"), m_readName);
        m_readDb.setDatabaseName(m_dbPath);
        if (!m_readDb.open()) {
            qWarning() << "[LibraryDB] Failed to open read connection:" << m_readDb.lastError().text();
            return false;
        }
        QSqlQuery readPragma(m_readDb);
        readPragma.exec(QStringLiteral("PRAGMA journal_mode=WAL"));
        readPragma.exec(QStringLiteral("PRAGMA query_only=ON"));
    }

    qDebug() << "[LibraryDB] Opened at" << m_dbPath;
    return true;
}

void LibraryDatabase::close()
{
    bool readWasOpen = false, writeWasOpen = false;
    {
        QMutexLocker lock(&m_readMutex);
        if (m_readDb.isOpen()) {
            m_readDb.close();
            readWasOpen = true;
        }
        m_readDb = QSqlDatabase();  // drop reference before removeDatabase
    }
    {
        QMutexLocker lock(&m_writeMutex);
        if (m_db.isOpen()) {
            m_db.close();
            writeWasOpen = true;
        }
        m_db = QSqlDatabase();      // drop reference before removeDatabase
    }
    // Only remove connections that were actually opened
    if (readWasOpen)
        QSqlDatabase::removeDatabase(m_readName);
    if (writeWasOpen)
        QSqlDatabase::removeDatabase(m_writeName);
}

bool LibraryDatabase::isOpen() const
{
    QMutexLocker lock(&m_writeMutex);
    return m_db.isOpen();
}

// ── Schema ──────────────────────────────────────────────────────────
void LibraryDatabase::createTables()
{
    QSqlQuery q(m_db);

    if (!q.exec(QStringLiteral(
        "CREATE TABLE IF NOT EXISTS tracks ("
        "  id TEXT PRIMARY KEY,"
        "  file_path TEXT NOT NULL,"
        "  file_size INTEGER DEFAULT 0,"
        "  duration REAL DEFAULT 0,"
        "  format TEXT,"
        "  bitrate INTEGER DEFAULT 0,"
        "  title TEXT,"
        "  artist TEXT,"
        "  album TEXT,"
        "  genre TEXT,"
        "  year INTEGER,"
        "  track_number INTEGER,"
        "  deleted INTEGER DEFAULT 0,"
        "  added_at TEXT DEFAULT (datetime('now'))"
        ")"
    ))) {
        qWarning() << "[LibraryDB] CREATE TABLE tracks failed:" << q.lastError().text();
    }
}

void LibraryDatabase::migrateColumns()
{
    QSqlQuery pragma(m_db);
    pragma.exec(QStringLiteral("PRAGMA table_info(tracks)"));
    QStringList existingColumns;
    while (pragma.next()) {
        existingColumns.append(pragma.value(1).toString());
    }

    auto addColumnIfMissing = [&](const QString& colName, const QString& type) {
        if (!existingColumns.contains(colName)) {
            QSqlQuery alter(m_db);
            if (alter.exec(QStringLiteral("ALTER TABLE tracks ADD COLUMN %1 %2").arg(colName, type)))
                qDebug() << "[LibraryDB] Added column" << colName;
            else
                qWarning() << "[LibraryDB] Could not add column" << colName << alter.lastError().text();
        }
    };

    // Columns that arrived after the first schema
    addColumnIfMissing(QStringLiteral("album_artist"), QStringLiteral("TEXT"));
    addColumnIfMissing(QStringLiteral("release_id"), QStringLiteral("TEXT"));
    addColumnIfMissing(QStringLiteral("content_hash"), QStringLiteral("TEXT"));
}

void LibraryDatabase::createIndexes()
{
    QSqlQuery q(m_db);
    // Paths are unique among active rows; a trashed record may share its
    // old path with a newer file
    q.exec(QStringLiteral("CREATE UNIQUE INDEX IF NOT EXISTS idx_tracks_active_path "
                          "ON tracks(file_path) WHERE deleted = 0"));
    q.exec(QStringLiteral("CREATE INDEX IF NOT EXISTS idx_tracks_size ON tracks(file_size)"));
    q.exec(QStringLiteral("CREATE INDEX IF NOT EXISTS idx_tracks_album ON tracks(album)"));
}

// ── ITrackStore ─────────────────────────────────────────────────────
QVector<Track> LibraryDatabase::load(const TrackFilter& filter) const
{
    return m_trackRepo->tracks(filter);
}

bool LibraryDatabase::updatePath(const QString& trackId, const QString& newPath)
{
    bool ok = m_trackRepo->updatePath(trackId, newPath);
    if (ok) emit databaseChanged();
    return ok;
}

bool LibraryDatabase::markDeleted(const QString& trackId)
{
    bool ok = m_trackRepo->setDeleted(trackId, true);
    if (ok) emit databaseChanged();
    return ok;
}

bool LibraryDatabase::restoreDeleted(const QString& trackId)
{
    bool ok = m_trackRepo->setDeleted(trackId, false);
    if (ok) emit databaseChanged();
    return ok;
}

bool LibraryDatabase::updateContentHash(const QString& trackId, const QByteArray& hash)
{
    return m_trackRepo->updateContentHash(trackId, hash);
}

// ── Tracks ──────────────────────────────────────────────────────────
bool LibraryDatabase::trackExists(const QString& filePath) const { return m_trackRepo->trackExists(filePath); }
bool LibraryDatabase::removeTrack(const QString& id) { return m_trackRepo->removeTrack(id); }
std::optional<Track> LibraryDatabase::trackById(const QString& id) const { return m_trackRepo->trackById(id); }
std::optional<Track> LibraryDatabase::trackByPath(const QString& filePath) const { return m_trackRepo->trackByPath(filePath); }
int LibraryDatabase::trackCount(bool includeDeleted) const { return m_trackRepo->trackCount(includeDeleted); }

bool LibraryDatabase::insertTrack(const Track& track, QString* assignedId)
{
    bool ok = m_trackRepo->insertTrack(track, assignedId);
    if (ok) emit databaseChanged();
    return ok;
}

void LibraryDatabase::clearAllData()
{
    QMutexLocker lock(&m_writeMutex);
    QSqlQuery q(m_db);
    if (!q.exec(QStringLiteral("DELETE FROM tracks")))
        qWarning() << "[LibraryDB] clearAllData failed:" << q.lastError().text();
    emit databaseChanged();
}

// ── Transaction helpers ──────────────────────────────────────────────
bool LibraryDatabase::beginTransaction() { QMutexLocker lock(&m_writeMutex); return m_db.transaction(); }
bool LibraryDatabase::commitTransaction() { QMutexLocker lock(&m_writeMutex); return m_db.commit(); }
