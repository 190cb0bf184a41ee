#include "TrackRepository.h"
#include "DatabaseContext.h"

#include <QSqlQuery>
#include <QSqlError>
#include <QDebug>
#include <QElapsedTimer>
#include <QMutexLocker>

static QVariant nullable(const std::optional<int>& v)
{
    return v ? QVariant(*v) : QVariant();
}

static QVariant nullableText(const QString& s)
{
    return s.isEmpty() ? QVariant() : QVariant(s);
}

// ── Constructor ──────────────────────────────────────────────────────
TrackRepository::TrackRepository(DatabaseContext* ctx)
    : m_ctx(ctx)
{
}

// ── Existence ────────────────────────────────────────────────────────
bool TrackRepository::trackExists(const QString& filePath) const
{
    QMutexLocker lock(m_ctx->readMutex);
    QSqlQuery q(*m_ctx->readDb);
    q.prepare(QStringLiteral("SELECT COUNT(*) FROM tracks WHERE file_path = ? AND deleted = 0"));
    q.addBindValue(filePath);
    if (q.exec() && q.next()) {
        return q.value(0).toInt() > 0;
    }
    return false;
}

// ── CRUD ─────────────────────────────────────────────────────────────
bool TrackRepository::insertTrack(const Track& track, QString* assignedId)
{
    QMutexLocker lock(m_ctx->writeMutex);

    QSqlQuery q(*m_ctx->writeDb);
    if (!q.prepare(QStringLiteral(
        "INSERT INTO tracks "
        "(id, file_path, file_size, duration, format, bitrate, "
        "title, artist, album_artist, album, genre, year, track_number, release_id, "
        "content_hash, deleted) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)"
    ))) {
        qWarning() << "[TrackRepository] insertTrack PREPARE failed:" << q.lastError().text();
        return false;
    }

    const QString id = track.id.isEmpty() ? m_ctx->generateId() : track.id;
    q.addBindValue(id);
    q.addBindValue(track.filePath);
    q.addBindValue(track.fileSize);
    q.addBindValue(track.duration);
    q.addBindValue(audioFormatToString(track.format));
    q.addBindValue(track.bitrate);
    q.addBindValue(track.title);
    q.addBindValue(nullableText(track.artist));
    q.addBindValue(nullableText(track.albumArtist));
    q.addBindValue(nullableText(track.album));
    q.addBindValue(nullableText(track.genre));
    q.addBindValue(nullable(track.year));
    q.addBindValue(nullable(track.trackNumber));
    q.addBindValue(nullableText(track.releaseId));
    q.addBindValue(track.contentHash ? QVariant(*track.contentHash) : QVariant());
    q.addBindValue(track.deleted ? 1 : 0);

    if (!q.exec()) {
        qWarning() << "[TrackRepository] insertTrack failed for" << track.filePath
                   << q.lastError().text();
        return false;
    }
    if (assignedId)
        *assignedId = id;
    return true;
}

bool TrackRepository::removeTrack(const QString& id)
{
    QMutexLocker lock(m_ctx->writeMutex);
    QSqlQuery q(*m_ctx->writeDb);
    q.prepare(QStringLiteral("DELETE FROM tracks WHERE id = ?"));
    q.addBindValue(id);
    return q.exec() && q.numRowsAffected() > 0;
}

// ── Engine write-back ────────────────────────────────────────────────
bool TrackRepository::updatePath(const QString& trackId, const QString& newPath)
{
    QMutexLocker lock(m_ctx->writeMutex);

    // Active paths are unique; check first for a readable log line rather
    // than relying on the constraint error alone
    QSqlQuery check(*m_ctx->writeDb);
    check.prepare(QStringLiteral(
        "SELECT id FROM tracks WHERE file_path = ? AND deleted = 0 AND id <> ?"));
    check.addBindValue(newPath);
    check.addBindValue(trackId);
    if (check.exec() && check.next()) {
        qWarning() << "[TrackRepository] updatePath:" << newPath << "already belongs to"
                   << check.value(0).toString();
        return false;
    }

    QSqlQuery q(*m_ctx->writeDb);
    q.prepare(QStringLiteral("UPDATE tracks SET file_path = ? WHERE id = ?"));
    q.addBindValue(newPath);
    q.addBindValue(trackId);
    if (!q.exec()) {
        qWarning() << "[TrackRepository] updatePath failed:" << q.lastError().text();
        return false;
    }
    return q.numRowsAffected() > 0;
}

bool TrackRepository::setDeleted(const QString& trackId, bool deleted)
{
    QMutexLocker lock(m_ctx->writeMutex);

    if (!deleted) {
        // Coming back must not shadow another active row at the same path
        QSqlQuery check(*m_ctx->writeDb);
        check.prepare(QStringLiteral(
            "SELECT other.id FROM tracks self JOIN tracks other "
            "ON other.file_path = self.file_path AND other.id <> self.id AND other.deleted = 0 "
            "WHERE self.id = ?"));
        check.addBindValue(trackId);
        if (check.exec() && check.next()) {
            qWarning() << "[TrackRepository] restore of" << trackId << "blocked by"
                       << check.value(0).toString();
            return false;
        }
    }

    QSqlQuery q(*m_ctx->writeDb);
    q.prepare(QStringLiteral("UPDATE tracks SET deleted = ? WHERE id = ?"));
    q.addBindValue(deleted ? 1 : 0);
    q.addBindValue(trackId);
    if (!q.exec()) {
        qWarning() << "[TrackRepository] setDeleted failed:" << q.lastError().text();
        return false;
    }
    return q.numRowsAffected() > 0;
}

bool TrackRepository::updateContentHash(const QString& trackId, const QByteArray& hash)
{
    QMutexLocker lock(m_ctx->writeMutex);
    QSqlQuery q(*m_ctx->writeDb);
    q.prepare(QStringLiteral("UPDATE tracks SET content_hash = ? WHERE id = ?"));
    q.addBindValue(hash);
    q.addBindValue(trackId);
    if (!q.exec()) {
        qWarning() << "[TrackRepository] updateContentHash failed:" << q.lastError().text();
        return false;
    }
    return q.numRowsAffected() > 0;
}

// ── Queries ──────────────────────────────────────────────────────────
std::optional<Track> TrackRepository::trackById(const QString& id) const
{
    QMutexLocker lock(m_ctx->readMutex);
    QSqlQuery q(*m_ctx->readDb);
    q.prepare(QStringLiteral("SELECT * FROM tracks WHERE id = ?"));
    q.addBindValue(id);
    if (q.exec() && q.next())
        return m_ctx->trackFromQuery(q);
    return std::nullopt;
}

std::optional<Track> TrackRepository::trackByPath(const QString& filePath) const
{
    QMutexLocker lock(m_ctx->readMutex);
    QSqlQuery q(*m_ctx->readDb);
    q.prepare(QStringLiteral("SELECT * FROM tracks WHERE file_path = ? ORDER BY deleted ASC LIMIT 1"));
    q.addBindValue(filePath);
    if (q.exec() && q.next())
        return m_ctx->trackFromQuery(q);
    return std::nullopt;
}

QVector<Track> TrackRepository::tracks(const TrackFilter& filter) const
{
    QMutexLocker lock(m_ctx->readMutex);
    QElapsedTimer t; t.start();

    QStringList where;
    QVariantList binds;
    if (!filter.includeDeleted)
        where << QStringLiteral("deleted = 0");
    if (!filter.pathPrefix.isEmpty()) {
        // substr() instead of LIKE so '%' and '_' in paths stay literal
        where << QStringLiteral("substr(file_path, 1, ?) = ?");
        binds << filter.pathPrefix.size() << filter.pathPrefix;
    }
    if (!filter.ids.isEmpty()) {
        QStringList marks;
        for (const auto& id : filter.ids) {
            marks << QStringLiteral("?");
            binds << id;
        }
        where << QStringLiteral("id IN (%1)").arg(marks.join(QLatin1Char(',')));
    }

    QString sql = QStringLiteral("SELECT * FROM tracks");
    if (!where.isEmpty())
        sql += QStringLiteral(" WHERE ") + where.join(QStringLiteral(" AND "));
    sql += QStringLiteral(" ORDER BY file_path, id");

    QVector<Track> result;
    QSqlQuery q(*m_ctx->readDb);
    q.prepare(sql);
    for (const auto& v : binds)
        q.addBindValue(v);
    if (!q.exec()) {
        qWarning() << "[TrackRepository] load failed:" << q.lastError().text();
        return result;
    }
    while (q.next())
        result.append(m_ctx->trackFromQuery(q));

    qDebug() << "[TIMING] TrackRepository::tracks:" << result.size() << "rows in" << t.elapsed() << "ms";
    return result;
}

int TrackRepository::trackCount(bool includeDeleted) const
{
    QMutexLocker lock(m_ctx->readMutex);
    QSqlQuery q(*m_ctx->readDb);
    q.exec(includeDeleted ? QStringLiteral("SELECT COUNT(*) FROM tracks")
                          : QStringLiteral("SELECT COUNT(*) FROM tracks WHERE deleted = 0"));
    if (q.next())
        return q.value(0).toInt();
    return 0;
}
