#include "DatabaseContext.h"

#include <QSqlQuery>
#include <QSqlRecord>
#include <QUuid>

QString DatabaseContext::generateId() const
{
    return QUuid::createUuid().toString(QUuid::WithoutBraces);
}

static std::optional<int> optionalInt(const QVariant& v)
{
    if (v.isNull())
        return std::nullopt;
    return v.toInt();
}

Track DatabaseContext::trackFromQuery(const QSqlQuery& query) const
{
    Track t;
    t.id          = query.value(QStringLiteral("id")).toString();
    t.filePath    = query.value(QStringLiteral("file_path")).toString();
    t.fileSize    = query.value(QStringLiteral("file_size")).toLongLong();
    t.duration    = query.value(QStringLiteral("duration")).toDouble();
    t.format      = audioFormatFromString(query.value(QStringLiteral("format")).toString());
    t.bitrate     = query.value(QStringLiteral("bitrate")).toInt();

    t.title       = query.value(QStringLiteral("title")).toString();
    t.artist      = query.value(QStringLiteral("artist")).toString();
    t.album       = query.value(QStringLiteral("album")).toString();
    t.genre       = query.value(QStringLiteral("genre")).toString();
    t.year        = optionalInt(query.value(QStringLiteral("year")));
    t.trackNumber = optionalInt(query.value(QStringLiteral("track_number")));

    // album_artist / release_id (migration columns: may not exist in old DBs)
    int aaIdx = query.record().indexOf(QStringLiteral("album_artist"));
    if (aaIdx >= 0)
        t.albumArtist = query.value(aaIdx).toString();
    int relIdx = query.record().indexOf(QStringLiteral("release_id"));
    if (relIdx >= 0)
        t.releaseId = query.value(relIdx).toString();

    int hashIdx = query.record().indexOf(QStringLiteral("content_hash"));
    if (hashIdx >= 0 && !query.value(hashIdx).isNull()) {
        const QByteArray hash = query.value(hashIdx).toByteArray();
        if (!hash.isEmpty())
            t.contentHash = hash;
    }

    t.deleted = query.value(QStringLiteral("deleted")).toInt() != 0;
    return t;
}
