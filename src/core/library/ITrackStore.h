#pragma once

#include <QString>
#include <QStringList>
#include <QVector>

#include "../MusicData.h"

struct TrackFilter {
    QStringList ids;            // empty → all
    QString     pathPrefix;     // empty → anywhere
    bool        includeDeleted = false;
};

// Catalog seam used by the reorganization engine. The engine reads the
// track set through load() and writes back only path/deletion state.
class ITrackStore {
public:
    virtual ~ITrackStore() = default;

    virtual QVector<Track> load(const TrackFilter& filter = TrackFilter()) const = 0;

    // Fails when another active record already owns newPath.
    virtual bool updatePath(const QString& trackId, const QString& newPath) = 0;
    virtual bool markDeleted(const QString& trackId) = 0;
    virtual bool restoreDeleted(const QString& trackId) = 0;
    virtual bool updateContentHash(const QString& trackId, const QByteArray& hash) = 0;
};
