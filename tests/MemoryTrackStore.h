#pragma once

#include <QHash>
#include <QVector>

#include "library/ITrackStore.h"

// In-memory catalog for engine tests that do not need SQLite.
class MemoryTrackStore : public ITrackStore {
public:
    void add(const Track& t) { m_tracks.insert(t.id, t); m_order.append(t.id); }
    Track track(const QString& id) const { return m_tracks.value(id); }

    QVector<Track> load(const TrackFilter& filter = TrackFilter()) const override
    {
        QVector<Track> result;
        for (const auto& id : m_order) {
            const Track& t = m_tracks[id];
            if (t.deleted && !filter.includeDeleted)
                continue;
            if (!filter.ids.isEmpty() && !filter.ids.contains(t.id))
                continue;
            if (!filter.pathPrefix.isEmpty() && !t.filePath.startsWith(filter.pathPrefix))
                continue;
            result.append(t);
        }
        return result;
    }

    bool updatePath(const QString& trackId, const QString& newPath) override
    {
        if (!m_tracks.contains(trackId))
            return false;
        for (const auto& t : m_tracks) {
            if (t.id != trackId && !t.deleted && t.filePath == newPath)
                return false;
        }
        m_tracks[trackId].filePath = newPath;
        return true;
    }

    bool markDeleted(const QString& trackId) override
    {
        if (!m_tracks.contains(trackId))
            return false;
        m_tracks[trackId].deleted = true;
        return true;
    }

    bool restoreDeleted(const QString& trackId) override
    {
        if (!m_tracks.contains(trackId))
            return false;
        m_tracks[trackId].deleted = false;
        return true;
    }

    bool updateContentHash(const QString& trackId, const QByteArray& hash) override
    {
        if (!m_tracks.contains(trackId))
            return false;
        m_tracks[trackId].contentHash = hash;
        return true;
    }

private:
    QHash<QString, Track> m_tracks;
    QStringList m_order;
};
