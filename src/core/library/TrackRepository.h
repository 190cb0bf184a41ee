#pragma once

#include <QVector>
#include <QString>
#include <optional>
#include "../MusicData.h"
#include "ITrackStore.h"

struct DatabaseContext;

class TrackRepository {
public:
    explicit TrackRepository(DatabaseContext* ctx);

    // ── Existence ────────────────────────────────────────────────────
    bool trackExists(const QString& filePath) const;   // active rows only

    // ── CRUD ─────────────────────────────────────────────────────────
    bool insertTrack(const Track& track, QString* assignedId = nullptr);
    bool removeTrack(const QString& id);

    // ── Engine write-back ────────────────────────────────────────────
    bool updatePath(const QString& trackId, const QString& newPath);
    bool setDeleted(const QString& trackId, bool deleted);
    bool updateContentHash(const QString& trackId, const QByteArray& hash);

    // ── Queries ──────────────────────────────────────────────────────
    std::optional<Track> trackById(const QString& id) const;
    std::optional<Track> trackByPath(const QString& filePath) const;
    QVector<Track> tracks(const TrackFilter& filter) const;
    int trackCount(bool includeDeleted = false) const;

private:
    DatabaseContext* m_ctx;
};
