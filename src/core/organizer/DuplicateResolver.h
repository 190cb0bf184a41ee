#pragma once

#include <QByteArray>
#include <QHash>
#include <QString>
#include <QStringList>
#include <QVector>

#include "../MusicData.h"
#include "PartialHasher.h"

struct DuplicateGroup {
    QString     keeperId;
    QStringList loserIds;      // best to worst
    AudioFormat format = AudioFormat::Unknown;
    qint64      fileSize = 0;
    double      minDuration = 0.0;
    double      maxDuration = 0.0;

    QStringList memberIds() const;   // keeper first
    int size() const { return 1 + loserIds.size(); }
};

struct DuplicateOptions {
    bool   useContentHash = false;
    qint64 sampleSize = PartialHasher::kDefaultSampleSize;
    double durationTolerance = 1.0;   // seconds, max spread inside one group
};

// What happens to the losers of a duplicate group once a plan executes.
enum class DuplicatePolicy {
    Skip,         // leave in place, keep out of the reorganization
    Quarantine,   // move into the quarantine directory
    Delete        // move into the safe-trash directory, record marked deleted
};

QString         duplicatePolicyToString(DuplicatePolicy policy);
DuplicatePolicy duplicatePolicyFromString(const QString& str);

// Groups tracks believed to be the same recording and picks the copy to
// keep. Never touches the filesystem beyond reading sample bytes for the
// optional content hash.
class DuplicateResolver {
public:
    // Coarse key: exact format, exact size, durations within the tolerance.
    // With options.useContentHash, members lacking a hash are hashed (in
    // parallel) and groups whose members disagree are split. Hashes that
    // were computed are reported through computedHashes (id → digest).
    static QVector<DuplicateGroup> detect(const QVector<Track>& tracks,
                                          const DuplicateOptions& options = DuplicateOptions(),
                                          QHash<QString, QByteArray>* computedHashes = nullptr);

    // Keeper first. Lossless beats lossy, then higher bitrate, then the
    // duration closest to the median, then the smallest path.
    static QVector<Track> rankCandidates(QVector<Track> members);
    static bool isBetterCandidate(const Track& a, const Track& b, double medianDuration);
    static double medianDuration(const QVector<Track>& members);

    // Input minus every loser of every group, order preserved.
    static QVector<Track> withoutLosers(const QVector<Track>& tracks,
                                        const QVector<DuplicateGroup>& groups);
};
