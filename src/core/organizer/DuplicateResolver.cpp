#include "DuplicateResolver.h"

#include <QDebug>
#include <QElapsedTimer>
#include <QMap>
#include <QSet>
#include <QtConcurrent>
#include <algorithm>
#include <cmath>

QStringList DuplicateGroup::memberIds() const
{
    QStringList ids;
    ids.reserve(size());
    ids.append(keeperId);
    ids.append(loserIds);
    return ids;
}

QString duplicatePolicyToString(DuplicatePolicy policy)
{
    switch (policy) {
    case DuplicatePolicy::Skip:       return QStringLiteral("skip");
    case DuplicatePolicy::Quarantine: return QStringLiteral("quarantine");
    case DuplicatePolicy::Delete:     return QStringLiteral("delete");
    }
    return QStringLiteral("skip");
}

DuplicatePolicy duplicatePolicyFromString(const QString& str)
{
    const QString s = str.trimmed().toLower();
    if (s == QStringLiteral("quarantine")) return DuplicatePolicy::Quarantine;
    if (s == QStringLiteral("delete") || s == QStringLiteral("trash")) return DuplicatePolicy::Delete;
    return DuplicatePolicy::Skip;
}

// ═══════════════════════════════════════════════════════════════════════
//  Keeper ranking
// ═══════════════════════════════════════════════════════════════════════

double DuplicateResolver::medianDuration(const QVector<Track>& members)
{
    if (members.isEmpty())
        return 0.0;
    QVector<double> durations;
    durations.reserve(members.size());
    for (const auto& t : members)
        durations.append(t.duration);
    std::sort(durations.begin(), durations.end());
    const int n = durations.size();
    if (n % 2 == 1)
        return durations.at(n / 2);
    return (durations.at(n / 2 - 1) + durations.at(n / 2)) / 2.0;
}

bool DuplicateResolver::isBetterCandidate(const Track& a, const Track& b, double median)
{
    const bool aLossless = isLosslessFormat(a.format);
    const bool bLossless = isLosslessFormat(b.format);
    if (aLossless != bLossless)
        return aLossless;

    if (a.bitrate != b.bitrate)
        return a.bitrate > b.bitrate;

    // Truncated or padded rips drift away from the median
    const double aDrift = std::fabs(a.duration - median);
    const double bDrift = std::fabs(b.duration - median);
    if (aDrift != bDrift)
        return aDrift < bDrift;

    if (a.filePath != b.filePath)
        return a.filePath < b.filePath;
    return a.id < b.id;
}

QVector<Track> DuplicateResolver::rankCandidates(QVector<Track> members)
{
    const double median = medianDuration(members);
    std::sort(members.begin(), members.end(), [median](const Track& a, const Track& b) {
        return isBetterCandidate(a, b, median);
    });
    return members;
}

// ═══════════════════════════════════════════════════════════════════════
//  detect
// ═══════════════════════════════════════════════════════════════════════

static bool isEligible(const Track& t)
{
    return !t.deleted
        && std::isfinite(t.duration) && t.duration > 0.0
        && t.fileSize > 0
        && t.format != AudioFormat::Unknown;
}

static QVector<QVector<Track>> coarseClusters(const QVector<Track>& tracks, double tolerance)
{
    QVector<Track> eligible;
    eligible.reserve(tracks.size());
    for (const auto& t : tracks) {
        if (isEligible(t))
            eligible.append(t);
    }

    // Sorting makes the greedy clustering independent of input order
    std::sort(eligible.begin(), eligible.end(), [](const Track& a, const Track& b) {
        if (a.format != b.format)
            return static_cast<int>(a.format) < static_cast<int>(b.format);
        if (a.fileSize != b.fileSize)
            return a.fileSize < b.fileSize;
        if (a.duration != b.duration)
            return a.duration < b.duration;
        if (a.filePath != b.filePath)
            return a.filePath < b.filePath;
        return a.id < b.id;
    });

    QVector<QVector<Track>> clusters;
    QVector<Track> current;
    for (const auto& t : eligible) {
        if (!current.isEmpty()) {
            const Track& first = current.first();
            const bool sameKey = first.format == t.format && first.fileSize == t.fileSize
                              && (t.duration - first.duration) <= tolerance;
            if (!sameKey) {
                if (current.size() > 1)
                    clusters.append(current);
                current.clear();
            }
        }
        current.append(t);
    }
    if (current.size() > 1)
        clusters.append(current);

    return clusters;
}

struct HashJob {
    QString trackId;
    QString filePath;
};

struct HashOutcome {
    QString trackId;
    QString filePath;
    std::optional<QByteArray> hash;
    QString error;
};

static QMap<QString, QByteArray> hashMembers(const QVector<QVector<Track>>& clusters,
                                             qint64 sampleSize)
{
    QMap<QString, QByteArray> hashes;
    QVector<HashJob> jobs;
    for (const auto& cluster : clusters) {
        for (const auto& t : cluster) {
            if (t.contentHash && !t.contentHash->isEmpty())
                hashes.insert(t.id, *t.contentHash);
            else
                jobs.append(HashJob{t.id, t.filePath});
        }
    }
    if (jobs.isEmpty())
        return hashes;

    QElapsedTimer timer;
    timer.start();

    // Read-only, independent per file: safe to fan out on the global pool
    const QList<HashOutcome> outcomes = QtConcurrent::blockingMapped<QList<HashOutcome>>(
        jobs, [sampleSize](const HashJob& job) {
            HashOutcome out{job.trackId, job.filePath, std::nullopt, QString()};
            out.hash = PartialHasher::hashFile(job.filePath, sampleSize, &out.error);
            return out;
        });

    int failures = 0;
    for (const auto& out : outcomes) {
        if (out.hash) {
            hashes.insert(out.trackId, *out.hash);
        } else {
            ++failures;
            qWarning() << "[Duplicates] Could not hash" << out.filePath << "-" << out.error
                       << "(falling back to the coarse key)";
        }
    }

    qDebug() << "[Duplicates] Hashed" << (jobs.size() - failures) << "of" << jobs.size()
             << "files in" << timer.elapsed() << "ms";
    return hashes;
}

static QVector<QVector<Track>> splitByHash(const QVector<Track>& cluster,
                                           const QMap<QString, QByteArray>& hashes)
{
    QMap<QByteArray, QVector<Track>> byHash;
    QVector<Track> unhashed;
    for (const auto& t : cluster) {
        auto it = hashes.constFind(t.id);
        if (it == hashes.constEnd())
            unhashed.append(t);
        else
            byHash[it.value()].append(t);
    }

    if (byHash.isEmpty())
        return { cluster };

    // Unreadable members stay on the coarse key: they join the largest
    // hash-consistent subgroup (smallest digest on ties)
    if (!unhashed.isEmpty()) {
        auto largest = byHash.begin();
        for (auto it = byHash.begin(); it != byHash.end(); ++it) {
            if (it.value().size() > largest.value().size())
                largest = it;
        }
        largest.value().append(unhashed);
    }

    QVector<QVector<Track>> result;
    for (auto it = byHash.cbegin(); it != byHash.cend(); ++it)
        result.append(it.value());
    return result;
}

QVector<DuplicateGroup> DuplicateResolver::detect(const QVector<Track>& tracks,
                                                  const DuplicateOptions& options,
                                                  QHash<QString, QByteArray>* computedHashes)
{
    QVector<QVector<Track>> clusters = coarseClusters(tracks, options.durationTolerance);

    if (options.useContentHash && !clusters.isEmpty()) {
        const QMap<QString, QByteArray> hashes = hashMembers(clusters, options.sampleSize);
        if (computedHashes) {
            for (const auto& cluster : clusters) {
                for (const auto& t : cluster) {
                    auto it = hashes.constFind(t.id);
                    if (it != hashes.constEnd() && !(t.contentHash && *t.contentHash == it.value()))
                        computedHashes->insert(t.id, it.value());
                }
            }
        }

        QVector<QVector<Track>> split;
        for (const auto& cluster : clusters)
            split.append(splitByHash(cluster, hashes));
        clusters = split;
    }

    QVector<DuplicateGroup> groups;
    for (const auto& cluster : clusters) {
        if (cluster.size() < 2)
            continue;

        const QVector<Track> ranked = rankCandidates(cluster);
        DuplicateGroup group;
        group.keeperId = ranked.first().id;
        group.format = ranked.first().format;
        group.fileSize = ranked.first().fileSize;
        group.minDuration = ranked.first().duration;
        group.maxDuration = ranked.first().duration;
        for (int i = 0; i < ranked.size(); ++i) {
            if (i > 0)
                group.loserIds.append(ranked.at(i).id);
            group.minDuration = std::min(group.minDuration, ranked.at(i).duration);
            group.maxDuration = std::max(group.maxDuration, ranked.at(i).duration);
        }
        groups.append(group);
    }

    // Stable output order: by keeper id
    std::sort(groups.begin(), groups.end(), [](const DuplicateGroup& a, const DuplicateGroup& b) {
        return a.keeperId < b.keeperId;
    });

    qDebug() << "[Duplicates]" << groups.size() << "groups among" << tracks.size() << "tracks";
    return groups;
}

QVector<Track> DuplicateResolver::withoutLosers(const QVector<Track>& tracks,
                                                const QVector<DuplicateGroup>& groups)
{
    QSet<QString> losers;
    for (const auto& g : groups) {
        for (const auto& id : g.loserIds)
            losers.insert(id);
    }

    QVector<Track> result;
    result.reserve(tracks.size());
    for (const auto& t : tracks) {
        if (!losers.contains(t.id))
            result.append(t);
    }
    return result;
}
