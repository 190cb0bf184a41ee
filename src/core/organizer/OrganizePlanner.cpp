#include "OrganizePlanner.h"
#include "FileOperations.h"

#include <QDebug>
#include <QDir>
#include <QElapsedTimer>
#include <QFileInfo>
#include <QHash>
#include <QSet>
#include <algorithm>

OrganizePlanner::OrganizePlanner(const IFileOperations* fileOps)
    : m_fileOps(fileOps)
{
}

QString OrganizePlanner::normalizePath(const QString& path)
{
    if (path.isEmpty())
        return QString();
    return QDir::cleanPath(QFileInfo(path).absoluteFilePath());
}

QString OrganizePlanner::disambiguatedPath(const QString& target, int n)
{
    QFileInfo fi(target);
    const QString suffix = fi.suffix();
    QString name = fi.completeBaseName() + QStringLiteral(" (%1)").arg(n);
    if (!suffix.isEmpty())
        name += QLatin1Char('.') + suffix;
    return QDir::cleanPath(fi.path() + QLatin1Char('/') + name);
}

PlanOperation OrganizePlanner::operationForMode(OrganizeMode mode)
{
    switch (mode) {
    case OrganizeMode::Copy: return PlanOperation::Copy;
    case OrganizeMode::Link: return PlanOperation::Link;
    case OrganizeMode::Simulate:
    case OrganizeMode::Move:
        break;
    }
    return PlanOperation::Move;
}

bool OrganizePlanner::identicalContent(const Track& a, const Track& b) const
{
    if (a.fileSize > 0 && b.fileSize > 0 && a.fileSize != b.fileSize)
        return false;
    if (m_fileOps)
        return m_fileOps->sameContent(a.filePath, b.filePath);
    return a.contentHash && b.contentHash && *a.contentHash == *b.contentHash;
}

OrganizePlan OrganizePlanner::plan(const QVector<Track>& tracks,
                                   const TemplatePlan& templatePlan,
                                   const QString& destinationRoot,
                                   OrganizeMode mode) const
{
    PlanOptions options;
    options.mode = mode;
    return plan(tracks, templatePlan, destinationRoot, options);
}

namespace {

struct Candidate {
    Track   track;
    QString source;
    QString target;      // empty when rendering failed
    ConflictReason failure = ConflictReason::None;
    QString failureDetail;
};

bool bySource(const Candidate& a, const Candidate& b)
{
    if (a.source != b.source)
        return a.source < b.source;
    return a.track.id < b.track.id;
}

} // anonymous namespace

OrganizePlan OrganizePlanner::plan(const QVector<Track>& tracks,
                                   const TemplatePlan& templatePlan,
                                   const QString& destinationRoot,
                                   const PlanOptions& options) const
{
    QElapsedTimer timer;
    timer.start();

    OrganizePlan result;
    result.destinationRoot = normalizePath(destinationRoot);
    result.templatePattern = templatePlan.pattern;
    result.mode = options.mode;
    result.createdAt = QDateTime::currentDateTimeUtc();

    QSet<QString> loserIds;
    for (const auto& g : options.duplicates) {
        for (const auto& id : g.loserIds)
            loserIds.insert(id);
    }

    // ── Partition: organizable / duplicate losers / excluded ─────────
    QVector<Candidate> organizable;
    QVector<Candidate> losers;
    for (const auto& t : tracks) {
        if (t.deleted) {
            result.excludedTrackIds.append(t.id);
            continue;
        }
        Candidate c;
        c.track = t;
        c.source = normalizePath(t.filePath);

        if (loserIds.contains(t.id)) {
            if (options.duplicatePolicy == DuplicatePolicy::Skip)
                result.excludedTrackIds.append(t.id);
            else
                losers.append(c);
            continue;
        }
        if (options.requireYear && !(t.year && *t.year > 0)) {
            result.excludedTrackIds.append(t.id);
            continue;
        }
        if (options.requireReleaseId && t.releaseId.trimmed().isEmpty() && !options.fallbackTemplate) {
            result.excludedTrackIds.append(t.id);
            continue;
        }
        organizable.append(c);
    }
    std::sort(organizable.begin(), organizable.end(), bySource);
    std::sort(losers.begin(), losers.end(), bySource);

    // ── Render every target up front ─────────────────────────────────
    QVector<Track> plannedTracks;
    plannedTracks.reserve(organizable.size());
    for (const auto& c : organizable)
        plannedTracks.append(c.track);
    const QSet<QString> compilations = PathTemplate::compilationAlbums(plannedTracks);

    for (auto& c : organizable) {
        if (result.destinationRoot.isEmpty()) {
            c.failure = ConflictReason::InvalidDestination;
            c.failureDetail = QStringLiteral("no destination root");
            continue;
        }
        const bool useFallback = options.requireReleaseId && c.track.releaseId.trimmed().isEmpty();
        const TemplatePlan& tp = useFallback ? *options.fallbackTemplate : templatePlan;

        RenderContext context;
        context.compilation = compilations.contains(PathTemplate::albumKey(c.track));
        RenderError error;
        auto relative = PathTemplate::render(tp, c.track, context, &error);
        if (!relative) {
            c.failure = ConflictReason::MissingField;
            c.failureDetail = error.message();
            continue;
        }
        c.target = QDir::cleanPath(result.destinationRoot + QLatin1Char('/') + *relative);
    }

    QSet<QString> sources;
    for (const auto& c : organizable)
        sources.insert(c.source);
    for (const auto& c : losers)
        sources.insert(c.source);

    QVector<PlanEntry> entries(organizable.size());
    QHash<QString, int> claims;     // target → index into entries
    QVector<const Track*> entryTracks(organizable.size(), nullptr);

    // Pass 1: files already where they belong keep their place
    for (int i = 0; i < organizable.size(); ++i) {
        const Candidate& c = organizable.at(i);
        PlanEntry& e = entries[i];
        e.trackId = c.track.id;
        e.sourcePath = c.source;
        entryTracks[i] = &organizable.at(i).track;
        if (!c.target.isEmpty() && c.target == c.source && !claims.contains(c.target)) {
            e.targetPath = c.target;
            e.operation = PlanOperation::NoOp;
            claims.insert(c.target, i);
        } else {
            e.operation = PlanOperation::Conflict;   // placeholder until pass 2
            e.conflict = ConflictReason::InvalidDestination;
        }
    }

    // Places one entry at base or its first free " (n)" variant
    auto place = [&](PlanEntry& e, const Track& track, const QString& base, PlanOperation op,
                     bool stepOverExisting, int index) {
        for (int n = 1; n <= options.maxDisambiguation; ++n) {
            const QString candidate = (n == 1) ? base : disambiguatedPath(base, n);

            if (candidate == e.sourcePath) {
                e.targetPath = candidate;
                e.operation = PlanOperation::NoOp;
                e.conflict = ConflictReason::None;
                e.disambiguated = n > 1;
                claims.insert(candidate, index);
                return;
            }

            auto claim = claims.constFind(candidate);
            if (claim != claims.constEnd()) {
                const int other = claim.value();
                if (n == 1 && other >= 0 && other < entries.size()
                    && entries.at(other).operation == PlanOperation::NoOp
                    && entryTracks.at(other) && identicalContent(track, *entryTracks.at(other))) {
                    e.targetPath = candidate;
                    e.operation = PlanOperation::NoOp;
                    e.conflict = ConflictReason::None;
                    e.detail = QStringLiteral("identical file already at target");
                    return;
                }
                continue;
            }

            if (sources.contains(candidate)) {
                if (n == 1) {
                    e.targetPath = candidate;
                    e.operation = PlanOperation::Conflict;
                    e.conflict = ConflictReason::PathChain;
                    e.detail = QStringLiteral("target is the current location of another track");
                    return;
                }
                continue;
            }

            if (stepOverExisting && m_fileOps && m_fileOps->exists(candidate))
                continue;

            e.targetPath = candidate;
            e.operation = op;
            e.conflict = ConflictReason::None;
            e.disambiguated = n > 1;
            if (e.disambiguated)
                e.detail = QStringLiteral("renamed to avoid a collision");
            claims.insert(candidate, index);
            return;
        }

        e.targetPath = base;
        e.operation = PlanOperation::Conflict;
        e.conflict = ConflictReason::TargetCollision;
        e.detail = QStringLiteral("no free name up to (%1)").arg(options.maxDisambiguation);
    };

    // Pass 2: everything else, in source order
    const PlanOperation reorganizeOp = operationForMode(options.mode);
    for (int i = 0; i < organizable.size(); ++i) {
        PlanEntry& e = entries[i];
        if (e.operation == PlanOperation::NoOp)
            continue;
        const Candidate& c = organizable.at(i);
        if (c.failure != ConflictReason::None) {
            e.targetPath = QString();
            e.conflict = c.failure;
            e.detail = c.failureDetail;
            continue;
        }
        place(e, c.track, c.target, reorganizeOp, false, i);
    }

    // Duplicate losers go flat into the quarantine / trash folder
    const bool quarantine = options.duplicatePolicy == DuplicatePolicy::Quarantine;
    const QString dispositionRoot = normalizePath(quarantine ? options.quarantineRoot
                                                             : options.trashRoot);
    const PlanOperation dispositionOp = quarantine ? PlanOperation::Quarantine
                                                   : PlanOperation::Trash;
    for (const auto& c : losers) {
        PlanEntry e;
        e.trackId = c.track.id;
        e.sourcePath = c.source;
        if (dispositionRoot.isEmpty()) {
            e.operation = PlanOperation::Conflict;
            e.conflict = ConflictReason::InvalidDestination;
            e.detail = QStringLiteral("no %1 folder configured")
                           .arg(quarantine ? QStringLiteral("quarantine") : QStringLiteral("trash"));
            entries.append(e);
            entryTracks.append(&c.track);
            continue;
        }
        const QString base = QDir::cleanPath(dispositionRoot + QLatin1Char('/')
                                             + QFileInfo(c.source).fileName());
        entries.append(e);
        entryTracks.append(&c.track);
        const int index = entries.size() - 1;
        place(entries[index], c.track, base, dispositionOp, true, index);
        // A loser already inside the folder is left where it is
        if (entries.at(index).operation == PlanOperation::NoOp) {
            entries[index].detail = QStringLiteral("already in the %1 folder")
                                        .arg(quarantine ? QStringLiteral("quarantine")
                                                        : QStringLiteral("trash"));
        }
    }

    result.entries = entries;

    qDebug() << "[Planner]" << result.entries.size() << "entries:"
             << result.mutationCount() << "to apply,"
             << result.count(PlanOperation::NoOp) << "in place,"
             << result.conflictCount() << "conflicts,"
             << result.excludedTrackIds.size() << "excluded"
             << "in" << timer.elapsed() << "ms";
    return result;
}
