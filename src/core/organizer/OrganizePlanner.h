#pragma once

#include <QString>
#include <QVector>
#include <optional>

#include "../MusicData.h"
#include "DuplicateResolver.h"
#include "OrganizePlan.h"
#include "PathTemplate.h"

class IFileOperations;

struct PlanOptions {
    OrganizeMode mode = OrganizeMode::Simulate;

    // ── Track filters ────────────────────────────────────────────
    bool requireYear = false;
    bool requireReleaseId = false;                  // "release" album mode
    std::optional<TemplatePlan> fallbackTemplate;   // for tracks without a release id

    // ── Duplicate losers ─────────────────────────────────────────
    QVector<DuplicateGroup> duplicates;
    DuplicatePolicy duplicatePolicy = DuplicatePolicy::Skip;
    QString quarantineRoot;
    QString trashRoot;

    int maxDisambiguation = 99;   // highest " (n)" suffix tried
};

// Computes the full source → target mapping before anything is touched.
//
// Entries already at their rendered location are claimed first, so an
// organized library plans to all no-ops. The remaining tracks are placed
// in source-path order; a target already claimed by a different file gets
// " (2)", " (3)" ... appended before the extension. A target that is the
// source of another entry still waiting to move becomes a PathChain
// conflict instead of a two-phase swap.
//
// The planner only reads the filesystem for the identical-content check
// and to step over files already sitting in the quarantine/trash folders.
class OrganizePlanner {
public:
    explicit OrganizePlanner(const IFileOperations* fileOps = nullptr);

    OrganizePlan plan(const QVector<Track>& tracks,
                      const TemplatePlan& templatePlan,
                      const QString& destinationRoot,
                      const PlanOptions& options = PlanOptions()) const;

    OrganizePlan plan(const QVector<Track>& tracks,
                      const TemplatePlan& templatePlan,
                      const QString& destinationRoot,
                      OrganizeMode mode) const;

    static QString normalizePath(const QString& path);
    static QString disambiguatedPath(const QString& target, int n);
    static PlanOperation operationForMode(OrganizeMode mode);

private:
    bool identicalContent(const Track& a, const Track& b) const;

    const IFileOperations* m_fileOps = nullptr;
};
