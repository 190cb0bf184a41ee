#pragma once

#include <QString>
#include <QVector>
#include <atomic>
#include <optional>

#include "ITrackStore.h"
#include "../organizer/DuplicateResolver.h"
#include "../organizer/OrganizeExecutor.h"
#include "../organizer/OrganizePlan.h"
#include "../organizer/OrganizePlanner.h"
#include "../organizer/PathTemplate.h"
#include "../organizer/UndoLog.h"

class IFileOperations;
class Settings;

struct OrganizeRequest {
    QString templateName;        // empty → organizer/activeTemplate; may be a raw pattern
    QString destinationRoot;     // empty → organizer/destinationRoot
    OrganizeMode mode = OrganizeMode::Simulate;
    TrackFilter filter;

    bool resolveDuplicates = false;
    std::optional<DuplicatePolicy> policy;    // empty → duplicates/policy
    std::optional<bool> useContentHash;       // empty → duplicates/useContentHash
};

struct OrganizeResult {
    QString error;                       // template or setup problem, nothing touched
    QVector<DuplicateGroup> duplicates;
    OrganizePlan plan;
    ExecutionReport report;

    bool ok() const { return error.isEmpty() && !report.aborted(); }
};

// Runs the reorganization pipeline against the catalog:
// load → duplicates → plan → execute, plus undo of earlier runs.
// Rules, folders and limits come from Settings.
class AutoOrganizer {
public:
    AutoOrganizer(ITrackStore& store, Settings& settings, IFileOperations& fileOps);

    // ── Configuration ────────────────────────────────────────────────
    TemplateRules templateRules() const;
    DuplicateOptions duplicateOptions() const;
    RetryPolicy retryPolicy() const;
    std::optional<TemplatePlan> compileTemplate(const QString& nameOrPattern,
                                                TemplateError* error = nullptr) const;

    void setCancelFlag(const std::atomic<bool>* flag) { m_cancel = flag; }

    // ── Pipeline ─────────────────────────────────────────────────────
    QVector<DuplicateGroup> findDuplicates(const TrackFilter& filter = TrackFilter(),
                                           std::optional<bool> useContentHash = std::nullopt);

    std::optional<OrganizePlan> preview(const OrganizeRequest& request, QString* error = nullptr,
                                        QVector<DuplicateGroup>* duplicates = nullptr);
    ExecutionReport execute(const OrganizePlan& plan, OrganizeMode mode);
    OrganizeResult organize(const OrganizeRequest& request);

    // ── Undo ─────────────────────────────────────────────────────────
    UndoReport undo();
    QVector<UndoBatch> history(bool includeUndone = true);

private:
    bool ensureUndoLogLoaded(QString* error = nullptr);

    ITrackStore& m_store;
    Settings& m_settings;
    IFileOperations& m_fileOps;
    UndoLog m_undoLog;
    bool m_undoLoaded = false;
    const std::atomic<bool>* m_cancel = nullptr;
};
