#include "OrganizeExecutor.h"
#include "UndoLog.h"
#include "../library/ITrackStore.h"

#include <QDebug>
#include <QElapsedTimer>
#include <QFileInfo>
#include <QJsonArray>

QString entryStateToString(EntryState state)
{
    switch (state) {
    case EntryState::Pending:   return QStringLiteral("pending");
    case EntryState::Verifying: return QStringLiteral("verifying");
    case EntryState::Verified:  return QStringLiteral("verified");
    case EntryState::Applying:  return QStringLiteral("applying");
    case EntryState::Committed: return QStringLiteral("committed");
    case EntryState::Failed:    return QStringLiteral("failed");
    case EntryState::Skipped:   return QStringLiteral("skipped");
    case EntryState::Undone:    return QStringLiteral("undone");
    }
    return QString();
}

// ── ExecutionReport ─────────────────────────────────────────────────

QVector<EntryOutcome> ExecutionReport::failures() const
{
    QVector<EntryOutcome> result;
    for (const auto& o : outcomes) {
        if (o.state == EntryState::Failed)
            result.append(o);
    }
    return result;
}

QString ExecutionReport::summary() const
{
    if (aborted())
        return QStringLiteral("Aborted: %1").arg(setupError);

    QString text = QStringLiteral("%1: %2 attempted, %3 %4, %5 failed, %6 skipped")
                       .arg(organizeModeToString(mode))
                       .arg(attempted)
                       .arg(succeeded)
                       .arg(mode == OrganizeMode::Simulate ? QStringLiteral("would succeed")
                                                           : QStringLiteral("succeeded"))
                       .arg(failed)
                       .arg(skipped);
    if (cancelled)
        text += QStringLiteral(" (cancelled)");
    if (!journalError.isEmpty())
        text += QStringLiteral(" (undo log error: %1)").arg(journalError);
    return text;
}

QJsonObject ExecutionReport::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("mode")] = organizeModeToString(mode);
    obj[QStringLiteral("batch")] = batchId;
    obj[QStringLiteral("attempted")] = attempted;
    obj[QStringLiteral("succeeded")] = succeeded;
    obj[QStringLiteral("failed")] = failed;
    obj[QStringLiteral("skipped")] = skipped;
    obj[QStringLiteral("cancelled")] = cancelled;
    if (aborted())
        obj[QStringLiteral("setupError")] = setupError;
    if (!journalError.isEmpty())
        obj[QStringLiteral("journalError")] = journalError;

    QJsonArray failedEntries;
    for (const auto& o : outcomes) {
        if (o.state != EntryState::Failed)
            continue;
        QJsonObject f = o.entry.toJson();
        f[QStringLiteral("failure")] = failureKindToString(o.failure);
        f[QStringLiteral("message")] = o.message;
        failedEntries.append(f);
    }
    obj[QStringLiteral("failures")] = failedEntries;
    return obj;
}

// ═══════════════════════════════════════════════════════════════════════
//  OrganizeExecutor
// ═══════════════════════════════════════════════════════════════════════

OrganizeExecutor::OrganizeExecutor(IFileOperations& fileOps, ITrackStore* store, UndoLog* undoLog)
    : m_fileOps(fileOps)
    , m_store(store)
    , m_undoLog(undoLog)
{
}

PlanOperation OrganizeExecutor::operationFor(const PlanEntry& entry, OrganizeMode mode)
{
    switch (entry.operation) {
    case PlanOperation::Move:
    case PlanOperation::Copy:
    case PlanOperation::Link:
        switch (mode) {
        case OrganizeMode::Move: return PlanOperation::Move;
        case OrganizeMode::Copy: return PlanOperation::Copy;
        case OrganizeMode::Link: return PlanOperation::Link;
        case OrganizeMode::Simulate: break;
        }
        return entry.operation;
    case PlanOperation::Quarantine:
    case PlanOperation::Trash:
    case PlanOperation::NoOp:
    case PlanOperation::Conflict:
        break;
    }
    return entry.operation;
}

QString OrganizeExecutor::checkSetup(const OrganizePlan& plan) const
{
    bool reorganizes = false;
    for (const auto& e : plan.entries) {
        if (e.operation == PlanOperation::Move || e.operation == PlanOperation::Copy
            || e.operation == PlanOperation::Link) {
            reorganizes = true;
            break;
        }
    }
    if (!reorganizes)
        return QString();

    if (plan.destinationRoot.isEmpty())
        return QStringLiteral("No destination root");
    if (QFileInfo(plan.destinationRoot).exists() && !QFileInfo(plan.destinationRoot).isDir())
        return QStringLiteral("Destination %1 is not a directory").arg(plan.destinationRoot);
    if (!m_fileOps.canCreateDirectory(plan.destinationRoot))
        return QStringLiteral("Destination %1 is not writable").arg(plan.destinationRoot);
    return QString();
}

FileOpResult OrganizeExecutor::verify(const PlanEntry& entry, const QString& target) const
{
    if (!m_fileOps.exists(entry.sourcePath))
        return FileOpResult::fail(FailureKind::SourceMissing,
                                  QStringLiteral("%1 no longer exists").arg(entry.sourcePath));
    if (!m_fileOps.isReadable(entry.sourcePath))
        return FileOpResult::fail(FailureKind::PermissionDenied,
                                  QStringLiteral("%1 is not readable").arg(entry.sourcePath));
    if (m_fileOps.exists(target))
        return FileOpResult::fail(FailureKind::TargetExists,
                                  QStringLiteral("%1 already exists").arg(target));
    const QString parent = QFileInfo(target).absolutePath();
    if (!m_fileOps.canCreateDirectory(parent))
        return FileOpResult::fail(FailureKind::PermissionDenied,
                                  QStringLiteral("cannot create %1").arg(parent));
    return FileOpResult::success();
}

FileOpResult OrganizeExecutor::apply(PlanOperation op, const PlanEntry& entry, QStringList* createdDirs)
{
    const QString parent = QFileInfo(entry.targetPath).absolutePath();
    FileOpResult r = retryTransient(m_retry, [&] { return m_fileOps.makePath(parent, createdDirs); });
    if (!r.ok())
        return r;

    switch (op) {
    case PlanOperation::Move:
    case PlanOperation::Quarantine:
    case PlanOperation::Trash:
        return retryTransient(m_retry, [&] { return m_fileOps.moveFile(entry.sourcePath, entry.targetPath); });
    case PlanOperation::Copy:
        return retryTransient(m_retry, [&] { return m_fileOps.copyFile(entry.sourcePath, entry.targetPath); });
    case PlanOperation::Link:
        return retryTransient(m_retry, [&] { return m_fileOps.linkFile(entry.sourcePath, entry.targetPath); });
    case PlanOperation::NoOp:
    case PlanOperation::Conflict:
        break;
    }
    return FileOpResult::fail(FailureKind::IOError, QStringLiteral("not an executable operation"));
}

void OrganizeExecutor::revertApplied(PlanOperation op, const PlanEntry& entry,
                                     const QStringList& createdDirs)
{
    const FileOpResult reverted = (op == PlanOperation::Copy || op == PlanOperation::Link)
                                      ? m_fileOps.removeFile(entry.targetPath)
                                      : m_fileOps.moveFile(entry.targetPath, entry.sourcePath);
    if (!reverted.ok())
        qCritical() << "[Executor] Could not revert" << entry.targetPath << reverted.message;
    for (int d = createdDirs.size() - 1; d >= 0; --d)
        m_fileOps.removeEmptyDirectory(createdDirs.at(d));
}

// Points the track record at the applied target. Returns false (with the
// record left as it was) when the store refuses.
bool OrganizeExecutor::updateStore(PlanOperation op, const PlanEntry& entry)
{
    if (!m_store || entry.trackId.isEmpty())
        return true;

    switch (op) {
    case PlanOperation::Move:
    case PlanOperation::Quarantine:
        return m_store->updatePath(entry.trackId, entry.targetPath);
    case PlanOperation::Trash:
        if (!m_store->updatePath(entry.trackId, entry.targetPath))
            return false;
        if (!m_store->markDeleted(entry.trackId)) {
            if (!m_store->updatePath(entry.trackId, entry.sourcePath))
                qCritical() << "[Executor] Catalog path left at" << entry.targetPath
                            << "for" << entry.trackId;
            return false;
        }
        return true;
    case PlanOperation::Copy:
    case PlanOperation::Link:
    case PlanOperation::NoOp:
    case PlanOperation::Conflict:
        break;   // the catalog keeps pointing at the original
    }
    return true;
}

void OrganizeExecutor::restoreStore(PlanOperation op, const PlanEntry& entry)
{
    if (!m_store || entry.trackId.isEmpty())
        return;
    if (op == PlanOperation::Trash && !m_store->restoreDeleted(entry.trackId))
        qCritical() << "[Executor] Could not un-delete catalog record" << entry.trackId;
    if ((op == PlanOperation::Move || op == PlanOperation::Quarantine || op == PlanOperation::Trash)
        && !m_store->updatePath(entry.trackId, entry.sourcePath))
        qCritical() << "[Executor] Could not restore catalog path for" << entry.trackId;
}

ExecutionReport OrganizeExecutor::execute(const OrganizePlan& plan, OrganizeMode mode)
{
    QElapsedTimer timer;
    timer.start();

    ExecutionReport report;
    report.mode = mode;
    const bool simulate = mode == OrganizeMode::Simulate;

    report.setupError = checkSetup(plan);
    if (report.setupError.isEmpty() && !simulate && !m_undoLog)
        report.setupError = QStringLiteral("No undo log available");
    if (!report.setupError.isEmpty()) {
        qCritical() << "[Executor]" << report.setupError;
        return report;
    }

    if (!simulate) {
        QString error;
        report.batchId = m_undoLog->beginBatch(mode, plan.destinationRoot, &error);
        if (report.batchId.isEmpty()) {
            report.setupError = error;
            qCritical() << "[Executor] Cannot open undo batch:" << error;
            return report;
        }
    }

    qDebug() << "[Executor]" << organizeModeToString(mode) << plan.entries.size() << "entries"
             << (simulate ? QString() : QStringLiteral("batch %1").arg(report.batchId));

    const int total = plan.entries.size();
    bool stop = false;
    for (int i = 0; i < total; ++i) {
        const PlanEntry& entry = plan.entries.at(i);
        EntryOutcome outcome;
        outcome.entry = entry;
        outcome.appliedOperation = operationFor(entry, mode);

        if (!stop && cancelRequested()) {
            report.cancelled = true;
            stop = true;
            qDebug() << "[Executor] Cancelled before entry" << i;
        }
        if (stop) {
            outcome.state = EntryState::Skipped;
            if (entry.isMutation())
                outcome.failure = report.cancelled ? FailureKind::Cancelled : FailureKind::IOError;
            ++report.skipped;
            report.outcomes.append(outcome);
            continue;
        }

        if (!entry.isMutation()) {
            outcome.state = EntryState::Skipped;
            outcome.message = entry.operation == PlanOperation::Conflict
                                  ? conflictReasonToString(entry.conflict)
                                  : QStringLiteral("in place");
            ++report.skipped;
            report.outcomes.append(outcome);
            if (m_progress)
                m_progress(i + 1, total, outcome);
            continue;
        }

        ++report.attempted;
        outcome.state = EntryState::Verifying;
        FileOpResult r = verify(entry, entry.targetPath);

        if (r.ok() && simulate) {
            outcome.state = EntryState::Verified;
        } else if (r.ok()) {
            outcome.state = EntryState::Applying;
            QStringList created;
            r = apply(outcome.appliedOperation, entry, &created);
            if (r.ok()) {
                const PlanOperation op = outcome.appliedOperation;
                UndoEntry undo;
                undo.trackId = entry.trackId;
                undo.sourcePath = entry.sourcePath;
                undo.targetPath = entry.targetPath;
                undo.operation = op;
                undo.createdDirs = created;

                QString error;
                if (!updateStore(op, entry)) {
                    // The record must follow the file: put the file back
                    qWarning() << "[Executor] Catalog refused" << entry.targetPath
                               << "for" << entry.trackId << ", reverting entry" << i;
                    revertApplied(op, entry, created);
                    r = FileOpResult::fail(FailureKind::CatalogError,
                                           QStringLiteral("catalog could not record %1 for track %2")
                                               .arg(entry.targetPath, entry.trackId));
                } else if (m_undoLog->appendEntry(report.batchId, undo, &error)) {
                    outcome.state = EntryState::Committed;
                } else {
                    // Unjournaled changes must not survive: put this one back and stop
                    qCritical() << "[Executor] Undo log append failed, reverting entry" << i << error;
                    report.journalError = error;
                    stop = true;
                    restoreStore(op, entry);
                    revertApplied(op, entry, created);
                    r = FileOpResult::fail(FailureKind::IOError,
                                           QStringLiteral("undo log write failed: %1").arg(error));
                }
            } else {
                for (int d = created.size() - 1; d >= 0; --d)
                    m_fileOps.removeEmptyDirectory(created.at(d));
            }
        }

        if (r.ok()) {
            ++report.succeeded;
        } else {
            outcome.state = EntryState::Failed;
            outcome.failure = r.failure;
            outcome.message = r.message;
            ++report.failed;
            qWarning() << "[Executor]" << (simulate ? "Would fail:" : "Failed:")
                       << failureKindToString(r.failure) << r.message;
        }

        report.outcomes.append(outcome);
        if (m_progress)
            m_progress(i + 1, total, outcome);
    }

    if (!simulate) {
        QString error;
        if (!m_undoLog->sealBatch(report.batchId, &error)) {
            if (report.journalError.isEmpty())
                report.journalError = error;
            qCritical() << "[Executor] Cannot seal batch" << report.batchId << error;
        }
    }

    qDebug() << "[Executor]" << report.summary() << "in" << timer.elapsed() << "ms";
    return report;
}
