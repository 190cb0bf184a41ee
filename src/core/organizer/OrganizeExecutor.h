#pragma once

#include <QJsonObject>
#include <QString>
#include <QVector>
#include <atomic>
#include <functional>

#include "FileOperations.h"
#include "OrganizePlan.h"

class ITrackStore;
class UndoLog;

enum class EntryState {
    Pending,
    Verifying,
    Verified,   // simulate mode: would be applied
    Applying,
    Committed,
    Failed,
    Skipped,    // no-op, conflict, or not reached after cancellation
    Undone
};

QString entryStateToString(EntryState state);

struct EntryOutcome {
    PlanEntry     entry;
    PlanOperation appliedOperation = PlanOperation::NoOp;
    EntryState    state = EntryState::Pending;
    FailureKind   failure = FailureKind::None;
    QString       message;
};

struct ExecutionReport {
    OrganizeMode mode = OrganizeMode::Simulate;
    QString      batchId;          // empty in simulate mode or when setup failed
    int          attempted = 0;
    int          succeeded = 0;    // committed, or would commit in simulate mode
    int          failed = 0;
    int          skipped = 0;
    bool         cancelled = false;
    QString      setupError;       // whole batch aborted before any mutation
    QString      journalError;     // undo log could not be written; run stopped there
    QVector<EntryOutcome> outcomes;

    bool aborted() const { return !setupError.isEmpty(); }
    QVector<EntryOutcome> failures() const;
    QString summary() const;
    QJsonObject toJson() const;
};

// Applies an OrganizePlan. Each entry is verified and applied on its own;
// a failed entry never stops or rolls back its siblings. Every committed
// operation is journaled in the undo log before the next entry starts, and
// the batch is sealed at the end even if it is empty or was cancelled.
//
// Simulate mode runs the same verification read-only and never writes the
// undo log.
class OrganizeExecutor {
public:
    using ProgressCallback = std::function<void(int done, int total, const EntryOutcome& outcome)>;

    OrganizeExecutor(IFileOperations& fileOps, ITrackStore* store, UndoLog* undoLog);

    void setRetryPolicy(const RetryPolicy& policy) { m_retry = policy; }
    void setCancelFlag(const std::atomic<bool>* flag) { m_cancel = flag; }
    void setProgressCallback(ProgressCallback cb) { m_progress = std::move(cb); }

    ExecutionReport execute(const OrganizePlan& plan, OrganizeMode mode);

    static PlanOperation operationFor(const PlanEntry& entry, OrganizeMode mode);

private:
    QString checkSetup(const OrganizePlan& plan) const;
    FileOpResult verify(const PlanEntry& entry, const QString& target) const;
    FileOpResult apply(PlanOperation op, const PlanEntry& entry, QStringList* createdDirs);
    void revertApplied(PlanOperation op, const PlanEntry& entry, const QStringList& createdDirs);
    bool updateStore(PlanOperation op, const PlanEntry& entry);
    void restoreStore(PlanOperation op, const PlanEntry& entry);
    bool cancelRequested() const { return m_cancel && m_cancel->load(); }

    IFileOperations& m_fileOps;
    ITrackStore* m_store = nullptr;
    UndoLog* m_undoLog = nullptr;
    RetryPolicy m_retry;
    const std::atomic<bool>* m_cancel = nullptr;
    ProgressCallback m_progress;
};
