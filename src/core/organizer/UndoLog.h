#pragma once

#include <QDateTime>
#include <QJsonObject>
#include <QString>
#include <QStringList>
#include <QVector>
#include <optional>

#include "FileOperations.h"
#include "OrganizePlan.h"

class ITrackStore;

// One committed file operation and everything needed to reverse it.
struct UndoEntry {
    QString       trackId;
    QString       sourcePath;
    QString       targetPath;      // for Trash: the safe-trash location
    PlanOperation operation = PlanOperation::Move;
    QStringList   createdDirs;     // directories made for this entry, outermost first

    QJsonObject toJson() const;
    static std::optional<UndoEntry> fromJson(const QJsonObject& obj);
};

struct UndoBatch {
    QString            id;
    QDateTime          startedAt;
    QDateTime          sealedAt;
    OrganizeMode       mode = OrganizeMode::Move;
    QString            destinationRoot;
    QVector<UndoEntry> entries;
    bool               sealed = false;
    bool               undone = false;
    QDateTime          undoneAt;
};

struct UndoOutcome {
    UndoEntry   entry;
    FailureKind failure = FailureKind::None;
    QString     message;

    bool ok() const { return failure == FailureKind::None; }
};

struct UndoReport {
    QString batchId;               // empty when there was nothing to undo
    int     attempted = 0;
    int     succeeded = 0;
    int     failed = 0;
    QString error;                 // log could not be updated
    QVector<UndoOutcome> outcomes; // in undo order (reverse of application)

    bool hadBatch() const { return !batchId.isEmpty(); }
    bool complete() const { return hadBatch() && failed == 0 && error.isEmpty(); }
};

// Durable journal of executed batches, stored as JSON Lines. Every record
// is appended and fsync'ed before the call returns, so a crash leaves at
// most one torn trailing line, which load() skips.
//
//   {"type":"begin",  "batch":..., "time":..., "mode":..., "root":...}
//   {"type":"entry",  "batch":..., "entry":{...}}
//   {"type":"seal",   "batch":..., "time":...}
//   {"type":"undone", "batch":..., "time":..., "succeeded":n, "failed":n}
//
// Batches are undone strictly LIFO. Undone batches stay in the file as
// history.
class UndoLog {
public:
    explicit UndoLog(const QString& path);

    QString path() const { return m_path; }

    bool load(QString* error = nullptr);

    // ── Writing (used by the executor) ───────────────────────────
    QString beginBatch(OrganizeMode mode, const QString& destinationRoot, QString* error = nullptr);
    bool appendEntry(const QString& batchId, const UndoEntry& entry, QString* error = nullptr);
    bool sealBatch(const QString& batchId, QString* error = nullptr);

    // ── Reading ──────────────────────────────────────────────────
    QVector<UndoBatch> batches(bool includeUndone = false) const;   // oldest first
    std::optional<UndoBatch> lastBatch() const;                     // next to undo
    std::optional<UndoBatch> batch(const QString& batchId) const;

    // Reverses the most recent sealed batch, entries in reverse order.
    // Failed entries are reported and skipped; the batch is popped either way.
    UndoReport undoLastBatch(IFileOperations& fileOps, ITrackStore* store,
                             const RetryPolicy& retry = RetryPolicy());

private:
    bool appendRecord(const QJsonObject& record, QString* error);
    UndoBatch* findBatch(const QString& batchId);
    UndoOutcome undoEntry(const UndoEntry& entry, IFileOperations& fileOps, ITrackStore* store,
                          const RetryPolicy& retry);

    QString m_path;
    QVector<UndoBatch> m_batches;
};
