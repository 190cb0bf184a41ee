#include "UndoLog.h"
#include "../library/ITrackStore.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QUuid>

#include <unistd.h>

// ═══════════════════════════════════════════════════════════════════════
//  UndoEntry serialization
// ═══════════════════════════════════════════════════════════════════════

QJsonObject UndoEntry::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("track")] = trackId;
    obj[QStringLiteral("source")] = sourcePath;
    obj[QStringLiteral("target")] = targetPath;
    obj[QStringLiteral("op")] = planOperationToString(operation);
    if (!createdDirs.isEmpty())
        obj[QStringLiteral("createdDirs")] = QJsonArray::fromStringList(createdDirs);
    return obj;
}

std::optional<UndoEntry> UndoEntry::fromJson(const QJsonObject& obj)
{
    UndoEntry e;
    e.trackId = obj.value(QStringLiteral("track")).toString();
    e.sourcePath = obj.value(QStringLiteral("source")).toString();
    e.targetPath = obj.value(QStringLiteral("target")).toString();
    e.operation = planOperationFromString(obj.value(QStringLiteral("op")).toString());
    for (const auto& v : obj.value(QStringLiteral("createdDirs")).toArray())
        e.createdDirs.append(v.toString());

    if (e.sourcePath.isEmpty() || e.targetPath.isEmpty())
        return std::nullopt;
    switch (e.operation) {
    case PlanOperation::Move:
    case PlanOperation::Copy:
    case PlanOperation::Link:
    case PlanOperation::Quarantine:
    case PlanOperation::Trash:
        return e;
    case PlanOperation::NoOp:
    case PlanOperation::Conflict:
        break;
    }
    return std::nullopt;
}

// ═══════════════════════════════════════════════════════════════════════
//  Loading
// ═══════════════════════════════════════════════════════════════════════

UndoLog::UndoLog(const QString& path)
    : m_path(path)
{
}

UndoBatch* UndoLog::findBatch(const QString& batchId)
{
    for (auto& b : m_batches) {
        if (b.id == batchId)
            return &b;
    }
    return nullptr;
}

bool UndoLog::load(QString* error)
{
    m_batches.clear();

    QFile file(m_path);
    if (!file.exists())
        return true;   // nothing executed yet
    if (!file.open(QIODevice::ReadOnly)) {
        if (error)
            *error = QStringLiteral("Cannot open undo log %1: %2").arg(m_path, file.errorString());
        qWarning() << "[UndoLog] Cannot open" << m_path << file.errorString();
        return false;
    }

    int lineNo = 0;
    int skipped = 0;
    while (!file.atEnd()) {
        const QByteArray line = file.readLine().trimmed();
        ++lineNo;
        if (line.isEmpty())
            continue;

        QJsonParseError parseError;
        const QJsonDocument doc = QJsonDocument::fromJson(line, &parseError);
        if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
            qWarning() << "[UndoLog] Skipping unreadable line" << lineNo << parseError.errorString();
            ++skipped;
            continue;
        }

        const QJsonObject rec = doc.object();
        const QString type = rec.value(QStringLiteral("type")).toString();
        const QString batchId = rec.value(QStringLiteral("batch")).toString();
        const QDateTime time = QDateTime::fromString(rec.value(QStringLiteral("time")).toString(),
                                                     Qt::ISODateWithMs);

        if (type == QLatin1String("begin")) {
            UndoBatch b;
            b.id = batchId;
            b.startedAt = time;
            b.mode = organizeModeFromString(rec.value(QStringLiteral("mode")).toString());
            b.destinationRoot = rec.value(QStringLiteral("root")).toString();
            m_batches.append(b);
            continue;
        }

        UndoBatch* b = findBatch(batchId);
        if (!b) {
            qWarning() << "[UndoLog] Line" << lineNo << "refers to unknown batch" << batchId;
            ++skipped;
            continue;
        }

        if (type == QLatin1String("entry")) {
            auto entry = UndoEntry::fromJson(rec.value(QStringLiteral("entry")).toObject());
            if (entry)
                b->entries.append(*entry);
            else
                ++skipped;
        } else if (type == QLatin1String("seal")) {
            b->sealed = true;
            b->sealedAt = time;
        } else if (type == QLatin1String("undone")) {
            b->undone = true;
            b->undoneAt = time;
        } else {
            ++skipped;
        }
    }

    // Interrupted runs still hold committed operations, keep them undoable
    for (auto& b : m_batches) {
        if (!b.sealed) {
            qWarning() << "[UndoLog] Batch" << b.id << "was never sealed; treating it as sealed with"
                       << b.entries.size() << "entries";
            b.sealed = true;
            b.sealedAt = b.startedAt;
        }
    }

    qDebug() << "[UndoLog] Loaded" << m_batches.size() << "batches from" << m_path
             << (skipped ? QStringLiteral("(%1 records skipped)").arg(skipped) : QString());
    return true;
}

// ═══════════════════════════════════════════════════════════════════════
//  Writing
// ═══════════════════════════════════════════════════════════════════════

bool UndoLog::appendRecord(const QJsonObject& record, QString* error)
{
    const QString dir = QFileInfo(m_path).absolutePath();
    if (!QDir().mkpath(dir)) {
        if (error)
            *error = QStringLiteral("Cannot create %1").arg(dir);
        return false;
    }

    QFile file(m_path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append)) {
        if (error)
            *error = QStringLiteral("Cannot open undo log %1: %2").arg(m_path, file.errorString());
        qCritical() << "[UndoLog] Cannot open" << m_path << file.errorString();
        return false;
    }

    QByteArray line = QJsonDocument(record).toJson(QJsonDocument::Compact);
    line.append('\n');
    if (file.write(line) != line.size() || !file.flush()) {
        if (error)
            *error = QStringLiteral("Write to undo log failed: %1").arg(file.errorString());
        qCritical() << "[UndoLog] Write failed" << file.errorString();
        return false;
    }
    if (::fsync(file.handle()) != 0) {
        if (error)
            *error = QStringLiteral("fsync of undo log failed");
        qCritical() << "[UndoLog] fsync failed for" << m_path;
        return false;
    }
    return true;
}

QString UndoLog::beginBatch(OrganizeMode mode, const QString& destinationRoot, QString* error)
{
    UndoBatch b;
    b.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    b.startedAt = QDateTime::currentDateTimeUtc();
    b.mode = mode;
    b.destinationRoot = destinationRoot;

    QJsonObject rec;
    rec[QStringLiteral("type")] = QStringLiteral("begin");
    rec[QStringLiteral("batch")] = b.id;
    rec[QStringLiteral("time")] = b.startedAt.toString(Qt::ISODateWithMs);
    rec[QStringLiteral("mode")] = organizeModeToString(mode);
    rec[QStringLiteral("root")] = destinationRoot;
    if (!appendRecord(rec, error))
        return QString();

    m_batches.append(b);
    return b.id;
}

bool UndoLog::appendEntry(const QString& batchId, const UndoEntry& entry, QString* error)
{
    UndoBatch* b = findBatch(batchId);
    if (!b || b->sealed) {
        if (error)
            *error = QStringLiteral("Batch %1 is not open").arg(batchId);
        return false;
    }

    QJsonObject rec;
    rec[QStringLiteral("type")] = QStringLiteral("entry");
    rec[QStringLiteral("batch")] = batchId;
    rec[QStringLiteral("entry")] = entry.toJson();
    if (!appendRecord(rec, error))
        return false;

    b->entries.append(entry);
    return true;
}

bool UndoLog::sealBatch(const QString& batchId, QString* error)
{
    UndoBatch* b = findBatch(batchId);
    if (!b) {
        if (error)
            *error = QStringLiteral("Unknown batch %1").arg(batchId);
        return false;
    }
    if (b->sealed)
        return true;

    const QDateTime now = QDateTime::currentDateTimeUtc();
    QJsonObject rec;
    rec[QStringLiteral("type")] = QStringLiteral("seal");
    rec[QStringLiteral("batch")] = batchId;
    rec[QStringLiteral("time")] = now.toString(Qt::ISODateWithMs);
    rec[QStringLiteral("entries")] = b->entries.size();
    if (!appendRecord(rec, error))
        return false;

    b->sealed = true;
    b->sealedAt = now;
    qDebug() << "[UndoLog] Sealed batch" << batchId << "with" << b->entries.size() << "entries";
    return true;
}

// ═══════════════════════════════════════════════════════════════════════
//  Reading
// ═══════════════════════════════════════════════════════════════════════

QVector<UndoBatch> UndoLog::batches(bool includeUndone) const
{
    QVector<UndoBatch> result;
    for (const auto& b : m_batches) {
        if (includeUndone || !b.undone)
            result.append(b);
    }
    return result;
}

std::optional<UndoBatch> UndoLog::lastBatch() const
{
    for (int i = m_batches.size() - 1; i >= 0; --i) {
        const UndoBatch& b = m_batches.at(i);
        if (b.sealed && !b.undone)
            return b;
    }
    return std::nullopt;
}

std::optional<UndoBatch> UndoLog::batch(const QString& batchId) const
{
    for (const auto& b : m_batches) {
        if (b.id == batchId)
            return b;
    }
    return std::nullopt;
}

// ═══════════════════════════════════════════════════════════════════════
//  Undo
// ═══════════════════════════════════════════════════════════════════════

UndoOutcome UndoLog::undoEntry(const UndoEntry& entry, IFileOperations& fileOps, ITrackStore* store,
                               const RetryPolicy& retry)
{
    UndoOutcome outcome;
    outcome.entry = entry;

    auto fail = [&outcome](FailureKind kind, const QString& message) {
        outcome.failure = kind;
        outcome.message = message;
        return outcome;
    };

    if (!fileOps.exists(entry.targetPath))
        return fail(FailureKind::SourceMissing,
                    QStringLiteral("%1 is gone").arg(entry.targetPath));

    switch (entry.operation) {
    case PlanOperation::Copy:
    case PlanOperation::Link: {
        FileOpResult r = retryTransient(retry, [&] { return fileOps.removeFile(entry.targetPath); });
        if (!r.ok())
            return fail(r.failure, r.message);
        break;
    }
    case PlanOperation::Move:
    case PlanOperation::Quarantine:
    case PlanOperation::Trash: {
        if (fileOps.exists(entry.sourcePath))
            return fail(FailureKind::ConflictOnUndo,
                        QStringLiteral("%1 is occupied by another file").arg(entry.sourcePath));

        FileOpResult r = fileOps.makePath(QFileInfo(entry.sourcePath).absolutePath(), nullptr);
        if (!r.ok())
            return fail(r.failure, r.message);
        r = retryTransient(retry, [&] { return fileOps.moveFile(entry.targetPath, entry.sourcePath); });
        if (!r.ok())
            return fail(r.failure, r.message);

        if (store && !entry.trackId.isEmpty()) {
            if (entry.operation == PlanOperation::Trash && !store->restoreDeleted(entry.trackId))
                qWarning() << "[UndoLog] Could not restore catalog record" << entry.trackId;
            if (!store->updatePath(entry.trackId, entry.sourcePath))
                qWarning() << "[UndoLog] File restored but catalog path not updated for"
                           << entry.trackId;
        }
        break;
    }
    case PlanOperation::NoOp:
    case PlanOperation::Conflict:
        return fail(FailureKind::IOError, QStringLiteral("entry kind cannot be undone"));
    }

    // Remove what the executor created for this entry, deepest first;
    // rmdir leaves anything non-empty alone
    for (int i = entry.createdDirs.size() - 1; i >= 0; --i)
        fileOps.removeEmptyDirectory(entry.createdDirs.at(i));

    return outcome;
}

UndoReport UndoLog::undoLastBatch(IFileOperations& fileOps, ITrackStore* store, const RetryPolicy& retry)
{
    UndoReport report;

    int index = -1;
    for (int i = m_batches.size() - 1; i >= 0; --i) {
        if (m_batches.at(i).sealed && !m_batches.at(i).undone) {
            index = i;
            break;
        }
    }
    if (index < 0) {
        qDebug() << "[UndoLog] Nothing to undo";
        return report;
    }

    const UndoBatch b = m_batches.at(index);
    report.batchId = b.id;
    qDebug() << "[UndoLog] Undoing batch" << b.id << "(" << organizeModeToString(b.mode) << ","
             << b.entries.size() << "entries)";

    for (int i = b.entries.size() - 1; i >= 0; --i) {
        UndoOutcome outcome = undoEntry(b.entries.at(i), fileOps, store, retry);
        ++report.attempted;
        if (outcome.ok()) {
            ++report.succeeded;
        } else {
            ++report.failed;
            qWarning() << "[UndoLog] Undo failed:" << failureKindToString(outcome.failure)
                       << outcome.message;
        }
        report.outcomes.append(outcome);
    }

    const QDateTime now = QDateTime::currentDateTimeUtc();
    QJsonObject rec;
    rec[QStringLiteral("type")] = QStringLiteral("undone");
    rec[QStringLiteral("batch")] = b.id;
    rec[QStringLiteral("time")] = now.toString(Qt::ISODateWithMs);
    rec[QStringLiteral("succeeded")] = report.succeeded;
    rec[QStringLiteral("failed")] = report.failed;
    QString error;
    if (!appendRecord(rec, &error)) {
        report.error = error;
        qCritical() << "[UndoLog] Could not archive batch" << b.id << error;
    }
    m_batches[index].undone = true;
    m_batches[index].undoneAt = now;

    qDebug() << "[UndoLog] Undo of" << b.id << ":" << report.succeeded << "restored,"
             << report.failed << "failed";
    return report;
}
