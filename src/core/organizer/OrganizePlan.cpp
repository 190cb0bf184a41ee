#include "OrganizePlan.h"

#include <QDir>
#include <QFileInfo>
#include <QJsonArray>
#include <QSaveFile>
#include <QTextStream>

QString organizeModeToString(OrganizeMode mode)
{
    switch (mode) {
    case OrganizeMode::Simulate: return QStringLiteral("simulate");
    case OrganizeMode::Move:     return QStringLiteral("move");
    case OrganizeMode::Copy:     return QStringLiteral("copy");
    case OrganizeMode::Link:     return QStringLiteral("link");
    }
    return QStringLiteral("simulate");
}

OrganizeMode organizeModeFromString(const QString& str, bool* ok)
{
    const QString s = str.trimmed().toLower();
    if (ok) *ok = true;
    if (s == QStringLiteral("simulate")) return OrganizeMode::Simulate;
    if (s == QStringLiteral("move"))     return OrganizeMode::Move;
    if (s == QStringLiteral("copy"))     return OrganizeMode::Copy;
    if (s == QStringLiteral("link"))     return OrganizeMode::Link;
    if (ok) *ok = false;
    return OrganizeMode::Simulate;
}

QString planOperationToString(PlanOperation op)
{
    switch (op) {
    case PlanOperation::NoOp:       return QStringLiteral("no-op");
    case PlanOperation::Move:       return QStringLiteral("move");
    case PlanOperation::Copy:       return QStringLiteral("copy");
    case PlanOperation::Link:       return QStringLiteral("link");
    case PlanOperation::Quarantine: return QStringLiteral("quarantine");
    case PlanOperation::Trash:      return QStringLiteral("trash");
    case PlanOperation::Conflict:   return QStringLiteral("conflict");
    }
    return QStringLiteral("no-op");
}

PlanOperation planOperationFromString(const QString& str)
{
    if (str == QStringLiteral("move"))       return PlanOperation::Move;
    if (str == QStringLiteral("copy"))       return PlanOperation::Copy;
    if (str == QStringLiteral("link"))       return PlanOperation::Link;
    if (str == QStringLiteral("quarantine")) return PlanOperation::Quarantine;
    if (str == QStringLiteral("trash"))      return PlanOperation::Trash;
    if (str == QStringLiteral("conflict"))   return PlanOperation::Conflict;
    return PlanOperation::NoOp;
}

QString conflictReasonToString(ConflictReason reason)
{
    switch (reason) {
    case ConflictReason::None:               return QString();
    case ConflictReason::MissingField:       return QStringLiteral("missing-field");
    case ConflictReason::TargetCollision:    return QStringLiteral("target-collision");
    case ConflictReason::PathChain:          return QStringLiteral("path-chain");
    case ConflictReason::InvalidDestination: return QStringLiteral("invalid-destination");
    }
    return QString();
}

// ── PlanEntry ───────────────────────────────────────────────────────

bool PlanEntry::isMutation() const
{
    return operation != PlanOperation::NoOp && operation != PlanOperation::Conflict;
}

QJsonObject PlanEntry::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("trackId")] = trackId;
    obj[QStringLiteral("source")] = sourcePath;
    obj[QStringLiteral("target")] = targetPath;
    obj[QStringLiteral("operation")] = planOperationToString(operation);
    if (conflict != ConflictReason::None)
        obj[QStringLiteral("conflict")] = conflictReasonToString(conflict);
    if (!detail.isEmpty())
        obj[QStringLiteral("detail")] = detail;
    if (disambiguated)
        obj[QStringLiteral("disambiguated")] = true;
    return obj;
}

// ── OrganizePlan ────────────────────────────────────────────────────

int OrganizePlan::count(PlanOperation op) const
{
    int n = 0;
    for (const auto& e : entries) {
        if (e.operation == op)
            ++n;
    }
    return n;
}

int OrganizePlan::mutationCount() const
{
    int n = 0;
    for (const auto& e : entries) {
        if (e.isMutation())
            ++n;
    }
    return n;
}

static QString csvField(const QString& value)
{
    if (value.contains(QLatin1Char(',')) || value.contains(QLatin1Char('"'))
        || value.contains(QLatin1Char('\n')) || value.contains(QLatin1Char('\r'))) {
        QString escaped = value;
        escaped.replace(QStringLiteral("\""), QStringLiteral("\"\""));
        return QLatin1Char('"') + escaped + QLatin1Char('"');
    }
    return value;
}

QString OrganizePlan::toCsv() const
{
    QString out;
    QTextStream stream(&out);
    stream << "source,target,operation,reason\n";
    for (const auto& e : entries) {
        QString reason = conflictReasonToString(e.conflict);
        if (reason.isEmpty())
            reason = e.detail;
        stream << csvField(e.sourcePath) << ','
               << csvField(e.targetPath) << ','
               << planOperationToString(e.operation) << ','
               << csvField(reason) << '\n';
    }
    stream.flush();
    return out;
}

QJsonObject OrganizePlan::toJson() const
{
    QJsonArray rows;
    for (const auto& e : entries)
        rows.append(e.toJson());

    QJsonObject obj;
    obj[QStringLiteral("destinationRoot")] = destinationRoot;
    obj[QStringLiteral("template")] = templatePattern;
    obj[QStringLiteral("mode")] = organizeModeToString(mode);
    obj[QStringLiteral("createdAt")] = createdAt.toString(Qt::ISODateWithMs);
    obj[QStringLiteral("entries")] = rows;
    if (!excludedTrackIds.isEmpty())
        obj[QStringLiteral("excluded")] = QJsonArray::fromStringList(excludedTrackIds);
    return obj;
}

bool OrganizePlan::writeCsv(const QString& path, QString* error) const
{
    QDir().mkpath(QFileInfo(path).absolutePath());

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        if (error) *error = file.errorString();
        return false;
    }
    file.write(toCsv().toUtf8());
    if (!file.commit()) {
        if (error) *error = file.errorString();
        return false;
    }
    return true;
}

QString OrganizePlan::toTable() const
{
    QString out;
    QTextStream stream(&out);
    for (const auto& e : entries) {
        stream << QStringLiteral("%1  %2\n").arg(planOperationToString(e.operation), -10).arg(e.sourcePath);
        if (e.operation != PlanOperation::NoOp)
            stream << QStringLiteral("%1→ %2").arg(QString(), 12).arg(e.targetPath);
        if (e.conflict != ConflictReason::None)
            stream << QStringLiteral("  [%1]").arg(conflictReasonToString(e.conflict));
        else if (e.disambiguated)
            stream << QStringLiteral("  [renamed]");
        if (e.operation != PlanOperation::NoOp || e.conflict != ConflictReason::None)
            stream << '\n';
    }
    stream << QStringLiteral("%1 entries: %2 to apply, %3 in place, %4 conflicts\n")
                  .arg(entries.size())
                  .arg(mutationCount())
                  .arg(count(PlanOperation::NoOp))
                  .arg(conflictCount());
    stream.flush();
    return out;
}
