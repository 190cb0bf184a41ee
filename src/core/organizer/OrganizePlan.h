#pragma once

#include <QDateTime>
#include <QJsonObject>
#include <QString>
#include <QStringList>
#include <QVector>

enum class OrganizeMode { Simulate, Move, Copy, Link };

enum class PlanOperation {
    NoOp,         // already in place
    Move,
    Copy,
    Link,
    Quarantine,   // duplicate loser → quarantine directory
    Trash,        // duplicate loser → safe-trash directory, record deleted
    Conflict      // left for the user; never executed
};

enum class ConflictReason {
    None,
    MissingField,         // template could not be rendered for this track
    TargetCollision,      // disambiguation exhausted
    PathChain,            // target is another moving entry's source
    InvalidDestination
};

QString       organizeModeToString(OrganizeMode mode);
OrganizeMode  organizeModeFromString(const QString& str, bool* ok = nullptr);
QString       planOperationToString(PlanOperation op);
PlanOperation planOperationFromString(const QString& str);
QString       conflictReasonToString(ConflictReason reason);

struct PlanEntry {
    QString        trackId;
    QString        sourcePath;     // absolute, normalized
    QString        targetPath;     // absolute, normalized
    PlanOperation  operation = PlanOperation::NoOp;
    ConflictReason conflict = ConflictReason::None;
    QString        detail;         // human-readable reason / adjustment note
    bool           disambiguated = false;

    bool isMutation() const;       // something the executor would apply
    QJsonObject toJson() const;
};

// The full proposed source → target mapping of one run. This is what the
// user previews and what the executor consumes.
struct OrganizePlan {
    QString            destinationRoot;
    QString            templatePattern;
    OrganizeMode       mode = OrganizeMode::Simulate;
    QDateTime          createdAt;
    QVector<PlanEntry> entries;
    QStringList        excludedTrackIds;   // filtered out before planning

    int count(PlanOperation op) const;
    int mutationCount() const;
    int conflictCount() const { return count(PlanOperation::Conflict); }

    QString     toCsv() const;
    QJsonObject toJson() const;
    bool        writeCsv(const QString& path, QString* error = nullptr) const;
    QString     toTable() const;   // plain-text preview for terminals
};
