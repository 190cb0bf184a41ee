#pragma once

#include <QString>
#include <QStringList>
#include <functional>

// Per-entry failure taxonomy shared by execution and undo.
enum class FailureKind {
    None,
    TargetExists,
    SourceMissing,
    PermissionDenied,
    ConflictOnUndo,
    IOError,
    CatalogError,     // file applied, but the track record could not follow
    Cancelled
};

QString failureKindToString(FailureKind kind);

struct FileOpResult {
    FailureKind failure = FailureKind::None;
    bool        transient = false;   // worth retrying (EAGAIN, EBUSY, EINTR)
    int         sysError = 0;
    QString     message;

    bool ok() const { return failure == FailureKind::None; }

    static FileOpResult success() { return FileOpResult(); }
    static FileOpResult fail(FailureKind kind, const QString& message, int sysError = 0,
                             bool transient = false);
};

// Bounded retry for transient failures only; logical errors return at once.
struct RetryPolicy {
    int maxRetries = 3;
    int retryDelayMs = 50;   // doubled after each attempt
};

FileOpResult retryTransient(const RetryPolicy& policy, const std::function<FileOpResult()>& op,
                            int* attempts = nullptr);

// Filesystem seam used by the executor, the undo log and the planner's
// identical-content check. Tests substitute a fault-injecting subclass.
class IFileOperations {
public:
    virtual ~IFileOperations() = default;

    // ── Queries ──────────────────────────────────────────────────
    virtual bool exists(const QString& path) const = 0;   // dangling symlinks count
    virtual bool isReadable(const QString& path) const = 0;
    // True when dirPath exists as a writable directory, or could be
    // created under its nearest existing ancestor.
    virtual bool canCreateDirectory(const QString& dirPath) const = 0;
    virtual bool sameContent(const QString& a, const QString& b) const = 0;

    // ── Mutations ────────────────────────────────────────────────
    // Recursive and idempotent; directories that did not exist before are
    // appended to created, outermost first.
    virtual FileOpResult makePath(const QString& dirPath, QStringList* created) = 0;
    virtual FileOpResult moveFile(const QString& from, const QString& to) = 0;
    virtual FileOpResult copyFile(const QString& from, const QString& to) = 0;
    virtual FileOpResult linkFile(const QString& from, const QString& to) = 0;
    virtual FileOpResult removeFile(const QString& path) = 0;
    virtual bool removeEmptyDirectory(const QString& dirPath) = 0;
};

// Local disk implementation (Qt file API plus POSIX for rename/link).
// None of the mutations overwrite an existing target.
class LocalFileOperations : public IFileOperations {
public:
    bool exists(const QString& path) const override;
    bool isReadable(const QString& path) const override;
    bool canCreateDirectory(const QString& dirPath) const override;
    bool sameContent(const QString& a, const QString& b) const override;

    FileOpResult makePath(const QString& dirPath, QStringList* created) override;
    FileOpResult moveFile(const QString& from, const QString& to) override;
    FileOpResult copyFile(const QString& from, const QString& to) override;
    FileOpResult linkFile(const QString& from, const QString& to) override;
    FileOpResult removeFile(const QString& path) override;
    bool removeEmptyDirectory(const QString& dirPath) override;

    static FileOpResult fromErrno(int err, const QString& context);
};
