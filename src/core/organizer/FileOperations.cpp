#include "FileOperations.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QThread>

#include <cerrno>
#include <cstring>
#include <sys/stat.h>
#include <unistd.h>

QString failureKindToString(FailureKind kind)
{
    switch (kind) {
    case FailureKind::None:             return QString();
    case FailureKind::TargetExists:     return QStringLiteral("TargetExists");
    case FailureKind::SourceMissing:    return QStringLiteral("SourceMissing");
    case FailureKind::PermissionDenied: return QStringLiteral("PermissionDenied");
    case FailureKind::ConflictOnUndo:   return QStringLiteral("ConflictOnUndo");
    case FailureKind::IOError:          return QStringLiteral("IOError");
    case FailureKind::CatalogError:     return QStringLiteral("CatalogError");
    case FailureKind::Cancelled:        return QStringLiteral("Cancelled");
    }
    return QString();
}

FileOpResult FileOpResult::fail(FailureKind kind, const QString& message, int sysError, bool transient)
{
    FileOpResult r;
    r.failure = kind;
    r.message = message;
    r.sysError = sysError;
    r.transient = transient;
    return r;
}

FileOpResult retryTransient(const RetryPolicy& policy, const std::function<FileOpResult()>& op,
                            int* attempts)
{
    int delay = qMax(0, policy.retryDelayMs);
    int attempt = 0;
    FileOpResult result;
    for (;;) {
        ++attempt;
        result = op();
        if (result.ok() || !result.transient || attempt > policy.maxRetries)
            break;
        qWarning() << "[FileOps] Transient failure, retrying in" << delay << "ms:" << result.message;
        if (delay > 0)
            QThread::msleep(static_cast<unsigned long>(delay));
        delay *= 2;
    }
    if (attempts)
        *attempts = attempt;
    return result;
}

FileOpResult LocalFileOperations::fromErrno(int err, const QString& context)
{
    const QString message = context + QStringLiteral(": ") + QString::fromLocal8Bit(std::strerror(err));
    switch (err) {
    case ENOENT:
    case ENOTDIR:
        return FileOpResult::fail(FailureKind::SourceMissing, message, err);
    case EACCES:
    case EPERM:
    case EROFS:
        return FileOpResult::fail(FailureKind::PermissionDenied, message, err);
    case EEXIST:
    case ENOTEMPTY:
        return FileOpResult::fail(FailureKind::TargetExists, message, err);
    case EAGAIN:
#if EWOULDBLOCK != EAGAIN
    case EWOULDBLOCK:
#endif
    case EBUSY:
    case EINTR:
        return FileOpResult::fail(FailureKind::IOError, message, err, true);
    default:
        return FileOpResult::fail(FailureKind::IOError, message, err);
    }
}

static QByteArray native(const QString& path)
{
    return QFile::encodeName(path);
}

// ═══════════════════════════════════════════════════════════════════════
//  Queries
// ═══════════════════════════════════════════════════════════════════════

bool LocalFileOperations::exists(const QString& path) const
{
    QFileInfo fi(path);
    return fi.exists() || fi.isSymLink();
}

bool LocalFileOperations::isReadable(const QString& path) const
{
    return QFileInfo(path).isReadable();
}

bool LocalFileOperations::canCreateDirectory(const QString& dirPath) const
{
    QString current = QDir::cleanPath(dirPath);
    QFileInfo fi(current);
    while (!fi.exists()) {
        const QString parent = fi.absolutePath();
        if (parent == current)
            return false;
        current = parent;
        fi = QFileInfo(current);
    }
    return fi.isDir() && fi.isWritable();
}

bool LocalFileOperations::sameContent(const QString& a, const QString& b) const
{
    QFile fa(a);
    QFile fb(b);
    if (!fa.open(QIODevice::ReadOnly) || !fb.open(QIODevice::ReadOnly))
        return false;
    if (fa.size() != fb.size())
        return false;

    constexpr qint64 kChunk = 64 * 1024;
    while (!fa.atEnd()) {
        const QByteArray ca = fa.read(kChunk);
        const QByteArray cb = fb.read(kChunk);
        if (ca != cb)
            return false;
        if (ca.isEmpty())
            break;
    }
    return true;
}

// ═══════════════════════════════════════════════════════════════════════
//  Mutations
// ═══════════════════════════════════════════════════════════════════════

FileOpResult LocalFileOperations::makePath(const QString& dirPath, QStringList* created)
{
    QStringList missing;
    QString current = QDir::cleanPath(QDir(dirPath).absolutePath());
    QFileInfo fi(current);
    while (!fi.exists()) {
        missing.prepend(current);
        const QString parent = fi.absolutePath();
        if (parent == current)
            break;
        current = parent;
        fi = QFileInfo(current);
    }
    if (fi.exists() && !fi.isDir())
        return FileOpResult::fail(FailureKind::IOError,
                                  QStringLiteral("%1 is not a directory").arg(current));

    for (const QString& dir : missing) {
        if (::mkdir(native(dir).constData(), 0777) != 0) {
            const int err = errno;
            if (err == EEXIST && QFileInfo(dir).isDir())
                continue;   // raced with someone else, fine
            return fromErrno(err, QStringLiteral("mkdir %1").arg(dir));
        }
        if (created)
            created->append(dir);
    }
    return FileOpResult::success();
}

FileOpResult LocalFileOperations::moveFile(const QString& from, const QString& to)
{
    if (exists(to))
        return FileOpResult::fail(FailureKind::TargetExists, QStringLiteral("%1 already exists").arg(to));

    if (::rename(native(from).constData(), native(to).constData()) == 0)
        return FileOpResult::success();

    const int err = errno;
    if (err != EXDEV)
        return fromErrno(err, QStringLiteral("rename %1").arg(from));

    // Different filesystems: copy, then drop the original
    FileOpResult copied = copyFile(from, to);
    if (!copied.ok())
        return copied;
    FileOpResult removed = removeFile(from);
    if (!removed.ok()) {
        QFile::remove(to);
        return removed;
    }
    return FileOpResult::success();
}

FileOpResult LocalFileOperations::copyFile(const QString& from, const QString& to)
{
    if (exists(to))
        return FileOpResult::fail(FailureKind::TargetExists, QStringLiteral("%1 already exists").arg(to));
    if (!QFileInfo::exists(from))
        return FileOpResult::fail(FailureKind::SourceMissing, QStringLiteral("%1 does not exist").arg(from));

    // Copy beside the target, then rename into place
    const QString partial = to + QStringLiteral(".reshelf-part");
    if (QFileInfo::exists(partial))
        QFile::remove(partial);

    QFile source(from);
    if (!source.copy(partial)) {
        const QString reason = source.errorString();
        QFile::remove(partial);
        if (!isReadable(from))
            return FileOpResult::fail(FailureKind::PermissionDenied,
                                      QStringLiteral("copy %1: %2").arg(from, reason));
        if (source.error() == QFileDevice::PermissionsError)
            return FileOpResult::fail(FailureKind::PermissionDenied,
                                      QStringLiteral("copy %1: %2").arg(from, reason));
        return FileOpResult::fail(FailureKind::IOError, QStringLiteral("copy %1: %2").arg(from, reason));
    }

    {
        QFile copy(partial);
        if (copy.open(QIODevice::Append))
            copy.setFileTime(QFileInfo(from).lastModified(), QFileDevice::FileModificationTime);
    }

    if (exists(to)) {
        QFile::remove(partial);
        return FileOpResult::fail(FailureKind::TargetExists, QStringLiteral("%1 already exists").arg(to));
    }
    if (::rename(native(partial).constData(), native(to).constData()) != 0) {
        const int err = errno;
        QFile::remove(partial);
        return fromErrno(err, QStringLiteral("rename %1").arg(partial));
    }
    return FileOpResult::success();
}

FileOpResult LocalFileOperations::linkFile(const QString& from, const QString& to)
{
    if (exists(to))
        return FileOpResult::fail(FailureKind::TargetExists, QStringLiteral("%1 already exists").arg(to));

    if (::link(native(from).constData(), native(to).constData()) == 0)
        return FileOpResult::success();

    const int err = errno;
    const bool hardLinkUnsupported = err == EXDEV || err == EPERM || err == EMLINK
                                  || err == EOPNOTSUPP;
    if (!hardLinkUnsupported)
        return fromErrno(err, QStringLiteral("link %1").arg(from));

    qDebug() << "[FileOps] Hard link unavailable for" << from << "- using a symlink";
    if (::symlink(native(from).constData(), native(to).constData()) != 0)
        return fromErrno(errno, QStringLiteral("symlink %1").arg(from));
    return FileOpResult::success();
}

FileOpResult LocalFileOperations::removeFile(const QString& path)
{
    if (::unlink(native(path).constData()) != 0)
        return fromErrno(errno, QStringLiteral("unlink %1").arg(path));
    return FileOpResult::success();
}

bool LocalFileOperations::removeEmptyDirectory(const QString& dirPath)
{
    return ::rmdir(native(dirPath).constData()) == 0;
}
