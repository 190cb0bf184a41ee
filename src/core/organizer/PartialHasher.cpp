#include "PartialHasher.h"

#include <QCryptographicHash>
#include <QFile>
#include <QtEndian>

static bool readSample(QFile& file, qint64 offset, qint64 length, QCryptographicHash& hash)
{
    if (!file.seek(offset))
        return false;
    QByteArray chunk = file.read(length);
    if (chunk.size() != length)
        return false;
    hash.addData(chunk);
    return true;
}

std::optional<QByteArray> PartialHasher::hashFile(const QString& filePath, qint64 sampleSize,
                                                  QString* error)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        if (error)
            *error = file.errorString();
        return std::nullopt;
    }

    if (sampleSize <= 0)
        sampleSize = kDefaultSampleSize;

    const qint64 size = file.size();
    QCryptographicHash hash(QCryptographicHash::Sha256);

    // Size goes into the digest so that two files sharing their samples
    // but differing in length never collide
    const quint64 sizeLE = qToLittleEndian(static_cast<quint64>(size));
    hash.addData(QByteArray(reinterpret_cast<const char*>(&sizeLE), sizeof(sizeLE)));

    bool ok = true;
    if (size <= sampleSize * 3) {
        ok = readSample(file, 0, size, hash);
    } else {
        ok = readSample(file, 0, sampleSize, hash)
          && readSample(file, size / 2 - sampleSize / 2, sampleSize, hash)
          && readSample(file, size - sampleSize, sampleSize, hash);
    }

    if (!ok) {
        if (error)
            *error = file.errorString().isEmpty() ? QStringLiteral("short read") : file.errorString();
        return std::nullopt;
    }

    return hash.result().toHex();
}
