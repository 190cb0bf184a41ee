#pragma once

#include <QByteArray>
#include <QString>
#include <optional>

// Content fingerprint from fixed-size samples at the head, middle and
// tail of a file (plus its size). Cheap enough to run over a whole
// duplicate candidate set; not a full-file checksum.
class PartialHasher {
public:
    static constexpr qint64 kDefaultSampleSize = 64 * 1024;

    // Hex digest, or nullopt when the file cannot be read.
    static std::optional<QByteArray> hashFile(const QString& filePath,
                                              qint64 sampleSize = kDefaultSampleSize,
                                              QString* error = nullptr);
};
