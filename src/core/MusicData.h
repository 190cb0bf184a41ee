#ifndef MUSICDATA_H
#define MUSICDATA_H

#include <QByteArray>
#include <QString>
#include <QStringList>
#include <QVector>
#include <optional>

// ── Audio Format Enum ───────────────────────────────────────────────
enum class AudioFormat {
    Unknown,
    FLAC,
    ALAC,
    WAV,
    AIFF,
    APE,
    WavPack,
    DSD,
    MP3,
    AAC,
    OGG,
    Opus,
    WMA
};

AudioFormat audioFormatFromExtension(const QString& suffix);
AudioFormat audioFormatFromString(const QString& str);
QString     audioFormatToString(AudioFormat format);
bool        isLosslessFormat(AudioFormat format);

// ── Catalog record ──────────────────────────────────────────────────
// One row per audio file, as produced by the scanner and filled in by
// metadata enrichment. Text tags are "absent" when empty; numeric tags
// use std::optional so that 0 stays a legal value.
struct Track {
    QString id;
    QString filePath;           // absolute
    qint64  fileSize = 0;       // bytes
    double  duration = 0.0;     // seconds, 0 = unknown
    AudioFormat format = AudioFormat::Unknown;
    int     bitrate = 0;        // kbps, 0 = unknown

    QString title;
    QString artist;
    QString albumArtist;        // ALBUMARTIST tag: used for compilations/VA albums
    QString album;
    QString genre;
    std::optional<int> year;
    std::optional<int> trackNumber;
    QString releaseId;          // MusicBrainz release ID

    std::optional<QByteArray> contentHash;  // partial hash, computed lazily
    bool    deleted = false;

    QString extension() const;  // lower-case suffix without the dot
};

// ── Display helpers ─────────────────────────────────────────────────
QString formatDuration(double seconds);
QString formatFileSize(qint64 bytes);

#endif // MUSICDATA_H
