#include "MusicData.h"

#include <QFileInfo>
#include <QHash>
#include <cmath>

// ═════════════════════════════════════════════════════════════════════
//  Audio format helpers
// ═════════════════════════════════════════════════════════════════════

AudioFormat audioFormatFromExtension(const QString& suffix)
{
    static const QHash<QString, AudioFormat> kByExtension = {
        { QStringLiteral("flac"), AudioFormat::FLAC },
        { QStringLiteral("alac"), AudioFormat::ALAC },
        { QStringLiteral("wav"),  AudioFormat::WAV },
        { QStringLiteral("aif"),  AudioFormat::AIFF },
        { QStringLiteral("aiff"), AudioFormat::AIFF },
        { QStringLiteral("ape"),  AudioFormat::APE },
        { QStringLiteral("wv"),   AudioFormat::WavPack },
        { QStringLiteral("dsf"),  AudioFormat::DSD },
        { QStringLiteral("dff"),  AudioFormat::DSD },
        { QStringLiteral("mp3"),  AudioFormat::MP3 },
        { QStringLiteral("m4a"),  AudioFormat::AAC },
        { QStringLiteral("aac"),  AudioFormat::AAC },
        { QStringLiteral("ogg"),  AudioFormat::OGG },
        { QStringLiteral("opus"), AudioFormat::Opus },
        { QStringLiteral("wma"),  AudioFormat::WMA },
    };
    QString key = suffix.toLower();
    if (key.startsWith(QLatin1Char('.')))
        key.remove(0, 1);
    return kByExtension.value(key, AudioFormat::Unknown);
}

QString audioFormatToString(AudioFormat format)
{
    switch (format) {
    case AudioFormat::Unknown: return QStringLiteral("Unknown");
    case AudioFormat::FLAC:    return QStringLiteral("FLAC");
    case AudioFormat::ALAC:    return QStringLiteral("ALAC");
    case AudioFormat::WAV:     return QStringLiteral("WAV");
    case AudioFormat::AIFF:    return QStringLiteral("AIFF");
    case AudioFormat::APE:     return QStringLiteral("APE");
    case AudioFormat::WavPack: return QStringLiteral("WavPack");
    case AudioFormat::DSD:     return QStringLiteral("DSD");
    case AudioFormat::MP3:     return QStringLiteral("MP3");
    case AudioFormat::AAC:     return QStringLiteral("AAC");
    case AudioFormat::OGG:     return QStringLiteral("OGG");
    case AudioFormat::Opus:    return QStringLiteral("Opus");
    case AudioFormat::WMA:     return QStringLiteral("WMA");
    }
    return QStringLiteral("Unknown");
}

AudioFormat audioFormatFromString(const QString& str)
{
    const QString s = str.trimmed().toUpper();
    if (s == QStringLiteral("FLAC"))    return AudioFormat::FLAC;
    if (s == QStringLiteral("ALAC"))    return AudioFormat::ALAC;
    if (s == QStringLiteral("WAV"))     return AudioFormat::WAV;
    if (s == QStringLiteral("AIFF"))    return AudioFormat::AIFF;
    if (s == QStringLiteral("APE"))     return AudioFormat::APE;
    if (s == QStringLiteral("WAVPACK")) return AudioFormat::WavPack;
    if (s == QStringLiteral("DSD"))     return AudioFormat::DSD;
    if (s == QStringLiteral("MP3"))     return AudioFormat::MP3;
    if (s == QStringLiteral("AAC"))     return AudioFormat::AAC;
    if (s == QStringLiteral("OGG"))     return AudioFormat::OGG;
    if (s == QStringLiteral("OPUS"))    return AudioFormat::Opus;
    if (s == QStringLiteral("WMA"))     return AudioFormat::WMA;
    // Scanner may hand us a bare extension instead of a codec label
    return audioFormatFromExtension(str.trimmed());
}

bool isLosslessFormat(AudioFormat format)
{
    switch (format) {
    case AudioFormat::FLAC:
    case AudioFormat::ALAC:
    case AudioFormat::WAV:
    case AudioFormat::AIFF:
    case AudioFormat::APE:
    case AudioFormat::WavPack:
    case AudioFormat::DSD:
        return true;
    case AudioFormat::Unknown:
    case AudioFormat::MP3:
    case AudioFormat::AAC:
    case AudioFormat::OGG:
    case AudioFormat::Opus:
    case AudioFormat::WMA:
        return false;
    }
    return false;
}

QString Track::extension() const
{
    return QFileInfo(filePath).suffix().toLower();
}

// ═════════════════════════════════════════════════════════════════════
//  Display helpers
// ═════════════════════════════════════════════════════════════════════

QString formatDuration(double seconds)
{
    int total = static_cast<int>(std::lround(seconds));
    int m = total / 60;
    int s = total % 60;
    return QString("%1:%2").arg(m).arg(s, 2, 10, QChar('0'));
}

QString formatFileSize(qint64 bytes)
{
    if (bytes < 1024)
        return QStringLiteral("%1 B").arg(bytes);
    if (bytes < 1024 * 1024)
        return QStringLiteral("%1 KB").arg(bytes / 1024.0, 0, 'f', 1);
    return QStringLiteral("%1 MB").arg(bytes / (1024.0 * 1024.0), 0, 'f', 1);
}
