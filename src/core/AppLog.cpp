#include "AppLog.h"

#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QStandardPaths>
#include <atomic>
#include <cstdio>

namespace {

QFile s_logFile;
QMutex s_mutex;
std::atomic<bool> s_verbose{false};

const char* levelTag(QtMsgType type)
{
    switch (type) {
    case QtDebugMsg:    return "D";
    case QtInfoMsg:     return "I";
    case QtWarningMsg:  return "W";
    case QtCriticalMsg: return "E";
    case QtFatalMsg:    return "F";
    }
    return "?";
}

void messageHandler(QtMsgType type, const QMessageLogContext&, const QString& msg)
{
    if (type == QtDebugMsg && !s_verbose.load())
        return;

    QMutexLocker lock(&s_mutex);
    QString line = QStringLiteral("[%1] %2 %3\n")
        .arg(QDateTime::currentDateTime().toString(QStringLiteral("HH:mm:ss.zzz")),
             QLatin1String(levelTag(type)), msg);
    QByteArray utf8 = line.toUtf8();
    if (s_logFile.isOpen()) {
        s_logFile.write(utf8);
        s_logFile.flush();
    }
    fprintf(stderr, "%s", utf8.constData());
}

} // anonymous namespace

namespace AppLog {

QString defaultLogPath()
{
    return QStandardPaths::writableLocation(QStandardPaths::AppDataLocation)
           + QStringLiteral("/reshelf.log");
}

bool install(const QString& logPath, bool verbose)
{
    s_verbose.store(verbose);

    bool opened = false;
    {
        QMutexLocker lock(&s_mutex);
        if (s_logFile.isOpen())
            s_logFile.close();
        if (!logPath.isEmpty()) {
            QDir().mkpath(QFileInfo(logPath).absolutePath());
            s_logFile.setFileName(logPath);
            opened = s_logFile.open(QIODevice::WriteOnly | QIODevice::Append);
        }
    }

    qInstallMessageHandler(messageHandler);
    if (!logPath.isEmpty() && !opened)
        qWarning() << "[AppLog] Cannot open log file" << logPath;
    return opened;
}

void uninstall()
{
    qInstallMessageHandler(nullptr);
    QMutexLocker lock(&s_mutex);
    if (s_logFile.isOpen())
        s_logFile.close();
}

} // namespace AppLog
