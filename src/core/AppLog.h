#pragma once

#include <QString>

// Process-wide Qt message handler: every qDebug/qInfo/qWarning/qCritical
// line is timestamped, appended to the log file and mirrored to stderr.
namespace AppLog {

// Debug lines are dropped unless verbose. Returns false if the log file
// could not be opened (stderr output still works).
bool install(const QString& logPath, bool verbose);
void uninstall();

QString defaultLogPath();

} // namespace AppLog
