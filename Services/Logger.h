#pragma once
#include <QString>
#include <QDateTime>
#include <QtGlobal>

enum class LogLevel { Debug = 10, Info = 20, Warning = 30, Error = 40, Critical = 50 };

struct LogSettings
{
    LogLevel level = LogLevel::Info;
    QString  filePath;                       // empty: console only
    qint64   maxBytes = 10 * 1024 * 1024;
    int      backupCount = 5;
    bool     console = true;
};

namespace Logger {

    // "DEBUG" / "info" / ... ; unknown strings map to Info and clear *ok
    LogLevel parseLevel(const QString& text, bool* ok = nullptr);
    QString  levelName(LogLevel level);
    LogLevel levelFor(QtMsgType type);

    QString formatFileLine(const QDateTime& when, const QString& category, LogLevel level, const QString& msg);
    QString formatConsoleLine(LogLevel level, const QString& msg);

    // file -> file.1 -> ... -> file.N, oldest dropped
    bool rotate(const QString& filePath, int backupCount, QString* error = nullptr);

    bool install(const LogSettings& settings, QString* error = nullptr);
    void uninstall();
    bool isInstalled();

} // namespace Logger
