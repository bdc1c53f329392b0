#include "Logger.h"
#include "LogCategories.h"

#include <QFile>
#include <QFileInfo>
#include <QDir>
#include <QMutex>
#include <QMutexLocker>
#include <cstdio>

Q_LOGGING_CATEGORY(lcApp, "medview.app")
Q_LOGGING_CATEGORY(lcConfig, "medview.config")
Q_LOGGING_CATEGORY(lcModel, "medview.model")
Q_LOGGING_CATEGORY(lcDicom, "medview.dicom")
Q_LOGGING_CATEGORY(lcAi, "medview.ai")
Q_LOGGING_CATEGORY(lcCloud, "medview.cloud")
Q_LOGGING_CATEGORY(lcRender, "medview.render")

namespace
{
    struct LoggerState
    {
        QMutex mutex;
        LogSettings settings;
        QFile file;
        QtMessageHandler previous = nullptr;
        bool installed = false;
    };

    LoggerState& state()
    {
        static LoggerState s;
        return s;
    }

    bool openLogFile(LoggerState& s, QString* error)
    {
        if (s.settings.filePath.isEmpty())
            return true;

        const QFileInfo fi(s.settings.filePath);
        if (!QDir().mkpath(fi.absolutePath()))
        {
            if (error) *error = QString("Cannot create log directory: %1").arg(fi.absolutePath());
            return false;
        }

        s.file.setFileName(s.settings.filePath);
        if (!s.file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text))
        {
            if (error) *error = QString("Cannot open log file: %1").arg(s.settings.filePath);
            return false;
        }
        return true;
    }

    void messageHandler(QtMsgType type, const QMessageLogContext& ctx, const QString& msg)
    {
        auto& s = state();
        const LogLevel level = Logger::levelFor(type);

        QMutexLocker lock(&s.mutex);
        if (static_cast<int>(level) < static_cast<int>(s.settings.level))
            return;

        if (s.settings.console)
        {
            const QByteArray line = Logger::formatConsoleLine(level, msg).toLocal8Bit();
            std::fprintf(stderr, "%s\n", line.constData());
            std::fflush(stderr);
        }

        if (s.file.isOpen())
        {
            QString category = QString::fromLatin1(ctx.category ? ctx.category : "");
            if (category.isEmpty() || category == "default")
                category = "medview";

            const QByteArray line =
                (Logger::formatFileLine(QDateTime::currentDateTime(), category, level, msg) + '\n').toUtf8();

            if (s.settings.maxBytes > 0 && s.file.size() + line.size() > s.settings.maxBytes)
            {
                s.file.close();
                Logger::rotate(s.settings.filePath, s.settings.backupCount);
                openLogFile(s, nullptr);
            }

            if (s.file.isOpen())
            {
                s.file.write(line);
                s.file.flush();
            }
        }
    }
}

LogLevel Logger::parseLevel(const QString& text, bool* ok)
{
    const QString t = text.trimmed().toUpper();
    if (ok) *ok = true;

    if (t == "DEBUG")    return LogLevel::Debug;
    if (t == "INFO")     return LogLevel::Info;
    if (t == "WARNING" || t == "WARN") return LogLevel::Warning;
    if (t == "ERROR")    return LogLevel::Error;
    if (t == "CRITICAL" || t == "FATAL") return LogLevel::Critical;

    if (ok) *ok = false;
    return LogLevel::Info;
}

QString Logger::levelName(LogLevel level)
{
    switch (level)
    {
    case LogLevel::Debug:    return QStringLiteral("DEBUG");
    case LogLevel::Info:     return QStringLiteral("INFO");
    case LogLevel::Warning:  return QStringLiteral("WARNING");
    case LogLevel::Error:    return QStringLiteral("ERROR");
    case LogLevel::Critical: return QStringLiteral("CRITICAL");
    }
    return QStringLiteral("INFO");
}

LogLevel Logger::levelFor(QtMsgType type)
{
    switch (type)
    {
    case QtDebugMsg:    return LogLevel::Debug;
    case QtInfoMsg:     return LogLevel::Info;
    case QtWarningMsg:  return LogLevel::Warning;
    case QtCriticalMsg: return LogLevel::Error;
    case QtFatalMsg:    return LogLevel::Critical;
    }
    return LogLevel::Info;
}

QString Logger::formatFileLine(const QDateTime& when, const QString& category, LogLevel level, const QString& msg)
{
    return QString("%1 - %2 - %3 - %4")
        .arg(when.toString("yyyy-MM-dd HH:mm:ss,zzz"))
        .arg(category)
        .arg(levelName(level))
        .arg(msg);
}

QString Logger::formatConsoleLine(LogLevel level, const QString& msg)
{
    return QString("%1: %2").arg(levelName(level), msg);
}

bool Logger::rotate(const QString& filePath, int backupCount, QString* error)
{
    if (backupCount <= 0)
    {
        if (QFile::exists(filePath) && !QFile::remove(filePath))
        {
            if (error) *error = QString("Cannot truncate log file: %1").arg(filePath);
            return false;
        }
        return true;
    }

    const QString oldest = QString("%1.%2").arg(filePath).arg(backupCount);
    if (QFile::exists(oldest))
        QFile::remove(oldest);

    for (int i = backupCount - 1; i >= 1; --i)
    {
        const QString from = QString("%1.%2").arg(filePath).arg(i);
        const QString to = QString("%1.%2").arg(filePath).arg(i + 1);
        if (QFile::exists(from) && !QFile::rename(from, to))
        {
            if (error) *error = QString("Cannot rename %1 to %2").arg(from, to);
            return false;
        }
    }

    if (QFile::exists(filePath) && !QFile::rename(filePath, filePath + ".1"))
    {
        if (error) *error = QString("Cannot rename %1").arg(filePath);
        return false;
    }
    return true;
}

bool Logger::install(const LogSettings& settings, QString* error)
{
    auto& s = state();
    {
        QMutexLocker lock(&s.mutex);
        if (s.file.isOpen())
            s.file.close();

        s.settings = settings;
        if (!openLogFile(s, error))
            s.settings.filePath.clear();

        if (!s.installed)
        {
            s.previous = qInstallMessageHandler(messageHandler);
            s.installed = true;
        }
    }

    // дальше пишем уже через свой обработчик
    qCInfo(lcApp) << "Logging initialized, level" << levelName(settings.level)
                  << "file" << (settings.filePath.isEmpty() ? QStringLiteral("<none>") : settings.filePath);
    return s.file.isOpen() || settings.filePath.isEmpty();
}

void Logger::uninstall()
{
    auto& s = state();
    QMutexLocker lock(&s.mutex);
    if (!s.installed)
        return;

    qInstallMessageHandler(s.previous);
    s.previous = nullptr;
    s.installed = false;
    if (s.file.isOpen())
        s.file.close();
}

bool Logger::isInstalled()
{
    auto& s = state();
    QMutexLocker lock(&s.mutex);
    return s.installed;
}
