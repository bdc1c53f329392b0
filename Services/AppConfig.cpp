#include "AppConfig.h"
#include "LogCategories.h"

#include <QCoreApplication>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QXmlStreamReader>
#include <QXmlStreamWriter>
#include <QDir>
#include <QStringList>
#include <QtGlobal>

namespace
{
    bool parseRgb(const QString& text, Rgb& out)
    {
        const QStringList parts = text.simplified().split(' ');
        if (parts.size() != 3)
            return false;

        Rgb tmp{};
        for (int i = 0; i < 3; ++i)
        {
            bool ok = false;
            tmp[i] = parts[i].toDouble(&ok);
            if (!ok || tmp[i] < 0.0 || tmp[i] > 1.0)
                return false;
        }
        out = tmp;
        return true;
    }

    QString rgbText(const Rgb& c)
    {
        return QString("%1 %2 %3").arg(c[0]).arg(c[1]).arg(c[2]);
    }

    void readInt(QXmlStreamReader& xr, int& dst)
    {
        bool ok = false;
        const int v = xr.readElementText().trimmed().toInt(&ok);
        if (ok) dst = v;
    }
}

AppConfig AppConfig::loadOrCreateDefault(const QString& filePath)
{
    AppConfig cfg;
    cfg.baseDir = QFileInfo(filePath).absolutePath();

    QFile f(filePath);
    if (!f.exists())
    {
        if (!cfg.save(filePath))
            qCWarning(lcConfig) << "Cannot write default config to" << filePath;
        cfg.applyEnvironment();
        return cfg;
    }

    if (!f.open(QIODevice::ReadOnly | QIODevice::Text))
    {
        qCWarning(lcConfig) << "Cannot open config" << filePath << "- using defaults";
        cfg.applyEnvironment();
        return cfg;
    }

    QXmlStreamReader xr(&f);
    QString section;

    while (!xr.atEnd())
    {
        xr.readNext();

        if (xr.isStartElement())
        {
            const QString name = xr.name().toString();

            if (name == "app" || name == "window" || name == "paths" || name == "render"
                || name == "ai" || name == "log" || name == "aws" || name == "firebase")
            {
                section = name;
                continue;
            }

            if (section == "app")
            {
                if (name == "name") cfg.appName = xr.readElementText().trimmed();
                else if (name == "version") cfg.appVersion = xr.readElementText().trimmed();
            }
            else if (section == "window")
            {
                int x = cfg.windowGeometry.x(), y = cfg.windowGeometry.y();
                int w = cfg.windowGeometry.width(), h = cfg.windowGeometry.height();
                if (name == "x") readInt(xr, x);
                else if (name == "y") readInt(xr, y);
                else if (name == "width") readInt(xr, w);
                else if (name == "height") readInt(xr, h);
                if (w > 0 && h > 0)
                    cfg.windowGeometry = QRect(x, y, w, h);
            }
            else if (section == "paths")
            {
                const QString v = xr.readElementText().trimmed();
                if (v.isEmpty()) continue;
                if (name == "assets") cfg.assetsDir = v;
                else if (name == "temp") cfg.tempDir = v;
                else if (name == "models") cfg.modelsDir = v;
            }
            else if (section == "render")
            {
                const QString v = xr.readElementText();
                Rgb* dst = nullptr;
                if (name == "background") dst = &cfg.background;
                else if (name == "axes") dst = &cfg.axesColor;
                else if (name == "boundingBox") dst = &cfg.boundingBoxColor;
                if (dst && !parseRgb(v, *dst))
                    qCWarning(lcConfig) << "Invalid color for" << name << ":" << v;
            }
            else if (section == "ai")
            {
                if (name == "confidenceThreshold")
                {
                    bool ok = false;
                    const double t = xr.readElementText().trimmed().toDouble(&ok);
                    if (ok) cfg.confidenceThreshold = qBound(0.0, t, 1.0);
                }
            }
            else if (section == "log")
            {
                if (name == "level")
                {
                    const QString v = xr.readElementText().trimmed().toUpper();
                    bool ok = false;
                    Logger::parseLevel(v, &ok);
                    if (ok) cfg.logLevel = v;
                    else qCWarning(lcConfig) << "Unknown log level" << v;
                }
                else if (name == "file") cfg.logFile = xr.readElementText().trimmed();
                else if (name == "maxBytes")
                {
                    bool ok = false;
                    const qint64 v = xr.readElementText().trimmed().toLongLong(&ok);
                    if (ok && v > 0) cfg.logMaxBytes = v;
                }
                else if (name == "backupCount")
                {
                    int v = cfg.logBackupCount;
                    readInt(xr, v);
                    if (v >= 0) cfg.logBackupCount = v;
                }
            }
            else if (section == "aws")
            {
                const QString v = xr.readElementText().trimmed();
                if (name == "region" && !v.isEmpty()) cfg.aws.region = v;
                else if (name == "bucket" && !v.isEmpty()) cfg.aws.bucket = v;
                else if (name == "endpoint") cfg.aws.endpoint = v;
            }
            else if (section == "firebase")
            {
                const QString v = xr.readElementText().trimmed();
                if (name == "projectId" && !v.isEmpty()) cfg.firebase.projectId = v;
                else if (name == "storageBucket" && !v.isEmpty()) cfg.firebase.storageBucket = v;
                else if (name == "databaseUrl" && !v.isEmpty()) cfg.firebase.databaseUrl = v;
            }
        }
        else if (xr.isEndElement())
        {
            if (xr.name().toString() == section)
                section.clear();
        }
    }

    if (xr.hasError())
        qCWarning(lcConfig) << "Config parse error in" << filePath << ":" << xr.errorString();

    cfg.applyEnvironment();
    return cfg;
}

bool AppConfig::save(const QString& filePath) const
{
    QSaveFile f(filePath);
    if (!f.open(QIODevice::WriteOnly | QIODevice::Text))
        return false;

    QXmlStreamWriter xw(&f);
    xw.setAutoFormatting(true);
    xw.writeStartDocument("1.0");
    xw.writeStartElement("MedView3D");
    xw.writeAttribute("version", "1");

    xw.writeStartElement("app");
    xw.writeTextElement("name", appName);
    xw.writeTextElement("version", appVersion);
    xw.writeEndElement(); // app

    xw.writeStartElement("window");
    xw.writeTextElement("x", QString::number(windowGeometry.x()));
    xw.writeTextElement("y", QString::number(windowGeometry.y()));
    xw.writeTextElement("width", QString::number(windowGeometry.width()));
    xw.writeTextElement("height", QString::number(windowGeometry.height()));
    xw.writeEndElement(); // window

    xw.writeStartElement("paths");
    xw.writeTextElement("assets", assetsDir);
    xw.writeTextElement("temp", tempDir);
    xw.writeTextElement("models", modelsDir);
    xw.writeEndElement(); // paths

    xw.writeStartElement("render");
    xw.writeTextElement("background", rgbText(background));
    xw.writeTextElement("axes", rgbText(axesColor));
    xw.writeTextElement("boundingBox", rgbText(boundingBoxColor));
    xw.writeEndElement(); // render

    xw.writeStartElement("ai");
    xw.writeTextElement("confidenceThreshold", QString::number(confidenceThreshold));
    xw.writeEndElement(); // ai

    xw.writeStartElement("log");
    xw.writeTextElement("level", logLevel);
    xw.writeTextElement("file", logFile);
    xw.writeTextElement("maxBytes", QString::number(logMaxBytes));
    xw.writeTextElement("backupCount", QString::number(logBackupCount));
    xw.writeEndElement(); // log

    xw.writeStartElement("aws");
    xw.writeTextElement("region", aws.region);
    xw.writeTextElement("bucket", aws.bucket);
    xw.writeTextElement("endpoint", aws.endpoint);
    xw.writeEndElement(); // aws

    xw.writeStartElement("firebase");
    xw.writeTextElement("projectId", firebase.projectId);
    xw.writeTextElement("storageBucket", firebase.storageBucket);
    xw.writeTextElement("databaseUrl", firebase.databaseUrl);
    xw.writeEndElement(); // firebase

    xw.writeEndElement(); // MedView3D
    xw.writeEndDocument();

    return f.commit();
}

void AppConfig::applyEnvironment()
{
    aws.accessKeyId = qEnvironmentVariable("AWS_ACCESS_KEY_ID");
    aws.secretAccessKey = qEnvironmentVariable("AWS_SECRET_ACCESS_KEY");
    aws.sessionToken = qEnvironmentVariable("AWS_SESSION_TOKEN");
    firebase.accessToken = qEnvironmentVariable("FIREBASE_ACCESS_TOKEN");
}

QString AppConfig::resolve(const QString& path) const
{
    if (path.isEmpty() || QDir::isAbsolutePath(path))
        return path;
    const QString base = baseDir.isEmpty() ? QDir::currentPath() : baseDir;
    return QDir(base).filePath(path);
}

bool AppConfig::ensureDirectories(QString* error) const
{
    for (const QString& d : { assetsDir, tempDir, modelsDir })
    {
        const QString abs = resolve(d);
        if (!QDir().mkpath(abs))
        {
            if (error) *error = QString("Cannot create directory: %1").arg(abs);
            return false;
        }
    }
    return true;
}

LogSettings AppConfig::logSettings() const
{
    LogSettings s;
    s.level = Logger::parseLevel(logLevel);
    s.filePath = resolve(logFile);
    s.maxBytes = logMaxBytes;
    s.backupCount = logBackupCount;
    return s;
}

QString AppConfig::defaultPath()
{
    const QByteArray env = qgetenv("MEDVIEW3D_CONFIG");
    if (!env.isEmpty())
        return QString::fromLocal8Bit(env);
    return QCoreApplication::applicationDirPath() + "/medview3d.xml";
}
