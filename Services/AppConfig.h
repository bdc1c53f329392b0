#pragma once
#include <QString>
#include <QRect>

#include "Logger.h"
#include "Rgb.h"

struct AwsSettings
{
    QString region = "us-east-1";
    QString bucket = "your-s3-bucket-name";
    QString endpoint;                       // пусто: https://{bucket}.s3.amazonaws.com
    // из окружения, в файл не пишутся
    QString accessKeyId;
    QString secretAccessKey;
    QString sessionToken;
};

struct FirebaseSettings
{
    QString projectId = "your-project-id";
    QString storageBucket = "your-firebase-bucket-name";
    QString databaseUrl = "https://your-project-id.firebaseio.com";
    QString accessToken;                    // FIREBASE_ACCESS_TOKEN
};

struct AppConfig
{
    QString appName = "Medical 3D Viewer";
    QString appVersion = "1.0.0";
    QRect   windowGeometry{ 100, 100, 1000, 700 };

    QString assetsDir = "assets";
    QString tempDir = "temp";
    QString modelsDir = "assets/models";

    Rgb background{ 0.2, 0.3, 0.4 };
    Rgb axesColor{ 1.0, 1.0, 1.0 };
    Rgb boundingBoxColor{ 0.8, 0.8, 0.8 };

    double confidenceThreshold = 0.8;

    QString logLevel = "INFO";
    QString logFile = "medical_3d_viewer.log";
    qint64  logMaxBytes = 10 * 1024 * 1024;
    int     logBackupCount = 5;

    AwsSettings aws;
    FirebaseSettings firebase;

    // каталог файла конфигурации, относительно него разрешаются пути
    QString baseDir;

    static AppConfig loadOrCreateDefault(const QString& filePath);
    bool save(const QString& filePath) const;

    void applyEnvironment();
    bool ensureDirectories(QString* error = nullptr) const;

    QString resolve(const QString& path) const;
    LogSettings logSettings() const;

    static QString defaultPath();
};
