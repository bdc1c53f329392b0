#pragma once
#include <QByteArray>
#include <QString>
#include <QUrl>

#include "AppConfig.h"

class QNetworkRequest;

// Загрузка файлов в AWS S3 и Firebase Storage по REST.
// Вызовы синхронные: из GUI только через QtConcurrent.
class CloudStorage
{
public:
    explicit CloudStorage(const AppConfig& cfg);

    // false, если нет учётных данных ни для одного сервиса
    bool initialize(QString* error = nullptr);

    bool s3Available() const;
    bool firebaseAvailable() const;

    // Возвращают публичный URL, пустая строка при ошибке
    QString uploadToS3(const QString& filePath, const QString& objectName = QString(), QString* error = nullptr);
    bool    deleteFromS3(const QString& objectName, QString* error = nullptr);

    QString uploadToFirebase(const QString& filePath, const QString& objectName = QString(), QString* error = nullptr);
    bool    deleteFromFirebase(const QString& objectName, QString* error = nullptr);

    QString s3PublicUrl(const QString& objectName) const;
    QUrl    s3RequestUrl(const QString& objectName) const;
    QString firebasePublicUrl(const QString& objectName) const;
    QUrl    firebaseUploadUrl(const QString& objectName) const;
    QUrl    firebaseObjectUrl(const QString& objectName) const;

    void setTimeoutMs(int ms) { mTimeoutMs = ms; }

private:
    bool send(QNetworkRequest& req, const QByteArray& verb, const QByteArray& body,
        QByteArray* response, QString* error) const;

    bool signS3(QNetworkRequest& req, const QByteArray& verb, const QByteArray& body, QString* error) const;

    AwsSettings      mAws;
    FirebaseSettings mFirebase;
    int              mTimeoutMs = 60000;
};
