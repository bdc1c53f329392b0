#include "CloudStorage.h"
#include "AwsSigV4.h"
#include "LogCategories.h"

#include <QDateTime>
#include <QEventLoop>
#include <QFile>
#include <QFileInfo>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>

namespace
{
    template <typename T>
    T fail(QString* error, const QString& msg, T value)
    {
        qCCritical(lcCloud).noquote() << msg;
        if (error) *error = msg;
        return value;
    }

    bool readFile(const QString& path, QByteArray& out, QString* error)
    {
        QFile f(path);
        if (!f.exists())
            return fail(error, QString("File not found: %1").arg(path), false);
        if (!f.open(QIODevice::ReadOnly))
            return fail(error, QString("Cannot open %1: %2").arg(path, f.errorString()), false);
        out = f.readAll();
        return true;
    }

    QString hostHeader(const QUrl& url)
    {
        const int port = url.port();
        const bool defaultPort = port == -1
            || (url.scheme() == "https" && port == 443)
            || (url.scheme() == "http" && port == 80);
        return defaultPort ? url.host() : QString("%1:%2").arg(url.host()).arg(port);
    }
}

CloudStorage::CloudStorage(const AppConfig& cfg)
    : mAws(cfg.aws)
    , mFirebase(cfg.firebase)
{
}

bool CloudStorage::s3Available() const
{
    return !mAws.accessKeyId.isEmpty() && !mAws.secretAccessKey.isEmpty() && !mAws.bucket.isEmpty();
}

bool CloudStorage::firebaseAvailable() const
{
    return !mFirebase.storageBucket.isEmpty() && !mFirebase.accessToken.isEmpty();
}

bool CloudStorage::initialize(QString* error)
{
    const bool s3 = s3Available();
    const bool fb = firebaseAvailable();

    if (!s3 && !fb)
        return fail(error, "Cloud service initialization failed: no AWS or Firebase credentials configured", false);

    qCInfo(lcCloud) << "Cloud services initialized. S3:" << (s3 ? "yes" : "no")
                    << "Firebase:" << (fb ? "yes" : "no");
    return true;
}

QString CloudStorage::s3PublicUrl(const QString& objectName) const
{
    if (!mAws.endpoint.isEmpty())
    {
        QString base = mAws.endpoint;
        while (base.endsWith('/')) base.chop(1);
        return QString("%1/%2/%3").arg(base, mAws.bucket, objectName);
    }
    return QString("https://%1.s3.amazonaws.com/%2").arg(mAws.bucket, objectName);
}

QUrl CloudStorage::s3RequestUrl(const QString& objectName) const
{
    QUrl url;
    if (!mAws.endpoint.isEmpty())
    {
        url = QUrl(mAws.endpoint);
        QString path = url.path();
        while (path.endsWith('/')) path.chop(1);
        url.setPath(path + "/" + mAws.bucket + "/" + objectName);
    }
    else
    {
        url.setScheme("https");
        url.setHost(QString("%1.s3.%2.amazonaws.com").arg(mAws.bucket, mAws.region));
        url.setPath("/" + objectName);
    }
    return url;
}

QString CloudStorage::firebasePublicUrl(const QString& objectName) const
{
    return QString("https://storage.googleapis.com/%1/%2").arg(mFirebase.storageBucket, objectName);
}

QUrl CloudStorage::firebaseUploadUrl(const QString& objectName) const
{
    const QString s = QString("https://firebasestorage.googleapis.com/v0/b/%1/o?uploadType=media&name=%2")
        .arg(mFirebase.storageBucket, QString::fromLatin1(AwsSigV4::uriEncode(objectName)));
    return QUrl(s, QUrl::StrictMode);
}

QUrl CloudStorage::firebaseObjectUrl(const QString& objectName) const
{
    const QString s = QString("https://firebasestorage.googleapis.com/v0/b/%1/o/%2")
        .arg(mFirebase.storageBucket, QString::fromLatin1(AwsSigV4::uriEncode(objectName)));
    return QUrl(s, QUrl::StrictMode);
}

bool CloudStorage::signS3(QNetworkRequest& req, const QByteArray& verb, const QByteArray& body, QString* error) const
{
    if (!s3Available())
        return fail(error, "AWS credentials not configured (set AWS_ACCESS_KEY_ID and AWS_SECRET_ACCESS_KEY)", false);

    const QUrl url = req.url();

    AwsSigV4::Request sr;
    sr.method = verb;
    sr.path = url.path(QUrl::FullyDecoded);
    sr.payloadHash = AwsSigV4::sha256Hex(body);
    sr.headers.insert("host", hostHeader(url).toUtf8());
    sr.headers.insert("x-amz-content-sha256", sr.payloadHash);

    const AwsSigV4::Credentials creds{ mAws.accessKeyId, mAws.secretAccessKey, mAws.sessionToken };
    const QByteArray auth = AwsSigV4::sign(sr, creds, mAws.region, "s3", QDateTime::currentDateTimeUtc());

    for (auto it = sr.headers.cbegin(); it != sr.headers.cend(); ++it)
        if (it.key() != "host")
            req.setRawHeader(it.key(), it.value());
    req.setRawHeader("Authorization", auth);

    // путь уже закодирован так же, как в подписи
    QUrl encoded = url;
    encoded.setPath(QString::fromLatin1(AwsSigV4::uriEncode(sr.path, false)), QUrl::StrictMode);
    req.setUrl(encoded);
    return true;
}

bool CloudStorage::send(QNetworkRequest& req, const QByteArray& verb, const QByteArray& body,
    QByteArray* response, QString* error) const
{
    // менеджер в текущем потоке: вызывается из пула QtConcurrent
    QNetworkAccessManager nam;
    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);

    QNetworkReply* reply = nam.sendCustomRequest(req, verb, body);
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    QObject::connect(&timer, &QTimer::timeout, &loop, &QEventLoop::quit);
    timer.start(mTimeoutMs);
    loop.exec();

    if (!reply->isFinished())
    {
        reply->abort();
        reply->deleteLater();
        return fail(error, QString("%1 %2 timed out after %3 s").arg(QString::fromLatin1(verb), req.url().toString())
            .arg(mTimeoutMs / 1000), false);
    }

    const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    const QByteArray data = reply->readAll();
    const QNetworkReply::NetworkError netErr = reply->error();
    const QString netText = reply->errorString();
    reply->deleteLater();

    if (status < 200 || status >= 300)
    {
        QString msg = QString("HTTP %1").arg(status);
        if (netErr != QNetworkReply::NoError) msg += ": " + netText;
        if (!data.isEmpty()) msg += "\n" + QString::fromUtf8(data.left(512));
        return fail(error, msg, false);
    }

    if (response) *response = data;
    qCDebug(lcCloud) << verb << req.url().toString() << "->" << status;
    return true;
}

QString CloudStorage::uploadToS3(const QString& filePath, const QString& objectName, QString* error)
{
    QByteArray body;
    if (!readFile(filePath, body, error))
        return QString();

    const QString object = objectName.isEmpty() ? QFileInfo(filePath).fileName() : objectName;

    QNetworkRequest req(s3RequestUrl(object));
    req.setHeader(QNetworkRequest::ContentTypeHeader, "application/octet-stream");
    if (!signS3(req, "PUT", body, error))
        return QString();

    qCInfo(lcCloud) << "Uploading" << filePath << "to S3 bucket" << mAws.bucket;
    QString err;
    if (!send(req, "PUT", body, nullptr, &err))
        return fail(error, "Failed to upload to S3: " + err, QString());

    const QString url = s3PublicUrl(object);
    qCInfo(lcCloud) << "Successfully uploaded to S3:" << url;
    return url;
}

bool CloudStorage::deleteFromS3(const QString& objectName, QString* error)
{
    if (objectName.isEmpty())
        return fail(error, "Object name is empty", false);

    QNetworkRequest req(s3RequestUrl(objectName));
    if (!signS3(req, "DELETE", QByteArray(), error))
        return false;

    qCInfo(lcCloud) << "Deleting" << objectName << "from S3 bucket" << mAws.bucket;
    QString err;
    if (!send(req, "DELETE", QByteArray(), nullptr, &err))
        return fail(error, "Failed to delete from S3: " + err, false);

    qCInfo(lcCloud) << "Successfully deleted from S3:" << objectName;
    return true;
}

QString CloudStorage::uploadToFirebase(const QString& filePath, const QString& objectName, QString* error)
{
    QByteArray body;
    if (!readFile(filePath, body, error))
        return QString();
    if (!firebaseAvailable())
        return fail(error, "Firebase credentials not configured (set FIREBASE_ACCESS_TOKEN)", QString());

    const QString object = objectName.isEmpty() ? QFileInfo(filePath).fileName() : objectName;

    QNetworkRequest req(firebaseUploadUrl(object));
    req.setHeader(QNetworkRequest::ContentTypeHeader, "application/octet-stream");
    req.setRawHeader("Authorization", "Bearer " + mFirebase.accessToken.toUtf8());

    qCInfo(lcCloud) << "Uploading" << filePath << "to Firebase Storage";
    QString err;
    if (!send(req, "POST", body, nullptr, &err))
        return fail(error, "Failed to upload to Firebase: " + err, QString());

    const QString url = firebasePublicUrl(object);
    qCInfo(lcCloud) << "Successfully uploaded to Firebase:" << url;
    return url;
}

bool CloudStorage::deleteFromFirebase(const QString& objectName, QString* error)
{
    if (objectName.isEmpty())
        return fail(error, "Object name is empty", false);
    if (!firebaseAvailable())
        return fail(error, "Firebase credentials not configured (set FIREBASE_ACCESS_TOKEN)", false);

    QNetworkRequest req(firebaseObjectUrl(objectName));
    req.setRawHeader("Authorization", "Bearer " + mFirebase.accessToken.toUtf8());

    qCInfo(lcCloud) << "Deleting" << objectName << "from Firebase Storage";
    QString err;
    if (!send(req, "DELETE", QByteArray(), nullptr, &err))
        return fail(error, "Failed to delete from Firebase: " + err, false);

    qCInfo(lcCloud) << "Successfully deleted from Firebase:" << objectName;
    return true;
}
