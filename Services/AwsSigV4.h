#pragma once
#include <QByteArray>
#include <QDateTime>
#include <QList>
#include <QMap>
#include <QPair>
#include <QString>

// AWS Signature Version 4 для запросов к S3
namespace AwsSigV4 {

    struct Request
    {
        QByteArray method = "GET";
        QString    path = "/";                              // без кодирования
        QList<QPair<QString, QString>> query;
        QMap<QByteArray, QByteArray>   headers;             // имя в нижнем регистре
        QByteArray payloadHash;                             // hex sha256 тела
    };

    struct Credentials
    {
        QString accessKeyId;
        QString secretAccessKey;
        QString sessionToken;
    };

    QByteArray sha256Hex(const QByteArray& data);
    QByteArray hmacSha256(const QByteArray& key, const QByteArray& message);

    // RFC 3986; для пути слэши оставляем
    QByteArray uriEncode(const QString& text, bool encodeSlash = true);

    QByteArray canonicalQuery(const QList<QPair<QString, QString>>& query);
    QByteArray signedHeaders(const Request& req);
    QByteArray canonicalRequest(const Request& req);

    QByteArray credentialScope(const QByteArray& date, const QString& region, const QString& service);
    QByteArray stringToSign(const QByteArray& amzDate, const QByteArray& scope, const QByteArray& canonicalRequest);
    QByteArray signingKey(const QString& secret, const QByteArray& date, const QString& region, const QString& service);
    QByteArray signature(const QByteArray& signingKey, const QByteArray& stringToSign);

    QByteArray amzDate(const QDateTime& utc);

    // Добавляет x-amz-date, x-amz-security-token и возвращает значение Authorization
    QByteArray sign(Request& req, const Credentials& creds, const QString& region, const QString& service,
        const QDateTime& nowUtc);

} // namespace AwsSigV4
