#include "AwsSigV4.h"

#include <QCryptographicHash>
#include <QMessageAuthenticationCode>
#include <QStringList>
#include <algorithm>

namespace
{
    const QByteArray kAlgorithm = "AWS4-HMAC-SHA256";

    // обрезать и схлопнуть пробелы внутри значения
    QByteArray trimAll(const QByteArray& v)
    {
        return v.simplified();
    }
}

QByteArray AwsSigV4::sha256Hex(const QByteArray& data)
{
    return QCryptographicHash::hash(data, QCryptographicHash::Sha256).toHex();
}

QByteArray AwsSigV4::hmacSha256(const QByteArray& key, const QByteArray& message)
{
    return QMessageAuthenticationCode::hash(message, key, QCryptographicHash::Sha256);
}

QByteArray AwsSigV4::uriEncode(const QString& text, bool encodeSlash)
{
    // toPercentEncoding не трогает только A-Z a-z 0-9 - . _ ~
    return text.toUtf8().toPercentEncoding(encodeSlash ? QByteArray() : QByteArray("/"));
}

QByteArray AwsSigV4::canonicalQuery(const QList<QPair<QString, QString>>& query)
{
    QList<QPair<QByteArray, QByteArray>> enc;
    enc.reserve(query.size());
    for (const auto& kv : query)
        enc.append({ uriEncode(kv.first), uriEncode(kv.second) });
    std::sort(enc.begin(), enc.end());

    QByteArray out;
    for (int i = 0; i < enc.size(); ++i)
    {
        if (i) out += '&';
        out += enc[i].first + '=' + enc[i].second;
    }
    return out;
}

QByteArray AwsSigV4::signedHeaders(const Request& req)
{
    QByteArrayList names;
    for (auto it = req.headers.cbegin(); it != req.headers.cend(); ++it)
        names << it.key().toLower();
    std::sort(names.begin(), names.end());
    return names.join(';');
}

QByteArray AwsSigV4::canonicalRequest(const Request& req)
{
    QMap<QByteArray, QByteArray> hdr;
    for (auto it = req.headers.cbegin(); it != req.headers.cend(); ++it)
        hdr.insert(it.key().toLower(), trimAll(it.value()));

    QByteArray headers;
    for (auto it = hdr.cbegin(); it != hdr.cend(); ++it)
        headers += it.key() + ':' + it.value() + '\n';

    const QString path = req.path.isEmpty() ? QString("/") : req.path;

    return req.method + '\n'
        + uriEncode(path, false) + '\n'
        + canonicalQuery(req.query) + '\n'
        + headers + '\n'
        + signedHeaders(req) + '\n'
        + req.payloadHash;
}

QByteArray AwsSigV4::credentialScope(const QByteArray& date, const QString& region, const QString& service)
{
    return date + '/' + region.toUtf8() + '/' + service.toUtf8() + "/aws4_request";
}

QByteArray AwsSigV4::stringToSign(const QByteArray& amzDate, const QByteArray& scope, const QByteArray& canonicalRequest)
{
    return kAlgorithm + '\n' + amzDate + '\n' + scope + '\n' + sha256Hex(canonicalRequest);
}

QByteArray AwsSigV4::signingKey(const QString& secret, const QByteArray& date, const QString& region, const QString& service)
{
    const QByteArray kDate = hmacSha256("AWS4" + secret.toUtf8(), date);
    const QByteArray kRegion = hmacSha256(kDate, region.toUtf8());
    const QByteArray kService = hmacSha256(kRegion, service.toUtf8());
    return hmacSha256(kService, "aws4_request");
}

QByteArray AwsSigV4::signature(const QByteArray& signingKey, const QByteArray& stringToSign)
{
    return hmacSha256(signingKey, stringToSign).toHex();
}

QByteArray AwsSigV4::amzDate(const QDateTime& utc)
{
    return utc.toUTC().toString("yyyyMMdd'T'HHmmss'Z'").toLatin1();
}

QByteArray AwsSigV4::sign(Request& req, const Credentials& creds, const QString& region, const QString& service,
    const QDateTime& nowUtc)
{
    const QByteArray stamp = amzDate(nowUtc);
    const QByteArray date = stamp.left(8);

    req.headers.insert("x-amz-date", stamp);
    if (!creds.sessionToken.isEmpty())
        req.headers.insert("x-amz-security-token", creds.sessionToken.toUtf8());

    const QByteArray scope = credentialScope(date, region, service);
    const QByteArray sts = stringToSign(stamp, scope, canonicalRequest(req));
    const QByteArray sig = signature(signingKey(creds.secretAccessKey, date, region, service), sts);

    return kAlgorithm + " Credential=" + creds.accessKeyId.toUtf8() + '/' + scope
        + ", SignedHeaders=" + signedHeaders(req)
        + ", Signature=" + sig;
}
