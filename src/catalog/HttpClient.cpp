#include "HttpClient.h"
#include "../core/Errors.h"

#include <QDebug>
#include <QEventLoop>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>

HttpClient::HttpClient(int timeoutMs)
    : m_timeoutMs(timeoutMs)
{
    setUserAgent(QByteArray("Echotrail/") + ECHOTRAIL_VERSION);
}

void HttpClient::setRawHeader(const QByteArray& name, const QByteArray& value)
{
    for (auto& header : m_headers) {
        if (header.first == name) {
            header.second = value;
            return;
        }
    }
    m_headers.append(qMakePair(name, value));
}

void HttpClient::setUserAgent(const QByteArray& userAgent)
{
    setRawHeader(QByteArrayLiteral("User-Agent"), userAgent);
}

static QNetworkRequest buildRequest(const QUrl& url,
                                    const QList<QPair<QByteArray, QByteArray>>& headers,
                                    int timeoutMs)
{
    QNetworkRequest request(url);
    for (const auto& header : headers)
        request.setRawHeader(header.first, header.second);
    request.setTransferTimeout(timeoutMs);
    return request;
}

static int httpStatus(const QNetworkReply* reply)
{
    return reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
}

// Connection, proxy and mid-transfer errors. Content and server errors
// mirror an HTTP status and are left to the caller, except when there is
// no status at all.
static bool isTransportError(const QNetworkReply* reply)
{
    const QNetworkReply::NetworkError error = reply->error();
    if (error == QNetworkReply::NoError)
        return false;
    if (error < QNetworkReply::ContentAccessDenied || error == QNetworkReply::ProtocolFailure)
        return true;
    return httpStatus(reply) == 0;
}

// ── Buffered GET ────────────────────────────────────────────────────
HttpResponse HttpClient::get(const QUrl& url, int timeoutMs) const
{
    QNetworkAccessManager network;
    QNetworkReply* reply = network.get(
        buildRequest(url, m_headers, timeoutMs > 0 ? timeoutMs : m_timeoutMs));

    QEventLoop loop;
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    if (!reply->isFinished())
        loop.exec();

    HttpResponse response;
    response.status = httpStatus(reply);

    if (isTransportError(reply)) {
        qWarning() << "[Http] GET" << url.toString(QUrl::RemoveQuery)
                   << "failed:" << reply->errorString();
        throw NetworkFailure(QStringLiteral("GET %1 failed: %2")
                                 .arg(url.toString(QUrl::RemoveQuery), reply->errorString()));
    }

    response.body = reply->readAll();
    qDebug() << "[Http] GET" << url.toString(QUrl::RemoveQuery)
             << "HTTP" << response.status << "size:" << response.body.size();
    return response;
}

// ── Streaming GET ───────────────────────────────────────────────────
StreamResult HttpClient::stream(const QUrl& url, int chunkSize,
                                const HeaderHandler& onHeaders,
                                const ChunkHandler& onChunk) const
{
    QNetworkAccessManager network;
    QNetworkReply* reply = network.get(buildRequest(url, m_headers, m_timeoutMs));

    StreamResult result;
    bool headersSeen = false;

    auto checkHeaders = [&]() {
        if (headersSeen)
            return;
        headersSeen = true;
        result.status = httpStatus(reply);
        const QVariant length = reply->header(QNetworkRequest::ContentLengthHeader);
        result.declaredSize = length.isValid() ? length.toLongLong() : -1;
        if (onHeaders && !onHeaders(result.status, result.declaredSize)) {
            result.aborted = true;
            reply->abort();
        }
    };

    auto drain = [&]() {
        checkHeaders();
        while (!result.aborted && reply->bytesAvailable() > 0) {
            const QByteArray chunk = reply->read(qMax(chunkSize, 1));
            if (chunk.isEmpty())
                break;
            result.bytesReceived += chunk.size();
            if (!onChunk(chunk)) {
                result.aborted = true;
                reply->abort();
            }
        }
    };

    QEventLoop loop;
    QObject::connect(reply, &QNetworkReply::metaDataChanged, &loop, checkHeaders);
    QObject::connect(reply, &QNetworkReply::readyRead, &loop, drain);
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    if (!reply->isFinished())
        loop.exec();

    if (result.aborted)
        return result;

    if (isTransportError(reply)) {
        qWarning() << "[Http] Stream" << url.toString(QUrl::RemoveQuery)
                   << "failed:" << reply->errorString();
        throw NetworkFailure(QStringLiteral("GET %1 failed: %2")
                                 .arg(url.toString(QUrl::RemoveQuery), reply->errorString()));
    }

    // Tail that arrived together with finished()
    drain();
    return result;
}
