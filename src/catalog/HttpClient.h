#pragma once

#include <QByteArray>
#include <QList>
#include <QPair>
#include <QUrl>
#include <functional>

struct HttpResponse {
    int        status = 0;      // 0 for non-HTTP schemes
    QByteArray body;

    bool isSuccess() const { return status == 0 || (status >= 200 && status < 300); }
};

struct StreamResult {
    int    status = 0;
    qint64 declaredSize = -1;   // Content-Length, -1 if absent
    qint64 bytesReceived = 0;
    bool   aborted = false;     // a handler asked to stop
};

// Synchronous HTTP on top of QNetworkAccessManager. Each call spins a
// private manager and event loop on the calling thread, so one client can
// be shared by worker threads. Transport failures throw NetworkFailure;
// HTTP error statuses are returned to the caller.
class HttpClient {
public:
    // (status, declared size) -> false aborts before any body is delivered
    using HeaderHandler = std::function<bool(int status, qint64 declaredSize)>;
    // chunk -> false aborts the transfer
    using ChunkHandler = std::function<bool(const QByteArray& chunk)>;

    explicit HttpClient(int timeoutMs = 15000);

    void setRawHeader(const QByteArray& name, const QByteArray& value);
    void setUserAgent(const QByteArray& userAgent);

    HttpResponse get(const QUrl& url, int timeoutMs = -1) const;

    StreamResult stream(const QUrl& url, int chunkSize,
                        const HeaderHandler& onHeaders,
                        const ChunkHandler& onChunk) const;

private:
    QList<QPair<QByteArray, QByteArray>> m_headers;
    int m_timeoutMs;
};
