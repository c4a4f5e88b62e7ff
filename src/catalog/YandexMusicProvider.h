#pragma once

#include "ICatalogService.h"
#include "HttpClient.h"
#include "RateLimiter.h"

#include <QJsonObject>
#include <QVariantMap>

class ICacheBackend;
class Settings;

class YandexMusicProvider : public ICatalogService {
public:
    // cache may be null; lookups are then always remote
    YandexMusicProvider(const Settings& settings, ICacheBackend* cache);

    std::optional<Artist> resolveEntity(const QString& artistId) override;
    QVector<Artist> listSimilar(const QString& artistId, int limit) override;
    QVector<Track> listMediaItems(const QString& artistId, int maxItems = -1) override;
    bool probeHasContentInRange(const QString& artistId, const YearRange& years) override;
    std::optional<QUrl> resolveMediaUrl(const Track& track) override;

    // JSON -> model, exposed for tests
    static Artist parseArtist(const QJsonObject& obj);
    static Track parseTrack(const QJsonObject& obj);

    // Cache value round trip
    static QVariantMap artistToVariant(const Artist& artist);
    static Artist artistFromVariant(const QVariantMap& map);

    // Direct link from the download-info XML fields
    static QUrl signedTrackUrl(const QString& host, const QString& path,
                               const QString& ts, const QString& s);

private:
    QJsonObject requestJson(const QString& endpoint, int timeoutMs = -1,
                            bool* notFound = nullptr);

    std::optional<QVariant> cacheGet(const QString& key);
    void cacheSet(const QString& key, const QVariant& value, int ttlSeconds);

    static const int ARTIST_TTL = 3600;
    static const int SIMILAR_TTL = 86400;
    static const int PROBE_TTL = 3600;
    static const int PROBE_FALLBACK_TTL = 1800;
    static const int PAGE_SIZE = 50;
    static const int MAX_PAGES = 100;

    QUrl m_baseUrl;
    int m_probeTimeoutMs;
    ICacheBackend* m_cache;
    HttpClient m_http;
    RateLimiter m_rateLimiter;
};
