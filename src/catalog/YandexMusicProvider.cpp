#include "YandexMusicProvider.h"
#include "../cache/ICacheBackend.h"
#include "../core/Errors.h"
#include "../core/Settings.h"

#include <QCryptographicHash>
#include <QDebug>
#include <QJsonArray>
#include <QJsonDocument>
#include <QUrlQuery>
#include <QXmlStreamReader>
#include <algorithm>

static const QByteArray SIGN_SALT = QByteArrayLiteral("XGRlBW9FXlekgbPrRHuSiA");

YandexMusicProvider::YandexMusicProvider(const Settings& settings, ICacheBackend* cache)
    : m_baseUrl(settings.catalog.baseUrl)
    , m_probeTimeoutMs(settings.catalog.probeTimeoutMs)
    , m_cache(cache)
    , m_http(settings.catalog.requestTimeoutMs)
    , m_rateLimiter(settings.catalog.requestsPerSecond)
{
    m_http.setRawHeader(QByteArrayLiteral("Accept"), QByteArrayLiteral("application/json"));
    m_http.setRawHeader(QByteArrayLiteral("X-Yandex-Music-Client"),
                        QByteArrayLiteral("YandexMusicAndroid/24023621"));
    if (!settings.catalog.token.isEmpty()) {
        m_http.setRawHeader(QByteArrayLiteral("Authorization"),
                            QByteArrayLiteral("OAuth ") + settings.catalog.token.toUtf8());
    } else {
        qWarning() << "[Yandex] No OAuth token configured, requests are anonymous";
    }
}

// ── Generic request helper ──────────────────────────────────────────
QJsonObject YandexMusicProvider::requestJson(const QString& endpoint, int timeoutMs,
                                             bool* notFound)
{
    m_rateLimiter.acquire();

    QUrl url = m_baseUrl;
    const QString query = endpoint.section(QLatin1Char('?'), 1);
    url.setPath(url.path() + endpoint.section(QLatin1Char('?'), 0, 0));
    if (!query.isEmpty())
        url.setQuery(query);

    const HttpResponse response = m_http.get(url, timeoutMs);

    if (response.status == 404 && notFound) {
        *notFound = true;
        return {};
    }
    if (!response.isSuccess()) {
        qWarning() << "[Yandex] HTTP" << response.status << endpoint;
        throw ServiceFailure(QStringLiteral("%1 returned HTTP %2").arg(endpoint).arg(response.status));
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(response.body, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject())
        throw ServiceFailure(QStringLiteral("%1 returned malformed JSON: %2")
                                 .arg(endpoint, parseError.errorString()));

    const QJsonObject root = doc.object();
    if (root.contains(QStringLiteral("error"))) {
        const QJsonObject err = root[QStringLiteral("error")].toObject();
        throw ServiceFailure(QStringLiteral("%1: %2").arg(endpoint,
            err[QStringLiteral("message")].toString(err[QStringLiteral("name")].toString())));
    }
    return root;
}

std::optional<QVariant> YandexMusicProvider::cacheGet(const QString& key)
{
    if (!m_cache)
        return std::nullopt;
    try {
        return m_cache->get(key);
    } catch (const CacheFailure& e) {
        qWarning() << "[Yandex] Cache read failed for" << key << ":" << e.message();
        return std::nullopt;
    }
}

void YandexMusicProvider::cacheSet(const QString& key, const QVariant& value, int ttlSeconds)
{
    if (!m_cache)
        return;
    try {
        m_cache->set(key, value, ttlSeconds);
    } catch (const CacheFailure& e) {
        qWarning() << "[Yandex] Cache write failed for" << key << ":" << e.message();
    }
}

// ── Parsing ─────────────────────────────────────────────────────────
static QString idString(const QJsonValue& v)
{
    return v.isString() ? v.toString() : QString::number(v.toVariant().toLongLong());
}

Artist YandexMusicProvider::parseArtist(const QJsonObject& obj)
{
    Artist a;
    a.id = idString(obj[QStringLiteral("id")]);
    a.name = obj[QStringLiteral("name")].toString();
    a.trackCount = obj[QStringLiteral("counts")].toObject()[QStringLiteral("tracks")].toInt();

    for (const auto& g : obj[QStringLiteral("genres")].toArray())
        a.genres << g.toString().toLower();

    const QJsonArray countries = obj[QStringLiteral("countries")].toArray();
    const QJsonArray regions = obj[QStringLiteral("regions")].toArray();
    if (!countries.isEmpty())
        a.country = countries.first().toString().toUpper();
    else if (!regions.isEmpty())
        a.country = regions.first().toString().toUpper();
    return a;
}

Track YandexMusicProvider::parseTrack(const QJsonObject& obj)
{
    Track t;
    t.id = idString(obj[QStringLiteral("id")]);
    t.title = obj[QStringLiteral("title")].toString();
    const QString version = obj[QStringLiteral("version")].toString();
    if (!version.isEmpty())
        t.title += QStringLiteral(" (%1)").arg(version);

    for (const auto& v : obj[QStringLiteral("artists")].toArray()) {
        const QJsonObject artist = v.toObject();
        t.artistIds << idString(artist[QStringLiteral("id")]);
        t.artistNames << artist[QStringLiteral("name")].toString();
    }

    const QJsonArray albums = obj[QStringLiteral("albums")].toArray();
    if (!albums.isEmpty()) {
        const QJsonObject album = albums.first().toObject();
        t.albumId = idString(album[QStringLiteral("id")]);
        t.albumTitle = album[QStringLiteral("title")].toString();
        const int year = album[QStringLiteral("year")].toInt();
        if (year > 0)
            t.year = year;
    }

    t.durationMs = obj[QStringLiteral("durationMs")].toVariant().toLongLong();
    t.explicitContent = obj[QStringLiteral("contentWarning")].toString() == QStringLiteral("explicit")
                     || obj[QStringLiteral("explicit")].toBool();
    return t;
}

QVariantMap YandexMusicProvider::artistToVariant(const Artist& artist)
{
    QVariantMap map;
    map[QStringLiteral("id")] = artist.id;
    map[QStringLiteral("name")] = artist.name;
    map[QStringLiteral("country")] = artist.country;
    map[QStringLiteral("genres")] = artist.genres;
    map[QStringLiteral("trackCount")] = artist.trackCount;
    if (artist.similarityScore)
        map[QStringLiteral("score")] = *artist.similarityScore;
    return map;
}

Artist YandexMusicProvider::artistFromVariant(const QVariantMap& map)
{
    Artist a;
    a.id = map.value(QStringLiteral("id")).toString();
    a.name = map.value(QStringLiteral("name")).toString();
    a.country = map.value(QStringLiteral("country")).toString();
    a.genres = map.value(QStringLiteral("genres")).toStringList();
    a.trackCount = map.value(QStringLiteral("trackCount")).toInt();
    if (map.contains(QStringLiteral("score")))
        a.similarityScore = map.value(QStringLiteral("score")).toDouble();
    return a;
}

// ── ICatalogService ─────────────────────────────────────────────────
std::optional<Artist> YandexMusicProvider::resolveEntity(const QString& artistId)
{
    const QString cacheKey = QStringLiteral("artist:%1").arg(artistId);
    if (auto cached = cacheGet(cacheKey))
        return artistFromVariant(cached->toMap());

    bool notFound = false;
    const QJsonObject root = requestJson(
        QStringLiteral("/artists/%1/brief-info").arg(artistId), -1, &notFound);
    if (notFound)
        return std::nullopt;

    const QJsonObject artistObj =
        root[QStringLiteral("result")].toObject()[QStringLiteral("artist")].toObject();
    if (artistObj.isEmpty())
        return std::nullopt;

    Artist artist = parseArtist(artistObj);
    cacheSet(cacheKey, artistToVariant(artist), ARTIST_TTL);
    qDebug() << "[Yandex] Resolved artist" << artist.id << artist.name
             << "tracks:" << artist.trackCount;
    return artist;
}

QVector<Artist> YandexMusicProvider::listSimilar(const QString& artistId, int limit)
{
    const QString cacheKey = QStringLiteral("similar_artists:%1:%2").arg(artistId).arg(limit);
    if (auto cached = cacheGet(cacheKey)) {
        QVector<Artist> artists;
        for (const QVariant& v : cached->toList())
            artists.append(artistFromVariant(v.toMap()));
        qDebug() << "[Yandex] Similar for" << artistId << "from cache:" << artists.size();
        return artists;
    }

    bool notFound = false;
    const QJsonObject root = requestJson(
        QStringLiteral("/artists/%1/similar").arg(artistId), -1, &notFound);
    if (notFound)
        return {};

    const QJsonArray raw =
        root[QStringLiteral("result")].toObject()[QStringLiteral("similarArtists")].toArray();

    QVector<Artist> artists;
    QVariantList toCache;
    const int total = raw.size();
    for (int i = 0; i < total && (limit < 0 || i < limit); ++i) {
        Artist a = parseArtist(raw[i].toObject());
        a.similarityScore = 1.0 - double(i) / double(total);
        artists.append(a);
        toCache.append(artistToVariant(a));
    }

    cacheSet(cacheKey, toCache, SIMILAR_TTL);
    qDebug() << "[Yandex] Similar for" << artistId << ":" << artists.size() << "of" << total;
    return artists;
}

QVector<Track> YandexMusicProvider::listMediaItems(const QString& artistId, int maxItems)
{
    QVector<Track> tracks;

    for (int page = 0; page < MAX_PAGES; ++page) {
        const QJsonObject root = requestJson(
            QStringLiteral("/artists/%1/tracks?page=%2&page-size=%3")
                .arg(artistId).arg(page).arg(PAGE_SIZE));
        const QJsonArray items =
            root[QStringLiteral("result")].toObject()[QStringLiteral("tracks")].toArray();

        for (const auto& v : items) {
            const QJsonObject obj = v.toObject();
            if (obj[QStringLiteral("available")].isBool() && !obj[QStringLiteral("available")].toBool())
                continue;
            tracks.append(parseTrack(obj));
        }

        if (maxItems >= 0 && tracks.size() >= maxItems) {
            qDebug() << "[Yandex] Early pagination stop for" << artistId
                     << "after page" << page << "(needed" << maxItems << ")";
            break;
        }
        if (items.size() < PAGE_SIZE)
            break;
    }

    if (maxItems >= 0 && tracks.size() > maxItems)
        tracks.resize(maxItems);
    return tracks;
}

bool YandexMusicProvider::probeHasContentInRange(const QString& artistId, const YearRange& years)
{
    const QString cacheKey = QStringLiteral("year_check:%1:%2-%3")
                                 .arg(artistId).arg(years.from).arg(years.to);
    if (auto cached = cacheGet(cacheKey))
        return cached->toBool();

    QJsonObject root;
    bool notFound = false;
    try {
        root = requestJson(QStringLiteral("/artists/%1/brief-info").arg(artistId),
                           m_probeTimeoutMs, &notFound);
    } catch (const ServiceFailure& e) {
        // Answered but unusable: keep the artist rather than lose it
        qWarning() << "[Yandex] Year probe for" << artistId << "unusable, including:" << e.message();
        cacheSet(cacheKey, true, PROBE_FALLBACK_TTL);
        return true;
    }

    if (notFound) {
        cacheSet(cacheKey, true, PROBE_FALLBACK_TTL);
        return true;
    }

    const QJsonObject result = root[QStringLiteral("result")].toObject();
    for (const QString& field : { QStringLiteral("albums"), QStringLiteral("alsoAlbums") }) {
        for (const auto& v : result[field].toArray()) {
            const int year = v.toObject()[QStringLiteral("year")].toInt();
            if (year > 0 && years.contains(year)) {
                cacheSet(cacheKey, true, PROBE_TTL);
                return true;
            }
        }
    }

    cacheSet(cacheKey, false, PROBE_TTL);
    return false;
}

std::optional<QUrl> YandexMusicProvider::resolveMediaUrl(const Track& track)
{
    bool notFound = false;
    const QJsonObject root = requestJson(
        QStringLiteral("/tracks/%1/download-info").arg(track.id), -1, &notFound);
    if (notFound)
        return std::nullopt;

    QVector<QJsonObject> options;
    for (const auto& v : root[QStringLiteral("result")].toArray())
        options.append(v.toObject());
    if (options.isEmpty())
        return std::nullopt;

    // mp3 first, then by bitrate descending
    std::stable_sort(options.begin(), options.end(), [](const QJsonObject& a, const QJsonObject& b) {
        const bool aMp3 = a[QStringLiteral("codec")].toString() == QStringLiteral("mp3");
        const bool bMp3 = b[QStringLiteral("codec")].toString() == QStringLiteral("mp3");
        if (aMp3 != bMp3)
            return aMp3;
        return a[QStringLiteral("bitrateInKbps")].toInt() > b[QStringLiteral("bitrateInKbps")].toInt();
    });

    QJsonObject chosen = options.first();
    if (track.quality == Quality::Low) {
        chosen = options.first();
        for (const QJsonObject& o : options) {
            if (o[QStringLiteral("codec")] == chosen[QStringLiteral("codec")])
                chosen = o;   // lowest bitrate of the preferred codec
        }
    } else if (track.quality == Quality::Medium) {
        for (const QJsonObject& o : options) {
            if (o[QStringLiteral("bitrateInKbps")].toInt() <= 192) {
                chosen = o;
                break;
            }
        }
    }

    const QString infoUrl = chosen[QStringLiteral("downloadInfoUrl")].toString();
    if (infoUrl.isEmpty())
        return std::nullopt;

    m_rateLimiter.acquire();
    const HttpResponse info = m_http.get(QUrl(infoUrl));
    if (!info.isSuccess())
        throw ServiceFailure(QStringLiteral("download info for track %1 returned HTTP %2")
                                 .arg(track.id).arg(info.status));

    QString host, path, ts, s;
    QXmlStreamReader xml(info.body);
    while (!xml.atEnd()) {
        if (xml.readNext() != QXmlStreamReader::StartElement)
            continue;
        const auto name = xml.name();
        if (name == QLatin1String("host"))      host = xml.readElementText();
        else if (name == QLatin1String("path")) path = xml.readElementText();
        else if (name == QLatin1String("ts"))   ts = xml.readElementText();
        else if (name == QLatin1String("s"))    s = xml.readElementText();
    }
    if (xml.hasError() || host.isEmpty() || path.isEmpty())
        throw ServiceFailure(QStringLiteral("malformed download info for track %1").arg(track.id));

    qDebug() << "[Yandex] Resolved media for track" << track.id
             << chosen[QStringLiteral("codec")].toString()
             << chosen[QStringLiteral("bitrateInKbps")].toInt() << "kbps";
    return signedTrackUrl(host, path, ts, s);
}

QUrl YandexMusicProvider::signedTrackUrl(const QString& host, const QString& path,
                                         const QString& ts, const QString& s)
{
    const QByteArray sign = QCryptographicHash::hash(
        SIGN_SALT + path.mid(1).toUtf8() + s.toUtf8(), QCryptographicHash::Md5).toHex();
    return QUrl(QStringLiteral("https://%1/get-mp3/%2/%3%4")
                    .arg(host, QString::fromLatin1(sign), ts, path));
}
