#include "Settings.h"
#include "Errors.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QSettings>
#include <QtGlobal>

static constexpr int kTenYearsSeconds = 10 * 365 * 24 * 3600;

int DownloadSettings::effectiveSongsCacheTtl() const
{
    return songsCacheTtl > 0 ? songsCacheTtl : kTenYearsSeconds;
}

// ── Environment override lookup ─────────────────────────────────────
// "downloads/max_concurrent" -> ECHOTRAIL_DOWNLOADS_MAX_CONCURRENT
static QString envKeyFor(const QString& key)
{
    QString name = key;
    name.replace(QLatin1Char('/'), QLatin1Char('_'));
    return QStringLiteral("ECHOTRAIL_") + name.toUpper();
}

static QVariant readValue(QSettings& ini, const QString& key, const QVariant& fallback)
{
    const QByteArray env = qgetenv(envKeyFor(key).toUtf8().constData());
    if (!env.isNull())
        return QString::fromUtf8(env);
    return ini.value(key, fallback);
}

static int readInt(QSettings& ini, const QString& key, int fallback)
{
    const QVariant v = readValue(ini, key, fallback);
    bool ok = false;
    const int result = v.toInt(&ok);
    if (!ok)
        throw ConfigurationError(QStringLiteral("%1 is not an integer: %2")
                                     .arg(key, v.toString()));
    return result;
}

static bool readBool(QSettings& ini, const QString& key, bool fallback)
{
    const QString s = readValue(ini, key, fallback).toString().trimmed().toLower();
    if (s == QStringLiteral("true") || s == QStringLiteral("1") || s == QStringLiteral("yes"))
        return true;
    if (s == QStringLiteral("false") || s == QStringLiteral("0") || s == QStringLiteral("no"))
        return false;
    throw ConfigurationError(QStringLiteral("%1 is not a boolean: %2").arg(key, s));
}

static QString readString(QSettings& ini, const QString& key, const QString& fallback)
{
    return readValue(ini, key, fallback).toString();
}

// ── Factories ───────────────────────────────────────────────────────
Settings Settings::defaults(const QString& storageDir)
{
    Settings s;
    s.files.storageDir = storageDir;
    s.cache.database = QDir(storageDir).filePath(QStringLiteral("cache/cache.sqlite"));
    s.resolvePaths();
    return s;
}

Settings Settings::load(const QString& iniPath)
{
    if (!iniPath.isEmpty() && !QFile::exists(iniPath))
        throw ConfigurationError(QStringLiteral("config file not found: %1").arg(iniPath));

    // An empty path still yields a QSettings that only ever returns defaults
    QSettings ini(iniPath.isEmpty() ? QStringLiteral("/dev/null") : iniPath,
                  QSettings::IniFormat);
    if (ini.status() == QSettings::FormatError)
        throw ConfigurationError(QStringLiteral("malformed config file: %1").arg(iniPath));

    Settings s;

    // ── catalog ──
    s.catalog.baseUrl = QUrl(readString(ini, QStringLiteral("catalog/base_url"),
                                        s.catalog.baseUrl.toString()));
    s.catalog.token = readString(ini, QStringLiteral("catalog/token"), QString());
    const QByteArray yandexToken = qgetenv("YANDEX_TOKEN");
    if (s.catalog.token.isEmpty() && !yandexToken.isEmpty())
        s.catalog.token = QString::fromUtf8(yandexToken);
    s.catalog.requestsPerSecond = readInt(ini, QStringLiteral("catalog/requests_per_second"),
                                          s.catalog.requestsPerSecond);
    s.catalog.requestTimeoutMs = readInt(ini, QStringLiteral("catalog/request_timeout_ms"),
                                         s.catalog.requestTimeoutMs);
    s.catalog.probeTimeoutMs = readInt(ini, QStringLiteral("catalog/probe_timeout_ms"),
                                       s.catalog.probeTimeoutMs);

    // ── discovery ──
    auto& d = s.discovery;
    d.similarConcurrency  = readInt(ini, QStringLiteral("discovery/similar_concurrency"), d.similarConcurrency);
    d.batchSize           = readInt(ini, QStringLiteral("discovery/batch_size"), d.batchSize);
    d.batchPauseMs        = readInt(ini, QStringLiteral("discovery/batch_pause_ms"), d.batchPauseMs);
    d.candidateFetchLimit = readInt(ini, QStringLiteral("discovery/candidate_fetch_limit"), d.candidateFetchLimit);
    d.probeRetries        = readInt(ini, QStringLiteral("discovery/probe_retries"), d.probeRetries);
    d.probeBackoffMs      = readInt(ini, QStringLiteral("discovery/probe_backoff_ms"), d.probeBackoffMs);

    // ── downloads ──
    auto& dl = s.downloads;
    dl.maxConcurrent      = readInt(ini, QStringLiteral("downloads/max_concurrent"), dl.maxConcurrent);
    dl.chunkSize          = readInt(ini, QStringLiteral("downloads/chunk_size"), dl.chunkSize);
    dl.maxFileSizeMb      = readInt(ini, QStringLiteral("downloads/max_file_size_mb"), dl.maxFileSizeMb);
    dl.negativeTtlSeconds = readInt(ini, QStringLiteral("downloads/negative_ttl_seconds"), dl.negativeTtlSeconds);
    dl.songsCacheTtl      = readInt(ini, QStringLiteral("downloads/songs_cache_ttl"), dl.songsCacheTtl);

    // ── files ──
    s.files.storageDir    = readString(ini, QStringLiteral("files/storage_dir"), s.files.storageDir);
    s.files.songsCacheDir = readString(ini, QStringLiteral("files/songs_cache_dir"), QString());
    s.files.progressDir   = readString(ini, QStringLiteral("files/progress_dir"), QString());

    // ── cache ──
    s.cache.enabled  = readBool(ini, QStringLiteral("cache/enabled"), s.cache.enabled);
    s.cache.database = readString(ini, QStringLiteral("cache/database"),
                                  QDir(s.files.storageDir).filePath(QStringLiteral("cache/cache.sqlite")));
    s.cache.sweepIntervalSeconds = readInt(ini, QStringLiteral("cache/sweep_interval_seconds"),
                                           s.cache.sweepIntervalSeconds);
    s.cache.defaultTtlSeconds = readInt(ini, QStringLiteral("cache/default_ttl_seconds"),
                                        s.cache.defaultTtlSeconds);

    // ── logging ──
    s.logging.verbose = readBool(ini, QStringLiteral("logging/verbose"), s.logging.verbose);
    s.logging.file    = readString(ini, QStringLiteral("logging/file"), QString());

    s.resolvePaths();
    s.validate();

    qDebug() << "[Settings] Loaded" << (iniPath.isEmpty() ? QStringLiteral("<defaults>") : iniPath)
             << "storage:" << s.files.storageDir;
    return s;
}

void Settings::resolvePaths()
{
    const QDir storage(files.storageDir);
    if (files.songsCacheDir.isEmpty())
        files.songsCacheDir = storage.filePath(QStringLiteral("downloads/tracks"));
    if (files.progressDir.isEmpty())
        files.progressDir = storage.filePath(QStringLiteral("progress"));
}

void Settings::validate() const
{
    if (!catalog.baseUrl.isValid() || catalog.baseUrl.scheme().isEmpty())
        throw ConfigurationError(QStringLiteral("catalog/base_url is not a valid URL"));
    if (catalog.requestsPerSecond < 1)
        throw ConfigurationError(QStringLiteral("catalog/requests_per_second must be >= 1"));
    if (catalog.requestTimeoutMs < 1 || catalog.probeTimeoutMs < 1)
        throw ConfigurationError(QStringLiteral("catalog timeouts must be positive"));
    if (discovery.similarConcurrency < 1 || discovery.batchSize < 1)
        throw ConfigurationError(QStringLiteral("discovery concurrency and batch size must be >= 1"));
    if (discovery.batchPauseMs < 0 || discovery.probeRetries < 1 || discovery.probeBackoffMs < 0)
        throw ConfigurationError(QStringLiteral("discovery retry settings out of range"));
    if (discovery.candidateFetchLimit < 1)
        throw ConfigurationError(QStringLiteral("discovery/candidate_fetch_limit must be >= 1"));
    if (downloads.maxConcurrent < 1 || downloads.chunkSize < 1 || downloads.maxFileSizeMb < 1)
        throw ConfigurationError(QStringLiteral("downloads limits must be positive"));
    if (downloads.negativeTtlSeconds < 1 || downloads.songsCacheTtl < 0)
        throw ConfigurationError(QStringLiteral("downloads TTLs out of range"));
    if (files.storageDir.isEmpty())
        throw ConfigurationError(QStringLiteral("files/storage_dir must not be empty"));
    if (cache.sweepIntervalSeconds < 1 || cache.defaultTtlSeconds < 1)
        throw ConfigurationError(QStringLiteral("cache intervals must be positive"));
}
