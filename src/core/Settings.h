#pragma once

#include <QString>
#include <QUrl>

// ── Settings groups ─────────────────────────────────────────────────
struct CatalogSettings {
    QUrl    baseUrl = QUrl(QStringLiteral("https://api.music.yandex.net"));
    QString token;
    int     requestsPerSecond = 5;
    int     requestTimeoutMs = 15000;
    int     probeTimeoutMs = 10000;
};

struct DiscoverySettings {
    int similarConcurrency = 3;
    int batchSize = 10;
    int batchPauseMs = 500;
    int candidateFetchLimit = 50;
    int probeRetries = 3;
    int probeBackoffMs = 1000;
};

struct DownloadSettings {
    int maxConcurrent = 2;
    int chunkSize = 8192;
    int maxFileSizeMb = 100;
    int negativeTtlSeconds = 300;
    int songsCacheTtl = 0;          // 0 = effectively forever

    int effectiveSongsCacheTtl() const;
    qint64 maxFileSizeBytes() const { return qint64(maxFileSizeMb) * 1024 * 1024; }
};

struct FileSettings {
    QString storageDir = QStringLiteral("./storage");
    QString songsCacheDir;
    QString progressDir;
};

struct CacheSettings {
    bool    enabled = true;
    QString database;               // empty = in-process cache only
    int     sweepIntervalSeconds = 300;
    int     defaultTtlSeconds = 3600;
};

struct LoggingSettings {
    bool    verbose = false;
    QString file;
};

// Runtime configuration. Built once at startup and handed to each
// component by const reference.
class Settings {
public:
    CatalogSettings   catalog;
    DiscoverySettings discovery;
    DownloadSettings  downloads;
    FileSettings      files;
    CacheSettings     cache;
    LoggingSettings   logging;

    // Defaults rooted at storageDir, derived paths filled in
    static Settings defaults(const QString& storageDir = QStringLiteral("./storage"));

    // INI file (may be empty for defaults only) plus ECHOTRAIL_* / YANDEX_TOKEN
    // environment overrides. Throws ConfigurationError.
    static Settings load(const QString& iniPath);

    // Fill empty songs cache / progress paths from storageDir
    void resolvePaths();

    void validate() const;
};
