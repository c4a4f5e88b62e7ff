#pragma once

#include "../core/MusicData.h"

#include <QMetaType>
#include <QObject>
#include <QThreadPool>
#include <optional>

class CancelToken;
class ICacheBackend;
class ICatalogService;
class Settings;

// Naming context for the canonical store file
struct FetchHints {
    QString            artistId;
    std::optional<int> year;
};

struct DownloadRequest {
    Track      track;
    QString    targetPath;
    FetchHints hints;
};

struct DownloadOutcome {
    Track   track;              // filePath / fileSize filled on success
    QString targetPath;
    bool    success = false;
    bool    skipped = false;    // cancelled before it started
    QString error;
};

struct DownloadProgress {
    double  fraction = 0.0;
    QString currentItem;
    int     completed = 0;
    int     total = 0;
    int     etaSeconds = 0;
};

Q_DECLARE_METATYPE(DownloadProgress)

// Materialises tracks into output folders through a content-addressed
// store: each track is downloaded once into the songs cache directory and
// hard-linked into every folder that wants it.
class DownloadOrchestrator : public QObject {
    Q_OBJECT
public:
    DownloadOrchestrator(ICatalogService& catalog, ICacheBackend& cache,
                         const Settings& settings, QObject* parent = nullptr);

    // false when the track failed recently (negative cache). Throws
    // NetworkFailure, DownloadFailure or FileSystemFailure.
    bool fetch(Track& track, const QString& targetPath, const FetchHints& hints = {});

    // Runs at most maxConcurrent fetches at once. Never throws for a single
    // item; failures are reported in the outcome. Blocks until done.
    QVector<DownloadOutcome> fetchBatch(const QVector<DownloadRequest>& requests,
                                        const CancelToken* cancel = nullptr);

    QString canonicalPath(const Track& track, const FetchHints& hints) const;

    // Removes destination, hard links, copies when linking is not possible
    static void linkOrCopy(const QString& source, const QString& destination);

    static QString positiveKey(const QString& trackId);
    static QString negativeKey(const QString& trackId);

signals:
    void progress(const DownloadProgress& update);

private:
    std::optional<QString> cachedPath(const QString& trackId);
    void streamToStore(const Track& track, const QUrl& url, const QString& storePath);
    void rememberFailure(const QString& trackId, const QString& reason);
    void materialise(Track& track, const QString& source, const QString& targetPath);

    ICatalogService& m_catalog;
    ICacheBackend&   m_cache;
    QString m_storeDir;
    int     m_chunkSize;
    qint64  m_maxFileSize;
    int     m_negativeTtl;
    int     m_positiveTtl;
    int     m_transferTimeoutMs;
    QThreadPool m_pool;
};
