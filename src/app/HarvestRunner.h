#pragma once

#include "CommandLine.h"

#include <QObject>

class CancelToken;
class CheckpointStore;
class DownloadOrchestrator;
class ICacheBackend;
class ICatalogService;
class Settings;

struct HarvestStats {
    int    artistsTotal = 0;
    int    artistsProcessed = 0;
    int    artistsSkipped = 0;     // already done in a resumed session
    int    tracksDownloaded = 0;
    int    tracksFailed = 0;
    qint64 totalBytes = 0;
    double elapsedSeconds = 0.0;
    bool   interrupted = false;
};

// One command-line run: discovery, checkpointed per-artist downloads and
// output post-processing.
class HarvestRunner : public QObject {
    Q_OBJECT
public:
    HarvestRunner(ICatalogService& catalog, ICacheBackend& cache, const Settings& settings,
                  QObject* parent = nullptr);

    // Exit code: 0 done, 130 interrupted. Fatal errors propagate.
    int run(const CommandLineOptions& options, CancelToken* cancel);

    HarvestStats stats() const { return m_stats; }
    QString statisticsReport() const;

    // Moves every .mp3 below dir into dir with a shuffled 001_ prefix,
    // removes the emptied subfolders. Returns the number of files.
    static int shuffleAndRenumber(const QString& dir);

    // <dir>.tar.gz next to dir. Throws FileSystemFailure.
    static QString archiveDirectory(const QString& dir);

signals:
    void artistStarted(int index, int total, const QString& name);

private:
    bool processArtist(const Artist& artist, const CommandLineOptions& options,
                       DownloadOrchestrator& downloads, CancelToken* cancel);
    void writeTree(const QString& path, const QJsonObject& tree) const;

    ICatalogService& m_catalog;
    ICacheBackend&   m_cache;
    const Settings&  m_settings;
    HarvestStats     m_stats;
};
