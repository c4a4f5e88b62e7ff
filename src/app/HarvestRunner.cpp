#include "HarvestRunner.h"
#include "../cache/ICacheBackend.h"
#include "../catalog/ICatalogService.h"
#include "../core/CancelToken.h"
#include "../core/Errors.h"
#include "../core/FileNaming.h"
#include "../core/Settings.h"
#include "../core/TrackSelector.h"
#include "../discovery/DiscoveryEngine.h"
#include "../download/DownloadOrchestrator.h"
#include "../progress/CheckpointStore.h"

#include <QDebug>
#include <QDir>
#include <QDirIterator>
#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>
#include <QHash>
#include <QJsonDocument>
#include <QProcess>
#include <QRandomGenerator>
#include <QSaveFile>
#include <QThread>

#include <algorithm>

HarvestRunner::HarvestRunner(ICatalogService& catalog, ICacheBackend& cache,
                             const Settings& settings, QObject* parent)
    : QObject(parent)
    , m_catalog(catalog)
    , m_cache(cache)
    , m_settings(settings)
{
}

// ── Run ─────────────────────────────────────────────────────────────
int HarvestRunner::run(const CommandLineOptions& options, CancelToken* cancel)
{
    m_stats = HarvestStats();
    QElapsedTimer clock;
    clock.start();

    if (!QDir().mkpath(options.outputDir))
        throw FileSystemFailure(QStringLiteral("Cannot create output directory"), options.outputDir);
    qInfo() << "[Harvest] Output directory:" << options.outputDir;

    CheckpointStore checkpoints(m_settings, &m_cache);
    const bool sessionMode = !options.session.isEmpty();
    if (sessionMode && options.resetProgress) {
        if (checkpoints.resetSession(options.session))
            qInfo() << "[Harvest] Progress reset for session" << options.session;
    }

    // ── Discovery ───────────────────────────────────────────────────
    DiscoveryEngine engine(m_catalog, m_settings);
    connect(&engine, &DiscoveryEngine::levelFinished, this,
            [](int depth, int admitted, int total) {
        qInfo() << "[Harvest] Depth" << depth << "added" << admitted << "artists, total" << total;
    });

    const DiscoveryResult discovery = engine.discover(options.artistIds, options.toDiscoveryOptions(), cancel);
    if (!options.treeJson.isEmpty())
        writeTree(options.treeJson, discovery.toJson());

    const QVector<Artist>& artists = discovery.artists;
    m_stats.artistsTotal = artists.size();

    if (discovery.interrupted) {
        m_stats.interrupted = true;
        m_stats.elapsedSeconds = clock.elapsed() / 1000.0;
        return 130;
    }

    // ── Checkpoint ──────────────────────────────────────────────────
    const QString signature = CheckpointStore::commandSignature(
        options.artistIds, options.similar, options.depth, options.tracks);

    QVector<Artist> pending = artists;
    if (sessionMode) {
        std::optional<ProgressCheckpoint> checkpoint;
        if (options.resume)
            checkpoint = checkpoints.loadCheckpoint(options.session);

        if (checkpoint && !checkpoints.isCompatible(*checkpoint, signature)) {
            throw ConfigurationError(
                QStringLiteral("Session '%1' was started with different parameters; "
                               "use --reset-progress to start over").arg(options.session));
        }
        if (checkpoint && checkpoint->isComplete) {
            qInfo() << "[Harvest] Session" << options.session << "is already complete";
            m_stats.artistsSkipped = artists.size();
            m_stats.elapsedSeconds = clock.elapsed() / 1000.0;
            return 0;
        }
        if (!checkpoint)
            checkpoint = checkpoints.createCheckpoint(options.session, artists.size(), signature);

        pending = CheckpointStore::remaining(artists, *checkpoint);
        m_stats.artistsSkipped = artists.size() - pending.size();
    }

    // ── Downloads ───────────────────────────────────────────────────
    DownloadOrchestrator downloads(m_catalog, m_cache, m_settings);
    connect(&downloads, &DownloadOrchestrator::progress, this, [](const DownloadProgress& p) {
        qDebug() << "[Harvest]" << p.completed << "/" << p.total << p.currentItem
                 << "eta" << p.etaSeconds << "s";
    });

    QHash<QString, int> positions;
    for (int k = 0; k < artists.size(); ++k)
        positions.insert(artists[k].id, k);

    for (int i = 0; i < pending.size(); ++i) {
        if (isCancelled(cancel)) {
            m_stats.interrupted = true;
            break;
        }

        const Artist& artist = pending[i];
        emit artistStarted(i, pending.size(), artist.name);
        qInfo() << "[Harvest] Artist" << (i + 1) << "/" << pending.size() << artist.name;

        const int downloadedBefore = m_stats.tracksDownloaded;
        const int failedBefore = m_stats.tracksFailed;
        if (!processArtist(artist, options, downloads, cancel)) {
            if (isCancelled(cancel)) {
                m_stats.interrupted = true;
                break;
            }
            continue;
        }
        ++m_stats.artistsProcessed;

        if (sessionMode) {
            checkpoints.recordTrackOutcome(m_stats.tracksDownloaded - downloadedBefore,
                                           m_stats.tracksFailed - failedBefore);
            checkpoints.saveProgress(options.session, artist.id, positions.value(artist.id),
                                     artists.size(), signature);
        }

        if (i + 1 < pending.size() && options.parallel < 5)
            QThread::msleep(500);
    }

    // ── Post-processing ─────────────────────────────────────────────
    if (!m_stats.interrupted) {
        if (sessionMode)
            checkpoints.markComplete(options.session);
        if (options.shuffle && m_stats.tracksDownloaded > 0)
            shuffleAndRenumber(options.outputDir);
        if (options.archive)
            archiveDirectory(options.outputDir);
    } else if (sessionMode) {
        qWarning().noquote() << "[Harvest] Interrupted. Resume with --session"
                             << options.session << "--resume\n" << checkpoints.summary();
    }

    m_stats.elapsedSeconds = clock.elapsed() / 1000.0;
    return m_stats.interrupted ? 130 : 0;
}

// Returns false when the artist must be retried by a later run
bool HarvestRunner::processArtist(const Artist& artist, const CommandLineOptions& options,
                                  DownloadOrchestrator& downloads, CancelToken* cancel)
{
    const SelectionOptions selection = options.toSelectionOptions();

    QVector<Track> tracks;
    try {
        tracks = TrackSelector::select(
            m_catalog.listMediaItems(artist.id, selection.maxItemsNeeded()), selection);
    } catch (const EchotrailError& e) {
        qWarning() << "[Harvest] Cannot list tracks of" << artist.name << ":" << e.message();
        return false;
    }

    if (tracks.isEmpty()) {
        qWarning() << "[Harvest] No tracks selected for" << artist.name;
        return true;
    }

    const QString folder = options.shuffle
        ? options.outputDir
        : QDir(options.outputDir).filePath(FileNaming::sanitize(artist.name));

    QVector<DownloadRequest> requests;
    requests.reserve(tracks.size());
    for (Track track : tracks) {
        track.quality = options.quality;
        DownloadRequest request;
        request.targetPath = QDir(folder).filePath(FileNaming::displayTrackName(track));
        request.hints.artistId = artist.id;
        request.hints.year = track.year;
        request.track = track;
        requests.append(request);
    }

    const QVector<DownloadOutcome> outcomes = downloads.fetchBatch(requests, cancel);

    int ok = 0;
    int failed = 0;
    bool skipped = false;
    for (const DownloadOutcome& outcome : outcomes) {
        if (outcome.skipped) {
            skipped = true;
        } else if (outcome.success) {
            ++ok;
            m_stats.totalBytes += outcome.track.fileSize;
        } else {
            ++failed;
            qWarning() << "[Harvest] Failed:" << outcome.track.title << "-" << outcome.error;
        }
    }
    m_stats.tracksDownloaded += ok;
    m_stats.tracksFailed += failed;
    qInfo() << "[Harvest] Downloaded" << ok << "/" << tracks.size() << "tracks from" << artist.name;

    return !skipped;
}

void HarvestRunner::writeTree(const QString& path, const QJsonObject& tree) const
{
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning() << "[Harvest] Cannot write tree to" << path << ":" << file.errorString();
        return;
    }
    file.write(QJsonDocument(tree).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        qWarning() << "[Harvest] Cannot commit tree" << path << ":" << file.errorString();
        return;
    }
    qInfo() << "[Harvest] Discovery tree written to" << path;
}

// ── Output layout ───────────────────────────────────────────────────
int HarvestRunner::shuffleAndRenumber(const QString& dir)
{
    QStringList files;
    QDirIterator it(dir, {QStringLiteral("*.mp3")}, QDir::Files, QDirIterator::Subdirectories);
    while (it.hasNext())
        files.append(it.next());

    if (files.isEmpty()) {
        qWarning() << "[Harvest] No tracks found to shuffle in" << dir;
        return 0;
    }

    std::shuffle(files.begin(), files.end(), *QRandomGenerator::global());

    const QDir root(dir);
    const QString staging = root.filePath(QStringLiteral("_shuffled_temp"));
    if (!QDir().mkpath(staging))
        throw FileSystemFailure(QStringLiteral("Cannot create staging directory"), staging);

    for (int i = 0; i < files.size(); ++i) {
        const QString name = QStringLiteral("%1_%2")
            .arg(i + 1, 3, 10, QLatin1Char('0'))
            .arg(QFileInfo(files[i]).fileName());
        const QString staged = QDir(staging).filePath(name);
        if (!QFile::rename(files[i], staged))
            throw FileSystemFailure(QStringLiteral("Cannot move %1").arg(files[i]), staged);
    }

    for (const QFileInfo& entry : root.entryInfoList(QDir::Dirs | QDir::NoDotAndDotDot)) {
        if (entry.absoluteFilePath() == QFileInfo(staging).absoluteFilePath())
            continue;
        if (!QDir(entry.absoluteFilePath()).removeRecursively())
            qWarning() << "[Harvest] Cannot remove" << entry.absoluteFilePath();
    }

    const QDir stagingDir(staging);
    for (const QString& name : stagingDir.entryList(QDir::Files)) {
        if (!QFile::rename(stagingDir.filePath(name), root.filePath(name)))
            throw FileSystemFailure(QStringLiteral("Cannot move %1").arg(name), root.filePath(name));
    }
    if (!root.rmdir(QStringLiteral("_shuffled_temp")))
        qWarning() << "[Harvest] Cannot remove staging directory" << staging;

    qInfo() << "[Harvest] Shuffled and renumbered" << files.size() << "tracks";
    return files.size();
}

QString HarvestRunner::archiveDirectory(const QString& dir)
{
    const QFileInfo info(QDir(dir).absolutePath());
    const QString archive = info.absoluteFilePath() + QStringLiteral(".tar.gz");

    QProcess tar;
    tar.setWorkingDirectory(info.absolutePath());
    tar.start(QStringLiteral("tar"),
              {QStringLiteral("-czf"), archive, info.fileName()});
    if (!tar.waitForFinished(-1) || tar.exitStatus() != QProcess::NormalExit || tar.exitCode() != 0) {
        throw FileSystemFailure(QStringLiteral("tar failed: %1")
                                    .arg(QString::fromLocal8Bit(tar.readAllStandardError()).trimmed()),
                                archive);
    }

    qInfo() << "[Harvest] Archive created:" << archive
            << QFileInfo(archive).size() / (1024.0 * 1024.0) << "MB";
    return archive;
}

QString HarvestRunner::statisticsReport() const
{
    const QString rule(60, QLatin1Char('='));
    QString report = rule + QStringLiteral("\nDOWNLOAD STATISTICS\n") + rule + QLatin1Char('\n');
    report += QStringLiteral("Artists discovered:   %1\n").arg(m_stats.artistsTotal);
    report += QStringLiteral("Artists processed:    %1\n").arg(m_stats.artistsProcessed);
    if (m_stats.artistsSkipped > 0)
        report += QStringLiteral("Artists resumed past: %1\n").arg(m_stats.artistsSkipped);
    report += QStringLiteral("Tracks downloaded:    %1\n").arg(m_stats.tracksDownloaded);
    report += QStringLiteral("Tracks failed:        %1\n").arg(m_stats.tracksFailed);
    report += QStringLiteral("Total size:           %1 MB\n")
                  .arg(m_stats.totalBytes / (1024.0 * 1024.0), 0, 'f', 2);
    report += QStringLiteral("Duration:             %1 seconds\n").arg(m_stats.elapsedSeconds, 0, 'f', 1);
    if (m_stats.elapsedSeconds > 0 && m_stats.tracksDownloaded > 0) {
        report += QStringLiteral("Avg time per track:   %1 seconds\n")
                      .arg(m_stats.elapsedSeconds / m_stats.tracksDownloaded, 0, 'f', 2);
    }
    report += rule;
    return report;
}
