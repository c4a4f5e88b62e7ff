#include "DownloadOrchestrator.h"
#include "../cache/ICacheBackend.h"
#include "../catalog/HttpClient.h"
#include "../catalog/ICatalogService.h"
#include "../core/CancelToken.h"
#include "../core/Errors.h"
#include "../core/FileNaming.h"
#include "../core/Settings.h"

#include <QDebug>
#include <QDir>
#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QMutexLocker>
#include <QQueue>
#include <QSaveFile>
#include <QWaitCondition>
#include <QtConcurrent>

#include <cerrno>
#include <cstring>
#include <exception>
#include <unistd.h>

DownloadOrchestrator::DownloadOrchestrator(ICatalogService& catalog, ICacheBackend& cache,
                                           const Settings& settings, QObject* parent)
    : QObject(parent)
    , m_catalog(catalog)
    , m_cache(cache)
    , m_storeDir(settings.files.songsCacheDir)
    , m_chunkSize(settings.downloads.chunkSize)
    , m_maxFileSize(settings.downloads.maxFileSizeBytes())
    , m_negativeTtl(settings.downloads.negativeTtlSeconds)
    , m_positiveTtl(settings.downloads.effectiveSongsCacheTtl())
    , m_transferTimeoutMs(settings.catalog.requestTimeoutMs)
{
    m_pool.setMaxThreadCount(qMax(1, settings.downloads.maxConcurrent));
    if (!QDir().mkpath(m_storeDir))
        qWarning() << "[Download] Cannot create songs cache directory" << m_storeDir;
}

QString DownloadOrchestrator::positiveKey(const QString& trackId)
{
    return QStringLiteral("track_%1").arg(trackId);
}

QString DownloadOrchestrator::negativeKey(const QString& trackId)
{
    return QStringLiteral("failed_track_%1").arg(trackId);
}

QString DownloadOrchestrator::canonicalPath(const Track& track, const FetchHints& hints) const
{
    QString artistId = hints.artistId;
    if (artistId.isEmpty() && !track.artistIds.isEmpty())
        artistId = track.artistIds.first();
    const std::optional<int> year = hints.year ? hints.year : track.year;
    return QDir(m_storeDir).filePath(FileNaming::canonicalTrackName(artistId, track.id, year));
}

// ── Hard links ──────────────────────────────────────────────────────
void DownloadOrchestrator::linkOrCopy(const QString& source, const QString& destination)
{
    if (QFileInfo(source).absoluteFilePath() == QFileInfo(destination).absoluteFilePath())
        return;

    const QString parentDir = QFileInfo(destination).absolutePath();
    if (!QDir().mkpath(parentDir))
        throw FileSystemFailure(QStringLiteral("Cannot create directory"), parentDir);

    if (QFileInfo::exists(destination) && !QFile::remove(destination))
        throw FileSystemFailure(QStringLiteral("Cannot replace existing file"), destination);

    const QByteArray src = QFile::encodeName(source);
    const QByteArray dst = QFile::encodeName(destination);
    if (::link(src.constData(), dst.constData()) == 0)
        return;

    const int err = errno;
    if (err != EXDEV && err != EPERM && err != ENOTSUP && err != EMLINK) {
        throw FileSystemFailure(QStringLiteral("Cannot link %1: %2")
                                    .arg(source, QString::fromLocal8Bit(std::strerror(err))),
                                destination);
    }

    qWarning() << "[Download] Hard link failed, falling back to copy:"
               << QString::fromLocal8Bit(std::strerror(err));
    if (!QFile::copy(source, destination))
        throw FileSystemFailure(QStringLiteral("Cannot copy %1").arg(source), destination);
}

// ── Cache bookkeeping ───────────────────────────────────────────────
std::optional<QString> DownloadOrchestrator::cachedPath(const QString& trackId)
{
    try {
        const auto value = m_cache.get(positiveKey(trackId));
        if (!value)
            return std::nullopt;
        const QString path = value->toString();
        if (!path.isEmpty() && QFileInfo::exists(path))
            return path;
        qDebug() << "[Download] Stale store entry for" << trackId << "->" << path;
        m_cache.remove(positiveKey(trackId));
    } catch (const CacheFailure& e) {
        qWarning() << "[Download] Cache lookup failed for" << trackId << ":" << e.message();
    }
    return std::nullopt;
}

void DownloadOrchestrator::rememberFailure(const QString& trackId, const QString& reason)
{
    try {
        m_cache.set(negativeKey(trackId), reason, m_negativeTtl);
    } catch (const CacheFailure& e) {
        qWarning() << "[Download] Cannot record failure for" << trackId << ":" << e.message();
    }
}

void DownloadOrchestrator::materialise(Track& track, const QString& source, const QString& targetPath)
{
    linkOrCopy(source, targetPath);
    track.filePath = targetPath;
    track.fileSize = QFileInfo(targetPath).size();
}

// ── Transfer ────────────────────────────────────────────────────────
void DownloadOrchestrator::streamToStore(const Track& track, const QUrl& url, const QString& storePath)
{
    if (!QDir().mkpath(QFileInfo(storePath).absolutePath()))
        throw FileSystemFailure(QStringLiteral("Cannot create store directory"), storePath);

    QSaveFile file(storePath);
    if (!file.open(QIODevice::WriteOnly))
        throw FileSystemFailure(QStringLiteral("Cannot open for writing: %1").arg(file.errorString()),
                                storePath);

    QString rejection;
    bool writeFailed = false;

    HttpClient http(m_transferTimeoutMs);
    StreamResult result;
    try {
        result = http.stream(url, m_chunkSize,
            [&](int status, qint64 declaredSize) {
                if (status != 0 && (status < 200 || status >= 300)) {
                    rejection = QStringLiteral("HTTP %1 when downloading track %2").arg(status).arg(track.id);
                    return false;
                }
                if (declaredSize > m_maxFileSize) {
                    rejection = QStringLiteral("File too large: %1 MB")
                                    .arg(declaredSize / 1024.0 / 1024.0, 0, 'f', 1);
                    return false;
                }
                return true;
            },
            [&](const QByteArray& chunk) {
                if (file.pos() + chunk.size() > m_maxFileSize) {
                    rejection = QStringLiteral("File too large: exceeds %1 MB")
                                    .arg(m_maxFileSize / 1024 / 1024);
                    return false;
                }
                if (file.write(chunk) != chunk.size()) {
                    writeFailed = true;
                    return false;
                }
                return true;
            });
    } catch (const NetworkFailure&) {
        file.cancelWriting();
        throw;
    }

    if (writeFailed) {
        const QString reason = file.errorString();
        file.cancelWriting();
        throw FileSystemFailure(QStringLiteral("Write failed: %1").arg(reason), storePath);
    }
    if (result.aborted) {
        file.cancelWriting();
        throw DownloadFailure(rejection, track.id);
    }
    if (result.declaredSize >= 0 && result.bytesReceived != result.declaredSize) {
        file.cancelWriting();
        throw NetworkFailure(QStringLiteral("Transfer of track %1 ended after %2 of %3 bytes")
                                 .arg(track.id).arg(result.bytesReceived).arg(result.declaredSize));
    }
    if (!file.commit())
        throw FileSystemFailure(QStringLiteral("Commit failed: %1").arg(file.errorString()), storePath);

    qDebug() << "[Download] Stored" << track.id << result.bytesReceived << "bytes at" << storePath;
}

bool DownloadOrchestrator::fetch(Track& track, const QString& targetPath, const FetchHints& hints)
{
    try {
        if (m_cache.exists(negativeKey(track.id))) {
            qDebug() << "[Download] Skipping recently failed track" << track.id;
            return false;
        }
    } catch (const CacheFailure& e) {
        qWarning() << "[Download] Negative cache check failed for" << track.id << ":" << e.message();
    }

    if (const auto stored = cachedPath(track.id)) {
        materialise(track, *stored, targetPath);
        qInfo() << "[Download] Using stored track" << track.id << "from" << *stored;
        return true;
    }

    const QString storePath = canonicalPath(track, hints);
    try {
        const std::optional<QUrl> url = m_catalog.resolveMediaUrl(track);
        if (!url)
            throw DownloadFailure(QStringLiteral("No download URL for track %1").arg(track.id), track.id);

        streamToStore(track, *url, storePath);
    } catch (const NetworkFailure& e) {
        qWarning() << "[Download] Network error for track" << track.id << ":" << e.message();
        rememberFailure(track.id, e.message());
        throw;
    } catch (const DownloadFailure& e) {
        qWarning() << "[Download] Track" << track.id << "failed:" << e.message();
        rememberFailure(track.id, e.message());
        throw;
    } catch (const ServiceFailure& e) {
        qWarning() << "[Download] Catalog refused track" << track.id << ":" << e.message();
        rememberFailure(track.id, e.message());
        throw DownloadFailure(QStringLiteral("Download failed: %1").arg(e.message()), track.id);
    }

    materialise(track, storePath, targetPath);

    try {
        m_cache.set(positiveKey(track.id), storePath, m_positiveTtl);
    } catch (const CacheFailure& e) {
        qWarning() << "[Download] Cannot record stored track" << track.id << ":" << e.message();
    }

    qInfo() << "[Download] Downloaded track" << track.id << "to" << targetPath;
    return true;
}

// ── Batch ───────────────────────────────────────────────────────────
QVector<DownloadOutcome> DownloadOrchestrator::fetchBatch(const QVector<DownloadRequest>& requests,
                                                          const CancelToken* cancel)
{
    QVector<DownloadOutcome> outcomes(requests.size());
    if (requests.isEmpty())
        return outcomes;

    QMutex mutex;
    QWaitCondition completed;
    QQueue<int> finishedOrder;

    QList<QFuture<void>> futures;
    futures.reserve(requests.size());
    for (int i = 0; i < requests.size(); ++i) {
        futures.append(QtConcurrent::run(&m_pool, [=, this, &outcomes, &mutex, &completed, &finishedOrder]() {
            DownloadOutcome outcome;
            outcome.track = requests[i].track;
            outcome.targetPath = requests[i].targetPath;

            if (isCancelled(cancel)) {
                outcome.skipped = true;
            } else {
                try {
                    outcome.success = fetch(outcome.track, outcome.targetPath, requests[i].hints);
                    if (!outcome.success)
                        outcome.error = QStringLiteral("recently failed");
                } catch (const EchotrailError& e) {
                    outcome.error = e.message();
                } catch (const std::exception& e) {
                    qWarning() << "[Download] Unexpected error for track" << outcome.track.id << ":" << e.what();
                    outcome.error = QString::fromLocal8Bit(e.what());
                }
            }

            QMutexLocker lock(&mutex);
            outcomes[i] = outcome;
            finishedOrder.enqueue(i);
            completed.wakeAll();
        }));
    }

    QElapsedTimer clock;
    clock.start();
    int done = 0;
    int reported = 0;
    int succeeded = 0;
    const int total = requests.size();

    while (done < total) {
        QMutexLocker lock(&mutex);
        while (finishedOrder.isEmpty())
            completed.wait(&mutex);
        const int index = finishedOrder.dequeue();
        const DownloadOutcome outcome = outcomes[index];
        lock.unlock();

        ++done;
        if (outcome.skipped)
            continue;
        ++reported;
        if (outcome.success)
            ++succeeded;

        DownloadProgress update;
        update.completed = done;
        update.total = total;
        update.fraction = double(done) / total;
        update.currentItem = outcome.success ? outcome.track.title : QStringLiteral("Failed track");
        const double perItem = double(clock.elapsed()) / 1000.0 / done;
        update.etaSeconds = int(perItem * (total - done));
        emit progress(update);
    }

    for (auto& future : futures)
        future.waitForFinished();

    qInfo() << "[Download] Batch finished:" << succeeded << "/" << total << "downloaded,"
            << (total - reported) << "skipped";
    return outcomes;
}
