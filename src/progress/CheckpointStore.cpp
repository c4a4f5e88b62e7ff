#include "CheckpointStore.h"
#include "../cache/ICacheBackend.h"
#include "../core/Errors.h"
#include "../core/FileNaming.h"
#include "../core/Settings.h"

#include <QCryptographicHash>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QJsonDocument>
#include <QMutexLocker>
#include <QSaveFile>

CheckpointStore::CheckpointStore(const Settings& settings, ICacheBackend* cache)
    : m_progressDir(settings.files.progressDir)
    , m_cache(cache)
{
    if (!QDir().mkpath(m_progressDir))
        qWarning() << "[Progress] Cannot create progress directory" << m_progressDir;
}

QString CheckpointStore::progressFilePath(const QString& session) const
{
    return QDir(m_progressDir).filePath(FileNaming::sessionFileName(session));
}

QString CheckpointStore::cacheKey(const QString& session)
{
    return QStringLiteral("echotrail:progress:%1").arg(session);
}

QString CheckpointStore::commandSignature(const QStringList& seedIds, int similarLimit,
                                          int maxDepth, int songsPerArtist)
{
    QStringList sorted = seedIds;
    sorted.sort();
    const QString content = QStringLiteral("%1_%2_%3_%4")
        .arg(sorted.join(QLatin1Char(',')))
        .arg(similarLimit)
        .arg(maxDepth)
        .arg(songsPerArtist);
    const QByteArray digest =
        QCryptographicHash::hash(content.toUtf8(), QCryptographicHash::Md5).toHex();
    return QString::fromLatin1(digest.left(12));
}

// ── Dual write ──────────────────────────────────────────────────────
void CheckpointStore::persist(const ProgressCheckpoint& checkpoint)
{
    const QJsonObject json = checkpoint.toJson();

    if (m_cache) {
        try {
            m_cache->set(cacheKey(checkpoint.sessionName), json.toVariantMap(),
                         checkpoint.isComplete ? COMPLETE_TTL : ACTIVE_TTL);
        } catch (const CacheFailure& e) {
            qWarning() << "[Progress] Cache save failed for" << checkpoint.sessionName
                       << ":" << e.message();
        }
    }

    const QString path = progressFilePath(checkpoint.sessionName);
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning() << "[Progress] Cannot write" << path << ":" << file.errorString();
        return;
    }
    file.write(QJsonDocument(json).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        qWarning() << "[Progress] Commit failed for" << path << ":" << file.errorString();
        return;
    }
    qDebug() << "[Progress] Saved" << checkpoint.sessionName
             << "index:" << checkpoint.lastArtistIndex
             << "processed:" << checkpoint.processedArtistIds.size();
}

// ── Lifecycle ───────────────────────────────────────────────────────
ProgressCheckpoint CheckpointStore::createCheckpoint(const QString& session, int totalArtists,
                                                     const QString& signature)
{
    ProgressCheckpoint cp;
    cp.sessionName = session;
    cp.totalArtists = totalArtists;
    cp.commandHash = signature;
    cp.startedAt = QDateTime::currentDateTime();
    cp.lastUpdatedAt = cp.startedAt;

    QMutexLocker lock(&m_mutex);
    m_current = cp;
    persist(cp);
    qInfo() << "[Progress] Created checkpoint" << session << "for" << totalArtists << "artists";
    return cp;
}

std::optional<ProgressCheckpoint> CheckpointStore::loadCheckpoint(const QString& session)
{
    std::optional<ProgressCheckpoint> loaded;

    if (m_cache) {
        try {
            if (auto cached = m_cache->get(cacheKey(session))) {
                loaded = ProgressCheckpoint::fromJson(QJsonObject::fromVariantMap(cached->toMap()));
                if (loaded)
                    qInfo() << "[Progress] Loaded" << session << "from cache";
            }
        } catch (const CacheFailure& e) {
            qWarning() << "[Progress] Cache load failed for" << session << ":" << e.message();
        }
    }

    if (!loaded) {
        QFile file(progressFilePath(session));
        if (file.exists()) {
            if (!file.open(QIODevice::ReadOnly)) {
                qWarning() << "[Progress] Cannot read" << file.fileName() << ":" << file.errorString();
            } else {
                QJsonParseError err;
                const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &err);
                if (err.error != QJsonParseError::NoError || !doc.isObject()) {
                    qWarning() << "[Progress] Corrupt progress file" << file.fileName()
                               << ":" << err.errorString();
                } else {
                    loaded = ProgressCheckpoint::fromJson(doc.object());
                    if (loaded)
                        qInfo() << "[Progress] Loaded" << session << "from" << file.fileName();
                }
            }
        }
    }

    if (!loaded) {
        qInfo() << "[Progress] No existing progress for session" << session;
        return std::nullopt;
    }

    QMutexLocker lock(&m_mutex);
    m_current = loaded;
    return loaded;
}

void CheckpointStore::saveProgress(const QString& session, const QString& artistId, int index,
                                   int totalArtists, const QString& signature)
{
    QMutexLocker lock(&m_mutex);
    if (!m_current || m_current->sessionName != session) {
        ProgressCheckpoint cp;
        cp.sessionName = session;
        cp.totalArtists = totalArtists;
        cp.commandHash = signature;
        cp.startedAt = QDateTime::currentDateTime();
        m_current = cp;
    }

    ProgressCheckpoint& cp = *m_current;
    cp.processedArtistIds.insert(artistId);
    if (index >= cp.lastArtistIndex) {
        cp.lastArtistIndex = index;
        cp.lastArtistId = artistId;
    }
    cp.lastUpdatedAt = QDateTime::currentDateTime();
    persist(cp);
}

void CheckpointStore::recordTrackOutcome(int downloaded, int failed)
{
    QMutexLocker lock(&m_mutex);
    if (!m_current)
        return;
    m_current->tracksDownloaded += downloaded;
    m_current->tracksFailed += failed;
}

void CheckpointStore::markComplete(const QString& session)
{
    QMutexLocker lock(&m_mutex);
    if (!m_current || m_current->sessionName != session) {
        qWarning() << "[Progress] markComplete for inactive session" << session;
        return;
    }
    m_current->isComplete = true;
    m_current->lastUpdatedAt = QDateTime::currentDateTime();
    persist(*m_current);
    qInfo() << "[Progress] Session complete:" << session;
}

bool CheckpointStore::resetSession(const QString& session)
{
    bool deleted = false;

    if (m_cache) {
        try {
            if (m_cache->remove(cacheKey(session))) {
                qInfo() << "[Progress] Deleted cached progress for" << session;
                deleted = true;
            }
        } catch (const CacheFailure& e) {
            qWarning() << "[Progress] Cache delete failed for" << session << ":" << e.message();
        }
    }

    const QString path = progressFilePath(session);
    if (QFile::exists(path)) {
        if (QFile::remove(path)) {
            qInfo() << "[Progress] Deleted progress file" << path;
            deleted = true;
        } else {
            qWarning() << "[Progress] Cannot delete progress file" << path;
        }
    }

    QMutexLocker lock(&m_mutex);
    if (m_current && m_current->sessionName == session)
        m_current.reset();
    return deleted;
}

// ── Queries ─────────────────────────────────────────────────────────
bool CheckpointStore::isCompatible(const ProgressCheckpoint& checkpoint, const QString& signature) const
{
    if (checkpoint.commandHash == signature)
        return true;
    qWarning() << "[Progress] Checkpoint signature mismatch:" << checkpoint.commandHash
               << "vs current" << signature << "- use --reset-progress to start fresh";
    return false;
}

QVector<Artist> CheckpointStore::remaining(const QVector<Artist>& artists,
                                           const ProgressCheckpoint& checkpoint)
{
    QVector<Artist> out;
    for (const Artist& a : artists) {
        if (!checkpoint.isProcessed(a.id))
            out.append(a);
    }
    qInfo() << "[Progress] Skipping" << (artists.size() - out.size())
            << "processed artists," << out.size() << "remaining";
    return out;
}

std::optional<ProgressCheckpoint> CheckpointStore::current() const
{
    QMutexLocker lock(&m_mutex);
    return m_current;
}

QString CheckpointStore::summary() const
{
    QMutexLocker lock(&m_mutex);
    if (!m_current)
        return QString();

    const ProgressCheckpoint& cp = *m_current;
    const int processed = cp.processedArtistIds.size();
    const double pct = cp.totalArtists > 0 ? processed * 100.0 / cp.totalArtists : 0.0;
    const double hours = cp.startedAt.secsTo(cp.lastUpdatedAt) / 3600.0;

    return QStringLiteral("Session: %1\n"
                          "Progress: %2/%3 (%4%)\n"
                          "Last artist: %5\n"
                          "Elapsed: %6 hours\n"
                          "Tracks: %7 downloaded, %8 failed")
        .arg(cp.sessionName)
        .arg(processed)
        .arg(cp.totalArtists)
        .arg(pct, 0, 'f', 1)
        .arg(cp.lastArtistId.isEmpty() ? QStringLiteral("-") : cp.lastArtistId)
        .arg(hours, 0, 'f', 1)
        .arg(cp.tracksDownloaded)
        .arg(cp.tracksFailed);
}
