#pragma once

#include "ProgressCheckpoint.h"
#include "../core/MusicData.h"

#include <QMutex>
#include <QStringList>
#include <QVector>
#include <optional>

class ICacheBackend;
class Settings;

// Named-session progress for resumable runs. Every save writes the whole
// checkpoint twice: to the cache (when one is given) and to a JSON file in
// the progress directory. Save failures are logged and never thrown.
class CheckpointStore {
public:
    CheckpointStore(const Settings& settings, ICacheBackend* cache);

    ProgressCheckpoint createCheckpoint(const QString& session, int totalArtists,
                                        const QString& signature);

    // Cache first, then the progress file. Becomes the current checkpoint.
    std::optional<ProgressCheckpoint> loadCheckpoint(const QString& session);

    // Creates the checkpoint on first save if none is current for session
    void saveProgress(const QString& session, const QString& artistId, int index,
                      int totalArtists = 0, const QString& signature = QString());

    // Adds to the current checkpoint's counters; persisted by the next save
    void recordTrackOutcome(int downloaded, int failed);

    void markComplete(const QString& session);
    bool resetSession(const QString& session);

    bool isCompatible(const ProgressCheckpoint& checkpoint, const QString& signature) const;

    static QVector<Artist> remaining(const QVector<Artist>& artists,
                                     const ProgressCheckpoint& checkpoint);

    // md5("<sorted ids joined by ','>_<similar>_<depth>_<songs>"), first 12 hex chars
    static QString commandSignature(const QStringList& seedIds, int similarLimit,
                                    int maxDepth, int songsPerArtist);

    std::optional<ProgressCheckpoint> current() const;
    QString summary() const;

    QString progressFilePath(const QString& session) const;
    static QString cacheKey(const QString& session);

    static const int ACTIVE_TTL = 30 * 24 * 3600;
    static const int COMPLETE_TTL = 7 * 24 * 3600;

private:
    void persist(const ProgressCheckpoint& checkpoint);

    QString m_progressDir;
    ICacheBackend* m_cache;
    std::optional<ProgressCheckpoint> m_current;
    mutable QMutex m_mutex;
};
