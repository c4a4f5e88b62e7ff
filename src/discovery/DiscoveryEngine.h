#pragma once

#include "../core/MusicData.h"

#include <QHash>
#include <QObject>
#include <QSet>
#include <QThreadPool>

class CancelToken;
class ICatalogService;
class Settings;

// Level-synchronous breadth-first walk over the catalog's similar-artist
// relation. Parents in a batch are scanned concurrently; admission is
// committed per batch in frontier order, so an artist reachable from two
// parents always belongs to the first one in traversal order.
class DiscoveryEngine : public QObject {
    Q_OBJECT
public:
    DiscoveryEngine(ICatalogService& catalog, const Settings& settings,
                    QObject* parent = nullptr);

    // Throws NotFoundError when a seed does not resolve, ServiceFailure when
    // seed resolution keeps failing upstream
    DiscoveryResult discover(const QStringList& seedIds, const DiscoveryOptions& options,
                             const CancelToken* cancel = nullptr);
    DiscoveryResult discover(const QString& seedId, const DiscoveryOptions& options,
                             const CancelToken* cancel = nullptr);

    // Probe with bounded retry; failures count as "has content"
    bool probeWithRetry(const QString& artistId, const YearRange& years);

signals:
    void levelStarted(int depth, int frontierSize);
    void levelFinished(int depth, int admitted, int totalDiscovered);

private:
    struct ParentScan {
        QString              parentId;
        QVector<Artist>      ranked;
        QHash<QString, bool> probes;   // speculative probe results by candidate id
        bool                 failed = false;
    };

    struct TraversalState;

    QVector<Artist> resolveSeeds(const QStringList& seedIds);
    ParentScan scanParent(const QString& parentId, const QSet<QString>& visitedSnapshot,
                          const DiscoveryOptions& options, const QSet<QString>& allowedRegions);
    QVector<Artist> rankCandidates(const QVector<Artist>& similar,
                                   const QSet<QString>& visited,
                                   const DiscoveryOptions& options,
                                   const QSet<QString>& allowedRegions) const;
    void commitScan(const ParentScan& scan, int depth, const DiscoveryOptions& options,
                    TraversalState& state, QStringList& nextLevel);

    ICatalogService& m_catalog;
    int m_batchSize;
    int m_batchPauseMs;
    int m_candidateFetchLimit;
    int m_probeRetries;
    int m_probeBackoffMs;
    QThreadPool m_pool;
};
