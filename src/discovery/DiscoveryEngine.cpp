#include "DiscoveryEngine.h"
#include "../catalog/ICatalogService.h"
#include "../core/CancelToken.h"
#include "../core/Errors.h"
#include "../core/Settings.h"

#include <QDebug>
#include <QElapsedTimer>
#include <QFuture>
#include <QRandomGenerator>
#include <QThread>
#include <QtConcurrent>

#include <exception>
#include <algorithm>

struct DiscoveryEngine::TraversalState {
    DiscoveryResult result;
    QSet<QString>   visited;
    QSet<QString>   filteredIds;
};

DiscoveryEngine::DiscoveryEngine(ICatalogService& catalog, const Settings& settings,
                                 QObject* parent)
    : QObject(parent)
    , m_catalog(catalog)
    , m_batchSize(settings.discovery.batchSize)
    , m_batchPauseMs(settings.discovery.batchPauseMs)
    , m_candidateFetchLimit(settings.discovery.candidateFetchLimit)
    , m_probeRetries(settings.discovery.probeRetries)
    , m_probeBackoffMs(settings.discovery.probeBackoffMs)
{
    m_pool.setMaxThreadCount(settings.discovery.similarConcurrency);
}

// ── Year probe ──────────────────────────────────────────────────────
bool DiscoveryEngine::probeWithRetry(const QString& artistId, const YearRange& years)
{
    int backoffMs = m_probeBackoffMs;
    for (int attempt = 1; attempt <= m_probeRetries; ++attempt) {
        try {
            return m_catalog.probeHasContentInRange(artistId, years);
        } catch (const NetworkFailure& e) {
            if (attempt < m_probeRetries) {
                qDebug() << "[Discovery] Probe for" << artistId << "failed, retry in"
                         << backoffMs << "ms:" << e.message();
                QThread::msleep(static_cast<unsigned long>(backoffMs));
                backoffMs *= 2;
                continue;
            }
            qWarning() << "[Discovery] Probe for" << artistId
                       << "gave up after" << attempt << "attempts, including:" << e.message();
        } catch (const EchotrailError& e) {
            qWarning() << "[Discovery] Probe for" << artistId << "failed, including:" << e.message();
            return true;
        } catch (const std::exception& e) {
            qWarning() << "[Discovery] Probe for" << artistId << "failed unexpectedly:" << e.what();
            return true;
        }
    }
    return true;
}

// ── Seeds ───────────────────────────────────────────────────────────
QVector<Artist> DiscoveryEngine::resolveSeeds(const QStringList& seedIds)
{
    QVector<Artist> seeds;
    QSet<QString> seen;
    for (const QString& id : seedIds) {
        if (id.isEmpty() || seen.contains(id))
            continue;
        seen.insert(id);

        std::optional<Artist> artist;
        try {
            artist = m_catalog.resolveEntity(id);
        } catch (const NetworkFailure& e) {
            throw ServiceFailure(QStringLiteral("cannot resolve seed %1: %2").arg(id, e.message()));
        }
        if (!artist)
            throw NotFoundError(QStringLiteral("artist %1 not found").arg(id));

        artist->depth = 0;
        artist->discoveredFrom.clear();
        seeds.append(*artist);
    }
    if (seeds.isEmpty())
        throw NotFoundError(QStringLiteral("no seed artists given"));
    return seeds;
}

// ── Candidate ranking ───────────────────────────────────────────────
QVector<Artist> DiscoveryEngine::rankCandidates(const QVector<Artist>& similar,
                                                const QSet<QString>& visited,
                                                const DiscoveryOptions& options,
                                                const QSet<QString>& allowedRegions) const
{
    QVector<Artist> candidates;
    for (const Artist& a : similar) {
        if (visited.contains(a.id) || options.excludeArtists.contains(a.id))
            continue;
        if (a.trackCount < options.minTracksPerArtist)
            continue;
        if (!allowedRegions.isEmpty() && !allowedRegions.contains(a.country))
            continue;
        candidates.append(a);
    }

    std::stable_sort(candidates.begin(), candidates.end(), [](const Artist& a, const Artist& b) {
        const double sa = a.similarityScore.value_or(0.0);
        const double sb = b.similarityScore.value_or(0.0);
        if (sa != sb)
            return sa > sb;
        return a.trackCount > b.trackCount;
    });

    if (!options.priorityRegions.isEmpty()) {
        QSet<QString> priority;
        for (const QString& r : options.priorityRegions)
            priority.insert(r.trimmed().toUpper());
        std::stable_partition(candidates.begin(), candidates.end(), [&](const Artist& a) {
            return priority.contains(a.country);
        });
    }
    return candidates;
}

// ── Phase 1: per-parent scan (runs on the pool) ─────────────────────
DiscoveryEngine::ParentScan DiscoveryEngine::scanParent(const QString& parentId,
                                                        const QSet<QString>& visitedSnapshot,
                                                        const DiscoveryOptions& options,
                                                        const QSet<QString>& allowedRegions)
{
    ParentScan scan;
    scan.parentId = parentId;

    try {
        const QVector<Artist> similar = m_catalog.listSimilar(parentId, m_candidateFetchLimit);
        scan.ranked = rankCandidates(similar, visitedSnapshot, options, allowedRegions);

        // Probe ahead as far as the commit walk would go if nothing else claims
        // these candidates; the commit phase probes any shortfall itself
        if (options.yearFilteringActive()) {
            int admitted = 0;
            int checked = 0;
            for (const Artist& candidate : scan.ranked) {
                if (admitted >= options.similarLimit || checked >= options.maxSimilarArtistAttempts)
                    break;
                ++checked;
                const bool has = probeWithRetry(candidate.id, *options.years);
                scan.probes.insert(candidate.id, has);
                if (has)
                    ++admitted;
            }
        }
    } catch (const EchotrailError& e) {
        qWarning() << "[Discovery] Scan of" << parentId << "failed:" << e.message();
        scan.failed = true;
        scan.ranked.clear();
        scan.probes.clear();
    } catch (const std::exception& e) {
        qWarning() << "[Discovery] Scan of" << parentId << "failed:" << e.what();
        scan.failed = true;
        scan.ranked.clear();
        scan.probes.clear();
    }
    return scan;
}

// ── Phase 2: ordered admission ──────────────────────────────────────
void DiscoveryEngine::commitScan(const ParentScan& scan, int depth, const DiscoveryOptions& options,
                                 TraversalState& state, QStringList& nextLevel)
{
    if (scan.failed)
        return;

    QStringList children;
    int checked = 0;
    int skipped = 0;
    const bool yearFilter = options.yearFilteringActive();

    for (const Artist& candidate : scan.ranked) {
        if (state.result.artists.size() >= options.maxTotalArtists)
            break;
        if (children.size() >= options.similarLimit)
            break;
        if (state.visited.contains(candidate.id))
            continue;

        if (yearFilter) {
            ++checked;
            if (checked > options.maxSimilarArtistAttempts) {
                qDebug() << "[Discovery] Probe cap" << options.maxSimilarArtistAttempts
                         << "reached for" << scan.parentId;
                break;
            }
            const auto cached = scan.probes.constFind(candidate.id);
            const bool has = cached != scan.probes.constEnd()
                ? cached.value()
                : probeWithRetry(candidate.id, *options.years);
            if (!has) {
                ++skipped;
                if (!state.filteredIds.contains(candidate.id)) {
                    state.filteredIds.insert(candidate.id);
                    FilteredArtist rejected;
                    rejected.artist = candidate;
                    rejected.artist.depth = depth;
                    rejected.artist.discoveredFrom = scan.parentId;
                    rejected.reason = QStringLiteral("no_content_in_years_%1-%2")
                                          .arg(options.years->from).arg(options.years->to);
                    state.result.filteredOut.append(rejected);
                }
                continue;
            }
        }

        Artist admitted = candidate;
        admitted.depth = depth;
        admitted.discoveredFrom = scan.parentId;
        state.visited.insert(admitted.id);
        state.result.artists.append(admitted);
        if (!admitted.country.isEmpty())
            state.result.regions.insert(admitted.country);
        children.append(admitted.id);
        nextLevel.append(admitted.id);
    }

    state.result.tree.insert(scan.parentId, children);
    if (yearFilter) {
        qDebug() << "[Discovery]" << scan.parentId << "-> added" << children.size()
                 << "skipped" << skipped << "checked" << checked;
    } else {
        qDebug() << "[Discovery]" << scan.parentId << "-> added" << children.size();
    }
}

// ── discover ────────────────────────────────────────────────────────
DiscoveryResult DiscoveryEngine::discover(const QString& seedId, const DiscoveryOptions& options,
                                          const CancelToken* cancel)
{
    return discover(QStringList{ seedId }, options, cancel);
}

DiscoveryResult DiscoveryEngine::discover(const QStringList& seedIds, const DiscoveryOptions& options,
                                          const CancelToken* cancel)
{
    QElapsedTimer timer;
    timer.start();

    TraversalState state;
    state.result.seeds = resolveSeeds(seedIds);

    QStringList seedOrder;
    for (const Artist& seed : state.result.seeds)
        seedOrder.append(seed.id);

    qInfo() << "[Discovery] Starting from" << seedOrder.join(QStringLiteral(", "))
            << "depth:" << options.maxDepth << "similar:" << options.similarLimit
            << "max artists:" << options.maxTotalArtists;

    // Region allow-list, "SAME" expands to the seeds' regions
    QSet<QString> allowedRegions;
    for (const QString& token : options.regionAllowList) {
        const QString code = token.trimmed().toUpper();
        if (code == QStringLiteral("SAME")) {
            bool any = false;
            for (const Artist& seed : state.result.seeds) {
                if (!seed.country.isEmpty()) {
                    allowedRegions.insert(seed.country.toUpper());
                    any = true;
                }
            }
            if (!any)
                qWarning() << "[Discovery] Seed has no region, SAME filter ignored";
        } else if (!code.isEmpty()) {
            allowedRegions.insert(code);
        }
    }

    // Seeds: visited and expanded, listed only when they pass the year filter
    for (const Artist& seed : state.result.seeds) {
        state.visited.insert(seed.id);
        state.result.tree.insert(seed.id, QStringList());

        if (options.yearFilteringActive() && !probeWithRetry(seed.id, *options.years)) {
            qInfo() << "[Discovery] Seed" << seed.name << "has no content in"
                    << options.years->toString() << "- traversing without listing it";
            continue;
        }
        state.result.artists.append(seed);
        if (!seed.country.isEmpty())
            state.result.regions.insert(seed.country);
    }

    QStringList currentLevel = seedOrder;
    for (int depth = 1; depth <= options.maxDepth; ++depth) {
        if (isCancelled(cancel)) {
            state.result.interrupted = true;
            break;
        }
        if (state.result.artists.size() >= options.maxTotalArtists) {
            qInfo() << "[Discovery] Reached artist limit" << options.maxTotalArtists;
            break;
        }
        if (currentLevel.isEmpty()) {
            qInfo() << "[Discovery] Frontier empty at depth" << depth;
            break;
        }

        qInfo() << "[Discovery] Level" << depth << "/" << options.maxDepth
                << ":" << currentLevel.size() << "artists";
        emit levelStarted(depth, currentLevel.size());

        const int before = state.result.artists.size();
        QStringList nextLevel;

        for (int start = 0; start < currentLevel.size(); start += m_batchSize) {
            if (isCancelled(cancel)) {
                state.result.interrupted = true;
                break;
            }
            if (state.result.artists.size() >= options.maxTotalArtists)
                break;

            const QStringList batch = currentLevel.mid(start, m_batchSize);
            const QSet<QString> snapshot = state.visited;

            QVector<QFuture<ParentScan>> futures;
            futures.reserve(batch.size());
            for (const QString& parentId : batch) {
                futures.append(QtConcurrent::run(&m_pool, [=, this]() {
                    return scanParent(parentId, snapshot, options, allowedRegions);
                }));
            }

            for (auto& future : futures)
                commitScan(future.result(), depth, options, state, nextLevel);

            if (start + m_batchSize < currentLevel.size() && m_batchPauseMs > 0)
                QThread::msleep(static_cast<unsigned long>(m_batchPauseMs));
        }

        const int added = state.result.artists.size() - before;
        if (added > 0)
            state.result.maxDepthReached = depth;
        qInfo() << "[Discovery] Level" << depth << "complete: added" << added
                << "total" << state.result.artists.size()
                << "next frontier" << nextLevel.size();
        emit levelFinished(depth, added, state.result.artists.size());

        if (state.result.interrupted)
            break;
        currentLevel = nextLevel;
    }

    if (state.result.interrupted)
        qWarning() << "[Discovery] Interrupted, returning partial result";

    if (options.shuffle) {
        // Seeds stay in front, discovered artists are shuffled behind them
        auto firstDiscovered = std::stable_partition(
            state.result.artists.begin(), state.result.artists.end(),
            [](const Artist& a) { return a.depth == 0; });
        std::shuffle(firstDiscovered, state.result.artists.end(), *QRandomGenerator::global());
    }

    state.result.elapsedSeconds = timer.elapsed() / 1000.0;

    QVariantMap params;
    params[QStringLiteral("max_depth")] = options.maxDepth;
    params[QStringLiteral("max_total_artists")] = options.maxTotalArtists;
    params[QStringLiteral("similar_limit")] = options.similarLimit;
    params[QStringLiteral("priority_countries")] = options.priorityRegions;
    params[QStringLiteral("countries")] = options.regionAllowList;
    QStringList excluded(options.excludeArtists.cbegin(), options.excludeArtists.cend());
    excluded.sort();
    params[QStringLiteral("exclude_artists")] = excluded;
    params[QStringLiteral("min_tracks")] = options.minTracksPerArtist;
    params[QStringLiteral("shuffle")] = options.shuffle;
    if (options.years)
        params[QStringLiteral("years")] = options.years->toString();
    state.result.parameters = params;

    qInfo() << "[Discovery] Complete:" << state.result.artists.size() << "artists, max depth"
            << state.result.maxDepthReached << "in" << state.result.elapsedSeconds << "s";
    return state.result;
}
