#pragma once

#include "../core/MusicData.h"

#include <QUrl>
#include <QVector>
#include <optional>

// Remote music catalog. Calls block and may be made from worker threads
// concurrently. Transport problems throw NetworkFailure, persistent
// upstream errors throw ServiceFailure.
class ICatalogService {
public:
    virtual ~ICatalogService() = default;

    virtual std::optional<Artist> resolveEntity(const QString& artistId) = 0;

    // Upstream ranking order, similarityScore filled relative to the list
    virtual QVector<Artist> listSimilar(const QString& artistId, int limit) = 0;

    // Popularity order; maxItems >= 0 stops paginating once reached
    virtual QVector<Track> listMediaItems(const QString& artistId, int maxItems = -1) = 0;

    virtual bool probeHasContentInRange(const QString& artistId, const YearRange& years) = 0;

    virtual std::optional<QUrl> resolveMediaUrl(const Track& track) = 0;
};
