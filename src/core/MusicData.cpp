#include "MusicData.h"

#include <QDateTime>
#include <QJsonArray>

// ═════════════════════════════════════════════════════════════════════
//  Utility Functions
// ═════════════════════════════════════════════════════════════════════

QString qualityToString(Quality quality)
{
    switch (quality) {
    case Quality::Low:    return QStringLiteral("low");
    case Quality::Medium: return QStringLiteral("medium");
    case Quality::High:   return QStringLiteral("high");
    }
    return QStringLiteral("high");
}

std::optional<Quality> qualityFromString(const QString& str)
{
    const QString s = str.trimmed().toLower();
    if (s == QStringLiteral("low"))    return Quality::Low;
    if (s == QStringLiteral("medium")) return Quality::Medium;
    if (s == QStringLiteral("high"))   return Quality::High;
    return std::nullopt;
}

// ── YearRange ───────────────────────────────────────────────────────
QString YearRange::toString() const
{
    if (from == to)
        return QString::number(from);
    return QStringLiteral("%1-%2").arg(from).arg(to);
}

std::optional<YearRange> YearRange::parse(const QString& text)
{
    const QString t = text.trimmed();
    if (t.isEmpty())
        return std::nullopt;

    const QStringList parts = t.split(QLatin1Char('-'));
    bool ok1 = false, ok2 = false;
    YearRange range;

    if (parts.size() == 1) {
        range.from = parts[0].trimmed().toInt(&ok1);
        range.to = range.from;
        ok2 = ok1;
    } else if (parts.size() == 2) {
        range.from = parts[0].trimmed().toInt(&ok1);
        range.to   = parts[1].trimmed().toInt(&ok2);
    }

    if (!ok1 || !ok2 || range.from <= 0 || range.to < range.from)
        return std::nullopt;
    return range;
}

// ═════════════════════════════════════════════════════════════════════
//  DiscoveryResult
// ═════════════════════════════════════════════════════════════════════

const Artist* DiscoveryResult::artistById(const QString& id) const
{
    for (const Artist& a : artists) {
        if (a.id == id)
            return &a;
    }
    for (const Artist& s : seeds) {
        if (s.id == id)
            return &s;
    }
    return nullptr;
}

QJsonObject artistToJson(const Artist& artist)
{
    QJsonObject obj;
    obj[QStringLiteral("id")]    = artist.id;
    obj[QStringLiteral("name")]  = artist.name;
    obj[QStringLiteral("depth")] = artist.depth;
    obj[QStringLiteral("discovered_from")] = artist.discoveredFrom.isEmpty()
        ? QJsonValue(QJsonValue::Null) : QJsonValue(artist.discoveredFrom);
    obj[QStringLiteral("country")] = artist.country.isEmpty()
        ? QJsonValue(QJsonValue::Null) : QJsonValue(artist.country);
    obj[QStringLiteral("track_count")] = artist.trackCount;
    if (artist.similarityScore)
        obj[QStringLiteral("similarity_score")] = *artist.similarityScore;
    return obj;
}

QJsonObject DiscoveryResult::toJson() const
{
    QJsonArray seedArray;
    for (const Artist& s : seeds) {
        QJsonObject o;
        o[QStringLiteral("id")]   = s.id;
        o[QStringLiteral("name")] = s.name;
        seedArray.append(o);
    }

    QJsonObject filters;
    const QVariant years = parameters.value(QStringLiteral("years"));
    filters[QStringLiteral("years")] = years.isValid()
        ? QJsonValue(years.toString()) : QJsonValue(QJsonValue::Null);
    filters[QStringLiteral("shuffled")] = parameters.value(QStringLiteral("shuffle")).toBool();

    QJsonObject metadata;
    metadata[QStringLiteral("timestamp")] =
        QDateTime::currentDateTime().toString(Qt::ISODate);
    metadata[QStringLiteral("base_artists")] = seedArray;
    metadata[QStringLiteral("filters")] = filters;

    QJsonObject stats;
    stats[QStringLiteral("total_artists_discovered")] = artists.size() + filteredOut.size();
    stats[QStringLiteral("filtered_artists_count")]   = artists.size();
    stats[QStringLiteral("filtered_out_count")]       = filteredOut.size();
    stats[QStringLiteral("base_artist_count")]        = seeds.size();
    stats[QStringLiteral("max_depth_reached")]        = maxDepthReached;
    stats[QStringLiteral("max_depth_requested")]      =
        parameters.value(QStringLiteral("max_depth")).toInt();
    stats[QStringLiteral("similar_limit_per_artist")] =
        parameters.value(QStringLiteral("similar_limit")).toInt();
    stats[QStringLiteral("discovery_time_seconds")]   = elapsedSeconds;
    stats[QStringLiteral("year_filter_applied")]      = years.isValid();

    QJsonArray regionArray;
    QStringList sortedRegions(regions.cbegin(), regions.cend());
    sortedRegions.sort();
    for (const QString& r : sortedRegions)
        regionArray.append(r);
    stats[QStringLiteral("countries_found")] = regionArray;

    QJsonArray unique;
    for (const Artist& a : artists)
        unique.append(artistToJson(a));

    QJsonArray filtered;
    for (const FilteredArtist& f : filteredOut) {
        QJsonObject o = artistToJson(f.artist);
        o[QStringLiteral("reason")] = f.reason;
        filtered.append(o);
    }

    QJsonObject treeObj;
    for (auto it = tree.cbegin(); it != tree.cend(); ++it)
        treeObj[it.key()] = QJsonArray::fromStringList(it.value());

    QJsonObject root;
    root[QStringLiteral("metadata")] = metadata;
    root[QStringLiteral("stats")] = stats;
    root[QStringLiteral("unique_artists")] = unique;
    root[QStringLiteral("filtered_out_artists")] = filtered;
    root[QStringLiteral("discovery_tree")] = treeObj;
    return root;
}
