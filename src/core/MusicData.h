#ifndef MUSICDATA_H
#define MUSICDATA_H

#include <QString>
#include <QStringList>
#include <QVector>
#include <QMap>
#include <QSet>
#include <QVariantMap>
#include <QJsonObject>
#include <QMetaType>
#include <optional>

// ── Quality tier ────────────────────────────────────────────────────
enum class Quality {
    Low,
    Medium,
    High
};

QString               qualityToString(Quality quality);
std::optional<Quality> qualityFromString(const QString& str);

// ── Year range (inclusive) ──────────────────────────────────────────
struct YearRange {
    int from = 0;
    int to   = 0;

    bool contains(int year) const { return year >= from && year <= to; }
    QString toString() const;

    // "2020" or "2018-2022"; empty optional on malformed input
    static std::optional<YearRange> parse(const QString& text);
};

// ── Data Structs ────────────────────────────────────────────────────
struct Artist {
    QString                 id;
    QString                 name;
    QString                 country;        // region code, empty if unknown
    QStringList             genres;
    int                     trackCount = 0;
    std::optional<double>   similarityScore; // rank-derived, relative to siblings
    QString                 discoveredFrom;  // empty for seeds
    int                     depth = 0;
};

struct Track {
    QString     id;
    QString     title;
    QStringList artistIds;
    QStringList artistNames;
    QString     albumId;
    QString     albumTitle;
    std::optional<int> year;
    qint64      durationMs = 0;
    bool        explicitContent = false;
    Quality     quality = Quality::High;

    // Filled in once the track has been materialised on disk
    QString     filePath;
    qint64      fileSize = 0;
};

// ── Discovery ───────────────────────────────────────────────────────
struct DiscoveryOptions {
    int         songsPerArtist = 10;
    int         similarLimit = 5;
    int         maxDepth = 2;
    int         maxTotalArtists = 50;

    QStringList regionAllowList;    // "SAME" resolves to the seed's region
    QStringList priorityRegions;
    int         minTracksPerArtist = 3;
    QSet<QString> excludeArtists;

    std::optional<YearRange> years;
    bool        yearFilterForDiscovery = false;
    bool        skipArtistsWithoutYearContent = true;
    int         maxSimilarArtistAttempts = 20;

    bool        shuffle = false;

    bool yearFilteringActive() const
    {
        return years.has_value() && yearFilterForDiscovery;
    }
};

struct FilteredArtist {
    Artist  artist;
    QString reason;
};

struct DiscoveryResult {
    QVector<Artist>             seeds;
    QVector<Artist>             artists;     // discovery order, de-duplicated
    QMap<QString, QStringList>  tree;        // parent id -> admitted child ids
    QSet<QString>               regions;
    QVector<FilteredArtist>     filteredOut;
    int                         maxDepthReached = 0;
    double                      elapsedSeconds = 0.0;
    bool                        interrupted = false;
    QVariantMap                 parameters;

    const Artist* artistById(const QString& id) const;

    // Tree export document (metadata / stats / unique_artists / filtered_out_artists)
    QJsonObject toJson() const;
};

QJsonObject artistToJson(const Artist& artist);

Q_DECLARE_METATYPE(Artist)
Q_DECLARE_METATYPE(Track)

#endif // MUSICDATA_H
