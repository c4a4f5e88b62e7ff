#pragma once

#include "MusicData.h"

#include <QVector>
#include <optional>

struct SelectionOptions {
    int                      songsPerArtist = 10;
    std::optional<YearRange> years;
    int                      inTopN = 0;          // 0 = off
    int                      inTopPercent = 0;    // 0 = off, 1..100
    bool                     excludeExplicit = false;

    bool popularityFilterActive() const
    {
        return years.has_value() && (inTopN > 0 || inTopPercent > 0);
    }

    // How many catalog items need listing before selection can run;
    // -1 when the whole catalog is required
    int maxItemsNeeded() const;
};

class TrackSelector {
public:
    // Tracks must arrive in popularity order
    static QVector<Track> select(const QVector<Track>& tracks, const SelectionOptions& options);

    static QVector<Track> filterByYear(const QVector<Track>& tracks, const YearRange& years);
};
