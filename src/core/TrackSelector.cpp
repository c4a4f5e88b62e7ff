#include "TrackSelector.h"

#include <QDebug>
#include <QtMath>

int SelectionOptions::maxItemsNeeded() const
{
    if (inTopN > 0 && years)
        return inTopN;
    if (inTopPercent > 0 || years || excludeExplicit)
        return -1;
    return songsPerArtist;
}

QVector<Track> TrackSelector::filterByYear(const QVector<Track>& tracks, const YearRange& years)
{
    QVector<Track> out;
    for (const Track& t : tracks) {
        if (t.year && years.contains(*t.year))
            out.append(t);
    }
    return out;
}

QVector<Track> TrackSelector::select(const QVector<Track>& tracks, const SelectionOptions& options)
{
    QVector<Track> pool = tracks;

    if (options.popularityFilterActive()) {
        int topCount = 0;
        if (options.inTopPercent > 0)
            topCount = qCeil(pool.size() * options.inTopPercent / 100.0);
        else
            topCount = qMin(options.inTopN, int(pool.size()));
        pool = pool.mid(0, topCount);

        const int before = pool.size();
        pool = filterByYear(pool, *options.years);
        qDebug() << "[Selector] in-top" << topCount << "of" << tracks.size()
                 << "->" << pool.size() << "/" << before << "in" << options.years->toString();
    } else if (options.years) {
        pool = filterByYear(pool, *options.years);
    }

    if (options.excludeExplicit) {
        QVector<Track> clean;
        for (const Track& t : pool) {
            if (!t.explicitContent)
                clean.append(t);
        }
        pool = clean;
    }

    if (options.songsPerArtist >= 0 && pool.size() > options.songsPerArtist)
        pool.resize(options.songsPerArtist);
    return pool;
}
