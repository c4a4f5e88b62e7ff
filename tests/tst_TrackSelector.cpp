#include <QtTest/QtTest>
#include "core/TrackSelector.h"

// Popularity-ordered catalog; years given per position, 0 = unknown
static QVector<Track> catalog(const QVector<int>& years)
{
    QVector<Track> out;
    for (int i = 0; i < years.size(); ++i) {
        Track t;
        t.id = QString::number(i + 1);
        t.title = QStringLiteral("Track %1").arg(i + 1);
        if (years[i] > 0)
            t.year = years[i];
        out.append(t);
    }
    return out;
}

static QStringList ids(const QVector<Track>& tracks)
{
    QStringList out;
    for (const Track& t : tracks)
        out.append(t.id);
    return out;
}

class tst_TrackSelector : public QObject {
    Q_OBJECT

private slots:
    // ── Plain selection ─────────────────────────────────────────
    void noFilter_takesMostPopular()
    {
        SelectionOptions o;
        o.songsPerArtist = 3;
        QCOMPARE(ids(TrackSelector::select(catalog({1, 1, 1, 1, 1}), o)),
                 (QStringList{"1", "2", "3"}));
        QCOMPARE(o.maxItemsNeeded(), 3);
    }

    void shortCatalog_returnsEverything()
    {
        SelectionOptions o;
        o.songsPerArtist = 10;
        QCOMPARE(TrackSelector::select(catalog({2000, 2001}), o).size(), 2);
    }

    // ── Year filter ─────────────────────────────────────────────
    void years_keepOrderAndDropUnknown()
    {
        SelectionOptions o;
        o.songsPerArtist = 10;
        o.years = YearRange{2019, 2020};
        const QVector<Track> picked =
            TrackSelector::select(catalog({2018, 2020, 0, 2019, 2021, 2020}), o);
        QCOMPARE(ids(picked), (QStringList{"2", "4", "6"}));
        QCOMPARE(o.maxItemsNeeded(), -1);
    }

    // ── Popularity window ───────────────────────────────────────
    void inTopN_filtersWithinWindow()
    {
        SelectionOptions o;
        o.songsPerArtist = 10;
        o.years = YearRange{2020, 2020};
        o.inTopN = 3;
        // Track 5 matches the year but sits outside the top 3
        const QVector<Track> picked =
            TrackSelector::select(catalog({2020, 2019, 2020, 2018, 2020}), o);
        QCOMPARE(ids(picked), (QStringList{"1", "3"}));
        QCOMPARE(o.maxItemsNeeded(), 3);
    }

    void inTopPercent_roundsUp()
    {
        SelectionOptions o;
        o.songsPerArtist = 10;
        o.years = YearRange{2020, 2020};
        o.inTopPercent = 30;
        // ceil(5 * 0.3) = 2
        const QVector<Track> picked =
            TrackSelector::select(catalog({2019, 2020, 2020, 2020, 2020}), o);
        QCOMPARE(ids(picked), QStringList{"2"});
        QCOMPARE(o.maxItemsNeeded(), -1);
    }

    void inTopWithoutYears_isInactive()
    {
        SelectionOptions o;
        o.songsPerArtist = 2;
        o.inTopN = 1;
        QVERIFY(!o.popularityFilterActive());
        QCOMPARE(TrackSelector::select(catalog({1, 1, 1}), o).size(), 2);
    }

    void selectionIsCappedAfterFiltering()
    {
        SelectionOptions o;
        o.songsPerArtist = 2;
        o.years = YearRange{2020, 2020};
        QCOMPARE(ids(TrackSelector::select(catalog({2019, 2020, 2020, 2020}), o)),
                 (QStringList{"2", "3"}));
    }

    void excludeExplicit_dropsFlaggedTracks()
    {
        SelectionOptions o;
        o.songsPerArtist = 10;
        o.excludeExplicit = true;
        QVector<Track> tracks = catalog({1, 1, 1});
        tracks[1].explicitContent = true;
        QCOMPARE(ids(TrackSelector::select(tracks, o)), (QStringList{"1", "3"}));
    }

    // ── YearRange ───────────────────────────────────────────────
    void yearRange_parse()
    {
        QCOMPARE(YearRange::parse("2020")->from, 2020);
        QCOMPARE(YearRange::parse("2020")->to, 2020);
        QCOMPARE(YearRange::parse(" 2018 - 2022 ")->to, 2022);
        QVERIFY(!YearRange::parse("").has_value());
        QVERIFY(!YearRange::parse("20x0").has_value());
        QVERIFY(!YearRange::parse("2022-2018").has_value());
        QVERIFY(!YearRange::parse("2018-2020-2022").has_value());
    }
};

QTEST_MAIN(tst_TrackSelector)
#include "tst_TrackSelector.moc"
