#include <QtTest/QtTest>
#include <QSignalSpy>
#include "FakeCatalogService.h"
#include "core/CancelToken.h"
#include "core/Settings.h"
#include "discovery/DiscoveryEngine.h"

static Settings testSettings()
{
    Settings s = Settings::defaults(QDir::tempPath() + QStringLiteral("/echotrail-discovery-test"));
    s.discovery.batchPauseMs = 0;
    s.discovery.probeBackoffMs = 1;
    return s;
}

static DiscoveryOptions makeOptions(int similar, int depth, int maxTotal = 50)
{
    DiscoveryOptions o;
    o.similarLimit = similar;
    o.maxDepth = depth;
    o.maxTotalArtists = maxTotal;
    return o;
}

static QStringList ids(const QVector<Artist>& artists)
{
    QStringList out;
    for (const Artist& a : artists)
        out.append(a.id);
    return out;
}

static YearRange years2020to2022()
{
    YearRange r;
    r.from = 2020;
    r.to = 2022;
    return r;
}

// 30 artists, each similar to the next six (wrapping)
static void buildRing(FakeCatalogService& catalog, int count = 30)
{
    for (int i = 0; i < count; ++i)
        catalog.addArtist(QStringLiteral("R%1").arg(i));
    for (int i = 0; i < count; ++i) {
        QStringList similar;
        for (int k = 1; k <= 6; ++k)
            similar.append(QStringLiteral("R%1").arg((i + k) % count));
        catalog.setSimilar(QStringLiteral("R%1").arg(i), similar);
    }
}

class tst_DiscoveryEngine : public QObject {
    Q_OBJECT

private slots:
    // ── Scenarios ───────────────────────────────────────────────
    void fiveRankedCandidates_admitsTopTwo()
    {
        FakeCatalogService catalog;
        catalog.addArtist("S");
        for (int i = 1; i <= 5; ++i)
            catalog.addArtist(QStringLiteral("C%1").arg(i));
        catalog.setSimilar("S", {"C1", "C2", "C3", "C4", "C5"});

        const Settings settings = testSettings();
        DiscoveryEngine engine(catalog, settings);
        const DiscoveryResult result = engine.discover(QStringLiteral("S"), makeOptions(2, 1));

        QCOMPARE(ids(result.artists), QStringList({"S", "C1", "C2"}));
        QCOMPARE(result.tree.size(), 1);
        QCOMPARE(result.tree.value("S"), QStringList({"C1", "C2"}));
        QCOMPARE(result.maxDepthReached, 1);
        QVERIFY(!result.interrupted);
    }

    void childrenCarryDepthAndParent()
    {
        FakeCatalogService catalog;
        catalog.addArtist("S");
        catalog.addArtist("A");
        catalog.setSimilar("S", {"A"});

        const Settings settings = testSettings();
        DiscoveryEngine engine(catalog, settings);
        const DiscoveryResult result = engine.discover(QStringLiteral("S"), makeOptions(3, 1));

        const Artist* a = result.artistById("A");
        QVERIFY(a);
        QCOMPARE(a->depth, 1);
        QCOMPARE(a->discoveredFrom, QStringLiteral("S"));
        QCOMPARE(result.artistById("S")->depth, 0);
        QVERIFY(result.artistById("S")->discoveredFrom.isEmpty());
    }

    // ── Admission order ─────────────────────────────────────────
    void firstDiscovererWins_noReparenting()
    {
        FakeCatalogService catalog;
        for (const char* id : {"S", "A", "B", "C", "D"})
            catalog.addArtist(id);
        catalog.setSimilar("S", {"A", "B"});
        catalog.setSimilar("A", {"B", "C", "S"});
        catalog.setSimilar("B", {"C", "D"});
        catalog.setSimilar("C", {"A"});

        const Settings settings = testSettings();
        DiscoveryEngine engine(catalog, settings);
        const DiscoveryResult result = engine.discover(QStringLiteral("S"), makeOptions(2, 3));

        QCOMPARE(ids(result.artists), QStringList({"S", "A", "B", "C", "D"}));
        QCOMPARE(result.artistById("C")->discoveredFrom, QStringLiteral("A"));
        QCOMPARE(result.artistById("D")->discoveredFrom, QStringLiteral("B"));
        QCOMPARE(result.tree.value("A"), QStringList({"C"}));
        QCOMPARE(result.tree.value("B"), QStringList({"D"}));

        for (const Artist& artist : result.artists) {
            if (artist.depth == 0)
                continue;
            const Artist* parent = result.artistById(artist.discoveredFrom);
            QVERIFY(parent);
            QCOMPARE(artist.depth, parent->depth + 1);
        }
    }

    void boundsRespected()
    {
        FakeCatalogService catalog;
        buildRing(catalog);

        Settings settings = testSettings();
        settings.discovery.batchSize = 2;
        DiscoveryEngine engine(catalog, settings);
        const DiscoveryResult result = engine.discover(QStringLiteral("R0"), makeOptions(3, 3, 12));

        QVERIFY(result.artists.size() <= 12);
        for (auto it = result.tree.cbegin(); it != result.tree.cend(); ++it)
            QVERIFY(it.value().size() <= 3);
        for (const Artist& a : result.artists)
            QVERIFY(a.depth <= 3);
        const QStringList listed = ids(result.artists);
        QCOMPARE(QSet<QString>(listed.cbegin(), listed.cend()).size(), listed.size());
    }

    void repeatedDiscoveryIsIdentical()
    {
        FakeCatalogService catalog;
        buildRing(catalog);

        Settings settings = testSettings();
        settings.discovery.batchSize = 3;
        DiscoveryEngine engine(catalog, settings);
        const DiscoveryOptions options = makeOptions(3, 3, 25);

        const DiscoveryResult first = engine.discover(QStringLiteral("R0"), options);
        const DiscoveryResult second = engine.discover(QStringLiteral("R0"), options);

        QCOMPARE(first.tree, second.tree);
        QCOMPARE(ids(first.artists), ids(second.artists));
        for (const Artist& a : first.artists) {
            const Artist* b = second.artistById(a.id);
            QVERIFY(b);
            QCOMPARE(b->depth, a.depth);
            QCOMPARE(b->discoveredFrom, a.discoveredFrom);
        }
    }

    void maxTotalStopsTraversal()
    {
        FakeCatalogService catalog;
        buildRing(catalog);

        const Settings settings = testSettings();
        DiscoveryEngine engine(catalog, settings);
        const DiscoveryResult result = engine.discover(QStringLiteral("R0"), makeOptions(6, 5, 4));

        QCOMPARE(result.artists.size(), 4);
        QCOMPARE(ids(result.artists), QStringList({"R0", "R1", "R2", "R3"}));
    }

    // ── Candidate filters ───────────────────────────────────────
    void excludedAndSmallCatalogsSkipped()
    {
        FakeCatalogService catalog;
        catalog.addArtist("S");
        catalog.addArtist("A");
        catalog.addArtist("Tiny", QString(), 1);
        catalog.addArtist("B");
        catalog.addArtist("C");
        catalog.setSimilar("S", {"A", "Tiny", "B", "C"});

        DiscoveryOptions options = makeOptions(2, 1);
        options.excludeArtists.insert("A");

        const Settings settings = testSettings();
        DiscoveryEngine engine(catalog, settings);
        const DiscoveryResult result = engine.discover(QStringLiteral("S"), options);

        QCOMPARE(result.tree.value("S"), QStringList({"B", "C"}));
    }

    void priorityRegionsRankFirst()
    {
        FakeCatalogService catalog;
        catalog.addArtist("S", "US");
        catalog.addArtist("A", "US");
        catalog.addArtist("B", "KZ");
        catalog.addArtist("C", "US");
        catalog.addArtist("D", "KZ");
        catalog.setSimilar("S", {"A", "B", "C", "D"});

        DiscoveryOptions options = makeOptions(3, 1);
        options.priorityRegions = {"KZ"};

        const Settings settings = testSettings();
        DiscoveryEngine engine(catalog, settings);
        const DiscoveryResult result = engine.discover(QStringLiteral("S"), options);

        QCOMPARE(result.tree.value("S"), QStringList({"B", "D", "A"}));
        QCOMPARE(result.regions, QSet<QString>({"US", "KZ"}));
    }

    void sameRegionUsesSeedRegion()
    {
        FakeCatalogService catalog;
        catalog.addArtist("S", "KZ");
        catalog.addArtist("A", "US");
        catalog.addArtist("B", "KZ");
        catalog.addArtist("NoRegion");
        catalog.addArtist("C", "KZ");
        catalog.setSimilar("S", {"A", "B", "NoRegion", "C"});

        DiscoveryOptions options = makeOptions(5, 1);
        options.regionAllowList = {"SAME"};

        const Settings settings = testSettings();
        DiscoveryEngine engine(catalog, settings);
        const DiscoveryResult result = engine.discover(QStringLiteral("S"), options);

        QCOMPARE(result.tree.value("S"), QStringList({"B", "C"}));
    }

    // ── Year filter ─────────────────────────────────────────────
    void seedWithoutContentIsTransparent()
    {
        FakeCatalogService catalog;
        catalog.addArtist("S");
        catalog.addArtist("A");
        catalog.addArtist("B");
        catalog.setSimilar("S", {"A", "B"});
        catalog.setHasContent("S", false);

        DiscoveryOptions options = makeOptions(2, 1);
        options.years = years2020to2022();
        options.yearFilterForDiscovery = true;

        const Settings settings = testSettings();
        DiscoveryEngine engine(catalog, settings);
        const DiscoveryResult result = engine.discover(QStringLiteral("S"), options);

        QCOMPARE(ids(result.artists), QStringList({"A", "B"}));
        QCOMPARE(result.tree.value("S"), QStringList({"A", "B"}));
        QCOMPARE(result.artistById("A")->discoveredFrom, QStringLiteral("S"));
        QCOMPARE(result.seeds.size(), 1);
    }

    void candidatesWithoutContentSkipped()
    {
        FakeCatalogService catalog;
        for (const char* id : {"S", "A", "B", "C", "D"})
            catalog.addArtist(id);
        catalog.setSimilar("S", {"A", "B", "C", "D"});
        catalog.setHasContent("B", false);

        DiscoveryOptions options = makeOptions(2, 1);
        options.years = years2020to2022();
        options.yearFilterForDiscovery = true;

        const Settings settings = testSettings();
        DiscoveryEngine engine(catalog, settings);
        const DiscoveryResult result = engine.discover(QStringLiteral("S"), options);

        QCOMPARE(result.tree.value("S"), QStringList({"A", "C"}));
        QCOMPARE(result.filteredOut.size(), 1);
        QCOMPARE(result.filteredOut.first().artist.id, QStringLiteral("B"));
        QCOMPARE(result.filteredOut.first().reason, QStringLiteral("no_content_in_years_2020-2022"));
        QCOMPARE(catalog.probeCalls("D"), 0);
    }

    void probeCapLeavesQuotaUnfilled()
    {
        FakeCatalogService catalog;
        for (const char* id : {"S", "A", "B", "C", "D", "E", "F"})
            catalog.addArtist(id);
        catalog.setSimilar("S", {"A", "B", "C", "D", "E", "F"});
        for (const char* id : {"A", "B", "C", "D"})
            catalog.setHasContent(id, false);

        DiscoveryOptions options = makeOptions(2, 1);
        options.years = years2020to2022();
        options.yearFilterForDiscovery = true;
        options.maxSimilarArtistAttempts = 3;

        const Settings settings = testSettings();
        DiscoveryEngine engine(catalog, settings);
        const DiscoveryResult result = engine.discover(QStringLiteral("S"), options);

        QCOMPARE(ids(result.artists), QStringList({"S"}));
        QVERIFY(result.tree.value("S").isEmpty());
        QCOMPARE(catalog.probeCalls("D"), 0);
        QCOMPARE(catalog.probeCalls("E"), 0);
        QCOMPARE(result.filteredOut.size(), 3);
    }

    void probeErrorsCountAsContent()
    {
        FakeCatalogService catalog;
        for (const char* id : {"S", "A", "B"})
            catalog.addArtist(id);
        catalog.setSimilar("S", {"A", "B"});
        catalog.failProbeTimes("A", 10);
        catalog.failProbeTimes("B", 1);
        catalog.setHasContent("B", false);

        DiscoveryOptions options = makeOptions(2, 1);
        options.years = years2020to2022();
        options.yearFilterForDiscovery = true;

        const Settings settings = testSettings();
        DiscoveryEngine engine(catalog, settings);
        const DiscoveryResult result = engine.discover(QStringLiteral("S"), options);

        QCOMPARE(result.tree.value("S"), QStringList({"A"}));
        QCOMPARE(catalog.probeCalls("A"), settings.discovery.probeRetries);
        QCOMPARE(catalog.probeCalls("B"), 2);
    }

    // ── Failures ────────────────────────────────────────────────
    void failingParentContributesNoChildren()
    {
        FakeCatalogService catalog;
        for (const char* id : {"S", "A", "B", "C", "D"})
            catalog.addArtist(id);
        catalog.setSimilar("S", {"A", "B"});
        catalog.setSimilar("A", {"C"});
        catalog.setSimilar("B", {"D"});
        catalog.failSimilarFor("A");

        const Settings settings = testSettings();
        DiscoveryEngine engine(catalog, settings);
        const DiscoveryResult result = engine.discover(QStringLiteral("S"), makeOptions(2, 2));

        QCOMPARE(ids(result.artists), QStringList({"S", "A", "B", "D"}));
        QVERIFY(!result.tree.contains("A"));
        QCOMPARE(result.tree.value("B"), QStringList({"D"}));
    }

    void unexpectedErrorsStayInsideTheirParent()
    {
        FakeCatalogService catalog;
        for (const char* id : {"S", "A", "B", "C", "D"})
            catalog.addArtist(id);
        catalog.setSimilar("S", {"A", "B"});
        catalog.setSimilar("A", {"C"});
        catalog.setSimilar("B", {"D"});
        // Both the year check and the similar lookup for A throw a
        // non-catalog exception
        catalog.failUnexpectedlyFor("A");

        DiscoveryOptions options = makeOptions(2, 2);
        options.years = years2020to2022();
        options.yearFilterForDiscovery = true;

        const Settings settings = testSettings();
        DiscoveryEngine engine(catalog, settings);
        DiscoveryResult result;
        try {
            result = engine.discover(QStringLiteral("S"), options);
        } catch (const std::exception& e) {
            QFAIL(e.what());
        }

        QVERIFY(catalog.probeCalls("A") >= 1);
        QCOMPARE(catalog.similarCalls("A"), 1);
        QCOMPARE(ids(result.artists), QStringList({"S", "A", "B", "D"}));
        QVERIFY(!result.tree.contains("A"));
        QCOMPARE(result.tree.value("B"), QStringList({"D"}));
        QCOMPARE(catalog.probeCalls("C"), 0);
    }

    void unknownSeedThrowsNotFound()
    {
        FakeCatalogService catalog;
        const Settings settings = testSettings();
        DiscoveryEngine engine(catalog, settings);

        bool thrown = false;
        try {
            engine.discover(QStringLiteral("missing"), makeOptions(2, 1));
        } catch (const NotFoundError&) {
            thrown = true;
        }
        QVERIFY(thrown);
    }

    void multipleSeedsAreNotRediscovered()
    {
        FakeCatalogService catalog;
        for (const char* id : {"S1", "S2", "A"})
            catalog.addArtist(id);
        catalog.setSimilar("S1", {"S2", "A"});
        catalog.setSimilar("S2", {"A", "S1"});

        const Settings settings = testSettings();
        DiscoveryEngine engine(catalog, settings);
        const DiscoveryResult result = engine.discover(QStringList{"S1", "S2", "S1"}, makeOptions(2, 1));

        QCOMPARE(result.seeds.size(), 2);
        QCOMPARE(ids(result.artists), QStringList({"S1", "S2", "A"}));
        QCOMPARE(result.artistById("S2")->depth, 0);
        QCOMPARE(result.tree.value("S1"), QStringList({"A"}));
        QVERIFY(result.tree.value("S2").isEmpty());
    }

    // ── Cancellation / signals ──────────────────────────────────
    void cancelledBeforeFirstLevel()
    {
        FakeCatalogService catalog;
        catalog.addArtist("S");
        catalog.addArtist("A");
        catalog.setSimilar("S", {"A"});

        CancelToken token;
        token.cancel();

        const Settings settings = testSettings();
        DiscoveryEngine engine(catalog, settings);
        const DiscoveryResult result = engine.discover(QStringLiteral("S"), makeOptions(2, 2), &token);

        QVERIFY(result.interrupted);
        QCOMPARE(ids(result.artists), QStringList({"S"}));
        QCOMPARE(catalog.similarCalls("S"), 0);
    }

    void levelSignalsPerLevel()
    {
        FakeCatalogService catalog;
        buildRing(catalog);

        const Settings settings = testSettings();
        DiscoveryEngine engine(catalog, settings);
        QSignalSpy started(&engine, &DiscoveryEngine::levelStarted);
        QSignalSpy finished(&engine, &DiscoveryEngine::levelFinished);

        engine.discover(QStringLiteral("R0"), makeOptions(2, 2));

        QCOMPARE(started.count(), 2);
        QCOMPARE(finished.count(), 2);
        QCOMPARE(finished.at(0).at(0).toInt(), 1);
        QCOMPARE(finished.at(0).at(1).toInt(), 2);
    }
};

QTEST_MAIN(tst_DiscoveryEngine)
#include "tst_DiscoveryEngine.moc"
