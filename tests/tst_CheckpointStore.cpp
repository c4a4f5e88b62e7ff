#include <QtTest/QtTest>
#include <QTemporaryDir>
#include "cache/MemoryCache.h"
#include "core/Settings.h"
#include "progress/CheckpointStore.h"

static QVector<Artist> artistList(const QStringList& ids)
{
    QVector<Artist> out;
    for (const QString& id : ids) {
        Artist a;
        a.id = id;
        a.name = id;
        out.append(a);
    }
    return out;
}

class tst_CheckpointStore : public QObject {
    Q_OBJECT

private:
    QTemporaryDir* m_dir = nullptr;
    Settings m_settings;

private slots:
    void init()
    {
        m_dir = new QTemporaryDir();
        QVERIFY(m_dir->isValid());
        m_settings = Settings::defaults(m_dir->path());
    }

    void cleanup()
    {
        delete m_dir;
        m_dir = nullptr;
    }

    // ── Persistence ─────────────────────────────────────────────
    void create_writesFileAndCache()
    {
        MemoryCache cache;
        CheckpointStore store(m_settings, &cache);
        store.createCheckpoint("run1", 4, "abc123");

        QVERIFY(QFile::exists(store.progressFilePath("run1")));
        QVERIFY(cache.exists(CheckpointStore::cacheKey("run1")));
        QVERIFY(store.current().has_value());
        QCOMPARE(store.current()->totalArtists, 4);
    }

    void load_fromFileWhenCacheIsEmpty()
    {
        {
            CheckpointStore writer(m_settings, nullptr);
            writer.createCheckpoint("run1", 3, "sig");
            writer.saveProgress("run1", "A", 0);
            writer.saveProgress("run1", "B", 1);
        }

        MemoryCache emptyCache;
        CheckpointStore reader(m_settings, &emptyCache);
        const auto cp = reader.loadCheckpoint("run1");
        QVERIFY(cp.has_value());
        QCOMPARE(cp->commandHash, QStringLiteral("sig"));
        QCOMPARE(cp->processedArtistIds, (QSet<QString>{"A", "B"}));
        QCOMPARE(cp->lastArtistIndex, 1);
        QCOMPARE(cp->lastArtistId, QStringLiteral("B"));
        QVERIFY(!cp->isComplete);
    }

    void load_prefersCache()
    {
        MemoryCache cache;
        {
            CheckpointStore writer(m_settings, &cache);
            writer.createCheckpoint("run1", 2, "sig");
            writer.saveProgress("run1", "A", 0);
        }
        QVERIFY(QFile::remove(CheckpointStore(m_settings, nullptr).progressFilePath("run1")));

        CheckpointStore reader(m_settings, &cache);
        const auto cp = reader.loadCheckpoint("run1");
        QVERIFY(cp.has_value());
        QVERIFY(cp->isProcessed("A"));
    }

    void load_missingOrCorruptGivesNothing()
    {
        CheckpointStore store(m_settings, nullptr);
        QVERIFY(!store.loadCheckpoint("nothing").has_value());

        QFile file(store.progressFilePath("broken"));
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write("{ not json");
        file.close();
        QVERIFY(!store.loadCheckpoint("broken").has_value());
    }

    // ── Progress ────────────────────────────────────────────────
    void saveProgress_indexNeverDecreases()
    {
        CheckpointStore store(m_settings, nullptr);
        store.createCheckpoint("run1", 5, "sig");
        store.saveProgress("run1", "C", 2);
        store.saveProgress("run1", "A", 0);

        const auto cp = store.current();
        QCOMPARE(cp->lastArtistIndex, 2);
        QCOMPARE(cp->lastArtistId, QStringLiteral("C"));
        QCOMPARE(cp->processedArtistIds.size(), 2);
    }

    void saveProgress_createsCheckpointOnFirstSave()
    {
        CheckpointStore store(m_settings, nullptr);
        store.saveProgress("fresh", "A", 0, 7, "sig");
        QCOMPARE(store.current()->sessionName, QStringLiteral("fresh"));
        QCOMPARE(store.current()->totalArtists, 7);
        QVERIFY(QFile::exists(store.progressFilePath("fresh")));
    }

    void remaining_skipsProcessedInOrder()
    {
        ProgressCheckpoint cp;
        cp.sessionName = "run1";
        cp.processedArtistIds = {"A", "B"};

        const QVector<Artist> left = CheckpointStore::remaining(artistList({"A", "B", "C", "D"}), cp);
        QCOMPARE(left.size(), 2);
        QCOMPARE(left[0].id, QStringLiteral("C"));
        QCOMPARE(left[1].id, QStringLiteral("D"));
    }

    void trackOutcomes_persistWithNextSave()
    {
        CheckpointStore store(m_settings, nullptr);
        store.createCheckpoint("run1", 2, "sig");
        store.recordTrackOutcome(3, 1);
        store.recordTrackOutcome(2, 0);
        store.saveProgress("run1", "A", 0);

        CheckpointStore reader(m_settings, nullptr);
        const auto cp = reader.loadCheckpoint("run1");
        QCOMPARE(cp->tracksDownloaded, 5);
        QCOMPARE(cp->tracksFailed, 1);
    }

    void markComplete_isPersisted()
    {
        CheckpointStore store(m_settings, nullptr);
        store.createCheckpoint("run1", 1, "sig");
        store.saveProgress("run1", "A", 0);
        store.markComplete("run1");

        CheckpointStore reader(m_settings, nullptr);
        QVERIFY(reader.loadCheckpoint("run1")->isComplete);
    }

    // ── Compatibility ───────────────────────────────────────────
    void signature_isOrderIndependentAndParameterSensitive()
    {
        const QString a = CheckpointStore::commandSignature({"1", "2"}, 5, 2, 10);
        QCOMPARE(a.size(), 12);
        QCOMPARE(a, CheckpointStore::commandSignature({"2", "1"}, 5, 2, 10));
        QVERIFY(a != CheckpointStore::commandSignature({"1", "2"}, 5, 3, 10));
        QVERIFY(a != CheckpointStore::commandSignature({"1", "2"}, 5, 2, 20));
        QVERIFY(a != CheckpointStore::commandSignature({"1", "3"}, 5, 2, 10));
    }

    void isCompatible_comparesSignature()
    {
        CheckpointStore store(m_settings, nullptr);
        const ProgressCheckpoint cp = store.createCheckpoint("run1", 1, "aaa");
        QVERIFY(store.isCompatible(cp, "aaa"));
        QVERIFY(!store.isCompatible(cp, "bbb"));
    }

    // ── Reset ───────────────────────────────────────────────────
    void reset_deletesBothCopies()
    {
        MemoryCache cache;
        CheckpointStore store(m_settings, &cache);
        store.createCheckpoint("run1", 1, "sig");

        QVERIFY(store.resetSession("run1"));
        QVERIFY(!QFile::exists(store.progressFilePath("run1")));
        QVERIFY(!cache.exists(CheckpointStore::cacheKey("run1")));
        QVERIFY(!store.current().has_value());
        QVERIFY(!store.resetSession("run1"));
    }

    void sessionNameWithSeparators_staysInProgressDir()
    {
        CheckpointStore store(m_settings, nullptr);
        const QString path = store.progressFilePath("a/b");
        QCOMPARE(QFileInfo(path).fileName(), QStringLiteral("a_b.json"));
        QCOMPARE(QFileInfo(path).absolutePath(), QDir(m_settings.files.progressDir).absolutePath());
    }

    void summary_reportsCounts()
    {
        CheckpointStore store(m_settings, nullptr);
        QVERIFY(store.summary().isEmpty());
        store.createCheckpoint("run1", 4, "sig");
        store.saveProgress("run1", "A", 0);
        const QString text = store.summary();
        QVERIFY(text.contains("Session: run1"));
        QVERIFY(text.contains("1/4 (25.0%)"));
        QVERIFY(text.contains("Last artist: A"));
    }
};

QTEST_MAIN(tst_CheckpointStore)
#include "tst_CheckpointStore.moc"
