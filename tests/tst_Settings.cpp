#include <QtTest/QtTest>
#include <QTemporaryDir>
#include "core/Errors.h"
#include "core/FileNaming.h"
#include "core/Settings.h"

static QString writeIni(const QTemporaryDir& dir, const QByteArray& contents)
{
    const QString path = dir.filePath("echotrail.ini");
    QFile f(path);
    if (f.open(QIODevice::WriteOnly))
        f.write(contents);
    return path;
}

class tst_Settings : public QObject {
    Q_OBJECT

private slots:
    void init()
    {
        qunsetenv("YANDEX_TOKEN");
        qunsetenv("ECHOTRAIL_DOWNLOADS_MAX_CONCURRENT");
    }

    // ── Defaults ────────────────────────────────────────────────
    void defaults_deriveDirectoriesFromStorage()
    {
        const Settings s = Settings::defaults("/data/echo");
        QCOMPARE(s.files.songsCacheDir, QStringLiteral("/data/echo/downloads/tracks"));
        QCOMPARE(s.files.progressDir, QStringLiteral("/data/echo/progress"));
        QCOMPARE(s.cache.database, QStringLiteral("/data/echo/cache/cache.sqlite"));
        QCOMPARE(s.downloads.maxConcurrent, 2);
        QCOMPARE(s.downloads.maxFileSizeBytes(), qint64(100) * 1024 * 1024);
        QCOMPARE(s.discovery.similarConcurrency, 3);
        s.validate();
    }

    void songsCacheTtl_zeroMeansLongLived()
    {
        DownloadSettings d;
        QVERIFY(d.effectiveSongsCacheTtl() > 365 * 24 * 3600);
        d.songsCacheTtl = 60;
        QCOMPARE(d.effectiveSongsCacheTtl(), 60);
    }

    // ── Loading ─────────────────────────────────────────────────
    void load_readsIniGroups()
    {
        QTemporaryDir dir;
        const QString path = writeIni(dir,
            "[catalog]\ntoken=abc\nrequests_per_second=2\n"
            "[downloads]\nmax_concurrent=4\nnegative_ttl_seconds=60\n"
            "[files]\nstorage_dir=/srv/echo\n"
            "[logging]\nverbose=yes\n");

        const Settings s = Settings::load(path);
        QCOMPARE(s.catalog.token, QStringLiteral("abc"));
        QCOMPARE(s.catalog.requestsPerSecond, 2);
        QCOMPARE(s.downloads.maxConcurrent, 4);
        QCOMPARE(s.downloads.negativeTtlSeconds, 60);
        QCOMPARE(s.files.progressDir, QStringLiteral("/srv/echo/progress"));
        QVERIFY(s.logging.verbose);
    }

    void load_environmentOverridesIni()
    {
        QTemporaryDir dir;
        const QString path = writeIni(dir, "[downloads]\nmax_concurrent=4\n");
        qputenv("ECHOTRAIL_DOWNLOADS_MAX_CONCURRENT", "7");
        qputenv("YANDEX_TOKEN", "from-env");

        const Settings s = Settings::load(path);
        QCOMPARE(s.downloads.maxConcurrent, 7);
        QCOMPARE(s.catalog.token, QStringLiteral("from-env"));

        qunsetenv("ECHOTRAIL_DOWNLOADS_MAX_CONCURRENT");
        qunsetenv("YANDEX_TOKEN");
    }

    void load_emptyPathGivesDefaults()
    {
        const Settings s = Settings::load(QString());
        QCOMPARE(s.downloads.chunkSize, 8192);
        QCOMPARE(s.catalog.requestTimeoutMs, 15000);
    }

    void load_rejectsBadValues()
    {
        QTemporaryDir dir;
        bool missing = false;
        try {
            Settings::load(dir.filePath("absent.ini"));
        } catch (const ConfigurationError&) {
            missing = true;
        }
        QVERIFY(missing);

        bool notInt = false;
        try {
            Settings::load(writeIni(dir, "[downloads]\nchunk_size=big\n"));
        } catch (const ConfigurationError&) {
            notInt = true;
        }
        QVERIFY(notInt);

        bool outOfRange = false;
        try {
            Settings::load(writeIni(dir, "[downloads]\nmax_concurrent=0\n"));
        } catch (const ConfigurationError&) {
            outOfRange = true;
        }
        QVERIFY(outOfRange);
    }

    // ── File naming ─────────────────────────────────────────────
    void sanitize_replacesReservedCharacters()
    {
        QCOMPARE(FileNaming::sanitize("AC/DC: Live?"), QStringLiteral("AC_DC_ Live_"));
        QCOMPARE(FileNaming::sanitize("  tab\tname "), QStringLiteral("tabname"));
        QCOMPARE(FileNaming::sanitize(".."), QStringLiteral("_"));
        QCOMPARE(FileNaming::sanitize(""), QStringLiteral("_"));
    }

    void canonicalName_withAndWithoutYear()
    {
        QCOMPARE(FileNaming::canonicalTrackName("42", "7", 2021),
                 QStringLiteral("[AID42] [TID7] [2021].mp3"));
        QCOMPARE(FileNaming::canonicalTrackName("42", "7"),
                 QStringLiteral("[AID42] [TID7].mp3"));
    }

    void displayName_joinsArtistsAndTruncates()
    {
        Track t;
        t.title = QStringLiteral("Song");
        t.artistNames = {QStringLiteral("A"), QStringLiteral("B")};
        QCOMPARE(FileNaming::displayTrackName(t), QStringLiteral("A, B - Song.mp3"));

        t.artistNames.clear();
        QCOMPARE(FileNaming::displayTrackName(t), QStringLiteral("Unknown Artist - Song.mp3"));

        t.title = QString(300, QLatin1Char('x'));
        const QString longName = FileNaming::displayTrackName(t);
        QCOMPARE(longName.size(), 200);
        QVERIFY(longName.endsWith(".mp3"));
    }

    void displayName_truncatesByEncodedBytes()
    {
        Track t;
        t.artistNames = {QStringLiteral("Группа")};
        t.title = QString(300, QChar(0x044F));
        const QString cyrillic = FileNaming::displayTrackName(t);
        QVERIFY(cyrillic.toUtf8().size() <= 200);
        QVERIFY(cyrillic.toUtf8().size() >= 198);
        QVERIFY(cyrillic.startsWith(QStringLiteral("Группа - ")));
        QVERIFY(cyrillic.endsWith(".mp3"));

        // Four-byte characters are never split
        t.title.clear();
        for (int i = 0; i < 80; ++i)
            t.title += QString::fromUcs4(U"\U0001F3B5", 1);
        const QString emoji = FileNaming::displayTrackName(t);
        QVERIFY(emoji.toUtf8().size() <= 200);
        QVERIFY(emoji.endsWith(".mp3"));
        const QString stem = emoji.chopped(4);
        QVERIFY(!stem.at(stem.size() - 1).isHighSurrogate());
        QCOMPARE(QString::fromUtf8(emoji.toUtf8()), emoji);
    }
};

QTEST_MAIN(tst_Settings)
#include "tst_Settings.moc"
