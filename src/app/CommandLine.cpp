#include "CommandLine.h"
#include "../core/Errors.h"

#include <QCommandLineParser>
#include <QFile>
#include <QTextStream>

DiscoveryOptions CommandLineOptions::toDiscoveryOptions() const
{
    DiscoveryOptions options;
    options.songsPerArtist = tracks;
    options.similarLimit = similar;
    // --similar without --depth lists the seeds' direct neighbours
    options.maxDepth = (depth == 0 && similar > 0) ? 1 : depth;
    options.maxTotalArtists = maxArtists;
    options.regionAllowList = countries;
    options.priorityRegions = priorityCountries;
    options.minTracksPerArtist = minTracks;
    options.excludeArtists = exclude;
    options.years = years;
    options.yearFilterForDiscovery = skipNoYearContent;
    options.skipArtistsWithoutYearContent = skipNoYearContent;
    options.maxSimilarArtistAttempts = maxAttempts;
    options.shuffle = shuffle;
    return options;
}

SelectionOptions CommandLineOptions::toSelectionOptions() const
{
    SelectionOptions options;
    options.songsPerArtist = tracks;
    options.years = years;
    options.inTopN = inTopN;
    options.inTopPercent = inTopPercent;
    return options;
}

QStringList CommandLine::splitList(const QString& text, bool upperCase)
{
    QStringList out;
    for (const QString& part : text.split(QLatin1Char(','), Qt::SkipEmptyParts)) {
        const QString item = part.trimmed();
        if (!item.isEmpty())
            out.append(upperCase ? item.toUpper() : item);
    }
    return out;
}

bool CommandLine::parseInTop(const QString& text, int& topN, int& topPercent)
{
    QString value = text.trimmed();
    const bool percent = value.endsWith(QLatin1Char('%'));
    if (percent)
        value.chop(1);

    bool ok = false;
    const int n = value.toInt(&ok);
    if (!ok || n < 1 || (percent && n > 100))
        return false;

    topN = percent ? 0 : n;
    topPercent = percent ? n : 0;
    return true;
}

QStringList CommandLine::readArtistFile(const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text))
        throw ConfigurationError(QStringLiteral("Cannot read artist file %1: %2")
                                     .arg(path, file.errorString()));

    QStringList ids;
    QTextStream in(&file);
    while (!in.atEnd()) {
        const QString line = in.readLine().trimmed();
        if (line.isEmpty() || line.startsWith(QLatin1Char('#')))
            continue;
        ids.append(splitList(line));
    }
    return ids;
}

static int intValue(const QCommandLineParser& parser, const QString& name, int fallback)
{
    if (!parser.isSet(name))
        return fallback;
    bool ok = false;
    const int value = parser.value(name).toInt(&ok);
    if (!ok)
        throw ConfigurationError(QStringLiteral("--%1 expects a number, got '%2'")
                                     .arg(name, parser.value(name)));
    return value;
}

CommandLineOptions CommandLine::parse(const QStringList& arguments)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Discover artists similar to a seed and download their top tracks"));
    parser.addHelpOption();

    parser.addOptions({
        {{QStringLiteral("a"), QStringLiteral("artist-id")},
         QStringLiteral("Seed artist ID (repeatable or comma separated)."), QStringLiteral("ID")},
        {QStringLiteral("artist-file"),
         QStringLiteral("File with one seed artist ID per line."), QStringLiteral("FILE")},
        {{QStringLiteral("o"), QStringLiteral("output-dir")},
         QStringLiteral("Output directory for downloaded tracks."), QStringLiteral("DIR")},
        {{QStringLiteral("n"), QStringLiteral("tracks")},
         QStringLiteral("Tracks per artist (default: 10)."), QStringLiteral("N")},
        {{QStringLiteral("s"), QStringLiteral("similar")},
         QStringLiteral("Similar artists per artist (default: 0)."), QStringLiteral("N")},
        {{QStringLiteral("d"), QStringLiteral("depth")},
         QStringLiteral("Recursive discovery depth (default: 0)."), QStringLiteral("N")},
        {QStringLiteral("max-artists"),
         QStringLiteral("Maximum number of artists in total (default: 999)."), QStringLiteral("N")},
        {QStringLiteral("exclude"),
         QStringLiteral("Comma separated artist IDs to exclude."), QStringLiteral("IDS")},
        {{QStringLiteral("y"), QStringLiteral("years")},
         QStringLiteral("Year filter, e.g. 2020 or 2018-2022."), QStringLiteral("RANGE")},
        {{QStringLiteral("c"), QStringLiteral("countries")},
         QStringLiteral("Allowed country codes, or SAME for the seed's country."), QStringLiteral("LIST")},
        {QStringLiteral("priority-countries"),
         QStringLiteral("Country codes ranked first among candidates."), QStringLiteral("LIST")},
        {QStringLiteral("min-tracks"),
         QStringLiteral("Minimum catalog size of a discovered artist (default: 3)."), QStringLiteral("N")},
        {QStringLiteral("in-top"),
         QStringLiteral("Only tracks within the artist's top N or N% (requires --years)."), QStringLiteral("N|N%")},
        {QStringLiteral("skip-no-year-content"),
         QStringLiteral("Skip discovered artists without tracks in --years.")},
        {QStringLiteral("max-attempts"),
         QStringLiteral("Candidates checked per parent under the year filter (default: 20)."), QStringLiteral("N")},
        {{QStringLiteral("q"), QStringLiteral("quality")},
         QStringLiteral("Audio quality: low, medium or high (default: high)."), QStringLiteral("LEVEL")},
        {{QStringLiteral("p"), QStringLiteral("parallel")},
         QStringLiteral("Maximum parallel downloads (default: 2)."), QStringLiteral("N")},
        {QStringLiteral("shuffle"),
         QStringLiteral("Put all tracks into one folder with numeric prefixes.")},
        {QStringLiteral("archive"),
         QStringLiteral("Pack the output directory into a .tar.gz.")},
        {QStringLiteral("session"),
         QStringLiteral("Session name for resumable runs."), QStringLiteral("NAME")},
        {QStringLiteral("resume"),
         QStringLiteral("Resume the named session.")},
        {QStringLiteral("reset-progress"),
         QStringLiteral("Discard saved progress of the named session.")},
        {QStringLiteral("tree-json"),
         QStringLiteral("Write the discovery tree to FILE."), QStringLiteral("FILE")},
        {QStringLiteral("config"),
         QStringLiteral("INI configuration file."), QStringLiteral("FILE")},
        {{QStringLiteral("v"), QStringLiteral("verbose")},
         QStringLiteral("Enable debug logging.")},
        // -v belongs to --verbose, so no addVersionOption()
        {QStringLiteral("version"),
         QStringLiteral("Displays version information.")},
    });

    if (!parser.parse(arguments))
        throw ConfigurationError(parser.errorText());
    if (parser.isSet(QStringLiteral("help")))
        parser.showHelp(0);
    if (parser.isSet(QStringLiteral("version")))
        parser.showVersion();

    CommandLineOptions opts;

    for (const QString& value : parser.values(QStringLiteral("artist-id")))
        opts.artistIds.append(splitList(value));
    opts.artistFile = parser.value(QStringLiteral("artist-file"));
    if (!opts.artistFile.isEmpty())
        opts.artistIds.append(readArtistFile(opts.artistFile));
    opts.artistIds.removeDuplicates();

    opts.outputDir = parser.value(QStringLiteral("output-dir"));

    opts.tracks      = intValue(parser, QStringLiteral("tracks"), opts.tracks);
    opts.similar     = intValue(parser, QStringLiteral("similar"), opts.similar);
    opts.depth       = intValue(parser, QStringLiteral("depth"), opts.depth);
    opts.maxArtists  = intValue(parser, QStringLiteral("max-artists"), opts.maxArtists);
    opts.minTracks   = intValue(parser, QStringLiteral("min-tracks"), opts.minTracks);
    opts.maxAttempts = intValue(parser, QStringLiteral("max-attempts"), opts.maxAttempts);
    opts.parallel    = intValue(parser, QStringLiteral("parallel"), opts.parallel);

    const QStringList excluded = splitList(parser.value(QStringLiteral("exclude")));
    opts.exclude = QSet<QString>(excluded.cbegin(), excluded.cend());

    if (parser.isSet(QStringLiteral("years"))) {
        opts.years = YearRange::parse(parser.value(QStringLiteral("years")));
        if (!opts.years)
            throw ConfigurationError(QStringLiteral("Invalid --years value '%1'")
                                         .arg(parser.value(QStringLiteral("years"))));
    }

    opts.countries = splitList(parser.value(QStringLiteral("countries")), true);
    opts.priorityCountries = splitList(parser.value(QStringLiteral("priority-countries")), true);

    if (parser.isSet(QStringLiteral("in-top"))
        && !parseInTop(parser.value(QStringLiteral("in-top")), opts.inTopN, opts.inTopPercent)) {
        throw ConfigurationError(QStringLiteral("Invalid --in-top value '%1'")
                                     .arg(parser.value(QStringLiteral("in-top"))));
    }
    opts.skipNoYearContent = parser.isSet(QStringLiteral("skip-no-year-content"));

    if (parser.isSet(QStringLiteral("quality"))) {
        const auto quality = qualityFromString(parser.value(QStringLiteral("quality")));
        if (!quality)
            throw ConfigurationError(QStringLiteral("--quality must be low, medium or high"));
        opts.quality = *quality;
    }

    opts.shuffle       = parser.isSet(QStringLiteral("shuffle"));
    opts.archive       = parser.isSet(QStringLiteral("archive"));
    opts.session       = parser.value(QStringLiteral("session"));
    opts.resume        = parser.isSet(QStringLiteral("resume"));
    opts.resetProgress = parser.isSet(QStringLiteral("reset-progress"));
    opts.treeJson      = parser.value(QStringLiteral("tree-json"));
    opts.configPath    = parser.value(QStringLiteral("config"));
    opts.verbose       = parser.isSet(QStringLiteral("verbose"));

    // ── Validation ──────────────────────────────────────────────────
    if (opts.artistIds.isEmpty())
        throw ConfigurationError(QStringLiteral("At least one --artist-id or --artist-file is required"));
    if (opts.outputDir.isEmpty())
        throw ConfigurationError(QStringLiteral("--output-dir is required"));
    if (opts.tracks < 1)
        throw ConfigurationError(QStringLiteral("--tracks must be >= 1"));
    if (opts.similar < 0)
        throw ConfigurationError(QStringLiteral("--similar must be >= 0"));
    if (opts.depth < 0)
        throw ConfigurationError(QStringLiteral("--depth must be >= 0"));
    if (opts.depth > 0 && opts.similar == 0)
        throw ConfigurationError(QStringLiteral("--depth > 0 requires --similar > 0"));
    if (opts.maxArtists < 1)
        throw ConfigurationError(QStringLiteral("--max-artists must be >= 1"));
    if (opts.parallel < 1)
        throw ConfigurationError(QStringLiteral("--parallel must be >= 1"));
    if ((opts.inTopN > 0 || opts.inTopPercent > 0) && !opts.years)
        throw ConfigurationError(QStringLiteral("--in-top requires --years"));
    if (opts.skipNoYearContent && !opts.years)
        throw ConfigurationError(QStringLiteral("--skip-no-year-content requires --years"));
    if ((opts.resume || opts.resetProgress) && opts.session.isEmpty())
        throw ConfigurationError(QStringLiteral("--resume and --reset-progress require --session"));
    if (opts.resume && opts.resetProgress)
        throw ConfigurationError(QStringLiteral("--resume and --reset-progress are mutually exclusive"));

    return opts;
}
