#pragma once

#include "../core/MusicData.h"
#include "../core/TrackSelector.h"

#include <QSet>
#include <QStringList>
#include <optional>

struct CommandLineOptions {
    QStringList artistIds;
    QString     artistFile;
    QString     outputDir;

    int tracks = 10;
    int similar = 0;
    int depth = 0;
    int maxArtists = 999;
    QSet<QString> exclude;

    std::optional<YearRange> years;
    QStringList countries;
    QStringList priorityCountries;
    int  minTracks = 3;
    int  inTopN = 0;
    int  inTopPercent = 0;
    bool skipNoYearContent = false;
    int  maxAttempts = 20;

    Quality quality = Quality::High;
    int  parallel = 2;
    bool shuffle = false;
    bool archive = false;

    QString session;
    bool    resume = false;
    bool    resetProgress = false;
    QString treeJson;

    QString configPath;
    bool    verbose = false;

    DiscoveryOptions toDiscoveryOptions() const;
    SelectionOptions toSelectionOptions() const;
};

class CommandLine {
public:
    // arguments[0] is the program name. Throws ConfigurationError on bad or
    // inconsistent input. --help / --version print and exit the process.
    static CommandLineOptions parse(const QStringList& arguments);

    // Accepts "N" or "N%"
    static bool parseInTop(const QString& text, int& topN, int& topPercent);

    // Comma-separated, trimmed, empty entries dropped
    static QStringList splitList(const QString& text, bool upperCase = false);

    static QStringList readArtistFile(const QString& path);
};
