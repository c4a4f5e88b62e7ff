#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QTextStream>

#include "app/CommandLine.h"
#include "app/HarvestRunner.h"
#include "app/SignalHandlers.h"
#include "cache/CacheFactory.h"
#include "catalog/YandexMusicProvider.h"
#include "core/CancelToken.h"
#include "core/Errors.h"
#include "core/Logging.h"
#include "core/Settings.h"

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    app.setOrganizationName(QStringLiteral("Echotrail"));
    app.setApplicationName(QStringLiteral("echotrail"));
    app.setApplicationVersion(QStringLiteral(ECHOTRAIL_VERSION));

    QTextStream out(stdout);
    QTextStream err(stderr);

    CommandLineOptions options;
    Settings settings;
    try {
        options = CommandLine::parse(app.arguments());
        settings = Settings::load(options.configPath);
        settings.downloads.maxConcurrent = options.parallel;
        if (options.verbose)
            settings.logging.verbose = true;
        settings.validate();
    } catch (const ConfigurationError& e) {
        err << "echotrail: " << e.message() << Qt::endl;
        err << "Try 'echotrail --help' for more information." << Qt::endl;
        return 2;
    }

    Logging::install(settings.logging);
    CancelToken cancel;
    SignalHandlers::install(QDir(settings.files.storageDir).filePath(QStringLiteral("logs")), &cancel);

    qInfo() << "[STARTUP] Echotrail" << ECHOTRAIL_VERSION
            << "storage:" << settings.files.storageDir;
    if (settings.catalog.token.isEmpty())
        qWarning() << "[STARTUP] No catalog token configured, requests are anonymous";

    int exitCode = 0;
    {
        std::unique_ptr<ICacheBackend> cache = CacheFactory::create(settings);
        qInfo() << "[STARTUP] Cache backend:" << cache->name();

        YandexMusicProvider catalog(settings, cache.get());
        HarvestRunner runner(catalog, *cache, settings);

        try {
            exitCode = runner.run(options, &cancel);
        } catch (const NotFoundError& e) {
            qCritical() << "[Harvest] Seed artist not found:" << e.message();
            exitCode = 1;
        } catch (const ConfigurationError& e) {
            qCritical() << "[Harvest]" << e.message();
            exitCode = 2;
        } catch (const EchotrailError& e) {
            qCritical() << "[Harvest] Fatal:" << e.message();
            exitCode = 1;
        }

        out << '\n' << runner.statisticsReport() << Qt::endl;
    }

    SignalHandlers::uninstall();
    Logging::shutdown();
    return exitCode;
}
