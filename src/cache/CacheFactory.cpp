#include "CacheFactory.h"
#include "LayeredCache.h"
#include "MemoryCache.h"
#include "SqliteCache.h"
#include "../core/Errors.h"
#include "../core/Settings.h"

#include <QDebug>

std::unique_ptr<ICacheBackend> CacheFactory::create(const Settings& settings)
{
    auto memory = std::make_unique<MemoryCache>(settings.cache.sweepIntervalSeconds);
    memory->start();

    if (!settings.cache.enabled || settings.cache.database.isEmpty()) {
        qInfo() << "[Cache] Using in-memory cache only";
        return memory;
    }

    auto sqlite = std::make_unique<SqliteCache>(settings.cache.database);
    try {
        sqlite->open();
        sqlite->purgeExpired();
    } catch (const CacheFailure& e) {
        qWarning() << "[Cache] Durable cache unavailable, using in-memory cache:" << e.message();
        return memory;
    }

    qInfo() << "[Cache] Using SQLite cache with in-memory fallback:" << settings.cache.database;
    return std::make_unique<LayeredCache>(std::move(sqlite), std::move(memory));
}
