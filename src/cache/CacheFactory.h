#pragma once

#include "ICacheBackend.h"

#include <memory>

class Settings;

class CacheFactory {
public:
    // LayeredCache(sqlite, memory) when a database is configured and opens,
    // otherwise a lone MemoryCache. The memory layer's sweep is started.
    static std::unique_ptr<ICacheBackend> create(const Settings& settings);
};
