#pragma once

#include "ICacheBackend.h"

#include <memory>

// Primary backend with an in-process fallback. Primary failures are
// logged and served from the fallback; writes only fail when both
// backends refuse them.
class LayeredCache : public ICacheBackend {
public:
    LayeredCache(std::unique_ptr<ICacheBackend> primary,
                 std::unique_ptr<ICacheBackend> fallback);

    std::optional<QVariant> get(const QString& key) override;
    void set(const QString& key, const QVariant& value, int ttlSeconds) override;
    bool remove(const QString& key) override;
    bool exists(const QString& key) override;
    void clear() override;
    QString name() const override;

    ICacheBackend* primary() const { return m_primary.get(); }
    ICacheBackend* fallback() const { return m_fallback.get(); }

private:
    std::unique_ptr<ICacheBackend> m_primary;
    std::unique_ptr<ICacheBackend> m_fallback;
};
