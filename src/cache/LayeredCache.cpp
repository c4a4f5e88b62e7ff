#include "LayeredCache.h"
#include "../core/Errors.h"

#include <QDebug>
#include <QStringList>

LayeredCache::LayeredCache(std::unique_ptr<ICacheBackend> primary,
                           std::unique_ptr<ICacheBackend> fallback)
    : m_primary(std::move(primary))
    , m_fallback(std::move(fallback))
{
}

QString LayeredCache::name() const
{
    return QStringLiteral("%1+%2").arg(m_primary->name(), m_fallback->name());
}

std::optional<QVariant> LayeredCache::get(const QString& key)
{
    try {
        return m_primary->get(key);
    } catch (const EchotrailError& e) {
        qWarning() << "[Cache] Primary get failed for" << key << ":" << e.message();
    }

    try {
        return m_fallback->get(key);
    } catch (const EchotrailError& e) {
        qWarning() << "[Cache] Fallback get also failed for" << key << ":" << e.message();
    }
    return std::nullopt;
}

void LayeredCache::set(const QString& key, const QVariant& value, int ttlSeconds)
{
    QString primaryError;
    try {
        m_primary->set(key, value, ttlSeconds);
        return;
    } catch (const EchotrailError& e) {
        primaryError = e.message();
        qWarning() << "[Cache] Primary set failed for" << key << ":" << primaryError;
    }

    try {
        m_fallback->set(key, value, ttlSeconds);
        return;
    } catch (const EchotrailError& e) {
        qWarning() << "[Cache] Fallback set also failed for" << key << ":" << e.message();
    }
    throw CacheFailure(QStringLiteral("all cache backends failed: %1").arg(primaryError));
}

bool LayeredCache::remove(const QString& key)
{
    bool removed = false;
    try {
        removed = m_primary->remove(key);
    } catch (const EchotrailError& e) {
        qWarning() << "[Cache] Primary remove failed for" << key << ":" << e.message();
    }

    try {
        removed = m_fallback->remove(key) || removed;
    } catch (const EchotrailError& e) {
        qWarning() << "[Cache] Fallback remove failed for" << key << ":" << e.message();
    }
    return removed;
}

bool LayeredCache::exists(const QString& key)
{
    try {
        return m_primary->exists(key);
    } catch (const EchotrailError& e) {
        qWarning() << "[Cache] Primary exists failed for" << key << ":" << e.message();
    }

    try {
        return m_fallback->exists(key);
    } catch (const EchotrailError& e) {
        qWarning() << "[Cache] Fallback exists also failed for" << key << ":" << e.message();
    }
    return false;
}

void LayeredCache::clear()
{
    QStringList errors;
    try {
        m_primary->clear();
    } catch (const EchotrailError& e) {
        errors << QStringLiteral("primary: %1").arg(e.message());
    }

    try {
        m_fallback->clear();
    } catch (const EchotrailError& e) {
        errors << QStringLiteral("fallback: %1").arg(e.message());
    }

    if (!errors.isEmpty())
        throw CacheFailure(QStringLiteral("cache clear errors: %1").arg(errors.join(QStringLiteral("; "))));
}
