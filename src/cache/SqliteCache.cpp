#include "SqliteCache.h"
#include "../core/Errors.h"

#include <QDataStream>
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QIODevice>
#include <QMutexLocker>
#include <QSqlError>
#include <QSqlQuery>

static constexpr int kStreamVersion = QDataStream::Qt_6_0;

SqliteCache::SqliteCache(const QString& dbPath)
    : m_dbPath(dbPath)
    , m_connectionName(QStringLiteral("echotrail_cache_%1")
                           .arg(reinterpret_cast<quintptr>(this), 0, 16))
{
}

SqliteCache::~SqliteCache()
{
    close();
}

// ── Connection ──────────────────────────────────────────────────────
void SqliteCache::open()
{
    QMutexLocker lock(&m_mutex);
    if (m_db.isOpen())
        return;

    QDir().mkpath(QFileInfo(m_dbPath).absolutePath());

    m_db = QSqlDatabase::addDatabase(QStringLiteral("QSQLITE"), m_connectionName);
    m_db.setDatabaseName(m_dbPath);
    if (!m_db.open()) {
        const QString err = m_db.lastError().text();
        m_db = QSqlDatabase();
        QSqlDatabase::removeDatabase(m_connectionName);
        throw CacheFailure(QStringLiteral("cannot open cache database %1: %2").arg(m_dbPath, err));
    }

    QSqlQuery pragma(m_db);
    if (pragma.exec(QStringLiteral("PRAGMA journal_mode=WAL")) && pragma.next()) {
        const QString mode = pragma.value(0).toString().toLower();
        if (mode != QStringLiteral("wal"))
            qWarning() << "[Cache] WAL mode not activated, got:" << mode;
    }
    pragma.exec(QStringLiteral("PRAGMA synchronous=NORMAL"));

    QSqlQuery create(m_db);
    if (!create.exec(QStringLiteral(
            "CREATE TABLE IF NOT EXISTS cache_entries ("
            "  key        TEXT PRIMARY KEY,"
            "  value      BLOB NOT NULL,"
            "  created_at INTEGER NOT NULL,"
            "  expires_at INTEGER NOT NULL)"))) {
        throw CacheFailure(QStringLiteral("cannot create cache table: %1")
                               .arg(create.lastError().text()));
    }
    create.exec(QStringLiteral(
        "CREATE INDEX IF NOT EXISTS idx_cache_expires ON cache_entries(expires_at)"));

    qDebug() << "[Cache] SQLite cache opened:" << m_dbPath;
}

void SqliteCache::close()
{
    QMutexLocker lock(&m_mutex);
    if (!m_db.isValid())
        return;
    m_db.close();
    m_db = QSqlDatabase();
    QSqlDatabase::removeDatabase(m_connectionName);
}

bool SqliteCache::isOpen() const
{
    QMutexLocker lock(&m_mutex);
    return m_db.isOpen();
}

void SqliteCache::ensureOpen() const
{
    if (!m_db.isOpen())
        throw CacheFailure(QStringLiteral("cache database is not open: %1").arg(m_dbPath));
}

// ── Value encoding ──────────────────────────────────────────────────
QByteArray SqliteCache::encode(const QVariant& value)
{
    QByteArray blob;
    QDataStream out(&blob, QIODevice::WriteOnly);
    out.setVersion(kStreamVersion);
    out << value;
    return blob;
}

QVariant SqliteCache::decode(const QByteArray& blob)
{
    QDataStream in(blob);
    in.setVersion(kStreamVersion);
    QVariant value;
    in >> value;
    if (in.status() != QDataStream::Ok)
        throw CacheFailure(QStringLiteral("corrupt cache value"));
    return value;
}

// ── ICacheBackend ───────────────────────────────────────────────────
std::optional<QVariant> SqliteCache::get(const QString& key)
{
    QMutexLocker lock(&m_mutex);
    ensureOpen();

    QSqlQuery q(m_db);
    q.prepare(QStringLiteral("SELECT value, expires_at FROM cache_entries WHERE key = ?"));
    q.addBindValue(key);
    if (!q.exec())
        throw CacheFailure(QStringLiteral("get(%1) failed: %2").arg(key, q.lastError().text()));
    if (!q.next())
        return std::nullopt;

    if (q.value(1).toLongLong() < QDateTime::currentMSecsSinceEpoch()) {
        QSqlQuery del(m_db);
        del.prepare(QStringLiteral("DELETE FROM cache_entries WHERE key = ?"));
        del.addBindValue(key);
        if (!del.exec())
            qWarning() << "[Cache] Failed to drop expired key" << key << del.lastError().text();
        return std::nullopt;
    }
    return decode(q.value(0).toByteArray());
}

void SqliteCache::set(const QString& key, const QVariant& value, int ttlSeconds)
{
    QMutexLocker lock(&m_mutex);
    ensureOpen();

    const qint64 now = QDateTime::currentMSecsSinceEpoch();
    QSqlQuery q(m_db);
    q.prepare(QStringLiteral(
        "INSERT OR REPLACE INTO cache_entries (key, value, created_at, expires_at) "
        "VALUES (?, ?, ?, ?)"));
    q.addBindValue(key);
    q.addBindValue(encode(value));
    q.addBindValue(now);
    q.addBindValue(now + qint64(ttlSeconds) * 1000);
    if (!q.exec())
        throw CacheFailure(QStringLiteral("set(%1) failed: %2").arg(key, q.lastError().text()));
}

bool SqliteCache::remove(const QString& key)
{
    QMutexLocker lock(&m_mutex);
    ensureOpen();

    QSqlQuery q(m_db);
    q.prepare(QStringLiteral("DELETE FROM cache_entries WHERE key = ?"));
    q.addBindValue(key);
    if (!q.exec())
        throw CacheFailure(QStringLiteral("remove(%1) failed: %2").arg(key, q.lastError().text()));
    return q.numRowsAffected() > 0;
}

bool SqliteCache::exists(const QString& key)
{
    QMutexLocker lock(&m_mutex);
    ensureOpen();

    QSqlQuery q(m_db);
    q.prepare(QStringLiteral("SELECT 1 FROM cache_entries WHERE key = ? AND expires_at >= ?"));
    q.addBindValue(key);
    q.addBindValue(QDateTime::currentMSecsSinceEpoch());
    if (!q.exec())
        throw CacheFailure(QStringLiteral("exists(%1) failed: %2").arg(key, q.lastError().text()));
    return q.next();
}

void SqliteCache::clear()
{
    QMutexLocker lock(&m_mutex);
    ensureOpen();

    QSqlQuery q(m_db);
    if (!q.exec(QStringLiteral("DELETE FROM cache_entries")))
        throw CacheFailure(QStringLiteral("clear failed: %1").arg(q.lastError().text()));
}

int SqliteCache::purgeExpired()
{
    QMutexLocker lock(&m_mutex);
    ensureOpen();

    QSqlQuery q(m_db);
    q.prepare(QStringLiteral("DELETE FROM cache_entries WHERE expires_at < ?"));
    q.addBindValue(QDateTime::currentMSecsSinceEpoch());
    if (!q.exec())
        throw CacheFailure(QStringLiteral("purge failed: %1").arg(q.lastError().text()));

    const int purged = q.numRowsAffected();
    if (purged > 0)
        qDebug() << "[Cache] Purged" << purged << "expired rows";
    return purged;
}
