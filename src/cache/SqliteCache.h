#pragma once

#include "ICacheBackend.h"

#include <QMutex>
#include <QSqlDatabase>

// Durable cache table in a SQLite file. All statements run on a single
// connection serialised by a mutex. Throws CacheFailure when the database
// cannot be opened or a statement fails.
class SqliteCache : public ICacheBackend {
public:
    explicit SqliteCache(const QString& dbPath);
    ~SqliteCache() override;

    SqliteCache(const SqliteCache&) = delete;
    SqliteCache& operator=(const SqliteCache&) = delete;

    void open();
    void close();
    bool isOpen() const;

    std::optional<QVariant> get(const QString& key) override;
    void set(const QString& key, const QVariant& value, int ttlSeconds) override;
    bool remove(const QString& key) override;
    bool exists(const QString& key) override;
    void clear() override;
    QString name() const override { return QStringLiteral("sqlite"); }

    // Deletes every expired row, returns how many
    int purgeExpired();

    QString path() const { return m_dbPath; }

private:
    void ensureOpen() const;
    static QByteArray encode(const QVariant& value);
    static QVariant decode(const QByteArray& blob);

    QString m_dbPath;
    QString m_connectionName;
    QSqlDatabase m_db;
    mutable QMutex m_mutex;
};
