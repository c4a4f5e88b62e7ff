#include "ProgressCheckpoint.h"

#include <QJsonArray>
#include <QStringList>

QJsonObject ProgressCheckpoint::toJson() const
{
    QStringList ids(processedArtistIds.cbegin(), processedArtistIds.cend());
    ids.sort();

    QJsonObject obj;
    obj[QStringLiteral("session_name")]         = sessionName;
    obj[QStringLiteral("total_artists")]        = totalArtists;
    obj[QStringLiteral("processed_artist_ids")] = QJsonArray::fromStringList(ids);
    obj[QStringLiteral("last_artist_index")]    = lastArtistIndex;
    obj[QStringLiteral("last_artist_id")]       = lastArtistId;
    obj[QStringLiteral("command_hash")]         = commandHash;
    obj[QStringLiteral("started_at")]           = startedAt.toString(Qt::ISODateWithMs);
    obj[QStringLiteral("last_updated_at")]      = lastUpdatedAt.toString(Qt::ISODateWithMs);
    obj[QStringLiteral("is_complete")]          = isComplete;
    obj[QStringLiteral("tracks_downloaded")]    = tracksDownloaded;
    obj[QStringLiteral("tracks_failed")]        = tracksFailed;
    return obj;
}

std::optional<ProgressCheckpoint> ProgressCheckpoint::fromJson(const QJsonObject& obj)
{
    if (!obj.contains(QStringLiteral("session_name")) || !obj.contains(QStringLiteral("command_hash")))
        return std::nullopt;

    ProgressCheckpoint cp;
    cp.sessionName     = obj[QStringLiteral("session_name")].toString();
    cp.totalArtists    = obj[QStringLiteral("total_artists")].toInt();
    for (const auto& v : obj[QStringLiteral("processed_artist_ids")].toArray())
        cp.processedArtistIds.insert(v.toString());
    cp.lastArtistIndex = obj[QStringLiteral("last_artist_index")].toInt(-1);
    cp.lastArtistId    = obj[QStringLiteral("last_artist_id")].toString();
    cp.commandHash     = obj[QStringLiteral("command_hash")].toString();
    cp.startedAt       = QDateTime::fromString(obj[QStringLiteral("started_at")].toString(), Qt::ISODateWithMs);
    cp.lastUpdatedAt   = QDateTime::fromString(obj[QStringLiteral("last_updated_at")].toString(), Qt::ISODateWithMs);
    cp.isComplete      = obj[QStringLiteral("is_complete")].toBool();
    cp.tracksDownloaded = obj[QStringLiteral("tracks_downloaded")].toInt();
    cp.tracksFailed    = obj[QStringLiteral("tracks_failed")].toInt();

    if (cp.sessionName.isEmpty())
        return std::nullopt;
    return cp;
}
