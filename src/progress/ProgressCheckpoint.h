#pragma once

#include <QDateTime>
#include <QJsonObject>
#include <QSet>
#include <QString>
#include <optional>

struct ProgressCheckpoint {
    QString       sessionName;
    int           totalArtists = 0;
    QSet<QString> processedArtistIds;
    int           lastArtistIndex = -1;
    QString       lastArtistId;
    QString       commandHash;
    QDateTime     startedAt;
    QDateTime     lastUpdatedAt;
    bool          isComplete = false;
    int           tracksDownloaded = 0;
    int           tracksFailed = 0;

    bool isProcessed(const QString& artistId) const
    {
        return processedArtistIds.contains(artistId);
    }

    QJsonObject toJson() const;
    static std::optional<ProgressCheckpoint> fromJson(const QJsonObject& obj);
};
