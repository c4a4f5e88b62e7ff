#pragma once

#include "MusicData.h"

#include <QString>
#include <optional>

namespace FileNaming {

// Replaces path separators and reserved characters with '_', drops
// control characters, trims. Never returns an empty string.
QString sanitize(const QString& name);

// Content-addressed store name: "[AID<artist>] [TID<track>][ [<year>]].mp3"
QString canonicalTrackName(const QString& artistId, const QString& trackId,
                           std::optional<int> year = std::nullopt);

// "<Artists> - <Title>.mp3", sanitised, at most 200 characters
QString displayTrackName(const Track& track);

// "<session>.json" with separators replaced
QString sessionFileName(const QString& session);

} // namespace FileNaming
