#include "FileNaming.h"

#include <QRegularExpression>

// Well below NAME_MAX (255 bytes) on common filesystems
static constexpr int kMaxFileNameBytes = 200;

static int utf8Length(char32_t codePoint)
{
    if (codePoint < 0x80)
        return 1;
    if (codePoint < 0x800)
        return 2;
    if (codePoint < 0x10000)
        return 3;
    return 4;
}

QString FileNaming::sanitize(const QString& name)
{
    static const QRegularExpression reserved(QStringLiteral("[<>:\"/\\\\|?*]"));
    static const QRegularExpression control(QStringLiteral("[\\x00-\\x1f\\x7f]"));

    QString out = name;
    out.replace(reserved, QStringLiteral("_"));
    out.remove(control);
    out = out.trimmed();

    // "." and ".." would escape the parent directory
    if (out.isEmpty() || out == QStringLiteral(".") || out == QStringLiteral(".."))
        out = QStringLiteral("_");
    return out;
}

QString FileNaming::canonicalTrackName(const QString& artistId, const QString& trackId,
                                       std::optional<int> year)
{
    QString name = QStringLiteral("[AID%1] [TID%2]").arg(artistId, trackId);
    if (year)
        name += QStringLiteral(" [%1]").arg(*year);
    return sanitize(name + QStringLiteral(".mp3"));
}

QString FileNaming::displayTrackName(const Track& track)
{
    const QString artists = track.artistNames.isEmpty()
        ? QStringLiteral("Unknown Artist")
        : track.artistNames.join(QStringLiteral(", "));
    QString name = sanitize(QStringLiteral("%1 - %2.mp3").arg(artists, track.title));

    int bytes = name.toUtf8().size();
    if (bytes <= kMaxFileNameBytes)
        return name;

    // Drop whole code points from the end of the stem
    const QString suffix = QStringLiteral(".mp3");
    QString stem = name.left(name.size() - suffix.size());
    bytes = stem.toUtf8().size();
    while (!stem.isEmpty() && bytes + suffix.size() > kMaxFileNameBytes) {
        const int last = stem.size() - 1;
        if (last > 0 && stem.at(last).isLowSurrogate() && stem.at(last - 1).isHighSurrogate()) {
            bytes -= utf8Length(QChar::surrogateToUcs4(stem.at(last - 1), stem.at(last)));
            stem.chop(2);
        } else {
            bytes -= utf8Length(stem.at(last).unicode());
            stem.chop(1);
        }
    }
    return stem + suffix;
}

QString FileNaming::sessionFileName(const QString& session)
{
    QString safe = session;
    safe.replace(QLatin1Char('/'), QLatin1Char('_'));
    safe.replace(QLatin1Char('\\'), QLatin1Char('_'));
    return safe + QStringLiteral(".json");
}
