#include "Errors.h"

EchotrailError::EchotrailError(const QString& message)
    : m_message(message)
    , m_what(message.toUtf8())
{
}

FileSystemFailure::FileSystemFailure(const QString& message, const QString& path)
    : EchotrailError(QStringLiteral("%1: %2").arg(message, path))
    , m_path(path)
{
}

DownloadFailure::DownloadFailure(const QString& message, const QString& trackId)
    : EchotrailError(QStringLiteral("track %1: %2").arg(trackId, message))
    , m_trackId(trackId)
{
}
