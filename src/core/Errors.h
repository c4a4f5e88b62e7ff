#pragma once

#include <QException>
#include <QString>
#include <QByteArray>

// Base for all failures raised by echotrail components. Derived from
// QException so instances survive a hop through QtConcurrent futures.
class EchotrailError : public QException {
public:
    explicit EchotrailError(const QString& message);

    QString message() const { return m_message; }
    const char* what() const noexcept override { return m_what.constData(); }

    void raise() const override { throw *this; }
    EchotrailError* clone() const override { return new EchotrailError(*this); }

private:
    QString m_message;
    QByteArray m_what;
};

// Requested entity does not exist upstream
class NotFoundError : public EchotrailError {
public:
    using EchotrailError::EchotrailError;
    void raise() const override { throw *this; }
    NotFoundError* clone() const override { return new NotFoundError(*this); }
};

// Upstream answered but persistently refused or returned garbage
class ServiceFailure : public EchotrailError {
public:
    using EchotrailError::EchotrailError;
    void raise() const override { throw *this; }
    ServiceFailure* clone() const override { return new ServiceFailure(*this); }
};

// Transport-level failure: timeout, connection reset, DNS
class NetworkFailure : public EchotrailError {
public:
    using EchotrailError::EchotrailError;
    void raise() const override { throw *this; }
    NetworkFailure* clone() const override { return new NetworkFailure(*this); }
};

class FileSystemFailure : public EchotrailError {
public:
    FileSystemFailure(const QString& message, const QString& path);

    QString path() const { return m_path; }
    void raise() const override { throw *this; }
    FileSystemFailure* clone() const override { return new FileSystemFailure(*this); }

private:
    QString m_path;
};

// Track-level business failure (no URL, oversize, HTTP error status)
class DownloadFailure : public EchotrailError {
public:
    DownloadFailure(const QString& message, const QString& trackId);

    QString trackId() const { return m_trackId; }
    void raise() const override { throw *this; }
    DownloadFailure* clone() const override { return new DownloadFailure(*this); }

private:
    QString m_trackId;
};

class CacheFailure : public EchotrailError {
public:
    using EchotrailError::EchotrailError;
    void raise() const override { throw *this; }
    CacheFailure* clone() const override { return new CacheFailure(*this); }
};

class ConfigurationError : public EchotrailError {
public:
    using EchotrailError::EchotrailError;
    void raise() const override { throw *this; }
    ConfigurationError* clone() const override { return new ConfigurationError(*this); }
};
