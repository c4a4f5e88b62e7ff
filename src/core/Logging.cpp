#include "Logging.h"

#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QMutexLocker>
#include <cstdio>

static QMutex s_logMutex;
static QFile  s_logFile;
static bool   s_verbose = false;

static char levelLetter(QtMsgType type)
{
    switch (type) {
    case QtDebugMsg:    return 'D';
    case QtInfoMsg:     return 'I';
    case QtWarningMsg:  return 'W';
    case QtCriticalMsg: return 'C';
    case QtFatalMsg:    return 'F';
    }
    return '?';
}

static void messageHandler(QtMsgType type, const QMessageLogContext&, const QString& msg)
{
    if (type == QtDebugMsg && !s_verbose)
        return;

    QMutexLocker lock(&s_logMutex);
    const QString line = QStringLiteral("[%1] %2 %3\n")
        .arg(QDateTime::currentDateTime().toString(QStringLiteral("HH:mm:ss.zzz")))
        .arg(QChar::fromLatin1(levelLetter(type)))
        .arg(msg);
    const QByteArray utf8 = line.toUtf8();

    if (s_logFile.isOpen()) {
        s_logFile.write(utf8);
        s_logFile.flush();
    }
    fprintf(stderr, "%s", utf8.constData());
    fflush(stderr);
}

void Logging::install(const LoggingSettings& config)
{
    {
        QMutexLocker lock(&s_logMutex);
        s_verbose = config.verbose;

        if (s_logFile.isOpen())
            s_logFile.close();

        if (!config.file.isEmpty()) {
            QDir().mkpath(QFileInfo(config.file).absolutePath());
            s_logFile.setFileName(config.file);
            if (!s_logFile.open(QIODevice::WriteOnly | QIODevice::Append)) {
                fprintf(stderr, "[Logging] Cannot open log file %s: %s\n",
                        qPrintable(config.file), qPrintable(s_logFile.errorString()));
            }
        }
    }

    qInstallMessageHandler(messageHandler);
    qDebug() << "[Logging] Installed, verbose:" << config.verbose
             << "file:" << (config.file.isEmpty() ? QStringLiteral("-") : config.file);
}

void Logging::shutdown()
{
    qInstallMessageHandler(nullptr);
    QMutexLocker lock(&s_logMutex);
    if (s_logFile.isOpen())
        s_logFile.close();
}
