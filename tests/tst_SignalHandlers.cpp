#include <QtTest/QtTest>
#include <QTemporaryDir>
#include <csignal>
#include "app/SignalHandlers.h"
#include "core/CancelToken.h"

class tst_SignalHandlers : public QObject {
    Q_OBJECT

private:
    QTemporaryDir* m_dir = nullptr;

private slots:
    void init()
    {
        m_dir = new QTemporaryDir();
        QVERIFY(m_dir->isValid());
    }

    void cleanup()
    {
        SignalHandlers::uninstall();
        delete m_dir;
        m_dir = nullptr;
    }

    void install_createsCrashDirectory()
    {
        CancelToken token;
        const QString dir = m_dir->filePath(QStringLiteral("logs"));
        SignalHandlers::install(dir, &token);

        QVERIFY(QDir(dir).exists());
        QCOMPARE(SignalHandlers::crashLogPath(), QDir(dir).filePath(QStringLiteral("crash.log")));
        QVERIFY(!QFile::exists(SignalHandlers::crashLogPath()));
    }

    void firstInterrupt_cancelsToken()
    {
        CancelToken token;
        SignalHandlers::install(m_dir->path(), &token);
        QCOMPARE(SignalHandlers::interruptCount(), 0);

        QCOMPARE(::raise(SIGINT), 0);
        QVERIFY(token.isCancelled());
        QCOMPARE(SignalHandlers::interruptCount(), 1);
    }

    void terminate_cancelsToken()
    {
        CancelToken token;
        SignalHandlers::install(m_dir->path(), &token);

        QCOMPARE(::raise(SIGTERM), 0);
        QVERIFY(token.isCancelled());
    }

    void reinstall_resetsInterruptCount()
    {
        CancelToken first;
        SignalHandlers::install(m_dir->path(), &first);
        QCOMPARE(::raise(SIGINT), 0);
        QCOMPARE(SignalHandlers::interruptCount(), 1);

        CancelToken second;
        SignalHandlers::install(m_dir->path(), &second);
        QCOMPARE(SignalHandlers::interruptCount(), 0);
        QCOMPARE(::raise(SIGINT), 0);
        QVERIFY(second.isCancelled());
    }
};

QTEST_MAIN(tst_SignalHandlers)
#include "tst_SignalHandlers.moc"
