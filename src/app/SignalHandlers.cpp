#include "SignalHandlers.h"
#include "../core/CancelToken.h"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <ctime>
#include <execinfo.h>
#include <fcntl.h>
#include <unistd.h>

#include <QDebug>
#include <QDir>
#include <QFile>

namespace {

enum class Disposition { Fatal, Interrupt };

struct SignalSpec {
    int         number;
    const char* name;
    Disposition disposition;
};

const SignalSpec kSignals[] = {
    {SIGSEGV, "SIGSEGV", Disposition::Fatal},
    {SIGABRT, "SIGABRT", Disposition::Fatal},
    {SIGFPE,  "SIGFPE",  Disposition::Fatal},
    {SIGBUS,  "SIGBUS",  Disposition::Fatal},
    {SIGILL,  "SIGILL",  Disposition::Fatal},
    {SIGINT,  "SIGINT",  Disposition::Interrupt},
    {SIGTERM, "SIGTERM", Disposition::Interrupt},
};

char s_crashLog[1024] = {0};
CancelToken* s_token = nullptr;
volatile sig_atomic_t s_interrupts = 0;

const char* signalName(int sig)
{
    for (const SignalSpec& spec : kSignals) {
        if (spec.number == sig)
            return spec.name;
    }
    return "signal";
}

// Everything below runs inside a handler: no allocation, no stdio.
void writeText(int fd, const char* text)
{
    size_t left = strlen(text);
    while (left > 0) {
        const ssize_t n = ::write(fd, text, left);
        if (n <= 0)
            return;
        text += n;
        left -= static_cast<size_t>(n);
    }
}

void writeNumber(int fd, long long value)
{
    char digits[24];
    int pos = sizeof(digits) - 1;
    digits[pos] = '\0';
    const bool negative = value < 0;
    unsigned long long v = negative ? 0ULL - static_cast<unsigned long long>(value)
                                    : static_cast<unsigned long long>(value);
    do {
        digits[--pos] = static_cast<char>('0' + v % 10);
        v /= 10;
    } while (v > 0 && pos > 1);
    if (negative)
        digits[--pos] = '-';
    writeText(fd, digits + pos);
}

void onFatal(int sig)
{
    const int savedErrno = errno;
    const int fd = ::open(s_crashLog, O_WRONLY | O_CREAT | O_APPEND, 0644);
    if (fd >= 0) {
        writeText(fd, "=== echotrail " ECHOTRAIL_VERSION " fatal signal ");
        writeNumber(fd, sig);
        writeText(fd, " (");
        writeText(fd, signalName(sig));
        writeText(fd, ") at unix time ");
        writeNumber(fd, static_cast<long long>(::time(nullptr)));
        writeText(fd, ", pid ");
        writeNumber(fd, static_cast<long long>(::getpid()));
        writeText(fd, "\n");

        void* frames[64];
        const int depth = backtrace(frames, 64);
        backtrace_symbols_fd(frames, depth, fd);
        writeText(fd, "\n");
        ::close(fd);
    }
    writeText(STDERR_FILENO, "echotrail: crashed, report written to ");
    writeText(STDERR_FILENO, s_crashLog);
    writeText(STDERR_FILENO, "\n");
    errno = savedErrno;

    // SA_RESETHAND restored the default action
    ::raise(sig);
}

void onInterrupt(int sig)
{
    if (s_interrupts++ > 0 || !s_token)
        ::_exit(128 + sig);

    writeText(STDERR_FILENO, "\nechotrail: ");
    writeText(STDERR_FILENO, signalName(sig));
    writeText(STDERR_FILENO, " received, finishing current work (repeat to quit)\n");
    s_token->cancel();
}

void route(const SignalSpec& spec, void (*handler)(int), int flags)
{
    struct sigaction sa;
    memset(&sa, 0, sizeof(sa));
    sa.sa_handler = handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = flags;
    if (sigaction(spec.number, &sa, nullptr) != 0)
        qWarning() << "[Signals] Cannot route" << spec.name << ":" << strerror(errno);
}

} // namespace

void SignalHandlers::install(const QString& crashDir, CancelToken* token)
{
    if (!QDir().mkpath(crashDir))
        qWarning() << "[Signals] Cannot create crash log directory" << crashDir;
    const QByteArray path = QFile::encodeName(QDir(crashDir).filePath(QStringLiteral("crash.log")));
    strncpy(s_crashLog, path.constData(), sizeof(s_crashLog) - 1);
    s_crashLog[sizeof(s_crashLog) - 1] = '\0';

    s_token = token;
    s_interrupts = 0;

    for (const SignalSpec& spec : kSignals) {
        if (spec.disposition == Disposition::Fatal)
            route(spec, onFatal, SA_RESETHAND);
        else
            route(spec, onInterrupt, SA_RESTART);
    }
    qDebug() << "[Signals] Crash reports go to" << crashLogPath();
}

void SignalHandlers::uninstall()
{
    for (const SignalSpec& spec : kSignals)
        route(spec, SIG_DFL, 0);
    s_token = nullptr;
    s_interrupts = 0;
}

QString SignalHandlers::crashLogPath()
{
    return QFile::decodeName(s_crashLog);
}

int SignalHandlers::interruptCount()
{
    return s_interrupts;
}
