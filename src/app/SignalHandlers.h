#pragma once

#include <QString>

class CancelToken;

// Process-wide signal wiring for the CLI.
//
// Fatal signals (SIGSEGV, SIGABRT, SIGFPE, SIGBUS, SIGILL) append a short
// report and a backtrace to <crashDir>/crash.log, then re-raise with the
// default action. SIGINT and SIGTERM cancel the token; a second one exits
// with 128 + signal.
class SignalHandlers {
public:
    static void install(const QString& crashDir, CancelToken* token);
    static void uninstall();

    static QString crashLogPath();
    static int interruptCount();
};
