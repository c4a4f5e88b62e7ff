#pragma once

#include "Settings.h"

namespace Logging {

// Installs the process-wide Qt message handler: "[HH:mm:ss.zzz] L message"
// to stderr and, when configured, appended to the log file. Debug output
// is dropped unless verbose.
void install(const LoggingSettings& config);

// Restores Qt's default handler and closes the log file
void shutdown();

} // namespace Logging
