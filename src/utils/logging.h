/**
 * @file logging.h
 * @brief Verbose diagnostics for transport commands and transfer workers.
 *
 * Warnings and errors always go through qWarning()/qCritical(). LOG_VERBOSE()
 * adds the per-command ssh/scp argument lists, worker start and finish, and
 * queue promotions; it is safe to use from worker threads.
 */

#ifndef LOGGING_H
#define LOGGING_H

#include <QDebug>

namespace twinscp {

/// Set once by main() from -V/--verbose before any worker thread starts
inline bool verboseLogging = false;

} // namespace twinscp

#define LOG_VERBOSE() if (twinscp::verboseLogging) qDebug()

#endif // LOGGING_H
