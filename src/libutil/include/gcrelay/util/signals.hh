#pragma once
/**
 * @file
 *
 * User interruption. A dedicated thread receives SIGINT, SIGTERM and
 * SIGHUP, sets the interrupted flag and runs the registered interrupt
 * callbacks outside of signal context.
 */

#include "gcrelay/util/types.hh"
#include "gcrelay/util/error.hh"

#include <atomic>
#include <functional>
#include <memory>

#include <pthread.h>
#include <signal.h>

namespace gcrelay {

MakeError(Interrupted, BaseError);

namespace unix {

extern std::atomic<bool> _isInterrupted;

void _interrupted();

/**
 * Start a thread that handles SIGINT, SIGTERM, SIGHUP and SIGPIPE.
 * Also block those signals on the current thread (and thus any
 * threads created by it).
 */
void startSignalHandlerThread();

/**
 * Set the interrupted flag and run the interrupt callbacks, as if a
 * terminating signal had been received.
 */
void triggerInterrupt();

} // namespace unix

static inline void setInterrupted(bool isInterrupted)
{
    unix::_isInterrupted = isInterrupted;
}

static inline bool isInterrupted()
{
    return unix::_isInterrupted;
}

/**
 * Throw `Interrupted` if the interrupted flag is set.
 */
inline void checkInterrupt()
{
    if (unix::_isInterrupted)
        unix::_interrupted();
}

struct InterruptCallback
{
    virtual ~InterruptCallback() {};
};

/**
 * Register a function that gets called on SIGINT (in a non-signal
 * context). The registration lasts as long as the returned object.
 */
std::unique_ptr<InterruptCallback> createInterruptCallback(std::function<void()> callback);

} // namespace gcrelay
