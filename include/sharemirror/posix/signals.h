#ifndef SHAREMIRROR_POSIX_SIGNALS_H
#define SHAREMIRROR_POSIX_SIGNALS_H 1

#include <atomic>
#include <thread>

#include <signal.h>

namespace sharemirror
{

class Mirror;

// Cancels a mirror on SIGINT or SIGTERM.
//
// The signals are blocked in the constructing thread, and in any thread it
// starts afterwards, and collected by a dedicated thread so that
// cancellation can take locks safely. The watcher must be stopped before
// the mirror it cancels is destroyed.
class SignalWatcher
{
    Mirror& mMirror;

    sigset_t mSignals;

    std::atomic<bool> mStopping;

    std::thread mThread;

    void watch();

public:
    explicit SignalWatcher(Mirror& mirror);

    SignalWatcher(const SignalWatcher& other) = delete;

    ~SignalWatcher();

    SignalWatcher& operator=(const SignalWatcher& rhs) = delete;

    // Whether signals are being watched.
    bool watching() const
    {
        return mThread.joinable();
    }

    // Stop watching and wait for the watcher thread to exit.
    void stop();
}; // SignalWatcher

} // sharemirror

#endif
