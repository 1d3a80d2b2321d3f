#include <cstring>

#include <pthread.h>

#include <sharemirror/logging.h>
#include <sharemirror/mirror.h>
#include <sharemirror/posix/signals.h>

namespace sharemirror
{

SignalWatcher::SignalWatcher(Mirror& mirror)
  : mMirror(mirror)
  , mSignals()
  , mStopping(false)
  , mThread()
{
    sigemptyset(&mSignals);
    sigaddset(&mSignals, SIGINT);
    sigaddset(&mSignals, SIGTERM);

    if (auto result = pthread_sigmask(SIG_BLOCK, &mSignals, nullptr))
    {
        LOG_warn << "Unable to block signals: " << strerror(result);
        return;
    }

    mThread = std::thread(&SignalWatcher::watch, this);
}

SignalWatcher::~SignalWatcher()
{
    stop();
}

void SignalWatcher::watch()
{
    while (true)
    {
        int signal = 0;

        if (sigwait(&mSignals, &signal))
            return;

        // Woken up by stop().
        if (mStopping)
            return;

        LOG_warn << "Received signal " << signal << ", stopping";

        mMirror.cancel();
    }
}

void SignalWatcher::stop()
{
    if (!mThread.joinable())
        return;

    mStopping = true;

    // Fails only when the thread has already gone.
    if (auto result = pthread_kill(mThread.native_handle(), SIGTERM))
        LOG_debug << "Signal watcher already stopped: " << strerror(result);

    mThread.join();
}

} // sharemirror
