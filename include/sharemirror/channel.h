#ifndef SHAREMIRROR_CHANNEL_H
#define SHAREMIRROR_CHANNEL_H 1

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <utility>

namespace sharemirror
{

// Bounded multi-producer multi-consumer queue.
template<typename T>
class Channel
{
    // Signalled when an item is added or the channel is closed.
    std::condition_variable mNotEmpty;

    // Signalled when an item is removed or the channel is closed.
    std::condition_variable mNotFull;

    // How many items may be waiting at once.
    std::size_t mCapacity;

    // Set once no more items will be added.
    bool mClosed;

    // Items waiting to be consumed.
    std::deque<T> mItems;

    // Serializes access to our state.
    std::mutex mLock;

public:
    explicit Channel(std::size_t capacity)
      : mNotEmpty()
      , mNotFull()
      , mCapacity(capacity ? capacity : 1)
      , mClosed(false)
      , mItems()
      , mLock()
    {
    }

    Channel(const Channel& other) = delete;

    Channel& operator=(const Channel& rhs) = delete;

    // Prevent further pushes and wake everyone up.
    //
    // Items already queued can still be popped.
    void close()
    {
        std::lock_guard<std::mutex> guard(mLock);

        mClosed = true;

        mNotEmpty.notify_all();
        mNotFull.notify_all();
    }

    // Wait for an item. Returns false once closed and drained.
    bool pop(T& item)
    {
        std::unique_lock<std::mutex> lock(mLock);

        mNotEmpty.wait(lock, [&]() { return mClosed || !mItems.empty(); });

        if (mItems.empty())
            return false;

        item = std::move(mItems.front());
        mItems.pop_front();

        mNotFull.notify_one();

        return true;
    }

    // Wait for room and add an item. Returns false if the channel's closed.
    bool push(T item)
    {
        std::unique_lock<std::mutex> lock(mLock);

        mNotFull.wait(lock, [&]() { return mClosed || mItems.size() < mCapacity; });

        if (mClosed)
            return false;

        mItems.emplace_back(std::move(item));

        mNotEmpty.notify_one();

        return true;
    }
}; // Channel<T>

} // sharemirror

#endif
