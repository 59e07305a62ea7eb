#ifndef BOUNDED_CHANNEL_HPP
#define BOUNDED_CHANNEL_HPP

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <utility>

// Multi-producer multi-consumer FIFO. A capacity of 0 means unbounded.
// close() lets consumers drain what is queued; cancel() drops it.
template <typename T>
class BoundedChannel
{
private:
    mutable std::mutex mutex;
    std::condition_variable not_empty;
    std::condition_variable not_full;
    std::deque<T> items;
    std::size_t capacity;
    bool closed;

public:
    explicit BoundedChannel(std::size_t max_items = 0) : capacity(max_items), closed(false) {}

    BoundedChannel(const BoundedChannel &) = delete;
    BoundedChannel &operator=(const BoundedChannel &) = delete;

    // Blocks while full. Returns false if the channel was closed.
    bool push(T item)
    {
        std::unique_lock<std::mutex> lock(mutex);
        not_full.wait(lock, [this]()
                      { return closed || capacity == 0 || items.size() < capacity; });
        if (closed)
        {
            return false;
        }
        items.push_back(std::move(item));
        lock.unlock();
        not_empty.notify_one();
        return true;
    }

    // Blocks while empty and open. Returns false once closed and drained.
    bool pop(T &item)
    {
        std::unique_lock<std::mutex> lock(mutex);
        not_empty.wait(lock, [this]()
                       { return closed || !items.empty(); });
        if (items.empty())
        {
            return false;
        }
        item = std::move(items.front());
        items.pop_front();
        lock.unlock();
        not_full.notify_one();
        return true;
    }

    void close()
    {
        {
            std::lock_guard<std::mutex> lock(mutex);
            closed = true;
        }
        not_empty.notify_all();
        not_full.notify_all();
    }

    void cancel()
    {
        {
            std::lock_guard<std::mutex> lock(mutex);
            closed = true;
            items.clear();
        }
        not_empty.notify_all();
        not_full.notify_all();
    }

    bool isClosed() const
    {
        std::lock_guard<std::mutex> lock(mutex);
        return closed;
    }

    std::size_t size() const
    {
        std::lock_guard<std::mutex> lock(mutex);
        return items.size();
    }
};

#endif // BOUNDED_CHANNEL_HPP
