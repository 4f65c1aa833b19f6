#pragma once

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace umelink
{

template <typename T>
class BroadcastChannel;

/**
 * One subscriber's view of a BroadcastChannel.
 *
 * Holds at most capacity() undelivered items. When a new item arrives at a full buffer the oldest
 * one is dropped and counted.
 */
template <typename T>
class Subscriber
{
public:
    explicit Subscriber(std::size_t capacity) : _capacity(std::max<std::size_t>(capacity, 1)) { }

    Subscriber(const Subscriber&)            = delete;
    Subscriber& operator=(const Subscriber&) = delete;

    std::optional<T> try_receive()
    {
        std::lock_guard<std::mutex> lock(_mutex);
        return pop();
    }

    /// Wait up to @p timeout for an item. Returns std::nullopt on timeout or once closed and drained.
    template <typename Rep, typename Period>
    std::optional<T> receive_for(std::chrono::duration<Rep, Period> timeout)
    {
        std::unique_lock<std::mutex> lock(_mutex);
        _available.wait_for(lock, timeout, [this]() { return !_items.empty() || _closed; });
        return pop();
    }

    /// Stop receiving. Items already buffered can still be taken.
    void close()
    {
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _closed = true;
        }
        _available.notify_all();
    }

    bool closed() const
    {
        std::lock_guard<std::mutex> lock(_mutex);
        return _closed;
    }

    std::size_t size() const
    {
        std::lock_guard<std::mutex> lock(_mutex);
        return _items.size();
    }

    std::size_t dropped() const
    {
        std::lock_guard<std::mutex> lock(_mutex);
        return _dropped;
    }

    std::size_t capacity() const { return _capacity; }

private:
    friend class BroadcastChannel<T>;

    bool deliver(const T& item)
    {
        {
            std::lock_guard<std::mutex> lock(_mutex);
            if (_closed)
            {
                return false;
            }
            if (_items.size() >= _capacity)
            {
                _items.pop_front();
                ++_dropped;
            }
            _items.push_back(item);
        }
        _available.notify_one();
        return true;
    }

    std::optional<T> pop()
    {
        if (_items.empty())
        {
            return std::nullopt;
        }
        T item = std::move(_items.front());
        _items.pop_front();
        return item;
    }

    mutable std::mutex _mutex;
    std::condition_variable _available;
    std::deque<T> _items;
    std::size_t _capacity;
    std::size_t _dropped = 0;
    bool _closed         = false;
};

/**
 * Publish-only multicast without replay: an item reaches the subscribers that exist when it's
 * published, nobody else. Subscribers are held weakly; dropping the last reference unsubscribes.
 */
template <typename T>
class BroadcastChannel
{
public:
    static constexpr std::size_t default_capacity = 32;

    BroadcastChannel() = default;

    BroadcastChannel(const BroadcastChannel&)            = delete;
    BroadcastChannel& operator=(const BroadcastChannel&) = delete;

    std::shared_ptr<Subscriber<T>> subscribe(std::size_t capacity = default_capacity)
    {
        auto subscriber = std::make_shared<Subscriber<T>>(capacity);
        std::lock_guard<std::mutex> lock(_mutex);
        _subscribers.push_back(subscriber);
        return subscriber;
    }

    /// @return the number of subscribers the item was handed to
    std::size_t publish(const T& item)
    {
        std::vector<std::shared_ptr<Subscriber<T>>> targets;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            prune();
            targets.reserve(_subscribers.size());
            for (auto& weak : _subscribers)
            {
                if (auto subscriber = weak.lock())
                {
                    targets.push_back(std::move(subscriber));
                }
            }
        }

        std::size_t delivered = 0;
        for (auto& subscriber : targets)
        {
            if (subscriber->deliver(item))
            {
                ++delivered;
            }
        }
        return delivered;
    }

    std::size_t subscriber_count()
    {
        std::lock_guard<std::mutex> lock(_mutex);
        prune();
        return _subscribers.size();
    }

private:
    void prune()
    {
        _subscribers.erase(std::remove_if(_subscribers.begin(), _subscribers.end(),
                                          [](const std::weak_ptr<Subscriber<T>>& weak)
                                          {
                                              auto subscriber = weak.lock();
                                              return !subscriber || subscriber->closed();
                                          }),
                           _subscribers.end());
    }

    std::mutex _mutex;
    std::vector<std::weak_ptr<Subscriber<T>>> _subscribers;
};

} // namespace umelink
