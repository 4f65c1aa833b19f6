#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <utility>

namespace umelink
{

/**
 * A value with change notification that always retains the last value.
 *
 * A new observer is called once with the current value, then with every change. Observers run on
 * the thread that sets the value, while the owner's lock is held: don't call back into the owner
 * from an observer, post to the io_context instead.
 *
 * Notifications are serialized with the first call made by subscribe(), so an observer never sees
 * an older value after a newer one.
 */
template <typename T>
class ObservableState
{
public:
    using Observer   = std::function<void(const T&)>;
    using ObserverId = std::uint64_t;

    explicit ObservableState(T initial) : _value(std::move(initial)) { }

    ObservableState(const ObservableState&)            = delete;
    ObservableState& operator=(const ObservableState&) = delete;

    T get() const
    {
        std::lock_guard<std::mutex> lock(_mutex);
        return _value;
    }

    /// Store a new value and notify observers. Setting the current value again notifies nobody.
    void set(const T& value)
    {
        std::lock_guard<std::recursive_mutex> notifying(_notify_mutex);
        std::map<ObserverId, Observer> observers;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            if (_value == value)
            {
                return;
            }
            _value    = value;
            observers = _observers;
        }
        _changed.notify_all();

        for (auto& entry : observers)
        {
            entry.second(value);
        }
    }

    ObserverId subscribe(Observer observer)
    {
        std::lock_guard<std::recursive_mutex> notifying(_notify_mutex);
        std::unique_lock<std::mutex> lock(_mutex);
        const ObserverId id = ++_last_id;
        _observers[id]      = observer;
        T current           = _value;
        lock.unlock();

        observer(current);
        return id;
    }

    void unsubscribe(ObserverId id)
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _observers.erase(id);
    }

    /// Block until the value equals @p expected or the timeout passes. Returns whether it matched.
    template <typename Rep, typename Period>
    bool wait_for(const T& expected, std::chrono::duration<Rep, Period> timeout) const
    {
        std::unique_lock<std::mutex> lock(_mutex);
        return _changed.wait_for(lock, timeout, [this, &expected]() { return _value == expected; });
    }

private:
    mutable std::mutex _mutex;
    // Held while observers are called; recursive so an observer may set or subscribe.
    std::recursive_mutex _notify_mutex;
    mutable std::condition_variable _changed;
    T _value;
    std::map<ObserverId, Observer> _observers;
    ObserverId _last_id = 0;
};

} // namespace umelink
