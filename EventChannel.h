#pragma once

#include "Logging.h"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

// Queue of events delivered to subscribers on a dedicated dispatch thread.
// Publishers never wait for subscribers to run.
template <typename T>
class EventChannel
{
public:
    using Subscriber = std::function<void(const T&)>;

    explicit EventChannel(std::string nameValue)
        : name(std::move(nameValue)),
        nextId(1),
        stopping(false),
        delivering(false)
    {
        worker = std::thread(&EventChannel::Dispatch, this);
    }

    ~EventChannel()
    {
        {
            std::lock_guard<std::mutex> lock(mutex);
            stopping = true;
        }
        changed.notify_all();

        if (worker.joinable())
        {
            if (worker.get_id() == std::this_thread::get_id())
            {
                worker.detach();
            }
            else
            {
                worker.join();
            }
        }
    }

    EventChannel(const EventChannel&) = delete;
    EventChannel& operator=(const EventChannel&) = delete;

    size_t Subscribe(Subscriber subscriber)
    {
        std::lock_guard<std::mutex> lock(mutex);
        size_t id = nextId++;
        subscribers.emplace(id, std::move(subscriber));
        return id;
    }

    void Unsubscribe(size_t id)
    {
        std::lock_guard<std::mutex> lock(mutex);
        subscribers.erase(id);
    }

    size_t SubscriberCount() const
    {
        std::lock_guard<std::mutex> lock(mutex);
        return subscribers.size();
    }

    void Publish(T value)
    {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (stopping)
            {
                return;
            }
            queue.push_back(std::move(value));
        }
        changed.notify_all();
    }

    // Waits until every published event has been delivered. Returns false at
    // once when called from a subscriber, since the channel cannot go idle
    // while that subscriber runs.
    bool WaitUntilIdle(int timeoutMs)
    {
        if (IsDispatchThread())
        {
            return false;
        }

        std::unique_lock<std::mutex> lock(mutex);
        return changed.wait_for(
            lock,
            std::chrono::milliseconds(timeoutMs),
            [this]() { return queue.empty() && !delivering; });
    }

    bool IsDispatchThread() const
    {
        return std::this_thread::get_id() == worker.get_id();
    }

private:
    void Dispatch()
    {
        std::unique_lock<std::mutex> lock(mutex);
        for (;;)
        {
            changed.wait(lock, [this]() { return stopping || !queue.empty(); });
            if (queue.empty())
            {
                return;
            }

            T value = std::move(queue.front());
            queue.pop_front();

            std::vector<Subscriber> snapshot;
            snapshot.reserve(subscribers.size());
            for (const auto& entry : subscribers)
            {
                snapshot.push_back(entry.second);
            }

            delivering = true;
            lock.unlock();

            for (const Subscriber& subscriber : snapshot)
            {
                try
                {
                    subscriber(value);
                }
                catch (const std::exception& exception)
                {
                    ErrorLog(L"[Events] %hs subscriber threw: %hs", name.c_str(), exception.what());
                }
            }

            lock.lock();
            delivering = false;
            changed.notify_all();
        }
    }

    std::string name;
    mutable std::mutex mutex;
    std::condition_variable changed;
    std::deque<T> queue;
    std::map<size_t, Subscriber> subscribers;
    size_t nextId;
    bool stopping;
    bool delivering;
    std::thread worker;
};
