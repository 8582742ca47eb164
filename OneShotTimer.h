#pragma once

#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

// Runs a callback once after a delay unless cancelled first.
class OneShotTimer
{
public:
    OneShotTimer();
    ~OneShotTimer();

    OneShotTimer(const OneShotTimer&) = delete;
    OneShotTimer& operator=(const OneShotTimer&) = delete;

    // Arms the timer. A previously armed timer is cancelled first.
    void Start(int delayMs, std::function<void()> callback);

    // Prevents a pending callback from running. Safe to call repeatedly,
    // including from inside the callback.
    void Cancel();

    // True once the callback has started running.
    bool HasFired() const;

private:
    void Run(int delayMs, std::function<void()> callback);

    mutable std::mutex mutex;
    std::condition_variable wake;
    std::thread worker;
    bool cancelled;
    bool fired;
};
