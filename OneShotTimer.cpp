#include "OneShotTimer.h"

#include "Logging.h"

#include <chrono>
#include <exception>
#include <utility>

OneShotTimer::OneShotTimer()
    : cancelled(false),
    fired(false)
{
}

OneShotTimer::~OneShotTimer()
{
    Cancel();

    // Destroyed from inside its own callback.
    if (worker.joinable())
    {
        worker.detach();
    }
}

void OneShotTimer::Start(int delayMs, std::function<void()> callback)
{
    Cancel();

    std::lock_guard<std::mutex> lock(mutex);
    if (worker.joinable())
    {
        // Re-armed from inside the callback.
        worker.detach();
    }
    cancelled = false;
    fired = false;
    worker = std::thread(&OneShotTimer::Run, this, delayMs, std::move(callback));
}

void OneShotTimer::Cancel()
{
    std::thread finished;
    {
        std::lock_guard<std::mutex> lock(mutex);
        cancelled = true;
        if (worker.joinable() && worker.get_id() != std::this_thread::get_id())
        {
            finished = std::move(worker);
        }
    }
    wake.notify_all();

    if (finished.joinable())
    {
        finished.join();
    }
}

bool OneShotTimer::HasFired() const
{
    std::lock_guard<std::mutex> lock(mutex);
    return fired;
}

void OneShotTimer::Run(int delayMs, std::function<void()> callback)
{
    {
        std::unique_lock<std::mutex> lock(mutex);
        bool stopped = wake.wait_for(
            lock,
            std::chrono::milliseconds(delayMs),
            [this]() { return cancelled; });
        if (stopped || fired)
        {
            return;
        }
        fired = true;
    }

    try
    {
        callback();
    }
    catch (const std::exception& exception)
    {
        ErrorLog(L"[Timer] Callback threw: %hs", exception.what());
    }
}
