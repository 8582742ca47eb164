#include "HandlerRegistry.h"

#include "Logging.h"

#include <algorithm>
#include <atomic>
#include <exception>
#include <system_error>
#include <thread>
#include <utility>

namespace
{
    constexpr size_t MaxConcurrentIdentifications = 8;
    constexpr int EventFlushTimeoutMs = 2000;

    // A throwing handler counts as no match.
    bool IdentifyQuietly(ITvHandler& handler, const DiscoveryCandidate& candidate, TvDevice& device)
    {
        try
        {
            return handler.Identify(candidate.ip, candidate.ssdpResponse, device);
        }
        catch (const std::exception& exception)
        {
            WarningLog(
                L"[Registry] %hs identify %hs threw: %hs",
                handler.DisplayName(),
                candidate.ip.c_str(),
                exception.what());
            return false;
        }
    }
}

HandlerRegistry::HandlerRegistry(IDiscoveryNetwork& networkValue, DiscoveryOptions discoveryOptionsValue)
    : network(networkValue),
    discoveryOptions(discoveryOptionsValue),
    activeHandler(nullptr),
    hasActiveDevice(false),
    activeGeneration(0),
    drainingHandler(nullptr),
    drainingGeneration(0),
    nextListenerId(1)
{
}

HandlerRegistry::~HandlerRegistry()
{
    Disconnect();
    StopDraining();
}

bool HandlerRegistry::Register(ITvHandler& handler)
{
    std::lock_guard<std::mutex> lock(mutex);
    if (handlersByBrand.count(handler.Brand()) != 0)
    {
        WarningLog(L"[Registry] Handler for %hs already registered, skipping", ToString(handler.Brand()));
        return false;
    }

    handlers.push_back(&handler);
    handlersByBrand[handler.Brand()] = &handler;
    DebugLog(L"[Registry] Registered %hs", handler.DisplayName());
    return true;
}

std::vector<ITvHandler*> HandlerRegistry::GetRegisteredHandlers() const
{
    std::lock_guard<std::mutex> lock(mutex);
    return handlers;
}

ITvHandler* HandlerRegistry::GetHandlerByBrand(TvBrand brand) const
{
    std::lock_guard<std::mutex> lock(mutex);
    auto found = handlersByBrand.find(brand);
    return found == handlersByBrand.end() ? nullptr : found->second;
}

ITvHandler* HandlerRegistry::GetHandler(const TvDevice& device) const
{
    return GetHandlerByBrand(device.brand);
}

std::vector<TvDevice> HandlerRegistry::DiscoverAll()
{
    InfoLog(L"[Registry] Starting discovery");

    DiscoveryEngine engine(network, discoveryOptions);
    std::vector<DiscoveryCandidate> candidates = engine.Discover();
    std::vector<ITvHandler*> registered = GetRegisteredHandlers();

    std::mutex devicesMutex;
    std::vector<TvDevice> devices;
    std::atomic<size_t> nextCandidate(0);

    auto identifyWorker = [&]()
    {
        for (;;)
        {
            size_t index = nextCandidate.fetch_add(1);
            if (index >= candidates.size())
            {
                return;
            }

            const DiscoveryCandidate& candidate = candidates[index];
            for (ITvHandler* handler : registered)
            {
                TvDevice device;
                if (!IdentifyQuietly(*handler, candidate, device))
                {
                    continue;
                }

                if (device.ssdpResponse.empty())
                {
                    device.ssdpResponse = candidate.ssdpResponse;
                }

                std::lock_guard<std::mutex> lock(devicesMutex);
                devices.push_back(std::move(device));
                break;
            }
        }
    };

    size_t workerCount = std::min(candidates.size(), MaxConcurrentIdentifications);
    std::vector<std::thread> workers;
    workers.reserve(workerCount);
    for (size_t index = 0; index < workerCount; ++index)
    {
        try
        {
            workers.emplace_back(identifyWorker);
        }
        catch (const std::system_error& error)
        {
            WarningLog(L"[Registry] Started %zu of %zu identify workers: %hs", index, workerCount, error.what());
            break;
        }
    }

    for (std::thread& worker : workers)
    {
        worker.join();
    }

    std::sort(
        devices.begin(),
        devices.end(),
        [](const TvDevice& left, const TvDevice& right)
        {
            if (left.name != right.name)
            {
                return left.name < right.name;
            }
            return IpAddressLess(left.ip, right.ip);
        });

    InfoLog(L"[Registry] Discovery identified %zu TV(s) from %zu candidate(s)", devices.size(), candidates.size());
    return devices;
}

bool HandlerRegistry::Connect(const TvDevice& device, std::string& errorMessage)
{
    ITvHandler* handler = GetHandler(device);
    if (!handler)
    {
        errorMessage = std::string("No handler available for brand: ") + ToString(device.brand);
        WarningLog(L"[Registry] %hs", errorMessage.c_str());
        return false;
    }

    StopDraining();

    ITvHandler* previous = nullptr;
    Unsubscribe previousUnsubscribe;
    std::uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(mutex);
        previous = activeHandler;
        previousUnsubscribe = std::move(activeUnsubscribe);
        activeUnsubscribe = nullptr;
        activeHandler = nullptr;
        hasActiveDevice = false;
        generation = ++activeGeneration;
    }

    // The previous session goes away without notifying registry listeners.
    if (previousUnsubscribe)
    {
        previousUnsubscribe();
    }
    if (previous)
    {
        DebugLog(L"[Registry] Replacing active %hs session", previous->DisplayName());
        previous->Disconnect();
        previous->WaitForEvents(EventFlushTimeoutMs);
    }

    {
        std::lock_guard<std::mutex> lock(mutex);
        if (activeGeneration != generation)
        {
            errorMessage = "Connection superseded";
            return false;
        }
        activeHandler = handler;
        activeDevice = device;
        hasActiveDevice = true;
    }

    Unsubscribe unsubscribe = handler->OnConnectionStateChange(
        [this, handler, generation](const ConnectionEvent& event)
        {
            ForwardEvent(handler, generation, event);
        });

    bool superseded = false;
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (activeGeneration == generation)
        {
            activeUnsubscribe = unsubscribe;
        }
        else
        {
            superseded = true;
        }
    }
    if (superseded)
    {
        unsubscribe();
        errorMessage = "Connection superseded";
        return false;
    }

    InfoLog(L"[Registry] Connecting to %hs via %hs", device.ip.c_str(), handler->DisplayName());
    if (!handler->Connect(device, errorMessage))
    {
        bool flushed = handler->WaitForEvents(EventFlushTimeoutMs);
        ReleaseActive(generation, flushed);
        return false;
    }
    return true;
}

void HandlerRegistry::Disconnect()
{
    ITvHandler* handler = nullptr;
    std::uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(mutex);
        handler = activeHandler;
        generation = activeGeneration;
    }

    if (!handler)
    {
        return;
    }

    handler->Disconnect();
    bool flushed = handler->WaitForEvents(EventFlushTimeoutMs);
    ReleaseActive(generation, flushed);
}

bool HandlerRegistry::IsConnected() const
{
    ITvHandler* handler = GetActiveHandler();
    return handler != nullptr && handler->IsConnected();
}

bool HandlerRegistry::GetActiveDevice(TvDevice& device) const
{
    std::lock_guard<std::mutex> lock(mutex);
    if (!hasActiveDevice)
    {
        return false;
    }
    device = activeDevice;
    return true;
}

bool HandlerRegistry::SendKey(StandardRemoteKey key)
{
    ITvHandler* handler = GetActiveHandler();
    if (!handler)
    {
        return false;
    }
    return handler->SendKey(key);
}

bool HandlerRegistry::SendRawKey(const std::string& keyCode)
{
    ITvHandler* handler = GetActiveHandler();
    if (!handler || !handler->Supports(Capability::RawKey))
    {
        return false;
    }
    return handler->SendRawKey(keyCode);
}

bool HandlerRegistry::LaunchApp(const std::string& appId)
{
    ITvHandler* handler = GetActiveHandler();
    if (!handler || !handler->Supports(Capability::AppLaunch))
    {
        return false;
    }
    return handler->LaunchApp(appId);
}

std::vector<StandardRemoteKey> HandlerRegistry::GetSupportedKeys() const
{
    ITvHandler* handler = GetActiveHandler();
    return handler ? handler->GetSupportedKeys() : std::vector<StandardRemoteKey>();
}

std::vector<RemoteKeyGroup> HandlerRegistry::GetSupportedKeyGroups() const
{
    ITvHandler* handler = GetActiveHandler();
    return handler ? handler->GetSupportedKeyGroups() : std::vector<RemoteKeyGroup>();
}

Unsubscribe HandlerRegistry::OnConnectionStateChange(ConnectionListener listener)
{
    size_t id = 0;
    {
        std::lock_guard<std::mutex> lock(mutex);
        id = nextListenerId++;
        listeners.emplace(id, std::move(listener));
    }

    return [this, id]()
    {
        std::lock_guard<std::mutex> lock(mutex);
        listeners.erase(id);
    };
}

bool HandlerRegistry::GetLastConnectedIp(std::string& ip) const
{
    for (ITvHandler* handler : GetRegisteredHandlers())
    {
        std::string candidate;
        if (handler->GetLastConnectedIp(candidate) && !candidate.empty())
        {
            ip = candidate;
            return true;
        }
    }
    return false;
}

ITvHandler* HandlerRegistry::GetActiveHandler() const
{
    std::lock_guard<std::mutex> lock(mutex);
    return activeHandler;
}

void HandlerRegistry::ForwardEvent(ITvHandler* handler, std::uint64_t generation, const ConnectionEvent& event)
{
    std::vector<ConnectionListener> snapshot;
    Unsubscribe released;
    {
        std::lock_guard<std::mutex> lock(mutex);
        bool active = generation == activeGeneration && handler == activeHandler;
        bool draining = generation == drainingGeneration && handler == drainingHandler;
        if (!active && !draining)
        {
            DebugLog(L"[Registry] Dropped stale %hs event", ToString(event.state));
            return;
        }

        snapshot.reserve(listeners.size());
        for (const auto& entry : listeners)
        {
            snapshot.push_back(entry.second);
        }

        if (active && event.state == ConnectionState::Disconnected)
        {
            activeHandler = nullptr;
            hasActiveDevice = false;
            released = std::move(activeUnsubscribe);
            activeUnsubscribe = nullptr;
        }
        else if (draining
            && (event.state == ConnectionState::Disconnected || event.state == ConnectionState::Error))
        {
            drainingHandler = nullptr;
            drainingGeneration = 0;
            released = std::move(drainingUnsubscribe);
            drainingUnsubscribe = nullptr;
        }
    }

    for (const ConnectionListener& listener : snapshot)
    {
        try
        {
            listener(event);
        }
        catch (const std::exception& exception)
        {
            ErrorLog(L"[Registry] Connection listener threw: %hs", exception.what());
        }
    }

    if (released)
    {
        released();
    }
}

void HandlerRegistry::ReleaseActive(std::uint64_t generation, bool eventsFlushed)
{
    Unsubscribe released;
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (generation != activeGeneration)
        {
            return;
        }

        if (eventsFlushed || !activeUnsubscribe)
        {
            released = std::move(activeUnsubscribe);
        }
        else
        {
            // Called from inside a listener: the closing event is still queued.
            released = std::move(drainingUnsubscribe);
            drainingHandler = activeHandler;
            drainingGeneration = generation;
            drainingUnsubscribe = std::move(activeUnsubscribe);
        }
        activeHandler = nullptr;
        hasActiveDevice = false;
        activeUnsubscribe = nullptr;
        ++activeGeneration;
    }

    if (released)
    {
        released();
    }
}

void HandlerRegistry::StopDraining()
{
    Unsubscribe released;
    {
        std::lock_guard<std::mutex> lock(mutex);
        released = std::move(drainingUnsubscribe);
        drainingUnsubscribe = nullptr;
        drainingHandler = nullptr;
        drainingGeneration = 0;
    }

    if (released)
    {
        released();
    }
}
