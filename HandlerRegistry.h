#pragma once

#include "DiscoveryEngine.h"
#include "TvHandler.h"

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

// Owns the single active TV session and exposes one control surface for
// every registered brand. Handlers are not owned and must outlive the registry.
class HandlerRegistry
{
public:
    HandlerRegistry(IDiscoveryNetwork& network, DiscoveryOptions discoveryOptions);
    ~HandlerRegistry();

    HandlerRegistry(const HandlerRegistry&) = delete;
    HandlerRegistry& operator=(const HandlerRegistry&) = delete;

    // Returns false and keeps the first handler when the brand is already registered.
    bool Register(ITvHandler& handler);

    std::vector<ITvHandler*> GetRegisteredHandlers() const;
    ITvHandler* GetHandlerByBrand(TvBrand brand) const;
    ITvHandler* GetHandler(const TvDevice& device) const;

    // Discovers candidates and identifies each against the handlers in
    // registration order. Sorted by name, then IP.
    std::vector<TvDevice> DiscoverAll();

    bool Connect(const TvDevice& device, std::string& errorMessage);
    void Disconnect();
    bool IsConnected() const;
    bool GetActiveDevice(TvDevice& device) const;

    bool SendKey(StandardRemoteKey key);
    bool SendRawKey(const std::string& keyCode);
    bool LaunchApp(const std::string& appId);

    std::vector<StandardRemoteKey> GetSupportedKeys() const;
    std::vector<RemoteKeyGroup> GetSupportedKeyGroups() const;

    Unsubscribe OnConnectionStateChange(ConnectionListener listener);

    // First IP reported by a handler, in registration order.
    bool GetLastConnectedIp(std::string& ip) const;

private:
    ITvHandler* GetActiveHandler() const;
    void ForwardEvent(ITvHandler* handler, std::uint64_t generation, const ConnectionEvent& event);

    // Clears the active state if it still belongs to generation. When the
    // handler's events were not flushed, its subscription stays open until
    // the closing event is forwarded.
    void ReleaseActive(std::uint64_t generation, bool eventsFlushed);

    void StopDraining();

    IDiscoveryNetwork& network;
    DiscoveryOptions discoveryOptions;

    mutable std::mutex mutex;
    std::vector<ITvHandler*> handlers;
    std::map<TvBrand, ITvHandler*> handlersByBrand;

    ITvHandler* activeHandler;
    bool hasActiveDevice;
    TvDevice activeDevice;
    Unsubscribe activeUnsubscribe;
    std::uint64_t activeGeneration;

    // Released session whose Disconnected or Error event is still queued.
    ITvHandler* drainingHandler;
    std::uint64_t drainingGeneration;
    Unsubscribe drainingUnsubscribe;

    std::map<size_t, ConnectionListener> listeners;
    size_t nextListenerId;
};
