#pragma once

#include <map>
#include <mutex>
#include <string>

// Persistence for pairing tokens keyed by TV IP and the last connected IP.
class ITokenStore
{
public:
    virtual ~ITokenStore() = default;

    virtual bool GetToken(const std::string& ip, std::string& token) const = 0;
    virtual void SaveToken(const std::string& ip, const std::string& token) = 0;
    virtual void ClearToken(const std::string& ip) = 0;

    virtual bool GetLastConnectedIp(std::string& ip) const = 0;
    virtual void SetLastConnectedIp(const std::string& ip) = 0;
};

// Token store backed by a key=value text file, rewritten on every change.
class FileTokenStore : public ITokenStore
{
public:
    explicit FileTokenStore(std::wstring path);

    bool GetToken(const std::string& ip, std::string& token) const override;
    void SaveToken(const std::string& ip, const std::string& token) override;
    void ClearToken(const std::string& ip) override;

    bool GetLastConnectedIp(std::string& ip) const override;
    void SetLastConnectedIp(const std::string& ip) override;

private:
    void Load();
    void Persist() const;

    std::wstring path;
    mutable std::mutex mutex;
    std::map<std::string, std::string> tokens;
    std::string lastConnectedIp;
};
