#include "TokenStore.h"

#include "Logging.h"

#include <fstream>
#include <utility>

namespace
{
    const char TokenKeyPrefix[] = "token.";
    const char LastConnectedIpKey[] = "last_connected_ip";

    void TrimLineEnd(std::string& value)
    {
        while (!value.empty() && (value.back() == '\r' || value.back() == '\n' || value.back() == ' '))
        {
            value.pop_back();
        }
    }
}

FileTokenStore::FileTokenStore(std::wstring pathValue)
    : path(std::move(pathValue)),
    tokens(),
    lastConnectedIp()
{
    Load();
}

bool FileTokenStore::GetToken(const std::string& ip, std::string& token) const
{
    std::lock_guard<std::mutex> lock(mutex);
    auto found = tokens.find(ip);
    if (found == tokens.end() || found->second.empty())
    {
        return false;
    }
    token = found->second;
    return true;
}

void FileTokenStore::SaveToken(const std::string& ip, const std::string& token)
{
    std::lock_guard<std::mutex> lock(mutex);
    tokens[ip] = token;
    Persist();
    DebugLog(L"[Tokens] Stored token for %hs (***hidden***)", ip.c_str());
}

void FileTokenStore::ClearToken(const std::string& ip)
{
    std::lock_guard<std::mutex> lock(mutex);
    if (tokens.erase(ip) == 0)
    {
        return;
    }
    Persist();
    DebugLog(L"[Tokens] Cleared token for %hs", ip.c_str());
}

bool FileTokenStore::GetLastConnectedIp(std::string& ip) const
{
    std::lock_guard<std::mutex> lock(mutex);
    if (lastConnectedIp.empty())
    {
        return false;
    }
    ip = lastConnectedIp;
    return true;
}

void FileTokenStore::SetLastConnectedIp(const std::string& ip)
{
    std::lock_guard<std::mutex> lock(mutex);
    lastConnectedIp = ip;
    Persist();
}

void FileTokenStore::Load()
{
    std::ifstream input(path);
    if (!input)
    {
        return;
    }

    std::string line;
    while (std::getline(input, line))
    {
        TrimLineEnd(line);
        auto separator = line.find('=');
        if (separator == std::string::npos)
        {
            continue;
        }

        std::string key = line.substr(0, separator);
        std::string value = line.substr(separator + 1);

        if (key == LastConnectedIpKey)
        {
            lastConnectedIp = value;
        }
        else if (key.compare(0, sizeof(TokenKeyPrefix) - 1, TokenKeyPrefix) == 0)
        {
            tokens[key.substr(sizeof(TokenKeyPrefix) - 1)] = value;
        }
    }
}

void FileTokenStore::Persist() const
{
    std::ofstream output(path, std::ios::trunc);
    if (!output)
    {
        ErrorLog(L"[Tokens] Failed to write token file");
        return;
    }

    if (!lastConnectedIp.empty())
    {
        output << LastConnectedIpKey << "=" << lastConnectedIp << "\n";
    }
    for (const auto& entry : tokens)
    {
        output << TokenKeyPrefix << entry.first << "=" << entry.second << "\n";
    }
}
