//----------------------------------------------------------------------------------------------------------------------
// File: Protocol.hpp
// Description: Defines an enum describing the types of network protocols available to the transport.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <string>
#include <unordered_map>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Network {
//----------------------------------------------------------------------------------------------------------------------

enum class Protocol : std::uint32_t { UDP4, UDP6, Invalid };

static std::unordered_map<std::string, Protocol> const ProtocolStringTranslations = {
    { "udp4", Protocol::UDP4 },
    { "udp6", Protocol::UDP6 },
};

static std::unordered_map<Protocol, std::string> const ProtocolEnumTranslations = {
    { Protocol::UDP4, "udp4" },
    { Protocol::UDP6, "udp6" },
};

[[nodiscard]] Protocol ParseProtocol(std::string name);
[[nodiscard]] std::string ProtocolToString(Protocol protocol);

//----------------------------------------------------------------------------------------------------------------------
} // Network namespace
//----------------------------------------------------------------------------------------------------------------------

inline Network::Protocol Network::ParseProtocol(std::string name)
{
    std::ranges::transform(name, name.begin(), [] (char c) {
        return static_cast<char>(std::tolower(static_cast<std::int32_t>(c)));
    });

    if (auto const itr = ProtocolStringTranslations.find(name); itr != ProtocolStringTranslations.end()) {
        return itr->second;
    }

    return Protocol::Invalid;
}

//----------------------------------------------------------------------------------------------------------------------

inline std::string Network::ProtocolToString(Protocol protocol)
{
    if (auto const itr = ProtocolEnumTranslations.find(protocol); itr != ProtocolEnumTranslations.end()) {
        return itr->second;
    }
    return {};
}

//----------------------------------------------------------------------------------------------------------------------
