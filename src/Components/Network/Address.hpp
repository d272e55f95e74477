//----------------------------------------------------------------------------------------------------------------------
// File: Address.hpp
// Description: A class to encapsulate an IP address and port pair (e.g. 192.168.1.7:44201 or [fe80::1]:44201).
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <fmt/format.h>
//----------------------------------------------------------------------------------------------------------------------
#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Network {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view ComponentSeperator = ":";
constexpr std::string_view Wildcard = "*";

class Address;
struct AddressHasher;

//----------------------------------------------------------------------------------------------------------------------
namespace Socket {
//----------------------------------------------------------------------------------------------------------------------

enum class Type : std::uint8_t { IPv4, IPv6, Invalid };

[[nodiscard]] Type ParseAddressType(std::string_view ip);
[[nodiscard]] std::optional<std::uint16_t> ParsePortNumber(std::string_view partition);

//----------------------------------------------------------------------------------------------------------------------
} // Socket namespace
} // Network namespace
//----------------------------------------------------------------------------------------------------------------------

class Network::Address
{
public:
    Address();
    Address(std::string_view ip, std::uint16_t port);

    // Note: Accepts the "ip:port" and "[ipv6]:port" forms. An unparsable authority produces an invalid address.
    explicit Address(std::string_view authority);

    [[nodiscard]] std::strong_ordering operator<=>(Address const& other) const;
    [[nodiscard]] bool operator==(Address const& other) const;

    [[nodiscard]] std::string const& GetIPAddress() const;
    [[nodiscard]] std::uint16_t GetPort() const;
    [[nodiscard]] Socket::Type GetType() const;
    [[nodiscard]] std::string GetAuthority() const;

    [[nodiscard]] bool IsValid() const;
    [[nodiscard]] bool IsMulticast() const;

    // Note: Returns an address sharing this address's ip with the provided port.
    [[nodiscard]] Address WithPort(std::uint16_t port) const;

private:
    void Reset();

    std::string m_ip;
    std::uint16_t m_port;
    Socket::Type m_type;
};

//----------------------------------------------------------------------------------------------------------------------

struct Network::AddressHasher
{
    std::size_t operator()(Address const& address) const
    {
        return std::hash<std::string>()(address.GetAuthority());
    }
};

//----------------------------------------------------------------------------------------------------------------------

template <>
struct fmt::formatter<Network::Address>
{
    constexpr auto parse(format_parse_context& ctx)
    {
        auto const begin = ctx.begin();
        if (begin != ctx.end() && *begin != '}') { throw format_error("invalid format"); }
        return begin;
    }

    template <typename FormatContext>
    auto format(Network::Address const& address, FormatContext& ctx) const
    {
        if (!address.IsValid()) { return fmt::format_to(ctx.out(), "[Unknown Address]"); }
        return fmt::format_to(ctx.out(), "{}", address.GetAuthority());
    }
};

//----------------------------------------------------------------------------------------------------------------------
