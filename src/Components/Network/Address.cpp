//----------------------------------------------------------------------------------------------------------------------
// File: Address.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Address.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/asio/ip/address.hpp>
#include <boost/lexical_cast.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <limits>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] std::optional<boost::asio::ip::address> MakeAddress(std::string_view ip);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
// Network::Address {
//----------------------------------------------------------------------------------------------------------------------

Network::Address::Address()
    : m_ip()
    , m_port(0)
    , m_type(Socket::Type::Invalid)
{
}

//----------------------------------------------------------------------------------------------------------------------

Network::Address::Address(std::string_view ip, std::uint16_t port)
    : m_ip()
    , m_port(port)
    , m_type(Socket::Type::Invalid)
{
    auto const optAddress = local::MakeAddress(ip);
    if (!optAddress || m_port == 0) { Reset(); return; }
    m_ip = optAddress->to_string(); // Store the canonical form such that equivalent addresses compare equal.
    m_type = optAddress->is_v4() ? Socket::Type::IPv4 : Socket::Type::IPv6;
}

//----------------------------------------------------------------------------------------------------------------------

Network::Address::Address(std::string_view authority)
    : Address()
{
    auto const boundary = authority.find_last_of(ComponentSeperator);
    if (boundary == std::string_view::npos || boundary == 0) { return; }

    auto ip = authority.substr(0, boundary);
    auto const port = authority.substr(boundary + ComponentSeperator.size());

    // IPv6 addresses must be wrapped with [..] to distinguish the address's colons from the port seperator.
    bool const isWrapped = ip.front() == '[' && ip.back() == ']';
    if (isWrapped) {
        ip = ip.substr(1, ip.size() - 2);
    } else if (ip.find(ComponentSeperator) != std::string_view::npos) {
        return;
    }

    auto const optPort = Socket::ParsePortNumber(port);
    if (!optPort) { return; }

    *this = Address{ ip, *optPort };
    if (isWrapped && m_type != Socket::Type::IPv6) { Reset(); }
}

//----------------------------------------------------------------------------------------------------------------------

std::strong_ordering Network::Address::operator<=>(Address const& other) const
{
    if (auto const result = m_ip <=> other.m_ip; result != std::strong_ordering::equal) { return result; }
    return m_port <=> other.m_port;
}

//----------------------------------------------------------------------------------------------------------------------

bool Network::Address::operator==(Address const& other) const
{
    return m_ip == other.m_ip && m_port == other.m_port;
}

//----------------------------------------------------------------------------------------------------------------------

std::string const& Network::Address::GetIPAddress() const { return m_ip; }

//----------------------------------------------------------------------------------------------------------------------

std::uint16_t Network::Address::GetPort() const { return m_port; }

//----------------------------------------------------------------------------------------------------------------------

Network::Socket::Type Network::Address::GetType() const { return m_type; }

//----------------------------------------------------------------------------------------------------------------------

std::string Network::Address::GetAuthority() const
{
    switch (m_type) {
        case Socket::Type::IPv4: return fmt::format("{}{}{}", m_ip, ComponentSeperator, m_port);
        case Socket::Type::IPv6: return fmt::format("[{}]{}{}", m_ip, ComponentSeperator, m_port);
        case Socket::Type::Invalid: break;
    }
    return {};
}

//----------------------------------------------------------------------------------------------------------------------

bool Network::Address::IsValid() const { return m_type != Socket::Type::Invalid; }

//----------------------------------------------------------------------------------------------------------------------

bool Network::Address::IsMulticast() const
{
    auto const optAddress = local::MakeAddress(m_ip);
    return optAddress && optAddress->is_multicast();
}

//----------------------------------------------------------------------------------------------------------------------

Network::Address Network::Address::WithPort(std::uint16_t port) const
{
    if (!IsValid()) { return {}; }
    return Address{ m_ip, port };
}

//----------------------------------------------------------------------------------------------------------------------

void Network::Address::Reset()
{
    m_ip.clear();
    m_port = 0;
    m_type = Socket::Type::Invalid;
}

//----------------------------------------------------------------------------------------------------------------------
// } Network::Address
//----------------------------------------------------------------------------------------------------------------------
// Network::Socket {
//----------------------------------------------------------------------------------------------------------------------

Network::Socket::Type Network::Socket::ParseAddressType(std::string_view ip)
{
    auto const optAddress = local::MakeAddress(ip);
    if (!optAddress) { return Type::Invalid; }
    return optAddress->is_v4() ? Type::IPv4 : Type::IPv6;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::uint16_t> Network::Socket::ParsePortNumber(std::string_view partition)
{
    if (partition.empty() || partition.front() == '-') { return {}; } // The cast would accept and wrap negatives.

    // Port Range Checks (Acceptable: 1 - 65535);
    constexpr std::uint16_t MinimumValue = 1;
    try {
        auto const port = boost::lexical_cast<std::uint16_t>(partition);
        if (port < MinimumValue) { return {}; }
        return port;
    } catch (boost::bad_lexical_cast const&) {
        return {};
    }
}

//----------------------------------------------------------------------------------------------------------------------
// } Network::Socket
//----------------------------------------------------------------------------------------------------------------------

std::optional<boost::asio::ip::address> local::MakeAddress(std::string_view ip)
{
    if (ip.empty()) { return {}; }
    boost::system::error_code error;
    auto const address = boost::asio::ip::make_address(std::string{ ip }, error);
    if (error) { return {}; }
    return address;
}

//----------------------------------------------------------------------------------------------------------------------
