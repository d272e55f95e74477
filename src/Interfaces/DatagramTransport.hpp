//----------------------------------------------------------------------------------------------------------------------
// File: DatagramTransport.hpp
// Description: Defines an interface for the connectionless transport used to exchange announcements and events.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

class IMessageSink;

namespace Network { class Address; }

//----------------------------------------------------------------------------------------------------------------------

class IDatagramTransport
{
public:
    virtual ~IDatagramTransport() = default;

    // Note: The binding and group must be provided before the transport is started.
    [[nodiscard]] virtual bool Bind(Network::Address const& binding) = 0;
    [[nodiscard]] virtual bool JoinMulticastGroup(Network::Address const& group) = 0;
    virtual void Register(IMessageSink* const pMessageSink) = 0;

    [[nodiscard]] virtual bool Send(std::string_view buffer, Network::Address const& destination) = 0;

    [[nodiscard]] virtual bool Startup() = 0;
    virtual void Shutdown() = 0;
    [[nodiscard]] virtual bool IsActive() const = 0;
};

//----------------------------------------------------------------------------------------------------------------------
