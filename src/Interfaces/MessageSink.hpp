//----------------------------------------------------------------------------------------------------------------------
// File: MessageSink.hpp
// Description: Defines an interface that allows the transport to forward received datagrams for processing.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

namespace Network { class Address; }

//----------------------------------------------------------------------------------------------------------------------

class IMessageSink
{
public:
    virtual ~IMessageSink() = default;

    // Note: The buffer is only valid for the duration of the call. Returns false if the datagram was dropped.
    virtual bool CollectMessage(Network::Address const& origin, std::string_view buffer) = 0;
};

//----------------------------------------------------------------------------------------------------------------------
