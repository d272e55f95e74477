//----------------------------------------------------------------------------------------------------------------------
// File: Dispatcher.hpp
// Description: Receives the datagrams collected by the transport, decodes them, and routes announcements to the
// registry and events to the local listeners.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Event/SharedPublisher.hpp"
#include "Interfaces/MessageSink.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <atomic>
#include <memory>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

namespace spdlog { class logger; }

//----------------------------------------------------------------------------------------------------------------------
namespace Service {
//----------------------------------------------------------------------------------------------------------------------

class Dispatcher;
class Registry;

//----------------------------------------------------------------------------------------------------------------------
} // Service namespace
//----------------------------------------------------------------------------------------------------------------------

class Service::Dispatcher final : public IMessageSink
{
public:
    Dispatcher(Event::SharedPublisher const& spEventPublisher, std::shared_ptr<Registry> const& spRegistry);

    // IMessageSink {
    virtual bool CollectMessage(Network::Address const& origin, std::string_view buffer) override;
    // } IMessageSink

    [[nodiscard]] std::size_t DroppedMessages() const;

private:
    std::shared_ptr<spdlog::logger> m_logger;
    Event::SharedPublisher m_spEventPublisher;
    std::shared_ptr<Registry> m_spRegistry;
    std::atomic_size_t m_dropped;
};

//----------------------------------------------------------------------------------------------------------------------
