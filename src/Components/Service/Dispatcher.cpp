//----------------------------------------------------------------------------------------------------------------------
// File: Dispatcher.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Dispatcher.hpp"
#include "Registry.hpp"
#include "Components/Event/Publisher.hpp"
#include "Components/Message/Codec.hpp"
#include "Components/Network/Address.hpp"
#include "Utilities/Logger.hpp"
#include "Utilities/VariantVisitor.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
#include <variant>
//----------------------------------------------------------------------------------------------------------------------

Service::Dispatcher::Dispatcher(
    Event::SharedPublisher const& spEventPublisher, std::shared_ptr<Registry> const& spRegistry)
    : m_logger(spdlog::get(Logger::Name::Core.data()))
    , m_spEventPublisher(spEventPublisher)
    , m_spRegistry(spRegistry)
    , m_dropped(0)
{
    assert(m_logger);
    assert(m_spEventPublisher && m_spRegistry);
}

//----------------------------------------------------------------------------------------------------------------------

bool Service::Dispatcher::CollectMessage(Network::Address const& origin, std::string_view buffer)
{
    auto const optParcel = Message::Decode(buffer);
    if (!optParcel) {
        m_logger->warn("Dropped a malformed datagram received from {}.", origin);
        ++m_dropped;
        return false;
    }

    bool const accepted = std::visit(VariantVisitor{
        [this] (Message::EventParcel const& event) -> bool {
            m_spEventPublisher->Publish<Event::Type::MessageBus>(event.eventName, event.data);
            return true;
        },
        [this, &origin] (Message::AnnouncementParcel const& announcement) -> bool {
            if (announcement.name.empty()) {
                m_logger->warn("Dropped an announcement from {} that did not provide a service name.", origin);
                return false;
            }

            std::optional<Network::Address> optOrigin;
            if (origin.IsValid()) { optOrigin = origin; }
            return m_spRegistry->UpsertFromRemote(
                announcement.name, announcement.data, announcement.interval, announcement.available, optOrigin);
        }
    }, *optParcel);

    if (!accepted) { ++m_dropped; }
    return accepted;
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Service::Dispatcher::DroppedMessages() const { return m_dropped; }

//----------------------------------------------------------------------------------------------------------------------
