//----------------------------------------------------------------------------------------------------------------------
// File: Router.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Router.hpp"
#include "Registry.hpp"
#include "Components/Event/Publisher.hpp"
#include "Components/Message/Codec.hpp"
#include "Interfaces/DatagramTransport.hpp"
#include "Utilities/Logger.hpp"
#include "Utilities/VariantVisitor.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <cassert>
#include <iterator>
//----------------------------------------------------------------------------------------------------------------------

Service::Router::Router(
    Event::SharedPublisher const& spEventPublisher,
    std::shared_ptr<Registry> const& spRegistry,
    std::shared_ptr<IDatagramTransport> const& spTransport,
    Network::Address const& group)
    : m_logger(spdlog::get(Logger::Name::Core.data()))
    , m_spEventPublisher(spEventPublisher)
    , m_spRegistry(spRegistry)
    , m_spTransport(spTransport)
    , m_group(group)
{
    assert(m_logger);
    assert(m_spEventPublisher && m_spRegistry && m_spTransport);
}

//----------------------------------------------------------------------------------------------------------------------

bool Service::Router::SendEvent(std::string_view eventName, boost::json::value const& data)
{
    if (eventName.empty()) {
        m_logger->debug("Rejected an event that did not provide an event name.");
        return false;
    }

    auto const buffer = Message::Encode(Message::EventParcel{ std::string{ eventName }, data });
    if (!m_spTransport->Send(buffer, m_group)) {
        m_logger->error("Failed to broadcast the \"{}\" event to {}.", eventName, m_group);
        return false;
    }

    return true;
}

//----------------------------------------------------------------------------------------------------------------------

bool Service::Router::SendEventTo(
    Destination const& destination, std::string_view eventName, boost::json::value const& data)
{
    if (eventName.empty()) {
        m_logger->debug("Rejected an event that did not provide an event name.");
        return false;
    }

    auto const optTargets = Resolve(destination);
    if (!optTargets) {
        m_logger->debug("Rejected the \"{}\" event, the destination is malformed.", eventName);
        return false;
    }

    if (optTargets->empty()) { return true; }

    auto const buffer = Message::Encode(Message::EventParcel{ std::string{ eventName }, data });
    std::ranges::for_each(*optTargets, [&] (Record const& target) { Deliver(target, eventName, data, buffer); });
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Service::Router::Targets> Service::Router::Resolve(Destination const& destination) const
{
    // The destination is resolved once into snapshots of the targeted services. A predicate is evaluated outside the
    // registry's lock, so it may safely call back into the node.
    return std::visit(VariantVisitor{
        [this] (std::string const& name) -> std::optional<Targets> {
            if (name.empty()) { return {}; }
            Targets targets;
            if (auto optRecord = m_spRegistry->GetRecord(name); optRecord) {
                targets.emplace_back(std::move(*optRecord));
            }
            return targets;
        },
        [this] (std::vector<std::string> const& names) -> std::optional<Targets> {
            if (names.empty()) { return {}; }
            Targets targets;
            for (auto const& name : names) {
                if (auto optRecord = m_spRegistry->GetRecord(name); optRecord) {
                    targets.emplace_back(std::move(*optRecord));
                }
            }
            return targets;
        },
        [this] (Predicate const& predicate) -> std::optional<Targets> {
            if (!predicate) { return {}; }
            Targets known;
            m_spRegistry->ForEach([&known] (Record const& record) -> CallbackIteration {
                known.emplace_back(record);
                return CallbackIteration::Continue;
            });

            Targets targets;
            std::ranges::copy_if(known, std::back_inserter(targets), predicate);
            return targets;
        }
    }, destination);
}

//----------------------------------------------------------------------------------------------------------------------

void Service::Router::Deliver(
    Record const& target, std::string_view eventName, boost::json::value const& data, std::string const& buffer)
{
    if (target.IsLocal()) {
        m_spEventPublisher->Publish<Event::Type::MessageBus>(std::string{ eventName }, data);
        return;
    }

    auto const& optAddress = target.GetAddress();
    if (!optAddress) {
        m_logger->debug("Skipping \"{}\" for the \"{}\" event, the service's address is unknown.",
            target.GetName(), eventName);
        return;
    }

    // Events are delivered to the service's origin on the port the node's peers are listening on.
    auto const destination = optAddress->WithPort(m_group.GetPort());
    if (!m_spTransport->Send(buffer, destination)) {
        m_logger->error("Failed to send the \"{}\" event to \"{}\" at {}.", eventName, target.GetName(), destination);
    }
}

//----------------------------------------------------------------------------------------------------------------------
