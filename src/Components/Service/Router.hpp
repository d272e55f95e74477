//----------------------------------------------------------------------------------------------------------------------
// File: Router.hpp
// Description: Resolves event destinations to concrete services and delivers the event to each of them. Local
// services receive the event through the publisher, remote services receive it over the transport.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Record.hpp"
#include "Components/Event/SharedPublisher.hpp"
#include "Components/Network/Address.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json/value.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

class IDatagramTransport;

namespace spdlog { class logger; }

//----------------------------------------------------------------------------------------------------------------------
namespace Service {
//----------------------------------------------------------------------------------------------------------------------

class Router;
class Registry;

using Predicate = std::function<bool(Record const&)>;

// Note: A destination is a single service name, a list of service names, or a query over the known services.
using Destination = std::variant<std::string, std::vector<std::string>, Predicate>;

//----------------------------------------------------------------------------------------------------------------------
} // Service namespace
//----------------------------------------------------------------------------------------------------------------------

class Service::Router
{
public:
    Router(
        Event::SharedPublisher const& spEventPublisher,
        std::shared_ptr<Registry> const& spRegistry,
        std::shared_ptr<IDatagramTransport> const& spTransport,
        Network::Address const& group);

    // Note: Broadcasts the event to the multicast group. Fails on an empty event name or a transport error.
    bool SendEvent(std::string_view eventName, boost::json::value const& data);

    // Note: Fails only on malformed input. Unknown services, and remote services without a known address, are
    // skipped. A query matching no services succeeds without delivering anything.
    bool SendEventTo(Destination const& destination, std::string_view eventName, boost::json::value const& data);

private:
    using Targets = std::vector<Record>;

    [[nodiscard]] std::optional<Targets> Resolve(Destination const& destination) const;
    void Deliver(
        Record const& target, std::string_view eventName, boost::json::value const& data, std::string const& buffer);

    std::shared_ptr<spdlog::logger> m_logger;
    Event::SharedPublisher m_spEventPublisher;
    std::shared_ptr<Registry> m_spRegistry;
    std::shared_ptr<IDatagramTransport> m_spTransport;
    Network::Address const m_group;
};

//----------------------------------------------------------------------------------------------------------------------
