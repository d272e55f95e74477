//----------------------------------------------------------------------------------------------------------------------
// File: Endpoint.cpp
// Description: Implementation for the UDP multicast endpoint.
//----------------------------------------------------------------------------------------------------------------------
#include "Endpoint.hpp"
#include "Components/Event/Publisher.hpp"
#include "Interfaces/MessageSink.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/asio/buffer.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/ip/multicast.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
#include <coroutine>
#include <exception>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] boost::asio::ip::udp::endpoint MakeEndpoint(Network::Address const& address);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Network::UDP::Endpoint::Endpoint(Protocol protocol, Event::SharedPublisher const& spEventPublisher, bool reuseAddress)
    : m_logger(spdlog::get(Logger::Name::Udp.data()))
    , m_protocol(protocol)
    , m_reuseAddress(reuseAddress)
    , m_spEventPublisher(spEventPublisher)
    , m_detailsMutex()
    , m_binding()
    , m_optGroup()
    , m_pMessageSink(nullptr)
    , m_context(1)
    , m_socket(m_context)
    , m_sendMutex()
    , m_buffer(MaximumDatagramSize)
    , m_active(false)
    , m_worker()
{
    assert(m_logger);
    assert(m_spEventPublisher);
    assert(m_protocol != Protocol::Invalid);
}

//----------------------------------------------------------------------------------------------------------------------

Network::UDP::Endpoint::~Endpoint()
{
    Shutdown();
}

//----------------------------------------------------------------------------------------------------------------------

Network::Protocol Network::UDP::Endpoint::GetProtocol() const { return m_protocol; }

//----------------------------------------------------------------------------------------------------------------------

Network::Address Network::UDP::Endpoint::GetBinding() const
{
    std::shared_lock lock(m_detailsMutex);
    return m_binding;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Network::Address> Network::UDP::Endpoint::GetGroup() const
{
    std::shared_lock lock(m_detailsMutex);
    return m_optGroup;
}

//----------------------------------------------------------------------------------------------------------------------

bool Network::UDP::Endpoint::Bind(Address const& binding)
{
    if (m_active || !IsCompatible(binding)) { return false; }
    std::unique_lock lock(m_detailsMutex);
    m_binding = binding;
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

bool Network::UDP::Endpoint::JoinMulticastGroup(Address const& group)
{
    if (m_active || !IsCompatible(group) || !group.IsMulticast()) { return false; }
    std::unique_lock lock(m_detailsMutex);
    m_optGroup = group;
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

void Network::UDP::Endpoint::Register(IMessageSink* const pMessageSink)
{
    assert(!m_active); // The sink is read without a lock by the receiver.
    m_pMessageSink = pMessageSink;
}

//----------------------------------------------------------------------------------------------------------------------

bool Network::UDP::Endpoint::Send(std::string_view buffer, Address const& destination)
{
    if (!m_active || !IsCompatible(destination)) { return false; }

    // Note: Sends are performed synchronously such that the caller may be told of the outcome. The socket is shared
    // with the receiver, the lock only serializes the senders.
    boost::system::error_code error;
    std::size_t sent = 0;
    {
        std::scoped_lock lock(m_sendMutex);
        sent = m_socket.send_to(
            boost::asio::buffer(buffer.data(), buffer.size()), local::MakeEndpoint(destination), 0, error);
    }

    if (error || sent != buffer.size()) {
        m_logger->warn("Failed to send a datagram to {}: {}", destination, error.message());
        return false;
    }

    return true;
}

//----------------------------------------------------------------------------------------------------------------------

bool Network::UDP::Endpoint::Startup()
{
    if (m_active) { return true; }

    auto const binding = GetBinding();
    auto const optGroup = GetGroup();
    if (!binding.IsValid()) {
        m_logger->error("The endpoint can not be started without a binding!");
        return false;
    }

    if (!Open(binding)) { return false; }
    if (optGroup && !Join(*optGroup)) { return false; }

    m_active = true;
    if (m_context.stopped()) { m_context.restart(); } // The context may have been stopped by a prior shutdown.

    boost::asio::co_spawn(
        m_context,
        Receiver(), // Note: The endpoint outlives the coroutine, the context is drained before destruction.
        [logger = m_logger] (std::exception_ptr exception, CompletionOrigin origin) {
            if (bool const error = (exception || origin == CompletionOrigin::Error); error) {
                logger->error("An unexpected error caused the receiver to shutdown!");
            }
        });

    m_worker = std::jthread([this] { ProcessEvents(); });

    m_logger->info("Listening on {}{}.", binding, optGroup ? fmt::format(" in the group {}", *optGroup) : "");
    m_spEventPublisher->Publish<Event::Type::EndpointStarted>(binding);
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

void Network::UDP::Endpoint::Shutdown()
{
    bool const operating = m_active || m_worker.joinable() || m_socket.is_open();
    if (!operating) { return; }

    m_logger->debug("Shutting down the endpoint.");
    bool const wasActive = m_active.exchange(false);

    m_context.stop();
    if (m_worker.joinable()) { m_worker.join(); }

    // Closing the socket aborts the pending receive, poll the context so the receiver may complete.
    boost::system::error_code error;
    m_socket.close(error);
    PollContext();

    if (wasActive) {
        m_spEventPublisher->Publish<Event::Type::EndpointStopped>(GetBinding(), ShutdownCause::ShutdownRequest);
    }
}

//----------------------------------------------------------------------------------------------------------------------

bool Network::UDP::Endpoint::IsActive() const { return m_active; }

//----------------------------------------------------------------------------------------------------------------------

bool Network::UDP::Endpoint::IsCompatible(Address const& address) const
{
    switch (m_protocol) {
        case Protocol::UDP4: return address.GetType() == Socket::Type::IPv4;
        case Protocol::UDP6: return address.GetType() == Socket::Type::IPv6;
        case Protocol::Invalid: break;
    }
    return false;
}

//----------------------------------------------------------------------------------------------------------------------

bool Network::UDP::Endpoint::Open(Address const& binding)
{
    auto const endpoint = local::MakeEndpoint(binding);

    boost::system::error_code error;
    if (m_socket.open(endpoint.protocol(), error); error) {
        OnBindingFailed(binding, BindingFailure::UnexpectedError, error);
        return false;
    }

    if (m_socket.set_option(boost::asio::ip::udp::socket::reuse_address(m_reuseAddress), error); error) {
        OnBindingFailed(binding, BindingFailure::UnexpectedError, error);
        return false;
    }

    if (m_socket.bind(endpoint, error); error) {
        auto failure = BindingFailure::UnexpectedError;
        switch (error.value()) {
            case boost::asio::error::address_in_use: failure = BindingFailure::AddressInUse; break;
            case boost::asio::error::access_denied: failure = BindingFailure::Permissions; break;
            default: break;
        }
        OnBindingFailed(binding, failure, error);
        return false;
    }

    return true;
}

//----------------------------------------------------------------------------------------------------------------------

bool Network::UDP::Endpoint::Join(Address const& group)
{
    auto const address = local::MakeEndpoint(group).address();

    // Loopback is enabled such that the node hears its own announcements, keeping its local services alive.
    boost::system::error_code error;
    if (m_socket.set_option(boost::asio::ip::multicast::enable_loopback(true), error); error) {
        OnBindingFailed(GetBinding(), BindingFailure::GroupMembership, error);
        return false;
    }

    if (m_socket.set_option(boost::asio::ip::multicast::join_group(address), error); error) {
        OnBindingFailed(GetBinding(), BindingFailure::GroupMembership, error);
        return false;
    }

    return true;
}

//----------------------------------------------------------------------------------------------------------------------

Network::UDP::SocketProcessor Network::UDP::Endpoint::Receiver()
{
    boost::asio::ip::udp::endpoint sender;
    boost::system::error_code error;
    while (m_active) {
        std::size_t const received = co_await m_socket.async_receive_from(
            boost::asio::buffer(m_buffer), sender, boost::asio::redirect_error(boost::asio::use_awaitable, error));

        if (error) {
            if (IsInducedError(error)) { co_return CompletionOrigin::Self; }
            m_logger->warn("Encountered an error while receiving a datagram: {}", error.message());
            continue;
        }

        Address const origin{ sender.address().to_string(), sender.port() };
        if (m_pMessageSink) {
            m_pMessageSink->CollectMessage(origin, std::string_view{ m_buffer.data(), received });
        }
    }

    co_return CompletionOrigin::Self;
}

//----------------------------------------------------------------------------------------------------------------------

void Network::UDP::Endpoint::ProcessEvents()
{
    // The context runs until it is stopped or the receiver completes, the pending receive keeps it from returning
    // while the endpoint is active.
    m_context.run();
}

//----------------------------------------------------------------------------------------------------------------------

void Network::UDP::Endpoint::PollContext()
{
    // Note: Context polling should only occur when the context is not being run by the worker thread.
    if (m_context.stopped()) { m_context.restart(); }
    m_context.poll();
}

//----------------------------------------------------------------------------------------------------------------------

void Network::UDP::Endpoint::OnBindingFailed(
    Address const& binding, BindingFailure failure, boost::system::error_code const& error)
{
    m_logger->error("A socket on {} could not be established: {}", binding, error.message());
    boost::system::error_code ignored;
    m_socket.close(ignored);
    m_spEventPublisher->Publish<Event::Type::BindingFailed>(binding, failure);
}

//----------------------------------------------------------------------------------------------------------------------

boost::asio::ip::udp::endpoint local::MakeEndpoint(Network::Address const& address)
{
    boost::system::error_code error;
    auto const ip = boost::asio::ip::make_address(address.GetIPAddress(), error);
    assert(!error); // A valid address has already been parsed by asio.
    return { ip, address.GetPort() };
}

//----------------------------------------------------------------------------------------------------------------------
