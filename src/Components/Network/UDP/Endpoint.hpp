//----------------------------------------------------------------------------------------------------------------------
// File: Endpoint.hpp
// Description: Declaration of the UDP multicast endpoint. The endpoint binds a socket to the configured port, joins
// the discovery group, and forwards every received datagram to the registered message sink from its own thread.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Event/Events.hpp"
#include "Components/Event/SharedPublisher.hpp"
#include "Components/Network/Address.hpp"
#include "Components/Network/Protocol.hpp"
#include "Interfaces/DatagramTransport.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/system/error_code.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string_view>
#include <thread>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

namespace spdlog { class logger; }

//----------------------------------------------------------------------------------------------------------------------
namespace Network::UDP {
//----------------------------------------------------------------------------------------------------------------------

class Endpoint;

enum class CompletionOrigin : std::uint8_t { Self, Error };
using SocketProcessor = boost::asio::awaitable<CompletionOrigin>;

// Note: Datagrams larger than the maximum payload are truncated by the socket.
constexpr std::size_t MaximumDatagramSize = 65536;

[[nodiscard]] bool IsInducedError(boost::system::error_code const& error);

//----------------------------------------------------------------------------------------------------------------------
} // Network::UDP namespace
//----------------------------------------------------------------------------------------------------------------------

class Network::UDP::Endpoint final : public IDatagramTransport
{
public:
    Endpoint(Protocol protocol, Event::SharedPublisher const& spEventPublisher, bool reuseAddress = true);
    ~Endpoint() override;

    Endpoint(Endpoint const&) = delete;
    Endpoint(Endpoint&&) = delete;
    Endpoint& operator=(Endpoint const&) = delete;
    Endpoint& operator=(Endpoint&&) = delete;

    [[nodiscard]] Protocol GetProtocol() const;
    [[nodiscard]] Address GetBinding() const;
    [[nodiscard]] std::optional<Address> GetGroup() const;

    // IDatagramTransport {
    [[nodiscard]] virtual bool Bind(Address const& binding) override;
    [[nodiscard]] virtual bool JoinMulticastGroup(Address const& group) override;
    virtual void Register(IMessageSink* const pMessageSink) override;

    [[nodiscard]] virtual bool Send(std::string_view buffer, Address const& destination) override;

    [[nodiscard]] virtual bool Startup() override;
    virtual void Shutdown() override;
    [[nodiscard]] virtual bool IsActive() const override;
    // } IDatagramTransport

private:
    using BindingFailure = Event::Message<Event::Type::BindingFailed>::Cause;
    using ShutdownCause = Event::Message<Event::Type::EndpointStopped>::Cause;

    [[nodiscard]] bool IsCompatible(Address const& address) const;
    [[nodiscard]] bool Open(Address const& binding);
    [[nodiscard]] bool Join(Address const& group);
    [[nodiscard]] SocketProcessor Receiver();
    void ProcessEvents();
    void PollContext();

    void OnBindingFailed(Address const& binding, BindingFailure failure, boost::system::error_code const& error);

    std::shared_ptr<spdlog::logger> m_logger;
    Protocol const m_protocol;
    bool const m_reuseAddress;
    Event::SharedPublisher m_spEventPublisher;

    mutable std::shared_mutex m_detailsMutex;
    Address m_binding;
    std::optional<Address> m_optGroup;
    IMessageSink* m_pMessageSink;

    boost::asio::io_context m_context;
    boost::asio::ip::udp::socket m_socket;
    std::mutex m_sendMutex;
    std::vector<char> m_buffer;
    std::atomic_bool m_active;
    std::jthread m_worker;
};

//----------------------------------------------------------------------------------------------------------------------

inline bool Network::UDP::IsInducedError(boost::system::error_code const& error)
{
    switch (error.value()) {
        case boost::asio::error::operation_aborted:
        case boost::asio::error::bad_descriptor:
        case boost::asio::error::shut_down: {
            return true;
        }
        default: return false;
    }
}

//----------------------------------------------------------------------------------------------------------------------
