//----------------------------------------------------------------------------------------------------------------------
#include "MessageSinkStub.hpp"
#include "Components/Event/Events.hpp"
#include "Components/Event/Publisher.hpp"
#include "Components/Network/Address.hpp"
#include "Components/Network/Protocol.hpp"
#include "Components/Network/UDP/Endpoint.hpp"
#include "Components/Scheduler/Registrar.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

class EventObserver;

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
//----------------------------------------------------------------------------------------------------------------------
namespace test {
//----------------------------------------------------------------------------------------------------------------------

using BindingFailure = Event::Message<Event::Type::BindingFailed>::Cause;
using StopCause = Event::Message<Event::Type::EndpointStopped>::Cause;

Network::Address const AlphaBinding{ "127.0.0.1", 35216 };
Network::Address const OmegaBinding{ "127.0.0.1", 35217 };
Network::Address const Group{ "224.0.0.234", 35216 };

constexpr std::uint32_t Iterations = 10;
constexpr std::chrono::milliseconds ReceiveTimeout{ 1000 };
constexpr std::string_view Datagram = R"({"name":"edge-node-1","data":{"port":80},"interval":500,"available":true})";

//----------------------------------------------------------------------------------------------------------------------
} // test namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

class local::EventObserver
{
public:
    explicit EventObserver(Event::SharedPublisher const& spPublisher)
        : m_spPublisher(spPublisher)
        , m_started()
        , m_stopped()
        , m_failures()
    {
        m_spPublisher->Subscribe<Event::Type::EndpointStarted>([this] (Network::Address const& binding) {
            m_started.emplace_back(binding);
        });

        m_spPublisher->Subscribe<Event::Type::EndpointStopped>(
            [this] (Network::Address const& binding, test::StopCause cause) {
                EXPECT_EQ(cause, test::StopCause::ShutdownRequest);
                m_stopped.emplace_back(binding);
            });

        m_spPublisher->Subscribe<Event::Type::BindingFailed>(
            [this] (Network::Address const&, test::BindingFailure failure) { m_failures.emplace_back(failure); });
    }

    [[nodiscard]] std::vector<Network::Address> const& Started() const { return m_started; }
    [[nodiscard]] std::vector<Network::Address> const& Stopped() const { return m_stopped; }
    [[nodiscard]] std::vector<test::BindingFailure> const& Failures() const { return m_failures; }

private:
    Event::SharedPublisher m_spPublisher;
    std::vector<Network::Address> m_started;
    std::vector<Network::Address> m_stopped;
    std::vector<test::BindingFailure> m_failures;
};

//----------------------------------------------------------------------------------------------------------------------

class UdpEndpointSuite : public testing::Test
{
protected:
    void SetUp() override
    {
        m_spRegistrar = std::make_shared<Scheduler::Registrar>();
        m_spPublisher = std::make_shared<Event::Publisher>(m_spRegistrar);
        m_upObserver = std::make_unique<local::EventObserver>(m_spPublisher);
        m_spPublisher->SuspendSubscriptions(); // Event subscriptions are disabled after this point.
    }

    std::shared_ptr<Scheduler::Registrar> m_spRegistrar;
    std::shared_ptr<Event::Publisher> m_spPublisher;
    std::unique_ptr<local::EventObserver> m_upObserver;
};

//----------------------------------------------------------------------------------------------------------------------

TEST_F(UdpEndpointSuite, ConfigurationTest)
{
    Network::UDP::Endpoint endpoint{ Network::Protocol::UDP4, m_spPublisher };
    EXPECT_EQ(endpoint.GetProtocol(), Network::Protocol::UDP4);
    EXPECT_FALSE(endpoint.IsActive());

    // The endpoint can not be started until a binding has been provided.
    EXPECT_FALSE(endpoint.Startup());
    EXPECT_FALSE(endpoint.Send(test::Datagram, test::OmegaBinding));

    EXPECT_FALSE(endpoint.Bind(Network::Address{ "[::1]:35216" }));
    EXPECT_FALSE(endpoint.Bind(Network::Address{}));
    EXPECT_TRUE(endpoint.Bind(test::AlphaBinding));
    EXPECT_EQ(endpoint.GetBinding(), test::AlphaBinding); // The binding should be cached before start.

    EXPECT_FALSE(endpoint.JoinMulticastGroup(test::OmegaBinding));
    EXPECT_FALSE(endpoint.JoinMulticastGroup(Network::Address{ "[ff02::1]:35216" }));
    EXPECT_FALSE(endpoint.GetGroup());
    EXPECT_TRUE(endpoint.JoinMulticastGroup(test::Group));
    EXPECT_EQ(endpoint.GetGroup(), test::Group);

    Network::UDP::Endpoint ipv6{ Network::Protocol::UDP6, m_spPublisher };
    EXPECT_FALSE(ipv6.Bind(test::AlphaBinding));
    EXPECT_TRUE(ipv6.Bind(Network::Address{ "[::1]:35216" }));
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(UdpEndpointSuite, DatagramExchangeTest)
{
    MessageSinkStub alphaSink;
    Network::UDP::Endpoint alpha{ Network::Protocol::UDP4, m_spPublisher };
    ASSERT_TRUE(alpha.Bind(test::AlphaBinding));
    alpha.Register(&alphaSink);

    MessageSinkStub omegaSink;
    Network::UDP::Endpoint omega{ Network::Protocol::UDP4, m_spPublisher };
    ASSERT_TRUE(omega.Bind(test::OmegaBinding));
    omega.Register(&omegaSink);

    ASSERT_TRUE(alpha.Startup());
    ASSERT_TRUE(omega.Startup());
    EXPECT_TRUE(alpha.IsActive());
    EXPECT_TRUE(alpha.Startup()); // Starting an active endpoint has no effect.

    for (std::uint32_t iteration = 0; iteration < test::Iterations; ++iteration) {
        EXPECT_TRUE(alpha.Send(test::Datagram, test::OmegaBinding));
    }
    ASSERT_TRUE(omegaSink.AwaitMessages(test::Iterations, test::ReceiveTimeout));

    // Each datagram is delivered whole, attributed to the sender's binding.
    for (std::uint32_t iteration = 0; iteration < test::Iterations; ++iteration) {
        auto const optMessage = omegaSink.GetNextMessage();
        ASSERT_TRUE(optMessage);
        EXPECT_EQ(optMessage->first, test::AlphaBinding);
        EXPECT_EQ(optMessage->second, test::Datagram);
    }
    EXPECT_FALSE(omegaSink.GetNextMessage());

    EXPECT_TRUE(omega.Send("reply", test::AlphaBinding));
    ASSERT_TRUE(alphaSink.AwaitMessages(1, test::ReceiveTimeout));
    auto const optReply = alphaSink.GetNextMessage();
    ASSERT_TRUE(optReply);
    EXPECT_EQ(optReply->first, test::OmegaBinding);
    EXPECT_EQ(optReply->second, "reply");

    EXPECT_FALSE(alpha.Send(test::Datagram, Network::Address{ "[::1]:35217" }));

    alpha.Shutdown();
    omega.Shutdown();
    EXPECT_FALSE(alpha.IsActive());
    EXPECT_FALSE(alpha.Send(test::Datagram, test::OmegaBinding));
    alpha.Shutdown(); // Shutting down a stopped endpoint has no effect.

    EXPECT_EQ(m_spPublisher->Dispatch(), 4);
    EXPECT_EQ(m_upObserver->Started(), (std::vector<Network::Address>{ test::AlphaBinding, test::OmegaBinding }));
    EXPECT_EQ(m_upObserver->Stopped(), (std::vector<Network::Address>{ test::AlphaBinding, test::OmegaBinding }));
    EXPECT_TRUE(m_upObserver->Failures().empty());
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(UdpEndpointSuite, RestartTest)
{
    MessageSinkStub sink;
    Network::UDP::Endpoint endpoint{ Network::Protocol::UDP4, m_spPublisher };
    ASSERT_TRUE(endpoint.Bind(test::OmegaBinding));
    endpoint.Register(&sink);

    Network::UDP::Endpoint sender{ Network::Protocol::UDP4, m_spPublisher };
    ASSERT_TRUE(sender.Bind(test::AlphaBinding));
    ASSERT_TRUE(sender.Startup());

    for (std::uint32_t cycle = 1; cycle <= 2; ++cycle) {
        ASSERT_TRUE(endpoint.Startup());
        EXPECT_TRUE(sender.Send(test::Datagram, test::OmegaBinding));
        ASSERT_TRUE(sink.AwaitMessages(cycle, test::ReceiveTimeout));
        endpoint.Shutdown();
    }

    sender.Shutdown();
    EXPECT_EQ(m_spPublisher->Dispatch(), 6);
    EXPECT_EQ(m_upObserver->Started().size(), 3);
    EXPECT_EQ(m_upObserver->Stopped().size(), 3);
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(UdpEndpointSuite, BindingFailureTest)
{
    Network::UDP::Endpoint first{ Network::Protocol::UDP4, m_spPublisher, false };
    ASSERT_TRUE(first.Bind(test::AlphaBinding));
    ASSERT_TRUE(first.Startup());

    // A second exclusive socket on the same port can not be established.
    Network::UDP::Endpoint second{ Network::Protocol::UDP4, m_spPublisher, false };
    ASSERT_TRUE(second.Bind(test::AlphaBinding));
    EXPECT_FALSE(second.Startup());
    EXPECT_FALSE(second.IsActive());

    first.Shutdown();
    second.Shutdown();

    EXPECT_EQ(m_spPublisher->Dispatch(), 3);
    EXPECT_EQ(m_upObserver->Started(), (std::vector<Network::Address>{ test::AlphaBinding }));
    EXPECT_EQ(m_upObserver->Stopped(), (std::vector<Network::Address>{ test::AlphaBinding }));
    EXPECT_EQ(m_upObserver->Failures(), (std::vector<test::BindingFailure>{ test::BindingFailure::AddressInUse }));
}

//----------------------------------------------------------------------------------------------------------------------
