//----------------------------------------------------------------------------------------------------------------------
#include "TransportStub.hpp"
#include "Components/Event/Publisher.hpp"
#include "Components/Message/Codec.hpp"
#include "Components/Scheduler/Registrar.hpp"
#include "Components/Service/Registry.hpp"
#include "Components/Service/Router.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json/parse.hpp>
#include <boost/json/value.hpp>
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <memory>
#include <string>
#include <variant>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace test {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view LocalService = "edge-node-1";
constexpr std::string_view RemoteService = "edge-node-2";
constexpr std::string_view AddresslessService = "edge-node-3";
constexpr std::string_view EventName = "reload";
constexpr std::chrono::milliseconds Interval{ 500 };

Network::Address const Binding{ "0.0.0.0:44201" };
Network::Address const Group{ "224.0.0.234:44201" };
Network::Address const RemoteOrigin{ "192.168.1.7:50123" };
boost::json::value const EventData = boost::json::parse(R"({ "version": 2 })");

//----------------------------------------------------------------------------------------------------------------------
} // test namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

class RouterSuite : public testing::Test
{
protected:
    void SetUp() override
    {
        m_spRegistrar = std::make_shared<Scheduler::Registrar>();
        m_spPublisher = std::make_shared<Event::Publisher>(m_spRegistrar);

        EXPECT_TRUE(m_spPublisher->Subscribe<Event::Type::MessageBus>(
            [this] (std::string const& event, boost::json::value const& data) {
                EXPECT_EQ(data, test::EventData);
                m_delivered.emplace_back(event);
            }));

        m_spPublisher->SuspendSubscriptions();

        m_spTransport = std::make_shared<TransportStub>();
        ASSERT_TRUE(m_spTransport->Bind(test::Binding));
        ASSERT_TRUE(m_spTransport->Startup());

        m_spRegistry = std::make_shared<Service::Registry>(m_spPublisher);
        ASSERT_TRUE(m_spRegistry->Register(test::LocalService, test::EventData, test::Interval, true, true));
        ASSERT_TRUE(m_spRegistry->UpsertFromRemote(
            test::RemoteService, test::EventData, test::Interval, true, test::RemoteOrigin));
        ASSERT_TRUE(m_spRegistry->UpsertFromRemote(
            test::AddresslessService, test::EventData, test::Interval, false, {}));

        m_upRouter = std::make_unique<Service::Router>(m_spPublisher, m_spRegistry, m_spTransport, test::Group);
    }

    [[nodiscard]] std::size_t DispatchLocal()
    {
        m_delivered.clear();
        m_spPublisher->Dispatch();
        return m_delivered.size();
    }

    std::shared_ptr<Scheduler::Registrar> m_spRegistrar;
    std::shared_ptr<Event::Publisher> m_spPublisher;
    std::shared_ptr<TransportStub> m_spTransport;
    std::shared_ptr<Service::Registry> m_spRegistry;
    std::unique_ptr<Service::Router> m_upRouter;
    std::vector<std::string> m_delivered;
};

//----------------------------------------------------------------------------------------------------------------------

TEST_F(RouterSuite, SendEventTest)
{
    EXPECT_TRUE(m_upRouter->SendEvent(test::EventName, test::EventData));

    auto const sent = m_spTransport->GetSentMessages();
    ASSERT_EQ(sent.size(), 1);
    EXPECT_EQ(sent.front().second, test::Group);

    auto const optParcel = Message::Decode(sent.front().first);
    ASSERT_TRUE(optParcel);
    auto const& event = std::get<Message::EventParcel>(*optParcel);
    EXPECT_EQ(event.eventName, test::EventName);
    EXPECT_EQ(event.data, test::EventData);

    EXPECT_FALSE(m_upRouter->SendEvent("", test::EventData));

    m_spTransport->FailSends(true);
    EXPECT_FALSE(m_upRouter->SendEvent(test::EventName, test::EventData));
    EXPECT_EQ(m_spTransport->SentCount(), 1);
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(RouterSuite, SingleDestinationTest)
{
    // A local service receives the event through the publisher.
    EXPECT_TRUE(m_upRouter->SendEventTo(std::string{ test::LocalService }, test::EventName, test::EventData));
    EXPECT_EQ(m_spTransport->SentCount(), 0);
    EXPECT_EQ(DispatchLocal(), 1);

    // A remote service receives the event at its origin, on the port the group is listening on.
    EXPECT_TRUE(m_upRouter->SendEventTo(std::string{ test::RemoteService }, test::EventName, test::EventData));
    auto const sent = m_spTransport->GetSentMessages();
    ASSERT_EQ(sent.size(), 1);
    EXPECT_EQ(sent.front().second, Network::Address("192.168.1.7:44201"));
    EXPECT_EQ(DispatchLocal(), 0);

    // Unknown services and services without a known address are skipped.
    EXPECT_TRUE(m_upRouter->SendEventTo(std::string{ test::AddresslessService }, test::EventName, test::EventData));
    EXPECT_TRUE(m_upRouter->SendEventTo(std::string{ "unknown" }, test::EventName, test::EventData));
    EXPECT_EQ(m_spTransport->SentCount(), 1);
    EXPECT_EQ(DispatchLocal(), 0);

    EXPECT_FALSE(m_upRouter->SendEventTo(std::string{}, test::EventName, test::EventData));
    EXPECT_FALSE(m_upRouter->SendEventTo(std::string{ test::LocalService }, "", test::EventData));
    EXPECT_EQ(DispatchLocal(), 0);
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(RouterSuite, MultipleDestinationTest)
{
    std::vector<std::string> const names = {
        std::string{ test::LocalService }, std::string{ test::RemoteService }, "unknown"
    };
    EXPECT_TRUE(m_upRouter->SendEventTo(names, test::EventName, test::EventData));
    EXPECT_EQ(m_spTransport->SentCount(), 1);
    EXPECT_EQ(DispatchLocal(), 1);

    EXPECT_FALSE(m_upRouter->SendEventTo(std::vector<std::string>{}, test::EventName, test::EventData));
    EXPECT_EQ(m_spTransport->SentCount(), 1);
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(RouterSuite, PredicateDestinationTest)
{
    Service::Predicate const available = [] (Service::Record const& record) { return record.IsAvailable(); };
    EXPECT_TRUE(m_upRouter->SendEventTo(available, test::EventName, test::EventData));
    EXPECT_EQ(m_spTransport->SentCount(), 1);
    EXPECT_EQ(DispatchLocal(), 1);

    // A query matching no services succeeds without delivering anything.
    Service::Predicate const none = [] (Service::Record const&) { return false; };
    EXPECT_TRUE(m_upRouter->SendEventTo(none, test::EventName, test::EventData));
    EXPECT_EQ(m_spTransport->SentCount(), 1);
    EXPECT_EQ(DispatchLocal(), 0);

    // The predicate is evaluated without the registry's lock and may read from the registry.
    Service::Predicate const reentrant = [this] (Service::Record const& record) {
        return m_spRegistry->Contains(record.GetName()) && !record.IsLocal();
    };
    EXPECT_TRUE(m_upRouter->SendEventTo(reentrant, test::EventName, test::EventData));
    EXPECT_EQ(m_spTransport->SentCount(), 2);

    EXPECT_FALSE(m_upRouter->SendEventTo(Service::Predicate{}, test::EventName, test::EventData));
}

//----------------------------------------------------------------------------------------------------------------------
