//----------------------------------------------------------------------------------------------------------------------
#include "Components/Event/Events.hpp"
#include "Components/Event/Publisher.hpp"
#include "Components/Scheduler/Delegate.hpp"
#include "Components/Scheduler/Registrar.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json/value.hpp>
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <memory>
#include <string>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace test {
//----------------------------------------------------------------------------------------------------------------------

using StopCause = Event::Message<Event::Type::RuntimeStopped>::Cause;

Network::Address const Binding{ "127.0.0.1", 44201 };

//----------------------------------------------------------------------------------------------------------------------
} // test namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

class PublisherSuite : public testing::Test
{
protected:
    void SetUp() override
    {
        m_spRegistrar = std::make_shared<Scheduler::Registrar>();
        m_spPublisher = std::make_shared<Event::Publisher>(m_spRegistrar);
    }

    std::shared_ptr<Scheduler::Registrar> m_spRegistrar;
    std::shared_ptr<Event::Publisher> m_spPublisher;
};

//----------------------------------------------------------------------------------------------------------------------

TEST_F(PublisherSuite, DispatchOrderTest)
{
    std::vector<std::string> received;
    EXPECT_TRUE(m_spPublisher->Subscribe<Event::Type::MessageBus>(
        [&received] (std::string const& event, boost::json::value const& data) {
            EXPECT_EQ(data.as_int64(), static_cast<std::int64_t>(received.size()));
            received.emplace_back(event);
        }));
    EXPECT_TRUE(m_spPublisher->Subscribe<Event::Type::RuntimeStarted>([&received] { received.emplace_back("start"); }));
    EXPECT_TRUE(m_spPublisher->IsSubscribed(Event::Type::MessageBus));
    EXPECT_EQ(m_spPublisher->ListenerCount(), 2);

    m_spPublisher->SuspendSubscriptions();
    EXPECT_TRUE(m_spPublisher->SubscriptionsSuspended());

    m_spPublisher->Publish<Event::Type::MessageBus>(std::string{ "alpha" }, boost::json::value(0));
    m_spPublisher->Publish<Event::Type::RuntimeStarted>();
    EXPECT_EQ(m_spPublisher->EventCount(), 2);
    EXPECT_TRUE(received.empty()); // Publishing only queues the event.

    EXPECT_EQ(m_spPublisher->Dispatch(), 2);
    EXPECT_EQ(m_spPublisher->EventCount(), 0);
    EXPECT_EQ(received, (std::vector<std::string>{ "alpha", "start" }));
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(PublisherSuite, UnsubscribedEventTest)
{
    std::size_t stopped = 0;
    EXPECT_TRUE(m_spPublisher->Subscribe<Event::Type::RuntimeStopped>([&stopped] (test::StopCause cause) {
        EXPECT_EQ(cause, test::StopCause::ShutdownRequest);
        ++stopped;
    }));
    m_spPublisher->SuspendSubscriptions();

    // Events without a listener are discarded when published.
    m_spPublisher->Publish<Event::Type::RuntimeStarted>();
    m_spPublisher->Publish<Event::Type::EndpointStarted>(test::Binding);
    EXPECT_EQ(m_spPublisher->EventCount(), 0);
    EXPECT_EQ(m_spRegistrar->AvailableTasks(), 0);

    m_spPublisher->Publish<Event::Type::RuntimeStopped>(test::StopCause::ShutdownRequest);
    EXPECT_EQ(m_spPublisher->EventCount(), 1);
    EXPECT_EQ(m_spPublisher->Dispatch(), 1);
    EXPECT_EQ(stopped, 1);
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(PublisherSuite, SuspendedSubscriptionsTest)
{
    std::size_t invoked = 0;
    EXPECT_TRUE(m_spPublisher->Subscribe<Event::Type::RuntimeStarted>([&invoked] { ++invoked; }));
    m_spPublisher->SuspendSubscriptions();

    EXPECT_FALSE(m_spPublisher->Subscribe<Event::Type::RuntimeStarted>([&invoked] { ++invoked; }));
    EXPECT_FALSE(m_spPublisher->IsSubscribed(Event::Type::RuntimeStopped));
    EXPECT_EQ(m_spPublisher->ListenerCount(), 1);

    m_spPublisher->Publish<Event::Type::RuntimeStarted>();
    m_spPublisher->Dispatch();
    EXPECT_EQ(invoked, 1); // Only the listener subscribed before the suspension is notified.
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(PublisherSuite, ScheduledDispatchTest)
{
    std::size_t invoked = 0;
    EXPECT_TRUE(m_spPublisher->Subscribe<Event::Type::EndpointStarted>(
        [&invoked] (Network::Address const& binding) {
            EXPECT_EQ(binding, test::Binding);
            ++invoked;
        }));
    m_spPublisher->SuspendSubscriptions();
    ASSERT_TRUE(m_spRegistrar->Initialize());

    m_spPublisher->Publish<Event::Type::EndpointStarted>(test::Binding);
    m_spPublisher->Publish<Event::Type::EndpointStarted>(test::Binding);

    // The publisher signals its delegate such that the runtime may dispatch the queued events.
    EXPECT_EQ(m_spRegistrar->AvailableTasks(), 2);
    auto const spDelegate = m_spRegistrar->GetDelegate<Event::Publisher>();
    ASSERT_TRUE(spDelegate);
    EXPECT_EQ(spDelegate->AvailableTasks(), 2);

    EXPECT_EQ(m_spRegistrar->Execute(), 2);
    EXPECT_EQ(invoked, 2);
    EXPECT_EQ(m_spRegistrar->AvailableTasks(), 0);
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(PublisherSuite, DirectDispatchTest)
{
    std::size_t invoked = 0;
    EXPECT_TRUE(m_spPublisher->Subscribe<Event::Type::RuntimeStarted>([&invoked] { ++invoked; }));
    m_spPublisher->SuspendSubscriptions();
    ASSERT_TRUE(m_spRegistrar->Initialize());

    m_spPublisher->Publish<Event::Type::RuntimeStarted>();
    m_spPublisher->Publish<Event::Type::RuntimeStarted>();
    EXPECT_EQ(m_spRegistrar->AvailableTasks(), 2);

    // Dispatching outside of the runtime cycle must settle the signalled work, otherwise the next cycle would find
    // work available that has already been completed.
    EXPECT_EQ(m_spPublisher->Dispatch(), 2);
    EXPECT_EQ(invoked, 2);
    EXPECT_EQ(m_spRegistrar->AvailableTasks(), 0);

    auto const spDelegate = m_spRegistrar->GetDelegate<Event::Publisher>();
    ASSERT_TRUE(spDelegate);
    EXPECT_EQ(spDelegate->AvailableTasks(), 0);

    EXPECT_EQ(m_spRegistrar->Execute(), 0);
    EXPECT_EQ(invoked, 2);
    EXPECT_TRUE(m_spRegistrar->AwaitNextTask(std::chrono::milliseconds{ 1 })); // The runtime waits for new work.
}

//----------------------------------------------------------------------------------------------------------------------
