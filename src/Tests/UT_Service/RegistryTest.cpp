//----------------------------------------------------------------------------------------------------------------------
#include "Components/Event/Events.hpp"
#include "Components/Event/Publisher.hpp"
#include "Components/Scheduler/Registrar.hpp"
#include "Components/Service/Registry.hpp"
#include "Interfaces/AnnouncementScheduler.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json/parse.hpp>
#include <boost/json/value.hpp>
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

class AnnouncementSchedulerStub;

struct Notification
{
    std::string name;
    bool available;
    Service::Reason reason;
    boost::json::value data;
};

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
//----------------------------------------------------------------------------------------------------------------------
namespace test {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view LocalService = "edge-node-1";
constexpr std::string_view RemoteService = "edge-node-2";
constexpr std::chrono::milliseconds Interval{ 500 };

Network::Address const RemoteOrigin{ "192.168.1.7:44201" };
boost::json::value const ServiceData = boost::json::parse(R"({ "port": 80 })");
boost::json::value const UpdatedData = boost::json::parse(R"({ "port": 8080 })");

//----------------------------------------------------------------------------------------------------------------------
} // test namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

class local::AnnouncementSchedulerStub : public IAnnouncementScheduler
{
public:
    AnnouncementSchedulerStub() : m_scheduled(), m_cancelled(0) {}

    // IAnnouncementScheduler {
    virtual std::optional<Scheduler::TaskIdentifier> ScheduleAnnouncements(
        std::string const& name, std::chrono::milliseconds interval) override
    {
        Scheduler::TaskIdentifier const identifier;
        m_scheduled.emplace(identifier, std::make_pair(name, interval));
        return identifier;
    }

    virtual bool CancelAnnouncements(Scheduler::TaskIdentifier const& identifier) override
    {
        if (m_scheduled.erase(identifier) == 0) { return false; }
        ++m_cancelled;
        return true;
    }
    // } IAnnouncementScheduler

    [[nodiscard]] std::size_t Active() const { return m_scheduled.size(); }
    [[nodiscard]] std::size_t Cancelled() const { return m_cancelled; }

    [[nodiscard]] std::optional<std::chrono::milliseconds> GetInterval(Scheduler::TaskIdentifier const& task) const
    {
        if (auto const itr = m_scheduled.find(task); itr != m_scheduled.end()) { return itr->second.second; }
        return {};
    }

private:
    std::map<Scheduler::TaskIdentifier, std::pair<std::string, std::chrono::milliseconds>> m_scheduled;
    std::size_t m_cancelled;
};

//----------------------------------------------------------------------------------------------------------------------

class RegistrySuite : public testing::Test
{
protected:
    void SetUp() override
    {
        m_now = Scheduler::Clock::now();
        m_spRegistrar = std::make_shared<Scheduler::Registrar>();
        m_spPublisher = std::make_shared<Event::Publisher>(m_spRegistrar);

        EXPECT_TRUE(m_spPublisher->Subscribe<Event::Type::ServiceAvailable>(
            [this] (std::string const& name, Service::Record const& record, Service::Reason reason) {
                EXPECT_EQ(name, record.GetName());
                m_notifications.emplace_back(local::Notification{ name, true, reason, record.GetData() });
            }));

        EXPECT_TRUE(m_spPublisher->Subscribe<Event::Type::ServiceUnavailable>(
            [this] (std::string const& name, Service::Record const& record, Service::Reason reason) {
                EXPECT_FALSE(record.IsAvailable());
                m_notifications.emplace_back(local::Notification{ name, false, reason, record.GetData() });
            }));

        m_spPublisher->SuspendSubscriptions();

        m_spRegistry = std::make_shared<Service::Registry>(m_spPublisher, [this] { return m_now; });
        m_spRegistry->Register(&m_scheduler);
    }

    void TearDown() override
    {
        m_spRegistry->Register(nullptr);
    }

    std::vector<local::Notification> const& DispatchNotifications()
    {
        m_notifications.clear();
        m_spPublisher->Dispatch();
        return m_notifications;
    }

    Scheduler::TimePoint m_now;
    std::shared_ptr<Scheduler::Registrar> m_spRegistrar;
    std::shared_ptr<Event::Publisher> m_spPublisher;
    std::shared_ptr<Service::Registry> m_spRegistry;
    local::AnnouncementSchedulerStub m_scheduler;
    std::vector<local::Notification> m_notifications;
};

//----------------------------------------------------------------------------------------------------------------------

TEST_F(RegistrySuite, RegisterTest)
{
    EXPECT_TRUE(m_spRegistry->Register(test::LocalService, test::ServiceData, test::Interval, true, true));
    EXPECT_TRUE(m_spRegistry->Contains(test::LocalService));
    EXPECT_EQ(m_spRegistry->Count(), 1);
    EXPECT_EQ(m_scheduler.Active(), 1); // Local services are announced as soon as they are registered.

    auto const optRecord = m_spRegistry->GetRecord(test::LocalService);
    ASSERT_TRUE(optRecord);
    EXPECT_EQ(optRecord->GetName(), test::LocalService);
    EXPECT_EQ(optRecord->GetData(), test::ServiceData);
    EXPECT_EQ(optRecord->GetInterval(), test::Interval);
    EXPECT_TRUE(optRecord->IsAvailable());
    EXPECT_TRUE(optRecord->IsLocal());
    EXPECT_TRUE(optRecord->IsAnnouncing());
    EXPECT_FALSE(optRecord->GetAddress());
    EXPECT_EQ(optRecord->GetLastSeen(), m_now);

    // A name identifies a single service, the existing registration is left untouched.
    EXPECT_FALSE(m_spRegistry->Register(test::LocalService, test::UpdatedData, test::Interval, false, true));
    EXPECT_EQ(m_spRegistry->GetData(test::LocalService), test::ServiceData);
    EXPECT_EQ(m_scheduler.Active(), 1);

    EXPECT_FALSE(m_spRegistry->Register("", test::ServiceData, test::Interval, true, true));
    EXPECT_FALSE(m_spRegistry->Register(test::RemoteService, boost::json::value(), test::Interval, true, true));
    EXPECT_EQ(m_spRegistry->Count(), 1);

    auto const& notifications = DispatchNotifications();
    ASSERT_EQ(notifications.size(), 1);
    EXPECT_EQ(notifications[0].name, test::LocalService);
    EXPECT_TRUE(notifications[0].available);
    EXPECT_EQ(notifications[0].reason, Service::Reason::New);
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(RegistrySuite, DefaultIntervalTest)
{
    using std::chrono::milliseconds;
    EXPECT_TRUE(m_spRegistry->Register(test::LocalService, test::ServiceData, milliseconds{ 0 }, true, true));
    EXPECT_TRUE(m_spRegistry->Register(test::RemoteService, test::ServiceData, milliseconds{ -5 }, true, false));

    EXPECT_EQ(m_spRegistry->GetRecord(test::LocalService)->GetInterval(), Service::DefaultInterval);
    EXPECT_EQ(m_spRegistry->GetRecord(test::RemoteService)->GetInterval(), Service::DefaultInterval);

    auto const optTask = m_spRegistry->GetRecord(test::LocalService)->GetAnnounceTask();
    ASSERT_TRUE(optTask);
    EXPECT_EQ(m_scheduler.GetInterval(*optTask), Service::DefaultInterval);
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(RegistrySuite, UnavailableRegistrationTest)
{
    // A service registered as unavailable is announced, but listeners are told it is unavailable.
    EXPECT_TRUE(m_spRegistry->Register(test::LocalService, test::ServiceData, test::Interval, false, true));
    EXPECT_EQ(m_scheduler.Active(), 1);

    auto const& notifications = DispatchNotifications();
    ASSERT_EQ(notifications.size(), 1);
    EXPECT_FALSE(notifications[0].available);
    EXPECT_EQ(notifications[0].reason, Service::Reason::New);
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(RegistrySuite, UpsertFromRemoteTest)
{
    EXPECT_TRUE(m_spRegistry->UpsertFromRemote(test::RemoteService, test::ServiceData, test::Interval, true, {}));
    EXPECT_EQ(m_scheduler.Active(), 0); // Remote services are never announced by this node.
    {
        auto const optRecord = m_spRegistry->GetRecord(test::RemoteService);
        ASSERT_TRUE(optRecord);
        EXPECT_FALSE(optRecord->IsLocal());
        EXPECT_FALSE(optRecord->IsAnnouncing());
        EXPECT_FALSE(optRecord->GetAddress());
    }

    // A repeated announcement refreshes the record without notifying listeners.
    m_now += test::Interval;
    EXPECT_TRUE(m_spRegistry->UpsertFromRemote(
        test::RemoteService, test::UpdatedData, test::Interval * 2, true, test::RemoteOrigin));
    {
        auto const optRecord = m_spRegistry->GetRecord(test::RemoteService);
        ASSERT_TRUE(optRecord);
        EXPECT_EQ(optRecord->GetData(), test::UpdatedData);
        EXPECT_EQ(optRecord->GetInterval(), test::Interval * 2);
        EXPECT_EQ(optRecord->GetLastSeen(), m_now);
        EXPECT_EQ(optRecord->GetAddress(), test::RemoteOrigin); // The first known origin is captured.
    }

    // The origin is never replaced once it is known.
    EXPECT_TRUE(m_spRegistry->UpsertFromRemote(
        test::RemoteService, test::UpdatedData, test::Interval, true, Network::Address{ "10.0.0.1:44201" }));
    EXPECT_EQ(m_spRegistry->GetRecord(test::RemoteService)->GetAddress(), test::RemoteOrigin);

    {
        auto const& notifications = DispatchNotifications();
        ASSERT_EQ(notifications.size(), 1);
        EXPECT_EQ(notifications[0].reason, Service::Reason::New);
    }

    EXPECT_TRUE(m_spRegistry->UpsertFromRemote(test::RemoteService, test::UpdatedData, test::Interval, false, {}));
    EXPECT_TRUE(m_spRegistry->UpsertFromRemote(test::RemoteService, test::UpdatedData, test::Interval, false, {}));
    EXPECT_TRUE(m_spRegistry->UpsertFromRemote(test::RemoteService, test::ServiceData, test::Interval, true, {}));
    {
        auto const& notifications = DispatchNotifications();
        ASSERT_EQ(notifications.size(), 2);
        EXPECT_FALSE(notifications[0].available);
        EXPECT_EQ(notifications[0].reason, Service::Reason::AvailabilityChange);
        EXPECT_TRUE(notifications[1].available);
        EXPECT_EQ(notifications[1].reason, Service::Reason::AvailabilityChange);
        EXPECT_EQ(notifications[1].data, test::ServiceData);
    }

    EXPECT_FALSE(m_spRegistry->UpsertFromRemote("", test::ServiceData, test::Interval, true, {}));
    EXPECT_EQ(m_spRegistry->Count(), 1);
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(RegistrySuite, UpdateLocalTest)
{
    EXPECT_FALSE(m_spRegistry->UpdateLocal(test::LocalService, test::UpdatedData, test::Interval, true));

    ASSERT_TRUE(m_spRegistry->Register(test::LocalService, test::ServiceData, test::Interval, true, true));
    auto const optInitialTask = m_spRegistry->GetRecord(test::LocalService)->GetAnnounceTask();
    ASSERT_TRUE(optInitialTask);
    DispatchNotifications();

    // An update with the same interval keeps the existing announcement task.
    EXPECT_TRUE(m_spRegistry->UpdateLocal(test::LocalService, test::UpdatedData, test::Interval, true));
    EXPECT_EQ(m_spRegistry->GetData(test::LocalService), test::UpdatedData);
    EXPECT_EQ(m_spRegistry->GetRecord(test::LocalService)->GetAnnounceTask(), optInitialTask);
    EXPECT_TRUE(DispatchNotifications().empty());

    // A new interval reschedules the announcements such that the cadence follows the service's interval.
    EXPECT_TRUE(m_spRegistry->UpdateLocal(test::LocalService, test::UpdatedData, test::Interval * 2, false));
    auto const optUpdatedTask = m_spRegistry->GetRecord(test::LocalService)->GetAnnounceTask();
    ASSERT_TRUE(optUpdatedTask);
    EXPECT_NE(optUpdatedTask, optInitialTask);
    EXPECT_EQ(m_scheduler.Active(), 1);
    EXPECT_EQ(m_scheduler.Cancelled(), 1);
    EXPECT_EQ(m_scheduler.GetInterval(*optUpdatedTask), test::Interval * 2);
    EXPECT_FALSE(m_spRegistry->GetAnnouncement(test::LocalService, *optInitialTask));

    auto const& notifications = DispatchNotifications();
    ASSERT_EQ(notifications.size(), 1);
    EXPECT_FALSE(notifications[0].available);
    EXPECT_EQ(notifications[0].reason, Service::Reason::AvailabilityChange);

    EXPECT_FALSE(m_spRegistry->UpdateLocal(test::LocalService, boost::json::value(), test::Interval, true));
    EXPECT_FALSE(m_spRegistry->UpdateLocal("", test::UpdatedData, test::Interval, true));
    EXPECT_EQ(m_spRegistry->GetData(test::LocalService), test::UpdatedData);
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(RegistrySuite, PauseAndResumeTest)
{
    ASSERT_TRUE(m_spRegistry->Register(test::LocalService, test::ServiceData, test::Interval, true, true));
    auto const optInitialTask = m_spRegistry->GetRecord(test::LocalService)->GetAnnounceTask();
    ASSERT_TRUE(optInitialTask);

    auto const optAnnouncement = m_spRegistry->GetAnnouncement(test::LocalService, *optInitialTask);
    ASSERT_TRUE(optAnnouncement);
    EXPECT_EQ(optAnnouncement->name, test::LocalService);
    EXPECT_EQ(optAnnouncement->data, test::ServiceData);
    EXPECT_EQ(optAnnouncement->interval, test::Interval);
    EXPECT_TRUE(optAnnouncement->available);

    EXPECT_TRUE(m_spRegistry->Pause(test::LocalService));
    EXPECT_FALSE(m_spRegistry->Pause(test::LocalService));
    EXPECT_EQ(m_scheduler.Active(), 0);
    EXPECT_FALSE(m_spRegistry->GetRecord(test::LocalService)->IsAnnouncing());
    EXPECT_FALSE(m_spRegistry->GetAnnouncement(test::LocalService, *optInitialTask));
    EXPECT_TRUE(m_spRegistry->Contains(test::LocalService)); // Pausing does not remove the service.

    EXPECT_TRUE(m_spRegistry->Resume(test::LocalService, test::Interval * 4));
    EXPECT_FALSE(m_spRegistry->Resume(test::LocalService));
    EXPECT_EQ(m_scheduler.Active(), 1);

    auto const optResumedTask = m_spRegistry->GetRecord(test::LocalService)->GetAnnounceTask();
    ASSERT_TRUE(optResumedTask);
    EXPECT_NE(*optResumedTask, *optInitialTask);
    EXPECT_EQ(m_spRegistry->GetRecord(test::LocalService)->GetInterval(), test::Interval * 4);
    EXPECT_FALSE(m_spRegistry->GetAnnouncement(test::LocalService, *optInitialTask)); // The superseded task is idle.
    EXPECT_TRUE(m_spRegistry->GetAnnouncement(test::LocalService, *optResumedTask));

    EXPECT_FALSE(m_spRegistry->Pause("unknown"));
    EXPECT_FALSE(m_spRegistry->Resume("unknown"));
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(RegistrySuite, ResumeRemoteTest)
{
    // A remote service may be adopted and announced by this node.
    ASSERT_TRUE(m_spRegistry->UpsertFromRemote(test::RemoteService, test::ServiceData, test::Interval, true, {}));
    EXPECT_FALSE(m_spRegistry->Pause(test::RemoteService));
    EXPECT_TRUE(m_spRegistry->Resume(test::RemoteService));
    EXPECT_TRUE(m_spRegistry->GetRecord(test::RemoteService)->IsAnnouncing());
    EXPECT_EQ(m_scheduler.Active(), 1);
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(RegistrySuite, SweepTest)
{
    ASSERT_TRUE(m_spRegistry->Register(test::LocalService, test::ServiceData, test::Interval, true, true));
    ASSERT_TRUE(m_spRegistry->UpsertFromRemote(
        test::RemoteService, test::ServiceData, test::Interval * 4, true, test::RemoteOrigin));
    DispatchNotifications();

    // A service is expired only once more than two of its intervals have passed.
    EXPECT_EQ(m_spRegistry->Sweep(m_now + 2 * test::Interval), 0);
    EXPECT_EQ(m_spRegistry->Count(), 2);

    m_now += 2 * test::Interval + std::chrono::milliseconds{ 1 };
    EXPECT_EQ(m_spRegistry->Sweep(), 1);
    EXPECT_FALSE(m_spRegistry->Contains(test::LocalService));
    EXPECT_FALSE(m_spRegistry->GetData(test::LocalService));
    EXPECT_TRUE(m_spRegistry->Contains(test::RemoteService));
    EXPECT_EQ(m_scheduler.Active(), 0); // The announcements of an expired service are stopped.

    {
        auto const& notifications = DispatchNotifications();
        ASSERT_EQ(notifications.size(), 1);
        EXPECT_EQ(notifications[0].name, test::LocalService);
        EXPECT_FALSE(notifications[0].available);
        EXPECT_EQ(notifications[0].reason, Service::Reason::TimedOut);
        EXPECT_EQ(notifications[0].data, test::ServiceData); // The data is reported as it was last announced.
    }

    // A refreshed service is measured from its latest announcement.
    m_now += test::Interval * 4;
    ASSERT_TRUE(m_spRegistry->UpsertFromRemote(test::RemoteService, test::UpdatedData, test::Interval * 4, true, {}));
    m_now += test::Interval * 8;
    EXPECT_EQ(m_spRegistry->Sweep(), 0);
    m_now += std::chrono::milliseconds{ 1 };
    EXPECT_EQ(m_spRegistry->Sweep(), 1);
    EXPECT_EQ(m_spRegistry->Count(), 0);
    EXPECT_EQ(m_spRegistry->Sweep(), 0);
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(RegistrySuite, MaximumIntervalTest)
{
    constexpr std::chrono::milliseconds OversizedInterval{ 10'000'000'000'000 };
    ASSERT_TRUE(m_spRegistry->Register(test::LocalService, test::ServiceData, OversizedInterval, true, true));
    ASSERT_TRUE(m_spRegistry->UpsertFromRemote(test::RemoteService, test::ServiceData, OversizedInterval, true, {}));

    // Intervals are clamped to the maximum, such that twice an interval remains representable by the clock.
    EXPECT_EQ(m_spRegistry->GetRecord(test::LocalService)->GetInterval(), Service::MaximumInterval);
    EXPECT_EQ(m_spRegistry->GetRecord(test::RemoteService)->GetInterval(), Service::MaximumInterval);

    auto const optTask = m_spRegistry->GetRecord(test::LocalService)->GetAnnounceTask();
    ASSERT_TRUE(optTask);
    EXPECT_EQ(m_scheduler.GetInterval(*optTask), Service::MaximumInterval);

    EXPECT_EQ(m_spRegistry->Sweep(m_now + test::Interval), 0);
    EXPECT_EQ(m_spRegistry->Sweep(m_now + 2 * Service::MaximumInterval), 0);
    EXPECT_EQ(m_spRegistry->Count(), 2);

    EXPECT_EQ(m_spRegistry->Sweep(m_now + 2 * Service::MaximumInterval + std::chrono::milliseconds{ 1 }), 2);
    EXPECT_EQ(m_spRegistry->Count(), 0);
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(RegistrySuite, LoopbackAnnouncementTest)
{
    ASSERT_TRUE(m_spRegistry->Register(test::LocalService, test::ServiceData, test::Interval, true, true));
    DispatchNotifications();

    EXPECT_TRUE(m_spRegistry->UpdateLocal(test::LocalService, test::UpdatedData, test::Interval, false));

    // An announcement of a local service received through loopback may predate the local update. It keeps the
    // service alive, but must not revert the local state.
    m_now += test::Interval;
    EXPECT_TRUE(m_spRegistry->UpsertFromRemote(
        test::LocalService, test::ServiceData, test::Interval * 4, true, test::RemoteOrigin));

    auto const optRecord = m_spRegistry->GetRecord(test::LocalService);
    ASSERT_TRUE(optRecord);
    EXPECT_TRUE(optRecord->IsLocal());
    EXPECT_EQ(optRecord->GetData(), test::UpdatedData);
    EXPECT_EQ(optRecord->GetInterval(), test::Interval);
    EXPECT_FALSE(optRecord->IsAvailable());
    EXPECT_EQ(optRecord->GetLastSeen(), m_now);
    EXPECT_EQ(optRecord->GetAddress(), test::RemoteOrigin);

    auto const& notifications = DispatchNotifications();
    ASSERT_EQ(notifications.size(), 1);
    EXPECT_FALSE(notifications[0].available);
    EXPECT_EQ(notifications[0].reason, Service::Reason::AvailabilityChange);
    EXPECT_EQ(notifications[0].data, test::UpdatedData);

    EXPECT_EQ(m_spRegistry->Sweep(m_now + 2 * test::Interval), 0);
    EXPECT_TRUE(m_spRegistry->Contains(test::LocalService));
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(RegistrySuite, MissingDataTest)
{
    // A service can not be discovered without data.
    EXPECT_FALSE(m_spRegistry->UpsertFromRemote(test::RemoteService, boost::json::value(), test::Interval, true, {}));
    EXPECT_FALSE(m_spRegistry->Contains(test::RemoteService));

    ASSERT_TRUE(m_spRegistry->UpsertFromRemote(test::RemoteService, test::ServiceData, test::Interval, true, {}));
    DispatchNotifications();

    // A later announcement without data refreshes the service, but keeps the data it was last seen with.
    m_now += test::Interval;
    EXPECT_TRUE(m_spRegistry->UpsertFromRemote(test::RemoteService, boost::json::value(), test::Interval, false, {}));

    auto const optRecord = m_spRegistry->GetRecord(test::RemoteService);
    ASSERT_TRUE(optRecord);
    EXPECT_FALSE(optRecord->GetData().is_null());
    EXPECT_EQ(optRecord->GetData(), test::ServiceData);
    EXPECT_FALSE(optRecord->IsAvailable());
    EXPECT_EQ(optRecord->GetLastSeen(), m_now);

    auto const& notifications = DispatchNotifications();
    ASSERT_EQ(notifications.size(), 1);
    EXPECT_EQ(notifications[0].reason, Service::Reason::AvailabilityChange);
    EXPECT_EQ(notifications[0].data, test::ServiceData);
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(RegistrySuite, ForEachTest)
{
    ASSERT_TRUE(m_spRegistry->Register(test::LocalService, test::ServiceData, test::Interval, true, true));
    ASSERT_TRUE(m_spRegistry->UpsertFromRemote(test::RemoteService, test::ServiceData, test::Interval, true, {}));

    std::size_t visited = 0;
    m_spRegistry->ForEach([&visited] (Service::Record const&) -> CallbackIteration {
        ++visited;
        return CallbackIteration::Continue;
    });
    EXPECT_EQ(visited, 2);

    visited = 0;
    m_spRegistry->ForEach([&visited] (Service::Record const&) -> CallbackIteration {
        ++visited;
        return CallbackIteration::Stop;
    });
    EXPECT_EQ(visited, 1);
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(RegistrySuite, ClearTest)
{
    ASSERT_TRUE(m_spRegistry->Register(test::LocalService, test::ServiceData, test::Interval, true, true));
    ASSERT_TRUE(m_spRegistry->UpsertFromRemote(test::RemoteService, test::ServiceData, test::Interval, true, {}));
    DispatchNotifications();

    m_spRegistry->Clear();
    EXPECT_EQ(m_spRegistry->Count(), 0);
    EXPECT_EQ(m_scheduler.Active(), 0);
    EXPECT_EQ(m_scheduler.Cancelled(), 1);
    EXPECT_TRUE(DispatchNotifications().empty()); // Clearing the registry does not notify listeners.
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(RegistrySuite, MissingSchedulerTest)
{
    // Without an announcement scheduler local services are stored but never broadcast.
    m_spRegistry->Register(nullptr);
    EXPECT_TRUE(m_spRegistry->Register(test::LocalService, test::ServiceData, test::Interval, true, true));
    EXPECT_FALSE(m_spRegistry->GetRecord(test::LocalService)->IsAnnouncing());
    EXPECT_FALSE(m_spRegistry->Resume(test::LocalService));
    EXPECT_EQ(m_scheduler.Active(), 0);
}

//----------------------------------------------------------------------------------------------------------------------
