//----------------------------------------------------------------------------------------------------------------------
#include "Components/Scheduler/Delegate.hpp"
#include "Components/Scheduler/Registrar.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <memory>
#include <optional>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

class TimedService;

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
//----------------------------------------------------------------------------------------------------------------------
namespace test {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::chrono::milliseconds Interval{ 500 };
constexpr std::chrono::milliseconds Tolerance{ 50 }; // Covers the time between the fixture's setup and scheduling.

//----------------------------------------------------------------------------------------------------------------------
} // test namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

class local::TimedService {};

//----------------------------------------------------------------------------------------------------------------------

class DelegateSuite : public testing::Test
{
protected:
    void SetUp() override
    {
        m_spRegistrar = std::make_shared<Scheduler::Registrar>();
        m_spDelegate = m_spRegistrar->Register<local::TimedService>([] () -> std::size_t { return 0; });
        ASSERT_TRUE(m_spRegistrar->Initialize());
        m_start = Scheduler::Clock::now();
    }

    void TearDown() override
    {
        m_spDelegate->Delist();
    }

    std::shared_ptr<Scheduler::Registrar> m_spRegistrar;
    std::shared_ptr<Scheduler::Delegate> m_spDelegate;
    Scheduler::TimePoint m_start;
};

//----------------------------------------------------------------------------------------------------------------------

TEST_F(DelegateSuite, IntervalTaskTest)
{
    std::size_t fired = 0;
    m_spDelegate->Schedule([&fired] { ++fired; }, test::Interval);
    EXPECT_EQ(m_spDelegate->ScheduledTasks(), 1);

    // The first execution occurs one interval after the task was scheduled.
    m_spRegistrar->Execute(m_start);
    EXPECT_EQ(fired, 0);

    m_spRegistrar->Execute(m_start + test::Interval + test::Tolerance);
    EXPECT_EQ(fired, 1);

    // Executing again within the same period must not fire the task twice.
    m_spRegistrar->Execute(m_start + test::Interval + 2 * test::Tolerance);
    EXPECT_EQ(fired, 1);

    m_spRegistrar->Execute(m_start + 2 * test::Interval + test::Tolerance);
    EXPECT_EQ(fired, 2);
    EXPECT_EQ(m_spDelegate->ScheduledTasks(), 1); // Interval tasks remain scheduled after firing.
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(DelegateSuite, MissedPeriodsTest)
{
    std::size_t fired = 0;
    m_spDelegate->Schedule([&fired] { ++fired; }, test::Interval);

    // A task that has fallen several periods behind fires once and resumes its cadence from the execution time.
    auto const late = m_start + 5 * test::Interval + std::chrono::milliseconds{ 10 };
    m_spRegistrar->Execute(late);
    EXPECT_EQ(fired, 1);

    m_spRegistrar->Execute(late + std::chrono::milliseconds{ 10 });
    EXPECT_EQ(fired, 1);

    auto const optDeadline = m_spDelegate->GetNextDeadline();
    ASSERT_TRUE(optDeadline);
    EXPECT_EQ(*optDeadline, late + test::Interval);
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(DelegateSuite, CancelTest)
{
    std::size_t firstFired = 0;
    std::size_t secondFired = 0;
    auto const first = m_spDelegate->Schedule([&firstFired] { ++firstFired; }, test::Interval);
    auto const second = m_spDelegate->Schedule([&secondFired] { ++secondFired; }, test::Interval);
    EXPECT_NE(first, second);
    EXPECT_EQ(m_spDelegate->ScheduledTasks(), 2);

    EXPECT_TRUE(m_spDelegate->Cancel(first));
    EXPECT_FALSE(m_spDelegate->Cancel(first));
    EXPECT_EQ(m_spDelegate->ScheduledTasks(), 1);

    m_spRegistrar->Execute(m_start + 2 * test::Interval);
    EXPECT_EQ(firstFired, 0);
    EXPECT_EQ(secondFired, 1);

    m_spDelegate->CancelAll();
    EXPECT_EQ(m_spDelegate->ScheduledTasks(), 0);
    EXPECT_FALSE(m_spDelegate->GetNextDeadline());
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(DelegateSuite, SelfCancellationTest)
{
    // A task provided its own identifier may cancel itself from within its callback.
    std::size_t fired = 0;
    Scheduler::TaskIdentifier const identifier;
    bool const scheduled = m_spDelegate->Schedule(identifier, [&] {
        ++fired;
        EXPECT_TRUE(m_spDelegate->Cancel(identifier));
    }, test::Interval);
    ASSERT_TRUE(scheduled);

    // The identifier may not be reused while the task is scheduled.
    EXPECT_FALSE(m_spDelegate->Schedule(identifier, [] {}, test::Interval));

    m_spRegistrar->Execute(m_start + 2 * test::Interval);
    EXPECT_EQ(fired, 1);
    EXPECT_EQ(m_spDelegate->ScheduledTasks(), 0);

    m_spRegistrar->Execute(m_start + 4 * test::Interval);
    EXPECT_EQ(fired, 1);
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(DelegateSuite, ClampedIntervalTest)
{
    std::size_t fired = 0;
    m_spDelegate->Schedule([&fired] { ++fired; }, std::chrono::milliseconds{ 10'000'000'000'000 });

    // An interval beyond the maximum is clamped, the deadline is then representable and bounded by the maximum.
    auto const optDeadline = m_spDelegate->GetNextDeadline();
    ASSERT_TRUE(optDeadline);
    EXPECT_GT(*optDeadline, m_start);
    EXPECT_LE(*optDeadline, m_start + Scheduler::MaximumInterval + test::Tolerance);

    m_spRegistrar->Execute(m_start + test::Interval);
    EXPECT_EQ(fired, 0);

    m_spRegistrar->Execute(m_start + Scheduler::MaximumInterval + test::Tolerance);
    EXPECT_EQ(fired, 1);
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(DelegateSuite, DirectCompletionTest)
{
    m_spDelegate->OnTaskAvailable(3);
    EXPECT_EQ(m_spDelegate->AvailableTasks(), 3);
    EXPECT_EQ(m_spRegistrar->AvailableTasks(), 3);

    // Work completed outside of the registrar's cycle must be settled with both the delegate and the registrar,
    // otherwise the runtime would never wait for new work.
    m_spDelegate->OnTaskCompleted(2);
    EXPECT_EQ(m_spDelegate->AvailableTasks(), 1);
    EXPECT_EQ(m_spRegistrar->AvailableTasks(), 1);

    m_spDelegate->OnTaskCompleted(1);
    EXPECT_EQ(m_spDelegate->AvailableTasks(), 0);
    EXPECT_EQ(m_spRegistrar->AvailableTasks(), 0);
    EXPECT_TRUE(m_spRegistrar->AwaitTask(std::chrono::milliseconds{ 1 }));
}

//----------------------------------------------------------------------------------------------------------------------

TEST(TaskIdentifierSuite, UniquenessTest)
{
    Scheduler::TaskIdentifier const first;
    Scheduler::TaskIdentifier const second;
    EXPECT_NE(first, second);
    EXPECT_LT(first, second);
    EXPECT_EQ(first, Scheduler::TaskIdentifier{ first.GetValue() });
}

//----------------------------------------------------------------------------------------------------------------------
