//----------------------------------------------------------------------------------------------------------------------
// File: Delegate.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Delegate.hpp"
#include "Registrar.hpp"
#include "Utilities/Assertions.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <limits>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

Scheduler::Delegate::Delegate(Identifier identifier, OnExecute const& callback, Sentinel* const sentinel)
    : m_identifier(identifier)
    , m_priority(std::numeric_limits<std::size_t>::max())
    , m_available(0)
    , m_execute(callback)
    , m_tasksMutex()
    , m_tasks()
    , m_dependencies()
    , m_sentinel(sentinel)
{
    assert(Assertions::Threading::IsCoreThread());
    assert(m_sentinel);
}

//----------------------------------------------------------------------------------------------------------------------

Scheduler::Delegate::Identifier Scheduler::Delegate::GetIdentifier() const { return m_identifier; }

//----------------------------------------------------------------------------------------------------------------------

std::size_t Scheduler::Delegate::GetPriority() const { return m_priority; }

//----------------------------------------------------------------------------------------------------------------------

std::size_t Scheduler::Delegate::AvailableTasks() const { return m_available; }

//----------------------------------------------------------------------------------------------------------------------

std::size_t Scheduler::Delegate::ScheduledTasks() const
{
    std::scoped_lock lock(m_tasksMutex);
    return m_tasks.size();
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Scheduler::TimePoint> Scheduler::Delegate::GetNextDeadline() const
{
    std::scoped_lock lock(m_tasksMutex);
    if (m_tasks.empty()) { return {}; }
    auto const itr = std::ranges::min_element(m_tasks, {}, [] (auto const& entry) {
        return entry.second->GetDeadline();
    });
    return itr->second->GetDeadline();
}

//----------------------------------------------------------------------------------------------------------------------

Scheduler::Delegate::Dependencies const& Scheduler::Delegate::GetDependencies() const { return m_dependencies; }

//----------------------------------------------------------------------------------------------------------------------

void Scheduler::Delegate::OnTaskAvailable(std::size_t available)
{
    m_available += available;
    m_sentinel->OnTaskAvailable(available);
}

//----------------------------------------------------------------------------------------------------------------------

void Scheduler::Delegate::OnTaskCompleted(std::size_t completed)
{
    assert(Assertions::Threading::IsCoreThread());
    assert(completed <= m_available); // Work must be signalled before it can be completed.
    m_available -= completed;
    m_sentinel->OnTaskCompleted(completed);
}

//----------------------------------------------------------------------------------------------------------------------

void Scheduler::Delegate::SetPriority([[maybe_unused]] ExecuteKey key, std::size_t priority)
{
    m_priority = priority;
}

//----------------------------------------------------------------------------------------------------------------------

Scheduler::TaskIdentifier Scheduler::Delegate::Schedule(
    IntervalTask::Callback const& callback, Interval const& interval)
{
    TaskIdentifier identifier;
    [[maybe_unused]] bool const scheduled = Schedule(identifier, callback, interval);
    assert(scheduled);
    return identifier;
}

//----------------------------------------------------------------------------------------------------------------------

bool Scheduler::Delegate::Schedule(
    TaskIdentifier const& identifier, IntervalTask::Callback const& callback, Interval const& interval)
{
    {
        std::scoped_lock lock(m_tasksMutex);
        auto const [itr, emplaced] = m_tasks.emplace(identifier, std::make_unique<IntervalTask>(callback, interval));
        if (!emplaced) { return false; }
    }
    m_sentinel->OnTaskScheduled(); // Wake the runtime such that it may account for the new deadline.
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

bool Scheduler::Delegate::Cancel(TaskIdentifier const& identifier)
{
    std::scoped_lock lock(m_tasksMutex);
    return m_tasks.erase(identifier) != 0;
}

//----------------------------------------------------------------------------------------------------------------------

void Scheduler::Delegate::CancelAll()
{
    std::scoped_lock lock(m_tasksMutex);
    m_tasks.clear();
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Scheduler::Delegate::Execute([[maybe_unused]] ExecuteKey key, TimePoint const& now)
{
    assert(Assertions::Threading::IsCoreThread());

    // Collect the callbacks of the ready tasks under the lock, the callbacks themselves are run afterwards such that
    // they are free to schedule or cancel tasks on this or any other delegate.
    std::vector<IntervalTask::Callback> ready;
    {
        std::scoped_lock lock(m_tasksMutex);
        for (auto const& [identifier, upTask] : m_tasks) {
            assert(upTask);
            if (upTask->Ready(now)) { ready.emplace_back(upTask->GetCallback()); }
        }
    }

    std::ranges::for_each(ready, [] (auto const& callback) { callback(); });

    // Run the main work executor registered with the delegate.
    std::size_t completed = 0;
    if (m_available != 0) {
        assert(m_execute);
        completed = m_execute();
        assert(completed <= m_available); // Work must be signalled before it can be completed.
        m_available -= completed;
    }

    return completed; // Provide the registrar the units of work completed.
}

//----------------------------------------------------------------------------------------------------------------------

void Scheduler::Delegate::Depends(Dependencies&& dependencies)
{
    m_dependencies = std::move(dependencies);
}

//----------------------------------------------------------------------------------------------------------------------

void Scheduler::Delegate::Delist()
{
    assert(m_sentinel);
    CancelAll();
    m_sentinel->Delist(m_identifier);
    m_priority = std::numeric_limits<std::size_t>::max();
}

//----------------------------------------------------------------------------------------------------------------------
