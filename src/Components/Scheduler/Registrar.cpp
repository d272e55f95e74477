//----------------------------------------------------------------------------------------------------------------------
// File: Registrar.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Registrar.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <deque>
#include <functional>
#include <ranges>
#include <unordered_map>
//----------------------------------------------------------------------------------------------------------------------

Scheduler::Sentinel::Sentinel()
    : m_mutex()
    , m_waiter()
    , m_available(0)
    , m_interrupted(false)
{
}

//----------------------------------------------------------------------------------------------------------------------

bool Scheduler::Sentinel::AwaitTask(std::chrono::milliseconds timeout)
{
    if (m_available != 0) { return false; } // If there are ready tasks, there is no need to wait.
    std::unique_lock lock(m_mutex);
    m_waiter.wait_for(lock, timeout, [this] { return m_available != 0 || m_interrupted; });
    m_interrupted = false;
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Scheduler::Sentinel::AvailableTasks() const { return m_available; }

//----------------------------------------------------------------------------------------------------------------------

void Scheduler::Sentinel::OnTaskAvailable(std::size_t available)
{
    // If this is the first notification of work we've had recently, wake the runtime thread early in order to
    // process the work as soon as possible.
    if (auto const result = m_available += available; result == available) {
        { std::scoped_lock lock(m_mutex); }
        m_waiter.notify_one();
    }
}

//----------------------------------------------------------------------------------------------------------------------

void Scheduler::Sentinel::OnTaskScheduled()
{
    {
        std::scoped_lock lock(m_mutex);
        m_interrupted = true;
    }
    m_waiter.notify_one();
}

//----------------------------------------------------------------------------------------------------------------------

void Scheduler::Sentinel::OnTaskCompleted(std::size_t completed) { m_available -= completed; }

//----------------------------------------------------------------------------------------------------------------------

Scheduler::Registrar::Registrar()
    : m_logger(spdlog::get(Logger::Name::Core.data()))
    , m_delegates()
    , m_initialized(false)
{
    assert(Assertions::Threading::IsCoreThread());
    assert(m_logger);
}

//----------------------------------------------------------------------------------------------------------------------

bool Scheduler::Registrar::Initialize()
{
    assert(Assertions::Threading::IsCoreThread());
    m_initialized = ResolveDependencies() && UpdatePriorityOrder();
    return m_initialized;
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Scheduler::Registrar::Execute(TimePoint const& now)
{
    assert(Assertions::Threading::IsCoreThread());
    assert(m_initialized);

    // Every delegate is visited, a delegate without signalled work may still own interval tasks that have come due.
    std::size_t total = 0;
    for (auto const& spDelegate : m_delegates) {
        std::size_t const executed = spDelegate->Execute({}, now);
        OnTaskCompleted(executed);
        total += executed;
    }

    return total;
}

//----------------------------------------------------------------------------------------------------------------------

bool Scheduler::Registrar::AwaitNextTask(std::chrono::milliseconds timeout)
{
    if (auto const optDeadline = GetNextDeadline(); optDeadline) {
        auto const remaining = std::chrono::ceil<std::chrono::milliseconds>(*optDeadline - Clock::now());
        if (remaining <= std::chrono::milliseconds::zero()) { return false; } // A task is already due.
        timeout = std::min(timeout, remaining);
    }
    return AwaitTask(timeout);
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Scheduler::TimePoint> Scheduler::Registrar::GetNextDeadline() const
{
    std::optional<TimePoint> optEarliest;
    for (auto const& spDelegate : m_delegates) {
        if (auto const optDeadline = spDelegate->GetNextDeadline(); optDeadline) {
            if (!optEarliest || *optDeadline < *optEarliest) { optEarliest = optDeadline; }
        }
    }
    return optEarliest;
}

//----------------------------------------------------------------------------------------------------------------------

void Scheduler::Registrar::Delist(Delegate::Identifier identifier)
{
    assert(Assertions::Threading::IsCoreThread());
    auto const itr = std::ranges::find_if(m_delegates, [&identifier] (auto const& spDelegate) {
        return spDelegate->GetIdentifier() == identifier;
    });

    if (itr != m_delegates.end()) {
        OnTaskCompleted((*itr)->AvailableTasks()); // The work of a delisted delegate is no longer available.
        m_delegates.erase(itr);
    }
}

//----------------------------------------------------------------------------------------------------------------------

std::shared_ptr<Scheduler::Delegate> Scheduler::Registrar::GetDelegate(Delegate::Identifier identifier) const
{
    constexpr auto projection = [] (auto const& spDelegate) -> auto { return spDelegate->GetIdentifier(); };
    if (auto const itr = std::ranges::find(m_delegates, identifier, projection); itr != m_delegates.end()) {
        return *itr;
    }
    return nullptr;
}

//----------------------------------------------------------------------------------------------------------------------

bool Scheduler::Registrar::ResolveDependencies()
{
    using RecursiveResolve = std::function<
        bool(std::shared_ptr<Delegate> const&, Delegate::Dependencies&, Delegate::Dependencies&)>;
    RecursiveResolve const resolve = [&] (auto const& spDelegate, auto& resolved, auto& unresolved) -> bool
    {
        if (!spDelegate) { return false; } // A dependency was declared on a type that was never registered.
        unresolved.emplace(spDelegate->GetIdentifier()); // Mark the current delegate as being actively resolved.
        for (auto const dependency : spDelegate->GetDependencies()) {
            if (resolved.contains(dependency)) { continue; }
            // If the dependency is also being resolved, we've encountered a cyclic dependency chain.
            if (unresolved.contains(dependency)) { return false; }
            if (!resolve(GetDelegate(dependency), resolved, unresolved)) { return false; }
        }
        resolved.emplace(spDelegate->GetIdentifier());
        unresolved.erase(spDelegate->GetIdentifier());
        return true;
    };

    // Note: Each delegate's implicit dependencies are flattened into its own dependency set.
    std::unordered_map<Delegate::Identifier, Delegate::Dependencies> store;
    for (auto const& spDelegate : m_delegates) {
        auto& resolved = store[spDelegate->GetIdentifier()];
        Delegate::Dependencies unresolved;
        if (!resolve(spDelegate, resolved, unresolved)) {
            m_logger->critical("Failed to initialize the scheduler due to an unresolvable dependency chain!");
            return false;
        }
        resolved.erase(spDelegate->GetIdentifier());
    }

    std::ranges::for_each(m_delegates, [&store] (auto& spDelegate) {
        spDelegate->Depends(std::move(store[spDelegate->GetIdentifier()]));
    });

    return true;
}

//----------------------------------------------------------------------------------------------------------------------

bool Scheduler::Registrar::UpdatePriorityOrder()
{
    // Count the number of delegates depending on each delegate.
    std::unordered_map<Delegate::Identifier, std::uint32_t> dependents;
    std::ranges::for_each(m_delegates, [&dependents] (auto const& spDelegate) {
        dependents.try_emplace(spDelegate->GetIdentifier(), 0);
        std::ranges::for_each(spDelegate->GetDependencies(), [&dependents] (auto dependency) {
            ++dependents[dependency];
        });
    });

    std::deque<std::shared_ptr<Delegate>> ready;
    std::ranges::for_each(m_delegates, [&] (auto const& spDelegate) {
        if (dependents[spDelegate->GetIdentifier()] == 0) { ready.emplace_back(spDelegate); }
    });

    Delegates resolved;
    resolved.reserve(m_delegates.size());
    while (!ready.empty()) {
        auto const& spDelegate = resolved.emplace_back(ready.front());
        ready.pop_front();
        spDelegate->SetPriority({}, m_delegates.size() - resolved.size() + 1);
        for (auto const dependency : spDelegate->GetDependencies()) {
            if (--dependents[dependency] == 0) { ready.emplace_back(GetDelegate(dependency)); }
        }
    }

    if (resolved.size() != m_delegates.size()) { return false; }

    // The most dependent delegates were resolved first, reverse the order such that they are executed last.
    std::ranges::reverse(resolved);
    m_delegates = std::move(resolved);

    return true;
}

//----------------------------------------------------------------------------------------------------------------------
