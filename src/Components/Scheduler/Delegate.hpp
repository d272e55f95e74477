//----------------------------------------------------------------------------------------------------------------------
// File: Delegate.hpp
// Description: A component's registration with the scheduler. The delegate tracks the component's queued units of
// work and owns the interval tasks the component has scheduled.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Tasks.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <typeinfo>
#include <unordered_map>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Scheduler {
//----------------------------------------------------------------------------------------------------------------------

using OnExecute = std::function<std::size_t()>;

class Delegate;
class Sentinel;

//----------------------------------------------------------------------------------------------------------------------
} // Scheduler namespace
//----------------------------------------------------------------------------------------------------------------------

class Scheduler::Delegate
{
public:
    using Identifier = std::size_t;
    using Dependencies = std::set<Identifier>;

    // Note: Only the registrar should be used to set the priority and execute the delegate.
    class ExecuteKey { public: friend class Registrar; private: ExecuteKey() = default; };

    Delegate(Identifier identifier, OnExecute const& callback, Sentinel* const sentinel);

    Delegate(Delegate const&) = delete;
    Delegate& operator=(Delegate const&) = delete;

    [[nodiscard]] Identifier GetIdentifier() const;
    [[nodiscard]] std::size_t GetPriority() const;
    [[nodiscard]] std::size_t AvailableTasks() const;
    [[nodiscard]] std::size_t ScheduledTasks() const;
    [[nodiscard]] std::optional<TimePoint> GetNextDeadline() const;
    [[nodiscard]] Dependencies const& GetDependencies() const;

    void OnTaskAvailable(std::size_t available = 1);
    // Note: Settles work that was completed outside of the registrar's execution cycle.
    void OnTaskCompleted(std::size_t completed);
    void SetPriority(ExecuteKey key, std::size_t priority);

    // Note: Scheduling and cancellation may occur from any thread. The callback is invoked on the core thread
    // without the delegate's lock held, so it may schedule or cancel tasks itself.
    TaskIdentifier Schedule(IntervalTask::Callback const& callback, Interval const& interval);
    // Note: Allows the callback to capture the identifier of its own task. Fails if the identifier is in use.
    bool Schedule(TaskIdentifier const& identifier, IntervalTask::Callback const& callback, Interval const& interval);
    bool Cancel(TaskIdentifier const& identifier);
    void CancelAll();

    [[nodiscard]] std::size_t Execute(ExecuteKey key, TimePoint const& now);

    // Note: When a delegate requires the latest execution state of another delegate in the same cycle, it should
    // declare the dependency such that it is executed afterwards. For example, the event publisher should dispatch
    // the notifications produced by the liveness sweep in the cycle the sweep ran.
    void Depends(Dependencies&& dependencies);

    template<typename... ServiceTypes>
    void Depends() { Depends(Dependencies{ typeid(ServiceTypes).hash_code()... }); }

    void Delist();

private:
    using TaskContainer = std::unordered_map<TaskIdentifier, std::unique_ptr<IntervalTask>, TaskIdentifierHasher>;

    Identifier const m_identifier;
    std::size_t m_priority;
    std::atomic_size_t m_available;
    OnExecute const m_execute;

    mutable std::mutex m_tasksMutex;
    TaskContainer m_tasks;

    Dependencies m_dependencies;
    Sentinel* const m_sentinel;
};

//----------------------------------------------------------------------------------------------------------------------
