//----------------------------------------------------------------------------------------------------------------------
// File: Registrar.hpp
// Description: The core runtime's work registry. Components register a delegate per type, signal available work
// through it, and the registrar executes the delegates in dependency order on each cycle of the runtime.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Delegate.hpp"
#include "Utilities/Assertions.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <atomic>
#include <cassert>
#include <chrono>
#include <concepts>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <type_traits>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

namespace spdlog { class logger; }

//----------------------------------------------------------------------------------------------------------------------
namespace Scheduler {
//----------------------------------------------------------------------------------------------------------------------

class Sentinel;
class Registrar;

//----------------------------------------------------------------------------------------------------------------------
} // Scheduler namespace
//----------------------------------------------------------------------------------------------------------------------

class Scheduler::Sentinel
{
public:
    Sentinel();
    virtual ~Sentinel() = default;

    virtual void Delist(Delegate::Identifier identifier) = 0;

    // Note: Returns false when the wait was skipped because work was already available.
    bool AwaitTask(std::chrono::milliseconds timeout);
    [[nodiscard]] std::size_t AvailableTasks() const;
    void OnTaskAvailable(std::size_t available);
    void OnTaskCompleted(std::size_t completed);
    void OnTaskScheduled();

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_waiter;
    std::atomic_size_t m_available;
    std::atomic_bool m_interrupted;
};

//----------------------------------------------------------------------------------------------------------------------

class Scheduler::Registrar final : public Scheduler::Sentinel
{
public:
    using Delegates = std::vector<std::shared_ptr<Delegate>>;

    Registrar();

    [[nodiscard]] bool Initialize();
    std::size_t Execute(TimePoint const& now = Clock::now());

    // Note: Waits for signalled work, bounded by the provided timeout and the earliest scheduled task deadline.
    bool AwaitNextTask(std::chrono::milliseconds timeout);
    [[nodiscard]] std::optional<TimePoint> GetNextDeadline() const;

    template<typename ServiceType> requires std::is_class_v<ServiceType>
    std::shared_ptr<Delegate> Register(OnExecute const& callback);

    template<typename ServiceType> requires std::is_class_v<ServiceType>
    [[nodiscard]] std::shared_ptr<Delegate> GetDelegate() const;

    // Sentinel {
    virtual void Delist(Delegate::Identifier identifier) override;
    // } Sentinel

private:
    [[nodiscard]] std::shared_ptr<Delegate> GetDelegate(Delegate::Identifier identifier) const;
    [[nodiscard]] bool ResolveDependencies();
    [[nodiscard]] bool UpdatePriorityOrder();

    std::shared_ptr<spdlog::logger> m_logger;
    Delegates m_delegates;
    bool m_initialized;
};

//----------------------------------------------------------------------------------------------------------------------

template<typename ServiceType> requires std::is_class_v<ServiceType>
std::shared_ptr<Scheduler::Delegate> Scheduler::Registrar::Register(OnExecute const& callback)
{
    assert(Assertions::Threading::IsCoreThread());
    assert(!GetDelegate<ServiceType>()); // Currently, only one delegate per service type is supported.
    m_initialized = false; // The priority order must be recomputed to account for the new delegate.
    return m_delegates.emplace_back(std::make_shared<Delegate>(typeid(ServiceType).hash_code(), callback, this));
}

//----------------------------------------------------------------------------------------------------------------------

template<typename ServiceType> requires std::is_class_v<ServiceType>
std::shared_ptr<Scheduler::Delegate> Scheduler::Registrar::GetDelegate() const
{
    return GetDelegate(typeid(ServiceType).hash_code());
}

//----------------------------------------------------------------------------------------------------------------------
