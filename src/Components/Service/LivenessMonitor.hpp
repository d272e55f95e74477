//----------------------------------------------------------------------------------------------------------------------
// File: LivenessMonitor.hpp
// Description: Sweeps the registry on a fixed tick, removing the services that have stopped announcing.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Scheduler/Tasks.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
//----------------------------------------------------------------------------------------------------------------------

namespace Scheduler { class Delegate; class Registrar; }

//----------------------------------------------------------------------------------------------------------------------
namespace Service {
//----------------------------------------------------------------------------------------------------------------------

class LivenessMonitor;
class Registry;

constexpr std::chrono::milliseconds DefaultTimeoutCheck{ 1000 };

//----------------------------------------------------------------------------------------------------------------------
} // Service namespace
//----------------------------------------------------------------------------------------------------------------------

class Service::LivenessMonitor
{
public:
    LivenessMonitor(
        std::shared_ptr<Scheduler::Registrar> const& spRegistrar,
        std::shared_ptr<Registry> const& spRegistry,
        std::chrono::milliseconds tick = DefaultTimeoutCheck);

    ~LivenessMonitor();

    LivenessMonitor(LivenessMonitor const&) = delete;
    LivenessMonitor(LivenessMonitor&&) = delete;
    LivenessMonitor& operator=(LivenessMonitor const&) = delete;
    LivenessMonitor& operator=(LivenessMonitor&&) = delete;

    void Start();
    void Stop();
    [[nodiscard]] bool IsActive() const;

    [[nodiscard]] std::chrono::milliseconds GetTick() const;
    [[nodiscard]] std::size_t ExpiredServices() const;

private:
    void OnTick();

    std::shared_ptr<Scheduler::Delegate> m_spDelegate;
    std::shared_ptr<Registry> m_spRegistry;
    std::chrono::milliseconds const m_tick;
    std::optional<Scheduler::TaskIdentifier> m_optTask;
    std::atomic_size_t m_expired;
};

//----------------------------------------------------------------------------------------------------------------------
