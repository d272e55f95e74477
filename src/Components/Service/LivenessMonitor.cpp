//----------------------------------------------------------------------------------------------------------------------
// File: LivenessMonitor.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "LivenessMonitor.hpp"
#include "Registry.hpp"
#include "Components/Scheduler/Delegate.hpp"
#include "Components/Scheduler/Registrar.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
//----------------------------------------------------------------------------------------------------------------------

Service::LivenessMonitor::LivenessMonitor(
    std::shared_ptr<Scheduler::Registrar> const& spRegistrar,
    std::shared_ptr<Registry> const& spRegistry,
    std::chrono::milliseconds tick)
    : m_spDelegate()
    , m_spRegistry(spRegistry)
    , m_tick(tick > std::chrono::milliseconds::zero() ? tick : DefaultTimeoutCheck)
    , m_optTask()
    , m_expired(0)
{
    assert(spRegistrar && m_spRegistry);
    m_spDelegate = spRegistrar->Register<LivenessMonitor>([] () -> std::size_t { return 0; });
}

//----------------------------------------------------------------------------------------------------------------------

Service::LivenessMonitor::~LivenessMonitor()
{
    m_spDelegate->Delist();
}

//----------------------------------------------------------------------------------------------------------------------

void Service::LivenessMonitor::Start()
{
    if (m_optTask) { return; }
    m_optTask = m_spDelegate->Schedule([this] { OnTick(); }, m_tick);
}

//----------------------------------------------------------------------------------------------------------------------

void Service::LivenessMonitor::Stop()
{
    if (!m_optTask) { return; }
    m_spDelegate->Cancel(*m_optTask);
    m_optTask.reset();
}

//----------------------------------------------------------------------------------------------------------------------

bool Service::LivenessMonitor::IsActive() const { return m_optTask.has_value(); }

//----------------------------------------------------------------------------------------------------------------------

std::chrono::milliseconds Service::LivenessMonitor::GetTick() const { return m_tick; }

//----------------------------------------------------------------------------------------------------------------------

std::size_t Service::LivenessMonitor::ExpiredServices() const { return m_expired; }

//----------------------------------------------------------------------------------------------------------------------

void Service::LivenessMonitor::OnTick()
{
    m_expired += m_spRegistry->Sweep();
}

//----------------------------------------------------------------------------------------------------------------------
