//----------------------------------------------------------------------------------------------------------------------
// File: RuntimePolicy.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "RuntimePolicy.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include "BeaconNode.hpp"
#include "Components/Scheduler/Registrar.hpp"
#include "Utilities/Assertions.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/spdlog.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
#include <chrono>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

// Bounds the wait for work such that a withdrawn execution request is observed promptly.
constexpr auto WorkTimeout = std::chrono::milliseconds{ 100 };

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Node::IRuntimePolicy::IRuntimePolicy(Node::Core& instance, std::reference_wrapper<ExecutionToken> const& token)
    : m_instance(instance)
    , m_token(token)
{
}

//----------------------------------------------------------------------------------------------------------------------

bool Node::IRuntimePolicy::IsExecutionRequested() const
{
    return m_token.get().IsExecutionRequested();
}

//----------------------------------------------------------------------------------------------------------------------

void Node::IRuntimePolicy::SetExecutionStatus(ExecutionStatus status)
{
    m_token.get().SetStatus({}, status);
}

//----------------------------------------------------------------------------------------------------------------------

void Node::IRuntimePolicy::OnExecutionStarted()
{
    assert(Assertions::Threading::RegisterCoreThread()); // The runtime's thread now drives the core's components.
    m_instance.m_logger->debug("Starting the node's core runtime.");
    m_token.get().OnExecutionStarted({});
}

//----------------------------------------------------------------------------------------------------------------------

ExecutionStatus Node::IRuntimePolicy::OnExecutionStopped() const
{
    auto const result = m_token.get().Status();
    m_instance.m_logger->debug("Stopping the node's core runtime.");
    m_instance.OnRuntimeStopped(result); // Release the transport and timers before indicating standby.
    m_token.get().OnExecutionStopped({});
    return result;
}

//----------------------------------------------------------------------------------------------------------------------

void Node::IRuntimePolicy::ProcessEvents()
{
    // Execute the ready delegates, then sleep until either work is signalled or the next interval task is due.
    m_instance.m_spScheduler->Execute();
    m_instance.m_spScheduler->AwaitNextTask(local::WorkTimeout);
}

//----------------------------------------------------------------------------------------------------------------------

Node::ForegroundRuntime::ForegroundRuntime(Node::Core& instance, std::reference_wrapper<ExecutionToken> const& token)
    : IRuntimePolicy(instance, token)
{
}

//----------------------------------------------------------------------------------------------------------------------

RuntimeContext Node::ForegroundRuntime::Type() const
{
    return RuntimeContext::Foreground;
}

//----------------------------------------------------------------------------------------------------------------------

ExecutionStatus Node::ForegroundRuntime::Start()
{
    // Note: The loop runs until a signal handler, another thread, or an unexpected error requests a stop.
    IRuntimePolicy::OnExecutionStarted();
    while (IRuntimePolicy::IsExecutionRequested()) { IRuntimePolicy::ProcessEvents(); }
    return IRuntimePolicy::OnExecutionStopped();
}

//----------------------------------------------------------------------------------------------------------------------

Node::BackgroundRuntime::BackgroundRuntime(Node::Core& instance, std::reference_wrapper<ExecutionToken> const& token)
    : IRuntimePolicy(instance, token)
    , m_worker()
{
}

//----------------------------------------------------------------------------------------------------------------------

RuntimeContext Node::BackgroundRuntime::Type() const
{
    return RuntimeContext::Background;
}

//----------------------------------------------------------------------------------------------------------------------

ExecutionStatus Node::BackgroundRuntime::Start()
{
    IRuntimePolicy::SetExecutionStatus(ExecutionStatus::ThreadSpawned);
    m_worker = std::jthread([this] {
        IRuntimePolicy::OnExecutionStarted();
        while (IRuntimePolicy::IsExecutionRequested()) { IRuntimePolicy::ProcessEvents(); }
        IRuntimePolicy::OnExecutionStopped();
        assert(Assertions::Threading::WithdrawCoreThread());
    });

    // Unlike the foreground runtime, the stop cause is only observable through the token and the event publisher.
    return ExecutionStatus::ThreadSpawned;
}

//----------------------------------------------------------------------------------------------------------------------
