//----------------------------------------------------------------------------------------------------------------------
// File: ExecutionToken.hpp
// Description: Shared view of the core's execution status. Start and stop transitions are atomic.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Utilities/ExecutionStatus.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <atomic>
#include <cassert>
#include <cstdint>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Node {
//----------------------------------------------------------------------------------------------------------------------

class Core;
class IRuntimePolicy;

class ExecutionToken;

//----------------------------------------------------------------------------------------------------------------------
} // Node namespace
//----------------------------------------------------------------------------------------------------------------------

class Node::ExecutionToken
{
private:
    // Note: Only a runtime policy may move the token between the standby and executing states.
    class RuntimeKey { public: friend class IRuntimePolicy; private: RuntimeKey() = default; };

    // Note: Only the core may request a start, it is responsible for providing the runtime that services it.
    class StartKey { public: friend class Core; private: StartKey() = default; };

public:
    constexpr ExecutionToken() noexcept
        : m_requested(false)
        , m_status(ExecutionStatus::Standby)
    {
    }

    ExecutionToken(ExecutionToken const&) = delete;
    ExecutionToken& operator=(ExecutionToken const&) = delete;

    [[nodiscard]] ExecutionStatus Status() const { return m_status; }
    [[nodiscard]] bool IsExecutionActive() const { return m_status == ExecutionStatus::Executing; }
    [[nodiscard]] bool IsExecutionRequested() const { return m_requested; }

    [[nodiscard]] bool RequestStart([[maybe_unused]] StartKey key)
    {
        if (m_status != ExecutionStatus::Standby) { return false; }
        bool expected = false;
        return m_requested.compare_exchange_strong(expected, true); // A concurrent start request must lose.
    }

    // Note: Withdraws a start request when the core fails to prepare its resources before a runtime was created.
    void WithdrawStart([[maybe_unused]] StartKey key)
    {
        assert(m_status == ExecutionStatus::Standby);
        m_requested = false;
    }

    // Note: The reason is reported until the runtime has finished cleaning up and returns to standby. A stop may be
    // requested while a runtime thread is still being spawned.
    [[nodiscard]] bool RequestStop(ExecutionStatus reason = ExecutionStatus::RequestedShutdown)
    {
        auto expected = m_status.load();
        do {
            if (expected != ExecutionStatus::Executing && expected != ExecutionStatus::ThreadSpawned) { return false; }
        } while (!m_status.compare_exchange_weak(expected, reason));
        m_requested = false; // The runtime leaves its event loop once the request has been withdrawn.
        return true;
    }

    void SetStatus([[maybe_unused]] RuntimeKey key, ExecutionStatus status) { m_status = status; }

    void OnExecutionStarted([[maybe_unused]] RuntimeKey key)
    {
        // A stop requested while the runtime thread was spawning takes precedence over the start.
        auto expected = ExecutionStatus::ThreadSpawned;
        if (m_status.compare_exchange_strong(expected, ExecutionStatus::Executing)) { return; }
        if (expected == ExecutionStatus::Standby) { m_status = ExecutionStatus::Executing; }
    }

    void OnExecutionStopped([[maybe_unused]] RuntimeKey key) { m_status = ExecutionStatus::Standby; }

private:
    std::atomic_bool m_requested;
    std::atomic<ExecutionStatus> m_status;
};

//----------------------------------------------------------------------------------------------------------------------
