//----------------------------------------------------------------------------------------------------------------------
// File: RuntimePolicy.hpp
// Description: Drives the core's scheduler loop on the calling thread or on a dedicated worker thread.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "ExecutionToken.hpp"
#include "RuntimeContext.hpp"
#include "Utilities/ExecutionStatus.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <concepts>
#include <functional>
#include <thread>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Node {
//----------------------------------------------------------------------------------------------------------------------

class Core;
class IRuntimePolicy;
class ForegroundRuntime;
class BackgroundRuntime;

template<typename RuntimePolicy>
concept ValidRuntimePolicy = std::derived_from<RuntimePolicy, IRuntimePolicy>;

//----------------------------------------------------------------------------------------------------------------------
} // Node namespace
//----------------------------------------------------------------------------------------------------------------------

class Node::IRuntimePolicy
{
public:
    IRuntimePolicy(Core& instance, std::reference_wrapper<ExecutionToken> const& token);
    virtual ~IRuntimePolicy() = default;

    IRuntimePolicy(IRuntimePolicy const&) = delete;
    IRuntimePolicy(IRuntimePolicy&&) = delete;
    IRuntimePolicy& operator=(IRuntimePolicy const&) = delete;
    IRuntimePolicy& operator=(IRuntimePolicy&&) = delete;

    [[nodiscard]] virtual RuntimeContext Type() const = 0;
    [[nodiscard]] virtual ExecutionStatus Start() = 0;

protected:
    [[nodiscard]] bool IsExecutionRequested() const;
    void SetExecutionStatus(ExecutionStatus status);
    void OnExecutionStarted();
    ExecutionStatus OnExecutionStopped() const;
    void ProcessEvents();

    Core& m_instance;
    std::reference_wrapper<ExecutionToken> m_token;
};

//----------------------------------------------------------------------------------------------------------------------

class Node::ForegroundRuntime final : public IRuntimePolicy
{
public:
    ForegroundRuntime(Core& instance, std::reference_wrapper<ExecutionToken> const& token);
    [[nodiscard]] virtual RuntimeContext Type() const override;
    [[nodiscard]] virtual ExecutionStatus Start() override;
};

//----------------------------------------------------------------------------------------------------------------------

class Node::BackgroundRuntime final : public IRuntimePolicy
{
public:
    BackgroundRuntime(Core& instance, std::reference_wrapper<ExecutionToken> const& token);
    [[nodiscard]] virtual RuntimeContext Type() const override;
    [[nodiscard]] virtual ExecutionStatus Start() override;

private:
    std::jthread m_worker;
};

//----------------------------------------------------------------------------------------------------------------------
