//----------------------------------------------------------------------------------------------------------------------
// File: BeaconNode.hpp
// Description: The node's core. Owns the discovery components and exposes the public service operations.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "ExecutionToken.hpp"
#include "RuntimeContext.hpp"
#include "RuntimePolicy.hpp"
#include "Components/Configuration/Options.hpp"
#include "Components/Event/Events.hpp"
#include "Components/Event/Publisher.hpp"
#include "Components/Service/Router.hpp"
#include "Utilities/Assertions.hpp"
#include "Utilities/ExecutionStatus.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json/value.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <atomic>
#include <cassert>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
// Forward Declarations
//----------------------------------------------------------------------------------------------------------------------

namespace spdlog { class logger; }

namespace Configuration { class Parser; }
namespace Scheduler { class Registrar; }

namespace Service {
    class Announcer;
    class Dispatcher;
    class LivenessMonitor;
    class Registry;
}

class IDatagramTransport;

//----------------------------------------------------------------------------------------------------------------------
namespace Node {
//----------------------------------------------------------------------------------------------------------------------

class Core;

//----------------------------------------------------------------------------------------------------------------------
} // Node namespace
//----------------------------------------------------------------------------------------------------------------------

class Node::Core final
{
public:
    Core(std::reference_wrapper<ExecutionToken> const& token, std::unique_ptr<Configuration::Parser> const& upParser);

    // Note: When a transport is not provided, a UDP endpoint is created from the network options.
    Core(
        std::reference_wrapper<ExecutionToken> const& token,
        Configuration::Options::Network const& network,
        Configuration::Options::Discovery const& discovery,
        std::shared_ptr<IDatagramTransport> const& spTransport = nullptr);

    Core(Core const& other) = delete;
    Core(Core&& other) = delete;
    Core& operator=(Core const& other) = delete;
    Core& operator=(Core&& other) = delete;

    ~Core();

    // Runtime Handler {
    friend class IRuntimePolicy;
    // } Runtime Handler

    [[nodiscard]] bool IsInitialized() const noexcept;
    [[nodiscard]] bool IsActive() const noexcept;
    [[nodiscard]] bool IsAccepting() const noexcept;

    // Note: Services added while in standby are registered and announced each time the runtime starts.
    [[nodiscard]] bool AddStartupService(Configuration::Options::Service const& service);

    bool RegisterAndAnnounce(
        std::string_view name,
        boost::json::value const& data,
        std::optional<std::chrono::milliseconds> const& optInterval = {},
        bool available = true);

    bool UpdateLocal(
        std::string_view name,
        boost::json::value const& data,
        std::optional<std::chrono::milliseconds> const& optInterval = {},
        bool available = true);

    bool Pause(std::string_view name);
    bool Resume(std::string_view name, std::optional<std::chrono::milliseconds> const& optInterval = {});

    [[nodiscard]] std::optional<boost::json::value> GetData(std::string_view name) const;

    bool SendEvent(std::string_view eventName, boost::json::value const& data = nullptr);
    bool SendEventTo(
        Service::Destination const& destination,
        std::string_view eventName,
        boost::json::value const& data = nullptr);

    template<Event::Type SpecificType>
    bool Subscribe(typename Event::Message<SpecificType>::CallbackTrait const& callback);

    template<ValidRuntimePolicy RuntimePolicy = ForegroundRuntime>
    [[nodiscard]] ExecutionStatus Startup();

    ExecutionStatus Shutdown(ExecutionStatus reason = ExecutionStatus::RequestedShutdown);

    [[nodiscard]] std::weak_ptr<Event::Publisher> GetEventPublisher() const;
    [[nodiscard]] std::weak_ptr<Service::Registry> GetRegistry() const;

private:
    void CreateResources(
        Configuration::Options::Network const& network,
        Configuration::Options::Discovery const& discovery,
        std::shared_ptr<IDatagramTransport> const& spTransport);

    [[nodiscard]] ExecutionStatus StartComponents();
    void RegisterStartupServices();
    void OnRuntimeStopped(ExecutionStatus status);
    void OnUnexpectedError();

    [[nodiscard]] bool IsAcceptingRequest(std::string_view operation) const;

    std::reference_wrapper<ExecutionToken> m_token;
    std::shared_ptr<spdlog::logger> m_logger;
    std::shared_ptr<Scheduler::Registrar> m_spScheduler;
    std::unique_ptr<IRuntimePolicy> m_upRuntime;

    std::shared_ptr<Event::Publisher> m_spEventPublisher;
    std::shared_ptr<Service::Registry> m_spRegistry;
    std::shared_ptr<IDatagramTransport> m_spTransport;
    std::shared_ptr<Service::Announcer> m_spAnnouncer;
    std::shared_ptr<Service::LivenessMonitor> m_spLivenessMonitor;
    std::shared_ptr<Service::Dispatcher> m_spDispatcher;
    std::shared_ptr<Service::Router> m_spRouter;

    std::chrono::milliseconds m_defaultInterval;
    Configuration::Options::Services m_startupServices;
    std::atomic_bool m_accepting;
    bool m_initialized;
};

//----------------------------------------------------------------------------------------------------------------------

template<Event::Type SpecificType>
bool Node::Core::Subscribe(typename Event::Message<SpecificType>::CallbackTrait const& callback)
{
    // Subscriptions are only accepted before the first start of the runtime.
    return m_spEventPublisher->Subscribe<SpecificType>(callback);
}

//----------------------------------------------------------------------------------------------------------------------

template<Node::ValidRuntimePolicy RuntimePolicy>
ExecutionStatus Node::Core::Startup()
{
    if (!m_initialized) { return ExecutionStatus::InitializationFailed; }
    if (m_token.get().Status() != ExecutionStatus::Standby) { return ExecutionStatus::AlreadyStarted; }
    m_upRuntime.reset(); // A background runtime that stopped on its own is released before starting again.

    // If we fail to prepare for the execution, return the reason why.
    if (auto const result = StartComponents(); result != ExecutionStatus::Standby) { return result; }

    m_upRuntime = std::make_unique<RuntimePolicy>(*this, m_token);
    ExecutionStatus const result = m_upRuntime->Start();
    if (result != ExecutionStatus::ThreadSpawned) {
        // Note: Anything other than a spawned thread indicates the runtime has already completed its execution. The
        // runtime is no longer needed and a subsequent start should be possible.
        m_upRuntime.reset();
    }

    return result;
}

//----------------------------------------------------------------------------------------------------------------------
