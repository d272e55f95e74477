//----------------------------------------------------------------------------------------------------------------------
// File: BeaconNode.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "BeaconNode.hpp"
#include "Components/Configuration/Parser.hpp"
#include "Components/Network/UDP/Endpoint.hpp"
#include "Components/Scheduler/Delegate.hpp"
#include "Components/Scheduler/Registrar.hpp"
#include "Components/Service/Announcer.hpp"
#include "Components/Service/Dispatcher.hpp"
#include "Components/Service/LivenessMonitor.hpp"
#include "Components/Service/Registry.hpp"
#include "Interfaces/DatagramTransport.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/spdlog.h>
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <cassert>
//----------------------------------------------------------------------------------------------------------------------

Node::Core::Core(
    std::reference_wrapper<ExecutionToken> const& token, std::unique_ptr<Configuration::Parser> const& upParser)
    : Core(token, upParser->GetNetworkOptions(), upParser->GetDiscoveryOptions())
{
    assert(upParser->Validated());
    m_startupServices = upParser->GetServices();
}

//----------------------------------------------------------------------------------------------------------------------

Node::Core::Core(
    std::reference_wrapper<ExecutionToken> const& token,
    Configuration::Options::Network const& network,
    Configuration::Options::Discovery const& discovery,
    std::shared_ptr<IDatagramTransport> const& spTransport)
    : m_token(token)
    , m_logger(spdlog::get(Logger::Name::Core.data()))
    , m_spScheduler(std::make_shared<Scheduler::Registrar>())
    , m_upRuntime()
    , m_spEventPublisher()
    , m_spRegistry()
    , m_spTransport()
    , m_spAnnouncer()
    , m_spLivenessMonitor()
    , m_spDispatcher()
    , m_spRouter()
    , m_defaultInterval(discovery.GetInterval())
    , m_startupServices()
    , m_accepting(false)
    , m_initialized(false)
{
    assert(m_logger);
    assert(Assertions::Threading::IsCoreThread());
    CreateResources(network, discovery, spTransport);
}

//----------------------------------------------------------------------------------------------------------------------

Node::Core::~Core()
{
    // Note: The ResourceShutdown status indicates the runtime must not publish to listeners that may have already
    // been destroyed.
    Shutdown(ExecutionStatus::ResourceShutdown);
}

//----------------------------------------------------------------------------------------------------------------------

bool Node::Core::IsInitialized() const noexcept { return m_initialized; }

//----------------------------------------------------------------------------------------------------------------------

bool Node::Core::IsActive() const noexcept { return m_token.get().IsExecutionActive(); }

//----------------------------------------------------------------------------------------------------------------------

bool Node::Core::IsAccepting() const noexcept { return m_accepting; }

//----------------------------------------------------------------------------------------------------------------------

bool Node::Core::AddStartupService(Configuration::Options::Service const& service)
{
    if (m_token.get().Status() != ExecutionStatus::Standby) { return false; }

    if (auto const [status, error] = service.AreOptionsAllowable(Configuration::Symbols::Services{});
        status != Configuration::StatusCode::Success) {
        m_logger->warn("Unable to add the startup service \"{}\": {}", service.GetName(), error);
        return false;
    }

    auto const itr = std::ranges::find_if(m_startupServices, [&service] (auto const& existing) {
        return existing.GetName() == service.GetName();
    });

    if (itr != m_startupServices.end()) {
        m_logger->warn("A startup service named \"{}\" has already been provided.", service.GetName());
        return false;
    }

    m_startupServices.emplace_back(service);
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

bool Node::Core::RegisterAndAnnounce(
    std::string_view name,
    boost::json::value const& data,
    std::optional<std::chrono::milliseconds> const& optInterval,
    bool available)
{
    if (!IsAcceptingRequest("register")) { return false; }
    return m_spRegistry->Register(name, data, optInterval.value_or(m_defaultInterval), available, true);
}

//----------------------------------------------------------------------------------------------------------------------

bool Node::Core::UpdateLocal(
    std::string_view name,
    boost::json::value const& data,
    std::optional<std::chrono::milliseconds> const& optInterval,
    bool available)
{
    if (!IsAcceptingRequest("update")) { return false; }

    // Without a new interval the service keeps announcing at its current cadence.
    auto interval = m_defaultInterval;
    if (optInterval) {
        interval = *optInterval;
    } else if (auto const optRecord = m_spRegistry->GetRecord(name); optRecord) {
        interval = optRecord->GetInterval();
    }

    return m_spRegistry->UpdateLocal(name, data, interval, available);
}

//----------------------------------------------------------------------------------------------------------------------

bool Node::Core::Pause(std::string_view name)
{
    if (!IsAcceptingRequest("pause")) { return false; }
    return m_spRegistry->Pause(name);
}

//----------------------------------------------------------------------------------------------------------------------

bool Node::Core::Resume(std::string_view name, std::optional<std::chrono::milliseconds> const& optInterval)
{
    if (!IsAcceptingRequest("resume")) { return false; }
    return m_spRegistry->Resume(name, optInterval);
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<boost::json::value> Node::Core::GetData(std::string_view name) const
{
    return m_spRegistry->GetData(name);
}

//----------------------------------------------------------------------------------------------------------------------

bool Node::Core::SendEvent(std::string_view eventName, boost::json::value const& data)
{
    if (!IsAcceptingRequest("send")) { return false; }
    return m_spRouter->SendEvent(eventName, data);
}

//----------------------------------------------------------------------------------------------------------------------

bool Node::Core::SendEventTo(
    Service::Destination const& destination, std::string_view eventName, boost::json::value const& data)
{
    if (!IsAcceptingRequest("send")) { return false; }
    return m_spRouter->SendEventTo(destination, eventName, data);
}

//----------------------------------------------------------------------------------------------------------------------

ExecutionStatus Node::Core::Shutdown(ExecutionStatus reason)
{
    bool const success = m_token.get().RequestStop(reason);
    if (success && m_upRuntime && m_upRuntime->Type() == RuntimeContext::Background) {
        // Note: Destroying a background runtime joins its thread. The core's components are then owned by the caller.
        m_upRuntime.reset();
        assert(Assertions::Threading::RegisterCoreThread());
    }

    return m_token.get().Status();
}

//----------------------------------------------------------------------------------------------------------------------

std::weak_ptr<Event::Publisher> Node::Core::GetEventPublisher() const { return m_spEventPublisher; }

//----------------------------------------------------------------------------------------------------------------------

std::weak_ptr<Service::Registry> Node::Core::GetRegistry() const { return m_spRegistry; }

//----------------------------------------------------------------------------------------------------------------------

void Node::Core::CreateResources(
    Configuration::Options::Network const& network,
    Configuration::Options::Discovery const& discovery,
    std::shared_ptr<IDatagramTransport> const& spTransport)
{
    m_spEventPublisher = std::make_shared<Event::Publisher>(m_spScheduler);
    m_spRegistry = std::make_shared<Service::Registry>(m_spEventPublisher);

    m_spTransport = spTransport;
    if (!m_spTransport) {
        m_spTransport = std::make_shared<Network::UDP::Endpoint>(
            network.GetProtocol(), m_spEventPublisher, network.UseReuseAddress());
    }

    auto const binding = network.GetBinding();
    auto const group = network.GetGroup();
    if (!m_spTransport->Bind(binding) || !m_spTransport->JoinMulticastGroup(group)) {
        m_logger->error("Unable to prepare the transport for {} and the group {}.", binding, group);
        return;
    }

    m_spAnnouncer = std::make_shared<Service::Announcer>(m_spScheduler, m_spRegistry, m_spTransport, group);
    m_spLivenessMonitor = std::make_shared<Service::LivenessMonitor>(
        m_spScheduler, m_spRegistry, discovery.GetTimeoutCheck());
    m_spDispatcher = std::make_shared<Service::Dispatcher>(m_spEventPublisher, m_spRegistry);
    m_spRouter = std::make_shared<Service::Router>(m_spEventPublisher, m_spRegistry, m_spTransport, group);

    m_spTransport->Register(m_spDispatcher.get());

    // Expired services are published by the monitor and should be flushed in the same cycle.
    m_spScheduler->GetDelegate<Event::Publisher>()->Depends<Service::LivenessMonitor>();

    using StopCause = Event::Message<Event::Type::EndpointStopped>::Cause;
    m_spEventPublisher->Subscribe<Event::Type::EndpointStopped>(
        [this] (Network::Address const& binding, StopCause cause) {
            if (cause == StopCause::ShutdownRequest) { return; }
            m_logger->error("The transport bound to {} stopped unexpectedly.", binding);
            OnUnexpectedError();
        });

    m_initialized = true;
}

//----------------------------------------------------------------------------------------------------------------------

ExecutionStatus Node::Core::StartComponents()
{
    if (!m_token.get().RequestStart({})) { return ExecutionStatus::AlreadyStarted; }

    assert(m_initialized);

    // Initialize the scheduler to set the priority of execution. If it fails, one of the delegates must have a
    // cyclic or missing dependency.
    if (!m_spScheduler->Initialize()) {
        m_token.get().WithdrawStart({});
        return ExecutionStatus::InitializationFailed;
    }

    // Event subscriptions are disabled after this point.
    if (!m_spEventPublisher->SubscriptionsSuspended()) { m_spEventPublisher->SuspendSubscriptions(); }

    if (!m_spTransport->Startup()) {
        m_token.get().WithdrawStart({});
        m_spEventPublisher->Dispatch(); // Deliver the binding failure to the subscribers.
        return ExecutionStatus::InitializationFailed;
    }

    m_spEventPublisher->Publish<Event::Type::RuntimeStarted>();
    m_spLivenessMonitor->Start();
    m_accepting = true;

    RegisterStartupServices();

    return ExecutionStatus::Standby;
}

//----------------------------------------------------------------------------------------------------------------------

void Node::Core::RegisterStartupServices()
{
    for (auto const& service : m_startupServices) {
        bool const registered = RegisterAndAnnounce(
            service.GetName(), service.GetData(), service.GetInterval(), service.IsAvailable());
        if (!registered) { m_logger->warn("Unable to register the startup service \"{}\".", service.GetName()); }
    }
}

//----------------------------------------------------------------------------------------------------------------------

void Node::Core::OnRuntimeStopped(ExecutionStatus status)
{
    m_accepting = false;
    m_spLivenessMonitor->Stop();
    m_spRegistry->Clear(); // Local announcements are cancelled and remote services are forgotten between cycles.
    m_spTransport->Shutdown();

    // Note: During the destruction of the core it is no longer safe to use the event publisher. Some subscribers
    // may have been destroyed.
    if (status != ExecutionStatus::ResourceShutdown) {
        using StopCause = Event::Message<Event::Type::RuntimeStopped>::Cause;
        auto const cause = (status == ExecutionStatus::UnexpectedShutdown) ?
            StopCause::UnexpectedError : StopCause::ShutdownRequest;
        m_spEventPublisher->Publish<Event::Type::RuntimeStopped>(cause);
        m_spEventPublisher->Dispatch(); // Flush remaining events to the subscribers.
    }
}

//----------------------------------------------------------------------------------------------------------------------

void Node::Core::OnUnexpectedError()
{
    // The token may have already been stopped by a prior request, in which case there is nothing left to do.
    if (m_token.get().RequestStop(ExecutionStatus::UnexpectedShutdown)) {
        m_logger->critical("An unexpected error caused the node to shutdown.");
    }
}

//----------------------------------------------------------------------------------------------------------------------

bool Node::Core::IsAcceptingRequest(std::string_view operation) const
{
    if (m_accepting) { return true; }
    m_logger->debug("Rejected a {} request while the node is not running.", operation);
    return false;
}

//----------------------------------------------------------------------------------------------------------------------
