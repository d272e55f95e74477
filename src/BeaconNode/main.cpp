//----------------------------------------------------------------------------------------------------------------------
// File: main.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "BeaconNode.hpp"
#include "ExecutionToken.hpp"
#include "RuntimePolicy.hpp"
#include "StartupOptions.hpp"
#include "Components/Configuration/Options.hpp"
#include "Components/Configuration/Parser.hpp"
#include "Components/Event/Events.hpp"
#include "Components/Service/Record.hpp"
#include "Utilities/Assertions.hpp"
#include "Utilities/ExecutionStatus.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/core/quick_exit.hpp>
#include <boost/json/serialize.hpp>
#include <spdlog/spdlog.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <tuple>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace Signal {
//----------------------------------------------------------------------------------------------------------------------

Node::ExecutionToken ExecutionToken;

extern "C" void OnShutdownRequested(std::int32_t signal);

//----------------------------------------------------------------------------------------------------------------------
} // Signal namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Startup {
//----------------------------------------------------------------------------------------------------------------------

using AnnouncedService = std::optional<Configuration::Options::Service>;
using Resources = std::tuple<ParseCode, std::unique_ptr<Configuration::Parser>, AnnouncedService>;

Resources InitializeResources(std::int32_t argc, char** argv);
void SubscribeToServiceEvents(Node::Core& core);

//----------------------------------------------------------------------------------------------------------------------
} // Startup namespace
//----------------------------------------------------------------------------------------------------------------------

extern "C" void Signal::OnShutdownRequested(std::int32_t signal)
{
    // If the node hasn't started yet there is no additional cleanup required (std::exit() is not signal safe).
    if (!ExecutionToken.IsExecutionActive()) { boost::quick_exit(signal); }
    // SIGINT and SIGTERM are considered expected shutdown signals.
    [[maybe_unused]] bool const result = ExecutionToken.RequestStop();
}

//----------------------------------------------------------------------------------------------------------------------

std::int32_t main(std::int32_t argc, char** argv)
{
    // Set the core thread such that the core's resources can assert during initialization.
    assert(Assertions::Threading::RegisterCoreThread());

    if (SIG_ERR == std::signal(SIGINT, Signal::OnShutdownRequested)) { return 1; }
    if (SIG_ERR == std::signal(SIGTERM, Signal::OnShutdownRequested)) { return 1; }

    auto const [code, upParser, optAnnounced] = Startup::InitializeResources(argc, argv);
    switch (code) {
        case Startup::ParseCode::Success: assert(upParser); break;
        case Startup::ParseCode::ExitRequested: return 0;
        case Startup::ParseCode::Malformed: return 1;
    }

    auto const logger = spdlog::get(Logger::Name::Core.data());
    logger->info("Starting the beacon on {}.", upParser->GetNetworkOptions().GetGroup());

    Node::Core core(Signal::ExecutionToken, upParser);
    if (!core.IsInitialized()) {
        logger->critical("Failed to initialize core resources!");
        return 1;
    }

    if (optAnnounced && !core.AddStartupService(*optAnnounced)) {
        logger->critical("Unable to announce the service \"{}\"!", optAnnounced->GetName());
        return 1;
    }

    Startup::SubscribeToServiceEvents(core);

    auto const status = core.Startup<Node::ForegroundRuntime>(); // The runtime blocks until execution completes.
    switch (status) {
        case ExecutionStatus::RequestedShutdown: break;
        case ExecutionStatus::InitializationFailed: {
            logger->critical("Failed to start the core's components!");
            return 1;
        }
        case ExecutionStatus::UnexpectedShutdown: {
            logger->critical("An unexpected error caused the node to shutdown!");
            return 1;
        }
        // Currently, only the explicit status cases are expected for a foreground process.
        default: assert(false); return 1;
    }

    return 0;
}

//----------------------------------------------------------------------------------------------------------------------

Startup::Resources Startup::InitializeResources(std::int32_t argc, char** argv)
{
    Options options;
    switch (options.Parse(argc, argv)) {
        case ParseCode::Success: break;
        case ParseCode::ExitRequested: return { ParseCode::ExitRequested, nullptr, {} };
        default: {
            std::cout << "Unable to parse startup options!" << std::endl;
            return { ParseCode::Malformed, nullptr, {} };
        }
    }

    Logger::Initialize(options.GetVerbosity(), true);
    auto const logger = spdlog::get(Logger::Name::Core.data()); // From here on we should use the logger for errors.

    auto upParser = std::make_unique<Configuration::Parser>(options.GetConfigPath(), options);
    if (auto const [status, error] = upParser->FetchOptions(); status != Configuration::StatusCode::Success) {
        logger->critical("Unable to read the configuration file: {}", error);
        return { ParseCode::Malformed, nullptr, {} };
    }

    return { ParseCode::Success, std::move(upParser), options.GetAnnouncedService() };
}

//----------------------------------------------------------------------------------------------------------------------

void Startup::SubscribeToServiceEvents(Node::Core& core)
{
    auto const logger = spdlog::get(Logger::Name::Core.data());

    core.Subscribe<Event::Type::ServiceAvailable>(
        [logger] (std::string const& name, Service::Record const& record, Service::Reason reason) {
            logger->info(
                "Service \"{}\" is available ({}): {}",
                name, Service::ReasonToString(reason), boost::json::serialize(record.GetData()));
        });

    core.Subscribe<Event::Type::ServiceUnavailable>(
        [logger] (std::string const& name, [[maybe_unused]] Service::Record const& record, Service::Reason reason) {
            logger->info("Service \"{}\" is unavailable ({}).", name, Service::ReasonToString(reason));
        });

    core.Subscribe<Event::Type::MessageBus>(
        [logger] (std::string const& event, boost::json::value const& data) {
            logger->info("Received the event \"{}\": {}", event, boost::json::serialize(data));
        });
}

//----------------------------------------------------------------------------------------------------------------------
