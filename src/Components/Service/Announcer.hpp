//----------------------------------------------------------------------------------------------------------------------
// File: Announcer.hpp
// Description: Periodically broadcasts the state of each local service to the multicast group. Every service being
// announced owns an interval task on the announcer's scheduler delegate.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Network/Address.hpp"
#include "Components/Scheduler/Tasks.hpp"
#include "Interfaces/AnnouncementScheduler.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
//----------------------------------------------------------------------------------------------------------------------

class IDatagramTransport;

namespace spdlog { class logger; }
namespace Scheduler { class Delegate; class Registrar; }

//----------------------------------------------------------------------------------------------------------------------
namespace Service {
//----------------------------------------------------------------------------------------------------------------------

class Announcer;
class Registry;

//----------------------------------------------------------------------------------------------------------------------
} // Service namespace
//----------------------------------------------------------------------------------------------------------------------

class Service::Announcer final : public IAnnouncementScheduler
{
public:
    Announcer(
        std::shared_ptr<Scheduler::Registrar> const& spRegistrar,
        std::shared_ptr<Registry> const& spRegistry,
        std::shared_ptr<IDatagramTransport> const& spTransport,
        Network::Address const& group);

    ~Announcer();

    Announcer(Announcer const&) = delete;
    Announcer(Announcer&&) = delete;
    Announcer& operator=(Announcer const&) = delete;
    Announcer& operator=(Announcer&&) = delete;

    // IAnnouncementScheduler {
    [[nodiscard]] virtual std::optional<Scheduler::TaskIdentifier> ScheduleAnnouncements(
        std::string const& name, std::chrono::milliseconds interval) override;
    virtual bool CancelAnnouncements(Scheduler::TaskIdentifier const& identifier) override;
    // } IAnnouncementScheduler

    [[nodiscard]] std::size_t ActiveAnnouncements() const;
    [[nodiscard]] std::size_t SentAnnouncements() const;

    // Note: Broadcasts the service's current state if the task is still the service's active announcement task.
    bool Announce(std::string const& name, Scheduler::TaskIdentifier const& task);

private:
    std::shared_ptr<spdlog::logger> m_logger;
    std::shared_ptr<Scheduler::Delegate> m_spDelegate;
    std::shared_ptr<Registry> m_spRegistry;
    std::shared_ptr<IDatagramTransport> m_spTransport;
    Network::Address const m_group;
    std::atomic_size_t m_sent;
};

//----------------------------------------------------------------------------------------------------------------------
