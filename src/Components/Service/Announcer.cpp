//----------------------------------------------------------------------------------------------------------------------
// File: Announcer.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Announcer.hpp"
#include "Registry.hpp"
#include "Components/Message/Codec.hpp"
#include "Components/Scheduler/Delegate.hpp"
#include "Components/Scheduler/Registrar.hpp"
#include "Interfaces/DatagramTransport.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
//----------------------------------------------------------------------------------------------------------------------

Service::Announcer::Announcer(
    std::shared_ptr<Scheduler::Registrar> const& spRegistrar,
    std::shared_ptr<Registry> const& spRegistry,
    std::shared_ptr<IDatagramTransport> const& spTransport,
    Network::Address const& group)
    : m_logger(spdlog::get(Logger::Name::Core.data()))
    , m_spDelegate()
    , m_spRegistry(spRegistry)
    , m_spTransport(spTransport)
    , m_group(group)
    , m_sent(0)
{
    assert(m_logger);
    assert(spRegistrar && m_spRegistry && m_spTransport);
    // The announcer has no queued work, its delegate only carries the interval tasks of the announced services.
    m_spDelegate = spRegistrar->Register<Announcer>([] () -> std::size_t { return 0; });
    m_spRegistry->Register(this);
}

//----------------------------------------------------------------------------------------------------------------------

Service::Announcer::~Announcer()
{
    m_spRegistry->Register(nullptr);
    m_spDelegate->Delist();
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Scheduler::TaskIdentifier> Service::Announcer::ScheduleAnnouncements(
    std::string const& name, std::chrono::milliseconds interval)
{
    assert(interval > std::chrono::milliseconds::zero());

    // The task is provided its own identifier such that a superseded task can recognize it no longer owns the service.
    Scheduler::TaskIdentifier const identifier;
    bool const scheduled = m_spDelegate->Schedule(
        identifier, [this, name, identifier] { Announce(name, identifier); }, interval);
    if (!scheduled) { return {}; }

    m_logger->debug("Announcing \"{}\" every {}ms.", name, interval.count());
    return identifier;
}

//----------------------------------------------------------------------------------------------------------------------

bool Service::Announcer::CancelAnnouncements(Scheduler::TaskIdentifier const& identifier)
{
    return m_spDelegate->Cancel(identifier);
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Service::Announcer::ActiveAnnouncements() const { return m_spDelegate->ScheduledTasks(); }

//----------------------------------------------------------------------------------------------------------------------

std::size_t Service::Announcer::SentAnnouncements() const { return m_sent; }

//----------------------------------------------------------------------------------------------------------------------

bool Service::Announcer::Announce(std::string const& name, Scheduler::TaskIdentifier const& task)
{
    auto const optAnnouncement = m_spRegistry->GetAnnouncement(name, task);
    if (!optAnnouncement) { return false; } // The service was removed or its announcements were superseded.

    try {
        auto const buffer = Message::Encode(*optAnnouncement);
        if (!m_spTransport->Send(buffer, m_group)) {
            m_logger->error("Failed to send the announcement for \"{}\" to {}.", name, m_group);
            return false;
        }
    } catch (std::exception const& exception) {
        m_logger->error("Failed to encode the announcement for \"{}\": {}", name, exception.what());
        return false;
    }

    ++m_sent;
    m_logger->trace("Sent the announcement for \"{}\".", name);
    return true;
}

//----------------------------------------------------------------------------------------------------------------------
