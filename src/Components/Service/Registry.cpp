//----------------------------------------------------------------------------------------------------------------------
// File: Registry.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Registry.hpp"
#include "Components/Event/Publisher.hpp"
#include "Interfaces/AnnouncementScheduler.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
#include <mutex>
//----------------------------------------------------------------------------------------------------------------------

Service::Registry::Registry(Event::SharedPublisher const& spEventPublisher, TimeSource const& source)
    : m_logger(spdlog::get(Logger::Name::Core.data()))
    , m_spEventPublisher(spEventPublisher)
    , m_source(source)
    , m_pAnnouncementScheduler(nullptr)
    , m_mutex()
    , m_records()
{
    assert(m_logger);
    assert(m_spEventPublisher);
    assert(m_source);
}

//----------------------------------------------------------------------------------------------------------------------

Service::Registry::~Registry()
{
    Clear();
}

//----------------------------------------------------------------------------------------------------------------------

void Service::Registry::Register(IAnnouncementScheduler* const pAnnouncementScheduler)
{
    std::unique_lock lock(m_mutex);
    m_pAnnouncementScheduler = pAnnouncementScheduler;
}

//----------------------------------------------------------------------------------------------------------------------

bool Service::Registry::Register(
    std::string_view name,
    boost::json::value const& data,
    std::chrono::milliseconds interval,
    bool available,
    bool local,
    std::optional<Network::Address> const& optAddress)
{
    std::unique_lock lock(m_mutex);
    return Emplace(name, data, interval, available, local, optAddress);
}

//----------------------------------------------------------------------------------------------------------------------

bool Service::Registry::UpsertFromRemote(
    std::string_view name,
    boost::json::value const& data,
    std::chrono::milliseconds interval,
    bool available,
    std::optional<Network::Address> const& optAddress)
{
    if (name.empty()) {
        m_logger->debug("Rejected an announcement that did not provide a service name.");
        return false;
    }

    std::unique_lock lock(m_mutex);
    auto const itr = m_records.find(std::string{ name });
    if (itr == m_records.end()) { return Emplace(name, data, interval, available, false, optAddress); }

    auto& record = itr->second;
    record.m_seen = m_source();

    // Note: A local service's state is owned by this node. Its looped back announcements may predate the latest
    // local update, so they only serve to keep the service alive.
    if (record.IsLocal()) {
        if (!record.m_optAddress && optAddress) { record.m_optAddress = optAddress; }
        return true;
    }

    // An announcement without data refreshes the service, but does not clear the data it was last seen with.
    Update(record, data.is_null() ? record.m_data : data, interval, available, optAddress);
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

bool Service::Registry::UpdateLocal(
    std::string_view name, boost::json::value const& data, std::chrono::milliseconds interval, bool available)
{
    if (name.empty() || data.is_null()) {
        m_logger->debug("Rejected a service update that did not provide a name and data.");
        return false;
    }

    std::unique_lock lock(m_mutex);
    auto const itr = m_records.find(std::string{ name });
    if (itr == m_records.end()) {
        m_logger->debug("Rejected an update for the unknown service \"{}\".", name);
        return false;
    }

    auto& record = itr->second;
    auto const previous = record.m_interval;
    Update(record, data, interval, available, {});

    // The broadcast cadence follows the service's interval, otherwise peers may time out a service that was updated
    // to announce more frequently.
    if (record.IsAnnouncing() && record.m_interval != previous) {
        StopAnnouncements(record);
        StartAnnouncements(record);
    }

    return true;
}

//----------------------------------------------------------------------------------------------------------------------

bool Service::Registry::Pause(std::string_view name)
{
    std::unique_lock lock(m_mutex);
    auto const itr = m_records.find(std::string{ name });
    if (itr == m_records.end() || !itr->second.IsAnnouncing()) {
        m_logger->debug("Unable to pause \"{}\", the service is not being announced.", name);
        return false;
    }

    StopAnnouncements(itr->second);
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

bool Service::Registry::Resume(std::string_view name, std::optional<std::chrono::milliseconds> const& optInterval)
{
    std::unique_lock lock(m_mutex);
    auto const itr = m_records.find(std::string{ name });
    if (itr == m_records.end() || itr->second.IsAnnouncing()) {
        m_logger->debug("Unable to resume \"{}\", the service is unknown or already being announced.", name);
        return false;
    }

    auto& record = itr->second;
    if (optInterval) { record.m_interval = ValidateInterval(*optInterval); }
    StartAnnouncements(record);
    return record.IsAnnouncing();
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<boost::json::value> Service::Registry::GetData(std::string_view name) const
{
    std::shared_lock lock(m_mutex);
    if (auto const itr = m_records.find(std::string{ name }); itr != m_records.end()) { return itr->second.m_data; }
    return {};
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Service::Record> Service::Registry::GetRecord(std::string_view name) const
{
    std::shared_lock lock(m_mutex);
    if (auto const itr = m_records.find(std::string{ name }); itr != m_records.end()) { return itr->second; }
    return {};
}

//----------------------------------------------------------------------------------------------------------------------

bool Service::Registry::Contains(std::string_view name) const
{
    std::shared_lock lock(m_mutex);
    return m_records.contains(std::string{ name });
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Service::Registry::Count() const
{
    std::shared_lock lock(m_mutex);
    return m_records.size();
}

//----------------------------------------------------------------------------------------------------------------------

void Service::Registry::ForEach(ReadCallback const& callback) const
{
    std::shared_lock lock(m_mutex);
    for (auto const& [name, record] : m_records) {
        if (callback(record) != CallbackIteration::Continue) { break; }
    }
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Service::Registry::Sweep(Scheduler::TimePoint const& now)
{
    std::unique_lock lock(m_mutex);
    if (m_records.empty()) {
        m_logger->trace("Skipping the liveness sweep, no services are known.");
        return 0;
    }

    // The removal and the timeout notification occur under the same lock, no reader may observe one without the
    // other. The record's data is left as it was last announced, only the snapshot's availability is cleared.
    std::size_t const removed = std::erase_if(m_records, [&] (auto& entry) -> bool {
        auto& [name, record] = entry;
        if (!record.IsExpired(now)) { return false; }
        StopAnnouncements(record);
        Record snapshot = record;
        snapshot.m_available = false;
        m_logger->info("The service \"{}\" has timed out.", name);
        m_spEventPublisher->Publish<Event::Type::ServiceUnavailable>(name, snapshot, Reason::TimedOut);
        return true;
    });

    return removed;
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Service::Registry::Sweep() { return Sweep(m_source()); }

//----------------------------------------------------------------------------------------------------------------------

std::optional<Message::AnnouncementParcel> Service::Registry::GetAnnouncement(
    std::string_view name, Scheduler::TaskIdentifier const& task) const
{
    std::shared_lock lock(m_mutex);
    auto const itr = m_records.find(std::string{ name });
    if (itr == m_records.end()) { return {}; }

    auto const& record = itr->second;
    if (!record.m_optTask || *record.m_optTask != task) { return {}; }

    return Message::AnnouncementParcel{ record.m_name, record.m_data, record.m_interval, record.m_available };
}

//----------------------------------------------------------------------------------------------------------------------

void Service::Registry::Clear()
{
    std::unique_lock lock(m_mutex);
    for (auto& [name, record] : m_records) { StopAnnouncements(record); }
    m_records.clear();
}

//----------------------------------------------------------------------------------------------------------------------

bool Service::Registry::Emplace(
    std::string_view name,
    boost::json::value const& data,
    std::chrono::milliseconds interval,
    bool available,
    bool local,
    std::optional<Network::Address> const& optAddress)
{
    if (name.empty() || data.is_null()) {
        m_logger->debug("Rejected a service registration that did not provide a name and data.");
        return false;
    }

    auto const [itr, emplaced] = m_records.try_emplace(
        std::string{ name }, name, data, interval, available, local, optAddress, m_source());
    if (!emplaced) {
        m_logger->debug("Rejected the registration of \"{}\", the service is already known.", name);
        return false;
    }

    auto& record = itr->second;
    if (local) { StartAnnouncements(record); }

    m_logger->debug("Registered the {} service \"{}\".", local ? "local" : "remote", name);
    PublishAvailability(record, Reason::New);
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

void Service::Registry::Update(
    Record& record,
    boost::json::value const& data,
    std::chrono::milliseconds interval,
    bool available,
    std::optional<Network::Address> const& optAddress)
{
    record.m_data = data;
    record.m_interval = ValidateInterval(interval);

    // The origin of a service is captured from the first announcement that carries one and is never replaced.
    if (!record.m_optAddress && optAddress) { record.m_optAddress = optAddress; }

    if (record.m_available != available) {
        record.m_available = available;
        PublishAvailability(record, Reason::AvailabilityChange);
    }
}

//----------------------------------------------------------------------------------------------------------------------

void Service::Registry::StartAnnouncements(Record& record)
{
    assert(!record.m_optTask);
    if (!m_pAnnouncementScheduler) { return; }
    record.m_optTask = m_pAnnouncementScheduler->ScheduleAnnouncements(record.m_name, record.m_interval);
    if (!record.m_optTask) { m_logger->error("Failed to schedule the announcements for \"{}\".", record.m_name); }
}

//----------------------------------------------------------------------------------------------------------------------

void Service::Registry::StopAnnouncements(Record& record)
{
    if (!record.m_optTask) { return; }
    if (m_pAnnouncementScheduler) { m_pAnnouncementScheduler->CancelAnnouncements(*record.m_optTask); }
    record.m_optTask.reset();
}

//----------------------------------------------------------------------------------------------------------------------

void Service::Registry::PublishAvailability(Record const& record, Reason reason) const
{
    if (record.m_available) {
        m_spEventPublisher->Publish<Event::Type::ServiceAvailable>(record.m_name, record, reason);
    } else {
        m_spEventPublisher->Publish<Event::Type::ServiceUnavailable>(record.m_name, record, reason);
    }
}

//----------------------------------------------------------------------------------------------------------------------
