//----------------------------------------------------------------------------------------------------------------------
// File: Registry.hpp
// Description: The in-memory mapping of service names to their records. The registry owns the rules for creating,
// updating, and expiring records. It is mutated by the transport's receive thread, the core runtime, and the
// application, so a single reader-writer lock guards the entire mapping. Notifications are queued in the event
// publisher while the lock is held and are delivered later on the core thread without it.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Record.hpp"
#include "Components/Event/SharedPublisher.hpp"
#include "Components/Message/Codec.hpp"
#include "Components/Scheduler/Tasks.hpp"
#include "Utilities/CallbackIteration.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json/value.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
//----------------------------------------------------------------------------------------------------------------------

class IAnnouncementScheduler;

namespace spdlog { class logger; }

//----------------------------------------------------------------------------------------------------------------------
namespace Service {
//----------------------------------------------------------------------------------------------------------------------

class Registry;

//----------------------------------------------------------------------------------------------------------------------
} // Service namespace
//----------------------------------------------------------------------------------------------------------------------

class Service::Registry
{
public:
    using TimeSource = std::function<Scheduler::TimePoint()>;
    using ReadCallback = std::function<CallbackIteration(Record const&)>;

    explicit Registry(
        Event::SharedPublisher const& spEventPublisher, TimeSource const& source = &Scheduler::Clock::now);
    ~Registry();

    Registry(Registry const&) = delete;
    Registry(Registry&&) = delete;
    Registry& operator=(Registry const&) = delete;
    Registry& operator=(Registry&&) = delete;

    // Note: Without a registered announcement scheduler local services are stored but never broadcast.
    void Register(IAnnouncementScheduler* const pAnnouncementScheduler);

    bool Register(
        std::string_view name,
        boost::json::value const& data,
        std::chrono::milliseconds interval,
        bool available,
        bool local,
        std::optional<Network::Address> const& optAddress = {});

    bool UpsertFromRemote(
        std::string_view name,
        boost::json::value const& data,
        std::chrono::milliseconds interval,
        bool available,
        std::optional<Network::Address> const& optAddress);

    bool UpdateLocal(
        std::string_view name, boost::json::value const& data, std::chrono::milliseconds interval, bool available);

    bool Pause(std::string_view name);
    bool Resume(std::string_view name, std::optional<std::chrono::milliseconds> const& optInterval = {});

    [[nodiscard]] std::optional<boost::json::value> GetData(std::string_view name) const;
    [[nodiscard]] std::optional<Record> GetRecord(std::string_view name) const;
    [[nodiscard]] bool Contains(std::string_view name) const;
    [[nodiscard]] std::size_t Count() const;

    // Note: The callback is invoked with the registry's shared lock held and must not call back into the registry.
    void ForEach(ReadCallback const& callback) const;

    // Note: Removes every record that has not been heard from in more than two of its intervals. Returns the number
    // of records removed.
    std::size_t Sweep(Scheduler::TimePoint const& now);
    std::size_t Sweep();

    // Note: Provides the announcement for a local service, but only while the provided task is the service's active
    // announcement task. A paused, resumed, or removed service yields nothing to a superseded task.
    [[nodiscard]] std::optional<Message::AnnouncementParcel> GetAnnouncement(
        std::string_view name, Scheduler::TaskIdentifier const& task) const;

    void Clear();

private:
    using RecordMap = std::unordered_map<std::string, Record>;

    [[nodiscard]] bool Emplace(
        std::string_view name,
        boost::json::value const& data,
        std::chrono::milliseconds interval,
        bool available,
        bool local,
        std::optional<Network::Address> const& optAddress);

    void Update(
        Record& record,
        boost::json::value const& data,
        std::chrono::milliseconds interval,
        bool available,
        std::optional<Network::Address> const& optAddress);

    void StartAnnouncements(Record& record);
    void StopAnnouncements(Record& record);
    void PublishAvailability(Record const& record, Reason reason) const;

    std::shared_ptr<spdlog::logger> m_logger;
    Event::SharedPublisher m_spEventPublisher;
    TimeSource m_source;
    IAnnouncementScheduler* m_pAnnouncementScheduler;

    mutable std::shared_mutex m_mutex;
    RecordMap m_records;
};

//----------------------------------------------------------------------------------------------------------------------
