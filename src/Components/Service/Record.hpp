//----------------------------------------------------------------------------------------------------------------------
// File: Record.hpp
// Description: The registry's entry for an announced service. Observers receive copies of a record, reflecting the
// last known state of the service rather than a live view.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Network/Address.hpp"
#include "Components/Scheduler/Tasks.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json/value.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Service {
//----------------------------------------------------------------------------------------------------------------------

enum class Reason : std::uint32_t { New, AvailabilityChange, TimedOut };

constexpr std::chrono::milliseconds DefaultInterval{ 3000 };

constexpr std::chrono::milliseconds MaximumInterval = Scheduler::MaximumInterval;

// Note: Supplied intervals that are missing or non-positive are replaced by the default interval, those beyond the
// maximum are clamped to it.
[[nodiscard]] constexpr std::chrono::milliseconds ValidateInterval(std::chrono::milliseconds interval)
{
    if (interval <= std::chrono::milliseconds::zero()) { return DefaultInterval; }
    return std::min(interval, MaximumInterval);
}

[[nodiscard]] constexpr std::string_view ReasonToString(Reason reason)
{
    switch (reason) {
        case Reason::New: return "new";
        case Reason::AvailabilityChange: return "availability change";
        case Reason::TimedOut: return "timed out";
    }
    return "unknown";
}

class Record;
class Registry;

//----------------------------------------------------------------------------------------------------------------------
} // Service namespace
//----------------------------------------------------------------------------------------------------------------------

class Service::Record
{
public:
    Record(
        std::string_view name,
        boost::json::value const& data,
        std::chrono::milliseconds interval,
        bool available,
        bool local,
        std::optional<Network::Address> const& optAddress,
        Scheduler::TimePoint const& seen);

    Record(Record const&) = default;
    Record(Record&&) = default;
    Record& operator=(Record const&) = delete;
    Record& operator=(Record&&) = delete;

    [[nodiscard]] std::string const& GetName() const { return m_name; }
    [[nodiscard]] boost::json::value const& GetData() const { return m_data; }
    [[nodiscard]] std::chrono::milliseconds GetInterval() const { return m_interval; }
    [[nodiscard]] bool IsAvailable() const { return m_available; }
    [[nodiscard]] bool IsLocal() const { return m_local; }
    [[nodiscard]] std::optional<Network::Address> const& GetAddress() const { return m_optAddress; }
    [[nodiscard]] Scheduler::TimePoint const& GetLastSeen() const { return m_seen; }
    [[nodiscard]] std::optional<Scheduler::TaskIdentifier> const& GetAnnounceTask() const { return m_optTask; }
    [[nodiscard]] bool IsAnnouncing() const { return m_optTask.has_value(); }

    // Note: A record expires once more than two of its intervals have passed without an announcement.
    [[nodiscard]] bool IsExpired(Scheduler::TimePoint const& now) const
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(now - m_seen) > 2 * m_interval;
    }

private:
    friend class Registry;

    std::string const m_name;
    boost::json::value m_data;
    std::chrono::milliseconds m_interval;
    bool m_available;
    bool const m_local;
    std::optional<Network::Address> m_optAddress;
    Scheduler::TimePoint m_seen;
    std::optional<Scheduler::TaskIdentifier> m_optTask;
};

//----------------------------------------------------------------------------------------------------------------------

inline Service::Record::Record(
    std::string_view name,
    boost::json::value const& data,
    std::chrono::milliseconds interval,
    bool available,
    bool local,
    std::optional<Network::Address> const& optAddress,
    Scheduler::TimePoint const& seen)
    : m_name(name)
    , m_data(data)
    , m_interval(ValidateInterval(interval))
    , m_available(available)
    , m_local(local)
    , m_optAddress(optAddress)
    , m_seen(seen)
    , m_optTask()
{
}

//----------------------------------------------------------------------------------------------------------------------
