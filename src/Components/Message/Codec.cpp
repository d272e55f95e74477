//----------------------------------------------------------------------------------------------------------------------
// File: Codec.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Codec.hpp"
#include "Components/Scheduler/Tasks.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json/object.hpp>
#include <boost/json/parse.hpp>
#include <boost/json/serialize.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <cmath>
#include <cstdint>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] std::string GetString(boost::json::object const& json, std::string_view key);
[[nodiscard]] std::chrono::milliseconds GetInterval(boost::json::object const& json);
[[nodiscard]] bool GetAvailability(boost::json::object const& json);
[[nodiscard]] boost::json::value GetData(boost::json::object const& json);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

std::string Message::Encode(AnnouncementParcel const& announcement)
{
    boost::json::object json;
    json.emplace(Field::Name, announcement.name);
    json.emplace(Field::Data, announcement.data);
    json.emplace(Field::Interval, announcement.interval.count());
    json.emplace(Field::Available, announcement.available);
    return boost::json::serialize(json);
}

//----------------------------------------------------------------------------------------------------------------------

std::string Message::Encode(EventParcel const& event)
{
    boost::json::object json;
    json.emplace(Field::EventName, event.eventName);
    json.emplace(Field::Data, event.data);
    return boost::json::serialize(json);
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Message::Parcel> Message::Decode(std::string_view buffer)
{
    if (buffer.empty()) { return {}; }

    boost::json::error_code error;
    auto const value = boost::json::parse(buffer, error);
    if (error || !value.is_object()) { return {}; }

    auto const& json = value.as_object();
    if (auto eventName = local::GetString(json, Field::EventName); !eventName.empty()) {
        return EventParcel{ std::move(eventName), local::GetData(json) };
    }

    return AnnouncementParcel{
        local::GetString(json, Field::Name),
        local::GetData(json),
        local::GetInterval(json),
        local::GetAvailability(json)
    };
}

//----------------------------------------------------------------------------------------------------------------------

std::string local::GetString(boost::json::object const& json, std::string_view key)
{
    auto const itr = json.find(key);
    if (itr == json.end() || !itr->value().is_string()) { return {}; }
    auto const& value = itr->value().get_string();
    return { value.data(), value.size() };
}

//----------------------------------------------------------------------------------------------------------------------

std::chrono::milliseconds local::GetInterval(boost::json::object const& json)
{
    auto const itr = json.find(Message::Field::Interval);
    if (itr == json.end()) { return std::chrono::milliseconds::zero(); }

    // Intervals beyond the maximum are clamped, such that a peer can not announce an interval the liveness checks
    // are unable to represent.
    constexpr std::int64_t maximum = Scheduler::MaximumInterval.count();
    auto const& value = itr->value();
    switch (value.kind()) {
        case boost::json::kind::int64: return std::chrono::milliseconds{ std::min(value.get_int64(), maximum) };
        case boost::json::kind::uint64: {
            auto const interval = std::min(value.get_uint64(), static_cast<std::uint64_t>(maximum));
            return std::chrono::milliseconds{ static_cast<std::int64_t>(interval) };
        }
        case boost::json::kind::double_: {
            auto const interval = std::min(value.get_double(), static_cast<double>(maximum));
            if (!std::isfinite(interval) || interval < 0) { break; }
            return std::chrono::milliseconds{ static_cast<std::int64_t>(interval) };
        }
        default: break;
    }

    return std::chrono::milliseconds::zero();
}

//----------------------------------------------------------------------------------------------------------------------

bool local::GetAvailability(boost::json::object const& json)
{
    auto const itr = json.find(Message::Field::Available);
    if (itr == json.end() || !itr->value().is_bool()) { return true; }
    return itr->value().get_bool();
}

//----------------------------------------------------------------------------------------------------------------------

boost::json::value local::GetData(boost::json::object const& json)
{
    auto const itr = json.find(Message::Field::Data);
    if (itr == json.end()) { return nullptr; }
    return itr->value();
}

//----------------------------------------------------------------------------------------------------------------------
