//----------------------------------------------------------------------------------------------------------------------
// File: Codec.hpp
// Description: Encodes and decodes the JSON datagrams exchanged by beacon nodes. An announcement describes the
// current state of a service, while an event carries an application defined name and payload. The presence of an
// event name is the sole discriminator between the two.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json/value.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Message {
//----------------------------------------------------------------------------------------------------------------------

namespace Field {
    constexpr std::string_view Name = "name";
    constexpr std::string_view Data = "data";
    constexpr std::string_view Interval = "interval";
    constexpr std::string_view Available = "available";
    constexpr std::string_view EventName = "eventName";
}

struct AnnouncementParcel;
struct EventParcel;

using Parcel = std::variant<AnnouncementParcel, EventParcel>;

[[nodiscard]] std::string Encode(AnnouncementParcel const& announcement);
[[nodiscard]] std::string Encode(EventParcel const& event);

// Note: Decoding is lenient. A missing or non-numeric interval decodes as zero, a missing availability decodes as
// available, and missing data decodes as null. Only an unparsable datagram or a non-object root fails.
[[nodiscard]] std::optional<Parcel> Decode(std::string_view buffer);

//----------------------------------------------------------------------------------------------------------------------
} // Message namespace
//----------------------------------------------------------------------------------------------------------------------

struct Message::AnnouncementParcel
{
    std::string name;
    boost::json::value data;
    std::chrono::milliseconds interval;
    bool available;
};

//----------------------------------------------------------------------------------------------------------------------

struct Message::EventParcel
{
    std::string eventName;
    boost::json::value data;
};

//----------------------------------------------------------------------------------------------------------------------
