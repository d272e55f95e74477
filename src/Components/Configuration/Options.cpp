//----------------------------------------------------------------------------------------------------------------------
#include "Options.hpp"
#include "Defaults.hpp"
#include "SerializationErrors.hpp"
#include "Components/Scheduler/Tasks.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <cstdlib>
#include <limits>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::int64_t MaximumDuration = Scheduler::MaximumInterval.count();

[[nodiscard]] std::optional<std::int64_t> GetInteger(boost::json::value const& value);
[[nodiscard]] bool IsDurationAllowable(std::chrono::milliseconds const& duration);
[[nodiscard]] bool IsAddressAllowable(::Network::Protocol protocol, std::string_view ip);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

std::filesystem::path Configuration::GetDefaultBeaconFolder()
{
    std::string filepath{ Defaults::FallbackConfigurationFolder }; // Set the filepath root to /etc/ by default

    // Prefer $XDG_CONFIG_HOME, then $HOME/.config, before resorting to the fallback folder.
    if (auto const pConfigHome = std::getenv("XDG_CONFIG_HOME"); pConfigHome && *pConfigHome != '\0') {
        filepath = pConfigHome;
    } else if (auto const pUserHome = std::getenv("HOME"); pUserHome && *pUserHome != '\0') {
        filepath = std::string{ pUserHome } + "/.config";
    }

    // Concat /beacon/ to the configuration folder path
    filepath += DefaultBeaconFolder;

    return filepath;
}

//----------------------------------------------------------------------------------------------------------------------

std::filesystem::path Configuration::GetDefaultConfigurationFilepath()
{
    return GetDefaultBeaconFolder() / DefaultConfigurationFilename; // ../config.json
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::Options::Network::Network()
    : m_protocol(
        Defaults::Protocol,
        [] (std::string const& value) { return ::Network::ParseProtocol(value) != ::Network::Protocol::Invalid; })
    , m_interface(
        Defaults::NetworkInterface,
        [] (std::string const& value) {
            return ::Network::Socket::ParseAddressType(value) != ::Network::Socket::Type::Invalid;
        })
    , m_port(Defaults::Port, [] (std::uint16_t value) { return value != 0; })
    , m_multicast(
        Defaults::MulticastGroup,
        [] (std::string const& value) { return ::Network::Address{ value, Defaults::Port }.IsMulticast(); })
    , m_reuseAddress(Defaults::ReuseAddress)
{
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::Options::Network::Network(
    std::string_view protocol,
    std::string_view interface,
    std::uint16_t port,
    std::string_view multicast,
    bool reuseAddress)
    : Network()
{
    // Values supplied at construction are treated as runtime values and take precedence over the file.
    [[maybe_unused]] bool const success = m_protocol.SetValue(protocol) && m_interface.SetValue(interface) &&
        m_port.SetValue(port) && m_multicast.SetValue(multicast) && m_reuseAddress.SetValue(reuseAddress);
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Options::Network::Merge(boost::json::object const& json)
{
    // JSON Schema:
    // "network": {
    //     "protocol": Optional String ("udp4" or "udp6"),
    //     "interface": Optional String,
    //     "port": Optional Integer (1 - 65535),
    //     "multicast": Optional String,
    //     "reuse_address": Optional Boolean
    // },

    auto const MergeString = [&] (auto& field) -> DeserializationResult {
        if (field.Modified()) { return { StatusCode::Success, "" }; }
        auto const itr = json.find(field.GetFieldName());
        if (itr == json.end()) { return { StatusCode::Success, "" }; }
        if (!itr->value().is_string()) {
            return {
                StatusCode::DecodeError,
                CreateMismatchedValueTypeMessage("string", GetFieldName(), field.GetFieldName())
            };
        }
        if (!field.SetValueFromConfig(std::string_view{ itr->value().get_string() })) {
            return { StatusCode::InputError, CreateInvalidValueMessage(GetFieldName(), field.GetFieldName()) };
        }
        return { StatusCode::Success, "" };
    };

    if (auto const status = MergeString(m_protocol); status.first != StatusCode::Success) { return status; }
    if (auto const status = MergeString(m_interface); status.first != StatusCode::Success) { return status; }

    // Deserialize the port field from the network object.
    if (m_port.NotModified()) {
        if (auto const itr = json.find(m_port.GetFieldName()); itr != json.end()) {
            auto const optPort = local::GetInteger(itr->value());
            if (!optPort) {
                return {
                    StatusCode::DecodeError,
                    CreateMismatchedValueTypeMessage("integer", GetFieldName(), m_port.GetFieldName())
                };
            }

            constexpr std::int64_t MaximumPort = std::numeric_limits<std::uint16_t>::max();
            if (*optPort < 1 || *optPort > MaximumPort ||
                !m_port.SetValueFromConfig(static_cast<std::uint16_t>(*optPort))) {
                return {
                    StatusCode::InputError,
                    CreateValueRangeMessage(1, MaximumPort, GetFieldName(), m_port.GetFieldName())
                };
            }
        }
    }

    if (auto const status = MergeString(m_multicast); status.first != StatusCode::Success) { return status; }

    // Deserialize the reuse address field from the network object.
    if (m_reuseAddress.NotModified()) {
        if (auto const itr = json.find(m_reuseAddress.GetFieldName()); itr != json.end()) {
            if (!itr->value().is_bool()) {
                return {
                    StatusCode::DecodeError,
                    CreateMismatchedValueTypeMessage("boolean", GetFieldName(), m_reuseAddress.GetFieldName())
                };
            }
            [[maybe_unused]] bool const success = m_reuseAddress.SetValueFromConfig(itr->value().get_bool());
        }
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::SerializationResult Configuration::Options::Network::Write(boost::json::object& json) const
{
    boost::json::object group;
    group[m_protocol.GetFieldName()] = m_protocol.GetValue();
    group[m_interface.GetFieldName()] = m_interface.GetValue();
    group[m_port.GetFieldName()] = m_port.GetValue();
    group[m_multicast.GetFieldName()] = m_multicast.GetValue();
    group[m_reuseAddress.GetFieldName()] = m_reuseAddress.GetValue();
    json[Symbol] = std::move(group);
    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::ValidationResult Configuration::Options::Network::AreOptionsAllowable() const
{
    auto const protocol = GetProtocol();
    if (protocol == ::Network::Protocol::Invalid) {
        return { StatusCode::InputError, CreateInvalidValueMessage(GetFieldName(), m_protocol.GetFieldName()) };
    }

    if (!local::IsAddressAllowable(protocol, m_interface.GetValue())) {
        return {
            StatusCode::InputError,
            CreateIncompatibleValuesMessage(
                "The interface address family must match the protocol.",
                GetFieldName(), m_interface.GetFieldName())
        };
    }

    if (!local::IsAddressAllowable(protocol, m_multicast.GetValue()) || !GetGroup().IsMulticast()) {
        return {
            StatusCode::InputError,
            CreateIncompatibleValuesMessage(
                "The multicast address must be a group address in the protocol's address family.",
                GetFieldName(), m_multicast.GetFieldName())
        };
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Network::Protocol Configuration::Options::Network::GetProtocol() const
{
    return ::Network::ParseProtocol(m_protocol.GetValue());
}

//----------------------------------------------------------------------------------------------------------------------

std::string const& Configuration::Options::Network::GetProtocolString() const { return m_protocol.GetValue(); }

//----------------------------------------------------------------------------------------------------------------------

std::string const& Configuration::Options::Network::GetInterface() const { return m_interface.GetValue(); }

//----------------------------------------------------------------------------------------------------------------------

std::uint16_t Configuration::Options::Network::GetPort() const { return m_port.GetValue(); }

//----------------------------------------------------------------------------------------------------------------------

std::string const& Configuration::Options::Network::GetMulticast() const { return m_multicast.GetValue(); }

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Options::Network::UseReuseAddress() const { return m_reuseAddress.GetValue(); }

//----------------------------------------------------------------------------------------------------------------------

Network::Address Configuration::Options::Network::GetBinding() const
{
    return ::Network::Address{ m_interface.GetValue(), m_port.GetValue() };
}

//----------------------------------------------------------------------------------------------------------------------

Network::Address Configuration::Options::Network::GetGroup() const
{
    return ::Network::Address{ m_multicast.GetValue(), m_port.GetValue() };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::Options::Discovery::Discovery()
    : m_timeoutCheck(Defaults::TimeoutCheck, local::IsDurationAllowable)
    , m_interval(Defaults::AnnounceInterval, local::IsDurationAllowable)
{
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::Options::Discovery::Discovery(
    std::chrono::milliseconds const& timeoutCheck, std::chrono::milliseconds const& interval)
    : Discovery()
{
    [[maybe_unused]] bool const success = m_timeoutCheck.SetValue(timeoutCheck) && m_interval.SetValue(interval);
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Options::Discovery::Merge(boost::json::object const& json)
{
    // JSON Schema:
    // "discovery": {
    //     "timeout_check": Optional Integer (milliseconds),
    //     "interval": Optional Integer (milliseconds)
    // },

    auto const MergeDuration = [&] (auto& field) -> DeserializationResult {
        if (field.Modified()) { return { StatusCode::Success, "" }; }
        auto const itr = json.find(field.GetFieldName());
        if (itr == json.end()) { return { StatusCode::Success, "" }; }

        auto const optValue = local::GetInteger(itr->value());
        if (!optValue) {
            return {
                StatusCode::DecodeError,
                CreateMismatchedValueTypeMessage("integer", GetFieldName(), field.GetFieldName())
            };
        }

        if (!field.SetValueFromConfig(std::chrono::milliseconds{ *optValue })) {
            return {
                StatusCode::InputError,
                CreateValueRangeMessage(1, local::MaximumDuration, GetFieldName(), field.GetFieldName())
            };
        }

        return { StatusCode::Success, "" };
    };

    if (auto const status = MergeDuration(m_timeoutCheck); status.first != StatusCode::Success) { return status; }
    if (auto const status = MergeDuration(m_interval); status.first != StatusCode::Success) { return status; }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::SerializationResult Configuration::Options::Discovery::Write(boost::json::object& json) const
{
    boost::json::object group;
    group[m_timeoutCheck.GetFieldName()] = m_timeoutCheck.GetValue().count();
    group[m_interval.GetFieldName()] = m_interval.GetValue().count();
    json[Symbol] = std::move(group);
    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::ValidationResult Configuration::Options::Discovery::AreOptionsAllowable() const
{
    // The liveness check must be able to observe a service before its timeout threshold elapses.
    if (m_timeoutCheck.GetValue() > 2 * m_interval.GetValue()) {
        return {
            StatusCode::InputError,
            CreateIncompatibleValuesMessage(
                "The timeout check must not exceed twice the announcement interval.",
                GetFieldName(), m_timeoutCheck.GetFieldName())
        };
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

std::chrono::milliseconds const& Configuration::Options::Discovery::GetTimeoutCheck() const
{
    return m_timeoutCheck.GetValue();
}

//----------------------------------------------------------------------------------------------------------------------

std::chrono::milliseconds const& Configuration::Options::Discovery::GetInterval() const
{
    return m_interval.GetValue();
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::Options::Service::Service()
    : m_name([] (std::string const& value) {
        return !value.empty() && value.size() <= Defaults::ServiceNameSizeLimit;
    })
    , m_data([] (boost::json::value const& value) { return !value.is_null(); })
    , m_optInterval([] (std::chrono::milliseconds const& value) { return local::IsDurationAllowable(value); })
    , m_available(true)
{
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::Options::Service::Service(
    std::string_view name,
    boost::json::value const& data,
    std::optional<std::chrono::milliseconds> const& optInterval,
    bool available)
    : Service()
{
    [[maybe_unused]] bool const success = m_name.SetValue(name) && m_data.SetValue(data) &&
        m_available.SetValue(available) && (!optInterval || m_optInterval.SetValue(*optInterval));
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Options::Service::Merge(
    boost::json::object const& json, std::string_view context)
{
    // JSON Schema:
    // "services": [
    //     {
    //         "name": Required String,
    //         "data": Required Value (not null),
    //         "interval": Optional Integer (milliseconds),
    //         "available": Optional Boolean
    //     }
    // ]

    if (auto const itr = json.find(m_name.GetFieldName()); itr != json.end()) {
        if (!itr->value().is_string()) {
            return {
                StatusCode::DecodeError,
                CreateMismatchedValueTypeMessage("string", context, m_name.GetFieldName())
            };
        }
        if (!m_name.SetValueFromConfig(std::string_view{ itr->value().get_string() })) {
            return {
                StatusCode::InputError,
                CreateExceededCharacterLimitMessage(Defaults::ServiceNameSizeLimit, context, m_name.GetFieldName())
            };
        }
    } else {
        return { StatusCode::DecodeError, CreateMissingFieldMessage(context, m_name.GetFieldName()) };
    }

    if (auto const itr = json.find(m_data.GetFieldName()); itr != json.end()) {
        if (!m_data.SetValueFromConfig(itr->value())) {
            return { StatusCode::InputError, CreateInvalidValueMessage(context, m_data.GetFieldName()) };
        }
    } else {
        return { StatusCode::DecodeError, CreateMissingFieldMessage(context, m_data.GetFieldName()) };
    }

    if (auto const itr = json.find(m_optInterval.GetFieldName()); itr != json.end()) {
        auto const optValue = local::GetInteger(itr->value());
        if (!optValue) {
            return {
                StatusCode::DecodeError,
                CreateMismatchedValueTypeMessage("integer", context, m_optInterval.GetFieldName())
            };
        }
        if (!m_optInterval.SetValueFromConfig(std::chrono::milliseconds{ *optValue })) {
            return {
                StatusCode::InputError,
                CreateValueRangeMessage(1, local::MaximumDuration, context, m_optInterval.GetFieldName())
            };
        }
    }

    if (auto const itr = json.find(m_available.GetFieldName()); itr != json.end()) {
        if (!itr->value().is_bool()) {
            return {
                StatusCode::DecodeError,
                CreateMismatchedValueTypeMessage("boolean", context, m_available.GetFieldName())
            };
        }
        [[maybe_unused]] bool const success = m_available.SetValueFromConfig(itr->value().get_bool());
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::SerializationResult Configuration::Options::Service::Write(boost::json::array& json) const
{
    boost::json::object service;
    service[m_name.GetFieldName()] = m_name.GetValue();
    service[m_data.GetFieldName()] = m_data.GetValue();
    if (m_optInterval.HasValue()) { service[m_optInterval.GetFieldName()] = m_optInterval.GetValue().count(); }
    service[m_available.GetFieldName()] = m_available.GetValue();
    json.emplace_back(std::move(service));
    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::ValidationResult Configuration::Options::Service::AreOptionsAllowable(std::string_view context) const
{
    if (!m_name.HasValue()) {
        return { StatusCode::InputError, CreateMissingFieldMessage(context, m_name.GetFieldName()) };
    }

    if (m_data.GetValue().is_null()) {
        return { StatusCode::InputError, CreateInvalidValueMessage(context, m_data.GetFieldName()) };
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

std::string const& Configuration::Options::Service::GetName() const { return m_name.GetValue(); }

//----------------------------------------------------------------------------------------------------------------------

boost::json::value const& Configuration::Options::Service::GetData() const { return m_data.GetValue(); }

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::chrono::milliseconds> const& Configuration::Options::Service::GetInterval() const
{
    return m_optInterval.GetOptionalValue();
}

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Options::Service::IsAvailable() const { return m_available.GetValue(); }

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::int64_t> local::GetInteger(boost::json::value const& value)
{
    if (value.is_int64()) { return value.get_int64(); }
    if (value.is_uint64()) {
        // Values beyond the signed range are clamped, every range check treats them as too large.
        constexpr auto SignedLimit = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
        return static_cast<std::int64_t>(std::min(value.get_uint64(), SignedLimit));
    }
    return {};
}

//----------------------------------------------------------------------------------------------------------------------

bool local::IsDurationAllowable(std::chrono::milliseconds const& duration)
{
    return duration.count() > 0 && duration.count() <= MaximumDuration;
}

//----------------------------------------------------------------------------------------------------------------------

bool local::IsAddressAllowable(::Network::Protocol protocol, std::string_view ip)
{
    auto const type = ::Network::Socket::ParseAddressType(ip);
    switch (protocol) {
        case ::Network::Protocol::UDP4: return type == ::Network::Socket::Type::IPv4;
        case ::Network::Protocol::UDP6: return type == ::Network::Socket::Type::IPv6;
        default: return false;
    }
}

//----------------------------------------------------------------------------------------------------------------------
