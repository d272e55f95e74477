//----------------------------------------------------------------------------------------------------------------------
// File: Options.hpp
// Description: The option groups read from and written to the node's configuration file.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Field.hpp"
#include "StatusCode.hpp"
#include "Components/Network/Address.hpp"
#include "Components/Network/Protocol.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json/value.hpp>
#include <spdlog/common.h>
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Configuration {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view DefaultBeaconFolder = "/beacon/";

std::filesystem::path const DefaultConfigurationFilename = "config.json";

std::filesystem::path GetDefaultBeaconFolder();
std::filesystem::path GetDefaultConfigurationFilepath();

//----------------------------------------------------------------------------------------------------------------------
namespace Options {
//----------------------------------------------------------------------------------------------------------------------

struct Runtime;

class Network;
class Discovery;
class Service;

using Services = std::vector<Service>;

//----------------------------------------------------------------------------------------------------------------------
} // Options namespace
//----------------------------------------------------------------------------------------------------------------------
namespace Symbols {
//----------------------------------------------------------------------------------------------------------------------

DEFINE_FIELD_NAME(Available);
DEFINE_FIELD_NAME(Data);
DEFINE_FIELD_NAME(Discovery);
DEFINE_FIELD_NAME(Interface);
DEFINE_FIELD_NAME(Interval);
DEFINE_FIELD_NAME(Multicast);
DEFINE_FIELD_NAME(Name);
DEFINE_FIELD_NAME(Network);
DEFINE_FIELD_NAME(Port);
DEFINE_FIELD_NAME(Protocol);
DEFINE_FIELD_NAME(ReuseAddress);
DEFINE_FIELD_NAME(Services);
DEFINE_FIELD_NAME(TimeoutCheck);

//----------------------------------------------------------------------------------------------------------------------
} // Symbols namespace
//----------------------------------------------------------------------------------------------------------------------
} // Configuration namespace
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
// Description: The set of options defined at runtime (e.g. cli flags).
//----------------------------------------------------------------------------------------------------------------------
struct Configuration::Options::Runtime
{
    spdlog::level::level_enum verbosity;
    bool useFilepathDeduction;
};

//----------------------------------------------------------------------------------------------------------------------
// Description: The socket the node binds and the multicast group it announces to.
//----------------------------------------------------------------------------------------------------------------------
class Configuration::Options::Network
{
public:
    static constexpr std::string_view Symbol = Symbols::Network{};

    Network();
    Network(
        std::string_view protocol,
        std::string_view interface,
        std::uint16_t port,
        std::string_view multicast,
        bool reuseAddress = true);

    [[nodiscard]] bool operator==(Network const& other) const = default;

    [[nodiscard]] static constexpr std::string_view GetFieldName() { return Symbol; }
    [[nodiscard]] static constexpr bool IsOptional() { return true; }

    [[nodiscard]] DeserializationResult Merge(boost::json::object const& json);
    [[nodiscard]] SerializationResult Write(boost::json::object& json) const;

    [[nodiscard]] ValidationResult AreOptionsAllowable() const;

    [[nodiscard]] ::Network::Protocol GetProtocol() const;
    [[nodiscard]] std::string const& GetProtocolString() const;
    [[nodiscard]] std::string const& GetInterface() const;
    [[nodiscard]] std::uint16_t GetPort() const;
    [[nodiscard]] std::string const& GetMulticast() const;
    [[nodiscard]] bool UseReuseAddress() const;

    [[nodiscard]] ::Network::Address GetBinding() const;
    [[nodiscard]] ::Network::Address GetGroup() const;

private:
    Field<Symbols::Protocol, std::string> m_protocol;
    Field<Symbols::Interface, std::string> m_interface;
    Field<Symbols::Port, std::uint16_t> m_port;
    Field<Symbols::Multicast, std::string> m_multicast;
    Field<Symbols::ReuseAddress, bool> m_reuseAddress;
};

//----------------------------------------------------------------------------------------------------------------------
// Description: The timing of the liveness checks and the default announcement interval.
//----------------------------------------------------------------------------------------------------------------------
class Configuration::Options::Discovery
{
public:
    static constexpr std::string_view Symbol = Symbols::Discovery{};

    Discovery();
    Discovery(std::chrono::milliseconds const& timeoutCheck, std::chrono::milliseconds const& interval);

    [[nodiscard]] bool operator==(Discovery const& other) const = default;

    [[nodiscard]] static constexpr std::string_view GetFieldName() { return Symbol; }
    [[nodiscard]] static constexpr bool IsOptional() { return true; }

    [[nodiscard]] DeserializationResult Merge(boost::json::object const& json);
    [[nodiscard]] SerializationResult Write(boost::json::object& json) const;

    [[nodiscard]] ValidationResult AreOptionsAllowable() const;

    [[nodiscard]] std::chrono::milliseconds const& GetTimeoutCheck() const;
    [[nodiscard]] std::chrono::milliseconds const& GetInterval() const;

private:
    Field<Symbols::TimeoutCheck, std::chrono::milliseconds> m_timeoutCheck;
    Field<Symbols::Interval, std::chrono::milliseconds> m_interval;
};

//----------------------------------------------------------------------------------------------------------------------
// Description: A local service the node registers and announces on startup.
//----------------------------------------------------------------------------------------------------------------------
class Configuration::Options::Service
{
public:
    static constexpr std::string_view Symbol = Symbols::Services{};

    Service();
    Service(
        std::string_view name,
        boost::json::value const& data,
        std::optional<std::chrono::milliseconds> const& optInterval = {},
        bool available = true);

    [[nodiscard]] bool operator==(Service const& other) const = default;

    [[nodiscard]] static constexpr std::string_view GetFieldName() { return Symbol; }

    [[nodiscard]] DeserializationResult Merge(boost::json::object const& json, std::string_view context);
    [[nodiscard]] SerializationResult Write(boost::json::array& json) const;

    [[nodiscard]] ValidationResult AreOptionsAllowable(std::string_view context) const;

    [[nodiscard]] std::string const& GetName() const;
    [[nodiscard]] boost::json::value const& GetData() const;
    [[nodiscard]] std::optional<std::chrono::milliseconds> const& GetInterval() const;
    [[nodiscard]] bool IsAvailable() const;

private:
    Field<Symbols::Name, std::string> m_name;
    Field<Symbols::Data, boost::json::value> m_data;
    OptionalField<Symbols::Interval, std::chrono::milliseconds> m_optInterval;
    Field<Symbols::Available, bool> m_available;
};

//----------------------------------------------------------------------------------------------------------------------
