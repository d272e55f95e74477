//----------------------------------------------------------------------------------------------------------------------
// File: StartupOptions.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "StartupOptions.hpp"
#include "Utilities/Version.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json/parse.hpp>
#include <fmt/format.h>
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <sys/ioctl.h>
#include <unistd.h>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

std::uint32_t GetTerminalWidth();

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Startup::Options::Options()
    : m_descriptions()
    , m_options()
    , m_levels()
    , m_verbosity(spdlog::level::info)
    , m_configurationFilepath()
    , m_optAnnounced()
{
    SetupDescriptions();
}

//----------------------------------------------------------------------------------------------------------------------

void Startup::Options::SetupDescriptions()
{
    namespace options = boost::program_options;

    std::uint32_t const width = local::GetTerminalWidth();
    options::options_description general("General Options", width);
    auto AddGeneralOption = general.add_options();

    AddGeneralOption(Help.data(), "Display this help text and exit.");
    AddGeneralOption(Version.data(), "Display the version information and exit.");

    // Option to set the log verbosity level.
    {
        m_levels = {
            { "trace", spdlog::level::trace },
            { "debug", spdlog::level::debug },
            { "info", spdlog::level::info },
            { "warning", spdlog::level::warn },
            { "error", spdlog::level::err },
            { "critical", spdlog::level::critical },
            { "none", spdlog::level::off },
        };

        std::ostringstream oss;
        oss << "Sets the maximum log level for console output. Options: [";
        std::size_t idx = 0;
        for (auto const& [name, value] : m_levels) {
            oss << name << ((++idx < m_levels.size()) ? ", " : "");
        }
        oss << "]";
        AddGeneralOption(
            Verbosity.data(),
            options::value<std::string>()->value_name("<level>")->default_value("info"),
            oss.str().c_str());
    }

    AddGeneralOption(
        Quiet.data(), options::bool_switch()->default_value(false), "Disables all output to the console.");

    m_descriptions.add(general);

    options::options_description configuration("Configuration Options", width);
    auto AddConfigurationOption = configuration.add_options();

    // Option to set the configuration filepath.
    {
        auto const filepath = Configuration::GetDefaultConfigurationFilepath();
        std::ostringstream oss;
        oss << "Set the configuration filepath. This may specify a complete filepath or directory. ";
        oss << "If a directory is specified \"" << Configuration::DefaultConfigurationFilename.string();
        oss << "\" is assumed. If a directory is not specified, the default configuration folder will be used.";
        AddConfigurationOption(
            ConfigurationFilepath.data(),
            options::value(&m_configurationFilepath)->value_name("<filepath>")->default_value(filepath.string()),
            oss.str().c_str());
    }

    m_descriptions.add(configuration);

    options::options_description service("Service Options", width);
    auto AddServiceOption = service.add_options();

    AddServiceOption(
        Announce.data(),
        options::value<std::string>()->value_name("<name>"),
        "Register and announce a local service in addition to the configured services.");

    AddServiceOption(
        Data.data(),
        options::value<std::string>()->value_name("<json>"),
        "The JSON payload of the announced service. Required when a service is announced.");

    {
        std::ostringstream oss;
        oss << "The announcement interval of the announced service in milliseconds. ";
        oss << "If not specified, the configured discovery interval will be used.";
        AddServiceOption(
            Interval.data(), options::value<std::uint32_t>()->value_name("<milliseconds>"), oss.str().c_str());
    }

    AddServiceOption(
        Unavailable.data(),
        options::bool_switch()->default_value(false),
        "Announce the service as unavailable.");

    m_descriptions.add(service);
}

//----------------------------------------------------------------------------------------------------------------------

Startup::ParseCode Startup::Options::Parse(std::int32_t argc, char** argv)
{
    constexpr auto IsOptionSupplied = [] (
        boost::program_options::variables_map const& options, std::string_view option) -> bool
    {
        return options.count(option.data()) && !options[option.data()].defaulted();
    };

    try {
        boost::program_options::store(
            boost::program_options::command_line_parser(argc, argv).options(m_descriptions).run(), m_options);
        boost::program_options::notify(m_options);
    } catch (std::exception const& exception) {
        std::cout << "An error occurred parsing startup options due to: " << exception.what() << "." << std::endl;
        return ParseCode::Malformed;
    }

    if (IsOptionSupplied(m_options, Help)) {
        std::cout << GenerateHelpText(argc, argv) << std::endl;
        return ParseCode::ExitRequested;
    }

    if (IsOptionSupplied(m_options, Version)) {
        std::cout << GenerateVersionText(argc, argv) << std::endl;
        return ParseCode::ExitRequested;
    }

    if (IsOptionSupplied(m_options, Verbosity) && IsOptionSupplied(m_options, Quiet)) {
        std::cout << fmt::format("Conflicting options '{}' and '{}'.", Verbosity, Quiet) << std::endl;
        return ParseCode::Malformed;
    }

    if (IsOptionSupplied(m_options, Verbosity)) {
        auto const& argument = m_options[Verbosity.data()].as<std::string>();
        auto const itr = std::ranges::find_if(m_levels, [&argument] (auto const& item) -> bool {
            return (argument == item.first);
        });

        if (itr == m_levels.end()) {
            std::cout << "Unrecognized verbosity level!" << std::endl;
            return ParseCode::Malformed;
        }

        m_verbosity = itr->second;
    }

    if (IsOptionSupplied(m_options, Quiet)) { m_verbosity = spdlog::level::off; }

    if (m_configurationFilepath.empty()) {
        std::cout << "The configuration filepath cannot be empty." << std::endl;
        return ParseCode::Malformed;
    }

    return ParseAnnouncedService();
}

//----------------------------------------------------------------------------------------------------------------------

std::string Startup::Options::GenerateHelpText([[maybe_unused]] std::int32_t argc, char** argv) const
{
    std::ostringstream oss;
    std::string name = std::filesystem::path(argv[0]).stem().string();
    oss << "Usage: " << name << " [options] \n" << m_descriptions;
    return oss.str();
}

//----------------------------------------------------------------------------------------------------------------------

std::string Startup::Options::GenerateVersionText([[maybe_unused]] std::int32_t argc, char** argv) const
{
    std::string name = std::filesystem::path(argv[0]).stem().string();
    return fmt::format("{} (Beacon) {}", name, Beacon::Version);
}

//----------------------------------------------------------------------------------------------------------------------

spdlog::level::level_enum Startup::Options::GetVerbosity() const { return m_verbosity; }

//----------------------------------------------------------------------------------------------------------------------

std::string const& Startup::Options::GetConfigPath() const { return m_configurationFilepath; }

//----------------------------------------------------------------------------------------------------------------------

std::optional<Configuration::Options::Service> const& Startup::Options::GetAnnouncedService() const
{
    return m_optAnnounced;
}

//----------------------------------------------------------------------------------------------------------------------

Startup::Options::operator Configuration::Options::Runtime() const
{
    return { .verbosity = m_verbosity, .useFilepathDeduction = true };
}

//----------------------------------------------------------------------------------------------------------------------

Startup::ParseCode Startup::Options::ParseAnnouncedService()
{
    bool const hasServiceFlags = m_options.count(Data.data()) || m_options.count(Interval.data()) ||
        m_options[Unavailable.data()].as<bool>();

    if (!m_options.count(Announce.data())) {
        if (hasServiceFlags) {
            std::cout << fmt::format("The service options require the '{}' option.", Announce) << std::endl;
            return ParseCode::Malformed;
        }
        return ParseCode::Success;
    }

    if (!m_options.count(Data.data())) {
        std::cout << fmt::format("An announced service requires the '{}' option.", Data) << std::endl;
        return ParseCode::Malformed;
    }

    boost::json::error_code error;
    auto const data = boost::json::parse(m_options[Data.data()].as<std::string>(), error);
    if (error || data.is_null()) {
        std::cout << "The announced service's data must be a non-null JSON value." << std::endl;
        return ParseCode::Malformed;
    }

    std::optional<std::chrono::milliseconds> optInterval;
    if (m_options.count(Interval.data())) {
        optInterval = std::chrono::milliseconds{ m_options[Interval.data()].as<std::uint32_t>() };
    }

    Configuration::Options::Service const service{
        m_options[Announce.data()].as<std::string>(), data, optInterval, !m_options[Unavailable.data()].as<bool>() };

    if (auto const [status, message] = service.AreOptionsAllowable(Announce);
        status != Configuration::StatusCode::Success) {
        std::cout << message << std::endl;
        return ParseCode::Malformed;
    }

    m_optAnnounced = service;
    return ParseCode::Success;
}

//----------------------------------------------------------------------------------------------------------------------

std::uint32_t local::GetTerminalWidth()
{
    struct winsize size{};
    if (::ioctl(STDOUT_FILENO, TIOCGWINSZ, &size) != 0 || size.ws_col == 0) {
        return boost::program_options::options_description::m_default_line_length;
    }
    return static_cast<std::uint32_t>(size.ws_col);
}

//----------------------------------------------------------------------------------------------------------------------
