//----------------------------------------------------------------------------------------------------------------------
// File: StartupOptions.hpp
// Description: Command line options accepted by the beacon executable.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Configuration/Options.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------
#include <boost/program_options.hpp>
#include <spdlog/common.h>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Startup {
//----------------------------------------------------------------------------------------------------------------------

enum class ParseCode : std::uint32_t { Malformed, ExitRequested, Success };

class Options;

//----------------------------------------------------------------------------------------------------------------------
} // Startup namespace
//----------------------------------------------------------------------------------------------------------------------

class Startup::Options
{
public:
    static constexpr std::string_view Help = "help";
    static constexpr std::string_view Version = "version";
    static constexpr std::string_view Verbosity = "verbosity";
    static constexpr std::string_view Quiet = "quiet";
    static constexpr std::string_view ConfigurationFilepath = "config";
    static constexpr std::string_view Announce = "announce";
    static constexpr std::string_view Data = "data";
    static constexpr std::string_view Interval = "interval";
    static constexpr std::string_view Unavailable = "unavailable";

    Options();

    void SetupDescriptions();
    [[nodiscard]] ParseCode Parse(std::int32_t argc, char** argv);

    [[nodiscard]] std::string GenerateHelpText(std::int32_t argc, char** argv) const;
    [[nodiscard]] std::string GenerateVersionText(std::int32_t argc, char** argv) const;

    [[nodiscard]] spdlog::level::level_enum GetVerbosity() const;
    [[nodiscard]] std::string const& GetConfigPath() const;

    // Note: Provides the service requested by the announce flag, if one was supplied.
    [[nodiscard]] std::optional<Configuration::Options::Service> const& GetAnnouncedService() const;

    [[nodiscard]] operator Configuration::Options::Runtime() const;

private:
    using VerbosityLevels = std::vector<std::pair<std::string, spdlog::level::level_enum>>;

    [[nodiscard]] ParseCode ParseAnnouncedService();

    boost::program_options::options_description m_descriptions;
    boost::program_options::variables_map m_options;
    VerbosityLevels m_levels;

    spdlog::level::level_enum m_verbosity;
    std::string m_configurationFilepath;
    std::optional<Configuration::Options::Service> m_optAnnounced;
};

//----------------------------------------------------------------------------------------------------------------------
