//----------------------------------------------------------------------------------------------------------------------
// File: Parser.hpp
// Description: Reads, validates, and writes back the node's configuration file.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Field.hpp"
#include "Options.hpp"
#include "StatusCode.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

namespace spdlog { class logger; }

//----------------------------------------------------------------------------------------------------------------------
namespace Configuration {
//----------------------------------------------------------------------------------------------------------------------

class Parser;

//----------------------------------------------------------------------------------------------------------------------
namespace Symbols {
//----------------------------------------------------------------------------------------------------------------------

DEFINE_FIELD_NAME(Version);

//----------------------------------------------------------------------------------------------------------------------
} // Symbols namespace
//----------------------------------------------------------------------------------------------------------------------
} // Configuration namespace
//----------------------------------------------------------------------------------------------------------------------

class Configuration::Parser final
{
public:
    explicit Parser(Options::Runtime const& options);
    Parser(std::filesystem::path const& filepath, Options::Runtime const& options);
    ~Parser();

    Parser(Parser const&) = delete;
    Parser& operator=(Parser const&) = delete;

    [[nodiscard]] DeserializationResult FetchOptions();
    [[nodiscard]] SerializationResult Serialize();

    [[nodiscard]] std::filesystem::path const& GetFilepath() const;
    void SetFilepath(std::filesystem::path const& filepath);
    void DisableFilesystem();
    [[nodiscard]] bool FilesystemDisabled() const;

    [[nodiscard]] spdlog::level::level_enum GetVerbosity() const;
    [[nodiscard]] bool UseFilepathDeduction() const;
    [[nodiscard]] std::string const& GetVersion() const;
    [[nodiscard]] Options::Network const& GetNetworkOptions() const;
    [[nodiscard]] Options::Discovery const& GetDiscoveryOptions() const;
    [[nodiscard]] Options::Services const& GetServices() const;

    [[nodiscard]] bool Validated() const;
    [[nodiscard]] bool Changed() const;

private:
    void OnFilepathChanged();
    [[nodiscard]] DeserializationResult ProcessFile();
    [[nodiscard]] DeserializationResult Deserialize();
    [[nodiscard]] DeserializationResult DeserializeServices(boost::json::array const& json);

    [[nodiscard]] ValidationResult ValidateOptions();

    std::shared_ptr<spdlog::logger> m_logger;

    Field<Symbols::Version, std::string> m_version;
    std::filesystem::path m_filepath;

    Options::Runtime m_runtime;
    Options::Network m_network;
    Options::Discovery m_discovery;
    Options::Services m_services;

    bool m_validated;
    bool m_changed;
};

//----------------------------------------------------------------------------------------------------------------------
