//----------------------------------------------------------------------------------------------------------------------
#include "Parser.hpp"
#include "Defaults.hpp"
#include "SerializationErrors.hpp"
#include "Utilities/FileUtils.hpp"
#include "Utilities/Logger.hpp"
#include "Utilities/PrettyPrinter.hpp"
#include "Utilities/Version.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json.hpp>
#include <spdlog/spdlog.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
#include <fstream>
#include <sstream>
#include <unordered_set>
//----------------------------------------------------------------------------------------------------------------------

Configuration::Parser::Parser(Options::Runtime const& options)
    : m_logger(spdlog::get(Logger::Name::Core.data()))
    , m_version(Beacon::Version, [] (std::string const& value) { return !value.empty(); })
    , m_filepath()
    , m_runtime(options)
    , m_network()
    , m_discovery()
    , m_services()
    , m_validated(false)
    , m_changed(false)
{
    assert(m_logger);
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::Parser::Parser(std::filesystem::path const& filepath, Options::Runtime const& options)
    : Parser(options)
{
    m_filepath = filepath;
    OnFilepathChanged();
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::Parser::~Parser()
{
    // A file that failed to parse or validate is left untouched.
    if (!m_filepath.empty() && m_changed && m_validated) {
        if (auto const status = Serialize(); status.first != StatusCode::Success) {
            m_logger->error(
                "Failed to update configuration file at: {}! Reason: {}", m_filepath.string(), status.second);
        }
    }
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Parser::FetchOptions()
{
    if (auto const status = ProcessFile(); status.first != StatusCode::Success) { return status; }
    if (auto const status = ValidateOptions(); status.first != StatusCode::Success) { return status; }

    // A newly generated file or an upgraded one needs to be written back with the values now in use.
    if (!m_changed) { return { StatusCode::Success, "" }; }

    auto const status = Serialize();
    if (status.first != StatusCode::Success) {
        m_logger->error("Failed to update configuration file at: {}! Reason: {}", m_filepath.string(), status.second);
    }

    return status;
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::SerializationResult Configuration::Parser::Serialize()
{
    if (auto const status = ValidateOptions(); status.first != StatusCode::Success) { return status; }

    // If the filesystem is disabled, there is nothing to do.
    if (m_filepath.empty()) {
        m_changed = false;
        return { StatusCode::Success, "" };
    }

    boost::json::object json;
    json[m_version.GetFieldName()] = m_version.GetValue();

    if (auto const status = m_network.Write(json); status.first != StatusCode::Success) { return status; }
    if (auto const status = m_discovery.Write(json); status.first != StatusCode::Success) { return status; }

    boost::json::array services;
    for (auto const& service : m_services) {
        if (auto const status = service.Write(services); status.first != StatusCode::Success) { return status; }
    }
    json[Options::Service::GetFieldName()] = std::move(services);

    std::ofstream os(m_filepath, std::ofstream::out | std::ofstream::trunc);
    if (os.fail()) { return { StatusCode::FileError, "Failed to open file." }; }

    JSON::PrettyPrinter{}.Write(json, os);

    os.close();
    if (os.fail()) { return { StatusCode::FileError, "Failed to write file." }; }

    m_changed = false; // On success, reset the changed flag to indicate all changes have been processed.

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::ValidationResult Configuration::Parser::ValidateOptions()
{
    m_validated = false; // Explicitly disable the validation result in case anything fails.

    if (auto const status = m_network.AreOptionsAllowable(); status.first != StatusCode::Success) { return status; }
    if (auto const status = m_discovery.AreOptionsAllowable(); status.first != StatusCode::Success) { return status; }

    std::unordered_set<std::string> names;
    for (std::size_t idx = 0; idx < m_services.size(); ++idx) {
        auto const& service = m_services[idx];
        auto const context = CreateArrayContextString(idx, Options::Service::GetFieldName());
        if (auto const status = service.AreOptionsAllowable(context); status.first != StatusCode::Success) {
            return status;
        }

        // Service names identify a registry entry, a name may only be configured once.
        if (auto const [itr, emplaced] = names.emplace(service.GetName()); !emplaced) {
            return { StatusCode::InputError, CreateInvalidValueMessage(context, Symbols::Name::GetFieldName()) };
        }
    }

    m_validated = true;

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

std::filesystem::path const& Configuration::Parser::GetFilepath() const { return m_filepath; }

//----------------------------------------------------------------------------------------------------------------------

void Configuration::Parser::SetFilepath(std::filesystem::path const& filepath)
{
    m_filepath = filepath;
    m_validated = false;
    OnFilepathChanged();
}

//----------------------------------------------------------------------------------------------------------------------

void Configuration::Parser::DisableFilesystem()
{
    m_filepath.clear();
}

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Parser::FilesystemDisabled() const { return m_filepath.empty(); }

//----------------------------------------------------------------------------------------------------------------------

spdlog::level::level_enum Configuration::Parser::GetVerbosity() const { return m_runtime.verbosity; }

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Parser::UseFilepathDeduction() const { return m_runtime.useFilepathDeduction; }

//----------------------------------------------------------------------------------------------------------------------

std::string const& Configuration::Parser::GetVersion() const { return m_version.GetValue(); }

//----------------------------------------------------------------------------------------------------------------------

Configuration::Options::Network const& Configuration::Parser::GetNetworkOptions() const { return m_network; }

//----------------------------------------------------------------------------------------------------------------------

Configuration::Options::Discovery const& Configuration::Parser::GetDiscoveryOptions() const { return m_discovery; }

//----------------------------------------------------------------------------------------------------------------------

Configuration::Options::Services const& Configuration::Parser::GetServices() const { return m_services; }

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Parser::Validated() const { return m_validated && !m_changed; }

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Parser::Changed() const { return m_changed; }

//----------------------------------------------------------------------------------------------------------------------

void Configuration::Parser::OnFilepathChanged()
{
    if (m_filepath.empty()) { return; } // If the filepath is empty, there is nothing to do.

    // If we are allowed to deduce the filepath, update the configured path using the defaults when applicable.
    if (m_runtime.useFilepathDeduction) {
        // If the filepath does not have a filename, attach the default config.json
        if (!m_filepath.has_filename()) { m_filepath = m_filepath / DefaultConfigurationFilename; }

        // If the filepath does not have a parent path, get and attach the default beacon folder
        if (!m_filepath.has_parent_path()) { m_filepath = GetDefaultBeaconFolder() / m_filepath; }
    }

    // Create the folder structure for a new configuration file, if one does not exist. If we fail to create the file
    // path, log out an error and disable filesystem usage.
    if (!FileUtils::CreateFolderIfNoneExist(m_filepath)) {
        m_logger->error("Failed to create the filepath at: {}!", m_filepath.string());
        DisableFilesystem();
    }
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Parser::ProcessFile()
{
    if (m_filepath.empty()) { return { StatusCode::Success, "" }; } // Filesystem usage has been disabled.
    if (m_validated) { return { StatusCode::Success, "" }; } // The file has already been processed.

    if (std::filesystem::exists(m_filepath)) {
        m_logger->debug("Reading configuration file at: {}.", m_filepath.string());
        return Deserialize();
    }

    // A missing file is not an error, the defaults are used and written out once they have been validated.
    m_logger->info("Generating a default configuration file at: {}.", m_filepath.string());
    m_changed = true;

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Parser::Deserialize()
{
    // If the filepath is empty, filesystem usage has been disabled.
    if (m_filepath.empty()) { return { StatusCode::Success, "" }; }

    std::error_code error;
    if (auto const size = std::filesystem::file_size(m_filepath, error); error || size > Defaults::FileSizeLimit) {
        return { StatusCode::FileError, "The configuration file is unreadable or exceeds the size limit." };
    }

    std::string serialized;
    {
        std::ifstream reader{ m_filepath };
        if (reader.fail()) [[unlikely]] {
            return { StatusCode::FileError, "Failed to open configuration file for reading." };
        }
        std::ostringstream buffer;
        buffer << reader.rdbuf(); // Read the file into the buffer stream.
        serialized = buffer.str();
    }

    if (serialized.empty()) {
        return { StatusCode::DecodeError, "The configuration file is empty." };
    }

    boost::json::parse_options options;
    options.allow_comments = true;
    options.allow_trailing_commas = true;

    boost::json::error_code ec;
    auto const value = boost::json::parse(serialized, ec, boost::json::storage_ptr{}, options);
    if (ec) {
        return { StatusCode::DecodeError, "Failed to read the configuration file as valid JSON." };
    }

    if (!value.is_object()) {
        return { StatusCode::DecodeError, "The configuration file must contain a JSON object." };
    }

    auto const& json = value.get_object();

    if (auto const itr = json.find(m_version.GetFieldName()); itr != json.end()) {
        if (!itr->value().is_string()) {
            return { StatusCode::DecodeError, CreateMismatchedValueTypeMessage("string", m_version.GetFieldName()) };
        }
        if (!m_version.SetValueFromConfig(std::string_view{ itr->value().get_string() })) {
            return { StatusCode::InputError, CreateInvalidValueMessage(m_version.GetFieldName()) };
        }
    } else {
        m_changed = true; // The current version will be written back to the file.
    }

    if (auto const itr = json.find(Options::Network::GetFieldName()); itr != json.end()) {
        if (!itr->value().is_object()) {
            return {
                StatusCode::DecodeError,
                CreateMismatchedValueTypeMessage("object", Options::Network::GetFieldName())
            };
        }
        if (auto const status = m_network.Merge(itr->value().get_object()); status.first != StatusCode::Success) {
            return status;
        }
    }

    if (auto const itr = json.find(Options::Discovery::GetFieldName()); itr != json.end()) {
        if (!itr->value().is_object()) {
            return {
                StatusCode::DecodeError,
                CreateMismatchedValueTypeMessage("object", Options::Discovery::GetFieldName())
            };
        }
        if (auto const status = m_discovery.Merge(itr->value().get_object()); status.first != StatusCode::Success) {
            return status;
        }
    }

    if (auto const itr = json.find(Options::Service::GetFieldName()); itr != json.end()) {
        if (!itr->value().is_array()) {
            return {
                StatusCode::DecodeError,
                CreateMismatchedValueTypeMessage("array", Options::Service::GetFieldName())
            };
        }
        if (auto const status = DeserializeServices(itr->value().get_array()); status.first != StatusCode::Success) {
            return status;
        }
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Parser::DeserializeServices(boost::json::array const& json)
{
    if (json.size() > Defaults::ServicesLimit) {
        return {
            StatusCode::InputError,
            CreateExceededElementLimitMessage(Defaults::ServicesLimit, Options::Service::GetFieldName())
        };
    }

    Options::Services services;
    services.reserve(json.size());

    for (std::size_t idx = 0; idx < json.size(); ++idx) {
        auto const context = CreateArrayContextString(idx, Options::Service::GetFieldName());
        auto const& element = json[idx];
        if (!element.is_object()) {
            return { StatusCode::DecodeError, CreateMismatchedValueTypeMessage("object", context) };
        }

        auto& service = services.emplace_back();
        if (auto const status = service.Merge(element.get_object(), context); status.first != StatusCode::Success) {
            return status;
        }
    }

    m_services = std::move(services);

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------
