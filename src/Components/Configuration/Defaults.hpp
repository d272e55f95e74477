//----------------------------------------------------------------------------------------------------------------------
// File: Defaults.hpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Configuration::Defaults {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::uint32_t FileSizeLimit = 12'000; // Limit the configuration files to 12KB

std::filesystem::path const FallbackConfigurationFolder = "/etc/";

constexpr std::string_view Protocol = "udp4";
constexpr std::string_view NetworkInterface = "0.0.0.0";
constexpr std::uint16_t Port = 44201;
constexpr std::string_view MulticastGroup = "224.0.0.234";
constexpr bool ReuseAddress = true;

constexpr auto TimeoutCheck = std::chrono::milliseconds{ 1'000 };
constexpr auto AnnounceInterval = std::chrono::milliseconds{ 3'000 };

constexpr std::size_t ServicesLimit = 64;
constexpr std::size_t ServiceNameSizeLimit = 256;

//----------------------------------------------------------------------------------------------------------------------
} // Configuration::Defaults namespace
//----------------------------------------------------------------------------------------------------------------------
