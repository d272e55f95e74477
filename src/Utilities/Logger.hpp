//----------------------------------------------------------------------------------------------------------------------
// File: Logger.hpp
// Description: Named spdlog loggers shared by the node's components.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/spdlog.h>
#include <spdlog/sinks/sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
//----------------------------------------------------------------------------------------------------------------------
#include <array>
#include <cassert>
#include <memory>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Logger {
//----------------------------------------------------------------------------------------------------------------------

namespace Name {
    constexpr std::string_view Core = "core";
    constexpr std::string_view Udp = "udp";
}

constexpr std::array<std::string_view, 2> Names = { Name::Core, Name::Udp };

constexpr std::string_view CorePattern = "[%T.%e] [%^%l%$] [core] %v";
constexpr std::string_view UdpPattern = "[%T.%e] [%^%l%$] [udp] %v";

void Initialize(spdlog::level::level_enum verbosity, bool useStdOutSink);
void AttachSink(std::shared_ptr<spdlog::sinks::sink> const& spSink);

//----------------------------------------------------------------------------------------------------------------------
} // Logger namespace
//----------------------------------------------------------------------------------------------------------------------

inline void Logger::Initialize(spdlog::level::level_enum verbosity, bool useStdOutSink)
{
    // Each named logger receives its own sink so the component tag can be carried in the pattern.
    auto const Register = [&] (std::string_view name, std::string_view pattern) {
        if (spdlog::get(name.data())) { return; }
        auto const spLogger = std::make_shared<spdlog::logger>(name.data());
        if (useStdOutSink) {
            auto const spSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            spSink->set_pattern(pattern.data());
            spLogger->sinks().emplace_back(spSink);
        }
        spLogger->set_level(verbosity);
        spdlog::register_logger(spLogger);
    };

    Register(Name::Core, CorePattern);
    Register(Name::Udp, UdpPattern);
}

//----------------------------------------------------------------------------------------------------------------------

inline void Logger::AttachSink(std::shared_ptr<spdlog::sinks::sink> const& spSink)
{
    for (auto const& name : Names) {
        auto const spLogger = spdlog::get(name.data());
        assert(spLogger);
        spLogger->sinks().emplace_back(spSink);
    }
}

//----------------------------------------------------------------------------------------------------------------------
