//----------------------------------------------------------------------------------------------------------------------
// File: ExecutionStatus.hpp
// Description: The lifecycle states of the node's core runtime.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
//----------------------------------------------------------------------------------------------------------------------

enum class ExecutionStatus : std::uint32_t
{
    Standby,
    Executing,
    ThreadSpawned,
    AlreadyStarted,
    InitializationFailed,
    RequestedShutdown,
    UnexpectedShutdown,
    ResourceShutdown
};

//----------------------------------------------------------------------------------------------------------------------
