//----------------------------------------------------------------------------------------------------------------------
// File: RuntimeContext.hpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
//----------------------------------------------------------------------------------------------------------------------

enum class RuntimeContext : std::uint32_t { Foreground, Background };

//----------------------------------------------------------------------------------------------------------------------
