//----------------------------------------------------------------------------------------------------------------------
// File: Version.hpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Beacon {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Version = "0.1.0";

//----------------------------------------------------------------------------------------------------------------------
} // Beacon namespace
//----------------------------------------------------------------------------------------------------------------------
