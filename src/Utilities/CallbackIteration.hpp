//----------------------------------------------------------------------------------------------------------------------
// File: CallbackIteration.hpp
// Description: Return value for iteration callbacks that allows the visitor to end a ForEach early.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
//----------------------------------------------------------------------------------------------------------------------

enum class CallbackIteration : std::uint32_t { Continue, Stop };

//----------------------------------------------------------------------------------------------------------------------
