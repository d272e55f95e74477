//----------------------------------------------------------------------------------------------------------------------
// File: VariantVisitor.hpp
// Description: Overload set used to visit the alternatives of a std::variant with lambdas.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------

template<typename... Handlers>
struct VariantVisitor : Handlers...
{
    using Handlers::operator()...;
};

template<typename... Handlers> VariantVisitor(Handlers...) -> VariantVisitor<Handlers...>;

//----------------------------------------------------------------------------------------------------------------------
