//----------------------------------------------------------------------------------------------------------------------
// File: SerializationErrors.hpp
// Description: Helpers to build the messages reported alongside a configuration status code.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <fmt/format.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cctype>
#include <concepts>
#include <cstdint>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Configuration {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] inline std::string GetIndefiniteArticle(std::string_view value)
{
    if (value.empty()) { return ""; }

    switch (std::tolower(static_cast<unsigned char>(value.front()))) {
        case 'a':
        case 'e':
        case 'i':
        case 'o':
        case 'u': return "an";
        default: return "a";
    }
}

//----------------------------------------------------------------------------------------------------------------------

template<typename... Fields> requires (std::convertible_to<Fields, std::string_view> && ...)
[[nodiscard]] std::string ConcatenateFieldNames(Fields const&... fields)
{
    std::string result;
    ((result += std::string(result.empty() ? "" : ".").append(std::string_view{ fields })), ...);
    return result;
}

//----------------------------------------------------------------------------------------------------------------------

template<typename... Fields> requires (std::convertible_to<Fields, std::string_view> && ...)
[[nodiscard]] std::string CreateArrayContextString(std::size_t index, Fields const&... fields)
{
    return fmt::format("{}[{}]", ConcatenateFieldNames(fields...), index);
}

//----------------------------------------------------------------------------------------------------------------------

template<typename... Fields> requires (std::convertible_to<Fields, std::string_view> && ...)
[[nodiscard]] std::string CreateUnexpectedErrorMessage(Fields const&... fields)
{
    return fmt::format("Encountered an unexpected error handling the '{}' field.", ConcatenateFieldNames(fields...));
}

//----------------------------------------------------------------------------------------------------------------------

template<typename... Fields> requires (std::convertible_to<Fields, std::string_view> && ...)
[[nodiscard]] std::string CreateMissingFieldMessage(Fields const&... fields)
{
    return fmt::format("The '{}' field was not found.", ConcatenateFieldNames(fields...));
}

//----------------------------------------------------------------------------------------------------------------------

template<typename... Fields> requires (std::convertible_to<Fields, std::string_view> && ...)
[[nodiscard]] std::string CreateExceededElementLimitMessage(std::integral auto max, Fields const&... fields)
{
    return fmt::format(
        "The '{}' field exceeded the maximum number of {} allowable elements.",
        ConcatenateFieldNames(fields...), max);
}

//----------------------------------------------------------------------------------------------------------------------

template<typename... Fields> requires (std::convertible_to<Fields, std::string_view> && ...)
[[nodiscard]] std::string CreateMismatchedValueTypeMessage(std::string_view type, Fields const&... fields)
{
    return fmt::format(
        "The '{}' field must be {} {}.",
        ConcatenateFieldNames(fields...), GetIndefiniteArticle(type), type);
}

//----------------------------------------------------------------------------------------------------------------------

template<typename... Fields> requires (std::convertible_to<Fields, std::string_view> && ...)
[[nodiscard]] std::string CreateInvalidValueMessage(Fields const&... fields)
{
    return fmt::format(
        "The '{}' field contains an invalid value. See documentation for supported values.",
        ConcatenateFieldNames(fields...));
}

//----------------------------------------------------------------------------------------------------------------------

template<typename... Fields> requires (std::convertible_to<Fields, std::string_view> && ...)
[[nodiscard]] std::string CreateValueRangeMessage(
    std::integral auto min, std::integral auto max, Fields const&... fields)
{
    return fmt::format(
        "The '{}' field must be a value between '{}' and '{}'.", ConcatenateFieldNames(fields...), min, max);
}

//----------------------------------------------------------------------------------------------------------------------

template<typename... Fields> requires (std::convertible_to<Fields, std::string_view> && ...)
[[nodiscard]] std::string CreateExceededCharacterLimitMessage(std::integral auto max, Fields const&... fields)
{
    return fmt::format(
        "The '{}' field exceeds the maximum allowed length of '{}' characters.",
        ConcatenateFieldNames(fields...), max);
}

//----------------------------------------------------------------------------------------------------------------------

template<typename... Fields> requires (std::convertible_to<Fields, std::string_view> && ...)
[[nodiscard]] std::string CreateIncompatibleValuesMessage(std::string_view reason, Fields const&... fields)
{
    return fmt::format("The '{}' fields are incompatible. {}", ConcatenateFieldNames(fields...), reason);
}

//----------------------------------------------------------------------------------------------------------------------
} // Configuration namespace
//----------------------------------------------------------------------------------------------------------------------
