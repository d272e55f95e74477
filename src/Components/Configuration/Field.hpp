//----------------------------------------------------------------------------------------------------------------------
// File: Field.hpp
// Description: Named configuration values that track whether they were set at runtime or read from a file.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <array>
#include <compare>
#include <concepts>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Configuration {
//----------------------------------------------------------------------------------------------------------------------

template<typename T>
concept FieldNameTag = requires(T t)
{
    { static_cast<std::string_view>(t) } -> std::same_as<std::string_view>;
};

template <std::size_t SourceSize>
constexpr std::size_t GetSnakeCaseSize(char const (&source)[SourceSize])
{
    std::size_t size = SourceSize > 0 ? 1 : 0;
    for (std::size_t idx = 1; idx < SourceSize; ++idx) {
        if (source[idx] >= 'A' && source[idx] <= 'Z' && source[idx - 1] >= 'a' && source[idx - 1] <= 'z') {
            ++size;
        }
        ++size;
    }
    return size;
}

template <std::size_t DestinationSize, std::size_t SourceSize>
constexpr auto ConvertToSnakeCase(char const (&source)[SourceSize])
{
    std::array<char, DestinationSize> converted{};

    std::size_t idx = 0;
    for (std::size_t jdx = 0; jdx < SourceSize - 1; ++jdx) {
        if (source[jdx] >= 'A' && source[jdx] <= 'Z') {
            if (jdx > 0 && source[jdx - 1] >= 'a' && source[jdx - 1] <= 'z') { converted[idx++] = '_'; }
            converted[idx++] = static_cast<char>(source[jdx] - 'A' + 'a');
        } else {
            converted[idx++] = source[jdx];
        }
    }

    converted[idx] = '\0';
    return converted;
}

// Defines a tag type whose field name is the snake case form of the tag (e.g. ReuseAddress becomes reuse_address).
#define DEFINE_FIELD_NAME(name) \
    struct name { \
        static constexpr auto FieldName = ConvertToSnakeCase<GetSnakeCaseSize(#name)>(#name); \
        static constexpr std::string_view GetFieldName() { return FieldName.data(); } \
        constexpr operator std::string_view() const { return FieldName.data(); } \
    }

template<typename T>
struct DecayedValueType { using Type = T; };

template<typename T>
struct DecayedValueType<std::optional<T>> { using Type = T; };

template<typename T>
concept IsOptionalValue = std::is_same_v<std::remove_cvref_t<T>, std::optional<typename DecayedValueType<T>::Type>>;

template<FieldNameTag ProvidedNameTag, typename ValueType>
class Field
{
public:
    using FieldType = typename DecayedValueType<std::decay_t<ValueType>>::Type;
    using Validator = std::function<bool(FieldType const&)>;

    static constexpr std::string_view FieldName = ProvidedNameTag{};
    static constexpr auto DefaultValidator = [] (FieldType const&) { return true; };

    explicit Field(Validator const& validator = DefaultValidator)
        : m_modified(false)
        , m_value()
        , m_validator(validator)
    {
    }

    template<typename T> requires std::is_same_v<std::remove_cvref_t<T>, FieldType>
    explicit Field(T&& value, Validator const& validator = DefaultValidator)
        : m_modified(false)
        , m_value(std::forward<T>(value))
        , m_validator(validator)
    {
    }

    explicit Field(std::string_view value, Validator const& validator = DefaultValidator)
        requires std::is_same_v<FieldType, std::string>
        : m_modified(false)
        , m_value(std::string{ value })
        , m_validator(validator)
    {
    }

    virtual ~Field() = default;

    [[nodiscard]] bool operator==(Field const& other) const { return m_value == other.m_value; }

    [[nodiscard]] static constexpr std::string_view GetFieldName() { return FieldName; }
    [[nodiscard]] static constexpr bool IsOptional() { return IsOptionalValue<ValueType>; }

    [[nodiscard]] FieldType const& GetValue() const
    {
        if constexpr (IsOptional()) { return *m_value; } else { return m_value; }
    }

    [[nodiscard]] bool HasValue() const
    {
        constexpr bool isStringField = std::is_same_v<FieldType, std::string>;
        if constexpr (IsOptional() && isStringField) {
            return m_value.has_value() && !m_value->empty();
        } else if constexpr (IsOptional()) {
            return m_value.has_value();
        } else if constexpr (isStringField) {
            return !m_value.empty();
        } else {
            return true;
        }
    }

    [[nodiscard]] bool Modified() const { return m_modified; }
    [[nodiscard]] bool NotModified() const { return !m_modified; }

    // Sets the value from a runtime source. Modified values take precedence over the values found in a file.
    [[nodiscard]] bool SetValue(FieldType const& value)
    {
        if (HasValue() && value == GetValue()) { return true; }
        if (!m_validator(value)) { return false; }
        m_value = value;
        m_modified = true;
        return true;
    }

    [[nodiscard]] bool SetValue(std::string_view value) requires std::is_same_v<FieldType, std::string>
    {
        return SetValue(std::string{ value });
    }

    [[nodiscard]] bool SetValueFromConfig(FieldType const& value)
    {
        if (!m_validator(value)) { return false; }
        m_value = value;
        return true;
    }

    [[nodiscard]] bool SetValueFromConfig(std::string_view value) requires std::is_same_v<FieldType, std::string>
    {
        return SetValueFromConfig(std::string{ value });
    }

    void ClearModifiedFlag() { m_modified = false; }

protected:
    bool m_modified;
    ValueType m_value;
    Validator m_validator;
};

//----------------------------------------------------------------------------------------------------------------------

template<FieldNameTag ProvidedNameTag, typename ValueType>
class OptionalField : public Field<ProvidedNameTag, std::optional<ValueType>>
{
public:
    using Base = Field<ProvidedNameTag, std::optional<ValueType>>;
    using Validator = typename Base::Validator;

    using Base::DefaultValidator;
    using Base::m_modified;
    using Base::m_value;

    explicit OptionalField(Validator const& validator = DefaultValidator)
        : Base(validator)
    {
    }

    [[nodiscard]] std::optional<ValueType> const& GetOptionalValue() const { return m_value; }

    [[nodiscard]] ValueType const& GetValueOrElse(ValueType const& defaultValue) const
    {
        return m_value.has_value() ? *m_value : defaultValue;
    }

    void ResetValue()
    {
        if (!m_value.has_value()) { return; }
        m_value.reset();
        m_modified = true;
    }
};

//----------------------------------------------------------------------------------------------------------------------
} // Configuration namespace
//----------------------------------------------------------------------------------------------------------------------
