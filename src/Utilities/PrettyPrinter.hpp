//----------------------------------------------------------------------------------------------------------------------
// File: PrettyPrinter.hpp
// Description: Writes indented JSON for human edited files.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace JSON {
//----------------------------------------------------------------------------------------------------------------------

class PrettyPrinter;

//----------------------------------------------------------------------------------------------------------------------
} // JSON namespace
//----------------------------------------------------------------------------------------------------------------------

class JSON::PrettyPrinter
{
public:
    static constexpr std::size_t DefaultIndent = 4;

    explicit PrettyPrinter(std::size_t indent = DefaultIndent);

    void Write(boost::json::value const& json, std::ostream& os);
    [[nodiscard]] std::string Format(boost::json::value const& json);

private:
    void WriteValue(boost::json::value const& json, std::ostream& os);
    void WriteObject(boost::json::object const& object, std::ostream& os);
    void WriteArray(boost::json::array const& array, std::ostream& os);

    std::string m_prefix;
    std::size_t const m_indent;
};

//----------------------------------------------------------------------------------------------------------------------

inline JSON::PrettyPrinter::PrettyPrinter(std::size_t indent)
    : m_prefix()
    , m_indent(indent)
{
}

//----------------------------------------------------------------------------------------------------------------------

inline void JSON::PrettyPrinter::Write(boost::json::value const& json, std::ostream& os)
{
    m_prefix.clear();
    WriteValue(json, os);
    os << '\n';
}

//----------------------------------------------------------------------------------------------------------------------

inline std::string JSON::PrettyPrinter::Format(boost::json::value const& json)
{
    std::ostringstream oss;
    Write(json, oss);
    return oss.str();
}

//----------------------------------------------------------------------------------------------------------------------

inline void JSON::PrettyPrinter::WriteValue(boost::json::value const& json, std::ostream& os)
{
    switch (json.kind()) {
        case boost::json::kind::object: WriteObject(json.get_object(), os); break;
        case boost::json::kind::array: WriteArray(json.get_array(), os); break;
        // Scalars are written in their compact form.
        default: os << boost::json::serialize(json); break;
    }
}

//----------------------------------------------------------------------------------------------------------------------

inline void JSON::PrettyPrinter::WriteObject(boost::json::object const& object, std::ostream& os)
{
    if (object.empty()) { os << "{}"; return; }

    os << "{\n";
    m_prefix.append(m_indent, ' ');
    bool first = true;
    for (auto const& [key, value] : object) {
        if (!first) { os << ",\n"; }
        first = false;
        os << m_prefix << boost::json::serialize(boost::json::string{ key }) << ": ";
        WriteValue(value, os);
    }
    m_prefix.resize(m_prefix.size() - m_indent);
    os << '\n' << m_prefix << '}';
}

//----------------------------------------------------------------------------------------------------------------------

inline void JSON::PrettyPrinter::WriteArray(boost::json::array const& array, std::ostream& os)
{
    if (array.empty()) { os << "[]"; return; }

    os << "[\n";
    m_prefix.append(m_indent, ' ');
    bool first = true;
    for (auto const& value : array) {
        if (!first) { os << ",\n"; }
        first = false;
        os << m_prefix;
        WriteValue(value, os);
    }
    m_prefix.resize(m_prefix.size() - m_indent);
    os << '\n' << m_prefix << ']';
}

//----------------------------------------------------------------------------------------------------------------------
