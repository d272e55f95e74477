//----------------------------------------------------------------------------------------------------------------------
// File: Events.hpp
// Description: The typed notifications published by the node's components.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Network/Address.hpp"
#include "Components/Service/Record.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json/value.hpp>
#include <boost/preprocessor/facilities/empty.hpp>
#include <boost/preprocessor/facilities/va_opt.hpp>
#include <boost/preprocessor/punctuation/comma_if.hpp>
#include <boost/preprocessor/seq/for_each_i.hpp>
#include <boost/preprocessor/variadic/to_seq.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <concepts>
#include <cstdint>
#include <functional>
#include <string>
#include <tuple>
#include <type_traits>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Event {
//----------------------------------------------------------------------------------------------------------------------

enum class Type : std::uint32_t
{
    BindingFailed,
    EndpointStarted,
    EndpointStopped,
    MessageBus,
    RuntimeStarted,
    RuntimeStopped,
    ServiceAvailable,
    ServiceUnavailable
};

class IMessage;

// By default, the message constructor is deleted to prevent usage of unspecialized types.
template<Type SpecificType>
class Message { Message() = delete; };

template<Type SpecificType>
concept MessageWithContent = requires { typename Message<SpecificType>::EventContent; };

template<Type SpecificType>
concept MessageWithoutContent = !MessageWithContent<SpecificType>;

//----------------------------------------------------------------------------------------------------------------------
} // Event namespace
//----------------------------------------------------------------------------------------------------------------------

class Event::IMessage
{
public:
    virtual ~IMessage() = default;
    virtual Event::Type GetType() = 0;
};

//----------------------------------------------------------------------------------------------------------------------
// Note: The following macros define the boilerplate types, methods, and variables that should be present in event
// specializations.
//----------------------------------------------------------------------------------------------------------------------

// Allows the event to define custom causes, (e.g. the event fired because of a defined error).
#define EVENT_MESSAGE_CAUSE(...) \
public: enum class Cause : std::uint32_t { __VA_ARGS__ };

// Converts a callback type into an unqualified content store type (e.g. std::string const& becomes std::string).
#define EVENT_MESSAGE_CONTENT_STORE_TYPES(r, data, i, elem) BOOST_PP_COMMA_IF(i) std::remove_cvref_t<elem>
// Converts a callback type into a named parameter (e.g. std::string const& becomes std::string const& arg_0).
#define EVENT_MESSAGE_CONTENT_STORE_ARGS(r, data, i, elem) BOOST_PP_COMMA_IF(i) elem arg_##i
// Converts a callback type into the name argument (e.g. std::string const& becomes arg_0).
#define EVENT_MESSAGE_CONTENT_STORE_NAMES(r, data, i, elem) BOOST_PP_COMMA_IF(i) arg_##i

// Creates the types, methods, and variables needed to support storing and providing callback content.
#define EVENT_MESSAGE_CONTENT_STORE(...) \
public:\
    using EventContent = std::tuple<\
        BOOST_PP_SEQ_FOR_EACH_I(EVENT_MESSAGE_CONTENT_STORE_TYPES, _, BOOST_PP_VARIADIC_TO_SEQ(__VA_ARGS__))>; \
    explicit Message(BOOST_PP_SEQ_FOR_EACH_I(\
        EVENT_MESSAGE_CONTENT_STORE_ARGS, _, BOOST_PP_VARIADIC_TO_SEQ(__VA_ARGS__))) \
        : m_content(BOOST_PP_SEQ_FOR_EACH_I( \
            EVENT_MESSAGE_CONTENT_STORE_NAMES, _, BOOST_PP_VARIADIC_TO_SEQ(__VA_ARGS__))) {} \
    auto const& GetContent() const { return m_content; } \
private: \
    EventContent m_content;
#define EVENT_MESSAGE_CONTENT_STORE_EMPTY \
public: \
    Message() = default;

// Creates the core types and methods needed to define an event specialization.
#define EVENT_MESSAGE_CORE(type, ...) \
public:\
    using CallbackTrait = std::function<void(__VA_ARGS__)>; \
    static constexpr Event::Type Type = type; \
    ~Message() = default; \
    Message(Message const&) = delete; \
    Message(Message&& ) = default; \
    Message& operator=(Message const&) = delete; \
    Message& operator=(Message&&) = default; \
    virtual Event::Type GetType() override { return Type; } \
    BOOST_PP_VA_OPT((EVENT_MESSAGE_CONTENT_STORE(__VA_ARGS__)), (EVENT_MESSAGE_CONTENT_STORE_EMPTY), __VA_ARGS__)

//----------------------------------------------------------------------------------------------------------------------
// Schema: The binding requested for the endpoint and the cause of the failure.
//----------------------------------------------------------------------------------------------------------------------
template<>
class Event::Message<Event::Type::BindingFailed> : public Event::IMessage
{
    EVENT_MESSAGE_CAUSE(AddressInUse, Permissions, GroupMembership, UnexpectedError)
    EVENT_MESSAGE_CORE(Event::Type::BindingFailed, Network::Address const&, Cause)
};

//----------------------------------------------------------------------------------------------------------------------
// Schema: The address the endpoint is bound to.
//----------------------------------------------------------------------------------------------------------------------
template<>
class Event::Message<Event::Type::EndpointStarted> : public Event::IMessage
{
    EVENT_MESSAGE_CORE(Event::Type::EndpointStarted, Network::Address const&)
};

//----------------------------------------------------------------------------------------------------------------------
// Schema: The address the endpoint was bound to and the cause of the event.
//----------------------------------------------------------------------------------------------------------------------
template<>
class Event::Message<Event::Type::EndpointStopped> : public Event::IMessage
{
    EVENT_MESSAGE_CAUSE(ShutdownRequest, BindingFailed, UnexpectedError)
    EVENT_MESSAGE_CORE(Event::Type::EndpointStopped, Network::Address const&, Cause)
};

//----------------------------------------------------------------------------------------------------------------------
// Schema: The application event name and its payload. Carries both received and locally routed events.
//----------------------------------------------------------------------------------------------------------------------
template<>
class Event::Message<Event::Type::MessageBus> : public Event::IMessage
{
    EVENT_MESSAGE_CORE(Event::Type::MessageBus, std::string const&, boost::json::value const&)
};

//----------------------------------------------------------------------------------------------------------------------
// Schema: No event data to be captured.
//----------------------------------------------------------------------------------------------------------------------
template<>
class Event::Message<Event::Type::RuntimeStarted> : public Event::IMessage
{
    EVENT_MESSAGE_CORE(Event::Type::RuntimeStarted)
};

//----------------------------------------------------------------------------------------------------------------------
// Schema: The cause of the runtime stopping.
//----------------------------------------------------------------------------------------------------------------------
template<>
class Event::Message<Event::Type::RuntimeStopped> : public Event::IMessage
{
    EVENT_MESSAGE_CAUSE(ShutdownRequest, UnexpectedError)
    EVENT_MESSAGE_CORE(Event::Type::RuntimeStopped, Cause)
};

//----------------------------------------------------------------------------------------------------------------------
// Schema: The service name, a snapshot of its record, and the reason the service became available.
//----------------------------------------------------------------------------------------------------------------------
template<>
class Event::Message<Event::Type::ServiceAvailable> : public Event::IMessage
{
    EVENT_MESSAGE_CORE(
        Event::Type::ServiceAvailable, std::string const&, Service::Record const&, Service::Reason)
};

//----------------------------------------------------------------------------------------------------------------------
// Schema: The service name, a snapshot of its record, and the reason the service became unavailable. When the
// reason is a timeout, the record has already been removed from the registry.
//----------------------------------------------------------------------------------------------------------------------
template<>
class Event::Message<Event::Type::ServiceUnavailable> : public Event::IMessage
{
    EVENT_MESSAGE_CORE(
        Event::Type::ServiceUnavailable, std::string const&, Service::Record const&, Service::Reason)
};

//----------------------------------------------------------------------------------------------------------------------
