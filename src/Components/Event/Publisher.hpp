//----------------------------------------------------------------------------------------------------------------------
// File: Publisher.hpp
// Description: Handle the subscription and publishing of events. Events may be published from any thread, they are
// queued and then dispatched to the listeners on the core thread when the scheduler executes the publisher.
// Notes: Event subscriptions are not thread safe. Only the core thread is allowed to subscribe and it must suspend
// subscriptions before the runtime starts. Publishing is far more common than subscribing, so the listeners are read
// without a lock once subscriptions have been suspended.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Events.hpp"
#include "SharedPublisher.hpp"
#include "Utilities/Assertions.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <atomic>
#include <cassert>
#include <concepts>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <tuple>
#include <unordered_map>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

namespace Scheduler { class Delegate; class Registrar; }

//----------------------------------------------------------------------------------------------------------------------
namespace Event {
//----------------------------------------------------------------------------------------------------------------------

class Publisher;

//----------------------------------------------------------------------------------------------------------------------
} // Event namespace
//----------------------------------------------------------------------------------------------------------------------

class Event::Publisher
{
public:
    explicit Publisher(std::shared_ptr<Scheduler::Registrar> const& spRegistrar);
    ~Publisher();

    Publisher(Publisher const&) = delete;
    Publisher(Publisher&& ) = delete;
    Publisher& operator=(Publisher const&) = delete;
    Publisher& operator=(Publisher&&) = delete;

    template<Type SpecificType> requires MessageWithContent<SpecificType>
    bool Subscribe(typename Event::Message<SpecificType>::CallbackTrait const& callback)
    {
        if (m_hasSuspendedSubscriptions) { return false; } // Subscriptions are disabled when the runtime begins.
        assert(Assertions::Threading::IsCoreThread());

        // The listener casts to the derived event type to access the content and forwards it to the handler.
        m_listeners[SpecificType].emplace_back([callback] (EventProxy const& upEventProxy) {
            assert(upEventProxy && upEventProxy->GetType() == SpecificType);
            auto const pEvent = static_cast<Event::Message<SpecificType> const*>(upEventProxy.get());
            std::apply(callback, pEvent->GetContent());
        });
        return true;
    }

    template<Type SpecificType> requires MessageWithoutContent<SpecificType>
    bool Subscribe(typename Event::Message<SpecificType>::CallbackTrait const& callback)
    {
        if (m_hasSuspendedSubscriptions) { return false; } // Subscriptions are disabled when the runtime begins.
        assert(Assertions::Threading::IsCoreThread());
        m_listeners[SpecificType].emplace_back([callback] (EventProxy const&) { std::invoke(callback); });
        return true;
    }

    void SuspendSubscriptions();
    [[nodiscard]] bool SubscriptionsSuspended() const;

    template<Type SpecificType, typename... Arguments> requires MessageWithContent<SpecificType>
    void Publish(Arguments&&... arguments)
    {
        Publish(SpecificType, std::make_unique<Event::Message<SpecificType>>(std::forward<Arguments>(arguments)...));
    }

    template<Type SpecificType> requires MessageWithoutContent<SpecificType>
    void Publish()
    {
        Publish(SpecificType, std::make_unique<Event::Message<SpecificType>>());
    }

    [[nodiscard]] bool IsSubscribed(Type type) const;
    [[nodiscard]] std::size_t EventCount() const;
    [[nodiscard]] std::size_t ListenerCount() const;

    // Note: Dispatching is normally driven by the registrar. A direct call settles the signalled work itself.
    std::size_t Dispatch();

private:
    using EventProxy = std::unique_ptr<IMessage>;
    using EventQueue = std::deque<EventProxy>;
    using ListenerProxy = std::function<void(EventProxy const& upEventProxy)>;
    using Listeners = std::unordered_map<Type, std::vector<ListenerProxy>>;

    void Publish(Type type, EventProxy&& upEventProxy);
    [[nodiscard]] std::size_t DispatchEvents();

    std::shared_ptr<Scheduler::Delegate> m_spDelegate;
    std::atomic_bool m_hasSuspendedSubscriptions;
    Listeners m_listeners;

    mutable std::mutex m_eventsMutex;
    EventQueue m_events;
};

//----------------------------------------------------------------------------------------------------------------------
