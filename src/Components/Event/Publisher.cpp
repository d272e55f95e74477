//----------------------------------------------------------------------------------------------------------------------
// File: Publisher.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Publisher.hpp"
#include "Components/Scheduler/Delegate.hpp"
#include "Components/Scheduler/Registrar.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

Event::Publisher::Publisher(std::shared_ptr<Scheduler::Registrar> const& spRegistrar)
    : m_spDelegate()
    , m_hasSuspendedSubscriptions(false)
    , m_listeners()
    , m_eventsMutex()
    , m_events()
{
    assert(Assertions::Threading::IsCoreThread());
    assert(spRegistrar);
    m_spDelegate = spRegistrar->Register<Event::Publisher>([this] () -> std::size_t { return DispatchEvents(); });
}

//----------------------------------------------------------------------------------------------------------------------

Event::Publisher::~Publisher()
{
    if (m_spDelegate) { m_spDelegate->Delist(); }
}

//----------------------------------------------------------------------------------------------------------------------

void Event::Publisher::SuspendSubscriptions()
{
    assert(Assertions::Threading::IsCoreThread()); // Only the thread that is allowed to subscribe can disable it.
    m_hasSuspendedSubscriptions = true;
}

//----------------------------------------------------------------------------------------------------------------------

bool Event::Publisher::SubscriptionsSuspended() const { return m_hasSuspendedSubscriptions; }

//----------------------------------------------------------------------------------------------------------------------

bool Event::Publisher::IsSubscribed(Type type) const { return m_listeners.contains(type); }

//----------------------------------------------------------------------------------------------------------------------

std::size_t Event::Publisher::EventCount() const
{
    std::scoped_lock lock(m_eventsMutex);
    return m_events.size();
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Event::Publisher::ListenerCount() const { return m_listeners.size(); }

//----------------------------------------------------------------------------------------------------------------------

std::size_t Event::Publisher::Dispatch()
{
    auto const dispatched = DispatchEvents();
    m_spDelegate->OnTaskCompleted(dispatched);
    return dispatched;
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Event::Publisher::DispatchEvents()
{
    assert(Assertions::Threading::IsCoreThread());

    // Pull and clear the queued events to quickly unblock publishers. Listeners may publish while being invoked,
    // those events are handled on the next cycle.
    auto const events = (std::scoped_lock{ m_eventsMutex }, std::exchange(m_events, {}));
    for (auto const& upEventProxy : events) {
        auto const itr = m_listeners.find(upEventProxy->GetType());
        assert(itr != m_listeners.end() && !itr->second.empty()); // Only events with listeners are queued.
        for (auto const& listenerProxy : itr->second) { std::invoke(listenerProxy, upEventProxy); }
    }
    return events.size();
}

//----------------------------------------------------------------------------------------------------------------------

void Event::Publisher::Publish(Type type, EventProxy&& upEventProxy)
{
    // Listeners are read without a lock, publishing can only begin after subscriptions have been suspended.
    assert(m_hasSuspendedSubscriptions);
    if (!IsSubscribed(type)) { return; }

    // The delegate is signalled under the lock, otherwise a dispatch could complete the event before it was counted.
    std::scoped_lock lock(m_eventsMutex);
    m_events.emplace_back(std::move(upEventProxy));
    m_spDelegate->OnTaskAvailable();
}

//----------------------------------------------------------------------------------------------------------------------
