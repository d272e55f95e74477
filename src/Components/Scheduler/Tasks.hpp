//----------------------------------------------------------------------------------------------------------------------
// File: Tasks.hpp
// Description: Handles and task types executed by the scheduler's delegates.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <compare>
#include <cstdint>
#include <functional>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Scheduler {
//----------------------------------------------------------------------------------------------------------------------

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Interval = std::chrono::milliseconds;

// Note: Bounds task intervals such that deadlines and twice an interval remain representable by the clock.
constexpr Interval MaximumInterval = std::chrono::hours{ 24 };

class TaskIdentifier;
struct TaskIdentifierHasher;

class IntervalTask;

//----------------------------------------------------------------------------------------------------------------------
} // Scheduler namespace
//----------------------------------------------------------------------------------------------------------------------

class Scheduler::TaskIdentifier
{
public:
    using UnderlyingType = std::uint32_t;

    TaskIdentifier() : m_value(Generator::Instance().Generate()) {}
    explicit TaskIdentifier(UnderlyingType value) : m_value(value) {}

    [[nodiscard]] bool operator==(TaskIdentifier const& other) const = default;
    [[nodiscard]] std::strong_ordering operator<=>(TaskIdentifier const& other) const = default;

    [[nodiscard]] UnderlyingType GetValue() const { return m_value; }

private:
    class Generator
    {
    public:
        static Generator& Instance()
        {
            static Generator instance;
            return instance;
        }

        Generator(Generator const&) = delete;
        void operator=(Generator const&) = delete;

        // Identifiers are generated by tasks scheduled from any thread.
        UnderlyingType Generate() { return ++m_counter; }

    private:
        Generator() : m_counter(0) {}

        std::atomic<UnderlyingType> m_counter;
    };

    UnderlyingType m_value;
};

//----------------------------------------------------------------------------------------------------------------------

struct Scheduler::TaskIdentifierHasher
{
    std::size_t operator()(TaskIdentifier const& identifier) const
    {
        return std::hash<TaskIdentifier::UnderlyingType>()(identifier.GetValue());
    }
};

//----------------------------------------------------------------------------------------------------------------------

class Scheduler::IntervalTask
{
public:
    using Callback = std::function<void()>;

    // Note: Intervals beyond the maximum are clamped to it.
    IntervalTask(Callback const& callback, Interval const& interval, TimePoint const& start = Clock::now())
        : m_callback(callback)
        , m_interval(std::min(interval, MaximumInterval))
        , m_deadline(start + m_interval)
    {
        assert(m_callback);
        assert(m_interval > Interval::zero());
    }

    [[nodiscard]] bool Ready(TimePoint const& now)
    {
        if (now < m_deadline) { return false; }
        // Advance from the missed deadline to keep the cadence, unless the task has fallen a full period behind.
        m_deadline += m_interval;
        if (m_deadline <= now) { m_deadline = now + m_interval; }
        return true;
    }

    [[nodiscard]] TimePoint GetDeadline() const { return m_deadline; }
    [[nodiscard]] Interval const& GetInterval() const { return m_interval; }
    [[nodiscard]] Callback const& GetCallback() const { return m_callback; }

private:
    Callback m_callback;
    Interval m_interval;
    TimePoint m_deadline;
};

//----------------------------------------------------------------------------------------------------------------------
