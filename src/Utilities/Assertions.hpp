//----------------------------------------------------------------------------------------------------------------------
// File: Assertions.hpp
// Description: Debug-only bookkeeping of the threads permitted to drive the core runtime.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#if !defined(NDEBUG)
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
#include <memory>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <thread>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Assertions {
//----------------------------------------------------------------------------------------------------------------------

class Threading
{
public:
    Threading(Threading const&) = delete;
    Threading& operator=(Threading const&) = delete;

    // Note: The methods return a boolean such that they may be packed into an assert() call.
    [[nodiscard]] static bool RegisterCoreThread()
    {
        auto& instance = Instance();
        std::scoped_lock lock(instance.m_mutex);
        instance.m_threads.emplace(std::this_thread::get_id());
        return true;
    }

    [[nodiscard]] static bool WithdrawCoreThread()
    {
        auto& instance = Instance();
        std::scoped_lock lock(instance.m_mutex);
        instance.m_threads.erase(std::this_thread::get_id());
        return true;
    }

    [[nodiscard]] static bool IsCoreThread()
    {
        auto& instance = Instance();
        std::shared_lock lock(instance.m_mutex);
        assert(!instance.m_threads.empty()); // A core thread must be registered before any component may check.
        return instance.m_threads.contains(std::this_thread::get_id());
    }

private:
    Threading() = default;

    static Threading& Instance()
    {
        static std::unique_ptr<Threading> const upInstance(new Threading());
        return *upInstance;
    }

    std::shared_mutex m_mutex;
    std::set<std::thread::id> m_threads;
};

//----------------------------------------------------------------------------------------------------------------------
} // Assertions namespace
//----------------------------------------------------------------------------------------------------------------------
#endif // !defined(NDEBUG)
//----------------------------------------------------------------------------------------------------------------------
